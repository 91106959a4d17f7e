#pragma once

#include <cstdint>
#include <limits>

namespace lazybar {
namespace base {

using PollId = int;
using TimerId = int;
using WakeId = int;
using SignalId = int;
using Timeout = int;

static constexpr int NoHandleId = -1;

} // namespace base
} // namespace lazybar
