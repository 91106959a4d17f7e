#pragma once

#include <lazybar/content.h>
#include <string_view>

namespace lazybar {

// Parse lemonbar-style color markup into segments:
//   %{F#rrggbb}  foreground      %{F-}  default foreground
//   %{B#rrggbb}  background      %{B-}  default background
// Unknown or malformed directives are dropped; an unterminated one is kept
// as text.
ContentItem parseMarkup(std::string_view text);

} // namespace lazybar
