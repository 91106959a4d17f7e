#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace lazybar {

//-----------------------------------------------------------------------------
// Error - message with an optional chained cause
//-----------------------------------------------------------------------------
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const noexcept { return _message; }
    const Error* cause() const noexcept { return _cause.get(); }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (const Error* c = cause(); c; c = c->cause()) {
            out += ": ";
            out += c->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

//-----------------------------------------------------------------------------
// Constructors
//-----------------------------------------------------------------------------
inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) {
        return std::unexpected(Error(std::move(message)));
    }
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace lazybar
