#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace cardview {

// Error carried by Result<T>. Errors chain: wrapping a failed Result keeps the
// original error as the cause, so the final message reads outermost-first.
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
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

// The template parameter only documents the Result type being produced;
// std::unexpected<Error> converts to any Result<T>.
template<typename T = void>
std::unexpected<Error> Err(std::string message) {
    return std::unexpected<Error>(Error(std::move(message)));
}

template<typename T = void, typename U>
std::unexpected<Error> Err(std::string message, const Result<U>& cause) {
    return std::unexpected<Error>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().to_string();
}

} // namespace cardview
