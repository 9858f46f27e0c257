#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace labelkit {

//=============================================================================
// Error - message plus optional chained cause
//=============================================================================
class Error {
public:
    explicit Error(std::string message,
                   std::shared_ptr<const Error> cause = nullptr)
        : _message(std::move(message)), _cause(std::move(cause)) {}

    const std::string& message() const { return _message; }
    const std::shared_ptr<const Error>& cause() const { return _cause; }

    // Own message followed by the cause chain ("outer: inner: root")
    std::string to_string() const {
        if (!_cause) return _message;
        return _message + ": " + _cause->to_string();
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

// Value carrier produced by Ok(value), converts into any compatible Result<T>
template<typename U>
struct OkValue {
    U value;
};

//=============================================================================
// Result<T> - value or Error
//=============================================================================
template<typename T>
class [[nodiscard]] Result {
public:
    using ValueType = T;

    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

    template<typename U,
             typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    Result(OkValue<U>&& ok)
        : _data(std::in_place_index<0>, T(std::move(ok.value))) {}

    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> &&
                                         std::is_constructible_v<T, U&&>>>
    Result(Result<U>&& other)
        : _data(other ? Data(std::in_place_index<0>, T(std::move(*other)))
                      : Data(std::in_place_index<1>, other.error())) {}

    bool has_value() const { return _data.index() == 0; }
    explicit operator bool() const { return has_value(); }

    T& value() & { return std::get<0>(_data); }
    const T& value() const& { return std::get<0>(_data); }
    T&& value() && { return std::get<0>(std::move(_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    using Data = std::variant<T, Error>;
    Data _data;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using ValueType = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const { return !_error.has_value(); }
    explicit operator bool() const { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//=============================================================================
// Constructors
//=============================================================================
inline Result<void> Ok() { return Result<void>(); }

template<typename U>
OkValue<std::decay_t<U>> Ok(U&& value) {
    return OkValue<std::decay_t<U>>{std::forward<U>(value)};
}

template<typename T>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message),
                           std::make_shared<const Error>(cause.error())));
}

template<typename T>
Result<T> Err(std::string message, const Error& cause) {
    return Result<T>(Error(std::move(message),
                           std::make_shared<const Error>(cause)));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace labelkit
