#pragma once

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace canvaschunk {

/// Error type for chunk operations
struct Error {
    enum class Code {
        Success,
        DecodeError,        ///< Malformed, truncated or undecodable payload
        NotConfigured,      ///< Board metadata requested before being supplied
        OutOfBounds,        ///< Chunk coordinates outside the service grid
        InvalidArgument,
        UnsupportedFeature,
        MemoryError,
        CompressionError,
        TransportError      ///< The external transport could not deliver a payload
    };

    Code code;
    std::string message;

    Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool is_success() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return code != Code::Success;
    }
};

/// Result type for operations that may fail without exceptions
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    // Constructors
    Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::forward<T>(value)) {}

    Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(value) {}

    Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    Result(const Error& error) noexcept
        : data_(error) {}

    // Status checks
    [[nodiscard]] bool is_ok() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    // Value access
    [[nodiscard]] T& value() & noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] const T& value() const& noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] T&& value() && noexcept {
        return std::get<T>(std::move(data_));
    }

    // Error access
    [[nodiscard]] const Error& error() const noexcept {
        return std::get<Error>(data_);
    }

    // Value extraction with default
    template <typename U>
    [[nodiscard]] T value_or(U&& default_value) const& {
        if (is_ok()) {
            return value();
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    template <typename U>
    [[nodiscard]] T value_or(U&& default_value) && {
        if (is_ok()) {
            return std::move(value());
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    // Monadic operations
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) & -> decltype(func(std::declval<T&>())) {
        if (is_ok()) {
            return func(value());
        }
        using RetType = decltype(func(std::declval<T&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> decltype(func(std::declval<const T&>())) {
        if (is_ok()) {
            return func(value());
        }
        using RetType = decltype(func(std::declval<const T&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] auto and_then(F&& func) && -> decltype(func(std::declval<T&&>())) {
        if (is_ok()) {
            return func(std::move(value()));
        }
        using RetType = decltype(func(std::declval<T&&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] auto transform(F&& func) const& {
        using U = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>{func(value())};
        }
        return Result<U>{error()};
    }

    template <typename F>
    [[nodiscard]] auto transform(F&& func) && {
        using U = decltype(func(std::declval<T&&>()));
        if (is_ok()) {
            return Result<U>{func(std::move(value()))};
        }
        return Result<U>{error()};
    }

    template <typename F>
    [[nodiscard]] Result or_else(F&& func) const& {
        if (is_error()) {
            return func(error());
        }
        return *this;
    }

    template <typename F>
    [[nodiscard]] Result or_else(F&& func) && {
        if (is_error()) {
            return func(error());
        }
        return std::move(*this);
    }
};

// Specialization for void
template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    Result() noexcept : data_(std::monostate{}) {}

    Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

// Helper functions for creating results
template <typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

/// Short name of an error code, used when logging
[[nodiscard]] inline const char* to_string(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::Success: return "Success";
        case Error::Code::DecodeError: return "DecodeError";
        case Error::Code::NotConfigured: return "NotConfigured";
        case Error::Code::OutOfBounds: return "OutOfBounds";
        case Error::Code::InvalidArgument: return "InvalidArgument";
        case Error::Code::UnsupportedFeature: return "UnsupportedFeature";
        case Error::Code::MemoryError: return "MemoryError";
        case Error::Code::CompressionError: return "CompressionError";
        case Error::Code::TransportError: return "TransportError";
    }
    return "Unknown";
}

} // namespace canvaschunk
