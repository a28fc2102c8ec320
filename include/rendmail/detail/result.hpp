/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Errors are returned via result<T>; every error code belongs to exactly one error kind.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <utility>
#include <type_traits>

namespace rendmail
{

/// Error codes for rendmail operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Transport errors (100-199)
    input_failed = 100,
    output_failed = 101,
    backup_failed = 102,

    // Message format errors (600-699)
    missing_body = 600,
    malformed_header_field = 601,
    invalid_boundary = 602,
    missing_delimiter = 603,
    nesting_too_deep = 604,
    invalid_content_type = 605,

    // Configuration errors (700-799)
    invalid_argument = 700,
    invalid_glob = 701,
};

/// Broad classes of errors, used to decide whether processing may recover
enum class error_kind : std::uint8_t
{
    none,
    transport,
    message_format,
    configuration,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::input_failed: return "Reading input failed";
        case error_code::output_failed: return "Writing output failed";
        case error_code::backup_failed: return "Writing backup failed";
        case error_code::missing_body: return "Missing body";
        case error_code::malformed_header_field: return "Malformed header field";
        case error_code::invalid_boundary: return "Invalid boundary";
        case error_code::missing_delimiter: return "Missing delimiter";
        case error_code::nesting_too_deep: return "Multipart nesting too deep";
        case error_code::invalid_content_type: return "Invalid content type";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::invalid_glob: return "Invalid glob pattern";
    }
    return "Unknown error";
}

/// Map an error code to its kind
[[nodiscard]] constexpr error_kind kind_of(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success:
            return error_kind::none;
        case error_code::input_failed:
        case error_code::output_failed:
        case error_code::backup_failed:
            return error_kind::transport;
        case error_code::missing_body:
        case error_code::malformed_header_field:
        case error_code::invalid_boundary:
        case error_code::missing_delimiter:
        case error_code::nesting_too_deep:
        case error_code::invalid_content_type:
            return error_kind::message_format;
        case error_code::invalid_argument:
        case error_code::invalid_glob:
            return error_kind::configuration;
    }
    return error_kind::configuration;
}

/// Error type with code and message
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] error_kind kind() const noexcept { return kind_of(code_); }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        return "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
    }

    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    [[nodiscard]] bool is_transport_error() const noexcept { return kind() == error_kind::transport; }

    [[nodiscard]] bool is_message_error() const noexcept { return kind() == error_kind::message_format; }

private:
    error_code code_;
    std::string message_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

/// Propagate the error of a result-returning expression, otherwise yield its value
/// Usage: auto val = RENDMAIL_TRY(some_op());
#define RENDMAIL_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            return std::unexpected(std::move(_result).error()); \
        std::move(*_result); \
    })

/// Same but for void results
#define RENDMAIL_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            return std::unexpected(std::move(_result).error()); \
    } while(0)

} // namespace rendmail
