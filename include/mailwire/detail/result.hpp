/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown in mailwire - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mailwire
{

/// Error categories for mailwire operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Validation (100-199)
    invalid_argument = 100,
    invalid_address = 101,
    invalid_state = 102,
    missing_sender = 103,
    missing_recipients = 104,
    null_callback = 105,

    // Serialization and local I/O (200-299)
    callback_failed = 200,
    io_failed = 201,
    codec_invalid_input = 202,
    sendmail_failed = 203,

    // Network (300-399)
    net_resolve_failed = 300,
    net_connect_failed = 301,
    net_connection_refused = 302,
    net_connection_reset = 303,
    net_eof = 304,
    net_timeout = 305,
    net_cancelled = 306,
    net_io_failed = 307,

    // TLS (400-499)
    tls_required = 400,
    tls_handshake_failed = 401,
    tls_verify_failed = 402,
    tls_pinning_failed = 403,

    // SMTP (500-599)
    smtp_bad_reply = 500,
    smtp_service_not_available = 501,
    smtp_auth_unsupported = 502,
    smtp_auth_failed = 503,
    smtp_mail_from_rejected = 504,
    smtp_rejected_recipient = 505,
    smtp_data_rejected = 506,
    smtp_temporary_failure = 507,
    smtp_permanent_failure = 508,
    smtp_batch_failed = 509,

    // SASL (600-699)
    sasl_bad_challenge = 600,
    sasl_server_verification_failed = 601,
    crypto_failed = 602,

    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "Success";
        case errc::invalid_argument: return "Invalid argument";
        case errc::invalid_address: return "Invalid address";
        case errc::invalid_state: return "Invalid state";
        case errc::missing_sender: return "Missing sender";
        case errc::missing_recipients: return "Missing recipients";
        case errc::null_callback: return "Missing content callback";
        case errc::callback_failed: return "Content callback failed";
        case errc::io_failed: return "I/O failed";
        case errc::codec_invalid_input: return "Invalid codec input";
        case errc::sendmail_failed: return "Sendmail failed";
        case errc::net_resolve_failed: return "DNS resolution failed";
        case errc::net_connect_failed: return "Connection failed";
        case errc::net_connection_refused: return "Connection refused";
        case errc::net_connection_reset: return "Connection reset";
        case errc::net_eof: return "Connection closed";
        case errc::net_timeout: return "Timeout";
        case errc::net_cancelled: return "Operation cancelled";
        case errc::net_io_failed: return "Network I/O failed";
        case errc::tls_required: return "TLS required";
        case errc::tls_handshake_failed: return "TLS handshake failed";
        case errc::tls_verify_failed: return "TLS verification failed";
        case errc::tls_pinning_failed: return "TLS pinning failed";
        case errc::smtp_bad_reply: return "Malformed SMTP reply";
        case errc::smtp_service_not_available: return "SMTP service not available";
        case errc::smtp_auth_unsupported: return "SMTP authentication not supported";
        case errc::smtp_auth_failed: return "SMTP authentication failed";
        case errc::smtp_mail_from_rejected: return "SMTP sender rejected";
        case errc::smtp_rejected_recipient: return "SMTP recipient rejected";
        case errc::smtp_data_rejected: return "SMTP data rejected";
        case errc::smtp_temporary_failure: return "SMTP temporary failure";
        case errc::smtp_permanent_failure: return "SMTP permanent failure";
        case errc::smtp_batch_failed: return "SMTP batch failed";
        case errc::sasl_bad_challenge: return "Malformed SASL challenge";
        case errc::sasl_server_verification_failed: return "SASL server verification failed";
        case errc::crypto_failed: return "Cryptographic primitive failed";
        case errc::internal_error: return "Internal error";
    }
    return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << mailwire::to_string(code);
}

/// Rich error value: code, message, structured detail and optional origins.
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    /// SMTP reply code when the error comes from a server reply, 0 otherwise.
    int reply_code = 0;

    [[nodiscard]] std::string to_string() const
    {
        std::string out = std::format("[{}] {}", static_cast<int>(code),
            message.empty() ? std::string(mailwire::to_string(code)) : message);
        if (reply_code != 0)
            out += std::format(" (reply {})", reply_code);
        if (sys)
            out += std::format(": {}", sys.message());
        return out;
    }
};

/// Temporary conditions may succeed when retried later.
[[nodiscard]] constexpr bool is_temporary(errc code) noexcept
{
    switch (code)
    {
        case errc::net_resolve_failed:
        case errc::net_connection_refused:
        case errc::net_connection_reset:
        case errc::net_eof:
        case errc::net_timeout:
        case errc::net_cancelled:
        case errc::net_io_failed:
        case errc::smtp_service_not_available:
        case errc::smtp_temporary_failure:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] inline bool is_temporary(const error_info& err) noexcept
{
    if (err.reply_code != 0)
        return err.reply_code >= 400 && err.reply_code < 500;
    return is_temporary(err.code);
}

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error_info>;

/// Helper to create void success
[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

/// Helper to create successful result
template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
[[nodiscard]] result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {}, std::error_code sys = {})
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), sys, 0});
}

} // namespace mailwire

/// Propagate the error of a result-returning expression from a plain function.
#define MAILWIRE_TRY(expr)                                                           \
    do                                                                               \
    {                                                                                \
        auto&& mailwire_try_res_ = (expr);                                           \
        if (!mailwire_try_res_)                                                      \
            return std::unexpected(std::move(mailwire_try_res_).error());            \
    } while (0)

/// Assign the value of a result into an already declared variable, or propagate its error.
#define MAILWIRE_TRY_ASSIGN(lhs, expr)                                               \
    do                                                                               \
    {                                                                                \
        auto&& mailwire_try_res_ = (expr);                                           \
        if (!mailwire_try_res_)                                                      \
            return std::unexpected(std::move(mailwire_try_res_).error());            \
        lhs = std::move(*mailwire_try_res_);                                         \
    } while (0)

/// Coroutine flavour of MAILWIRE_TRY.
#define MAILWIRE_CO_TRY_VOID(expr)                                                   \
    do                                                                               \
    {                                                                                \
        auto&& mailwire_try_res_ = (expr);                                           \
        if (!mailwire_try_res_)                                                      \
            co_return std::unexpected(std::move(mailwire_try_res_).error());         \
    } while (0)

/// Coroutine flavour of MAILWIRE_TRY_ASSIGN.
#define MAILWIRE_CO_TRY_ASSIGN(lhs, expr)                                            \
    do                                                                               \
    {                                                                                \
        auto&& mailwire_try_res_ = (expr);                                           \
        if (!mailwire_try_res_)                                                      \
            co_return std::unexpected(std::move(mailwire_try_res_).error());         \
        lhs = std::move(*mailwire_try_res_);                                         \
    } while (0)
