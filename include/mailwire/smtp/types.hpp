/*

smtp/types.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailwire/detail/asio_decl.hpp>
#include <mailwire/detail/ascii.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/detail/sanitize.hpp>
#include <mailwire/net/dialog.hpp>
#include <mailwire/net/tls_options.hpp>
#include <mailwire/sasl/mechanism.hpp>

namespace mailwire
{
namespace smtp
{

inline constexpr unsigned short DEFAULT_PORT = 25;
inline constexpr unsigned short DEFAULT_SUBMISSION_PORT = 587;
inline constexpr unsigned short DEFAULT_SMTPS_PORT = 465;

struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    [[nodiscard]] bool is_positive_completion() const noexcept { return status / 100 == 2; }
    [[nodiscard]] bool is_positive_intermediate() const noexcept { return status / 100 == 3; }
    [[nodiscard]] bool is_transient_negative() const noexcept { return status / 100 == 4; }
    [[nodiscard]] bool is_permanent_negative() const noexcept { return status / 100 == 5; }

    [[nodiscard]] std::string message() const
    {
        if (lines.empty())
            return std::string();

        std::string out = lines.front();
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            out += "\n";
            out += lines[i];
        }
        return out;
    }
};

/**
Extensions announced in the EHLO reply, keyed by uppercase keyword.
**/
struct capabilities
{
    std::map<std::string, std::vector<std::string>> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    [[nodiscard]] bool supports(std::string_view capability) const
    {
        return entries.find(mailwire::detail::to_upper_copy(capability)) != entries.end();
    }

    [[nodiscard]] const std::vector<std::string>* parameters(std::string_view capability) const
    {
        auto it = entries.find(mailwire::detail::to_upper_copy(capability));
        return it == entries.end() ? nullptr : &it->second;
    }

    /// Mechanisms listed by `AUTH`, including the obsolete `AUTH=` form.
    [[nodiscard]] std::vector<std::string> auth_mechanisms() const
    {
        std::vector<std::string> out;
        if (const auto* params = parameters("AUTH"))
            out = *params;
        if (const auto* legacy = parameters("AUTH="))
            out.insert(out.end(), legacy->begin(), legacy->end());
        return out;
    }

    /// Value of SIZE, zero when absent or unlimited.
    [[nodiscard]] std::size_t max_size() const
    {
        const auto* params = parameters("SIZE");
        if (params == nullptr || params->empty())
            return 0;
        std::size_t value = 0;
        for (char ch : params->front())
        {
            if (!mailwire::detail::is_ascii_digit(ch))
                return 0;
            value = value * 10 + static_cast<std::size_t>(ch - '0');
        }
        return value;
    }
};

// ==================== DSN Types (RFC 3461) ====================

/**
 * DSN return type: which part of the message comes back in the report.
 */
enum class dsn_ret
{
    none,      ///< Don't request specific return type
    full,      ///< Return full message in DSN (RET=FULL)
    hdrs       ///< Return only headers in DSN (RET=HDRS)
};

/**
 * DSN notification conditions, combined with `|`.
 */
enum class dsn_notify : unsigned int
{
    none       = 0,
    success    = 1 << 0,
    failure    = 1 << 1,
    delay      = 1 << 2,
    never      = 1 << 3   ///< Never send DSN (overrides others)
};

inline dsn_notify operator|(dsn_notify a, dsn_notify b) noexcept
{
    return static_cast<dsn_notify>(static_cast<unsigned int>(a) | static_cast<unsigned int>(b));
}

inline dsn_notify operator&(dsn_notify a, dsn_notify b) noexcept
{
    return static_cast<dsn_notify>(static_cast<unsigned int>(a) & static_cast<unsigned int>(b));
}

inline bool has_flag(dsn_notify flags, dsn_notify flag) noexcept
{
    return (static_cast<unsigned int>(flags) & static_cast<unsigned int>(flag)) != 0;
}

struct dsn_options
{
    dsn_ret ret = dsn_ret::none;
    dsn_notify notify = dsn_notify::none;
    std::string envid;

    [[nodiscard]] bool enabled() const noexcept
    {
        return ret != dsn_ret::none || notify != dsn_notify::none || !envid.empty();
    }

    [[nodiscard]] std::string ret_string() const
    {
        switch (ret)
        {
            case dsn_ret::full: return "FULL";
            case dsn_ret::hdrs: return "HDRS";
            default: return "";
        }
    }

    [[nodiscard]] std::string notify_string() const
    {
        if (has_flag(notify, dsn_notify::never))
            return "NEVER";

        std::string out;
        const auto append = [&out](std::string_view word)
        {
            if (!out.empty())
                out += ",";
            out += word;
        };
        if (has_flag(notify, dsn_notify::success))
            append("SUCCESS");
        if (has_flag(notify, dsn_notify::failure))
            append("FAILURE");
        if (has_flag(notify, dsn_notify::delay))
            append("DELAY");
        return out;
    }

    /// Notification on failure only, with headers returned.
    static dsn_options on_failure()
    {
        dsn_options opt;
        opt.notify = dsn_notify::failure;
        opt.ret = dsn_ret::hdrs;
        return opt;
    }

    static dsn_options on_success_or_failure()
    {
        dsn_options opt;
        opt.notify = dsn_notify::success | dsn_notify::failure;
        opt.ret = dsn_ret::hdrs;
        return opt;
    }
};

/**
What happens when some recipients are rejected.
**/
enum class rcpt_policy
{
    /// Any rejection aborts the transaction before DATA.
    strict,
    /// The message goes to the accepted recipients and is marked partially delivered.
    lenient
};

/**
When the SMTPUTF8 parameter is added to MAIL FROM.
**/
enum class smtputf8_mode
{
    never,
    /// Only when an envelope address is not ASCII.
    when_needed,
    /// Whenever the server advertises the extension.
    when_advertised
};

/// Opening the TCP connection; replaces resolving and connecting when set.
using dial_function = std::function<mailwire::asio::awaitable<result<mailwire::asio::ip::tcp::socket>>(
    mailwire::asio::any_io_executor, std::string host, std::string service)>;

/**
Connection, security and transaction settings of a client.
**/
struct options
{
    std::string host;
    unsigned short port = DEFAULT_SUBMISSION_PORT;

    net::tls_policy tls_policy = net::tls_policy::mandatory;
    net::tls_options tls;
    /// Server name for SNI and certificate checks, the host when empty.
    std::string sni;

    /// Name announced in EHLO, the local host name when empty.
    std::string helo_name;

    /// No authentication when both password and token are empty.
    sasl::credentials credentials;
    /// Forced mechanism, automatic selection when unset.
    std::optional<sasl::mechanism> mechanism;
    /// PLAIN, LOGIN and XOAUTH2 are refused on plaintext connections to other hosts than localhost.
    bool allow_cleartext_auth = false;

    /// Bound of every protocol round trip.
    std::optional<std::chrono::steady_clock::duration> timeout = std::chrono::seconds(15);
    std::optional<std::chrono::steady_clock::duration> connect_timeout = std::chrono::seconds(15);
    dial_function dial;

    rcpt_policy recipients = rcpt_policy::strict;
    dsn_options dsn;
    smtputf8_mode smtputf8 = smtputf8_mode::when_advertised;
    bool use_8bitmime = true;
    bool use_size_extension = false;

    /// Reconnect before a send when the connection has been idle longer than this.
    std::optional<std::chrono::steady_clock::duration> idle_timeout;
    /// Dial again when the connection check before a send fails.
    bool auto_reconnect = true;

    bool redact_secrets_in_trace = true;
    std::size_t max_line_length = net::DEFAULT_MAX_LINE_LENGTH;
};

namespace detail
{
    struct mail_extension_flags
    {
        bool body_8bitmime = false;
        bool smtputf8 = false;
        std::optional<std::size_t> size;
        std::string ret;
        std::string envid;
    };

    /**
    RFC 3461 xtext: `+`, `=` and bytes outside `!`..`~` become `+XX`.
    **/
    [[nodiscard]] inline std::string xtext_encode(std::string_view text)
    {
        static constexpr char hex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(text.size());
        for (char ch : text)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (byte < 0x21 || byte > 0x7E || ch == '+' || ch == '=')
            {
                out.push_back('+');
                out.push_back(hex[byte >> 4]);
                out.push_back(hex[byte & 0x0F]);
            }
            else
                out.push_back(ch);
        }
        return out;
    }

    /**
    Building `MAIL FROM:<addr>` followed by the extension parameters in a fixed order:
    BODY, SMTPUTF8, SIZE, RET, ENVID.
    **/
    [[nodiscard]] inline result<std::string> build_mail_from_command(std::string_view mail_from,
        const mail_extension_flags& flags)
    {
        MAILWIRE_TRY(mailwire::detail::ensure_no_crlf_or_nul(mail_from, "mail_from"));
        std::string cmd = "MAIL FROM:<";
        cmd += mail_from;
        cmd += ">";
        if (flags.body_8bitmime)
            cmd += " BODY=8BITMIME";
        if (flags.smtputf8)
            cmd += " SMTPUTF8";
        if (flags.size)
            cmd += " SIZE=" + std::to_string(*flags.size);
        if (!flags.ret.empty())
            cmd += " RET=" + flags.ret;
        if (!flags.envid.empty())
            cmd += " ENVID=" + xtext_encode(flags.envid);
        return cmd;
    }

    /**
    Building `RCPT TO:<addr>` with the optional DSN NOTIFY parameter.
    **/
    [[nodiscard]] inline result<std::string> build_rcpt_to_command(std::string_view rcpt, std::string_view notify)
    {
        MAILWIRE_TRY(mailwire::detail::ensure_no_crlf_or_nul(rcpt, "rcpt_to"));
        std::string cmd = "RCPT TO:<";
        cmd += rcpt;
        cmd += ">";
        if (!notify.empty())
        {
            cmd += " NOTIFY=";
            cmd += notify;
        }
        return cmd;
    }
} // namespace detail

} // namespace smtp
} // namespace mailwire
