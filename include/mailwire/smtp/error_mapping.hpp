/*

smtp/error_mapping.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping between SMTP reply codes and mailwire::errc.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mailwire/detail/error_detail.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/smtp/types.hpp>

namespace mailwire::smtp
{

enum class command_kind
{
    greeting,
    ehlo,
    helo,
    starttls,
    auth,
    mail_from,
    rcpt_to,
    data_cmd,
    data_body,
    rset,
    noop,
    quit,
    other
};

[[nodiscard]] constexpr std::string_view command_name(command_kind k) noexcept
{
    switch (k)
    {
        case command_kind::greeting: return "greeting";
        case command_kind::ehlo: return "ehlo";
        case command_kind::helo: return "helo";
        case command_kind::starttls: return "starttls";
        case command_kind::auth: return "auth";
        case command_kind::mail_from: return "mail_from";
        case command_kind::rcpt_to: return "rcpt_to";
        case command_kind::data_cmd: return "data_cmd";
        case command_kind::data_body: return "data_body";
        case command_kind::rset: return "rset";
        case command_kind::noop: return "noop";
        case command_kind::quit: return "quit";
        case command_kind::other: return "other";
    }
    return "other";
}

[[nodiscard]] constexpr bool is_temporary_reply(int code) noexcept
{
    return code >= 400 && code < 500;
}

[[nodiscard]] constexpr bool is_permanent_reply(int code) noexcept
{
    return code >= 500 && code < 600;
}

[[nodiscard]] constexpr errc map_smtp_reply(command_kind k, int code) noexcept
{
    if (code == 421)
        return errc::smtp_service_not_available;

    const bool negative = is_temporary_reply(code) || is_permanent_reply(code);
    switch (k)
    {
        case command_kind::auth:
            if (negative)
                return errc::smtp_auth_failed;
            break;
        case command_kind::rcpt_to:
            if (negative)
                return errc::smtp_rejected_recipient;
            break;
        case command_kind::mail_from:
            if (negative)
                return errc::smtp_mail_from_rejected;
            break;
        case command_kind::data_cmd:
            if (code != 354)
                return errc::smtp_data_rejected;
            break;
        case command_kind::data_body:
            if (negative)
                return errc::smtp_data_rejected;
            break;
        default:
            break;
    }

    if (is_temporary_reply(code))
        return errc::smtp_temporary_failure;
    if (is_permanent_reply(code))
        return errc::smtp_permanent_failure;
    return errc::smtp_bad_reply;
}

/**
Finding an RFC 3463 enhanced status code such as `5.1.1` in the reply text.
**/
[[nodiscard]] inline std::string find_enhanced_status(const std::vector<std::string>& lines)
{
    for (const auto& line : lines)
    {
        for (std::size_t i = 0; i + 4 < line.size(); ++i)
        {
            const char a = line[i];
            const char b = line[i + 1];
            const char c = line[i + 2];
            const char d = line[i + 3];
            const char e = line[i + 4];
            if (i > 0 && line[i - 1] != ' ')
                continue;
            if (a >= '2' && a <= '5' && b == '.' && c >= '0' && c <= '9' && d == '.' && e >= '0' && e <= '9')
            {
                std::size_t end = i + 5;
                while (end < line.size() && line[end] >= '0' && line[end] <= '9')
                    ++end;
                return line.substr(i, end - i);
            }
        }
    }
    return {};
}

[[nodiscard]] inline mailwire::detail::error_detail make_smtp_detail(std::string_view host, std::string_view service,
    command_kind k, std::string_view cmd_line_redacted, const reply& r)
{
    mailwire::detail::error_detail info;
    info.add("proto", "smtp");
    info.add("host", host);
    info.add("service", service);
    info.add("command", command_name(k));
    if (!cmd_line_redacted.empty())
        info.add("command.line", cmd_line_redacted);
    info.add_int("reply.code", static_cast<std::int64_t>(r.status));
    for (std::size_t i = 0; i < r.lines.size(); ++i)
        info.add("reply.line" + std::to_string(i), r.lines[i]);
    const std::string enhanced = find_enhanced_status(r.lines);
    if (!enhanced.empty())
        info.add("enhanced", enhanced);
    return info;
}

/**
Turning an unexpected reply into an error.

@param k       Command the reply answers.
@param r       Reply.
@param message Summary of what failed.
@param detail  Context built by `make_smtp_detail()`.
**/
[[nodiscard]] inline error_info error_from_reply(command_kind k, const reply& r, std::string message, std::string detail = {})
{
    error_info err;
    err.code = map_smtp_reply(k, r.status);
    err.message = std::move(message);
    if (!r.lines.empty())
        err.message += " " + std::to_string(r.status) + " " + r.message();
    err.detail = std::move(detail);
    err.reply_code = r.status;
    return err;
}

} // namespace mailwire::smtp
