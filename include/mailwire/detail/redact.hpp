/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Hides credentials in SMTP protocol lines before they reach logs or error details.

*/

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <mailwire/detail/ascii.hpp>

namespace mailwire::detail
{

inline void split_tokens(std::string_view text, std::vector<std::string_view>& out)
{
    out.clear();
    while (!text.empty())
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        if (text.empty())
            break;
        const auto pos = text.find(' ');
        if (pos == std::string_view::npos)
        {
            out.push_back(text);
            break;
        }
        out.push_back(text.substr(0, pos));
        text.remove_prefix(pos + 1);
    }
}

[[nodiscard]] inline bool looks_like_base64(std::string_view text) noexcept
{
    if (text.empty())
        return false;
    for (char ch : text)
    {
        if (!(is_ascii_alnum(ch) || ch == '+' || ch == '/' || ch == '='))
            return false;
    }
    return true;
}

[[nodiscard]] inline bool has_base64_markers(std::string_view text) noexcept
{
    for (char ch : text)
    {
        if (ch == '=' || ch == '+' || ch == '/' || is_ascii_digit(ch))
            return true;
    }
    return false;
}

/**
Redact one protocol line.

`AUTH <mech> <initial-response>` keeps the mechanism, a lone base64 token (a SASL
continuation) is replaced entirely and a `*` cancellation is kept as is.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string_view trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == '\n'))
        trimmed.remove_suffix(1);
    const std::string_view suffix = line.substr(trimmed.size());

    std::vector<std::string_view> tokens;
    split_tokens(trimmed, tokens);
    if (tokens.empty())
        return std::string(line);

    bool redacted = false;
    if (iequals_ascii(tokens.front(), "AUTH"))
    {
        if (tokens.size() >= 3)
        {
            tokens.resize(3);
            tokens[2] = "<redacted>";
            redacted = true;
        }
    }
    else if (tokens.size() == 1)
    {
        const std::string_view token = tokens.front();
        if (looks_like_base64(token) && (token.size() >= 12 || has_base64_markers(token)))
        {
            tokens[0] = "<redacted>";
            redacted = true;
        }
    }

    if (!redacted)
        return std::string(line);

    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        if (i > 0)
            out.push_back(' ');
        out.append(tokens[i].data(), tokens[i].size());
    }
    out.append(suffix.data(), suffix.size());
    return out;
}

[[nodiscard]] inline std::string redact_if_needed(std::string_view line, bool enable_redaction)
{
    if (!enable_redaction)
        return std::string(line);
    return redact_line(line);
}

} // namespace mailwire::detail
