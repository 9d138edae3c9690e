/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

namespace mailwire::detail
{

[[nodiscard]] constexpr char ascii_tolower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

[[nodiscard]] constexpr char ascii_toupper(char c) noexcept
{
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
}

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
            return false;
    }
    return true;
}

[[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && iequals_ascii(text.substr(0, prefix.size()), prefix);
}

[[nodiscard]] inline std::string to_lower_copy(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = ascii_tolower(c);
    return out;
}

[[nodiscard]] inline std::string to_upper_copy(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = ascii_toupper(c);
    return out;
}

[[nodiscard]] constexpr bool is_wsp(char c) noexcept
{
    return c == ' ' || c == '\t';
}

[[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
{
    auto is_space = [](char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };

    while (!sv.empty() && is_space(sv.front()))
        sv.remove_prefix(1);
    while (!sv.empty() && is_space(sv.back()))
        sv.remove_suffix(1);
    return sv;
}

/// True when every byte is 7-bit.
[[nodiscard]] inline bool is_ascii(std::string_view s) noexcept
{
    for (char ch : s)
    {
        if (static_cast<unsigned char>(ch) > 0x7F)
            return false;
    }
    return true;
}

// RFC 5322: field-name = 1*ftext; ftext = %d33-57 / %d59-126 (printable US-ASCII except ":")
[[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
{
    if (name.empty())
        return false;

    for (char ch : name)
    {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!((c >= 33 && c <= 57) || (c >= 59 && c <= 126)))
            return false;
    }
    return true;
}

[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
{
    return (c >= '0' && c <= '9');
}

[[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
{
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

// RFC 5322 "atext" punctuation (without the alphanumerics). Dot is *not* part of atext.
inline constexpr std::string_view ATEXT_PUNCT = "!#$%&'*+-/=?^_`{|}~";

/// atext, extended with UTF-8 bytes as allowed by RFC 6532.
[[nodiscard]] constexpr bool is_atext(char c) noexcept
{
    return is_ascii_alnum(c) || ATEXT_PUNCT.find(c) != std::string_view::npos
        || static_cast<unsigned char>(c) >= 0x80;
}

[[nodiscard]] inline bool is_dot_atom_text(std::string_view s) noexcept
{
    if (s.empty() || s.front() == '.' || s.back() == '.')
        return false;

    bool prev_dot = false;
    for (char ch : s)
    {
        if (ch == '.')
        {
            if (prev_dot)
                return false;
            prev_dot = true;
            continue;
        }
        prev_dot = false;
        if (!is_atext(ch))
            return false;
    }
    return true;
}

/// RFC 5234 VCHAR.
[[nodiscard]] constexpr bool is_vchar(char c) noexcept
{
    return c >= '!' && c <= '~';
}

} // namespace mailwire::detail
