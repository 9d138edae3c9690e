/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <string_view>

namespace mailwire::codec
{

/// Line terminator mandated by RFC 5322 and RFC 5321.
inline constexpr std::string_view END_OF_LINE = "\r\n";

inline constexpr std::string_view CHARSET_ASCII = "US-ASCII";
inline constexpr std::string_view CHARSET_UTF8 = "UTF-8";

inline constexpr std::string_view HEX_DIGITS = "0123456789ABCDEF";

/// RFC 2045 limit for base64 and quoted-printable body lines.
inline constexpr std::size_t MAX_BODY_LINE_LENGTH = 76;

/// Returns -1 for a character that is not a hexadecimal digit.
[[nodiscard]] constexpr int hex_digit_to_int(char digit) noexcept
{
    if (digit >= '0' && digit <= '9')
        return digit - '0';
    if (digit >= 'A' && digit <= 'F')
        return digit - 'A' + 10;
    if (digit >= 'a' && digit <= 'f')
        return digit - 'a' + 10;
    return -1;
}

} // namespace mailwire::codec
