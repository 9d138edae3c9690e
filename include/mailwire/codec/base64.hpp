/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <mailwire/detail/result.hpp>

namespace mailwire::codec
{

inline constexpr std::string_view BASE64_CHARSET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/**
Encode a buffer into a single base64 line.

@param data Bytes to encode.
@return     Padded base64 text without line breaks.
**/
[[nodiscard]] inline std::string base64_encode(std::string_view data)
{
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3)
    {
        const auto o0 = static_cast<unsigned char>(data[i]);
        const auto o1 = static_cast<unsigned char>(data[i + 1]);
        const auto o2 = static_cast<unsigned char>(data[i + 2]);
        out.push_back(BASE64_CHARSET[o0 >> 2]);
        out.push_back(BASE64_CHARSET[((o0 & 0x03) << 4) | (o1 >> 4)]);
        out.push_back(BASE64_CHARSET[((o1 & 0x0f) << 2) | (o2 >> 6)]);
        out.push_back(BASE64_CHARSET[o2 & 0x3f]);
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1)
    {
        const auto o0 = static_cast<unsigned char>(data[i]);
        out.push_back(BASE64_CHARSET[o0 >> 2]);
        out.push_back(BASE64_CHARSET[(o0 & 0x03) << 4]);
        out.append("==");
    }
    else if (rest == 2)
    {
        const auto o0 = static_cast<unsigned char>(data[i]);
        const auto o1 = static_cast<unsigned char>(data[i + 1]);
        out.push_back(BASE64_CHARSET[o0 >> 2]);
        out.push_back(BASE64_CHARSET[((o0 & 0x03) << 4) | (o1 >> 4)]);
        out.push_back(BASE64_CHARSET[(o1 & 0x0f) << 2]);
        out.push_back('=');
    }
    return out;
}

/**
Decode base64 text.

CR and LF are skipped so folded bodies can be decoded directly. Any other character outside
the alphabet, misplaced padding or a truncated quantum is an error.
**/
[[nodiscard]] inline result<std::string> base64_decode(std::string_view text)
{
    static constexpr auto table = [] {
        std::array<std::int8_t, 256> t{};
        t.fill(-1);
        for (std::size_t i = 0; i < BASE64_CHARSET.size(); ++i)
            t[static_cast<unsigned char>(BASE64_CHARSET[i])] = static_cast<std::int8_t>(i);
        return t;
    }();

    std::string out;
    out.reserve(text.size() / 4 * 3);

    std::uint32_t accum = 0;
    int bits = 0;
    std::size_t quantum = 0;
    std::size_t padding = 0;
    for (char ch : text)
    {
        if (ch == '\r' || ch == '\n')
            continue;
        if (ch == '=')
        {
            ++padding;
            ++quantum;
            continue;
        }
        const std::int8_t value = table[static_cast<unsigned char>(ch)];
        if (value < 0 || padding > 0)
            return fail<std::string>(errc::codec_invalid_input, "Invalid base64 input.");
        accum = (accum << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        ++quantum;
        if (bits >= 8)
        {
            bits -= 8;
            out.push_back(static_cast<char>((accum >> bits) & 0xFF));
        }
    }

    if (quantum % 4 != 0 || padding > 2)
        return fail<std::string>(errc::codec_invalid_input, "Truncated base64 input.");
    return out;
}

} // namespace mailwire::codec
