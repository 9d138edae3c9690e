/*

random.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Cryptographically sourced random values (OpenSSL RAND_bytes).

*/

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <openssl/rand.h>

#include <mailwire/detail/result.hpp>

namespace mailwire::detail
{

inline constexpr std::string_view RANDOM_ALPHABET = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ1234567890";

inline result<void> random_bytes(std::span<unsigned char> out)
{
    if (out.empty())
        return ok();
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1)
        return fail(errc::crypto_failed, "RAND_bytes failed.");
    return ok();
}

/// Uniform value in [0, bound). Rejection sampling avoids modulo bias.
inline result<std::uint64_t> random_below(std::uint64_t bound)
{
    if (bound == 0)
        return fail<std::uint64_t>(errc::invalid_argument, "Random bound must be positive.");

    const std::uint64_t limit = UINT64_MAX - (UINT64_MAX % bound);
    while (true)
    {
        std::array<unsigned char, 8> buf{};
        MAILWIRE_TRY(random_bytes(buf));
        std::uint64_t value = 0;
        for (unsigned char b : buf)
            value = (value << 8) | b;
        if (value < limit)
            return value % bound;
    }
}

/// Alphanumeric string of the given length.
inline result<std::string> random_string(std::size_t length)
{
    std::string out;
    out.reserve(length);
    // 248 is the largest multiple of the alphabet size that fits in a byte.
    constexpr unsigned limit = 256 - (256 % RANDOM_ALPHABET.size());
    std::array<unsigned char, 64> buf{};
    while (out.size() < length)
    {
        MAILWIRE_TRY(random_bytes(buf));
        for (unsigned char b : buf)
        {
            if (b >= limit)
                continue;
            out.push_back(RANDOM_ALPHABET[b % RANDOM_ALPHABET.size()]);
            if (out.size() == length)
                break;
        }
    }
    return out;
}

/// Multipart boundary: 30 random bytes in lowercase hex.
inline result<std::string> random_boundary()
{
    static constexpr char hex[] = "0123456789abcdef";
    std::array<unsigned char, 30> buf{};
    MAILWIRE_TRY(random_bytes(buf));
    std::string out;
    out.reserve(buf.size() * 2);
    for (unsigned char b : buf)
    {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

} // namespace mailwire::detail
