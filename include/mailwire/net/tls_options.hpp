/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/ssl.h>

#include <mailwire/detail/ascii.hpp>

namespace mailwire::net
{

/**
How TLS is used on a mail connection.
**/
enum class tls_policy
{
    /// STARTTLS must succeed, otherwise the connection fails.
    mandatory,
    /// STARTTLS is attempted when offered; failure falls back to plaintext.
    opportunistic,
    /// Plaintext only.
    none,
    /// TLS from the first byte (SMTPS, port 465).
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_policy policy) noexcept
{
    switch (policy)
    {
        case tls_policy::mandatory: return "mandatory";
        case tls_policy::opportunistic: return "opportunistic";
        case tls_policy::none: return "none";
        case tls_policy::implicit: return "implicit";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, tls_policy policy)
{
    return os << to_string(policy);
}

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
    /// SHA-256 of the leaf SubjectPublicKeyInfo, hex or base64.
    std::vector<std::string> pinned_spki_sha256;
    /// SHA-256 of the leaf certificate, hex or base64.
    std::vector<std::string> pinned_cert_sha256;
    bool allow_self_signed = false;
};

/**
Bringing a fingerprint to a comparable form: lowercase hex without separators, or padded base64.
**/
[[nodiscard]] inline std::string normalize_fingerprint(std::string_view input)
{
    std::string compact;
    compact.reserve(input.size());
    for (char ch : input)
    {
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n')
            continue;
        compact.push_back(ch);
    }

    std::string hex;
    hex.reserve(compact.size());
    bool is_hex = !compact.empty();
    for (char ch : compact)
    {
        if (ch == ':' || ch == '-')
            continue;
        const bool digit = detail::is_ascii_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
        if (!digit)
        {
            is_hex = false;
            break;
        }
        hex.push_back(detail::ascii_tolower(ch));
    }
    if (is_hex && !hex.empty())
        return hex;

    const std::size_t mod = compact.size() % 4;
    if (mod != 0)
        compact.append(4 - mod, '=');
    return compact;
}

[[nodiscard]] inline bool constant_time_equals(std::string_view a, std::string_view b) noexcept
{
    std::size_t diff = a.size() ^ b.size();
    const std::size_t max_len = std::max(a.size(), b.size());
    for (std::size_t i = 0; i < max_len; ++i)
    {
        const unsigned char ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
        const unsigned char cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
        diff |= static_cast<std::size_t>(ca ^ cb);
    }
    return diff == 0;
}

} // namespace mailwire::net
