/*

mechanism.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

SASL mechanism catalogue and automatic selection.

*/

#pragma once

#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <mailwire/detail/ascii.hpp>

namespace mailwire::sasl
{

enum class mechanism
{
    scram_sha_256_plus,
    scram_sha_256,
    scram_sha_1_plus,
    scram_sha_1,
    digest_md5,
    cram_md5,
    xoauth2,
    ntlm,
    login,
    plain
};

/// Mechanisms in the order automatic selection tries them, strongest first.
inline constexpr std::array<mechanism, 10> PREFERENCE_ORDER =
{
    mechanism::scram_sha_256_plus,
    mechanism::scram_sha_256,
    mechanism::scram_sha_1_plus,
    mechanism::scram_sha_1,
    mechanism::digest_md5,
    mechanism::cram_md5,
    mechanism::xoauth2,
    mechanism::ntlm,
    mechanism::login,
    mechanism::plain
};

[[nodiscard]] constexpr std::string_view mechanism_name(mechanism mech) noexcept
{
    switch (mech)
    {
        case mechanism::scram_sha_256_plus: return "SCRAM-SHA-256-PLUS";
        case mechanism::scram_sha_256: return "SCRAM-SHA-256";
        case mechanism::scram_sha_1_plus: return "SCRAM-SHA-1-PLUS";
        case mechanism::scram_sha_1: return "SCRAM-SHA-1";
        case mechanism::digest_md5: return "DIGEST-MD5";
        case mechanism::cram_md5: return "CRAM-MD5";
        case mechanism::xoauth2: return "XOAUTH2";
        case mechanism::ntlm: return "NTLM";
        case mechanism::login: return "LOGIN";
        case mechanism::plain: return "PLAIN";
    }
    return "";
}

inline std::ostream& operator<<(std::ostream& os, mechanism mech)
{
    return os << mechanism_name(mech);
}

/**
Looking up a mechanism by its IANA name, case insensitively.

@param name Name as advertised in the AUTH capability.
@return     Mechanism, or nothing for names the library does not implement.
**/
[[nodiscard]] inline std::optional<mechanism> parse_mechanism(std::string_view name) noexcept
{
    for (mechanism mech : PREFERENCE_ORDER)
        if (detail::iequals_ascii(name, mechanism_name(mech)))
            return mech;
    return std::nullopt;
}

/// Channel binding variants need a TLS channel to bind to.
[[nodiscard]] constexpr bool is_plus(mechanism mech) noexcept
{
    return mech == mechanism::scram_sha_256_plus || mech == mechanism::scram_sha_1_plus;
}

/// Mechanisms which put the password or token on the wire in a recoverable form.
[[nodiscard]] constexpr bool sends_cleartext(mechanism mech) noexcept
{
    return mech == mechanism::plain || mech == mechanism::login || mech == mechanism::xoauth2;
}

struct credentials
{
    std::string username;
    std::string password;
    std::string oauth2_token;
    /// Authorization identity, sent by PLAIN, SCRAM and DIGEST-MD5 when set.
    std::string authzid;
    /// Workstation name announced by NTLM.
    std::string workstation;

    [[nodiscard]] bool has_password() const noexcept
    {
        return !password.empty();
    }

    [[nodiscard]] bool has_token() const noexcept
    {
        return !oauth2_token.empty();
    }
};

/**
Choosing the strongest mechanism both sides support and the credentials allow.

XOAUTH2 is only considered with a token, every other mechanism needs a password. The PLUS
variants need TLS with exportable channel binding data.

@param offered                   Mechanisms advertised by the server, unknown names are ignored.
@param tls_active                Whether the connection is encrypted.
@param channel_binding_available Whether channel binding data can be obtained.
@param creds                     Credentials at hand.
@return                          Mechanism, or nothing when no usable mechanism is left.
**/
[[nodiscard]] inline std::optional<mechanism> select_mechanism(const std::vector<std::string>& offered, bool tls_active,
    bool channel_binding_available, const credentials& creds)
{
    std::vector<mechanism> known;
    for (const auto& name : offered)
        if (auto mech = parse_mechanism(name))
            known.push_back(*mech);

    for (mechanism mech : PREFERENCE_ORDER)
    {
        bool advertised = false;
        for (mechanism k : known)
            advertised = advertised || k == mech;
        if (!advertised)
            continue;
        if (is_plus(mech) && !(tls_active && channel_binding_available))
            continue;
        if (mech == mechanism::xoauth2)
        {
            if (creds.has_token())
                return mech;
            continue;
        }
        if (creds.has_password())
            return mech;
    }
    return std::nullopt;
}

} // namespace mailwire::sasl
