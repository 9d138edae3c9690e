/*

digest_md5.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

DIGEST-MD5 authentication, RFC 2831, limited to the `auth` quality of protection.

*/

#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/codec/base64.hpp>
#include <mailwire/detail/ascii.hpp>
#include <mailwire/detail/random.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/sasl/crypto.hpp>
#include <mailwire/sasl/mechanism.hpp>

namespace mailwire::sasl
{

/**
Parsing the `key=value` and `key="quoted value"` list of a digest challenge.
Keys are lowercased; for repeated keys the first occurrence wins.

@param challenge Decoded challenge.
@return          Directives, or an error for unbalanced quotes.
**/
[[nodiscard]] inline result<std::map<std::string, std::string>> parse_digest_directives(std::string_view challenge)
{
    std::map<std::string, std::string> directives;
    std::size_t pos = 0;
    const auto skip_separators = [&]()
    {
        while (pos < challenge.size() && (challenge[pos] == ',' || challenge[pos] == ' ' || challenge[pos] == '\t'))
            ++pos;
    };

    skip_separators();
    while (pos < challenge.size())
    {
        const auto eq = challenge.find('=', pos);
        if (eq == std::string_view::npos)
            return fail<std::map<std::string, std::string>>(errc::sasl_bad_challenge, "Digest directive without a value.",
                std::string(challenge.substr(pos, 32)));
        std::string key = detail::to_lower_copy(detail::trim_view(challenge.substr(pos, eq - pos)));
        pos = eq + 1;

        std::string value;
        if (pos < challenge.size() && challenge[pos] == '"')
        {
            ++pos;
            bool closed = false;
            while (pos < challenge.size())
            {
                const char ch = challenge[pos++];
                if (ch == '\\' && pos < challenge.size())
                    value.push_back(challenge[pos++]);
                else if (ch == '"')
                {
                    closed = true;
                    break;
                }
                else
                    value.push_back(ch);
            }
            if (!closed)
                return fail<std::map<std::string, std::string>>(errc::sasl_bad_challenge, "Unterminated quoted digest value.",
                    key);
        }
        else
        {
            const auto comma = challenge.find(',', pos);
            const auto end = comma == std::string_view::npos ? challenge.size() : comma;
            value = std::string(detail::trim_view(challenge.substr(pos, end - pos)));
            pos = end;
        }
        directives.emplace(std::move(key), std::move(value));
        skip_separators();
    }
    return directives;
}


/**
Client side of DIGEST-MD5: one response to the server challenge, then verification of `rspauth`.
**/
class digest_md5_session
{
public:

    /**
    @param creds          Username, password and optional authorization identity.
    @param host           Server host name, part of the digest URI.
    @param service        Service name of the digest URI.
    @param cnonce_override Fixed client nonce, random when not given.
    **/
    digest_md5_session(credentials creds, std::string host, std::string service = "smtp",
        std::optional<std::string> cnonce_override = std::nullopt)
        : creds_(std::move(creds)), host_(std::move(host)), service_(std::move(service)),
        cnonce_override_(std::move(cnonce_override))
    {
    }

    [[nodiscard]] result<std::optional<std::string>> start()
    {
        if (creds_.username.empty() || creds_.password.empty())
            return fail<std::optional<std::string>>(errc::invalid_argument, "DIGEST-MD5 needs a username and a password.");
        step_ = 0;
        return std::optional<std::string>{};
    }

    [[nodiscard]] result<std::optional<std::string>> next(std::string_view challenge, bool more);

private:

    result<std::string> respond(std::string_view challenge);

    result<void> verify(std::string_view challenge);

    result<std::string> hex_md5(std::string_view data) const
    {
        std::string raw;
        MAILWIRE_TRY_ASSIGN(raw, digest(digest_algorithm::md5, data));
        return to_hex(raw);
    }

    static std::string quote(std::string_view value)
    {
        std::string out = "\"";
        for (char ch : value)
        {
            if (ch == '"' || ch == '\\')
                out.push_back('\\');
            out.push_back(ch);
        }
        out.push_back('"');
        return out;
    }

    credentials creds_;
    std::string host_;
    std::string service_;
    std::optional<std::string> cnonce_override_;

    int step_ = 0;
    std::string expected_rspauth_;
};


inline result<std::optional<std::string>> digest_md5_session::next(std::string_view challenge, bool more)
{
    if (!more)
        return std::optional<std::string>{};

    if (step_ == 0)
    {
        std::string response;
        MAILWIRE_TRY_ASSIGN(response, respond(challenge));
        step_ = 1;
        return std::optional<std::string>(std::move(response));
    }
    if (step_ == 1)
    {
        MAILWIRE_TRY(verify(challenge));
        step_ = 2;
        return std::optional<std::string>(std::string{});
    }
    return fail<std::optional<std::string>>(errc::sasl_bad_challenge, "Unexpected DIGEST-MD5 challenge.");
}


inline result<std::string> digest_md5_session::respond(std::string_view challenge)
{
    std::map<std::string, std::string> directives;
    MAILWIRE_TRY_ASSIGN(directives, parse_digest_directives(challenge));

    const auto nonce_it = directives.find("nonce");
    if (nonce_it == directives.end() || nonce_it->second.empty())
        return fail<std::string>(errc::sasl_bad_challenge, "DIGEST-MD5 challenge without a nonce.");
    const auto algorithm_it = directives.find("algorithm");
    if (algorithm_it == directives.end() || !detail::iequals_ascii(algorithm_it->second, "md5-sess"))
        return fail<std::string>(errc::sasl_bad_challenge, "DIGEST-MD5 challenge without algorithm=md5-sess.");
    const auto qop_it = directives.find("qop");
    if (qop_it != directives.end())
    {
        bool has_auth = false;
        std::string_view options = qop_it->second;
        while (!options.empty())
        {
            const auto comma = options.find(',');
            has_auth = has_auth || detail::iequals_ascii(detail::trim_view(options.substr(0, comma)), "auth");
            options = comma == std::string_view::npos ? std::string_view{} : options.substr(comma + 1);
        }
        if (!has_auth)
            return fail<std::string>(errc::smtp_auth_unsupported, "DIGEST-MD5 server does not offer qop=auth.",
                qop_it->second);
    }

    const std::string& nonce = nonce_it->second;
    const auto realm_it = directives.find("realm");
    const std::string realm = realm_it == directives.end() ? std::string{} : realm_it->second;
    const bool utf8 = directives.contains("charset") && detail::iequals_ascii(directives["charset"], "utf-8");

    std::string cnonce;
    if (cnonce_override_)
        cnonce = *cnonce_override_;
    else
    {
        std::string raw(16, '\0');
        MAILWIRE_TRY(detail::random_bytes(std::span<unsigned char>(reinterpret_cast<unsigned char*>(raw.data()), raw.size())));
        cnonce = to_hex(raw);
    }

    const std::string nc = "00000001";
    const std::string qop = "auth";
    const std::string digest_uri = service_ + "/" + host_;

    std::string user_hash;
    MAILWIRE_TRY_ASSIGN(user_hash, digest(digest_algorithm::md5, creds_.username + ":" + realm + ":" + creds_.password));
    std::string a1 = user_hash + ":" + nonce + ":" + cnonce;
    if (!creds_.authzid.empty())
        a1 += ":" + creds_.authzid;

    std::string ha1;
    std::string ha2;
    std::string response;
    MAILWIRE_TRY_ASSIGN(ha1, hex_md5(a1));
    MAILWIRE_TRY_ASSIGN(ha2, hex_md5("AUTHENTICATE:" + digest_uri));
    MAILWIRE_TRY_ASSIGN(response, hex_md5(ha1 + ":" + nonce + ":" + nc + ":" + cnonce + ":" + qop + ":" + ha2));

    std::string server_ha2;
    MAILWIRE_TRY_ASSIGN(server_ha2, hex_md5(":" + digest_uri));
    MAILWIRE_TRY_ASSIGN(expected_rspauth_, hex_md5(ha1 + ":" + nonce + ":" + nc + ":" + cnonce + ":" + qop + ":" + server_ha2));

    std::string out;
    if (utf8)
        out += "charset=utf-8,";
    out += "username=" + quote(creds_.username);
    if (!realm.empty())
        out += ",realm=" + quote(realm);
    out += ",nonce=" + quote(nonce);
    out += ",nc=" + nc;
    out += ",cnonce=" + quote(cnonce);
    out += ",digest-uri=" + quote(digest_uri);
    out += ",response=" + response;
    out += ",qop=" + qop;
    if (!creds_.authzid.empty())
        out += ",authzid=" + quote(creds_.authzid);
    return out;
}


inline result<void> digest_md5_session::verify(std::string_view challenge)
{
    std::map<std::string, std::string> directives;
    MAILWIRE_TRY_ASSIGN(directives, parse_digest_directives(challenge));
    const auto it = directives.find("rspauth");
    if (it == directives.end())
        return fail(errc::sasl_bad_challenge, "DIGEST-MD5 server reply without rspauth.");
    if (!constant_time_equal(detail::to_lower_copy(it->second), expected_rspauth_))
        return fail(errc::sasl_server_verification_failed, "DIGEST-MD5 rspauth does not match.");
    return ok();
}

} // namespace mailwire::sasl
