/*

basic.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

PLAIN, LOGIN, XOAUTH2 and CRAM-MD5 mechanisms.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/detail/result.hpp>
#include <mailwire/sasl/crypto.hpp>
#include <mailwire/sasl/mechanism.hpp>

namespace mailwire::sasl
{

/**
 * PLAIN, RFC 4616.
 * Initial response: authzid \0 username \0 password. Any further challenge is an error.
 */
class plain_session
{
public:
    explicit plain_session(credentials creds) : creds_(std::move(creds))
    {
    }

    [[nodiscard]] result<std::optional<std::string>> start()
    {
        std::string response;
        response.reserve(creds_.authzid.size() + creds_.username.size() + creds_.password.size() + 2);
        response += creds_.authzid;
        response.push_back('\0');
        response += creds_.username;
        response.push_back('\0');
        response += creds_.password;
        return std::optional<std::string>(std::move(response));
    }

    [[nodiscard]] result<std::optional<std::string>> next(std::string_view, bool more)
    {
        if (more)
            return fail<std::optional<std::string>>(errc::sasl_bad_challenge, "Unexpected server challenge for PLAIN.");
        return std::optional<std::string>{};
    }

private:
    credentials creds_;
};


/**
 * LOGIN, the legacy username then password exchange.
 * The well known prompts select the answer; other prompts are answered in order.
 */
class login_session
{
public:
    static constexpr std::string_view USERNAME_PROMPT = "Username:";
    static constexpr std::string_view PASSWORD_PROMPT = "Password:";
    static constexpr std::string_view DRAFT_USERNAME_PROMPT{"User Name\0", 10};
    static constexpr std::string_view DRAFT_PASSWORD_PROMPT{"Password\0", 9};

    explicit login_session(credentials creds) : creds_(std::move(creds))
    {
    }

    [[nodiscard]] result<std::optional<std::string>> start()
    {
        step_ = 0;
        return std::optional<std::string>{};
    }

    [[nodiscard]] result<std::optional<std::string>> next(std::string_view challenge, bool more)
    {
        if (!more)
            return std::optional<std::string>{};

        if (challenge == USERNAME_PROMPT || challenge == DRAFT_USERNAME_PROMPT)
        {
            step_ = 1;
            return std::optional<std::string>(creds_.username);
        }
        if (challenge == PASSWORD_PROMPT || challenge == DRAFT_PASSWORD_PROMPT)
        {
            step_ = 2;
            return std::optional<std::string>(creds_.password);
        }

        switch (step_++)
        {
            case 0: return std::optional<std::string>(creds_.username);
            case 1: return std::optional<std::string>(creds_.password);
            default:
                return fail<std::optional<std::string>>(errc::sasl_bad_challenge, "Unexpected server challenge for LOGIN.",
                    std::string(challenge.substr(0, 64)));
        }
    }

private:
    credentials creds_;
    int step_ = 0;
};


/**
 * XOAUTH2 bearer token.
 * On failure the server sends a JSON error as a challenge, an empty response lets it finish with 5xx.
 */
class xoauth2_session
{
public:
    explicit xoauth2_session(credentials creds) : creds_(std::move(creds))
    {
    }

    [[nodiscard]] result<std::optional<std::string>> start()
    {
        if (creds_.oauth2_token.empty())
            return fail<std::optional<std::string>>(errc::invalid_argument, "XOAUTH2 needs an access token.");
        return std::optional<std::string>("user=" + creds_.username + "\x01" "auth=Bearer " + creds_.oauth2_token + "\x01\x01");
    }

    [[nodiscard]] result<std::optional<std::string>> next(std::string_view challenge, bool more)
    {
        if (!more)
            return std::optional<std::string>{};
        error_detail_ = std::string(challenge);
        return std::optional<std::string>(std::string{});
    }

    /// JSON error the server sent before rejecting the token, if any.
    [[nodiscard]] const std::string& server_error() const noexcept
    {
        return error_detail_;
    }

private:
    credentials creds_;
    std::string error_detail_;
};


/**
 * CRAM-MD5, RFC 2195: `username hex(HMAC-MD5(password, challenge))`.
 */
class cram_md5_session
{
public:
    explicit cram_md5_session(credentials creds) : creds_(std::move(creds))
    {
    }

    [[nodiscard]] result<std::optional<std::string>> start()
    {
        answered_ = false;
        return std::optional<std::string>{};
    }

    [[nodiscard]] result<std::optional<std::string>> next(std::string_view challenge, bool more)
    {
        if (!more)
            return std::optional<std::string>{};
        if (answered_)
            return fail<std::optional<std::string>>(errc::sasl_bad_challenge, "Unexpected second CRAM-MD5 challenge.");
        if (challenge.empty())
            return fail<std::optional<std::string>>(errc::sasl_bad_challenge, "CRAM-MD5 challenge is empty.");

        std::string mac;
        MAILWIRE_TRY_ASSIGN(mac, hmac(digest_algorithm::md5, creds_.password, challenge));
        answered_ = true;
        return std::optional<std::string>(creds_.username + " " + to_hex(mac));
    }

private:
    credentials creds_;
    bool answered_ = false;
};

} // namespace mailwire::sasl
