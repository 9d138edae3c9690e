/*

session.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <mailwire/detail/result.hpp>
#include <mailwire/net/upgradable_stream.hpp>
#include <mailwire/sasl/basic.hpp>
#include <mailwire/sasl/digest_md5.hpp>
#include <mailwire/sasl/mechanism.hpp>
#include <mailwire/sasl/ntlm.hpp>
#include <mailwire/sasl/scram.hpp>

namespace mailwire::sasl
{

/**
One authentication exchange with any of the supported mechanisms.

`start()` yields the initial response, nothing when the mechanism waits for a first challenge.
`next()` is called with every decoded 334 challenge (`more` set) and once with the text of
the final 235 reply (`more` cleared); it yields the response to send, nothing to stop.
**/
class session
{
public:

    using variant_type = std::variant<plain_session, login_session, xoauth2_session, cram_md5_session,
        digest_md5_session, ntlm_session, scram_session>;

    session(mechanism mech, variant_type impl) : mech_(mech), impl_(std::move(impl))
    {
    }

    [[nodiscard]] mechanism mech() const noexcept
    {
        return mech_;
    }

    [[nodiscard]] std::string_view name() const noexcept
    {
        return mechanism_name(mech_);
    }

    [[nodiscard]] result<std::optional<std::string>> start()
    {
        return std::visit([](auto& impl) { return impl.start(); }, impl_);
    }

    [[nodiscard]] result<std::optional<std::string>> next(std::string_view challenge, bool more)
    {
        return std::visit([challenge, more](auto& impl) { return impl.next(challenge, more); }, impl_);
    }

    /// A failing step is answered with `*` to abort the exchange, except for XOAUTH2.
    [[nodiscard]] bool cancels_on_error() const noexcept
    {
        return mech_ != mechanism::xoauth2;
    }

private:
    mechanism mech_;
    variant_type impl_;
};


/// Inputs of a session besides the credentials.
struct session_options
{
    /// Host name of the server, used by DIGEST-MD5.
    std::string host;
    /// Required by the PLUS mechanisms.
    std::optional<net::channel_binding> binding;
    /// Fixed client nonce for SCRAM and DIGEST-MD5.
    std::optional<std::string> nonce;
};

/**
Creating the session of a mechanism.

@param mech  Mechanism to run.
@param creds Credentials.
@param opts  Host, channel binding and nonce.
@return      Session, or an error when a PLUS mechanism has no channel binding data.
**/
[[nodiscard]] inline result<session> make_session(mechanism mech, credentials creds, session_options opts = {})
{
    switch (mech)
    {
        case mechanism::plain:
            return session(mech, plain_session(std::move(creds)));
        case mechanism::login:
            return session(mech, login_session(std::move(creds)));
        case mechanism::xoauth2:
            return session(mech, xoauth2_session(std::move(creds)));
        case mechanism::cram_md5:
            return session(mech, cram_md5_session(std::move(creds)));
        case mechanism::digest_md5:
            return session(mech, digest_md5_session(std::move(creds), std::move(opts.host), "smtp", std::move(opts.nonce)));
        case mechanism::ntlm:
            return session(mech, ntlm_session(std::move(creds)));
        case mechanism::scram_sha_256_plus:
        case mechanism::scram_sha_1_plus:
            if (!opts.binding)
                return fail<session>(errc::invalid_state, "Channel binding data is required.", std::string(mechanism_name(mech)));
            [[fallthrough]];
        case mechanism::scram_sha_256:
        case mechanism::scram_sha_1:
            return session(mech, scram_session(mech, std::move(creds), std::move(opts.binding), std::move(opts.nonce)));
    }
    return fail<session>(errc::smtp_auth_unsupported, "Unknown SASL mechanism.");
}

} // namespace mailwire::sasl
