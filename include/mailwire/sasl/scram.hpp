/*

scram.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

SCRAM-SHA-1 and SCRAM-SHA-256 with optional channel binding, RFC 5802 and RFC 7677.

*/

#pragma once

#include <charconv>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/codec/base64.hpp>
#include <mailwire/detail/random.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/net/upgradable_stream.hpp>
#include <mailwire/sasl/crypto.hpp>
#include <mailwire/sasl/mechanism.hpp>

namespace mailwire::sasl
{

/**
Client side of a SCRAM exchange.

The exchange starts without an initial response: the server answers `AUTH` with an empty
challenge, the client sends its first message, proves the password on the server first
message, then verifies the server signature.
**/
class scram_session
{
public:

    /**
    Creating the session.

    @param mech            One of the four SCRAM mechanisms.
    @param creds           Username, password and optional authorization identity.
    @param binding         Channel binding data, required for the PLUS variants.
    @param nonce_override  Fixed client nonce, random when not given.
    **/
    scram_session(mechanism mech, credentials creds, std::optional<net::channel_binding> binding = std::nullopt,
        std::optional<std::string> nonce_override = std::nullopt);

    [[nodiscard]] result<std::optional<std::string>> start();

    /**
    Answering a server challenge.

    @param challenge Decoded challenge text.
    @param more      True for a 334 continuation, false for the final 235 reply.
    @return          Response to send, or nothing to end the exchange.
    **/
    [[nodiscard]] result<std::optional<std::string>> next(std::string_view challenge, bool more);

    [[nodiscard]] bool server_verified() const noexcept
    {
        return server_verified_;
    }

private:

    result<std::string> client_first();

    result<std::string> client_final(std::string_view server_first);

    result<void> verify_server(std::string_view server_final);

    std::string gs2_header() const;

    static std::string escape_name(std::string_view name);

    void reset();

    mechanism mech_;
    credentials creds_;
    digest_algorithm alg_;
    std::size_t digest_size_;
    std::optional<net::channel_binding> binding_;
    std::optional<std::string> nonce_override_;

    std::string nonce_;
    std::string client_first_bare_;
    std::string salted_password_;
    std::string auth_message_;
    bool server_verified_ = false;
};


inline scram_session::scram_session(mechanism mech, credentials creds, std::optional<net::channel_binding> binding,
    std::optional<std::string> nonce_override)
    : mech_(mech), creds_(std::move(creds)), binding_(std::move(binding)), nonce_override_(std::move(nonce_override))
{
    const bool sha256 = mech_ == mechanism::scram_sha_256 || mech_ == mechanism::scram_sha_256_plus;
    alg_ = sha256 ? digest_algorithm::sha256 : digest_algorithm::sha1;
    digest_size_ = sha256 ? 32 : 20;
}


inline result<std::optional<std::string>> scram_session::start()
{
    if (is_plus(mech_) && !binding_)
        return fail<std::optional<std::string>>(errc::invalid_state, "Channel binding data is required.",
            std::string(mechanism_name(mech_)));
    if (creds_.username.empty() || creds_.password.empty())
        return fail<std::optional<std::string>>(errc::invalid_argument, "SCRAM needs a username and a password.");
    reset();
    return std::optional<std::string>{};
}


inline result<std::optional<std::string>> scram_session::next(std::string_view challenge, bool more)
{
    if (!more)
    {
        if (!server_verified_)
            return fail<std::optional<std::string>>(errc::sasl_server_verification_failed,
                "Server accepted the authentication without proving the password.");
        return std::optional<std::string>{};
    }

    result<std::optional<std::string>> res = std::optional<std::string>{};
    if (challenge.empty())
    {
        auto first = client_first();
        if (first)
            return std::optional<std::string>(std::move(*first));
        res = std::unexpected(std::move(first).error());
    }
    else if (challenge.starts_with("r="))
    {
        auto final_message = client_final(challenge);
        if (final_message)
            return std::optional<std::string>(std::move(*final_message));
        res = std::unexpected(std::move(final_message).error());
    }
    else if (challenge.starts_with("v="))
    {
        auto verified = verify_server(challenge);
        if (verified)
            return std::optional<std::string>(std::string{});
        res = std::unexpected(std::move(verified).error());
    }
    else
        res = fail<std::optional<std::string>>(errc::sasl_bad_challenge, "Unexpected SCRAM server message.",
            std::string(challenge.substr(0, 64)));

    reset();
    return res;
}


inline result<std::string> scram_session::client_first()
{
    reset();
    if (nonce_override_)
        nonce_ = *nonce_override_;
    else
    {
        std::string raw(24, '\0');
        MAILWIRE_TRY(detail::random_bytes(std::span<unsigned char>(reinterpret_cast<unsigned char*>(raw.data()), raw.size())));
        nonce_ = codec::base64_encode(raw);
    }
    client_first_bare_ = "n=" + escape_name(creds_.username) + ",r=" + nonce_;
    return gs2_header() + client_first_bare_;
}


inline result<std::string> scram_session::client_final(std::string_view server_first)
{
    if (nonce_.empty())
        return fail<std::string>(errc::sasl_bad_challenge, "Server first message before the client first message.");

    std::string_view combined_nonce;
    std::string_view salt_text;
    std::string_view iter_text;
    std::size_t index = 0;
    std::string_view rest = server_first;
    while (!rest.empty())
    {
        const auto comma = rest.find(',');
        const std::string_view field = rest.substr(0, comma);
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        if (index == 0 && field.starts_with("r="))
            combined_nonce = field.substr(2);
        else if (index == 1 && field.starts_with("s="))
            salt_text = field.substr(2);
        else if (index == 2 && field.starts_with("i="))
            iter_text = field.substr(2);
        else if (index < 3)
            return fail<std::string>(errc::sasl_bad_challenge, "Malformed SCRAM server first message.",
                std::string(field.substr(0, 32)));
        ++index;
    }
    if (index < 3)
        return fail<std::string>(errc::sasl_bad_challenge, "Not enough fields in the SCRAM server first message.");
    if (!combined_nonce.starts_with(nonce_))
        return fail<std::string>(errc::sasl_bad_challenge, "Server nonce does not start with the client nonce.");

    std::string salt;
    auto decoded_salt = codec::base64_decode(salt_text);
    if (!decoded_salt)
        return fail<std::string>(errc::sasl_bad_challenge, "Invalid SCRAM salt.", decoded_salt.error().message);
    salt = std::move(*decoded_salt);

    int iterations = 0;
    const auto [ptr, ec] = std::from_chars(iter_text.data(), iter_text.data() + iter_text.size(), iterations);
    if (ec != std::errc{} || ptr != iter_text.data() + iter_text.size() || iterations <= 0)
        return fail<std::string>(errc::sasl_bad_challenge, "Invalid SCRAM iteration count.", std::string(iter_text));

    nonce_ = std::string(combined_nonce);
    MAILWIRE_TRY_ASSIGN(salted_password_, pbkdf2(alg_, creds_.password, salt, iterations, digest_size_));

    std::string channel;
    if (binding_ && is_plus(mech_))
        channel = codec::base64_encode(gs2_header() + binding_->data);
    else
        channel = codec::base64_encode(gs2_header());
    const std::string without_proof = "c=" + channel + ",r=" + nonce_;
    auth_message_ = client_first_bare_ + "," + std::string(server_first) + "," + without_proof;

    std::string client_key;
    std::string stored_key;
    std::string client_signature;
    MAILWIRE_TRY_ASSIGN(client_key, hmac(alg_, salted_password_, "Client Key"));
    MAILWIRE_TRY_ASSIGN(stored_key, digest(alg_, client_key));
    MAILWIRE_TRY_ASSIGN(client_signature, hmac(alg_, stored_key, auth_message_));

    std::string proof(client_key.size(), '\0');
    for (std::size_t i = 0; i < proof.size(); ++i)
        proof[i] = static_cast<char>(client_key[i] ^ client_signature[i]);
    return without_proof + ",p=" + codec::base64_encode(proof);
}


inline result<void> scram_session::verify_server(std::string_view server_final)
{
    if (auth_message_.empty())
        return fail(errc::sasl_bad_challenge, "Server final message before the client proof.");

    std::string server_key;
    std::string signature;
    MAILWIRE_TRY_ASSIGN(server_key, hmac(alg_, salted_password_, "Server Key"));
    MAILWIRE_TRY_ASSIGN(signature, hmac(alg_, server_key, auth_message_));

    std::string_view received = server_final.substr(2);
    const auto comma = received.find(',');
    if (comma != std::string_view::npos)
        received = received.substr(0, comma);
    if (!constant_time_equal(received, codec::base64_encode(signature)))
        return fail(errc::sasl_server_verification_failed, "Invalid SCRAM server signature.");
    server_verified_ = true;
    return ok();
}


inline std::string scram_session::gs2_header() const
{
    std::string header;
    if (binding_ && is_plus(mech_))
        header = "p=" + std::string(net::to_string(binding_->type));
    else
        header = "n";
    header += ",";
    if (!creds_.authzid.empty())
        header += "a=" + escape_name(creds_.authzid);
    header += ",";
    return header;
}


inline std::string scram_session::escape_name(std::string_view name)
{
    std::string out;
    out.reserve(name.size());
    for (char ch : name)
    {
        if (ch == '=')
            out += "=3D";
        else if (ch == ',')
            out += "=2C";
        else
            out.push_back(ch);
    }
    return out;
}


inline void scram_session::reset()
{
    nonce_.clear();
    client_first_bare_.clear();
    salted_password_.clear();
    auth_message_.clear();
    server_verified_ = false;
}

} // namespace mailwire::sasl
