/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/err.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <mailwire/codec/base64.hpp>
#include <mailwire/detail/asio_decl.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/net/tls_options.hpp>

namespace mailwire
{
namespace net
{

using mailwire::asio::any_io_executor;
using mailwire::asio::awaitable;
using mailwire::asio::tcp;
namespace ssl = mailwire::asio::ssl;

/**
TLS channel binding types of RFC 5929 and RFC 9266.
**/
enum class channel_binding_type
{
    tls_unique,
    tls_exporter
};

[[nodiscard]] constexpr std::string_view to_string(channel_binding_type type) noexcept
{
    return type == channel_binding_type::tls_unique ? "tls-unique" : "tls-exporter";
}

/**
Channel binding name and data of an established TLS session.
**/
struct channel_binding
{
    channel_binding_type type;
    std::string data;
};


/**
Stable stream type that can be upgraded to TLS without changing the type.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    explicit upgradable_stream(executor_type executor)
        : stream_(tcp::socket(executor))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    const lowest_layer_type& lowest_layer() const
    {
        return std::visit([](const auto& stream) -> const lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /**
    Switching the socket to TLS and running the client handshake.

    The context is expected to be configured already (trust store, protocol floor).

    @param context TLS context.
    @param sni     Server name for SNI and host verification.
    @param opt     Verification and pinning options.
    @return        Error on handshake, verification or pinning failure.
    **/
    awaitable<result<void>> start_tls(ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return ok();

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);

        auto& tls_stream = std::get<ssl_stream>(stream_);
        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (opt.verify == verify_mode::peer)
        {
            tls_stream.set_verify_mode(ssl::verify_peer);
            if (opt.verify_host)
            {
                if (sni.empty())
                    co_return fail(errc::tls_verify_failed, "TLS hostname verification requires a host name.");
                auto verifier = ssl::host_name_verification(sni);
                tls_stream.set_verify_callback([verifier, allow_self_signed = opt.allow_self_signed](bool preverified,
                    ssl::verify_context& ctx) mutable
                {
                    if (!relax_verify(preverified, ctx, allow_self_signed))
                        return false;
                    return verifier(true, ctx);
                });
            }
            else if (opt.allow_self_signed)
            {
                tls_stream.set_verify_callback([](bool preverified, ssl::verify_context& ctx)
                {
                    return relax_verify(preverified, ctx, true);
                });
            }
        }
        else
            tls_stream.set_verify_mode(ssl::verify_none);

        auto [ec] = co_await tls_stream.async_handshake(ssl::stream_base::client, mailwire::asio::use_nothrow_awaitable);
        if (ec)
        {
            const long verify_result = SSL_get_verify_result(tls_stream.native_handle());
            if (verify_result != X509_V_OK)
                co_return fail(errc::tls_verify_failed, "TLS certificate verification failed.",
                    X509_verify_cert_error_string(verify_result), ec);
            co_return fail(errc::tls_handshake_failed, "TLS handshake failed.", ec.message(), ec);
        }

        MAILWIRE_CO_TRY_VOID(enforce_pins(tls_stream, opt));
        co_return ok();
    }

    /**
    Getting the negotiated protocol version, e.g. `TLSv1.3`; empty on a plaintext stream.
    **/
    std::string tls_version()
    {
        if (!is_tls())
            return {};
        return SSL_get_version(std::get<ssl_stream>(stream_).native_handle());
    }

    /**
    Extracting channel binding data for SCRAM-PLUS: `tls-exporter` on TLS 1.3, `tls-unique`
    on older versions.

    @return Binding type and data, or an error on a plaintext stream.
    **/
    result<channel_binding> channel_binding_data()
    {
        if (!is_tls())
            return fail<channel_binding>(errc::invalid_state, "Channel binding requires TLS.");
        SSL* ssl = std::get<ssl_stream>(stream_).native_handle();

        if (SSL_version(ssl) >= TLS1_3_VERSION)
        {
            static constexpr std::string_view label = "EXPORTER-Channel-Binding";
            std::string out(32, '\0');
            if (SSL_export_keying_material(ssl, reinterpret_cast<unsigned char*>(out.data()), out.size(), label.data(),
                label.size(), nullptr, 0, 0) != 1)
                return fail<channel_binding>(errc::crypto_failed, "TLS exporter failed.", openssl_error_message());
            return channel_binding{channel_binding_type::tls_exporter, std::move(out)};
        }

        // tls-unique is the first Finished message: ours on a full handshake, the server's on resumption.
        unsigned char finished[EVP_MAX_MD_SIZE];
        const std::size_t length = SSL_session_reused(ssl) ? SSL_get_peer_finished(ssl, finished, sizeof(finished))
            : SSL_get_finished(ssl, finished, sizeof(finished));
        if (length == 0)
            return fail<channel_binding>(errc::crypto_failed, "TLS Finished message is not available.");
        return channel_binding{channel_binding_type::tls_unique, std::string(reinterpret_cast<const char*>(finished), length)};
    }

    /**
    Closing the socket without a TLS shutdown.
    **/
    void close() noexcept
    {
        mailwire::asio::error_code ec;
        lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
        lowest_layer().close(ec);
    }

private:
    static std::string openssl_error_message()
    {
        const unsigned long err = ERR_get_error();
        if (err == 0)
            return {};
        char buffer[256];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    static bool relax_verify(bool preverified, ssl::verify_context& ctx, bool allow_self_signed) noexcept
    {
        if (preverified)
            return true;
        if (!allow_self_signed)
            return false;

        X509_STORE_CTX* store_ctx = ctx.native_handle();
        if (store_ctx == nullptr)
            return false;
        const int err = X509_STORE_CTX_get_error(store_ctx);
        return err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN || err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT;
    }

    static bool valid_pin_length(std::size_t length) noexcept
    {
        constexpr std::size_t hex_len = SHA256_DIGEST_LENGTH * 2;
        constexpr std::size_t base64_len = 4 * ((SHA256_DIGEST_LENGTH + 2) / 3);
        return length == hex_len || length == base64_len;
    }

    static result<std::vector<std::string>> normalize_pins(const std::vector<std::string>& pins, std::string_view label)
    {
        std::vector<std::string> out;
        out.reserve(pins.size());
        for (const auto& pin : pins)
        {
            std::string normalized = normalize_fingerprint(pin);
            if (normalized.empty())
                continue;
            if (!valid_pin_length(normalized.size()))
                return fail<std::vector<std::string>>(errc::tls_pinning_failed,
                    std::string("TLS pinning failure: invalid ") + std::string(label) + " pin.");
            out.push_back(std::move(normalized));
        }
        return out;
    }

    /// Hex and base64 forms of the SHA-256 of a DER blob.
    static std::pair<std::string, std::string> sha256_fingerprints(const std::vector<unsigned char>& der)
    {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        SHA256(der.data(), der.size(), digest);
        static constexpr char hex_digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(SHA256_DIGEST_LENGTH * 2);
        for (unsigned char byte : digest)
        {
            hex.push_back(hex_digits[byte >> 4]);
            hex.push_back(hex_digits[byte & 0x0F]);
        }
        const std::string_view raw(reinterpret_cast<const char*>(digest), SHA256_DIGEST_LENGTH);
        return {std::move(hex), codec::base64_encode(raw)};
    }

    template<typename T, typename Encoder>
    static std::vector<unsigned char> to_der(T* object, Encoder encode)
    {
        const int len = encode(object, nullptr);
        if (len <= 0)
            return {};
        std::vector<unsigned char> der(static_cast<std::size_t>(len));
        unsigned char* ptr = der.data();
        encode(object, &ptr);
        return der;
    }

    static bool match_pins(const std::vector<std::string>& pins, const std::pair<std::string, std::string>& fingerprints) noexcept
    {
        bool matched = false;
        for (const auto& pin : pins)
        {
            matched |= constant_time_equals(pin, fingerprints.first);
            matched |= constant_time_equals(pin, fingerprints.second);
        }
        return matched;
    }

    static result<void> enforce_pins(ssl_stream& tls_stream, const tls_options& opt)
    {
        std::vector<std::string> cert_pins;
        std::vector<std::string> spki_pins;
        MAILWIRE_TRY_ASSIGN(cert_pins, normalize_pins(opt.pinned_cert_sha256, "cert"));
        MAILWIRE_TRY_ASSIGN(spki_pins, normalize_pins(opt.pinned_spki_sha256, "spki"));
        if (cert_pins.empty() && spki_pins.empty())
            return ok();

        std::unique_ptr<X509, decltype(&X509_free)> cert(SSL_get_peer_certificate(tls_stream.native_handle()), X509_free);
        if (!cert)
            return fail(errc::tls_pinning_failed, "TLS pinning failure: no peer certificate.");

        bool matched = false;
        if (!cert_pins.empty())
        {
            const auto der = to_der(cert.get(), i2d_X509);
            if (der.empty())
                return fail(errc::tls_pinning_failed, "TLS pinning failure: unable to encode certificate.");
            matched |= match_pins(cert_pins, sha256_fingerprints(der));
        }
        if (!spki_pins.empty())
        {
            const auto der = to_der(X509_get_X509_PUBKEY(cert.get()), i2d_X509_PUBKEY);
            if (der.empty())
                return fail(errc::tls_pinning_failed, "TLS pinning failure: unable to encode SPKI.");
            matched |= match_pins(spki_pins, sha256_fingerprints(der));
        }

        if (!matched)
            return fail(errc::tls_pinning_failed, "TLS pinning failure: certificate mismatch.");
        return ok();
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace net
} // namespace mailwire
