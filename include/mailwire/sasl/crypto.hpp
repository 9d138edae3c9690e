/*

crypto.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Hash, HMAC and key derivation primitives used by the SASL mechanisms, on top of libcrypto.

*/

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/opensslv.h>

#include <mailwire/codec/codec.hpp>
#include <mailwire/detail/result.hpp>

namespace mailwire::sasl
{

enum class digest_algorithm
{
    md4,
    md5,
    sha1,
    sha256
};

namespace detail_crypto
{

struct md_deleter
{
    void operator()(EVP_MD* md) const noexcept
    {
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
        EVP_MD_free(md);
#else
        (void)md;
#endif
    }
};

using md_ptr = std::unique_ptr<EVP_MD, md_deleter>;

[[nodiscard]] inline std::string openssl_error()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return buffer;
}

[[nodiscard]] constexpr const char* algorithm_name(digest_algorithm alg) noexcept
{
    switch (alg)
    {
        case digest_algorithm::md4: return "MD4";
        case digest_algorithm::md5: return "MD5";
        case digest_algorithm::sha1: return "SHA1";
        case digest_algorithm::sha256: return "SHA256";
    }
    return "";
}

/// Fetching the digest from the active providers; MD4 lives in the legacy provider on OpenSSL 3.
[[nodiscard]] inline result<md_ptr> fetch(digest_algorithm alg)
{
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    md_ptr md(EVP_MD_fetch(nullptr, algorithm_name(alg), nullptr));
#else
    const EVP_MD* found = nullptr;
    switch (alg)
    {
        case digest_algorithm::md4: found = EVP_md4(); break;
        case digest_algorithm::md5: found = EVP_md5(); break;
        case digest_algorithm::sha1: found = EVP_sha1(); break;
        case digest_algorithm::sha256: found = EVP_sha256(); break;
    }
    md_ptr md(const_cast<EVP_MD*>(found));
#endif
    if (!md)
    {
        ERR_clear_error();
        return fail<md_ptr>(errc::crypto_failed, std::string("Digest ") + algorithm_name(alg)
            + " is not available from the OpenSSL providers.");
    }
    return md;
}

inline const unsigned char* bytes(std::string_view data) noexcept
{
    return reinterpret_cast<const unsigned char*>(data.data());
}

} // namespace detail_crypto


/**
Checking whether a digest can be used, e.g. MD4 for NTLM.
**/
[[nodiscard]] inline bool digest_available(digest_algorithm alg)
{
    return detail_crypto::fetch(alg).has_value();
}

[[nodiscard]] inline result<std::string> digest(digest_algorithm alg, std::string_view data)
{
    detail_crypto::md_ptr md;
    MAILWIRE_TRY_ASSIGN(md, detail_crypto::fetch(alg));
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), out, &length, md.get(), nullptr) != 1)
        return fail<std::string>(errc::crypto_failed, "Digest computation failed.", detail_crypto::openssl_error());
    return std::string(reinterpret_cast<const char*>(out), length);
}

[[nodiscard]] inline result<std::string> hmac(digest_algorithm alg, std::string_view key, std::string_view data)
{
    detail_crypto::md_ptr md;
    MAILWIRE_TRY_ASSIGN(md, detail_crypto::fetch(alg));
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (HMAC(md.get(), key.data(), static_cast<int>(key.size()), detail_crypto::bytes(data), data.size(), out, &length) == nullptr)
        return fail<std::string>(errc::crypto_failed, "HMAC computation failed.", detail_crypto::openssl_error());
    return std::string(reinterpret_cast<const char*>(out), length);
}

/**
PBKDF2 with HMAC, the `Hi()` function of SCRAM.
**/
[[nodiscard]] inline result<std::string> pbkdf2(digest_algorithm alg, std::string_view password, std::string_view salt,
    int iterations, std::size_t length)
{
    detail_crypto::md_ptr md;
    MAILWIRE_TRY_ASSIGN(md, detail_crypto::fetch(alg));
    std::string out(length, '\0');
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), detail_crypto::bytes(salt),
        static_cast<int>(salt.size()), iterations, md.get(), static_cast<int>(length),
        reinterpret_cast<unsigned char*>(out.data())) != 1)
        return fail<std::string>(errc::crypto_failed, "PBKDF2 derivation failed.", detail_crypto::openssl_error());
    return out;
}

/// Lowercase hex, as used by CRAM-MD5 and DIGEST-MD5.
[[nodiscard]] inline std::string to_hex(std::string_view data)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (char ch : data)
    {
        const auto byte = static_cast<unsigned char>(ch);
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

[[nodiscard]] inline bool constant_time_equal(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace mailwire::sasl
