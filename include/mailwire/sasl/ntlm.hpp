/*

ntlm.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

NTLMv2 authentication, MS-NLMP. Only the authentication exchange is implemented, no session
signing or sealing.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <mailwire/detail/ascii.hpp>
#include <mailwire/detail/random.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/sasl/crypto.hpp>
#include <mailwire/sasl/mechanism.hpp>

namespace mailwire::sasl
{

namespace ntlm
{

inline constexpr std::string_view SIGNATURE{"NTLMSSP\0", 8};

inline constexpr std::uint32_t NEGOTIATE_UNICODE = 0x00000001;
inline constexpr std::uint32_t REQUEST_TARGET = 0x00000004;
inline constexpr std::uint32_t NEGOTIATE_NTLM = 0x00000200;
inline constexpr std::uint32_t NEGOTIATE_OEM_DOMAIN_SUPPLIED = 0x00001000;
inline constexpr std::uint32_t NEGOTIATE_OEM_WORKSTATION_SUPPLIED = 0x00002000;
inline constexpr std::uint32_t NEGOTIATE_ALWAYS_SIGN = 0x00008000;
inline constexpr std::uint32_t NEGOTIATE_EXTENDED_SESSIONSECURITY = 0x00080000;
inline constexpr std::uint32_t NEGOTIATE_TARGET_INFO = 0x00800000;
inline constexpr std::uint32_t NEGOTIATE_VERSION = 0x02000000;
inline constexpr std::uint32_t NEGOTIATE_128 = 0x20000000;
inline constexpr std::uint32_t NEGOTIATE_56 = 0x80000000;

inline constexpr std::uint32_t DEFAULT_FLAGS = NEGOTIATE_UNICODE | REQUEST_TARGET | NEGOTIATE_NTLM | NEGOTIATE_ALWAYS_SIGN
    | NEGOTIATE_EXTENDED_SESSIONSECURITY | NEGOTIATE_TARGET_INFO | NEGOTIATE_VERSION | NEGOTIATE_128 | NEGOTIATE_56;

/// AV pair id of the server timestamp in the target info block.
inline constexpr std::uint16_t MSV_AV_TIMESTAMP = 7;
inline constexpr std::uint16_t MSV_AV_EOL = 0;

/// Seconds between 1601-01-01 and 1970-01-01.
inline constexpr std::uint64_t FILETIME_EPOCH_OFFSET = 11644473600ULL;

/// Version field: Windows 6.1 build 7601, NTLM revision 15.
inline constexpr std::string_view VERSION_BYTES{"\x06\x01\xb1\x1d\x00\x00\x00\x0f", 8};

inline void put_u16(std::string& out, std::uint16_t value)
{
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

inline void put_u32(std::string& out, std::uint32_t value)
{
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
}

inline void put_u64(std::string& out, std::uint64_t value)
{
    for (int i = 0; i < 8; ++i)
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
}

inline std::uint16_t get_u16(std::string_view in, std::size_t pos)
{
    return static_cast<std::uint16_t>(static_cast<unsigned char>(in[pos]) | (static_cast<unsigned char>(in[pos + 1]) << 8));
}

inline std::uint32_t get_u32(std::string_view in, std::size_t pos)
{
    std::uint32_t value = 0;
    for (int i = 3; i >= 0; --i)
        value = (value << 8) | static_cast<unsigned char>(in[pos + static_cast<std::size_t>(i)]);
    return value;
}

inline std::uint64_t get_u64(std::string_view in, std::size_t pos)
{
    std::uint64_t value = 0;
    for (int i = 7; i >= 0; --i)
        value = (value << 8) | static_cast<unsigned char>(in[pos + static_cast<std::size_t>(i)]);
    return value;
}

/// Security buffer header: length, allocated length, offset.
inline void put_field(std::string& out, std::size_t length, std::size_t offset)
{
    put_u16(out, static_cast<std::uint16_t>(length));
    put_u16(out, static_cast<std::uint16_t>(length));
    put_u32(out, static_cast<std::uint32_t>(offset));
}

/**
Converting UTF-8 to UTF-16LE. Invalid sequences become U+FFFD.
**/
[[nodiscard]] inline std::string to_utf16le(std::string_view text)
{
    std::string out;
    out.reserve(text.size() * 2);
    std::size_t i = 0;
    while (i < text.size())
    {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::uint32_t cp = 0xFFFD;
        std::size_t length = 1;
        if (lead < 0x80)
            cp = lead;
        else if ((lead & 0xE0) == 0xC0)
            length = 2;
        else if ((lead & 0xF0) == 0xE0)
            length = 3;
        else if ((lead & 0xF8) == 0xF0)
            length = 4;

        if (length > 1)
        {
            if (i + length > text.size())
            {
                cp = 0xFFFD;
                length = 1;
            }
            else
            {
                cp = lead & (0xFF >> (length + 1));
                for (std::size_t k = 1; k < length; ++k)
                {
                    const auto cont = static_cast<unsigned char>(text[i + k]);
                    if ((cont & 0xC0) != 0x80)
                    {
                        cp = 0xFFFD;
                        length = k;
                        break;
                    }
                    cp = (cp << 6) | (cont & 0x3F);
                }
            }
        }
        i += length;

        if (cp >= 0x10000)
        {
            cp -= 0x10000;
            put_u16(out, static_cast<std::uint16_t>(0xD800 + (cp >> 10)));
            put_u16(out, static_cast<std::uint16_t>(0xDC00 + (cp & 0x3FF)));
        }
        else
            put_u16(out, static_cast<std::uint16_t>(cp));
    }
    return out;
}

/**
Splitting `DOMAIN\user` into the user and the domain. Other forms have no domain.
**/
[[nodiscard]] inline std::pair<std::string, std::string> split_domain(std::string_view username)
{
    const auto pos = username.find('\\');
    if (pos == std::string_view::npos)
        return {std::string(username), std::string{}};
    return {std::string(username.substr(pos + 1)), std::string(username.substr(0, pos))};
}

/**
Building the negotiate (type 1) message.
**/
[[nodiscard]] inline std::string negotiate_message(std::string_view domain, std::string_view workstation)
{
    std::uint32_t flags = DEFAULT_FLAGS;
    if (!domain.empty())
        flags |= NEGOTIATE_OEM_DOMAIN_SUPPLIED;
    if (!workstation.empty())
        flags |= NEGOTIATE_OEM_WORKSTATION_SUPPLIED;

    constexpr std::size_t payload_offset = 40;
    std::string out(SIGNATURE);
    put_u32(out, 1);
    put_u32(out, flags);
    put_field(out, domain.size(), payload_offset);
    put_field(out, workstation.size(), payload_offset + domain.size());
    out += VERSION_BYTES;
    out += detail::to_upper_copy(domain);
    out += detail::to_upper_copy(workstation);
    return out;
}

/// Relevant parts of the challenge (type 2) message.
struct challenge
{
    std::uint32_t flags = 0;
    std::string server_challenge;
    std::string target_name;
    std::string target_info;
    std::optional<std::uint64_t> timestamp;
};

[[nodiscard]] inline result<challenge> parse_challenge(std::string_view data)
{
    if (data.size() < 48 || data.substr(0, 8) != SIGNATURE || get_u32(data, 8) != 2)
        return fail<challenge>(errc::sasl_bad_challenge, "Invalid NTLM challenge message.");

    const auto field = [&data](std::size_t pos) -> result<std::string>
    {
        const std::size_t length = get_u16(data, pos);
        const std::size_t offset = get_u32(data, pos + 4);
        if (length == 0)
            return std::string{};
        if (offset > data.size() || length > data.size() - offset)
            return fail<std::string>(errc::sasl_bad_challenge, "NTLM challenge field out of bounds.");
        return std::string(data.substr(offset, length));
    };

    challenge out;
    MAILWIRE_TRY_ASSIGN(out.target_name, field(12));
    out.flags = get_u32(data, 20);
    out.server_challenge = std::string(data.substr(24, 8));
    MAILWIRE_TRY_ASSIGN(out.target_info, field(40));

    std::string_view info = out.target_info;
    std::size_t pos = 0;
    while (pos + 4 <= info.size())
    {
        const std::uint16_t id = get_u16(info, pos);
        const std::size_t length = get_u16(info, pos + 2);
        if (id == MSV_AV_EOL)
            break;
        if (pos + 4 + length > info.size())
            return fail<challenge>(errc::sasl_bad_challenge, "NTLM target info is truncated.");
        if (id == MSV_AV_TIMESTAMP && length == 8)
            out.timestamp = get_u64(info, pos + 4);
        pos += 4 + length;
    }
    return out;
}

/// NTOWFv2: HMAC-MD5 keyed with the NT hash over the uppercased user and the domain.
[[nodiscard]] inline result<std::string> ntowf_v2(std::string_view user, std::string_view password, std::string_view domain)
{
    std::string nt_hash;
    MAILWIRE_TRY_ASSIGN(nt_hash, digest(digest_algorithm::md4, to_utf16le(password)));
    return hmac(digest_algorithm::md5, nt_hash, to_utf16le(detail::to_upper_copy(user) + std::string(domain)));
}

[[nodiscard]] inline std::uint64_t filetime_now()
{
    const auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return (static_cast<std::uint64_t>(since_epoch) + FILETIME_EPOCH_OFFSET * 1000000ULL) * 10ULL;
}

/**
Building the authenticate (type 3) message from a parsed challenge.

@param chal             Challenge from the server.
@param user             User name without the domain.
@param password         Password.
@param domain           Domain, may be empty.
@param workstation      Workstation name, may be empty.
@param client_challenge Eight random bytes.
@param timestamp        FILETIME used when the server did not send one.
**/
[[nodiscard]] inline result<std::string> authenticate_message(const challenge& chal, std::string_view user,
    std::string_view password, std::string_view domain, std::string_view workstation, std::string_view client_challenge,
    std::uint64_t timestamp)
{
    std::string key;
    MAILWIRE_TRY_ASSIGN(key, ntowf_v2(user, password, domain));

    std::string blob("\x01\x01\x00\x00\x00\x00\x00\x00", 8);
    put_u64(blob, chal.timestamp.value_or(timestamp));
    blob += client_challenge;
    blob += std::string(4, '\0');
    blob += chal.target_info;
    blob += std::string(4, '\0');

    std::string nt_proof;
    MAILWIRE_TRY_ASSIGN(nt_proof, hmac(digest_algorithm::md5, key, chal.server_challenge + blob));
    const std::string nt_response = nt_proof + blob;

    std::string lm_response;
    if (chal.timestamp)
        lm_response = std::string(24, '\0');
    else
    {
        MAILWIRE_TRY_ASSIGN(lm_response, hmac(digest_algorithm::md5, key, chal.server_challenge + std::string(client_challenge)));
        lm_response += client_challenge;
    }

    const std::string domain_w = to_utf16le(domain);
    const std::string user_w = to_utf16le(user);
    const std::string workstation_w = to_utf16le(workstation);

    std::uint32_t flags = chal.flags & DEFAULT_FLAGS;
    flags |= NEGOTIATE_UNICODE | NEGOTIATE_NTLM;

    constexpr std::size_t payload_offset = 72;
    std::size_t offset = payload_offset;
    std::string out(SIGNATURE);
    put_u32(out, 3);
    put_field(out, lm_response.size(), offset);
    offset += lm_response.size();
    put_field(out, nt_response.size(), offset);
    offset += nt_response.size();
    put_field(out, domain_w.size(), offset);
    offset += domain_w.size();
    put_field(out, user_w.size(), offset);
    offset += user_w.size();
    put_field(out, workstation_w.size(), offset);
    offset += workstation_w.size();
    put_field(out, 0, offset);
    put_u32(out, flags);
    out += VERSION_BYTES;
    out += lm_response;
    out += nt_response;
    out += domain_w;
    out += user_w;
    out += workstation_w;
    return out;
}

} // namespace ntlm


/**
NTLMv2 exchange: negotiate in the initial response, authenticate on the challenge.
**/
class ntlm_session
{
public:

    explicit ntlm_session(credentials creds, std::optional<std::string> client_challenge_override = std::nullopt)
        : creds_(std::move(creds)), client_challenge_override_(std::move(client_challenge_override))
    {
        std::tie(user_, domain_) = ntlm::split_domain(creds_.username);
    }

    [[nodiscard]] result<std::optional<std::string>> start()
    {
        if (user_.empty() || creds_.password.empty())
            return fail<std::optional<std::string>>(errc::invalid_argument, "NTLM needs a username and a password.");
        if (!digest_available(digest_algorithm::md4))
            return fail<std::optional<std::string>>(errc::crypto_failed,
                "NTLM needs MD4, which the loaded OpenSSL providers do not offer.", "load the legacy provider");
        return std::optional<std::string>(ntlm::negotiate_message(domain_, creds_.workstation));
    }

    [[nodiscard]] result<std::optional<std::string>> next(std::string_view challenge, bool more)
    {
        if (!more)
            return std::optional<std::string>{};
        if (challenge.empty())
            return fail<std::optional<std::string>>(errc::sasl_bad_challenge, "NTLM challenge message is empty.");

        ntlm::challenge chal;
        MAILWIRE_TRY_ASSIGN(chal, ntlm::parse_challenge(challenge));

        std::string client_challenge;
        if (client_challenge_override_)
            client_challenge = *client_challenge_override_;
        else
        {
            client_challenge.assign(8, '\0');
            MAILWIRE_TRY(detail::random_bytes(std::span<unsigned char>(
                reinterpret_cast<unsigned char*>(client_challenge.data()), client_challenge.size())));
        }

        std::string message;
        MAILWIRE_TRY_ASSIGN(message, ntlm::authenticate_message(chal, user_, creds_.password, domain_, creds_.workstation,
            client_challenge, ntlm::filetime_now()));
        return std::optional<std::string>(std::move(message));
    }

    [[nodiscard]] const std::string& user() const noexcept
    {
        return user_;
    }

    [[nodiscard]] const std::string& domain() const noexcept
    {
        return domain_;
    }

private:
    credentials creds_;
    std::optional<std::string> client_challenge_override_;
    std::string user_;
    std::string domain_;
};

} // namespace mailwire::sasl
