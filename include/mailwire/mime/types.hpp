/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Vocabulary of the message model: header names, charsets, transfer encodings, content types.

*/


#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <mailwire/detail/ascii.hpp>

namespace mailwire::mime
{

/// Header names known to the library. Any other name can be used as a generic header too.
namespace header
{
    inline constexpr std::string_view CONTENT_DESCRIPTION = "Content-Description";
    inline constexpr std::string_view CONTENT_DISPOSITION = "Content-Disposition";
    inline constexpr std::string_view CONTENT_ID = "Content-ID";
    inline constexpr std::string_view CONTENT_LANGUAGE = "Content-Language";
    inline constexpr std::string_view CONTENT_LOCATION = "Content-Location";
    inline constexpr std::string_view CONTENT_TRANSFER_ENCODING = "Content-Transfer-Encoding";
    inline constexpr std::string_view CONTENT_TYPE = "Content-Type";
    inline constexpr std::string_view DATE = "Date";
    inline constexpr std::string_view DISPOSITION_NOTIFICATION_TO = "Disposition-Notification-To";
    inline constexpr std::string_view IMPORTANCE = "Importance";
    inline constexpr std::string_view IN_REPLY_TO = "In-Reply-To";
    inline constexpr std::string_view LIST_UNSUBSCRIBE = "List-Unsubscribe";
    inline constexpr std::string_view LIST_UNSUBSCRIBE_POST = "List-Unsubscribe-Post";
    inline constexpr std::string_view MESSAGE_ID = "Message-ID";
    inline constexpr std::string_view MIME_VERSION = "MIME-Version";
    inline constexpr std::string_view ORGANIZATION = "Organization";
    inline constexpr std::string_view PRECEDENCE = "Precedence";
    inline constexpr std::string_view PRIORITY = "Priority";
    inline constexpr std::string_view REFERENCES = "References";
    inline constexpr std::string_view SUBJECT = "Subject";
    inline constexpr std::string_view USER_AGENT = "User-Agent";
    inline constexpr std::string_view X_AUTO_RESPONSE_SUPPRESS = "X-Auto-Response-Suppress";
    inline constexpr std::string_view X_MAILER = "X-Mailer";
    inline constexpr std::string_view X_MSMAIL_PRIORITY = "X-MSMail-Priority";
    inline constexpr std::string_view X_PRIORITY = "X-Priority";
} // namespace header

/// Roles whose values are validated address lists.
enum class address_header
{
    from,
    to,
    cc,
    bcc,
    reply_to,
    envelope_from,
    disposition_notification_to
};

[[nodiscard]] constexpr std::string_view to_string(address_header role) noexcept
{
    switch (role)
    {
        case address_header::from: return "From";
        case address_header::to: return "To";
        case address_header::cc: return "Cc";
        case address_header::bcc: return "Bcc";
        case address_header::reply_to: return "Reply-To";
        case address_header::envelope_from: return "EnvelopeFrom";
        case address_header::disposition_notification_to: return "Disposition-Notification-To";
    }
    return "";
}

/// Charset names as they appear in Content-Type parameters and encoded-words.
namespace charset
{
    inline constexpr std::string_view UTF8 = "UTF-8";
    inline constexpr std::string_view US_ASCII = "US-ASCII";
    inline constexpr std::string_view ISO_8859_1 = "ISO-8859-1";
    inline constexpr std::string_view ISO_8859_2 = "ISO-8859-2";
    inline constexpr std::string_view ISO_8859_5 = "ISO-8859-5";
    inline constexpr std::string_view ISO_8859_15 = "ISO-8859-15";
    inline constexpr std::string_view ISO_2022_JP = "ISO-2022-JP";
    inline constexpr std::string_view KOI8_R = "KOI8-R";
    inline constexpr std::string_view KOI8_U = "KOI8-U";
    inline constexpr std::string_view SHIFT_JIS = "Shift_JIS";
    inline constexpr std::string_view GB18030 = "GB18030";
    inline constexpr std::string_view BIG5 = "Big5";
    inline constexpr std::string_view WINDOWS_1250 = "windows-1250";
    inline constexpr std::string_view WINDOWS_1251 = "windows-1251";
    inline constexpr std::string_view WINDOWS_1252 = "windows-1252";
} // namespace charset

/// Content-Transfer-Encoding of a body part.
enum class transfer_encoding
{
    quoted_printable,
    base64,
    /// 7bit: bytes are passed through, the content must already be 7-bit clean.
    seven_bit,
    /// 8bit: bytes are passed through unmodified for 8-bit clean transports.
    eight_bit
};

[[nodiscard]] constexpr std::string_view to_string(transfer_encoding enc) noexcept
{
    switch (enc)
    {
        case transfer_encoding::quoted_printable: return "quoted-printable";
        case transfer_encoding::base64: return "base64";
        case transfer_encoding::seven_bit: return "7bit";
        case transfer_encoding::eight_bit: return "8bit";
    }
    return "";
}

[[nodiscard]] inline std::optional<transfer_encoding> parse_transfer_encoding(std::string_view text)
{
    text = detail::trim_view(text);
    if (detail::iequals_ascii(text, "quoted-printable"))
        return transfer_encoding::quoted_printable;
    if (detail::iequals_ascii(text, "base64"))
        return transfer_encoding::base64;
    if (detail::iequals_ascii(text, "7bit"))
        return transfer_encoding::seven_bit;
    if (detail::iequals_ascii(text, "8bit"))
        return transfer_encoding::eight_bit;
    return std::nullopt;
}

namespace content_type
{
    inline constexpr std::string_view TEXT_PLAIN = "text/plain";
    inline constexpr std::string_view TEXT_HTML = "text/html";
    inline constexpr std::string_view TEXT_CALENDAR = "text/calendar";
    inline constexpr std::string_view APPLICATION_OCTET_STREAM = "application/octet-stream";
    inline constexpr std::string_view APPLICATION_PKCS7_SIGNATURE = "application/pkcs7-signature";
    inline constexpr std::string_view SMIME_SIGNATURE = "application/pkcs7-signature; name=\"smime.p7s\"";
} // namespace content_type

/// Subtypes of multipart containers produced by the writer.
enum class multipart_type
{
    alternative,
    mixed,
    related,
    smime_signed
};

[[nodiscard]] constexpr std::string_view to_string(multipart_type type) noexcept
{
    switch (type)
    {
        case multipart_type::alternative: return "alternative";
        case multipart_type::mixed: return "mixed";
        case multipart_type::related: return "related";
        case multipart_type::smime_signed: return "signed; protocol=\"application/pkcs7-signature\"; micalg=sha-256";
    }
    return "";
}

/// Message importance, mapped to the Importance/Priority family of headers.
enum class importance
{
    normal,
    low,
    high,
    non_urgent,
    urgent
};

inline constexpr std::string_view DEFAULT_MIME_VERSION = "1.0";

/// Written as User-Agent and X-Mailer unless the message overrides or suppresses it.
inline constexpr std::string_view DEFAULT_USER_AGENT = "mailwire v1.0";

/// RFC 5322 recommends at most 78 characters; 76 keeps room for the folding space.
inline constexpr std::size_t DEFAULT_MAX_HEADER_LENGTH = 76;

/// Nesting limit: signed, mixed, related, alternative.
inline constexpr std::size_t MAX_MULTIPART_DEPTH = 4;

} // namespace mailwire::mime
