/*

word_encoder.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

RFC 2047 encoded-words for header values.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/codec/base64.hpp>
#include <mailwire/codec/codec.hpp>
#include <mailwire/detail/ascii.hpp>

namespace mailwire::codec
{

enum class word_encoding
{
    q,
    b
};

/// Encoded-words are limited to 75 characters (RFC 2047, section 2).
inline constexpr std::size_t MAX_ENCODED_WORD_LENGTH = 75;

/// Header text needs encoding when it holds bytes outside printable ASCII other than tab.
[[nodiscard]] inline bool needs_word_encoding(std::string_view value) noexcept
{
    for (char ch : value)
    {
        const auto b = static_cast<unsigned char>(ch);
        if ((b < ' ' || b > '~') && b != '\t')
            return true;
    }
    return false;
}

/// Length of the UTF-8 sequence starting at `pos`; malformed sequences count as one byte.
[[nodiscard]] inline std::size_t utf8_sequence_length(std::string_view s, std::size_t pos) noexcept
{
    const auto lead = static_cast<unsigned char>(s[pos]);
    std::size_t len = 1;
    if (lead >= 0xF0 && lead <= 0xF7)
        len = 4;
    else if (lead >= 0xE0)
        len = (lead <= 0xEF) ? 3 : 1;
    else if (lead >= 0xC2)
        len = 2;

    if (pos + len > s.size())
        return 1;
    for (std::size_t i = 1; i < len; ++i)
    {
        if ((static_cast<unsigned char>(s[pos + i]) & 0xC0) != 0x80)
            return 1;
    }
    return len;
}

/**
Produces RFC 2047 encoded-words.

Values that are plain printable ASCII are returned unchanged. With a UTF-8 charset long values
are split into several words separated by a space, never in the middle of a multibyte
character, so the header folder can break lines between them.
**/
class word_encoder
{
public:
    explicit word_encoder(word_encoding encoding = word_encoding::q, std::string charset = std::string(CHARSET_UTF8))
        : encoding_(encoding), charset_(std::move(charset))
    {
    }

    [[nodiscard]] word_encoding encoding() const noexcept
    {
        return encoding_;
    }

    [[nodiscard]] const std::string& charset() const noexcept
    {
        return charset_;
    }

    [[nodiscard]] std::string encode(std::string_view value) const
    {
        if (!needs_word_encoding(value))
            return std::string(value);

        std::string out = open_word();
        if (encoding_ == word_encoding::b)
            encode_b(out, value);
        else
            encode_q(out, value);
        out += "?=";
        return out;
    }

private:
    [[nodiscard]] std::string open_word() const
    {
        return "=?" + charset_ + (encoding_ == word_encoding::b ? "?b?" : "?q?");
    }

    [[nodiscard]] std::size_t max_content_length() const noexcept
    {
        return MAX_ENCODED_WORD_LENGTH - charset_.size() - 7;
    }

    [[nodiscard]] bool is_utf8() const noexcept
    {
        return detail::iequals_ascii(charset_, CHARSET_UTF8);
    }

    void split_word(std::string& out) const
    {
        out += "?= ";
        out += open_word();
    }

    static void append_q(std::string& out, std::string_view s)
    {
        for (char ch : s)
        {
            const auto b = static_cast<unsigned char>(ch);
            if (b == ' ')
                out.push_back('_');
            else if (b >= '!' && b <= '~' && b != '=' && b != '?' && b != '_')
                out.push_back(ch);
            else
            {
                out.push_back('=');
                out.push_back(HEX_DIGITS[b >> 4]);
                out.push_back(HEX_DIGITS[b & 0x0F]);
            }
        }
    }

    void encode_q(std::string& out, std::string_view s) const
    {
        if (!is_utf8())
        {
            append_q(out, s);
            return;
        }

        const std::size_t max_len = max_content_length();
        std::size_t current = 0;
        std::size_t seq = 0;
        for (std::size_t i = 0; i < s.size(); i += seq)
        {
            const auto b = static_cast<unsigned char>(s[i]);
            std::size_t enc_len = 0;
            if (b >= ' ' && b <= '~' && b != '=' && b != '?' && b != '_')
            {
                seq = 1;
                enc_len = 1;
            }
            else
            {
                seq = utf8_sequence_length(s, i);
                enc_len = 3 * seq;
            }

            if (current + enc_len > max_len)
            {
                split_word(out);
                current = 0;
            }
            append_q(out, s.substr(i, seq));
            current += enc_len;
        }
    }

    void encode_b(std::string& out, std::string_view s) const
    {
        const std::size_t max_raw = max_content_length() / 4 * 3;
        if (!is_utf8() || s.size() <= max_raw)
        {
            out += base64_encode(s);
            return;
        }

        std::size_t current = 0;
        std::size_t last = 0;
        std::size_t seq = 0;
        for (std::size_t i = 0; i < s.size(); i += seq)
        {
            seq = utf8_sequence_length(s, i);
            if (current + seq <= max_raw)
            {
                current += seq;
                continue;
            }
            out += base64_encode(s.substr(last, i - last));
            split_word(out);
            last = i;
            current = seq;
        }
        out += base64_encode(s.substr(last));
    }

    word_encoding encoding_;
    std::string charset_;
};

namespace detail_words
{

[[nodiscard]] inline std::optional<std::string> decode_q_text(std::string_view text)
{
    std::string out;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == '_')
            out.push_back(' ');
        else if (ch == '=')
        {
            if (i + 2 >= text.size())
                return std::nullopt;
            const int hi = hex_digit_to_int(text[i + 1]);
            const int lo = hex_digit_to_int(text[i + 2]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        else
            out.push_back(ch);
    }
    return out;
}

[[nodiscard]] inline std::string latin1_to_utf8(std::string_view text)
{
    std::string out;
    for (char ch : text)
    {
        const auto b = static_cast<unsigned char>(ch);
        if (b < 0x80)
            out.push_back(ch);
        else
        {
            out.push_back(static_cast<char>(0xC0 | (b >> 6)));
            out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return out;
}

/// Decodes one `=?charset?enc?text?=` token; nullopt leaves the token literal.
[[nodiscard]] inline std::optional<std::string> decode_word(std::string_view word)
{
    if (word.size() < 8 || !word.starts_with("=?") || !word.ends_with("?="))
        return std::nullopt;
    const std::string_view inner = word.substr(2, word.size() - 4);
    const auto q1 = inner.find('?');
    if (q1 == std::string_view::npos || q1 + 2 >= inner.size() || inner[q1 + 2] != '?')
        return std::nullopt;

    std::string_view charset = inner.substr(0, q1);
    // RFC 2231 language suffix.
    if (const auto star = charset.find('*'); star != std::string_view::npos)
        charset = charset.substr(0, star);
    const char enc = mailwire::detail::ascii_toupper(inner[q1 + 1]);
    const std::string_view text = inner.substr(q1 + 3);

    std::optional<std::string> raw;
    if (enc == 'Q')
        raw = decode_q_text(text);
    else if (enc == 'B')
    {
        auto decoded = base64_decode(text);
        if (decoded)
            raw = std::move(*decoded);
    }
    if (!raw)
        return std::nullopt;

    if (mailwire::detail::iequals_ascii(charset, "UTF-8") || mailwire::detail::iequals_ascii(charset, "US-ASCII"))
        return raw;
    if (mailwire::detail::iequals_ascii(charset, "ISO-8859-1"))
        return latin1_to_utf8(*raw);
    return std::nullopt;
}

} // namespace detail_words

/**
Decode every encoded-word in a header text.

Whitespace between two adjacent encoded-words is dropped as RFC 2047 requires; words in
charsets other than UTF-8, US-ASCII and ISO-8859-1 are kept literally.
**/
[[nodiscard]] inline std::string decode_header_words(std::string_view text)
{
    std::string out;
    std::string pending_ws;
    bool prev_encoded = false;

    std::size_t pos = 0;
    while (pos < text.size())
    {
        const std::size_t ws_end = text.find_first_not_of(" \t", pos);
        if (ws_end != pos)
        {
            pending_ws.assign(text.substr(pos, (ws_end == std::string_view::npos ? text.size() : ws_end) - pos));
            if (ws_end == std::string_view::npos)
                break;
            pos = ws_end;
        }

        std::size_t end = text.find_first_of(" \t", pos);
        if (end == std::string_view::npos)
            end = text.size();
        const std::string_view token = text.substr(pos, end - pos);

        auto decoded = detail_words::decode_word(token);
        if (decoded)
        {
            if (!prev_encoded)
                out += pending_ws;
            out += *decoded;
        }
        else
        {
            out += pending_ws;
            out += token;
        }
        pending_ws.clear();
        prev_encoded = decoded.has_value();
        pos = end;
    }
    out += pending_ws;
    return out;
}

} // namespace mailwire::codec
