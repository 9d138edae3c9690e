/*

mailboxes.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailwire/codec/word_encoder.hpp>
#include <mailwire/detail/ascii.hpp>
#include <mailwire/detail/result.hpp>

namespace mailwire::mime
{


/**
Mail as name and address.
**/
struct mail_address
{
    /**
    Display name, decoded to UTF-8. May be empty.
    **/
    std::string name;

    /**
    Address part of the mail, `local@domain`. A quoted local part is stored unquoted.
    **/
    std::string address;

    mail_address() = default;

    mail_address(std::string mail_name, std::string mail_address)
        : name(std::move(mail_name)), address(std::move(mail_address))
    {
    }

    bool empty() const
    {
        return name.empty() && address.empty();
    }

    /**
    Formatting as an RFC 5322 mailbox.

    The address is always bracketed. A printable ASCII name is quoted, any other name becomes
    a UTF-8 encoded-word.

    @return Mailbox text suitable for a header value.
    **/
    std::string format() const;

    friend bool operator==(const mail_address&, const mail_address&) = default;
};


namespace detail_mailbox
{

[[nodiscard]] inline std::string quote_string(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '\\' || ch == '"')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

/**
Recursive descent over the RFC 5322 mailbox grammar, including comments and the obsolete
dotted phrase form.
**/
class address_parser
{
public:
    explicit address_parser(std::string_view text) : text_(text) {}

    result<mail_address> parse_mailbox()
    {
        skip_cfws();
        if (at_end())
            return error("empty address");

        // Bare addr-spec first; a trailing comment is allowed after it.
        const std::size_t start = pos_;
        {
            auto spec = parse_addr_spec();
            if (spec)
            {
                skip_cfws();
                if (at_end())
                    return mail_address({}, std::move(*spec));
            }
        }
        pos_ = start;

        std::string name;
        if (peek() != '<')
        {
            auto phrase = parse_phrase();
            if (!phrase)
                return std::unexpected(std::move(phrase).error());
            name = std::move(*phrase);
        }

        skip_cfws();
        if (!consume('<'))
            return error("missing '<' in angle address");
        auto spec = parse_addr_spec();
        if (!spec)
            return std::unexpected(std::move(spec).error());
        if (!consume('>'))
            return error("unclosed angle address");
        skip_cfws();
        if (!at_end())
            return error("unexpected text after address");
        return mail_address(std::move(name), std::move(*spec));
    }

private:
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
    [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : text_[pos_]; }

    bool consume(char ch)
    {
        if (peek() != ch)
            return false;
        ++pos_;
        return true;
    }

    result<mail_address> error(std::string_view what) const
    {
        return fail<mail_address>(errc::invalid_address, std::format("Invalid address \"{}\": {}.", text_, what));
    }

    result<std::string> error_text(std::string_view what) const
    {
        return fail<std::string>(errc::invalid_address, std::format("Invalid address \"{}\": {}.", text_, what));
    }

    void skip_cfws()
    {
        while (!at_end())
        {
            const char ch = peek();
            if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n')
            {
                ++pos_;
                continue;
            }
            if (ch == '(' && skip_comment())
                continue;
            break;
        }
    }

    bool skip_comment()
    {
        std::size_t p = pos_ + 1;
        int depth = 1;
        while (p < text_.size() && depth > 0)
        {
            const char ch = text_[p];
            if (ch == '\\')
                ++p;
            else if (ch == '(')
                ++depth;
            else if (ch == ')')
                --depth;
            ++p;
        }
        if (depth != 0)
            return false;
        pos_ = p;
        return true;
    }

    result<std::string> parse_quoted_string()
    {
        if (!consume('"'))
            return error_text("expected quoted string");
        std::string out;
        while (!at_end())
        {
            const char ch = text_[pos_++];
            if (ch == '"')
                return out;
            if (ch == '\\')
            {
                if (at_end())
                    break;
                out.push_back(text_[pos_++]);
                continue;
            }
            if (ch == '\r' || ch == '\n')
                return error_text("line break in quoted string");
            out.push_back(ch);
        }
        return error_text("unclosed quoted string");
    }

    /// atom or dot-atom text, returned as found; `dots` admits periods (obsolete phrase form).
    std::string parse_atom(bool dots)
    {
        const std::size_t start = pos_;
        while (!at_end() && (detail::is_atext(peek()) || (dots && peek() == '.')))
            ++pos_;
        return std::string(text_.substr(start, pos_ - start));
    }

    result<std::string> parse_addr_spec()
    {
        std::string local;
        if (peek() == '"')
        {
            auto quoted = parse_quoted_string();
            if (!quoted)
                return quoted;
            local = std::move(*quoted);
        }
        else
        {
            local = parse_atom(true);
            if (!detail::is_dot_atom_text(local))
                return error_text("invalid local part");
        }

        if (!consume('@'))
            return error_text("missing '@'");

        std::string domain;
        if (peek() == '[')
        {
            const std::size_t close = text_.find(']', pos_);
            if (close == std::string_view::npos)
                return error_text("unclosed domain literal");
            domain = std::string(text_.substr(pos_, close - pos_ + 1));
            pos_ = close + 1;
        }
        else
        {
            domain = parse_atom(true);
            if (!detail::is_dot_atom_text(domain))
                return error_text("invalid domain");
        }
        return local + "@" + domain;
    }

    result<std::string> parse_phrase()
    {
        struct word
        {
            std::string text;
            bool encoded;
        };
        std::vector<word> words;

        while (true)
        {
            skip_cfws();
            if (peek() == '"')
            {
                auto quoted = parse_quoted_string();
                if (!quoted)
                    return quoted;
                words.push_back({std::move(*quoted), false});
                continue;
            }
            std::string atom = parse_atom(true);
            if (atom.empty())
                break;
            const bool encoded = atom.starts_with("=?") && atom.ends_with("?=");
            words.push_back({encoded ? codec::decode_header_words(atom) : std::move(atom), encoded});
        }

        if (words.empty())
            return error_text("empty display name");

        std::string out;
        for (std::size_t i = 0; i < words.size(); ++i)
        {
            // RFC 2047: whitespace between adjacent encoded-words is not displayed.
            if (i > 0 && !(words[i].encoded && words[i - 1].encoded))
                out.push_back(' ');
            out += words[i].text;
        }
        return out;
    }

    std::string_view text_;
    std::size_t pos_{0};
};

/// Split on commas that are outside quotes, comments and angle brackets.
[[nodiscard]] inline std::vector<std::string_view> split_address_list(std::string_view text)
{
    std::vector<std::string_view> out;
    std::size_t start = 0;
    bool quoted = false;
    int comment = 0;
    int angle = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == '\\' && (quoted || comment > 0))
        {
            ++i;
            continue;
        }
        if (quoted)
        {
            if (ch == '"')
                quoted = false;
            continue;
        }
        if (ch == '"' && comment == 0)
            quoted = true;
        else if (ch == '(')
            ++comment;
        else if (ch == ')' && comment > 0)
            --comment;
        else if (ch == '<' && comment == 0)
            ++angle;
        else if (ch == '>' && comment == 0 && angle > 0)
            --angle;
        else if (ch == ',' && comment == 0 && angle == 0)
        {
            out.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    out.push_back(text.substr(start));
    return out;
}

} // namespace detail_mailbox


/**
Parsing a single RFC 5322 mailbox such as `"Toni Tester" <toni@example.com>`.

@param text Mailbox text.
@return     Parsed address or `errc::invalid_address`.
**/
[[nodiscard]] inline result<mail_address> parse_address(std::string_view text)
{
    return detail_mailbox::address_parser(text).parse_mailbox();
}

/**
Parsing a comma separated list of mailboxes. Empty elements are skipped.

@param text Address list text.
@return     Parsed addresses or the first parsing error.
**/
[[nodiscard]] inline result<std::vector<mail_address>> parse_address_list(std::string_view text)
{
    std::vector<mail_address> out;
    for (std::string_view item : detail_mailbox::split_address_list(text))
    {
        if (detail::trim_view(item).empty())
            continue;
        auto addr = parse_address(item);
        if (!addr)
            return std::unexpected(std::move(addr).error());
        out.push_back(std::move(*addr));
    }
    return out;
}


inline std::string mail_address::format() const
{
    const auto at = address.rfind('@');
    std::string local = at == std::string::npos ? address : address.substr(0, at);
    const std::string domain = at == std::string::npos ? std::string() : address.substr(at + 1);

    if (!detail::is_dot_atom_text(local))
        local = detail_mailbox::quote_string(local);
    std::string out = "<" + local + "@" + domain + ">";
    if (name.empty())
        return out;

    bool all_printable = true;
    for (char ch : name)
    {
        if (!detail::is_vchar(ch) && !detail::is_wsp(ch))
        {
            all_printable = false;
            break;
        }
    }
    if (all_printable)
        return detail_mailbox::quote_string(name) + " " + out;

    // Encoded-words in a phrase must not carry specials, B encoding avoids them entirely.
    const bool has_specials = name.find_first_of("\"#$%&'(),.:;<>@[]^`{|}~") != std::string::npos;
    const codec::word_encoder encoder(has_specials ? codec::word_encoding::b : codec::word_encoding::q, "utf-8");
    return encoder.encode(name) + " " + out;
}

/**
Joining mailboxes for a header value.

@param mails Addresses to format.
@return      Comma and space separated mailbox list.
**/
[[nodiscard]] inline std::string format_address_list(const std::vector<mail_address>& mails)
{
    std::string out;
    for (const auto& mail : mails)
    {
        if (!out.empty())
            out += ", ";
        out += mail.format();
    }
    return out;
}

} // namespace mailwire::mime
