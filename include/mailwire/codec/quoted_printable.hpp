/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

#include <mailwire/codec/codec.hpp>
#include <mailwire/detail/output_sink.hpp>

namespace mailwire::codec
{

/**
Streaming quoted-printable body encoder (RFC 2045, section 6.7).

Printable ASCII other than `=` passes through, every other byte becomes `=XX` with uppercase
hex. Lines are soft-wrapped with a trailing `=` so no encoded line exceeds 76 characters.
CR, LF and CRLF in the input are line breaks and come out as CRLF; whitespace before a line
break is encoded so transports cannot strip it.
**/
class quoted_printable_writer : public detail::output_sink
{
public:
    explicit quoted_printable_writer(detail::output_sink& next)
        : next_(&next)
    {
        line_.reserve(MAX_BODY_LINE_LENGTH + 2);
    }

    result<void> write(std::string_view chunk) override
    {
        for (char ch : chunk)
        {
            const auto b = static_cast<unsigned char>(ch);
            const bool literal = (b >= '!' && b <= '~' && b != '=') || b == ' ' || b == '\t' || b == '\r' || b == '\n';
            if (literal)
                MAILWIRE_TRY(put_literal(ch));
            else
                MAILWIRE_TRY(encode(b));
        }
        return ok();
    }

    /// Encodes a trailing space or tab and flushes the pending line.
    result<void> close()
    {
        MAILWIRE_TRY(encode_trailing_whitespace());
        return flush();
    }

private:
    result<void> put_literal(char ch)
    {
        if (ch == '\r' || ch == '\n')
        {
            // The LF of a CRLF pair was already turned into a line break by its CR.
            if (cr_ && ch == '\n')
            {
                cr_ = false;
                return ok();
            }
            cr_ = (ch == '\r');
            MAILWIRE_TRY(encode_trailing_whitespace());
            return insert_crlf();
        }

        if (line_.size() == MAX_BODY_LINE_LENGTH - 1)
            MAILWIRE_TRY(insert_soft_line_break());
        line_.push_back(ch);
        cr_ = false;
        return ok();
    }

    result<void> encode(unsigned char b)
    {
        if (MAX_BODY_LINE_LENGTH - 1 - line_.size() < 3)
            MAILWIRE_TRY(insert_soft_line_break());
        line_.push_back('=');
        line_.push_back(HEX_DIGITS[b >> 4]);
        line_.push_back(HEX_DIGITS[b & 0x0F]);
        cr_ = false;
        return ok();
    }

    result<void> encode_trailing_whitespace()
    {
        if (line_.empty())
            return ok();
        const char last = line_.back();
        if (last != ' ' && last != '\t')
            return ok();
        line_.pop_back();
        return encode(static_cast<unsigned char>(last));
    }

    result<void> insert_soft_line_break()
    {
        line_.push_back('=');
        return insert_crlf();
    }

    result<void> insert_crlf()
    {
        line_.append(END_OF_LINE);
        return flush();
    }

    result<void> flush()
    {
        if (line_.empty())
            return ok();
        auto res = next_->write(line_);
        line_.clear();
        return res;
    }

    detail::output_sink* next_;
    std::string line_;
    bool cr_{false};
};

/// Convenience for short texts.
[[nodiscard]] inline result<std::string> quoted_printable_encode(std::string_view text)
{
    std::string out;
    detail::string_sink sink(out);
    quoted_printable_writer writer(sink);
    MAILWIRE_TRY(writer.write(text));
    MAILWIRE_TRY(writer.close());
    return out;
}

} // namespace mailwire::codec
