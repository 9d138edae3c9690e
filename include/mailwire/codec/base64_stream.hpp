/*

base64_stream.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Streaming base64 body encoding: an encoder sink feeding a fixed width line breaker, so
attachments never have to be buffered whole.

*/

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <mailwire/codec/base64.hpp>
#include <mailwire/codec/codec.hpp>
#include <mailwire/detail/output_sink.hpp>

namespace mailwire::codec
{

/**
Splits its input into lines of a fixed width, each terminated by CRLF.

The last partial line is emitted with its CRLF by close(); empty input produces no output.
**/
class base64_line_breaker : public detail::output_sink
{
public:
    explicit base64_line_breaker(detail::output_sink& next, std::size_t line_length = MAX_BODY_LINE_LENGTH)
        : next_(&next), line_length_(line_length == 0 ? MAX_BODY_LINE_LENGTH : line_length)
    {
        line_.reserve(line_length_);
    }

    result<void> write(std::string_view chunk) override
    {
        while (!chunk.empty())
        {
            const std::size_t room = line_length_ - line_.size();
            const std::size_t take = chunk.size() < room ? chunk.size() : room;
            line_.append(chunk.substr(0, take));
            chunk.remove_prefix(take);
            if (line_.size() == line_length_)
                MAILWIRE_TRY(flush_line());
        }
        return ok();
    }

    result<void> close()
    {
        if (line_.empty())
            return ok();
        return flush_line();
    }

private:
    result<void> flush_line()
    {
        line_.append(END_OF_LINE);
        auto res = next_->write(line_);
        line_.clear();
        return res;
    }

    detail::output_sink* next_;
    std::size_t line_length_;
    std::string line_;
};

/**
Base64-encodes the bytes written to it and forwards the characters to the next sink.

close() emits the final padded quantum; it does not close the next sink.
**/
class base64_stream_encoder : public detail::output_sink
{
public:
    explicit base64_stream_encoder(detail::output_sink& next)
        : next_(&next)
    {
    }

    result<void> write(std::string_view chunk) override
    {
        std::string out;
        out.reserve((chunk.size() / 3 + 1) * 4);

        while (!chunk.empty())
        {
            pending_[pending_size_++] = chunk.front();
            chunk.remove_prefix(1);
            if (pending_size_ == 3)
            {
                out += base64_encode(std::string_view(pending_.data(), 3));
                pending_size_ = 0;
            }
        }

        if (out.empty())
            return ok();
        return next_->write(out);
    }

    result<void> close()
    {
        if (pending_size_ == 0)
            return ok();
        const std::string tail = base64_encode(std::string_view(pending_.data(), pending_size_));
        pending_size_ = 0;
        return next_->write(tail);
    }

private:
    detail::output_sink* next_;
    std::array<char, 3> pending_{};
    std::size_t pending_size_{0};
};

} // namespace mailwire::codec
