/*

output_sink.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Byte sinks used by the MIME writer and the content callbacks.

*/

#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/detail/result.hpp>

namespace mailwire
{
namespace detail
{

struct output_sink
{
    virtual ~output_sink() = default;
    virtual result<void> write(std::string_view chunk) = 0;
};

class string_sink : public output_sink
{
public:
    explicit string_sink(std::string& out) : out_(&out) {}

    result<void> write(std::string_view chunk) override
    {
        out_->append(chunk.data(), chunk.size());
        return ok();
    }

private:
    std::string* out_;
};

class ostream_sink : public output_sink
{
public:
    explicit ostream_sink(std::ostream& out) : out_(&out) {}

    result<void> write(std::string_view chunk) override
    {
        out_->write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!*out_)
            return fail(errc::io_failed, "Output stream write failed.");
        return ok();
    }

private:
    std::ostream* out_;
};

class fn_sink : public output_sink
{
public:
    explicit fn_sink(std::function<result<void>(std::string_view)> fn)
        : fn_(std::move(fn))
    {
    }

    result<void> write(std::string_view chunk) override
    {
        if (!fn_)
            return ok();
        return fn_(chunk);
    }

private:
    std::function<result<void>(std::string_view)> fn_;
};

/// Forwards to another sink and counts the bytes it accepted.
class counting_sink : public output_sink
{
public:
    explicit counting_sink(output_sink& next) : next_(&next) {}

    result<void> write(std::string_view chunk) override
    {
        MAILWIRE_TRY(next_->write(chunk));
        count_ += chunk.size();
        return ok();
    }

    [[nodiscard]] std::size_t count() const noexcept
    {
        return count_;
    }

private:
    output_sink* next_;
    std::size_t count_ = 0;
};

} // namespace detail
} // namespace mailwire
