/*

part.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/detail/output_sink.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/mime/types.hpp>

namespace mailwire::mime
{

/**
Byte producer for a body part or a file.

It must be re-invocable: every serialization of the message calls it again and expects the
same bytes. It returns the number of bytes it wrote or the first error.
**/
using content_writer = std::function<result<std::size_t>(detail::output_sink&)>;

/// Producer for an in-memory text.
[[nodiscard]] inline content_writer string_writer(std::string content)
{
    return [content = std::move(content)](detail::output_sink& sink) -> result<std::size_t>
    {
        MAILWIRE_TRY(sink.write(content));
        return content.size();
    };
}

/// Per-part overrides of the message defaults.
struct part_options
{
    std::optional<std::string> charset;
    std::optional<transfer_encoding> encoding;
    std::string description;
};


/**
One body alternative of a message: content type, transfer encoding, charset and its producer.
**/
class part
{
public:
    part() = default;

    part(std::string content_type, std::string charset, transfer_encoding encoding, content_writer writer)
        : content_type_(std::move(content_type)), charset_(std::move(charset)), encoding_(encoding),
        writer_(std::move(writer))
    {
    }

    /**
    Getting the content type without parameters, e.g. `text/plain`.
    **/
    const std::string& content_type() const noexcept
    {
        return content_type_;
    }

    void content_type(std::string type)
    {
        content_type_ = std::move(type);
    }

    /**
    Getting the charset; empty means the message charset applies.
    **/
    const std::string& charset() const noexcept
    {
        return charset_;
    }

    void charset(std::string cs)
    {
        charset_ = std::move(cs);
    }

    transfer_encoding encoding() const noexcept
    {
        return encoding_;
    }

    void encoding(transfer_encoding enc) noexcept
    {
        encoding_ = enc;
    }

    /**
    Getting the optional Content-Description.
    **/
    const std::string& description() const noexcept
    {
        return description_;
    }

    void description(std::string text)
    {
        description_ = std::move(text);
    }

    const content_writer& writer() const noexcept
    {
        return writer_;
    }

    void writer(content_writer fn)
    {
        writer_ = std::move(fn);
    }

    /**
    Replacing the content with a fixed text.

    @param text Content bytes, before transfer encoding.
    **/
    void content(std::string text)
    {
        writer_ = string_writer(std::move(text));
    }

    /**
    Running the producer into memory.

    @return Raw content bytes before transfer encoding.
    **/
    result<std::string> content() const
    {
        if (!writer_)
            return fail<std::string>(errc::null_callback, "Part has no content writer.");
        std::string out;
        detail::string_sink sink(out);
        MAILWIRE_TRY(writer_(sink));
        return out;
    }

    /**
    Marking the part as deleted; the writer skips it from then on.
    **/
    void mark_deleted() noexcept
    {
        deleted_ = true;
    }

    bool is_deleted() const noexcept
    {
        return deleted_;
    }

    /**
    Checking whether this is the opaque S/MIME signature part.
    **/
    bool is_smime() const noexcept
    {
        return smime_;
    }

    void smime(bool flag) noexcept
    {
        smime_ = flag;
    }

private:
    std::string content_type_{mime::content_type::TEXT_PLAIN};
    std::string charset_;
    transfer_encoding encoding_{transfer_encoding::quoted_printable};
    std::string description_;
    content_writer writer_;
    bool deleted_{false};
    bool smime_{false};
};

} // namespace mailwire::mime
