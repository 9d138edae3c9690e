/*

writer.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailwire/codec/base64_stream.hpp>
#include <mailwire/codec/codec.hpp>
#include <mailwire/codec/quoted_printable.hpp>
#include <mailwire/detail/output_sink.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/mime/message.hpp>

namespace mailwire::mime
{

/**
Serializer of a message snapshot into an RFC 5322 / MIME byte stream.

Multipart levels are opened in the order `signed`, `mixed`, `related`, `alternative`, each only
when the content calls for it.
**/
class message_writer
{
public:
    explicit message_writer(detail::output_sink& sink)
        : out_(sink)
    {
    }

    /**
    Writing the whole message.

    @param msg Message whose default headers are already set.
    @return    Number of bytes written or the first error.
    **/
    result<std::size_t> write(const message& msg);

private:
    using part_headers = std::map<std::string, std::string, std::less<>>;

    /// Open multipart level.
    struct level
    {
        std::string boundary;
        bool has_parts{false};
    };

    result<void> check_writers(const message& msg) const;

    result<void> write_headers(const message& msg);

    result<void> write_header(std::string_view key, const std::vector<std::string>& values);

    result<void> start_multipart(multipart_type type, const message& msg);

    result<void> stop_multipart();

    result<void> open_part(const part_headers& headers);

    result<void> write_part(const message& msg, const part& p);

    result<void> write_files(const message& msg, const std::vector<file>& files, bool embed);

    result<void> write_body(const content_writer& writer, transfer_encoding encoding);

    detail::counting_sink out_;
    std::vector<level> levels_;
    std::size_t max_header_length_{DEFAULT_MAX_HEADER_LENGTH};
};


inline result<std::size_t> message_writer::write(const message& msg)
{
    MAILWIRE_TRY(check_writers(msg));
    max_header_length_ = msg.max_header_length();
    MAILWIRE_TRY(write_headers(msg));

    std::size_t part_count = 0;
    for (const auto& p : msg.parts())
    {
        if (!p.is_deleted())
            ++part_count;
    }
    const std::size_t attachment_count = msg.attachments().size();
    const std::size_t embed_count = msg.embeds().size();
    const bool has_content = part_count > 0 || attachment_count > 0 || embed_count > 0;

    if (msg.smime_signature())
        MAILWIRE_TRY(start_multipart(multipart_type::smime_signed, msg));
    const bool mixed = (part_count > 0 && attachment_count > 0) || attachment_count > 1;
    if (mixed)
        MAILWIRE_TRY(start_multipart(multipart_type::mixed, msg));
    const bool related = (part_count > 0 && embed_count > 0) || embed_count > 1;
    if (related)
        MAILWIRE_TRY(start_multipart(multipart_type::related, msg));
    const bool alternative = part_count > 1;
    if (alternative)
        MAILWIRE_TRY(start_multipart(multipart_type::alternative, msg));

    for (const auto& p : msg.parts())
    {
        if (!p.is_deleted())
            MAILWIRE_TRY(write_part(msg, p));
    }
    if (alternative)
        MAILWIRE_TRY(stop_multipart());

    MAILWIRE_TRY(write_files(msg, msg.embeds(), true));
    if (related)
        MAILWIRE_TRY(stop_multipart());

    MAILWIRE_TRY(write_files(msg, msg.attachments(), false));
    if (mixed)
        MAILWIRE_TRY(stop_multipart());

    if (msg.smime_signature())
    {
        MAILWIRE_TRY(write_part(msg, *msg.smime_signature()));
        MAILWIRE_TRY(stop_multipart());
    }

    // Headers only: close the header block so the result is still a valid message.
    if (!has_content && !msg.smime_signature())
        MAILWIRE_TRY(out_.write(codec::END_OF_LINE));

    return out_.count();
}


inline result<void> message_writer::check_writers(const message& msg) const
{
    for (const auto& p : msg.parts())
    {
        if (!p.is_deleted() && !p.writer())
            return fail(errc::null_callback, std::format("Body part {} has no content writer.", p.content_type()));
    }
    for (const auto* files : {&msg.embeds(), &msg.attachments()})
    {
        for (const auto& f : *files)
        {
            if (!f.writer)
                return fail(errc::null_callback, std::format("File \"{}\" has no content writer.", f.name));
        }
    }
    return ok();
}


inline result<void> message_writer::write_headers(const message& msg)
{
    for (const auto& [name, values] : msg.headers())
        MAILWIRE_TRY(write_header(name, values));
    for (const auto& [name, value] : msg.preformatted_headers())
        MAILWIRE_TRY(out_.write(std::format("{}: {}{}", name, value, codec::END_OF_LINE)));

    auto formatted = [&msg](address_header role)
    {
        std::vector<std::string> values;
        for (const auto& addr : msg.addresses(role))
            values.push_back(addr.format());
        return values;
    };

    if (!msg.addresses(address_header::from).empty())
        MAILWIRE_TRY(write_header(to_string(address_header::from), formatted(address_header::from)));
    else if (!msg.addresses(address_header::envelope_from).empty())
        MAILWIRE_TRY(write_header(to_string(address_header::from), formatted(address_header::envelope_from)));

    // Bcc and the envelope sender never appear in the headers.
    for (address_header role : {address_header::to, address_header::cc, address_header::reply_to,
        address_header::disposition_notification_to})
    {
        if (!msg.addresses(role).empty())
            MAILWIRE_TRY(write_header(to_string(role), formatted(role)));
    }
    return ok();
}


/**
Writing `Key: v1, v2` folded on spaces so a line stays under the header length.
**/
inline result<void> message_writer::write_header(std::string_view key, const std::vector<std::string>& values)
{
    if (values.empty())
        return out_.write(std::format("{}:{}", key, codec::END_OF_LINE));

    const long max_length = static_cast<long>(max_header_length_);
    long remaining = max_length - 2 - static_cast<long>(key.size());
    std::string line = std::format("{}: ", key);
    remaining -= 2;

    std::string joined;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
            joined += ", ";
        joined += values[i];
    }

    std::vector<std::string_view> words;
    std::string_view rest = joined;
    while (true)
    {
        const auto space = rest.find(' ');
        words.push_back(rest.substr(0, space));
        if (space == std::string_view::npos)
            break;
        rest.remove_prefix(space + 1);
    }

    for (std::size_t i = 0; i < words.size(); ++i)
    {
        const long word_length = static_cast<long>(words[i].size());
        if (remaining - word_length <= 1)
        {
            line += "\r\n ";
            remaining = max_length - 3;
        }
        line += words[i];
        if (i + 1 != words.size())
        {
            line.push_back(' ');
            remaining -= 1;
        }
        remaining -= word_length;
    }

    // A fold right after a separator leaves a trailing space on the previous line.
    std::string cleaned;
    cleaned.reserve(line.size() + 2);
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] == ' ' && line.compare(i + 1, 2, "\r\n") == 0)
            continue;
        cleaned.push_back(line[i]);
    }
    cleaned += codec::END_OF_LINE;
    return out_.write(cleaned);
}


inline result<void> message_writer::start_multipart(multipart_type type, const message& msg)
{
    level next;
    next.boundary = msg.level_boundary(levels_.size());
    if (next.boundary.empty())
        return fail(errc::internal_error, std::format("No boundary drawn for multipart level {}.", levels_.size()));

    const std::string value = std::format("multipart/{};\r\n boundary={}", to_string(type), next.boundary);
    if (levels_.empty())
        MAILWIRE_TRY(out_.write(std::format("{}: {}\r\n\r\n", header::CONTENT_TYPE, value)));
    else
        MAILWIRE_TRY(open_part({{std::string(header::CONTENT_TYPE), value}}));
    levels_.push_back(std::move(next));
    return ok();
}


inline result<void> message_writer::stop_multipart()
{
    if (levels_.empty())
        return fail(errc::internal_error, "No multipart level to close.");
    const level& current = levels_.back();
    if (current.has_parts)
        MAILWIRE_TRY(out_.write(std::format("\r\n--{}--\r\n", current.boundary)));
    else
        MAILWIRE_TRY(out_.write(std::format("--{}--\r\n", current.boundary)));
    levels_.pop_back();
    return ok();
}


inline result<void> message_writer::open_part(const part_headers& headers)
{
    level& current = levels_.back();
    std::string text;
    if (current.has_parts)
        text = std::format("\r\n--{}\r\n", current.boundary);
    else
        text = std::format("--{}\r\n", current.boundary);
    current.has_parts = true;

    for (const auto& [name, value] : headers)
        text += std::format("{}: {}\r\n", name, value);
    text += codec::END_OF_LINE;
    return out_.write(text);
}


inline result<void> message_writer::write_part(const message& msg, const part& p)
{
    std::string type;
    if (p.is_smime())
        type = p.content_type();
    else
        type = std::format("{}; charset={}", p.content_type(), p.charset().empty() ? msg.charset() : p.charset());
    const std::string encoding(to_string(p.encoding()));

    if (levels_.empty())
    {
        if (!p.description().empty())
            MAILWIRE_TRY(write_header(header::CONTENT_DESCRIPTION, {p.description()}));
        MAILWIRE_TRY(write_header(header::CONTENT_TRANSFER_ENCODING, {encoding}));
        MAILWIRE_TRY(write_header(header::CONTENT_TYPE, {type}));
        MAILWIRE_TRY(out_.write(codec::END_OF_LINE));
    }
    else
    {
        part_headers headers{
            {std::string(header::CONTENT_TRANSFER_ENCODING), encoding},
            {std::string(header::CONTENT_TYPE), type}};
        if (!p.description().empty())
            headers.emplace(std::string(header::CONTENT_DESCRIPTION), p.description());
        MAILWIRE_TRY(open_part(headers));
    }
    return write_body(p.writer(), p.encoding());
}


inline result<void> message_writer::write_files(const message& msg, const std::vector<file>& files, bool embed)
{
    const codec::word_encoder encoder = msg.word_encoder();
    for (const auto& f : files)
    {
        const std::string safe_name = sanitize_filename(f.name);
        const std::string type = f.content_type.empty() ? content_type_for(f.name) : f.content_type;

        part_headers headers{
            {std::string(header::CONTENT_TYPE), std::format("{}; name=\"{}\"", type, encoder.encode(safe_name))},
            {std::string(header::CONTENT_TRANSFER_ENCODING), std::string(to_string(f.encoding))},
            {std::string(header::CONTENT_DISPOSITION),
                std::format("{}; filename=\"{}\"", embed ? "inline" : "attachment", encoder.encode(safe_name))}};
        if (!f.description.empty())
            headers.emplace(std::string(header::CONTENT_DESCRIPTION), encoder.encode(f.description));
        if (embed)
            headers.emplace(std::string(header::CONTENT_ID), std::format("<{}>", f.content_id.empty() ? safe_name : f.content_id));

        if (levels_.empty())
        {
            for (const auto& [name, value] : headers)
                MAILWIRE_TRY(write_header(name, {value}));
            MAILWIRE_TRY(out_.write(codec::END_OF_LINE));
        }
        else
            MAILWIRE_TRY(open_part(headers));

        MAILWIRE_TRY(write_body(f.writer, f.encoding));
    }
    return ok();
}


inline result<void> message_writer::write_body(const content_writer& writer, transfer_encoding encoding)
{
    if (!writer)
        return fail(errc::null_callback, "Content writer is not set.");

    switch (encoding)
    {
        case transfer_encoding::quoted_printable:
        {
            codec::quoted_printable_writer qp(out_);
            MAILWIRE_TRY(writer(qp));
            return qp.close();
        }

        case transfer_encoding::base64:
        {
            codec::base64_line_breaker breaker(out_);
            codec::base64_stream_encoder encoder(breaker);
            MAILWIRE_TRY(writer(encoder));
            MAILWIRE_TRY(encoder.close());
            return breaker.close();
        }

        case transfer_encoding::seven_bit:
        case transfer_encoding::eight_bit:
            break;
    }
    MAILWIRE_TRY(writer(out_));
    return ok();
}


inline result<std::size_t> message::write_to(detail::output_sink& sink)
{
    return write_to_skip_middleware(sink, {});
}


inline result<std::size_t> message::write_to_skip_middleware(detail::output_sink& sink, std::string_view skip_type)
{
    MAILWIRE_TRY(ensure_default_headers());
    const message snapshot = apply_middlewares(skip_type);
    message_writer writer(sink);
    return writer.write(snapshot);
}


inline result<std::string> message::to_string()
{
    std::string out;
    detail::string_sink sink(out);
    MAILWIRE_TRY(write_to(sink));
    return out;
}


inline result<void> message::write_to_file(const std::filesystem::path& path)
{
    std::ofstream file_stream(path, std::ios::binary | std::ios::trunc);
    if (!file_stream)
        return fail(errc::io_failed, std::format("Cannot open {} for writing.", path.string()));
    detail::ostream_sink sink(file_stream);
    MAILWIRE_TRY(write_to(sink));
    file_stream.close();
    if (!file_stream)
        return fail(errc::io_failed, std::format("Cannot write {}.", path.string()));
    return ok();
}

} // namespace mailwire::mime
