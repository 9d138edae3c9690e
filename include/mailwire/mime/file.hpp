/*

file.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Attachments and embeds. A file never holds its bytes unless it was built from memory or
from a stream; path based files reopen the path on every serialization.

*/


#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <istream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/detail/ascii.hpp>
#include <mailwire/detail/output_sink.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/mime/part.hpp>
#include <mailwire/mime/types.hpp>

namespace mailwire::mime
{

/// Overrides applied when a file is attached or embedded.
struct file_options
{
    std::optional<std::string> name;
    std::optional<std::string> content_type;
    std::optional<std::string> description;
    std::optional<std::string> content_id;
    std::optional<transfer_encoding> encoding;
};

/**
Attachment or embed: logical name, content type, optional description and content id, and
the producer of its bytes.
**/
struct file
{
    std::string name;
    /// Empty means: derived from the file name extension when written.
    std::string content_type;
    std::string description;
    /// Defaults to the file name for embeds.
    std::string content_id;
    transfer_encoding encoding{transfer_encoding::base64};
    content_writer writer;

    void apply(const file_options& options)
    {
        if (options.name)
            name = *options.name;
        if (options.content_type)
            content_type = *options.content_type;
        if (options.description)
            description = *options.description;
        if (options.content_id)
            content_id = *options.content_id;
        if (options.encoding)
            encoding = *options.encoding;
    }
};


/**
Guessing a content type from a file name extension.

@param name File name or path.
@return     MIME type, `application/octet-stream` when the extension is unknown.
**/
[[nodiscard]] inline std::string content_type_for(std::string_view name)
{
    struct entry
    {
        std::string_view ext;
        std::string_view type;
    };
    static constexpr std::array<entry, 40> table{{
        {"7z", "application/x-7z-compressed"}, {"avif", "image/avif"}, {"bmp", "image/bmp"},
        {"css", "text/css"}, {"csv", "text/csv"}, {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"eml", "message/rfc822"}, {"gif", "image/gif"}, {"gz", "application/gzip"},
        {"htm", "text/html"}, {"html", "text/html"}, {"ics", "text/calendar"}, {"jpeg", "image/jpeg"},
        {"jpg", "image/jpeg"}, {"js", "text/javascript"}, {"json", "application/json"},
        {"md", "text/markdown"}, {"mp3", "audio/mpeg"}, {"mp4", "video/mp4"},
        {"odp", "application/vnd.oasis.opendocument.presentation"},
        {"ods", "application/vnd.oasis.opendocument.spreadsheet"},
        {"odt", "application/vnd.oasis.opendocument.text"}, {"ogg", "audio/ogg"},
        {"pdf", "application/pdf"}, {"png", "image/png"}, {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"rtf", "application/rtf"}, {"svg", "image/svg+xml"}, {"tar", "application/x-tar"},
        {"tif", "image/tiff"}, {"tiff", "image/tiff"}, {"txt", "text/plain"}, {"wav", "audio/wav"},
        {"webp", "image/webp"}, {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"xml", "application/xml"}, {"zip", "application/zip"},
    }};

    const auto dot = name.rfind('.');
    if (dot != std::string_view::npos && dot + 1 < name.size())
    {
        const std::string ext = detail::to_lower_copy(name.substr(dot + 1));
        for (const auto& e : table)
        {
            if (e.ext == ext)
                return std::string(e.type);
        }
    }
    return std::string(content_type::APPLICATION_OCTET_STREAM);
}

/**
Replacing characters that are unsafe inside a quoted filename parameter.

Control characters, DEL and `"/:<>?\|` become `_`.
**/
[[nodiscard]] inline std::string sanitize_filename(std::string_view name)
{
    std::string out(name);
    for (char& ch : out)
    {
        const auto b = static_cast<unsigned char>(ch);
        if (b < 0x20 || b == 0x7F || std::string_view("\"/:<>?\\|").find(ch) != std::string_view::npos)
            ch = '_';
    }
    return out;
}


/**
Creating a file backed by a path. The path is opened and closed on every write.

@param path    Path of the file to read.
@param options Overrides; the name defaults to the path's file name.
@return        File or `errc::io_failed` when the path is not a readable regular file.
**/
[[nodiscard]] inline result<file> file_from_path(const std::filesystem::path& path, const file_options& options = {})
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return fail<file>(errc::io_failed, std::format("Not a regular file: {}.", path.string()), {}, ec);

    file f;
    f.name = path.filename().string();
    f.writer = [path](detail::output_sink& sink) -> result<std::size_t>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            return fail<std::size_t>(errc::io_failed, std::format("Cannot open {}.", path.string()));

        std::array<char, 32 * 1024> buf{};
        std::size_t total = 0;
        while (in)
        {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const auto got = static_cast<std::size_t>(in.gcount());
            if (got == 0)
                break;
            MAILWIRE_TRY(sink.write(std::string_view(buf.data(), got)));
            total += got;
        }
        if (in.bad())
            return fail<std::size_t>(errc::io_failed, std::format("Read error on {}.", path.string()));
        return total;
    };
    f.apply(options);
    return f;
}

/**
Creating a file from bytes held in memory.
**/
[[nodiscard]] inline file file_from_string(std::string name, std::string content, const file_options& options = {})
{
    file f;
    f.name = std::move(name);
    f.writer = string_writer(std::move(content));
    f.apply(options);
    return f;
}

/**
Creating a file from a stream. The stream is drained now so the file stays re-readable.
**/
[[nodiscard]] inline result<file> file_from_stream(std::string name, std::istream& in, const file_options& options = {})
{
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
        return fail<file>(errc::io_failed, std::format("Read error on stream for {}.", name));
    return file_from_string(std::move(name), std::move(content), options);
}

/**
Creating a file from a caller supplied producer.
**/
[[nodiscard]] inline file file_from_writer(std::string name, content_writer writer, const file_options& options = {})
{
    file f;
    f.name = std::move(name);
    f.writer = std::move(writer);
    f.apply(options);
    return f;
}

} // namespace mailwire::mime
