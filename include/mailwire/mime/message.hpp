/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

#include <boost/asio/ip/host_name.hpp>

#include <mailwire/codec/word_encoder.hpp>
#include <mailwire/detail/ascii.hpp>
#include <mailwire/detail/output_sink.hpp>
#include <mailwire/detail/random.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/mime/file.hpp>
#include <mailwire/mime/mailboxes.hpp>
#include <mailwire/mime/part.hpp>
#include <mailwire/mime/send_error.hpp>
#include <mailwire/mime/types.hpp>

namespace mailwire::mime
{

class message;

/**
Transformation applied to a copy of the message right before it is serialized.

The type tag identifies the middleware so a single serialization can skip it.
**/
struct middleware
{
    std::string type;
    std::function<message(message)> handle;
};

/// Outcome of the last delivery attempt.
enum class delivery_state
{
    pending,
    delivered,
    partially_delivered,
    failed
};


/**
Formatting a time point as an RFC 5322 date with a numeric zone, in the local time zone.

@param tp Time to format.
@return   Date such as `Mon, 02 Jan 2006 15:04:05 -0700`.
**/
inline std::string format_date(std::chrono::system_clock::time_point tp)
{
    const std::chrono::zoned_time zt{std::chrono::current_zone(), std::chrono::floor<std::chrono::seconds>(tp)};
    const auto offset = std::chrono::duration_cast<std::chrono::minutes>(zt.get_info().offset).count();
    const char sign = offset < 0 ? '-' : '+';
    const auto abs_offset = offset < 0 ? -offset : offset;
    return std::format("{:%a, %d %b %Y %H:%M:%S} {}{:02}{:02}", zt.get_local_time(), sign, abs_offset / 60, abs_offset % 60);
}

/**
Getting the host name used in generated message IDs.

@return Host name, `localhost.localdomain` when it cannot be determined.
**/
inline std::string message_id_host()
{
    boost::system::error_code ec;
    std::string host = boost::asio::ip::host_name(ec);
    if (ec || host.empty())
        return "localhost.localdomain";
    return host;
}


/**
Mail message model: headers, addresses, body parts, attachments, embeds and the middleware
chain. Serialization is done by `write_to()` and its variants.
**/
class message
{
public:
    using header_map = std::map<std::string, std::vector<std::string>, std::less<>>;

    /**
    Creating a message with UTF-8 charset, quoted-printable encoding and MIME 1.0.
    **/
    message() = default;

    /**
    Setting the charset used for body parts and encoded header words.
    **/
    void set_charset(std::string cs);

    const std::string& charset() const;

    /**
    Setting the default transfer encoding of body parts; base64 also switches header words
    to the B encoding.
    **/
    void set_encoding(transfer_encoding enc);

    transfer_encoding encoding() const;

    void set_mime_version(std::string version);

    const std::string& mime_version() const;

    /**
    Setting the boundary of the outermost multipart level. The other levels get random
    boundaries on the first serialization, kept until `reset()`.
    **/
    void set_boundary(std::string boundary);

    const std::string& boundary() const;

    /**
    Boundary of the multipart level at the given depth, empty before the first serialization.
    **/
    const std::string& level_boundary(std::size_t depth) const;

    /**
    Setting the header folding width.
    **/
    void set_max_header_length(std::size_t length);

    std::size_t max_header_length() const;

    /**
    Setting User-Agent and X-Mailer.

    @param agent Identifier to write in both headers.
    **/
    void set_user_agent(std::string_view agent);

    /**
    Disabling the default User-Agent and X-Mailer headers.
    **/
    void suppress_user_agent(bool suppress = true);

    void add_middleware(middleware mw);

    const std::vector<middleware>& middlewares() const;

    /**
    Getting the encoder for header words matching the charset and encoding of the message.
    **/
    codec::word_encoder word_encoder() const;

    /**
    Setting a generic header, replacing previous values. Values are word-encoded now.

    @param name   Header name.
    @param values Header values, joined by `, ` when written.
    @return       Error for an invalid name or a value containing CR, LF or NUL.
    **/
    result<void> set_header(std::string_view name, const std::vector<std::string>& values);

    result<void> set_header(std::string_view name, std::string_view value);

    /**
    Setting a header written as is, without encoding or folding.

    @param name  Header name.
    @param value Wire-ready value; line breaks are only allowed as folding (CRLF + WSP).
    **/
    result<void> set_header_preformatted(std::string_view name, std::string value);

    /**
    Getting the stored (encoded) values of a generic header.
    **/
    std::vector<std::string> header(std::string_view name) const;

    bool has_header(std::string_view name) const;

    void remove_header(std::string_view name);

    const header_map& headers() const;

    const std::map<std::string, std::string, std::less<>>& preformatted_headers() const;

    /**
    Replacing the addresses of a role. Every address must parse; From and envelope-From
    take exactly one.

    @param role      Address header to set.
    @param addresses Mailbox texts.
    @return          `errc::invalid_address` without touching the current value on failure.
    **/
    result<void> set_address_header(address_header role, const std::vector<std::string>& addresses);

    /**
    Replacing the addresses of a role, silently dropping the ones that do not parse.
    **/
    void set_address_header_ignore_invalid(address_header role, const std::vector<std::string>& addresses);

    /**
    Appending one address to a role.
    **/
    result<void> add_address(address_header role, std::string_view address);

    const std::vector<mail_address>& addresses(address_header role) const;

    result<void> set_from(std::string_view address);

    result<void> set_from_format(std::string_view name, std::string_view address);

    result<void> set_envelope_from(std::string_view address);

    result<void> set_envelope_from_format(std::string_view name, std::string_view address);

    result<void> set_to(const std::vector<std::string>& addresses);

    result<void> add_to(std::string_view address);

    result<void> add_to_format(std::string_view name, std::string_view address);

    void set_to_ignore_invalid(const std::vector<std::string>& addresses);

    result<void> set_cc(const std::vector<std::string>& addresses);

    result<void> add_cc(std::string_view address);

    result<void> add_cc_format(std::string_view name, std::string_view address);

    void set_cc_ignore_invalid(const std::vector<std::string>& addresses);

    result<void> set_bcc(const std::vector<std::string>& addresses);

    result<void> add_bcc(std::string_view address);

    result<void> add_bcc_format(std::string_view name, std::string_view address);

    void set_bcc_ignore_invalid(const std::vector<std::string>& addresses);

    result<void> set_reply_to(std::string_view address);

    result<void> set_reply_to_format(std::string_view name, std::string_view address);

    /**
    Requesting a message disposition notification (RFC 8098) to the given addresses.
    **/
    result<void> request_mdn_to(const std::vector<std::string>& addresses);

    result<void> add_mdn_to(std::string_view address);

    /**
    Getting the envelope sender: envelope-From first, From otherwise.

    @param full True for the formatted mailbox, false for the bare address.
    @return     Sender or `errc::missing_sender`.
    **/
    result<std::string> get_sender(bool full = false) const;

    /**
    Getting the envelope recipients from To, Cc and Bcc without duplicates.

    @return Addresses or `errc::missing_recipients`.
    **/
    result<std::vector<std::string>> get_recipients() const;

    void set_subject(std::string_view subject);

    /**
    Setting the Date header to the current time.
    **/
    void set_date();

    void set_date(std::chrono::system_clock::time_point tp);

    /**
    Setting a generated Message-ID `<pid.random1random2.random-string@hostname>`.

    @return Error when no random bytes are available.
    **/
    result<void> set_message_id();

    /**
    Setting the Message-ID to a given value; angle brackets are added when missing.
    **/
    result<void> set_message_id(std::string_view id);

    /**
    Getting the Message-ID, empty when not set yet.
    **/
    std::string message_id() const;

    void set_importance(importance level);

    void set_organization(std::string_view organization);

    /**
    Marking the message as bulk mail and suppressing auto responses.
    **/
    void set_bulk();

    /**
    Setting the primary body part, replacing every existing part.

    @param content_type Content type without parameters.
    @param content      Body text.
    @param options      Per-part charset, encoding and description.
    **/
    void set_body(std::string_view content_type, std::string content, const part_options& options = {});

    void set_body_writer(std::string_view content_type, content_writer writer, const part_options& options = {});

    /**
    Adding an alternative body part, e.g. the HTML version of a text body.
    **/
    void add_alternative(std::string_view content_type, std::string content, const part_options& options = {});

    void add_alternative_writer(std::string_view content_type, content_writer writer, const part_options& options = {});

    std::vector<part>& parts();

    const std::vector<part>& parts() const;

    result<void> attach_file(const std::filesystem::path& path, const file_options& options = {});

    void attach_string(std::string name, std::string content, const file_options& options = {});

    result<void> attach_stream(std::string name, std::istream& in, const file_options& options = {});

    void attach_writer(std::string name, content_writer writer, const file_options& options = {});

    void attach(file f);

    result<void> embed_file(const std::filesystem::path& path, const file_options& options = {});

    void embed_string(std::string name, std::string content, const file_options& options = {});

    result<void> embed_stream(std::string name, std::istream& in, const file_options& options = {});

    void embed_writer(std::string name, content_writer writer, const file_options& options = {});

    void embed(file f);

    const std::vector<file>& attachments() const;

    void set_attachments(std::vector<file> files);

    const std::vector<file>& embeds() const;

    void set_embeds(std::vector<file> files);

    /**
    Attaching a detached S/MIME signature produced elsewhere. The message is then written as
    `multipart/signed` with the signature as its last part.

    @param der DER encoded PKCS#7 signature.
    **/
    void set_smime_signature(std::string der);

    const std::optional<part>& smime_signature() const;

    /**
    Adding Date, Message-ID, MIME-Version and the default User-Agent where needed, and drawing
    the multipart boundaries. Generated values are kept, so later serializations reuse them.
    **/
    result<void> ensure_default_headers();

    /**
    Copying the message and running the middlewares on the copy.

    @param skip_type Middleware type to leave out, empty to run all.
    **/
    message apply_middlewares(std::string_view skip_type = {}) const;

    /**
    Serializing the message.

    @param sink Destination of the MIME byte stream.
    @return     Number of bytes written or the first error.
    **/
    result<std::size_t> write_to(detail::output_sink& sink);

    result<std::size_t> write_to_skip_middleware(detail::output_sink& sink, std::string_view skip_type);

    result<std::string> to_string();

    /**
    Writing the message as an `.eml` file, replacing an existing file.
    **/
    result<void> write_to_file(const std::filesystem::path& path);

    /**
    Clearing headers, addresses, parts, attachments, embeds and delivery state. Charset,
    encoding, MIME version, boundary, middlewares and User-Agent settings are kept.
    **/
    void reset();

    bool is_delivered() const;

    bool is_partially_delivered() const;

    bool has_send_error() const;

    bool send_error_is_temp() const;

    const std::optional<send_error>& last_send_error() const;

    const std::vector<recipient_failure>& rejected_recipients() const;

    delivery_state state() const;

    /**
    Recording the result of a delivery attempt; used by transports.
    **/
    void record_delivery(delivery_state state, std::optional<send_error> error = std::nullopt,
        std::vector<recipient_failure> rejected = {});

private:
    void set_part(std::string_view content_type, content_writer writer, const part_options& options, bool replace);

    file& add_file(std::vector<file>& files, file f);

    header_map generic_headers_;
    std::map<std::string, std::string, std::less<>> preformatted_headers_;
    std::map<address_header, std::vector<mail_address>> address_headers_;
    std::vector<part> parts_;
    std::vector<file> attachments_;
    std::vector<file> embeds_;
    std::optional<part> smime_part_;

    std::string charset_{mime::charset::UTF8};
    transfer_encoding encoding_{transfer_encoding::quoted_printable};
    std::string mime_version_{DEFAULT_MIME_VERSION};
    std::string boundary_;
    std::vector<std::string> level_boundaries_;
    std::size_t max_header_length_{DEFAULT_MAX_HEADER_LENGTH};
    std::string user_agent_{DEFAULT_USER_AGENT};
    bool user_agent_suppressed_{false};
    std::vector<middleware> middlewares_;

    delivery_state state_{delivery_state::pending};
    std::optional<send_error> send_error_;
    std::vector<recipient_failure> rejected_;
};


inline void message::set_charset(std::string cs)
{
    charset_ = std::move(cs);
}


inline const std::string& message::charset() const
{
    return charset_;
}


inline void message::set_encoding(transfer_encoding enc)
{
    encoding_ = enc;
}


inline transfer_encoding message::encoding() const
{
    return encoding_;
}


inline void message::set_mime_version(std::string version)
{
    mime_version_ = std::move(version);
}


inline const std::string& message::mime_version() const
{
    return mime_version_;
}


inline void message::set_boundary(std::string boundary)
{
    boundary_ = std::move(boundary);
}


inline const std::string& message::boundary() const
{
    return boundary_;
}


inline const std::string& message::level_boundary(std::size_t depth) const
{
    static const std::string none;
    if (depth == 0 && !boundary_.empty())
        return boundary_;
    return depth < level_boundaries_.size() ? level_boundaries_[depth] : none;
}


inline void message::set_max_header_length(std::size_t length)
{
    max_header_length_ = length < 10 ? 10 : length;
}


inline std::size_t message::max_header_length() const
{
    return max_header_length_;
}


inline void message::set_user_agent(std::string_view agent)
{
    user_agent_ = std::string(agent);
    const std::string encoded = word_encoder().encode(agent);
    generic_headers_[std::string(mime::header::USER_AGENT)] = {encoded};
    generic_headers_[std::string(mime::header::X_MAILER)] = {encoded};
}


inline void message::suppress_user_agent(bool suppress)
{
    user_agent_suppressed_ = suppress;
}


inline void message::add_middleware(middleware mw)
{
    middlewares_.push_back(std::move(mw));
}


inline const std::vector<middleware>& message::middlewares() const
{
    return middlewares_;
}


inline codec::word_encoder message::word_encoder() const
{
    return codec::word_encoder(encoding_ == transfer_encoding::base64 ? codec::word_encoding::b : codec::word_encoding::q, charset_);
}


inline result<void> message::set_header(std::string_view name, const std::vector<std::string>& values)
{
    if (!detail::is_valid_header_name(name))
        return fail(errc::invalid_argument, std::format("Invalid header name \"{}\".", name));
    const codec::word_encoder encoder = word_encoder();
    std::vector<std::string> encoded;
    encoded.reserve(values.size());
    for (const auto& value : values)
    {
        for (char ch : value)
        {
            if (ch == '\r' || ch == '\n' || ch == '\0')
                return fail(errc::invalid_argument, std::format("Header {} contains CR, LF or NUL.", name));
        }
        encoded.push_back(encoder.encode(value));
    }
    generic_headers_.insert_or_assign(std::string(name), std::move(encoded));
    return ok();
}


inline result<void> message::set_header(std::string_view name, std::string_view value)
{
    return set_header(name, std::vector<std::string>{std::string(value)});
}


inline result<void> message::set_header_preformatted(std::string_view name, std::string value)
{
    if (!detail::is_valid_header_name(name))
        return fail(errc::invalid_argument, std::format("Invalid header name \"{}\".", name));
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        const char ch = value[i];
        if (ch == '\0')
            return fail(errc::invalid_argument, std::format("Header {} contains NUL.", name));
        if (ch == '\r' || ch == '\n')
        {
            const bool fold = ch == '\r' && i + 2 < value.size() && value[i + 1] == '\n' && detail::is_wsp(value[i + 2]);
            if (!fold)
                return fail(errc::invalid_argument, std::format("Header {} contains a line break that is not folding.", name));
            ++i;
        }
    }
    preformatted_headers_.insert_or_assign(std::string(name), std::move(value));
    return ok();
}


inline std::vector<std::string> message::header(std::string_view name) const
{
    const auto it = generic_headers_.find(name);
    if (it == generic_headers_.end())
        return {};
    return it->second;
}


inline bool message::has_header(std::string_view name) const
{
    return generic_headers_.find(name) != generic_headers_.end();
}


inline void message::remove_header(std::string_view name)
{
    const auto it = generic_headers_.find(name);
    if (it != generic_headers_.end())
        generic_headers_.erase(it);
}


inline const message::header_map& message::headers() const
{
    return generic_headers_;
}


inline const std::map<std::string, std::string, std::less<>>& message::preformatted_headers() const
{
    return preformatted_headers_;
}


inline result<void> message::set_address_header(address_header role, const std::vector<std::string>& addresses)
{
    const bool single = role == address_header::from || role == address_header::envelope_from;
    if (single && addresses.size() != 1)
        return fail(errc::invalid_address, std::format("{} takes exactly one address, {} given.", mime::to_string(role), addresses.size()));

    std::vector<mail_address> parsed;
    parsed.reserve(addresses.size());
    for (const auto& text : addresses)
    {
        auto addr = parse_address(text);
        if (!addr)
            return std::unexpected(std::move(addr).error());
        parsed.push_back(std::move(*addr));
    }
    address_headers_.insert_or_assign(role, std::move(parsed));
    return ok();
}


inline void message::set_address_header_ignore_invalid(address_header role, const std::vector<std::string>& addresses)
{
    std::vector<mail_address> parsed;
    for (const auto& text : addresses)
    {
        auto addr = parse_address(text);
        if (addr)
            parsed.push_back(std::move(*addr));
    }
    const bool single = role == address_header::from || role == address_header::envelope_from;
    if (single && parsed.size() > 1)
        parsed.resize(1);
    address_headers_.insert_or_assign(role, std::move(parsed));
}


inline result<void> message::add_address(address_header role, std::string_view address)
{
    auto addr = parse_address(address);
    if (!addr)
        return std::unexpected(std::move(addr).error());
    auto& list = address_headers_[role];
    if (role == address_header::from || role == address_header::envelope_from)
        list.clear();
    list.push_back(std::move(*addr));
    return ok();
}


inline const std::vector<mail_address>& message::addresses(address_header role) const
{
    static const std::vector<mail_address> empty;
    const auto it = address_headers_.find(role);
    return it == address_headers_.end() ? empty : it->second;
}


namespace detail_message
{

[[nodiscard]] inline std::string format_name_address(std::string_view name, std::string_view address)
{
    return std::format("\"{}\" <{}>", name, address);
}

} // namespace detail_message


inline result<void> message::set_from(std::string_view address)
{
    return set_address_header(address_header::from, {std::string(address)});
}


inline result<void> message::set_from_format(std::string_view name, std::string_view address)
{
    return set_address_header(address_header::from, {detail_message::format_name_address(name, address)});
}


inline result<void> message::set_envelope_from(std::string_view address)
{
    return set_address_header(address_header::envelope_from, {std::string(address)});
}


inline result<void> message::set_envelope_from_format(std::string_view name, std::string_view address)
{
    return set_address_header(address_header::envelope_from, {detail_message::format_name_address(name, address)});
}


inline result<void> message::set_to(const std::vector<std::string>& addresses)
{
    return set_address_header(address_header::to, addresses);
}


inline result<void> message::add_to(std::string_view address)
{
    return add_address(address_header::to, address);
}


inline result<void> message::add_to_format(std::string_view name, std::string_view address)
{
    return add_address(address_header::to, detail_message::format_name_address(name, address));
}


inline void message::set_to_ignore_invalid(const std::vector<std::string>& addresses)
{
    set_address_header_ignore_invalid(address_header::to, addresses);
}


inline result<void> message::set_cc(const std::vector<std::string>& addresses)
{
    return set_address_header(address_header::cc, addresses);
}


inline result<void> message::add_cc(std::string_view address)
{
    return add_address(address_header::cc, address);
}


inline result<void> message::add_cc_format(std::string_view name, std::string_view address)
{
    return add_address(address_header::cc, detail_message::format_name_address(name, address));
}


inline void message::set_cc_ignore_invalid(const std::vector<std::string>& addresses)
{
    set_address_header_ignore_invalid(address_header::cc, addresses);
}


inline result<void> message::set_bcc(const std::vector<std::string>& addresses)
{
    return set_address_header(address_header::bcc, addresses);
}


inline result<void> message::add_bcc(std::string_view address)
{
    return add_address(address_header::bcc, address);
}


inline result<void> message::add_bcc_format(std::string_view name, std::string_view address)
{
    return add_address(address_header::bcc, detail_message::format_name_address(name, address));
}


inline void message::set_bcc_ignore_invalid(const std::vector<std::string>& addresses)
{
    set_address_header_ignore_invalid(address_header::bcc, addresses);
}


inline result<void> message::set_reply_to(std::string_view address)
{
    return set_address_header(address_header::reply_to, {std::string(address)});
}


inline result<void> message::set_reply_to_format(std::string_view name, std::string_view address)
{
    return set_address_header(address_header::reply_to, {detail_message::format_name_address(name, address)});
}


inline result<void> message::request_mdn_to(const std::vector<std::string>& addresses)
{
    return set_address_header(address_header::disposition_notification_to, addresses);
}


inline result<void> message::add_mdn_to(std::string_view address)
{
    return add_address(address_header::disposition_notification_to, address);
}


inline result<std::string> message::get_sender(bool full) const
{
    for (address_header role : {address_header::envelope_from, address_header::from})
    {
        const auto& list = addresses(role);
        if (!list.empty())
            return full ? list.front().format() : list.front().address;
    }
    return fail<std::string>(errc::missing_sender, "No FROM address set.");
}


inline result<std::vector<std::string>> message::get_recipients() const
{
    std::vector<std::string> out;
    for (address_header role : {address_header::to, address_header::cc, address_header::bcc})
    {
        for (const auto& addr : addresses(role))
        {
            const bool seen = std::any_of(out.begin(), out.end(),
                [&addr](const std::string& other) { return detail::iequals_ascii(other, addr.address); });
            if (!seen)
                out.push_back(addr.address);
        }
    }
    if (out.empty())
        return fail<std::vector<std::string>>(errc::missing_recipients, "No recipient addresses set.");
    return out;
}


inline void message::set_subject(std::string_view subject)
{
    generic_headers_.insert_or_assign(std::string(mime::header::SUBJECT), std::vector<std::string>{word_encoder().encode(subject)});
}


inline void message::set_date()
{
    set_date(std::chrono::system_clock::now());
}


inline void message::set_date(std::chrono::system_clock::time_point tp)
{
    generic_headers_.insert_or_assign(std::string(mime::header::DATE), std::vector<std::string>{format_date(tp)});
}


inline result<void> message::set_message_id()
{
    std::uint64_t first = 0;
    std::uint64_t second = 0;
    std::string tail;
    MAILWIRE_TRY_ASSIGN(first, detail::random_below(100000000));
    MAILWIRE_TRY_ASSIGN(second, detail::random_below(10000));
    MAILWIRE_TRY_ASSIGN(tail, detail::random_string(17));

    const std::string id = std::format("<{}.{}{}.{}@{}>", static_cast<long>(::getpid()), first, second, tail, message_id_host());
    generic_headers_.insert_or_assign(std::string(mime::header::MESSAGE_ID), std::vector<std::string>{id});
    return ok();
}


inline result<void> message::set_message_id(std::string_view id)
{
    std::string_view bare = detail::trim_view(id);
    if (bare.starts_with('<') && bare.ends_with('>'))
        bare = bare.substr(1, bare.size() - 2);
    if (bare.empty() || bare.find_first_of("<>\r\n \t") != std::string_view::npos)
        return fail(errc::invalid_argument, std::format("Invalid message ID \"{}\".", id));
    generic_headers_.insert_or_assign(std::string(mime::header::MESSAGE_ID), std::vector<std::string>{std::format("<{}>", bare)});
    return ok();
}


inline std::string message::message_id() const
{
    const auto values = header(mime::header::MESSAGE_ID);
    return values.empty() ? std::string() : values.front();
}


inline void message::set_importance(importance level)
{
    std::string_view name;
    std::string_view num;
    std::string_view x_priority;
    switch (level)
    {
        case importance::normal:
            return;
        case importance::low:
            name = "low";
            num = "0";
            x_priority = "5";
            break;
        case importance::non_urgent:
            name = "non-urgent";
            num = "0";
            x_priority = "5";
            break;
        case importance::high:
            name = "high";
            num = "1";
            x_priority = "1";
            break;
        case importance::urgent:
            name = "urgent";
            num = "1";
            x_priority = "1";
            break;
    }
    generic_headers_.insert_or_assign(std::string(mime::header::IMPORTANCE), std::vector<std::string>{std::string(name)});
    generic_headers_.insert_or_assign(std::string(mime::header::PRIORITY), std::vector<std::string>{std::string(num)});
    generic_headers_.insert_or_assign(std::string(mime::header::X_PRIORITY), std::vector<std::string>{std::string(x_priority)});
    generic_headers_.insert_or_assign(std::string(mime::header::X_MSMAIL_PRIORITY), std::vector<std::string>{std::string(num)});
}


inline void message::set_organization(std::string_view organization)
{
    generic_headers_.insert_or_assign(std::string(mime::header::ORGANIZATION), std::vector<std::string>{word_encoder().encode(organization)});
}


inline void message::set_bulk()
{
    generic_headers_.insert_or_assign(std::string(mime::header::PRECEDENCE), std::vector<std::string>{"bulk"});
    generic_headers_.insert_or_assign(std::string(mime::header::X_AUTO_RESPONSE_SUPPRESS), std::vector<std::string>{"All"});
}


inline void message::set_part(std::string_view content_type, content_writer writer, const part_options& options, bool replace)
{
    part p(std::string(content_type), options.charset.value_or(charset_), options.encoding.value_or(encoding_), std::move(writer));
    p.description(options.description);
    if (replace)
        parts_.clear();
    parts_.push_back(std::move(p));
}


inline void message::set_body(std::string_view content_type, std::string content, const part_options& options)
{
    set_part(content_type, string_writer(std::move(content)), options, true);
}


inline void message::set_body_writer(std::string_view content_type, content_writer writer, const part_options& options)
{
    set_part(content_type, std::move(writer), options, true);
}


inline void message::add_alternative(std::string_view content_type, std::string content, const part_options& options)
{
    set_part(content_type, string_writer(std::move(content)), options, false);
}


inline void message::add_alternative_writer(std::string_view content_type, content_writer writer, const part_options& options)
{
    set_part(content_type, std::move(writer), options, false);
}


inline std::vector<part>& message::parts()
{
    return parts_;
}


inline const std::vector<part>& message::parts() const
{
    return parts_;
}


inline file& message::add_file(std::vector<file>& files, file f)
{
    files.push_back(std::move(f));
    return files.back();
}


inline result<void> message::attach_file(const std::filesystem::path& path, const file_options& options)
{
    auto f = file_from_path(path, options);
    if (!f)
        return std::unexpected(std::move(f).error());
    add_file(attachments_, std::move(*f));
    return ok();
}


inline void message::attach_string(std::string name, std::string content, const file_options& options)
{
    add_file(attachments_, file_from_string(std::move(name), std::move(content), options));
}


inline result<void> message::attach_stream(std::string name, std::istream& in, const file_options& options)
{
    auto f = file_from_stream(std::move(name), in, options);
    if (!f)
        return std::unexpected(std::move(f).error());
    add_file(attachments_, std::move(*f));
    return ok();
}


inline void message::attach_writer(std::string name, content_writer writer, const file_options& options)
{
    add_file(attachments_, file_from_writer(std::move(name), std::move(writer), options));
}


inline void message::attach(file f)
{
    add_file(attachments_, std::move(f));
}


inline result<void> message::embed_file(const std::filesystem::path& path, const file_options& options)
{
    auto f = file_from_path(path, options);
    if (!f)
        return std::unexpected(std::move(f).error());
    add_file(embeds_, std::move(*f));
    return ok();
}


inline void message::embed_string(std::string name, std::string content, const file_options& options)
{
    add_file(embeds_, file_from_string(std::move(name), std::move(content), options));
}


inline result<void> message::embed_stream(std::string name, std::istream& in, const file_options& options)
{
    auto f = file_from_stream(std::move(name), in, options);
    if (!f)
        return std::unexpected(std::move(f).error());
    add_file(embeds_, std::move(*f));
    return ok();
}


inline void message::embed_writer(std::string name, content_writer writer, const file_options& options)
{
    add_file(embeds_, file_from_writer(std::move(name), std::move(writer), options));
}


inline void message::embed(file f)
{
    add_file(embeds_, std::move(f));
}


inline const std::vector<file>& message::attachments() const
{
    return attachments_;
}


inline void message::set_attachments(std::vector<file> files)
{
    attachments_ = std::move(files);
}


inline const std::vector<file>& message::embeds() const
{
    return embeds_;
}


inline void message::set_embeds(std::vector<file> files)
{
    embeds_ = std::move(files);
}


inline void message::set_smime_signature(std::string der)
{
    part p(std::string(content_type::SMIME_SIGNATURE), {}, transfer_encoding::base64, string_writer(std::move(der)));
    p.smime(true);
    smime_part_ = std::move(p);
}


inline const std::optional<part>& message::smime_signature() const
{
    return smime_part_;
}


inline result<void> message::ensure_default_headers()
{
    if (!has_header(mime::header::DATE))
        set_date();
    if (!has_header(mime::header::MESSAGE_ID))
        MAILWIRE_TRY(set_message_id());
    generic_headers_.insert_or_assign(std::string(mime::header::MIME_VERSION), std::vector<std::string>{mime_version_});

    if (!user_agent_suppressed_ && !has_header(mime::header::USER_AGENT) && !has_header(mime::header::X_MAILER))
        set_user_agent(user_agent_);

    while (level_boundaries_.size() < MAX_MULTIPART_DEPTH)
    {
        std::string token;
        MAILWIRE_TRY_ASSIGN(token, detail::random_boundary());
        level_boundaries_.push_back(std::move(token));
    }
    return ok();
}


inline message message::apply_middlewares(std::string_view skip_type) const
{
    message out = *this;
    for (const auto& mw : middlewares_)
    {
        if (!mw.handle || (!skip_type.empty() && mw.type == skip_type))
            continue;
        out = mw.handle(std::move(out));
    }
    return out;
}


inline void message::reset()
{
    generic_headers_.clear();
    preformatted_headers_.clear();
    address_headers_.clear();
    parts_.clear();
    attachments_.clear();
    embeds_.clear();
    smime_part_.reset();
    level_boundaries_.clear();
    state_ = delivery_state::pending;
    send_error_.reset();
    rejected_.clear();
}


inline bool message::is_delivered() const
{
    return state_ == delivery_state::delivered || state_ == delivery_state::partially_delivered;
}


inline bool message::is_partially_delivered() const
{
    return state_ == delivery_state::partially_delivered;
}


inline bool message::has_send_error() const
{
    return send_error_.has_value();
}


inline bool message::send_error_is_temp() const
{
    return send_error_ && send_error_->is_temp();
}


inline const std::optional<send_error>& message::last_send_error() const
{
    return send_error_;
}


inline const std::vector<recipient_failure>& message::rejected_recipients() const
{
    return rejected_;
}


inline delivery_state message::state() const
{
    return state_;
}


inline void message::record_delivery(delivery_state state, std::optional<send_error> error, std::vector<recipient_failure> rejected)
{
    state_ = state;
    send_error_ = std::move(error);
    rejected_ = std::move(rejected);
}

} // namespace mailwire::mime

#include <mailwire/mime/writer.hpp>
