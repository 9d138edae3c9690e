/*

send_error.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Per-message delivery outcome recorded by the SMTP client.

*/


#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailwire/detail/result.hpp>

namespace mailwire::mime
{

/// Stage of the delivery at which a message failed.
enum class send_error_reason
{
    get_sender,
    get_recipients,
    mail_from,
    rcpt_to,
    data,
    data_close,
    reset,
    write_content,
    conn_check,
    no_unencoded,
    ambiguous
};

[[nodiscard]] constexpr std::string_view to_string(send_error_reason reason) noexcept
{
    switch (reason)
    {
        case send_error_reason::get_sender: return "getting sender address";
        case send_error_reason::get_recipients: return "getting recipient addresses";
        case send_error_reason::mail_from: return "sending SMTP MAIL FROM command";
        case send_error_reason::rcpt_to: return "sending SMTP RCPT TO command";
        case send_error_reason::data: return "sending SMTP DATA command";
        case send_error_reason::data_close: return "closing SMTP DATA writer";
        case send_error_reason::reset: return "sending SMTP RESET command";
        case send_error_reason::write_content: return "sending message content";
        case send_error_reason::conn_check: return "checking SMTP connection";
        case send_error_reason::no_unencoded: return "message is 8bit unencoded, but server does not support 8BITMIME";
        case send_error_reason::ambiguous: return "ambiguous reason, check the message send errors for message specific reasons";
    }
    return "unknown reason";
}

/**
Delivery failure of one message: the reason, the underlying errors and the recipients they
affect. Temporary failures may be retried by the caller.
**/
class send_error
{
public:
    send_error(send_error_reason reason, std::vector<error_info> errors, std::vector<std::string> recipients = {})
        : reason_(reason), errors_(std::move(errors)), recipients_(std::move(recipients))
    {
        temporary_ = !errors_.empty() && std::all_of(errors_.begin(), errors_.end(),
            [](const error_info& e) { return is_temporary(e); });
    }

    send_error_reason reason() const noexcept
    {
        return reason_;
    }

    bool is_temp() const noexcept
    {
        return temporary_;
    }

    const std::vector<error_info>& errors() const noexcept
    {
        return errors_;
    }

    const std::vector<std::string>& recipients() const noexcept
    {
        return recipients_;
    }

    /**
    Formatting as `reason: error1, error2, affected recipient(s): a, b`.
    **/
    std::string to_string() const
    {
        std::string out(mime::to_string(reason_));
        if (!errors_.empty())
        {
            out.push_back(':');
            for (std::size_t i = 0; i < errors_.size(); ++i)
            {
                out.push_back(' ');
                out += errors_[i].message;
                if (i + 1 != errors_.size())
                    out += ",";
            }
        }
        if (!recipients_.empty())
        {
            out += ", affected recipient(s): ";
            for (std::size_t i = 0; i < recipients_.size(); ++i)
            {
                if (i > 0)
                    out += ", ";
                out += recipients_[i];
            }
        }
        return out;
    }

    /// Error value for APIs returning result<T>.
    error_info to_error_info() const
    {
        error_info err = errors_.empty() ? error_info{errc::internal_error, {}, {}, {}, 0} : errors_.front();
        err.message = to_string();
        return err;
    }

private:
    send_error_reason reason_;
    std::vector<error_info> errors_;
    std::vector<std::string> recipients_;
    bool temporary_{false};
};

/// Rejection of one recipient in a transaction that may still deliver to the others.
struct recipient_failure
{
    std::string address;
    error_info error;
};

} // namespace mailwire::mime
