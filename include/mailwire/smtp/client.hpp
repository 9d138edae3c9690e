/*

smtp/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailwire/codec/base64.hpp>
#include <mailwire/detail/ascii.hpp>
#include <mailwire/detail/asio_decl.hpp>
#include <mailwire/detail/async_mutex.hpp>
#include <mailwire/detail/log.hpp>
#include <mailwire/detail/redact.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/detail/sanitize.hpp>
#include <mailwire/mime/message.hpp>
#include <mailwire/mime/send_error.hpp>
#include <mailwire/net/deadline.hpp>
#include <mailwire/net/dialog.hpp>
#include <mailwire/net/error_mapping.hpp>
#include <mailwire/net/tls_options.hpp>
#include <mailwire/net/tls_trust_store.hpp>
#include <mailwire/net/upgradable_stream.hpp>
#include <mailwire/sasl/mechanism.hpp>
#include <mailwire/sasl/session.hpp>
#include <mailwire/smtp/error_mapping.hpp>
#include <mailwire/smtp/types.hpp>

namespace mailwire::smtp
{

using namespace mailwire::asio;

namespace detail
{

/// Bytes handed to one DATA write, each write with its own timeout.
inline constexpr std::size_t DATA_CHUNK_SIZE = 8192;

/**
Incremental DATA framing: lines starting with a dot get a second dot, and the last chunk ends
with the `CRLF.CRLF` terminator.
**/
class data_framer
{
public:
    explicit data_framer(std::string_view payload) noexcept
        : payload_(payload)
    {
    }

    [[nodiscard]] bool done() const noexcept
    {
        return done_;
    }

    /**
    Framing the next piece of at most `max_size` payload bytes, plus the dots they need.

    @return Framed bytes, empty once the terminator went out.
    **/
    [[nodiscard]] std::string next_chunk(std::size_t max_size)
    {
        std::string out;
        if (done_)
            return out;

        const std::size_t take = std::min(max_size, payload_.size() - pos_);
        out.reserve(take + take / 64 + 8);
        for (const std::size_t end = pos_ + take; pos_ < end; ++pos_)
        {
            const char ch = payload_[pos_];
            if (line_start_ && ch == '.')
                out.push_back('.');
            out.push_back(ch);
            line_start_ = ch == '\n';
        }

        if (pos_ == payload_.size())
        {
            if (!payload_.empty() && !payload_.ends_with("\r\n"))
                out += "\r\n";
            out += ".\r\n";
            done_ = true;
        }
        return out;
    }

private:
    std::string_view payload_;
    std::size_t pos_{0};
    bool line_start_{true};
    bool done_{false};
};

/**
Framing a whole message for DATA in one piece.
**/
[[nodiscard]] inline std::string frame_data_payload(std::string_view payload)
{
    data_framer framer(payload);
    return framer.next_chunk(payload.size());
}

[[nodiscard]] inline bool is_localhost(std::string_view host) noexcept
{
    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

/// Errors after which the connection cannot carry another command.
[[nodiscard]] inline bool breaks_connection(const error_info& err) noexcept
{
    const auto code = static_cast<int>(err.code);
    return (code >= 300 && code < 500) || err.code == errc::smtp_bad_reply || err.reply_code == 421;
}

} // namespace detail


/**
SMTP client on one connection.

Every public operation takes the connection lock, so concurrent callers are serialized and a
transaction (MAIL, RCPT, DATA) never interleaves with another one. Errors are returned as
`result`; delivery outcomes are also recorded on the messages.
**/
class client
{
public:
    using executor_type = any_io_executor;
    using dialog_type = mailwire::net::dialog<mailwire::net::upgradable_stream>;

    explicit client(executor_type executor, options opts = {})
        : executor_(executor),
          options_(std::move(opts)),
          mutex_(executor_)
    {
    }

    explicit client(io_context& context, options opts = {})
        : client(context.get_executor(), std::move(opts))
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    executor_type get_executor() const { return executor_; }

    const options& config() const noexcept { return options_; }

    /**
    Using a caller provided TLS context instead of one built from `options::tls`.
    **/
    void set_tls_context(std::shared_ptr<ssl::context> context)
    {
        tls_context_ = std::move(context);
    }

    const capabilities& server_capabilities() const noexcept { return capabilities_; }

    bool is_connected() const noexcept { return dialog_.has_value(); }

    bool is_tls() const noexcept { return dialog_.has_value() && dialog_->stream().is_tls(); }

    bool is_authenticated() const noexcept { return state_ == state::authenticated; }

    /// Mechanism of the last successful authentication.
    std::optional<sasl::mechanism> auth_mechanism() const noexcept { return auth_mechanism_; }

    bool supports_8bitmime() const { return capabilities_known_ && capabilities_.supports("8BITMIME"); }

    bool supports_smtputf8() const { return capabilities_known_ && capabilities_.supports("SMTPUTF8"); }

    bool supports_dsn() const { return capabilities_known_ && capabilities_.supports("DSN"); }

    bool supports_starttls() const { return capabilities_known_ && capabilities_.supports("STARTTLS"); }

    // ==================== Low level operations ====================

    /**
    Opening the TCP connection, through the dial hook when one is configured, and running the
    TLS handshake right away under the implicit policy.
    **/
    awaitable<result<void>> connect()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await connect_impl();
    }

    awaitable<result<reply>> read_greeting()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await read_greeting_impl();
    }

    /**
    Sending EHLO, falling back to HELO when the server does not know EHLO.

    @param domain Name to announce, `options::helo_name` or the local host name when empty.
    **/
    awaitable<result<reply>> ehlo(std::string domain = {})
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await ehlo_impl(std::move(domain));
    }

    /**
    Upgrading the connection with STARTTLS and refreshing the capabilities with a new EHLO.
    **/
    awaitable<result<void>> start_tls()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILWIRE_CO_TRY_VOID(co_await start_tls_impl());
        MAILWIRE_CO_TRY_VOID(co_await ehlo_impl({}));
        co_return ok();
    }

    /**
    Authenticating with the configured credentials and mechanism, or the strongest mechanism
    both sides support.
    **/
    awaitable<result<void>> authenticate()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await authenticate_impl();
    }

    awaitable<result<reply>> noop()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await simple_command_impl(command_kind::noop, "NOOP");
    }

    awaitable<result<reply>> reset()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await simple_command_impl(command_kind::rset, "RSET");
    }

    /**
    Sending QUIT and closing the transport.
    **/
    awaitable<result<reply>> quit()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        if (!dialog_.has_value())
            co_return fail<reply>(errc::invalid_state, "Connection is not established.");
        auto rep = co_await command_impl(command_kind::quit, "QUIT");
        close_transport();
        co_return rep;
    }

    /**
    Closing the connection, with QUIT when the session got past the greeting. Calling it on a
    closed client does nothing.

    @return Error of the QUIT exchange; the transport is closed in any case.
    **/
    awaitable<result<void>> close()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await close_impl();
    }

    // ==================== High level operations ====================

    /**
    Connecting and preparing the session: greeting, EHLO, TLS according to the policy and
    authentication when credentials are configured.
    **/
    awaitable<result<void>> dial()
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await dial_impl();
    }

    /**
    Delivering one message. The outcome is also recorded on the message.
    **/
    awaitable<result<void>> send(mime::message& msg)
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await send_one_impl(msg);
    }

    /**
    Delivering several messages on the connection; a failure does not stop the batch.

    @return The error of the failed message when only one failed, `smtp_batch_failed`
            when several did. Each message carries its own outcome.
    **/
    awaitable<result<void>> send(std::span<mime::message> batch)
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await send_batch_impl(batch);
    }

    /**
    Dialing, delivering the batch and closing the connection.
    **/
    awaitable<result<void>> dial_and_send(std::span<mime::message> batch)
    {
        mailwire::detail::async_mutex::scoped_lock guard;
        MAILWIRE_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILWIRE_CO_TRY_VOID(co_await dial_impl());
        auto sent = co_await send_batch_impl(batch);
        auto closed = co_await close_impl();
        if (!sent)
            co_return sent;
        co_return closed;
    }

private:
    enum class state
    {
        disconnected,
        connected,
        greeted,
        ehlo_done,
        authenticated
    };

    static bool allows_helo_fallback(int status) noexcept
    {
        return status >= 500 && status < 600;
    }

    std::string service() const
    {
        return std::to_string(options_.port);
    }

    std::string server_name() const
    {
        return options_.sni.empty() ? options_.host : options_.sni;
    }

    void reset_capabilities() noexcept
    {
        capabilities_.entries.clear();
        capabilities_known_ = false;
    }

    void configure_trace()
    {
        if (!dialog_.has_value())
            return;
        dialog_->set_trace_protocol("SMTP");
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
    }

    result<ssl::context*> tls_context()
    {
        if (!tls_context_)
        {
            auto context = std::make_shared<ssl::context>(ssl::context::tls_client);
            MAILWIRE_TRY(mailwire::net::configure_context(*context, options_.tls));
            tls_context_ = std::move(context);
        }
        return tls_context_.get();
    }

    mailwire::detail::error_detail reply_detail(command_kind k, std::string_view line, const reply& rep) const
    {
        return make_smtp_detail(options_.host, service(), k,
            options_.redact_secrets_in_trace ? mailwire::detail::redact_line(line) : std::string(line), rep);
    }

    void close_transport() noexcept
    {
        if (dialog_.has_value())
            dialog_->stream().close();
        dialog_.reset();
        state_ = state::disconnected;
        reset_capabilities();
        auth_mechanism_.reset();
    }

    awaitable<result<void>> close_impl()
    {
        if (!dialog_.has_value())
            co_return ok();
        result<void> outcome = ok();
        if (state_ != state::connected)
        {
            auto rep = co_await command_impl(command_kind::quit, "QUIT");
            if (!rep)
                outcome = std::unexpected(std::move(rep).error());
        }
        close_transport();
        co_return outcome;
    }

    awaitable<result<void>> connect_impl()
    {
        if (dialog_.has_value())
            co_return fail(errc::invalid_state, "Connection is already established.");
        MAILWIRE_CO_TRY_VOID(mailwire::detail::ensure_no_crlf_or_nul(options_.host, "host"));
        if (options_.host.empty())
            co_return fail(errc::invalid_argument, "SMTP host is empty.");

        const std::string port = service();
        std::optional<tcp::socket> socket;
        if (options_.dial)
        {
            tcp::socket dialed(executor_);
            MAILWIRE_CO_TRY_ASSIGN(dialed, co_await options_.dial(executor_, options_.host, port));
            socket.emplace(std::move(dialed));
        }
        else
        {
            tcp::resolver resolver(executor_);
            socket.emplace(executor_);
            mailwire::net::deadline timer(executor_, options_.connect_timeout, [&resolver, &socket]()
            {
                resolver.cancel();
                mailwire::asio::error_code ignore_ec;
                socket->close(ignore_ec);
            });

            auto [resolve_ec, endpoints] = co_await resolver.async_resolve(options_.host, port, use_nothrow_awaitable);
            if (resolve_ec)
                co_return std::unexpected(mailwire::net::error_from_asio(mailwire::net::io_stage::resolve, resolve_ec,
                    timer.expired(), "Cannot resolve the SMTP server.", mailwire::net::make_net_detail("smtp", options_.host,
                    port, mailwire::net::io_stage::resolve, "async_resolve").add_ec("error", resolve_ec).str()));

            auto [connect_ec, endpoint] = co_await mailwire::asio::async_connect(*socket, endpoints, use_nothrow_awaitable);
            if (connect_ec)
                co_return std::unexpected(mailwire::net::error_from_asio(mailwire::net::io_stage::connect, connect_ec,
                    timer.expired(), "Cannot connect to the SMTP server.", mailwire::net::make_net_detail("smtp", options_.host,
                    port, mailwire::net::io_stage::connect, "async_connect").add_ec("error", connect_ec).str()));
        }

        mailwire::net::upgradable_stream stream(std::move(*socket));
        if (options_.tls_policy == mailwire::net::tls_policy::implicit)
            MAILWIRE_CO_TRY_VOID(co_await handshake(stream));

        dialog_.emplace(std::move(stream), options_.max_line_length, options_.timeout);
        configure_trace();
        state_ = state::connected;
        reset_capabilities();
        last_activity_ = std::chrono::steady_clock::now();
        MAILWIRE_LOGF(mailwire::log::level::debug, "SMTP connected to {}:{}", options_.host, port);
        co_return ok();
    }

    awaitable<result<void>> handshake(mailwire::net::upgradable_stream& stream)
    {
        ssl::context* context = nullptr;
        MAILWIRE_CO_TRY_ASSIGN(context, tls_context());
        mailwire::net::deadline timer(executor_, options_.timeout, [&stream]()
        {
            mailwire::asio::error_code ignore_ec;
            stream.lowest_layer().cancel(ignore_ec);
        });
        auto res = co_await stream.start_tls(*context, server_name(), options_.tls);
        if (!res && timer.expired())
            co_return fail(errc::net_timeout, "TLS handshake timed out.", res.error().detail, res.error().sys);
        co_return res;
    }

    awaitable<result<reply>> read_greeting_impl()
    {
        if (state_ != state::connected)
            co_return fail<reply>(errc::invalid_state, "Greeting requires an established connection.");
        reply rep;
        MAILWIRE_CO_TRY_ASSIGN(rep, co_await read_reply_impl());
        if (rep.status != 220)
            co_return std::unexpected(error_from_reply(command_kind::greeting, rep, "Connection rejected.",
                reply_detail(command_kind::greeting, {}, rep).str()));
        state_ = state::greeted;
        co_return rep;
    }

    awaitable<result<reply>> ehlo_impl(std::string domain)
    {
        if (state_ == state::disconnected || state_ == state::connected)
            co_return fail<reply>(errc::invalid_state, "EHLO requires a greeting.");

        if (domain.empty())
            domain = options_.helo_name.empty() ? default_hostname() : options_.helo_name;
        MAILWIRE_CO_TRY_VOID(mailwire::detail::ensure_no_crlf_or_nul(domain, "helo_name"));

        reply rep;
        MAILWIRE_CO_TRY_ASSIGN(rep, co_await command_impl(command_kind::ehlo, "EHLO " + domain));
        reset_capabilities();
        if (!rep.is_positive_completion())
        {
            if (!allows_helo_fallback(rep.status))
                co_return std::unexpected(error_from_reply(command_kind::ehlo, rep, "EHLO rejected.",
                    reply_detail(command_kind::ehlo, "EHLO " + domain, rep).str()));

            reply helo_rep;
            MAILWIRE_CO_TRY_ASSIGN(helo_rep, co_await command_impl(command_kind::helo, "HELO " + domain));
            if (!helo_rep.is_positive_completion())
                co_return std::unexpected(error_from_reply(command_kind::helo, helo_rep, "HELO rejected.",
                    reply_detail(command_kind::helo, "HELO " + domain, helo_rep).str()));
            state_ = state::ehlo_done;
            co_return helo_rep;
        }

        parse_capabilities(rep);
        capabilities_known_ = true;
        state_ = state::ehlo_done;
        co_return rep;
    }

    awaitable<result<void>> start_tls_impl()
    {
        if (state_ != state::ehlo_done)
            co_return fail(errc::invalid_state, "STARTTLS requires EHLO and no authentication yet.");
        if (is_tls())
            co_return fail(errc::invalid_state, "TLS is already active.");
        if (!supports_starttls())
            co_return fail(errc::tls_required, "STARTTLS not supported.", "server did not advertise STARTTLS");

        reply rep;
        MAILWIRE_CO_TRY_ASSIGN(rep, co_await command_impl(command_kind::starttls, "STARTTLS"));
        if (rep.status != 220)
            co_return std::unexpected(error_from_reply(command_kind::starttls, rep, "STARTTLS rejected.",
                reply_detail(command_kind::starttls, "STARTTLS", rep).str()));
        if (dialog_->has_buffered_input())
        {
            close_transport();
            co_return fail(errc::tls_handshake_failed, "Plaintext data received after STARTTLS.",
                "possible command injection");
        }

        const std::size_t max_len = dialog_->max_line_length();
        const auto timeout = dialog_->timeout();
        mailwire::net::upgradable_stream stream = std::move(dialog_->stream());
        dialog_.reset();
        auto res = co_await handshake(stream);
        if (!res)
        {
            stream.close();
            close_transport();
            co_return res;
        }

        dialog_.emplace(std::move(stream), max_len, timeout);
        configure_trace();
        reset_capabilities();
        state_ = state::greeted;
        MAILWIRE_LOGF(mailwire::log::level::debug, "SMTP connection upgraded to {}", dialog_->stream().tls_version());
        co_return ok();
    }

    /**
    Applying the TLS policy after the first EHLO.
    **/
    awaitable<result<void>> apply_tls_policy()
    {
        using mailwire::net::tls_policy;
        switch (options_.tls_policy)
        {
            case tls_policy::none:
            case tls_policy::implicit:
                co_return ok();

            case tls_policy::mandatory:
                if (!supports_starttls())
                    co_return fail(errc::tls_required, "STARTTLS is required but not offered by the server.");
                MAILWIRE_CO_TRY_VOID(co_await start_tls_impl());
                MAILWIRE_CO_TRY_VOID(co_await ehlo_impl({}));
                co_return ok();

            case tls_policy::opportunistic:
            {
                if (!supports_starttls())
                {
                    MAILWIRE_DEBUG("STARTTLS not offered, continuing in plaintext.");
                    co_return ok();
                }
                auto upgraded = co_await start_tls_impl();
                if (upgraded)
                {
                    MAILWIRE_CO_TRY_VOID(co_await ehlo_impl({}));
                    co_return ok();
                }
                MAILWIRE_LOGF(mailwire::log::level::warn, "STARTTLS failed, continuing in plaintext: {}",
                    upgraded.error().to_string());
                if (dialog_.has_value())
                    co_return ok();

                // The handshake consumed the connection: dial again without TLS.
                MAILWIRE_CO_TRY_VOID(co_await connect_impl());
                MAILWIRE_CO_TRY_VOID(co_await read_greeting_impl());
                MAILWIRE_CO_TRY_VOID(co_await ehlo_impl({}));
                co_return ok();
            }
        }
        co_return ok();
    }

    awaitable<result<void>> dial_impl()
    {
        if (dialog_.has_value())
            co_return fail(errc::invalid_state, "Connection is already established.");
        auto res = co_await dial_steps();
        if (!res)
            close_transport();
        co_return res;
    }

    awaitable<result<void>> dial_steps()
    {
        MAILWIRE_CO_TRY_VOID(co_await connect_impl());
        MAILWIRE_CO_TRY_VOID(co_await read_greeting_impl());
        MAILWIRE_CO_TRY_VOID(co_await ehlo_impl({}));
        MAILWIRE_CO_TRY_VOID(co_await apply_tls_policy());
        if (options_.credentials.has_password() || options_.credentials.has_token())
            MAILWIRE_CO_TRY_VOID(co_await authenticate_impl());
        co_return ok();
    }

    // ==================== Authentication ====================

    result<sasl::mechanism> resolve_mechanism()
    {
        const std::vector<std::string> offered = capabilities_.auth_mechanisms();
        if (offered.empty())
            return fail<sasl::mechanism>(errc::smtp_auth_unsupported, "AUTH not supported.",
                "server did not advertise AUTH");

        if (options_.mechanism.has_value())
        {
            const std::string_view wanted = sasl::mechanism_name(*options_.mechanism);
            for (const auto& name : offered)
                if (mailwire::detail::iequals_ascii(name, wanted))
                    return *options_.mechanism;
            return fail<sasl::mechanism>(errc::smtp_auth_unsupported, "Authentication mechanism not advertised.",
                std::string(wanted));
        }

        const bool tls = is_tls();
        const bool binding = tls && dialog_->stream().channel_binding_data().has_value();
        auto selected = sasl::select_mechanism(offered, tls, binding, options_.credentials);
        if (!selected)
            return fail<sasl::mechanism>(errc::smtp_auth_unsupported, "No usable authentication mechanism.");
        return *selected;
    }

    result<void> ensure_auth_allowed(sasl::mechanism mech) const
    {
        if (!sasl::sends_cleartext(mech) || is_tls() || detail::is_localhost(options_.host))
            return ok();
        if (options_.allow_cleartext_auth)
        {
            MAILWIRE_WARN("AUTH without TLS allowed by configuration.");
            return ok();
        }
        return fail(errc::tls_required, "TLS required for authentication.", std::string(sasl::mechanism_name(mech)));
    }

    awaitable<result<void>> authenticate_impl()
    {
        if (state_ == state::authenticated)
            co_return fail(errc::invalid_state, "Already authenticated.");
        if (state_ != state::ehlo_done)
            co_return fail(errc::invalid_state, "Authentication requires EHLO.");
        if (!capabilities_known_)
            co_return fail(errc::smtp_auth_unsupported, "Server capabilities unknown, HELO servers do not support AUTH.");
        if (!options_.credentials.has_password() && !options_.credentials.has_token())
            co_return fail(errc::invalid_argument, "No credentials configured.");
        MAILWIRE_CO_TRY_VOID(mailwire::detail::ensure_no_crlf_or_nul(options_.credentials.username, "username"));

        sasl::mechanism mech{};
        MAILWIRE_CO_TRY_ASSIGN(mech, resolve_mechanism());
        MAILWIRE_CO_TRY_VOID(ensure_auth_allowed(mech));

        sasl::session_options session_opts;
        session_opts.host = server_name();
        if (sasl::is_plus(mech))
            MAILWIRE_CO_TRY_ASSIGN(session_opts.binding, dialog_->stream().channel_binding_data());

        auto created = sasl::make_session(mech, options_.credentials, std::move(session_opts));
        if (!created)
            co_return std::unexpected(std::move(created).error());
        sasl::session& session = *created;

        std::optional<std::string> initial;
        MAILWIRE_CO_TRY_ASSIGN(initial, session.start());

        std::string line = "AUTH " + std::string(session.name());
        if (initial.has_value())
            line += initial->empty() ? std::string(" =") : " " + codec::base64_encode(*initial);

        MAILWIRE_LOGF(mailwire::log::level::debug, "SMTP authenticating with {}", session.name());
        reply rep;
        MAILWIRE_CO_TRY_ASSIGN(rep, co_await command_impl(command_kind::auth, line));
        while (true)
        {
            result<std::optional<std::string>> step = std::optional<std::string>{};
            if (rep.status == 334)
            {
                auto challenge = codec::base64_decode(rep.message());
                if (!challenge)
                    step = fail<std::optional<std::string>>(errc::sasl_bad_challenge, "Invalid base64 in the server challenge.");
                else
                    step = session.next(*challenge, true);
            }
            else if (rep.status == 235)
                step = session.next(rep.message(), false);
            else
                co_return std::unexpected(error_from_reply(command_kind::auth, rep, "Authentication rejected.",
                    reply_detail(command_kind::auth, "AUTH " + std::string(session.name()), rep).str()));

            if (!step)
            {
                if (rep.status == 334 && session.cancels_on_error())
                {
                    auto cancelled = co_await command_impl(command_kind::auth, "*");
                    if (!cancelled)
                        MAILWIRE_LOGF(mailwire::log::level::debug, "SMTP AUTH cancellation failed: {}",
                            cancelled.error().to_string());
                }
                co_return std::unexpected(std::move(step).error());
            }
            if (!step->has_value())
                break;
            MAILWIRE_CO_TRY_ASSIGN(rep, co_await command_impl(command_kind::auth, codec::base64_encode(**step)));
        }

        if (rep.status != 235)
            co_return std::unexpected(error_from_reply(command_kind::auth, rep, "Authentication did not complete.",
                reply_detail(command_kind::auth, {}, rep).str()));
        state_ = state::authenticated;
        auth_mechanism_ = mech;
        co_return ok();
    }

    // ==================== Transactions ====================

    /**
    Making sure the connection can take a transaction: reconnecting after the idle timeout,
    checking liveness with NOOP and dialing again when allowed.
    **/
    awaitable<result<void>> check_connection_impl()
    {
        if (dialog_.has_value() && options_.idle_timeout.has_value()
            && std::chrono::steady_clock::now() - last_activity_ > *options_.idle_timeout)
        {
            MAILWIRE_DEBUG("SMTP connection idle for too long, reconnecting.");
            auto closed = co_await close_impl();
            if (!closed)
                MAILWIRE_LOGF(mailwire::log::level::debug, "SMTP close of idle connection failed: {}", closed.error().to_string());
        }

        if (dialog_.has_value())
        {
            auto rep = co_await command_impl(command_kind::noop, "NOOP");
            if (rep && rep->is_positive_completion())
                co_return ok();
            error_info err = rep ? error_from_reply(command_kind::noop, *rep, "Connection check failed.")
                : std::move(rep).error();
            close_transport();
            if (!options_.auto_reconnect)
                co_return std::unexpected(std::move(err));
            MAILWIRE_LOGF(mailwire::log::level::debug, "SMTP connection check failed, reconnecting: {}", err.to_string());
        }
        else if (!options_.auto_reconnect)
            co_return fail(errc::invalid_state, "Connection is not established.");

        co_return co_await dial_impl();
    }

    static error_info record_failure(mime::message& msg, mime::send_error_reason reason, std::vector<error_info> errors,
        std::vector<std::string> affected, std::vector<mime::recipient_failure> rejected = {})
    {
        mime::send_error err(reason, std::move(errors), std::move(affected));
        error_info out = err.to_error_info();
        msg.record_delivery(mime::delivery_state::failed, std::move(err), std::move(rejected));
        return out;
    }

    /// RSET after a failed step, the connection is dropped when even that fails.
    awaitable<void> abort_transaction()
    {
        if (!dialog_.has_value())
            co_return;
        auto rep = co_await command_impl(command_kind::rset, "RSET");
        if (!rep || !rep->is_positive_completion())
        {
            MAILWIRE_DEBUG("SMTP RSET after a failed transaction did not succeed, closing the connection.");
            close_transport();
        }
    }

    detail::mail_extension_flags mail_flags(const mime::message& msg, std::string_view from,
        const std::vector<std::string>& recipients, std::size_t payload_size) const
    {
        detail::mail_extension_flags flags;
        // Declared whenever the server takes it; an 8bit body without it is refused earlier.
        flags.body_8bitmime = (options_.use_8bitmime || msg.encoding() == mime::transfer_encoding::eight_bit)
            && supports_8bitmime();

        if (supports_smtputf8())
        {
            switch (options_.smtputf8)
            {
                case smtputf8_mode::never:
                    break;
                case smtputf8_mode::when_advertised:
                    flags.smtputf8 = true;
                    break;
                case smtputf8_mode::when_needed:
                {
                    bool needed = !mailwire::detail::is_ascii(from);
                    for (const auto& rcpt : recipients)
                        needed = needed || !mailwire::detail::is_ascii(rcpt);
                    flags.smtputf8 = needed;
                    break;
                }
            }
        }

        if (options_.use_size_extension && capabilities_known_ && capabilities_.supports("SIZE"))
            flags.size = payload_size;

        if (options_.dsn.ret != dsn_ret::none || !options_.dsn.envid.empty())
        {
            if (supports_dsn())
            {
                flags.ret = options_.dsn.ret_string();
                flags.envid = options_.dsn.envid;
            }
            else
                MAILWIRE_DEBUG("DSN requested but not advertised, RET and ENVID are not sent.");
        }
        return flags;
    }

    awaitable<result<void>> send_one_impl(mime::message& msg)
    {
        auto checked = co_await check_connection_impl();
        if (!checked)
            co_return std::unexpected(record_failure(msg, mime::send_error_reason::conn_check, {checked.error()}, {}));
        co_return co_await transaction_impl(msg);
    }

    awaitable<result<void>> send_batch_impl(std::span<mime::message> batch)
    {
        std::vector<error_info> failures;
        for (auto& msg : batch)
        {
            auto sent = co_await send_one_impl(msg);
            if (!sent)
                failures.push_back(std::move(sent).error());
        }
        if (failures.empty())
            co_return ok();
        if (failures.size() == 1)
            co_return std::unexpected(std::move(failures.front()));

        error_info err;
        err.code = errc::smtp_batch_failed;
        err.message = std::format("{} of {} messages failed: {}", failures.size(), batch.size(),
            mime::to_string(mime::send_error_reason::ambiguous));
        mailwire::detail::error_detail info;
        for (std::size_t i = 0; i < failures.size(); ++i)
            info.add("error" + std::to_string(i), failures[i].to_string());
        err.detail = info.str();
        co_return std::unexpected(std::move(err));
    }

    awaitable<result<void>> transaction_impl(mime::message& msg)
    {
        if (msg.encoding() == mime::transfer_encoding::eight_bit && !supports_8bitmime())
            co_return std::unexpected(record_failure(msg, mime::send_error_reason::no_unencoded,
                {error_info{errc::invalid_argument, "Server does not support 8BITMIME.", {}, {}, 0}}, {}));

        auto sender = msg.get_sender(false);
        if (!sender)
            co_return std::unexpected(record_failure(msg, mime::send_error_reason::get_sender, {sender.error()}, {}));
        auto recipients = msg.get_recipients();
        if (!recipients)
            co_return std::unexpected(record_failure(msg, mime::send_error_reason::get_recipients, {recipients.error()}, {}));

        auto payload = msg.to_string();
        if (!payload)
            co_return std::unexpected(record_failure(msg, mime::send_error_reason::write_content, {payload.error()},
                *recipients));

        // MAIL FROM
        auto mail_cmd = detail::build_mail_from_command(*sender, mail_flags(msg, *sender, *recipients, payload->size()));
        if (!mail_cmd)
            co_return std::unexpected(record_failure(msg, mime::send_error_reason::mail_from, {mail_cmd.error()}, *recipients));
        auto mail_rep = co_await command_impl(command_kind::mail_from, *mail_cmd);
        if (!mail_rep || !mail_rep->is_positive_completion())
        {
            error_info err = mail_rep ? error_from_reply(command_kind::mail_from, *mail_rep, "Mail sender rejected.",
                reply_detail(command_kind::mail_from, *mail_cmd, *mail_rep).str()) : std::move(mail_rep).error();
            co_return std::unexpected(co_await fail_transaction(msg, mime::send_error_reason::mail_from, std::move(err),
                *recipients));
        }

        // RCPT TO
        const std::string notify = supports_dsn() ? options_.dsn.notify_string() : std::string{};
        std::vector<mime::recipient_failure> rejected;
        std::vector<std::string> accepted;
        for (const auto& rcpt : *recipients)
        {
            auto rcpt_cmd = detail::build_rcpt_to_command(rcpt, notify);
            if (!rcpt_cmd)
            {
                rejected.push_back({rcpt, rcpt_cmd.error()});
                continue;
            }
            auto rcpt_rep = co_await command_impl(command_kind::rcpt_to, *rcpt_cmd);
            if (!rcpt_rep)
                co_return std::unexpected(co_await fail_transaction(msg, mime::send_error_reason::rcpt_to,
                    std::move(rcpt_rep).error(), *recipients));
            if (rcpt_rep->is_positive_completion())
                accepted.push_back(rcpt);
            else
                rejected.push_back({rcpt, error_from_reply(command_kind::rcpt_to, *rcpt_rep, "Recipient rejected.",
                    reply_detail(command_kind::rcpt_to, *rcpt_cmd, *rcpt_rep).str())});
        }

        if (!rejected.empty() && (options_.recipients == rcpt_policy::strict || accepted.empty()))
        {
            std::vector<error_info> errors;
            std::vector<std::string> affected;
            for (const auto& failure : rejected)
            {
                errors.push_back(failure.error);
                affected.push_back(failure.address);
            }
            error_info out = record_failure(msg, mime::send_error_reason::rcpt_to, std::move(errors), std::move(affected),
                rejected);
            co_await abort_transaction();
            co_return std::unexpected(std::move(out));
        }

        // DATA
        auto data_rep = co_await command_impl(command_kind::data_cmd, "DATA");
        if (!data_rep || data_rep->status != 354)
        {
            error_info err = data_rep ? error_from_reply(command_kind::data_cmd, *data_rep, "DATA rejected.",
                reply_detail(command_kind::data_cmd, "DATA", *data_rep).str()) : std::move(data_rep).error();
            co_return std::unexpected(co_await fail_transaction(msg, mime::send_error_reason::data, std::move(err), accepted));
        }

        dialog_->trace_payload(payload->size());
        detail::data_framer framer(*payload);
        result<void> written = ok();
        while (written && !framer.done())
        {
            written = co_await dialog_->write_raw(framer.next_chunk(detail::DATA_CHUNK_SIZE));
            if (written)
                last_activity_ = std::chrono::steady_clock::now();
        }
        if (!written)
        {
            error_info out = record_failure(msg, mime::send_error_reason::write_content, {written.error()}, accepted);
            close_transport();
            co_return std::unexpected(std::move(out));
        }

        auto final_rep = co_await read_reply_impl();
        if (!final_rep || !final_rep->is_positive_completion())
        {
            error_info err = final_rep ? error_from_reply(command_kind::data_body, *final_rep, "Message rejected.",
                reply_detail(command_kind::data_body, {}, *final_rep).str()) : std::move(final_rep).error();
            co_return std::unexpected(co_await fail_transaction(msg, mime::send_error_reason::data_close, std::move(err),
                accepted));
        }

        if (rejected.empty())
            msg.record_delivery(mime::delivery_state::delivered);
        else
        {
            std::vector<error_info> errors;
            std::vector<std::string> affected;
            for (const auto& failure : rejected)
            {
                errors.push_back(failure.error);
                affected.push_back(failure.address);
            }
            MAILWIRE_LOGF(mailwire::log::level::info, "SMTP message delivered to {} of {} recipients", accepted.size(),
                recipients->size());
            msg.record_delivery(mime::delivery_state::partially_delivered,
                mime::send_error(mime::send_error_reason::rcpt_to, std::move(errors), std::move(affected)), std::move(rejected));
        }

        auto reset_rep = co_await command_impl(command_kind::rset, "RSET");
        if (!reset_rep)
        {
            close_transport();
            co_return std::unexpected(std::move(reset_rep).error());
        }
        if (!reset_rep->is_positive_completion())
            co_return std::unexpected(error_from_reply(command_kind::rset, *reset_rep, "RSET after delivery failed.",
                reply_detail(command_kind::rset, "RSET", *reset_rep).str()));
        co_return ok();
    }

    /**
    Recording a failed step, then resetting the transaction or dropping a broken connection.
    **/
    awaitable<error_info> fail_transaction(mime::message& msg, mime::send_error_reason reason, error_info err,
        std::vector<std::string> affected)
    {
        const bool broken = detail::breaks_connection(err);
        error_info out = record_failure(msg, reason, {std::move(err)}, std::move(affected));
        if (broken)
            close_transport();
        else
            co_await abort_transaction();
        co_return out;
    }

    // ==================== Wire helpers ====================

    awaitable<result<reply>> simple_command_impl(command_kind k, std::string_view line)
    {
        if (!dialog_.has_value())
            co_return fail<reply>(errc::invalid_state, "Connection is not established.");
        reply rep;
        MAILWIRE_CO_TRY_ASSIGN(rep, co_await command_impl(k, line));
        if (!rep.is_positive_completion())
            co_return std::unexpected(error_from_reply(k, rep, std::string(command_name(k)) + " failed.",
                reply_detail(k, line, rep).str()));
        co_return rep;
    }

    awaitable<result<reply>> command_impl(command_kind k, std::string_view line)
    {
        if (!dialog_.has_value())
            co_return fail<reply>(errc::invalid_state, "Connection is not established.");
        auto written = co_await dialog_->write_line(line);
        if (!written)
        {
            MAILWIRE_LOGF(mailwire::log::level::debug, "SMTP {} write failed", command_name(k));
            co_return std::unexpected(std::move(written).error());
        }
        co_return co_await read_reply_impl();
    }

    /**
    Reading a possibly multi-line reply; every line must carry the same code.
    **/
    awaitable<result<reply>> read_reply_impl()
    {
        if (!dialog_.has_value())
            co_return fail<reply>(errc::invalid_state, "Connection is not established.");
        reply rep;
        while (true)
        {
            std::string line;
            MAILWIRE_CO_TRY_ASSIGN(line, co_await dialog_->read_line());
            if (line.size() < 3 || !mailwire::detail::is_ascii_digit(line[0]) || !mailwire::detail::is_ascii_digit(line[1])
                || !mailwire::detail::is_ascii_digit(line[2]))
                co_return fail<reply>(errc::smtp_bad_reply, "Parsing server failure.", line);
            const int code = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
            bool last = true;
            if (line.size() >= 4)
            {
                if (line[3] == '-')
                    last = false;
                else if (line[3] != ' ')
                    co_return fail<reply>(errc::smtp_bad_reply, "Parsing server failure.", line);
            }
            if (rep.status == 0)
                rep.status = code;
            else if (rep.status != code)
                co_return fail<reply>(errc::smtp_bad_reply, "Inconsistent reply codes in a multi-line reply.", line);
            rep.lines.push_back(line.size() > 4 ? line.substr(4) : std::string{});
            if (last)
                break;
        }
        last_activity_ = std::chrono::steady_clock::now();
        co_return rep;
    }

    static std::string default_hostname()
    {
        mailwire::asio::error_code ec;
        std::string name = ip::host_name(ec);
        if (ec || name.empty())
            return "localhost";
        return name;
    }

    /// The first line names the server; every other line is an extension keyword with parameters.
    void parse_capabilities(const reply& rep)
    {
        capabilities_.entries.clear();
        for (std::size_t i = 1; i < rep.lines.size(); ++i)
        {
            std::string_view rest = mailwire::detail::trim_view(rep.lines[i]);
            if (rest.empty())
                continue;
            auto space_pos = rest.find(' ');
            std::string key = mailwire::detail::to_upper_copy(rest.substr(0, space_pos));
            std::vector<std::string> params;
            // Obsolete form `AUTH=LOGIN PLAIN`.
            if (key.starts_with("AUTH="))
            {
                params.push_back(key.substr(5));
                key = "AUTH=";
            }
            rest = space_pos == std::string_view::npos ? std::string_view{} : rest.substr(space_pos + 1);
            while (!rest.empty())
            {
                space_pos = rest.find(' ');
                const std::string_view token = rest.substr(0, space_pos);
                if (!token.empty())
                    params.emplace_back(token);
                rest = space_pos == std::string_view::npos ? std::string_view{} : rest.substr(space_pos + 1);
            }
            auto& slot = capabilities_.entries[key];
            slot.insert(slot.end(), params.begin(), params.end());
        }
    }

    executor_type executor_;
    options options_;
    mailwire::detail::async_mutex mutex_;
    std::shared_ptr<ssl::context> tls_context_;
    std::optional<dialog_type> dialog_;
    capabilities capabilities_;
    state state_{state::disconnected};
    bool capabilities_known_{false};
    std::optional<sasl::mechanism> auth_mechanism_;
    std::chrono::steady_clock::time_point last_activity_{};
};


/**
Sending a plain text message in one call: a connection is dialed, used for the message and
closed.

@return The delivered message, carrying its headers and delivery outcome.
**/
inline awaitable<result<mime::message>> quick_send(any_io_executor executor, options opts, std::string_view from,
    const std::vector<std::string>& recipients, std::string_view subject, std::string body)
{
    mime::message msg;
    MAILWIRE_CO_TRY_VOID(msg.set_from(from));
    for (const auto& rcpt : recipients)
        MAILWIRE_CO_TRY_VOID(msg.add_to(rcpt));
    msg.set_subject(subject);
    msg.set_body("text/plain", std::move(body));

    client conn(executor, std::move(opts));
    MAILWIRE_CO_TRY_VOID(co_await conn.dial_and_send(std::span<mime::message>(&msg, 1)));
    co_return std::move(msg);
}

} // namespace mailwire::smtp
