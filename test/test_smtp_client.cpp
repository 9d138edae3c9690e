/*

test_smtp_client.cpp
--------------------

Drives smtp::client against a scripted server on localhost: plaintext and STARTTLS sessions,
authentication, recipient policies, batches, reconnects and DATA framing.

*/

#define BOOST_TEST_MODULE smtp_client_test

#include <atomic>
#include <cctype>
#include <chrono>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/test/unit_test.hpp>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <mailwire/codec/base64.hpp>
#include <mailwire/mime/message.hpp>
#include <mailwire/smtp/client.hpp>

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;
using mailwire::errc;
using mailwire::mime::delivery_state;
using mailwire::mime::message;
using mailwire::smtp::client;

namespace
{

/// Replies of the scripted server.
struct server_script
{
    std::vector<std::string> extensions{"8BITMIME", "SMTPUTF8", "AUTH PLAIN LOGIN"};
    bool reject_ehlo = false;
    bool offer_starttls = false;
    bool reject_auth = false;
    std::set<std::string> rejected_recipients;
    std::string cram_challenge = "<1896.697170952@postoffice.reston.mci.net>";
};

/// What the server saw, in order.
struct server_log
{
    std::vector<std::string> commands;
    std::vector<std::string> bodies;
    /// Decoded SASL payloads: initial responses and continuation lines.
    std::vector<std::string> auth_payloads;
    int connections = 0;
    bool tls_established = false;
};

std::string upper(std::string_view text)
{
    std::string out(text);
    for (char& ch : out)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return out;
}

std::vector<std::string> split_words(std::string_view line)
{
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < line.size())
    {
        auto end = line.find(' ', pos);
        if (end == std::string_view::npos)
            end = line.size();
        if (end > pos)
            out.emplace_back(line.substr(pos, end - pos));
        pos = end + 1;
    }
    return out;
}

std::string decode(std::string_view text)
{
    auto decoded = mailwire::codec::base64_decode(text);
    return decoded ? *decoded : std::string("<invalid base64>");
}

template<typename Stream>
class line_channel
{
public:
    explicit line_channel(Stream& stream) : stream_(stream)
    {
    }

    bool read_line(std::string& line)
    {
        asio::error_code ec;
        asio::read_until(stream_, buffer_, "\r\n", ec);
        if (ec)
            return false;
        std::istream is(&buffer_);
        std::getline(is, line);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return true;
    }

    /// Reading the DATA payload up to the terminating dot, keeping the last line break.
    bool read_data(std::string& body)
    {
        asio::error_code ec;
        const std::size_t n = asio::read_until(stream_, buffer_, "\r\n.\r\n", ec);
        if (ec)
            return false;
        const auto begin = asio::buffers_begin(buffer_.data());
        body.assign(begin, begin + static_cast<std::ptrdiff_t>(n - 3));
        buffer_.consume(n);
        return true;
    }

    bool write(std::string_view text)
    {
        asio::error_code ec;
        asio::write(stream_, asio::buffer(text.data(), text.size()), ec);
        return !ec;
    }

private:
    Stream& stream_;
    asio::streambuf buffer_;
};


/**
Single threaded SMTP server answering from a script. Connections are served one after the
other until `stop()`.
**/
class fake_server
{
public:
    explicit fake_server(server_script script, ssl::context* tls = nullptr)
        : script_(std::move(script)),
          tls_(tls),
          acceptor_(ctx_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { run(); });
    }

    ~fake_server()
    {
        stop();
    }

    unsigned short port() const
    {
        return port_;
    }

    /// Waking the acceptor with a throwaway connection and waiting for the thread.
    void stop()
    {
        if (!thread_.joinable())
            return;
        stopping_ = true;
        asio::io_context wake_ctx;
        tcp::socket wake(wake_ctx);
        asio::error_code ec;
        wake.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_), ec);
        thread_.join();
    }

    server_log log() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

private:
    enum class session_end
    {
        closed,
        starttls
    };

    void run()
    {
        while (true)
        {
            tcp::socket socket(ctx_);
            asio::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_)
                return;
            handle(socket);
        }
    }

    void handle(tcp::socket& socket)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++log_.connections;
        }
        asio::error_code ec;
        asio::write(socket, asio::buffer(std::string("220 mx.example.test ESMTP ready\r\n")), ec);
        if (ec)
            return;
        if (serve(socket, false) != session_end::starttls || tls_ == nullptr)
            return;

        ssl::stream<tcp::socket&> tls_stream(socket, *tls_);
        tls_stream.handshake(ssl::stream_base::server, ec);
        if (ec)
            return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            log_.tls_established = true;
        }
        serve(tls_stream, true);
    }

    void record_command(const std::string& line)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.commands.push_back(line);
    }

    void record_auth(std::string payload)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.auth_payloads.push_back(std::move(payload));
    }

    template<typename Stream>
    session_end serve(Stream& stream, bool tls_active)
    {
        line_channel<Stream> chan(stream);
        std::string line;
        while (chan.read_line(line))
        {
            record_command(line);
            const auto words = split_words(line);
            const std::string verb = words.empty() ? std::string{} : upper(words.front());

            if (verb == "EHLO")
            {
                if (script_.reject_ehlo)
                {
                    chan.write("502 5.5.2 Error: command not recognized\r\n");
                    continue;
                }
                std::vector<std::string> extensions = script_.extensions;
                if (script_.offer_starttls && !tls_active && tls_ != nullptr)
                    extensions.push_back("STARTTLS");
                std::string reply = extensions.empty() ? "250 mx.example.test\r\n" : "250-mx.example.test\r\n";
                for (std::size_t i = 0; i < extensions.size(); ++i)
                    reply += (i + 1 == extensions.size() ? "250 " : "250-") + extensions[i] + "\r\n";
                chan.write(reply);
            }
            else if (verb == "HELO")
                chan.write("250 mx.example.test\r\n");
            else if (verb == "STARTTLS")
            {
                if (tls_active || tls_ == nullptr)
                {
                    chan.write("454 4.7.0 TLS not available\r\n");
                    continue;
                }
                chan.write("220 2.0.0 Ready to start TLS\r\n");
                return session_end::starttls;
            }
            else if (verb == "AUTH")
            {
                if (!authenticate(chan, words))
                    return session_end::closed;
            }
            else if (verb == "MAIL" || verb == "RSET" || verb == "NOOP")
                chan.write("250 2.0.0 Ok\r\n");
            else if (verb == "RCPT")
            {
                const auto open = line.find('<');
                const auto close = line.find('>');
                const std::string addr = open != std::string::npos && close != std::string::npos && close > open
                    ? line.substr(open + 1, close - open - 1) : std::string{};
                if (script_.rejected_recipients.contains(addr))
                    chan.write("550 5.1.1 <" + addr + ">: Recipient address rejected: User unknown\r\n");
                else
                    chan.write("250 2.1.5 Ok\r\n");
            }
            else if (verb == "DATA")
            {
                chan.write("354 End data with <CR><LF>.<CR><LF>\r\n");
                std::string body;
                if (!chan.read_data(body))
                    return session_end::closed;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    log_.bodies.push_back(std::move(body));
                }
                chan.write("250 2.0.0 Ok: queued as 4F2C81\r\n");
            }
            else if (verb == "QUIT")
            {
                chan.write("221 2.0.0 Bye\r\n");
                return session_end::closed;
            }
            else
                chan.write("500 5.5.2 Error: command not recognized\r\n");
        }
        return session_end::closed;
    }

    template<typename Stream>
    bool authenticate(line_channel<Stream>& chan, const std::vector<std::string>& words)
    {
        const std::string mech = words.size() > 1 ? upper(words[1]) : std::string{};
        std::string response;
        if (mech == "PLAIN")
        {
            if (words.size() > 2)
                response = words[2];
            else if (!chan.write("334 \r\n") || !chan.read_line(response))
                return false;
            record_auth(decode(response));
        }
        else if (mech == "LOGIN")
        {
            if (!chan.write("334 VXNlcm5hbWU6\r\n") || !chan.read_line(response))
                return false;
            record_auth(decode(response));
            if (!chan.write("334 UGFzc3dvcmQ6\r\n") || !chan.read_line(response))
                return false;
            record_auth(decode(response));
        }
        else if (mech == "CRAM-MD5")
        {
            if (!chan.write("334 " + mailwire::codec::base64_encode(script_.cram_challenge) + "\r\n")
                || !chan.read_line(response))
                return false;
            record_auth(decode(response));
        }
        else
            return chan.write("504 5.5.4 Unrecognized authentication type\r\n");

        if (script_.reject_auth)
            return chan.write("535 5.7.8 Error: authentication failed\r\n");
        return chan.write("235 2.7.0 Authentication successful\r\n");
    }

    server_script script_;
    ssl::context* tls_;
    asio::io_context ctx_;
    tcp::acceptor acceptor_;
    unsigned short port_{0};
    std::atomic<bool> stopping_{false};
    mutable std::mutex mutex_;
    server_log log_;
    std::thread thread_;
};


struct pkey_deleter
{
    void operator()(EVP_PKEY* key) const
    {
        EVP_PKEY_free(key);
    }
};

struct pkey_ctx_deleter
{
    void operator()(EVP_PKEY_CTX* ctx) const
    {
        EVP_PKEY_CTX_free(ctx);
    }
};

struct x509_deleter
{
    void operator()(X509* cert) const
    {
        X509_free(cert);
    }
};

/// Server context with a throwaway self-signed certificate.
std::unique_ptr<ssl::context> make_server_tls_context()
{
    std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter> key_ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    BOOST_REQUIRE(key_ctx);
    BOOST_REQUIRE(EVP_PKEY_keygen_init(key_ctx.get()) > 0);
    BOOST_REQUIRE(EVP_PKEY_CTX_set_rsa_keygen_bits(key_ctx.get(), 2048) > 0);
    EVP_PKEY* raw_key = nullptr;
    BOOST_REQUIRE(EVP_PKEY_keygen(key_ctx.get(), &raw_key) > 0);
    std::unique_ptr<EVP_PKEY, pkey_deleter> key(raw_key);

    std::unique_ptr<X509, x509_deleter> cert(X509_new());
    BOOST_REQUIRE(cert);
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    BOOST_REQUIRE(X509_set_pubkey(cert.get(), key.get()) == 1);
    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    BOOST_REQUIRE(X509_sign(cert.get(), key.get(), EVP_sha256()) > 0);

    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_server);
    BOOST_REQUIRE(SSL_CTX_use_certificate(ctx->native_handle(), cert.get()) == 1);
    BOOST_REQUIRE(SSL_CTX_use_PrivateKey(ctx->native_handle(), key.get()) == 1);
    return ctx;
}

mailwire::smtp::options local_options(unsigned short port)
{
    mailwire::smtp::options opts;
    opts.host = "127.0.0.1";
    opts.port = port;
    opts.tls_policy = mailwire::net::tls_policy::none;
    opts.helo_name = "client.example.test";
    opts.timeout = std::chrono::seconds(5);
    opts.connect_timeout = std::chrono::seconds(5);
    return opts;
}

message simple_message(std::vector<std::string> recipients, std::string body = "Hello there.\r\n")
{
    message msg;
    BOOST_REQUIRE(msg.set_from("alice@example.com"));
    for (const auto& rcpt : recipients)
        BOOST_REQUIRE(msg.add_to(rcpt));
    msg.set_subject("Greetings");
    msg.set_body("text/plain", std::move(body));
    return msg;
}

template<typename Body>
void run_client(Body body)
{
    asio::io_context ctx;
    auto done = asio::co_spawn(ctx, std::move(body), asio::use_future);
    ctx.run();
    done.get();
}

bool contains(const std::vector<std::string>& lines, std::string_view wanted)
{
    for (const auto& line : lines)
        if (line == wanted)
            return true;
    return false;
}

bool has_prefix(const std::vector<std::string>& lines, std::string_view prefix)
{
    for (const auto& line : lines)
        if (line.starts_with(prefix))
            return true;
    return false;
}

} // namespace


BOOST_AUTO_TEST_CASE(plaintext_session_delivers)
{
    fake_server server(server_script{});
    message msg = simple_message({"bob@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, local_options(server.port()));
        auto dialed = co_await cli.dial();
        BOOST_REQUIRE_MESSAGE(dialed, dialed ? std::string{} : dialed.error().to_string());
        BOOST_TEST(cli.supports_8bitmime());
        BOOST_TEST(!cli.is_tls());

        auto sent = co_await cli.send(msg);
        BOOST_REQUIRE_MESSAGE(sent, sent ? std::string{} : sent.error().to_string());
        BOOST_REQUIRE(co_await cli.close());
        BOOST_TEST(!cli.is_connected());
    });
    server.stop();

    const auto log = server.log();
    const std::vector<std::string> expected{
        "EHLO client.example.test",
        "NOOP",
        "MAIL FROM:<alice@example.com> BODY=8BITMIME SMTPUTF8",
        "RCPT TO:<bob@example.com>",
        "DATA",
        "RSET",
        "QUIT"};
    BOOST_TEST(log.commands == expected, boost::test_tools::per_element());
    BOOST_REQUIRE(log.bodies.size() == 1u);
    BOOST_TEST(log.bodies[0].find("Subject: Greetings\r\n") != std::string::npos);
    BOOST_TEST(log.bodies[0].find("Content-Transfer-Encoding: quoted-printable\r\n") != std::string::npos);
    BOOST_TEST(log.bodies[0].find("Bcc:") == std::string::npos);
    BOOST_TEST(msg.is_delivered());
    BOOST_TEST(!msg.has_send_error());
}

BOOST_AUTO_TEST_CASE(starttls_then_auth)
{
    auto tls = make_server_tls_context();
    server_script script;
    script.offer_starttls = true;
    script.extensions = {"8BITMIME", "SMTPUTF8", "AUTH PLAIN"};
    fake_server server(script, tls.get());
    message msg = simple_message({"bob@example.com"}, "Gr\xC3\xBC\xC3\x9F" "e aus Z\xC3\xBCrich\r\n");

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.tls_policy = mailwire::net::tls_policy::mandatory;
        opts.tls.verify = mailwire::net::verify_mode::none;
        opts.credentials.username = "alice";
        opts.credentials.password = "s3cret";
        client cli(co_await asio::this_coro::executor, opts);

        auto dialed = co_await cli.dial();
        BOOST_REQUIRE_MESSAGE(dialed, dialed ? std::string{} : dialed.error().to_string());
        BOOST_TEST(cli.is_tls());
        BOOST_TEST(cli.is_authenticated());
        BOOST_REQUIRE(cli.auth_mechanism());
        BOOST_TEST(static_cast<int>(*cli.auth_mechanism()) == static_cast<int>(mailwire::sasl::mechanism::plain));
        BOOST_TEST(!cli.supports_starttls());

        auto sent = co_await cli.send(msg);
        BOOST_REQUIRE_MESSAGE(sent, sent ? std::string{} : sent.error().to_string());
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_TEST(log.tls_established);
    BOOST_REQUIRE(log.commands.size() >= 4u);
    BOOST_TEST(log.commands[0] == "EHLO client.example.test");
    BOOST_TEST(log.commands[1] == "STARTTLS");
    BOOST_TEST(log.commands[2] == "EHLO client.example.test");
    BOOST_TEST(log.commands[3].starts_with("AUTH PLAIN "));
    BOOST_TEST(contains(log.commands, "MAIL FROM:<alice@example.com> BODY=8BITMIME SMTPUTF8"));
    BOOST_TEST(contains(log.commands, "RCPT TO:<bob@example.com>"));
    BOOST_REQUIRE(log.auth_payloads.size() == 1u);
    BOOST_TEST(log.auth_payloads[0] == std::string("\0alice\0s3cret", 13));
    BOOST_REQUIRE(log.bodies.size() == 1u);
    BOOST_TEST(log.bodies[0].find("Content-Transfer-Encoding: quoted-printable") != std::string::npos);
    BOOST_TEST(log.bodies[0].find("Gr=C3=BC=C3=9Fe aus Z=C3=BCrich") != std::string::npos);
    BOOST_TEST(msg.is_delivered());
}

BOOST_AUTO_TEST_CASE(mandatory_tls_without_starttls)
{
    fake_server server(server_script{});

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.tls_policy = mailwire::net::tls_policy::mandatory;
        client cli(co_await asio::this_coro::executor, opts);
        auto dialed = co_await cli.dial();
        BOOST_REQUIRE(!dialed);
        BOOST_TEST(static_cast<int>(dialed.error().code) == static_cast<int>(errc::tls_required));
        BOOST_TEST(!cli.is_connected());
    });
    server.stop();

    BOOST_TEST(!has_prefix(server.log().commands, "MAIL"));
}

BOOST_AUTO_TEST_CASE(opportunistic_tls_falls_back_to_plaintext)
{
    fake_server server(server_script{});
    message msg = simple_message({"bob@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.tls_policy = mailwire::net::tls_policy::opportunistic;
        client cli(co_await asio::this_coro::executor, opts);
        BOOST_REQUIRE(co_await cli.dial());
        BOOST_TEST(!cli.is_tls());
        BOOST_REQUIRE(co_await cli.send(msg));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    BOOST_TEST(!contains(server.log().commands, "STARTTLS"));
    BOOST_TEST(msg.is_delivered());
}

BOOST_AUTO_TEST_CASE(strict_policy_aborts_on_rejected_recipient)
{
    server_script script;
    script.rejected_recipients = {"nobody@example.com"};
    fake_server server(script);
    message msg = simple_message({"bob@example.com", "nobody@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, local_options(server.port()));
        BOOST_REQUIRE(co_await cli.dial());
        auto sent = co_await cli.send(msg);
        BOOST_REQUIRE(!sent);
        BOOST_TEST(static_cast<int>(sent.error().code) == static_cast<int>(errc::smtp_rejected_recipient));
        BOOST_TEST(sent.error().reply_code == 550);
        // The connection survives a rejected transaction.
        BOOST_TEST(cli.is_connected());
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_TEST(!contains(log.commands, "DATA"));
    BOOST_TEST(contains(log.commands, "RSET"));
    BOOST_TEST(log.bodies.empty());
    BOOST_TEST(static_cast<int>(msg.state()) == static_cast<int>(delivery_state::failed));
    BOOST_TEST(msg.has_send_error());
    BOOST_TEST(!msg.send_error_is_temp());
    BOOST_REQUIRE(msg.rejected_recipients().size() == 1u);
    BOOST_TEST(msg.rejected_recipients()[0].address == "nobody@example.com");
}

BOOST_AUTO_TEST_CASE(lenient_policy_delivers_partially)
{
    server_script script;
    script.rejected_recipients = {"nobody@example.com"};
    fake_server server(script);
    message msg = simple_message({"bob@example.com", "nobody@example.com", "carol@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.recipients = mailwire::smtp::rcpt_policy::lenient;
        client cli(co_await asio::this_coro::executor, opts);
        BOOST_REQUIRE(co_await cli.dial());
        auto sent = co_await cli.send(msg);
        BOOST_TEST(sent.has_value());
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_TEST(contains(log.commands, "DATA"));
    BOOST_REQUIRE(log.bodies.size() == 1u);
    BOOST_TEST(msg.is_partially_delivered());
    BOOST_TEST(!msg.is_delivered());
    BOOST_REQUIRE(msg.rejected_recipients().size() == 1u);
    BOOST_TEST(msg.rejected_recipients()[0].address == "nobody@example.com");
}

BOOST_AUTO_TEST_CASE(lenient_policy_with_every_recipient_rejected)
{
    server_script script;
    script.rejected_recipients = {"nobody@example.com"};
    fake_server server(script);
    message msg = simple_message({"nobody@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.recipients = mailwire::smtp::rcpt_policy::lenient;
        client cli(co_await asio::this_coro::executor, opts);
        BOOST_REQUIRE(co_await cli.dial());
        BOOST_TEST(!(co_await cli.send(msg)));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    BOOST_TEST(!contains(server.log().commands, "DATA"));
    BOOST_TEST(static_cast<int>(msg.state()) == static_cast<int>(delivery_state::failed));
}

BOOST_AUTO_TEST_CASE(batch_continues_after_a_failure)
{
    server_script script;
    script.rejected_recipients = {"nobody@example.com"};
    fake_server server(script);

    std::vector<message> batch;
    batch.push_back(simple_message({"bob@example.com"}));
    batch.push_back(simple_message({"nobody@example.com"}));
    batch.push_back(simple_message({"carol@example.com"}));

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, local_options(server.port()));
        BOOST_REQUIRE(co_await cli.dial());
        auto sent = co_await cli.send(std::span<message>(batch));
        BOOST_REQUIRE(!sent);
        // A single failure is reported as is.
        BOOST_TEST(static_cast<int>(sent.error().code) == static_cast<int>(errc::smtp_rejected_recipient));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_TEST(log.connections == 1);
    BOOST_TEST(log.bodies.size() == 2u);
    BOOST_TEST(batch[0].is_delivered());
    BOOST_TEST(static_cast<int>(batch[1].state()) == static_cast<int>(delivery_state::failed));
    BOOST_TEST(batch[2].is_delivered());
}

BOOST_AUTO_TEST_CASE(batch_with_several_failures)
{
    server_script script;
    script.rejected_recipients = {"nobody@example.com"};
    fake_server server(script);

    std::vector<message> batch;
    batch.push_back(simple_message({"nobody@example.com"}));
    batch.push_back(simple_message({"nobody@example.com"}));

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, local_options(server.port()));
        auto sent = co_await cli.dial_and_send(std::span<message>(batch));
        BOOST_REQUIRE(!sent);
        BOOST_TEST(static_cast<int>(sent.error().code) == static_cast<int>(errc::smtp_batch_failed));
        BOOST_TEST(!cli.is_connected());
    });
    server.stop();

    BOOST_TEST(contains(server.log().commands, "QUIT"));
}

BOOST_AUTO_TEST_CASE(send_dials_and_redials)
{
    fake_server server(server_script{});
    message first = simple_message({"bob@example.com"});
    message second = simple_message({"bob@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, local_options(server.port()));
        // Not connected yet: the send dials first.
        BOOST_REQUIRE(co_await cli.send(first));
        BOOST_TEST(cli.is_connected());
        BOOST_REQUIRE(co_await cli.close());
        BOOST_REQUIRE(co_await cli.send(second));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    BOOST_TEST(server.log().connections == 2);
    BOOST_TEST(first.is_delivered());
    BOOST_TEST(second.is_delivered());
}

BOOST_AUTO_TEST_CASE(send_without_reconnect_requires_connection)
{
    fake_server server(server_script{});
    message msg = simple_message({"bob@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.auto_reconnect = false;
        client cli(co_await asio::this_coro::executor, opts);
        auto sent = co_await cli.send(msg);
        BOOST_REQUIRE(!sent);
        BOOST_TEST(static_cast<int>(sent.error().code) == static_cast<int>(errc::invalid_state));
    });
    server.stop();

    BOOST_TEST(server.log().connections == 0);
    BOOST_TEST(static_cast<int>(msg.state()) == static_cast<int>(delivery_state::failed));
    BOOST_TEST(static_cast<int>(msg.last_send_error()->reason()) == static_cast<int>(mailwire::mime::send_error_reason::conn_check));
}

BOOST_AUTO_TEST_CASE(helo_fallback_without_extensions)
{
    server_script script;
    script.reject_ehlo = true;
    fake_server server(script);
    message msg = simple_message({"bob@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, local_options(server.port()));
        BOOST_REQUIRE(co_await cli.dial());
        BOOST_TEST(!cli.supports_8bitmime());
        BOOST_REQUIRE(co_await cli.send(msg));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_REQUIRE(log.commands.size() >= 2u);
    BOOST_TEST(log.commands[0] == "EHLO client.example.test");
    BOOST_TEST(log.commands[1] == "HELO client.example.test");
    BOOST_TEST(contains(log.commands, "MAIL FROM:<alice@example.com>"));
}

BOOST_AUTO_TEST_CASE(data_is_dot_stuffed)
{
    fake_server server(server_script{});
    message msg = simple_message({"bob@example.com"}, "Hello\r\n.hidden\r\n..two\r\nend\r\n");

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, local_options(server.port()));
        BOOST_REQUIRE(co_await cli.dial());
        BOOST_REQUIRE(co_await cli.send(msg));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_REQUIRE(log.bodies.size() == 1u);
    BOOST_TEST(log.bodies[0].find("\r\n..hidden\r\n...two\r\nend\r\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(cleartext_auth_refused_off_localhost)
{
    fake_server server(server_script{});
    const unsigned short port = server.port();

    auto opts = local_options(port);
    opts.host = "mail.example.test";
    opts.credentials.username = "alice";
    opts.credentials.password = "s3cret";
    opts.dial = [port](mailwire::asio::any_io_executor executor, std::string, std::string)
        -> mailwire::asio::awaitable<mailwire::result<tcp::socket>>
    {
        tcp::socket socket(executor);
        auto [ec] = co_await socket.async_connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port),
            mailwire::asio::use_nothrow_awaitable);
        if (ec)
            co_return mailwire::fail<tcp::socket>(errc::net_connect_failed, "Cannot reach the test server.");
        co_return std::move(socket);
    };

    run_client([&]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, opts);
        auto dialed = co_await cli.dial();
        BOOST_REQUIRE(!dialed);
        BOOST_TEST(static_cast<int>(dialed.error().code) == static_cast<int>(errc::tls_required));
    });

    run_client([&]() -> asio::awaitable<void>
    {
        auto allowed = opts;
        allowed.allow_cleartext_auth = true;
        client cli(co_await asio::this_coro::executor, allowed);
        auto dialed = co_await cli.dial();
        BOOST_REQUIRE_MESSAGE(dialed, dialed ? std::string{} : dialed.error().to_string());
        BOOST_TEST(static_cast<int>(*cli.auth_mechanism()) == static_cast<int>(mailwire::sasl::mechanism::login));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_TEST(log.connections == 2);
    const std::vector<std::string> expected{"alice", "s3cret"};
    BOOST_TEST(log.auth_payloads == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(cram_md5_preferred_over_plain)
{
    server_script script;
    script.extensions = {"AUTH PLAIN CRAM-MD5"};
    fake_server server(script);

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.credentials.username = "tim";
        opts.credentials.password = "tanstaaftanstaaf";
        client cli(co_await asio::this_coro::executor, opts);
        BOOST_REQUIRE(co_await cli.dial());
        BOOST_TEST(static_cast<int>(*cli.auth_mechanism()) == static_cast<int>(mailwire::sasl::mechanism::cram_md5));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_REQUIRE(log.auth_payloads.size() == 1u);
    BOOST_TEST(log.auth_payloads[0] == "tim b913a602c7eda7a495b4e6e7334d3890");
}

BOOST_AUTO_TEST_CASE(rejected_credentials)
{
    server_script script;
    script.reject_auth = true;
    fake_server server(script);

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.credentials.username = "alice";
        opts.credentials.password = "wrong";
        client cli(co_await asio::this_coro::executor, opts);
        auto dialed = co_await cli.dial();
        BOOST_REQUIRE(!dialed);
        BOOST_TEST(static_cast<int>(dialed.error().code) == static_cast<int>(errc::smtp_auth_failed));
        BOOST_TEST(dialed.error().reply_code == 535);
        BOOST_TEST(!cli.is_connected());
    });
    server.stop();

    BOOST_TEST(!has_prefix(server.log().commands, "MAIL"));
}

BOOST_AUTO_TEST_CASE(concurrent_sends_do_not_interleave)
{
    fake_server server(server_script{});
    message first = simple_message({"bob@example.com"}, "First.\r\n");
    message second = simple_message({"carol@example.com"}, "Second.\r\n");

    asio::io_context ctx;
    client cli(ctx, local_options(server.port()));
    int finished = 0;
    auto deliver = [&](message& msg) -> asio::awaitable<void>
    {
        auto sent = co_await cli.send(msg);
        BOOST_TEST(static_cast<bool>(sent));
        if (++finished == 2)
        {
            auto closed = co_await cli.close();
            BOOST_TEST(static_cast<bool>(closed));
        }
    };
    asio::co_spawn(ctx, deliver(first), asio::detached);
    asio::co_spawn(ctx, deliver(second), asio::detached);
    ctx.run();
    server.stop();

    const auto log = server.log();
    std::vector<std::string> transaction;
    for (const auto& line : log.commands)
    {
        const std::string verb = upper(line.substr(0, 4));
        if (verb == "MAIL" || verb == "RCPT" || verb == "DATA" || verb == "RSET")
            transaction.push_back(verb);
    }
    const std::vector<std::string> expected{"MAIL", "RCPT", "DATA", "RSET", "MAIL", "RCPT", "DATA", "RSET"};
    BOOST_TEST(transaction == expected, boost::test_tools::per_element());
    BOOST_TEST(log.connections == 1);
    BOOST_TEST(log.bodies.size() == 2u);
    BOOST_TEST(first.is_delivered());
    BOOST_TEST(second.is_delivered());
}

BOOST_AUTO_TEST_CASE(silent_server_times_out)
{
    // The kernel completes the handshake from the backlog; nothing ever answers.
    asio::io_context server_ctx;
    tcp::acceptor acceptor(server_ctx, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const unsigned short port = acceptor.local_endpoint().port();

    const auto started = std::chrono::steady_clock::now();
    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(port);
        opts.timeout = std::chrono::milliseconds(300);
        opts.connect_timeout = std::chrono::milliseconds(300);
        client cli(co_await asio::this_coro::executor, opts);
        auto dialed = co_await cli.dial();
        BOOST_REQUIRE(!dialed);
        BOOST_TEST(static_cast<int>(dialed.error().code) == static_cast<int>(errc::net_timeout));
        BOOST_TEST(mailwire::is_temporary(dialed.error()));
        BOOST_TEST(!cli.is_connected());
    });
    BOOST_TEST(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

BOOST_AUTO_TEST_CASE(idle_connection_is_redialed_without_noop)
{
    fake_server server(server_script{});
    message first = simple_message({"bob@example.com"});
    message second = simple_message({"bob@example.com"});

    run_client([&]() -> asio::awaitable<void>
    {
        auto opts = local_options(server.port());
        opts.idle_timeout = std::chrono::milliseconds(50);
        client cli(co_await asio::this_coro::executor, opts);
        BOOST_REQUIRE(co_await cli.send(first));
        asio::steady_timer pause(co_await asio::this_coro::executor, std::chrono::milliseconds(200));
        co_await pause.async_wait(asio::use_awaitable);
        BOOST_REQUIRE(co_await cli.send(second));
        BOOST_REQUIRE(co_await cli.close());
    });
    server.stop();

    const auto log = server.log();
    BOOST_TEST(log.connections == 2);
    BOOST_TEST(!has_prefix(log.commands, "NOOP"));
    BOOST_TEST(log.bodies.size() == 2u);
    BOOST_TEST(first.is_delivered());
    BOOST_TEST(second.is_delivered());
}

BOOST_AUTO_TEST_CASE(dsn_parameters_follow_the_extension)
{
    auto line_starting = [](const std::vector<std::string>& lines, std::string_view prefix)
    {
        for (const auto& line : lines)
            if (line.starts_with(prefix))
                return line;
        return std::string{};
    };

    auto deliver = [](unsigned short port)
    {
        message msg = simple_message({"bob@example.com"});
        run_client([&]() -> asio::awaitable<void>
        {
            auto opts = local_options(port);
            opts.dsn = mailwire::smtp::dsn_options::on_success_or_failure();
            opts.dsn.envid = "batch 1";
            client cli(co_await asio::this_coro::executor, opts);
            BOOST_REQUIRE(co_await cli.send(msg));
            BOOST_REQUIRE(co_await cli.close());
        });
        BOOST_TEST(msg.is_delivered());
    };

    server_script with_dsn;
    with_dsn.extensions = {"8BITMIME", "DSN"};
    fake_server dsn_server(with_dsn);
    deliver(dsn_server.port());
    dsn_server.stop();

    auto log = dsn_server.log();
    std::string mail = line_starting(log.commands, "MAIL FROM:");
    BOOST_TEST(mail.find(" RET=HDRS ENVID=batch+201") != std::string::npos);
    BOOST_TEST(line_starting(log.commands, "RCPT TO:") == "RCPT TO:<bob@example.com> NOTIFY=SUCCESS,FAILURE");

    fake_server plain_server(server_script{});
    deliver(plain_server.port());
    plain_server.stop();

    log = plain_server.log();
    mail = line_starting(log.commands, "MAIL FROM:");
    BOOST_REQUIRE(!mail.empty());
    BOOST_TEST(mail.find("RET=") == std::string::npos);
    BOOST_TEST(mail.find("ENVID=") == std::string::npos);
    BOOST_TEST(line_starting(log.commands, "RCPT TO:") == "RCPT TO:<bob@example.com>");
}

BOOST_AUTO_TEST_CASE(quick_send_delivers_and_closes)
{
    fake_server server(server_script{});

    mailwire::result<message> sent = mailwire::fail<message>(errc::internal_error, "not run");
    run_client([&]() -> asio::awaitable<void>
    {
        sent = co_await mailwire::smtp::quick_send(co_await asio::this_coro::executor, local_options(server.port()),
            "alice@example.com", {"bob@example.com", "carol@example.com"}, "Status", "All green.\r\n");
    });
    server.stop();

    BOOST_REQUIRE_MESSAGE(sent, sent ? std::string{} : sent.error().to_string());
    BOOST_TEST(sent->is_delivered());
    const auto log = server.log();
    BOOST_TEST(log.connections == 1);
    BOOST_TEST(contains(log.commands, "RCPT TO:<carol@example.com>"));
    BOOST_TEST(log.commands.back() == "QUIT");
    BOOST_REQUIRE(log.bodies.size() == 1u);
    BOOST_TEST(log.bodies[0].find("Subject: Status") != std::string::npos);
    BOOST_TEST(log.bodies[0].find("All green.") != std::string::npos);
}
