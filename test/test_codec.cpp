/*

test_codec.cpp
--------------

Base64, quoted-printable and encoded-word codecs.

*/

#define BOOST_TEST_MODULE codec_test

#include <boost/test/unit_test.hpp>
#include <mailwire/codec/base64.hpp>
#include <mailwire/codec/base64_stream.hpp>
#include <mailwire/codec/quoted_printable.hpp>
#include <mailwire/codec/word_encoder.hpp>
#include <mailwire/detail/output_sink.hpp>
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

using namespace mailwire;

namespace
{

std::string sample_bytes(std::size_t size)
{
    std::string out(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<char>((i * 131 + 7) & 0xFF);
    return out;
}

/// Body encoding as the writer does it: base64 chunks folded at 76 columns.
std::string encode_streaming(std::string_view input)
{
    std::string out;
    detail::string_sink sink(out);
    codec::base64_line_breaker breaker(sink);
    codec::base64_stream_encoder enc(breaker);

    // Chunk the input to cover the incremental paths.
    const std::vector<std::size_t> chunks{5, 7, 13, 29};
    std::size_t offset = 0;
    for (std::size_t chunk : chunks)
    {
        if (offset >= input.size())
            break;
        const std::size_t len = std::min(chunk, input.size() - offset);
        BOOST_REQUIRE(enc.write(input.substr(offset, len)));
        offset += len;
    }
    if (offset < input.size())
        BOOST_REQUIRE(enc.write(input.substr(offset)));
    BOOST_REQUIRE(enc.close());
    BOOST_REQUIRE(breaker.close());
    return out;
}

std::vector<std::string> split_crlf(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const auto end = text.find("\r\n", pos);
        BOOST_REQUIRE(end != std::string_view::npos);
        lines.emplace_back(text.substr(pos, end - pos));
        pos = end + 2;
    }
    return lines;
}

} // namespace


BOOST_AUTO_TEST_CASE(base64_known_vectors)
{
    BOOST_TEST(codec::base64_encode("") == "");
    BOOST_TEST(codec::base64_encode("f") == "Zg==");
    BOOST_TEST(codec::base64_encode("fo") == "Zm8=");
    BOOST_TEST(codec::base64_encode("foo") == "Zm9v");
    BOOST_TEST(codec::base64_encode("foobar") == "Zm9vYmFy");
    BOOST_TEST(*codec::base64_decode("Zm9vYmE=") == "fooba");
}

BOOST_AUTO_TEST_CASE(base64_round_trip_at_line_boundaries)
{
    for (std::size_t size : {0u, 1u, 75u, 76u, 77u, 10000u})
    {
        const std::string data = sample_bytes(size);
        const std::string folded = encode_streaming(data);

        for (const auto& line : split_crlf(folded))
            BOOST_TEST(line.size() <= 76u);
        BOOST_TEST((folded.empty() || folded.ends_with("\r\n")));

        auto decoded = codec::base64_decode(folded);
        BOOST_REQUIRE(decoded);
        BOOST_TEST(*decoded == data);
    }
}

BOOST_AUTO_TEST_CASE(base64_stream_matches_single_shot)
{
    const std::string data = sample_bytes(57 * 3 + 11);
    std::string unfolded = encode_streaming(data);
    unfolded.erase(std::remove(unfolded.begin(), unfolded.end(), '\r'), unfolded.end());
    unfolded.erase(std::remove(unfolded.begin(), unfolded.end(), '\n'), unfolded.end());
    BOOST_TEST(unfolded == codec::base64_encode(data));
}

BOOST_AUTO_TEST_CASE(base64_decode_rejects_garbage)
{
    BOOST_TEST(!codec::base64_decode("Zm9v!"));
    BOOST_TEST(!codec::base64_decode("Zm9"));
    BOOST_TEST(!codec::base64_decode("Zg==Zg=="));
    auto res = codec::base64_decode("Zm9v*");
    BOOST_REQUIRE(!res);
    BOOST_TEST(static_cast<int>(res.error().code) == static_cast<int>(errc::codec_invalid_input));
}

BOOST_AUTO_TEST_CASE(quoted_printable_escapes)
{
    BOOST_TEST(*codec::quoted_printable_encode("a=b") == "a=3Db");
    BOOST_TEST(*codec::quoted_printable_encode("caf\xC3\xA9") == "caf=C3=A9");
    BOOST_TEST(*codec::quoted_printable_encode("Hello\r\nWorld") == "Hello\r\nWorld");
}

BOOST_AUTO_TEST_CASE(quoted_printable_line_breaks_normalized)
{
    BOOST_TEST(*codec::quoted_printable_encode("one\ntwo\rthree") == "one\r\ntwo\r\nthree");
}

BOOST_AUTO_TEST_CASE(quoted_printable_trailing_whitespace)
{
    BOOST_TEST(*codec::quoted_printable_encode("x \r\ny") == "x=20\r\ny");
    BOOST_TEST(*codec::quoted_printable_encode("tab\t") == "tab=09");
}

BOOST_AUTO_TEST_CASE(quoted_printable_soft_breaks)
{
    const std::string text(100, 'a');
    const std::string encoded = *codec::quoted_printable_encode(text);
    BOOST_TEST(encoded == std::string(75, 'a') + "=\r\n" + std::string(25, 'a'));

    // An escape is never split by a soft break.
    const std::string accents = std::string(74, 'b') + "\xC3\xA9";
    const std::string enc2 = *codec::quoted_printable_encode(accents);
    for (const auto& line : split_crlf(enc2 + "\r\n"))
        BOOST_TEST(line.size() <= 76u);
    BOOST_TEST(enc2.ends_with("=C3=A9"));
}

BOOST_AUTO_TEST_CASE(word_encoder_leaves_ascii_alone)
{
    codec::word_encoder enc;
    BOOST_TEST(enc.encode("Hello, World!") == "Hello, World!");
}

BOOST_AUTO_TEST_CASE(word_encoder_q_and_b)
{
    codec::word_encoder q;
    BOOST_TEST(q.encode("Gr\xC3\xBC\xC3\x9F" "e aus") == "=?UTF-8?q?Gr=C3=BC=C3=9Fe_aus?=");

    codec::word_encoder b(codec::word_encoding::b);
    BOOST_TEST(b.encode("\xC3\xA9t\xC3\xA9") == "=?UTF-8?b?w6l0w6k=?=");
}

BOOST_AUTO_TEST_CASE(word_encoder_splits_long_values)
{
    std::string value;
    for (int i = 0; i < 40; ++i)
        value += "\xC3\xA9";
    codec::word_encoder q;
    const std::string encoded = q.encode(value);

    std::size_t words = 0;
    std::size_t pos = 0;
    while (pos < encoded.size())
    {
        auto end = encoded.find(' ', pos);
        if (end == std::string::npos)
            end = encoded.size();
        const std::string word = encoded.substr(pos, end - pos);
        BOOST_TEST(word.size() <= codec::MAX_ENCODED_WORD_LENGTH);
        BOOST_TEST(word.starts_with("=?UTF-8?q?"));
        BOOST_TEST(word.ends_with("?="));
        ++words;
        pos = end + 1;
    }
    BOOST_TEST(words > 1u);
    BOOST_TEST(codec::decode_header_words(encoded) == value);
}

BOOST_AUTO_TEST_CASE(decode_header_words_mixed)
{
    BOOST_TEST(codec::decode_header_words("=?UTF-8?Q?Caf=C3=A9?= =?UTF-8?B?w6k=?= ok") == "Caf\xC3\xA9\xC3\xA9 ok");
    BOOST_TEST(codec::decode_header_words("=?ISO-8859-1?Q?caf=E9?=") == "caf\xC3\xA9");
    BOOST_TEST(codec::decode_header_words("plain text") == "plain text");
    BOOST_TEST(codec::decode_header_words("=?KOI8-R?Q?x?=") == "=?KOI8-R?Q?x?=");
}
