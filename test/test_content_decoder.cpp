#include "proxy/content_decoder.hpp"
#include "proxy/errors.hpp"

#include <gtest/gtest.h>
#include <zlib.h>

#include <stdexcept>

namespace {

std::string deflate_with(std::string_view input, int window_bits)
{
    z_stream z{};
    if (deflateInit2(&z, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2() failed");
    }

    std::string output(deflateBound(&z, input.size()) + 32, '\0');
    z.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    z.avail_in = static_cast<uInt>(input.size());
    z.next_out = reinterpret_cast<Bytef*>(output.data());
    z.avail_out = static_cast<uInt>(output.size());

    int err = deflate(&z, Z_FINISH);
    output.resize(output.size() - z.avail_out);
    deflateEnd(&z);
    if (err != Z_STREAM_END) {
        throw std::runtime_error("deflate() failed");
    }
    return output;
}

const std::string kHtml = "<html><body><a href=\"/x\">caf\xc3\xa9</a></body></html>";

} // namespace

TEST(ContentDecoder, Encodings)
{
    EXPECT_TRUE(is_identity_encoding(""));
    EXPECT_TRUE(is_identity_encoding(" identity "));
    EXPECT_TRUE(is_decodable_encoding("gzip"));
    EXPECT_TRUE(is_decodable_encoding("X-GZIP"));
    EXPECT_TRUE(is_decodable_encoding("deflate"));
    EXPECT_FALSE(is_decodable_encoding("br"));
    EXPECT_FALSE(is_decodable_encoding("gzip, br"));
}

TEST(ContentDecoder, Gzip)
{
    auto compressed = deflate_with(kHtml, MAX_WBITS + 16);
    EXPECT_EQ(decode_content(compressed, "gzip", 1 << 20), kHtml);
    EXPECT_EQ(decode_content(compressed, "x-gzip", 1 << 20), kHtml);
}

TEST(ContentDecoder, GzipMembersConcatenated)
{
    auto body = deflate_with("<html><body>", MAX_WBITS + 16) + deflate_with("</body></html>", MAX_WBITS + 16);
    EXPECT_EQ(decode_content(body, "gzip", 1 << 20), "<html><body></body></html>");

    // zero padding after the last member
    body += std::string(4, '\0');
    EXPECT_EQ(decode_content(body, "gzip", 1 << 20), "<html><body></body></html>");
}

TEST(ContentDecoder, DeflateZlibAndRaw)
{
    EXPECT_EQ(decode_content(deflate_with(kHtml, MAX_WBITS), "deflate", 1 << 20), kHtml);
    EXPECT_EQ(decode_content(deflate_with(kHtml, -MAX_WBITS), "deflate", 1 << 20), kHtml);
}

TEST(ContentDecoder, Identity)
{
    EXPECT_EQ(decode_content(kHtml, "identity", 1 << 20), kHtml);
}

TEST(ContentDecoder, Failures)
{
    auto compressed = deflate_with(kHtml, MAX_WBITS + 16);
    EXPECT_THROW(decode_content(compressed, "br", 1 << 20), RewriteError);
    EXPECT_THROW(decode_content(compressed.substr(0, compressed.size() / 2), "gzip", 1 << 20), RewriteError);
    EXPECT_THROW(decode_content("definitely not gzip", "gzip", 1 << 20), RewriteError);
    EXPECT_THROW(decode_content(compressed, "gzip", 8), RewriteError);
}
