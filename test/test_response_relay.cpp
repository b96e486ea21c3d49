#include "proxy/response_relay.hpp"

#include <gtest/gtest.h>

namespace {

RelayOptions make_options()
{
    RelayOptions options;
    options.rewrite.base = resolve_target("https://example.com/a/page.html");
    options.drop_headers = default_dropped_response_headers();
    return options;
}

} // namespace

TEST(ResponseRelay, CopiesStatusAndHeaders)
{
    UpstreamResponse upstream;
    upstream.status_code = 404;
    upstream.headers = {
        {"Content-Type", "text/plain"},
        {"Content-Length", "999"},
        {"Connection", "close"},
        {"Transfer-Encoding", "chunked"},
        {"Strict-Transport-Security", "max-age=31536000"},
        {"Cache-Control", "no-cache"},
    };
    upstream.content_type = "text/plain";

    auto response = relay(upstream, "missing", make_options());
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(response.body, "missing");

    HeaderList expected = {
        {"Content-Type", "text/plain"},
        {"Cache-Control", "no-cache"},
        {"Content-Length", "7"},
    };
    EXPECT_EQ(response.headers, expected);
}

TEST(ResponseRelay, ConnectionListedHeadersDropped)
{
    UpstreamResponse upstream;
    upstream.status_code = 200;
    upstream.headers = {
        {"Connection", "close, X-Backend-Hop"},
        {"X-Backend-Hop", "node-3"},
        {"X-Request-Id", "42"},
    };

    auto response = relay(upstream, "", make_options());
    EXPECT_EQ(find_header(response.headers, "x-backend-hop"), nullptr);
    ASSERT_NE(find_header(response.headers, "x-request-id"), nullptr);
}

TEST(ResponseRelay, RedirectLocationRewritten)
{
    UpstreamResponse upstream;
    upstream.status_code = 302;
    upstream.headers = {{"Location", "/login?next=%2F"}};

    auto response = relay(upstream, "", make_options());
    EXPECT_EQ(response.status_code, 302);
    ASSERT_NE(find_header(response.headers, "location"), nullptr);
    EXPECT_EQ(*find_header(response.headers, "location"),
              "/proxy?url=" + percent_encode("https://example.com/login?next=%2F"));
}

TEST(ResponseRelay, EachCookieSeparate)
{
    UpstreamResponse upstream;
    upstream.status_code = 200;
    upstream.cookies = {"a=1; Domain=example.com", "b=2; Path=/x"};

    auto response = relay(upstream, "ok", make_options());
    auto cookies = header_values(response.headers, "set-cookie");
    ASSERT_EQ(cookies.size(), 2u);
    EXPECT_EQ(cookies[0], "a@.example.com=1; Path=/");
    EXPECT_EQ(cookies[1], "b@example.com=2; Path=/");
}

TEST(ResponseRelay, ContentEncodingAfterDecoding)
{
    UpstreamResponse upstream;
    upstream.status_code = 200;
    upstream.headers = {{"Content-Type", "text/html"}, {"Content-Encoding", "gzip"}};

    auto options = make_options();
    auto passthrough = relay(upstream, "compressed", options);
    ASSERT_NE(find_header(passthrough.headers, "content-encoding"), nullptr);

    options.body_decoded = true;
    auto decoded = relay(upstream, "<html></html>", options);
    EXPECT_EQ(find_header(decoded.headers, "content-encoding"), nullptr);
    EXPECT_EQ(*find_header(decoded.headers, "content-length"), "13");
}

TEST(ResponseRelay, NoContentLengthWithoutBody)
{
    UpstreamResponse upstream;
    upstream.status_code = 304;
    upstream.headers = {{"ETag", "\"abc\""}};

    auto response = relay(upstream, "", make_options());
    EXPECT_EQ(find_header(response.headers, "content-length"), nullptr);
    EXPECT_NE(find_header(response.headers, "etag"), nullptr);
}
