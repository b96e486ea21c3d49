#include "transport/http_client.hpp"
#include "proxy/errors.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace {

// Accepts one connection on 127.0.0.1 and hands it to a blocking handler
class LoopbackServer {
public:
    explicit LoopbackServer(std::function<void(tcp::socket&)> handler)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        thread_ = std::thread([this, handler]() {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (!ec) {
                handler(socket);
            }
        });
    }

    ~LoopbackServer() {
        thread_.join();
    }

    uint16_t port() const {
        return acceptor_.local_endpoint().port();
    }

private:
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
};

// Blocks until the client closes the connection
void wait_for_close(tcp::socket& socket)
{
    char c;
    beast::error_code ec;
    while (!ec) {
        socket.read_some(net::buffer(&c, 1), ec);
    }
}

struct Result {
    bool called = false;
    UpstreamResponse response;
    std::exception_ptr error;
};

class HttpClientTest : public ::testing::Test {
protected:
    HttpClientTest() : tls_(ssl::context::tls_client) {
        config.upstream_timeout = std::chrono::milliseconds(2000);
    }

    ProxyRequest make_request(uint16_t port, const std::string& path) {
        ProxyRequest request;
        request.target = resolve_target("http://127.0.0.1:" + std::to_string(port) + path);
        return request;
    }

    std::shared_ptr<UpstreamExchange> forward(const ProxyRequest& request, Result& result) {
        HttpClient client(ioc_, tls_, config);
        return client.forward(request, [&result](UpstreamResponse response, std::exception_ptr error) {
            result.called = true;
            result.response = std::move(response);
            result.error = error;
        });
    }

    net::io_context ioc_;
    ssl::context tls_;
    ProxyConfig config;
};

template <typename E>
bool holds(std::exception_ptr error)
{
    try {
        std::rethrow_exception(error);
    } catch (const E&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

TEST_F(HttpClientTest, PostForwarded)
{
    http::request<http::string_body> seen;
    LoopbackServer server([&seen](tcp::socket& socket) {
        beast::flat_buffer buffer;
        http::read(socket, buffer, seen);
        std::string response =
            "HTTP/1.1 201 Created\r\n"
            "Content-Type: text/plain\r\n"
            "Set-Cookie: a=1; Path=/\r\n"
            "Set-Cookie: b=2\r\n"
            "Content-Length: 7\r\n"
            "Connection: close\r\n"
            "\r\n"
            "created";
        net::write(socket, net::buffer(response));
        wait_for_close(socket);
    });

    auto request = make_request(server.port(), "/submit?x=1");
    request.method = ProxyMethod::Post;
    request.body = std::string("name=caf%C3%A9&n=\x01\x02", 19);
    request.headers = {{"Content-Type", "application/x-www-form-urlencoded"}, {"X-Forwarded-For", "1.2.3.4"}};
    request.query_params = {{"extra", "y"}};
    request.cookies = "sid=42";

    Result result;
    forward(request, result);
    ioc_.run();

    ASSERT_TRUE(result.called);
    ASSERT_FALSE(result.error);
    EXPECT_EQ(result.response.status_code, 201);
    EXPECT_EQ(result.response.body, "created");
    EXPECT_EQ(result.response.content_type, "text/plain");
    ASSERT_EQ(result.response.cookies.size(), 2u);
    EXPECT_EQ(result.response.cookies[0], "a=1; Path=/");
    EXPECT_EQ(result.response.cookies[1], "b=2");
    EXPECT_EQ(find_header(result.response.headers, "set-cookie"), nullptr);

    EXPECT_EQ(seen.method(), http::verb::post);
    EXPECT_EQ(seen.target(), "/submit?x=1&extra=y");
    EXPECT_EQ(seen.body(), *request.body);
    EXPECT_EQ(seen[http::field::content_type], "application/x-www-form-urlencoded");
    EXPECT_EQ(seen[http::field::host], "127.0.0.1:" + std::to_string(server.port()));
    EXPECT_EQ(seen[http::field::cookie], "sid=42");
    EXPECT_EQ(seen[http::field::user_agent], "Mozilla/5.0");
    EXPECT_EQ(seen.count("X-Forwarded-For"), 0u);
}

TEST_F(HttpClientTest, RedirectNotFollowed)
{
    LoopbackServer server([](tcp::socket& socket) {
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(socket, buffer, request);
        std::string response =
            "HTTP/1.1 302 Found\r\n"
            "Location: /elsewhere\r\n"
            "Content-Length: 0\r\n"
            "\r\n";
        net::write(socket, net::buffer(response));
        wait_for_close(socket);
    });

    Result result;
    forward(make_request(server.port(), "/start"), result);
    ioc_.run();

    ASSERT_TRUE(result.called);
    ASSERT_FALSE(result.error);
    EXPECT_EQ(result.response.status_code, 302);
    ASSERT_NE(find_header(result.response.headers, "location"), nullptr);
    EXPECT_EQ(*find_header(result.response.headers, "location"), "/elsewhere");
}

TEST_F(HttpClientTest, BodyDelimitedByClose)
{
    LoopbackServer server([](tcp::socket& socket) {
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(socket, buffer, request);
        std::string response =
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: text/html\r\n"
            "Connection: close\r\n"
            "\r\n"
            "<p>until eof</p>";
        net::write(socket, net::buffer(response));
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
    });

    Result result;
    forward(make_request(server.port(), "/"), result);
    ioc_.run();

    ASSERT_TRUE(result.called);
    ASSERT_FALSE(result.error);
    EXPECT_EQ(result.response.body, "<p>until eof</p>");
}

TEST_F(HttpClientTest, TimeoutIsReported)
{
    config.upstream_timeout = std::chrono::milliseconds(200);
    LoopbackServer server([](tcp::socket& socket) {
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(socket, buffer, request);
        wait_for_close(socket);
    });

    Result result;
    auto start = std::chrono::steady_clock::now();
    forward(make_request(server.port(), "/slow"), result);
    ioc_.run();

    ASSERT_TRUE(result.called);
    ASSERT_TRUE(result.error);
    EXPECT_TRUE(holds<UpstreamTimeoutError>(result.error));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST_F(HttpClientTest, ConnectionRefused)
{
    uint16_t port;
    {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    Result result;
    forward(make_request(port, "/"), result);
    ioc_.run();

    ASSERT_TRUE(result.called);
    ASSERT_TRUE(result.error);
    EXPECT_TRUE(holds<UpstreamUnreachableError>(result.error));
}

TEST_F(HttpClientTest, OversizedResponse)
{
    config.max_body_bytes = 16;
    LoopbackServer server([](tcp::socket& socket) {
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(socket, buffer, request);
        std::string response =
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: 64\r\n"
            "\r\n" + std::string(64, 'x');
        beast::error_code ec;
        net::write(socket, net::buffer(response), ec);
        wait_for_close(socket);
    });

    Result result;
    forward(make_request(server.port(), "/big"), result);
    ioc_.run();

    ASSERT_TRUE(result.called);
    EXPECT_TRUE(holds<UpstreamUnreachableError>(result.error));
}

TEST_F(HttpClientTest, CancelSuppressesCallback)
{
    std::shared_ptr<UpstreamExchange> exchange;
    LoopbackServer server([this, &exchange](tcp::socket& socket) {
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(socket, buffer, request);
        net::post(ioc_, [&exchange]() {
            exchange->cancel();
        });
        wait_for_close(socket);
    });

    Result result;
    exchange = forward(make_request(server.port(), "/"), result);
    ioc_.run();

    EXPECT_FALSE(result.called);
}
