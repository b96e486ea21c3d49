#pragma once

#include "active_request.hpp"
#include "request_handler.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <optional>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Plain HTTP/1.1 front-end. Requests on a connection are served one at
// a time; the connection is kept open when the client asks for it.
class Http1ProxySession : public std::enable_shared_from_this<Http1ProxySession> {
public:
    Http1ProxySession(tcp::socket socket, const RequestHandler& handler, size_t max_body_bytes);
    void start();

private:
    void read_request();
    void handle_request(http::request<http::string_body> request);
    void watch_disconnect(std::shared_ptr<ActiveRequest> active);
    void send_response(std::shared_ptr<ActiveRequest> active, const HttpResponse& response);
    void send_error(int status_code, const std::string& message);
    void close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    const RequestHandler& handler_;
    size_t max_body_bytes_;
    std::shared_ptr<ActiveRequest> active_request_;
    unsigned version_ = 11;
    bool keep_alive_ = false;
};

class Http1ProxyServer {
public:
    Http1ProxyServer(net::io_context& io_context, int port, const RequestHandler& handler, size_t max_body_bytes);
    void start();

private:
    void accept_connections();

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    const RequestHandler& handler_;
    size_t max_body_bytes_;
};
