#pragma once

#include "../transport/common.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <memory>

class Session;

// HTTP/2 listener: cleartext h2c, or TLS with h2 selected by ALPN
class Server {
public:
    Server(boost::asio::io_context& p_io_context, int p_port, size_t p_max_body_bytes);
    Server(boost::asio::io_context& p_io_context, int p_port, size_t p_max_body_bytes,
           const std::string& cert_file, const std::string& key_file);
    ~Server() = default;

    void start();
    void set_request_handler(RequestCB p_handler);
private:
    void accept_connection();
    void setup_ssl_context(const std::string& cert_file, const std::string& key_file);

private:
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::io_context& io_context_;
    RequestCB request_handler_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    size_t max_body_bytes_;
    bool use_ssl_ = false;
};
