#pragma once

#include "common.h"
#include "../core/config.hpp"
#include "../proxy/header_policy.hpp"
#include "../proxy/upstream.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <memory>
#include <functional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// Sends proxied requests to their target over HTTP/1.1, plain or TLS.
// Every request gets its own connection; redirects are never followed.
class HttpClient : public Upstream {
public:
    HttpClient(net::io_context& io_context, ssl::context& tls_context, const ProxyConfig& config);
    ~HttpClient() override = default;

    std::shared_ptr<UpstreamExchange> forward(const ProxyRequest& p_request,
                                              UpstreamCallback p_callback) override;

private:
    net::io_context& io_context_;
    ssl::context& tls_context_;
    UpstreamHeaderOptions header_options_;
    std::chrono::milliseconds timeout_;
    size_t max_body_bytes_;
    bool verify_tls_;
};
