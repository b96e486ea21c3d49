#include "http_client.hpp"
#include "../proxy/errors.hpp"
#include "../proxy/text_util.hpp"
#include "../utils/logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <optional>

namespace {

constexpr uint32_t kHeaderLimit = 64 * 1024;

// State of one upstream request. Lives on its own strand; owned by the
// pending async operations.
class HttpExchange : public UpstreamExchange,
                     public std::enable_shared_from_this<HttpExchange> {
public:
    HttpExchange(net::io_context& io_context, ssl::context& tls_context,
                 std::chrono::milliseconds timeout, size_t max_body_bytes, bool verify_tls)
        : strand_(net::make_strand(io_context)),
          tls_context_(tls_context),
          resolver_(strand_),
          deadline_(strand_),
          timeout_(timeout),
          max_body_bytes_(max_body_bytes),
          verify_tls_(verify_tls) {}

    void start(TargetUrl target, http::request<http::string_body> request, UpstreamCallback callback);
    void cancel() override;

private:
    void handle_resolve(const beast::error_code& ec, tcp::resolver::results_type results);
    void handle_connect(const beast::error_code& ec);
    void handle_handshake(const beast::error_code& ec);

    template <typename Stream>
    void write_request(Stream& stream);
    void handle_write(const beast::error_code& ec);

    template <typename Stream>
    void read_response(Stream& stream);
    void handle_read(const beast::error_code& ec);

    void handle_deadline(const beast::error_code& ec);
    void fail(const char* stage, const beast::error_code& ec);
    void finish(UpstreamResponse response, std::exception_ptr error);
    void close();
    beast::tcp_stream& lowest_layer();

private:
    net::strand<net::io_context::executor_type> strand_;
    ssl::context& tls_context_;
    tcp::resolver resolver_;
    net::steady_timer deadline_;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;

    TargetUrl target_;
    http::request<http::string_body> request_;
    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::string_body>> parser_;
    UpstreamCallback callback_;

    std::chrono::milliseconds timeout_;
    size_t max_body_bytes_;
    bool verify_tls_;
    bool cancelled_ = false;
    bool done_ = false;
};

void HttpExchange::start(TargetUrl target, http::request<http::string_body> request, UpstreamCallback callback) {
    target_ = std::move(target);
    request_ = std::move(request);
    callback_ = std::move(callback);

    if (target_.is_tls()) {
        tls_.emplace(strand_, tls_context_);
    } else {
        plain_.emplace(strand_);
    }

    auto self = shared_from_this();
    net::dispatch(strand_, [self]() {
        if (self->cancelled_) {
            return;
        }
        self->deadline_.expires_after(self->timeout_);
        self->deadline_.async_wait([self](const beast::error_code& ec) {
            self->handle_deadline(ec);
        });

        self->resolver_.async_resolve(self->target_.host_name(),
                                      std::to_string(self->target_.effective_port()),
            [self](const beast::error_code& ec, tcp::resolver::results_type results) {
                self->handle_resolve(ec, results);
            });
    });
}

void HttpExchange::cancel() {
    auto self = shared_from_this();
    net::post(strand_, [self]() {
        if (self->done_) {
            return;
        }
        LOG_DEBUG("Upstream request to " << self->target_.authority() << " cancelled");
        self->cancelled_ = true;
        self->done_ = true;
        self->callback_ = nullptr;
        self->close();
    });
}

beast::tcp_stream& HttpExchange::lowest_layer() {
    if (tls_) {
        return beast::get_lowest_layer(*tls_);
    }
    return *plain_;
}

void HttpExchange::close() {
    beast::error_code ignored;
    resolver_.cancel();
    deadline_.cancel();
    lowest_layer().socket().close(ignored);
}

void HttpExchange::handle_deadline(const beast::error_code& ec) {
    if (ec == net::error::operation_aborted || done_) {
        return;
    }
    LOG_WARN("Upstream request to " << target_.authority() << " timed out after "
             << timeout_.count() << "ms");
    finish(UpstreamResponse{}, std::make_exception_ptr(UpstreamTimeoutError(
        "Timed out waiting for " + target_.authority())));
}

void HttpExchange::handle_resolve(const beast::error_code& ec, tcp::resolver::results_type results) {
    if (ec) {
        fail("Failed to resolve host", ec);
        return;
    }

    auto self = shared_from_this();
    lowest_layer().async_connect(results,
        [self](const beast::error_code& ec, const tcp::endpoint&) {
            self->handle_connect(ec);
        });
}

void HttpExchange::handle_connect(const beast::error_code& ec) {
    if (ec) {
        fail("Failed to connect", ec);
        return;
    }

    if (!tls_) {
        write_request(*plain_);
        return;
    }

    auto host = target_.host_name();
    if (!SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str())) {
        fail("Failed to set SNI", beast::error_code(static_cast<int>(::ERR_get_error()),
                                                   net::error::get_ssl_category()));
        return;
    }
    if (verify_tls_) {
        tls_->set_verify_mode(ssl::verify_peer);
        tls_->set_verify_callback(ssl::host_name_verification(host));
    } else {
        tls_->set_verify_mode(ssl::verify_none);
    }

    auto self = shared_from_this();
    tls_->async_handshake(ssl::stream_base::client,
        [self](const beast::error_code& ec) {
            self->handle_handshake(ec);
        });
}

void HttpExchange::handle_handshake(const beast::error_code& ec) {
    if (ec) {
        fail("TLS handshake failed", ec);
        return;
    }
    write_request(*tls_);
}

template <typename Stream>
void HttpExchange::write_request(Stream& stream) {
    auto self = shared_from_this();
    http::async_write(stream, request_,
        [self](const beast::error_code& ec, std::size_t) {
            self->handle_write(ec);
        });
}

void HttpExchange::handle_write(const beast::error_code& ec) {
    if (ec) {
        fail("Failed to write request", ec);
        return;
    }

    parser_.emplace();
    parser_->header_limit(kHeaderLimit);
    parser_->body_limit(max_body_bytes_);

    if (tls_) {
        read_response(*tls_);
    } else {
        read_response(*plain_);
    }
}

template <typename Stream>
void HttpExchange::read_response(Stream& stream) {
    auto self = shared_from_this();
    http::async_read(stream, buffer_, *parser_,
        [self](const beast::error_code& ec, std::size_t) {
            self->handle_read(ec);
        });
}

void HttpExchange::handle_read(const beast::error_code& ec) {
    // Servers that delimit the body by closing the connection often skip
    // the TLS close_notify.
    bool truncated_but_complete = ec == ssl::error::stream_truncated && parser_->is_done();
    if (ec && !truncated_but_complete) {
        fail("Failed to read response", ec);
        return;
    }

    auto message = parser_->release();
    UpstreamResponse response;
    response.status_code = static_cast<int>(message.result_int());
    for (const auto& field : message) {
        std::string name(field.name_string());
        std::string value(field.value());
        if (iequals(name, "set-cookie")) {
            response.cookies.push_back(std::move(value));
            continue;
        }
        if (iequals(name, "content-type")) {
            response.content_type = value;
        }
        response.headers.emplace_back(std::move(name), std::move(value));
    }
    response.body = std::move(message.body());

    LOG_DEBUG("Upstream " << target_.authority() << " answered " << response.status_code
              << " (" << response.body.size() << " bytes)");
    finish(std::move(response), nullptr);
}

void HttpExchange::fail(const char* stage, const beast::error_code& ec) {
    if (done_) {
        return;
    }
    if (ec == http::error::body_limit) {
        finish(UpstreamResponse{}, std::make_exception_ptr(UpstreamUnreachableError(
            "Response from " + target_.authority() + " exceeds the body limit")));
        return;
    }
    LOG_WARN(stage << " for " << target_.authority() << ": " << ec.message());
    finish(UpstreamResponse{}, std::make_exception_ptr(UpstreamUnreachableError(
        std::string(stage) + ": " + ec.message())));
}

void HttpExchange::finish(UpstreamResponse response, std::exception_ptr error) {
    if (done_) {
        return;
    }
    done_ = true;
    auto callback = std::move(callback_);
    callback_ = nullptr;
    close();
    if (callback) {
        callback(std::move(response), error);
    }
}

} // namespace

HttpClient::HttpClient(net::io_context& io_context, ssl::context& tls_context, const ProxyConfig& config)
    : io_context_(io_context),
      tls_context_(tls_context),
      timeout_(config.upstream_timeout),
      max_body_bytes_(config.max_body_bytes),
      verify_tls_(config.verify_upstream_tls) {
    header_options_.safelist = config.header_safelist;
    header_options_.default_user_agent = config.default_user_agent;
    header_options_.proxy_base_path = config.proxy_base_path;
}

std::shared_ptr<UpstreamExchange> HttpClient::forward(const ProxyRequest& p_request,
                                                      UpstreamCallback p_callback) {
    auto url = upstream_url(p_request);

    http::request<http::string_body> req;
    req.version(11);
    req.method(p_request.method == ProxyMethod::Post ? http::verb::post : http::verb::get);
    req.target(url.request_target());
    for (const auto& [name, value] : build_upstream_headers(p_request, header_options_)) {
        req.insert(name, value);
    }
    req.keep_alive(false);

    if (p_request.body) {
        req.body() = *p_request.body;
    }
    req.prepare_payload();

    LOG_INFO("Forwarding " << method_name(p_request.method) << " " << url.to_string());

    auto exchange = std::make_shared<HttpExchange>(io_context_, tls_context_, timeout_,
                                                   max_body_bytes_, verify_tls_);
    exchange->start(std::move(url), std::move(req), std::move(p_callback));
    return exchange;
}
