#include "http1_proxy.hpp"
#include "../utils/logger.h"

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(30);
constexpr uint32_t kHeaderLimit = 64 * 1024;

bool status_has_body(int status_code) {
    return status_code >= 200 && status_code != 204 && status_code != 304;
}

} // namespace

Http1ProxySession::Http1ProxySession(tcp::socket socket, const RequestHandler& handler, size_t max_body_bytes)
    : stream_(std::move(socket)), handler_(handler), max_body_bytes_(max_body_bytes) {}

void Http1ProxySession::start() {
    net::dispatch(stream_.get_executor(),
        [self = shared_from_this()]() {
            self->read_request();
        });
}

void Http1ProxySession::read_request() {
    auto self = shared_from_this();
    parser_.emplace();
    parser_->header_limit(kHeaderLimit);
    parser_->body_limit(max_body_bytes_);

    stream_.expires_after(kIdleTimeout);
    http::async_read(stream_, buffer_, *parser_,
        [self](beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                self->close();
                return;
            }
            if (ec == http::error::body_limit) {
                LOG_WARN("HTTP/1.1 request body exceeds " << self->max_body_bytes_ << " bytes");
                self->keep_alive_ = false;
                self->send_error(413, "Request body too large");
                return;
            }
            if (ec) {
                if (ec != beast::error::timeout) {
                    LOG_ERROR("HTTP/1.1 read error: " << ec.message());
                }
                self->close();
                return;
            }
            self->handle_request(self->parser_->release());
        });
}

void Http1ProxySession::handle_request(http::request<http::string_body> request) {
    version_ = request.version();
    keep_alive_ = request.keep_alive();

    IncomingRequest incoming;
    incoming.method = std::string(request.method_string());
    incoming.target = std::string(request.target());
    incoming.body = std::move(request.body());
    for (const auto& field : request) {
        incoming.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    incoming.secure = false;

    LOG_INFO("HTTP/1.1 " << incoming.method << " " << incoming.target);

    auto active = std::make_shared<ActiveRequest>(std::move(incoming));
    active_request_ = active;
    active->set_state(RequestState::Dispatched);
    stream_.expires_never();

    auto self = shared_from_this();
    handler_.handle_request(active->get_request(), 1,
        [self, active](int32_t, const HttpResponse& response) {
            net::post(self->stream_.get_executor(), [self, active, response]() {
                self->send_response(active, response);
            });
        });

    if (active->get_state() == RequestState::Dispatched) {
        watch_disconnect(active);
    }
}

void Http1ProxySession::watch_disconnect(std::shared_ptr<ActiveRequest> active) {
    auto self = shared_from_this();
    stream_.socket().async_wait(tcp::socket::wait_read,
        [self, active](beast::error_code ec) {
            if (ec || self->active_request_ != active || active->get_state() != RequestState::Dispatched) {
                return;
            }
            // Readable with nothing to read: the peer closed its side.
            // Pipelined bytes are left for the next read.
            beast::error_code available_ec;
            if (self->stream_.socket().available(available_ec) == 0 || available_ec) {
                active->abort();
                self->close();
            }
        });
}

void Http1ProxySession::send_response(std::shared_ptr<ActiveRequest> active, const HttpResponse& response) {
    if (active_request_ != active || active->get_state() != RequestState::Dispatched) {
        return;
    }
    active->set_state(RequestState::SendingResponse);

    beast::error_code ignored;
    stream_.socket().cancel(ignored);

    auto res = std::make_shared<http::response<http::string_body>>(
        static_cast<http::status>(response.status_code), version_);
    for (const auto& [name, value] : response.headers) {
        res->insert(name, value);
    }
    res->set(http::field::server, "webrelay");
    res->keep_alive(keep_alive_);
    if (status_has_body(response.status_code)) {
        res->body() = response.body;
        res->prepare_payload();
    }

    stream_.expires_after(kIdleTimeout);
    http::async_write(stream_, *res,
        [self = shared_from_this(), active, res](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_ERROR("Response write error: " << ec.message());
                active->abort();
                self->close();
                return;
            }
            active->complete(res->result_int());
            self->active_request_.reset();
            if (!res->keep_alive()) {
                self->close();
                return;
            }
            self->read_request();
        });
}

void Http1ProxySession::send_error(int status_code, const std::string& message) {
    json error = RequestHandler::create_error_response(status_code, message);
    IncomingRequest incoming;
    incoming.method = "-";
    auto active = std::make_shared<ActiveRequest>(std::move(incoming));
    active_request_ = active;
    active->set_state(RequestState::Dispatched);
    send_response(active, HttpResponse(status_code, error.dump()));
}

void Http1ProxySession::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.close();
}

Http1ProxyServer::Http1ProxyServer(net::io_context& io_context, int port,
                                   const RequestHandler& handler, size_t max_body_bytes)
    : io_context_(io_context), acceptor_(io_context, tcp::endpoint(tcp::v4(), port)),
      handler_(handler), max_body_bytes_(max_body_bytes) {}

void Http1ProxyServer::start() {
    LOG_INFO("Starting HTTP/1.1 proxy server on port " << acceptor_.local_endpoint().port());
    accept_connections();
}

void Http1ProxyServer::accept_connections() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                LOG_DEBUG("HTTP/1.1 connection accepted");
                std::make_shared<Http1ProxySession>(std::move(socket), handler_, max_body_bytes_)->start();
            } else if (ec == net::error::operation_aborted) {
                return;
            } else {
                LOG_ERROR("HTTP/1.1 accept error: " << ec.message());
            }
            accept_connections();
        });
}
