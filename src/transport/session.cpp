#include "session.h"
#include "request_handler.h"
#include "../proxy/header_policy.hpp"
#include "../proxy/text_util.hpp"

#include <algorithm>
#include <cstring>

namespace {

nghttp2_nv make_nv_ls(const std::string& name, const std::string& value) {
    return {(uint8_t*)name.c_str(), (uint8_t*)value.c_str(), name.size(), value.size(), NGHTTP2_NV_FLAG_NONE};
}

bool status_has_body(int status_code) {
    return status_code >= 200 && status_code != 204 && status_code != 304;
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket p_socket, RequestCB p_request_cb, size_t p_max_body_bytes)
    : executor_(p_socket.get_executor()), request_cb_(std::move(p_request_cb)),
      max_body_bytes_(p_max_body_bytes), use_ssl_(false) {
    plain_socket_ = std::make_unique<boost::asio::ip::tcp::socket>(std::move(p_socket));
}

Session::Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context,
                 RequestCB p_request_cb, size_t p_max_body_bytes)
    : executor_(p_socket.get_executor()), request_cb_(std::move(p_request_cb)),
      max_body_bytes_(p_max_body_bytes), use_ssl_(true) {
    ssl_socket_ = std::make_unique<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>(std::move(p_socket), ssl_context);
}

Session::~Session() {
    if (session_) {
        nghttp2_session_del(session_);
    }
}

void Session::start() {
    LOG_DEBUG("Start nghttp2 session");
    auto self(shared_from_this());
    boost::asio::dispatch(executor_, [this, self]() {
        if (use_ssl_) {
            handle_ssl_handshake();
        } else {
            setup_nghttp2();
            write_data();
            read_data();
        }
    });
}

void Session::handle_ssl_handshake() {
    auto self(shared_from_this());
    ssl_socket_->async_handshake(boost::asio::ssl::stream_base::server,
        [this, self](boost::system::error_code ec) {
            if (!ec) {
                LOG_DEBUG("SSL handshake completed");
                setup_nghttp2();
                write_data();
                read_data();
            } else {
                LOG_ERROR("SSL handshake failed: " << ec.message());
            }
        });
}

void Session::setup_nghttp2() {
    nghttp2_session_callbacks* callbacks;
    nghttp2_session_callbacks_new(&callbacks);

    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, on_frame_recv_cb);
    nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header_cb);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, on_data_chunk_recv_cb);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close_cb);
    nghttp2_session_callbacks_set_send_callback(callbacks, send_cb);

    nghttp2_session_server_new(&session_, callbacks, this);
    nghttp2_session_callbacks_del(callbacks);

    // Send initial SETTINGS frame
    nghttp2_settings_entry iv[1] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100}
    };
    nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, iv, 1);
}

void Session::read_data() {
    auto self(shared_from_this());
    
    if (use_ssl_) {
        ssl_socket_->async_read_some(boost::asio::buffer(read_buffer_),
            [this, self](boost::system::error_code ec, std::size_t length) {
                handle_read(ec, length);
            });
    } else {
        plain_socket_->async_read_some(boost::asio::buffer(read_buffer_),
            [this, self](boost::system::error_code ec, std::size_t length) {
                handle_read(ec, length);
            });
    }
}

void Session::handle_read(boost::system::error_code ec, std::size_t length) {
    if (ec) {
        if (ec != boost::asio::error::eof) {
            LOG_DEBUG("HTTP/2 read error: " << ec.message());
        }
        shutdown();
        return;
    }

    ssize_t read = nghttp2_session_mem_recv(session_, read_buffer_.data(), length);
    if (read < 0) {
        LOG_ERROR("nghttp2_session_mem_recv error: " << nghttp2_strerror((int)read));
        shutdown();
        return;
    }
    write_data();
    if (closed_) {
        return;
    }
    if (!nghttp2_session_want_read(session_) && !nghttp2_session_want_write(session_)) {
        shutdown();
        return;
    }
    read_data();
}

void Session::write_data() {
    if (closed_) {
        return;
    }
    int rv = nghttp2_session_send(session_);
    if (rv != 0) {
        LOG_ERROR("nghttp2_session_send failed: " << nghttp2_strerror(rv));
        shutdown();
    }
}

void Session::shutdown() {
    if (closed_) {
        return;
    }
    closed_ = true;
    for (auto& [stream_id, stream_data] : streams_data_) {
        if (stream_data.active) {
            stream_data.active->abort();
        }
    }
    streams_data_.clear();

    boost::system::error_code ignored;
    auto& socket = use_ssl_ ? ssl_socket_->next_layer() : *plain_socket_;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    LOG_DEBUG("HTTP/2 connection closed");
}

void Session::dispatch_request(int32_t p_stream_id) {
    auto it = streams_data_.find(p_stream_id);
    if (it == streams_data_.end() || it->second.active) {
        return;
    }
    auto& stream_data = it->second;

    if (stream_data.too_large) {
        LOG_WARN("HTTP/2 request body on stream " << p_stream_id << " exceeds " << max_body_bytes_ << " bytes");
        json error = RequestHandler::create_error_response(413, "Request body too large");
        stream_data.active = std::make_shared<ActiveRequest>(stream_data.request);
        stream_data.active->set_state(RequestState::Dispatched);
        send_response(p_stream_id, HttpResponse(413, error.dump()));
        return;
    }

    if (!stream_data.authority.empty() && !find_header(stream_data.request.headers, "host")) {
        stream_data.request.headers.emplace_back("host", stream_data.authority);
    }
    stream_data.request.secure = use_ssl_;

    LOG_INFO("HTTP/2 " << stream_data.request.method << " " << stream_data.request.target
             << " (stream " << p_stream_id << ", body: " << stream_data.request.body.size() << " bytes)");

    auto active = std::make_shared<ActiveRequest>(std::move(stream_data.request));
    stream_data.active = active;
    active->set_state(RequestState::Dispatched);

    // Responses may come from any thread; nghttp2 is only touched on the
    // connection's strand.
    std::weak_ptr<Session> weak = shared_from_this();
    auto executor = executor_;
    auto sender = [weak, executor, active](int32_t stream_id, const HttpResponse& response) {
        boost::asio::post(executor, [weak, active, stream_id, response]() {
            auto sess = weak.lock();
            if (!sess || active->get_state() != RequestState::Dispatched) {
                return;
            }
            sess->send_response(stream_id, response);
            sess->write_data();
        });
    };
    request_cb_(active->get_request(), p_stream_id, sender);
}

void Session::send_response(int32_t p_stream_id, const HttpResponse& p_response) {
    auto it = streams_data_.find(p_stream_id);
    if (closed_ || it == streams_data_.end() || !it->second.active) {
        return;
    }
    auto& stream_data = it->second;
    stream_data.active->set_state(RequestState::SendingResponse);

    std::string status = std::to_string(p_response.status_code);
    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& [name, value] : p_response.headers) {
        auto lower = to_lower(name);
        if (is_hop_by_hop_header(lower) || lower == "content-length" || lower == "host") {
            continue;
        }
        fields.emplace_back(std::move(lower), value);
    }

    bool with_body = status_has_body(p_response.status_code);
    if (with_body) {
        fields.emplace_back("content-length", std::to_string(p_response.body.size()));
    }

    std::vector<nghttp2_nv> headers;
    headers.push_back(make_nv_ls(":status", status));
    for (const auto& [name, value] : fields) {
        headers.push_back(make_nv_ls(name, value));
    }

    int rv;
    if (!with_body || p_response.body.empty()) {
        // No response body, send only headers
        rv = nghttp2_submit_response(session_, p_stream_id, headers.data(), headers.size(), nullptr);
    }
    else {
        stream_data.response_body = p_response.body;
        stream_data.response_offset = 0;
        nghttp2_data_provider data_prd;
        data_prd.source.ptr = &stream_data;
        data_prd.read_callback = read_body_cb;
        rv = nghttp2_submit_response(session_, p_stream_id, headers.data(), headers.size(), &data_prd);
    }
    if (rv != 0) {
        LOG_ERROR("nghttp2_submit_response failed on stream " << p_stream_id << ": " << nghttp2_strerror(rv));
        stream_data.active->abort();
        return;
    }
    stream_data.active->complete(p_response.status_code);
    LOG_DEBUG("Response sent on stream " << p_stream_id << " with status " << status);
}

// Static callbacks
ssize_t Session::read_body_cb(nghttp2_session* session, int32_t stream_id, uint8_t* buf,
                              size_t length, uint32_t* data_flags, nghttp2_data_source* source,
                              void* user_data) {
    auto* stream_data = static_cast<StreamData*>(source->ptr);
    size_t remaining = stream_data->response_body.size() - stream_data->response_offset;
    size_t len = std::min(remaining, length);

    memcpy(buf, stream_data->response_body.data() + stream_data->response_offset, len);
    stream_data->response_offset += len;
    if (stream_data->response_offset == stream_data->response_body.size()) {
        *data_flags |= NGHTTP2_DATA_FLAG_EOF;
    }
    return len;
}

int Session::on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                    void* user_data) {
    Session* sess = static_cast<Session*>(user_data);

    switch (frame->hd.type) {
    case NGHTTP2_HEADERS:
    case NGHTTP2_DATA:
        // END_STREAM ends the request, with or without a body
        if (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) {
            sess->dispatch_request(frame->hd.stream_id);
        }
        break;
    default:
        break;
    }
    return 0;                                
}
                                
int Session::on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                            const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                            uint8_t flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    if(frame->hd.type == NGHTTP2_HEADERS && frame->headers.cat == NGHTTP2_HCAT_REQUEST) {
        auto& stream_data = sess->streams_data_[frame->hd.stream_id];
        auto header_name = std::string(reinterpret_cast<const char*>(name), namelen);
        auto header_value = std::string(reinterpret_cast<const char*>(value), valuelen);
        if(header_name == ":method")
            stream_data.request.method = header_value;
        else if(header_name == ":path")
            stream_data.request.target = header_value;
        else if(header_name == ":authority")
            stream_data.authority = header_value;
        else if(header_name[0] != ':')
            stream_data.request.headers.emplace_back(std::move(header_name), std::move(header_value));
    }

    return 0;
}

int Session::on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                    int32_t stream_id, const uint8_t* data,
                                    size_t len, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it == sess->streams_data_.end()) {
        return 0;
    }

    auto& stream_data = it->second;
    if (stream_data.request.body.size() + len > sess->max_body_bytes_) {
        stream_data.too_large = true;
        stream_data.request.body.clear();
        return 0;
    }
    if (!stream_data.too_large) {
        stream_data.request.body.append((const char*)data, len);
    }
    LOG_DEBUG("Received " << len << " bytes of data on stream " << stream_id
              << ", total " << stream_data.request.body.size());
    return 0;
}

int Session::on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                uint32_t error_code, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it != sess->streams_data_.end()) {
        if (it->second.active && it->second.active->get_state() == RequestState::Dispatched) {
            LOG_DEBUG("Stream " << stream_id << " reset by client: " << nghttp2_http2_strerror(error_code));
            it->second.active->abort();
        }
        sess->streams_data_.erase(it);
    }
    LOG_DEBUG("Stream " << stream_id << " closed");
    return 0;
}

ssize_t Session::send_cb(nghttp2_session* session, const uint8_t* data,
                         size_t length, int flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    boost::system::error_code ec;
    
    size_t written;
    if (sess->use_ssl_) {
        written = boost::asio::write(*sess->ssl_socket_, 
                                   boost::asio::buffer(data, length), 
                                   ec);
    } else {
        written = boost::asio::write(*sess->plain_socket_, 
                                   boost::asio::buffer(data, length), 
                                   ec);
    }
    
    if (ec) {
        LOG_ERROR("Write error: " << ec.message());
        return NGHTTP2_ERR_CALLBACK_FAILURE;
    }
    
    return written;
}
