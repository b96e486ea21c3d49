#pragma once

#include "active_request.hpp"
#include "common.h"
#include "../utils/logger.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <nghttp2/nghttp2.h>
#include <array>
#include <functional>
#include <memory>
#include <unordered_map>

// HTTP/2 front-end connection (h2c, or h2 negotiated by ALPN)
class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(boost::asio::ip::tcp::socket p_socket, RequestCB p_request_cb, size_t p_max_body_bytes);
        Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context,
                RequestCB p_request_cb, size_t p_max_body_bytes);
        ~Session();

        void start();
    private:
        // nghttp2 callbacks
        static int on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                     void* user_data);
        static int on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                 const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                                 uint8_t flags, void* user_data);
        static int on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                         int32_t stream_id, const uint8_t* data,
                                         size_t len, void* user_data);
        static int on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                       uint32_t error_code, void* user_data);
        static ssize_t send_cb(nghttp2_session* session, const uint8_t* data,
                               size_t length, int flags, void* user_data);
        static ssize_t read_body_cb(nghttp2_session* session, int32_t stream_id, uint8_t* buf,
                                    size_t length, uint32_t* data_flags, nghttp2_data_source* source,
                                    void* user_data);

        // Session management
        void setup_nghttp2();
        void read_data();
        void handle_read(boost::system::error_code ec, std::size_t length);
        void write_data();
        void dispatch_request(int32_t p_stream_id);
        void send_response(int32_t p_stream_id, const HttpResponse& p_response);
        void handle_ssl_handshake();
        void shutdown();

        // Request handling
        struct StreamData
        {
            IncomingRequest request;
            std::string authority;
            bool too_large = false;
            std::shared_ptr<ActiveRequest> active;
            std::string response_body;
            size_t response_offset = 0;
        };
        
    private:
        nghttp2_session* session_ = nullptr;
        std::unique_ptr<boost::asio::ip::tcp::socket> plain_socket_;
        std::unique_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>> ssl_socket_;
        boost::asio::any_io_executor executor_;
        RequestCB request_cb_;
        size_t max_body_bytes_;
        std::array<uint8_t, 8192> read_buffer_;
        std::unordered_map<int32_t, StreamData> streams_data_;
        bool use_ssl_ = false;
        bool closed_ = false;
};
