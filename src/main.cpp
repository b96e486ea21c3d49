#include "core/config.hpp"
#include "core/server.h"
#include "transport/request_handler.h"
#include "transport/proxy_handler.hpp"
#include "transport/http1_proxy.hpp"
#include "transport/http_client.hpp"
#include "utils/logger.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <iostream>
#include <signal.h>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

boost::asio::io_context* g_io_context = nullptr;

void signal_handler(int signum) {
    if (g_io_context) {
        g_io_context->stop();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file.json>]\n"
              << "Environment: PORT, HTTP1_PORT, THREADS, USE_SSL, CERT_FILE, KEY_FILE,\n"
              << "             UPSTREAM_TIMEOUT_MS, LOG_LEVEL, CONFIG_FILE\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = std::getenv("CONFIG_FILE") ? std::getenv("CONFIG_FILE") : "";
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        // Setup signal handling
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        ProxyConfig config = load_config(config_file);
        Logger::instance().set_level(config.log_level);

        LOG_INFO("Starting web relay");
        LOG_INFO("HTTP/2 Port: " << config.http2_port << ", HTTP/1.1 Port: " << config.http1_port
                 << ", Threads: " << config.threads);
        LOG_INFO("SSL: " << (config.use_ssl ? "Enabled" : "Disabled")
                 << ", upstream timeout: " << config.upstream_timeout.count() << "ms");

        boost::asio::io_context io_context(config.threads);
        g_io_context = &io_context;

        // TLS towards the proxied sites
        boost::asio::ssl::context upstream_tls(boost::asio::ssl::context::tls_client);
        upstream_tls.set_default_verify_paths();

        HttpClient upstream(io_context, upstream_tls, config);
        ProxyRequestHandler proxy_handler(config, upstream);

        RequestHandler handler;
        auto proxy_route = [&proxy_handler](const IncomingRequest& p_request, int32_t p_stream_id,
                                            ResponseSender p_sender) {
            proxy_handler.handle_proxy_request(p_request, p_stream_id, p_sender);
        };
        for (const char* method : {"GET", "POST"}) {
            handler.register_route(method, config.proxy_base_path, proxy_route);
            handler.register_prefix_route(method, config.proxy_base_path + "/", proxy_route);
        }

        auto dispatch = [&handler](const IncomingRequest& p_request, int32_t p_stream_id,
                                   ResponseSender p_sender) {
            handler.handle_request(p_request, p_stream_id, p_sender);
        };

        // Create server
        std::unique_ptr<Server> server = config.use_ssl ?
            std::make_unique<Server>(io_context, config.http2_port, config.max_body_bytes,
                                     config.cert_file, config.key_file) :
            std::make_unique<Server>(io_context, config.http2_port, config.max_body_bytes);
        server->set_request_handler(dispatch);

        // Create HTTP/1.1 proxy server for browser access
        Http1ProxyServer http1_proxy(io_context, config.http1_port, handler, config.max_body_bytes);

        // Start both servers
        server->start();
        http1_proxy.start();

        // Run with multiple threads
        std::vector<std::thread> thread_pool;
        thread_pool.reserve(config.threads);

        for (int i = 0; i < config.threads - 1; ++i) {
            thread_pool.emplace_back([&io_context]() {
                io_context.run();
            });
        }

        LOG_INFO("HTTP/2 server ready on port " << config.http2_port);
        LOG_INFO("HTTP/1.1 proxy ready on port " << config.http1_port << " (for browsers)");

        // Run on main thread
        io_context.run();

        // Wait for all threads
        for (auto& t : thread_pool) {
            if (t.joinable()) {
                t.join();
            }
        }

        LOG_INFO("Server shutdown complete");

    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: " << e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " << e.what());
        return 1;
    }

    return 0;
}
