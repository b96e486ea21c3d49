#pragma once

#include "../utils/logger.h"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Built once at startup, then shared read-only by every component
struct ProxyConfig {
    int http2_port = 8080;
    int http1_port = 9080;
    int threads = 4;
    bool use_ssl = false;
    std::string cert_file = "certs/server.crt";
    std::string key_file = "certs/server.key";

    std::string proxy_base_path = "/proxy";
    std::chrono::milliseconds upstream_timeout{15000};
    size_t max_body_bytes = 32 * 1024 * 1024;
    std::vector<std::string> header_safelist;
    std::vector<std::string> drop_response_headers;
    std::string default_user_agent = "Mozilla/5.0";
    std::string cookie_domain;
    bool verify_upstream_tls = true;

    bool inject_banner = true;
    std::string banner_html;

    LogLevel log_level = LogLevel::Info;

    ProxyConfig();
};

// Overrides fields with the keys present in a JSON document
void apply_config_json(ProxyConfig& p_config, std::string_view p_json_text);
void apply_config_file(ProxyConfig& p_config, const std::string& p_path);
// PORT, HTTP1_PORT, THREADS, USE_SSL, CERT_FILE, KEY_FILE,
// UPSTREAM_TIMEOUT_MS, LOG_LEVEL
void apply_environment(ProxyConfig& p_config);
void validate_config(const ProxyConfig& p_config);

// Defaults, then the optional file, then the environment
ProxyConfig load_config(const std::string& p_config_file);
