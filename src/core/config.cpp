#include "config.hpp"
#include "../proxy/header_policy.hpp"
#include "../proxy/response_relay.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

const char* const kDefaultBanner =
    "<div style=\"background-color: #ffc107; color: #333; padding: 12px; text-align: center; "
    "font-family: sans-serif; font-size: 16px; border-bottom: 2px solid #e0a800; z-index: 999999; "
    "position: sticky; top: 0;\"><b>Notice:</b> This page is intended for educational and research "
    "purposes only. This connection is relayed by a proxy server, which can view or modify traffic. "
    "Avoid submitting passwords, financial details, or any sensitive personal data.</div>";

int parse_int_env(const char* p_name, const char* p_value) {
    try {
        size_t consumed = 0;
        int value = std::stoi(p_value, &consumed);
        if (consumed != std::string(p_value).size()) {
            throw ConfigError(std::string("Invalid number in ") + p_name + ": " + p_value);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("Invalid number in ") + p_name + ": " + p_value);
    }
}

LogLevel parse_log_level(const std::string& p_name) {
    LogLevel level;
    if (!Logger::parse_level(p_name, level)) {
        throw ConfigError("Unknown log level: " + p_name);
    }
    return level;
}

template <typename T>
void read_key(const json& p_doc, const char* p_key, T& p_target) {
    auto it = p_doc.find(p_key);
    if (it == p_doc.end()) {
        return;
    }
    try {
        p_target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + p_key + "': " + e.what());
    }
}

} // namespace

ProxyConfig::ProxyConfig()
    : header_safelist(default_header_safelist()),
      drop_response_headers(default_dropped_response_headers()),
      banner_html(kDefaultBanner) {}

void apply_config_json(ProxyConfig& p_config, std::string_view p_json_text) {
    json doc;
    try {
        doc = json::parse(p_json_text.begin(), p_json_text.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    read_key(doc, "http2_port", p_config.http2_port);
    read_key(doc, "http1_port", p_config.http1_port);
    read_key(doc, "threads", p_config.threads);
    read_key(doc, "use_ssl", p_config.use_ssl);
    read_key(doc, "cert_file", p_config.cert_file);
    read_key(doc, "key_file", p_config.key_file);
    read_key(doc, "proxy_base_path", p_config.proxy_base_path);
    read_key(doc, "max_body_bytes", p_config.max_body_bytes);
    read_key(doc, "header_safelist", p_config.header_safelist);
    read_key(doc, "drop_response_headers", p_config.drop_response_headers);
    read_key(doc, "default_user_agent", p_config.default_user_agent);
    read_key(doc, "cookie_domain", p_config.cookie_domain);
    read_key(doc, "verify_upstream_tls", p_config.verify_upstream_tls);
    read_key(doc, "inject_banner", p_config.inject_banner);
    read_key(doc, "banner_html", p_config.banner_html);

    long long timeout_ms = p_config.upstream_timeout.count();
    read_key(doc, "upstream_timeout_ms", timeout_ms);
    p_config.upstream_timeout = std::chrono::milliseconds(timeout_ms);

    std::string level = Logger::level_name(p_config.log_level);
    read_key(doc, "log_level", level);
    p_config.log_level = parse_log_level(level);
}

void apply_config_file(ProxyConfig& p_config, const std::string& p_path) {
    std::ifstream file(p_path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + p_path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    apply_config_json(p_config, contents.str());
}

void apply_environment(ProxyConfig& p_config) {
    if (const char* value = std::getenv("PORT")) {
        p_config.http2_port = parse_int_env("PORT", value);
    }
    if (const char* value = std::getenv("HTTP1_PORT")) {
        p_config.http1_port = parse_int_env("HTTP1_PORT", value);
    }
    if (const char* value = std::getenv("THREADS")) {
        p_config.threads = parse_int_env("THREADS", value);
    }
    if (const char* value = std::getenv("USE_SSL")) {
        p_config.use_ssl = std::string(value) == "1";
    }
    if (const char* value = std::getenv("CERT_FILE")) {
        p_config.cert_file = value;
    }
    if (const char* value = std::getenv("KEY_FILE")) {
        p_config.key_file = value;
    }
    if (const char* value = std::getenv("UPSTREAM_TIMEOUT_MS")) {
        p_config.upstream_timeout = std::chrono::milliseconds(parse_int_env("UPSTREAM_TIMEOUT_MS", value));
    }
    if (const char* value = std::getenv("LOG_LEVEL")) {
        p_config.log_level = parse_log_level(value);
    }
}

void validate_config(const ProxyConfig& p_config) {
    auto check_port = [](const char* name, int port) {
        if (port <= 0 || port > 65535) {
            throw ConfigError(std::string(name) + " out of range: " + std::to_string(port));
        }
    };
    check_port("http2_port", p_config.http2_port);
    check_port("http1_port", p_config.http1_port);

    if (p_config.threads < 1) {
        throw ConfigError("threads must be at least 1");
    }
    if (p_config.proxy_base_path.size() < 2 || p_config.proxy_base_path.front() != '/' ||
        p_config.proxy_base_path.back() == '/' ||
        p_config.proxy_base_path.find_first_of("?#") != std::string::npos) {
        throw ConfigError("proxy_base_path must look like \"/proxy\": " + p_config.proxy_base_path);
    }
    if (p_config.upstream_timeout.count() <= 0) {
        throw ConfigError("upstream_timeout_ms must be positive");
    }
    if (p_config.max_body_bytes == 0) {
        throw ConfigError("max_body_bytes must be positive");
    }
}

ProxyConfig load_config(const std::string& p_config_file) {
    ProxyConfig config;
    if (!p_config_file.empty()) {
        apply_config_file(config, p_config_file);
    }
    apply_environment(config);
    validate_config(config);
    return config;
}
