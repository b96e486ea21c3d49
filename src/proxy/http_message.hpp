#pragma once

#include "target_resolver.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Header fields in arrival order. Names compare case-insensitively,
// duplicates are kept.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

const std::string* find_header(const HeaderList& p_headers, std::string_view p_name);
std::vector<std::string> header_values(const HeaderList& p_headers, std::string_view p_name);

enum class ProxyMethod {
    Get,
    Post
};

const char* method_name(ProxyMethod p_method);

struct ProxyRequest {
    ProxyMethod method = ProxyMethod::Get;
    TargetUrl target;
    QueryParams query_params;
    std::optional<std::string> body;
    HeaderList headers;
    // the client's cookies for the target host, scope already removed
    std::string cookies;
    // the client reached the proxy over TLS
    bool secure = false;
};

// Upstream URL of a request: the target plus the extra query parameters
TargetUrl upstream_url(const ProxyRequest& p_request);

struct UpstreamResponse {
    int status_code = 0;
    HeaderList headers;
    std::vector<std::string> cookies;
    std::string body;
    std::string content_type;
};

// Response handed to a front-end (the client side of the proxy)
struct HttpResponse {
    int status_code = 200;
    std::string body;
    HeaderList headers;

    HttpResponse() = default;
    HttpResponse(int status, const std::string& response_body, const std::string& type = "application/json")
        : status_code(status), body(response_body) {
        headers.emplace_back("Content-Type", type);
    }
};
