#pragma once

#include "http_message.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Client headers forwarded upstream unless configured otherwise
const std::vector<std::string>& default_header_safelist();

// Connection-scoped headers that never cross the proxy (RFC 7230 6.1)
bool is_hop_by_hop_header(std::string_view p_name);

// Lowercase header names listed in Connection fields; they are
// connection-scoped as well
std::vector<std::string> connection_header_tokens(const HeaderList& p_headers);

// Case-insensitive membership of a header name in a list
bool header_name_listed(const std::vector<std::string>& p_names, std::string_view p_name);

// Codings to request upstream: those of "gzip, deflate" the client's own
// Accept-Encoding allows, so passthrough bodies arrive in a coding the
// client can read. Empty when the client sent none or allows neither.
std::string upstream_accept_encoding(const HeaderList& p_client_headers);

// Headers describing the path through proxies; ours are not leaked
bool is_routing_header(std::string_view p_name);

// Recovers the upstream URL from a Referer that points at a proxied
// page ("http://proxy/proxy?url=https%3A%2F%2Fexample.com%2F").
std::optional<std::string> unwrap_proxied_url(std::string_view p_referer, std::string_view p_proxy_base_path);

struct UpstreamHeaderOptions {
    std::vector<std::string> safelist = default_header_safelist();
    std::string default_user_agent = "Mozilla/5.0";
    std::string proxy_base_path = "/proxy";
};

// Header set of the outbound request: Host of the target, safelisted
// client headers, the client's cookies and the codings both sides can decode.
HeaderList build_upstream_headers(const ProxyRequest& p_request, const UpstreamHeaderOptions& p_options);
