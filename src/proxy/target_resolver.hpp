#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Absolute http(s) URL of an upstream resource. The scheme is always
// "http" or "https" and the host is never empty.
struct TargetUrl {
    std::string scheme;
    std::string host;
    std::optional<uint16_t> port;
    std::string path = "/";
    std::optional<std::string> query;

    bool is_tls() const { return scheme == "https"; }
    uint16_t effective_port() const;

    // host[:port], as sent in the Host header
    std::string authority() const;
    // host without IPv6 brackets, as passed to the resolver
    std::string host_name() const;
    // path[?query], as sent on the request line
    std::string request_target() const;
    std::string to_string() const;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Normalizes user input (scheme optional, https assumed) into a
// TargetUrl. Throws InvalidTargetError.
TargetUrl resolve_target(std::string_view p_input);

// RFC 3986 section 5.2 reference resolution. Returns the target URI as
// a string; the result may carry any scheme.
std::string resolve_reference(const TargetUrl& p_base, std::string_view p_reference);

// Scheme of an absolute URI reference ("HTTP" for "HTTP://x"), or empty
std::string_view uri_scheme(std::string_view p_reference);

std::string remove_dot_segments(std::string_view p_path);

// Encodes every byte outside the RFC 3986 unreserved set
std::string percent_encode(std::string_view p_value);
std::string percent_decode(std::string_view p_value, bool p_plus_as_space = false);

QueryParams parse_query(std::string_view p_query);
// Appends p_params to the URL's query string, preserving their order
void append_query(TargetUrl& p_url, const QueryParams& p_params);
