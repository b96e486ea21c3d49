#include "header_policy.hpp"
#include "text_util.hpp"

#include <cstdlib>

namespace {

const char* const kHopByHopHeaders[] = {
    "connection",
    "keep-alive",
    "proxy-connection",
    "proxy-authenticate",
    "proxy-authorization",
    "te",
    "trailer",
    "transfer-encoding",
    "upgrade",
    nullptr,
};

const char* const kRoutingHeaders[] = {
    "forwarded",
    "via",
    "x-real-ip",
    nullptr,
};

bool string_in_array(const char* const p_array[], std::string_view p_value) {
    for (unsigned i = 0; p_array[i] != nullptr; ++i) {
        if (iequals(p_array[i], p_value)) {
            return true;
        }
    }
    return false;
}

// Calls p_handler for each trimmed, non-empty element of a comma list
template <typename F>
void for_each_list_element(std::string_view p_list, F&& p_handler) {
    while (!p_list.empty()) {
        auto comma = p_list.find(',');
        auto element = trim(p_list.substr(0, comma));
        p_list = comma == std::string_view::npos ? std::string_view() : p_list.substr(comma + 1);
        if (!element.empty()) {
            p_handler(element);
        }
    }
}

// "gzip;q=0.5" -> false only for a zero quality value
bool coding_acceptable(std::string_view p_element) {
    auto semicolon = p_element.find(';');
    while (semicolon != std::string_view::npos) {
        auto rest = p_element.substr(semicolon + 1);
        auto next = rest.find(';');
        auto param = trim(rest.substr(0, next));
        if (param.size() > 2 && ascii_lower(param[0]) == 'q' && param[1] == '=') {
            return std::strtod(std::string(param.substr(2)).c_str(), nullptr) > 0;
        }
        semicolon = next == std::string_view::npos ? next : semicolon + 1 + next;
    }
    return true;
}

} // namespace

std::vector<std::string> connection_header_tokens(const HeaderList& p_headers) {
    std::vector<std::string> tokens;
    for (const auto& value : header_values(p_headers, "connection")) {
        for_each_list_element(value, [&](std::string_view p_token) {
            tokens.push_back(to_lower(p_token));
        });
    }
    return tokens;
}

bool header_name_listed(const std::vector<std::string>& p_names, std::string_view p_name) {
    for (const auto& name : p_names) {
        if (iequals(name, p_name)) {
            return true;
        }
    }
    return false;
}

std::string upstream_accept_encoding(const HeaderList& p_client_headers) {
    std::optional<bool> gzip;
    std::optional<bool> deflate;
    bool any = false;

    for (const auto& value : header_values(p_client_headers, "accept-encoding")) {
        for_each_list_element(value, [&](std::string_view p_element) {
            auto coding = trim(p_element.substr(0, p_element.find(';')));
            bool acceptable = coding_acceptable(p_element);
            if (iequals(coding, "gzip") || iequals(coding, "x-gzip")) {
                gzip = acceptable;
            } else if (iequals(coding, "deflate")) {
                deflate = acceptable;
            } else if (coding == "*") {
                any = acceptable;
            }
        });
    }

    std::string result;
    if (gzip.value_or(any)) {
        result = "gzip";
    }
    if (deflate.value_or(any)) {
        result += result.empty() ? "deflate" : ", deflate";
    }
    return result;
}

const std::vector<std::string>& default_header_safelist() {
    static const std::vector<std::string> safelist = {
        "accept",
        "accept-language",
        "cache-control",
        "content-type",
        "if-modified-since",
        "if-none-match",
        "referer",
        "user-agent",
    };
    return safelist;
}

bool is_hop_by_hop_header(std::string_view p_name) {
    return string_in_array(kHopByHopHeaders, p_name);
}

bool is_routing_header(std::string_view p_name) {
    return string_in_array(kRoutingHeaders, p_name) || istarts_with(p_name, "x-forwarded-");
}

std::optional<std::string> unwrap_proxied_url(std::string_view p_referer, std::string_view p_proxy_base_path) {
    auto value = trim(p_referer);

    // strip scheme and authority of the proxy itself
    auto scheme_end = value.find("://");
    if (scheme_end != std::string_view::npos) {
        auto path_start = value.find('/', scheme_end + 3);
        if (path_start == std::string_view::npos) {
            return std::nullopt;
        }
        value.remove_prefix(path_start);
    }

    if (!starts_with(value, p_proxy_base_path)) {
        return std::nullopt;
    }
    auto rest = value.substr(p_proxy_base_path.size());

    if (!rest.empty() && rest.front() == '/') {
        auto target = rest.substr(1);
        if (target.empty()) {
            return std::nullopt;
        }
        return std::string(target);
    }

    if (rest.empty() || rest.front() != '?') {
        return std::nullopt;
    }

    for (const auto& [name, param] : parse_query(rest.substr(1))) {
        if (name == "url" && !param.empty()) {
            return param;
        }
    }
    return std::nullopt;
}

HeaderList build_upstream_headers(const ProxyRequest& p_request, const UpstreamHeaderOptions& p_options) {
    HeaderList headers;
    headers.emplace_back("Host", p_request.target.authority());

    auto connection_scoped = connection_header_tokens(p_request.headers);
    for (const auto& [name, value] : p_request.headers) {
        if (is_hop_by_hop_header(name) || is_routing_header(name) || iequals(name, "host") ||
            iequals(name, "cookie") || header_name_listed(connection_scoped, name)) {
            continue;
        }

        bool forward = header_name_listed(p_options.safelist, name) ||
                       (p_request.body && iequals(name, "content-type"));
        if (!forward) {
            continue;
        }

        if (iequals(name, "referer")) {
            auto upstream = unwrap_proxied_url(value, p_options.proxy_base_path);
            if (upstream) {
                headers.emplace_back(name, *upstream);
            }
            continue;
        }

        headers.emplace_back(name, value);
    }

    if (find_header(headers, "user-agent") == nullptr && !p_options.default_user_agent.empty()) {
        headers.emplace_back("User-Agent", p_options.default_user_agent);
    }

    if (!p_request.cookies.empty()) {
        headers.emplace_back("Cookie", p_request.cookies);
    }

    auto codings = upstream_accept_encoding(p_request.headers);
    if (!codings.empty()) {
        headers.emplace_back("Accept-Encoding", std::move(codings));
    }
    return headers;
}
