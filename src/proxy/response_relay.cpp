#include "response_relay.hpp"
#include "header_policy.hpp"
#include "text_util.hpp"

namespace {

bool has_no_body(int p_status) {
    return (p_status >= 100 && p_status < 200) || p_status == 204 || p_status == 304;
}

} // namespace

const std::vector<std::string>& default_dropped_response_headers() {
    static const std::vector<std::string> headers = {
        "alt-svc",
        "content-security-policy",
        "public-key-pins",
        "strict-transport-security",
    };
    return headers;
}

HttpResponse relay(const UpstreamResponse& p_response, std::string p_body, const RelayOptions& p_options) {
    HttpResponse response;
    response.status_code = p_response.status_code;

    auto connection_scoped = connection_header_tokens(p_response.headers);
    for (const auto& [name, value] : p_response.headers) {
        if (is_hop_by_hop_header(name) || iequals(name, "content-length") || iequals(name, "set-cookie") ||
            header_name_listed(p_options.drop_headers, name) || header_name_listed(connection_scoped, name)) {
            continue;
        }
        if (p_options.body_decoded && iequals(name, "content-encoding")) {
            continue;
        }

        if (iequals(name, "location") || iequals(name, "content-location")) {
            response.headers.emplace_back(name, rewrite_url_token(value, p_options.rewrite));
            continue;
        }

        response.headers.emplace_back(name, value);
    }

    auto upstream_host = p_options.rewrite.base.host_name();
    for (const auto& cookie : p_response.cookies) {
        response.headers.emplace_back("Set-Cookie", rewrite_set_cookie(cookie, upstream_host, p_options.cookies));
    }

    if (!has_no_body(p_response.status_code)) {
        response.headers.emplace_back("Content-Length", std::to_string(p_body.size()));
    }

    response.body = std::move(p_body);
    return response;
}
