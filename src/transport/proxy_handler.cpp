#include "proxy_handler.hpp"
#include "request_handler.h"
#include "../proxy/content_decoder.hpp"
#include "../proxy/content_rewriter.hpp"
#include "../proxy/cookie_policy.hpp"
#include "../proxy/text_util.hpp"
#include "../utils/logger.h"

ProxyRequestHandler::ProxyRequestHandler(const ProxyConfig& config, Upstream& upstream)
    : upstream_(upstream),
      base_path_(config.proxy_base_path),
      max_body_bytes_(config.max_body_bytes) {
    relay_options_.rewrite.proxy_base_path = config.proxy_base_path;
    if (config.inject_banner) {
        relay_options_.rewrite.notice_banner = config.banner_html;
    }
    relay_options_.cookies.cookie_domain = config.cookie_domain;
    relay_options_.drop_headers = config.drop_response_headers;
}

ProxyRequest ProxyRequestHandler::build_proxy_request(const IncomingRequest& p_request) const {
    ProxyRequest request;
    if (p_request.method == "GET") {
        request.method = ProxyMethod::Get;
    } else if (p_request.method == "POST") {
        request.method = ProxyMethod::Post;
    } else {
        throw ProxyError("Method not allowed", 405);
    }

    auto path = p_request.path();
    std::string_view query;
    auto question = p_request.target.find('?');
    if (question != std::string::npos) {
        query = std::string_view(p_request.target).substr(question + 1);
    }

    if (path == base_path_) {
        std::optional<std::string> url;
        for (auto& [name, value] : parse_query(query)) {
            if (name == "url" && !url) {
                url = std::move(value);
                continue;
            }
            request.query_params.emplace_back(std::move(name), std::move(value));
        }
        if (!url || trim(*url).empty()) {
            throw MissingTargetError("Missing 'url' parameter");
        }
        request.target = resolve_target(*url);
    } else if (starts_with(path, base_path_ + "/")) {
        auto raw = percent_decode(std::string_view(path).substr(base_path_.size() + 1));
        if (trim(raw).empty()) {
            throw MissingTargetError("Missing target URL");
        }
        if (!query.empty()) {
            raw += "?";
            raw += query;
        }
        request.target = resolve_target(raw);
    } else {
        throw InvalidTargetError("Not a proxy path: " + path);
    }

    if (request.method == ProxyMethod::Post) {
        request.body = p_request.body;
    }
    request.headers = p_request.headers;
    request.cookies = collect_request_cookies(p_request.headers, request.target.host_name());
    request.secure = p_request.secure;
    return request;
}

HttpResponse ProxyRequestHandler::build_response(const ProxyRequest& p_request, UpstreamResponse p_response) const {
    RelayOptions options = relay_options_;
    options.rewrite.base = p_request.target;
    options.cookies.secure_client = p_request.secure;

    std::string body = std::move(p_response.body);
    auto kind = classify_content_type(p_response.content_type);
    if (kind == ContentKind::Passthrough || body.empty()) {
        return relay(p_response, std::move(body), options);
    }

    const std::string* encoding = find_header(p_response.headers, "Content-Encoding");
    if (encoding && !is_identity_encoding(*encoding)) {
        if (!is_decodable_encoding(*encoding)) {
            LOG_INFO("Relaying " << content_kind_name(kind) << " body unrewritten, coding: " << *encoding);
            return relay(p_response, std::move(body), options);
        }
        try {
            body = decode_content(body, *encoding, max_body_bytes_);
            options.body_decoded = true;
        } catch (const RewriteError& e) {
            LOG_WARN("Cannot decode body from " << p_request.target.authority() << ": " << e.what());
            return relay(p_response, std::move(body), options);
        }
    }

    try {
        auto rewritten = rewrite_content(body, kind, options.rewrite);
        return relay(p_response, std::move(rewritten), options);
    } catch (const RewriteError& e) {
        LOG_WARN("Rewrite of " << p_request.target.to_string() << " failed, relaying original body: " << e.what());
        return relay(p_response, std::move(body), options);
    }
}

void ProxyRequestHandler::handle_proxy_request(const IncomingRequest& p_request,
                                               int32_t p_stream_id,
                                               ResponseSender p_sender) {
    ProxyRequest request;
    try {
        request = build_proxy_request(p_request);
    } catch (const ProxyError& e) {
        LOG_WARN("Rejected proxy request " << p_request.target << ": " << e.what());
        send_error(p_stream_id, p_sender, e.http_status(), e.what());
        return;
    }

    auto forwarded = std::make_shared<ProxyRequest>(std::move(request));
    auto exchange = upstream_.forward(*forwarded,
        [this, forwarded, p_stream_id, p_sender](UpstreamResponse response, std::exception_ptr error) {
            try {
                if (error) {
                    std::rethrow_exception(error);
                }
                LOG_INFO("Upstream response " << response.status_code << " for " << forwarded->target.to_string());
                p_sender(p_stream_id, build_response(*forwarded, std::move(response)));
            } catch (const ProxyError& e) {
                LOG_ERROR("Proxy request to " << forwarded->target.to_string() << " failed: " << e.what());
                send_error(p_stream_id, p_sender, e.http_status(), e.what());
            } catch (const std::exception& e) {
                LOG_ERROR("Proxy request to " << forwarded->target.to_string() << " failed: " << e.what());
                send_error(p_stream_id, p_sender, 500, "Internal server error");
            }
        });

    if (p_request.abort && exchange) {
        p_request.abort->on_abort([exchange]() {
            exchange->cancel();
        });
    }
}

void ProxyRequestHandler::send_error(int32_t p_stream_id, const ResponseSender& p_sender,
                                     int p_status, const std::string& p_message) {
    json error = RequestHandler::create_error_response(p_status, p_message);
    p_sender(p_stream_id, HttpResponse(p_status, error.dump()));
}
