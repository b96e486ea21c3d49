#pragma once

#include "common.h"
#include "../core/config.hpp"
#include "../proxy/errors.hpp"
#include "../proxy/response_relay.hpp"
#include "../proxy/upstream.hpp"

#include <memory>
#include <string>
#include <string_view>

// Serves "<base>?url=<target>" and "<base>/<absolute-url>": forwards the
// request to the target and relays the rewritten response.
class ProxyRequestHandler {
public:
    ProxyRequestHandler(const ProxyConfig& config, Upstream& upstream);

    void handle_proxy_request(const IncomingRequest& p_request,
                              int32_t p_stream_id,
                              ResponseSender p_sender);

    // Throws MissingTargetError, InvalidTargetError or ProxyError (405)
    ProxyRequest build_proxy_request(const IncomingRequest& p_request) const;

    // Decodes and rewrites the body where its type allows it, then
    // relays. Rewrite failures fall back to the unrewritten body.
    HttpResponse build_response(const ProxyRequest& p_request, UpstreamResponse p_response) const;

private:
    static void send_error(int32_t p_stream_id, const ResponseSender& p_sender,
                           int p_status, const std::string& p_message);

    Upstream& upstream_;
    std::string base_path_;
    size_t max_body_bytes_;
    RelayOptions relay_options_;
};
