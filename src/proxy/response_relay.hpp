#pragma once

#include "content_rewriter.hpp"
#include "cookie_policy.hpp"
#include "http_message.hpp"

#include <string>
#include <vector>

struct RelayOptions {
    // resolves Location headers; base.host is the cookie domain to strip
    RewriteContext rewrite;
    CookieRewriteOptions cookies;
    // upstream response headers never relayed (lower case)
    std::vector<std::string> drop_headers;
    // the body was decoded, so Content-Encoding no longer applies
    bool body_decoded = false;
};

// Upstream response headers relayed unless configured otherwise
const std::vector<std::string>& default_dropped_response_headers();

// Builds the client response from an upstream response and the body to
// send (rewritten or original). Content-Length is recomputed and every
// cookie becomes its own Set-Cookie field.
HttpResponse relay(const UpstreamResponse& p_response, std::string p_body, const RelayOptions& p_options);
