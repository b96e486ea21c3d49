#pragma once

#include "target_resolver.hpp"

#include <string>
#include <string_view>

enum class ContentKind {
    Html,
    Css,
    JavaScript,
    Passthrough
};

// Selects the rewrite mode from a Content-Type header value
ContentKind classify_content_type(std::string_view p_content_type);
const char* content_kind_name(ContentKind p_kind);

struct RewriteContext {
    // document URL; relative references resolve against it
    TargetUrl base;
    std::string proxy_base_path = "/proxy";
    // inserted after <body> when not empty
    std::string notice_banner;
};

// Turns one URL reference into "<proxy_base_path>?url=<encoded absolute URL>".
// Fragment-only references, non-http(s) schemes and references that
// already point at the proxy are returned unchanged.
std::string rewrite_url_token(std::string_view p_raw, const RewriteContext& p_ctx);

// Each mode copies everything except the matched URL substrings
// verbatim. rewrite_html throws RewriteError on markup it cannot scan
// safely.
std::string rewrite_html(std::string_view p_body, const RewriteContext& p_ctx);
std::string rewrite_css(std::string_view p_body, const RewriteContext& p_ctx);
std::string rewrite_javascript(std::string_view p_body, const RewriteContext& p_ctx);

std::string rewrite_content(std::string_view p_body, ContentKind p_kind, const RewriteContext& p_ctx);
std::string rewrite_content(std::string_view p_body, std::string_view p_content_type,
                            const RewriteContext& p_ctx);
