#pragma once

#include "http_message.hpp"

#include <string>
#include <string_view>

struct CookieRewriteOptions {
    // replaces a Domain attribute that matches the upstream host; the
    // attribute is removed when empty
    std::string cookie_domain;
    // the client talks TLS to the proxy, so Secure cookies are usable
    bool secure_client = false;
};

// RFC 6265 domain matching ("www.example.com" matches "example.com" and
// ".example.com")
bool domain_matches(std::string_view p_host, std::string_view p_domain);

// All upstream cookies share the proxy origin in the browser, so each
// relayed name carries the scope it came from: "name@host" for host-only
// cookies, "name@.domain" for cookies with a matching Domain attribute.
std::string scoped_cookie_name(std::string_view p_name, std::string_view p_scope);

// Rewrites one Set-Cookie value so the browser stores it against the
// proxy origin and sends it back on the next proxied request to the
// same upstream site.
std::string rewrite_set_cookie(std::string_view p_set_cookie, std::string_view p_upstream_host,
                               const CookieRewriteOptions& p_options);

// Value for the upstream Cookie header: the client's cookies whose scope
// covers p_target_host, with the scope removed from the name. Cookies of
// other sites and unscoped ones stay behind. HTTP/2 clients may split
// cookies over several header fields.
std::string collect_request_cookies(const HeaderList& p_headers, std::string_view p_target_host);
