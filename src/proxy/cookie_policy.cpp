#include "cookie_policy.hpp"
#include "text_util.hpp"

#include <vector>

bool domain_matches(std::string_view p_host, std::string_view p_domain) {
    if (!p_domain.empty() && p_domain.front() == '.') {
        p_domain.remove_prefix(1);
    }
    if (p_domain.empty() || p_host.size() < p_domain.size()) {
        return false;
    }
    if (!iends_with(p_host, p_domain)) {
        return false;
    }
    return p_host.size() == p_domain.size() || p_host[p_host.size() - p_domain.size() - 1] == '.';
}

namespace {

const char kScopeSeparator = '@';

bool scope_covers(std::string_view p_scope, std::string_view p_host) {
    if (!p_scope.empty() && p_scope.front() == '.') {
        return domain_matches(p_host, p_scope);
    }
    return !p_scope.empty() && iequals(p_scope, p_host);
}

} // namespace

std::string scoped_cookie_name(std::string_view p_name, std::string_view p_scope) {
    std::string name(p_name);
    name += kScopeSeparator;
    name += to_lower(p_scope);
    return name;
}

std::string rewrite_set_cookie(std::string_view p_set_cookie, std::string_view p_upstream_host,
                               const CookieRewriteOptions& p_options) {
    std::vector<std::string> parts;
    std::string scope(p_upstream_host);
    bool has_path = false;
    bool dropped_secure = false;

    size_t pos = 0;
    bool first = true;
    while (pos <= p_set_cookie.size()) {
        auto semicolon = p_set_cookie.find(';', pos);
        auto part = trim(p_set_cookie.substr(pos, semicolon == std::string_view::npos ? std::string_view::npos
                                                                                    : semicolon - pos));
        pos = semicolon == std::string_view::npos ? p_set_cookie.size() + 1 : semicolon + 1;

        if (first) {
            // the name is scoped once the Domain attribute is known
            parts.emplace_back(part);
            first = false;
            continue;
        }
        if (part.empty()) {
            continue;
        }

        auto eq = part.find('=');
        auto name = trim(part.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string_view() : trim(part.substr(eq + 1));

        if (iequals(name, "domain")) {
            if (domain_matches(p_upstream_host, value)) {
                scope = "." + std::string(value.substr(value.front() == '.' ? 1 : 0));
                if (!p_options.cookie_domain.empty()) {
                    parts.push_back("Domain=" + p_options.cookie_domain);
                }
                continue;
            }
        } else if (iequals(name, "path")) {
            parts.emplace_back("Path=/");
            has_path = true;
            continue;
        } else if (iequals(name, "secure") && !p_options.secure_client) {
            dropped_secure = true;
            continue;
        }

        parts.emplace_back(part);
    }

    if (!has_path) {
        parts.emplace_back("Path=/");
    }

    auto name_value = std::string_view(parts.front());
    auto eq = name_value.find('=');
    auto scoped = scoped_cookie_name(trim(name_value.substr(0, eq)), scope);
    if (eq != std::string_view::npos) {
        scoped += name_value.substr(eq);
    }
    parts.front() = std::move(scoped);

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        // browsers reject SameSite=None without Secure
        if (i > 0 && dropped_secure && istarts_with(part, "samesite") &&
            ifind(part, "none") != std::string_view::npos) {
            continue;
        }
        if (!result.empty()) {
            result += "; ";
        }
        result += part;
    }
    return result;
}

std::string collect_request_cookies(const HeaderList& p_headers, std::string_view p_target_host) {
    std::string cookies;
    for (const auto& value : header_values(p_headers, "cookie")) {
        std::string_view rest(value);
        while (!rest.empty()) {
            auto semicolon = rest.find(';');
            auto pair = trim(rest.substr(0, semicolon));
            rest = semicolon == std::string_view::npos ? std::string_view() : rest.substr(semicolon + 1);

            auto eq = pair.find('=');
            auto name = trim(pair.substr(0, eq));
            auto separator = name.rfind(kScopeSeparator);
            if (separator == std::string_view::npos ||
                !scope_covers(name.substr(separator + 1), p_target_host)) {
                continue;
            }

            if (!cookies.empty()) {
                cookies += "; ";
            }
            cookies += name.substr(0, separator);
            if (eq != std::string_view::npos) {
                cookies += pair.substr(eq);
            }
        }
    }
    return cookies;
}
