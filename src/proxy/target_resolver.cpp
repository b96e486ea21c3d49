#include "target_resolver.hpp"
#include "errors.hpp"
#include "text_util.hpp"

#include <cstring>

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
    return is_ascii_alnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

// Browsers escape these when they appear literally in a path or query
std::string escape_illegal_target_chars(std::string_view p_value) {
    std::string result;
    result.reserve(p_value.size());
    for (unsigned char c : p_value) {
        if (c <= 0x20 || c >= 0x7f || std::strchr("\"<>\\^`{|}", c) != nullptr) {
            result += '%';
            result += kHexDigits[c >> 4];
            result += kHexDigits[c & 0x0f];
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

bool is_valid_host(std::string_view p_host) {
    if (p_host.empty()) {
        return false;
    }

    if (p_host.front() == '[') {
        if (p_host.size() < 3 || p_host.back() != ']') {
            return false;
        }
        for (unsigned char c : p_host.substr(1, p_host.size() - 2)) {
            if (!is_hex_digit(c) && c != ':' && c != '.') {
                return false;
            }
        }
        return true;
    }

    for (unsigned char c : p_host) {
        if (c <= 0x20 || c == 0x7f || std::strchr("#%/:<>?@[\\]^|\"{}`", c) != nullptr) {
            return false;
        }
    }
    return true;
}

std::optional<uint16_t> parse_port(std::string_view p_port) {
    if (p_port.empty() || p_port.size() > 5) {
        return std::nullopt;
    }
    unsigned value = 0;
    for (char c : p_port) {
        if (!is_ascii_digit(c)) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

struct UriReference {
    std::optional<std::string_view> scheme;
    std::optional<std::string_view> authority;
    std::string_view path;
    std::optional<std::string_view> query;
    std::optional<std::string_view> fragment;
};

UriReference split_reference(std::string_view p_ref) {
    UriReference ref;

    auto hash = p_ref.find('#');
    if (hash != std::string_view::npos) {
        ref.fragment = p_ref.substr(hash + 1);
        p_ref = p_ref.substr(0, hash);
    }

    auto question = p_ref.find('?');
    if (question != std::string_view::npos) {
        ref.query = p_ref.substr(question + 1);
        p_ref = p_ref.substr(0, question);
    }

    auto scheme = uri_scheme(p_ref);
    if (!scheme.empty()) {
        ref.scheme = scheme;
        p_ref.remove_prefix(scheme.size() + 1);
    }

    if (starts_with(p_ref, "//")) {
        p_ref.remove_prefix(2);
        auto slash = p_ref.find('/');
        ref.authority = p_ref.substr(0, slash);
        p_ref = slash == std::string_view::npos ? std::string_view() : p_ref.substr(slash);
    }

    ref.path = p_ref;
    return ref;
}

std::string merge_paths(const TargetUrl& p_base, std::string_view p_path) {
    auto slash = p_base.path.rfind('/');
    if (slash == std::string::npos) {
        return "/" + std::string(p_path);
    }
    return p_base.path.substr(0, slash + 1) + std::string(p_path);
}

} // namespace

uint16_t TargetUrl::effective_port() const {
    if (port) {
        return *port;
    }
    return is_tls() ? 443 : 80;
}

std::string TargetUrl::authority() const {
    if (port) {
        return host + ":" + std::to_string(*port);
    }
    return host;
}

std::string TargetUrl::host_name() const {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

std::string TargetUrl::request_target() const {
    std::string target = path.empty() ? "/" : path;
    if (query) {
        target += '?';
        target += *query;
    }
    return target;
}

std::string TargetUrl::to_string() const {
    return scheme + "://" + authority() + request_target();
}

TargetUrl resolve_target(std::string_view p_input) {
    auto input = trim(p_input);
    if (input.empty()) {
        throw InvalidTargetError("Target URL is empty");
    }

    TargetUrl url;
    std::string_view rest;
    if (istarts_with(input, "http://")) {
        url.scheme = "http";
        rest = input.substr(7);
    } else if (istarts_with(input, "https://")) {
        url.scheme = "https";
        rest = input.substr(8);
    } else if (istarts_with(input, "http:/")) {
        // browsers and some servers collapse "//" in paths
        url.scheme = "http";
        rest = input.substr(6);
    } else if (istarts_with(input, "https:/")) {
        url.scheme = "https";
        rest = input.substr(7);
    } else {
        url.scheme = "https";
        rest = input;
    }

    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);
    rest = authority_end == std::string_view::npos ? std::string_view() : rest.substr(authority_end);

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto bracket = authority.find(']');
        if (bracket == std::string_view::npos) {
            throw InvalidTargetError("Unterminated IPv6 address in target: " + std::string(input));
        }
        host = authority.substr(0, bracket + 1);
        auto after = authority.substr(bracket + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw InvalidTargetError("Invalid host in target: " + std::string(input));
            }
            port = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (!is_valid_host(host)) {
        throw InvalidTargetError("Invalid host in target: " + std::string(input));
    }
    url.host = to_lower(host);

    if (!port.empty()) {
        url.port = parse_port(port);
        if (!url.port) {
            throw InvalidTargetError("Invalid port in target: " + std::string(input));
        }
    }

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        url.query = escape_illegal_target_chars(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    url.path = rest.empty() ? "/" : escape_illegal_target_chars(rest);
    return url;
}

std::string resolve_reference(const TargetUrl& p_base, std::string_view p_reference) {
    auto ref = split_reference(p_reference);

    std::string scheme;
    std::string authority;
    std::string path;
    std::optional<std::string_view> query;

    if (ref.scheme) {
        scheme = std::string(*ref.scheme);
        if (ref.authority) {
            authority = std::string(*ref.authority);
        }
        path = remove_dot_segments(ref.path);
        query = ref.query;
    } else {
        scheme = p_base.scheme;
        if (ref.authority) {
            authority = std::string(*ref.authority);
            path = remove_dot_segments(ref.path);
            query = ref.query;
        } else {
            authority = p_base.authority();
            if (ref.path.empty()) {
                path = p_base.path;
                if (ref.query) {
                    query = ref.query;
                } else if (p_base.query) {
                    query = std::string_view(*p_base.query);
                }
            } else if (ref.path.front() == '/') {
                path = remove_dot_segments(ref.path);
                query = ref.query;
            } else {
                path = remove_dot_segments(merge_paths(p_base, ref.path));
                query = ref.query;
            }
        }
    }

    std::string result = scheme;
    result += ':';
    if (ref.authority || !ref.scheme) {
        result += "//";
        result += authority;
    }
    result += path;
    if (query) {
        result += '?';
        result.append(query->data(), query->size());
    }
    if (ref.fragment) {
        result += '#';
        result.append(ref.fragment->data(), ref.fragment->size());
    }
    return result;
}

std::string_view uri_scheme(std::string_view p_reference) {
    if (p_reference.empty() || !is_ascii_alpha(p_reference.front())) {
        return {};
    }
    for (size_t i = 1; i < p_reference.size(); ++i) {
        char c = p_reference[i];
        if (c == ':') {
            return p_reference.substr(0, i);
        }
        if (!is_ascii_alnum(c) && c != '+' && c != '-' && c != '.') {
            return {};
        }
    }
    return {};
}

std::string remove_dot_segments(std::string_view p_path) {
    std::string input(p_path);
    std::string output;

    while (!input.empty()) {
        if (starts_with(input, "../")) {
            input.erase(0, 3);
        } else if (starts_with(input, "./")) {
            input.erase(0, 2);
        } else if (starts_with(input, "/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (starts_with(input, "/../") || input == "/..") {
            if (input == "/..") {
                input = "/";
            } else {
                input.erase(0, 3);
            }
            auto slash = output.rfind('/');
            output.erase(slash == std::string::npos ? 0 : slash);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            auto next = input.find('/', input.front() == '/' ? 1 : 0);
            output.append(input, 0, next);
            input.erase(0, next);
        }
    }

    return output;
}

std::string percent_encode(std::string_view p_value) {
    std::string result;
    result.reserve(p_value.size() * 3);
    for (unsigned char c : p_value) {
        if (is_unreserved(c)) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += kHexDigits[c >> 4];
            result += kHexDigits[c & 0x0f];
        }
    }
    return result;
}

std::string percent_decode(std::string_view p_value, bool p_plus_as_space) {
    std::string result;
    result.reserve(p_value.size());
    for (size_t i = 0; i < p_value.size(); ++i) {
        char c = p_value[i];
        if (c == '%' && i + 2 < p_value.size() &&
            is_hex_digit(p_value[i + 1]) && is_hex_digit(p_value[i + 2])) {
            result += static_cast<char>(hex_value(p_value[i + 1]) * 16 + hex_value(p_value[i + 2]));
            i += 2;
        } else if (c == '+' && p_plus_as_space) {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

QueryParams parse_query(std::string_view p_query) {
    QueryParams params;
    while (!p_query.empty()) {
        auto amp = p_query.find('&');
        auto pair = p_query.substr(0, amp);
        p_query = amp == std::string_view::npos ? std::string_view() : p_query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            params.emplace_back(percent_decode(pair, true), std::string());
        } else {
            params.emplace_back(percent_decode(pair.substr(0, eq), true),
                                percent_decode(pair.substr(eq + 1), true));
        }
    }
    return params;
}

void append_query(TargetUrl& p_url, const QueryParams& p_params) {
    if (p_params.empty()) {
        return;
    }

    std::string query = p_url.query.value_or(std::string());
    for (const auto& [name, value] : p_params) {
        if (!query.empty()) {
            query += '&';
        }
        query += percent_encode(name);
        query += '=';
        query += percent_encode(value);
    }
    p_url.query = std::move(query);
}
