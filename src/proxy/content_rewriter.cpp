#include "content_rewriter.hpp"
#include "errors.hpp"
#include "text_util.hpp"

#include <cstring>
#include <optional>
#include <vector>

namespace {

struct Replacement {
    size_t start;
    size_t end;
    std::string text;
};

// Replacements must be sorted by start and must not overlap
std::string apply_replacements(std::string_view p_input, const std::vector<Replacement>& p_replacements) {
    if (p_replacements.empty()) {
        return std::string(p_input);
    }

    std::string output;
    output.reserve(p_input.size() + p_replacements.size() * 32);

    size_t pos = 0;
    for (const auto& replacement : p_replacements) {
        output.append(p_input.data() + pos, replacement.start - pos);
        output += replacement.text;
        pos = replacement.end;
    }
    output.append(p_input.data() + pos, p_input.size() - pos);
    return output;
}

void append_utf8(std::string& p_output, unsigned long p_code_point) {
    if (p_code_point == 0 || p_code_point > 0x10FFFF || (p_code_point >= 0xD800 && p_code_point <= 0xDFFF)) {
        p_code_point = 0xFFFD;
    }

    if (p_code_point < 0x80) {
        p_output += static_cast<char>(p_code_point);
    } else if (p_code_point < 0x800) {
        p_output += static_cast<char>(0xC0 | (p_code_point >> 6));
        p_output += static_cast<char>(0x80 | (p_code_point & 0x3F));
    } else if (p_code_point < 0x10000) {
        p_output += static_cast<char>(0xE0 | (p_code_point >> 12));
        p_output += static_cast<char>(0x80 | ((p_code_point >> 6) & 0x3F));
        p_output += static_cast<char>(0x80 | (p_code_point & 0x3F));
    } else {
        p_output += static_cast<char>(0xF0 | (p_code_point >> 18));
        p_output += static_cast<char>(0x80 | ((p_code_point >> 12) & 0x3F));
        p_output += static_cast<char>(0x80 | ((p_code_point >> 6) & 0x3F));
        p_output += static_cast<char>(0x80 | (p_code_point & 0x3F));
    }
}

// Decodes the character references that show up in URL attributes.
// Unknown entities are copied through.
std::string html_unescape(std::string_view p_value) {
    if (p_value.find('&') == std::string_view::npos) {
        return std::string(p_value);
    }

    std::string output;
    output.reserve(p_value.size());

    size_t pos = 0;
    while (pos < p_value.size()) {
        auto amp = p_value.find('&', pos);
        if (amp == std::string_view::npos) {
            break;
        }
        output.append(p_value.data() + pos, amp - pos);

        auto semicolon = p_value.find(';', amp + 1);
        if (semicolon == std::string_view::npos || semicolon - amp > 10) {
            output += '&';
            pos = amp + 1;
            continue;
        }

        auto entity = p_value.substr(amp + 1, semicolon - amp - 1);
        bool decoded = true;
        if (entity == "amp") {
            output += '&';
        } else if (entity == "quot") {
            output += '"';
        } else if (entity == "apos") {
            output += '\'';
        } else if (entity == "lt") {
            output += '<';
        } else if (entity == "gt") {
            output += '>';
        } else if (entity.size() > 1 && entity.front() == '#') {
            auto digits = entity.substr(1);
            int base = 10;
            if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
                base = 16;
                digits.remove_prefix(1);
            }

            unsigned long code_point = 0;
            decoded = !digits.empty();
            for (char c : digits) {
                if (base == 16 ? !is_hex_digit(c) : !is_ascii_digit(c)) {
                    decoded = false;
                    break;
                }
                code_point = code_point * base + static_cast<unsigned long>(hex_value(c));
                if (code_point > 0x10FFFF) {
                    code_point = 0x110000;
                }
            }
            if (decoded) {
                append_utf8(output, code_point);
            }
        } else {
            decoded = false;
        }

        if (decoded) {
            pos = semicolon + 1;
        } else {
            output += '&';
            pos = amp + 1;
        }
    }

    output.append(p_value.data() + pos, p_value.size() - pos);
    return output;
}

std::string html_escape_attribute(std::string_view p_value) {
    std::string output;
    output.reserve(p_value.size());
    for (char c : p_value) {
        switch (c) {
            case '&':  output += "&amp;"; break;
            case '"':  output += "&quot;"; break;
            case '\'': output += "&#39;"; break;
            case '<':  output += "&lt;"; break;
            case '>':  output += "&gt;"; break;
            default:   output += c;
        }
    }
    return output;
}

bool is_css_ident_char(char c) {
    return is_ascii_alnum(c) || c == '-' || c == '_';
}

bool is_js_ident_char(char c) {
    return is_ascii_alnum(c) || c == '_' || c == '$' || static_cast<unsigned char>(c) >= 0x80;
}

// True when an absolute URL already addresses one of the proxy entry points
bool points_at_proxy(std::string_view p_absolute, const RewriteContext& p_ctx) {
    auto path = resolve_target(p_absolute).path;
    return path == p_ctx.proxy_base_path || starts_with(path, p_ctx.proxy_base_path + "/");
}

// Position of the quote closing a CSS string that opens at p_open, honouring
// backslash escapes
size_t find_css_string_end(std::string_view p_css, size_t p_open) {
    char quote = p_css[p_open];
    size_t j = p_open + 1;
    while (j < p_css.size() && p_css[j] != quote) {
        if (p_css[j] == '\n') {
            return std::string_view::npos;
        }
        j += p_css[j] == '\\' ? 2 : 1;
    }
    return j < p_css.size() ? j : std::string_view::npos;
}

/*
 * CSS
 *
 */

// Resolves CSS escapes (CSS Syntax 4.3.7) so the URL is resolved as the
// browser would see it
std::string css_unescape(std::string_view p_value) {
    std::string output;
    output.reserve(p_value.size());

    size_t i = 0;
    while (i < p_value.size()) {
        char c = p_value[i++];
        if (c != '\\') {
            output += c;
            continue;
        }
        if (i >= p_value.size()) {
            break;
        }

        if (is_hex_digit(p_value[i])) {
            unsigned long code_point = 0;
            size_t digits = 0;
            while (i < p_value.size() && digits < 6 && is_hex_digit(p_value[i])) {
                code_point = code_point * 16 + hex_value(p_value[i++]);
                ++digits;
            }
            if (i < p_value.size() && is_ascii_space(p_value[i])) {
                ++i;
            }
            append_utf8(output, code_point);
        } else if (p_value[i] == '\n') {
            // line continuation inside a string
            ++i;
        } else {
            output += p_value[i++];
        }
    }
    return output;
}

void collect_css_urls(std::string_view p_css, const RewriteContext& p_ctx,
                      std::vector<Replacement>& p_replacements, size_t p_offset = 0) {
    auto rewrite_span = [&](size_t start, size_t end) {
        auto raw = css_unescape(p_css.substr(start, end - start));
        auto rewritten = rewrite_url_token(raw, p_ctx);
        if (rewritten != raw) {
            p_replacements.push_back({p_offset + start, p_offset + end, std::move(rewritten)});
        }
    };

    size_t i = 0;
    while (i < p_css.size()) {
        char c = p_css[i];

        if (c == '/' && i + 1 < p_css.size() && p_css[i + 1] == '*') {
            auto end = p_css.find("*/", i + 2);
            if (end == std::string_view::npos) {
                return;
            }
            i = end + 2;
            continue;
        }

        if ((c == 'u' || c == 'U') && istarts_with(p_css.substr(i), "url(") &&
            (i == 0 || !is_css_ident_char(p_css[i - 1]))) {
            size_t j = i + 4;
            while (j < p_css.size() && is_ascii_space(p_css[j])) {
                ++j;
            }
            if (j >= p_css.size()) {
                return;
            }

            if (p_css[j] == '"' || p_css[j] == '\'') {
                auto close = find_css_string_end(p_css, j);
                if (close == std::string_view::npos) {
                    return;
                }
                rewrite_span(j + 1, close);
                i = close + 1;
            } else {
                auto close = p_css.find(')', j);
                if (close == std::string_view::npos) {
                    return;
                }
                size_t end = close;
                while (end > j && is_ascii_space(p_css[end - 1])) {
                    --end;
                }
                if (end > j) {
                    rewrite_span(j, end);
                }
                i = close + 1;
            }
            continue;
        }

        if (c == '@' && istarts_with(p_css.substr(i), "@import")) {
            size_t j = i + 7;
            while (j < p_css.size() && is_ascii_space(p_css[j])) {
                ++j;
            }
            if (j < p_css.size() && (p_css[j] == '"' || p_css[j] == '\'')) {
                auto close = find_css_string_end(p_css, j);
                if (close == std::string_view::npos) {
                    return;
                }
                rewrite_span(j + 1, close);
                i = close + 1;
            } else {
                // url(...) form, picked up by the branch above
                i = j;
            }
            continue;
        }

        if (c == '"' || c == '\'') {
            size_t j = i + 1;
            while (j < p_css.size() && p_css[j] != c && p_css[j] != '\n') {
                j += p_css[j] == '\\' ? 2 : 1;
            }
            i = j + 1;
            continue;
        }

        ++i;
    }
}

/*
 * JavaScript
 *
 */

// Identifier chain ("window.location.href") that ends right before p_end
std::string_view js_identifier_before(std::string_view p_js, size_t p_end) {
    while (p_end > 0 && is_ascii_space(p_js[p_end - 1])) {
        --p_end;
    }
    size_t start = p_end;
    while (start > 0 && (is_js_ident_char(p_js[start - 1]) || p_js[start - 1] == '.')) {
        --start;
    }
    return p_js.substr(start, p_end - start);
}

std::string_view last_segment(std::string_view p_chain) {
    auto dot = p_chain.rfind('.');
    return dot == std::string_view::npos ? p_chain : p_chain.substr(dot + 1);
}

bool is_url_taking_call(std::string_view p_callee) {
    auto name = last_segment(p_callee);
    if (name == "fetch" || name == "open" || name == "sendBeacon" || name == "importScripts" ||
        name == "EventSource" || name == "Worker") {
        return true;
    }
    return p_callee == "location.assign" || p_callee == "location.replace" ||
           iends_with(p_callee, ".location.assign") || iends_with(p_callee, ".location.replace");
}

bool is_url_property(std::string_view p_target) {
    auto name = last_segment(p_target);
    return name == "location" || name == "href" || name == "src" || name == "action";
}

// Whether the string literal starting at p_quote is passed to a
// fetch/navigation API or assigned to a URL property
bool in_navigation_position(std::string_view p_js, size_t p_quote) {
    size_t j = p_quote;
    while (j > 0 && is_ascii_space(p_js[j - 1])) {
        --j;
    }
    if (j == 0) {
        return false;
    }

    char previous = p_js[j - 1];
    if (previous == '(') {
        return is_url_taking_call(js_identifier_before(p_js, j - 1));
    }

    if (previous == '=') {
        if (j >= 2 && std::strchr("=!<>+-*/%&|^", p_js[j - 2]) != nullptr) {
            return false;
        }
        return is_url_property(js_identifier_before(p_js, j - 1));
    }

    if (previous == ',') {
        // XMLHttpRequest.open(method, url)
        size_t k = j - 1;
        while (k > 0 && is_ascii_space(p_js[k - 1])) {
            --k;
        }
        if (k == 0 || (p_js[k - 1] != '"' && p_js[k - 1] != '\'')) {
            return false;
        }
        char quote = p_js[k - 1];
        auto open_quote = k >= 2 ? p_js.rfind(quote, k - 2) : std::string_view::npos;
        if (open_quote == std::string_view::npos) {
            return false;
        }
        size_t m = open_quote;
        while (m > 0 && is_ascii_space(p_js[m - 1])) {
            --m;
        }
        if (m == 0 || p_js[m - 1] != '(') {
            return false;
        }
        return last_segment(js_identifier_before(p_js, m - 1)) == "open";
    }

    return false;
}

bool looks_like_url(std::string_view p_value) {
    if (p_value.empty() || p_value.find_first_of(" \t\r\n\\") != std::string_view::npos) {
        return false;
    }
    if (istarts_with(p_value, "http://") || istarts_with(p_value, "https://")) {
        return true;
    }
    if (starts_with(p_value, "//")) {
        return p_value.size() > 2 && is_ascii_alnum(p_value[2]);
    }
    return p_value.front() == '/' && p_value.size() > 1 && p_value[1] != '*';
}

void collect_javascript_urls(std::string_view p_js, const RewriteContext& p_ctx,
                             std::vector<Replacement>& p_replacements, size_t p_offset = 0) {
    size_t i = 0;
    while (i < p_js.size()) {
        char c = p_js[i];

        if (c == '/' && i + 1 < p_js.size() && p_js[i + 1] == '/') {
            auto eol = p_js.find('\n', i + 2);
            if (eol == std::string_view::npos) {
                return;
            }
            i = eol + 1;
            continue;
        }

        if (c == '/' && i + 1 < p_js.size() && p_js[i + 1] == '*') {
            auto end = p_js.find("*/", i + 2);
            if (end == std::string_view::npos) {
                return;
            }
            i = end + 2;
            continue;
        }

        if (c == '"' || c == '\'' || c == '`') {
            size_t j = i + 1;
            bool terminated = false;
            while (j < p_js.size()) {
                if (p_js[j] == '\\') {
                    j += 2;
                    continue;
                }
                if (p_js[j] == c) {
                    terminated = true;
                    break;
                }
                if (p_js[j] == '\n' && c != '`') {
                    break;
                }
                ++j;
            }

            if (!terminated) {
                i = j;
                continue;
            }

            auto literal = p_js.substr(i + 1, j - i - 1);
            bool interpolated = c == '`' && literal.find("${") != std::string_view::npos;
            if (!interpolated && looks_like_url(literal) && in_navigation_position(p_js, i)) {
                auto rewritten = rewrite_url_token(literal, p_ctx);
                if (rewritten != literal) {
                    p_replacements.push_back({p_offset + i + 1, p_offset + j, std::move(rewritten)});
                }
            }
            i = j + 1;
            continue;
        }

        ++i;
    }
}

/*
 * HTML
 *
 */

struct HtmlAttribute {
    std::string name;
    size_t value_start = 0;
    size_t value_end = 0;
    char quote = 0;
    bool has_value = false;
};

bool is_url_attribute(std::string_view p_name) {
    return p_name == "href" || p_name == "src" || p_name == "action" || p_name == "formaction" ||
           p_name == "poster" || p_name == "background";
}

bool is_javascript_type(std::string_view p_type) {
    auto type = trim(p_type);
    return type.empty() || iequals(type, "module") || ifind(type, "javascript") != std::string_view::npos ||
           ifind(type, "ecmascript") != std::string_view::npos;
}

std::string rewrite_srcset(std::string_view p_value, const RewriteContext& p_ctx) {
    std::vector<Replacement> replacements;

    size_t i = 0;
    while (i < p_value.size()) {
        while (i < p_value.size() && (is_ascii_space(p_value[i]) || p_value[i] == ',')) {
            ++i;
        }
        if (i >= p_value.size()) {
            break;
        }

        size_t url_start = i;
        while (i < p_value.size() && !is_ascii_space(p_value[i])) {
            ++i;
        }
        size_t url_end = i;
        bool has_descriptor = true;
        while (url_end > url_start && p_value[url_end - 1] == ',') {
            --url_end;
            has_descriptor = false;
        }

        auto url = p_value.substr(url_start, url_end - url_start);
        auto rewritten = rewrite_url_token(url, p_ctx);
        if (rewritten != url) {
            replacements.push_back({url_start, url_end, std::move(rewritten)});
        }

        if (has_descriptor) {
            int depth = 0;
            while (i < p_value.size() && (depth > 0 || p_value[i] != ',')) {
                if (p_value[i] == '(') {
                    ++depth;
                } else if (p_value[i] == ')' && depth > 0) {
                    --depth;
                }
                ++i;
            }
        }
    }

    return apply_replacements(p_value, replacements);
}

// content="5; url=/next"
std::string rewrite_refresh(std::string_view p_value, const RewriteContext& p_ctx) {
    auto url_pos = ifind(p_value, "url");
    if (url_pos == std::string_view::npos) {
        return std::string(p_value);
    }

    size_t i = url_pos + 3;
    while (i < p_value.size() && is_ascii_space(p_value[i])) {
        ++i;
    }
    if (i >= p_value.size() || p_value[i] != '=') {
        return std::string(p_value);
    }
    ++i;
    while (i < p_value.size() && is_ascii_space(p_value[i])) {
        ++i;
    }

    size_t end = p_value.size();
    if (i < p_value.size() && (p_value[i] == '"' || p_value[i] == '\'')) {
        auto close = p_value.find(p_value[i], i + 1);
        end = close == std::string_view::npos ? p_value.size() : close;
        ++i;
    }
    while (end > i && is_ascii_space(p_value[end - 1])) {
        --end;
    }

    auto url = p_value.substr(i, end - i);
    std::string result(p_value.substr(0, i));
    result += rewrite_url_token(url, p_ctx);
    result.append(p_value.data() + end, p_value.size() - end);
    return result;
}

class HtmlRewriter {
public:
    HtmlRewriter(std::string_view p_input, const RewriteContext& p_ctx)
        : input_(p_input), ctx_(p_ctx) {}

    std::string run();

private:
    size_t parse_tag(size_t p_lt);
    size_t skip_raw_text(size_t p_pos, std::string_view p_closing_tag, bool p_javascript, bool p_css);
    void rewrite_attributes(std::string_view p_tag, const std::vector<HtmlAttribute>& p_attributes,
                            size_t p_tag_end);
    void replace_attribute(const HtmlAttribute& p_attribute, std::string_view p_decoded,
                           const std::string& p_rewritten);

    std::string_view value_of(const HtmlAttribute& p_attribute) const {
        return input_.substr(p_attribute.value_start, p_attribute.value_end - p_attribute.value_start);
    }

    const HtmlAttribute* find_attribute(const std::vector<HtmlAttribute>& p_attributes,
                                        std::string_view p_name) const {
        for (const auto& attribute : p_attributes) {
            if (attribute.name == p_name) {
                return &attribute;
            }
        }
        return nullptr;
    }

    std::string_view input_;
    RewriteContext ctx_;
    std::vector<Replacement> replacements_;
    bool banner_inserted_ = false;
};

std::string HtmlRewriter::run() {
    size_t pos = 0;
    while (pos < input_.size()) {
        auto lt = input_.find('<', pos);
        if (lt == std::string_view::npos || lt + 1 >= input_.size()) {
            break;
        }

        if (starts_with(input_.substr(lt), "<!--")) {
            auto end = input_.find("-->", lt + 4);
            if (end == std::string_view::npos) {
                break;
            }
            pos = end + 3;
            continue;
        }

        char next = input_[lt + 1];
        if (next == '!' || next == '?' || next == '/') {
            auto gt = input_.find('>', lt);
            if (gt == std::string_view::npos) {
                break;
            }
            pos = gt + 1;
            continue;
        }

        if (!is_ascii_alpha(next)) {
            pos = lt + 1;
            continue;
        }

        pos = parse_tag(lt);
    }

    return apply_replacements(input_, replacements_);
}

size_t HtmlRewriter::parse_tag(size_t p_lt) {
    size_t i = p_lt + 1;
    while (i < input_.size() && (is_ascii_alnum(input_[i]) || input_[i] == '-' || input_[i] == ':')) {
        ++i;
    }
    auto tag = to_lower(input_.substr(p_lt + 1, i - p_lt - 1));

    std::vector<HtmlAttribute> attributes;
    bool closed = false;
    while (i < input_.size()) {
        while (i < input_.size() && is_ascii_space(input_[i])) {
            ++i;
        }
        if (i >= input_.size()) {
            break;
        }
        if (input_[i] == '>') {
            ++i;
            closed = true;
            break;
        }
        if (input_[i] == '/') {
            ++i;
            continue;
        }

        size_t name_start = i;
        while (i < input_.size() && !is_ascii_space(input_[i]) && input_[i] != '=' && input_[i] != '>' &&
               !(input_[i] == '/' && i + 1 < input_.size() && input_[i + 1] == '>')) {
            ++i;
        }
        if (i == name_start) {
            ++i;
            continue;
        }

        HtmlAttribute attribute;
        attribute.name = to_lower(input_.substr(name_start, i - name_start));

        size_t after_name = i;
        while (i < input_.size() && is_ascii_space(input_[i])) {
            ++i;
        }
        if (i < input_.size() && input_[i] == '=') {
            ++i;
            while (i < input_.size() && is_ascii_space(input_[i])) {
                ++i;
            }
            if (i < input_.size() && (input_[i] == '"' || input_[i] == '\'')) {
                char quote = input_[i];
                auto close = input_.find(quote, i + 1);
                if (close == std::string_view::npos) {
                    throw RewriteError("Unterminated value of attribute '" + attribute.name + "' in <" +
                                       tag + ">");
                }
                attribute.quote = quote;
                attribute.value_start = i + 1;
                attribute.value_end = close;
                i = close + 1;
            } else {
                attribute.value_start = i;
                while (i < input_.size() && !is_ascii_space(input_[i]) && input_[i] != '>') {
                    ++i;
                }
                attribute.value_end = i;
            }
            attribute.has_value = true;
        } else {
            i = after_name;
        }

        attributes.push_back(std::move(attribute));
    }

    if (!closed) {
        return input_.size();
    }

    rewrite_attributes(tag, attributes, i);

    if (tag == "style") {
        return skip_raw_text(i, "</style", false, true);
    }
    if (tag == "script") {
        const auto* type = find_attribute(attributes, "type");
        bool javascript = find_attribute(attributes, "src") == nullptr &&
                          (type == nullptr || is_javascript_type(value_of(*type)));
        return skip_raw_text(i, "</script", javascript, false);
    }
    if (tag == "textarea" || tag == "title") {
        return skip_raw_text(i, "</" + tag, false, false);
    }
    return i;
}

size_t HtmlRewriter::skip_raw_text(size_t p_pos, std::string_view p_closing_tag, bool p_javascript, bool p_css) {
    auto close = ifind(input_, p_closing_tag, p_pos);
    size_t end = close == std::string_view::npos ? input_.size() : close;
    auto text = input_.substr(p_pos, end - p_pos);

    if (p_css) {
        collect_css_urls(text, ctx_, replacements_, p_pos);
    } else if (p_javascript) {
        collect_javascript_urls(text, ctx_, replacements_, p_pos);
    }
    return end;
}

void HtmlRewriter::replace_attribute(const HtmlAttribute& p_attribute, std::string_view p_decoded,
                                     const std::string& p_rewritten) {
    if (p_rewritten == p_decoded) {
        return;
    }
    replacements_.push_back({p_attribute.value_start, p_attribute.value_end, html_escape_attribute(p_rewritten)});
}

void HtmlRewriter::rewrite_attributes(std::string_view p_tag, const std::vector<HtmlAttribute>& p_attributes,
                                      size_t p_tag_end) {
    const HtmlAttribute* action = nullptr;
    std::optional<TargetUrl> new_base;

    for (const auto& attribute : p_attributes) {
        if (!attribute.has_value) {
            continue;
        }

        auto decoded = html_unescape(value_of(attribute));

        if (is_url_attribute(attribute.name)) {
            replace_attribute(attribute, decoded, rewrite_url_token(decoded, ctx_));

            if (attribute.name == "action") {
                action = &attribute;
            }
            if (p_tag == "base" && attribute.name == "href") {
                try {
                    new_base = resolve_target(resolve_reference(ctx_.base, trim(decoded)));
                } catch (const InvalidTargetError&) {
                    // keep resolving against the document URL
                }
            }
        } else if (attribute.name == "srcset") {
            replace_attribute(attribute, decoded, rewrite_srcset(decoded, ctx_));
        } else if (attribute.name == "style") {
            std::vector<Replacement> replacements;
            collect_css_urls(decoded, ctx_, replacements);
            replace_attribute(attribute, decoded, apply_replacements(decoded, replacements));
        } else if (attribute.name == "content" && p_tag == "meta") {
            const auto* equiv = find_attribute(p_attributes, "http-equiv");
            if (equiv != nullptr && iequals(trim(value_of(*equiv)), "refresh")) {
                replace_attribute(attribute, decoded, rewrite_refresh(decoded, ctx_));
            }
        }
    }

    if (p_tag == "form") {
        // A GET submission replaces the query of the action URL, which
        // would drop our url parameter. Carry it as a form field instead.
        const auto* method = find_attribute(p_attributes, "method");
        if (method == nullptr || !method->has_value || iequals(trim(value_of(*method)), "get")) {
            std::string target = action != nullptr ? html_unescape(value_of(*action)) : std::string();
            auto value = trim(target);
            auto scheme = uri_scheme(value);
            if (scheme.empty() || iequals(scheme, "http") || iequals(scheme, "https")) {
                auto resolved = resolve_reference(ctx_.base, value);
                resolved = resolved.substr(0, resolved.find_first_of("?#"));
                bool already_proxied = true;
                try {
                    already_proxied = points_at_proxy(resolved, ctx_);
                } catch (const InvalidTargetError&) {
                    // the action was left as is, so there is nothing to carry
                }
                if (!already_proxied) {
                    replacements_.push_back({p_tag_end, p_tag_end,
                                             "<input type=\"hidden\" name=\"url\" value=\"" +
                                                 html_escape_attribute(resolved) + "\">"});
                }
            }
        }
    }

    if (p_tag == "body" && !banner_inserted_ && !ctx_.notice_banner.empty()) {
        replacements_.push_back({p_tag_end, p_tag_end, ctx_.notice_banner});
        banner_inserted_ = true;
    }

    if (new_base) {
        ctx_.base = std::move(*new_base);
    }
}

std::string_view media_type_of(std::string_view p_content_type) {
    return trim(p_content_type.substr(0, p_content_type.find(';')));
}

} // namespace

ContentKind classify_content_type(std::string_view p_content_type) {
    auto charset = ifind(p_content_type, "charset=");
    if (charset != std::string_view::npos) {
        auto value = trim(p_content_type.substr(charset + 8));
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            value.remove_prefix(1);
        }
        if (istarts_with(value, "utf-16") || istarts_with(value, "utf-32")) {
            return ContentKind::Passthrough;
        }
    }

    auto type = media_type_of(p_content_type);
    if (iequals(type, "text/html") || iequals(type, "application/xhtml+xml")) {
        return ContentKind::Html;
    }
    if (iequals(type, "text/css")) {
        return ContentKind::Css;
    }
    if (iequals(type, "application/javascript") || iequals(type, "text/javascript") ||
        iequals(type, "application/x-javascript") || iequals(type, "application/ecmascript") ||
        iequals(type, "text/ecmascript")) {
        return ContentKind::JavaScript;
    }
    return ContentKind::Passthrough;
}

const char* content_kind_name(ContentKind p_kind) {
    switch (p_kind) {
        case ContentKind::Html:        return "html";
        case ContentKind::Css:         return "css";
        case ContentKind::JavaScript:  return "javascript";
        case ContentKind::Passthrough: return "passthrough";
    }
    return "passthrough";
}

std::string rewrite_url_token(std::string_view p_raw, const RewriteContext& p_ctx) {
    auto value = trim(p_raw);
    if (value.empty() || value.front() == '#') {
        return std::string(p_raw);
    }

    auto scheme = uri_scheme(value);
    if (!scheme.empty() && !iequals(scheme, "http") && !iequals(scheme, "https")) {
        return std::string(p_raw);
    }

    // the path form of the entry point, "/proxy/https://..."
    if (starts_with(value, p_ctx.proxy_base_path + "/")) {
        return std::string(p_raw);
    }

    auto resolved = resolve_reference(p_ctx.base, value);

    std::string fragment;
    auto hash = resolved.find('#');
    if (hash != std::string::npos) {
        fragment = resolved.substr(hash);
        resolved.erase(hash);
    }

    try {
        if (points_at_proxy(resolved, p_ctx)) {
            return std::string(p_raw);
        }
    } catch (const InvalidTargetError&) {
        return std::string(p_raw);
    }

    return p_ctx.proxy_base_path + "?url=" + percent_encode(resolved) + fragment;
}

std::string rewrite_html(std::string_view p_body, const RewriteContext& p_ctx) {
    return HtmlRewriter(p_body, p_ctx).run();
}

std::string rewrite_css(std::string_view p_body, const RewriteContext& p_ctx) {
    std::vector<Replacement> replacements;
    collect_css_urls(p_body, p_ctx, replacements);
    return apply_replacements(p_body, replacements);
}

std::string rewrite_javascript(std::string_view p_body, const RewriteContext& p_ctx) {
    std::vector<Replacement> replacements;
    collect_javascript_urls(p_body, p_ctx, replacements);
    return apply_replacements(p_body, replacements);
}

std::string rewrite_content(std::string_view p_body, ContentKind p_kind, const RewriteContext& p_ctx) {
    switch (p_kind) {
        case ContentKind::Html:        return rewrite_html(p_body, p_ctx);
        case ContentKind::Css:         return rewrite_css(p_body, p_ctx);
        case ContentKind::JavaScript:  return rewrite_javascript(p_body, p_ctx);
        case ContentKind::Passthrough: break;
    }
    return std::string(p_body);
}

std::string rewrite_content(std::string_view p_body, std::string_view p_content_type,
                            const RewriteContext& p_ctx) {
    return rewrite_content(p_body, classify_content_type(p_content_type), p_ctx);
}
