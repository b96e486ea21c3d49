#include "http_message.hpp"
#include "text_util.hpp"

const std::string* find_header(const HeaderList& p_headers, std::string_view p_name) {
    for (const auto& [name, value] : p_headers) {
        if (iequals(name, p_name)) {
            return &value;
        }
    }
    return nullptr;
}

std::vector<std::string> header_values(const HeaderList& p_headers, std::string_view p_name) {
    std::vector<std::string> values;
    for (const auto& [name, value] : p_headers) {
        if (iequals(name, p_name)) {
            values.push_back(value);
        }
    }
    return values;
}

TargetUrl upstream_url(const ProxyRequest& p_request) {
    TargetUrl url = p_request.target;
    append_query(url, p_request.query_params);
    return url;
}

const char* method_name(ProxyMethod p_method) {
    switch (p_method) {
        case ProxyMethod::Get:  return "GET";
        case ProxyMethod::Post: return "POST";
    }
    return "GET";
}
