#include "request_handler.h"
#include "../utils/logger.h"


void RequestHandler::register_route(std::string_view p_method,
                                    std::string_view p_path,
                                    RequestCB p_callback) {
    RouteKey key = {std::string(p_method), std::string(p_path)};
    route_handlers_[key] = std::move(p_callback);
    LOG_INFO("Registered route: " << p_method << " " << p_path);
}

void RequestHandler::register_prefix_route(std::string_view p_method,
                                           std::string_view p_prefix,
                                           RequestCB p_callback) {
    prefix_handlers_.emplace_back(RouteKey{std::string(p_method), std::string(p_prefix)}, std::move(p_callback));
    LOG_INFO("Registered route: " << p_method << " " << p_prefix << "*");
}

const RequestCB* RequestHandler::find_route(std::string_view p_method, std::string_view p_path) const {
    auto it = route_handlers_.find(RouteKey{std::string(p_method), std::string(p_path)});
    if (it != route_handlers_.end()) {
        return &it->second;
    }

    for (const auto& [key, callback] : prefix_handlers_) {
        if (key.first == p_method && p_path.substr(0, key.second.size()) == key.second) {
            return &callback;
        }
    }
    return nullptr;
}

bool RequestHandler::path_is_routed(std::string_view p_path) const {
    for (const auto& [key, callback] : route_handlers_) {
        if (key.second == p_path) {
            return true;
        }
    }
    for (const auto& [key, callback] : prefix_handlers_) {
        if (p_path.substr(0, key.second.size()) == key.second) {
            return true;
        }
    }
    return false;
}

void RequestHandler::handle_request(const IncomingRequest& p_request,
                                    int32_t p_stream_id,
                                    ResponseSender p_sender) const {
    auto path = p_request.path();
    LOG_INFO("Processing " << p_request.method << " " << path);
    try
    {
        if (const auto* route = find_route(p_request.method, path)) {
            LOG_DEBUG("Found route: " << p_request.method << " " << path);
            (*route)(p_request, p_stream_id, p_sender);
            return;
        }
        if (path_is_routed(path)) {
            LOG_WARN("Method " << p_request.method << " not allowed for " << path);
            json error = create_error_response(405, "Method not allowed");
            p_sender(p_stream_id, HttpResponse(405, error.dump()));
            return;
        }
        LOG_DEBUG("No route found for: " << p_request.method << " " << path << ", using default handler");
        handle_default_routes(p_request, p_stream_id, p_sender);
    }
    catch(const std::exception& e)
    {
        LOG_ERROR("Request handling failed: " << e.what());
        json error = create_error_response(500, "Internal server error");
        p_sender(p_stream_id, HttpResponse(500, error.dump()));
    }
    
}

json RequestHandler::create_error_response(int code, const std::string& message)
{
    return {
        {"error", true},
        {"code", code},
        {"message", message}
    };
}

json RequestHandler::create_success_response(const json& data)
{
    json response = {
        {"success", true}
    };
    
    for (auto& [key, value] : data.items()) {
        response[key] = value;
    }
    
    return response;
}

void RequestHandler::handle_default_routes(const IncomingRequest& p_request,
                                           int32_t stream_id,
                                           ResponseSender sender) const {
    if (p_request.method == "GET" && p_request.path() == "/health") {
        json response = create_success_response({
            {"status", "ok"}
        });
        sender(stream_id, HttpResponse(200, response.dump()));
    }
    else {
        json error = create_error_response(404, "Route not found");
        sender(stream_id, HttpResponse(404, error.dump()));
    }
}
