#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <vector>

#include "utils/logger.h"
#include "common.h"

class RequestHandler {
    public:
        RequestHandler() = default;

        void register_route(std::string_view p_method,
                            std::string_view p_path,
                            RequestCB p_callback);
        // Matches every path below p_prefix ("/proxy/" matches "/proxy/x")
        void register_prefix_route(std::string_view p_method,
                                   std::string_view p_prefix,
                                   RequestCB p_callback);
        void handle_request(const IncomingRequest& p_request,
                            int32_t p_stream_id,
                            ResponseSender p_sender) const;
        static json create_error_response(int code, const std::string& message);
        static json create_success_response(const json& data);
    private:
        const RequestCB* find_route(std::string_view p_method, std::string_view p_path) const;
        bool path_is_routed(std::string_view p_path) const;
        void handle_default_routes(const IncomingRequest& p_request,
                                   int32_t stream_id,
                                   ResponseSender sender) const;

    private:
        std::map<RouteKey, RequestCB> route_handlers_;
        std::vector<std::pair<RouteKey, RequestCB>> prefix_handlers_;
};
