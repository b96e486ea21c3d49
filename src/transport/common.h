#pragma once

#include "../proxy/http_message.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
using json = nlohmann::json;

// Fired by a front-end when the client goes away before its response
// was sent.
class AbortSignal {
public:
    void on_abort(std::function<void()> p_handler) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (aborted_) {
            lock.unlock();
            p_handler();
            return;
        }
        handler_ = std::move(p_handler);
    }

    void abort() {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (aborted_) {
                return;
            }
            aborted_ = true;
            handler.swap(handler_);
        }
        if (handler) {
            handler();
        }
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_;
    }

private:
    mutable std::mutex mutex_;
    std::function<void()> handler_;
    bool aborted_ = false;
};

struct IncomingRequest {
    std::string method;
    // request target as received: path plus optional query
    std::string target;
    std::string body;
    HeaderList headers;
    bool secure = false;
    std::shared_ptr<AbortSignal> abort;

    std::string path() const { return target.substr(0, target.find('?')); }
};

using ResponseSender = std::function<void(int32_t stream_id, const HttpResponse& response)>;
using RequestCB = std::function<void(const IncomingRequest& p_request,
                                     int32_t p_stream_id,
                                     ResponseSender p_sender)>;
using RouteKey = std::pair<std::string, std::string>; // {method, path}
