#pragma once

#include "http_message.hpp"

#include <exception>
#include <functional>
#include <memory>

// One in-flight upstream request
class UpstreamExchange {
public:
    virtual ~UpstreamExchange() = default;

    // Abandons the exchange; the completion callback is not invoked
    // afterwards.
    virtual void cancel() = 0;
};

// Exactly one of the arguments is meaningful: p_error is set when the
// upstream could not be reached (a ProxyError subclass).
using UpstreamCallback = std::function<void(UpstreamResponse p_response, std::exception_ptr p_error)>;

class Upstream {
public:
    virtual ~Upstream() = default;

    virtual std::shared_ptr<UpstreamExchange> forward(const ProxyRequest& p_request,
                                                      UpstreamCallback p_callback) = 0;
};
