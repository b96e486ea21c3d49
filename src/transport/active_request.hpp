#pragma once

#include "common.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

enum class RequestState {
    Created,
    Dispatched,
    SendingResponse,
    Completed,
    Aborted
};

const char* request_state_name(RequestState state);

// One client request from dispatch to the last byte of its response.
// The front-ends own it; the proxy handler only sees its abort signal.
class ActiveRequest {
public:
    explicit ActiveRequest(IncomingRequest request);
    ~ActiveRequest();

    RequestState get_state() const { return state_; }
    void set_state(RequestState state);

    const IncomingRequest& get_request() const { return request_; }

    // The client went away before the response was sent
    void abort();
    // Marks the response as sent and logs the request line with timing
    void complete(int status_code);

    std::chrono::milliseconds elapsed() const;

private:
    static uint64_t generate_request_id();

    uint64_t request_id_;
    std::atomic<RequestState> state_;
    std::chrono::steady_clock::time_point start_time_;
    IncomingRequest request_;
};
