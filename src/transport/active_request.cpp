#include "active_request.hpp"
#include "../utils/logger.h"

const char* request_state_name(RequestState state) {
    switch (state) {
    case RequestState::Created: return "created";
    case RequestState::Dispatched: return "dispatched";
    case RequestState::SendingResponse: return "sending";
    case RequestState::Completed: return "completed";
    case RequestState::Aborted: return "aborted";
    }
    return "unknown";
}

ActiveRequest::ActiveRequest(IncomingRequest request)
    : request_id_(generate_request_id()), state_(RequestState::Created),
      start_time_(std::chrono::steady_clock::now()),
      request_(std::move(request)) {
    if (!request_.abort) {
        request_.abort = std::make_shared<AbortSignal>();
    }
    LOG_DEBUG("Created ActiveRequest " << request_id_ << ": " << request_.method << " " << request_.target);
}

ActiveRequest::~ActiveRequest() {
    LOG_DEBUG("Destroyed ActiveRequest " << request_id_ << " (" << request_state_name(state_) << ")");
}

void ActiveRequest::set_state(RequestState state) {
    state_ = state;
    LOG_DEBUG("Request " << request_id_ << " state: " << request_state_name(state));
}

void ActiveRequest::abort() {
    auto state = state_.load();
    if (state == RequestState::Completed || state == RequestState::Aborted) {
        return;
    }
    set_state(RequestState::Aborted);
    LOG_INFO("Client left before response: " << request_.method << " " << request_.target
             << " after " << elapsed().count() << "ms");
    request_.abort->abort();
}

void ActiveRequest::complete(int status_code) {
    set_state(RequestState::Completed);
    LOG_INFO(request_.method << " " << request_.target << " -> " << status_code
             << " in " << elapsed().count() << "ms");
}

std::chrono::milliseconds ActiveRequest::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time_);
}

uint64_t ActiveRequest::generate_request_id() {
    static std::atomic<uint64_t> next_request_id{1};
    return next_request_id.fetch_add(1);
}
