#pragma once

#include <stdexcept>
#include <string>

// Base of every failure the proxy pipeline can report. Carries the
// status code the failure is surfaced as to the client.
class ProxyError : public std::runtime_error {
public:
    ProxyError(const std::string& message, int status)
        : std::runtime_error(message), status_(status) {}

    int http_status() const { return status_; }

private:
    int status_;
};

// Request has no "url" parameter
class MissingTargetError : public ProxyError {
public:
    explicit MissingTargetError(const std::string& message)
        : ProxyError(message, 400) {}
};

class InvalidTargetError : public ProxyError {
public:
    explicit InvalidTargetError(const std::string& message)
        : ProxyError(message, 400) {}
};

class UpstreamTimeoutError : public ProxyError {
public:
    explicit UpstreamTimeoutError(const std::string& message)
        : ProxyError(message, 504) {}
};

// DNS, connect, TLS and I/O failures talking to the target
class UpstreamUnreachableError : public ProxyError {
public:
    explicit UpstreamUnreachableError(const std::string& message)
        : ProxyError(message, 502) {}
};

// Content could not be scanned safely. Never reaches the client: the
// original body is relayed instead.
class RewriteError : public ProxyError {
public:
    explicit RewriteError(const std::string& message)
        : ProxyError(message, 500) {}
};
