#include "errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::SetupTimeout: return "setup timeout";
        case ErrorKind::RateLimited: return "rate limited";
        case ErrorKind::MalformedMessage: return "malformed message";
        case ErrorKind::Device: return "device";
        case ErrorKind::Request: return "request";
    }
    return "unknown";
}

RequestError RequestError::from_status(int status, const std::string& body) {
    std::string excerpt = body.substr(0, 200);
    if (status == 429) {
        return RequestError(ErrorKind::RateLimited, status, "Rate limited (429): " + excerpt);
    }
    return RequestError(ErrorKind::Request, status, "Request failed: " + std::to_string(status) + " " + excerpt);
}
