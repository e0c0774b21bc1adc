#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Transport,
    SetupTimeout,
    RateLimited,
    MalformedMessage,
    Device,
    Request,
};

const char* to_string(ErrorKind kind);

// Raised by text-completion implementations on a non-success status.
class RequestError : public std::runtime_error {
public:
    RequestError(ErrorKind kind, int status, const std::string& message)
        : std::runtime_error(message), kind_(kind), status_(status) {}
    ErrorKind kind() const { return kind_; }
    int status() const { return status_; }
    bool rate_limited() const { return kind_ == ErrorKind::RateLimited; }
    static RequestError from_status(int status, const std::string& body);
private:
    ErrorKind kind_;
    int status_;
};

// Microphone or camera unavailable. what() is suitable for showing to the user.
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& message) : std::runtime_error(message) {}
};
