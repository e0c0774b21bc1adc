#pragma once
#include <functional>
#include <memory>
#include <string>

struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_message;
    std::function<void(int code, const std::string& reason)> on_close;
    std::function<void(const std::string&)> on_error;
};

// Persistent text-message connection (a WebSocket in production). Handlers
// are invoked on the event-loop thread, one at a time, in arrival order.
class Transport {
public:
    virtual ~Transport() = default;
    virtual void open(const std::string& url, TransportHandlers handlers) = 0;
    virtual bool is_open() const = 0;
    virtual void send(const std::string& text) = 0;
    // Must not invoke on_close synchronously.
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
