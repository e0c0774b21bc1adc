#pragma once
#include <chrono>
#include <functional>

// Shared backoff window after a rate-limit signal. One instance per process,
// handed to every component that calls the text-completion service.
class RateLimitGate {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::chrono::milliseconds DEFAULT_BACKOFF{45000};

    explicit RateLimitGate(std::chrono::milliseconds backoff = DEFAULT_BACKOFF,
                           std::function<Clock::time_point()> now = Clock::now);
    void arm();
    bool is_active() const;
    std::chrono::milliseconds remaining() const;
    void clear();
private:
    std::chrono::milliseconds backoff_;
    std::function<Clock::time_point()> now_;
    bool armed_;
    Clock::time_point armed_at_;
};
