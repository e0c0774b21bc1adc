#include "rate_limit.hpp"
#include <iostream>

RateLimitGate::RateLimitGate(std::chrono::milliseconds backoff, std::function<Clock::time_point()> now)
    : backoff_(backoff), now_(std::move(now)), armed_(false) {}

void RateLimitGate::arm() {
    armed_ = true;
    armed_at_ = now_();
    std::cout << "[RateLimit] backing off for " << backoff_.count() << " ms" << std::endl;
}

bool RateLimitGate::is_active() const {
    return remaining().count() > 0;
}

std::chrono::milliseconds RateLimitGate::remaining() const {
    if (!armed_) return std::chrono::milliseconds(0);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - armed_at_);
    if (elapsed >= backoff_) return std::chrono::milliseconds(0);
    return backoff_ - elapsed;
}

void RateLimitGate::clear() {
    armed_ = false;
}
