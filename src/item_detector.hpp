#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "data_types.hpp"
#include "errors.hpp"
#include "rate_limit.hpp"
#include "text_completion.hpp"

extern const char* const DETECTION_PROMPT;

struct DetectionOutcome {
    std::vector<DetectedItem> items;
    std::optional<RequestError> error;
};

// One detection cycle through the text-completion collaborator. At most one
// request is in flight; a rate-limited failure arms the shared gate.
class ItemDetector {
public:
    using Callback = std::function<void(const DetectionOutcome&)>;

    ItemDetector(TextCompletion& completion, RateLimitGate& gate);
    ~ItemDetector();
    ItemDetector(const ItemDetector&) = delete;
    ItemDetector& operator=(const ItemDetector&) = delete;

    // False when skipped: backoff window active or a request still in flight.
    bool detect(const std::vector<uint8_t>& jpeg, Callback on_done);
    // Drops the answer of the request in flight, if any.
    void cancel();
    bool in_flight() const { return in_flight_; }
private:
    TextCompletion& completion;
    RateLimitGate& gate;
    bool in_flight_;
    uint64_t generation_;
    std::shared_ptr<bool> alive_;
};
