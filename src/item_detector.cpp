#include "item_detector.hpp"
#include "detection_parser.hpp"
#include "errors.hpp"
#include <iostream>

const char* const DETECTION_PROMPT =
    "You are analyzing a single image from a grocery store or kitchen. List every visible product or food "
    "item that a shopper might pick up.\n\n"
    "CRITICAL: Always use SPECIFIC product or food names. Examples: \"canned tuna\", \"olive oil\", "
    "\"vitamin D bottle\", \"greek yogurt\", \"oatmeal box\". Never use only generic words like \"box\", "
    "\"bottle\", \"can\", \"container\"; identify what is inside or what the product is.\n\n"
    "Respond with ONLY a JSON array, no other text. Each element: "
    "{ \"label\": \"short specific product name\", \"bbox\": { \"x\", \"y\", \"width\", \"height\" } }.\n"
    "Use normalized coordinates 0-1: x,y = top-left corner of the item, width and height = size.";

ItemDetector::ItemDetector(TextCompletion& completion, RateLimitGate& gate)
    : completion(completion), gate(gate), in_flight_(false), generation_(0), alive_(std::make_shared<bool>(true)) {}

ItemDetector::~ItemDetector() {
    alive_.reset();
}

bool ItemDetector::detect(const std::vector<uint8_t>& jpeg, Callback on_done) {
    if (gate.is_active() || in_flight_) return false;
    in_flight_ = true;
    uint64_t gen = generation_;
    std::weak_ptr<bool> alive = alive_;
    completion.complete(DETECTION_PROMPT, jpeg, [this, alive, gen, on_done](const CompletionResult& result) {
        if (alive.expired() || gen != generation_) return;
        in_flight_ = false;
        DetectionOutcome outcome;
        if (result.error) {
            if (result.error->rate_limited()) gate.arm();
            std::cerr << "[Detector] " << result.error->what() << std::endl;
            outcome.error = result.error;
        } else {
            outcome.items = parse_detection_json(result.text);
        }
        if (on_done) on_done(outcome);
    });
    return true;
}

void ItemDetector::cancel() {
    ++generation_;
    in_flight_ = false;
}
