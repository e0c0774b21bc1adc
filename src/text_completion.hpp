#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"

// Outcome of one completion request. error is set when the request failed;
// a 429 maps to ErrorKind::RateLimited.
struct CompletionResult {
    std::string text;
    std::optional<RequestError> error;
};

// Generic "ask a model for text" collaborator. complete() returns at once and
// on_done runs later on the event-loop thread, exactly once.
class TextCompletion {
public:
    using Callback = std::function<void(const CompletionResult&)>;

    virtual ~TextCompletion() = default;
    virtual void complete(const std::string& prompt, const std::optional<std::vector<uint8_t>>& image,
                          Callback on_done) = 0;
};
