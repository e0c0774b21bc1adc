#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "event_loop.hpp"
#include "text_completion.hpp"

// generateContent request body with an optional JPEG attachment.
nlohmann::json make_completion_request(const CompletionConfig& config, const std::string& prompt,
                                       const std::optional<std::vector<uint8_t>>& image);

// Joins the text parts of the first candidate. error is set on a non-2xx
// status or a body that is not a generateContent answer.
CompletionResult parse_completion_response(int status, const std::string& body);

// TextCompletion over HTTP(S) with Boost.Beast. Requests run on a small
// worker pool and answers are handed back to the event loop. Requests still
// queued when the object is destroyed are dropped without an answer.
class HttpTextCompletion : public TextCompletion {
public:
    HttpTextCompletion(EventLoop& loop, CompletionConfig config, std::string api_key);
    ~HttpTextCompletion() override;
    HttpTextCompletion(const HttpTextCompletion&) = delete;
    HttpTextCompletion& operator=(const HttpTextCompletion&) = delete;

    void complete(const std::string& prompt, const std::optional<std::vector<uint8_t>>& image,
                  Callback on_done) override;
private:
    struct Job {
        std::string body;
        Callback on_done;
    };
    EventLoop& loop_;
    CompletionConfig config_;
    std::string api_key_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Job> jobs_;
    bool stopping_;
    std::vector<std::thread> workers_;

    void worker();
    CompletionResult send_request(const std::string& body) const;
};
