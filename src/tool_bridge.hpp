#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include "event_loop.hpp"
#include "rate_limit.hpp"
#include "session_messages.hpp"
#include "text_completion.hpp"

constexpr std::chrono::milliseconds DEFAULT_TOOL_TIMEOUT{30000};

struct TaskResult {
    bool success;
    std::string text;
};

// Carries out an `execute` task. done() may be called synchronously or later
// from the event loop, at most once.
class TaskExecutor {
public:
    virtual ~TaskExecutor() = default;
    virtual void execute(const std::string& task, std::function<void(const TaskResult&)> done) = 0;
};

// Runs the task as a prompt against the text-completion service. Returns
// before the answer arrives; done() follows from the event loop.
class CompletionTaskExecutor : public TaskExecutor {
public:
    CompletionTaskExecutor(TextCompletion& completion, RateLimitGate& gate);
    void execute(const std::string& task, std::function<void(const TaskResult&)> done) override;
private:
    TextCompletion& completion;
    RateLimitGate& gate;
};

// Answers every tool call exactly once: with the executor's result, or with an
// error when the call is invalid or the executor does not finish in time.
class ToolCallBridge {
public:
    using Responder = std::function<void(const ToolResponse&)>;

    ToolCallBridge(EventLoop& loop, TaskExecutor& executor, Responder respond,
                   std::chrono::milliseconds timeout = DEFAULT_TOOL_TIMEOUT);
    ~ToolCallBridge();
    ToolCallBridge(const ToolCallBridge&) = delete;
    ToolCallBridge& operator=(const ToolCallBridge&) = delete;

    void handle(const ToolCall& call);
    // Forgets pending calls without responding; the session they belong to is gone.
    void cancel_all();
    size_t pending() const { return pending_.size(); }
private:
    struct Pending {
        ToolCall call;
        EventLoop::TimerId timer;
    };
    EventLoop& loop_;
    TaskExecutor& executor_;
    Responder respond_;
    std::chrono::milliseconds timeout_;
    uint64_t next_key_;
    std::map<uint64_t, Pending> pending_;
    std::shared_ptr<bool> alive_;

    void finish(uint64_t key, const TaskResult& result);
    void expire(uint64_t key);
};
