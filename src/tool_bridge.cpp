#include "tool_bridge.hpp"
#include "errors.hpp"
#include <iostream>

CompletionTaskExecutor::CompletionTaskExecutor(TextCompletion& completion, RateLimitGate& gate)
    : completion(completion), gate(gate) {}

void CompletionTaskExecutor::execute(const std::string& task, std::function<void(const TaskResult&)> done) {
    if (gate.is_active()) {
        done({false, "Rate limited, try again in " + std::to_string(gate.remaining().count() / 1000) + "s"});
        return;
    }
    completion.complete(task, std::nullopt, [this, done](const CompletionResult& result) {
        if (result.error) {
            if (result.error->rate_limited()) gate.arm();
            done({false, result.error->what()});
            return;
        }
        done({true, result.text.empty() ? "OK" : result.text});
    });
}

ToolCallBridge::ToolCallBridge(EventLoop& loop, TaskExecutor& executor, Responder respond,
                               std::chrono::milliseconds timeout)
    : loop_(loop),
      executor_(executor),
      respond_(std::move(respond)),
      timeout_(timeout),
      next_key_(1),
      alive_(std::make_shared<bool>(true)) {}

ToolCallBridge::~ToolCallBridge() {
    cancel_all();
}

void ToolCallBridge::handle(const ToolCall& call) {
    if (call.name != EXECUTE_TOOL_NAME) {
        respond_(ToolResponse::failure(call, "Unknown tool: " + call.name));
        return;
    }
    auto task = call.args.find("task");
    if (task == call.args.end() || !task->is_string() || trim(task->get<std::string>()).empty()) {
        respond_(ToolResponse::failure(call, "Missing required argument: task"));
        return;
    }

    uint64_t key = next_key_++;
    EventLoop::TimerId timer = loop_.call_after(timeout_, [this, key]() { expire(key); });
    pending_[key] = Pending{call, timer};
    std::cout << "[ToolBridge] executing " << call.id << ": " << task->get<std::string>() << std::endl;

    std::weak_ptr<bool> alive = alive_;
    executor_.execute(task->get<std::string>(), [this, alive, key](const TaskResult& result) {
        if (alive.expired()) return;
        finish(key, result);
    });
}

void ToolCallBridge::finish(uint64_t key, const TaskResult& result) {
    auto it = pending_.find(key);
    if (it == pending_.end()) return; // timed out or cancelled already
    ToolCall call = it->second.call;
    loop_.cancel(it->second.timer);
    pending_.erase(it);
    respond_(result.success ? ToolResponse::success(call, result.text) : ToolResponse::failure(call, result.text));
}

void ToolCallBridge::expire(uint64_t key) {
    auto it = pending_.find(key);
    if (it == pending_.end()) return;
    ToolCall call = it->second.call;
    pending_.erase(it);
    std::cerr << "[ToolBridge] " << call.id << " timed out after " << timeout_.count() << " ms" << std::endl;
    respond_(ToolResponse::failure(call, "Tool call timed out"));
}

void ToolCallBridge::cancel_all() {
    for (const auto& entry : pending_) loop_.cancel(entry.second.timer);
    pending_.clear();
}
