#include <gtest/gtest.h>
#include <optional>
#include "errors.hpp"
#include "fakes.hpp"
#include "tool_bridge.hpp"

using json = nlohmann::json;
using std::chrono::milliseconds;

namespace {

ToolCall execute_call(const std::string& id, const std::string& task) {
    return ToolCall{id, EXECUTE_TOOL_NAME, {{"task", task}}};
}

class ToolBridgeTest : public ::testing::Test {
protected:
    ToolBridgeTest()
        : loop(true),
          bridge(loop, executor, [this](const ToolResponse& r) { responses.push_back(r); }, milliseconds(30000)) {}

    EventLoop loop;
    FakeExecutor executor;
    std::vector<ToolResponse> responses;
    ToolCallBridge bridge;
};

} // namespace

TEST_F(ToolBridgeTest, ForwardsTaskAndRespondsWithResult) {
    bridge.handle(execute_call("c1", "add oat milk to my list"));
    ASSERT_EQ(executor.tasks.size(), 1u);
    EXPECT_EQ(executor.tasks[0], "add oat milk to my list");
    EXPECT_EQ(bridge.pending(), 1u);
    EXPECT_TRUE(responses.empty());

    executor.callbacks[0]({true, "Added oat milk"});
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].id, "c1");
    EXPECT_EQ(responses[0].name, "execute");
    EXPECT_EQ(*responses[0].result, "Added oat milk");
    EXPECT_FALSE(responses[0].error.has_value());
    EXPECT_EQ(bridge.pending(), 0u);
    EXPECT_EQ(loop.size(), 0u);
}

TEST_F(ToolBridgeTest, ExecutorFailureBecomesErrorResponse) {
    bridge.handle(execute_call("c1", "send a message"));
    executor.callbacks[0]({false, "No messaging account"});
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(*responses[0].error, "No messaging account");
}

TEST_F(ToolBridgeTest, TimesOutWithErrorAndIgnoresLateResult) {
    bridge.handle(execute_call("slow", "research halal certification"));
    loop.advance(milliseconds(29999));
    EXPECT_TRUE(responses.empty());
    loop.advance(milliseconds(1));
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].id, "slow");
    EXPECT_EQ(*responses[0].error, "Tool call timed out");

    executor.callbacks[0]({true, "too late"});
    EXPECT_EQ(responses.size(), 1u);
}

TEST_F(ToolBridgeTest, InvalidCallsAreAnsweredImmediately) {
    bridge.handle(ToolCall{"u1", "lookup", {{"task", "x"}}});
    bridge.handle(ToolCall{"u2", EXECUTE_TOOL_NAME, json::object()});
    bridge.handle(ToolCall{"u3", EXECUTE_TOOL_NAME, {{"task", "   "}}});
    bridge.handle(ToolCall{"u4", EXECUTE_TOOL_NAME, {{"task", 42}}});
    ASSERT_EQ(responses.size(), 4u);
    EXPECT_NE(responses[0].error->find("Unknown tool"), std::string::npos);
    for (size_t i = 1; i < responses.size(); ++i) {
        EXPECT_TRUE(responses[i].error.has_value());
    }
    EXPECT_TRUE(executor.tasks.empty());
}

TEST_F(ToolBridgeTest, CancelAllDropsPendingCalls) {
    bridge.handle(execute_call("a", "one"));
    bridge.handle(execute_call("b", "two"));
    bridge.cancel_all();
    EXPECT_EQ(bridge.pending(), 0u);
    loop.advance(milliseconds(60000));
    executor.callbacks[1]({true, "done"});
    EXPECT_TRUE(responses.empty());
}

TEST_F(ToolBridgeTest, ConcurrentCallsKeepTheirOwnIds) {
    bridge.handle(execute_call("a", "one"));
    bridge.handle(execute_call("b", "two"));
    executor.callbacks[1]({true, "second"});
    executor.callbacks[0]({true, "first"});
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].id, "b");
    EXPECT_EQ(responses[1].id, "a");
}

TEST(ToolBridgeLifetimeTest, ResultAfterBridgeDestroyedIsHarmless) {
    EventLoop loop(true);
    FakeExecutor executor;
    int responses = 0;
    {
        ToolCallBridge bridge(loop, executor, [&](const ToolResponse&) { ++responses; });
        bridge.handle(execute_call("a", "one"));
    }
    executor.callbacks[0]({true, "done"});
    loop.advance(milliseconds(60000));
    EXPECT_EQ(responses, 0);
}

TEST(CompletionTaskExecutorTest, ReturnsBeforeTheAnswerArrives) {
    EventLoop loop(true);
    FakeCompletion completion(&loop);
    completion.answer = []() { return std::string("Oat milk is $3.49 nearby."); };
    RateLimitGate gate;
    CompletionTaskExecutor executor(completion, gate);
    std::optional<TaskResult> result;
    executor.execute("find oat milk price", [&](const TaskResult& r) { result = r; });
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(completion.prompts[0], "find oat milk price");
    EXPECT_FALSE(completion.had_image[0]);

    loop.advance(milliseconds(0));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->text, "Oat milk is $3.49 nearby.");
}

TEST(CompletionTaskExecutorTest, EmptyAnswerBecomesOk) {
    FakeCompletion completion;
    completion.answer = []() { return std::string(); };
    RateLimitGate gate;
    CompletionTaskExecutor executor(completion, gate);
    std::optional<TaskResult> result;
    executor.execute("turn on reminders", [&](const TaskResult& r) { result = r; });
    completion.release();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->text, "OK");
}

TEST(CompletionTaskExecutorTest, RateLimitArmsGateAndFailsLaterCalls) {
    EventLoop loop(true);
    FakeCompletion completion(&loop);
    completion.answer = []() -> std::string { throw RequestError::from_status(429, "quota"); };
    RateLimitGate gate;
    CompletionTaskExecutor executor(completion, gate);
    std::vector<TaskResult> results;
    executor.execute("a", [&](const TaskResult& r) { results.push_back(r); });
    loop.advance(milliseconds(0));
    executor.execute("b", [&](const TaskResult& r) { results.push_back(r); });
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].success);
    EXPECT_FALSE(results[1].success);
    EXPECT_TRUE(gate.is_active());
    EXPECT_EQ(completion.prompts.size(), 1u);
}

TEST(CompletionTaskExecutorTest, SlowAnswerTimesOutThroughTheBridge) {
    EventLoop loop(true);
    FakeCompletion completion(&loop);
    completion.hold = true;
    RateLimitGate gate;
    CompletionTaskExecutor executor(completion, gate);
    std::vector<ToolResponse> responses;
    ToolCallBridge bridge(loop, executor, [&](const ToolResponse& r) { responses.push_back(r); },
                          milliseconds(30000));

    bridge.handle(execute_call("slow", "compare every cereal price in town"));
    EXPECT_EQ(bridge.pending(), 1u);
    EXPECT_TRUE(responses.empty());
    loop.advance(milliseconds(29999));
    EXPECT_TRUE(responses.empty());
    loop.advance(milliseconds(1));
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].id, "slow");
    ASSERT_TRUE(responses[0].error.has_value());
    EXPECT_EQ(*responses[0].error, "Tool call timed out");

    // The late answer is dropped
    completion.release();
    EXPECT_EQ(responses.size(), 1u);
    EXPECT_EQ(bridge.pending(), 0u);
}
