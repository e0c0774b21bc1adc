#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

// Single-threaded timer loop. Tasks run in due-time order, ties in the order
// they were scheduled. In virtual time the clock only moves through advance(),
// which makes cadences deterministic for replay and tests. Only
// post_external() and stop() may be called from other threads.
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using TimerId = uint64_t;

    explicit EventLoop(bool virtual_time = false);

    Clock::time_point now() const;
    TimerId call_after(std::chrono::milliseconds delay, std::function<void()> fn);
    TimerId call_every(std::chrono::milliseconds period, std::function<void()> fn);
    TimerId post(std::function<void()> fn);
    // Hands a task to the loop thread from any thread; it runs on the next turn.
    void post_external(std::function<void()> fn);
    void cancel(TimerId id);
    bool pending(TimerId id) const { return index_.count(id) > 0; }
    size_t size() const { return tasks_.size(); }

    // Virtual time: moves the clock forward, running everything that falls due.
    void advance(std::chrono::milliseconds delta);
    // Runs due tasks until the deadline passes, stop() is called or nothing is left.
    void run_until(Clock::time_point deadline);
    void run();
    void stop();
private:
    using Key = std::pair<Clock::time_point, uint64_t>;
    struct Task {
        TimerId id;
        std::chrono::milliseconds period; // zero for one-shot
        std::function<void()> fn;
    };
    bool virtual_time_;
    std::atomic<bool> stopped_;
    Clock::time_point virtual_now_;
    uint64_t next_seq_;
    TimerId next_id_;
    std::map<Key, Task> tasks_;
    std::unordered_map<TimerId, Key> index_;
    std::mutex inbox_mutex_;
    std::condition_variable wake_;
    std::vector<std::function<void()>> inbox_;

    TimerId schedule(Clock::time_point due, std::chrono::milliseconds period, std::function<void()> fn,
                     TimerId reuse_id = 0);
    bool run_next_due(Clock::time_point limit);
    void drain_inbox();
    void wait_for_work(Clock::time_point until);
};
