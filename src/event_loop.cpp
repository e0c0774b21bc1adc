#include "event_loop.hpp"

EventLoop::EventLoop(bool virtual_time)
    : virtual_time_(virtual_time), stopped_(false), virtual_now_(Clock::time_point{}), next_seq_(0), next_id_(1) {}

EventLoop::Clock::time_point EventLoop::now() const {
    return virtual_time_ ? virtual_now_ : Clock::now();
}

EventLoop::TimerId EventLoop::schedule(Clock::time_point due, std::chrono::milliseconds period,
                                       std::function<void()> fn, TimerId reuse_id) {
    TimerId id = reuse_id ? reuse_id : next_id_++;
    Key key{due, next_seq_++};
    tasks_.emplace(key, Task{id, period, std::move(fn)});
    index_[id] = key;
    return id;
}

EventLoop::TimerId EventLoop::call_after(std::chrono::milliseconds delay, std::function<void()> fn) {
    return schedule(now() + delay, std::chrono::milliseconds(0), std::move(fn));
}

EventLoop::TimerId EventLoop::call_every(std::chrono::milliseconds period, std::function<void()> fn) {
    if (period.count() <= 0) period = std::chrono::milliseconds(1);
    return schedule(now() + period, period, std::move(fn));
}

EventLoop::TimerId EventLoop::post(std::function<void()> fn) {
    return schedule(now(), std::chrono::milliseconds(0), std::move(fn));
}

void EventLoop::post_external(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.push_back(std::move(fn));
    }
    wake_.notify_one();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        stopped_ = true;
    }
    wake_.notify_all();
}

void EventLoop::drain_inbox() {
    std::vector<std::function<void()>> incoming;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        incoming.swap(inbox_);
    }
    for (auto& fn : incoming) post(std::move(fn));
}

void EventLoop::wait_for_work(Clock::time_point until) {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    wake_.wait_until(lock, until, [this]() { return !inbox_.empty() || stopped_; });
}

void EventLoop::cancel(TimerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return;
    tasks_.erase(it->second);
    index_.erase(it);
}

bool EventLoop::run_next_due(Clock::time_point limit) {
    if (tasks_.empty()) return false;
    auto first = tasks_.begin();
    if (first->first.first > limit) return false;
    Clock::time_point due = first->first.first;
    Task task = std::move(first->second);
    tasks_.erase(first);
    index_.erase(task.id);
    if (virtual_time_ && due > virtual_now_) virtual_now_ = due;
    if (task.period.count() > 0) {
        // Rescheduled before running so the task can cancel itself
        schedule(due + task.period, task.period, task.fn, task.id);
    }
    task.fn();
    return true;
}

void EventLoop::advance(std::chrono::milliseconds delta) {
    Clock::time_point target = now() + delta;
    stopped_ = false;
    while (!stopped_) {
        drain_inbox();
        if (!run_next_due(target)) break;
    }
    if (virtual_time_ && virtual_now_ < target) virtual_now_ = target;
}

void EventLoop::run_until(Clock::time_point deadline) {
    stopped_ = false;
    while (!stopped_) {
        drain_inbox();
        if (tasks_.empty()) break;
        Clock::time_point next = tasks_.begin()->first.first;
        if (next > deadline) break;
        if (virtual_time_) {
            run_next_due(next);
            continue;
        }
        if (next > Clock::now()) {
            // Woken early by post_external() or stop()
            wait_for_work(next);
            continue;
        }
        run_next_due(Clock::now());
    }
    if (virtual_time_ && !stopped_ && virtual_now_ < deadline && deadline != Clock::time_point::max()) {
        virtual_now_ = deadline;
    }
}

void EventLoop::run() {
    run_until(Clock::time_point::max());
}
