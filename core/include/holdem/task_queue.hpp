#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <vector>

namespace holdem {

/// Single-threaded queue of delayed continuations.
/// Each task carries a guard that is re-checked right before it runs;
/// a task whose guard fails is dropped without running.
class TaskQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;
    using Guard = std::function<bool()>;

    void schedule(std::chrono::milliseconds delay, Guard guard, Task task);

    /// Runs every task due at or before `now`. Returns the number of tasks that actually ran.
    std::size_t run_ready(Clock::time_point now = Clock::now());

    /// Runs the earliest task regardless of its due time. Returns false if the queue is empty.
    bool run_next();

    /// Runs tasks in due order until the queue is empty or `limit` tasks were popped.
    std::size_t drain(std::size_t limit = 10000);

    std::optional<Clock::time_point> next_due() const;
    std::size_t pending() const { return tasks_.size(); }
    bool empty() const { return tasks_.empty(); }
    void clear();

    /// Tasks dropped because their guard failed.
    uint64_t dropped() const { return dropped_; }

private:
    struct Entry {
        Clock::time_point due;
        uint64_t sequence;
        Guard guard;
        Task task;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.due != b.due) {
                return a.due > b.due;
            }
            return a.sequence > b.sequence;
        }
    };

    bool pop_and_run();

    std::priority_queue<Entry, std::vector<Entry>, Later> tasks_;
    uint64_t next_sequence_ = 0;
    uint64_t dropped_ = 0;
};

}  // namespace holdem
