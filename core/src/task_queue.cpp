#include "holdem/task_queue.hpp"
#include "holdem/logging.hpp"
#include <utility>

namespace holdem {

void TaskQueue::schedule(std::chrono::milliseconds delay, Guard guard, Task task) {
    Entry entry{Clock::now() + delay, next_sequence_++, std::move(guard), std::move(task)};
    tasks_.push(std::move(entry));
}

bool TaskQueue::pop_and_run() {
    Entry entry = tasks_.top();
    tasks_.pop();
    if (entry.guard && !entry.guard()) {
        ++dropped_;
        log_debug("scheduler", "task_dropped", {{"sequence", entry.sequence}});
        return false;
    }
    entry.task();
    return true;
}

std::size_t TaskQueue::run_ready(Clock::time_point now) {
    std::size_t ran = 0;
    while (!tasks_.empty() && tasks_.top().due <= now) {
        if (pop_and_run()) {
            ++ran;
        }
    }
    return ran;
}

bool TaskQueue::run_next() {
    if (tasks_.empty()) {
        return false;
    }
    pop_and_run();
    return true;
}

std::size_t TaskQueue::drain(std::size_t limit) {
    std::size_t popped = 0;
    while (popped < limit && run_next()) {
        ++popped;
    }
    return popped;
}

std::optional<TaskQueue::Clock::time_point> TaskQueue::next_due() const {
    if (tasks_.empty()) {
        return std::nullopt;
    }
    return tasks_.top().due;
}

void TaskQueue::clear() {
    tasks_ = {};
}

}  // namespace holdem
