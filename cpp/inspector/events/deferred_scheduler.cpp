#include "inspector/events/deferred_scheduler.h"
#include "inspector/core/util.h"

#include <utility>

namespace inspector {

DeferredScheduler::DeferredScheduler(Clock clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return hostNowMs(); };
    }
}

DeferredScheduler::TaskId DeferredScheduler::schedule(double delayMs, Task task) {
    const TaskId id = nextId_++;
    const double due = now() + (delayMs > 0.0 ? delayMs : 0.0);
    tasks_.emplace(id, Entry{due, std::move(task)});
    return id;
}

bool DeferredScheduler::cancel(TaskId id) {
    return tasks_.erase(id) > 0;
}

void DeferredScheduler::cancelAll() {
    tasks_.clear();
}

bool DeferredScheduler::isPending(TaskId id) const {
    return tasks_.find(id) != tasks_.end();
}

std::size_t DeferredScheduler::runDue() {
    const TaskId cutoff = nextId_;
    std::size_t ran = 0;

    while (true) {
        const double current = now();
        auto next = tasks_.end();
        for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
            if (it->first >= cutoff) break;
            if (it->second.due > current) continue;
            if (next == tasks_.end() || it->second.due < next->second.due) {
                next = it;
            }
        }
        if (next == tasks_.end()) break;

        // Erase before running so the task may reschedule or cancel freely.
        Task task = std::move(next->second.task);
        tasks_.erase(next);
        if (task) task();
        ++ran;
    }
    return ran;
}

double DeferredScheduler::now() const {
    return clock_();
}

std::optional<double> DeferredScheduler::nextDueTime() const {
    std::optional<double> earliest;
    for (const auto& [id, entry] : tasks_) {
        if (!earliest || entry.due < *earliest) earliest = entry.due;
    }
    return earliest;
}

} // namespace inspector
