#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace inspector {

// Cancellable deferred actions against a host clock. Nothing runs on its own:
// the host calls runDue() once per frame, the same way the JS side polls the
// engine, and every due task runs synchronously inside that call.
class DeferredScheduler {
public:
    using TaskId = std::uint64_t;
    using Task = std::function<void()>;
    using Clock = std::function<double()>;

    // An empty clock falls back to emscripten_get_now().
    explicit DeferredScheduler(Clock clock = {});

    DeferredScheduler(const DeferredScheduler&) = delete;
    DeferredScheduler& operator=(const DeferredScheduler&) = delete;

    // Negative delays are treated as zero. Ids are never reused.
    TaskId schedule(double delayMs, Task task);
    bool cancel(TaskId id);
    void cancelAll();
    bool isPending(TaskId id) const;

    // Runs every task that was already scheduled when the pass started and is
    // due, ordered by due time and then by scheduling order. Tasks scheduled
    // during the pass wait for the next one. Returns the number of tasks run.
    std::size_t runDue();

    double now() const;
    std::size_t pendingCount() const noexcept { return tasks_.size(); }
    std::optional<double> nextDueTime() const;

private:
    struct Entry {
        double due;
        Task task;
    };

    Clock clock_;
    std::map<TaskId, Entry> tasks_;
    TaskId nextId_ = 1;
};

} // namespace inspector
