#include "inspector/events/dispatch_queue.h"

#include <utility>

namespace inspector {

DispatchQueues beginDispatch(DispatchQueues queues) {
    queues.phase = DispatchPhase::Dispatching;
    return queues;
}

DispatchQueues endDispatch(DispatchQueues queues) {
    queues.phase = DispatchPhase::Idle;
    return queues;
}

DispatchQueues enqueueDeferred(DispatchQueues queues, QueuedEvent item) {
    if (item.event.priority == DispatchPriority::High) {
        queues.priorityQueue.push_back(std::move(item));
    } else {
        queues.normalQueue.push_back(std::move(item));
    }
    return queues;
}

DrainStep takeNextQueued(DispatchQueues queues) {
    DrainStep step;
    if (queues.phase == DispatchPhase::Idle) {
        if (!queues.priorityQueue.empty()) {
            step.next = std::move(queues.priorityQueue.front());
            queues.priorityQueue.pop_front();
        } else if (!queues.normalQueue.empty()) {
            step.next = std::move(queues.normalQueue.front());
            queues.normalQueue.pop_front();
        }
    }
    step.queues = std::move(queues);
    return step;
}

DispatchQueues clearQueued(DispatchQueues queues) {
    queues.priorityQueue.clear();
    queues.normalQueue.clear();
    return queues;
}

bool hasQueued(const DispatchQueues& queues) noexcept {
    return !queues.priorityQueue.empty() || !queues.normalQueue.empty();
}

std::size_t queuedCount(const DispatchQueues& queues) noexcept {
    return queues.priorityQueue.size() + queues.normalQueue.size();
}

} // namespace inspector
