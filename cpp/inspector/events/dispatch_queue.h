#pragma once

#include "inspector/events/event.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace inspector {

enum class DispatchPhase : std::uint8_t {
    Idle = 0,
    Dispatching = 1,
};

struct QueuedEvent {
    Event event;
    bool silent = false;
};

// Dispatch state machine plus the two deferral queues it owns. Every transition
// below takes the state by value and returns the next state, so the drain
// order can be tested without a dispatcher.
struct DispatchQueues {
    DispatchPhase phase = DispatchPhase::Idle;
    std::deque<QueuedEvent> priorityQueue;
    std::deque<QueuedEvent> normalQueue;
};

struct DrainStep {
    DispatchQueues queues;
    std::optional<QueuedEvent> next;
};

DispatchQueues beginDispatch(DispatchQueues queues);
DispatchQueues endDispatch(DispatchQueues queues);

// High priority goes to priorityQueue; Normal and Low share normalQueue.
DispatchQueues enqueueDeferred(DispatchQueues queues, QueuedEvent item);

// Pops the next event to deliver: priorityQueue first, FIFO within a queue.
// Yields nothing while a dispatch is in progress or when both queues are empty.
DrainStep takeNextQueued(DispatchQueues queues);

DispatchQueues clearQueued(DispatchQueues queues);

bool hasQueued(const DispatchQueues& queues) noexcept;
std::size_t queuedCount(const DispatchQueues& queues) noexcept;

} // namespace inspector
