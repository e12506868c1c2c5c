#pragma once

#include "inspector/core/types.h"
#include "inspector/events/event_kind.h"
#include "inspector/events/event_payload.h"

#include <cstdint>
#include <string>

namespace inspector {

// One dispatched event. Listeners only ever see it through a const reference;
// retries redeliver the same instance, so `id` correlates attempts and history.
struct Event {
    EventKind kind;
    Payload payload;
    std::int64_t timestamp;
    std::string id;
    DispatchPriority priority;
    bool allowRetry;
};

} // namespace inspector
