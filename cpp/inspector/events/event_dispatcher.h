#pragma once

#include "inspector/core/types.h"
#include "inspector/events/deferred_scheduler.h"
#include "inspector/events/dispatch_queue.h"
#include "inspector/events/event.h"
#include "inspector/events/event_kind.h"
#include "inspector/events/event_payload.h"
#include "inspector/events/event_schema.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace inspector {

struct DispatchOptions {
    DispatchPriority priority = DispatchPriority::Normal;
    std::uint32_t debounceMs = 0;
    std::uint32_t throttleMs = 0;
    bool allowRetry = false;
    bool silent = false;
};

struct DispatcherConfig {
    std::size_t maxHistory = 100;
    std::uint32_t maxRetries = 3;
    double retryBaseDelayMs = 100.0;
    double retryMaxDelayMs = 3000.0;
    // Queued deliveries per drain pass before the rest moves to the next tick.
    std::size_t maxDrainPerTick = 10;
};

// Reported to error observers once per failing listener invocation.
struct ListenerFailure {
    std::string message;
    Event event;
    // 0 for the original delivery, n for the n-th retry.
    std::uint32_t attempt;
};

using Listener = std::function<void(const Event&)>;
using ErrorObserver = std::function<void(const ListenerFailure&)>;
// Idempotent; safe to call after the dispatcher is gone.
using Unsubscribe = std::function<void()>;

class EventDispatcher {
public:
    explicit EventDispatcher(
        DeferredScheduler& scheduler,
        EventSchemaRegistry schemas = EventSchemaRegistry::withDefaults(),
        DispatcherConfig config = {});
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // ==============================================================================
    // Registration
    // ==============================================================================
    Unsubscribe subscribe(EventKind kind, Listener listener);
    Unsubscribe subscribeOnce(EventKind kind, Listener listener);
    // Receives every delivered event after the kind-specific listeners.
    Unsubscribe subscribeAny(Listener listener);
    Unsubscribe onError(ErrorObserver observer);

    // ==============================================================================
    // Dispatch
    // ==============================================================================
    bool dispatch(EventKind kind, Payload payload = {}, const DispatchOptions& options = {});
    bool dispatch(std::string_view kindName, Payload payload = {}, const DispatchOptions& options = {});

    template <typename TypedPayloadT>
    bool dispatchTyped(const TypedPayloadT& typed, const DispatchOptions& options = {}) {
        return dispatch(TypedPayloadT::kKind, typed.toPayload(), options);
    }

    // ==============================================================================
    // Introspection
    // ==============================================================================
    std::vector<Event> getHistory() const;
    std::vector<Event> getHistory(EventKind kind) const;
    void clearHistory();

    std::size_t getListenerCount(EventKind kind) const;
    std::size_t getQueuedCount() const noexcept { return queuedCount(queues_); }
    std::size_t getPendingRetryCount() const noexcept { return retryTasks_.size(); }
    bool hasPendingDebounce(EventKind kind) const;
    bool isDispatching() const noexcept { return queues_.phase == DispatchPhase::Dispatching; }
    bool isDestroyed() const noexcept { return destroyed_; }
    DispatchError lastError() const noexcept { return lastError_; }

    const DispatcherConfig& config() const noexcept { return config_; }
    EventSchemaRegistry& schemas() noexcept { return schemas_; }
    const EventSchemaRegistry& schemas() const noexcept { return schemas_; }

    // ==============================================================================
    // Lifecycle
    // ==============================================================================
    // Drops listeners and every pending queue, debounce and retry; stays usable.
    void clear();
    // Idempotent. Afterwards every dispatch is rejected with DispatchError::Destroyed.
    void destroy();

private:
    // Removal flips `active`, so a delivery snapshot skips listeners removed mid-dispatch.
    struct ListenerSlot {
        Listener callback;
        bool active = true;
    };

    struct ListenerEntry {
        std::uint32_t id;
        std::shared_ptr<ListenerSlot> slot;
    };

    struct ObserverEntry {
        std::uint32_t id;
        std::shared_ptr<ErrorObserver> callback;
    };

    // Shared with the Unsubscribe closures; they only hold it weakly.
    struct ListenerTable {
        std::unordered_map<EventKind, std::vector<ListenerEntry>> byKind;
        std::vector<ListenerEntry> any;
        std::vector<ObserverEntry> observers;
        std::uint32_t nextId = 1;

        bool remove(EventKind kind, std::uint32_t id);
        bool removeAny(std::uint32_t id);
        bool removeObserver(std::uint32_t id);
        void deactivateAll();
    };

    bool reject(DispatchError error, std::string_view kindName, bool silent);
    Event makeEvent(EventKind kind, Payload payload, const DispatchOptions& options);
    std::string makeEventId(EventKind kind, std::int64_t timestamp);
    static std::string retryKey(const Event& event);

    void scheduleDebounced(EventKind kind, Payload payload, const DispatchOptions& options);
    bool acceptThrottled(EventKind kind, std::uint32_t throttleMs, bool silent);

    // Delivers now when idle, otherwise defers behind the current dispatch.
    void deliverOrQueue(QueuedEvent item);
    void deliver(const Event& event, bool silent);
    void drainQueued();
    void scheduleDrain();

    void notifyObservers(const ListenerFailure& failure);
    bool shouldRetry(const Event& event);
    void scheduleRetry(const Event& event, bool silent);
    void clearRetry(const std::string& key);
    std::uint32_t attemptFor(const Event& event) const;
    void dispatchListenerError(const Event& event, const std::string& message, std::uint32_t attempt);

    void recordHistory(const Event& event);
    void cancelPendingWork();

    DeferredScheduler& scheduler_;
    EventSchemaRegistry schemas_;
    DispatcherConfig config_;

    std::shared_ptr<ListenerTable> listeners_;
    DispatchQueues queues_;

    std::unordered_map<EventKind, DeferredScheduler::TaskId> debounceTasks_;
    std::unordered_map<EventKind, double> lastAccepted_;
    std::unordered_map<std::string, std::uint32_t> retryCounts_;
    std::unordered_map<std::string, DeferredScheduler::TaskId> retryTasks_;
    std::optional<DeferredScheduler::TaskId> drainTask_;

    std::deque<Event> history_;
    std::mt19937 idRng_;

    DispatchError lastError_ = DispatchError::Ok;
    bool destroyed_ = false;
};

} // namespace inspector
