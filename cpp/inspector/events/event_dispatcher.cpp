#include "inspector/events/event_dispatcher.h"
#include "inspector/core/logging.h"
#include "inspector/core/util.h"
#include "inspector/events/typed_payloads.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace inspector {

namespace {

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::size_t kEventIdSuffixLength = 9;

template <typename Entry>
bool eraseById(std::vector<Entry>& entries, std::uint32_t id) {
    const auto it = std::find_if(entries.begin(), entries.end(), [id](const Entry& e) { return e.id == id; });
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
}

} // namespace

// ==============================================================================
// ListenerTable
// ==============================================================================

bool EventDispatcher::ListenerTable::remove(EventKind kind, std::uint32_t id) {
    const auto list = byKind.find(kind);
    if (list == byKind.end()) return false;
    for (auto& entry : list->second) {
        if (entry.id == id) entry.slot->active = false;
    }
    const bool removed = eraseById(list->second, id);
    if (list->second.empty()) byKind.erase(list);
    return removed;
}

bool EventDispatcher::ListenerTable::removeAny(std::uint32_t id) {
    for (auto& entry : any) {
        if (entry.id == id) entry.slot->active = false;
    }
    return eraseById(any, id);
}

bool EventDispatcher::ListenerTable::removeObserver(std::uint32_t id) {
    return eraseById(observers, id);
}

void EventDispatcher::ListenerTable::deactivateAll() {
    for (auto& [kind, entries] : byKind) {
        (void)kind;
        for (auto& entry : entries) entry.slot->active = false;
    }
    for (auto& entry : any) entry.slot->active = false;
    byKind.clear();
    any.clear();
    observers.clear();
}

// ==============================================================================
// Construction
// ==============================================================================

EventDispatcher::EventDispatcher(DeferredScheduler& scheduler, EventSchemaRegistry schemas, DispatcherConfig config)
    : scheduler_(scheduler),
      schemas_(std::move(schemas)),
      config_(config),
      listeners_(std::make_shared<ListenerTable>()),
      idRng_(std::random_device{}()) {}

EventDispatcher::~EventDispatcher() {
    destroy();
}

// ==============================================================================
// Registration
// ==============================================================================

Unsubscribe EventDispatcher::subscribe(EventKind kind, Listener listener) {
    if (destroyed_ || !listener) return [] {};
    if (!isKnownEventKind(kind)) {
        INSPECTOR_LOG_WARN("subscribe: unknown event kind %u", static_cast<unsigned>(kind));
        return [] {};
    }

    auto slot = std::make_shared<ListenerSlot>();
    slot->callback = std::move(listener);
    const std::uint32_t id = listeners_->nextId++;
    listeners_->byKind[kind].push_back(ListenerEntry{id, std::move(slot)});

    std::weak_ptr<ListenerTable> weak = listeners_;
    return [weak, kind, id]() {
        if (auto table = weak.lock()) table->remove(kind, id);
    };
}

Unsubscribe EventDispatcher::subscribeOnce(EventKind kind, Listener listener) {
    if (destroyed_ || !listener) return [] {};
    if (!isKnownEventKind(kind)) {
        INSPECTOR_LOG_WARN("subscribeOnce: unknown event kind %u", static_cast<unsigned>(kind));
        return [] {};
    }

    const std::uint32_t id = listeners_->nextId++;
    std::weak_ptr<ListenerTable> weak = listeners_;
    auto slot = std::make_shared<ListenerSlot>();
    // The delivery snapshot keeps the slot (and this closure) alive after removal.
    slot->callback = [weak, kind, id, inner = std::move(listener)](const Event& event) {
        if (auto table = weak.lock()) table->remove(kind, id);
        inner(event);
    };
    listeners_->byKind[kind].push_back(ListenerEntry{id, std::move(slot)});

    return [weak, kind, id]() {
        if (auto table = weak.lock()) table->remove(kind, id);
    };
}

Unsubscribe EventDispatcher::subscribeAny(Listener listener) {
    if (destroyed_ || !listener) return [] {};

    auto slot = std::make_shared<ListenerSlot>();
    slot->callback = std::move(listener);
    const std::uint32_t id = listeners_->nextId++;
    listeners_->any.push_back(ListenerEntry{id, std::move(slot)});

    std::weak_ptr<ListenerTable> weak = listeners_;
    return [weak, id]() {
        if (auto table = weak.lock()) table->removeAny(id);
    };
}

Unsubscribe EventDispatcher::onError(ErrorObserver observer) {
    if (destroyed_ || !observer) return [] {};

    const std::uint32_t id = listeners_->nextId++;
    listeners_->observers.push_back(ObserverEntry{id, std::make_shared<ErrorObserver>(std::move(observer))});

    std::weak_ptr<ListenerTable> weak = listeners_;
    return [weak, id]() {
        if (auto table = weak.lock()) table->removeObserver(id);
    };
}

std::size_t EventDispatcher::getListenerCount(EventKind kind) const {
    const auto it = listeners_->byKind.find(kind);
    return it == listeners_->byKind.end() ? 0 : it->second.size();
}

// ==============================================================================
// Dispatch
// ==============================================================================

bool EventDispatcher::dispatch(std::string_view kindName, Payload payload, const DispatchOptions& options) {
    if (destroyed_) return reject(DispatchError::Destroyed, kindName, options.silent);
    const std::optional<EventKind> kind = parseEventKind(kindName);
    if (!kind) return reject(DispatchError::UnknownKind, kindName, options.silent);
    return dispatch(*kind, std::move(payload), options);
}

bool EventDispatcher::dispatch(EventKind kind, Payload payload, const DispatchOptions& options) {
    if (destroyed_) return reject(DispatchError::Destroyed, eventKindName(kind), options.silent);
    if (!isKnownEventKind(kind)) return reject(DispatchError::UnknownKind, "<unknown>", options.silent);

    std::string missingField;
    if (!schemas_.validate(kind, payload, missingField)) {
        lastError_ = DispatchError::ValidationFailed;
        if (!options.silent) {
            const std::string_view name = eventKindName(kind);
            INSPECTOR_LOG_WARN("dispatch %.*s: missing required field '%s' in %s",
                static_cast<int>(name.size()), name.data(), missingField.c_str(),
                describePayload(payload).c_str());
        }
        return false;
    }

    if (options.debounceMs > 0) {
        scheduleDebounced(kind, std::move(payload), options);
        lastError_ = DispatchError::Ok;
        return true;
    }

    if (options.throttleMs > 0 && !acceptThrottled(kind, options.throttleMs, options.silent)) {
        return false;
    }

    lastError_ = DispatchError::Ok;
    deliverOrQueue(QueuedEvent{makeEvent(kind, std::move(payload), options), options.silent});
    return true;
}

bool EventDispatcher::reject(DispatchError error, std::string_view kindName, bool silent) {
    lastError_ = error;
    if (!silent) {
        INSPECTOR_LOG_WARN("dispatch %.*s rejected: %s",
            static_cast<int>(kindName.size()), kindName.data(), dispatchErrorName(error));
    }
    (void)kindName;
    return false;
}

Event EventDispatcher::makeEvent(EventKind kind, Payload payload, const DispatchOptions& options) {
    Event event;
    event.kind = kind;
    event.payload = std::move(payload);
    event.timestamp = toTimestampMs(scheduler_.now());
    event.id = makeEventId(kind, event.timestamp);
    event.priority = options.priority;
    event.allowRetry = options.allowRetry;
    return event;
}

std::string EventDispatcher::makeEventId(EventKind kind, std::int64_t timestamp) {
    std::uniform_int_distribution<int> digit(0, 35);
    std::string suffix(kEventIdSuffixLength, '0');
    for (char& c : suffix) c = kBase36[digit(idRng_)];

    std::string id(eventKindName(kind));
    id += '-';
    id += std::to_string(timestamp);
    id += '-';
    id += suffix;
    return id;
}

std::string EventDispatcher::retryKey(const Event& event) {
    std::string key(eventKindName(event.kind));
    key += '-';
    key += event.id;
    return key;
}

void EventDispatcher::scheduleDebounced(EventKind kind, Payload payload, const DispatchOptions& options) {
    const auto pending = debounceTasks_.find(kind);
    if (pending != debounceTasks_.end()) {
        scheduler_.cancel(pending->second);
        debounceTasks_.erase(pending);
    }

    DispatchOptions immediate = options;
    immediate.debounceMs = 0;
    debounceTasks_[kind] = scheduler_.schedule(options.debounceMs,
        [this, kind, payload = std::move(payload), immediate]() mutable {
            debounceTasks_.erase(kind);
            dispatch(kind, std::move(payload), immediate);
        });
}

bool EventDispatcher::hasPendingDebounce(EventKind kind) const {
    return debounceTasks_.find(kind) != debounceTasks_.end();
}

bool EventDispatcher::acceptThrottled(EventKind kind, std::uint32_t throttleMs, bool silent) {
    const double now = scheduler_.now();
    const auto last = lastAccepted_.find(kind);
    if (last != lastAccepted_.end() && now - last->second < static_cast<double>(throttleMs)) {
        lastError_ = DispatchError::Throttled;
        if (!silent) {
            const std::string_view name = eventKindName(kind);
            INSPECTOR_LOG_DEBUG("dispatch %.*s throttled", static_cast<int>(name.size()), name.data());
        }
        return false;
    }
    lastAccepted_[kind] = now;
    return true;
}

// ==============================================================================
// Delivery
// ==============================================================================

void EventDispatcher::deliverOrQueue(QueuedEvent item) {
    if (isDispatching()) {
        queues_ = enqueueDeferred(std::move(queues_), std::move(item));
        return;
    }
    deliver(item.event, item.silent);
    drainQueued();
}

void EventDispatcher::deliver(const Event& event, bool silent) {
    queues_ = beginDispatch(std::move(queues_));
    recordHistory(event);

    std::vector<std::shared_ptr<ListenerSlot>> snapshot;
    const auto kindList = listeners_->byKind.find(event.kind);
    if (kindList != listeners_->byKind.end()) {
        for (const auto& entry : kindList->second) snapshot.push_back(entry.slot);
    }
    for (const auto& entry : listeners_->any) snapshot.push_back(entry.slot);

    const std::uint32_t attempt = attemptFor(event);
    std::vector<std::string> failures;
    for (const auto& slot : snapshot) {
        if (!slot->active) continue;
        std::string message;
        try {
            slot->callback(event);
            continue;
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }
        if (!silent) {
            const std::string_view name = eventKindName(event.kind);
            INSPECTOR_LOG_ERROR("listener for %.*s failed (attempt %u): %s",
                static_cast<int>(name.size()), name.data(), attempt, message.c_str());
        }
        notifyObservers(ListenerFailure{message, event, attempt});
        failures.push_back(std::move(message));
    }

    // Follow-up dispatches below are queued behind this pass, never nested in it.
    if (!destroyed_) {
        if (failures.empty()) {
            if (event.allowRetry) clearRetry(retryKey(event));
        } else if (shouldRetry(event)) {
            scheduleRetry(event, silent);
        } else {
            clearRetry(retryKey(event));
            if (event.kind != EventKind::Error) {
                for (const auto& message : failures) dispatchListenerError(event, message, attempt);
            }
        }
    }

    queues_ = endDispatch(std::move(queues_));
}

void EventDispatcher::drainQueued() {
    const std::size_t budget = std::max<std::size_t>(1, config_.maxDrainPerTick);
    std::size_t delivered = 0;
    while (!destroyed_ && hasQueued(queues_)) {
        if (delivered >= budget) {
            scheduleDrain();
            return;
        }
        DrainStep step = takeNextQueued(std::move(queues_));
        queues_ = std::move(step.queues);
        if (!step.next) return;
        deliver(step.next->event, step.next->silent);
        ++delivered;
    }
}

void EventDispatcher::scheduleDrain() {
    if (drainTask_ && scheduler_.isPending(*drainTask_)) return;
    drainTask_ = scheduler_.schedule(0.0, [this]() {
        drainTask_.reset();
        drainQueued();
    });
}

void EventDispatcher::notifyObservers(const ListenerFailure& failure) {
    std::vector<std::shared_ptr<ErrorObserver>> observers;
    observers.reserve(listeners_->observers.size());
    for (const auto& entry : listeners_->observers) observers.push_back(entry.callback);

    for (const auto& observer : observers) {
        try {
            (*observer)(failure);
        } catch (const std::exception& e) {
            INSPECTOR_LOG_ERROR("error observer failed: %s", e.what());
        } catch (...) {
            INSPECTOR_LOG_ERROR("error observer failed: non-standard exception");
        }
    }
}

// ==============================================================================
// Retry
// ==============================================================================

std::uint32_t EventDispatcher::attemptFor(const Event& event) const {
    if (retryCounts_.empty()) return 0;
    const auto it = retryCounts_.find(retryKey(event));
    return it == retryCounts_.end() ? 0 : it->second;
}

bool EventDispatcher::shouldRetry(const Event& event) {
    if (!event.allowRetry || event.kind == EventKind::Error) return false;
    return attemptFor(event) < config_.maxRetries;
}

void EventDispatcher::scheduleRetry(const Event& event, bool silent) {
    const std::string key = retryKey(event);
    const std::uint32_t count = attemptFor(event);
    const double delay = std::min(config_.retryBaseDelayMs * std::pow(2.0, static_cast<double>(count)),
                                  config_.retryMaxDelayMs);
    retryCounts_[key] = count + 1;

    const auto pending = retryTasks_.find(key);
    if (pending != retryTasks_.end()) scheduler_.cancel(pending->second);

    INSPECTOR_LOG_DEBUG("retry %s in %.0f ms (attempt %u)", key.c_str(), delay, count + 1);
    retryTasks_[key] = scheduler_.schedule(delay, [this, key, event, silent]() {
        retryTasks_.erase(key);
        if (destroyed_) return;
        deliverOrQueue(QueuedEvent{event, silent});
    });
}

void EventDispatcher::clearRetry(const std::string& key) {
    retryCounts_.erase(key);
    const auto pending = retryTasks_.find(key);
    if (pending != retryTasks_.end()) {
        scheduler_.cancel(pending->second);
        retryTasks_.erase(pending);
    }
}

void EventDispatcher::dispatchListenerError(const Event& event, const std::string& message, std::uint32_t attempt) {
    ErrorPayload error;
    error.error = "listener-error";
    error.message = message;
    error.eventKind = std::string(eventKindName(event.kind));
    error.eventId = event.id;
    error.attempt = attempt;

    DispatchOptions options;
    options.priority = DispatchPriority::High;
    options.silent = true;
    dispatchTyped(error, options);
}

// ==============================================================================
// History
// ==============================================================================

void EventDispatcher::recordHistory(const Event& event) {
    if (config_.maxHistory == 0) return;
    history_.push_back(event);
    while (history_.size() > config_.maxHistory) history_.pop_front();
}

std::vector<Event> EventDispatcher::getHistory() const {
    return std::vector<Event>(history_.begin(), history_.end());
}

std::vector<Event> EventDispatcher::getHistory(EventKind kind) const {
    std::vector<Event> out;
    for (const auto& event : history_) {
        if (event.kind == kind) out.push_back(event);
    }
    return out;
}

void EventDispatcher::clearHistory() {
    history_.clear();
}

// ==============================================================================
// Lifecycle
// ==============================================================================

void EventDispatcher::cancelPendingWork() {
    for (const auto& [kind, task] : debounceTasks_) {
        (void)kind;
        scheduler_.cancel(task);
    }
    for (const auto& [key, task] : retryTasks_) {
        (void)key;
        scheduler_.cancel(task);
    }
    if (drainTask_) scheduler_.cancel(*drainTask_);

    debounceTasks_.clear();
    retryTasks_.clear();
    retryCounts_.clear();
    lastAccepted_.clear();
    drainTask_.reset();
    queues_ = clearQueued(std::move(queues_));
}

void EventDispatcher::clear() {
    listeners_->deactivateAll();
    cancelPendingWork();
    lastError_ = DispatchError::Ok;
}

void EventDispatcher::destroy() {
    if (destroyed_) return;
    destroyed_ = true;
    listeners_->deactivateAll();
    cancelPendingWork();
    history_.clear();
    INSPECTOR_LOG_DEBUG("dispatcher destroyed");
}

} // namespace inspector
