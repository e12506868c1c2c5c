#ifndef MODEL_INSPECTOR_CONTEXT_H
#define MODEL_INSPECTOR_CONTEXT_H

#include "inspector/events/deferred_scheduler.h"
#include "inspector/events/event_dispatcher.h"
#include "inspector/protocol_types.h"
#include "inspector/selection/selection_state.h"
#include "inspector/sync/sync_coordinator.h"
#include "inspector/sync/sync_surface.h"

#include <cstddef>
#include <memory>

namespace inspector {

struct InspectorConfig {
    DispatcherConfig dispatcher;
    SyncConfig sync;
};

// Everything one inspection session needs, built in dependency order and
// torn down in reverse. Nothing here is global: tests build as many
// independent contexts as they like.
class InspectorContext {
public:
    explicit InspectorContext(InspectorConfig config = {}, DeferredScheduler::Clock clock = {});
    ~InspectorContext();

    InspectorContext(const InspectorContext&) = delete;
    InspectorContext& operator=(const InspectorContext&) = delete;

    DeferredScheduler& scheduler() { return scheduler_; }
    EventDispatcher& dispatcher() { return dispatcher_; }
    const EventDispatcher& dispatcher() const { return dispatcher_; }
    SyncCoordinator& coordinator() { return coordinator_; }
    // Read-only; the coordinator is the only writer.
    const SelectionState& state() const { return state_; }

    std::unique_ptr<SyncSurface> createSurface(InteractionOrigin self, SurfaceConfig config = {});

    // Runs deferred work that is due: debounced dispatches, retries, queue drains.
    // Returns the number of tasks run.
    std::size_t tick();

    // Idempotent.
    void destroy();
    bool isDestroyed() const { return dispatcher_.isDestroyed(); }

    ProtocolInfo getProtocolInfo() const;

private:
    DeferredScheduler scheduler_;
    EventDispatcher dispatcher_;
    SelectionState state_;
    SyncCoordinator coordinator_;
};

} // namespace inspector

#endif // MODEL_INSPECTOR_CONTEXT_H
