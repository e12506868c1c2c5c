#pragma once

#include "inspector/core/types.h"
#include "inspector/events/event_dispatcher.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace inspector {

struct SurfaceConfig {
    // Pointer enter/leave collapse to the last call within this window.
    std::uint32_t hoverDebounceMs = 16;
    DispatchPriority clickPriority = DispatchPriority::Normal;
};

// One UI surface (tree, viewport, properties panel) on the bus. Requests go
// out tagged with the surface's origin; canonical events caused by those
// requests are not handed back to the same surface.
class SyncSurface {
public:
    SyncSurface(EventDispatcher& dispatcher, InteractionOrigin self, SurfaceConfig config = {});
    ~SyncSurface();

    SyncSurface(const SyncSurface&) = delete;
    SyncSurface& operator=(const SyncSurface&) = delete;

    InteractionOrigin origin() const { return self_; }

    // Only canonical kinds are accepted.
    bool onCanonical(EventKind kind, Listener listener);

    bool requestSelection(const std::vector<NodeId>& ids, bool multi = false);
    bool clearSelection();
    bool requestFocus(const NodeId& id);
    bool clearFocus();
    bool pointerEnter(const NodeId& id);
    bool pointerLeave(const NodeId& id);
    bool requestIsolation(const std::vector<NodeId>& ids);
    bool requestVisibility(const std::vector<NodeId>& ids, bool visible);
    bool showAll();

    std::size_t suppressedCount() const { return suppressed_; }
    std::size_t deliveredCount() const { return delivered_; }

    void detach();

private:
    DispatchOptions clickOptions() const;
    DispatchOptions hoverOptions() const;

    EventDispatcher& dispatcher_;
    InteractionOrigin self_;
    SurfaceConfig config_;
    std::vector<Unsubscribe> subscriptions_;
    std::size_t suppressed_ = 0;
    std::size_t delivered_ = 0;
};

} // namespace inspector
