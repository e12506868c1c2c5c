#include "inspector/sync/sync_surface.h"
#include "inspector/core/logging.h"
#include "inspector/events/typed_payloads.h"

#include <utility>

namespace inspector {

SyncSurface::SyncSurface(EventDispatcher& dispatcher, InteractionOrigin self, SurfaceConfig config)
    : dispatcher_(dispatcher), self_(self), config_(config) {}

SyncSurface::~SyncSurface() {
    detach();
}

void SyncSurface::detach() {
    for (auto& unsubscribe : subscriptions_) unsubscribe();
    subscriptions_.clear();
}

bool SyncSurface::onCanonical(EventKind kind, Listener listener) {
    if (!isCanonicalKind(kind) || !listener) {
        const std::string_view name = eventKindName(kind);
        INSPECTOR_LOG_WARN("%s surface: %.*s is not a canonical event", originName(self_),
            static_cast<int>(name.size()), name.data());
        return false;
    }
    subscriptions_.push_back(dispatcher_.subscribe(kind,
        [this, inner = std::move(listener)](const Event& event) {
            if (getOrigin(event.payload) == self_) {
                ++suppressed_;
                return;
            }
            ++delivered_;
            inner(event);
        }));
    return true;
}

DispatchOptions SyncSurface::clickOptions() const {
    DispatchOptions options;
    options.priority = config_.clickPriority;
    return options;
}

DispatchOptions SyncSurface::hoverOptions() const {
    DispatchOptions options;
    options.priority = DispatchPriority::Low;
    options.debounceMs = config_.hoverDebounceMs;
    return options;
}

bool SyncSurface::requestSelection(const std::vector<NodeId>& ids, bool multi) {
    SelectionChangePayload request;
    request.nodeIds = ids;
    request.multi = multi;
    request.origin = self_;
    return dispatcher_.dispatchTyped(request, clickOptions());
}

bool SyncSurface::clearSelection() {
    return dispatcher_.dispatchTyped(SelectionClearPayload{self_}, clickOptions());
}

bool SyncSurface::requestFocus(const NodeId& id) {
    return dispatcher_.dispatchTyped(FocusNodePayload{id, self_}, clickOptions());
}

bool SyncSurface::clearFocus() {
    return dispatcher_.dispatchTyped(FocusClearPayload{self_}, clickOptions());
}

bool SyncSurface::pointerEnter(const NodeId& id) {
    return dispatcher_.dispatchTyped(NodeHighlightPayload{id, self_}, hoverOptions());
}

bool SyncSurface::pointerLeave(const NodeId& id) {
    return dispatcher_.dispatchTyped(NodeUnhighlightPayload{id, self_}, hoverOptions());
}

bool SyncSurface::requestIsolation(const std::vector<NodeId>& ids) {
    return dispatcher_.dispatchTyped(NodeIsolatePayload{ids, self_}, clickOptions());
}

bool SyncSurface::requestVisibility(const std::vector<NodeId>& ids, bool visible) {
    if (visible) return dispatcher_.dispatchTyped(NodeShowPayload{ids, self_}, clickOptions());
    return dispatcher_.dispatchTyped(NodeHidePayload{ids, self_}, clickOptions());
}

bool SyncSurface::showAll() {
    return dispatcher_.dispatchTyped(ShowAllPayload{self_}, clickOptions());
}

} // namespace inspector
