#pragma once

#include "inspector/core/types.h"
#include "inspector/events/event_dispatcher.h"
#include "inspector/selection/selection_state.h"

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace inspector {

struct SyncConfig {
    // Only applies once the loaded model announced its node ids.
    bool ignoreUnknownNodes = true;
    DispatchPriority selectionPriority = DispatchPriority::High;
    DispatchPriority focusPriority = DispatchPriority::High;
    DispatchPriority highlightPriority = DispatchPriority::Low;
    DispatchPriority visibilityPriority = DispatchPriority::Normal;
};

// Maps a raw id (mesh name, picking id) to the node id the store tracks.
// Returning nullopt drops the id.
using NodeResolver = std::function<std::optional<NodeId>(const NodeId&)>;

struct SelectionSnapshot {
    std::string modelId;
    SelectionState state;
};

// The single writer of the selection store. Listens to raw interaction
// requests, applies them to the store and re-emits the outcome as canonical
// events carrying the origin of the request that caused them.
class SyncCoordinator {
public:
    SyncCoordinator(EventDispatcher& dispatcher, SelectionState& state, SyncConfig config = {});
    ~SyncCoordinator();

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    // Subscribes to every raw request kind. Calling it twice is a no-op.
    void attach();
    void detach();
    bool isAttached() const { return !subscriptions_.empty(); }

    void setNodeResolver(NodeResolver resolver) { resolver_ = std::move(resolver); }

    const SelectionState& state() const { return state_; }
    const std::string& modelId() const { return modelId_; }
    bool hasModel() const { return hasModel_; }
    bool isKnownNode(const NodeId& id) const;
    const SyncConfig& config() const { return config_; }

    SelectionSnapshot snapshot() const;
    // Fails when the snapshot belongs to another model. Emits a canonical
    // event for every axis that differs from the current state.
    bool restore(const SelectionSnapshot& snapshot, InteractionOrigin origin = InteractionOrigin::External);

private:
    void onLoadStart(const Event& event);
    void onLoadSuccess(const Event& event);
    void onUnload(const Event& event);
    void onLoadError(const Event& event);
    void onSelectionChange(const Event& event);
    void onSelectionClear(const Event& event);
    void onHighlight(const Event& event, bool on);
    void onFocusNode(const Event& event);
    void onFocusClear(const Event& event);
    void onIsolate(const Event& event);
    void onShowAll(const Event& event);
    void onVisibility(const Event& event, bool visible);

    std::optional<NodeId> resolve(const NodeId& raw) const;
    std::vector<NodeId> resolveAll(const StringList& raw) const;

    void emitSelectionChanged(InteractionOrigin origin);
    void emitHighlightChanged(InteractionOrigin origin);
    void emitFocusChanged(InteractionOrigin origin);
    void emitIsolationChanged(InteractionOrigin origin);
    void emitVisibilityChanged(InteractionOrigin origin);
    void emitStateChange(const char* reason);

    EventDispatcher& dispatcher_;
    SelectionState& state_;
    SyncConfig config_;
    NodeResolver resolver_;
    std::vector<Unsubscribe> subscriptions_;

    std::string modelId_;
    bool hasModel_ = false;
    std::unordered_set<NodeId> knownNodes_;
};

} // namespace inspector
