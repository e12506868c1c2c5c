#include "inspector/sync/sync_coordinator.h"
#include "inspector/core/logging.h"
#include "inspector/events/typed_payloads.h"

#include <utility>

namespace inspector {

namespace {

DispatchOptions withPriority(DispatchPriority priority) {
    DispatchOptions options;
    options.priority = priority;
    return options;
}

} // namespace

SyncCoordinator::SyncCoordinator(EventDispatcher& dispatcher, SelectionState& state, SyncConfig config)
    : dispatcher_(dispatcher), state_(state), config_(config) {}

SyncCoordinator::~SyncCoordinator() {
    detach();
}

void SyncCoordinator::attach() {
    if (isAttached()) return;
    auto on = [this](EventKind kind, void (SyncCoordinator::*handler)(const Event&)) {
        subscriptions_.push_back(dispatcher_.subscribe(kind, [this, handler](const Event& e) { (this->*handler)(e); }));
    };
    on(EventKind::LoadStart, &SyncCoordinator::onLoadStart);
    on(EventKind::LoadSuccess, &SyncCoordinator::onLoadSuccess);
    on(EventKind::Unload, &SyncCoordinator::onUnload);
    on(EventKind::LoadError, &SyncCoordinator::onLoadError);
    on(EventKind::SelectionChange, &SyncCoordinator::onSelectionChange);
    on(EventKind::SelectionClear, &SyncCoordinator::onSelectionClear);
    on(EventKind::FocusNode, &SyncCoordinator::onFocusNode);
    on(EventKind::FocusClear, &SyncCoordinator::onFocusClear);
    on(EventKind::NodeIsolate, &SyncCoordinator::onIsolate);
    on(EventKind::ShowAll, &SyncCoordinator::onShowAll);
    subscriptions_.push_back(dispatcher_.subscribe(EventKind::NodeHighlight, [this](const Event& e) { onHighlight(e, true); }));
    subscriptions_.push_back(dispatcher_.subscribe(EventKind::NodeUnhighlight, [this](const Event& e) { onHighlight(e, false); }));
    subscriptions_.push_back(dispatcher_.subscribe(EventKind::NodeShow, [this](const Event& e) { onVisibility(e, true); }));
    subscriptions_.push_back(dispatcher_.subscribe(EventKind::NodeHide, [this](const Event& e) { onVisibility(e, false); }));
}

void SyncCoordinator::detach() {
    for (auto& unsubscribe : subscriptions_) unsubscribe();
    subscriptions_.clear();
}

bool SyncCoordinator::isKnownNode(const NodeId& id) const {
    if (!config_.ignoreUnknownNodes || knownNodes_.empty()) return true;
    return knownNodes_.find(id) != knownNodes_.end();
}

std::optional<NodeId> SyncCoordinator::resolve(const NodeId& raw) const {
    std::optional<NodeId> id = resolver_ ? resolver_(raw) : std::optional<NodeId>(raw);
    if (!id) {
        INSPECTOR_LOG_DEBUG("node '%s' did not resolve", raw.c_str());
        return std::nullopt;
    }
    if (!isKnownNode(*id)) {
        INSPECTOR_LOG_WARN("ignoring unknown node '%s' for model '%s'", id->c_str(), modelId_.c_str());
        return std::nullopt;
    }
    return id;
}

std::vector<NodeId> SyncCoordinator::resolveAll(const StringList& raw) const {
    std::vector<NodeId> ids;
    ids.reserve(raw.size());
    for (const auto& r : raw) {
        if (auto id = resolve(r)) ids.push_back(std::move(*id));
    }
    return ids;
}

// ==============================================================================
// Model lifecycle
// ==============================================================================

// A new load drops whatever the previous model left in the store.
void SyncCoordinator::onLoadStart(const Event& event) {
    if (!hasModel_) return;
    onUnload(event);
}

void SyncCoordinator::onLoadSuccess(const Event& event) {
    const auto loaded = LoadSuccessPayload::fromPayload(event.payload);
    if (!loaded) {
        INSPECTOR_LOG_WARN("load:success without a model id");
        return;
    }
    state_.reset();
    modelId_ = loaded->modelId;
    hasModel_ = true;
    knownNodes_.clear();
    if (!loaded->nodeIds.empty()) {
        knownNodes_.insert(loaded->nodeIds.begin(), loaded->nodeIds.end());
        if (!loaded->root.empty()) knownNodes_.insert(loaded->root);
    }
    INSPECTOR_LOG_DEBUG("model '%s' loaded (%zu known nodes)", modelId_.c_str(), knownNodes_.size());
    emitStateChange("model-loaded");
}

void SyncCoordinator::onUnload(const Event& event) {
    (void)event;
    state_.reset();
    modelId_.clear();
    hasModel_ = false;
    knownNodes_.clear();
    emitStateChange("model-unloaded");
}

void SyncCoordinator::onLoadError(const Event& event) {
    const auto failed = LoadErrorPayload::fromPayload(event.payload);
    INSPECTOR_LOG_WARN("model load failed: %s", failed ? failed->error.c_str() : "unknown error");
    (void)failed;
}

// ==============================================================================
// Interaction requests
// ==============================================================================

void SyncCoordinator::onSelectionChange(const Event& event) {
    const auto request = SelectionChangePayload::fromPayload(event.payload);
    if (!request) return;

    const std::vector<NodeId> ids = resolveAll(request->nodeIds);
    if (ids.empty() && !request->nodeIds.empty()) return;

    const std::vector<NodeId> before = state_.getOrdered();
    if (!request->multi) {
        state_.clearSelection();
    }
    for (const auto& id : ids) state_.select(id, true);

    if (state_.getOrdered() != before) emitSelectionChanged(request->origin);
}

void SyncCoordinator::onSelectionClear(const Event& event) {
    const std::uint32_t generation = state_.getGeneration();
    state_.clearSelection();
    if (state_.getGeneration() != generation) emitSelectionChanged(getOrigin(event.payload));
}

void SyncCoordinator::onHighlight(const Event& event, bool on) {
    const std::string* raw = getString(event.payload, field::kNodeId);
    if (!raw) return;
    const auto id = resolve(*raw);
    if (!id) return;

    const std::uint32_t generation = state_.getGeneration();
    if (on) {
        state_.highlight(*id);
    } else {
        state_.dehighlight(*id);
    }
    if (state_.getGeneration() != generation) emitHighlightChanged(getOrigin(event.payload));
}

void SyncCoordinator::onFocusNode(const Event& event) {
    const auto request = FocusNodePayload::fromPayload(event.payload);
    if (!request) return;
    const auto id = resolve(request->nodeId);
    if (!id) return;

    const std::uint32_t generation = state_.getGeneration();
    state_.focus(*id);
    if (state_.getGeneration() != generation) emitFocusChanged(request->origin);
}

void SyncCoordinator::onFocusClear(const Event& event) {
    const std::uint32_t generation = state_.getGeneration();
    state_.clearFocus();
    if (state_.getGeneration() != generation) emitFocusChanged(getOrigin(event.payload));
}

void SyncCoordinator::onIsolate(const Event& event) {
    const auto request = NodeIsolatePayload::fromPayload(event.payload);
    if (!request) return;

    const std::vector<NodeId> ids = resolveAll(request->nodeIds);
    if (ids.empty() && !request->nodeIds.empty()) return;

    const std::uint32_t generation = state_.getGeneration();
    state_.isolate(ids);
    if (state_.getGeneration() != generation) emitIsolationChanged(request->origin);
}

void SyncCoordinator::onShowAll(const Event& event) {
    const InteractionOrigin origin = getOrigin(event.payload);

    std::uint32_t generation = state_.getGeneration();
    state_.clearIsolation();
    if (state_.getGeneration() != generation) emitIsolationChanged(origin);

    generation = state_.getGeneration();
    state_.clearHidden();
    if (state_.getGeneration() != generation) emitVisibilityChanged(origin);
}

void SyncCoordinator::onVisibility(const Event& event, bool visible) {
    const StringList raw = getStringList(event.payload, field::kNodeIds);
    const std::uint32_t generation = state_.getGeneration();
    for (const auto& id : resolveAll(raw)) {
        if (visible) {
            state_.show(id);
        } else {
            state_.hide(id);
        }
    }
    if (state_.getGeneration() != generation) emitVisibilityChanged(getOrigin(event.payload));
}

// ==============================================================================
// Canonical events
// ==============================================================================

void SyncCoordinator::emitSelectionChanged(InteractionOrigin origin) {
    SelectionChangedPayload out;
    out.nodeIds = state_.getOrdered();
    out.origin = origin;
    dispatcher_.dispatchTyped(out, withPriority(config_.selectionPriority));
}

void SyncCoordinator::emitHighlightChanged(InteractionOrigin origin) {
    HighlightChangedPayload out;
    out.nodeIds.assign(state_.getHighlighted().begin(), state_.getHighlighted().end());
    out.origin = origin;
    dispatcher_.dispatchTyped(out, withPriority(config_.highlightPriority));
}

void SyncCoordinator::emitFocusChanged(InteractionOrigin origin) {
    FocusChangedPayload out;
    out.nodeId = state_.focusedId();
    out.origin = origin;
    dispatcher_.dispatchTyped(out, withPriority(config_.focusPriority));
}

void SyncCoordinator::emitIsolationChanged(InteractionOrigin origin) {
    IsolationChangedPayload out;
    out.nodeIds.assign(state_.getIsolated().begin(), state_.getIsolated().end());
    out.origin = origin;
    dispatcher_.dispatchTyped(out, withPriority(config_.visibilityPriority));
}

// Carries the hidden set; isolation travels separately.
void SyncCoordinator::emitVisibilityChanged(InteractionOrigin origin) {
    VisibilityChangedPayload out;
    out.nodeIds.assign(state_.getHidden().begin(), state_.getHidden().end());
    out.origin = origin;
    dispatcher_.dispatchTyped(out, withPriority(config_.visibilityPriority));
}

void SyncCoordinator::emitStateChange(const char* reason) {
    StateChangePayload out;
    out.reason = reason;
    out.modelId = modelId_;
    dispatcher_.dispatchTyped(out, withPriority(DispatchPriority::High));
}

// ==============================================================================
// Snapshots
// ==============================================================================

SelectionSnapshot SyncCoordinator::snapshot() const {
    return SelectionSnapshot{modelId_, state_.clone()};
}

bool SyncCoordinator::restore(const SelectionSnapshot& snapshot, InteractionOrigin origin) {
    if (snapshot.modelId != modelId_) {
        INSPECTOR_LOG_WARN("snapshot for model '%s' does not match '%s'", snapshot.modelId.c_str(), modelId_.c_str());
        return false;
    }

    const SelectionState& target = snapshot.state;
    const SelectionState before = state_.clone();

    // Applied through the mutators so the generation keeps increasing.
    state_.clearSelection();
    for (const auto& id : target.getOrdered()) state_.select(id, true);

    state_.clearHighlights();
    for (const auto& id : target.getHighlighted()) state_.highlight(id);

    if (target.focusedId()) {
        state_.focus(*target.focusedId());
    } else {
        state_.clearFocus();
    }

    state_.isolate(std::vector<NodeId>(target.getIsolated().begin(), target.getIsolated().end()));

    state_.clearHidden();
    for (const auto& id : target.getHidden()) state_.hide(id);

    if (before.getOrdered() != state_.getOrdered()) emitSelectionChanged(origin);
    if (before.getHighlighted() != state_.getHighlighted()) emitHighlightChanged(origin);
    if (before.focusedId() != state_.focusedId()) emitFocusChanged(origin);
    if (before.getIsolated() != state_.getIsolated()) emitIsolationChanged(origin);
    if (before.getHidden() != state_.getHidden()) emitVisibilityChanged(origin);
    return true;
}

} // namespace inspector
