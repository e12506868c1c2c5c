#include "inspector/selection/selection_state.h"

#include <algorithm>
#include <utility>

namespace inspector {

SelectionState& SelectionState::select(const NodeId& id, bool multi) {
    if (multi) {
        if (selected_.insert(id).second) {
            ordered_.push_back(id);
            touch();
        }
        return *this;
    }

    if (selected_.size() == 1 && isSelected(id)) return *this;
    selected_.clear();
    ordered_.clear();
    selected_.insert(id);
    ordered_.push_back(id);
    touch();
    return *this;
}

SelectionState& SelectionState::deselect(const NodeId& id) {
    const auto it = selected_.find(id);
    if (it == selected_.end()) return *this;
    selected_.erase(it);
    ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), id), ordered_.end());
    touch();
    return *this;
}

SelectionState& SelectionState::clearSelection() {
    if (selected_.empty()) return *this;
    selected_.clear();
    ordered_.clear();
    touch();
    return *this;
}

SelectionState& SelectionState::highlight(const NodeId& id) {
    if (highlighted_.insert(id).second) touch();
    return *this;
}

SelectionState& SelectionState::dehighlight(const NodeId& id) {
    if (highlighted_.erase(id) > 0) touch();
    return *this;
}

SelectionState& SelectionState::clearHighlights() {
    if (highlighted_.empty()) return *this;
    highlighted_.clear();
    touch();
    return *this;
}

SelectionState& SelectionState::focus(const NodeId& id) {
    if (isFocused(id)) return *this;
    focused_ = id;
    touch();
    return *this;
}

SelectionState& SelectionState::clearFocus() {
    if (!focused_) return *this;
    focused_.reset();
    touch();
    return *this;
}

SelectionState& SelectionState::isolate(const std::vector<NodeId>& ids) {
    std::set<NodeId> next(ids.begin(), ids.end());
    if (next == isolated_) return *this;
    isolated_ = std::move(next);
    touch();
    return *this;
}

SelectionState& SelectionState::clearIsolation() {
    if (isolated_.empty()) return *this;
    isolated_.clear();
    touch();
    return *this;
}

SelectionState& SelectionState::hide(const NodeId& id) {
    if (hidden_.insert(id).second) touch();
    return *this;
}

SelectionState& SelectionState::show(const NodeId& id) {
    if (hidden_.erase(id) > 0) touch();
    return *this;
}

SelectionState& SelectionState::clearHidden() {
    if (hidden_.empty()) return *this;
    hidden_.clear();
    touch();
    return *this;
}

bool SelectionState::isVisible(const NodeId& id) const {
    if (isHidden(id)) return false;
    return !hasIsolation() || isIsolated(id);
}

bool SelectionState::isEmpty() const {
    return selected_.empty() && highlighted_.empty() && !focused_ && isolated_.empty() && hidden_.empty();
}

SelectionState& SelectionState::reset() {
    if (isEmpty()) return *this;
    selected_.clear();
    ordered_.clear();
    highlighted_.clear();
    focused_.reset();
    isolated_.clear();
    hidden_.clear();
    touch();
    return *this;
}

} // namespace inspector
