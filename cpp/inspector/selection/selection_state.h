#pragma once

#include "inspector/core/types.h"

#include <cstdint>
#include <optional>
#include <set>
#include <unordered_set>
#include <vector>

namespace inspector {

// Selection, highlight, focus, isolation and hidden-node state for one loaded
// model. The axes are independent. Every mutator that actually changes the
// state bumps the generation, so callers detect no-ops by comparing it.
class SelectionState {
public:
    SelectionState() = default;

    // Single mode replaces the selection; multi mode adds to it.
    SelectionState& select(const NodeId& id, bool multi = false);
    SelectionState& deselect(const NodeId& id);
    SelectionState& clearSelection();
    bool isSelected(const NodeId& id) const { return selected_.find(id) != selected_.end(); }

    SelectionState& highlight(const NodeId& id);
    SelectionState& dehighlight(const NodeId& id);
    SelectionState& clearHighlights();
    bool isHighlighted(const NodeId& id) const { return highlighted_.find(id) != highlighted_.end(); }

    SelectionState& focus(const NodeId& id);
    SelectionState& clearFocus();
    bool isFocused(const NodeId& id) const { return focused_ && *focused_ == id; }
    const std::optional<NodeId>& focusedId() const { return focused_; }

    // Replaces the isolated set; an empty list ends isolation.
    SelectionState& isolate(const std::vector<NodeId>& ids);
    SelectionState& clearIsolation();
    bool hasIsolation() const { return !isolated_.empty(); }
    bool isIsolated(const NodeId& id) const { return isolated_.find(id) != isolated_.end(); }

    SelectionState& hide(const NodeId& id);
    SelectionState& show(const NodeId& id);
    SelectionState& clearHidden();
    bool isHidden(const NodeId& id) const { return hidden_.find(id) != hidden_.end(); }
    // Not hidden and, while isolation is active, isolated.
    bool isVisible(const NodeId& id) const;

    const std::unordered_set<NodeId>& getSelected() const { return selected_; }
    // Selection in the order nodes were added.
    const std::vector<NodeId>& getOrdered() const { return ordered_; }
    const std::set<NodeId>& getHighlighted() const { return highlighted_; }
    const std::set<NodeId>& getIsolated() const { return isolated_; }
    const std::set<NodeId>& getHidden() const { return hidden_; }
    std::uint32_t getSelectedCount() const { return static_cast<std::uint32_t>(selected_.size()); }
    std::uint32_t getGeneration() const { return generation_; }
    bool isEmpty() const;

    // Clears every axis. Counts as one change when anything was set.
    SelectionState& reset();

    // Value copy; the copy shares nothing with this instance.
    SelectionState clone() const { return *this; }

private:
    void touch() { generation_++; }

    std::unordered_set<NodeId> selected_;
    std::vector<NodeId> ordered_;
    std::set<NodeId> highlighted_;
    std::optional<NodeId> focused_;
    std::set<NodeId> isolated_;
    std::set<NodeId> hidden_;
    std::uint32_t generation_ = 0;
};

} // namespace inspector
