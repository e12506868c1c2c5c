#include "inspector/events/event_kind.h"

#include <array>
#include <utility>

namespace inspector {

namespace {

constexpr std::array<std::pair<EventKind, std::string_view>, 29> kEventKindNames{{
    {EventKind::LoadStart, "load:start"},
    {EventKind::LoadSuccess, "load:success"},
    {EventKind::LoadError, "load:error"},
    {EventKind::Unload, "unload"},
    {EventKind::ModelUpdate, "model:update"},
    {EventKind::SelectionChange, "selection:change"},
    {EventKind::SelectionClear, "selection:clear"},
    {EventKind::FocusNode, "focus:node"},
    {EventKind::FocusClear, "focus:clear"},
    {EventKind::NodeShow, "node:show"},
    {EventKind::NodeHide, "node:hide"},
    {EventKind::NodeIsolate, "node:isolate"},
    {EventKind::ShowAll, "show:all"},
    {EventKind::NodeHighlight, "node:highlight"},
    {EventKind::NodeUnhighlight, "node:unhighlight"},
    {EventKind::Disassemble, "transform:disassemble"},
    {EventKind::Reassemble, "transform:reassemble"},
    {EventKind::CameraReset, "camera:reset"},
    {EventKind::CameraFit, "camera:fit"},
    {EventKind::CameraZoom, "camera:zoom"},
    {EventKind::FullscreenEnter, "ui:fullscreen:enter"},
    {EventKind::FullscreenExit, "ui:fullscreen:exit"},
    {EventKind::Error, "error"},
    {EventKind::StateChange, "state:change"},
    {EventKind::SelectionChanged, "selection:changed"},
    {EventKind::HighlightChanged, "highlight:changed"},
    {EventKind::FocusChanged, "focus:changed"},
    {EventKind::IsolationChanged, "isolation:changed"},
    {EventKind::VisibilityChanged, "visibility:changed"},
}};

} // namespace

std::string_view eventKindName(EventKind kind) {
    for (const auto& entry : kEventKindNames) {
        if (entry.first == kind) return entry.second;
    }
    return {};
}

std::optional<EventKind> parseEventKind(std::string_view name) {
    for (const auto& entry : kEventKindNames) {
        if (entry.second == name) return entry.first;
    }
    return std::nullopt;
}

bool isKnownEventKind(EventKind kind) {
    return !eventKindName(kind).empty();
}

bool isCanonicalKind(EventKind kind) {
    switch (kind) {
        case EventKind::SelectionChanged:
        case EventKind::HighlightChanged:
        case EventKind::FocusChanged:
        case EventKind::IsolationChanged:
        case EventKind::VisibilityChanged:
        case EventKind::StateChange:
            return true;
        default:
            return false;
    }
}

const std::vector<EventKind>& allEventKinds() {
    static const std::vector<EventKind> kinds = [] {
        std::vector<EventKind> out;
        out.reserve(kEventKindNames.size());
        for (const auto& entry : kEventKindNames) out.push_back(entry.first);
        return out;
    }();
    return kinds;
}

} // namespace inspector
