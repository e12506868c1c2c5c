#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace inspector {

// Every event the dispatcher accepts. Values are stable across the JS boundary.
enum class EventKind : std::uint16_t {
    // Model lifecycle
    LoadStart = 1,
    LoadSuccess = 2,
    LoadError = 3,
    Unload = 4,
    ModelUpdate = 5,

    // Selection requests
    SelectionChange = 10,
    SelectionClear = 11,

    // Focus requests
    FocusNode = 20,
    FocusClear = 21,

    // Visibility requests
    NodeShow = 30,
    NodeHide = 31,
    NodeIsolate = 32,
    ShowAll = 33,

    // Hover / highlight requests
    NodeHighlight = 40,
    NodeUnhighlight = 41,

    // Transform
    Disassemble = 50,
    Reassemble = 51,

    // Camera
    CameraReset = 60,
    CameraFit = 61,
    CameraZoom = 62,

    // UI
    FullscreenEnter = 70,
    FullscreenExit = 71,

    Error = 80,

    StateChange = 90,

    // Canonical state-changed events, emitted only by the sync coordinator
    SelectionChanged = 100,
    HighlightChanged = 101,
    FocusChanged = 102,
    IsolationChanged = 103,
    VisibilityChanged = 104,
};

// Wire name, e.g. "selection:change". Returns an empty view for values outside the enum.
std::string_view eventKindName(EventKind kind);

std::optional<EventKind> parseEventKind(std::string_view name);

bool isKnownEventKind(EventKind kind);

// True for the kinds only the sync coordinator emits.
bool isCanonicalKind(EventKind kind);

const std::vector<EventKind>& allEventKinds();

} // namespace inspector
