#ifndef MODEL_INSPECTOR_TYPES_H
#define MODEL_INSPECTOR_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Lightweight types shared by the dispatcher, the selection store and the sync layer.

namespace inspector {

using NodeId = std::string;

enum class DispatchPriority : std::uint8_t {
    High = 0,
    Normal = 1,
    Low = 2,
};

// Which surface produced an interaction. Canonical events carry the tag of the
// request that caused them so the originating surface can skip its own echo.
enum class InteractionOrigin : std::uint8_t {
    External = 0,
    Tree = 1,
    Viewport = 2,
    Properties = 3,
};

enum class DispatchError : std::uint32_t {
    Ok = 0,
    Destroyed = 1,
    UnknownKind = 2,
    ValidationFailed = 3,
    Throttled = 4,
};

inline const char* priorityName(DispatchPriority priority) {
    switch (priority) {
        case DispatchPriority::High: return "high";
        case DispatchPriority::Normal: return "normal";
        case DispatchPriority::Low: return "low";
    }
    return "normal";
}

inline std::optional<DispatchPriority> parsePriority(std::string_view name) {
    if (name == "high") return DispatchPriority::High;
    if (name == "normal") return DispatchPriority::Normal;
    if (name == "low") return DispatchPriority::Low;
    return std::nullopt;
}

inline const char* originName(InteractionOrigin origin) {
    switch (origin) {
        case InteractionOrigin::External: return "external";
        case InteractionOrigin::Tree: return "tree";
        case InteractionOrigin::Viewport: return "viewport";
        case InteractionOrigin::Properties: return "properties";
    }
    return "external";
}

// Unknown or empty names map to External.
inline InteractionOrigin parseOrigin(std::string_view name) {
    if (name == "tree") return InteractionOrigin::Tree;
    if (name == "viewport") return InteractionOrigin::Viewport;
    if (name == "properties") return InteractionOrigin::Properties;
    return InteractionOrigin::External;
}

inline const char* dispatchErrorName(DispatchError error) {
    switch (error) {
        case DispatchError::Ok: return "ok";
        case DispatchError::Destroyed: return "destroyed";
        case DispatchError::UnknownKind: return "unknown-kind";
        case DispatchError::ValidationFailed: return "validation-failed";
        case DispatchError::Throttled: return "throttled";
    }
    return "unknown";
}

} // namespace inspector

#endif // MODEL_INSPECTOR_TYPES_H
