#pragma once

#include <cstdint>

namespace inspector {

// =============================================================================
// Feature Flags (build-time capabilities for protocol handshake)
// =============================================================================

enum class InspectorFeatureFlags : std::uint32_t {
    FEATURE_DEBOUNCE = 1 << 0,
    FEATURE_THROTTLE = 1 << 1,
    FEATURE_RETRY = 1 << 2,
    FEATURE_PRIORITY_QUEUES = 1 << 3,
    FEATURE_ORIGIN_SYNC = 1 << 4,
    FEATURE_SNAPSHOTS = 1 << 5,
};

// =============================================================================
// Protocol Handshake Payload (POD struct for Embind)
// =============================================================================

struct ProtocolInfo {
    std::uint32_t protocolVersion;
    std::uint32_t eventKindCount;
    std::uint32_t schemaCount;
    std::uint32_t featureFlags;
};

static constexpr std::uint32_t kProtocolVersion = 1;

static constexpr std::uint32_t kFeatureFlags =
    static_cast<std::uint32_t>(InspectorFeatureFlags::FEATURE_DEBOUNCE)
    | static_cast<std::uint32_t>(InspectorFeatureFlags::FEATURE_THROTTLE)
    | static_cast<std::uint32_t>(InspectorFeatureFlags::FEATURE_RETRY)
    | static_cast<std::uint32_t>(InspectorFeatureFlags::FEATURE_PRIORITY_QUEUES)
    | static_cast<std::uint32_t>(InspectorFeatureFlags::FEATURE_ORIGIN_SYNC)
    | static_cast<std::uint32_t>(InspectorFeatureFlags::FEATURE_SNAPSHOTS);

} // namespace inspector
