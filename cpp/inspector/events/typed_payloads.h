#pragma once

#include "inspector/core/types.h"
#include "inspector/events/event_kind.h"
#include "inspector/events/event_payload.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

// Typed views over the dynamic Payload map, one per event kind that has a shape.
// Each struct declares its kind and its required fields; the default schema
// registry is generated from these declarations (see EventSchemaRegistry::withDefaults).

namespace inspector {

struct LoadStartPayload {
    static constexpr EventKind kKind = EventKind::LoadStart;
    static constexpr std::array<std::string_view, 1> kRequiredFields{field::kFile};

    std::string file;

    Payload toPayload() const;
    static std::optional<LoadStartPayload> fromPayload(const Payload& payload);
};

struct LoadSuccessPayload {
    static constexpr EventKind kKind = EventKind::LoadSuccess;
    static constexpr std::array<std::string_view, 2> kRequiredFields{field::kModelId, field::kRoot};

    std::string modelId;
    NodeId root;
    // Optional; when present the coordinator rejects ids outside this list.
    StringList nodeIds;

    Payload toPayload() const;
    static std::optional<LoadSuccessPayload> fromPayload(const Payload& payload);
};

struct LoadErrorPayload {
    static constexpr EventKind kKind = EventKind::LoadError;
    static constexpr std::array<std::string_view, 1> kRequiredFields{field::kError};

    std::string error;
    std::string modelId;

    Payload toPayload() const;
    static std::optional<LoadErrorPayload> fromPayload(const Payload& payload);
};

struct SelectionChangePayload {
    static constexpr EventKind kKind = EventKind::SelectionChange;
    static constexpr std::array<std::string_view, 1> kRequiredFields{field::kNodeIds};

    StringList nodeIds;
    bool multi = false;
    InteractionOrigin origin = InteractionOrigin::External;

    Payload toPayload() const;
    static std::optional<SelectionChangePayload> fromPayload(const Payload& payload);
};

struct ErrorPayload {
    static constexpr EventKind kKind = EventKind::Error;
    static constexpr std::array<std::string_view, 2> kRequiredFields{field::kError, field::kMessage};

    std::string error;
    std::string message;
    std::string eventKind;
    std::string eventId;
    std::uint32_t attempt = 0;

    Payload toPayload() const;
    static std::optional<ErrorPayload> fromPayload(const Payload& payload);
};

struct StateChangePayload {
    static constexpr EventKind kKind = EventKind::StateChange;
    static constexpr std::array<std::string_view, 1> kRequiredFields{field::kReason};

    std::string reason;
    std::string modelId;

    Payload toPayload() const;
    static std::optional<StateChangePayload> fromPayload(const Payload& payload);
};

// Request carrying one node id (hover, focus).
template <EventKind K>
struct NodeRequestPayload {
    static constexpr EventKind kKind = K;
    static constexpr std::array<std::string_view, 1> kRequiredFields{field::kNodeId};

    NodeId nodeId;
    InteractionOrigin origin = InteractionOrigin::External;

    Payload toPayload() const {
        Payload payload;
        payload[std::string(field::kNodeId)] = nodeId;
        setOrigin(payload, origin);
        return payload;
    }

    static std::optional<NodeRequestPayload> fromPayload(const Payload& payload) {
        const std::string* id = getString(payload, field::kNodeId);
        if (!id) return std::nullopt;
        return NodeRequestPayload{*id, getOrigin(payload)};
    }
};

// Request carrying a list of node ids (visibility, isolation).
template <EventKind K>
struct NodeListRequestPayload {
    static constexpr EventKind kKind = K;
    static constexpr std::array<std::string_view, 1> kRequiredFields{field::kNodeIds};

    StringList nodeIds;
    InteractionOrigin origin = InteractionOrigin::External;

    Payload toPayload() const {
        Payload payload;
        payload[std::string(field::kNodeIds)] = nodeIds;
        setOrigin(payload, origin);
        return payload;
    }

    static std::optional<NodeListRequestPayload> fromPayload(const Payload& payload) {
        if (!hasField(payload, field::kNodeIds)) return std::nullopt;
        return NodeListRequestPayload{getStringList(payload, field::kNodeIds), getOrigin(payload)};
    }
};

// Request with no subject beyond its origin (clear selection, clear focus, show all).
template <EventKind K>
struct OriginOnlyPayload {
    static constexpr EventKind kKind = K;
    static constexpr std::array<std::string_view, 0> kRequiredFields{};

    InteractionOrigin origin = InteractionOrigin::External;

    Payload toPayload() const {
        Payload payload;
        setOrigin(payload, origin);
        return payload;
    }

    static std::optional<OriginOnlyPayload> fromPayload(const Payload& payload) {
        return OriginOnlyPayload{getOrigin(payload)};
    }
};

// Canonical event describing the new contents of one state axis.
template <EventKind K>
struct NodeListChangedPayload {
    static constexpr EventKind kKind = K;
    static constexpr std::array<std::string_view, 2> kRequiredFields{field::kNodeIds, field::kOrigin};

    StringList nodeIds;
    InteractionOrigin origin = InteractionOrigin::External;

    Payload toPayload() const {
        Payload payload;
        payload[std::string(field::kNodeIds)] = nodeIds;
        setOrigin(payload, origin);
        return payload;
    }

    static std::optional<NodeListChangedPayload> fromPayload(const Payload& payload) {
        if (!hasField(payload, field::kNodeIds) || !hasField(payload, field::kOrigin)) return std::nullopt;
        return NodeListChangedPayload{getStringList(payload, field::kNodeIds), getOrigin(payload)};
    }
};

struct FocusChangedPayload {
    static constexpr EventKind kKind = EventKind::FocusChanged;
    static constexpr std::array<std::string_view, 2> kRequiredFields{field::kNodeId, field::kOrigin};

    // Empty after focus was cleared; encoded as an explicit null.
    std::optional<NodeId> nodeId;
    InteractionOrigin origin = InteractionOrigin::External;

    Payload toPayload() const;
    static std::optional<FocusChangedPayload> fromPayload(const Payload& payload);
};

using FocusNodePayload = NodeRequestPayload<EventKind::FocusNode>;
using NodeHighlightPayload = NodeRequestPayload<EventKind::NodeHighlight>;
using NodeUnhighlightPayload = NodeRequestPayload<EventKind::NodeUnhighlight>;
using NodeShowPayload = NodeListRequestPayload<EventKind::NodeShow>;
using NodeHidePayload = NodeListRequestPayload<EventKind::NodeHide>;
using NodeIsolatePayload = NodeListRequestPayload<EventKind::NodeIsolate>;
using SelectionClearPayload = OriginOnlyPayload<EventKind::SelectionClear>;
using FocusClearPayload = OriginOnlyPayload<EventKind::FocusClear>;
using ShowAllPayload = OriginOnlyPayload<EventKind::ShowAll>;
using SelectionChangedPayload = NodeListChangedPayload<EventKind::SelectionChanged>;
using HighlightChangedPayload = NodeListChangedPayload<EventKind::HighlightChanged>;
using IsolationChangedPayload = NodeListChangedPayload<EventKind::IsolationChanged>;
using VisibilityChangedPayload = NodeListChangedPayload<EventKind::VisibilityChanged>;

// Tagged union of every shaped payload, discriminated by kKind.
using TypedPayload = std::variant<
    LoadStartPayload,
    LoadSuccessPayload,
    LoadErrorPayload,
    SelectionChangePayload,
    SelectionClearPayload,
    FocusNodePayload,
    FocusClearPayload,
    NodeShowPayload,
    NodeHidePayload,
    NodeIsolatePayload,
    ShowAllPayload,
    NodeHighlightPayload,
    NodeUnhighlightPayload,
    ErrorPayload,
    StateChangePayload,
    SelectionChangedPayload,
    HighlightChangedPayload,
    FocusChangedPayload,
    IsolationChangedPayload,
    VisibilityChangedPayload>;

inline EventKind typedPayloadKind(const TypedPayload& typed) {
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kKind; }, typed);
}

inline Payload typedPayloadToPayload(const TypedPayload& typed) {
    return std::visit([](const auto& p) { return p.toPayload(); }, typed);
}

} // namespace inspector
