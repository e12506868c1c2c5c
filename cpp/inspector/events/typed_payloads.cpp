#include "inspector/events/typed_payloads.h"

#include <cmath>

namespace inspector {

Payload LoadStartPayload::toPayload() const {
    Payload payload;
    payload[std::string(field::kFile)] = file;
    return payload;
}

std::optional<LoadStartPayload> LoadStartPayload::fromPayload(const Payload& payload) {
    const std::string* file = getString(payload, field::kFile);
    if (!file) return std::nullopt;
    return LoadStartPayload{*file};
}

Payload LoadSuccessPayload::toPayload() const {
    Payload payload;
    payload[std::string(field::kModelId)] = modelId;
    payload[std::string(field::kRoot)] = root;
    if (!nodeIds.empty()) {
        payload[std::string(field::kNodeIds)] = nodeIds;
    }
    return payload;
}

std::optional<LoadSuccessPayload> LoadSuccessPayload::fromPayload(const Payload& payload) {
    const std::string* modelId = getString(payload, field::kModelId);
    if (!modelId) return std::nullopt;
    LoadSuccessPayload out;
    out.modelId = *modelId;
    // The root may be announced before the loader assigned it an id.
    if (const std::string* root = getString(payload, field::kRoot)) out.root = *root;
    out.nodeIds = getStringList(payload, field::kNodeIds);
    return out;
}

Payload LoadErrorPayload::toPayload() const {
    Payload payload;
    payload[std::string(field::kError)] = error;
    if (!modelId.empty()) {
        payload[std::string(field::kModelId)] = modelId;
    }
    return payload;
}

std::optional<LoadErrorPayload> LoadErrorPayload::fromPayload(const Payload& payload) {
    if (!hasField(payload, field::kError)) return std::nullopt;
    LoadErrorPayload out;
    if (const std::string* error = getString(payload, field::kError)) out.error = *error;
    if (const std::string* modelId = getString(payload, field::kModelId)) out.modelId = *modelId;
    return out;
}

Payload SelectionChangePayload::toPayload() const {
    Payload payload;
    payload[std::string(field::kNodeIds)] = nodeIds;
    payload[std::string(field::kMulti)] = multi;
    setOrigin(payload, origin);
    return payload;
}

std::optional<SelectionChangePayload> SelectionChangePayload::fromPayload(const Payload& payload) {
    if (!hasField(payload, field::kNodeIds)) return std::nullopt;
    SelectionChangePayload out;
    out.nodeIds = getStringList(payload, field::kNodeIds);
    out.multi = getBool(payload, field::kMulti, false);
    out.origin = getOrigin(payload);
    return out;
}

Payload ErrorPayload::toPayload() const {
    Payload payload;
    payload[std::string(field::kError)] = error;
    payload[std::string(field::kMessage)] = message;
    if (!eventKind.empty()) payload[std::string(field::kEventKind)] = eventKind;
    if (!eventId.empty()) payload[std::string(field::kEventId)] = eventId;
    payload[std::string(field::kAttempt)] = static_cast<double>(attempt);
    return payload;
}

std::optional<ErrorPayload> ErrorPayload::fromPayload(const Payload& payload) {
    if (!hasField(payload, field::kError) || !hasField(payload, field::kMessage)) return std::nullopt;
    ErrorPayload out;
    if (const std::string* error = getString(payload, field::kError)) out.error = *error;
    if (const std::string* message = getString(payload, field::kMessage)) out.message = *message;
    if (const std::string* kind = getString(payload, field::kEventKind)) out.eventKind = *kind;
    if (const std::string* id = getString(payload, field::kEventId)) out.eventId = *id;
    if (const auto attempt = getNumber(payload, field::kAttempt)) {
        out.attempt = *attempt > 0.0 ? static_cast<std::uint32_t>(std::lround(*attempt)) : 0u;
    }
    return out;
}

Payload StateChangePayload::toPayload() const {
    Payload payload;
    payload[std::string(field::kReason)] = reason;
    if (!modelId.empty()) {
        payload[std::string(field::kModelId)] = modelId;
    }
    return payload;
}

std::optional<StateChangePayload> StateChangePayload::fromPayload(const Payload& payload) {
    const std::string* reason = getString(payload, field::kReason);
    if (!reason) return std::nullopt;
    StateChangePayload out;
    out.reason = *reason;
    if (const std::string* modelId = getString(payload, field::kModelId)) out.modelId = *modelId;
    return out;
}

Payload FocusChangedPayload::toPayload() const {
    Payload payload;
    if (nodeId) {
        payload[std::string(field::kNodeId)] = *nodeId;
    } else {
        payload[std::string(field::kNodeId)] = std::monostate{};
    }
    setOrigin(payload, origin);
    return payload;
}

std::optional<FocusChangedPayload> FocusChangedPayload::fromPayload(const Payload& payload) {
    if (!hasField(payload, field::kNodeId) || !hasField(payload, field::kOrigin)) return std::nullopt;
    FocusChangedPayload out;
    if (const std::string* id = getString(payload, field::kNodeId)) out.nodeId = *id;
    out.origin = getOrigin(payload);
    return out;
}

} // namespace inspector
