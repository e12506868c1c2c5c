#pragma once

#include "inspector/core/types.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace inspector {

using StringList = std::vector<std::string>;

// std::monostate is an explicit null: the key exists but carries no value.
using PayloadValue = std::variant<std::monostate, bool, double, std::string, StringList>;

using Payload = std::map<std::string, PayloadValue, std::less<>>;

// Field names shared by producers, the schema registry and the coordinator.
namespace field {
inline constexpr std::string_view kFile = "file";
inline constexpr std::string_view kModelId = "modelId";
inline constexpr std::string_view kRoot = "root";
inline constexpr std::string_view kNodeId = "nodeId";
inline constexpr std::string_view kNodeIds = "nodeIds";
inline constexpr std::string_view kOrigin = "origin";
inline constexpr std::string_view kMulti = "multi";
inline constexpr std::string_view kError = "error";
inline constexpr std::string_view kMessage = "message";
inline constexpr std::string_view kReason = "reason";
inline constexpr std::string_view kEventKind = "eventKind";
inline constexpr std::string_view kEventId = "eventId";
inline constexpr std::string_view kAttempt = "attempt";
} // namespace field

bool hasField(const Payload& payload, std::string_view key);

bool isNullField(const Payload& payload, std::string_view key);

// Typed accessors never throw; a missing key or a different alternative yields the fallback.
const std::string* getString(const Payload& payload, std::string_view key);
std::optional<double> getNumber(const Payload& payload, std::string_view key);
bool getBool(const Payload& payload, std::string_view key, bool fallback);

// A single string is promoted to a one-element list.
StringList getStringList(const Payload& payload, std::string_view key);

InteractionOrigin getOrigin(const Payload& payload);
void setOrigin(Payload& payload, InteractionOrigin origin);

// Compact single-line rendering for diagnostics.
std::string describePayload(const Payload& payload);

} // namespace inspector
