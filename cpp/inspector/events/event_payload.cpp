#include "inspector/events/event_payload.h"

#include <sstream>

namespace inspector {

namespace {

const PayloadValue* findField(const Payload& payload, std::string_view key) {
    const auto it = payload.find(key);
    if (it == payload.end()) return nullptr;
    return &it->second;
}

void describeValue(std::ostringstream& out, const PayloadValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        out << "null";
    } else if (const auto* b = std::get_if<bool>(&value)) {
        out << (*b ? "true" : "false");
    } else if (const auto* n = std::get_if<double>(&value)) {
        out << *n;
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        out << '"' << *s << '"';
    } else if (const auto* list = std::get_if<StringList>(&value)) {
        out << '[';
        for (std::size_t i = 0; i < list->size(); ++i) {
            if (i > 0) out << ", ";
            out << '"' << (*list)[i] << '"';
        }
        out << ']';
    }
}

} // namespace

bool hasField(const Payload& payload, std::string_view key) {
    return findField(payload, key) != nullptr;
}

bool isNullField(const Payload& payload, std::string_view key) {
    const PayloadValue* value = findField(payload, key);
    return value != nullptr && std::holds_alternative<std::monostate>(*value);
}

const std::string* getString(const Payload& payload, std::string_view key) {
    const PayloadValue* value = findField(payload, key);
    if (!value) return nullptr;
    return std::get_if<std::string>(value);
}

std::optional<double> getNumber(const Payload& payload, std::string_view key) {
    const PayloadValue* value = findField(payload, key);
    if (!value) return std::nullopt;
    if (const auto* n = std::get_if<double>(value)) return *n;
    return std::nullopt;
}

bool getBool(const Payload& payload, std::string_view key, bool fallback) {
    const PayloadValue* value = findField(payload, key);
    if (!value) return fallback;
    if (const auto* b = std::get_if<bool>(value)) return *b;
    return fallback;
}

StringList getStringList(const Payload& payload, std::string_view key) {
    const PayloadValue* value = findField(payload, key);
    if (!value) return {};
    if (const auto* list = std::get_if<StringList>(value)) return *list;
    if (const auto* s = std::get_if<std::string>(value)) return StringList{*s};
    return {};
}

InteractionOrigin getOrigin(const Payload& payload) {
    const std::string* name = getString(payload, field::kOrigin);
    if (!name) return InteractionOrigin::External;
    return parseOrigin(*name);
}

void setOrigin(Payload& payload, InteractionOrigin origin) {
    payload[std::string(field::kOrigin)] = std::string(originName(origin));
}

std::string describePayload(const Payload& payload) {
    std::ostringstream out;
    out << '{';
    bool first = true;
    for (const auto& [key, value] : payload) {
        if (!first) out << ", ";
        first = false;
        out << key << ": ";
        describeValue(out, value);
    }
    out << '}';
    return out.str();
}

} // namespace inspector
