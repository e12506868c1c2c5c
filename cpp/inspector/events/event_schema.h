#pragma once

#include "inspector/events/event_kind.h"
#include "inspector/events/event_payload.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace inspector {

// Required-field shape checks per event kind. Only key presence is checked;
// a required key may hold any value, including null.
class EventSchemaRegistry {
public:
    EventSchemaRegistry() = default;

    // Schemas for every typed payload declared in typed_payloads.h.
    static EventSchemaRegistry withDefaults();

    // Replaces any schema previously registered for `kind`.
    void registerSchema(EventKind kind, std::vector<std::string> requiredFields);
    bool removeSchema(EventKind kind);
    void clear() { schemas_.clear(); }

    bool hasSchema(EventKind kind) const;
    const std::vector<std::string>* requiredFields(EventKind kind) const;
    std::size_t size() const noexcept { return schemas_.size(); }

    // No schema registered means always valid.
    bool validate(EventKind kind, const Payload& payload) const;

    // Same as validate(); on failure `missingField` receives the first absent field.
    bool validate(EventKind kind, const Payload& payload, std::string& missingField) const;

private:
    std::unordered_map<EventKind, std::vector<std::string>> schemas_;
};

} // namespace inspector
