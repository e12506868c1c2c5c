#include "inspector/events/event_schema.h"
#include "inspector/events/typed_payloads.h"

#include <utility>

namespace inspector {

namespace {

template <typename T>
void registerTypedSchema(EventSchemaRegistry& registry) {
    std::vector<std::string> fields;
    fields.reserve(T::kRequiredFields.size());
    for (const std::string_view name : T::kRequiredFields) {
        fields.emplace_back(name);
    }
    registry.registerSchema(T::kKind, std::move(fields));
}

template <typename... Ts>
void registerVariantSchemas(EventSchemaRegistry& registry, const std::variant<Ts...>*) {
    (registerTypedSchema<Ts>(registry), ...);
}

} // namespace

EventSchemaRegistry EventSchemaRegistry::withDefaults() {
    EventSchemaRegistry registry;
    registerVariantSchemas(registry, static_cast<const TypedPayload*>(nullptr));
    return registry;
}

void EventSchemaRegistry::registerSchema(EventKind kind, std::vector<std::string> requiredFields) {
    schemas_[kind] = std::move(requiredFields);
}

bool EventSchemaRegistry::removeSchema(EventKind kind) {
    return schemas_.erase(kind) > 0;
}

bool EventSchemaRegistry::hasSchema(EventKind kind) const {
    return schemas_.find(kind) != schemas_.end();
}

const std::vector<std::string>* EventSchemaRegistry::requiredFields(EventKind kind) const {
    const auto it = schemas_.find(kind);
    if (it == schemas_.end()) return nullptr;
    return &it->second;
}

bool EventSchemaRegistry::validate(EventKind kind, const Payload& payload) const {
    std::string ignored;
    return validate(kind, payload, ignored);
}

bool EventSchemaRegistry::validate(EventKind kind, const Payload& payload, std::string& missingField) const {
    const auto it = schemas_.find(kind);
    if (it == schemas_.end()) return true;

    for (const auto& name : it->second) {
        if (!hasField(payload, name)) {
            missingField = name;
            return false;
        }
    }
    return true;
}

} // namespace inspector
