#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "inspector/inspector_context.h"
#include "inspector/events/event_kind.h"
#include "inspector/events/event_payload.h"

#ifdef EMSCRIPTEN
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

using emscripten::val;

namespace {

bool isJsArray(const val& v) {
    return val::global("Array").call<bool>("isArray", v);
}

inspector::PayloadValue valueFromJs(const val& v) {
    if (v.isNull() || v.isUndefined()) return std::monostate{};
    if (v.isTrue() || v.isFalse()) return v.as<bool>();
    if (v.isNumber()) return v.as<double>();
    if (v.isString()) return v.as<std::string>();
    if (isJsArray(v)) {
        inspector::StringList list;
        const unsigned length = v["length"].as<unsigned>();
        for (unsigned i = 0; i < length; i++) {
            const val item = v[i];
            if (item.isString()) list.push_back(item.as<std::string>());
            else if (item.isNumber()) list.push_back(val::global("String")(item).as<std::string>());
        }
        return list;
    }
    // Nested objects have no payload representation; keep the key so schemas still see it.
    return std::monostate{};
}

inspector::Payload payloadFromJs(const val& obj) {
    inspector::Payload payload;
    if (obj.isNull() || obj.isUndefined()) return payload;
    const val keys = val::global("Object").call<val>("keys", obj);
    const unsigned length = keys["length"].as<unsigned>();
    for (unsigned i = 0; i < length; i++) {
        const std::string key = keys[i].as<std::string>();
        payload[key] = valueFromJs(obj[key]);
    }
    return payload;
}

val valueToJs(const inspector::PayloadValue& value) {
    return std::visit([](const auto& v) -> val {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return val::null();
        } else if constexpr (std::is_same_v<T, inspector::StringList>) {
            val array = val::array();
            for (const auto& s : v) array.call<void>("push", s);
            return array;
        } else {
            return val(v);
        }
    }, value);
}

val payloadToJs(const inspector::Payload& payload) {
    val obj = val::object();
    for (const auto& [key, value] : payload) obj.set(key, valueToJs(value));
    return obj;
}

val eventToJs(const inspector::Event& event) {
    val obj = val::object();
    obj.set("type", std::string(inspector::eventKindName(event.kind)));
    obj.set("payload", payloadToJs(event.payload));
    obj.set("timestamp", static_cast<double>(event.timestamp));
    obj.set("id", event.id);
    obj.set("priority", std::string(inspector::priorityName(event.priority)));
    return obj;
}

inspector::DispatchOptions optionsFromJs(const val& obj) {
    inspector::DispatchOptions options;
    if (obj.isNull() || obj.isUndefined()) return options;
    const val priority = obj["priority"];
    if (priority.isString()) {
        if (auto parsed = inspector::parsePriority(priority.as<std::string>())) options.priority = *parsed;
    }
    if (obj["debounce"].isNumber()) options.debounceMs = obj["debounce"].as<std::uint32_t>();
    if (obj["throttle"].isNumber()) options.throttleMs = obj["throttle"].as<std::uint32_t>();
    if (!obj["retry"].isUndefined()) options.allowRetry = obj["retry"].as<bool>();
    if (!obj["silent"].isUndefined()) options.silent = obj["silent"].as<bool>();
    return options;
}

val idsToJs(const std::vector<std::string>& ids) {
    val array = val::array();
    for (const auto& id : ids) array.call<void>("push", id);
    return array;
}

// Calls cb(ev) inside a JS try/catch and returns the thrown message, or null.
// A JS exception must never unwind through the dispatcher's delivery loop.
const val& guardedCall() {
    static const val invoker = val::global("Function").new_(val("cb"), val("ev"),
        val("try { cb(ev); return null; } "
            "catch (e) { return String(e && e.message !== undefined ? e.message : e); }"));
    return invoker;
}

void invokeListener(const val& callback, const inspector::Event& event) {
    const val failure = guardedCall()(callback, eventToJs(event));
    if (!failure.isNull()) throw std::runtime_error(failure.as<std::string>());
}

// JS-facing facade over one InspectorContext. Subscriptions are addressed by
// integer handles because JS cannot hold the C++ unsubscribe closures.
class InspectorModule {
public:
    InspectorModule() = default;

    bool dispatch(const std::string& kind, val payload, val options) {
        return context_.dispatcher().dispatch(kind, payloadFromJs(payload), optionsFromJs(options));
    }

    std::uint32_t subscribe(const std::string& kind, val callback) {
        const auto parsed = inspector::parseEventKind(kind);
        if (!parsed) return 0;
        const std::uint32_t handle = nextHandle_++;
        handles_[handle] = context_.dispatcher().subscribe(*parsed,
            [callback](const inspector::Event& event) { invokeListener(callback, event); });
        return handle;
    }

    bool unsubscribe(std::uint32_t handle) {
        const auto it = handles_.find(handle);
        if (it == handles_.end()) return false;
        it->second();
        handles_.erase(it);
        return true;
    }

    std::uint32_t tick() { return static_cast<std::uint32_t>(context_.tick()); }
    void destroy() {
        handles_.clear();
        context_.destroy();
    }

    std::uint32_t getLastError() const { return static_cast<std::uint32_t>(context_.dispatcher().lastError()); }
    inspector::ProtocolInfo getProtocolInfo() const { return context_.getProtocolInfo(); }

    bool isSelected(const std::string& id) const { return context_.state().isSelected(id); }
    bool isHighlighted(const std::string& id) const { return context_.state().isHighlighted(id); }
    bool isFocused(const std::string& id) const { return context_.state().isFocused(id); }
    bool isIsolated(const std::string& id) const { return context_.state().isIsolated(id); }
    bool hasIsolation() const { return context_.state().hasIsolation(); }
    bool isVisible(const std::string& id) const { return context_.state().isVisible(id); }
    std::uint32_t getSelectionGeneration() const { return context_.state().getGeneration(); }

    val getSelected() const { return idsToJs(context_.state().getOrdered()); }
    val getFocused() const {
        const auto& focused = context_.state().focusedId();
        return focused ? val(*focused) : val::null();
    }

    val getHistory() const {
        val array = val::array();
        for (const auto& event : context_.dispatcher().getHistory()) array.call<void>("push", eventToJs(event));
        return array;
    }

private:
    inspector::InspectorContext context_;
    std::unordered_map<std::uint32_t, inspector::Unsubscribe> handles_;
    std::uint32_t nextHandle_ = 1;
};

} // namespace

EMSCRIPTEN_BINDINGS(model_inspector_module) {
    emscripten::value_object<inspector::ProtocolInfo>("ProtocolInfo")
        .field("protocolVersion", &inspector::ProtocolInfo::protocolVersion)
        .field("eventKindCount", &inspector::ProtocolInfo::eventKindCount)
        .field("schemaCount", &inspector::ProtocolInfo::schemaCount)
        .field("featureFlags", &inspector::ProtocolInfo::featureFlags);

    emscripten::class_<InspectorModule>("ModelInspector")
        .constructor<>()
        .function("dispatch", &InspectorModule::dispatch)
        .function("subscribe", &InspectorModule::subscribe)
        .function("unsubscribe", &InspectorModule::unsubscribe)
        .function("tick", &InspectorModule::tick)
        .function("destroy", &InspectorModule::destroy)
        .function("getLastError", &InspectorModule::getLastError)
        .function("getProtocolInfo", &InspectorModule::getProtocolInfo)
        .function("isSelected", &InspectorModule::isSelected)
        .function("isHighlighted", &InspectorModule::isHighlighted)
        .function("isFocused", &InspectorModule::isFocused)
        .function("isIsolated", &InspectorModule::isIsolated)
        .function("hasIsolation", &InspectorModule::hasIsolation)
        .function("isVisible", &InspectorModule::isVisible)
        .function("getSelectionGeneration", &InspectorModule::getSelectionGeneration)
        .function("getSelected", &InspectorModule::getSelected)
        .function("getFocused", &InspectorModule::getFocused)
        .function("getHistory", &InspectorModule::getHistory);
}
#endif
