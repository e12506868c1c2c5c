#include "inspector/inspector_context.h"
#include "inspector/core/logging.h"
#include "inspector/events/event_kind.h"

#include <utility>

namespace inspector {

InspectorContext::InspectorContext(InspectorConfig config, DeferredScheduler::Clock clock)
    : scheduler_(std::move(clock)),
      dispatcher_(scheduler_, EventSchemaRegistry::withDefaults(), config.dispatcher),
      coordinator_(dispatcher_, state_, config.sync) {
    coordinator_.attach();
}

InspectorContext::~InspectorContext() {
    destroy();
}

std::unique_ptr<SyncSurface> InspectorContext::createSurface(InteractionOrigin self, SurfaceConfig config) {
    return std::make_unique<SyncSurface>(dispatcher_, self, config);
}

std::size_t InspectorContext::tick() {
    if (isDestroyed()) return 0;
    return scheduler_.runDue();
}

void InspectorContext::destroy() {
    if (isDestroyed()) return;
    coordinator_.detach();
    dispatcher_.destroy();
    scheduler_.cancelAll();
    INSPECTOR_LOG_DEBUG("inspector context destroyed");
}

ProtocolInfo InspectorContext::getProtocolInfo() const {
    return ProtocolInfo{
        kProtocolVersion,
        static_cast<std::uint32_t>(allEventKinds().size()),
        static_cast<std::uint32_t>(dispatcher_.schemas().size()),
        kFeatureFlags,
    };
}

} // namespace inspector
