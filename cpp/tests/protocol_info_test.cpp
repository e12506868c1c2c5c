#include <gtest/gtest.h>
#include "inspector/inspector_context.h"
#include "inspector/events/event_kind.h"

using namespace inspector;

TEST(ProtocolInfoTest, NonZeroAndStable) {
    InspectorContext context;
    const auto info1 = context.getProtocolInfo();
    const auto info2 = context.getProtocolInfo();

    EXPECT_EQ(info1.protocolVersion, kProtocolVersion);
    EXPECT_EQ(info1.featureFlags, kFeatureFlags);
    EXPECT_EQ(info1.eventKindCount, allEventKinds().size());
    EXPECT_EQ(info1.schemaCount, context.dispatcher().schemas().size());

    EXPECT_NE(info1.protocolVersion, 0u);
    EXPECT_NE(info1.eventKindCount, 0u);
    EXPECT_NE(info1.schemaCount, 0u);
    EXPECT_NE(info1.featureFlags, 0u);

    EXPECT_EQ(info1.schemaCount, info2.schemaCount);
    EXPECT_EQ(info1.featureFlags, info2.featureFlags);
}

TEST(ProtocolInfoTest, AdvertisesSyncFeatures) {
    const std::uint32_t flags = InspectorContext().getProtocolInfo().featureFlags;
    for (const auto feature : {
             InspectorFeatureFlags::FEATURE_DEBOUNCE,
             InspectorFeatureFlags::FEATURE_THROTTLE,
             InspectorFeatureFlags::FEATURE_RETRY,
             InspectorFeatureFlags::FEATURE_PRIORITY_QUEUES,
             InspectorFeatureFlags::FEATURE_ORIGIN_SYNC,
             InspectorFeatureFlags::FEATURE_SNAPSHOTS,
         }) {
        EXPECT_NE(flags & static_cast<std::uint32_t>(feature), 0u);
    }
}
