#include <gtest/gtest.h>
#include "inspector/events/event_dispatcher.h"
#include "inspector/events/typed_payloads.h"
#include "tests/test_common.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace inspector;
using inspector_test::DispatcherTest;
using inspector_test::text;

namespace {

Payload zoom(double factor) {
    Payload payload;
    payload["factor"] = factor;
    return payload;
}

DispatchOptions retrying() {
    DispatchOptions options;
    options.allowRetry = true;
    return options;
}

} // namespace

// ==============================================================================
// Registration
// ==============================================================================

TEST_F(DispatcherTest, ListenersRunInRegistrationOrder) {
    std::vector<int> calls;
    const Listener first = [&](const Event&) { calls.push_back(1); };
    dispatcher.subscribe(EventKind::CameraFit, first);
    dispatcher.subscribe(EventKind::CameraFit, first);
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { calls.push_back(2); });

    EXPECT_TRUE(dispatcher.dispatch(EventKind::CameraFit));
    EXPECT_EQ(calls, (std::vector<int>{1, 1, 2}));
    EXPECT_EQ(dispatcher.getListenerCount(EventKind::CameraFit), 3u);
}

TEST_F(DispatcherTest, UnsubscribeIsIdempotent) {
    int calls = 0;
    auto off = dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { calls++; });
    off();
    off();
    dispatcher.dispatch(EventKind::CameraFit);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(dispatcher.getListenerCount(EventKind::CameraFit), 0u);
}

TEST(DispatcherLifetimeTest, UnsubscribeAfterDispatcherIsGone) {
    DeferredScheduler scheduler;
    Unsubscribe late;
    {
        auto dispatcher = std::make_unique<EventDispatcher>(scheduler);
        late = dispatcher->subscribe(EventKind::CameraFit, [](const Event&) {});
    }
    late();
    SUCCEED();
}

TEST_F(DispatcherTest, SubscribeOnceDeliversOnce) {
    int calls = 0;
    dispatcher.subscribeOnce(EventKind::CameraReset, [&](const Event&) { calls++; });
    dispatcher.dispatch(EventKind::CameraReset);
    dispatcher.dispatch(EventKind::CameraReset);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(dispatcher.getListenerCount(EventKind::CameraReset), 0u);
}

TEST_F(DispatcherTest, WildcardRunsAfterKindListeners) {
    std::vector<std::string> calls;
    dispatcher.subscribeAny([&](const Event& e) { calls.push_back("any:" + std::string(eventKindName(e.kind))); });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { calls.push_back("fit"); });

    dispatcher.dispatch(EventKind::CameraFit);
    dispatcher.dispatch(EventKind::CameraReset);
    EXPECT_EQ(calls, (std::vector<std::string>{"fit", "any:camera:fit", "any:camera:reset"}));
}

TEST_F(DispatcherTest, ListenerRemovedMidDispatchIsSkipped) {
    int second = 0;
    int added = 0;
    Unsubscribe offSecond;
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        offSecond();
        dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { added++; });
    });
    offSecond = dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { second++; });

    dispatcher.dispatch(EventKind::CameraFit);
    EXPECT_EQ(second, 0);
    EXPECT_EQ(added, 0);
}

// ==============================================================================
// Rejections
// ==============================================================================

TEST_F(DispatcherTest, MissingRequiredFieldRejectsBeforeListeners) {
    int calls = 0;
    dispatcher.subscribeAny([&](const Event&) { calls++; });

    DispatchOptions silent;
    silent.silent = true;
    for (const EventKind kind : allEventKinds()) {
        const auto* fields = dispatcher.schemas().requiredFields(kind);
        if (!fields || fields->empty()) continue;
        EXPECT_FALSE(dispatcher.dispatch(kind, Payload{}, silent)) << eventKindName(kind);
        EXPECT_EQ(dispatcher.lastError(), DispatchError::ValidationFailed);
    }
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(dispatcher.getHistory().empty());
}

TEST_F(DispatcherTest, UnknownKindIsRejected) {
    EXPECT_FALSE(dispatcher.dispatch("camera:spin"));
    EXPECT_EQ(dispatcher.lastError(), DispatchError::UnknownKind);
    EXPECT_FALSE(dispatcher.dispatch(static_cast<EventKind>(999)));
    EXPECT_EQ(dispatcher.lastError(), DispatchError::UnknownKind);

    EXPECT_TRUE(dispatcher.dispatch("camera:fit"));
    EXPECT_EQ(dispatcher.lastError(), DispatchError::Ok);
}

TEST_F(DispatcherTest, TypedDispatchUsesSchema) {
    std::vector<Event> seen;
    dispatcher.subscribe(EventKind::SelectionChange, [&](const Event& e) { seen.push_back(e); });

    EXPECT_TRUE(dispatcher.dispatchTyped(SelectionChangePayload{{"n1", "n2"}, true, InteractionOrigin::Tree}));
    ASSERT_EQ(seen.size(), 1u);
    const auto decoded = SelectionChangePayload::fromPayload(seen[0].payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->nodeIds, (StringList{"n1", "n2"}));
    EXPECT_TRUE(decoded->multi);
    EXPECT_EQ(decoded->origin, InteractionOrigin::Tree);
}

// ==============================================================================
// Debounce / throttle
// ==============================================================================

TEST_F(DispatcherTest, DebounceDeliversLastPayloadOnce) {
    std::vector<double> factors;
    dispatcher.subscribe(EventKind::CameraZoom, [&](const Event& e) {
        factors.push_back(getNumber(e.payload, "factor").value_or(-1.0));
    });

    DispatchOptions options;
    options.debounceMs = 50;
    for (int i = 0; i < 5; i++) {
        EXPECT_TRUE(dispatcher.dispatch(EventKind::CameraZoom, zoom(i), options));
        advance(10);
    }
    EXPECT_TRUE(factors.empty());
    EXPECT_TRUE(dispatcher.hasPendingDebounce(EventKind::CameraZoom));

    advance(50);
    ASSERT_EQ(factors.size(), 1u);
    EXPECT_DOUBLE_EQ(factors[0], 4.0);
    EXPECT_FALSE(dispatcher.hasPendingDebounce(EventKind::CameraZoom));
}

TEST_F(DispatcherTest, ThrottleKeepsFirstAndDropsRest) {
    std::vector<double> factors;
    dispatcher.subscribe(EventKind::CameraZoom, [&](const Event& e) {
        factors.push_back(getNumber(e.payload, "factor").value_or(-1.0));
    });

    DispatchOptions options;
    options.throttleMs = 100;
    EXPECT_TRUE(dispatcher.dispatch(EventKind::CameraZoom, zoom(1), options));
    for (int i = 2; i <= 4; i++) {
        advance(10);
        EXPECT_FALSE(dispatcher.dispatch(EventKind::CameraZoom, zoom(i), options));
        EXPECT_EQ(dispatcher.lastError(), DispatchError::Throttled);
    }
    ASSERT_EQ(factors.size(), 1u);
    EXPECT_DOUBLE_EQ(factors[0], 1.0);

    advance(80);
    EXPECT_TRUE(dispatcher.dispatch(EventKind::CameraZoom, zoom(5), options));
    EXPECT_EQ(factors.size(), 2u);
    // Dropped calls are never replayed.
    advance(1000);
    EXPECT_EQ(factors.size(), 2u);
}

// ==============================================================================
// Re-entrancy and queues
// ==============================================================================

TEST_F(DispatcherTest, ReentrantDispatchIsDeferred) {
    int depth = 0;
    int maxDepth = 0;
    int calls = 0;
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        depth++;
        maxDepth = std::max(maxDepth, depth);
        calls++;
        if (calls < 4) {
            EXPECT_TRUE(dispatcher.isDispatching());
            dispatcher.dispatch(EventKind::CameraFit);
            EXPECT_EQ(dispatcher.getQueuedCount(), 1u);
        }
        depth--;
    });

    dispatcher.dispatch(EventKind::CameraFit);
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(maxDepth, 1);
    EXPECT_FALSE(dispatcher.isDispatching());
    EXPECT_EQ(dispatcher.getQueuedCount(), 0u);
}

TEST_F(DispatcherTest, QueuedEventsDrainByPriority) {
    std::vector<EventKind> order;
    dispatcher.subscribeAny([&](const Event& e) { order.push_back(e.kind); });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        DispatchOptions low;
        low.priority = DispatchPriority::Low;
        DispatchOptions high;
        high.priority = DispatchPriority::High;
        dispatcher.dispatch(EventKind::CameraReset);
        dispatcher.dispatch(EventKind::CameraZoom, zoom(2), low);
        dispatcher.dispatch(EventKind::FullscreenEnter, Payload{}, high);
    });

    dispatcher.dispatch(EventKind::CameraFit);
    EXPECT_EQ(order, (std::vector<EventKind>{
        EventKind::CameraFit, EventKind::FullscreenEnter, EventKind::CameraReset, EventKind::CameraZoom}));
}

TEST_F(DispatcherTest, DrainIsBoundedPerTick) {
    int resets = 0;
    dispatcher.subscribe(EventKind::CameraReset, [&](const Event&) { resets++; });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        for (int i = 0; i < 25; i++) dispatcher.dispatch(EventKind::CameraReset);
    });

    dispatcher.dispatch(EventKind::CameraFit);
    EXPECT_EQ(resets, 10);
    EXPECT_EQ(dispatcher.getQueuedCount(), 15u);

    advance(0);
    EXPECT_EQ(resets, 20);
    advance(0);
    EXPECT_EQ(resets, 25);
    EXPECT_EQ(dispatcher.getQueuedCount(), 0u);
    EXPECT_EQ(scheduler.pendingCount(), 0u);
}

// ==============================================================================
// Listener failures
// ==============================================================================

TEST_F(DispatcherTest, FailingListenerDoesNotStopSiblings) {
    std::vector<int> calls;
    std::vector<ListenerFailure> failures;
    std::vector<Event> errors;
    dispatcher.onError([&](const ListenerFailure& f) { failures.push_back(f); });
    dispatcher.subscribe(EventKind::Error, [&](const Event& e) { errors.push_back(e); });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { calls.push_back(1); });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        calls.push_back(2);
        throw std::runtime_error("boom");
    });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { calls.push_back(3); });

    EXPECT_TRUE(dispatcher.dispatch(EventKind::CameraFit));
    EXPECT_EQ(calls, (std::vector<int>{1, 2, 3}));

    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].message, "boom");
    EXPECT_EQ(failures[0].event.kind, EventKind::CameraFit);
    EXPECT_EQ(failures[0].attempt, 0u);

    ASSERT_EQ(errors.size(), 1u);
    const auto error = ErrorPayload::fromPayload(errors[0].payload);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "boom");
    EXPECT_EQ(error->eventKind, "camera:fit");
    EXPECT_EQ(error->eventId, failures[0].event.id);
}

TEST_F(DispatcherTest, FailingErrorListenerDoesNotRecurse) {
    int observed = 0;
    dispatcher.onError([&](const ListenerFailure&) { observed++; });
    dispatcher.subscribe(EventKind::Error, [](const Event&) { throw 42; });
    dispatcher.subscribe(EventKind::CameraFit, [](const Event&) { throw std::logic_error("fit"); });

    dispatcher.dispatch(EventKind::CameraFit, Payload{}, retrying());
    for (int i = 0; i < 3; i++) advance(5000);

    EXPECT_EQ(dispatcher.getHistory(EventKind::Error).size(), 1u);
    // Four attempts on camera:fit plus the single failing error delivery.
    EXPECT_EQ(observed, 5);
    EXPECT_EQ(dispatcher.getPendingRetryCount(), 0u);
}

TEST_F(DispatcherTest, ThrowingErrorObserverLeavesDispatcherUsable) {
    int resets = 0;
    dispatcher.onError([](const ListenerFailure&) { throw 7; });
    dispatcher.onError([](const ListenerFailure&) { throw std::runtime_error("observer"); });
    dispatcher.subscribe(EventKind::CameraFit, [](const Event&) { throw std::runtime_error("fit"); });
    dispatcher.subscribe(EventKind::CameraReset, [&](const Event&) { resets++; });

    EXPECT_NO_THROW(dispatcher.dispatch(EventKind::CameraFit));
    EXPECT_FALSE(dispatcher.isDispatching());
    EXPECT_EQ(dispatcher.getHistory(EventKind::Error).size(), 1u);

    EXPECT_TRUE(dispatcher.dispatch(EventKind::CameraReset));
    EXPECT_EQ(resets, 1);
}

TEST_F(DispatcherTest, RetryBacksOffThenDiscards) {
    std::vector<double> attemptTimes;
    std::vector<std::uint32_t> attempts;
    dispatcher.onError([&](const ListenerFailure& f) { attempts.push_back(f.attempt); });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        attemptTimes.push_back(clock.nowMs);
        throw std::runtime_error("unavailable");
    });

    dispatcher.dispatch(EventKind::CameraFit, Payload{}, retrying());
    EXPECT_EQ(attemptTimes.size(), 1u);
    EXPECT_EQ(dispatcher.getPendingRetryCount(), 1u);
    EXPECT_TRUE(dispatcher.getHistory(EventKind::Error).empty());

    advance(99);
    EXPECT_EQ(attemptTimes.size(), 1u);
    for (int i = 0; i < 100; i++) advance(50);

    ASSERT_EQ(attemptTimes.size(), 4u);
    EXPECT_EQ(attempts, (std::vector<std::uint32_t>{0, 1, 2, 3}));
    double previousGap = 0.0;
    for (std::size_t i = 1; i < attemptTimes.size(); i++) {
        const double gap = attemptTimes[i] - attemptTimes[i - 1];
        EXPECT_GT(gap, previousGap);
        previousGap = gap;
    }
    EXPECT_EQ(dispatcher.getPendingRetryCount(), 0u);

    const auto history = dispatcher.getHistory(EventKind::CameraFit);
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history.front().id, history.back().id);

    const auto errors = dispatcher.getHistory(EventKind::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_DOUBLE_EQ(getNumber(errors[0].payload, "attempt").value_or(-1.0), 3.0);
}

TEST_F(DispatcherTest, RetryStopsAfterSuccess) {
    int calls = 0;
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        if (++calls == 1) throw std::runtime_error("transient");
    });

    dispatcher.dispatch(EventKind::CameraFit, Payload{}, retrying());
    advance(100);
    EXPECT_EQ(calls, 2);
    advance(10000);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(dispatcher.getPendingRetryCount(), 0u);
    EXPECT_TRUE(dispatcher.getHistory(EventKind::Error).empty());
}

TEST_F(DispatcherTest, FailureWithoutRetryReportsImmediately) {
    dispatcher.subscribe(EventKind::CameraFit, [](const Event&) { throw std::runtime_error("no"); });
    dispatcher.dispatch(EventKind::CameraFit);
    EXPECT_EQ(dispatcher.getPendingRetryCount(), 0u);
    EXPECT_EQ(dispatcher.getHistory(EventKind::Error).size(), 1u);
}

// ==============================================================================
// History and ids
// ==============================================================================

TEST_F(DispatcherTest, HistoryIsBounded) {
    for (int i = 0; i < 120; i++) dispatcher.dispatch(EventKind::CameraZoom, zoom(i));
    dispatcher.dispatch(EventKind::CameraFit);

    const auto history = dispatcher.getHistory();
    ASSERT_EQ(history.size(), 100u);
    EXPECT_DOUBLE_EQ(getNumber(history.front().payload, "factor").value_or(-1.0), 21.0);
    EXPECT_EQ(history.back().kind, EventKind::CameraFit);
    EXPECT_EQ(dispatcher.getHistory(EventKind::CameraFit).size(), 1u);

    dispatcher.clearHistory();
    EXPECT_TRUE(dispatcher.getHistory().empty());
}

TEST_F(DispatcherTest, EventCarriesIdTimestampAndPriority) {
    std::vector<Event> seen;
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event& e) { seen.push_back(e); });

    DispatchOptions options;
    options.priority = DispatchPriority::High;
    dispatcher.dispatch(EventKind::CameraFit, Payload{}, options);
    dispatcher.dispatch(EventKind::CameraFit);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].timestamp, 1000);
    EXPECT_EQ(seen[0].priority, DispatchPriority::High);
    EXPECT_EQ(seen[1].priority, DispatchPriority::Normal);

    const std::string prefix = "camera:fit-1000-";
    ASSERT_EQ(seen[0].id.rfind(prefix, 0), 0u);
    const std::string suffix = seen[0].id.substr(prefix.size());
    EXPECT_EQ(suffix.size(), 9u);
    EXPECT_EQ(suffix.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz"), std::string::npos);
    EXPECT_NE(seen[0].id, seen[1].id);
}

// ==============================================================================
// Lifecycle
// ==============================================================================

TEST_F(DispatcherTest, DestroyCancelsPendingWorkAndRejects) {
    int calls = 0;
    dispatcher.subscribe(EventKind::CameraZoom, [&](const Event&) { calls++; });
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) {
        calls++;
        throw std::runtime_error("retry me");
    });

    DispatchOptions debounced;
    debounced.debounceMs = 50;
    dispatcher.dispatch(EventKind::CameraZoom, zoom(1), debounced);
    dispatcher.dispatch(EventKind::CameraFit, Payload{}, retrying());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(scheduler.pendingCount(), 2u);

    dispatcher.destroy();
    dispatcher.destroy();
    EXPECT_TRUE(dispatcher.isDestroyed());
    EXPECT_EQ(scheduler.pendingCount(), 0u);
    EXPECT_TRUE(dispatcher.getHistory().empty());

    advance(10000);
    EXPECT_EQ(calls, 1);

    EXPECT_FALSE(dispatcher.dispatch(EventKind::CameraFit));
    EXPECT_EQ(dispatcher.lastError(), DispatchError::Destroyed);
    EXPECT_EQ(dispatcher.getListenerCount(EventKind::CameraFit), 0u);
}

TEST_F(DispatcherTest, ClearKeepsDispatcherUsable) {
    int calls = 0;
    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { calls++; });
    DispatchOptions debounced;
    debounced.debounceMs = 20;
    dispatcher.dispatch(EventKind::CameraFit, Payload{}, debounced);

    dispatcher.clear();
    EXPECT_FALSE(dispatcher.hasPendingDebounce(EventKind::CameraFit));
    advance(100);
    EXPECT_EQ(calls, 0);

    dispatcher.subscribe(EventKind::CameraFit, [&](const Event&) { calls++; });
    EXPECT_TRUE(dispatcher.dispatch(EventKind::CameraFit));
    EXPECT_EQ(calls, 1);
}
