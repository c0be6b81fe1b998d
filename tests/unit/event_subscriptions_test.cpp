#include <scenesync/scene/event_subscriptions.h>

#include "recording_backend.h"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace scenesync::scene;
using scenesync::render::RenderNode;
using scenesync::testing::CallLog;
using scenesync::testing::RecordingNode;

namespace {

class CountingHandler : public EventHandler {
public:
    void handle_event(const PointerEvent& event) override {
        ++count;
        last_x = event.x;
    }
    int count = 0;
    double last_x = 0;
};

PointerEvent click_at(double x) {
    PointerEvent e;
    e.kind = EventKind::Click;
    e.x = x;
    return e;
}

}  // namespace

// ---------------------------------------------------------------------------
// Listener
// ---------------------------------------------------------------------------
TEST(Listener, PresenceAndInvoke) {
    Listener empty;
    EXPECT_FALSE(empty.present());

    int calls = 0;
    Listener fn([&calls](const PointerEvent&) { ++calls; });
    EXPECT_TRUE(static_cast<bool>(fn));
    fn.invoke(click_at(0));
    EXPECT_EQ(calls, 1);
}

TEST(Listener, CallableWinsOverHandler) {
    auto handler = std::make_shared<CountingHandler>();
    int calls = 0;
    Listener both;
    both.callback = [&calls](const PointerEvent&) { ++calls; };
    both.handler = handler;
    both.invoke(click_at(0));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(handler->count, 0);
}

// ---------------------------------------------------------------------------
// Reconcile
// ---------------------------------------------------------------------------
TEST(EventSubscriptions, SubscribesOnceWhenListenerAppears) {
    CallLog log;
    RecordingNode<RenderNode> node(log, 1);
    EventSubscriptions subs;

    int calls = 0;
    subs.reconcile(node, EventKind::Click, Listener([&calls](const PointerEvent&) { ++calls; }));
    subs.reconcile(node, EventKind::Click, Listener([&calls](const PointerEvent&) { calls += 10; }));

    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].op, "subscribe");
    EXPECT_EQ(log[0].args, "click");
    EXPECT_TRUE(subs.subscribed(EventKind::Click));

    // The newest listener is used without resubscribing.
    node.fire(click_at(3));
    EXPECT_EQ(calls, 10);
}

TEST(EventSubscriptions, UnsubscribesWhenListenerGoes) {
    CallLog log;
    RecordingNode<RenderNode> node(log, 1);
    EventSubscriptions subs;

    subs.reconcile(node, EventKind::MouseMove, Listener([](const PointerEvent&) {}));
    subs.reconcile(node, EventKind::MouseMove, Listener());
    subs.reconcile(node, EventKind::MouseMove, Listener());

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1].op, "unsubscribe");
    EXPECT_FALSE(subs.subscribed(EventKind::MouseMove));
    EXPECT_EQ(node.handler_count(), 0u);
}

TEST(EventSubscriptions, AbsentListenerNeverSubscribes) {
    CallLog log;
    RecordingNode<RenderNode> node(log, 1);
    EventSubscriptions subs;
    for (EventKind kind : scenesync::render::kAllEventKinds) {
        subs.reconcile(node, kind, Listener());
    }
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(subs.active_count(), 0u);
}

TEST(EventSubscriptions, HandlerObjectsReceiveEvents) {
    CallLog log;
    RecordingNode<RenderNode> node(log, 1);
    EventSubscriptions subs;
    auto handler = std::make_shared<CountingHandler>();

    subs.reconcile(node, EventKind::Click, Listener(handler));
    node.fire(click_at(42));
    EXPECT_EQ(handler->count, 1);
    EXPECT_DOUBLE_EQ(handler->last_x, 42);
}

TEST(EventSubscriptions, ReleaseAllUnsubscribesEachOnce) {
    CallLog log;
    RecordingNode<RenderNode> node(log, 1);
    {
        EventSubscriptions subs;
        subs.reconcile(node, EventKind::Click, Listener([](const PointerEvent&) {}));
        subs.reconcile(node, EventKind::MouseUp, Listener([](const PointerEvent&) {}));
        EXPECT_EQ(subs.active_count(), 2u);

        subs.release_all();
        EXPECT_EQ(subs.active_count(), 0u);
        EXPECT_FALSE(subs.listener(EventKind::Click).present());
    }
    std::size_t unsubscribes = 0;
    for (const auto& call : log) {
        if (call.op == "unsubscribe") ++unsubscribes;
    }
    // The destructor finds nothing left to release.
    EXPECT_EQ(unsubscribes, 2u);
}

TEST(EventSubscriptions, DispatchIgnoresMissingListener) {
    EventSubscriptions subs;
    subs.dispatch(click_at(1));
    SUCCEED();
}

TEST(EventSubscriptions, ListenerMayReplaceItselfWhileRunning) {
    CallLog log;
    RecordingNode<RenderNode> node(log, 1);
    EventSubscriptions subs;

    int replacement_calls = 0;
    Listener replacement([&replacement_calls](const PointerEvent&) { ++replacement_calls; });

    std::string label(64, 'x');
    std::string seen;
    subs.reconcile(node, EventKind::Click,
        Listener([&subs, &node, &replacement, &seen, label](const PointerEvent&) {
            subs.reconcile(node, EventKind::Click, replacement);
            // Captures must still be alive after the slot was overwritten.
            seen = label;
        }));

    EXPECT_TRUE(node.fire(click_at(1)));
    EXPECT_EQ(seen, label);
    EXPECT_EQ(replacement_calls, 0);

    EXPECT_TRUE(node.fire(click_at(2)));
    EXPECT_EQ(replacement_calls, 1);
    EXPECT_EQ(subs.active_count(), 1u);
}

TEST(EventSubscriptions, ListenerMayReleaseAllWhileRunning) {
    CallLog log;
    RecordingNode<RenderNode> node(log, 1);
    EventSubscriptions subs;

    std::string label(64, 'y');
    std::string seen;
    subs.reconcile(node, EventKind::MouseDown,
        Listener([&subs, &seen, label](const PointerEvent&) {
            subs.release_all();
            seen = label;
        }));

    PointerEvent down;
    down.kind = EventKind::MouseDown;
    EXPECT_TRUE(node.fire(down));
    EXPECT_EQ(seen, label);
    EXPECT_EQ(subs.active_count(), 0u);
    EXPECT_FALSE(node.fire(down));
}
