#pragma once
#include <array>
#include <functional>
#include <memory>

#include <scenesync/core/config.h>
#include <scenesync/render/pointer_event.h>

namespace scenesync::render { class RenderNode; }

namespace scenesync::scene {

using render::EventKind;
using render::PointerEvent;

// Listener objects that want events through a method instead of a callable.
class EventHandler {
public:
    virtual ~EventHandler() = default;
    virtual void handle_event(const PointerEvent& event) = 0;
};

// A property-set listener: a callable, a handler object, or nothing.
struct Listener {
    std::function<void(const PointerEvent&)> callback;
    std::shared_ptr<EventHandler> handler;

    Listener() = default;
    Listener(std::function<void(const PointerEvent&)> fn) : callback(std::move(fn)) {}
    Listener(std::shared_ptr<EventHandler> h) : handler(std::move(h)) {}

    bool present() const { return callback != nullptr || handler != nullptr; }
    explicit operator bool() const { return present(); }

    // Callable wins over handler when both are set.
    void invoke(const PointerEvent& event) const;
};

// Per-node event wiring. Two tables are kept apart on purpose:
//  - listeners_: the current listener per kind, read at dispatch time;
//  - subscriptions_: the live backend subscription per kind.
// Swapping one listener for another therefore never resubscribes; only a
// presence change touches the backend.
class EventSubscriptions {
public:
    EventSubscriptions() = default;
    ~EventSubscriptions();

    EventSubscriptions(const EventSubscriptions&) = delete;
    EventSubscriptions& operator=(const EventSubscriptions&) = delete;

    void reconcile(render::RenderNode& node, EventKind kind, const Listener& listener);

    // Release every live subscription exactly once and forget all listeners.
    void release_all();

    // Dispatcher body shared by all subscriptions of this node.
    void dispatch(const PointerEvent& event) const;

    bool subscribed(EventKind kind) const;
    std::size_t active_count() const;
    const Listener& listener(EventKind kind) const;

private:
    std::array<Listener, core::config::kEventKindCount> listeners_;
    std::array<render::Unsubscribe, core::config::kEventKindCount> subscriptions_;
};

}  // namespace scenesync::scene
