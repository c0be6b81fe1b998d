#include <scenesync/scene/event_subscriptions.h>
#include <scenesync/render/render_node.h>

namespace scenesync::scene {

void Listener::invoke(const PointerEvent& event) const {
    if (callback) {
        callback(event);
    } else if (handler) {
        handler->handle_event(event);
    }
}

EventSubscriptions::~EventSubscriptions() {
    release_all();
}

void EventSubscriptions::reconcile(render::RenderNode& node, EventKind kind,
                                   const Listener& listener) {
    auto index = render::event_kind_index(kind);
    listeners_[index] = listener;

    if (listener.present()) {
        if (!subscriptions_[index]) {
            subscriptions_[index] = node.subscribe(kind, [this](const PointerEvent& event) {
                dispatch(event);
            });
        }
    } else if (subscriptions_[index]) {
        // Move out first so a reentrant release cannot run the handle twice.
        render::Unsubscribe unsubscribe = std::move(subscriptions_[index]);
        subscriptions_[index] = nullptr;
        unsubscribe();
    }
}

void EventSubscriptions::release_all() {
    for (auto& slot : subscriptions_) {
        if (slot) {
            render::Unsubscribe unsubscribe = std::move(slot);
            slot = nullptr;
            unsubscribe();
        }
    }
    for (auto& listener : listeners_) {
        listener = Listener();
    }
}

void EventSubscriptions::dispatch(const PointerEvent& event) const {
    // Copy: the listener may replace itself or remove its node, which
    // destroys the table slot while the call is still running. Nothing
    // below may touch `this` after invoke().
    Listener current = listeners_[render::event_kind_index(event.kind)];
    if (!current.present()) {
        return;
    }
    current.invoke(event);
}

bool EventSubscriptions::subscribed(EventKind kind) const {
    return static_cast<bool>(subscriptions_[render::event_kind_index(kind)]);
}

std::size_t EventSubscriptions::active_count() const {
    std::size_t count = 0;
    for (const auto& slot : subscriptions_) {
        if (slot) ++count;
    }
    return count;
}

const Listener& EventSubscriptions::listener(EventKind kind) const {
    return listeners_[render::event_kind_index(kind)];
}

}  // namespace scenesync::scene
