#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

#include <scenesync/core/config.h>

namespace scenesync::render {

// Pointer events a retained node can be subscribed to.
enum class EventKind {
    Click,
    MouseMove,
    MouseOver,
    MouseOut,
    MouseUp,
    MouseDown,
};

inline constexpr std::array<EventKind, core::config::kEventKindCount> kAllEventKinds = {
    EventKind::Click, EventKind::MouseMove, EventKind::MouseOver,
    EventKind::MouseOut, EventKind::MouseUp, EventKind::MouseDown,
};

inline constexpr std::size_t event_kind_index(EventKind kind) {
    return static_cast<std::size_t>(kind);
}

// Backend event name: "click", "mousemove", ...
const char* event_kind_name(EventKind kind);
std::optional<EventKind> event_kind_from_name(std::string_view name);

struct PointerEvent {
    EventKind kind = EventKind::Click;
    double x = 0;  // surface coordinates
    double y = 0;
    int button = 0;  // 0=primary, 1=middle, 2=secondary
    bool alt_key = false;
    bool ctrl_key = false;
    bool meta_key = false;
    bool shift_key = false;
};

using PointerHandler = std::function<void(const PointerEvent&)>;

// Returned by RenderNode::subscribe; calling it removes the subscription.
using Unsubscribe = std::function<void()>;

}  // namespace scenesync::render
