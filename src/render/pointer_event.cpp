#include <scenesync/render/pointer_event.h>

namespace scenesync::render {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Click:     return "click";
        case EventKind::MouseMove: return "mousemove";
        case EventKind::MouseOver: return "mouseover";
        case EventKind::MouseOut:  return "mouseout";
        case EventKind::MouseUp:   return "mouseup";
        case EventKind::MouseDown: return "mousedown";
    }
    return "unknown";
}

std::optional<EventKind> event_kind_from_name(std::string_view name) {
    for (EventKind kind : kAllEventKinds) {
        if (name == event_kind_name(kind)) return kind;
    }
    return std::nullopt;
}

}  // namespace scenesync::render
