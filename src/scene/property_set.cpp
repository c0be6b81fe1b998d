#include <scenesync/scene/property_set.h>

namespace scenesync::scene {

double resolve_scale_x(const PropertySet& props) {
    if (props.scale_x) return *props.scale_x;
    if (props.scale) return *props.scale;
    return core::config::kDefaultScale;
}

double resolve_scale_y(const PropertySet& props) {
    if (props.scale_y) return *props.scale_y;
    if (props.scale) return *props.scale;
    return core::config::kDefaultScale;
}

std::string children_as_string(const std::vector<ChildValue>& children) {
    std::string result;
    for (const auto& child : children) {
        if (auto* text = std::get_if<std::string>(&child)) {
            result += *text;
        }
    }
    return result;
}

paint::PathValue resolve_shape_path(const PropertySet& props) {
    if (props.d) {
        const auto* text = std::get_if<std::string>(&*props.d);
        const auto* ref = std::get_if<paint::PathRef>(&*props.d);
        // Empty data and null references fall through to the children.
        if ((text && !text->empty()) || (ref && *ref)) {
            return *props.d;
        }
    }
    return children_as_string(props.children);
}

bool is_text_content(const PropertySet& props) {
    if (props.children.size() != 1) return false;
    const auto& only = props.children.front();
    return std::holds_alternative<std::string>(only) ||
           std::holds_alternative<double>(only);
}

}  // namespace scenesync::scene
