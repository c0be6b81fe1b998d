#include <scenesync/scene/node_kind.h>

namespace scenesync::scene {

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::ClippingRectangle: return "ClippingRectangle";
        case NodeKind::Group:             return "Group";
        case NodeKind::Shape:             return "Shape";
        case NodeKind::Text:              return "Text";
    }
    return "Unknown";
}

std::optional<NodeKind> node_kind_from_name(std::string_view name) {
    if (name == "ClippingRectangle") return NodeKind::ClippingRectangle;
    if (name == "Group") return NodeKind::Group;
    if (name == "Shape") return NodeKind::Shape;
    if (name == "Text") return NodeKind::Text;
    return std::nullopt;
}

}  // namespace scenesync::scene
