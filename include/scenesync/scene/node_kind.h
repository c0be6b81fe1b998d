#pragma once
#include <optional>
#include <string_view>

namespace scenesync::scene {

enum class NodeKind {
    ClippingRectangle,
    Group,
    Shape,
    Text,
};

const char* node_kind_name(NodeKind kind);

// "ClippingRectangle", "Group", "Shape", "Text"; nullopt otherwise.
std::optional<NodeKind> node_kind_from_name(std::string_view name);

inline bool is_drawable(NodeKind kind) {
    return kind == NodeKind::Shape || kind == NodeKind::Text;
}

}  // namespace scenesync::scene
