#include <scenesync/scene/node_factory.h>
#include <scenesync/scene/appliers.h>

#include <stdexcept>
#include <string>

namespace scenesync::scene {

NodeFactory::NodeFactory(render::RenderBackend& backend)
    : backend_(backend) {}

std::unique_ptr<SceneNode> NodeFactory::construct(NodeKind kind, const PropertySet& props) {
    std::uint64_t id = next_id_;
    std::unique_ptr<SceneNode> node;

    switch (kind) {
        case NodeKind::ClippingRectangle:
            node = SceneNode::clipping_rectangle(id, backend_.create_clipping_rectangle());
            break;
        case NodeKind::Group:
            node = SceneNode::group(id, backend_.create_group());
            break;
        case NodeKind::Shape:
            node = SceneNode::shape(id, backend_.create_shape());
            break;
        case NodeKind::Text:
            node = SceneNode::text(id, backend_.create_text(children_as_string(props.children),
                                                            props.font, props.alignment,
                                                            props.path));
            break;
    }

    if (!node) {
        throw std::invalid_argument("scene: unsupported node kind " +
                                    std::to_string(static_cast<int>(kind)));
    }
    ++next_id_;
    return node;
}

std::unique_ptr<SceneNode> NodeFactory::create(NodeKind kind, const PropertySet& props,
                                               paint::Transform& scratch) {
    auto node = construct(kind, props);
    apply_props(*node, props, PropertySet{}, scratch);
    return node;
}

std::unique_ptr<SceneNode> NodeFactory::create(std::string_view type, const PropertySet& props,
                                               paint::Transform& scratch) {
    auto kind = node_kind_from_name(type);
    if (!kind) {
        throw std::invalid_argument("scene: does not support the type \"" +
                                    std::string(type) + "\"");
    }
    return create(*kind, props, scratch);
}

}  // namespace scenesync::scene
