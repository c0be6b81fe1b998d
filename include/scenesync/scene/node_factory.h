#pragma once
#include <cstdint>
#include <memory>
#include <string_view>

#include <scenesync/paint/transform.h>
#include <scenesync/render/render_node.h>
#include <scenesync/scene/node_kind.h>
#include <scenesync/scene/property_set.h>
#include <scenesync/scene/scene_node.h>

namespace scenesync::scene {

// Builds scene nodes: picks the backend constructor for the kind, wraps the
// handle, then runs the kind's applier against an empty property set so the
// initial properties go through the same diff as any later update.
class NodeFactory {
public:
    explicit NodeFactory(render::RenderBackend& backend);

    // Throws std::invalid_argument for a value outside NodeKind.
    std::unique_ptr<SceneNode> create(NodeKind kind, const PropertySet& props,
                                      paint::Transform& scratch);
    // Throws std::invalid_argument for an unknown tag.
    std::unique_ptr<SceneNode> create(std::string_view type, const PropertySet& props,
                                      paint::Transform& scratch);

    std::uint64_t created_count() const { return next_id_ - 1; }

private:
    std::unique_ptr<SceneNode> construct(NodeKind kind, const PropertySet& props);

    render::RenderBackend& backend_;
    std::uint64_t next_id_ = 1;
};

}  // namespace scenesync::scene
