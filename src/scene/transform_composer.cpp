#include <scenesync/scene/transform_composer.h>
#include <scenesync/scene/property_set.h>
#include <scenesync/render/render_node.h>

namespace scenesync::scene {

const paint::Transform& compose_transform(const PropertySet& props, paint::Transform& scratch) {
    double origin_x = props.origin_x.value_or(0);
    double origin_y = props.origin_y.value_or(0);

    scratch.transform_to(1, 0, 0, 1, 0, 0)
        .move(props.x.value_or(0), props.y.value_or(0))
        .rotate(props.rotation.value_or(0), origin_x, origin_y)
        .scale(resolve_scale_x(props), resolve_scale_y(props), origin_x, origin_y);

    if (props.transform) {
        scratch.transform(*props.transform);
    }
    return scratch;
}

bool update_transform(const PropertySet& props, paint::Transform& scratch,
                      paint::Transform& applied, render::RenderNode& node) {
    const paint::Transform& composed = compose_transform(props, scratch);
    if (composed == applied) {
        return false;
    }
    applied = composed;
    node.transform_to(applied);
    return true;
}

}  // namespace scenesync::scene
