#include <scenesync/scene/appliers.h>
#include <scenesync/core/config.h>
#include <scenesync/scene/property_set.h>
#include <scenesync/scene/scene_node.h>
#include <scenesync/scene/transform_composer.h>

namespace scenesync::scene {

void apply_node_props(SceneNode& node, const PropertySet& props,
                      const PropertySet& prev, paint::Transform& scratch) {
    render::RenderNode& handle = node.render_node();

    update_transform(props, scratch, node.applied_transform(), handle);

    // cursor and title always travel together
    if (props.cursor != prev.cursor || props.title != prev.title) {
        handle.indicate(props.cursor, props.title);
    }

    if (handle.supports_blend() && props.opacity != prev.opacity) {
        handle.blend(props.opacity.value_or(core::config::kDefaultOpacity));
    }

    if (props.visible != prev.visible) {
        if (props.visible.value_or(true)) {
            handle.show();
        } else {
            handle.hide();
        }
    }

    for (EventKind kind : render::kAllEventKinds) {
        node.subscriptions().reconcile(handle, kind, props.on(kind));
    }
}

void apply_renderable_props(SceneNode& node, const PropertySet& props,
                            const PropertySet& prev, paint::Transform& scratch) {
    apply_node_props(node, props, prev, scratch);

    render::RenderableNode& handle = node.renderable_node();

    if (prev.fill != props.fill) {
        props.fill.apply_to(handle);
    }

    if (prev.stroke != props.stroke ||
        prev.stroke_width != props.stroke_width ||
        prev.stroke_cap != props.stroke_cap ||
        prev.stroke_join != props.stroke_join ||
        prev.stroke_dash != props.stroke_dash) {
        handle.stroke(props.stroke, props.stroke_width, props.stroke_cap,
                      props.stroke_join, props.stroke_dash);
    }
}

void apply_group_props(SceneNode& node, const PropertySet& props,
                       const PropertySet& prev, paint::Transform& scratch) {
    apply_node_props(node, props, prev, scratch);

    node.width = props.width;
    node.height = props.height;
}

void apply_clipping_rectangle_props(SceneNode& node, const PropertySet& props,
                                    const PropertySet& prev, paint::Transform& scratch) {
    apply_node_props(node, props, prev, scratch);

    node.width = props.width;
    node.height = props.height;
}

void apply_shape_props(SceneNode& node, const PropertySet& props,
                       const PropertySet& prev, paint::Transform& scratch) {
    apply_renderable_props(node, props, prev, scratch);

    paint::PathValue path = resolve_shape_path(props);
    std::uint64_t delta = paint::path_delta(path);

    // A Path object can change in place, so identity alone is not enough:
    // the delta marker catches edits made since the last draw.
    if (!node.prev_path ||
        !paint::same_path(path, *node.prev_path) ||
        delta != node.prev_delta ||
        prev.height != props.height ||
        prev.width != props.width) {
        node.shape_node().draw(path, props.stroke_width, props.stroke);

        node.prev_delta = delta;
        node.prev_path = std::move(path);
    }
}

void apply_text_props(SceneNode& node, const PropertySet& props,
                      const PropertySet& prev, paint::Transform& scratch) {
    apply_renderable_props(node, props, prev, scratch);

    std::string text = children_as_string(props.children);

    if (node.current_string != text ||
        !paint::is_same_font(props.font, prev.font) ||
        props.alignment != prev.alignment ||
        props.path != prev.path) {
        node.text_node().draw(text, props.font, props.alignment, props.path);

        node.current_string = std::move(text);
    }
}

void apply_props(SceneNode& node, const PropertySet& props,
                 const PropertySet& prev, paint::Transform& scratch) {
    switch (node.kind()) {
        case NodeKind::ClippingRectangle:
            apply_clipping_rectangle_props(node, props, prev, scratch);
            break;
        case NodeKind::Group:
            apply_group_props(node, props, prev, scratch);
            break;
        case NodeKind::Shape:
            apply_shape_props(node, props, prev, scratch);
            break;
        case NodeKind::Text:
            apply_text_props(node, props, prev, scratch);
            break;
    }
}

}  // namespace scenesync::scene
