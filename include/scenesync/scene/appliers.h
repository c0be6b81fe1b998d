#pragma once
#include <scenesync/paint/transform.h>

namespace scenesync::scene {

class SceneNode;
struct PropertySet;

// Property appliers. Each one diffs `props` against `prev` and issues only
// the backend calls whose inputs changed. Pass an empty PropertySet as
// `prev` for the initial apply so every field counts as changed.
//
// `scratch` is the caller's transform buffer; it is overwritten on every
// call and must not be shared between threads.

// Placement, indicate, opacity, visibility and event wiring. Every kind.
void apply_node_props(SceneNode& node, const PropertySet& props,
                      const PropertySet& prev, paint::Transform& scratch);

// Node props plus fill and stroke. Shape and Text.
void apply_renderable_props(SceneNode& node, const PropertySet& props,
                            const PropertySet& prev, paint::Transform& scratch);

void apply_group_props(SceneNode& node, const PropertySet& props,
                       const PropertySet& prev, paint::Transform& scratch);

void apply_clipping_rectangle_props(SceneNode& node, const PropertySet& props,
                                    const PropertySet& prev, paint::Transform& scratch);

void apply_shape_props(SceneNode& node, const PropertySet& props,
                       const PropertySet& prev, paint::Transform& scratch);

void apply_text_props(SceneNode& node, const PropertySet& props,
                      const PropertySet& prev, paint::Transform& scratch);

// Dispatch on node.kind().
void apply_props(SceneNode& node, const PropertySet& props,
                 const PropertySet& prev, paint::Transform& scratch);

}  // namespace scenesync::scene
