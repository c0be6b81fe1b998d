#pragma once
#include <scenesync/paint/transform.h>

namespace scenesync::render { class RenderNode; }

namespace scenesync::scene {

struct PropertySet;

// Compose a node's placement, in this order:
//   identity -> move(x, y) -> rotate about origin -> scale about origin
//   -> post-multiply the explicit transform, if any.
// `scratch` is fully overwritten; callers own it (one per thread).
const paint::Transform& compose_transform(const PropertySet& props, paint::Transform& scratch);

// Compose into `scratch` and push it to `node` only when one of the six
// coefficients differs from `applied`. Returns true when the backend was
// called; `applied` then holds the new coefficients.
bool update_transform(const PropertySet& props, paint::Transform& scratch,
                      paint::Transform& applied, render::RenderNode& node);

}  // namespace scenesync::scene
