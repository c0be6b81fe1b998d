#pragma once
#include <memory>

#include <scenesync/core/config.h>
#include <scenesync/render/render_node.h>
#include <scenesync/scene/scene_node.h>

namespace scenesync::scene {

// Root container a scene is mounted into. Owns the top-level nodes.
class Surface : public SceneParent {
public:
    explicit Surface(render::RenderBackend& backend,
                     double width = core::config::kDefaultSurfaceWidth,
                     double height = core::config::kDefaultSurfaceHeight);
    ~Surface() override;

    render::RenderNode& render_node() override { return *handle_; }
    render::RenderSurface& surface_node() { return *handle_; }

    double width() const { return width_; }
    double height() const { return height_; }

    // Resizes the backend surface only when a dimension actually changed.
    // Returns true when resize() was called.
    bool set_size(double width, double height);

    // Ask the backend to present the current state, if it renders explicitly.
    // Returns true when render() was called.
    bool flush();

private:
    std::unique_ptr<render::RenderSurface> handle_;
    double width_;
    double height_;
};

}  // namespace scenesync::scene
