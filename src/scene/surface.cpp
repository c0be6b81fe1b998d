#include <scenesync/scene/surface.h>

#include <stdexcept>

namespace scenesync::scene {

Surface::Surface(render::RenderBackend& backend, double width, double height)
    : handle_(backend.create_surface(width, height))
    , width_(width)
    , height_(height) {
    if (!handle_) {
        throw std::runtime_error("scene: backend failed to create a surface");
    }
}

Surface::~Surface() {
    children_.clear();
}

bool Surface::set_size(double width, double height) {
    if (width == width_ && height == height_) {
        return false;
    }
    width_ = width;
    height_ = height;
    handle_->resize(width_, height_);
    return true;
}

bool Surface::flush() {
    if (!handle_->supports_render()) {
        return false;
    }
    handle_->render();
    return true;
}

}  // namespace scenesync::scene
