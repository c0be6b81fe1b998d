#include <scenesync/paint/fill.h>
#include <scenesync/render/render_node.h>

namespace scenesync::paint {

bool operator==(const GradientStop& a, const GradientStop& b) {
    return a.offset == b.offset && a.color == b.color;
}

Fill::Fill(std::string color) : color_(std::move(color)) {}

Fill::Fill(const char* color) : color_(std::string(color)) {}

Fill::Fill(std::shared_ptr<const FillDescriptor> descriptor)
    : descriptor_(std::move(descriptor)) {}

Fill Fill::solid(std::string color) {
    return Fill(std::move(color));
}

Fill Fill::linear(std::vector<GradientStop> stops,
                  double x1, double y1, double x2, double y2) {
    LinearGradient g{std::move(stops), x1, y1, x2, y2};
    return Fill(std::make_shared<const FillDescriptor>(std::move(g)));
}

Fill Fill::radial(std::vector<GradientStop> stops,
                  double fx, double fy, double rx, double ry,
                  double cx, double cy) {
    RadialGradient g{std::move(stops), fx, fy, rx, ry, cx, cy};
    return Fill(std::make_shared<const FillDescriptor>(std::move(g)));
}

Fill Fill::pattern(std::string url, double width, double height,
                   double left, double top) {
    Pattern p{std::move(url), width, height, left, top};
    return Fill(std::make_shared<const FillDescriptor>(std::move(p)));
}

void apply_linear_gradient(const LinearGradient& gradient, render::RenderableNode& node) {
    node.fill_linear(gradient.stops, gradient.x1, gradient.y1, gradient.x2, gradient.y2);
}

void apply_radial_gradient(const RadialGradient& gradient, render::RenderableNode& node) {
    node.fill_radial(gradient.stops, gradient.fx, gradient.fy, gradient.rx, gradient.ry,
                     gradient.cx, gradient.cy);
}

void apply_pattern(const Pattern& pattern, render::RenderableNode& node) {
    node.fill_image(pattern.url, pattern.width, pattern.height, pattern.left, pattern.top);
}

void Fill::apply_to(render::RenderableNode& node) const {
    if (!descriptor_) {
        node.fill(color_);
        return;
    }
    if (auto* linear = std::get_if<LinearGradient>(descriptor_.get())) {
        apply_linear_gradient(*linear, node);
    } else if (auto* radial = std::get_if<RadialGradient>(descriptor_.get())) {
        apply_radial_gradient(*radial, node);
    } else if (auto* pattern = std::get_if<Pattern>(descriptor_.get())) {
        apply_pattern(*pattern, node);
    }
}

bool operator==(const Fill& a, const Fill& b) {
    if (a.descriptor_ || b.descriptor_) {
        return a.descriptor_ == b.descriptor_;
    }
    return a.color_ == b.color_;
}

}  // namespace scenesync::paint
