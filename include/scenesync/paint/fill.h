#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scenesync::render { class RenderableNode; }

namespace scenesync::paint {

struct GradientStop {
    double offset = 0;  // 0..1
    std::string color;
};

bool operator==(const GradientStop& a, const GradientStop& b);

struct LinearGradient {
    std::vector<GradientStop> stops;
    double x1 = 0, y1 = 0;
    double x2 = 0, y2 = 0;
};

struct RadialGradient {
    std::vector<GradientStop> stops;
    double fx = 0, fy = 0;  // focal point
    double rx = 0, ry = 0;  // radii
    double cx = 0, cy = 0;  // center
};

struct Pattern {
    std::string url;
    double width = 0, height = 0;
    double left = 0, top = 0;
};

using FillDescriptor = std::variant<LinearGradient, RadialGradient, Pattern>;

// Value held in a node's `fill` property: nothing, a solid color, or a
// structured descriptor. Every Fill::linear/radial/pattern call creates a
// new descriptor instance, and descriptors compare by instance identity, so
// changing a gradient parameter always means building a new Fill.
class Fill {
public:
    Fill() = default;
    Fill(std::string color);
    Fill(const char* color);

    static Fill none() { return Fill(); }
    static Fill solid(std::string color);
    static Fill linear(std::vector<GradientStop> stops,
                       double x1, double y1, double x2, double y2);
    static Fill radial(std::vector<GradientStop> stops,
                       double fx, double fy, double rx, double ry,
                       double cx, double cy);
    static Fill pattern(std::string url, double width, double height,
                        double left = 0, double top = 0);

    bool is_none() const { return !color_ && !descriptor_; }
    bool is_solid() const { return color_.has_value(); }
    bool is_descriptor() const { return descriptor_ != nullptr; }

    const std::optional<std::string>& color() const { return color_; }
    const std::shared_ptr<const FillDescriptor>& descriptor() const { return descriptor_; }

    // Issue the backend fill call for this value: the descriptor-specific
    // operation for gradients and patterns, the generic one otherwise.
    void apply_to(render::RenderableNode& node) const;

    friend bool operator==(const Fill& a, const Fill& b);
    friend bool operator!=(const Fill& a, const Fill& b) { return !(a == b); }

private:
    explicit Fill(std::shared_ptr<const FillDescriptor> descriptor);

    std::optional<std::string> color_;
    std::shared_ptr<const FillDescriptor> descriptor_;
};

void apply_linear_gradient(const LinearGradient& gradient, render::RenderableNode& node);
void apply_radial_gradient(const RadialGradient& gradient, render::RenderableNode& node);
void apply_pattern(const Pattern& pattern, render::RenderableNode& node);

}  // namespace scenesync::paint
