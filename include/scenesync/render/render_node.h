#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <scenesync/paint/fill.h>
#include <scenesync/paint/font.h>
#include <scenesync/paint/path.h>
#include <scenesync/paint/stroke.h>
#include <scenesync/paint/transform.h>
#include <scenesync/render/pointer_event.h>

namespace scenesync::render {

// Retained node of a drawing backend. The scene core only ever calls these
// imperative operations; how a backend stores or rasterizes is its own
// business.
class RenderNode {
public:
    virtual ~RenderNode() = default;

    virtual void transform_to(const paint::Transform& transform) = 0;
    virtual void indicate(const std::optional<std::string>& cursor,
                          const std::optional<std::string>& title) = 0;

    // Nodes that cannot blend never receive blend().
    virtual bool supports_blend() const { return true; }
    virtual void blend(double opacity) = 0;

    virtual void show() = 0;
    virtual void hide() = 0;

    virtual Unsubscribe subscribe(EventKind kind, PointerHandler handler) = 0;

    // Tree placement. inject() appends to `parent`, detaching from any
    // previous parent first.
    virtual void inject(RenderNode& parent) = 0;
    virtual void inject_before(RenderNode& sibling) = 0;
    virtual void eject() = 0;
    virtual RenderNode* parent_node() const = 0;
};

// Nodes that paint geometry: fill and stroke.
class RenderableNode : public RenderNode {
public:
    virtual void fill(const std::optional<std::string>& color) = 0;
    virtual void fill_linear(const std::vector<paint::GradientStop>& stops,
                             double x1, double y1, double x2, double y2) = 0;
    virtual void fill_radial(const std::vector<paint::GradientStop>& stops,
                             double fx, double fy, double rx, double ry,
                             double cx, double cy) = 0;
    virtual void fill_image(const std::string& url, double width, double height,
                            double left, double top) = 0;

    // All five parameters are always passed together.
    virtual void stroke(const std::optional<std::string>& color,
                        std::optional<double> width,
                        std::optional<paint::StrokeCap> cap,
                        std::optional<paint::StrokeJoin> join,
                        const paint::DashPattern& dash) = 0;
};

class ShapeRenderNode : public RenderableNode {
public:
    virtual void draw(const paint::PathValue& path,
                      std::optional<double> stroke_width,
                      const std::optional<std::string>& stroke) = 0;
};

class TextRenderNode : public RenderableNode {
public:
    virtual void draw(const std::string& text,
                      const paint::Font& font,
                      std::optional<paint::Alignment> alignment,
                      const paint::PathRef& layout_path) = 0;
};

// Root of a backend tree.
class RenderSurface : public RenderNode {
public:
    virtual void resize(double width, double height) = 0;
    virtual bool supports_render() const { return false; }
    virtual void render() {}
};

// Node constructors of one backend.
class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    virtual std::unique_ptr<RenderSurface> create_surface(double width, double height) = 0;
    virtual std::unique_ptr<RenderNode> create_clipping_rectangle() = 0;
    virtual std::unique_ptr<RenderNode> create_group() = 0;
    virtual std::unique_ptr<ShapeRenderNode> create_shape() = 0;
    virtual std::unique_ptr<TextRenderNode> create_text(const std::string& text,
                                                        const paint::Font& font,
                                                        std::optional<paint::Alignment> alignment,
                                                        const paint::PathRef& layout_path) = 0;
};

}  // namespace scenesync::render
