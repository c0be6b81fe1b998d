#pragma once
#include <scenesync/render/render_node.h>

#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace scenesync::testing {

// One backend call as seen by a recording node.
struct RecordedCall {
    std::uint64_t node = 0;
    std::string op;
    std::string args;
};

using CallLog = std::vector<RecordedCall>;

inline std::string opt_str(const std::optional<std::string>& v) {
    return v ? *v : std::string("-");
}

inline std::string opt_num(std::optional<double> v) {
    if (!v) return "-";
    std::ostringstream oss;
    oss << *v;
    return oss.str();
}

template<typename Interface>
class RecordingNode : public Interface {
public:
    RecordingNode(CallLog& log, std::uint64_t id, bool blends = true)
        : log_(log), id_(id), blends_(blends) {}

    std::uint64_t id() const { return id_; }

    void transform_to(const paint::Transform& t) override {
        std::ostringstream oss;
        oss << t.xx << ' ' << t.yx << ' ' << t.xy << ' ' << t.yy << ' ' << t.x << ' ' << t.y;
        record("transform", oss.str());
    }
    void indicate(const std::optional<std::string>& cursor,
                  const std::optional<std::string>& title) override {
        record("indicate", opt_str(cursor) + " " + opt_str(title));
    }
    bool supports_blend() const override { return blends_; }
    void blend(double opacity) override { record("blend", opt_num(opacity)); }
    void show() override { record("show", ""); }
    void hide() override { record("hide", ""); }

    render::Unsubscribe subscribe(render::EventKind kind, render::PointerHandler handler) override {
        record("subscribe", render::event_kind_name(kind));
        handlers_[kind] = std::move(handler);
        return [this, kind]() {
            record("unsubscribe", render::event_kind_name(kind));
            handlers_.erase(kind);
        };
    }

    void inject(render::RenderNode& parent) override {
        parent_ = &parent;
        record("inject", "");
    }
    void inject_before(render::RenderNode& sibling) override {
        parent_ = sibling.parent_node();
        record("inject_before", "");
    }
    void eject() override {
        parent_ = nullptr;
        record("eject", "");
    }
    render::RenderNode* parent_node() const override { return parent_; }

    // Deliver an event the way a backend would on pointer input.
    bool fire(const render::PointerEvent& event) {
        auto it = handlers_.find(event.kind);
        if (it == handlers_.end()) return false;
        // The handler may unsubscribe itself.
        render::PointerHandler handler = it->second;
        handler(event);
        return true;
    }
    std::size_t handler_count() const { return handlers_.size(); }

protected:
    void record(const std::string& op, const std::string& args) {
        log_.push_back({id_, op, args});
    }

    CallLog& log_;

private:
    std::uint64_t id_;
    bool blends_;
    render::RenderNode* parent_ = nullptr;
    std::map<render::EventKind, render::PointerHandler> handlers_;
};

template<typename Interface>
class RecordingRenderable : public RecordingNode<Interface> {
public:
    using RecordingNode<Interface>::RecordingNode;

    void fill(const std::optional<std::string>& color) override {
        this->record("fill", opt_str(color));
    }
    void fill_linear(const std::vector<paint::GradientStop>& stops,
                     double x1, double y1, double x2, double y2) override {
        std::ostringstream oss;
        oss << stops.size() << ' ' << x1 << ' ' << y1 << ' ' << x2 << ' ' << y2;
        this->record("fill_linear", oss.str());
    }
    void fill_radial(const std::vector<paint::GradientStop>& stops,
                     double fx, double fy, double rx, double ry,
                     double cx, double cy) override {
        std::ostringstream oss;
        oss << stops.size() << ' ' << fx << ' ' << fy << ' ' << rx << ' ' << ry
            << ' ' << cx << ' ' << cy;
        this->record("fill_radial", oss.str());
    }
    void fill_image(const std::string& url, double width, double height,
                    double left, double top) override {
        std::ostringstream oss;
        oss << url << ' ' << width << ' ' << height << ' ' << left << ' ' << top;
        this->record("fill_image", oss.str());
    }
    void stroke(const std::optional<std::string>& color,
                std::optional<double> width,
                std::optional<paint::StrokeCap> cap,
                std::optional<paint::StrokeJoin> join,
                const paint::DashPattern& dash) override {
        std::string args = opt_str(color) + " " + opt_num(width) + " " +
                           (cap ? paint::stroke_cap_name(*cap) : "-") + " " +
                           (join ? paint::stroke_join_name(*join) : "-") + " " +
                           (dash ? std::to_string(dash->size()) : std::string("-"));
        this->record("stroke", args);
    }
};

class RecordingShape : public RecordingRenderable<render::ShapeRenderNode> {
public:
    using RecordingRenderable::RecordingRenderable;

    void draw(const paint::PathValue& path, std::optional<double> stroke_width,
              const std::optional<std::string>& stroke) override {
        record("draw", paint::path_data(path) + " " + opt_num(stroke_width) + " " +
                       opt_str(stroke));
    }
};

class RecordingText : public RecordingRenderable<render::TextRenderNode> {
public:
    using RecordingRenderable::RecordingRenderable;

    void draw(const std::string& text, const paint::Font& font,
              std::optional<paint::Alignment> alignment,
              const paint::PathRef& /*layout_path*/) override {
        record("draw", text + " [" + paint::font_to_css(font) + "] " +
                       (alignment ? paint::alignment_name(*alignment) : "-"));
    }
};

class RecordingSurface : public RecordingNode<render::RenderSurface> {
public:
    RecordingSurface(CallLog& log, std::uint64_t id, bool renders)
        : RecordingNode(log, id), renders_(renders) {}

    void resize(double width, double height) override {
        record("resize", opt_num(width) + " " + opt_num(height));
    }
    bool supports_render() const override { return renders_; }
    void render() override { record("render", ""); }

private:
    bool renders_;
};

// Backend whose nodes append every call to a shared log. Node ids start at
// 1 in creation order, the surface included.
class RecordingBackend : public render::RenderBackend {
public:
    explicit RecordingBackend(bool renders = false) : renders_(renders) {}

    std::unique_ptr<render::RenderSurface> create_surface(double width, double height) override {
        auto surface = std::make_unique<RecordingSurface>(log, ++next_id_, renders_);
        log.push_back({next_id_, "create_surface", opt_num(width) + " " + opt_num(height)});
        return surface;
    }
    std::unique_ptr<render::RenderNode> create_clipping_rectangle() override {
        log.push_back({++next_id_, "create_clipping_rectangle", ""});
        return std::make_unique<RecordingNode<render::RenderNode>>(log, next_id_, false);
    }
    std::unique_ptr<render::RenderNode> create_group() override {
        log.push_back({++next_id_, "create_group", ""});
        return std::make_unique<RecordingNode<render::RenderNode>>(log, next_id_);
    }
    std::unique_ptr<render::ShapeRenderNode> create_shape() override {
        log.push_back({++next_id_, "create_shape", ""});
        auto shape = std::make_unique<RecordingShape>(log, next_id_);
        last_shape = shape.get();
        return shape;
    }
    std::unique_ptr<render::TextRenderNode> create_text(const std::string& text,
                                                        const paint::Font& font,
                                                        std::optional<paint::Alignment> /*alignment*/,
                                                        const paint::PathRef& /*layout_path*/) override {
        log.push_back({++next_id_, "create_text", text + " [" + paint::font_to_css(font) + "]"});
        auto node = std::make_unique<RecordingText>(log, next_id_);
        last_text = node.get();
        return node;
    }

    // Calls of one operation, in order.
    std::vector<RecordedCall> calls(const std::string& op) const {
        std::vector<RecordedCall> out;
        for (const auto& call : log) {
            if (call.op == op) out.push_back(call);
        }
        return out;
    }

    std::size_t count(const std::string& op) const { return calls(op).size(); }

    CallLog log;
    RecordingShape* last_shape = nullptr;
    RecordingText* last_text = nullptr;

private:
    bool renders_;
    std::uint64_t next_id_ = 0;
};

}  // namespace scenesync::testing
