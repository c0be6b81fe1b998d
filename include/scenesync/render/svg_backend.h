#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <scenesync/render/render_node.h>

namespace scenesync::render {

// Operation counters, one per backend call kind.
struct SvgStats {
    std::size_t transforms = 0;
    std::size_t indicates = 0;
    std::size_t blends = 0;
    std::size_t shows = 0;
    std::size_t hides = 0;
    std::size_t subscribes = 0;
    std::size_t unsubscribes = 0;
    std::size_t fills = 0;
    std::size_t strokes = 0;
    std::size_t draws = 0;
    std::size_t injects = 0;
    std::size_t ejects = 0;
    std::size_t resizes = 0;
    std::size_t renders = 0;

    std::size_t mutation_count() const;
};

struct SvgAttribute {
    std::string name;
    std::string value;
};

// One element of the retained SVG tree.
class SvgElement {
public:
    SvgElement(std::uint64_t id, std::string tag);
    ~SvgElement();

    SvgElement(const SvgElement&) = delete;
    SvgElement& operator=(const SvgElement&) = delete;

    std::uint64_t id() const { return id_; }
    const std::string& tag() const { return tag_; }

    // Backend node this element belongs to.
    RenderNode* owner() const { return owner_; }
    void set_owner(RenderNode* owner) { owner_ = owner; }

    std::optional<std::string> get_attribute(std::string_view name) const;
    void set_attribute(const std::string& name, const std::string& value);
    void remove_attribute(std::string_view name);
    const std::vector<SvgAttribute>& attributes() const { return attributes_; }

    SvgElement* parent() const { return parent_; }
    const std::vector<SvgElement*>& children() const { return children_; }
    std::size_t index_in_parent() const;

    void append(SvgElement& child);
    void insert_before(SvgElement& child, SvgElement& reference);
    void detach();

    // Character data of <text>; <title> of any element.
    const std::string& text() const { return text_; }
    void set_text(std::string text) { text_ = std::move(text); }
    const std::optional<std::string>& title() const { return title_; }
    void set_title(std::optional<std::string> title) { title_ = std::move(title); }

    // Gradient or pattern definition referenced by this element's fill.
    const std::string& paint_server() const { return paint_server_; }
    void set_paint_server(std::string markup) { paint_server_ = std::move(markup); }

    bool hidden() const;

    // Register a handler. The returned handle removes exactly this
    // registration, is safe to call more than once, and stays safe after
    // the element is gone. Each effective removal bumps `*removed`.
    Unsubscribe add_handler(EventKind kind, PointerHandler handler, std::size_t* removed);
    std::size_t handler_count(EventKind kind) const;
    std::size_t emit(const PointerEvent& event) const;

    void write(std::string& out, int depth) const;
    void collect_paint_servers(std::string& out) const;

private:
    std::uint64_t id_;
    std::string tag_;
    RenderNode* owner_ = nullptr;
    std::vector<SvgAttribute> attributes_;
    SvgElement* parent_ = nullptr;
    std::vector<SvgElement*> children_;
    std::string text_;
    std::optional<std::string> title_;
    std::string paint_server_;
    struct HandlerTable {
        std::map<EventKind, std::map<std::uint64_t, PointerHandler>> by_kind;
        std::uint64_t next_token = 1;
    };
    std::shared_ptr<HandlerTable> handlers_;
};

// Retained backend that keeps an SVG element tree in memory. Nodes it
// creates hold a reference to the backend, so it must outlive them.
class SvgBackend : public RenderBackend {
public:
    SvgBackend();
    ~SvgBackend() override;

    std::unique_ptr<RenderSurface> create_surface(double width, double height) override;
    std::unique_ptr<RenderNode> create_clipping_rectangle() override;
    std::unique_ptr<RenderNode> create_group() override;
    std::unique_ptr<ShapeRenderNode> create_shape() override;
    std::unique_ptr<TextRenderNode> create_text(const std::string& text,
                                                const paint::Font& font,
                                                std::optional<paint::Alignment> alignment,
                                                const paint::PathRef& layout_path) override;

    // Element behind a node created by this backend, nullptr otherwise.
    static SvgElement* element_of(RenderNode& node);
    static const SvgElement* element_of(const RenderNode& node);

    // Deliver an event to the handlers subscribed on `node`. Returns how
    // many handlers ran.
    std::size_t dispatch(RenderNode& node, const PointerEvent& event) const;

    // Markup of the tree rooted at `root`.
    std::string serialize(const RenderNode& root) const;

    const SvgStats& stats() const { return stats_; }
    SvgStats& stats() { return stats_; }
    void reset_stats() { stats_ = SvgStats{}; }

    // Markup captured by the most recent surface render().
    const std::string& last_frame() const { return last_frame_; }
    void set_last_frame(std::string frame) { last_frame_ = std::move(frame); }

    std::uint64_t next_element_id() { return next_id_++; }

private:
    SvgStats stats_;
    std::string last_frame_;
    std::uint64_t next_id_ = 1;
};

std::string format_matrix(const paint::Transform& t);

}  // namespace scenesync::render
