#include <scenesync/render/svg_backend.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace scenesync::render {

namespace {

std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

std::string escape_xml(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

void write_indent(std::string& out, int depth) {
    out.append(static_cast<std::size_t>(depth) * 2, ' ');
}

std::string write_stops(const std::vector<paint::GradientStop>& stops) {
    std::string out;
    for (const auto& stop : stops) {
        out += "<stop offset=\"" + format_number(stop.offset) +
               "\" stop-color=\"" + escape_xml(stop.color) + "\"/>";
    }
    return out;
}

const char* text_anchor(paint::Alignment alignment) {
    switch (alignment) {
        case paint::Alignment::Left:   return "start";
        case paint::Alignment::Center: return "middle";
        case paint::Alignment::Right:  return "end";
    }
    return "start";
}

// Cross-cast target that lets the backend find the element behind any of
// its node types.
class SvgElementHolder {
public:
    virtual ~SvgElementHolder() = default;
    virtual SvgElement& element() = 0;
};

// ---------------------------------------------------------------------------
// SvgNode: RenderNode operations shared by every element kind
// ---------------------------------------------------------------------------

template<typename Interface>
class SvgNode : public Interface, public SvgElementHolder {
public:
    SvgNode(SvgBackend& backend, const char* tag)
        : backend_(backend), element_(backend.next_element_id(), tag) {
        element_.set_owner(this);
    }

    SvgElement& element() override { return element_; }

    void transform_to(const paint::Transform& transform) override {
        ++backend_.stats().transforms;
        if (transform.is_identity()) {
            element_.remove_attribute("transform");
        } else {
            element_.set_attribute("transform", format_matrix(transform));
        }
    }

    void indicate(const std::optional<std::string>& cursor,
                  const std::optional<std::string>& title) override {
        ++backend_.stats().indicates;
        if (cursor) {
            element_.set_attribute("cursor", *cursor);
        } else {
            element_.remove_attribute("cursor");
        }
        element_.set_title(title);
    }

    void blend(double opacity) override {
        ++backend_.stats().blends;
        if (opacity == 1.0) {
            element_.remove_attribute("opacity");
        } else {
            element_.set_attribute("opacity", format_number(opacity));
        }
    }

    void show() override {
        ++backend_.stats().shows;
        element_.remove_attribute("display");
    }

    void hide() override {
        ++backend_.stats().hides;
        element_.set_attribute("display", "none");
    }

    Unsubscribe subscribe(EventKind kind, PointerHandler handler) override {
        ++backend_.stats().subscribes;
        return element_.add_handler(kind, std::move(handler), &backend_.stats().unsubscribes);
    }

    void inject(RenderNode& parent) override {
        SvgElement* target = SvgBackend::element_of(parent);
        if (!target) {
            throw std::invalid_argument("svg: parent node was not created by an SvgBackend");
        }
        ++backend_.stats().injects;
        element_.detach();
        target->append(element_);
    }

    void inject_before(RenderNode& sibling) override {
        SvgElement* reference = SvgBackend::element_of(sibling);
        if (!reference) {
            throw std::invalid_argument("svg: sibling node was not created by an SvgBackend");
        }
        if (!reference->parent()) {
            throw std::logic_error("svg: sibling node is not attached");
        }
        ++backend_.stats().injects;
        element_.detach();
        reference->parent()->insert_before(element_, *reference);
    }

    void eject() override {
        ++backend_.stats().ejects;
        element_.detach();
    }

    RenderNode* parent_node() const override {
        return element_.parent() ? element_.parent()->owner() : nullptr;
    }

protected:
    SvgBackend& backend_;
    SvgElement element_;
};

// ---------------------------------------------------------------------------
// SvgRenderable: fill and stroke
// ---------------------------------------------------------------------------

template<typename Interface>
class SvgRenderable : public SvgNode<Interface> {
public:
    using SvgNode<Interface>::SvgNode;

    void fill(const std::optional<std::string>& color) override {
        ++this->backend_.stats().fills;
        this->element_.set_paint_server("");
        this->element_.set_attribute("fill", color ? *color : std::string("none"));
    }

    void fill_linear(const std::vector<paint::GradientStop>& stops,
                     double x1, double y1, double x2, double y2) override {
        ++this->backend_.stats().fills;
        std::string id = paint_server_id();
        this->element_.set_paint_server(
            "<linearGradient id=\"" + id + "\" gradientUnits=\"userSpaceOnUse\"" +
            " x1=\"" + format_number(x1) + "\" y1=\"" + format_number(y1) +
            "\" x2=\"" + format_number(x2) + "\" y2=\"" + format_number(y2) + "\">" +
            write_stops(stops) + "</linearGradient>");
        this->element_.set_attribute("fill", "url(#" + id + ")");
    }

    void fill_radial(const std::vector<paint::GradientStop>& stops,
                     double fx, double fy, double rx, double ry,
                     double cx, double cy) override {
        ++this->backend_.stats().fills;
        std::string id = paint_server_id();
        std::string markup = "<radialGradient id=\"" + id + "\" gradientUnits=\"userSpaceOnUse\"" +
            " fx=\"" + format_number(fx) + "\" fy=\"" + format_number(fy) +
            "\" cx=\"" + format_number(cx) + "\" cy=\"" + format_number(cy) +
            "\" r=\"" + format_number(rx) + "\"";
        if (rx != ry && rx != 0) {
            // Squash the circle vertically around the center.
            markup += " gradientTransform=\"translate(0 " + format_number(cy) + ") scale(1 " +
                      format_number(ry / rx) + ") translate(0 " + format_number(-cy) + ")\"";
        }
        markup += ">" + write_stops(stops) + "</radialGradient>";
        this->element_.set_paint_server(markup);
        this->element_.set_attribute("fill", "url(#" + id + ")");
    }

    void fill_image(const std::string& url, double width, double height,
                    double left, double top) override {
        ++this->backend_.stats().fills;
        std::string id = paint_server_id();
        this->element_.set_paint_server(
            "<pattern id=\"" + id + "\" patternUnits=\"userSpaceOnUse\"" +
            " x=\"" + format_number(left) + "\" y=\"" + format_number(top) +
            "\" width=\"" + format_number(width) + "\" height=\"" + format_number(height) + "\">" +
            "<image href=\"" + escape_xml(url) + "\" width=\"" + format_number(width) +
            "\" height=\"" + format_number(height) + "\"/></pattern>");
        this->element_.set_attribute("fill", "url(#" + id + ")");
    }

    void stroke(const std::optional<std::string>& color,
                std::optional<double> width,
                std::optional<paint::StrokeCap> cap,
                std::optional<paint::StrokeJoin> join,
                const paint::DashPattern& dash) override {
        ++this->backend_.stats().strokes;
        SvgElement& e = this->element_;
        if (color) e.set_attribute("stroke", *color); else e.remove_attribute("stroke");
        if (width) e.set_attribute("stroke-width", format_number(*width));
        else e.remove_attribute("stroke-width");
        if (cap) e.set_attribute("stroke-linecap", paint::stroke_cap_name(*cap));
        else e.remove_attribute("stroke-linecap");
        if (join) e.set_attribute("stroke-linejoin", paint::stroke_join_name(*join));
        else e.remove_attribute("stroke-linejoin");
        if (dash && !dash->empty()) {
            std::string joined;
            for (double length : *dash) {
                if (!joined.empty()) joined += ',';
                joined += format_number(length);
            }
            e.set_attribute("stroke-dasharray", joined);
        } else {
            e.remove_attribute("stroke-dasharray");
        }
    }

private:
    std::string paint_server_id() const {
        return "fill-" + std::to_string(this->element_.id());
    }
};

// ---------------------------------------------------------------------------
// Concrete element kinds
// ---------------------------------------------------------------------------

class SvgGroup : public SvgNode<RenderNode> {
public:
    explicit SvgGroup(SvgBackend& backend) : SvgNode(backend, "g") {}
};

class SvgClippingRectangle : public SvgNode<RenderNode> {
public:
    explicit SvgClippingRectangle(SvgBackend& backend) : SvgNode(backend, "g") {
        element_.set_attribute("class", "clipping-rectangle");
    }

    bool supports_blend() const override { return false; }
};

class SvgShape : public SvgRenderable<ShapeRenderNode> {
public:
    explicit SvgShape(SvgBackend& backend) : SvgRenderable(backend, "path") {}

    void draw(const paint::PathValue& path,
              std::optional<double> /*stroke_width*/,
              const std::optional<std::string>& /*stroke*/) override {
        ++backend_.stats().draws;
        std::string data = paint::path_data(path);
        if (data.empty()) {
            element_.remove_attribute("d");
        } else {
            element_.set_attribute("d", data);
        }
    }
};

class SvgText : public SvgRenderable<TextRenderNode> {
public:
    SvgText(SvgBackend& backend, const std::string& text, const paint::Font& font,
            std::optional<paint::Alignment> alignment, const paint::PathRef& layout_path)
        : SvgRenderable(backend, "text") {
        layout(text, font, alignment, layout_path);
    }

    void draw(const std::string& text,
              const paint::Font& font,
              std::optional<paint::Alignment> alignment,
              const paint::PathRef& layout_path) override {
        ++backend_.stats().draws;
        layout(text, font, alignment, layout_path);
    }

private:
    void layout(const std::string& text, const paint::Font& font,
                std::optional<paint::Alignment> alignment,
                const paint::PathRef& layout_path) {
        element_.set_text(text);

        std::string css = paint::font_to_css(font);
        if (css.empty()) {
            element_.remove_attribute("style");
        } else {
            element_.set_attribute("style", "font: " + css);
        }

        if (alignment) {
            element_.set_attribute("text-anchor", text_anchor(*alignment));
        } else {
            element_.remove_attribute("text-anchor");
        }

        if (layout_path) {
            element_.set_attribute("data-path", layout_path->to_svg_data());
        } else {
            element_.remove_attribute("data-path");
        }
    }
};

class SvgSurface : public SvgNode<RenderSurface> {
public:
    SvgSurface(SvgBackend& backend, double width, double height)
        : SvgNode(backend, "svg") {
        element_.set_attribute("xmlns", "http://www.w3.org/2000/svg");
        set_dimensions(width, height);
    }

    void resize(double width, double height) override {
        ++backend_.stats().resizes;
        set_dimensions(width, height);
    }

    bool supports_render() const override { return true; }

    void render() override {
        ++backend_.stats().renders;
        backend_.set_last_frame(backend_.serialize(*this));
    }

private:
    void set_dimensions(double width, double height) {
        element_.set_attribute("width", format_number(width));
        element_.set_attribute("height", format_number(height));
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// SvgStats
// ---------------------------------------------------------------------------

std::size_t SvgStats::mutation_count() const {
    return transforms + indicates + blends + shows + hides + subscribes +
           unsubscribes + fills + strokes + draws;
}

std::string format_matrix(const paint::Transform& t) {
    return "matrix(" + format_number(t.xx) + " " + format_number(t.yx) + " " +
           format_number(t.xy) + " " + format_number(t.yy) + " " +
           format_number(t.x) + " " + format_number(t.y) + ")";
}

// ---------------------------------------------------------------------------
// SvgElement
// ---------------------------------------------------------------------------

SvgElement::SvgElement(std::uint64_t id, std::string tag)
    : id_(id), tag_(std::move(tag)), handlers_(std::make_shared<HandlerTable>()) {}

SvgElement::~SvgElement() {
    detach();
    for (SvgElement* child : children_) {
        child->parent_ = nullptr;
    }
}

std::optional<std::string> SvgElement::get_attribute(std::string_view name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name) return attr.value;
    }
    return std::nullopt;
}

void SvgElement::set_attribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    attributes_.push_back({name, value});
}

void SvgElement::remove_attribute(std::string_view name) {
    attributes_.erase(
        std::remove_if(attributes_.begin(), attributes_.end(),
            [name](const SvgAttribute& attr) { return attr.name == name; }),
        attributes_.end());
}

std::size_t SvgElement::index_in_parent() const {
    if (!parent_) return 0;
    auto it = std::find(parent_->children_.begin(), parent_->children_.end(), this);
    return static_cast<std::size_t>(it - parent_->children_.begin());
}

void SvgElement::append(SvgElement& child) {
    if (&child == this) return;
    child.detach();
    child.parent_ = this;
    children_.push_back(&child);
}

void SvgElement::insert_before(SvgElement& child, SvgElement& reference) {
    if (&child == &reference || reference.parent_ != this) return;
    child.detach();
    auto it = std::find(children_.begin(), children_.end(), &reference);
    child.parent_ = this;
    children_.insert(it, &child);
}

void SvgElement::detach() {
    if (!parent_) return;
    auto& siblings = parent_->children_;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), this), siblings.end());
    parent_ = nullptr;
}

bool SvgElement::hidden() const {
    auto display = get_attribute("display");
    return display && *display == "none";
}

Unsubscribe SvgElement::add_handler(EventKind kind, PointerHandler handler, std::size_t* removed) {
    std::uint64_t token = handlers_->next_token++;
    handlers_->by_kind[kind].emplace(token, std::move(handler));

    std::weak_ptr<HandlerTable> table = handlers_;
    return [table, kind, token, removed]() {
        auto locked = table.lock();
        if (!locked) return;
        auto it = locked->by_kind.find(kind);
        if (it == locked->by_kind.end()) return;
        if (it->second.erase(token) > 0 && removed) {
            ++*removed;
        }
    };
}

std::size_t SvgElement::handler_count(EventKind kind) const {
    auto it = handlers_->by_kind.find(kind);
    return it == handlers_->by_kind.end() ? 0 : it->second.size();
}

std::size_t SvgElement::emit(const PointerEvent& event) const {
    auto it = handlers_->by_kind.find(event.kind);
    if (it == handlers_->by_kind.end()) return 0;

    // Copy so handlers may unsubscribe while the event is delivered.
    std::vector<PointerHandler> snapshot;
    snapshot.reserve(it->second.size());
    for (const auto& entry : it->second) {
        snapshot.push_back(entry.second);
    }
    for (const auto& handler : snapshot) {
        handler(event);
    }
    return snapshot.size();
}

void SvgElement::collect_paint_servers(std::string& out) const {
    if (!paint_server_.empty()) {
        out += paint_server_;
    }
    for (const SvgElement* child : children_) {
        child->collect_paint_servers(out);
    }
}

void SvgElement::write(std::string& out, int depth) const {
    write_indent(out, depth);
    out += "<" + tag_;
    for (const auto& attr : attributes_) {
        out += " " + attr.name + "=\"" + escape_xml(attr.value) + "\"";
    }

    std::string defs;
    if (tag_ == "svg") {
        for (const SvgElement* child : children_) {
            child->collect_paint_servers(defs);
        }
    }

    if (children_.empty() && !title_ && text_.empty() && defs.empty()) {
        out += "/>\n";
        return;
    }
    out += ">\n";

    if (!defs.empty()) {
        write_indent(out, depth + 1);
        out += "<defs>" + defs + "</defs>\n";
    }
    if (title_) {
        write_indent(out, depth + 1);
        out += "<title>" + escape_xml(*title_) + "</title>\n";
    }
    if (!text_.empty()) {
        write_indent(out, depth + 1);
        out += escape_xml(text_) + "\n";
    }
    for (const SvgElement* child : children_) {
        child->write(out, depth + 1);
    }

    write_indent(out, depth);
    out += "</" + tag_ + ">\n";
}

// ---------------------------------------------------------------------------
// SvgBackend
// ---------------------------------------------------------------------------

SvgBackend::SvgBackend() = default;

SvgBackend::~SvgBackend() = default;

std::unique_ptr<RenderSurface> SvgBackend::create_surface(double width, double height) {
    return std::make_unique<SvgSurface>(*this, width, height);
}

std::unique_ptr<RenderNode> SvgBackend::create_clipping_rectangle() {
    return std::make_unique<SvgClippingRectangle>(*this);
}

std::unique_ptr<RenderNode> SvgBackend::create_group() {
    return std::make_unique<SvgGroup>(*this);
}

std::unique_ptr<ShapeRenderNode> SvgBackend::create_shape() {
    return std::make_unique<SvgShape>(*this);
}

std::unique_ptr<TextRenderNode> SvgBackend::create_text(const std::string& text,
                                                        const paint::Font& font,
                                                        std::optional<paint::Alignment> alignment,
                                                        const paint::PathRef& layout_path) {
    return std::make_unique<SvgText>(*this, text, font, alignment, layout_path);
}

SvgElement* SvgBackend::element_of(RenderNode& node) {
    auto* holder = dynamic_cast<SvgElementHolder*>(&node);
    return holder ? &holder->element() : nullptr;
}

const SvgElement* SvgBackend::element_of(const RenderNode& node) {
    return element_of(const_cast<RenderNode&>(node));
}

std::size_t SvgBackend::dispatch(RenderNode& node, const PointerEvent& event) const {
    SvgElement* element = element_of(node);
    if (!element) return 0;
    return element->emit(event);
}

std::string SvgBackend::serialize(const RenderNode& root) const {
    std::string out;
    const SvgElement* element = element_of(root);
    if (element) {
        element->write(out, 0);
    }
    return out;
}

}  // namespace scenesync::render
