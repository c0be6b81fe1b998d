#include <scenesync/scene/scene_node.h>

#include <algorithm>
#include <stdexcept>

namespace scenesync::scene {

// ---------------------------------------------------------------------------
// SceneParent
// ---------------------------------------------------------------------------

SceneParent::~SceneParent() = default;

SceneNode& SceneParent::append_child(std::unique_ptr<SceneNode> child) {
    return insert_before(std::move(child), nullptr);
}

SceneNode& SceneParent::insert_before(std::unique_ptr<SceneNode> child, SceneNode* reference) {
    if (!child) {
        throw std::logic_error("scene: cannot insert a null node");
    }

    auto it = children_.end();
    if (reference != nullptr) {
        it = std::find_if(children_.begin(), children_.end(),
            [reference](const std::unique_ptr<SceneNode>& c) {
                return c.get() == reference;
            });
        if (it == children_.end()) {
            throw std::logic_error("scene: reference node is not a child of this parent");
        }
    }

    SceneNode* inserted = child.get();
    inserted->parent_ = this;
    children_.insert(it, std::move(child));
    return *inserted;
}

std::unique_ptr<SceneNode> SceneParent::remove_child(SceneNode& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<SceneNode>& c) {
            return c.get() == &child;
        });
    if (it == children_.end()) {
        throw std::logic_error("scene: node is not a child of this parent");
    }

    std::unique_ptr<SceneNode> removed = std::move(*it);
    children_.erase(it);
    removed->parent_ = nullptr;
    return removed;
}

SceneNode* SceneParent::first_child() const {
    if (children_.empty()) return nullptr;
    return children_.front().get();
}

SceneNode* SceneParent::last_child() const {
    if (children_.empty()) return nullptr;
    return children_.back().get();
}

SceneNode* SceneParent::child_at(std::size_t index) const {
    if (index >= children_.size()) return nullptr;
    return children_[index].get();
}

std::optional<std::size_t> SceneParent::index_of(const SceneNode& child) const {
    for (std::size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].get() == &child) return i;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// SceneNode
// ---------------------------------------------------------------------------

SceneNode::SceneNode(std::uint64_t id, NodeKind kind, std::unique_ptr<render::RenderNode> handle)
    : id_(id), kind_(kind), handle_(std::move(handle)) {
    if (!handle_) {
        throw std::invalid_argument("scene: node created without a backend handle");
    }
}

std::unique_ptr<SceneNode> SceneNode::clipping_rectangle(std::uint64_t id,
                                                         std::unique_ptr<render::RenderNode> handle) {
    return std::unique_ptr<SceneNode>(
        new SceneNode(id, NodeKind::ClippingRectangle, std::move(handle)));
}

std::unique_ptr<SceneNode> SceneNode::group(std::uint64_t id,
                                            std::unique_ptr<render::RenderNode> handle) {
    return std::unique_ptr<SceneNode>(new SceneNode(id, NodeKind::Group, std::move(handle)));
}

std::unique_ptr<SceneNode> SceneNode::shape(std::uint64_t id,
                                            std::unique_ptr<render::ShapeRenderNode> handle) {
    return std::unique_ptr<SceneNode>(new SceneNode(id, NodeKind::Shape, std::move(handle)));
}

std::unique_ptr<SceneNode> SceneNode::text(std::uint64_t id,
                                           std::unique_ptr<render::TextRenderNode> handle) {
    return std::unique_ptr<SceneNode>(new SceneNode(id, NodeKind::Text, std::move(handle)));
}

SceneNode::~SceneNode() {
    subscriptions_.release_all();
    // Children go first so no backend child outlives its parent handle.
    children_.clear();
}

render::RenderableNode& SceneNode::renderable_node() {
    if (!is_drawable(kind_)) {
        throw std::logic_error(std::string("scene: ") + node_kind_name(kind_) +
                               " node has no fill or stroke");
    }
    return static_cast<render::RenderableNode&>(*handle_);
}

render::ShapeRenderNode& SceneNode::shape_node() {
    if (kind_ != NodeKind::Shape) {
        throw std::logic_error(std::string("scene: ") + node_kind_name(kind_) +
                               " node is not a Shape");
    }
    return static_cast<render::ShapeRenderNode&>(*handle_);
}

render::TextRenderNode& SceneNode::text_node() {
    if (kind_ != NodeKind::Text) {
        throw std::logic_error(std::string("scene: ") + node_kind_name(kind_) +
                               " node is not a Text");
    }
    return static_cast<render::TextRenderNode&>(*handle_);
}

}  // namespace scenesync::scene
