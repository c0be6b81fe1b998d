#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <scenesync/paint/path.h>
#include <scenesync/paint/transform.h>
#include <scenesync/render/render_node.h>
#include <scenesync/scene/event_subscriptions.h>
#include <scenesync/scene/node_kind.h>

namespace scenesync::scene {

class SceneNode;

// Anything that owns scene nodes: another node or the surface.
class SceneParent {
public:
    SceneParent() = default;
    virtual ~SceneParent();

    SceneParent(const SceneParent&) = delete;
    SceneParent& operator=(const SceneParent&) = delete;

    virtual render::RenderNode& render_node() = 0;

    // Ownership only; backend placement is the caller's job.
    SceneNode& append_child(std::unique_ptr<SceneNode> child);
    // Appends when `reference` is null. Throws std::logic_error when
    // `reference` is not a child of this parent.
    SceneNode& insert_before(std::unique_ptr<SceneNode> child, SceneNode* reference);
    // Throws std::logic_error when `child` is not a child of this parent.
    std::unique_ptr<SceneNode> remove_child(SceneNode& child);

    std::size_t child_count() const { return children_.size(); }
    SceneNode* first_child() const;
    SceneNode* last_child() const;
    SceneNode* child_at(std::size_t index) const;
    std::optional<std::size_t> index_of(const SceneNode& child) const;

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

protected:
    std::vector<std::unique_ptr<SceneNode>> children_;
};

// A retained scene node: the backend handle plus everything the appliers
// need to diff against. Kind is fixed at construction.
class SceneNode : public SceneParent {
public:
    // The handle type is tied to the kind here, which is what makes the
    // typed accessors below safe.
    static std::unique_ptr<SceneNode> clipping_rectangle(std::uint64_t id,
                                                         std::unique_ptr<render::RenderNode> handle);
    static std::unique_ptr<SceneNode> group(std::uint64_t id,
                                            std::unique_ptr<render::RenderNode> handle);
    static std::unique_ptr<SceneNode> shape(std::uint64_t id,
                                            std::unique_ptr<render::ShapeRenderNode> handle);
    static std::unique_ptr<SceneNode> text(std::uint64_t id,
                                           std::unique_ptr<render::TextRenderNode> handle);

    ~SceneNode() override;

    std::uint64_t id() const { return id_; }
    NodeKind kind() const { return kind_; }
    SceneParent* parent() const { return parent_; }

    render::RenderNode& render_node() override { return *handle_; }
    // Typed handle access; throws std::logic_error on a kind mismatch.
    render::RenderableNode& renderable_node();
    render::ShapeRenderNode& shape_node();
    render::TextRenderNode& text_node();

    // Coefficients last pushed through transform_to().
    paint::Transform& applied_transform() { return applied_transform_; }
    const paint::Transform& applied_transform() const { return applied_transform_; }

    EventSubscriptions& subscriptions() { return subscriptions_; }
    const EventSubscriptions& subscriptions() const { return subscriptions_; }

    // Group and clipping rectangle dimensions.
    std::optional<double> width;
    std::optional<double> height;

    // Shape: path and delta marker of the last draw.
    std::optional<paint::PathValue> prev_path;
    std::uint64_t prev_delta = 0;

    // Text: string of the last draw.
    std::optional<std::string> current_string;

private:
    friend class SceneParent;

    SceneNode(std::uint64_t id, NodeKind kind, std::unique_ptr<render::RenderNode> handle);

    std::uint64_t id_;
    NodeKind kind_;
    std::unique_ptr<render::RenderNode> handle_;
    paint::Transform applied_transform_;
    SceneParent* parent_ = nullptr;
    // Declared after handle_ so it is torn down while the handle still lives.
    EventSubscriptions subscriptions_;
};

}  // namespace scenesync::scene
