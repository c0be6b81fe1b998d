#pragma once
#include <memory>
#include <string>
#include <string_view>

#include <scenesync/core/diagnostics.h>
#include <scenesync/paint/transform.h>
#include <scenesync/render/render_node.h>
#include <scenesync/scene/node_factory.h>
#include <scenesync/scene/property_set.h>
#include <scenesync/scene/scene_node.h>
#include <scenesync/scene/surface.h>

namespace scenesync::scene {

// Boundary a tree reconciler drives. Every call runs to completion on the
// caller's thread; one HostConfig serves one scene at a time and owns the
// transform scratch buffer its appliers use.
//
// Misuse (unknown node type, inserting a node before itself, a reference
// node that is not a child) throws; the affected node must then be
// considered unusable.
class HostConfig {
public:
    explicit HostConfig(render::RenderBackend& backend);

    // -- Creation ------------------------------------------------------------

    std::unique_ptr<SceneNode> create_instance(NodeKind kind, const PropertySet& props);
    std::unique_ptr<SceneNode> create_instance(std::string_view type, const PropertySet& props);

    // Text leaves are not scene nodes; the text is returned unchanged.
    std::string create_text_instance(std::string text) const;

    // String children are folded into their parent's text or path.
    void append_initial_child(SceneNode& parent, const std::string& text);
    void append_initial_child(SceneNode& parent, std::unique_ptr<SceneNode> child);

    bool finalize_initial_children(SceneNode& node, NodeKind kind,
                                   const PropertySet& props) const;
    bool should_set_text_content(const PropertySet& props) const;
    SceneNode& get_public_instance(SceneNode& node) const { return node; }

    // -- Commit bracket ------------------------------------------------------

    // Starts a new diagnostics batch.
    void prepare_for_commit();
    void reset_after_commit();

    // -- Mutation ------------------------------------------------------------

    // Attach a new node at the end of `parent`.
    SceneNode& append_child(SceneParent& parent, std::unique_ptr<SceneNode> child);
    // Move an already attached node to the end of `parent`.
    SceneNode& append_child(SceneParent& parent, SceneNode& child);
    SceneNode& append_child_to_container(Surface& container, std::unique_ptr<SceneNode> child);
    SceneNode& append_child_to_container(Surface& container, SceneNode& child);

    SceneNode& insert_before(SceneParent& parent, std::unique_ptr<SceneNode> child,
                             SceneNode& before);
    SceneNode& insert_before(SceneParent& parent, SceneNode& child, SceneNode& before);
    SceneNode& insert_in_container_before(Surface& container, std::unique_ptr<SceneNode> child,
                                          SceneNode& before);
    SceneNode& insert_in_container_before(Surface& container, SceneNode& child,
                                          SceneNode& before);

    // Release the node's subscriptions, detach it and destroy its subtree.
    void remove_child(SceneParent& parent, SceneNode& child);
    void remove_child_from_container(Surface& container, SceneNode& child);

    // -- Updates -------------------------------------------------------------

    bool prepare_update(SceneNode& node, NodeKind kind,
                        const PropertySet& old_props, const PropertySet& new_props) const;
    void commit_update(SceneNode& node, NodeKind kind,
                       const PropertySet& old_props, const PropertySet& new_props);

    // All effect lives in commit_update; these exist for the reconciler.
    void commit_text_update(const std::string& text_instance, const std::string& old_text,
                            const std::string& new_text);
    void reset_text_content(SceneNode& node);
    void commit_mount(SceneNode& node, NodeKind kind, const PropertySet& props);

    // -- Diagnostics ---------------------------------------------------------

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::FailureTraceCollector& failures() const { return failures_; }

private:
    SceneNode& attach(SceneParent& parent, std::unique_ptr<SceneNode> child);
    std::unique_ptr<SceneNode> detach_from_parent(SceneNode& child);
    [[noreturn]] void fail(const std::string& stage, const std::string& message,
                           const SceneNode* node, bool invalid_argument);

    NodeFactory factory_;
    paint::Transform scratch_;
    core::DiagnosticEmitter diagnostics_;
    core::FailureTraceCollector failures_;
    std::uint64_t batch_ = 0;
};

}  // namespace scenesync::scene
