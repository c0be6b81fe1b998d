#include <scenesync/scene/host_config.h>
#include <scenesync/scene/appliers.h>

#include <stdexcept>

namespace scenesync::scene {

namespace {
constexpr const char kModule[] = "host";
}

HostConfig::HostConfig(render::RenderBackend& backend)
    : factory_(backend) {}

// ---------------------------------------------------------------------------
// Creation
// ---------------------------------------------------------------------------

std::unique_ptr<SceneNode> HostConfig::create_instance(NodeKind kind, const PropertySet& props) {
    std::unique_ptr<SceneNode> node;
    try {
        node = factory_.create(kind, props, scratch_);
    } catch (const std::invalid_argument& e) {
        diagnostics_.emit(core::Severity::Error, kModule, "create", e.what());
        failures_.capture(diagnostics_, kModule, "create", e.what());
        throw;
    }
    diagnostics_.emit(core::Severity::Info, kModule, "create",
                      std::string("created ") + node_kind_name(node->kind()), node->id());
    return node;
}

std::unique_ptr<SceneNode> HostConfig::create_instance(std::string_view type,
                                                       const PropertySet& props) {
    auto kind = node_kind_from_name(type);
    if (!kind) {
        fail("create", "does not support the type \"" + std::string(type) + "\"",
             nullptr, true);
    }
    return create_instance(*kind, props);
}

std::string HostConfig::create_text_instance(std::string text) const {
    return text;
}

void HostConfig::append_initial_child(SceneNode& /*parent*/, const std::string& /*text*/) {
    // Noop: string children of Text and Shape are read from props.children.
}

void HostConfig::append_initial_child(SceneNode& parent, std::unique_ptr<SceneNode> child) {
    attach(parent, std::move(child));
}

bool HostConfig::finalize_initial_children(SceneNode& /*node*/, NodeKind /*kind*/,
                                           const PropertySet& /*props*/) const {
    return false;
}

bool HostConfig::should_set_text_content(const PropertySet& props) const {
    return is_text_content(props);
}

// ---------------------------------------------------------------------------
// Commit bracket
// ---------------------------------------------------------------------------

void HostConfig::prepare_for_commit() {
    diagnostics_.set_batch_id(++batch_);
}

void HostConfig::reset_after_commit() {
    // Noop
}

// ---------------------------------------------------------------------------
// Mutation
// ---------------------------------------------------------------------------

SceneNode& HostConfig::attach(SceneParent& parent, std::unique_ptr<SceneNode> child) {
    SceneNode& attached = parent.append_child(std::move(child));
    attached.render_node().inject(parent.render_node());
    diagnostics_.emit(core::Severity::Debug, kModule, "append",
                      "appended " + std::string(node_kind_name(attached.kind())),
                      attached.id());
    return attached;
}

std::unique_ptr<SceneNode> HostConfig::detach_from_parent(SceneNode& child) {
    SceneParent* old_parent = child.parent();
    child.render_node().eject();
    return old_parent->remove_child(child);
}

SceneNode& HostConfig::append_child(SceneParent& parent, std::unique_ptr<SceneNode> child) {
    if (!child) {
        fail("append", "cannot append a null node", nullptr, false);
    }
    return attach(parent, std::move(child));
}

SceneNode& HostConfig::append_child(SceneParent& parent, SceneNode& child) {
    if (child.parent() == nullptr) {
        fail("append", "node is not attached; pass ownership to append it", &child, false);
    }
    if (child.parent() != &parent) {
        diagnostics_.emit(core::Severity::Warning, kModule, "append",
                          "moving node to a different parent", child.id());
    }
    return attach(parent, detach_from_parent(child));
}

SceneNode& HostConfig::append_child_to_container(Surface& container,
                                                 std::unique_ptr<SceneNode> child) {
    return append_child(container, std::move(child));
}

SceneNode& HostConfig::append_child_to_container(Surface& container, SceneNode& child) {
    return append_child(container, child);
}

SceneNode& HostConfig::insert_before(SceneParent& parent, std::unique_ptr<SceneNode> child,
                                     SceneNode& before) {
    if (!child) {
        fail("insert", "cannot insert a null node", nullptr, false);
    }
    if (child.get() == &before) {
        fail("insert", "can not insert node before itself", &before, false);
    }
    if (before.parent() != &parent) {
        fail("insert", "reference node is not a child of the parent", &before, false);
    }

    SceneNode& inserted = parent.insert_before(std::move(child), &before);
    inserted.render_node().inject_before(before.render_node());
    diagnostics_.emit(core::Severity::Debug, kModule, "insert",
                      "inserted before node " + std::to_string(before.id()), inserted.id());
    return inserted;
}

SceneNode& HostConfig::insert_before(SceneParent& parent, SceneNode& child, SceneNode& before) {
    if (&child == &before) {
        fail("insert", "can not insert node before itself", &child, false);
    }
    if (before.parent() != &parent) {
        fail("insert", "reference node is not a child of the parent", &before, false);
    }
    if (child.parent() == nullptr) {
        fail("insert", "node is not attached; pass ownership to insert it", &child, false);
    }
    return insert_before(parent, detach_from_parent(child), before);
}

SceneNode& HostConfig::insert_in_container_before(Surface& container,
                                                  std::unique_ptr<SceneNode> child,
                                                  SceneNode& before) {
    return insert_before(container, std::move(child), before);
}

SceneNode& HostConfig::insert_in_container_before(Surface& container, SceneNode& child,
                                                  SceneNode& before) {
    return insert_before(container, child, before);
}

void HostConfig::remove_child(SceneParent& parent, SceneNode& child) {
    if (child.parent() != &parent) {
        fail("remove", "node is not a child of the parent", &child, false);
    }

    std::uint64_t id = child.id();
    NodeKind kind = child.kind();

    // Subscriptions must go while the backend handle is still reachable.
    child.subscriptions().release_all();
    child.render_node().eject();
    std::unique_ptr<SceneNode> removed = parent.remove_child(child);
    removed.reset();

    diagnostics_.emit(core::Severity::Info, kModule, "remove",
                      std::string("removed ") + node_kind_name(kind), id);
}

void HostConfig::remove_child_from_container(Surface& container, SceneNode& child) {
    remove_child(container, child);
}

// ---------------------------------------------------------------------------
// Updates
// ---------------------------------------------------------------------------

bool HostConfig::prepare_update(SceneNode& /*node*/, NodeKind /*kind*/,
                                const PropertySet& /*old_props*/,
                                const PropertySet& /*new_props*/) const {
    return true;
}

void HostConfig::commit_update(SceneNode& node, NodeKind kind,
                               const PropertySet& old_props, const PropertySet& new_props) {
    if (kind != node.kind()) {
        diagnostics_.emit(core::Severity::Warning, kModule, "update",
                          std::string("update tagged ") + node_kind_name(kind) +
                          " applied as " + node_kind_name(node.kind()), node.id());
    }
    apply_props(node, new_props, old_props, scratch_);
}

void HostConfig::commit_text_update(const std::string& /*text_instance*/,
                                    const std::string& /*old_text*/,
                                    const std::string& /*new_text*/) {
    // Noop
}

void HostConfig::reset_text_content(SceneNode& /*node*/) {
    // Noop
}

void HostConfig::commit_mount(SceneNode& /*node*/, NodeKind /*kind*/,
                              const PropertySet& /*props*/) {
    // Noop
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

void HostConfig::fail(const std::string& stage, const std::string& message,
                      const SceneNode* node, bool invalid_argument) {
    std::uint64_t node_id = node ? node->id() : 0;
    diagnostics_.emit(core::Severity::Error, kModule, stage, message, node_id);

    core::FailureTrace& trace = failures_.capture(diagnostics_, kModule, stage, message);
    if (node) {
        trace.add_snapshot("node", std::to_string(node->id()));
        trace.add_snapshot("kind", node_kind_name(node->kind()));
        trace.add_snapshot("attached", node->parent() ? "true" : "false");
    }

    std::string what = "scenesync: " + message;
    if (invalid_argument) {
        throw std::invalid_argument(what);
    }
    throw std::logic_error(what);
}

}  // namespace scenesync::scene
