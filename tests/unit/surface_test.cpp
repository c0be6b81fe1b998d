#include <scenesync/scene/host_config.h>
#include <scenesync/scene/node_kind.h>
#include <scenesync/scene/surface.h>

#include "recording_backend.h"

#include <gtest/gtest.h>

using namespace scenesync::scene;
using scenesync::testing::RecordingBackend;

// ---------------------------------------------------------------------------
// Surface
// ---------------------------------------------------------------------------
TEST(Surface, CreatesBackendSurface) {
    RecordingBackend backend;
    Surface surface(backend, 300, 150);
    ASSERT_EQ(backend.log.size(), 1u);
    EXPECT_EQ(backend.log[0].op, "create_surface");
    EXPECT_EQ(backend.log[0].args, "300 150");
    EXPECT_DOUBLE_EQ(surface.width(), 300);
    EXPECT_DOUBLE_EQ(surface.height(), 150);
}

TEST(Surface, DefaultSize) {
    RecordingBackend backend;
    Surface surface(backend);
    EXPECT_DOUBLE_EQ(surface.width(), 300);
    EXPECT_DOUBLE_EQ(surface.height(), 150);
}

TEST(Surface, ResizesOnlyOnChange) {
    RecordingBackend backend;
    Surface surface(backend, 10, 10);
    EXPECT_FALSE(surface.set_size(10, 10));
    EXPECT_TRUE(surface.set_size(20, 10));
    EXPECT_EQ(backend.count("resize"), 1u);
    EXPECT_EQ(backend.calls("resize")[0].args, "20 10");
}

TEST(Surface, FlushRespectsBackendCapability) {
    RecordingBackend passive;
    Surface a(passive, 10, 10);
    EXPECT_FALSE(a.flush());
    EXPECT_EQ(passive.count("render"), 0u);

    RecordingBackend active(true);
    Surface b(active, 10, 10);
    EXPECT_TRUE(b.flush());
    EXPECT_EQ(active.count("render"), 1u);
}

TEST(Surface, DestroyingSurfaceReleasesSubscriptions) {
    RecordingBackend backend;
    HostConfig host(backend);
    {
        Surface surface(backend, 10, 10);
        PropertySet props;
        props.on(EventKind::Click) = Listener([](const PointerEvent&) {});
        host.append_child_to_container(surface, host.create_instance(NodeKind::Group, props));
    }
    EXPECT_EQ(backend.count("subscribe"), 1u);
    EXPECT_EQ(backend.count("unsubscribe"), 1u);
}

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------
TEST(NodeKind, NamesRoundTrip) {
    EXPECT_STREQ(node_kind_name(NodeKind::ClippingRectangle), "ClippingRectangle");
    EXPECT_EQ(node_kind_from_name("Shape"), NodeKind::Shape);
    EXPECT_FALSE(node_kind_from_name("shape").has_value());
    EXPECT_TRUE(is_drawable(NodeKind::Text));
    EXPECT_FALSE(is_drawable(NodeKind::Group));
}

TEST(EventKind, Names) {
    using scenesync::render::event_kind_from_name;
    using scenesync::render::event_kind_name;
    EXPECT_STREQ(event_kind_name(EventKind::MouseDown), "mousedown");
    EXPECT_EQ(event_kind_from_name("mouseover"), EventKind::MouseOver);
    EXPECT_FALSE(event_kind_from_name("wheel").has_value());
}
