#include <scenesync/paint/fill.h>
#include <scenesync/paint/font.h>
#include <scenesync/paint/stroke.h>

#include "recording_backend.h"

#include <gtest/gtest.h>

using namespace scenesync::paint;
using scenesync::testing::CallLog;
using scenesync::testing::RecordingShape;

// ---------------------------------------------------------------------------
// Fill equality
// ---------------------------------------------------------------------------
TEST(Fill, SolidColorsCompareByValue) {
    EXPECT_EQ(Fill("red"), Fill::solid("red"));
    EXPECT_NE(Fill("red"), Fill("blue"));
    EXPECT_NE(Fill("red"), Fill::none());
    EXPECT_EQ(Fill::none(), Fill());
}

TEST(Fill, DescriptorsCompareByIdentity) {
    Fill a = Fill::linear({{0, "red"}, {1, "blue"}}, 0, 0, 10, 0);
    Fill b = Fill::linear({{0, "red"}, {1, "blue"}}, 0, 0, 10, 0);
    Fill copy = a;
    EXPECT_EQ(a, copy);
    EXPECT_NE(a, b);
    EXPECT_NE(a, Fill("red"));
}

TEST(Fill, Classification) {
    EXPECT_TRUE(Fill().is_none());
    EXPECT_TRUE(Fill("#fff").is_solid());
    EXPECT_TRUE(Fill::pattern("tile.png", 8, 8).is_descriptor());
    EXPECT_FALSE(Fill::pattern("tile.png", 8, 8).is_solid());
}

// ---------------------------------------------------------------------------
// Backend calls
// ---------------------------------------------------------------------------
TEST(Fill, SolidUsesGenericFill) {
    CallLog log;
    RecordingShape node(log, 1);
    Fill("red").apply_to(node);
    Fill().apply_to(node);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].op, "fill");
    EXPECT_EQ(log[0].args, "red");
    EXPECT_EQ(log[1].args, "-");
}

TEST(Fill, LinearGradientPassesItsCoordinates) {
    CallLog log;
    RecordingShape node(log, 1);
    Fill::linear({{0, "red"}, {1, "blue"}}, 1, 2, 3, 4).apply_to(node);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].op, "fill_linear");
    EXPECT_EQ(log[0].args, "2 1 2 3 4");
}

TEST(Fill, RadialGradientPassesItsOwnFields) {
    CallLog log;
    RecordingShape node(log, 1);
    Fill::radial({{0, "white"}}, 1, 2, 3, 4, 5, 6).apply_to(node);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].op, "fill_radial");
    EXPECT_EQ(log[0].args, "1 1 2 3 4 5 6");
}

TEST(Fill, PatternPassesItsOwnFields) {
    CallLog log;
    RecordingShape node(log, 1);
    Fill::pattern("tile.png", 16, 8, 2, 3).apply_to(node);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].op, "fill_image");
    EXPECT_EQ(log[0].args, "tile.png 16 8 2 3");
}

// ---------------------------------------------------------------------------
// Stroke names
// ---------------------------------------------------------------------------
TEST(Stroke, Names) {
    EXPECT_STREQ(stroke_cap_name(StrokeCap::Butt), "butt");
    EXPECT_STREQ(stroke_cap_name(StrokeCap::Square), "square");
    EXPECT_STREQ(stroke_join_name(StrokeJoin::Miter), "miter");
    EXPECT_STREQ(stroke_join_name(StrokeJoin::Bevel), "bevel");
}

TEST(Stroke, DashPatternsCompareByIdentity) {
    DashPattern a = make_dash({4, 2});
    DashPattern b = make_dash({4, 2});
    EXPECT_NE(a, b);
    EXPECT_EQ(a->size(), 2u);
}
