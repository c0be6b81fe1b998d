#pragma once
#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <scenesync/core/config.h>
#include <scenesync/paint/fill.h>
#include <scenesync/paint/font.h>
#include <scenesync/paint/path.h>
#include <scenesync/paint/stroke.h>
#include <scenesync/paint/transform.h>
#include <scenesync/scene/event_subscriptions.h>

namespace scenesync::scene {

// Placeholder for a child that is a scene node rather than text.
struct ElementChild {};

using ChildValue = std::variant<std::string, double, ElementChild>;

// Snapshot of a node's declared properties. Absent fields are nullopt.
struct PropertySet {
    // Placement
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> rotation;  // degrees
    std::optional<double> scale;
    std::optional<double> scale_x;
    std::optional<double> scale_y;
    std::optional<double> origin_x;
    std::optional<double> origin_y;
    std::optional<paint::Transform> transform;

    // Presentation
    std::optional<std::string> cursor;
    std::optional<std::string> title;
    std::optional<double> opacity;
    std::optional<bool> visible;

    std::optional<double> width;
    std::optional<double> height;

    // Drawable
    paint::Fill fill;
    std::optional<std::string> stroke;
    std::optional<double> stroke_width;
    std::optional<paint::StrokeCap> stroke_cap;
    std::optional<paint::StrokeJoin> stroke_join;
    paint::DashPattern stroke_dash;

    // Shape
    std::optional<paint::PathValue> d;

    // Text
    paint::Font font;
    std::optional<paint::Alignment> alignment;
    paint::PathRef path;

    std::vector<ChildValue> children;

    Listener& on(EventKind kind) { return listeners[render::event_kind_index(kind)]; }
    const Listener& on(EventKind kind) const { return listeners[render::event_kind_index(kind)]; }

    std::array<Listener, core::config::kEventKindCount> listeners;
};

double resolve_scale_x(const PropertySet& props);
double resolve_scale_y(const PropertySet& props);

// Concatenation of the string children; other children are skipped.
std::string children_as_string(const std::vector<ChildValue>& children);

// Shape geometry: `d` when given, otherwise the string children.
paint::PathValue resolve_shape_path(const PropertySet& props);

// A node is a text leaf when its only child is a string or a number.
bool is_text_content(const PropertySet& props);

}  // namespace scenesync::scene
