#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace scenesync::paint {

struct PathSegment {
    enum Type { MoveTo, LineTo, QuadTo, CurveTo, ArcTo, Close };
    Type type;
    // MoveTo/LineTo: p[0..1]; QuadTo: p[0..3]; CurveTo: p[0..5];
    // ArcTo: rx, ry, rotation (deg), x, y in p[0..4] plus the two flags.
    double p[6] = {0, 0, 0, 0, 0, 0};
    bool large_arc = false;
    bool sweep = false;
};

// Mutable path builder. Every mutation advances delta(), so a retained
// shape can tell that a path object it already drew has changed in place.
class Path {
public:
    Path() = default;
    explicit Path(const std::string& svg_data);

    Path& move_to(double x, double y);
    Path& line_to(double x, double y);
    Path& quad_to(double cx, double cy, double x, double y);
    Path& curve_to(double c1x, double c1y, double c2x, double c2y, double x, double y);
    Path& arc_to(double rx, double ry, double rotation, bool large_arc, bool sweep,
                 double x, double y);
    Path& close();
    Path& reset();

    // Relative variants, measured from the current pen position.
    Path& move(double dx, double dy);
    Path& line(double dx, double dy);

    std::uint64_t delta() const { return delta_; }
    const std::vector<PathSegment>& segments() const { return segments_; }
    bool empty() const { return segments_.empty() && raw_.empty(); }

    double pen_x() const { return pen_x_; }
    double pen_y() const { return pen_y_; }

    // SVG path data ("M0,0 L10,0 Z").
    std::string to_svg_data() const;

private:
    void push(const PathSegment& segment, double end_x, double end_y);

    std::vector<PathSegment> segments_;
    std::string raw_;  // initial data supplied as a string
    std::uint64_t delta_ = 0;
    double pen_x_ = 0, pen_y_ = 0;
    double start_x_ = 0, start_y_ = 0;
};

using PathRef = std::shared_ptr<Path>;

// Shape geometry: literal path data or a shared, mutable Path object.
using PathValue = std::variant<std::string, PathRef>;

// Literal strings compare by value, Path objects by identity.
bool same_path(const PathValue& a, const PathValue& b);

// Delta marker of the path, 0 for literal strings and null references.
std::uint64_t path_delta(const PathValue& value);

std::string path_data(const PathValue& value);

}  // namespace scenesync::paint
