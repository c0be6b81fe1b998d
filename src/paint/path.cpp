#include <scenesync/paint/path.h>

#include <sstream>

namespace scenesync::paint {

namespace {

void write_number(std::ostringstream& oss, double v) {
    if (v == static_cast<double>(static_cast<long long>(v))) {
        oss << static_cast<long long>(v);
    } else {
        oss << v;
    }
}

void write_point(std::ostringstream& oss, double x, double y) {
    write_number(oss, x);
    oss << ',';
    write_number(oss, y);
}

}  // namespace

Path::Path(const std::string& svg_data) : raw_(svg_data) {}

void Path::push(const PathSegment& segment, double end_x, double end_y) {
    segments_.push_back(segment);
    pen_x_ = end_x;
    pen_y_ = end_y;
    ++delta_;
}

Path& Path::move_to(double x, double y) {
    PathSegment s{PathSegment::MoveTo};
    s.p[0] = x; s.p[1] = y;
    start_x_ = x;
    start_y_ = y;
    push(s, x, y);
    return *this;
}

Path& Path::line_to(double x, double y) {
    PathSegment s{PathSegment::LineTo};
    s.p[0] = x; s.p[1] = y;
    push(s, x, y);
    return *this;
}

Path& Path::quad_to(double cx, double cy, double x, double y) {
    PathSegment s{PathSegment::QuadTo};
    s.p[0] = cx; s.p[1] = cy;
    s.p[2] = x;  s.p[3] = y;
    push(s, x, y);
    return *this;
}

Path& Path::curve_to(double c1x, double c1y, double c2x, double c2y, double x, double y) {
    PathSegment s{PathSegment::CurveTo};
    s.p[0] = c1x; s.p[1] = c1y;
    s.p[2] = c2x; s.p[3] = c2y;
    s.p[4] = x;   s.p[5] = y;
    push(s, x, y);
    return *this;
}

Path& Path::arc_to(double rx, double ry, double rotation, bool large_arc, bool sweep,
                   double x, double y) {
    PathSegment s{PathSegment::ArcTo};
    s.p[0] = rx; s.p[1] = ry;
    s.p[2] = rotation;
    s.p[3] = x;  s.p[4] = y;
    s.large_arc = large_arc;
    s.sweep = sweep;
    push(s, x, y);
    return *this;
}

Path& Path::close() {
    push(PathSegment{PathSegment::Close}, start_x_, start_y_);
    return *this;
}

Path& Path::reset() {
    segments_.clear();
    raw_.clear();
    pen_x_ = pen_y_ = 0;
    start_x_ = start_y_ = 0;
    ++delta_;
    return *this;
}

Path& Path::move(double dx, double dy) {
    return move_to(pen_x_ + dx, pen_y_ + dy);
}

Path& Path::line(double dx, double dy) {
    return line_to(pen_x_ + dx, pen_y_ + dy);
}

std::string Path::to_svg_data() const {
    std::ostringstream oss;
    oss << raw_;
    for (const auto& s : segments_) {
        if (oss.tellp() > 0) oss << ' ';
        switch (s.type) {
            case PathSegment::MoveTo:
                oss << 'M';
                write_point(oss, s.p[0], s.p[1]);
                break;
            case PathSegment::LineTo:
                oss << 'L';
                write_point(oss, s.p[0], s.p[1]);
                break;
            case PathSegment::QuadTo:
                oss << 'Q';
                write_point(oss, s.p[0], s.p[1]);
                oss << ' ';
                write_point(oss, s.p[2], s.p[3]);
                break;
            case PathSegment::CurveTo:
                oss << 'C';
                write_point(oss, s.p[0], s.p[1]);
                oss << ' ';
                write_point(oss, s.p[2], s.p[3]);
                oss << ' ';
                write_point(oss, s.p[4], s.p[5]);
                break;
            case PathSegment::ArcTo:
                oss << 'A';
                write_point(oss, s.p[0], s.p[1]);
                oss << ' ';
                write_number(oss, s.p[2]);
                oss << ' ' << (s.large_arc ? 1 : 0) << ',' << (s.sweep ? 1 : 0) << ' ';
                write_point(oss, s.p[3], s.p[4]);
                break;
            case PathSegment::Close:
                oss << 'Z';
                break;
        }
    }
    return oss.str();
}

bool same_path(const PathValue& a, const PathValue& b) {
    if (a.index() != b.index()) return false;
    if (auto* sa = std::get_if<std::string>(&a)) {
        return *sa == std::get<std::string>(b);
    }
    return std::get<PathRef>(a) == std::get<PathRef>(b);
}

std::uint64_t path_delta(const PathValue& value) {
    if (auto* ref = std::get_if<PathRef>(&value)) {
        return *ref ? (*ref)->delta() : 0;
    }
    return 0;
}

std::string path_data(const PathValue& value) {
    if (auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    const auto& ref = std::get<PathRef>(value);
    return ref ? ref->to_svg_data() : std::string();
}

}  // namespace scenesync::paint
