#include <scenesync/paint/transform.h>

#include <cmath>

namespace scenesync::paint {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

Transform& Transform::transform_to(double nxx, double nyx, double nxy, double nyy,
                                   double nx, double ny) {
    xx = nxx; yx = nyx;
    xy = nxy; yy = nyy;
    x = nx;   y = ny;
    return *this;
}

Transform& Transform::transform_to(const Transform& other) {
    return transform_to(other.xx, other.yx, other.xy, other.yy, other.x, other.y);
}

Transform& Transform::transform(double oxx, double oyx, double oxy, double oyy,
                                double ox, double oy) {
    return transform_to(
        xx * oxx + xy * oyx,
        yx * oxx + yy * oyx,
        xx * oxy + xy * oyy,
        yx * oxy + yy * oyy,
        xx * ox + xy * oy + x,
        yx * ox + yy * oy + y);
}

Transform& Transform::transform(const Transform& other) {
    return transform(other.xx, other.yx, other.xy, other.yy, other.x, other.y);
}

Transform& Transform::move(double dx, double dy) {
    x += dx;
    y += dy;
    return *this;
}

Transform& Transform::rotate(double degrees, double origin_x, double origin_y) {
    // T(origin) * R * T(-origin)
    double rad = degrees * kPi / 180.0;
    double sin_a = std::sin(rad);
    double cos_a = std::cos(rad);
    transform(1, 0, 0, 1, origin_x, origin_y);
    transform(cos_a, sin_a, -sin_a, cos_a, 0, 0);
    return transform(1, 0, 0, 1, -origin_x, -origin_y);
}

Transform& Transform::scale(double sx, double sy, double origin_x, double origin_y) {
    // T(origin) * S * T(-origin)
    transform(1, 0, 0, 1, origin_x, origin_y);
    transform(sx, 0, 0, sy, 0, 0);
    return transform(1, 0, 0, 1, -origin_x, -origin_y);
}

void Transform::point(double px, double py, double& out_x, double& out_y) const {
    out_x = xx * px + xy * py + x;
    out_y = yx * px + yy * py + y;
}

Transform Transform::inverse() const {
    double det = determinant();
    if (det == 0) return identity();
    double inv_det = 1.0 / det;
    Transform r;
    r.xx =  yy * inv_det;
    r.yx = -yx * inv_det;
    r.xy = -xy * inv_det;
    r.yy =  xx * inv_det;
    r.x = -(r.xx * x + r.xy * y);
    r.y = -(r.yx * x + r.yy * y);
    return r;
}

bool Transform::is_identity() const {
    return xx == 1 && yx == 0 && xy == 0 && yy == 1 && x == 0 && y == 0;
}

Transform Transform::operator*(const Transform& o) const {
    Transform r = *this;
    r.transform(o);
    return r;
}

bool operator==(const Transform& a, const Transform& b) {
    return a.xx == b.xx && a.yx == b.yx &&
           a.xy == b.xy && a.yy == b.yy &&
           a.x == b.x && a.y == b.y;
}

bool operator!=(const Transform& a, const Transform& b) {
    return !(a == b);
}

}  // namespace scenesync::paint
