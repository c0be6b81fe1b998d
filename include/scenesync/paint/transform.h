#pragma once

namespace scenesync::paint {

// 2D affine transform. A point (px, py) maps to
//   (xx * px + xy * py + x, yx * px + yy * py + y)
struct Transform {
    double xx = 1, yx = 0;
    double xy = 0, yy = 1;
    double x = 0, y = 0;

    static Transform identity() { return {}; }
    static Transform translation(double tx, double ty) { return {1, 0, 0, 1, tx, ty}; }

    // Overwrite all six coefficients.
    Transform& transform_to(double nxx, double nyx, double nxy, double nyy,
                            double nx, double ny);
    Transform& transform_to(const Transform& other);

    // Post-multiply: this = this * other
    Transform& transform(double oxx, double oyx, double oxy, double oyy,
                         double ox, double oy);
    Transform& transform(const Transform& other);

    Transform& move(double dx, double dy);

    // Rotate by `degrees` about (origin_x, origin_y) in the current frame.
    Transform& rotate(double degrees, double origin_x = 0, double origin_y = 0);

    // Scale about (origin_x, origin_y) in the current frame.
    Transform& scale(double sx, double sy, double origin_x = 0, double origin_y = 0);

    void point(double px, double py, double& out_x, double& out_y) const;

    double determinant() const { return xx * yy - yx * xy; }
    bool invertible() const { return determinant() != 0; }
    // Identity when the transform is singular.
    Transform inverse() const;

    bool is_identity() const;

    Transform operator*(const Transform& o) const;
};

// Exact coefficient equality; no epsilon.
bool operator==(const Transform& a, const Transform& b);
bool operator!=(const Transform& a, const Transform& b);

}  // namespace scenesync::paint
