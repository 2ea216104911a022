#ifndef PURSUIT_STATE_VECTOR_HPP
#define PURSUIT_STATE_VECTOR_HPP

#include <cmath>

namespace pursuit {

/**
 * @brief Simple 3D vector
 */
struct Vec3 {
    double x, y, z;

    Vec3() : x(0), y(0), z(0) {}
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double norm() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double squared_norm() const {
        return x*x + y*y + z*z;
    }

    static Vec3 Zero() { return Vec3(0, 0, 0); }
};

/**
 * @brief Simple quaternion (w, x, y, z)
 */
struct Quat {
    double w, x, y, z;

    Quat() : w(1), x(0), y(0), z(0) {}
    Quat(double w_, double x_, double y_, double z_) : w(w_), x(x_), y(y_), z(z_) {}

    static Quat Identity() { return Quat(1, 0, 0, 0); }
};

/**
 * @brief Position + orientation of a body in the internal frame
 *
 * Orientation is body->world. Body axes: +X right, +Y up, +Z forward.
 * Always passed by value.
 */
struct Pose {
    Vec3 position;
    Quat orientation;

    Pose() = default;
    Pose(const Vec3& p, const Quat& q) : position(p), orientation(q) {}
};

} // namespace pursuit

#endif // PURSUIT_STATE_VECTOR_HPP
