/**
 * Vec3 and Quat Operations
 *
 * Free-function operator overloads and utilities for Vec3/Quat.
 * Header-only — include wherever vector/quaternion math is needed.
 *
 * Quaternions are Hamilton (w, x, y, z). quat_rotate(q, v) maps a
 * body-frame vector into the frame q is expressed in.
 */

#ifndef PURSUIT_VEC3_OPS_HPP
#define PURSUIT_VEC3_OPS_HPP

#include "core/state_vector.hpp"
#include <cmath>
#include <algorithm>

namespace pursuit {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

// ═══════════════════════════════════════════════════════════════
// Vec3 operators
// ═══════════════════════════════════════════════════════════════

inline Vec3 operator+(const Vec3& a, const Vec3& b) {
    return Vec3{a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3 operator-(const Vec3& a, const Vec3& b) {
    return Vec3{a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3 operator-(const Vec3& a) {
    return Vec3{-a.x, -a.y, -a.z};
}

inline Vec3 operator*(double s, const Vec3& v) {
    return Vec3{s * v.x, s * v.y, s * v.z};
}

inline Vec3 operator*(const Vec3& v, double s) {
    return Vec3{v.x * s, v.y * s, v.z * s};
}

inline Vec3 operator/(const Vec3& v, double s) {
    double inv = 1.0 / s;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

inline Vec3& operator+=(Vec3& a, const Vec3& b) {
    a.x += b.x; a.y += b.y; a.z += b.z;
    return a;
}

inline Vec3& operator-=(Vec3& a, const Vec3& b) {
    a.x -= b.x; a.y -= b.y; a.z -= b.z;
    return a;
}

inline bool operator==(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vec3& a, const Vec3& b) {
    return !(a == b);
}

// ═══════════════════════════════════════════════════════════════
// Vec3 functions
// ═══════════════════════════════════════════════════════════════

inline double dot(const Vec3& a, const Vec3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return Vec3{
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x
    };
}

inline Vec3 normalized(const Vec3& v) {
    double n = v.norm();
    if (n < 1e-15) return Vec3::Zero();
    double inv = 1.0 / n;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

inline double distance(const Vec3& a, const Vec3& b) {
    return (a - b).norm();
}

inline Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
    return Vec3{
        a.x + (b.x - a.x) * t,
        a.y + (b.y - a.y) * t,
        a.z + (b.z - a.z) * t
    };
}

// Unsigned angle between two vectors [rad]; 0 if either is zero
inline double angle_between(const Vec3& a, const Vec3& b) {
    double denom = std::sqrt(a.squared_norm() * b.squared_norm());
    if (denom < 1e-15) return 0.0;
    double c = std::clamp(dot(a, b) / denom, -1.0, 1.0);
    return std::acos(c);
}

inline bool is_finite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

// ═══════════════════════════════════════════════════════════════
// Quat operators and functions
// ═══════════════════════════════════════════════════════════════

// Hamilton product: q1 * q2 (applies q2 then q1)
inline Quat quat_multiply(const Quat& q1, const Quat& q2) {
    return Quat{
        q1.w * q2.w - q1.x * q2.x - q1.y * q2.y - q1.z * q2.z,
        q1.w * q2.x + q1.x * q2.w + q1.y * q2.z - q1.z * q2.y,
        q1.w * q2.y - q1.x * q2.z + q1.y * q2.w + q1.z * q2.x,
        q1.w * q2.z + q1.x * q2.y - q1.y * q2.x + q1.z * q2.w
    };
}

inline Quat quat_conjugate(const Quat& q) {
    return Quat{q.w, -q.x, -q.y, -q.z};
}

inline double quat_norm(const Quat& q) {
    return std::sqrt(q.w * q.w + q.x * q.x + q.y * q.y + q.z * q.z);
}

inline double quat_dot(const Quat& a, const Quat& b) {
    return a.w * b.w + a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Quat quat_normalize(const Quat& q) {
    double n = quat_norm(q);
    if (n < 1e-15) return Quat::Identity();
    double inv = 1.0 / n;
    return Quat{q.w * inv, q.x * inv, q.y * inv, q.z * inv};
}

inline bool is_finite(const Quat& q) {
    return std::isfinite(q.w) && std::isfinite(q.x) &&
           std::isfinite(q.y) && std::isfinite(q.z);
}

// Rotate vector by quaternion: q * v * q^-1
inline Vec3 quat_rotate(const Quat& q, const Vec3& v) {
    // Efficient formula: v' = v + 2*w*(u x v) + 2*(u x (u x v))
    // where q = (w, u)
    Vec3 u{q.x, q.y, q.z};
    Vec3 uv = cross(u, v);
    Vec3 uuv = cross(u, uv);
    return v + 2.0 * (q.w * uv + uuv);
}

// Inverse rotation: q^-1 * v * q
inline Vec3 quat_rotate_inverse(const Quat& q, const Vec3& v) {
    return quat_rotate(quat_conjugate(q), v);
}

// Create quaternion from axis-angle
inline Quat quat_from_axis_angle(const Vec3& axis, double angle) {
    Vec3 a = normalized(axis);
    double half = angle * 0.5;
    double s = std::sin(half);
    return Quat{std::cos(half), a.x * s, a.y * s, a.z * s};
}

/**
 * Decompose a rotation into unit axis + angle in [0, pi].
 * A rotation too small to define an axis yields a zero axis.
 */
inline void quat_to_axis_angle(const Quat& q_in, Vec3& axis, double& angle) {
    Quat q = quat_normalize(q_in);
    if (q.w < 0.0) q = Quat{-q.w, -q.x, -q.y, -q.z};

    angle = 2.0 * std::acos(std::clamp(q.w, -1.0, 1.0));
    double s = std::sqrt(std::max(0.0, 1.0 - q.w * q.w));
    if (s < 1e-9) {
        axis = Vec3::Zero();
        return;
    }
    axis = Vec3{q.x / s, q.y / s, q.z / s};
}

// Minimal rotation taking direction `from` onto direction `to`
inline Quat quat_from_to(const Vec3& from, const Vec3& to) {
    Vec3 f = normalized(from);
    Vec3 t = normalized(to);
    if (f.squared_norm() == 0.0 || t.squared_norm() == 0.0) return Quat::Identity();

    double d = dot(f, t);
    if (d >= 1.0 - 1e-12) return Quat::Identity();

    if (d <= -1.0 + 1e-12) {
        // Antiparallel: any perpendicular axis works
        Vec3 axis = cross(Vec3{1, 0, 0}, f);
        if (axis.squared_norm() < 1e-12) axis = cross(Vec3{0, 1, 0}, f);
        return quat_from_axis_angle(axis, PI);
    }

    Vec3 c = cross(f, t);
    return quat_normalize(Quat{1.0 + d, c.x, c.y, c.z});
}

// Spherical linear interpolation along the shortest arc
inline Quat quat_slerp(const Quat& a_in, const Quat& b_in, double t) {
    Quat a = quat_normalize(a_in);
    Quat b = quat_normalize(b_in);
    t = std::clamp(t, 0.0, 1.0);

    double d = quat_dot(a, b);
    if (d < 0.0) {
        b = Quat{-b.w, -b.x, -b.y, -b.z};
        d = -d;
    }

    if (d > 0.9995) {
        // Nearly parallel: nlerp
        return quat_normalize(Quat{
            a.w + (b.w - a.w) * t,
            a.x + (b.x - a.x) * t,
            a.y + (b.y - a.y) * t,
            a.z + (b.z - a.z) * t
        });
    }

    double theta = std::acos(d);
    double sin_theta = std::sin(theta);
    double wa = std::sin((1.0 - t) * theta) / sin_theta;
    double wb = std::sin(t * theta) / sin_theta;
    return Quat{
        wa * a.w + wb * b.w,
        wa * a.x + wb * b.x,
        wa * a.y + wb * b.y,
        wa * a.z + wb * b.z
    };
}

}  // namespace pursuit

#endif  // PURSUIT_VEC3_OPS_HPP
