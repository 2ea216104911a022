#include "coordinate/enu_frame.hpp"
#include "physics/vec3_ops.hpp"
#include <cmath>

namespace pursuit {

Vec3 EnuFrame::to_internal(const Vec3& enu) {
    return Vec3{enu.x, enu.z, enu.y};
}

Vec3 EnuFrame::to_external(const Vec3& internal) {
    return Vec3{internal.x, internal.z, internal.y};
}

Quat EnuFrame::quaternion_from_basis(const Vec3& right_in, const Vec3& up_in, const Vec3& forward_in) {
    Vec3 right = normalized(right_in);
    Vec3 up = normalized(up_in);
    Vec3 fwd = normalized(forward_in);

    // Columns are the basis axes
    double m00 = right.x, m01 = up.x, m02 = fwd.x;
    double m10 = right.y, m11 = up.y, m12 = fwd.y;
    double m20 = right.z, m21 = up.z, m22 = fwd.z;

    double trace = m00 + m11 + m22;
    double w, x, y, z;

    if (trace > 0.0) {
        double s = std::sqrt(trace + 1.0) * 2.0;
        w = 0.25 * s;
        x = (m21 - m12) / s;
        y = (m02 - m20) / s;
        z = (m10 - m01) / s;
    } else if (m00 > m11 && m00 > m22) {
        double s = std::sqrt(1.0 + m00 - m11 - m22) * 2.0;
        w = (m21 - m12) / s;
        x = 0.25 * s;
        y = (m01 + m10) / s;
        z = (m02 + m20) / s;
    } else if (m11 > m22) {
        double s = std::sqrt(1.0 + m11 - m00 - m22) * 2.0;
        w = (m02 - m20) / s;
        x = (m01 + m10) / s;
        y = 0.25 * s;
        z = (m12 + m21) / s;
    } else {
        double s = std::sqrt(1.0 + m22 - m00 - m11) * 2.0;
        w = (m10 - m01) / s;
        x = (m02 + m20) / s;
        y = (m12 + m21) / s;
        z = 0.25 * s;
    }

    // Degenerate inputs can leave s == 0 and the components NaN
    return sanitize(Quat{w, x, y, z});
}

Quat EnuFrame::world_to_body_to_internal_rotation(double w, double x, double y, double z) {
    Quat q_wb = sanitize(Quat{w, x, y, z});
    Quat q_bw = quat_conjugate(q_wb);

    // Body axes expressed in ENU
    Vec3 ex = quat_rotate(q_bw, Vec3{1, 0, 0});
    Vec3 ey = quat_rotate(q_bw, Vec3{0, 1, 0});
    Vec3 ez = quat_rotate(q_bw, Vec3{0, 0, 1});

    return quaternion_from_basis(to_internal(ex), to_internal(ey), to_internal(ez));
}

std::array<double, 4> EnuFrame::internal_rotation_to_enu_wxyz(const Quat& q_in) {
    Quat q = sanitize(q_in);

    Vec3 ex = normalized(to_external(quat_rotate(q, Vec3{1, 0, 0})));
    Vec3 ey = normalized(to_external(quat_rotate(q, Vec3{0, 1, 0})));
    Vec3 ez = normalized(to_external(quat_rotate(q, Vec3{0, 0, 1})));

    Quat r = quaternion_from_basis(ex, ey, ez);
    return {r.w, r.x, r.y, r.z};
}

Quat EnuFrame::look_rotation(const Vec3& forward, const Vec3& up) {
    Vec3 f = normalized(forward);
    if (f.squared_norm() == 0.0) return Quat::Identity();

    Vec3 r = normalized(cross(up, f));
    if (r.squared_norm() == 0.0) {
        // forward parallel to up: pick any right axis
        r = normalized(cross(Vec3{0, 0, 1}, f));
        if (r.squared_norm() == 0.0) r = normalized(cross(Vec3{1, 0, 0}, f));
    }
    Vec3 u = cross(f, r);
    return quaternion_from_basis(r, u, f);
}

Quat EnuFrame::sanitize(const Quat& q) {
    if (!is_finite(q)) return Quat::Identity();
    double m = quat_norm(q);
    if (m < 1e-8) return Quat::Identity();
    return Quat{q.w / m, q.x / m, q.y / m, q.z / m};
}

Vec3 EnuFrame::sanitize(const Vec3& v) {
    return Vec3{sanitize(v.x), sanitize(v.y), sanitize(v.z)};
}

double EnuFrame::sanitize(double v) {
    return std::isfinite(v) ? v : 0.0;
}

bool EnuFrame::is_degenerate(const Quat& q) {
    return !is_finite(q) || quat_norm(q) < 1e-8;
}

} // namespace pursuit
