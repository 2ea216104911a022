#ifndef PURSUIT_ENU_FRAME_HPP
#define PURSUIT_ENU_FRAME_HPP

#include "core/state_vector.hpp"
#include <array>

namespace pursuit {

/**
 * @brief Conversions between the external ENU frame and the internal frame
 *
 * External: East-North-Up, right-handed.
 * Internal: x = East, y = Up, z = North. Body axes are +X right,
 * +Y up, +Z forward.
 *
 * The vector mapping is a pure axis swap, so to_internal and to_external
 * are exact inverses for every finite input.
 */
class EnuFrame {
public:
    /// ENU (e, n, u) -> internal (e, u, n)
    static Vec3 to_internal(const Vec3& enu);

    /// internal (x, y, z) -> ENU (x, z, y)
    static Vec3 to_external(const Vec3& internal);

    /**
     * @brief Build a unit quaternion from three axis vectors (matrix columns)
     *
     * Inputs are normalized first. Uses the trace method, branching on the
     * largest of trace / m00 / m11 / m22. The result is re-normalized.
     */
    static Quat quaternion_from_basis(const Vec3& right, const Vec3& up, const Vec3& forward);

    /**
     * @brief Recorded ENU world->body attitude to an internal body->world rotation
     *
     * Conjugates the input, rotates the ENU basis axes by it, maps each axis
     * to the internal frame and rebuilds a quaternion from that basis.
     */
    static Quat world_to_body_to_internal_rotation(double w, double x, double y, double z);

    /// Internal body->world rotation to an ENU quaternion, as [w, x, y, z]
    static std::array<double, 4> internal_rotation_to_enu_wxyz(const Quat& q);

    /// Rotation whose +Z points along `forward` with +Y as close to `up` as possible
    static Quat look_rotation(const Vec3& forward, const Vec3& up = Vec3{0, 1, 0});

    /// NaN/Inf or norm < 1e-8 -> identity; otherwise normalized
    static Quat sanitize(const Quat& q);

    /// Non-finite components -> 0
    static Vec3 sanitize(const Vec3& v);

    /// Non-finite -> 0
    static double sanitize(double v);

    /// True if sanitize(q) had to substitute identity
    static bool is_degenerate(const Quat& q);
};

} // namespace pursuit

#endif // PURSUIT_ENU_FRAME_HPP
