#include "control/pronav_guidance.hpp"
#include "physics/vec3_ops.hpp"

namespace pursuit::control {

ProNavGuidance::ProNavGuidance(const ProNavParams& params) : params_(params) {}

std::optional<Vec3> ProNavGuidance::update(const Pose& own, double own_speed,
                                           const std::optional<Vec3>& target_position,
                                           bool has_lock) {
    if (!target_position || !has_lock) return std::nullopt;
    if (!(params_.time_to_align > 0.0)) return std::nullopt;

    Vec3 los = normalized(*target_position - own.position);
    if (los.squared_norm() < 1e-6) return std::nullopt;

    Vec3 forward = quat_rotate(own.orientation, Vec3{0, 0, 1});
    Quat q = quat_from_to(forward, los);

    Vec3 axis_world;
    double angle_rad = 0.0;
    quat_to_axis_angle(q, axis_world, angle_rad);
    if (angle_rad * RAD_TO_DEG < params_.min_angle_deg) return std::nullopt;
    if (axis_world.squared_norm() == 0.0) return std::nullopt;

    Vec3 rate_world = normalized(axis_world) * (angle_rad / params_.time_to_align);
    Vec3 rate_body = quat_rotate_inverse(own.orientation, rate_world);

    desired_accel_body_ = cross(rate_body, Vec3{0, 0, 1}) * own_speed;
    return rate_body;
}

void ProNavGuidance::reset() {
    desired_accel_body_ = Vec3::Zero();
}

} // namespace pursuit::control
