#include "control/attitude_controller.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <cmath>

namespace pursuit::control {

static double normalize_axis(double torque, double max_torque) {
    if (!(max_torque > 0.0) || !std::isfinite(torque)) return 0.0;
    return std::clamp(torque / max_torque, -1.0, 1.0);
}

AttitudeController::AttitudeController(RigidBody& body, Actuator& actuator,
                                       const AttitudeGains& gains, double fixed_dt)
    : body_(body), actuator_(actuator), gains_(gains), dt_(fixed_dt) {}

Vec3 AttitudeController::apply_rate_command(const Vec3& desired_body_rate) {
    Vec3 current = body_angular_rate(body_);
    Vec3 err = desired_body_rate - current;

    Vec3 deriv;
    if (dt_ > 0.0 && std::isfinite(dt_)) {
        integral_ += err * dt_;
        deriv = (err - prev_error_) / dt_;
    }
    prev_error_ = err;

    Vec3 torque_cmd{
        gains_.kp.x * err.x + gains_.ki.x * integral_.x + gains_.kd.x * deriv.x,
        gains_.kp.y * err.y + gains_.ki.y * integral_.y + gains_.kd.y * deriv.y,
        gains_.kp.z * err.z + gains_.ki.z * integral_.z + gains_.kd.z * deriv.z
    };

    const Vec3& max_t = actuator_.max_torque();
    Vec3 demand{
        normalize_axis(torque_cmd.x, max_t.x),
        normalize_axis(torque_cmd.y, max_t.y),
        normalize_axis(torque_cmd.z, max_t.z)
    };

    actuator_.apply_moment(demand);
    return demand;
}

void AttitudeController::reset() {
    integral_ = Vec3::Zero();
    prev_error_ = Vec3::Zero();
}

} // namespace pursuit::control
