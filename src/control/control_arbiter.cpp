#include "control/control_arbiter.hpp"
#include "coordinate/enu_frame.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <cmath>

namespace pursuit::control {

ControlArbiter::ControlArbiter(AttitudeController& controller, ThrustModel& thrust,
                               const ArbiterParams& params)
    : controller_(controller), thrust_(thrust), params_(params) {}

Vec3 ControlArbiter::limit_rate(const Vec3& rate, double gain, double max_rate) {
    Vec3 cmd = EnuFrame::sanitize(rate) * std::max(0.0, gain);
    double mag = cmd.norm();
    double limit = std::max(0.0, max_rate);
    if (mag > limit) {
        cmd = cmd * (limit / mag);
    }
    return cmd;
}

Vec3 ControlArbiter::activate_external(double thrust01, const Vec3& desired_body_rate) {
    source_ = CommandSource::ExternallyCommanded;

    double t = std::isfinite(thrust01) ? std::clamp(thrust01, 0.0, 1.0) : 0.0;
    t = std::max(t, std::clamp(params_.min_thrust_floor, 0.0, 1.0));
    thrust_.set_throttle(t);

    last_rate_command_ = limit_rate(desired_body_rate, params_.rate_gain, params_.max_rate_rad);
    controller_.apply_rate_command(last_rate_command_);
    return last_rate_command_;
}

void ControlArbiter::deactivate_external() {
    source_ = CommandSource::Autonomous;
    thrust_.set_throttle(1.0);
}

bool ControlArbiter::apply_guidance(const Vec3& desired_body_rate) {
    if (source_ != CommandSource::Autonomous) return false;

    last_rate_command_ = limit_rate(desired_body_rate, 1.0, params_.max_rate_rad);
    controller_.apply_rate_command(last_rate_command_);
    return true;
}

} // namespace pursuit::control
