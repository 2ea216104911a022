#include "control/thrust_model.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <cmath>

namespace pursuit::control {

ThrustModel::ThrustModel(RigidBody& body, FuelModel& fuel,
                         std::optional<ThrustCurve> curve, bool use_forward_axis)
    : body_(body),
      fuel_(fuel),
      curve_(std::move(curve)),
      use_forward_axis_(use_forward_axis) {}

void ThrustModel::update(double dt) {
    applied_thrust_n_ = 0.0;
    if (fuel_.is_empty() || !curve_ || curve_->empty()) return;
    if (!(dt > 0.0)) return;

    evaluated_thrust_n_ = curve_->evaluate(burn_time_);
    applied_thrust_n_ = evaluated_thrust_n_ * throttle_;

    double mass_used = fuel_.consume(dt);

    Vec3 axis = use_forward_axis_ ? Vec3{0, 0, 1} : Vec3{1, 0, 0};
    body_.add_relative_force(axis * applied_thrust_n_);
    body_.set_mass(body_.mass() - mass_used);

    burn_time_ += dt;
}

void ThrustModel::set_throttle(double throttle01) {
    throttle_ = std::isfinite(throttle01) ? std::clamp(throttle01, 0.0, 1.0) : 0.0;
}

void ThrustModel::reset() {
    throttle_ = 1.0;
    burn_time_ = 0.0;
    evaluated_thrust_n_ = 0.0;
    applied_thrust_n_ = 0.0;
}

} // namespace pursuit::control
