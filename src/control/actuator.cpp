#include "control/actuator.hpp"
#include <algorithm>
#include <cmath>

namespace pursuit::control {

static double clamp_unit(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, -1.0, 1.0);
}

Actuator::Actuator(RigidBody& body, const Vec3& max_torque)
    : body_(body), max_torque_(max_torque) {}

Vec3 Actuator::apply_moment(const Vec3& demand) {
    last_demand_ = Vec3{clamp_unit(demand.x), clamp_unit(demand.y), clamp_unit(demand.z)};
    last_torque_ = Vec3{
        last_demand_.x * max_torque_.x,
        last_demand_.y * max_torque_.y,
        last_demand_.z * max_torque_.z
    };
    body_.add_relative_torque(last_torque_);
    return last_torque_;
}

} // namespace pursuit::control
