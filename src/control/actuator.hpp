#ifndef PURSUIT_ACTUATOR_HPP
#define PURSUIT_ACTUATOR_HPP

#include "core/state_vector.hpp"
#include "physics/rigid_body.hpp"

namespace pursuit::control {

/**
 * @brief Normalized moment demand -> body torque
 *
 * Each demand axis is clamped to [-1, 1] (non-finite -> 0) and scaled by
 * max_torque before being applied as a body-relative torque.
 */
class Actuator {
public:
    explicit Actuator(RigidBody& body, const Vec3& max_torque = Vec3{8000.0, 8000.0, 2000.0});

    /// Returns the torque applied [N·m]
    Vec3 apply_moment(const Vec3& demand);

    const Vec3& max_torque() const { return max_torque_; }
    const Vec3& last_demand() const { return last_demand_; }
    const Vec3& last_torque() const { return last_torque_; }

private:
    RigidBody& body_;
    Vec3 max_torque_;
    Vec3 last_demand_;
    Vec3 last_torque_;
};

} // namespace pursuit::control

#endif // PURSUIT_ACTUATOR_HPP
