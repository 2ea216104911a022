#ifndef PURSUIT_ATTITUDE_CONTROLLER_HPP
#define PURSUIT_ATTITUDE_CONTROLLER_HPP

#include "control/actuator.hpp"
#include "physics/rigid_body.hpp"

namespace pursuit::control {

struct AttitudeGains {
    Vec3 kp{0.8, 0.8, 0.2};
    Vec3 ki{0.0, 0.0, 0.0};
    Vec3 kd{0.05, 0.05, 0.02};
};

/**
 * @brief Per-axis PID on body angular rate
 *
 *   err   = desired - current (body axes)
 *   torque = Kp*err + Ki*integral + Kd*d(err)/dt
 *   demand = clamp(torque / max_torque, -1, 1)
 *
 * With a non-positive or non-finite timestep the integral is frozen and
 * the derivative term is zero.
 */
class AttitudeController {
public:
    AttitudeController(RigidBody& body, Actuator& actuator,
                       const AttitudeGains& gains = AttitudeGains{},
                       double fixed_dt = 0.01);

    /// Returns the normalized demand handed to the actuator
    Vec3 apply_rate_command(const Vec3& desired_body_rate);

    void set_timestep(double dt) { dt_ = dt; }
    double timestep() const { return dt_; }

    const AttitudeGains& gains() const { return gains_; }
    const Vec3& integral() const { return integral_; }

    void reset();

private:
    RigidBody& body_;
    Actuator& actuator_;
    AttitudeGains gains_;
    double dt_;

    Vec3 integral_;
    Vec3 prev_error_;
};

} // namespace pursuit::control

#endif // PURSUIT_ATTITUDE_CONTROLLER_HPP
