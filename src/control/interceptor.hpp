/**
 * Interceptor — one guided airframe, composed explicitly.
 *
 * Owns the fuel, motor, seeker, guidance law, actuator, rate controller,
 * arbiter and fuse, and wires each with its collaborators at construction.
 * The rigid body and the pursued target are borrowed: the target is set
 * with set_target() and may be cleared at any time.
 *
 * Usage:
 *   SimpleRigidBody body(start_pose, 50.0, inertia);
 *   Interceptor missile(body, InterceptorParams{});
 *   missile.set_target(&threat_body);
 *   missile.tick(dt);        // seeker -> guidance -> arbiter -> PID -> actuator, motor, fuse
 *   body.step(dt);
 */

#ifndef PURSUIT_INTERCEPTOR_HPP
#define PURSUIT_INTERCEPTOR_HPP

#include "control/actuator.hpp"
#include "control/attitude_controller.hpp"
#include "control/control_arbiter.hpp"
#include "control/fuel_model.hpp"
#include "control/pronav_guidance.hpp"
#include "control/proximity_fuse.hpp"
#include "control/seeker_sensor.hpp"
#include "control/thrust_model.hpp"
#include "physics/rigid_body.hpp"
#include <optional>

namespace pursuit::control {

struct InterceptorParams {
    FuelParams fuel;
    std::optional<ThrustCurve> thrust_curve = ThrustCurve::default_motor();
    bool thrust_along_forward = true;
    SeekerParams seeker;
    ProNavParams pronav;
    AttitudeGains gains;
    Vec3 max_torque{8000.0, 8000.0, 2000.0};
    ArbiterParams arbiter;
    FuseParams fuse;
    double dt = 0.01;
};

class Interceptor {
public:
    Interceptor(RigidBody& body, const InterceptorParams& params);

    Interceptor(const Interceptor&) = delete;
    Interceptor& operator=(const Interceptor&) = delete;

    /// nullptr clears the target; guidance goes inert
    void set_target(const RigidBody* target) { target_ = target; }
    const RigidBody* target() const { return target_; }

    /**
     * @brief Run one control tick
     *
     * Seeker lock is refreshed, autonomous guidance is forwarded through the
     * arbiter (ignored while an external command source is active), then
     * the motor burns and the fuse is checked.
     */
    void tick(double dt);

    void reset();

    RigidBody& body() { return body_; }
    FuelModel& fuel() { return fuel_; }
    ThrustModel& thrust() { return thrust_; }
    SeekerSensor& seeker() { return seeker_; }
    ProNavGuidance& guidance() { return pronav_; }
    Actuator& actuator() { return actuator_; }
    AttitudeController& controller() { return controller_; }
    ControlArbiter& arbiter() { return arbiter_; }
    ProximityFuse& fuse() { return fuse_; }

    const FuelModel& fuel() const { return fuel_; }
    const SeekerSensor& seeker() const { return seeker_; }
    const ControlArbiter& arbiter() const { return arbiter_; }
    const ProximityFuse& fuse() const { return fuse_; }

    bool had_guidance_command() const { return had_guidance_command_; }
    double time_of_flight() const { return time_of_flight_; }

private:
    RigidBody& body_;
    InterceptorParams params_;

    FuelModel fuel_;
    ThrustModel thrust_;
    SeekerSensor seeker_;
    ProNavGuidance pronav_;
    Actuator actuator_;
    AttitudeController controller_;
    ControlArbiter arbiter_;
    ProximityFuse fuse_;

    const RigidBody* target_ = nullptr;
    bool had_guidance_command_ = false;
    double time_of_flight_ = 0.0;
};

} // namespace pursuit::control

#endif // PURSUIT_INTERCEPTOR_HPP
