#ifndef PURSUIT_THRUST_MODEL_HPP
#define PURSUIT_THRUST_MODEL_HPP

#include "control/fuel_model.hpp"
#include "control/thrust_curve.hpp"
#include "physics/rigid_body.hpp"
#include <optional>

namespace pursuit::control {

/**
 * @brief Motor model: curve x throttle, applied along a body axis
 *
 * Each update, while fuel remains and a curve is configured:
 *   thrust = curve(burn_time) * throttle
 * The force goes along body +Z (forward) or +X (right), body mass drops by
 * the fuel burned and burn time advances by dt. Fuel burns at the full
 * mass-flow rate whatever the throttle.
 */
class ThrustModel {
public:
    ThrustModel(RigidBody& body, FuelModel& fuel,
                std::optional<ThrustCurve> curve = ThrustCurve::default_motor(),
                bool use_forward_axis = true);

    void update(double dt);

    /// Clamped into [0, 1]; non-finite -> 0
    void set_throttle(double throttle01);
    double throttle() const { return throttle_; }

    /// Curve output at the last burning update (throttle-independent)
    double evaluated_thrust_n() const { return evaluated_thrust_n_; }

    /// Force actually applied at the last update
    double applied_thrust_n() const { return applied_thrust_n_; }

    double burn_time() const { return burn_time_; }

    void reset();

private:
    RigidBody& body_;
    FuelModel& fuel_;
    std::optional<ThrustCurve> curve_;
    bool use_forward_axis_;

    double throttle_ = 1.0;
    double burn_time_ = 0.0;
    double evaluated_thrust_n_ = 0.0;
    double applied_thrust_n_ = 0.0;
};

} // namespace pursuit::control

#endif // PURSUIT_THRUST_MODEL_HPP
