#ifndef PURSUIT_CONTROL_ARBITER_HPP
#define PURSUIT_CONTROL_ARBITER_HPP

#include "control/attitude_controller.hpp"
#include "control/thrust_model.hpp"

namespace pursuit::control {

enum class CommandSource {
    Autonomous,
    ExternallyCommanded
};

inline const char* command_source_to_string(CommandSource s) {
    switch (s) {
        case CommandSource::Autonomous:          return "autonomous";
        case CommandSource::ExternallyCommanded: return "external";
        default:                                 return "";
    }
}

struct ArbiterParams {
    double rate_gain = 1.0;          // negative treated as 0
    double max_rate_rad = 3.0;       // rate command magnitude limit [rad/s]
    double min_thrust_floor = 0.0;   // lowest throttle while external
};

/**
 * @brief Selects which command source drives the attitude controller
 *
 * Two states, switched explicitly and immediately. While externally
 * commanded, guidance commands are ignored.
 */
class ControlArbiter {
public:
    ControlArbiter(AttitudeController& controller, ThrustModel& thrust,
                   const ArbiterParams& params = ArbiterParams{});

    /**
     * @brief Enter (or stay in) the externally commanded state
     *
     * throttle = max(floor, clamp01(thrust01)); rate is scaled by the gain
     * and magnitude-limited. Both are applied this tick.
     * @return the rate command actually forwarded
     */
    Vec3 activate_external(double thrust01, const Vec3& desired_body_rate);

    /// Back to autonomous; throttle reset to full
    void deactivate_external();

    /// Forward a guidance command; ignored (returns false) while external
    bool apply_guidance(const Vec3& desired_body_rate);

    CommandSource source() const { return source_; }
    bool is_external() const { return source_ == CommandSource::ExternallyCommanded; }

    double throttle() const { return thrust_.throttle(); }
    const Vec3& last_rate_command() const { return last_rate_command_; }
    const ArbiterParams& params() const { return params_; }

    /// gain-scale then clamp |rate| to max_rate (direction kept, NaN -> 0)
    static Vec3 limit_rate(const Vec3& rate, double gain, double max_rate);

private:
    AttitudeController& controller_;
    ThrustModel& thrust_;
    ArbiterParams params_;
    CommandSource source_ = CommandSource::Autonomous;
    Vec3 last_rate_command_;
};

} // namespace pursuit::control

#endif // PURSUIT_CONTROL_ARBITER_HPP
