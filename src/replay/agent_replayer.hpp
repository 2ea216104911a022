/**
 * AgentReplayer — drives one replayed body from recorded data.
 *
 * Two modes, held as a std::variant so a transition replaces the whole
 * per-mode state:
 *
 *   Kinematic      recorded poses are written straight into a pose-locked
 *                  body; linear and angular velocity are estimated from
 *                  successive poses.
 *   CommandDriven  recorded actions [pitch, yaw, roll, throttle, ...] are
 *                  pushed through the airframe's ControlArbiter so the
 *                  normal PID/actuator path flies the body. Short or
 *                  missing actions reuse the last usable one.
 *
 * Usage:
 *   AgentReplayer r("interceptor_0", body, &missile);
 *   r.configure(AgentMode::CommandDriven);
 *   r.apply_action(frame.find("interceptor_0")->action, dt);
 *   body.step(dt);
 */

#ifndef PURSUIT_AGENT_REPLAYER_HPP
#define PURSUIT_AGENT_REPLAYER_HPP

#include "control/interceptor.hpp"
#include "physics/rigid_body.hpp"
#include <string>
#include <variant>
#include <vector>

namespace pursuit::replay {

enum class AgentMode {
    Kinematic,
    CommandDriven
};

inline const char* agent_mode_to_string(AgentMode m) {
    switch (m) {
        case AgentMode::Kinematic:     return "kinematic";
        case AgentMode::CommandDriven: return "command";
        default:                       return "";
    }
}

inline AgentMode string_to_agent_mode(const std::string& s) {
    if (s == "command" || s == "command_driven") return AgentMode::CommandDriven;
    return AgentMode::Kinematic;
}

struct KinematicState {
    Vec3 last_position;
    Quat last_rotation;
    bool first_update = true;
};

struct CommandDrivenState {
    std::vector<double> held_action;
};

using AgentModeState = std::variant<KinematicState, CommandDrivenState>;

class AgentReplayer {
public:
    /// airframe may be null; such an agent can only be Kinematic
    AgentReplayer(std::string id, RigidBody& body, control::Interceptor* airframe = nullptr);

    /**
     * @brief Switch mode
     *
     * Kinematic pose-locks the body and hands the arbiter back to autonomous.
     * CommandDriven unlocks it. Returns false (mode unchanged) when
     * CommandDriven is requested without an airframe.
     */
    bool configure(AgentMode mode);

    AgentMode mode() const;
    const AgentModeState& state() const { return state_; }

    /// Kinematic only; returns false in the other mode
    bool apply_kinematic(const Pose& pose, double dt);

    /**
     * @brief CommandDriven only: fly one tick from a recorded action
     *
     * Returns false if not CommandDriven or no usable action has been seen.
     */
    bool apply_action(const std::vector<double>& action, double dt);

    /// Teleport with zero velocities, whatever the mode
    void force_pose(const Pose& pose);

    void set_frozen(bool frozen) { frozen_ = frozen; }
    bool is_frozen() const { return frozen_; }

    const std::string& id() const { return id_; }
    RigidBody& body() { return body_; }
    const RigidBody& body() const { return body_; }
    control::Interceptor* airframe() { return airframe_; }

private:
    std::string id_;
    RigidBody& body_;
    control::Interceptor* airframe_;
    AgentModeState state_;
    bool frozen_ = false;
};

} // namespace pursuit::replay

#endif // PURSUIT_AGENT_REPLAYER_HPP
