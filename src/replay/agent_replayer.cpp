#include "replay/agent_replayer.hpp"
#include "replay/episode_types.hpp"
#include "physics/vec3_ops.hpp"
#include <iostream>

namespace pursuit::replay {

AgentReplayer::AgentReplayer(std::string id, RigidBody& body, control::Interceptor* airframe)
    : id_(std::move(id)), body_(body), airframe_(airframe) {
    Pose p = body_.pose();
    state_ = KinematicState{p.position, p.orientation, true};
    body_.set_kinematic(true);
}

AgentMode AgentReplayer::mode() const {
    return std::holds_alternative<CommandDrivenState>(state_) ? AgentMode::CommandDriven
                                                              : AgentMode::Kinematic;
}

bool AgentReplayer::configure(AgentMode mode) {
    if (mode == AgentMode::CommandDriven) {
        if (!airframe_) {
            std::cerr << "[AgentReplayer] " << id_
                      << ": no airframe, cannot be command driven\n";
            return false;
        }
        body_.set_kinematic(false);
        state_ = CommandDrivenState{};
        return true;
    }

    body_.set_kinematic(true);
    if (airframe_) airframe_->arbiter().deactivate_external();
    Pose p = body_.pose();
    state_ = KinematicState{p.position, p.orientation, true};
    return true;
}

bool AgentReplayer::apply_kinematic(const Pose& pose, double dt) {
    auto* ks = std::get_if<KinematicState>(&state_);
    if (!ks) return false;

    body_.move_to(pose);

    if (!ks->first_update && dt > 0.0) {
        body_.set_velocity((pose.position - ks->last_position) / dt);

        // Rotation delta in world axes, shortest arc
        Quat delta = quat_multiply(pose.orientation, quat_conjugate(ks->last_rotation));
        Vec3 axis;
        double angle = 0.0;
        quat_to_axis_angle(delta, axis, angle);
        body_.set_angular_velocity(axis * (angle / dt));
    }

    ks->last_position = pose.position;
    ks->last_rotation = pose.orientation;
    ks->first_update = false;
    return true;
}

bool AgentReplayer::apply_action(const std::vector<double>& action, double dt) {
    auto* cs = std::get_if<CommandDrivenState>(&state_);
    if (!cs || !airframe_) return false;

    if (action.size() >= ACTION_MIN_USABLE) {
        cs->held_action = action;
    }
    if (cs->held_action.size() < ACTION_MIN_USABLE) return false;

    const auto& u = cs->held_action;
    Vec3 rate{u[ACTION_PITCH_RATE], u[ACTION_YAW_RATE], u[ACTION_ROLL_RATE]};
    airframe_->arbiter().activate_external(u[ACTION_THROTTLE], rate);
    airframe_->tick(dt);
    return true;
}

void AgentReplayer::force_pose(const Pose& pose) {
    body_.move_to(pose);
    body_.set_velocity(Vec3::Zero());
    body_.set_angular_velocity(Vec3::Zero());

    if (auto* ks = std::get_if<KinematicState>(&state_)) {
        ks->last_position = pose.position;
        ks->last_rotation = pose.orientation;
        ks->first_update = true;
    }
}

} // namespace pursuit::replay
