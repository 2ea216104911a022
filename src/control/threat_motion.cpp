#include "control/threat_motion.hpp"
#include "coordinate/enu_frame.hpp"
#include "physics/vec3_ops.hpp"

namespace pursuit::control {

ThreatMotion::ThreatMotion(RigidBody& body, const ThreatParams& params)
    : body_(body), params_(params) {
    body_.set_kinematic(true);
}

void ThreatMotion::update(double dt) {
    if (arrived_ || !(dt > 0.0)) return;

    Pose pose = body_.pose();
    Vec3 to_aim = params_.aim_point - pose.position;
    double remaining = to_aim.norm();
    double step = params_.speed * dt;

    if (remaining <= step || remaining < 1e-9) {
        arrived_ = true;
        body_.set_velocity(Vec3::Zero());
        body_.move_to(Pose{params_.aim_point, pose.orientation});
        return;
    }

    Vec3 dir = to_aim / remaining;
    body_.set_velocity(dir * params_.speed);
    body_.move_to(Pose{pose.position + dir * step, EnuFrame::look_rotation(dir)});
}

} // namespace pursuit::control
