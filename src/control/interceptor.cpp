#include "control/interceptor.hpp"

namespace pursuit::control {

Interceptor::Interceptor(RigidBody& body, const InterceptorParams& params)
    : body_(body),
      params_(params),
      fuel_(params.fuel),
      thrust_(body, fuel_, params.thrust_curve, params.thrust_along_forward),
      seeker_(params.seeker),
      pronav_(params.pronav),
      actuator_(body, params.max_torque),
      controller_(body, actuator_, params.gains, params.dt),
      arbiter_(controller_, thrust_, params.arbiter),
      fuse_(params.fuse) {}

void Interceptor::tick(double dt) {
    controller_.set_timestep(dt);

    Pose pose = body_.pose();
    std::optional<Vec3> target_pos;
    if (target_) target_pos = target_->pose().position;

    bool lock = seeker_.update(pose, target_pos, dt);

    had_guidance_command_ = false;
    if (!arbiter_.is_external()) {
        auto cmd = pronav_.update(pose, body_.velocity().norm(), target_pos, lock);
        if (cmd) had_guidance_command_ = arbiter_.apply_guidance(*cmd);
    }

    thrust_.update(dt);
    fuse_.check(pose.position, target_pos, time_of_flight_);

    if (dt > 0.0) time_of_flight_ += dt;
}

void Interceptor::reset() {
    fuel_.reset();
    thrust_.reset();
    seeker_.reset();
    pronav_.reset();
    controller_.reset();
    arbiter_.deactivate_external();
    fuse_.reset();
    had_guidance_command_ = false;
    time_of_flight_ = 0.0;
}

} // namespace pursuit::control
