#include "control/seeker_sensor.hpp"
#include "physics/vec3_ops.hpp"

namespace pursuit::control {

SeekerSensor::SeekerSensor(const SeekerParams& params) : params_(params) {}

bool SeekerSensor::update(const Pose& own, const std::optional<Vec3>& target_position, double dt) {
    has_lock_ = false;

    if (!target_position) {
        prev_los_.reset();
        return false;
    }

    Vec3 to_target = *target_position - own.position;
    double dist = to_target.norm();
    last_range_ = dist;

    // Range gate; no usable LOS this tick, so no rate history either
    if (dist > params_.max_range || dist < 1e-9) {
        prev_los_.reset();
        return false;
    }

    Vec3 los = to_target / dist;
    std::optional<Vec3> prev = prev_los_;
    prev_los_ = los;

    // FOV gate
    Vec3 forward = quat_rotate(own.orientation, Vec3{0, 0, 1});
    last_off_boresight_deg_ = angle_between(forward, los) * RAD_TO_DEG;
    if (last_off_boresight_deg_ > params_.half_fov_deg) return false;

    // Track-rate gate, LOS slew since the previous tick
    if (prev && dt > 0.0) {
        double track_rate = angle_between(*prev, los) * RAD_TO_DEG / dt;
        if (track_rate > params_.max_track_rate_deg_s) return false;
    }

    has_lock_ = true;
    return true;
}

void SeekerSensor::reset() {
    has_lock_ = false;
    prev_los_.reset();
    last_range_ = 0.0;
    last_off_boresight_deg_ = 0.0;
}

} // namespace pursuit::control
