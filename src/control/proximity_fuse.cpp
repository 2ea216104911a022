#include "control/proximity_fuse.hpp"
#include "physics/vec3_ops.hpp"
#include <limits>

namespace pursuit::control {

ProximityFuse::ProximityFuse(const FuseParams& params)
    : params_(params),
      closest_approach_(std::numeric_limits<double>::infinity()) {}

bool ProximityFuse::check(const Vec3& own_position, const std::optional<Vec3>& target_position,
                          double time_of_flight) {
    if (detonated_) return true;
    if (!target_position) return false;

    double range = distance(own_position, *target_position);
    if (range < closest_approach_) closest_approach_ = range;

    if (time_of_flight < params_.arm_time_s) return false;
    if (range <= params_.blast_radius) detonated_ = true;
    return detonated_;
}

void ProximityFuse::reset() {
    detonated_ = false;
    closest_approach_ = std::numeric_limits<double>::infinity();
}

} // namespace pursuit::control
