#ifndef PURSUIT_PROXIMITY_FUSE_HPP
#define PURSUIT_PROXIMITY_FUSE_HPP

#include "core/state_vector.hpp"
#include <optional>

namespace pursuit::control {

struct FuseParams {
    double blast_radius = 5.0;   // m
    double arm_time_s = 0.0;     // no detonation before this time of flight
};

/**
 * @brief Range-triggered detonation, latched once fired
 */
class ProximityFuse {
public:
    explicit ProximityFuse(const FuseParams& params = FuseParams{});

    /// True on the tick the fuse fires and on every tick after
    bool check(const Vec3& own_position, const std::optional<Vec3>& target_position,
               double time_of_flight);

    bool detonated() const { return detonated_; }
    double closest_approach() const { return closest_approach_; }

    void reset();

private:
    FuseParams params_;
    bool detonated_ = false;
    double closest_approach_;
};

} // namespace pursuit::control

#endif // PURSUIT_PROXIMITY_FUSE_HPP
