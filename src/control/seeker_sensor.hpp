#ifndef PURSUIT_SEEKER_SENSOR_HPP
#define PURSUIT_SEEKER_SENSOR_HPP

#include "core/state_vector.hpp"
#include <optional>

namespace pursuit::control {

struct SeekerParams {
    double half_fov_deg = 30.0;           // cone half-angle
    double max_range = 200.0;             // m
    double max_track_rate_deg_s = 60.0;   // LOS slew limit (g-limit proxy)
};

/**
 * @brief Monopulse-style seeker gate
 *
 * Lock requires, in order: a target, range within max_range, the LOS
 * inside the FOV cone around body +Z, and (once a previous LOS exists)
 * an LOS angular rate under the track-rate limit. The LOS is remembered
 * on every tick that has one, lock or not, and forgotten on ticks without
 * one (no target, out of range, coincident). Never throws.
 */
class SeekerSensor {
public:
    explicit SeekerSensor(const SeekerParams& params = SeekerParams{});

    /// Re-evaluate lock for this tick and return it
    bool update(const Pose& own, const std::optional<Vec3>& target_position, double dt);

    bool has_lock() const { return has_lock_; }

    double last_range() const { return last_range_; }
    double last_off_boresight_deg() const { return last_off_boresight_deg_; }

    const SeekerParams& params() const { return params_; }
    void reset();

private:
    SeekerParams params_;
    bool has_lock_ = false;
    std::optional<Vec3> prev_los_;
    double last_range_ = 0.0;
    double last_off_boresight_deg_ = 0.0;
};

} // namespace pursuit::control

#endif // PURSUIT_SEEKER_SENSOR_HPP
