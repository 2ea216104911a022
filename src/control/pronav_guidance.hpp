#ifndef PURSUIT_PRONAV_GUIDANCE_HPP
#define PURSUIT_PRONAV_GUIDANCE_HPP

#include "core/state_vector.hpp"
#include <optional>

namespace pursuit::control {

/**
 * Pursuit-style proportional navigation
 *
 * Rotates body +Z onto the line of sight within a fixed time constant:
 *   rate_world = axis * (angle / time_to_align)
 * and returns that rate in body axes. No command is produced when there
 * is no target, no seeker lock, coincident positions, or when the
 * remaining angle is below min_angle_deg.
 */
struct ProNavParams {
    double time_to_align = 0.5;   // s
    double min_angle_deg = 0.01;  // already-aligned threshold
};

class ProNavGuidance {
public:
    explicit ProNavGuidance(const ProNavParams& params = ProNavParams{});

    std::optional<Vec3> update(const Pose& own, double own_speed,
                               const std::optional<Vec3>& target_position,
                               bool has_lock);

    /// cross(rate_body, +Z) * speed from the last issued command
    const Vec3& desired_accel_body() const { return desired_accel_body_; }

    const ProNavParams& params() const { return params_; }
    void reset();

private:
    ProNavParams params_;
    Vec3 desired_accel_body_;
};

} // namespace pursuit::control

#endif // PURSUIT_PRONAV_GUIDANCE_HPP
