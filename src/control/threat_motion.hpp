#ifndef PURSUIT_THREAT_MOTION_HPP
#define PURSUIT_THREAT_MOTION_HPP

#include "physics/rigid_body.hpp"

namespace pursuit::control {

struct ThreatParams {
    Vec3 aim_point;         // internal frame
    double speed = 50.0;    // m/s
};

/**
 * @brief Constant-speed straight-line threat
 *
 * Pose-locked: each update moves the body speed*dt toward the aim point
 * and faces it along the direction of travel. Stops on arrival.
 */
class ThreatMotion {
public:
    ThreatMotion(RigidBody& body, const ThreatParams& params);

    void update(double dt);

    bool arrived() const { return arrived_; }
    const ThreatParams& params() const { return params_; }

private:
    RigidBody& body_;
    ThreatParams params_;
    bool arrived_ = false;
};

} // namespace pursuit::control

#endif // PURSUIT_THREAT_MOTION_HPP
