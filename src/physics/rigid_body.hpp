/**
 * Rigid Body Collaborator
 *
 * The control pipeline never integrates physics itself. It reads state
 * from and hands forces/torques to a RigidBody. SimpleRigidBody is the
 * reference implementation used by the demo executable and the tests:
 * semi-implicit Euler translation, Euler's equation for rotation and
 * first-order quaternion integration.
 *
 * Usage:
 *   SimpleRigidBody body(Pose{{0,0,0}, Quat::Identity()}, 50.0, {5,5,1});
 *   body.add_relative_force({0, 0, 600});
 *   body.step(0.01);
 */

#ifndef PURSUIT_RIGID_BODY_HPP
#define PURSUIT_RIGID_BODY_HPP

#include "core/state_vector.hpp"

namespace pursuit {

/**
 * @brief Abstract rigid body seen by the control and replay pipelines
 *
 * Angular velocity is reported in the world frame. Forces and torques
 * accumulate until the integrator consumes them.
 */
class RigidBody {
public:
    virtual ~RigidBody() = default;

    virtual Pose pose() const = 0;
    virtual Vec3 velocity() const = 0;
    virtual Vec3 angular_velocity() const = 0;
    virtual double mass() const = 0;

    virtual void set_mass(double kg) = 0;
    virtual void set_velocity(const Vec3& v) = 0;
    virtual void set_angular_velocity(const Vec3& w) = 0;

    /// Pose-locked bodies ignore forces and are moved only by move_to()
    virtual void set_kinematic(bool kinematic) = 0;
    virtual bool is_kinematic() const = 0;
    virtual void move_to(const Pose& pose) = 0;

    virtual void add_force(const Vec3& world_force) = 0;
    virtual void add_relative_force(const Vec3& body_force) = 0;
    virtual void add_relative_torque(const Vec3& body_torque) = 0;
};

/// Current angular rate expressed in body axes
Vec3 body_angular_rate(const RigidBody& body);

/// Principal moments of inertia [kg·m²]
struct Inertia {
    double Ixx = 1.0;
    double Iyy = 1.0;
    double Izz = 1.0;
};

class SimpleRigidBody : public RigidBody {
public:
    SimpleRigidBody(const Pose& pose, double mass, const Inertia& inertia = Inertia{});

    Pose pose() const override { return pose_; }
    Vec3 velocity() const override { return velocity_; }
    Vec3 angular_velocity() const override { return angular_velocity_; }
    double mass() const override { return mass_; }

    void set_mass(double kg) override;
    void set_velocity(const Vec3& v) override { velocity_ = v; }
    void set_angular_velocity(const Vec3& w) override { angular_velocity_ = w; }

    void set_kinematic(bool kinematic) override { kinematic_ = kinematic; }
    bool is_kinematic() const override { return kinematic_; }
    void move_to(const Pose& pose) override;

    void add_force(const Vec3& world_force) override;
    void add_relative_force(const Vec3& body_force) override;
    void add_relative_torque(const Vec3& body_torque) override;

    void set_gravity(const Vec3& g) { gravity_ = g; }

    /**
     * @brief Advance one step and clear accumulated loads
     *
     * Kinematic bodies only discard the accumulators. dt <= 0 is a no-op.
     */
    void step(double dt);

    const Vec3& last_torque() const { return last_torque_; }

private:
    Pose pose_;
    Vec3 velocity_;
    Vec3 angular_velocity_;  // world frame
    double mass_;
    Inertia inertia_;
    Vec3 gravity_;
    bool kinematic_ = false;

    Vec3 force_accum_;   // world frame
    Vec3 torque_accum_;  // body frame
    Vec3 last_torque_;
};

} // namespace pursuit

#endif // PURSUIT_RIGID_BODY_HPP
