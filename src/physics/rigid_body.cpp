#include "physics/rigid_body.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>

namespace pursuit {

Vec3 body_angular_rate(const RigidBody& body) {
    return quat_rotate_inverse(body.pose().orientation, body.angular_velocity());
}

SimpleRigidBody::SimpleRigidBody(const Pose& pose, double mass, const Inertia& inertia)
    : pose_(pose),
      mass_(std::max(mass, 1e-6)),
      inertia_(inertia) {
    pose_.orientation = quat_normalize(pose_.orientation);
}

void SimpleRigidBody::set_mass(double kg) {
    mass_ = std::max(kg, 1e-6);
}

void SimpleRigidBody::move_to(const Pose& pose) {
    pose_.position = pose.position;
    pose_.orientation = quat_normalize(pose.orientation);
}

void SimpleRigidBody::add_force(const Vec3& world_force) {
    force_accum_ += world_force;
}

void SimpleRigidBody::add_relative_force(const Vec3& body_force) {
    force_accum_ += quat_rotate(pose_.orientation, body_force);
}

void SimpleRigidBody::add_relative_torque(const Vec3& body_torque) {
    torque_accum_ += body_torque;
}

void SimpleRigidBody::step(double dt) {
    last_torque_ = torque_accum_;
    Vec3 force = force_accum_;
    Vec3 torque = torque_accum_;
    force_accum_ = Vec3::Zero();
    torque_accum_ = Vec3::Zero();

    if (kinematic_ || !(dt > 0.0)) return;

    // ── Translation: semi-implicit Euler ──
    Vec3 accel = force / mass_ + gravity_;
    velocity_ += accel * dt;
    pose_.position += velocity_ * dt;

    // ── Rotation: Euler's equation in body axes ──
    Vec3 w = quat_rotate_inverse(pose_.orientation, angular_velocity_);
    Vec3 Iw{inertia_.Ixx * w.x, inertia_.Iyy * w.y, inertia_.Izz * w.z};
    Vec3 wxIw = cross(w, Iw);
    Vec3 w_dot{
        (torque.x - wxIw.x) / inertia_.Ixx,
        (torque.y - wxIw.y) / inertia_.Iyy,
        (torque.z - wxIw.z) / inertia_.Izz
    };
    w += w_dot * dt;

    // dq/dt = 0.5 * q ⊗ (0, w_body)
    const Quat& q = pose_.orientation;
    Quat dq = quat_multiply(q, Quat{0.0, w.x, w.y, w.z});
    pose_.orientation = quat_normalize(Quat{
        q.w + 0.5 * dq.w * dt,
        q.x + 0.5 * dq.x * dt,
        q.y + 0.5 * dq.y * dt,
        q.z + 0.5 * dq.z * dt
    });

    angular_velocity_ = quat_rotate(pose_.orientation, w);
}

} // namespace pursuit
