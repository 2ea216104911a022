#include "control/pronav_guidance.hpp"
#include "control/proximity_fuse.hpp"
#include "control/seeker_sensor.hpp"
#include "control/threat_motion.hpp"
#include "physics/rigid_body.hpp"
#include "physics/vec3_ops.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace pursuit;
using namespace pursuit::control;

// ═══════════════════════════════════════════════════════════════
// SeekerSensor
// ═══════════════════════════════════════════════════════════════

TEST(SeekerSensor, LocksTargetAhead) {
    SeekerSensor seeker;
    EXPECT_TRUE(seeker.update(Pose{}, Vec3{0, 0, 100}, 0.01));
    EXPECT_TRUE(seeker.has_lock());
    EXPECT_NEAR(seeker.last_range(), 100.0, 1e-12);
    EXPECT_NEAR(seeker.last_off_boresight_deg(), 0.0, 1e-9);
}

TEST(SeekerSensor, RangeGate) {
    SeekerSensor seeker(SeekerParams{30.0, 200.0, 60.0});
    EXPECT_FALSE(seeker.update(Pose{}, Vec3{0, 0, 300}, 0.01));
    EXPECT_FALSE(seeker.has_lock());
}

TEST(SeekerSensor, FieldOfViewGate) {
    SeekerSensor seeker;
    EXPECT_FALSE(seeker.update(Pose{}, Vec3{100, 0, 10}, 0.01));
    EXPECT_GT(seeker.last_off_boresight_deg(), 30.0);
}

TEST(SeekerSensor, LocksAheadButNotBeyondFieldOfView) {
    SeekerSensor ahead;
    EXPECT_TRUE(ahead.update(Pose{}, Vec3{0, 0, 150}, 0.01));

    SeekerSensor abeam;
    EXPECT_FALSE(abeam.update(Pose{}, Vec3{150 * std::sin(95 * DEG_TO_RAD), 0, 150 * std::cos(95 * DEG_TO_RAD)}, 0.01));
    EXPECT_NEAR(abeam.last_off_boresight_deg(), 95.0, 1e-6);
}

TEST(SeekerSensor, TrackRateGateBreaksLock) {
    SeekerSensor seeker;
    ASSERT_TRUE(seeker.update(Pose{}, Vec3{0, 0, 100}, 0.01));
    // ~26.6 degrees in one 10 ms tick
    EXPECT_FALSE(seeker.update(Pose{}, Vec3{50, 0, 100}, 0.01));
}

TEST(SeekerSensor, NullTargetClearsPreviousLineOfSight) {
    SeekerSensor seeker;
    ASSERT_TRUE(seeker.update(Pose{}, Vec3{0, 0, 100}, 0.01));
    EXPECT_FALSE(seeker.update(Pose{}, std::nullopt, 0.01));
    EXPECT_TRUE(seeker.update(Pose{}, Vec3{50, 0, 100}, 0.01));
}

TEST(SeekerSensor, ReacquiresAfterLeavingFieldOfView) {
    SeekerSensor seeker;
    ASSERT_TRUE(seeker.update(Pose{}, Vec3{0, 0, 100}, 0.01));
    EXPECT_FALSE(seeker.update(Pose{}, Vec3{100, 0, 10}, 0.01));

    // Back inside the cone: one tick to re-measure the rate, then locked
    const Vec3 target{100 * std::sin(10 * DEG_TO_RAD), 0, 100 * std::cos(10 * DEG_TO_RAD)};
    EXPECT_FALSE(seeker.update(Pose{}, target, 0.01));
    int locked = 0;
    for (int i = 0; i < 999; i++) {
        if (seeker.update(Pose{}, target, 0.01)) locked++;
    }
    EXPECT_EQ(locked, 999);
    EXPECT_TRUE(seeker.has_lock());
}

TEST(SeekerSensor, OutOfRangeTickForgetsLineOfSight) {
    SeekerSensor seeker;
    ASSERT_TRUE(seeker.update(Pose{}, Vec3{0, 0, 100}, 0.01));
    EXPECT_FALSE(seeker.update(Pose{}, Vec3{0, 0, 500}, 0.01));
    EXPECT_TRUE(seeker.update(Pose{}, Vec3{50, 0, 100}, 0.01));
}

TEST(SeekerSensor, CoincidentTargetHasNoLock) {
    SeekerSensor seeker;
    EXPECT_FALSE(seeker.update(Pose{{1, 2, 3}, Quat::Identity()}, Vec3{1, 2, 3}, 0.01));
}

// ═══════════════════════════════════════════════════════════════
// ProNavGuidance
// ═══════════════════════════════════════════════════════════════

TEST(ProNavGuidance, AlignedTargetNeedsNoCommand) {
    ProNavGuidance pronav;
    EXPECT_FALSE(pronav.update(Pose{}, 100.0, Vec3{0, 0, 100}, true).has_value());
}

TEST(ProNavGuidance, NoTargetOrNoLockIsInert) {
    ProNavGuidance pronav;
    EXPECT_FALSE(pronav.update(Pose{}, 100.0, std::nullopt, true).has_value());
    EXPECT_FALSE(pronav.update(Pose{}, 100.0, Vec3{100, 0, 100}, false).has_value());
}

TEST(ProNavGuidance, TurnRateAlignsInTimeToAlign) {
    ProNavGuidance pronav(ProNavParams{0.5, 0.01});
    auto rate = pronav.update(Pose{}, 100.0, Vec3{100, 0, 100}, true);
    ASSERT_TRUE(rate.has_value());

    // 45 degrees to the right is a yaw about +Y
    EXPECT_NEAR(rate->x, 0.0, 1e-9);
    EXPECT_NEAR(rate->y, (PI / 4.0) / 0.5, 1e-9);
    EXPECT_NEAR(rate->z, 0.0, 1e-9);

    EXPECT_NEAR(pronav.desired_accel_body().x, 100.0 * (PI / 4.0) / 0.5, 1e-6);
}

TEST(ProNavGuidance, CommandIsInBodyAxes) {
    // Body yawed 90 degrees left: world +X is now body -Z
    Quat yaw = quat_from_axis_angle({0, 1, 0}, -PI / 2.0);
    Pose own{{0, 0, 0}, yaw};
    ASSERT_NEAR(quat_rotate(yaw, {0, 0, 1}).x, -1.0, 1e-12);

    ProNavGuidance pronav;
    auto rate = pronav.update(own, 50.0, Vec3{-100, 100, 0}, true);
    ASSERT_TRUE(rate.has_value());

    // Target above the nose: pitch up about body X
    EXPECT_LT(rate->x, 0.0);
    EXPECT_NEAR(rate->y, 0.0, 1e-9);
    EXPECT_NEAR(rate->z, 0.0, 1e-9);
}

TEST(ProNavGuidance, NonPositiveAlignTimeDisablesGuidance) {
    ProNavGuidance pronav(ProNavParams{0.0, 0.01});
    EXPECT_FALSE(pronav.update(Pose{}, 100.0, Vec3{100, 0, 100}, true).has_value());
}

// ═══════════════════════════════════════════════════════════════
// ProximityFuse
// ═══════════════════════════════════════════════════════════════

TEST(ProximityFuse, DetonatesInsideBlastRadiusAndLatches) {
    ProximityFuse fuse(FuseParams{5.0, 0.0});
    EXPECT_FALSE(fuse.check({0, 0, 0}, Vec3{0, 0, 10}, 1.0));
    EXPECT_NEAR(fuse.closest_approach(), 10.0, 1e-12);

    EXPECT_TRUE(fuse.check({0, 0, 0}, Vec3{0, 0, 4}, 1.1));
    EXPECT_TRUE(fuse.detonated());
    EXPECT_TRUE(fuse.check({0, 0, 0}, std::nullopt, 1.2));
}

TEST(ProximityFuse, SafeBeforeArmTime) {
    ProximityFuse fuse(FuseParams{5.0, 1.0});
    EXPECT_FALSE(fuse.check({0, 0, 0}, Vec3{0, 0, 1}, 0.5));
    EXPECT_NEAR(fuse.closest_approach(), 1.0, 1e-12);
    EXPECT_TRUE(fuse.check({0, 0, 0}, Vec3{0, 0, 1}, 1.0));
}

TEST(ProximityFuse, NoTargetNeverFires) {
    ProximityFuse fuse;
    EXPECT_FALSE(fuse.check({0, 0, 0}, std::nullopt, 5.0));
    EXPECT_TRUE(std::isinf(fuse.closest_approach()));
}

TEST(ProximityFuse, ResetDisarms) {
    ProximityFuse fuse;
    fuse.check({0, 0, 0}, Vec3{0, 0, 0}, 1.0);
    ASSERT_TRUE(fuse.detonated());
    fuse.reset();
    EXPECT_FALSE(fuse.detonated());
}

// ═══════════════════════════════════════════════════════════════
// ThreatMotion
// ═══════════════════════════════════════════════════════════════

TEST(ThreatMotion, FliesStraightAtConstantSpeed) {
    SimpleRigidBody body(Pose{}, 200.0);
    ThreatMotion threat(body, ThreatParams{{0, 0, 100}, 50.0});
    EXPECT_TRUE(body.is_kinematic());

    threat.update(1.0);
    EXPECT_NEAR(body.pose().position.z, 50.0, 1e-12);
    EXPECT_NEAR(body.velocity().z, 50.0, 1e-12);
    EXPECT_FALSE(threat.arrived());
}

TEST(ThreatMotion, StopsAtAimPoint) {
    SimpleRigidBody body(Pose{}, 200.0);
    ThreatMotion threat(body, ThreatParams{{30, 0, 40}, 50.0});

    threat.update(2.0);
    EXPECT_TRUE(threat.arrived());
    EXPECT_DOUBLE_EQ(body.pose().position.x, 30.0);
    EXPECT_DOUBLE_EQ(body.pose().position.z, 40.0);
    EXPECT_EQ(body.velocity().norm(), 0.0);

    threat.update(1.0);
    EXPECT_DOUBLE_EQ(body.pose().position.z, 40.0);
}

TEST(ThreatMotion, FacesDirectionOfTravel) {
    SimpleRigidBody body(Pose{}, 200.0);
    ThreatMotion threat(body, ThreatParams{{100, 0, 0}, 10.0});
    threat.update(0.1);

    Vec3 fwd = quat_rotate(body.pose().orientation, {0, 0, 1});
    EXPECT_NEAR(fwd.x, 1.0, 1e-9);
}
