#include "coordinate/enu_frame.hpp"
#include "physics/vec3_ops.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace pursuit;

namespace {

void expect_vec_near(const Vec3& a, const Vec3& b, double tol = 1e-9) {
    EXPECT_NEAR(a.x, b.x, tol);
    EXPECT_NEAR(a.y, b.y, tol);
    EXPECT_NEAR(a.z, b.z, tol);
}

void expect_identity(const Quat& q, double tol = 1e-9) {
    EXPECT_NEAR(std::abs(q.w), 1.0, tol);
    EXPECT_NEAR(q.x, 0.0, tol);
    EXPECT_NEAR(q.y, 0.0, tol);
    EXPECT_NEAR(q.z, 0.0, tol);
}

}  // namespace

TEST(EnuFrame, AxisSwapIsExactInverse) {
    const Vec3 samples[] = {
        {1.0, 2.0, 3.0}, {-0.125, 1e6, -7.5}, {0.0, -0.0, 42.0}, {1e-300, 3.3, -1e300}
    };
    for (const Vec3& v : samples) {
        Vec3 back = EnuFrame::to_internal(EnuFrame::to_external(v));
        EXPECT_EQ(back.x, v.x);
        EXPECT_EQ(back.y, v.y);
        EXPECT_EQ(back.z, v.z);

        Vec3 fwd = EnuFrame::to_external(EnuFrame::to_internal(v));
        EXPECT_EQ(fwd.x, v.x);
        EXPECT_EQ(fwd.y, v.y);
        EXPECT_EQ(fwd.z, v.z);
    }
}

TEST(EnuFrame, UpMapsToInternalY) {
    Vec3 up = EnuFrame::to_internal(Vec3{0, 0, 1});
    EXPECT_EQ(up.y, 1.0);
    Vec3 north = EnuFrame::to_internal(Vec3{0, 1, 0});
    EXPECT_EQ(north.z, 1.0);
}

TEST(EnuFrame, BasisOfWorldAxesIsIdentity) {
    Quat q = EnuFrame::quaternion_from_basis({1, 0, 0}, {0, 1, 0}, {0, 0, 1});
    expect_identity(q);
}

TEST(EnuFrame, BasisReproducesRotationOnEveryBranch) {
    // Angles near pi force the non-trace branches
    const std::pair<Vec3, double> rotations[] = {
        {{0, 1, 0}, 0.3},
        {{1, 0, 0}, PI},
        {{0, 1, 0}, PI},
        {{0, 0, 1}, PI},
        {{1, 1, 0}, 2.9},
        {{0.2, -0.7, 0.4}, 1.7},
    };
    for (const auto& [axis, angle] : rotations) {
        Quat ref = quat_from_axis_angle(axis, angle);
        Quat q = EnuFrame::quaternion_from_basis(quat_rotate(ref, {1, 0, 0}),
                                                 quat_rotate(ref, {0, 1, 0}),
                                                 quat_rotate(ref, {0, 0, 1}));
        EXPECT_NEAR(quat_norm(q), 1.0, 1e-12);

        const Vec3 v{0.3, -1.2, 2.5};
        expect_vec_near(quat_rotate(q, v), quat_rotate(ref, v), 1e-9);
    }
}

TEST(EnuFrame, BasisNormalizesScaledAxes) {
    Quat q = EnuFrame::quaternion_from_basis({3, 0, 0}, {0, 0.5, 0}, {0, 0, 10});
    expect_identity(q);
}

TEST(EnuFrame, BasisFromZeroAxesFallsBackToIdentity) {
    Quat q = EnuFrame::quaternion_from_basis({0, 0, 0}, {0, 0, 0}, {0, 0, 0});
    EXPECT_TRUE(is_finite(q));
    EXPECT_NEAR(quat_norm(q), 1.0, 1e-12);
}

TEST(EnuFrame, IdentityWorldToBodyIsNoRotation) {
    Quat q = EnuFrame::world_to_body_to_internal_rotation(1, 0, 0, 0);
    expect_identity(q);
}

TEST(EnuFrame, DegenerateRecordedAttitudeIsIdentity) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    expect_identity(EnuFrame::world_to_body_to_internal_rotation(nan, 0, 0, 0));
    expect_identity(EnuFrame::world_to_body_to_internal_rotation(0, 0, 0, 0));
}

TEST(EnuFrame, IdentityInternalRotationIsIdentityInEnu) {
    auto q = EnuFrame::internal_rotation_to_enu_wxyz(Quat::Identity());
    EXPECT_NEAR(std::abs(q[0]), 1.0, 1e-12);
    EXPECT_NEAR(q[1], 0.0, 1e-12);
    EXPECT_NEAR(q[2], 0.0, 1e-12);
    EXPECT_NEAR(q[3], 0.0, 1e-12);
}

TEST(EnuFrame, LookRotationAlongForwardIsIdentity) {
    expect_identity(EnuFrame::look_rotation({0, 0, 5}));
}

TEST(EnuFrame, LookRotationPointsForwardAxis) {
    Quat q = EnuFrame::look_rotation({1, 0, 0});
    expect_vec_near(quat_rotate(q, {0, 0, 1}), {1, 0, 0});
    expect_vec_near(quat_rotate(q, {0, 1, 0}), {0, 1, 0});
}

TEST(EnuFrame, LookRotationStraightUpStaysFinite) {
    Quat q = EnuFrame::look_rotation({0, 3, 0});
    EXPECT_NEAR(quat_norm(q), 1.0, 1e-12);
    expect_vec_near(quat_rotate(q, {0, 0, 1}), {0, 1, 0});
}

TEST(EnuFrame, LookRotationOfZeroVectorIsIdentity) {
    expect_identity(EnuFrame::look_rotation({0, 0, 0}));
}

TEST(EnuFrame, SanitizeQuaternion) {
    double inf = std::numeric_limits<double>::infinity();
    expect_identity(EnuFrame::sanitize(Quat{inf, 0, 0, 0}));
    expect_identity(EnuFrame::sanitize(Quat{1e-12, 0, 0, 0}));

    Quat q = EnuFrame::sanitize(Quat{0, 0, 2, 0});
    EXPECT_DOUBLE_EQ(q.y, 1.0);

    EXPECT_TRUE(EnuFrame::is_degenerate(Quat{0, 0, 0, 0}));
    EXPECT_FALSE(EnuFrame::is_degenerate(Quat{0.5, 0.5, 0.5, 0.5}));
}

TEST(EnuFrame, SanitizeVectorZeroesNonFinite) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    Vec3 v = EnuFrame::sanitize(Vec3{nan, 2.0, -std::numeric_limits<double>::infinity()});
    EXPECT_EQ(v.x, 0.0);
    EXPECT_EQ(v.y, 2.0);
    EXPECT_EQ(v.z, 0.0);
}
