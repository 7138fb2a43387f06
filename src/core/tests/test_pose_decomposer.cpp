/**
 * @file test_pose_decomposer.cpp
 * @brief Unit tests for position + angle-triple decomposition
 */

#include <gtest/gtest.h>
#include "kinematics/ForwardKinematics.hpp"
#include "kinematics/PoseDecomposer.hpp"
#include <cmath>
#include <random>

using namespace arm_kinematics::kinematics;

namespace {

double rotationResidual(const Pose& pose, const Matrix4d& T) {
    Matrix3d R = PoseDecomposer::orientationMatrix(pose(3), pose(4), pose(5));
    return (R - T.block<3, 3>(0, 0)).cwiseAbs().maxCoeff();
}

Matrix4d transformFrom(const Matrix3d& R, const Vector3d& p) {
    Matrix4d T = Matrix4d::Identity();
    T.block<3, 3>(0, 0) = R;
    T.block<3, 1>(0, 3) = p;
    return T;
}

} // namespace

// ============================================================================
// Degenerate branch
// ============================================================================

TEST(PoseDecomposerTest, IdentityIsDegenerate) {
    // W(0,2) = 0: no triple under this convention
    const Matrix4d T = Matrix4d::Identity();
    PoseCandidates candidates = PoseDecomposer::decompose(T);

    EXPECT_TRUE(candidates.degenerate());
    EXPECT_TRUE(candidates.empty());
    EXPECT_EQ(candidates.count(), 0u);
    EXPECT_THROW(candidates.first(), std::out_of_range);
    EXPECT_FALSE(candidates.closestTo(Pose::Zero()).has_value());
}

TEST(PoseDecomposerTest, ZeroPitchIsDegenerate) {
    // Any Rx(a1) * Rz(a3) has sin(a2) = 0
    Matrix4d T = transformFrom(rotationX(0.4) * rotationZ(-1.2), Vector3d(1, 2, 3));
    EXPECT_TRUE(PoseDecomposer::decompose(T).empty());
    EXPECT_TRUE(PoseDecomposer::decompose(T).degenerate());
}

TEST(PoseDecomposerTest, PitchBelowEpsilonIsDegenerate) {
    // W(0,2) = sin(1e-12), inside the 1e-9 band
    Matrix4d T = transformFrom(rotationY(1e-12), Vector3d::Zero());
    ASSERT_LT(std::abs(T(0, 2)), EPSILON);

    PoseCandidates candidates = PoseDecomposer::decompose(T);
    EXPECT_TRUE(candidates.degenerate());
    EXPECT_TRUE(candidates.empty());
}

TEST(PoseDecomposerTest, PitchAboveEpsilonHasTwoCandidates) {
    // W(0,2) = sin(1e-8), just outside the 1e-9 band
    Matrix4d T = transformFrom(rotationY(1e-8), Vector3d::Zero());
    ASSERT_GT(std::abs(T(0, 2)), EPSILON);

    PoseCandidates candidates = PoseDecomposer::decompose(T);
    EXPECT_FALSE(candidates.degenerate());
    ASSERT_EQ(candidates.count(), 2u);
    for (size_t i = 0; i < candidates.count(); ++i) {
        EXPECT_LT(rotationResidual(candidates.at(i), T), 1e-6);
    }

    // A wider band swallows the same pose
    EXPECT_TRUE(PoseDecomposer::decompose(T, 1e-7).empty());
}

// ============================================================================
// Regular branches
// ============================================================================

TEST(PoseDecomposerTest, GenericRotationHasTwoCandidates) {
    const Vector3d p(0.5, -1.5, 2.5);
    Matrix4d T = transformFrom(PoseDecomposer::orientationMatrix(0.3, 0.4, 0.5), p);

    PoseCandidates candidates = PoseDecomposer::decompose(T);
    ASSERT_EQ(candidates.count(), 2u);
    EXPECT_FALSE(candidates.degenerate());
    EXPECT_EQ(candidates.branch(0), -1);
    EXPECT_EQ(candidates.branch(1), 1);

    for (size_t i = 0; i < candidates.count(); ++i) {
        const Pose& pose = candidates.at(i);
        EXPECT_NEAR((pose.head<3>() - p).norm(), 0.0, 1e-15);
        EXPECT_LT(rotationResidual(pose, T), 1e-12);
    }

    // Positive branch recovers the generating angles
    EXPECT_NEAR(candidates.at(1)(3), 0.3, 1e-12);
    EXPECT_NEAR(candidates.at(1)(4), 0.4, 1e-12);
    EXPECT_NEAR(candidates.at(1)(5), 0.5, 1e-12);

    // Negative branch is the mirrored triple
    EXPECT_NEAR(normalizeAngle(candidates.first()(3) - (0.3 + PI)), 0.0, 1e-12);
    EXPECT_NEAR(candidates.first()(4), PI - 0.4, 1e-12);
    EXPECT_NEAR(normalizeAngle(candidates.first()(5) - (0.5 - PI)), 0.0, 1e-12);
}

TEST(PoseDecomposerTest, QuarterTurnA3UsesAlternateFormula) {
    // cos(a3) = 0 path
    Matrix4d T = transformFrom(PoseDecomposer::orientationMatrix(0.3, 0.4, PI / 2.0), Vector3d::Zero());

    PoseCandidates candidates = PoseDecomposer::decompose(T);
    ASSERT_EQ(candidates.count(), 2u);
    for (size_t i = 0; i < candidates.count(); ++i) {
        EXPECT_NEAR(std::abs(std::cos(candidates.at(i)(5))), 0.0, 1e-9);
        EXPECT_LT(rotationResidual(candidates.at(i), T), 1e-12);
    }
}

TEST(PoseDecomposerTest, RoundTripThroughForwardKinematics) {
    ForwardKinematics fk(DHTable({1, 1, 1, 1, 1, 1}));
    std::mt19937 rng(2024);
    std::uniform_real_distribution<double> dist(-PI, PI);

    for (int trial = 0; trial < 100; ++trial) {
        JointAngles q;
        for (auto& v : q) v = dist(rng);

        Matrix4d T = fk.computeEndEffector(q);
        PoseCandidates candidates = PoseDecomposer::decompose(T);

        ASSERT_EQ(candidates.count(), 2u) << "trial " << trial;
        for (size_t i = 0; i < candidates.count(); ++i) {
            EXPECT_LT(rotationResidual(candidates.at(i), T), 1e-6) << "trial " << trial;
            EXPECT_TRUE(PoseDecomposer::toTransform(candidates.at(i)).isApprox(T, 1e-6));
        }
    }
}

TEST(PoseDecomposerTest, ZeroConfigurationPose) {
    ForwardKinematics fk(DHTable({1, 1, 1, 1, 1, 1}));
    PoseCandidates candidates = PoseDecomposer::decompose(fk.computeEndEffector({0, 0, 0, 0, 0, 0}));

    ASSERT_FALSE(candidates.empty());
    EXPECT_NEAR(candidates.first()(0), 4.0, 1e-12);
    EXPECT_NEAR(candidates.first()(1), 0.0, 1e-12);
    EXPECT_NEAR(candidates.first()(2), 2.0, 1e-12);
    EXPECT_NEAR(candidates.first()(4), PI / 2.0, 1e-12);
}

// ============================================================================
// Candidate selection & input validation
// ============================================================================

TEST(PoseDecomposerTest, ClosestToSelectsBranch) {
    Matrix4d T = transformFrom(PoseDecomposer::orientationMatrix(0.3, 0.4, 0.5), Vector3d::Zero());
    PoseCandidates candidates = PoseDecomposer::decompose(T);

    Pose near;
    near << 0, 0, 0, 0.25, 0.45, 0.55;
    auto best = candidates.closestTo(near);
    ASSERT_TRUE(best.has_value());
    EXPECT_NEAR(((*best) - candidates.at(1)).norm(), 0.0, 1e-15);

    Pose mirrored = candidates.first();
    best = candidates.closestTo(mirrored);
    ASSERT_TRUE(best.has_value());
    EXPECT_NEAR(((*best) - candidates.first()).norm(), 0.0, 1e-15);
}

TEST(PoseDecomposerTest, OutOfRangeCandidate) {
    Matrix4d T = transformFrom(PoseDecomposer::orientationMatrix(0.3, 0.4, 0.5), Vector3d::Zero());
    PoseCandidates candidates = PoseDecomposer::decompose(T);

    EXPECT_THROW(candidates.at(2), std::out_of_range);
    EXPECT_THROW(candidates.branch(2), std::out_of_range);
}

TEST(PoseDecomposerTest, DynamicInputShapeIsValidated) {
    Eigen::MatrixXd ok = transformFrom(PoseDecomposer::orientationMatrix(0.3, 0.4, 0.5), Vector3d::Zero());
    EXPECT_EQ(PoseDecomposer::decompose(ok).count(), 2u);

    const Eigen::MatrixXd rotationOnly = Eigen::MatrixXd::Identity(3, 3);
    const Eigen::MatrixXd wide = Eigen::MatrixXd::Identity(4, 5);
    EXPECT_THROW(PoseDecomposer::decompose(rotationOnly), std::invalid_argument);
    EXPECT_THROW(PoseDecomposer::decompose(wide), std::invalid_argument);
}
