/**
 * @file test_jacobian.cpp
 * @brief Unit tests for the geometric Jacobian and singularity predicate
 */

#include <gtest/gtest.h>
#include "kinematics/ForwardKinematics.hpp"
#include "kinematics/JacobianComputer.hpp"
#include <random>

using namespace arm_kinematics::kinematics;

namespace {

ForwardKinematics unitArm() {
    return ForwardKinematics(DHTable({1, 1, 1, 1, 1, 1}));
}

Jacobian jacobianAt(const ForwardKinematics& fk, const JointAngles& q) {
    return JacobianComputer::compute(fk.computeFrames(q));
}

} // namespace

TEST(JacobianTest, ZeroConfigurationColumns) {
    auto fk = unitArm();
    Jacobian J = jacobianAt(fk, {0, 0, 0, 0, 0, 0});

    // Joint 1 axis is base z, end-effector at (4, 0, 2)
    Vector6d col0;
    col0 << 0, 4, 0, 0, 0, 1;
    EXPECT_NEAR((J.col(0) - col0).norm(), 0.0, 1e-12);

    // Angular rows are the joint axes
    FrameList frames = fk.computeFrames({0, 0, 0, 0, 0, 0});
    for (int i = 0; i < NUM_JOINTS; ++i) {
        Vector3d z = frames[i].block<3, 1>(0, 2);
        EXPECT_NEAR((J.block<3, 1>(3, i) - z).norm(), 0.0, 1e-12) << "joint " << i;
    }

    EXPECT_NEAR(J.determinant(), 2.0, 1e-9);
}

TEST(JacobianTest, LinearRowsMatchFiniteDifference) {
    auto fk = unitArm();
    std::mt19937 rng(3);
    std::uniform_real_distribution<double> dist(-PI, PI);
    std::uniform_real_distribution<double> dir(-1.0, 1.0);

    const double h = 1e-6;
    for (int trial = 0; trial < 20; ++trial) {
        JointAngles q;
        JointAngles qPerturbed;
        Vector6d dq;
        for (int i = 0; i < NUM_JOINTS; ++i) {
            q[i] = dist(rng);
            dq(i) = dir(rng) * h;
            qPerturbed[i] = q[i] + dq(i);
        }

        Vector3d p0 = fk.computeEndEffector(q).block<3, 1>(0, 3);
        Vector3d p1 = fk.computeEndEffector(qPerturbed).block<3, 1>(0, 3);
        Vector3d predicted = jacobianAt(fk, q).topRows<3>() * dq;

        // Second-order remainder: |dq|^2 times link scale
        EXPECT_NEAR((p1 - p0 - predicted).norm(), 0.0, 1e-10);
    }
}

TEST(JacobianTest, AngularRowsMatchFiniteDifference) {
    auto fk = unitArm();
    JointAngles q = {0.3, -0.7, 1.1, 0.4, -0.9, 2.0};
    Jacobian J = jacobianAt(fk, q);

    const double h = 1e-7;
    for (int i = 0; i < NUM_JOINTS; ++i) {
        JointAngles qp = q;
        qp[i] += h;

        Matrix3d R0 = fk.computeEndEffector(q).block<3, 3>(0, 0);
        Matrix3d R1 = fk.computeEndEffector(qp).block<3, 3>(0, 0);
        Matrix3d S = (R1 * R0.transpose() - Matrix3d::Identity()) / h;

        // Skew part of dR R^T is [w]x
        Vector3d w(S(2, 1), S(0, 2), S(1, 0));
        EXPECT_NEAR((w - J.block<3, 1>(3, i)).norm(), 0.0, 1e-5) << "joint " << i;
    }
}

TEST(JacobianTest, WristAlignmentIsSingular) {
    auto fk = unitArm();

    // q5 = +-pi/2 aligns the joint 4 and joint 6 axes
    EXPECT_TRUE(JacobianComputer::isSingular(jacobianAt(fk, {0.3, 0.2, 0.0, 0.4, PI / 2.0, 0.6})));
    EXPECT_TRUE(JacobianComputer::isSingular(jacobianAt(fk, {0.3, 0.2, 1.0, 0.4, -PI / 2.0, 0.6})));
}

TEST(JacobianTest, GenericConfigurationIsRegular) {
    auto fk = unitArm();

    Jacobian J = jacobianAt(fk, {0.1, 0.2, 0.3, 0.4, 0.5, 0.6});
    EXPECT_FALSE(JacobianComputer::isSingular(J));
    EXPECT_NEAR(std::abs(J.determinant()), 1.5129174262556682, 1e-9);

    std::mt19937 rng(11);
    std::uniform_real_distribution<double> dist(-PI, PI);
    for (int trial = 0; trial < 20; ++trial) {
        JointAngles q;
        for (auto& v : q) v = dist(rng);
        EXPECT_FALSE(JacobianComputer::isSingular(jacobianAt(fk, q)));
    }
}

TEST(JacobianTest, SingularityEpsilonIsConfigurable) {
    auto fk = unitArm();
    Jacobian J = jacobianAt(fk, {0, 0, 0, 0, 0, 0});

    EXPECT_FALSE(JacobianComputer::isSingular(J));
    EXPECT_TRUE(JacobianComputer::isSingular(J, 10.0));
}

TEST(JacobianTest, CartesianVelocity) {
    auto fk = unitArm();
    Jacobian J = jacobianAt(fk, {0, 0, 0, 0, 0, 0});

    // Only joint 1 moving: end-effector sweeps about base z
    Vector6d v = JacobianComputer::cartesianVelocity(J, {1.0, 0, 0, 0, 0, 0});
    Vector6d expected;
    expected << 0, 4, 0, 0, 0, 1;
    EXPECT_NEAR((v - expected).norm(), 0.0, 1e-12);

    JointVelocities qdot = {0.1, -0.2, 0.3, -0.4, 0.5, -0.6};
    EXPECT_NEAR((JacobianComputer::cartesianVelocity(J, qdot) - J * toVector(qdot)).norm(), 0.0, 1e-15);
}

TEST(JacobianTest, Manipulability) {
    auto fk = unitArm();

    // Square Jacobian: sqrt(det(J J^T)) = |det J|
    EXPECT_NEAR(JacobianComputer::manipulability(jacobianAt(fk, {0, 0, 0, 0, 0, 0})), 2.0, 1e-9);
    EXPECT_NEAR(JacobianComputer::manipulability(jacobianAt(fk, {0.3, 0.2, 0.0, 0.4, PI / 2.0, 0.6})),
                0.0, 1e-6);
}
