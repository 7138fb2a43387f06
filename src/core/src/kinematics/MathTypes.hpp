/**
 * @file MathTypes.hpp
 * @brief Math types and utilities for arm kinematics
 */

#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace arm_kinematics {
namespace kinematics {

// ============================================================================
// Type Definitions
// ============================================================================

// Basic types
using Vector3d = Eigen::Vector3d;
using Vector6d = Eigen::Matrix<double, 6, 1>;
using Matrix3d = Eigen::Matrix3d;
using Matrix4d = Eigen::Matrix4d;
using Matrix6d = Eigen::Matrix<double, 6, 6>;

// Joint space
constexpr int NUM_JOINTS = 6;
using JointAngles = std::array<double, NUM_JOINTS>;
using JointVelocities = std::array<double, NUM_JOINTS>;

// Jacobian matrix (6x6 for 6-DOF arm)
using Jacobian = Eigen::Matrix<double, 6, NUM_JOINTS>;

// ============================================================================
// Constants
// ============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double EPSILON = 1e-9;

// ============================================================================
// Utility Functions
// ============================================================================

inline bool isNearZero(double value, double tolerance = EPSILON) {
    return std::abs(value) < tolerance;
}

inline double normalizeAngle(double angle) {
    while (angle > PI) angle -= 2.0 * PI;
    while (angle < -PI) angle += 2.0 * PI;
    return angle;
}

inline Vector6d toVector(const JointAngles& q) {
    Vector6d v;
    for (int i = 0; i < NUM_JOINTS; ++i) {
        v(i) = q[i];
    }
    return v;
}

inline JointAngles toJointAngles(const Vector6d& v) {
    JointAngles q;
    for (int i = 0; i < NUM_JOINTS; ++i) {
        q[i] = v(i);
    }
    return q;
}

/**
 * Validate a dynamically sized joint vector (config files, callers outside
 * the fixed-size API) and convert it.
 * @throws std::invalid_argument if the length is not NUM_JOINTS
 */
inline JointAngles toJointAngles(const std::vector<double>& values) {
    if (values.size() != static_cast<size_t>(NUM_JOINTS)) {
        throw std::invalid_argument("Joint vector must have " + std::to_string(NUM_JOINTS) +
                                    " elements, got " + std::to_string(values.size()));
    }
    JointAngles q;
    for (int i = 0; i < NUM_JOINTS; ++i) {
        q[i] = values[i];
    }
    return q;
}

/**
 * Validate a dynamically sized matrix as a homogeneous transform.
 * @throws std::invalid_argument if the shape is not 4x4
 */
inline Matrix4d toHomogeneous(const Eigen::MatrixXd& M) {
    if (M.rows() != 4 || M.cols() != 4) {
        throw std::invalid_argument("Homogeneous transform must be 4x4, got " +
                                    std::to_string(M.rows()) + "x" + std::to_string(M.cols()));
    }
    return Matrix4d(M);
}

// Elementary rotations
inline Matrix3d rotationX(double angle) {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    Matrix3d R;
    R << 1, 0, 0,
         0, c, -s,
         0, s, c;
    return R;
}

inline Matrix3d rotationY(double angle) {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    Matrix3d R;
    R << c, 0, s,
         0, 1, 0,
         -s, 0, c;
    return R;
}

inline Matrix3d rotationZ(double angle) {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    Matrix3d R;
    R << c, -s, 0,
         s, c, 0,
         0, 0, 1;
    return R;
}

} // namespace kinematics
} // namespace arm_kinematics
