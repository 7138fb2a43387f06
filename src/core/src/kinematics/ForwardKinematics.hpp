/**
 * @file ForwardKinematics.hpp
 * @brief Forward kinematics for the 6-DOF arm
 */

#pragma once

#include "DHParameters.hpp"
#include <vector>

namespace arm_kinematics {
namespace kinematics {

/**
 * Base frame followed by the 6 link frames, all in base coordinates.
 * frames[i] = T_1 * ... * T_i, frames[0] = identity, frames[6] = end-effector.
 */
using FrameList = std::array<Matrix4d, NUM_JOINTS + 1>;

// ============================================================================
// Forward Kinematics Class
// ============================================================================

/**
 * Chains the DH table transforms. Stateless apart from the immutable table.
 */
class ForwardKinematics {
public:
    explicit ForwardKinematics(const DHTable& table);
    ~ForwardKinematics() = default;

    /**
     * Compute all frames for a joint configuration
     * @param jointAngles Joint angles in radians
     * @return [base, T_0^1, ..., T_0^6]
     */
    FrameList computeFrames(const JointAngles& jointAngles) const;

    /**
     * Compute only the end-effector transform
     */
    Matrix4d computeEndEffector(const JointAngles& jointAngles) const;

    /**
     * Origin of every frame in the base frame (base + 6 joints)
     */
    std::vector<Vector3d> computeJointPositions(const JointAngles& jointAngles) const;

    const DHTable& table() const { return table_; }

private:
    DHTable table_;
};

// ============================================================================
// Implementation
// ============================================================================

inline ForwardKinematics::ForwardKinematics(const DHTable& table)
    : table_(table) {}

inline FrameList ForwardKinematics::computeFrames(const JointAngles& jointAngles) const {
    FrameList frames;
    frames[0] = Matrix4d::Identity();

    for (int i = 0; i < NUM_JOINTS; ++i) {
        frames[i + 1] = frames[i] * table_.transform(i, jointAngles[i]);
    }

    return frames;
}

inline Matrix4d ForwardKinematics::computeEndEffector(const JointAngles& jointAngles) const {
    Matrix4d T = Matrix4d::Identity();

    for (int i = 0; i < NUM_JOINTS; ++i) {
        T = T * table_.transform(i, jointAngles[i]);
    }

    return T;
}

inline std::vector<Vector3d> ForwardKinematics::computeJointPositions(const JointAngles& jointAngles) const {
    const auto frames = computeFrames(jointAngles);

    std::vector<Vector3d> positions;
    positions.reserve(frames.size());

    for (const auto& T : frames) {
        positions.push_back(T.block<3, 1>(0, 3));
    }

    return positions;
}

} // namespace kinematics
} // namespace arm_kinematics
