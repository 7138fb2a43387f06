/**
 * @file PoseDecomposer.hpp
 * @brief Position + 3-angle orientation decomposition of a homogeneous pose
 *
 * Orientation convention: R = Rx(a1) * Ry(a2) * Rz(a3), so that
 *   W(0,2) =  sin(a2)
 *   W(0,0) =  cos(a2) cos(a3),   W(0,1) = -cos(a2) sin(a3)
 *   W(1,2) = -sin(a1) cos(a2),   W(2,2) =  cos(a1) cos(a2)
 *
 * Each rotation has two angle triples, one per sign branch m2 = -1 / +1.
 */

#pragma once

#include "MathTypes.hpp"
#include <optional>

namespace arm_kinematics {
namespace kinematics {

/**
 * Pose vector (x, y, z, a1, a2, a3)
 */
using Pose = Vector6d;

/**
 * Up to two pose solutions for one transform, in branch order (m2 = -1, +1).
 */
class PoseCandidates {
public:
    static constexpr int MAX_CANDIDATES = 2;

    size_t count() const { return count_; }
    bool empty() const { return count_ == 0; }

    /**
     * True when |W(0,2)| was below tolerance and the branches yielded nothing
     */
    bool degenerate() const { return degenerate_; }

    /**
     * @throws std::out_of_range if index >= count()
     */
    const Pose& at(size_t index) const;

    /**
     * Sign m2 that produced candidate index
     * @throws std::out_of_range if index >= count()
     */
    int branch(size_t index) const;

    /**
     * Candidate of the first branch (m2 = -1), the conventional choice
     * @throws std::out_of_range if there is no candidate
     */
    const Pose& first() const { return at(0); }

    /**
     * Candidate whose angles are closest (wrapped difference) to reference
     */
    std::optional<Pose> closestTo(const Pose& reference) const;

private:
    friend class PoseDecomposer;

    void add(const Pose& pose, int branch);

    std::array<Pose, MAX_CANDIDATES> poses_;
    std::array<int, MAX_CANDIDATES> branches_{};
    size_t count_ = 0;
    bool degenerate_ = false;
};

/**
 * Stateless decomposition of end-effector transforms
 */
class PoseDecomposer {
public:
    /**
     * Decompose T into position + angle triples for both sign branches
     * @param T Homogeneous transform
     * @param epsilon Tolerance for the degenerate and cos(a3) = 0 tests
     */
    static PoseCandidates decompose(const Matrix4d& T, double epsilon = EPSILON);

    /**
     * Same as decompose() for a dynamically sized matrix
     * @throws std::invalid_argument if T is not 4x4
     */
    static PoseCandidates decompose(const Eigen::MatrixXd& T, double epsilon = EPSILON);

    /**
     * Rotation block for an angle triple, Rx(a1) * Ry(a2) * Rz(a3)
     */
    static Matrix3d orientationMatrix(double a1, double a2, double a3);

    /**
     * Homogeneous transform rebuilt from a pose vector
     */
    static Matrix4d toTransform(const Pose& pose);

private:
    static std::optional<Vector3d> solveBranch(const Matrix3d& W, double m2, double epsilon);
};

} // namespace kinematics
} // namespace arm_kinematics
