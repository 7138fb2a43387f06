/**
 * @file PoseDecomposer.cpp
 * @brief Pose decomposition implementation
 */

#include "PoseDecomposer.hpp"
#include <cmath>
#include <initializer_list>
#include <limits>

namespace arm_kinematics {
namespace kinematics {

// ============================================================================
// PoseCandidates
// ============================================================================

const Pose& PoseCandidates::at(size_t index) const {
    if (index >= count_) {
        throw std::out_of_range("Pose candidate " + std::to_string(index) +
                                " requested, " + std::to_string(count_) + " available");
    }
    return poses_[index];
}

int PoseCandidates::branch(size_t index) const {
    if (index >= count_) {
        throw std::out_of_range("Pose candidate " + std::to_string(index) +
                                " requested, " + std::to_string(count_) + " available");
    }
    return branches_[index];
}

std::optional<Pose> PoseCandidates::closestTo(const Pose& reference) const {
    std::optional<Pose> best;
    double minDistance = std::numeric_limits<double>::max();

    for (size_t i = 0; i < count_; ++i) {
        double distance = 0.0;
        for (int k = 3; k < 6; ++k) {
            const double diff = normalizeAngle(poses_[i](k) - reference(k));
            distance += diff * diff;
        }
        if (distance < minDistance) {
            minDistance = distance;
            best = poses_[i];
        }
    }

    return best;
}

void PoseCandidates::add(const Pose& pose, int branch) {
    poses_[count_] = pose;
    branches_[count_] = branch;
    ++count_;
}

// ============================================================================
// PoseDecomposer
// ============================================================================

PoseCandidates PoseDecomposer::decompose(const Matrix4d& T, double epsilon) {
    PoseCandidates result;
    const Matrix3d W = T.block<3, 3>(0, 0);
    const Vector3d position = T.block<3, 1>(0, 3);

    for (double m2 : {-1.0, 1.0}) {
        auto angles = solveBranch(W, m2, epsilon);
        if (!angles) {
            result.degenerate_ = true;
            continue;
        }

        Pose pose;
        pose << position, *angles;
        result.add(pose, static_cast<int>(m2));
    }

    return result;
}

PoseCandidates PoseDecomposer::decompose(const Eigen::MatrixXd& T, double epsilon) {
    return decompose(toHomogeneous(T), epsilon);
}

std::optional<Vector3d> PoseDecomposer::solveBranch(const Matrix3d& W, double m2, double epsilon) {
    // sin(a2) == 0 has no triple under this convention
    // TODO: gimbal configurations still have underdetermined solutions; decide whether to return one
    if (isNearZero(std::abs(W(0, 2)), epsilon)) {
        return std::nullopt;
    }

    const double a3 = std::atan2(-W(0, 1) * m2, W(0, 0) * m2);
    const double c3 = std::cos(a3);

    double a2;
    if (!isNearZero(c3, epsilon)) {
        a2 = std::atan2(W(0, 2), W(0, 0) / c3);
    } else {
        const double s3 = std::sin(a3);
        a2 = std::atan2(W(0, 2), W(0, 1) / -s3);
    }

    const double c2 = std::cos(a2);
    const double a1 = std::atan2(-W(1, 2) / c2, W(2, 2) / c2);

    return Vector3d(a1, a2, a3);
}

Matrix3d PoseDecomposer::orientationMatrix(double a1, double a2, double a3) {
    return rotationX(a1) * rotationY(a2) * rotationZ(a3);
}

Matrix4d PoseDecomposer::toTransform(const Pose& pose) {
    Matrix4d T = Matrix4d::Identity();
    T.block<3, 3>(0, 0) = orientationMatrix(pose(3), pose(4), pose(5));
    T.block<3, 1>(0, 3) = pose.head<3>();
    return T;
}

} // namespace kinematics
} // namespace arm_kinematics
