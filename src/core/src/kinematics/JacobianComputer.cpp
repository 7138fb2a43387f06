/**
 * @file JacobianComputer.cpp
 * @brief Geometric Jacobian implementation
 */

#include "JacobianComputer.hpp"
#include <cmath>

namespace arm_kinematics {
namespace kinematics {

Jacobian JacobianComputer::compute(const FrameList& frames) {
    Jacobian J = Jacobian::Zero();

    // End-effector origin
    const Vector3d o_ee = frames.back().block<3, 1>(0, 3);

    for (int i = 0; i < NUM_JOINTS; ++i) {
        const Vector3d z_i = frames[i].block<3, 1>(0, 2);  // joint axis
        const Vector3d o_i = frames[i].block<3, 1>(0, 3);  // joint origin

        J.block<3, 1>(0, i) = z_i.cross(o_ee - o_i);
        J.block<3, 1>(3, i) = z_i;
    }

    return J;
}

bool JacobianComputer::isSingular(const Jacobian& J, double epsilon) {
    return std::abs(J.determinant()) < epsilon;
}

Vector6d JacobianComputer::cartesianVelocity(const Jacobian& J, const JointVelocities& qdot) {
    return J * toVector(qdot);
}

double JacobianComputer::manipulability(const Jacobian& J) {
    const Matrix6d JJT = J * J.transpose();
    return std::sqrt(std::abs(JJT.determinant()));
}

} // namespace kinematics
} // namespace arm_kinematics
