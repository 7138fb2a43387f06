/**
 * @file JacobianComputer.hpp
 * @brief Geometric Jacobian and singularity inspection for the 6-DOF arm
 *
 * Row layout: [v; w] (rows 0-2 linear velocity, rows 3-5 angular velocity).
 * Column i is joint i's contribution.
 */

#pragma once

#include "ForwardKinematics.hpp"

namespace arm_kinematics {
namespace kinematics {

/**
 * All methods are static - no internal state.
 */
class JacobianComputer {
public:
    /**
     * Build the geometric Jacobian from the frame list.
     *
     * For revolute joint i with axis z_i and origin o_i (frame i):
     *   J_i = [z_i x (o_ee - o_i); z_i]
     *
     * @param frames Base frame + 6 link frames from ForwardKinematics
     * @return 6x6 Jacobian
     */
    static Jacobian compute(const FrameList& frames);

    /**
     * True iff |det(J)| < epsilon. A singular configuration is reported,
     * not corrected.
     */
    static bool isSingular(const Jacobian& J, double epsilon = EPSILON);

    /**
     * End-effector twist [v; w] produced by joint velocities qdot
     */
    static Vector6d cartesianVelocity(const Jacobian& J, const JointVelocities& qdot);

    /**
     * Yoshikawa manipulability: sqrt(|det(J * J^T)|)
     */
    static double manipulability(const Jacobian& J);
};

} // namespace kinematics
} // namespace arm_kinematics
