/**
 * @file DifferentialIK.hpp
 * @brief Velocity-based differential inverse kinematics
 *
 * Drives the joint configuration toward a target pose by integrating
 *
 *   dq/dt = J(q) * (x_target - x(q)) * k
 *
 * where x(q) is the first decomposed pose candidate of FK(q) and k is the
 * time grid gain (tf - t0) / numSteps. The ODE is integrated with
 * Boost.Odeint and sampled on the time grid.
 */

#pragma once

#include "ForwardKinematics.hpp"
#include "JacobianComputer.hpp"
#include "PoseDecomposer.hpp"
#include "../trajectory/TrajectoryTypes.hpp"
#include <functional>
#include <optional>

namespace arm_kinematics {
namespace kinematics {

// ============================================================================
// Configuration & Report
// ============================================================================

struct IntegratorConfig {
    double absTolerance = 1e-8;
    double relTolerance = 1e-8;
    double initialStep = 1e-3;          // First internal step (s)
    double singularityEpsilon = EPSILON; // |det J| threshold for reports
    int maxStepsPerSample = 500;        // Internal steps allowed between two grid samples
};

/**
 * Post-hoc quality summary of a trajectory against its target
 */
struct SolveReport {
    double initialError = 0.0;
    double finalError = 0.0;
    size_t samples = 0;
    size_t singularSamples = 0;
    size_t degenerateSamples = 0;
    std::optional<size_t> firstSingularSample;
    std::optional<size_t> stalledSample;  // First sample held after the integrator gave up

    bool improved() const { return finalError < initialError; }
};

// ============================================================================
// Differential IK Solver
// ============================================================================

class DifferentialIKSolver {
public:
    /**
     * dq/dt for state q at time t, in odeint system signature
     */
    using VectorField = std::function<void(const JointAngles& q, JointAngles& dqdt, double t)>;

    explicit DifferentialIKSolver(const DHTable& table,
                                  const IntegratorConfig& config = IntegratorConfig());

    /**
     * Target pose reached by configuration q (first candidate)
     * @throws std::runtime_error if the pose of q is degenerate
     */
    Pose targetFromConfiguration(const JointAngles& q) const;

    /**
     * Build the vector field. The closure holds copies of the kinematic
     * model, target and gain only, so it may be evaluated at any (q, t) in
     * any order.
     */
    VectorField makeVectorField(const Pose& target, double gain) const;

    /**
     * Integrate from q0 over the grid
     *
     * If the integrator needs more than maxStepsPerSample internal steps to
     * reach the next sample, integration stops there. The remaining samples
     * hold the last reached configuration and Trajectory::stalledAt marks
     * the first of them.
     *
     * @return One joint configuration per grid sample
     * @throws std::invalid_argument on an invalid grid or non-finite q0
     */
    trajectory::Trajectory solve(const JointAngles& q0,
                                 const Pose& target,
                                 const trajectory::TimeGrid& grid) const;

    /**
     * Pose error norm |target - x(q)|. Orientation terms are zero when the
     * pose of q has no candidate.
     */
    double poseError(const JointAngles& q, const Pose& target) const;

    SolveReport analyze(const trajectory::Trajectory& trajectory, const Pose& target) const;

    const ForwardKinematics& forwardKinematics() const { return fk_; }
    const IntegratorConfig& config() const { return config_; }

private:
    static Vector6d scaledPoseError(const FrameList& frames,
                                    const Pose& target,
                                    double gain);

    ForwardKinematics fk_;
    IntegratorConfig config_;
};

} // namespace kinematics
} // namespace arm_kinematics
