/**
 * @file DifferentialIK.cpp
 * @brief Differential IK solver implementation
 */

#include "DifferentialIK.hpp"
#include "../logging/Logger.hpp"
#include <boost/numeric/odeint.hpp>
#include <cmath>
#include <stdexcept>

namespace arm_kinematics {
namespace kinematics {

DifferentialIKSolver::DifferentialIKSolver(const DHTable& table, const IntegratorConfig& config)
    : fk_(table), config_(config) {}

Pose DifferentialIKSolver::targetFromConfiguration(const JointAngles& q) const {
    const auto candidates = PoseDecomposer::decompose(fk_.computeEndEffector(q));
    if (candidates.empty()) {
        throw std::runtime_error("Target configuration has a degenerate orientation, no pose candidate");
    }
    return candidates.first();
}

Vector6d DifferentialIKSolver::scaledPoseError(const FrameList& frames,
                                               const Pose& target,
                                               double gain) {
    const auto candidates = PoseDecomposer::decompose(frames.back());

    Vector6d error = Vector6d::Zero();
    if (candidates.empty()) {
        // Degenerate orientation: position-only correction
        error.head<3>() = target.head<3>() - frames.back().block<3, 1>(0, 3);
    } else {
        error = target - candidates.first();
    }

    return error * gain;
}

DifferentialIKSolver::VectorField DifferentialIKSolver::makeVectorField(const Pose& target,
                                                                        double gain) const {
    const ForwardKinematics fk = fk_;

    return [fk, target, gain](const JointAngles& q, JointAngles& dqdt, double /*t*/) {
        const FrameList frames = fk.computeFrames(q);
        const Jacobian J = JacobianComputer::compute(frames);
        const Vector6d dx = scaledPoseError(frames, target, gain);
        dqdt = toJointAngles(Vector6d(J * dx));
    };
}

trajectory::Trajectory DifferentialIKSolver::solve(const JointAngles& q0,
                                                   const Pose& target,
                                                   const trajectory::TimeGrid& grid) const {
    using namespace boost::numeric::odeint;

    for (int i = 0; i < NUM_JOINTS; ++i) {
        if (!std::isfinite(q0[i])) {
            throw std::invalid_argument("Initial joint angle " + std::to_string(i) + " is not finite");
        }
    }

    const std::vector<double> times = grid.samples();
    const double gain = grid.gain();

    LOG_INFO("Differential IK: {} samples over [{}, {}], gain {}",
             times.size(), grid.t0, grid.tf, gain);

    if (JacobianComputer::isSingular(JacobianComputer::compute(fk_.computeFrames(q0)),
                                     config_.singularityEpsilon)) {
        LOG_WARN("Initial configuration is singular, joint velocities may be ill-conditioned");
    }

    trajectory::Trajectory result;
    result.times.reserve(times.size());
    result.samples.reserve(times.size());

    JointAngles q = q0;
    auto stepper = make_dense_output(config_.absTolerance, config_.relTolerance,
                                     runge_kutta_dopri5<JointAngles>());

    auto observer = [&result](const JointAngles& state, double t) {
        result.times.push_back(t);
        result.samples.push_back(state);
    };

    try {
        const size_t steps = integrate_times(
            stepper,
            makeVectorField(target, gain),
            q,
            times.begin(), times.end(),
            config_.initialStep,
            observer,
            max_step_checker(config_.maxStepsPerSample));

        LOG_DEBUG("Integrator took {} internal steps", steps);
    } catch (const odeint_error& e) {
        const size_t reached = result.samples.size();
        LOG_WARN("Integrator stalled after t = {} ({} of {} samples): {}",
                 result.times.back(), reached, times.size(), e.what());

        const JointAngles hold = result.samples.back();
        result.stalledAt = reached;
        for (size_t i = reached; i < times.size(); ++i) {
            result.times.push_back(times[i]);
            result.samples.push_back(hold);
        }
    }

    return result;
}

double DifferentialIKSolver::poseError(const JointAngles& q, const Pose& target) const {
    return scaledPoseError(fk_.computeFrames(q), target, 1.0).norm();
}

SolveReport DifferentialIKSolver::analyze(const trajectory::Trajectory& trajectory,
                                          const Pose& target) const {
    SolveReport report;
    report.samples = trajectory.size();
    if (trajectory.empty()) {
        return report;
    }

    for (size_t i = 0; i < trajectory.size(); ++i) {
        const FrameList frames = fk_.computeFrames(trajectory.samples[i]);

        if (JacobianComputer::isSingular(JacobianComputer::compute(frames),
                                         config_.singularityEpsilon)) {
            ++report.singularSamples;
            if (!report.firstSingularSample) {
                report.firstSingularSample = i;
            }
        }

        if (PoseDecomposer::decompose(frames.back()).empty()) {
            ++report.degenerateSamples;
        }
    }

    report.stalledSample = trajectory.stalledAt;
    if (report.stalledSample) {
        LOG_WARN("Integration stopped at sample {} of {}, later samples are held",
                 *report.stalledSample, report.samples);
    }

    report.initialError = poseError(trajectory.initial(), target);
    report.finalError = poseError(trajectory.last(), target);

    if (report.singularSamples > 0) {
        LOG_WARN("{} of {} samples are singular (first at sample {})",
                 report.singularSamples, report.samples, *report.firstSingularSample);
    }
    if (report.degenerateSamples > 0) {
        LOG_WARN("{} of {} samples have a degenerate orientation",
                 report.degenerateSamples, report.samples);
    }
    LOG_INFO("Pose error: initial {:.6f}, final {:.6f}", report.initialError, report.finalError);

    return report;
}

} // namespace kinematics
} // namespace arm_kinematics
