/**
 * @file TrajectoryTypes.hpp
 * @brief Time grid and joint trajectory types
 */

#pragma once

#include "../kinematics/MathTypes.hpp"
#include <optional>
#include <vector>
#include <string>

namespace arm_kinematics {
namespace trajectory {

using kinematics::JointAngles;
using kinematics::NUM_JOINTS;

// ============================================================================
// Time Grid
// ============================================================================

/**
 * Evenly spaced sample times over [t0, tf], endpoints included
 */
struct TimeGrid {
    double t0 = 0.0;
    double tf = 10.0;
    int numSteps = 10000;

    TimeGrid() = default;
    TimeGrid(double t0_, double tf_, int numSteps_)
        : t0(t0_), tf(tf_), numSteps(numSteps_) {}

    /**
     * @throws std::invalid_argument if numSteps < 2 or tf <= t0
     */
    void validate() const {
        if (numSteps < 2) {
            throw std::invalid_argument("Time grid needs at least 2 samples, got " +
                                        std::to_string(numSteps));
        }
        if (!(tf > t0)) {
            throw std::invalid_argument("Time grid end must be after start");
        }
    }

    std::vector<double> samples() const {
        validate();
        std::vector<double> t(static_cast<size_t>(numSteps));
        const double step = (tf - t0) / (numSteps - 1);
        for (int i = 0; i < numSteps; ++i) {
            t[i] = t0 + step * i;
        }
        t.back() = tf;
        return t;
    }

    /**
     * Proportional gain on the pose error, tied to grid resolution
     */
    double gain() const {
        validate();
        return (tf - t0) / numSteps;
    }
};

// ============================================================================
// Trajectory
// ============================================================================

/**
 * Joint configuration at every grid sample
 */
struct Trajectory {
    std::vector<double> times;
    std::vector<JointAngles> samples;
    std::optional<size_t> stalledAt;  // Samples from here on were not integrated

    bool stalled() const { return stalledAt.has_value(); }

    size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }

    const JointAngles& initial() const { return samples.front(); }
    const JointAngles& last() const { return samples.back(); }

    /**
     * Values of one joint over time
     * @throws std::out_of_range if jointIndex is not in [0, 5]
     */
    std::vector<double> jointSeries(int jointIndex) const {
        if (jointIndex < 0 || jointIndex >= NUM_JOINTS) {
            throw std::out_of_range("Joint index " + std::to_string(jointIndex) + " out of range");
        }
        std::vector<double> series;
        series.reserve(samples.size());
        for (const auto& q : samples) {
            series.push_back(q[jointIndex]);
        }
        return series;
    }
};

} // namespace trajectory
} // namespace arm_kinematics
