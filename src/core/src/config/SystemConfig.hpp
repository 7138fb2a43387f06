/**
 * @file SystemConfig.hpp
 * @brief System configuration data structures
 */

#pragma once

#include <string>
#include <array>

namespace arm_kinematics {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/arm_kinematics.log";
    int max_size_mb = 10;
    int max_files = 5;
};

/**
 * Differential IK run configuration
 */
struct SolverConfig {
    // Start configuration of the integration (rad)
    std::array<double, 6> initial_configuration = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    // Configuration whose pose becomes the target (rad)
    std::array<double, 6> input_configuration = {0.1, 0.1, 0.1, 0.1, 0.1, 0.1};

    // Time grid
    double t0 = 0.0;
    double tf = 10.0;
    int num_steps = 10000;

    // Integrator
    double abs_tolerance = 1e-8;
    double rel_tolerance = 1e-8;
    double singularity_epsilon = 1e-9;
    int max_steps_per_sample = 500;
};

/**
 * Output files
 */
struct OutputConfig {
    std::string trajectory_file = "output/trajectory.json";
};

/**
 * Complete system configuration
 */
struct SystemConfig {
    std::string version = "1.0.0";
    LoggingConfig logging;
    SolverConfig solver;
    OutputConfig output;
};

} // namespace config
} // namespace arm_kinematics
