/**
 * @file main.cpp
 * @brief Differential IK demo - Entry Point
 *
 * Synthesises a target pose from the configured input configuration,
 * drives the arm toward it from the initial configuration and writes the
 * joint trajectory for plotting.
 */

#include <iostream>
#include <stdexcept>

#include "arm_kinematics/core.hpp"

using namespace arm_kinematics;
using namespace arm_kinematics::config;
using namespace arm_kinematics::kinematics;

int main(int argc, char* argv[]) {
    // Determine config directory (from arg or default)
    std::string config_dir = "config";
    if (argc > 1) {
        config_dir = argv[1];
    }

    // Basic setup, reconfigured after loading config
    Logger::init("", "debug");

    LOG_INFO("========================================");
    LOG_INFO("Arm Kinematics Differential IK v1.0.0");
    LOG_INFO("========================================");
    LOG_INFO("Config directory: {}", config_dir);

    auto& config = ConfigManager::instance();
    if (!config.loadAll(config_dir)) {
        LOG_ERROR("Failed to load configuration files");
        LOG_ERROR("Make sure robot_config.yaml and system_config.yaml exist in: {}", config_dir);
        return 1;
    }

    // Reconfigure logger based on loaded config
    const auto& logConfig = config.systemConfig().logging;
    Logger::shutdown();
    Logger::init(
        logConfig.file,
        logConfig.level,
        static_cast<size_t>(logConfig.max_size_mb) * 1024 * 1024,
        static_cast<size_t>(logConfig.max_files)
    );

    LOG_DEBUG("Robot config: {}", config.robotConfigToJson());
    LOG_DEBUG("System config: {}", config.systemConfigToJson());

    const auto& solverConfig = config.systemConfig().solver;

    try {
        DHTable table(config.robotConfig().link_lengths);

        IntegratorConfig integrator;
        integrator.absTolerance = solverConfig.abs_tolerance;
        integrator.relTolerance = solverConfig.rel_tolerance;
        integrator.singularityEpsilon = solverConfig.singularity_epsilon;
        integrator.maxStepsPerSample = solverConfig.max_steps_per_sample;

        DifferentialIKSolver solver(table, integrator);

        const Pose target = solver.targetFromConfiguration(solverConfig.input_configuration);
        LOG_INFO("Target pose: [{:.4f}, {:.4f}, {:.4f}, {:.4f}, {:.4f}, {:.4f}]",
                 target(0), target(1), target(2), target(3), target(4), target(5));

        const trajectory::TimeGrid grid(solverConfig.t0, solverConfig.tf, solverConfig.num_steps);
        const auto result = solver.solve(solverConfig.initial_configuration, target, grid);
        const auto report = solver.analyze(result, target);

        const auto& q = result.last();
        LOG_INFO("Final joints: [{:.4f}, {:.4f}, {:.4f}, {:.4f}, {:.4f}, {:.4f}]",
                 q[0], q[1], q[2], q[3], q[4], q[5]);
        if (report.stalledSample) {
            LOG_WARN("Trajectory is held from sample {} on", *report.stalledSample);
        }
        if (!report.improved()) {
            LOG_WARN("Pose error did not decrease over the horizon");
        }

        if (!trajectory::TrajectoryExporter::writePlotJson(result, config.systemConfig().output.trajectory_file)) {
            return 1;
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Differential IK run failed: {}", e.what());
        return 1;
    }

    LOG_INFO("Done");
    return 0;
}
