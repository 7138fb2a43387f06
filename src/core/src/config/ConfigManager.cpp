/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>

namespace arm_kinematics {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Six-element sequence; anything else is a structural error
std::array<double, 6> readJointArray(const YAML::Node& node, const std::string& key,
                                     const std::array<double, 6>& fallback) {
    if (!node) {
        return fallback;
    }
    if (!node.IsSequence() || node.size() != 6) {
        throw std::invalid_argument("'" + key + "' must be a sequence of 6 numbers");
    }
    std::array<double, 6> values{};
    for (size_t i = 0; i < 6; ++i) {
        values[i] = node[i].as<double>();
    }
    return values;
}

} // namespace

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadRobotConfig(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Robot config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading robot config from: {}", filepath);

        YAML::Node config = YAML::LoadFile(filepath);
        YAML::Node robot = config["robot"];

        if (!robot) {
            LOG_ERROR("Missing 'robot' section in config");
            return false;
        }

        RobotConfig loaded;
        loaded.name = robot["name"].as<std::string>("Arm6DOF");
        loaded.link_lengths = readJointArray(robot["link_lengths"], "link_lengths",
                                             loaded.link_lengths);

        if (!loaded.isValid()) {
            LOG_ERROR("Robot config validation failed: link lengths must be finite and positive");
            return false;
        }

        m_robot_config = loaded;
        LOG_INFO("Robot config loaded: {}", m_robot_config.name);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in robot config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading robot config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadSystemConfig(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("System config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading system config from: {}", filepath);

        YAML::Node config = YAML::LoadFile(filepath);
        YAML::Node system = config["system"];

        if (!system) {
            LOG_ERROR("Missing 'system' section in config");
            return false;
        }

        SystemConfig loaded;
        loaded.version = system["version"].as<std::string>("1.0.0");

        // Logging settings
        if (system["logging"]) {
            auto logging = system["logging"];
            loaded.logging.level = logging["level"].as<std::string>("info");
            loaded.logging.file = logging["file"].as<std::string>("logs/arm_kinematics.log");
            loaded.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
            loaded.logging.max_files = logging["max_files"].as<int>(5);
        }

        // Solver settings
        if (system["solver"]) {
            auto solver = system["solver"];
            auto& s = loaded.solver;
            s.initial_configuration = readJointArray(solver["initial_configuration"],
                                                     "initial_configuration", s.initial_configuration);
            s.input_configuration = readJointArray(solver["input_configuration"],
                                                   "input_configuration", s.input_configuration);
            s.t0 = solver["t0"].as<double>(0.0);
            s.tf = solver["tf"].as<double>(10.0);
            s.num_steps = solver["num_steps"].as<int>(10000);
            s.abs_tolerance = solver["abs_tolerance"].as<double>(1e-8);
            s.rel_tolerance = solver["rel_tolerance"].as<double>(1e-8);
            s.singularity_epsilon = solver["singularity_epsilon"].as<double>(1e-9);
            s.max_steps_per_sample = solver["max_steps_per_sample"].as<int>(500);
        }

        // Output settings
        if (system["output"]) {
            loaded.output.trajectory_file =
                system["output"]["trajectory_file"].as<std::string>("output/trajectory.json");
        }

        const auto& s = loaded.solver;
        if (s.num_steps < 2 || !(s.tf > s.t0)) {
            LOG_ERROR("Solver time grid invalid: [{}, {}] with {} steps", s.t0, s.tf, s.num_steps);
            return false;
        }
        if (s.abs_tolerance <= 0.0 || s.rel_tolerance <= 0.0 || s.singularity_epsilon <= 0.0) {
            LOG_ERROR("Solver tolerances must be positive");
            return false;
        }
        if (s.max_steps_per_sample <= 0) {
            LOG_ERROR("Solver max_steps_per_sample must be positive, got {}", s.max_steps_per_sample);
            return false;
        }

        m_system_config = loaded;
        LOG_INFO("System config loaded: version {}", m_system_config.version);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadAll(const std::string& config_dir) {
    std::string robot_path = config_dir + "/robot_config.yaml";
    std::string system_path = config_dir + "/system_config.yaml";

    bool robot_ok = loadRobotConfig(robot_path);
    bool system_ok = loadSystemConfig(system_path);

    m_loaded = robot_ok && system_ok;
    return m_loaded;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_robot_config = RobotConfig();
    m_system_config = SystemConfig();
    m_loaded = false;
}

std::string ConfigManager::robotConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["name"] = m_robot_config.name;
    j["link_lengths"] = m_robot_config.link_lengths;
    return j.dump();
}

std::string ConfigManager::systemConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto& s = m_system_config.solver;
    json j;
    j["version"] = m_system_config.version;
    j["logging"] = {
        {"level", m_system_config.logging.level},
        {"file", m_system_config.logging.file},
        {"max_size_mb", m_system_config.logging.max_size_mb},
        {"max_files", m_system_config.logging.max_files}
    };
    j["solver"] = {
        {"initial_configuration", s.initial_configuration},
        {"input_configuration", s.input_configuration},
        {"t0", s.t0},
        {"tf", s.tf},
        {"num_steps", s.num_steps},
        {"abs_tolerance", s.abs_tolerance},
        {"rel_tolerance", s.rel_tolerance},
        {"singularity_epsilon", s.singularity_epsilon},
        {"max_steps_per_sample", s.max_steps_per_sample}
    };
    j["output"] = {
        {"trajectory_file", m_system_config.output.trajectory_file}
    };
    return j.dump();
}

} // namespace config
} // namespace arm_kinematics
