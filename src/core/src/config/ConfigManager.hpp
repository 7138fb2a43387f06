/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "RobotConfig.hpp"
#include "SystemConfig.hpp"

namespace arm_kinematics {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Loads robot_config.yaml (arm geometry) and system_config.yaml (logging,
 * solver, output). Values missing from a file keep their defaults.
 * Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load robot configuration from YAML file
     * @param filepath Path to robot_config.yaml
     * @return true if loaded successfully
     */
    bool loadRobotConfig(const std::string& filepath);

    /**
     * Load system configuration from YAML file
     * @param filepath Path to system_config.yaml
     * @return true if loaded successfully
     */
    bool loadSystemConfig(const std::string& filepath);

    /**
     * Load all configuration files from a directory
     * @param config_dir Path to config directory
     * @return true if all configs loaded successfully
     */
    bool loadAll(const std::string& config_dir = "config");

    /**
     * Restore defaults (reference scenario)
     */
    void reset();

    const RobotConfig& robotConfig() const { return m_robot_config; }
    const SystemConfig& systemConfig() const { return m_system_config; }

    /**
     * Check if configuration is loaded and valid
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * Get configuration as JSON (for logging / run records)
     */
    std::string robotConfigToJson() const;
    std::string systemConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    RobotConfig m_robot_config;
    SystemConfig m_system_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace arm_kinematics
