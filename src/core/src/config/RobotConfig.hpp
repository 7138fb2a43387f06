/**
 * @file RobotConfig.hpp
 * @brief Arm configuration data structures
 */

#pragma once

#include <string>
#include <array>
#include <cmath>

namespace arm_kinematics {
namespace config {

/**
 * Arm geometry
 */
struct RobotConfig {
    // Identification
    std::string name = "Arm6DOF";

    // Link lengths l1..l6
    std::array<double, 6> link_lengths = {1.0, 1.0, 1.0, 1.0, 1.0, 1.0};

    // Validation
    bool isValid() const {
        for (double l : link_lengths) {
            if (!std::isfinite(l) || l <= 0.0) {
                return false;
            }
        }
        return true;
    }
};

} // namespace config
} // namespace arm_kinematics
