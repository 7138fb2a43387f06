#pragma once
/**
 * @file core.hpp
 * @brief Main include file for Arm Kinematics Core
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/kinematics/DHParameters.hpp"
#include "../../src/kinematics/ForwardKinematics.hpp"
#include "../../src/kinematics/JacobianComputer.hpp"
#include "../../src/kinematics/PoseDecomposer.hpp"
#include "../../src/kinematics/DifferentialIK.hpp"
#include "../../src/trajectory/TrajectoryExporter.hpp"
