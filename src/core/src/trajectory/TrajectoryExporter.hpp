/**
 * @file TrajectoryExporter.hpp
 * @brief Plot hand-off document for joint trajectories
 *
 * Layout:
 *   {
 *     "title": ..., "xlabel": ..., "ylabel": ...,
 *     "x": [t0, ..., tf],
 *     "series": [{"y": [...], "label": "joint 0"}, ... "joint 5"]
 *   }
 */

#pragma once

#include "TrajectoryTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace arm_kinematics {
namespace trajectory {

class TrajectoryExporter {
public:
    static nlohmann::json toPlotJson(const Trajectory& trajectory);

    /**
     * Write the plot document to disk, creating parent directories
     * @return true if written successfully
     */
    static bool writePlotJson(const Trajectory& trajectory, const std::string& filepath);
};

} // namespace trajectory
} // namespace arm_kinematics
