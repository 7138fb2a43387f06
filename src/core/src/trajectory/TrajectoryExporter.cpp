/**
 * @file TrajectoryExporter.cpp
 * @brief Trajectory export implementation
 */

#include "TrajectoryExporter.hpp"
#include "../logging/Logger.hpp"
#include <filesystem>
#include <fstream>

namespace arm_kinematics {
namespace trajectory {

using json = nlohmann::json;
namespace fs = std::filesystem;

json TrajectoryExporter::toPlotJson(const Trajectory& trajectory) {
    json doc;
    doc["title"] = "Joint angles changes during configuration change";
    doc["xlabel"] = "Time (s)";
    doc["ylabel"] = "Joint angles (rad)";
    doc["x"] = trajectory.times;

    json series = json::array();
    for (int i = 0; i < NUM_JOINTS; ++i) {
        series.push_back({
            {"y", trajectory.jointSeries(i)},
            {"label", "joint " + std::to_string(i)}
        });
    }
    doc["series"] = series;

    return doc;
}

bool TrajectoryExporter::writePlotJson(const Trajectory& trajectory, const std::string& filepath) {
    try {
        fs::path path(filepath);
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream out(filepath);
        if (!out) {
            LOG_ERROR("Cannot open trajectory file for writing: {}", filepath);
            return false;
        }

        out << toPlotJson(trajectory).dump(2);
        if (!out) {
            LOG_ERROR("Failed writing trajectory file: {}", filepath);
            return false;
        }

        LOG_INFO("Trajectory written: {} ({} samples)", filepath, trajectory.size());
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Error writing trajectory file {}: {}", filepath, e.what());
        return false;
    }
}

} // namespace trajectory
} // namespace arm_kinematics
