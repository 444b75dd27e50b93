// =================================================================
// src/Packwright/StageMarkers.cpp
// =================================================================
// Implementation for stage-completion markers.

#include "Packwright/StageMarkers.hpp"
#include "Packwright/Environment.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

std::string utcTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc_tm{};
    gmtime_r(&now, &utc_tm);
    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // anonymous namespace

StageMarkers::StageMarkers(const ProjectTree& tree)
    : m_tree(tree) {
}

fs::path StageMarkers::markerPath(PipelineStage stage) const {
    return m_tree.stagesDirectory() / (stageName(stage) + ".json");
}

bool StageMarkers::isComplete(PipelineStage stage, bool test_mode) const {
    auto marker = read(stage);
    if (!marker) {
        return false;
    }
    return stage == PipelineStage::SCAFFOLD || marker->test_mode == test_mode;
}

std::optional<StageMarker> StageMarkers::read(PipelineStage stage) const {
    fs::path path = markerPath(stage);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    try {
        auto json = nlohmann::json::parse(readFile(path));
        StageMarker marker;
        marker.stage = parseStage(json.at("stage").get<std::string>());
        marker.test_mode = json.value("test_mode", false);
        marker.artefact = json.value("artefact", std::string());
        marker.completed_at = json.value("completed_at", std::string());
        if (marker.stage != stage) {
            return std::nullopt;
        }
        return marker;
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Pipeline", "Ignoring unreadable stage marker " + path.string(), e.what());
        return std::nullopt;
    }
}

void StageMarkers::markComplete(PipelineStage stage, bool test_mode, const std::string& artefact) {
    nlohmann::json marker = {
        {"stage", stageName(stage)},
        {"test_mode", test_mode},
        {"artefact", artefact},
        {"completed_at", utcTimestamp()},
        {"packwright_version", toolVersion()}
    };
    writeFileAtomic(markerPath(stage), marker.dump(2));
}

void StageMarkers::invalidateFrom(PipelineStage stage) {
    for (PipelineStage candidate : allStages()) {
        auto required = prerequisites(candidate);
        bool depends = std::find(required.begin(), required.end(), stage) != required.end();
        if (candidate == stage || depends) {
            std::error_code ec;
            fs::remove(markerPath(candidate), ec);
        }
    }
}

} // namespace Packwright
