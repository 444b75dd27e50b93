// =================================================================
// include/Packwright/StageMarkers.hpp
// =================================================================
// Durable stage-completion markers stored inside a ProjectTree.

#pragma once

#include "Packwright/PipelineStage.hpp"
#include "Packwright/ProjectTree.hpp"
#include <optional>
#include <string>

namespace Packwright {

/**
 * @brief Contents of one completion marker
 */
struct StageMarker {
    PipelineStage stage = PipelineStage::SCAFFOLD;
    bool test_mode = false;
    std::string artefact;
    std::string completed_at;
};

/**
 * @brief Reads and writes `<tree>/.packwright/stages/<stage>.json`
 *
 * Markers are written atomically and only after a stage has finished.
 * Markers written in test mode only satisfy test-mode runs (scaffold is
 * the same in both modes).
 */
class StageMarkers {
public:
    explicit StageMarkers(const ProjectTree& tree);

    bool isComplete(PipelineStage stage, bool test_mode) const;

    /**
     * @brief Read a marker; unreadable markers are treated as missing
     */
    std::optional<StageMarker> read(PipelineStage stage) const;

    void markComplete(PipelineStage stage, bool test_mode, const std::string& artefact = "");

    /**
     * @brief Remove the marker of a stage and of every stage that depends on it
     */
    void invalidateFrom(PipelineStage stage);

    std::filesystem::path markerPath(PipelineStage stage) const;

private:
    ProjectTree m_tree;
};

} // namespace Packwright
