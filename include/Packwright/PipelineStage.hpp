// =================================================================
// include/Packwright/PipelineStage.hpp
// =================================================================
// Lifecycle stages and their ordering.

#pragma once

#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief One ordered step of the build lifecycle
 *
 * scaffold < populate < compile < execute; package requires compile.
 */
enum class PipelineStage {
    SCAFFOLD,
    POPULATE,
    COMPILE,
    EXECUTE,
    PACKAGE
};

std::string stageName(PipelineStage stage);

/**
 * @brief Parse a verb or stage name
 * @throws UserError for unknown names
 */
PipelineStage parseStage(const std::string& name);

/**
 * @brief Stages that must be complete before a stage may run, in order
 */
std::vector<PipelineStage> prerequisites(PipelineStage stage);

/**
 * @brief Every stage, in lifecycle order
 */
const std::vector<PipelineStage>& allStages();

} // namespace Packwright
