// =================================================================
// include/Packwright/Pipeline.hpp
// =================================================================
// Sequences lifecycle stages for one or more apps.

#pragma once

#include "Packwright/Backend.hpp"
#include "Packwright/BackendRegistry.hpp"
#include "Packwright/Cancellation.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/PipelineStage.hpp"
#include "Packwright/ProcessSupervisor.hpp"
#include "Packwright/ProjectConfig.hpp"
#include "Packwright/StageMarkers.hpp"
#include "Packwright/TemplateProvisioner.hpp"
#include "Packwright/ToolRegistry.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief Terminal state of one app's pipeline
 */
enum class PipelineState {
    SUCCEEDED,
    FAILED,
    CANCELLED
};

std::string pipelineStateToString(PipelineState state);

/**
 * @brief What the user asked for
 */
struct PipelineRequest {
    PipelineStage verb = PipelineStage::PACKAGE;
    std::string platform;               ///< Empty = the host's platform
    std::string output_format;          ///< Empty = the platform's default format
    PipelineOptions options;
    std::vector<std::string> apps;      ///< Empty = every app in the descriptor
    size_t jobs = 1;                    ///< Apps processed concurrently
};

/**
 * @brief Outcome of one app's pipeline
 */
struct PipelineResult {
    PipelineState state = PipelineState::FAILED;
    std::string app_name;
    std::string platform;
    std::string output_format;
    std::vector<PipelineStage> stages_run;
    std::string artefact;               ///< Compiled artefact or distributable
    std::string output;                 ///< Captured app output of the execute stage
    std::string error_message;
    ErrorKind error_kind = ErrorKind::USER_ERROR;
    std::string failed_stage;
    std::string tool;
    int exit_code = ExitCode::SUCCESS;

    bool succeeded() const { return state == PipelineState::SUCCEEDED; }
};

/**
 * @brief Runs the stages a verb needs, in order, for each selected app
 *
 * A verb's prerequisite stages run only when their completion marker is
 * missing (or always with --force). The first failure stops the app's
 * pipeline; only stages that finished leave a marker. Running a stage
 * invalidates the markers of the stages that depend on it.
 */
class Pipeline {
public:
    Pipeline(const ProjectDescriptor& descriptor, const BackendRegistry& backends, ToolRegistry& tools,
             ProcessSupervisor& supervisor, TemplateProvisioner& templates, const CancellationToken& token);

    /**
     * @brief Run the requested verb for one app
     * @return Result describing success, failure or cancellation; never throws
     */
    PipelineResult run(const std::string& app_name, const PipelineRequest& request);

    /**
     * @brief Run the requested verb for every selected app
     *
     * Apps run concurrently on at most `request.jobs` threads. A failing app
     * does not stop its siblings; cancellation does, and apps still queued
     * when it arrives are reported cancelled without running. Results are in
     * descriptor order.
     * @throws UserError if a requested app is not in the descriptor
     */
    std::vector<PipelineResult> runAll(const PipelineRequest& request);

    /**
     * @brief Exit code of the first failed result, or 0
     */
    static int exitCodeFor(const std::vector<PipelineResult>& results);

    /**
     * @brief Platform targeted by a request
     */
    std::string resolvePlatform(const PipelineRequest& request) const;

private:
    const ProjectDescriptor& m_descriptor;
    const BackendRegistry& m_backends;
    ToolRegistry& m_tools;
    ProcessSupervisor& m_supervisor;
    TemplateProvisioner& m_templates;
    const CancellationToken& m_token;

    PipelineResult notStarted(const std::string& app_name, const PipelineRequest& request) const;
    void runStage(PipelineStage stage, PlatformBackend& backend, BackendContext& context,
                  StageMarkers& markers, const std::string& packaging_format, PipelineResult& result);
};

} // namespace Packwright
