// =================================================================
// include/Packwright/Backend.hpp
// =================================================================
// Capability interface implemented by every platform backend.

#pragma once

#include "Packwright/Cancellation.hpp"
#include "Packwright/PipelineStage.hpp"
#include "Packwright/ProcessSupervisor.hpp"
#include "Packwright/ProjectConfig.hpp"
#include "Packwright/ProjectTree.hpp"
#include "Packwright/ToolRegistry.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace Packwright {

class TemplateProvisioner;

/**
 * @brief How the execute stage runs the app
 */
enum class ExecuteMode {
    NORMAL,     ///< Run and stream the app's output
    TEST,       ///< Run the test suite; outcome decided by output patterns
    DEBUG       ///< Run attached to the terminal with debugging enabled
};

std::string executeModeToString(ExecuteMode mode);

/**
 * @brief Options gathered from the command line for one invocation
 */
struct PipelineOptions {
    bool force = false;                     ///< Rerun prerequisite stages even if complete
    ExecuteMode execute_mode = ExecuteMode::NORMAL;
    std::string packaging_format;           ///< Empty = configured or backend default
    std::string signing_identity;           ///< Empty = configured identity, else ad-hoc
    bool adhoc_sign = false;
    bool notarize = true;
    std::string submission_id;              ///< Resume an earlier notarization
    std::vector<std::string> passthrough_args;
    ConfigLayerMap overrides;               ///< -C key=value entries
};

/**
 * @brief Everything a backend operation may use
 */
struct BackendContext {
    BackendContext(const EffectiveConfig& config_, const ProjectTree& tree_,
                   const std::filesystem::path& project_root_, const PipelineOptions& options_,
                   ProcessSupervisor& supervisor_, TemplateProvisioner& templates_,
                   const CancellationToken& cancellation_)
        : config(config_), tree(tree_), project_root(project_root_), options(options_),
          supervisor(supervisor_), templates(templates_), cancellation(cancellation_) {}

    const EffectiveConfig& config;
    ProjectTree tree;
    std::filesystem::path project_root;
    const PipelineOptions& options;
    ProcessSupervisor& supervisor;
    TemplateProvisioner& templates;
    const CancellationToken& cancellation;
    std::map<std::string, std::filesystem::path> tool_paths;    ///< Ensured tools by name
    bool test_mode = false;

    /**
     * @brief Directory receiving distributable artefacts
     */
    std::filesystem::path distDirectory() const { return project_root / "dist"; }

    /**
     * @brief Executable of an ensured tool, falling back to its bare name
     */
    std::string toolPath(const std::string& name) const;
};

/**
 * @brief One (platform, output format) implementation of the lifecycle
 *
 * Backends never sequence stages themselves; the Pipeline decides which
 * operations run and in which order.
 */
class PlatformBackend {
public:
    virtual ~PlatformBackend() = default;

    virtual std::string platform() const = 0;
    virtual std::string outputFormat() const = 0;

    /**
     * @brief Distributable formats accepted by package()
     */
    virtual std::vector<std::string> packagingFormats() const = 0;
    virtual std::string defaultPackagingFormat() const = 0;

    /**
     * @brief Tools a stage needs, ensured by the Pipeline before the stage runs
     */
    virtual std::vector<ToolSpec> requiredTools(PipelineStage stage, const std::string& packaging_format) const = 0;

    virtual ProjectTree scaffold(BackendContext& context) = 0;
    virtual void populate(BackendContext& context) = 0;

    /**
     * @return Path of the compiled artefact
     */
    virtual std::filesystem::path compile(BackendContext& context) = 0;

    virtual ProcessResult execute(BackendContext& context, ExecuteMode mode) = 0;

    /**
     * @return Path of the distributable
     */
    virtual std::filesystem::path package(BackendContext& context, const std::string& format) = 0;

    /**
     * @brief Location of the ProjectTree for an app: build/<app>/<platform>/<format>
     */
    virtual ProjectTree treeFor(const EffectiveConfig& config, const std::filesystem::path& project_root) const;

    bool supportsPackagingFormat(const std::string& format) const;

    /**
     * @brief Packaging format from the options, then the `packaging_format` setting, then the default
     * @throws UnsupportedTarget if the backend cannot produce it
     */
    std::string resolvePackagingFormat(const EffectiveConfig& config, const PipelineOptions& options) const;
};

} // namespace Packwright
