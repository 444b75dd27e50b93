// =================================================================
// include/Packwright/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Packwright/BackendRegistry.hpp"
#include "Packwright/Cancellation.hpp"
#include "Packwright/CliParser.hpp"
#include "Packwright/PipelineStage.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Forward declarations to reduce header dependencies
namespace Packwright {
    class ProcessSupervisor;
    class TemplateProvisioner;
    class ToolRegistry;
    struct PipelineRequest;
    struct PipelineResult;
}

namespace Packwright {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return Process exit code (0 success, 2 user error, 3 environment
     * error, 4 tool failure, 5 template error, 130 cancelled)
     */
    int run();

    /**
     * @brief Files of a project created without a template
     */
    static std::map<std::string, std::string> defaultProjectFiles(const std::string& app_name,
                                                                  const std::string& bundle);

private:
    // Command Handlers
    int handleNew();
    int handleStage(PipelineStage verb);
    int handleTools();

    PipelineRequest buildRequest(PipelineStage verb, const ProjectDescriptor& descriptor) const;
    int reportResults(const std::vector<PipelineResult>& results) const;
    void registerBackendTools();

    const Commands& m_commands;
    CancellationToken m_token;
    std::unique_ptr<ProcessSupervisor> m_supervisor;
    std::unique_ptr<ToolRegistry> m_tools;
    std::unique_ptr<TemplateProvisioner> m_templates;
    BackendRegistry m_backends;
};

} // namespace Packwright
