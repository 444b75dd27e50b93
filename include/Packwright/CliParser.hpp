// =================================================================
// include/Packwright/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Packwright {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Options shared by every command
    std::vector<std::string> apps;
    std::vector<std::string> config_overrides;
    std::string descriptor_path = "packwright.yml";
    bool force = false;
    size_t jobs = 1;
    int verbosity = 0;

    // Target selection for the lifecycle commands
    std::string platform;
    std::string output_format;

    // Options for 'new'
    std::string app_name;
    std::string bundle = "com.example";
    std::string template_location;
    std::string template_branch;

    // Options for 'execute'
    bool test_mode = false;
    bool debug_mode = false;
    std::vector<std::string> passthrough_args;

    // Options for 'package'
    std::string packaging_format;
    std::string identity;
    bool adhoc_sign = false;
    bool no_notarize = false;
    std::string submission_id;

    // Options for 'tools'
    std::string tools_subcommand;   // list, upgrade
    std::vector<std::string> tool_names;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupCommonOptions(CLI::App& app);
    void setupNewCommand(CLI::App& app);
    void setupLifecycleCommand(CLI::App& app, const std::string& name, const std::string& description);
    void setupExecuteCommand(CLI::App& app);
    void setupPackageCommand(CLI::App& app);
    void setupToolsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Packwright
