// =================================================================
// src/Packwright/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Packwright/CliParser.hpp"
#include "Packwright/Environment.hpp"

namespace Packwright {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Packwright: turns an application project into native distributables.");
    m_app->set_version_flag("--version", std::string("packwright ") + PACKWRIGHT_VERSION);
    m_app->require_subcommand(0, 1);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Shared options may appear before or after the subcommand
    setupCommonOptions(*m_app);

    // Define all commands
    setupNewCommand(*m_app);
    setupLifecycleCommand(*m_app, "scaffold", "Renders the platform template into the build tree.");
    setupLifecycleCommand(*m_app, "populate", "Copies the app sources and requirements into the build tree.");
    setupLifecycleCommand(*m_app, "compile", "Builds the app, running earlier stages if needed.");
    setupExecuteCommand(*m_app);
    setupPackageCommand(*m_app);
    setupToolsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupCommonOptions(CLI::App& app) {
    app.add_option("-a,--app", m_commands.apps, "Limit the command to this app (repeatable).");
    app.add_option("-C,--config", m_commands.config_overrides,
                   "Override a setting for this run, e.g. -C version=\"1.2\" (repeatable).");
    app.add_option("--descriptor", m_commands.descriptor_path, "Path to the project descriptor.");
    app.add_flag("-f,--force", m_commands.force, "Rerun earlier stages even if they are complete.");
    app.add_option("-j,--jobs", m_commands.jobs, "Number of apps processed concurrently.")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", m_commands.verbosity, "Show tool output (-vv also logs commands).");
}

void CliParser::setupNewCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("new", "Creates a new application project.");
    sub->add_option("name", m_commands.app_name, "Name of the app, e.g. 'hello-world'.")->required();
    sub->add_option("--bundle", m_commands.bundle, "Reverse-DNS bundle prefix (default: com.example).");
    sub->add_option("--template", m_commands.template_location, "Local directory or git URL of a project template.");
    sub->add_option("--template-branch", m_commands.template_branch, "Branch of the project template.");
    sub->fallthrough();
}

void CliParser::setupLifecycleCommand(CLI::App& app, const std::string& name, const std::string& description) {
    auto* sub = app.add_subcommand(name, description);
    sub->add_option("platform", m_commands.platform, "Target platform (default: this host).");
    sub->add_option("format", m_commands.output_format, "Output format (default: the platform's default).");
    sub->fallthrough();
}

void CliParser::setupExecuteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("execute", "Runs the app, compiling it first if needed.");
    sub->add_option("platform", m_commands.platform, "Target platform (default: this host).");
    sub->add_option("format", m_commands.output_format, "Output format (default: the platform's default).");
    auto* test = sub->add_flag("--test", m_commands.test_mode, "Run the app's test suite.");
    auto* debug = sub->add_flag("--debug", m_commands.debug_mode, "Run the app attached to the terminal in debug mode.");
    test->excludes(debug);
    sub->add_option("--arg", m_commands.passthrough_args, "Argument passed to the app (repeatable).");
    sub->fallthrough();
}

void CliParser::setupPackageCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("package", "Produces a distributable, compiling the app first if needed.");
    sub->add_option("platform", m_commands.platform, "Target platform (default: this host).");
    sub->add_option("format", m_commands.output_format, "Output format (default: the platform's default).");
    sub->add_option("--format", m_commands.packaging_format, "Distributable format, e.g. tar.gz, zip, dmg.");
    auto* identity = sub->add_option("-i,--identity", m_commands.identity, "Code signing identity.");
    auto* adhoc = sub->add_flag("--adhoc-sign", m_commands.adhoc_sign, "Sign with an ad-hoc identity.");
    identity->excludes(adhoc);
    sub->add_flag("--no-notarize", m_commands.no_notarize, "Do not submit the distributable for notarization.");
    sub->add_option("--submission-id", m_commands.submission_id, "Resume polling an earlier notarization submission.");
    sub->fallthrough();
}

void CliParser::setupToolsCommand(CLI::App& app) {
    auto* tools_cmd = app.add_subcommand("tools", "Inspect and manage the external tools Packwright uses");
    tools_cmd->require_subcommand(1);

    // List subcommand
    auto* list_cmd = tools_cmd->add_subcommand("list", "List known tools and where they were found");
    list_cmd->callback([this]() { m_commands.tools_subcommand = "list"; });

    // Upgrade subcommand
    auto* upgrade_cmd = tools_cmd->add_subcommand("upgrade", "Re-acquire managed tools (all when none are named)");
    upgrade_cmd->add_option("names", m_commands.tool_names, "Tools to upgrade");
    upgrade_cmd->callback([this]() { m_commands.tools_subcommand = "upgrade"; });

    tools_cmd->fallthrough();
    tools_cmd->callback([this]() { m_commands.active_command = "tools"; });
}

} // namespace Packwright
