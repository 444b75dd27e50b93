// =================================================================
// include/Packwright/NativeBackend.hpp
// =================================================================
// Lifecycle shared by backends that build on the host with shell commands.

#pragma once

#include "Packwright/Backend.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief Base for backends whose tree is rendered from a template, filled
 * with the app sources and built by a configurable command
 *
 * Settings read from the effective configuration:
 * - `template`, `template_branch`: scaffold source (a built-in layout when unset)
 * - `sources`, `test_sources`, `requires`, `test_requires`: populate inputs
 * - `install_command`, `build_command`, `run_command`, `test_command`:
 *   a string runs through `/bin/sh -c`, a list runs as an argument vector
 * - `artefact`: compiled artefact relative to the tree (default `bin/<app>`)
 * - `build_noise`: regexes of build output lines hidden from the console
 * - `test_success_regex`, `test_failure_regex`, `env`
 */
class NativeBackend : public PlatformBackend {
public:
    static const char* DEFAULT_TEST_SUCCESS_REGEX;
    static const char* DEFAULT_TEST_FAILURE_REGEX;

    ProjectTree scaffold(BackendContext& context) override;
    void populate(BackendContext& context) override;
    std::filesystem::path compile(BackendContext& context) override;
    ProcessResult execute(BackendContext& context, ExecuteMode mode) override;

    /**
     * @brief Replace `{name}` placeholders in a command
     * @param command Command text
     * @param values Placeholder values by name
     * @param quote Single-quote each value for the shell
     * @return Expanded command; unknown placeholders are left untouched
     */
    static std::string expandPlaceholders(const std::string& command,
                                          const std::map<std::string, std::string>& values,
                                          bool quote);

    /**
     * @brief Quote a value for `/bin/sh`
     */
    static std::string shellQuote(const std::string& value);

protected:
    /**
     * @brief Directory receiving the app sources
     */
    std::filesystem::path appDirectory(const BackendContext& context) const;

    /**
     * @brief Output of the build command
     */
    std::filesystem::path buildOutput(const BackendContext& context) const;

    /**
     * @brief Program run by the execute stage when no run command is set
     */
    virtual std::filesystem::path launchPath(const BackendContext& context) const;

    /**
     * @brief Files written when no template is configured
     */
    virtual std::map<std::string, std::string> builtinLayout() const;

    /**
     * @brief App source directory as seen from the built launcher
     */
    virtual std::string launcherAppDirectory() const { return "../app"; }

    /**
     * @brief Distributable location: dist/<app>-<version>-<platform>-<arch>.<ext>
     */
    std::filesystem::path distributablePath(const BackendContext& context, const std::string& extension) const;

    /**
     * @brief Run a configured command from a setting
     * @param context Backend context
     * @param key Setting holding the command
     * @param default_command Used when the setting is absent; empty = skip
     * @param extra Additional placeholder values
     * @return False if the command was skipped
     * @throws ToolInvocationFailed if the command fails
     */
    bool runConfiguredCommand(BackendContext& context, const std::string& key,
                              const std::vector<std::string>& default_command,
                              const std::map<std::string, std::string>& extra = {});

    /**
     * @brief Invocation for a configured command; args are empty when nothing is configured
     */
    ToolInvocation commandInvocation(const BackendContext& context, const std::string& key,
                                     const std::vector<std::string>& default_command,
                                     const std::map<std::string, std::string>& extra,
                                     const std::vector<std::string>& trailing_args = {}) const;

    /**
     * @brief Environment shared by every command run for the app
     */
    std::map<std::string, std::string> commandEnvironment(const BackendContext& context) const;

    std::map<std::string, std::string> placeholderValues(const BackendContext& context) const;
};

} // namespace Packwright
