// =================================================================
// src/Packwright/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Packwright/Core.hpp"
#include "Packwright/Downloader.hpp"
#include "Packwright/Environment.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include "Packwright/Pipeline.hpp"
#include "Packwright/ProcessSupervisor.hpp"
#include "Packwright/ProjectConfig.hpp"
#include "Packwright/TemplateProvisioner.hpp"
#include "Packwright/ToolRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

const char* DEFAULT_DESCRIPTOR = R"(# Packwright project descriptor
project_name: "{{ formal_name }}"
bundle: "{{ bundle }}"
version: "0.0.1"
description: "My first application"
license: "MIT"

apps:
  {{ app_name }}:
    formal_name: "{{ formal_name }}"
    description: "My first application"
    sources:
      - src/{{ module_name }}
    test_sources:
      - tests
    requires: []

    linux:
      system:
        packaging_format: tar.gz

    macOS:
      app:
        packaging_format: dmg
        # signing_identity: "Developer ID Application: Example (TEAMID)"
        # notarization_profile: "packwright-notary"
)";

const char* DEFAULT_MAIN = R"(import os
import sys
import unittest


def main():
    print("Hello from {{ formal_name }}!")


def run_tests():
    suite = unittest.defaultTestLoader.discover("tests")
    result = unittest.TextTestRunner(verbosity=2).run(suite)
    code = 0 if result.wasSuccessful() else 1
    print(">>>>>>>>>> EXIT %d <<<<<<<<<<" % code)
    return code


if __name__ == "__main__":
    if os.environ.get("PACKWRIGHT_TEST"):
        sys.exit(run_tests())
    main()
)";

const char* DEFAULT_TEST = R"(import unittest


class FirstTest(unittest.TestCase):
    def test_first(self):
        self.assertTrue(True)
)";

std::string titleCase(const std::string& name) {
    std::string formal;
    bool start = true;
    for (char c : name) {
        if (c == '-' || c == '_') {
            formal += ' ';
            start = true;
        } else {
            formal += start ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
            start = false;
        }
    }
    return formal;
}

std::string moduleName(const std::string& name) {
    std::string module = name;
    std::replace(module.begin(), module.end(), '-', '_');
    return module;
}

std::map<std::string, std::string> newProjectContext(const std::string& app_name, const std::string& bundle) {
    return {
        {"app_name", app_name},
        {"formal_name", titleCase(app_name)},
        {"module_name", moduleName(app_name)},
        {"bundle", bundle},
        {"packwright_version", toolVersion()}
    };
}

} // anonymous namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_backends(BackendRegistry::withBuiltinBackends())
{
    int verbosity = std::max(m_commands.verbosity, environmentVerbosity());

    auto& logger = Logger::getInstance();
    logger.initialize();
    logger.applyVerbosity(verbosity);

    m_supervisor = std::make_unique<ProcessSupervisor>(m_token, verbosity);
    m_tools = std::make_unique<ToolRegistry>(*m_supervisor, std::make_shared<HttpDownloader>());
    m_templates = std::make_unique<TemplateProvisioner>(*m_supervisor);
}

Core::~Core() = default;

int Core::run() {
    auto& logger = Logger::getInstance();
    auto start_time = std::chrono::steady_clock::now();
    logger.logSessionStart(m_commands.active_command, m_commands.platform + " " + m_commands.output_format);

    int exit_code = ExitCode::SUCCESS;
    try {
        if (m_commands.active_command == "new") {
            exit_code = handleNew();
        } else if (m_commands.active_command == "scaffold") {
            exit_code = handleStage(PipelineStage::SCAFFOLD);
        } else if (m_commands.active_command == "populate") {
            exit_code = handleStage(PipelineStage::POPULATE);
        } else if (m_commands.active_command == "compile") {
            exit_code = handleStage(PipelineStage::COMPILE);
        } else if (m_commands.active_command == "execute") {
            exit_code = handleStage(PipelineStage::EXECUTE);
        } else if (m_commands.active_command == "package") {
            exit_code = handleStage(PipelineStage::PACKAGE);
        } else if (m_commands.active_command == "tools") {
            exit_code = handleTools();
        } else if (m_commands.active_command.empty()) {
            exit_code = ExitCode::SUCCESS;
        } else {
            throw UserError("Unknown command '" + m_commands.active_command + "'");
        }
    } catch (const PackwrightError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (auto* invocation = dynamic_cast<const ToolInvocationFailed*>(&e)) {
            if (!invocation->output().empty() && m_supervisor->verbosity() == 0) {
                std::cerr << invocation->output() << std::endl;
            }
        }
        logger.error("Core", e.what(), PackwrightError::getKindName(e.kind()));
        exit_code = e.exitCode();
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration.count()));
    logger.flush();
    return exit_code;
}

std::map<std::string, std::string> Core::defaultProjectFiles(const std::string& app_name, const std::string& bundle) {
    auto context = newProjectContext(app_name, bundle);
    std::string module = context["module_name"];

    std::map<std::string, std::string> files = {
        {ProjectDescriptor::DEFAULT_FILENAME, DEFAULT_DESCRIPTOR},
        {"src/" + module + "/__init__.py", ""},
        {"src/" + module + "/__main__.py", DEFAULT_MAIN},
        {"tests/__init__.py", ""},
        {"tests/test_" + module + ".py", DEFAULT_TEST}
    };
    for (auto& [path, content] : files) {
        content = TemplateProvisioner::render(content, context, path);
    }
    return files;
}

int Core::handleNew() {
    static const std::regex name_pattern("^[a-z][a-z0-9_-]*$");
    const std::string& name = m_commands.app_name;
    if (!std::regex_match(name, name_pattern)) {
        throw UserError("'" + name + "' is not a valid app name; use lowercase letters, digits, '-' and '_', "
                        "starting with a letter");
    }

    fs::path destination = fs::current_path() / name;
    std::error_code ec;
    if (fs::exists(destination, ec) && !m_commands.force) {
        throw UserError("Directory " + destination.string() + " already exists (use --force to replace it)");
    }

    std::cout << "Creating project " << name << "..." << std::endl;
    if (!m_commands.template_location.empty()) {
        ScaffoldRequest request;
        request.source.location = m_commands.template_location;
        request.source.branch = m_commands.template_branch;
        request.context = newProjectContext(name, m_commands.bundle);
        request.destination = destination;
        m_templates->provision(request);
    } else {
        ScopedTempDirectory staging(fs::current_path(), "." + name + ".new-");
        for (const auto& [path, content] : defaultProjectFiles(name, m_commands.bundle)) {
            fs::path target = staging.path() / path;
            fs::create_directories(target.parent_path());
            writeFileAtomic(target, content);
        }
        replaceDirectory(staging.path(), destination);
    }

    std::cout << "✓ Created " << destination.string() << std::endl;
    std::cout << "\nNext: cd " << name << " && packwright execute" << std::endl;
    return ExitCode::SUCCESS;
}

PipelineRequest Core::buildRequest(PipelineStage verb, const ProjectDescriptor& descriptor) const {
    PipelineRequest request;
    request.verb = verb;
    request.platform = m_commands.platform;
    request.output_format = m_commands.output_format;
    request.apps = m_commands.apps;
    request.jobs = m_commands.jobs;

    PipelineOptions& options = request.options;
    options.force = m_commands.force;
    if (m_commands.test_mode) {
        options.execute_mode = ExecuteMode::TEST;
    } else if (m_commands.debug_mode) {
        options.execute_mode = ExecuteMode::DEBUG;
    }
    options.packaging_format = m_commands.packaging_format;
    options.signing_identity = m_commands.identity;
    options.adhoc_sign = m_commands.adhoc_sign;
    options.notarize = !m_commands.no_notarize;
    options.submission_id = m_commands.submission_id;
    options.passthrough_args = m_commands.passthrough_args;
    options.overrides = descriptor.overridesFor(m_commands.config_overrides);
    return request;
}

int Core::handleStage(PipelineStage verb) {
    ProjectDescriptor descriptor = ProjectDescriptor::load(m_commands.descriptor_path);
    PipelineRequest request = buildRequest(verb, descriptor);
    if (!m_commands.submission_id.empty() && descriptor.selectApps(m_commands.apps).size() != 1) {
        throw UserError("--submission-id needs exactly one app; select it with --app");
    }
    registerBackendTools();

    SignalGuard signals;
    Pipeline pipeline(descriptor, m_backends, *m_tools, *m_supervisor, *m_templates, m_token);
    return reportResults(pipeline.runAll(request));
}

int Core::reportResults(const std::vector<PipelineResult>& results) const {
    for (const auto& result : results) {
        std::string target = result.app_name + " (" + result.platform + "/" + result.output_format + ")";
        if (result.succeeded()) {
            std::cout << "✓ " << target;
            if (!result.artefact.empty()) {
                std::cout << ": " << result.artefact;
            }
            std::cout << std::endl;
            continue;
        }

        if (result.state == PipelineState::CANCELLED) {
            std::cerr << "✗ " << target << " cancelled" << std::endl;
            continue;
        }

        std::cerr << "✗ " << target;
        if (!result.failed_stage.empty()) {
            std::cerr << " failed during " << result.failed_stage;
        }
        std::cerr << ": " << result.error_message << std::endl;
        if (result.error_kind == ErrorKind::TOOL_INVOCATION_FAILED && !result.output.empty() &&
            m_supervisor->verbosity() == 0) {
            std::cerr << result.output << std::endl;
        }
    }
    return Pipeline::exitCodeFor(results);
}

void Core::registerBackendTools() {
    for (const auto& platform : m_backends.platforms()) {
        for (const auto& format : m_backends.formats(platform)) {
            auto backend = m_backends.create(platform, format);
            for (PipelineStage stage : allStages()) {
                for (const auto& packaging : backend->packagingFormats()) {
                    for (const auto& spec : backend->requiredTools(stage, packaging)) {
                        if (!m_tools->hasTool(spec.name)) {
                            m_tools->registerTool(spec);
                        }
                    }
                }
            }
        }
    }
}

int Core::handleTools() {
    registerBackendTools();

    if (m_commands.tools_subcommand == "list") {
        std::cout << std::left << std::setw(14) << "TOOL" << std::setw(15) << "STATUS"
                  << std::setw(10) << "ORIGIN" << std::setw(12) << "VERSION" << "PATH" << std::endl;
        for (const auto& listing : m_tools->list()) {
            const auto& resolution = listing.resolution;
            std::cout << std::left << std::setw(14) << listing.spec.name
                      << std::setw(15) << toolStatusToString(resolution.status)
                      << std::setw(10) << toolOriginToString(resolution.origin)
                      << std::setw(12) << (resolution.detected_version.empty() ? "-" : resolution.detected_version)
                      << (resolution.path.empty() ? "-" : resolution.path.string()) << std::endl;
        }
        return ExitCode::SUCCESS;
    }

    if (m_commands.tools_subcommand == "upgrade") {
        std::vector<std::string> names = m_commands.tool_names;
        if (names.empty()) {
            for (const auto& name : m_tools->toolNames()) {
                ToolSpec spec = m_tools->getSpec(name);
                if (!spec.url.empty() && spec.supportsHost(m_tools->host())) {
                    names.push_back(name);
                }
            }
        }
        if (names.empty()) {
            std::cout << "No managed tools to upgrade." << std::endl;
            return ExitCode::SUCCESS;
        }

        SignalGuard signals;
        for (const auto& name : names) {
            fs::path path = m_tools->upgrade(name);
            std::cout << "✓ " << name << ": " << path.string() << std::endl;
        }
        return ExitCode::SUCCESS;
    }

    throw UserError("Unknown tools command '" + m_commands.tools_subcommand + "'");
}

} // namespace Packwright
