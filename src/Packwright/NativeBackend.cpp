// =================================================================
// src/Packwright/NativeBackend.cpp
// =================================================================
// Implementation for the shared native backend lifecycle.

#include "Packwright/NativeBackend.hpp"
#include "Packwright/Environment.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/IgnorePattern.hpp"
#include "Packwright/Logger.hpp"
#include "Packwright/OutputFilter.hpp"
#include "Packwright/TemplateProvisioner.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

const char* BUILTIN_MAKEFILE =
    "# Build rules for {{ formal_name }}, generated by Packwright.\n"
    "APP = {{ app_name }}\n"
    "ENTRY = {{ entry_point }}\n"
    "\n"
    "all: bin/$(APP)\n"
    "\n"
    "bin/$(APP): FORCE\n"
    "\tmkdir -p bin\n"
    "\tprintf '#!/bin/sh\\ncd \"$$(dirname \"$$0\")/{{ launcher_app_dir }}\" || exit 1\\nexec %s \"$$@\"\\n'"
    " '$(ENTRY)' > bin/$(APP)\n"
    "\tchmod +x bin/$(APP)\n"
    "\n"
    "FORCE:\n"
    ".PHONY: all FORCE\n";

/**
 * @brief Copy a source directory, skipping ignored entries
 */
void copyTree(const fs::path& origin, const fs::path& target, const IgnorePatternSet& ignored) {
    fs::create_directories(target);
    for (auto it = fs::recursive_directory_iterator(origin); it != fs::recursive_directory_iterator(); ++it) {
        std::string relative = fs::relative(it->path(), origin).generic_string();
        bool is_directory = it->is_directory();
        if (ignored.shouldIgnore(relative, is_directory)) {
            if (is_directory) {
                it.disable_recursion_pending();
            }
            continue;
        }

        fs::path destination = target / relative;
        if (it->is_symlink()) {
            fs::create_directories(destination.parent_path());
            fs::copy_symlink(it->path(), destination);
        } else if (is_directory) {
            fs::create_directories(destination);
        } else {
            fs::create_directories(destination.parent_path());
            fs::copy_file(it->path(), destination, fs::copy_options::overwrite_existing);
        }
    }
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += line + "\n";
    }
    return text;
}

} // anonymous namespace

const char* NativeBackend::DEFAULT_TEST_SUCCESS_REGEX = ">>>>>>>>>> EXIT 0 <<<<<<<<<<";
const char* NativeBackend::DEFAULT_TEST_FAILURE_REGEX = ">>>>>>>>>> EXIT [1-9][0-9]* <<<<<<<<<<";

std::string NativeBackend::shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string NativeBackend::expandPlaceholders(const std::string& command,
                                              const std::map<std::string, std::string>& values,
                                              bool quote) {
    std::string result;
    size_t pos = 0;
    while (pos < command.size()) {
        size_t open = command.find('{', pos);
        if (open == std::string::npos) {
            result.append(command, pos, std::string::npos);
            break;
        }
        size_t close = command.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(command, pos, std::string::npos);
            break;
        }

        result.append(command, pos, open - pos);
        auto it = values.find(command.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            result += '{';
            pos = open + 1;
            continue;
        }
        result += quote ? shellQuote(it->second) : it->second;
        pos = close + 1;
    }
    return result;
}

fs::path NativeBackend::appDirectory(const BackendContext& context) const {
    return context.tree.root / "app";
}

fs::path NativeBackend::buildOutput(const BackendContext& context) const {
    std::string configured = context.config.getString("artefact");
    if (!configured.empty()) {
        return context.tree.root / configured;
    }
    return context.tree.root / "bin" / context.config.appName();
}

fs::path NativeBackend::launchPath(const BackendContext& context) const {
    return buildOutput(context);
}

std::map<std::string, std::string> NativeBackend::builtinLayout() const {
    return {{"Makefile", BUILTIN_MAKEFILE}};
}

fs::path NativeBackend::distributablePath(const BackendContext& context, const std::string& extension) const {
    std::string name = context.config.appName();
    std::string version = context.config.version();
    if (!version.empty()) {
        name += "-" + version;
    }
    name += "-" + platform() + "-" + detectHost().arch + "." + extension;
    return context.distDirectory() / name;
}

std::map<std::string, std::string> NativeBackend::placeholderValues(const BackendContext& context) const {
    return {
        {"tree", context.tree.root.string()},
        {"app", appDirectory(context).string()},
        {"requirements", (context.tree.root / "requirements.txt").string()},
        {"artefact", buildOutput(context).string()},
        {"format", outputFormat()},
        {"name", context.config.appName()},
        {"version", context.config.version()}
    };
}

std::map<std::string, std::string> NativeBackend::commandEnvironment(const BackendContext& context) const {
    std::map<std::string, std::string> environment = context.config.getTable("env");
    environment["PACKWRIGHT_APP"] = context.config.appName();
    environment["PACKWRIGHT_TREE"] = context.tree.root.string();
    environment["PACKWRIGHT_PLATFORM"] = platform();
    environment["PACKWRIGHT_FORMAT"] = outputFormat();
    return environment;
}

ToolInvocation NativeBackend::commandInvocation(const BackendContext& context, const std::string& key,
                                                const std::vector<std::string>& default_command,
                                                const std::map<std::string, std::string>& extra,
                                                const std::vector<std::string>& trailing_args) const {
    auto values = placeholderValues(context);
    for (const auto& [name, value] : extra) {
        values[name] = value;
    }

    ToolInvocation invocation;
    const ConfigValue& configured = context.config.get(key);
    if (configured.kind() == ConfigValue::Kind::SCALAR) {
        std::string script = expandPlaceholders(configured.asString(), values, true);
        for (const auto& arg : trailing_args) {
            script += " " + shellQuote(arg);
        }
        invocation.args = {"/bin/sh", "-c", script};
        invocation.tool_name = key;
    } else if (configured.kind() == ConfigValue::Kind::LIST) {
        for (const auto& arg : configured.asList()) {
            invocation.args.push_back(expandPlaceholders(arg, values, false));
        }
        invocation.args.insert(invocation.args.end(), trailing_args.begin(), trailing_args.end());
    } else if (configured.kind() == ConfigValue::Kind::TABLE) {
        throw MalformedConfig("'" + key + "' must be a command string or a list of arguments");
    } else if (!default_command.empty()) {
        invocation.args = default_command;
        invocation.args.insert(invocation.args.end(), trailing_args.begin(), trailing_args.end());
    }

    if (invocation.args.empty()) {
        return invocation;
    }

    invocation.working_directory = context.tree.root.string();
    invocation.env_overlay = commandEnvironment(context);
    return invocation;
}

bool NativeBackend::runConfiguredCommand(BackendContext& context, const std::string& key,
                                         const std::vector<std::string>& default_command,
                                         const std::map<std::string, std::string>& extra) {
    ToolInvocation invocation = commandInvocation(context, key, default_command, extra);
    if (invocation.args.empty()) {
        return false;
    }

    auto noise = context.config.getList("build_noise");
    if (!noise.empty()) {
        auto filter = std::make_shared<PatternNoiseFilter>();
        for (const auto& pattern : noise) {
            filter->suppress(pattern);
        }
        invocation.filter = filter;
    }

    Logger::getInstance().debug("Backend", "Running " + key + " for " + context.config.appName(),
                                invocation.commandLine());
    context.supervisor.checkOutput(invocation);
    return true;
}

ProjectTree NativeBackend::scaffold(BackendContext& context) {
    const EffectiveConfig& config = context.config;
    ProjectTree tree = treeFor(config, context.project_root);

    std::map<std::string, std::string> render_context = config.templateContext();
    render_context["platform"] = platform();
    render_context["output_format"] = outputFormat();
    render_context["packwright_version"] = toolVersion();
    render_context["launcher_app_dir"] = launcherAppDirectory();
    if (render_context.count("entry_point") == 0) {
        render_context["entry_point"] = "python3 -m " + config.moduleName();
    }

    std::string location = config.getString("template");
    if (!location.empty()) {
        ScaffoldRequest request;
        request.source.location = location;
        if (!request.source.isRemote() && fs::path(location).is_relative()) {
            request.source.location = (context.project_root / location).string();
        }
        request.source.branch = config.getString("template_branch");
        request.context = render_context;
        request.destination = tree.root;
        context.templates.provision(request);
    } else {
        Logger::getInstance().debug("Backend", "No template configured for " + config.appName() +
                                    "; using the built-in layout");
        ScopedTempDirectory staging(tree.root.parent_path(), "." + tree.root.filename().string() + ".render-");
        for (const auto& [relative, content] : builtinLayout()) {
            fs::path target = staging.path() / TemplateProvisioner::render(relative, render_context, relative);
            fs::create_directories(target.parent_path());
            writeFileAtomic(target, TemplateProvisioner::render(content, render_context, relative));
        }
        replaceDirectory(staging.path(), tree.root);
    }

    fs::create_directories(tree.metadataDirectory());
    context.tree = tree;
    return tree;
}

void NativeBackend::populate(BackendContext& context) {
    const EffectiveConfig& config = context.config;
    auto& logger = Logger::getInstance();

    IgnorePatternSet ignored({"__pycache__/", "*.pyc", ".git/", ".packwright/", ".DS_Store"});
    ignored.addPatterns(config.getList("exclude"));

    std::vector<std::string> sources = config.getList("sources");
    std::vector<std::string> requirements = config.getList("requires");
    if (context.test_mode) {
        auto test_sources = config.getList("test_sources");
        sources.insert(sources.end(), test_sources.begin(), test_sources.end());
        auto test_requires = config.getList("test_requires");
        requirements.insert(requirements.end(), test_requires.begin(), test_requires.end());
    }

    ScopedTempDirectory staging(context.tree.root, ".app.populate-");
    for (const auto& source : sources) {
        fs::path origin = fs::path(source).is_absolute() ? fs::path(source) : context.project_root / source;
        std::error_code ec;
        if (!fs::exists(origin, ec)) {
            throw UserError("Source '" + source + "' of " + config.appName() + " does not exist");
        }

        fs::path name = origin.filename();
        if (name.empty()) {
            name = origin.parent_path().filename();
        }
        fs::path target = staging.path() / name;
        if (fs::is_directory(origin, ec)) {
            copyTree(origin, target, ignored);
        } else {
            fs::copy_file(origin, target, fs::copy_options::overwrite_existing);
        }
        logger.debug("Backend", "Copied " + source, target.string());
    }

    replaceDirectory(staging.path(), appDirectory(context));
    writeFileAtomic(context.tree.root / "requirements.txt", joinLines(requirements));

    if (!requirements.empty()) {
        runConfiguredCommand(context, "install_command", {});
    }
}

fs::path NativeBackend::compile(BackendContext& context) {
    runConfiguredCommand(context, "build_command", {"make"});

    fs::path artefact = buildOutput(context);
    std::error_code ec;
    if (!fs::exists(artefact, ec)) {
        throw ToolInvocationFailed("build_command", 0, "",
                                   "Build of " + context.config.appName() + " finished without producing " +
                                   artefact.string());
    }
    return artefact;
}

ProcessResult NativeBackend::execute(BackendContext& context, ExecuteMode mode) {
    const EffectiveConfig& config = context.config;
    std::string key = mode == ExecuteMode::TEST && config.has("test_command") ? "test_command" : "run_command";

    ToolInvocation invocation = commandInvocation(context, key, {launchPath(context).string()}, {},
                                                  context.options.passthrough_args);
    invocation.tool_name = config.appName();

    switch (mode) {
        case ExecuteMode::TEST:
            invocation.success_patterns = {config.getString("test_success_regex", DEFAULT_TEST_SUCCESS_REGEX)};
            invocation.failure_patterns = {config.getString("test_failure_regex", DEFAULT_TEST_FAILURE_REGEX)};
            invocation.env_overlay["PACKWRIGHT_TEST"] = "1";
            invocation.echo = true;
            break;
        case ExecuteMode::DEBUG:
            invocation.mode = StreamMode::INTERACTIVE;
            invocation.env_overlay["PACKWRIGHT_DEBUG"] = "1";
            break;
        case ExecuteMode::NORMAL:
        default:
            invocation.echo = true;
            break;
    }

    Logger::getInstance().info("Backend", "Starting " + config.appName() + " (" + executeModeToString(mode) + ")");
    return context.supervisor.run(invocation);
}

} // namespace Packwright
