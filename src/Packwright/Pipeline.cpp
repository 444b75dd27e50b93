// =================================================================
// src/Packwright/Pipeline.cpp
// =================================================================
// Implementation for stage sequencing.

#include "Packwright/Pipeline.hpp"
#include "Packwright/Logger.hpp"
#include "Packwright/WorkerPool.hpp"
#include <algorithm>
#include <future>

namespace Packwright {

std::string pipelineStateToString(PipelineState state) {
    switch (state) {
        case PipelineState::SUCCEEDED: return "succeeded";
        case PipelineState::FAILED: return "failed";
        case PipelineState::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

Pipeline::Pipeline(const ProjectDescriptor& descriptor, const BackendRegistry& backends, ToolRegistry& tools,
                   ProcessSupervisor& supervisor, TemplateProvisioner& templates, const CancellationToken& token)
    : m_descriptor(descriptor),
      m_backends(backends),
      m_tools(tools),
      m_supervisor(supervisor),
      m_templates(templates),
      m_token(token) {
}

std::string Pipeline::resolvePlatform(const PipelineRequest& request) const {
    if (!request.platform.empty()) {
        return request.platform;
    }
    return BackendRegistry::defaultPlatformFor(m_tools.host());
}

PipelineResult Pipeline::run(const std::string& app_name, const PipelineRequest& request) {
    auto& logger = Logger::getInstance();

    PipelineResult result;
    result.app_name = app_name;
    result.platform = resolvePlatform(request);

    std::string current_stage;
    try {
        result.output_format = request.output_format.empty()
            ? m_backends.defaultFormat(result.platform)
            : request.output_format;

        EffectiveConfig config = m_descriptor.resolve(app_name, result.platform, result.output_format,
                                                      request.options.overrides);

        // Reject unsupported targets before any tool or file is touched
        auto backend = m_backends.create(result.platform, result.output_format);
        std::string packaging_format;
        if (request.verb == PipelineStage::PACKAGE) {
            packaging_format = backend->resolvePackagingFormat(config, request.options);
        }

        ProjectTree tree = backend->treeFor(config, m_descriptor.rootDirectory());
        BackendContext context(config, tree, m_descriptor.rootDirectory(), request.options,
                               m_supervisor, m_templates, m_token);
        context.test_mode = request.verb == PipelineStage::EXECUTE &&
                            request.options.execute_mode == ExecuteMode::TEST;
        StageMarkers markers(tree);

        std::vector<PipelineStage> stages = prerequisites(request.verb);
        stages.push_back(request.verb);
        for (PipelineStage stage : stages) {
            bool requested = stage == request.verb;
            if (!requested && !request.options.force && markers.isComplete(stage, context.test_mode)) {
                logger.logStageTransition(app_name, stageName(stage), "skipped");
                continue;
            }
            current_stage = stageName(stage);
            runStage(stage, *backend, context, markers, packaging_format, result);
            current_stage.clear();
        }

        result.state = PipelineState::SUCCEEDED;
        result.exit_code = ExitCode::SUCCESS;
    } catch (PackwrightError& e) {
        if (e.stage().empty() && !current_stage.empty()) {
            e.setStage(current_stage);
        }
        result.state = e.kind() == ErrorKind::CANCELLED ? PipelineState::CANCELLED : PipelineState::FAILED;
        result.error_message = e.what();
        result.error_kind = e.kind();
        result.failed_stage = e.stage();
        result.tool = e.tool();
        result.exit_code = e.exitCode();
        if (auto* invocation = dynamic_cast<ToolInvocationFailed*>(&e)) {
            result.output = invocation->output();
        }
    } catch (const std::exception& e) {
        result.state = PipelineState::FAILED;
        result.error_message = e.what();
        result.failed_stage = current_stage;
        result.exit_code = 1;
    }

    if (!current_stage.empty()) {
        logger.logStageTransition(app_name, current_stage,
                                  result.state == PipelineState::CANCELLED ? "cancelled" : "failed");
    }
    if (!result.succeeded()) {
        logger.error(app_name, result.error_message,
                     result.failed_stage.empty() ? "" : "stage: " + result.failed_stage);
    }
    return result;
}

void Pipeline::runStage(PipelineStage stage, PlatformBackend& backend, BackendContext& context,
                        StageMarkers& markers, const std::string& packaging_format, PipelineResult& result) {
    auto& logger = Logger::getInstance();
    const std::string& app_name = context.config.appName();

    m_token.throwIfCancelled();

    auto tools = backend.requiredTools(stage, packaging_format);
    for (const auto& spec : tools) {
        if (!m_tools.hasTool(spec.name)) {
            m_tools.registerTool(spec);
        }
    }
    for (const auto& [name, path] : m_tools.ensureAll(tools)) {
        context.tool_paths[name] = path;
    }

    logger.logStageTransition(app_name, stageName(stage), "started");
    markers.invalidateFrom(stage);

    std::string artefact;
    switch (stage) {
        case PipelineStage::SCAFFOLD:
            context.tree = backend.scaffold(context);
            break;
        case PipelineStage::POPULATE:
            backend.populate(context);
            break;
        case PipelineStage::COMPILE:
            artefact = backend.compile(context).string();
            break;
        case PipelineStage::EXECUTE: {
            ProcessResult run = backend.execute(context, context.options.execute_mode);
            result.output = run.output;
            if (run.outcome == RunOutcome::CANCELLED) {
                throw Cancelled();
            }
            if (!run.succeeded()) {
                std::string summary = app_name + " " +
                    (context.test_mode ? "test suite failed" : "exited with an error") +
                    " (exit code " + std::to_string(run.exit_code) + ")";
                if (!run.matched_line.empty()) {
                    summary += ": " + run.matched_line;
                }
                throw ToolInvocationFailed(app_name, run.exit_code, run.output, summary);
            }
            break;
        }
        case PipelineStage::PACKAGE:
            artefact = backend.package(context, packaging_format).string();
            break;
    }

    markers.markComplete(stage, stage == PipelineStage::SCAFFOLD ? false : context.test_mode, artefact);
    result.stages_run.push_back(stage);
    if (!artefact.empty()) {
        result.artefact = artefact;
    }
    logger.logStageTransition(app_name, stageName(stage), "completed");
}

std::vector<PipelineResult> Pipeline::runAll(const PipelineRequest& request) {
    std::vector<std::string> apps = m_descriptor.selectApps(request.apps);

    size_t threads = std::max<size_t>(1, std::min(request.jobs, apps.size()));
    WorkerPool pool(threads, m_token);

    std::vector<std::future<PipelineResult>> futures;
    futures.reserve(apps.size());
    for (const auto& app : apps) {
        futures.push_back(pool.submit(
            [this, app, &request]() { return run(app, request); },
            [this, app, &request]() { return notStarted(app, request); }));
    }

    std::vector<PipelineResult> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

PipelineResult Pipeline::notStarted(const std::string& app_name, const PipelineRequest& request) const {
    PipelineResult result;
    result.state = PipelineState::CANCELLED;
    result.app_name = app_name;
    result.platform = resolvePlatform(request);
    result.output_format = request.output_format;
    result.error_kind = ErrorKind::CANCELLED;
    result.error_message = Cancelled().what();
    result.exit_code = ExitCode::CANCELLED;
    Logger::getInstance().info(app_name, "Not started: cancelled while queued");
    return result;
}

int Pipeline::exitCodeFor(const std::vector<PipelineResult>& results) {
    for (const auto& result : results) {
        if (!result.succeeded()) {
            return result.exit_code;
        }
    }
    return ExitCode::SUCCESS;
}

} // namespace Packwright
