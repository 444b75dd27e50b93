// =================================================================
// tests/PipelineTest.cpp
// =================================================================
// Unit tests for stage sequencing, completion markers and multi-app runs.

#include "Packwright/Pipeline.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::mutex g_calls_mutex;
std::vector<std::string> g_calls;
std::atomic<int> g_compile_failures{0};
std::atomic<Packwright::CancellationToken*> g_cancel_when_packaged{nullptr};

void recordCall(const std::string& call) {
    std::lock_guard<std::mutex> lock(g_calls_mutex);
    g_calls.push_back(call);
}

std::vector<std::string> takeCalls() {
    std::lock_guard<std::mutex> lock(g_calls_mutex);
    std::vector<std::string> calls;
    calls.swap(g_calls);
    return calls;
}

void touch(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

/**
 * @brief In-memory backend that records every operation it performs
 */
class RecordingBackend : public Packwright::PlatformBackend {
public:
    std::string platform() const override { return "fakeos"; }
    std::string outputFormat() const override { return "bundle"; }
    std::vector<std::string> packagingFormats() const override { return {"zip", "tar"}; }
    std::string defaultPackagingFormat() const override { return "zip"; }

    std::vector<Packwright::ToolSpec> requiredTools(Packwright::PipelineStage stage,
                                                    const std::string& /*packaging_format*/) const override {
        if (stage != Packwright::PipelineStage::COMPILE) {
            return {};
        }
        Packwright::ToolSpec shell;
        shell.name = "sh";
        shell.verify_args = {"-c", "echo sh 1.0"};
        return {shell};
    }

    Packwright::ProjectTree scaffold(Packwright::BackendContext& context) override {
        recordCall(context.config.appName() + ":scaffold");
        touch(context.tree.root / "scaffold.txt", "scaffolded");
        return context.tree;
    }

    void populate(Packwright::BackendContext& context) override {
        recordCall(context.config.appName() + ":populate");
        touch(context.tree.root / "app" / "main.py", context.test_mode ? "tests" : "app");
    }

    fs::path compile(Packwright::BackendContext& context) override {
        recordCall(context.config.appName() + ":compile");
        assert(context.tool_paths.count("sh") == 1 && "Required tools should be ensured before the stage");
        if (context.config.getString("fail_compile") == "true" && g_compile_failures.load() > 0) {
            --g_compile_failures;
            throw Packwright::ToolInvocationFailed("fakecc", 1, "boom\n", "fakecc could not compile");
        }
        fs::path artefact = context.tree.root / "bin" / context.config.appName();
        touch(artefact, "binary");
        return artefact;
    }

    Packwright::ProcessResult execute(Packwright::BackendContext& context, Packwright::ExecuteMode mode) override {
        recordCall(context.config.appName() + ":execute:" + Packwright::executeModeToString(mode));
        Packwright::ProcessResult result;
        if (mode == Packwright::ExecuteMode::TEST && context.config.getString("test_result") == "fail") {
            result.exit_code = 1;
            result.output = "FAILED (failures=1)\n";
            result.matched_line = "FAILED (failures=1)";
            result.outcome = Packwright::RunOutcome::FAILED;
            return result;
        }
        result.exit_code = 0;
        result.output = "hello\n";
        result.outcome = Packwright::RunOutcome::SUCCEEDED;
        return result;
    }

    fs::path package(Packwright::BackendContext& context, const std::string& format) override {
        recordCall(context.config.appName() + ":package:" + format);
        fs::path artefact = context.distDirectory() / (context.config.appName() + "." + format);
        touch(artefact, "archive");
        if (auto* token = g_cancel_when_packaged.load()) {
            token->cancel();
        }
        return artefact;
    }
};

} // anonymous namespace

class PipelineTest {
private:
    fs::path m_test_dir;
    Packwright::CancellationToken m_token;
    Packwright::ProcessSupervisor m_supervisor;
    Packwright::ToolRegistry m_tools;
    Packwright::TemplateProvisioner m_templates;
    Packwright::BackendRegistry m_backends;

    static fs::path makeTestDir() {
        fs::path dir = fs::temp_directory_path() / ("packwright-pipeline-test-" + Packwright::uniqueSuffix());
        fs::create_directories(dir);
        setenv("PACKWRIGHT_HOME", dir.c_str(), 1);
        return dir;
    }

    Packwright::ProjectDescriptor createProject(const std::string& name, const std::string& extra_apps = "") {
        fs::path root = m_test_dir / name;
        touch(root / "packwright.yml",
              "project_name: " + name + "\n"
              "bundle: com.example\n"
              "version: 1.0.0\n"
              "description: Pipeline test project\n"
              "sources: [src]\n"
              "apps:\n"
              "  alpha:\n"
              "    fail_compile: 'true'\n"
              "    test_result: pass\n" +
              extra_apps);
        return Packwright::ProjectDescriptor::load(root / "packwright.yml");
    }

    Packwright::PipelineRequest request(Packwright::PipelineStage verb) {
        Packwright::PipelineRequest req;
        req.verb = verb;
        req.platform = "fakeos";
        return req;
    }

    Packwright::StageMarkers markersFor(const Packwright::ProjectDescriptor& descriptor, const std::string& app) {
        Packwright::ProjectTree tree;
        tree.root = descriptor.rootDirectory() / "build" / app / "fakeos" / "bundle";
        return Packwright::StageMarkers(tree);
    }

    static bool sameStages(const std::vector<Packwright::PipelineStage>& actual,
                           const std::vector<Packwright::PipelineStage>& expected) {
        return actual == expected;
    }

public:
    PipelineTest()
        : m_test_dir(makeTestDir()),
          m_supervisor(m_token),
          m_tools(m_supervisor, std::make_shared<Packwright::HttpDownloader>(), m_test_dir / "cache"),
          m_templates(m_supervisor, m_test_dir / "cache", "0.1.0") {
        Packwright::Logger::getInstance().initialize((m_test_dir / "logs").string());
        Packwright::Logger::getInstance().setConsoleLogging(false);
        m_backends.registerBackend("fakeos", "bundle", [] {
            return std::make_unique<RecordingBackend>();
        });
    }

    ~PipelineTest() {
        Packwright::removeQuietly(m_test_dir);
    }

    void testPackageRunsEveryStageOnce() {
        std::cout << "Testing package on a fresh tree..." << std::endl;

        using Packwright::PipelineStage;
        auto descriptor = createProject("fresh");
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, m_token);
        takeCalls();

        auto result = pipeline.run("alpha", request(PipelineStage::PACKAGE));
        assert(result.succeeded() && "Package should succeed");
        assert(sameStages(result.stages_run, {PipelineStage::SCAFFOLD, PipelineStage::POPULATE,
                                              PipelineStage::COMPILE, PipelineStage::PACKAGE}) &&
               "Every stage should run once, in order");
        assert(result.output_format == "bundle" && "Default format of the platform should be used");
        assert(fs::path(result.artefact).filename() == "alpha.zip" && "Default packaging format is zip");

        auto calls = takeCalls();
        assert(calls.size() == 4 && calls[0] == "alpha:scaffold" && calls[3] == "alpha:package:zip" &&
               "Backend operations should be called in lifecycle order");

        auto markers = markersFor(descriptor, "alpha");
        for (auto stage : {PipelineStage::SCAFFOLD, PipelineStage::POPULATE,
                           PipelineStage::COMPILE, PipelineStage::PACKAGE}) {
            assert(markers.isComplete(stage, false) && "Every finished stage should leave a marker");
        }
        assert(!markers.isComplete(PipelineStage::EXECUTE, false) && "Execute never ran");

        auto again = pipeline.run("alpha", request(PipelineStage::PACKAGE));
        assert(again.succeeded() && "Second package should succeed");
        assert(sameStages(again.stages_run, {PipelineStage::PACKAGE}) &&
               "Completed prerequisites should be skipped");

        auto forced_request = request(PipelineStage::PACKAGE);
        forced_request.options.force = true;
        forced_request.options.packaging_format = "tar";
        auto forced = pipeline.run("alpha", forced_request);
        assert(forced.stages_run.size() == 4 && "--force should rerun every prerequisite");
        assert(fs::path(forced.artefact).filename() == "alpha.tar" && "Requested packaging format should be used");

        std::cout << "✓ Package on a fresh tree test passed" << std::endl;
    }

    void testFailedStageIsRetried() {
        std::cout << "Testing failed stage retry..." << std::endl;

        using Packwright::PipelineStage;
        auto descriptor = createProject("retry");
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, m_token);

        g_compile_failures = 1;
        auto failed = pipeline.run("alpha", request(PipelineStage::PACKAGE));
        assert(failed.state == Packwright::PipelineState::FAILED && "Compile failure should fail the pipeline");
        assert(failed.failed_stage == "compile" && "The failing stage should be reported");
        assert(failed.tool == "fakecc" && "The failing tool should be reported");
        assert(failed.output == "boom\n" && "Tool output should be kept verbatim");
        assert(failed.exit_code == Packwright::ExitCode::TOOL_FAILURE && "Tool failures exit with 4");
        assert(sameStages(failed.stages_run, {PipelineStage::SCAFFOLD, PipelineStage::POPULATE}) &&
               "Stages after the failure should not run");

        auto markers = markersFor(descriptor, "alpha");
        assert(!markers.isComplete(PipelineStage::COMPILE, false) && "A failed stage leaves no marker");
        assert(!markers.isComplete(PipelineStage::PACKAGE, false) && "Later stages leave no marker");
        assert(markers.isComplete(PipelineStage::POPULATE, false) && "Earlier stages keep their markers");

        auto retried = pipeline.run("alpha", request(PipelineStage::PACKAGE));
        assert(retried.succeeded() && "The retry should succeed");
        assert(sameStages(retried.stages_run, {PipelineStage::COMPILE, PipelineStage::PACKAGE}) &&
               "Only the failed stage and its dependents should rerun");

        std::cout << "✓ Failed stage retry test passed" << std::endl;
    }

    void testRunningStageInvalidatesDependents() {
        std::cout << "Testing marker invalidation..." << std::endl;

        using Packwright::PipelineStage;
        auto descriptor = createProject("invalidate");
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, m_token);

        assert(pipeline.run("alpha", request(PipelineStage::PACKAGE)).succeeded() && "Initial package");

        auto populated = pipeline.run("alpha", request(PipelineStage::POPULATE));
        assert(sameStages(populated.stages_run, {PipelineStage::POPULATE}) && "Populate reruns on request");

        auto markers = markersFor(descriptor, "alpha");
        assert(!markers.isComplete(PipelineStage::COMPILE, false) && "Compile depends on populate");
        assert(!markers.isComplete(PipelineStage::PACKAGE, false) && "Package depends on populate");
        assert(markers.isComplete(PipelineStage::SCAFFOLD, false) && "Scaffold is not a dependent");

        auto packaged = pipeline.run("alpha", request(PipelineStage::PACKAGE));
        assert(sameStages(packaged.stages_run, {PipelineStage::COMPILE, PipelineStage::PACKAGE}) &&
               "Invalidated stages should run again");

        auto executed = pipeline.run("alpha", request(PipelineStage::EXECUTE));
        assert(executed.succeeded() && executed.output == "hello\n" && "Execute should report the app output");
        assert(markers.isComplete(PipelineStage::PACKAGE, false) && "Executing does not invalidate packaging");

        std::cout << "✓ Marker invalidation test passed" << std::endl;
    }

    void testTestModeMarkers() {
        std::cout << "Testing test-mode markers..." << std::endl;

        using Packwright::PipelineStage;
        auto descriptor = createProject("testmode");
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, m_token);

        assert(pipeline.run("alpha", request(PipelineStage::COMPILE)).succeeded() && "Normal compile");

        auto test_request = request(PipelineStage::EXECUTE);
        test_request.options.execute_mode = Packwright::ExecuteMode::TEST;
        auto tested = pipeline.run("alpha", test_request);
        assert(tested.succeeded() && "Test run should pass");
        assert(sameStages(tested.stages_run, {PipelineStage::POPULATE, PipelineStage::COMPILE,
                                              PipelineStage::EXECUTE}) &&
               "Normal-mode markers do not satisfy a test run, scaffold is shared");

        auto repeated = pipeline.run("alpha", test_request);
        assert(sameStages(repeated.stages_run, {PipelineStage::EXECUTE}) && "Test-mode markers are reused");

        auto normal = pipeline.run("alpha", request(PipelineStage::COMPILE));
        assert(sameStages(normal.stages_run, {PipelineStage::POPULATE, PipelineStage::COMPILE}) &&
               "Test-mode markers do not satisfy a normal run");

        std::cout << "✓ Test-mode markers test passed" << std::endl;
    }

    void testFailingTestSuite() {
        std::cout << "Testing failing test suites..." << std::endl;

        auto descriptor = createProject("failing-tests",
                                        "  beta:\n"
                                        "    test_result: fail\n");
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, m_token);

        auto test_request = request(Packwright::PipelineStage::EXECUTE);
        test_request.options.execute_mode = Packwright::ExecuteMode::TEST;
        auto result = pipeline.run("beta", test_request);

        assert(result.state == Packwright::PipelineState::FAILED && "A failing suite fails the pipeline");
        assert(result.failed_stage == "execute" && "Failure is attributed to execute");
        assert(result.exit_code == Packwright::ExitCode::TOOL_FAILURE && "Failing suites exit with 4");
        assert(result.error_message.find("test suite failed") != std::string::npos && "Message names the suite");
        assert(result.error_message.find("FAILED (failures=1)") != std::string::npos && "Message quotes the marker");
        assert(result.output == "FAILED (failures=1)\n" && "Suite output is kept");

        std::cout << "✓ Failing test suites test passed" << std::endl;
    }

    void testMultiAppIsolation() {
        std::cout << "Testing multi-app isolation..." << std::endl;

        auto descriptor = createProject("multi",
                                        "  beta:\n"
                                        "    packaging_format: msi\n");
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, m_token);
        takeCalls();

        auto req = request(Packwright::PipelineStage::PACKAGE);
        req.jobs = 2;
        auto results = pipeline.runAll(req);

        assert(results.size() == 2 && "One result per app");
        assert(results[0].app_name == "alpha" && results[1].app_name == "beta" && "Results in descriptor order");
        assert(results[0].succeeded() && "alpha should package despite beta failing");
        assert(results[1].state == Packwright::PipelineState::FAILED && "beta should fail");
        assert(results[1].error_kind == Packwright::ErrorKind::UNSUPPORTED_TARGET && "msi is not supported");
        assert(results[1].stages_run.empty() && "beta should fail before any stage runs");
        assert(!fs::exists(descriptor.rootDirectory() / "build" / "beta") && "beta should touch no files");

        auto calls = takeCalls();
        bool beta_called = std::any_of(calls.begin(), calls.end(), [](const std::string& call) {
            return call.rfind("beta:", 0) == 0;
        });
        assert(!beta_called && "No backend operation should run for beta");

        assert(Packwright::Pipeline::exitCodeFor(results) == Packwright::ExitCode::USER_ERROR &&
               "The overall exit code reflects beta's failure");

        auto only_alpha = req;
        only_alpha.apps = {"alpha"};
        auto alpha_results = pipeline.runAll(only_alpha);
        assert(alpha_results.size() == 1 && Packwright::Pipeline::exitCodeFor(alpha_results) == 0 &&
               "Selecting a subset of apps should work");

        bool threw = false;
        auto unknown = req;
        unknown.apps = {"gamma"};
        try {
            pipeline.runAll(unknown);
        } catch (const Packwright::UserError&) {
            threw = true;
        }
        assert(threw && "Selecting an undeclared app is a user error");

        std::cout << "✓ Multi-app isolation test passed" << std::endl;
    }

    void testUnsupportedTarget() {
        std::cout << "Testing unsupported targets..." << std::endl;

        auto descriptor = createProject("unsupported");
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, m_token);

        auto amiga = request(Packwright::PipelineStage::COMPILE);
        amiga.platform = "amiga";
        auto result = pipeline.run("alpha", amiga);
        assert(result.error_kind == Packwright::ErrorKind::UNSUPPORTED_TARGET && "Unknown platform");
        assert(result.exit_code == Packwright::ExitCode::USER_ERROR && "Unsupported targets are user errors");

        auto flatpak = request(Packwright::PipelineStage::COMPILE);
        flatpak.output_format = "flatpak";
        result = pipeline.run("alpha", flatpak);
        assert(result.error_kind == Packwright::ErrorKind::UNSUPPORTED_TARGET && "Unknown format");
        assert(!fs::exists(descriptor.rootDirectory() / "build") && "Nothing should be created");

        std::cout << "✓ Unsupported targets test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing cancellation..." << std::endl;

        auto descriptor = createProject("cancelled");
        Packwright::CancellationToken token;
        token.cancel();
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, token);

        auto result = pipeline.run("alpha", request(Packwright::PipelineStage::PACKAGE));
        assert(result.state == Packwright::PipelineState::CANCELLED && "Cancelled runs are reported as such");
        assert(result.exit_code == Packwright::ExitCode::CANCELLED && "Cancelled runs exit with 130");
        assert(result.stages_run.empty() && "No stage should complete");
        assert(result.failed_stage == "scaffold" && "The interrupted stage is reported");

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testCancellationDropsQueuedApps() {
        std::cout << "Testing cancellation of queued apps..." << std::endl;

        auto descriptor = createProject("queued",
                                        "  beta:\n"
                                        "    test_result: pass\n"
                                        "  gamma:\n"
                                        "    test_result: pass\n");
        Packwright::CancellationToken token;
        Packwright::Pipeline pipeline(descriptor, m_backends, m_tools, m_supervisor, m_templates, token);
        takeCalls();

        auto req = request(Packwright::PipelineStage::PACKAGE);
        req.jobs = 1;
        g_cancel_when_packaged = &token;
        auto results = pipeline.runAll(req);
        g_cancel_when_packaged = nullptr;

        assert(results.size() == 3 && "Every selected app gets a result");
        assert(results[0].app_name == "alpha" && results[0].stages_run.size() == 4 &&
               "The app already running finishes its stages");
        for (size_t i = 1; i < results.size(); ++i) {
            assert(results[i].state == Packwright::PipelineState::CANCELLED && "Queued apps are cancelled");
            assert(results[i].exit_code == Packwright::ExitCode::CANCELLED && "Queued apps exit with 130");
            assert(results[i].error_kind == Packwright::ErrorKind::CANCELLED && "Queued apps report cancellation");
            assert(results[i].stages_run.empty() && "Queued apps run no stage");
            assert(results[i].platform == "fakeos" && "Queued apps still name their target");
        }
        assert(results[1].app_name == "beta" && results[2].app_name == "gamma" && "Results keep descriptor order");

        auto calls = takeCalls();
        bool queued_called = std::any_of(calls.begin(), calls.end(), [](const std::string& call) {
            return call.rfind("beta:", 0) == 0 || call.rfind("gamma:", 0) == 0;
        });
        assert(!queued_called && "No backend operation runs for a dropped app");
        assert(!fs::exists(descriptor.rootDirectory() / "build" / "beta") && "Dropped apps touch no files");
        assert(Packwright::Pipeline::exitCodeFor(results) == Packwright::ExitCode::CANCELLED &&
               "The overall exit code reports the cancellation");

        std::cout << "✓ Cancellation of queued apps test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Pipeline unit tests..." << std::endl;

        testPackageRunsEveryStageOnce();
        testFailedStageIsRetried();
        testRunningStageInvalidatesDependents();
        testTestModeMarkers();
        testFailingTestSuite();
        testMultiAppIsolation();
        testUnsupportedTarget();
        testCancellation();
        testCancellationDropsQueuedApps();

        std::cout << "All Pipeline tests passed!" << std::endl;
    }
};

int main() {
    try {
        PipelineTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Pipeline component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
