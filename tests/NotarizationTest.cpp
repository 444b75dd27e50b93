// =================================================================
// tests/NotarizationTest.cpp
// =================================================================
// Unit tests for notarization submission, polling and resumption.

#include "Packwright/Notarization.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Service replaying a fixed sequence of statuses
 */
class ScriptedNotarizationService : public Packwright::NotarizationService {
public:
    explicit ScriptedNotarizationService(std::vector<Packwright::NotarizationStatus> statuses)
        : m_statuses(std::move(statuses)) {}

    std::string submit(const fs::path& /*artefact*/) override {
        ++submits;
        return "submission-" + std::to_string(submits);
    }

    Packwright::NotarizationStatus status(const std::string& submission_id) override {
        polled_ids.push_back(submission_id);
        auto status = m_next < m_statuses.size() ? m_statuses[m_next++] : m_statuses.back();
        if (cancel_token != nullptr && static_cast<int>(polled_ids.size()) >= cancel_after) {
            cancel_token->cancel();
        }
        return status;
    }

    std::string log(const std::string& /*submission_id*/) override {
        ++log_requests;
        return "{\"issues\": [{\"message\": \"The binary is not signed.\"}]}";
    }

    void staple(const fs::path& artefact) override {
        stapled.push_back(artefact);
    }

    int submits = 0;
    int log_requests = 0;
    std::vector<std::string> polled_ids;
    std::vector<fs::path> stapled;
    Packwright::CancellationToken* cancel_token = nullptr;
    int cancel_after = 0;

private:
    std::vector<Packwright::NotarizationStatus> m_statuses;
    size_t m_next = 0;
};

} // anonymous namespace

class NotarizationTest {
private:
    fs::path m_test_dir;
    fs::path m_artefact;
    Packwright::BackoffPolicy m_fast;

    fs::path freshRecord(const std::string& name) {
        fs::path record = m_test_dir / name / "notarization.json";
        fs::create_directories(record.parent_path());
        return record;
    }

    fs::path writeFakeXcrun(const std::string& info_status) {
        fs::path script = m_test_dir / "bin" / "xcrun";
        fs::create_directories(script.parent_path());
        std::ofstream out(script);
        out << "#!/bin/sh\n"
               "echo \"$@\" >> \"$(dirname \"$0\")/calls.log\"\n"
               "case \"$1 $2\" in\n"
               "  \"notarytool submit\")\n"
               "    echo 'Conducting pre-submission checks for Hello.zip'\n"
               "    echo '{\"id\": \"2efe2717-52ef\", \"message\": \"Successfully uploaded file\"}' ;;\n"
               "  \"notarytool info\")\n"
               "    echo '{\"id\": \"2efe2717-52ef\", \"status\": \"" << info_status << "\"}' ;;\n"
               "  \"notarytool log\")\n"
               "    echo '{\"issues\": null}' ;;\n"
               "  \"stapler staple\")\n"
               "    echo 'The staple and validate action worked!' ;;\n"
               "  *)\n"
               "    echo \"unexpected arguments: $*\" >&2; exit 1 ;;\n"
               "esac\n";
        out.close();
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
        Packwright::removeQuietly(script.parent_path() / "calls.log");
        return script;
    }

public:
    NotarizationTest() {
        m_test_dir = fs::temp_directory_path() / ("packwright-notarization-test-" + Packwright::uniqueSuffix());
        fs::create_directories(m_test_dir);
        setenv("PACKWRIGHT_HOME", m_test_dir.c_str(), 1);
        Packwright::Logger::getInstance().initialize((m_test_dir / "logs").string());
        Packwright::Logger::getInstance().setConsoleLogging(false);

        m_artefact = m_test_dir / "dist" / "Hello-1.0.0.dmg";
        fs::create_directories(m_artefact.parent_path());
        std::ofstream(m_artefact) << "disk image";

        m_fast.initial_ms = 1;
        m_fast.maximum_ms = 2;
    }

    ~NotarizationTest() {
        Packwright::removeQuietly(m_test_dir);
    }

    void testBackoffPolicy() {
        std::cout << "Testing backoff policy..." << std::endl;

        Packwright::BackoffPolicy policy;
        policy.initial_ms = 1000;
        policy.maximum_ms = 8000;
        assert(policy.delayFor(0) == 1000 && "First delay is the initial delay");
        assert(policy.delayFor(1) == 2000 && "Delay doubles");
        assert(policy.delayFor(3) == 8000 && "Delay reaches the cap");
        assert(policy.delayFor(20) == 8000 && "Delay never exceeds the cap");
        assert(Packwright::BackoffPolicy().delayFor(0) == 5000 && "Default initial delay is five seconds");

        std::cout << "✓ Backoff policy test passed" << std::endl;
    }

    void testStatusParsing() {
        std::cout << "Testing status parsing..." << std::endl;

        using Packwright::NotarizationStatus;
        for (auto status : {NotarizationStatus::IN_PROGRESS, NotarizationStatus::ACCEPTED,
                            NotarizationStatus::INVALID, NotarizationStatus::REJECTED}) {
            assert(Packwright::parseNotarizationStatus(Packwright::notarizationStatusToString(status)) == status &&
                   "Status names should parse back");
        }

        bool threw = false;
        try {
            Packwright::parseNotarizationStatus("Pending review");
        } catch (const Packwright::ToolInvocationFailed&) {
            threw = true;
        }
        assert(threw && "Unknown statuses should be reported");

        std::cout << "✓ Status parsing test passed" << std::endl;
    }

    void testAcceptedAfterPolling() {
        std::cout << "Testing accepted submissions..." << std::endl;

        using Packwright::NotarizationStatus;
        ScriptedNotarizationService service({NotarizationStatus::IN_PROGRESS, NotarizationStatus::IN_PROGRESS,
                                             NotarizationStatus::ACCEPTED});
        Packwright::CancellationToken token;
        Packwright::NotarizationJob job(service, freshRecord("accepted"), m_fast, token);

        job.run(m_artefact);
        assert(service.submits == 1 && "The artefact should be submitted once");
        assert(job.pollCount() == 3 && "Polling continues until a final status");
        assert(service.stapled.size() == 1 && service.stapled[0] == m_artefact && "The artefact is stapled");

        auto record = job.loadRecord();
        assert(record && record->submission_id == "submission-1" && "The submission id is recorded");
        assert(record->status == NotarizationStatus::ACCEPTED && "The final status is recorded");

        std::cout << "✓ Accepted submissions test passed" << std::endl;
    }

    void testStapleTarget() {
        std::cout << "Testing staple targets..." << std::endl;

        ScriptedNotarizationService service({Packwright::NotarizationStatus::ACCEPTED});
        Packwright::CancellationToken token;
        Packwright::NotarizationJob job(service, freshRecord("staple-target"), m_fast, token);

        fs::path bundle = m_test_dir / "build" / "Hello.app";
        job.run(m_artefact, bundle);
        assert(service.stapled.size() == 1 && service.stapled[0] == bundle && "The ticket goes to the bundle");

        std::cout << "✓ Staple targets test passed" << std::endl;
    }

    void testResumeWithoutResubmitting() {
        std::cout << "Testing interrupted polling and resumption..." << std::endl;

        using Packwright::NotarizationStatus;
        fs::path record_path = freshRecord("resume");

        ScriptedNotarizationService first({NotarizationStatus::IN_PROGRESS});
        Packwright::CancellationToken first_token;
        first.cancel_token = &first_token;
        first.cancel_after = 2;
        Packwright::NotarizationJob interrupted(first, record_path, m_fast, first_token);

        bool cancelled = false;
        try {
            interrupted.run(m_artefact);
        } catch (const Packwright::Cancelled&) {
            cancelled = true;
        }
        assert(cancelled && "Interrupting the poll loop should raise Cancelled");
        assert(first.submits == 1 && "The first run submitted the artefact");

        auto record = interrupted.loadRecord();
        assert(record && record->status == NotarizationStatus::IN_PROGRESS && "The record survives the interrupt");

        ScriptedNotarizationService second({NotarizationStatus::IN_PROGRESS, NotarizationStatus::ACCEPTED});
        Packwright::CancellationToken second_token;
        Packwright::NotarizationJob resumed(second, record_path, m_fast, second_token);
        resumed.run(m_artefact);

        assert(second.submits == 0 && "Resuming must not resubmit");
        assert(!second.polled_ids.empty() && second.polled_ids[0] == "submission-1" &&
               "The recorded submission is polled");
        assert(second.stapled.size() == 1 && "The resumed submission is stapled");

        fs::path other = m_test_dir / "dist" / "Other-1.0.0.dmg";
        std::ofstream(other) << "other disk image";
        ScriptedNotarizationService third({NotarizationStatus::ACCEPTED});
        Packwright::NotarizationJob fresh(third, record_path, m_fast, second_token);
        fresh.run(other);
        assert(third.submits == 1 && "A finished record does not block a new submission");

        std::cout << "✓ Interrupted polling and resumption test passed" << std::endl;
    }

    void testExplicitResume() {
        std::cout << "Testing explicit resume..." << std::endl;

        ScriptedNotarizationService service({Packwright::NotarizationStatus::ACCEPTED});
        Packwright::CancellationToken token;
        Packwright::NotarizationJob job(service, freshRecord("explicit"), m_fast, token);

        job.resume("f00d-cafe", m_artefact);
        assert(service.submits == 0 && "Explicit resume never submits");
        assert(service.polled_ids.size() == 1 && service.polled_ids[0] == "f00d-cafe" && "The given id is polled");
        assert(job.loadRecord()->submission_id == "f00d-cafe" && "The given id is recorded");

        std::cout << "✓ Explicit resume test passed" << std::endl;
    }

    void testRebuiltArtefactIsNotResumed() {
        std::cout << "Testing rebuilt artefacts..." << std::endl;

        using Packwright::NotarizationStatus;
        fs::path record_path = freshRecord("rebuilt");
        fs::path artefact = m_test_dir / "dist" / "Rebuilt-1.0.0.dmg";
        std::ofstream(artefact) << "first build";

        ScriptedNotarizationService first({NotarizationStatus::IN_PROGRESS});
        Packwright::CancellationToken first_token;
        first.cancel_token = &first_token;
        first.cancel_after = 1;
        Packwright::NotarizationJob interrupted(first, record_path, m_fast, first_token);
        try {
            interrupted.run(artefact);
        } catch (const Packwright::Cancelled&) {
        }
        assert(first.submits == 1 && "The first build was submitted");

        Packwright::CancellationToken token;
        ScriptedNotarizationService idle({NotarizationStatus::ACCEPTED});
        Packwright::NotarizationJob job(idle, record_path, m_fast, token);
        auto pending = job.pendingSubmission();
        assert(pending && pending->artefact == artefact.string() && "The unchanged submission can be resumed");
        assert(pending->sha256 == Packwright::sha256File(artefact) && "The submitted digest is recorded");
        assert(job.pendingSubmission("submission-1") && "The recorded id matches");
        assert(!job.pendingSubmission("someone-else") && "Other ids do not match the record");

        std::ofstream(artefact) << "second build";
        assert(!job.pendingSubmission() && "A changed artefact cannot be resumed");

        bool rejected = false;
        try {
            job.resume("submission-1", artefact);
        } catch (const Packwright::UserError& e) {
            rejected = std::string(e.what()).find("changed since it was submitted") != std::string::npos;
        }
        assert(rejected && "Resuming with a different artefact is refused");
        assert(idle.polled_ids.empty() && idle.stapled.empty() && "Nothing is polled or stapled");

        ScriptedNotarizationService second({NotarizationStatus::ACCEPTED});
        Packwright::NotarizationJob rebuilt(second, record_path, m_fast, token);
        rebuilt.run(artefact);
        assert(second.submits == 1 && "The rebuilt artefact is submitted again");
        assert(rebuilt.loadRecord()->sha256 == Packwright::sha256File(artefact) && "The new digest is recorded");

        std::cout << "✓ Rebuilt artefacts test passed" << std::endl;
    }

    void testRejectedSubmission() {
        std::cout << "Testing rejected submissions..." << std::endl;

        ScriptedNotarizationService service({Packwright::NotarizationStatus::IN_PROGRESS,
                                             Packwright::NotarizationStatus::INVALID});
        Packwright::CancellationToken token;
        Packwright::NotarizationJob job(service, freshRecord("rejected"), m_fast, token);

        bool threw = false;
        try {
            job.run(m_artefact);
        } catch (const Packwright::ToolInvocationFailed& e) {
            threw = true;
            std::string message = e.what();
            assert(message.find("Invalid") != std::string::npos && "The final status is reported");
            assert(message.find("submission-1") != std::string::npos && "The submission id is reported");
            assert(e.output().find("not signed") != std::string::npos && "The service log is attached");
            assert(e.exitCode() == Packwright::ExitCode::TOOL_FAILURE && "Rejections exit with 4");
        }
        assert(threw && "An invalid submission should fail");
        assert(service.log_requests == 1 && "The log is fetched once");
        assert(service.stapled.empty() && "Nothing is stapled");

        std::cout << "✓ Rejected submissions test passed" << std::endl;
    }

    void testNotaryToolService() {
        std::cout << "Testing the notarytool driver..." << std::endl;

        Packwright::CancellationToken token;
        Packwright::ProcessSupervisor supervisor(token);
        fs::path xcrun = writeFakeXcrun("Accepted");
        Packwright::NotaryToolService service(supervisor, "ci-profile", xcrun.string());

        assert(service.submit(m_artefact) == "2efe2717-52ef" && "The id is read from the JSON output");
        assert(service.status("2efe2717-52ef") == Packwright::NotarizationStatus::ACCEPTED && "Status is parsed");
        service.staple(m_artefact);

        std::string calls = Packwright::readFile(xcrun.parent_path() / "calls.log");
        assert(calls.find("notarytool submit " + m_artefact.string()) != std::string::npos && "Submit is called");
        assert(calls.find("--keychain-profile ci-profile --output-format json") != std::string::npos &&
               "The keychain profile and JSON output are requested");
        assert(calls.find("stapler staple " + m_artefact.string()) != std::string::npos && "Stapler is called");

        Packwright::NotaryToolService failing(supervisor, "ci-profile", (m_test_dir / "bin" / "xcrun").string());
        writeFakeXcrun("Exploded");
        bool threw = false;
        try {
            failing.status("2efe2717-52ef");
        } catch (const Packwright::ToolInvocationFailed& e) {
            threw = true;
            assert(std::string(e.what()).find("Exploded") != std::string::npos && "The odd status is named");
        }
        assert(threw && "Unknown statuses from notarytool are failures");

        std::cout << "✓ notarytool driver test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Notarization unit tests..." << std::endl;

        testBackoffPolicy();
        testStatusParsing();
        testAcceptedAfterPolling();
        testStapleTarget();
        testResumeWithoutResubmitting();
        testExplicitResume();
        testRebuiltArtefactIsNotResumed();
        testRejectedSubmission();
        testNotaryToolService();

        std::cout << "All Notarization tests passed!" << std::endl;
    }
};

int main() {
    try {
        NotarizationTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Notarization component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
