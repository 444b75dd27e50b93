// =================================================================
// src/Packwright/Notarization.cpp
// =================================================================
// Implementation for notarization submission and polling.

#include "Packwright/Notarization.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cmath>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

nlohmann::json parseToolJson(const std::string& output, const std::string& operation) {
    // notarytool may print progress lines before the JSON document
    size_t start = output.find('{');
    if (start == std::string::npos) {
        throw ToolInvocationFailed("notarytool", 0, output, "notarytool " + operation + " returned no JSON");
    }
    try {
        return nlohmann::json::parse(output.substr(start));
    } catch (const nlohmann::json::parse_error& e) {
        throw ToolInvocationFailed("notarytool", 0, output,
                                   "Unable to parse notarytool " + operation + " output: " + e.what());
    }
}

} // anonymous namespace

std::string notarizationStatusToString(NotarizationStatus status) {
    switch (status) {
        case NotarizationStatus::IN_PROGRESS: return "In Progress";
        case NotarizationStatus::ACCEPTED: return "Accepted";
        case NotarizationStatus::INVALID: return "Invalid";
        case NotarizationStatus::REJECTED: return "Rejected";
        default: return "Unknown";
    }
}

NotarizationStatus parseNotarizationStatus(const std::string& text) {
    if (text == "In Progress") return NotarizationStatus::IN_PROGRESS;
    if (text == "Accepted") return NotarizationStatus::ACCEPTED;
    if (text == "Invalid") return NotarizationStatus::INVALID;
    if (text == "Rejected") return NotarizationStatus::REJECTED;
    throw ToolInvocationFailed("notarytool", 0, text, "Unknown notarization status '" + text + "'");
}

// NotaryToolService

NotaryToolService::NotaryToolService(ProcessSupervisor& supervisor, const std::string& keychain_profile,
                                     const std::string& xcrun)
    : m_supervisor(supervisor), m_profile(keychain_profile), m_xcrun(xcrun) {
}

std::string NotaryToolService::notarytool(const std::vector<std::string>& args) {
    ToolInvocation invocation;
    invocation.args = {m_xcrun, "notarytool"};
    invocation.args.insert(invocation.args.end(), args.begin(), args.end());
    invocation.args.insert(invocation.args.end(),
                           {"--keychain-profile", m_profile, "--output-format", "json"});
    invocation.tool_name = "notarytool";
    return m_supervisor.checkOutput(invocation);
}

std::string NotaryToolService::submit(const fs::path& artefact) {
    auto json = parseToolJson(notarytool({"submit", artefact.string()}), "submit");
    std::string id = json.value("id", std::string());
    if (id.empty()) {
        throw ToolInvocationFailed("notarytool", 0, json.dump(), "notarytool submit returned no submission id");
    }
    return id;
}

NotarizationStatus NotaryToolService::status(const std::string& submission_id) {
    auto json = parseToolJson(notarytool({"info", submission_id}), "info");
    return parseNotarizationStatus(json.value("status", std::string()));
}

std::string NotaryToolService::log(const std::string& submission_id) {
    return notarytool({"log", submission_id});
}

void NotaryToolService::staple(const fs::path& artefact) {
    ToolInvocation invocation;
    invocation.args = {m_xcrun, "stapler", "staple", artefact.string()};
    invocation.tool_name = "stapler";
    m_supervisor.checkOutput(invocation);
}

// BackoffPolicy

long BackoffPolicy::delayFor(int attempt) const {
    double delay = static_cast<double>(initial_ms) * std::pow(factor, std::max(attempt, 0));
    if (delay > static_cast<double>(maximum_ms)) {
        return maximum_ms;
    }
    return static_cast<long>(delay);
}

// NotarizationJob

NotarizationJob::NotarizationJob(NotarizationService& service, const fs::path& record_path,
                                 const BackoffPolicy& policy, const CancellationToken& token)
    : m_service(service), m_record_path(record_path), m_policy(policy), m_token(token) {
}

std::optional<NotarizationRecord> NotarizationJob::loadRecord() const {
    std::error_code ec;
    if (!fs::is_regular_file(m_record_path, ec)) {
        return std::nullopt;
    }
    try {
        auto json = nlohmann::json::parse(readFile(m_record_path));
        NotarizationRecord record;
        record.submission_id = json.at("submission_id").get<std::string>();
        record.artefact = json.at("artefact").get<std::string>();
        record.sha256 = json.value("sha256", std::string());
        record.status = parseNotarizationStatus(json.value("status", std::string("In Progress")));
        return record;
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Notarization", "Ignoring unreadable record " + m_record_path.string(),
                                      e.what());
        return std::nullopt;
    }
}

void NotarizationJob::saveRecord(const NotarizationRecord& record) const {
    nlohmann::json json = {
        {"submission_id", record.submission_id},
        {"artefact", record.artefact},
        {"sha256", record.sha256},
        {"status", notarizationStatusToString(record.status)}
    };
    writeFileAtomic(m_record_path, json.dump(2));
}

std::optional<NotarizationRecord> NotarizationJob::pendingSubmission(const std::string& submission_id) const {
    auto record = loadRecord();
    if (!record) {
        return std::nullopt;
    }
    if (submission_id.empty() ? record->status != NotarizationStatus::IN_PROGRESS
                              : record->submission_id != submission_id) {
        return std::nullopt;
    }

    auto& logger = Logger::getInstance();
    std::error_code ec;
    if (!fs::is_regular_file(record->artefact, ec)) {
        logger.warning("Notarization", "Submitted artefact of " + record->submission_id + " is gone",
                       record->artefact);
        return std::nullopt;
    }
    if (record->sha256.empty() || sha256File(record->artefact) != record->sha256) {
        logger.warning("Notarization", "Artefact changed since submission " + record->submission_id,
                       record->artefact);
        return std::nullopt;
    }
    return record;
}

void NotarizationJob::run(const fs::path& artefact, const fs::path& staple_target) {
    std::string digest = sha256File(artefact);
    auto existing = loadRecord();
    if (existing && existing->artefact == artefact.string() && existing->sha256 == digest &&
        existing->status == NotarizationStatus::IN_PROGRESS) {
        Logger::getInstance().info("Notarization", "Resuming submission " + existing->submission_id,
                                   artefact.filename().string());
        poll(*existing, artefact, staple_target);
        return;
    }

    m_token.throwIfCancelled();
    Logger::getInstance().info("Notarization", "Submitting " + artefact.filename().string());

    NotarizationRecord record;
    record.submission_id = m_service.submit(artefact);
    record.artefact = artefact.string();
    record.sha256 = digest;
    saveRecord(record);

    Logger::getInstance().info("Notarization", "Submission id " + record.submission_id,
                               "resume with --submission-id " + record.submission_id);
    poll(record, artefact, staple_target);
}

void NotarizationJob::resume(const std::string& submission_id, const fs::path& artefact,
                             const fs::path& staple_target) {
    std::string digest = sha256File(artefact);
    auto existing = loadRecord();
    if (existing && existing->submission_id == submission_id && !existing->sha256.empty() &&
        existing->sha256 != digest) {
        throw UserError(artefact.filename().string() + " changed since it was submitted as " + submission_id +
                        "; package again without --submission-id to submit the new build");
    }

    NotarizationRecord record;
    record.submission_id = submission_id;
    record.artefact = artefact.string();
    record.sha256 = digest;
    saveRecord(record);
    poll(record, artefact, staple_target);
}

void NotarizationJob::poll(NotarizationRecord record, const fs::path& artefact,
                           const fs::path& staple_target) {
    auto& logger = Logger::getInstance();

    int attempt = 0;
    while (true) {
        m_token.throwIfCancelled();
        ++m_polls;
        record.status = m_service.status(record.submission_id);
        if (record.status != NotarizationStatus::IN_PROGRESS) {
            break;
        }

        long delay = m_policy.delayFor(attempt++);
        logger.debug("Notarization", "Submission " + record.submission_id + " in progress",
                     "next check in " + std::to_string(delay) + "ms");
        if (!m_token.waitFor(delay)) {
            throw Cancelled();
        }
    }
    saveRecord(record);

    if (record.status == NotarizationStatus::ACCEPTED) {
        m_service.staple(staple_target.empty() ? artefact : staple_target);
        logger.info("Notarization", "Notarized and stapled " + artefact.filename().string());
        return;
    }

    std::string details = m_service.log(record.submission_id);
    throw ToolInvocationFailed("notarytool", 0, details,
                               "Notarization of " + artefact.filename().string() + " was " +
                               notarizationStatusToString(record.status) + " (submission " +
                               record.submission_id + ")");
}

} // namespace Packwright
