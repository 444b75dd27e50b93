// =================================================================
// include/Packwright/Notarization.hpp
// =================================================================
// Resumable submission of distributables to a notarization service.

#pragma once

#include "Packwright/Cancellation.hpp"
#include "Packwright/ProcessSupervisor.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace Packwright {

/**
 * @brief State reported by the notarization service
 */
enum class NotarizationStatus {
    IN_PROGRESS,
    ACCEPTED,
    INVALID,
    REJECTED
};

std::string notarizationStatusToString(NotarizationStatus status);

/**
 * @brief Parse a status as reported by notarytool ("In Progress", "Accepted", ...)
 * @throws ToolInvocationFailed for an unknown status
 */
NotarizationStatus parseNotarizationStatus(const std::string& text);

/**
 * @brief Remote notarization operations
 */
class NotarizationService {
public:
    virtual ~NotarizationService() = default;

    /**
     * @return Submission id
     */
    virtual std::string submit(const std::filesystem::path& artefact) = 0;
    virtual NotarizationStatus status(const std::string& submission_id) = 0;

    /**
     * @brief Diagnostic log of a finished submission
     */
    virtual std::string log(const std::string& submission_id) = 0;

    /**
     * @brief Attach the notarization ticket to the artefact
     */
    virtual void staple(const std::filesystem::path& artefact) = 0;
};

/**
 * @brief Drives `xcrun notarytool` with a stored keychain profile
 */
class NotaryToolService : public NotarizationService {
public:
    NotaryToolService(ProcessSupervisor& supervisor, const std::string& keychain_profile,
                      const std::string& xcrun = "xcrun");

    std::string submit(const std::filesystem::path& artefact) override;
    NotarizationStatus status(const std::string& submission_id) override;
    std::string log(const std::string& submission_id) override;
    void staple(const std::filesystem::path& artefact) override;

private:
    ProcessSupervisor& m_supervisor;
    std::string m_profile;
    std::string m_xcrun;

    std::string notarytool(const std::vector<std::string>& args);
};

/**
 * @brief Delay between status polls: doubling from an initial value up to a cap
 */
struct BackoffPolicy {
    long initial_ms = 5000;
    long maximum_ms = 60000;
    double factor = 2.0;

    long delayFor(int attempt) const;
};

/**
 * @brief Persisted submission, used to resume polling in a later invocation
 */
struct NotarizationRecord {
    std::string submission_id;
    std::string artefact;
    std::string sha256;         ///< Digest of the artefact as submitted
    NotarizationStatus status = NotarizationStatus::IN_PROGRESS;
};

/**
 * @brief Submits, polls and staples one distributable
 *
 * The submission id is written to the record file before the first poll,
 * so an interrupted job can be resumed without resubmitting.
 */
class NotarizationJob {
public:
    NotarizationJob(NotarizationService& service, const std::filesystem::path& record_path,
                    const BackoffPolicy& policy, const CancellationToken& token);

    /**
     * @brief Notarize an artefact, resuming a recorded in-progress submission
     * for the same artefact
     * @param artefact Distributable submitted to the service
     * @param staple_target Receives the ticket; empty = the artefact itself
     * @throws ToolInvocationFailed if the submission is rejected
     * @throws Cancelled if interrupted while polling
     */
    void run(const std::filesystem::path& artefact,
             const std::filesystem::path& staple_target = std::filesystem::path());

    /**
     * @brief Continue polling an existing submission
     * @throws UserError if the artefact changed since it was submitted
     */
    void resume(const std::string& submission_id, const std::filesystem::path& artefact,
                const std::filesystem::path& staple_target = std::filesystem::path());

    std::optional<NotarizationRecord> loadRecord() const;

    /**
     * @brief Recorded submission that can be resumed as is
     *
     * With a submission id, the record must carry that id; without one it
     * must still be in progress. Either way the recorded artefact must
     * exist unchanged since it was submitted.
     */
    std::optional<NotarizationRecord> pendingSubmission(const std::string& submission_id = "") const;

    int pollCount() const { return m_polls; }

private:
    NotarizationService& m_service;
    std::filesystem::path m_record_path;
    BackoffPolicy m_policy;
    const CancellationToken& m_token;
    int m_polls = 0;

    void saveRecord(const NotarizationRecord& record) const;
    void poll(NotarizationRecord record, const std::filesystem::path& artefact,
              const std::filesystem::path& staple_target);
};

} // namespace Packwright
