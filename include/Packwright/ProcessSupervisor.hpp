// =================================================================
// include/Packwright/ProcessSupervisor.hpp
// =================================================================
// Runs external tools, streams and classifies their output.

#pragma once

#include "Packwright/Cancellation.hpp"
#include "Packwright/OutputFilter.hpp"
#include <functional>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief How a child process is connected to the terminal
 */
enum class StreamMode {
    CAPTURED,       ///< stdout+stderr merged into a pipe we read
    INTERACTIVE     ///< Child inherits the terminal, in its own process group
};

/**
 * @brief Terminal classification of a supervised run
 */
enum class RunOutcome {
    SUCCEEDED,
    FAILED,
    CANCELLED
};

std::string runOutcomeToString(RunOutcome outcome);

/**
 * @brief Everything needed to launch and judge one external command
 */
struct ToolInvocation {
    std::vector<std::string> args;              ///< args[0] is the executable
    std::string working_directory;              ///< Empty = inherit
    std::map<std::string, std::string> env_overlay;
    std::vector<std::string> env_unset;
    std::vector<std::string> success_patterns;  ///< ECMAScript regexes
    std::vector<std::string> failure_patterns;  ///< ECMAScript regexes
    std::shared_ptr<OutputFilter> filter;       ///< Display-only noise filter
    StreamMode mode = StreamMode::CAPTURED;
    bool echo = false;                          ///< Show output even at verbosity 0
    bool stop_on_match = false;                 ///< Terminate once a pattern matches
    std::function<void(const std::string&)> line_callback;
    std::string tool_name;                      ///< Name used in error reports

    /**
     * @brief Printable command line (arguments with spaces are quoted)
     */
    std::string commandLine() const;

    /**
     * @brief tool_name, or the executable name when unset
     */
    std::string displayName() const;
};

/**
 * @brief Result of a supervised run
 */
struct ProcessResult {
    int exit_code = -1;
    std::string output;             ///< Decoded, merged stdout/stderr
    RunOutcome outcome = RunOutcome::FAILED;
    std::string matched_line;       ///< Line that decided the outcome, if any

    bool succeeded() const { return outcome == RunOutcome::SUCCEEDED; }
};

/**
 * @brief Decides success or failure from output lines and the exit code
 *
 * A failure pattern match means failure. Otherwise a success pattern match
 * means success. Otherwise, when success patterns were given the run failed,
 * and without any patterns the exit code decides.
 */
class OutputClassifier {
public:
    /**
     * @throws UserError if a pattern is not a valid regex
     */
    OutputClassifier(const std::vector<std::string>& success_patterns,
                     const std::vector<std::string>& failure_patterns);

    void observe(const std::string& line);

    RunOutcome verdict(int exit_code) const;

    /**
     * @brief True once any success or failure pattern has matched
     */
    bool hasMatch() const { return m_success_seen || m_failure_seen; }

    const std::string& matchedLine() const { return m_matched_line; }

private:
    std::vector<std::regex> m_success;
    std::vector<std::regex> m_failure;
    bool m_success_seen = false;
    bool m_failure_seen = false;
    std::string m_matched_line;
};

/**
 * @brief Launches external commands under supervision
 *
 * Every run is placed in its own process group so that cancellation can
 * terminate the whole tree the tool spawned. Interactive runs are handed
 * the controlling terminal for their duration.
 */
class ProcessSupervisor {
public:
    /**
     * @param token Cancellation source observed while children run
     * @param verbosity 1 echoes tool output, 2 also logs command details
     */
    explicit ProcessSupervisor(const CancellationToken& token, int verbosity = 0);

    /**
     * @brief Run a command to completion (or cancellation)
     * @throws MissingTool if the executable cannot be found
     * @throws UserError for an empty command or invalid patterns
     */
    ProcessResult run(const ToolInvocation& invocation);

    /**
     * @brief Run captured and return the output
     * @throws ToolInvocationFailed carrying the verbatim output unless the run succeeded
     * @throws Cancelled if the run was interrupted
     */
    std::string checkOutput(const ToolInvocation& invocation);

    /**
     * @brief Decode raw bytes, escaping invalid UTF-8 as \xNN
     */
    static std::string decodeOutput(const std::string& raw);

    void setVerbosity(int verbosity) { m_verbosity = verbosity; }
    int verbosity() const { return m_verbosity; }

    const CancellationToken& token() const { return m_token; }

    /**
     * @brief Grace period between SIGTERM and SIGKILL when cancelling
     */
    void setTerminationGrace(long milliseconds) { m_termination_grace_ms = milliseconds; }

private:
    const CancellationToken& m_token;
    int m_verbosity;
    long m_termination_grace_ms = 3000;

    ProcessResult runCaptured(const ToolInvocation& invocation,
                              const std::vector<std::string>& argv,
                              const std::vector<std::string>& envp);
    ProcessResult runInteractive(const ToolInvocation& invocation,
                                 const std::vector<std::string>& argv,
                                 const std::vector<std::string>& envp);
    /**
     * @brief SIGTERM a tool's process group, SIGKILL whatever outlives the grace period
     * @return Wait status of the group leader
     */
    int terminate(int pgid, bool leader_reaped, int leader_status);
    void handleLine(const ToolInvocation& invocation, const std::string& line,
                    OutputClassifier& classifier, std::string& output);
};

} // namespace Packwright
