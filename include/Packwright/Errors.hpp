// =================================================================
// include/Packwright/Errors.hpp
// =================================================================
// Exception taxonomy shared by every Packwright component.

#pragma once

#include <stdexcept>
#include <string>

namespace Packwright {

/**
 * @brief Classification of every failure Packwright reports
 */
enum class ErrorKind {
    MALFORMED_CONFIG,       ///< Project descriptor cannot be used as written
    UNSUPPORTED_TARGET,     ///< No backend for the (platform, format) pair
    UNSUPPORTED_PLATFORM,   ///< Tool cannot be provided on this host
    DOWNLOAD_FAILED,        ///< Network failure while acquiring a tool
    INTEGRITY_FAILED,       ///< Download arrived corrupt or truncated
    MISSING_TOOL,           ///< Tool is neither installed nor acquirable
    TOOL_INVOCATION_FAILED, ///< Wrapped tool reported failure
    CANCELLED,              ///< User interrupted the invocation
    TEMPLATE_ERROR,         ///< Template does not match this tool version
    USER_ERROR              ///< Bad command line arguments
};

/**
 * @brief Process exit codes surfaced by the command line front end
 */
namespace ExitCode {
    const int SUCCESS = 0;
    const int USER_ERROR = 2;
    const int ENVIRONMENT_ERROR = 3;
    const int TOOL_FAILURE = 4;
    const int TEMPLATE_ERROR = 5;
    const int CANCELLED = 130;
}

/**
 * @brief Base class for every error Packwright raises on purpose
 *
 * Carries the error kind plus optional pipeline context (the stage that was
 * running and the external tool involved) so failures can be reported in an
 * actionable way.
 */
class PackwrightError : public std::runtime_error {
public:
    PackwrightError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

    /**
     * @brief Exit code the command line should return for this error
     */
    int exitCode() const;

    const std::string& stage() const { return m_stage; }
    const std::string& tool() const { return m_tool; }

    void setStage(const std::string& stage) { m_stage = stage; }
    void setTool(const std::string& tool) { m_tool = tool; }

    /**
     * @brief Get a short human-readable name for an error kind
     */
    static std::string getKindName(ErrorKind kind);

    /**
     * @brief Map an error kind onto the exit code taxonomy
     */
    static int exitCodeFor(ErrorKind kind);

private:
    ErrorKind m_kind;
    std::string m_stage;
    std::string m_tool;
};

class MalformedConfig : public PackwrightError {
public:
    explicit MalformedConfig(const std::string& message);

    /**
     * @brief Construct with the location of the offending entry
     * @param file Descriptor file name
     * @param line 1-based line, or 0 when unknown
     * @param column 1-based column, or 0 when unknown
     * @param message Description of the problem
     */
    MalformedConfig(const std::string& file, int line, int column, const std::string& message);

    const std::string& file() const { return m_file; }
    int line() const { return m_line; }
    int column() const { return m_column; }

private:
    std::string m_file;
    int m_line = 0;
    int m_column = 0;
};

class UnsupportedTarget : public PackwrightError {
public:
    UnsupportedTarget(const std::string& platform, const std::string& format, const std::string& detail = "");
};

class UnsupportedPlatform : public PackwrightError {
public:
    UnsupportedPlatform(const std::string& tool, const std::string& host);
};

class DownloadFailed : public PackwrightError {
public:
    DownloadFailed(const std::string& url, const std::string& reason);

    const std::string& url() const { return m_url; }

private:
    std::string m_url;
};

class IntegrityFailed : public PackwrightError {
public:
    IntegrityFailed(const std::string& what, const std::string& reason);
};

class MissingTool : public PackwrightError {
public:
    MissingTool(const std::string& tool, const std::string& hint = "");
};

/**
 * @brief A wrapped tool reported failure; its output is kept verbatim
 */
class ToolInvocationFailed : public PackwrightError {
public:
    ToolInvocationFailed(const std::string& tool, int exit_code, const std::string& output,
                         const std::string& summary = "");

    int toolExitCode() const { return m_exit_code; }
    const std::string& output() const { return m_output; }

private:
    int m_exit_code;
    std::string m_output;
};

class Cancelled : public PackwrightError {
public:
    Cancelled();
};

class TemplateError : public PackwrightError {
public:
    explicit TemplateError(const std::string& message);
};

class UserError : public PackwrightError {
public:
    explicit UserError(const std::string& message);
};

} // namespace Packwright
