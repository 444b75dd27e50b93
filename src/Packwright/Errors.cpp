// =================================================================
// src/Packwright/Errors.cpp
// =================================================================
// Implementation of the error taxonomy.

#include "Packwright/Errors.hpp"

namespace Packwright {

PackwrightError::PackwrightError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), m_kind(kind) {}

int PackwrightError::exitCode() const {
    return exitCodeFor(m_kind);
}

std::string PackwrightError::getKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_CONFIG: return "MalformedConfig";
        case ErrorKind::UNSUPPORTED_TARGET: return "UnsupportedTarget";
        case ErrorKind::UNSUPPORTED_PLATFORM: return "UnsupportedPlatform";
        case ErrorKind::DOWNLOAD_FAILED: return "DownloadFailed";
        case ErrorKind::INTEGRITY_FAILED: return "IntegrityFailed";
        case ErrorKind::MISSING_TOOL: return "MissingTool";
        case ErrorKind::TOOL_INVOCATION_FAILED: return "ToolInvocationFailed";
        case ErrorKind::CANCELLED: return "Cancelled";
        case ErrorKind::TEMPLATE_ERROR: return "TemplateError";
        case ErrorKind::USER_ERROR: return "UserError";
        default: return "Unknown";
    }
}

int PackwrightError::exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_CONFIG:
        case ErrorKind::UNSUPPORTED_TARGET:
        case ErrorKind::USER_ERROR:
            return ExitCode::USER_ERROR;
        case ErrorKind::UNSUPPORTED_PLATFORM:
        case ErrorKind::DOWNLOAD_FAILED:
        case ErrorKind::INTEGRITY_FAILED:
        case ErrorKind::MISSING_TOOL:
            return ExitCode::ENVIRONMENT_ERROR;
        case ErrorKind::TOOL_INVOCATION_FAILED:
            return ExitCode::TOOL_FAILURE;
        case ErrorKind::TEMPLATE_ERROR:
            return ExitCode::TEMPLATE_ERROR;
        case ErrorKind::CANCELLED:
            return ExitCode::CANCELLED;
        default:
            return 1;
    }
}

MalformedConfig::MalformedConfig(const std::string& message)
    : PackwrightError(ErrorKind::MALFORMED_CONFIG, message) {}

static std::string formatLocation(const std::string& file, int line, int column) {
    std::string location = file;
    if (line > 0) {
        location += ":" + std::to_string(line);
        if (column > 0) {
            location += ":" + std::to_string(column);
        }
    }
    return location;
}

MalformedConfig::MalformedConfig(const std::string& file, int line, int column, const std::string& message)
    : PackwrightError(ErrorKind::MALFORMED_CONFIG, formatLocation(file, line, column) + ": " + message),
      m_file(file), m_line(line), m_column(column) {}

UnsupportedTarget::UnsupportedTarget(const std::string& platform, const std::string& format,
                                     const std::string& detail)
    : PackwrightError(ErrorKind::UNSUPPORTED_TARGET,
                      "The " + platform + (format.empty() ? "" : " " + format) +
                      " target is not supported" + (detail.empty() ? "." : ": " + detail)) {}

UnsupportedPlatform::UnsupportedPlatform(const std::string& tool, const std::string& host)
    : PackwrightError(ErrorKind::UNSUPPORTED_PLATFORM,
                      tool + " cannot be provided on " + host + " hosts.") {
    setTool(tool);
}

DownloadFailed::DownloadFailed(const std::string& url, const std::string& reason)
    : PackwrightError(ErrorKind::DOWNLOAD_FAILED,
                      "Unable to download " + url + "; " + reason), m_url(url) {}

IntegrityFailed::IntegrityFailed(const std::string& what, const std::string& reason)
    : PackwrightError(ErrorKind::INTEGRITY_FAILED,
                      "Download of " + what + " is incomplete or corrupt: " + reason) {}

MissingTool::MissingTool(const std::string& tool, const std::string& hint)
    : PackwrightError(ErrorKind::MISSING_TOOL,
                      "Unable to locate " + tool + (hint.empty() ? "." : "; " + hint)) {
    setTool(tool);
}

ToolInvocationFailed::ToolInvocationFailed(const std::string& tool, int exit_code,
                                           const std::string& output, const std::string& summary)
    : PackwrightError(ErrorKind::TOOL_INVOCATION_FAILED,
                      summary.empty()
                          ? tool + " reported failure (exit code " + std::to_string(exit_code) + ")"
                          : summary),
      m_exit_code(exit_code), m_output(output) {
    setTool(tool);
}

Cancelled::Cancelled()
    : PackwrightError(ErrorKind::CANCELLED, "Cancelled by user.") {}

TemplateError::TemplateError(const std::string& message)
    : PackwrightError(ErrorKind::TEMPLATE_ERROR, message) {}

UserError::UserError(const std::string& message)
    : PackwrightError(ErrorKind::USER_ERROR, message) {}

} // namespace Packwright
