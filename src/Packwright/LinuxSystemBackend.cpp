// =================================================================
// src/Packwright/LinuxSystemBackend.cpp
// =================================================================
// Implementation for the linux/system backend.

#include "Packwright/LinuxSystemBackend.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"

namespace fs = std::filesystem;

namespace Packwright {

std::vector<std::string> LinuxSystemBackend::packagingFormats() const {
    return {"tar.gz", "zip"};
}

ToolSpec LinuxSystemBackend::archiverFor(const std::string& format) {
    ToolSpec spec;
    if (format == "zip") {
        spec.name = "zip";
        spec.verify_args = {"-v"};
        spec.description = "Info-ZIP archiver";
    } else {
        spec.name = "tar";
        spec.description = "Tape archiver";
    }
    return spec;
}

std::vector<ToolSpec> LinuxSystemBackend::requiredTools(PipelineStage stage,
                                                        const std::string& packaging_format) const {
    if (stage == PipelineStage::PACKAGE) {
        return {archiverFor(packaging_format)};
    }
    return {};
}

fs::path LinuxSystemBackend::package(BackendContext& context, const std::string& format) {
    fs::path destination = distributablePath(context, format);
    fs::create_directories(destination.parent_path());

    // Archive under a temporary name so a failed run never leaves a partial distributable
    fs::path partial = destination.parent_path() /
        (".partial-" + uniqueSuffix() + "-" + destination.filename().string());

    ToolInvocation invocation;
    invocation.working_directory = context.tree.root.string();
    if (format == "zip") {
        invocation.args = {context.toolPath("zip"), "-q", "-r", "-y", partial.string(), "bin", "app"};
        invocation.tool_name = "zip";
    } else {
        invocation.args = {context.toolPath("tar"), "-czf", partial.string(), "-C",
                           context.tree.root.string(), "bin", "app"};
        invocation.tool_name = "tar";
    }

    try {
        context.supervisor.checkOutput(invocation);
        fs::rename(partial, destination);
    } catch (...) {
        removeQuietly(partial);
        throw;
    }

    Logger::getInstance().info("Backend", "Packaged " + context.config.appName(), destination.string());
    return destination;
}

} // namespace Packwright
