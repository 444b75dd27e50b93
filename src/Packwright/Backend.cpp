// =================================================================
// src/Packwright/Backend.cpp
// =================================================================
// Shared parts of the platform backend interface.

#include "Packwright/Backend.hpp"
#include "Packwright/Errors.hpp"
#include <algorithm>

namespace Packwright {

std::string executeModeToString(ExecuteMode mode) {
    switch (mode) {
        case ExecuteMode::NORMAL: return "normal";
        case ExecuteMode::TEST: return "test";
        case ExecuteMode::DEBUG: return "debug";
        default: return "unknown";
    }
}

std::string BackendContext::toolPath(const std::string& name) const {
    auto it = tool_paths.find(name);
    return it == tool_paths.end() ? name : it->second.string();
}

ProjectTree PlatformBackend::treeFor(const EffectiveConfig& config, const std::filesystem::path& project_root) const {
    ProjectTree tree;
    tree.root = project_root / "build" / config.appName() / platform() / outputFormat();
    tree.app_name = config.appName();
    tree.platform = platform();
    tree.output_format = outputFormat();
    return tree;
}

bool PlatformBackend::supportsPackagingFormat(const std::string& format) const {
    auto formats = packagingFormats();
    return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string PlatformBackend::resolvePackagingFormat(const EffectiveConfig& config,
                                                    const PipelineOptions& options) const {
    std::string format = options.packaging_format;
    if (format.empty()) {
        format = config.getString("packaging_format", defaultPackagingFormat());
    }
    if (!supportsPackagingFormat(format)) {
        std::string supported;
        for (const auto& candidate : packagingFormats()) {
            supported += (supported.empty() ? "" : ", ") + candidate;
        }
        throw UnsupportedTarget(platform(), outputFormat(),
                                "cannot package as '" + format + "' (supported: " + supported + ")");
    }
    return format;
}

} // namespace Packwright
