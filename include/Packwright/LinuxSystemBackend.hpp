// =================================================================
// include/Packwright/LinuxSystemBackend.hpp
// =================================================================
// Backend producing system packages for Linux hosts.

#pragma once

#include "Packwright/NativeBackend.hpp"

namespace Packwright {

/**
 * @brief linux/system: a tree holding `bin/<app>` and `app/`, packaged as
 * a tar.gz or zip archive
 */
class LinuxSystemBackend : public NativeBackend {
public:
    std::string platform() const override { return "linux"; }
    std::string outputFormat() const override { return "system"; }

    std::vector<std::string> packagingFormats() const override;
    std::string defaultPackagingFormat() const override { return "tar.gz"; }

    std::vector<ToolSpec> requiredTools(PipelineStage stage, const std::string& packaging_format) const override;

    std::filesystem::path package(BackendContext& context, const std::string& format) override;

    /**
     * @brief Archiver spec for a packaging format
     */
    static ToolSpec archiverFor(const std::string& format);
};

} // namespace Packwright
