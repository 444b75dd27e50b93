// =================================================================
// include/Packwright/MacOSAppBackend.hpp
// =================================================================
// Backend producing signed and notarized macOS app bundles.

#pragma once

#include "Packwright/NativeBackend.hpp"
#include "Packwright/Notarization.hpp"

namespace Packwright {

/**
 * @brief macOS/app: `<Formal Name>.app` bundles packaged as zip or dmg
 *
 * Additional settings: `signing_identity`, `notarization_profile`,
 * `notarization_poll_initial_ms`, `notarization_poll_max_ms`, `info`
 * (extra Info.plist strings) and `permission` (usage descriptions).
 */
class MacOSAppBackend : public NativeBackend {
public:
    static const char* ADHOC_IDENTITY;

    std::string platform() const override { return "macOS"; }
    std::string outputFormat() const override { return "app"; }

    std::vector<std::string> packagingFormats() const override;
    std::string defaultPackagingFormat() const override { return "dmg"; }

    std::vector<ToolSpec> requiredTools(PipelineStage stage, const std::string& packaging_format) const override;

    /**
     * @brief Build with the configured command, then assemble the bundle
     * @return Path of the .app bundle
     */
    std::filesystem::path compile(BackendContext& context) override;

    std::filesystem::path package(BackendContext& context, const std::string& format) override;

    /**
     * @brief Render Info.plist for an app
     */
    static std::string infoPlist(const EffectiveConfig& config);

    /**
     * @brief Signing identity: --adhoc-sign, then --identity, then
     * `signing_identity`, else ad-hoc
     */
    static std::string signingIdentity(const EffectiveConfig& config, const PipelineOptions& options);

    /**
     * @brief Poll timing from the configuration
     * @throws MalformedConfig for non-numeric values
     */
    static BackoffPolicy backoffPolicy(const EffectiveConfig& config);

    std::filesystem::path bundlePath(const BackendContext& context) const;

protected:
    std::filesystem::path launchPath(const BackendContext& context) const override;
    std::string launcherAppDirectory() const override { return "../Resources/app"; }

private:
    void sign(BackendContext& context, const std::filesystem::path& path, const std::string& identity);
    std::filesystem::path archive(BackendContext& context, const std::string& format, const std::string& identity);
};

} // namespace Packwright
