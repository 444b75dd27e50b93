// =================================================================
// include/Packwright/BackendRegistry.hpp
// =================================================================
// Maps (platform, output format) pairs to backend factories.

#pragma once

#include "Packwright/Backend.hpp"
#include "Packwright/Environment.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Packwright {

/**
 * @brief Backend factory function type
 */
using BackendFactory = std::function<std::unique_ptr<PlatformBackend>()>;

/**
 * @brief Registry of the platform backends known to this build
 *
 * Adding a target means registering a factory; nothing in the Pipeline
 * changes.
 */
class BackendRegistry {
public:
    BackendRegistry() = default;

    /**
     * @brief Register a factory for a (platform, format) pair
     * @param platform Platform name, e.g. "linux"
     * @param format Output format name, e.g. "system"
     * @param factory Creates a fresh backend per pipeline run
     * @param is_default Use this format when none is requested for the platform
     */
    void registerBackend(const std::string& platform, const std::string& format,
                         BackendFactory factory, bool is_default = false);

    /**
     * @brief Create a backend
     * @throws UnsupportedTarget if the pair has no registered factory
     */
    std::unique_ptr<PlatformBackend> create(const std::string& platform, const std::string& format) const;

    bool supports(const std::string& platform, const std::string& format) const;

    std::vector<std::string> platforms() const;
    std::vector<std::string> formats(const std::string& platform) const;

    /**
     * @brief Default output format of a platform
     * @throws UnsupportedTarget if the platform is unknown
     */
    std::string defaultFormat(const std::string& platform) const;

    /**
     * @brief Platform name targeted when none is given on the command line
     */
    static std::string defaultPlatformFor(const HostInfo& host);

    /**
     * @brief Registry holding the backends shipped with Packwright
     */
    static BackendRegistry withBuiltinBackends();

private:
    std::map<std::pair<std::string, std::string>, BackendFactory> m_factories;
    std::map<std::string, std::string> m_default_formats;
};

} // namespace Packwright
