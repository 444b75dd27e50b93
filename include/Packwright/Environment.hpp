// =================================================================
// include/Packwright/Environment.hpp
// =================================================================
// Host detection, environment overrides and cache locations.

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#ifndef PACKWRIGHT_VERSION
#define PACKWRIGHT_VERSION "0.1.0"
#endif

namespace Packwright {

/**
 * @brief Operating system and CPU architecture of the running host
 */
struct HostInfo {
    std::string os;     ///< "linux", "macos", ...
    std::string arch;   ///< "x86_64", "arm64", ...

    /**
     * @brief Cache-key form, e.g. "linux-x86_64"
     */
    std::string key() const { return os + "-" + arch; }
};

/**
 * @brief Detect the host OS and architecture via uname()
 */
HostInfo detectHost();

/**
 * @brief Read an environment variable
 * @return The value, or std::nullopt when unset
 */
std::optional<std::string> getEnvironment(const std::string& name);

/**
 * @brief Root directory for Packwright's persistent caches
 *
 * PACKWRIGHT_HOME wins; otherwise $XDG_CACHE_HOME/packwright or
 * ~/.cache/packwright on Linux and ~/Library/Caches/org.packwright on macOS.
 */
std::filesystem::path cacheRoot();

/**
 * @brief Verbosity requested through PACKWRIGHT_VERBOSITY (0 when unset)
 */
int environmentVerbosity();

/**
 * @brief Search a PATH-style list for an executable
 * @param name Executable name; returned unchanged (if executable) when it contains a '/'
 * @param search_path PATH value; empty means the process PATH
 * @return Full path, or std::nullopt when not found
 */
std::optional<std::filesystem::path> findExecutable(const std::string& name,
                                                    const std::string& search_path = "");

/**
 * @brief The running tool's own version string
 */
std::string toolVersion();

} // namespace Packwright
