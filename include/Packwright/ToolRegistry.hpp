// =================================================================
// include/Packwright/ToolRegistry.hpp
// =================================================================
// Describes, verifies, acquires and caches external tools.

#pragma once

#include "Packwright/Downloader.hpp"
#include "Packwright/Environment.hpp"
#include "Packwright/ProcessSupervisor.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief Verification result for a tool candidate
 */
enum class ToolStatus {
    ABSENT,         ///< Not installed, or not runnable
    WRONG_VERSION,  ///< Installed but outside the required range
    OK              ///< Installed and acceptable
};

/**
 * @brief Where a resolved tool comes from
 */
enum class ToolOrigin {
    NONE,       ///< Not found anywhere
    OVERRIDE,   ///< User supplied executable via environment variable
    MANAGED,    ///< Entry in Packwright's tool cache
    SYSTEM      ///< Found on PATH
};

std::string toolStatusToString(ToolStatus status);
std::string toolOriginToString(ToolOrigin origin);

/**
 * @brief Static description of an external tool dependency
 */
struct ToolSpec {
    std::string name;                       ///< Tool identifier, e.g. "appimagetool"
    std::string version;                    ///< Version acquired into the cache
    std::string version_range;              ///< Accepted versions, e.g. ">=1.2,<2"; empty = any
    std::string url;                        ///< Acquisition URL template; empty = not acquirable
    std::string sha256;                     ///< Expected digest of the download
    long long size = -1;                    ///< Expected download size in bytes; -1 = unknown
    bool is_archive = false;                ///< Download must be unpacked
    std::string executable;                 ///< Path of the executable inside the install; default = name
    std::vector<std::string> verify_args = {"--version"};
    std::string version_regex = R"((\d+(?:\.\d+)+))";
    std::string override_env;               ///< Default PACKWRIGHT_TOOL_<NAME>
    std::vector<std::string> supported_hosts; ///< "linux", "macos-arm64", ...; empty = any
    bool system_lookup = true;              ///< Accept an installation found on PATH
    std::string description;

    /**
     * @brief Name of the "use exactly this executable" environment variable
     */
    std::string overrideVariable() const;

    /**
     * @brief Relative executable path inside an install directory
     */
    std::string executablePath() const;

    /**
     * @brief URL with {version}, {os} and {arch} substituted
     */
    std::string resolvedUrl(const HostInfo& host) const;

    bool supportsHost(const HostInfo& host) const;
};

/**
 * @brief Outcome of locating a tool without acquiring it
 */
struct ToolResolution {
    ToolStatus status = ToolStatus::ABSENT;
    ToolOrigin origin = ToolOrigin::NONE;
    std::filesystem::path path;
    std::string detected_version;
};

struct ToolListing {
    ToolSpec spec;
    ToolResolution resolution;
};

/**
 * @brief Registry of external tools with an on-disk cache
 *
 * Detection order: the per-tool override variable always wins; then a
 * published cache entry; then an acceptable installation on PATH; otherwise
 * the tool is acquired. Cache entries live under
 * <cache>/tools/<name>/<version>/<os>-<arch>/ and are published by atomic
 * rename, so a partially downloaded tool is never visible.
 */
class ToolRegistry {
public:
    ToolRegistry(ProcessSupervisor& supervisor,
                 std::shared_ptr<Downloader> downloader,
                 const std::filesystem::path& cache_root = cacheRoot(),
                 const HostInfo& host = detectHost());

    /**
     * @brief Register (or replace) a tool description
     */
    void registerTool(const ToolSpec& spec);

    bool hasTool(const std::string& name) const;

    /**
     * @throws MissingTool if no tool with that name is registered
     */
    ToolSpec getSpec(const std::string& name) const;

    /**
     * @brief Registered tool names, sorted
     */
    std::vector<std::string> toolNames() const;

    /**
     * @brief Status of the best installed candidate for a tool
     */
    ToolStatus verify(const ToolSpec& spec);

    /**
     * @brief Locate a tool following the detection order, without acquiring
     */
    ToolResolution locate(const ToolSpec& spec);

    /**
     * @brief Download and publish a tool into the cache
     * @return Path to the executable
     * @throws UnsupportedPlatform, MissingTool, DownloadFailed, IntegrityFailed, Cancelled
     */
    std::filesystem::path acquire(const ToolSpec& spec);

    /**
     * @brief Locate a usable tool, acquiring it when needed
     * @return Path to the executable
     */
    std::filesystem::path ensure(const ToolSpec& spec);

    /**
     * @brief Ensure several tools concurrently
     *
     * Every tool is attempted; the first failure (in argument order) is
     * rethrown once all attempts have finished.
     * @return Map from tool name to executable path
     */
    std::map<std::string, std::filesystem::path> ensureAll(const std::vector<ToolSpec>& specs);

    /**
     * @brief Re-acquire a tool and atomically replace its cache entry
     * @throws UserError if the tool is provided through its override variable
     */
    std::filesystem::path upgrade(const std::string& name);

    /**
     * @brief Describe every registered tool
     */
    std::vector<ToolListing> list();

    /**
     * @brief Cache directory of a tool entry for this host
     */
    std::filesystem::path entryPath(const ToolSpec& spec) const;

    /**
     * @brief Remove staging directories abandoned by interrupted runs
     */
    void cleanStaleStaging(std::chrono::hours max_age = std::chrono::hours(24));

    const std::filesystem::path& cacheRootPath() const { return m_cache_root; }
    const HostInfo& host() const { return m_host; }

private:
    ProcessSupervisor& m_supervisor;
    std::shared_ptr<Downloader> m_downloader;
    std::filesystem::path m_cache_root;
    HostInfo m_host;

    std::map<std::string, ToolSpec> m_specs;
    mutable std::mutex m_specs_mutex;

    std::map<std::string, std::unique_ptr<std::mutex>> m_entry_locks;
    std::mutex m_entry_locks_mutex;

    ToolStatus verifyExecutable(const ToolSpec& spec, const std::filesystem::path& executable,
                                std::string* detected_version = nullptr);
    std::filesystem::path installEntry(const ToolSpec& spec, bool replace_existing);
    void unpack(const ToolSpec& spec, const std::filesystem::path& payload,
                const std::filesystem::path& install_dir);
    std::mutex& entryLock(const ToolSpec& spec);
    bool hasPublishedEntry(const ToolSpec& spec) const;
};

} // namespace Packwright
