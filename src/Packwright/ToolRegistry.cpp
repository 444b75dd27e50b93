// =================================================================
// src/Packwright/ToolRegistry.cpp
// =================================================================
// Implementation for tool detection, acquisition and caching.

#include "Packwright/ToolRegistry.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include "Packwright/Version.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <regex>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

const char* MANIFEST_NAME = ".packwright-tool.json";

std::string toUpperIdentifier(const std::string& name) {
    std::string result;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        result += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return result;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::string toolStatusToString(ToolStatus status) {
    switch (status) {
        case ToolStatus::ABSENT: return "absent";
        case ToolStatus::WRONG_VERSION: return "wrong version";
        case ToolStatus::OK: return "ok";
        default: return "unknown";
    }
}

std::string toolOriginToString(ToolOrigin origin) {
    switch (origin) {
        case ToolOrigin::NONE: return "-";
        case ToolOrigin::OVERRIDE: return "override";
        case ToolOrigin::MANAGED: return "managed";
        case ToolOrigin::SYSTEM: return "system";
        default: return "unknown";
    }
}

// ToolSpec

std::string ToolSpec::overrideVariable() const {
    if (!override_env.empty()) {
        return override_env;
    }
    return "PACKWRIGHT_TOOL_" + toUpperIdentifier(name);
}

std::string ToolSpec::executablePath() const {
    return executable.empty() ? name : executable;
}

std::string ToolSpec::resolvedUrl(const HostInfo& host) const {
    std::string resolved = url;
    replaceAll(resolved, "{version}", version);
    replaceAll(resolved, "{os}", host.os);
    replaceAll(resolved, "{arch}", host.arch);
    return resolved;
}

bool ToolSpec::supportsHost(const HostInfo& host) const {
    if (supported_hosts.empty()) {
        return true;
    }
    for (const auto& supported : supported_hosts) {
        if (supported == host.os || supported == host.key()) {
            return true;
        }
    }
    return false;
}

// ToolRegistry

ToolRegistry::ToolRegistry(ProcessSupervisor& supervisor,
                           std::shared_ptr<Downloader> downloader,
                           const fs::path& cache_root,
                           const HostInfo& host)
    : m_supervisor(supervisor),
      m_downloader(std::move(downloader)),
      m_cache_root(cache_root),
      m_host(host) {
}

void ToolRegistry::registerTool(const ToolSpec& spec) {
    std::lock_guard<std::mutex> lock(m_specs_mutex);
    m_specs[spec.name] = spec;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_specs_mutex);
    return m_specs.count(name) > 0;
}

ToolSpec ToolRegistry::getSpec(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_specs_mutex);
    auto it = m_specs.find(name);
    if (it == m_specs.end()) {
        throw MissingTool(name, "no such tool is known to Packwright");
    }
    return it->second;
}

std::vector<std::string> ToolRegistry::toolNames() const {
    std::lock_guard<std::mutex> lock(m_specs_mutex);
    std::vector<std::string> names;
    for (const auto& [name, spec] : m_specs) {
        names.push_back(name);
    }
    return names;
}

fs::path ToolRegistry::entryPath(const ToolSpec& spec) const {
    std::string version = spec.version.empty() ? "unversioned" : spec.version;
    return m_cache_root / "tools" / spec.name / version / m_host.key();
}

bool ToolRegistry::hasPublishedEntry(const ToolSpec& spec) const {
    std::error_code ec;
    return fs::is_regular_file(entryPath(spec) / MANIFEST_NAME, ec);
}

ToolStatus ToolRegistry::verify(const ToolSpec& spec) {
    return locate(spec).status;
}

ToolResolution ToolRegistry::locate(const ToolSpec& spec) {
    auto& logger = Logger::getInstance();
    ToolResolution resolution;

    auto override_value = getEnvironment(spec.overrideVariable());
    if (override_value && !override_value->empty()) {
        resolution.origin = ToolOrigin::OVERRIDE;
        resolution.path = *override_value;
        auto executable = findExecutable(*override_value);
        if (!executable) {
            resolution.status = ToolStatus::ABSENT;
            return resolution;
        }
        resolution.path = *executable;
        ToolStatus status = verifyExecutable(spec, resolution.path, &resolution.detected_version);
        if (status == ToolStatus::WRONG_VERSION) {
            logger.warning("Tools", spec.name + " from " + spec.overrideVariable() +
                           " does not satisfy " + spec.version_range + "; using it anyway",
                           resolution.detected_version);
        }
        resolution.status = ToolStatus::OK;
        return resolution;
    }

    if (hasPublishedEntry(spec)) {
        resolution.origin = ToolOrigin::MANAGED;
        resolution.path = entryPath(spec) / spec.executablePath();
        resolution.status = verifyExecutable(spec, resolution.path, &resolution.detected_version);
        if (resolution.status == ToolStatus::OK) {
            return resolution;
        }
        logger.warning("Tools", "Cached " + spec.name + " is not usable",
                       resolution.path.string() + ": " + toolStatusToString(resolution.status));
    }

    if (spec.system_lookup) {
        auto system_path = findExecutable(fs::path(spec.executablePath()).filename().string());
        if (system_path) {
            std::string detected;
            ToolStatus status = verifyExecutable(spec, *system_path, &detected);
            if (status == ToolStatus::OK || resolution.origin == ToolOrigin::NONE) {
                resolution.origin = ToolOrigin::SYSTEM;
                resolution.path = *system_path;
                resolution.status = status;
                resolution.detected_version = detected;
            }
            if (status == ToolStatus::OK) {
                return resolution;
            }
        }
    }

    return resolution;
}

ToolStatus ToolRegistry::verifyExecutable(const ToolSpec& spec, const fs::path& executable,
                                          std::string* detected_version) {
    std::error_code ec;
    if (!fs::is_regular_file(executable, ec)) {
        return ToolStatus::ABSENT;
    }
    if (spec.verify_args.empty()) {
        return ToolStatus::OK;
    }

    ToolInvocation invocation;
    invocation.args.push_back(executable.string());
    invocation.args.insert(invocation.args.end(), spec.verify_args.begin(), spec.verify_args.end());
    invocation.tool_name = spec.name;

    ProcessResult result;
    try {
        result = m_supervisor.run(invocation);
    } catch (const MissingTool&) {
        return ToolStatus::ABSENT;
    }
    if (result.outcome == RunOutcome::CANCELLED) {
        throw Cancelled();
    }
    if (!result.succeeded()) {
        return ToolStatus::ABSENT;
    }

    std::smatch match;
    std::string version_text;
    try {
        std::regex version_pattern(spec.version_regex);
        if (std::regex_search(result.output, match, version_pattern)) {
            version_text = match.size() > 1 ? match[1].str() : match[0].str();
        }
    } catch (const std::regex_error& e) {
        throw UserError("Invalid version pattern for " + spec.name + ": " + e.what());
    }
    if (detected_version != nullptr) {
        *detected_version = version_text;
    }

    if (spec.version_range.empty()) {
        return ToolStatus::OK;
    }
    VersionRange range;
    try {
        range = VersionRange::parse(spec.version_range);
    } catch (const std::logic_error& e) {
        throw UserError("Invalid version range for " + spec.name + ": " + e.what());
    }

    if (version_text.empty() || !Version::isValid(version_text)) {
        return ToolStatus::WRONG_VERSION;
    }
    try {
        return range.contains(Version::parse(version_text)) ? ToolStatus::OK : ToolStatus::WRONG_VERSION;
    } catch (const std::logic_error& e) {
        // Components too large for a version number
        Logger::getInstance().debug("Tools", "Unusable " + spec.name + " version " + version_text, e.what());
        return ToolStatus::WRONG_VERSION;
    }
}

fs::path ToolRegistry::ensure(const ToolSpec& spec) {
    ToolResolution resolution = locate(spec);
    if (resolution.origin == ToolOrigin::OVERRIDE) {
        if (resolution.status == ToolStatus::ABSENT) {
            throw MissingTool(spec.name, spec.overrideVariable() + " points at '" +
                              resolution.path.string() + "', which is not an executable");
        }
        return resolution.path;
    }
    if (resolution.status == ToolStatus::OK) {
        Logger::getInstance().debug("Tools", "Using " + toolOriginToString(resolution.origin) + " " + spec.name,
                                    resolution.path.string());
        return resolution.path;
    }
    return acquire(spec);
}

fs::path ToolRegistry::acquire(const ToolSpec& spec) {
    std::lock_guard<std::mutex> lock(entryLock(spec));

    if (hasPublishedEntry(spec)) {
        fs::path executable = entryPath(spec) / spec.executablePath();
        if (verifyExecutable(spec, executable) == ToolStatus::OK) {
            return executable;
        }
        return installEntry(spec, true);
    }
    return installEntry(spec, false);
}

fs::path ToolRegistry::upgrade(const std::string& name) {
    ToolSpec spec = getSpec(name);

    auto override_value = getEnvironment(spec.overrideVariable());
    if (override_value && !override_value->empty()) {
        throw UserError(name + " is provided by " + spec.overrideVariable() +
                        " and is not managed by Packwright");
    }

    std::lock_guard<std::mutex> lock(entryLock(spec));
    Logger::getInstance().info("Tools", "Upgrading " + name);
    return installEntry(spec, true);
}

std::map<std::string, fs::path> ToolRegistry::ensureAll(const std::vector<ToolSpec>& specs) {
    std::vector<std::future<fs::path>> futures;
    futures.reserve(specs.size());
    for (const auto& spec : specs) {
        futures.push_back(std::async(std::launch::async, [this, spec]() {
            return ensure(spec);
        }));
    }

    std::map<std::string, fs::path> paths;
    std::exception_ptr first_error;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            paths[specs[i].name] = futures[i].get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return paths;
}

std::vector<ToolListing> ToolRegistry::list() {
    std::vector<ToolListing> listings;
    for (const auto& name : toolNames()) {
        ToolListing listing;
        listing.spec = getSpec(name);
        listing.resolution = locate(listing.spec);
        listings.push_back(listing);
    }
    return listings;
}

void ToolRegistry::cleanStaleStaging(std::chrono::hours max_age) {
    fs::path staging_root = m_cache_root / "tools" / ".staging";
    std::error_code ec;
    if (!fs::is_directory(staging_root, ec)) {
        return;
    }

    auto now = fs::file_time_type::clock::now();
    for (const auto& entry : fs::directory_iterator(staging_root, ec)) {
        std::error_code time_ec;
        auto modified = fs::last_write_time(entry.path(), time_ec);
        if (!time_ec && now - modified > max_age) {
            Logger::getInstance().debug("Tools", "Removing abandoned staging directory", entry.path().string());
            removeQuietly(entry.path());
        }
    }
}

fs::path ToolRegistry::installEntry(const ToolSpec& spec, bool replace_existing) {
    auto& logger = Logger::getInstance();

    if (!spec.supportsHost(m_host)) {
        throw UnsupportedPlatform(spec.name, m_host.key());
    }
    if (spec.url.empty()) {
        throw MissingTool(spec.name, "install it manually, or point " + spec.overrideVariable() +
                          " at an existing executable");
    }

    cleanStaleStaging();

    std::string url = spec.resolvedUrl(m_host);
    ScopedTempDirectory staging(m_cache_root / "tools" / ".staging", spec.name + "-");

    std::string payload_name = url.substr(url.find_last_of('/') + 1);
    if (payload_name.empty()) {
        payload_name = spec.name;
    }
    fs::path payload = staging.path() / "download" / payload_name;
    fs::create_directories(payload.parent_path());

    m_downloader->download(url, payload, m_supervisor.token());

    if (spec.size >= 0) {
        auto actual_size = static_cast<long long>(fs::file_size(payload));
        if (actual_size != spec.size) {
            throw IntegrityFailed(spec.name, "expected " + std::to_string(spec.size) + " bytes, got " +
                                  std::to_string(actual_size));
        }
    }

    std::string digest = sha256File(payload);
    if (!spec.sha256.empty() && toLower(spec.sha256) != digest) {
        throw IntegrityFailed(spec.name, "SHA-256 mismatch (expected " + spec.sha256 + ", got " + digest + ")");
    }

    fs::path install_dir = staging.path() / "install";
    fs::create_directories(install_dir);
    fs::path executable = install_dir / spec.executablePath();

    if (spec.is_archive) {
        unpack(spec, payload, install_dir);
    } else {
        fs::create_directories(executable.parent_path());
        fs::copy_file(payload, executable, fs::copy_options::overwrite_existing);
    }

    std::error_code ec;
    if (!fs::is_regular_file(executable, ec)) {
        throw IntegrityFailed(spec.name, "download does not contain " + spec.executablePath());
    }
    fs::permissions(executable,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add);

    std::string detected;
    if (verifyExecutable(spec, executable, &detected) != ToolStatus::OK) {
        throw IntegrityFailed(spec.name, "downloaded executable failed verification" +
                              (detected.empty() ? std::string() : " (reports version " + detected + ")"));
    }

    nlohmann::json manifest = {
        {"name", spec.name},
        {"version", spec.version},
        {"url", url},
        {"sha256", digest},
        {"host", m_host.key()},
        {"executable", spec.executablePath()}
    };
    writeFileAtomic(install_dir / MANIFEST_NAME, manifest.dump(2));

    fs::path destination = entryPath(spec);
    if (replace_existing) {
        replaceDirectory(install_dir, destination);
    } else if (!publishDirectory(install_dir, destination)) {
        logger.debug("Tools", "Another process published " + spec.name + " first; using its copy");
    }

    logger.info("Tools", "Installed " + spec.name + " " + spec.version, destination.string());
    return destination / spec.executablePath();
}

void ToolRegistry::unpack(const ToolSpec& spec, const fs::path& payload, const fs::path& install_dir) {
    ToolInvocation invocation;
    if (endsWith(payload.filename().string(), ".zip")) {
        invocation.args = {"unzip", "-q", payload.string(), "-d", install_dir.string()};
    } else {
        invocation.args = {"tar", "-xf", payload.string(), "-C", install_dir.string()};
    }
    invocation.tool_name = invocation.args[0];

    ProcessResult result = m_supervisor.run(invocation);
    if (result.outcome == RunOutcome::CANCELLED) {
        throw Cancelled();
    }
    if (!result.succeeded()) {
        throw IntegrityFailed(spec.name, "could not unpack download: " + result.output);
    }
}

std::mutex& ToolRegistry::entryLock(const ToolSpec& spec) {
    std::lock_guard<std::mutex> lock(m_entry_locks_mutex);
    std::string key = spec.name + "/" + spec.version;
    auto& slot = m_entry_locks[key];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

} // namespace Packwright
