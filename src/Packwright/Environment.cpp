// =================================================================
// src/Packwright/Environment.cpp
// =================================================================
// Implementation for host detection and cache locations.

#include "Packwright/Environment.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <sys/utsname.h>
#include <unistd.h>

namespace Packwright {

HostInfo detectHost() {
    HostInfo host;
    struct utsname info;
    if (uname(&info) != 0) {
        host.os = "unknown";
        host.arch = "unknown";
        return host;
    }

    std::string sysname = info.sysname;
    if (sysname == "Darwin") {
        host.os = "macos";
    } else if (sysname == "Linux") {
        host.os = "linux";
    } else {
        host.os = sysname;
        for (auto& c : host.os) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    host.arch = info.machine;
    if (host.arch == "aarch64") {
        host.arch = "arm64";
    } else if (host.arch == "amd64") {
        host.arch = "x86_64";
    }
    return host;
}

std::optional<std::string> getEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path cacheRoot() {
    if (auto home_override = getEnvironment("PACKWRIGHT_HOME")) {
        if (!home_override->empty()) {
            return std::filesystem::path(*home_override);
        }
    }

    std::filesystem::path home = getEnvironment("HOME").value_or(".");
    if (detectHost().os == "macos") {
        return home / "Library" / "Caches" / "org.packwright";
    }

    if (auto xdg = getEnvironment("XDG_CACHE_HOME")) {
        if (!xdg->empty()) {
            return std::filesystem::path(*xdg) / "packwright";
        }
    }
    return home / ".cache" / "packwright";
}

int environmentVerbosity() {
    auto value = getEnvironment("PACKWRIGHT_VERBOSITY");
    if (!value || value->empty()) {
        return 0;
    }
    try {
        return std::stoi(*value);
    } catch (const std::exception&) {
        return 0;
    }
}

std::optional<std::filesystem::path> findExecutable(const std::string& name, const std::string& search_path) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }

    std::string path_list = search_path;
    if (path_list.empty()) {
        path_list = getEnvironment("PATH").value_or("/usr/local/bin:/usr/bin:/bin");
    }

    std::istringstream stream(path_list);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string toolVersion() {
    return PACKWRIGHT_VERSION;
}

} // namespace Packwright
