// =================================================================
// src/Packwright/BackendRegistry.cpp
// =================================================================
// Implementation for the backend registry.

#include "Packwright/BackendRegistry.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/LinuxSystemBackend.hpp"
#include "Packwright/Logger.hpp"
#include "Packwright/MacOSAppBackend.hpp"

namespace Packwright {

void BackendRegistry::registerBackend(const std::string& platform, const std::string& format,
                                      BackendFactory factory, bool is_default) {
    m_factories[{platform, format}] = std::move(factory);
    if (is_default || m_default_formats.count(platform) == 0) {
        m_default_formats[platform] = format;
    }
    Logger::getInstance().debug("BackendRegistry", "Registered backend " + platform + "/" + format);
}

std::unique_ptr<PlatformBackend> BackendRegistry::create(const std::string& platform,
                                                         const std::string& format) const {
    auto it = m_factories.find({platform, format});
    if (it == m_factories.end()) {
        std::string known;
        for (const auto& candidate : formats(platform)) {
            known += (known.empty() ? "" : ", ") + candidate;
        }
        throw UnsupportedTarget(platform, format,
                                known.empty() ? "no backend is registered for this platform"
                                              : "available formats are " + known);
    }

    auto backend = it->second();
    if (!backend) {
        throw UnsupportedTarget(platform, format, "backend factory returned no backend");
    }
    return backend;
}

bool BackendRegistry::supports(const std::string& platform, const std::string& format) const {
    return m_factories.count({platform, format}) > 0;
}

std::vector<std::string> BackendRegistry::platforms() const {
    std::vector<std::string> result;
    for (const auto& [platform, format] : m_default_formats) {
        result.push_back(platform);
    }
    return result;
}

std::vector<std::string> BackendRegistry::formats(const std::string& platform) const {
    std::vector<std::string> result;
    for (const auto& [key, factory] : m_factories) {
        if (key.first == platform) {
            result.push_back(key.second);
        }
    }
    return result;
}

std::string BackendRegistry::defaultFormat(const std::string& platform) const {
    auto it = m_default_formats.find(platform);
    if (it == m_default_formats.end()) {
        throw UnsupportedTarget(platform, "<default>", "no backend is registered for this platform");
    }
    return it->second;
}

std::string BackendRegistry::defaultPlatformFor(const HostInfo& host) {
    if (host.os == "macos") {
        return "macOS";
    }
    return host.os;
}

BackendRegistry BackendRegistry::withBuiltinBackends() {
    BackendRegistry registry;
    registry.registerBackend("linux", "system", [] {
        return std::make_unique<LinuxSystemBackend>();
    }, true);
    registry.registerBackend("macOS", "app", [] {
        return std::make_unique<MacOSAppBackend>();
    }, true);
    return registry;
}

} // namespace Packwright
