// =================================================================
// src/Packwright/MacOSAppBackend.cpp
// =================================================================
// Implementation for the macOS/app backend.

#include "Packwright/MacOSAppBackend.hpp"
#include "Packwright/CodeSigner.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include <optional>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

const std::map<std::string, std::string> PERMISSION_KEYS = {
    {"camera", "NSCameraUsageDescription"},
    {"microphone", "NSMicrophoneUsageDescription"},
    {"fine_location", "NSLocationWhenInUseUsageDescription"},
    {"background_location", "NSLocationAlwaysAndWhenInUseUsageDescription"},
    {"photo_library", "NSPhotoLibraryUsageDescription"},
    {"bluetooth", "NSBluetoothAlwaysUsageDescription"}
};

std::string escapeXml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

ToolSpec hostTool(const std::string& name, const std::vector<std::string>& verify_args,
                  const std::string& description) {
    ToolSpec spec;
    spec.name = name;
    spec.verify_args = verify_args;
    spec.supported_hosts = {"macos"};
    spec.description = description;
    return spec;
}

long parseMilliseconds(const EffectiveConfig& config, const std::string& key, long default_value) {
    std::string text = config.getString(key);
    if (text.empty()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size() || value <= 0) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw MalformedConfig("'" + key + "' must be a positive number of milliseconds, not '" + text + "'");
    }
}

} // anonymous namespace

const char* MacOSAppBackend::ADHOC_IDENTITY = "-";

std::vector<std::string> MacOSAppBackend::packagingFormats() const {
    return {"dmg", "zip"};
}

std::vector<ToolSpec> MacOSAppBackend::requiredTools(PipelineStage stage,
                                                     const std::string& packaging_format) const {
    if (stage != PipelineStage::PACKAGE) {
        return {};
    }
    std::vector<ToolSpec> tools = {
        hostTool("codesign", {}, "Apple code signing tool"),
        hostTool("xcrun", {"--version"}, "Xcode tool launcher, used for notarytool and stapler")
    };
    if (packaging_format == "zip") {
        tools.push_back(hostTool("ditto", {}, "Apple archive copier"));
    } else {
        tools.push_back(hostTool("hdiutil", {}, "Apple disk image utility"));
    }
    return tools;
}

fs::path MacOSAppBackend::bundlePath(const BackendContext& context) const {
    return context.tree.root / (context.config.formalName() + ".app");
}

fs::path MacOSAppBackend::launchPath(const BackendContext& context) const {
    return bundlePath(context) / "Contents" / "MacOS" / context.config.appName();
}

std::string MacOSAppBackend::infoPlist(const EffectiveConfig& config) {
    std::map<std::string, std::string> entries = {
        {"CFBundleDevelopmentRegion", "en"},
        {"CFBundleDisplayName", config.formalName()},
        {"CFBundleExecutable", config.appName()},
        {"CFBundleIdentifier", config.bundleIdentifier()},
        {"CFBundleInfoDictionaryVersion", "6.0"},
        {"CFBundleName", config.formalName()},
        {"CFBundlePackageType", "APPL"},
        {"CFBundleShortVersionString", config.version()},
        {"CFBundleVersion", config.getString("build", config.version())}
    };
    for (const auto& [permission, description] : config.getTable("permission")) {
        auto key = PERMISSION_KEYS.find(permission);
        if (key == PERMISSION_KEYS.end()) {
            Logger::getInstance().warning("Backend", "Permission '" + permission + "' has no macOS equivalent");
            continue;
        }
        entries[key->second] = description;
    }
    for (const auto& [key, value] : config.getTable("info")) {
        entries[key] = value;
    }

    std::ostringstream plist;
    plist << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
          << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
          << "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
          << "<plist version=\"1.0\">\n<dict>\n";
    for (const auto& [key, value] : entries) {
        plist << "\t<key>" << escapeXml(key) << "</key>\n"
              << "\t<string>" << escapeXml(value) << "</string>\n";
    }
    plist << "</dict>\n</plist>\n";
    return plist.str();
}

std::string MacOSAppBackend::signingIdentity(const EffectiveConfig& config, const PipelineOptions& options) {
    if (options.adhoc_sign) {
        return ADHOC_IDENTITY;
    }
    if (!options.signing_identity.empty()) {
        return options.signing_identity;
    }
    return config.getString("signing_identity", ADHOC_IDENTITY);
}

BackoffPolicy MacOSAppBackend::backoffPolicy(const EffectiveConfig& config) {
    BackoffPolicy policy;
    policy.initial_ms = parseMilliseconds(config, "notarization_poll_initial_ms", policy.initial_ms);
    policy.maximum_ms = parseMilliseconds(config, "notarization_poll_max_ms", policy.maximum_ms);
    return policy;
}

fs::path MacOSAppBackend::compile(BackendContext& context) {
    fs::path executable = NativeBackend::compile(context);
    fs::path bundle = bundlePath(context);

    ScopedTempDirectory staging(context.tree.root, ".bundle-");
    fs::path staged = staging.path() / bundle.filename();
    fs::path contents = staged / "Contents";
    fs::create_directories(contents / "MacOS");
    fs::create_directories(contents / "Resources");

    fs::path launcher = contents / "MacOS" / context.config.appName();
    fs::copy_file(executable, launcher);
    fs::permissions(launcher, fs::status(executable).permissions(), fs::perm_options::replace);

    std::error_code ec;
    if (fs::is_directory(appDirectory(context), ec)) {
        fs::copy(appDirectory(context), contents / "Resources" / "app",
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    }
    writeFileAtomic(contents / "Info.plist", infoPlist(context.config));

    replaceDirectory(staged, bundle);
    Logger::getInstance().info("Backend", "Assembled " + bundle.filename().string());
    return bundle;
}

void MacOSAppBackend::sign(BackendContext& context, const fs::path& path, const std::string& identity) {
    ToolInvocation invocation;
    invocation.args = {context.toolPath("codesign"), "--sign", identity, "--force"};
    if (identity != ADHOC_IDENTITY) {
        invocation.args.insert(invocation.args.end(), {"--options", "runtime", "--timestamp"});
    }
    invocation.args.push_back(path.string());
    invocation.tool_name = "codesign";
    context.supervisor.checkOutput(invocation);
}

fs::path MacOSAppBackend::archive(BackendContext& context, const std::string& format, const std::string& identity) {
    fs::path bundle = bundlePath(context);
    fs::path destination = distributablePath(context, format);
    fs::create_directories(destination.parent_path());
    fs::path partial = destination.parent_path() /
        (".partial-" + uniqueSuffix() + "-" + destination.filename().string());

    ToolInvocation invocation;
    if (format == "zip") {
        invocation.args = {context.toolPath("ditto"), "-c", "-k", "--sequesterRsrc", "--keepParent",
                           bundle.string(), partial.string()};
        invocation.tool_name = "ditto";
    } else {
        invocation.args = {context.toolPath("hdiutil"), "create", "-volname", context.config.formalName(),
                           "-srcfolder", bundle.string(), "-ov", "-format", "UDZO", partial.string()};
        invocation.tool_name = "hdiutil";
    }

    try {
        context.supervisor.checkOutput(invocation);
        if (format == "dmg" && identity != ADHOC_IDENTITY) {
            sign(context, partial, identity);
        }
        fs::rename(partial, destination);
    } catch (...) {
        removeQuietly(partial);
        throw;
    }
    return destination;
}

fs::path MacOSAppBackend::package(BackendContext& context, const std::string& format) {
    auto& logger = Logger::getInstance();
    const EffectiveConfig& config = context.config;

    fs::path bundle = bundlePath(context);
    std::error_code ec;
    if (!fs::is_directory(bundle, ec)) {
        throw UserError(bundle.string() + " does not exist; compile " + config.appName() + " first");
    }

    std::string identity = signingIdentity(config, context.options);
    if (identity == ADHOC_IDENTITY) {
        logger.warning("Signing", "Signing " + config.appName() + " with an ad-hoc identity",
                       "the app will only run on this machine");
    }

    auto signAndArchive = [this, &context, &format, &identity, &bundle]() {
        CodeSigner signer([this, &context, &identity](const fs::path& path) {
            sign(context, path, identity);
        }, context.cancellation);
        signer.signBundle(bundle);
        return archive(context, format, identity);
    };

    fs::path distributable;
    if (!context.options.notarize || identity == ADHOC_IDENTITY) {
        distributable = signAndArchive();
        if (!context.options.notarize) {
            logger.info("Notarization", "Skipping notarization of " + distributable.filename().string());
        } else {
            logger.warning("Notarization", "Ad-hoc signed apps cannot be notarized; skipping notarization");
        }
        logger.info("Backend", "Packaged " + config.appName(), distributable.string());
        return distributable;
    }

    std::string profile = config.getString("notarization_profile");
    if (profile.empty()) {
        throw UserError("Notarizing " + config.appName() + " needs 'notarization_profile' "
                        "(a notarytool keychain profile), or pass --no-notarize");
    }

    NotaryToolService service(context.supervisor, profile, context.toolPath("xcrun"));
    NotarizationJob job(service, context.tree.metadataDirectory() / "notarization.json",
                        backoffPolicy(config), context.cancellation);

    // A submitted artefact is stapled as is; signing or archiving again would change it
    const std::string& submission_id = context.options.submission_id;
    fs::path expected = distributablePath(context, format);
    std::optional<NotarizationRecord> pending = job.pendingSubmission(submission_id);
    if (pending && fs::path(pending->artefact) != expected) {
        pending.reset();
    }
    if (pending) {
        distributable = pending->artefact;
        logger.info("Notarization", "Reusing submitted " + distributable.filename().string(),
                    "submission " + pending->submission_id);
    } else if (!submission_id.empty()) {
        distributable = expected;
        if (!fs::is_regular_file(distributable, ec)) {
            throw UserError(distributable.string() + " does not exist; submission " + submission_id +
                            " can only be resumed with the artefact that was submitted");
        }
    } else {
        distributable = signAndArchive();
    }

    // A zip cannot hold a ticket: staple the bundle and archive it again
    fs::path staple_target = format == "zip" ? bundle : distributable;
    if (pending) {
        job.resume(pending->submission_id, distributable, staple_target);
    } else if (!submission_id.empty()) {
        job.resume(submission_id, distributable, staple_target);
    } else {
        job.run(distributable, staple_target);
    }
    if (format == "zip") {
        distributable = archive(context, format, identity);
    }

    logger.info("Backend", "Packaged " + config.appName(), distributable.string());
    return distributable;
}

} // namespace Packwright
