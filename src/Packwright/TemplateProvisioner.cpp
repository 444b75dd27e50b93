// =================================================================
// src/Packwright/TemplateProvisioner.cpp
// =================================================================
// Implementation for template fetching and rendering.

#include "Packwright/TemplateProvisioner.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/IgnorePattern.hpp"
#include "Packwright/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <memory>
#include <mutex>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

struct TemplateManifest {
    std::map<std::string, std::string> defaults;
    std::vector<std::string> copy_without_render;
};

TemplateManifest loadManifest(const fs::path& template_dir) {
    TemplateManifest manifest;
    fs::path manifest_path = template_dir / TemplateProvisioner::MANIFEST_NAME;
    std::error_code ec;
    if (!fs::is_regular_file(manifest_path, ec)) {
        return manifest;
    }

    try {
        YAML::Node root = YAML::LoadFile(manifest_path.string());
        if (root["defaults"]) {
            for (auto it = root["defaults"].begin(); it != root["defaults"].end(); ++it) {
                manifest.defaults[it->first.as<std::string>()] = it->second.as<std::string>();
            }
        }
        if (root["copy_without_render"]) {
            for (const auto& pattern : root["copy_without_render"]) {
                manifest.copy_without_render.push_back(pattern.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        throw TemplateError("Invalid template manifest " + manifest_path.string() + ": " + e.what());
    }
    return manifest;
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::mutex g_source_locks_mutex;
std::map<std::string, std::unique_ptr<std::mutex>> g_source_locks;

// One lock per cached source; a clone replaces the directory another render may be reading
std::mutex& sourceLock(const fs::path& cache_directory) {
    std::lock_guard<std::mutex> lock(g_source_locks_mutex);
    auto& slot = g_source_locks[cache_directory.lexically_normal().string()];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

} // anonymous namespace

const char* TemplateProvisioner::MANIFEST_NAME = "template.yml";

bool TemplateSource::isRemote() const {
    for (const char* prefix : {"https://", "http://", "ssh://", "git://", "file://", "git@"}) {
        if (startsWith(location, prefix)) {
            return true;
        }
    }
    return false;
}

TemplateProvisioner::TemplateProvisioner(ProcessSupervisor& supervisor,
                                         const fs::path& cache_root,
                                         const std::string& tool_version)
    : m_supervisor(supervisor), m_cache_root(cache_root), m_tool_version(tool_version) {
}

std::vector<std::string> TemplateProvisioner::candidateBranches(const TemplateSource& source) const {
    std::vector<std::string> candidates;
    for (const std::string& branch : {source.branch, "v" + m_tool_version, std::string("main")}) {
        if (!branch.empty() && std::find(candidates.begin(), candidates.end(), branch) == candidates.end()) {
            candidates.push_back(branch);
        }
    }
    return candidates;
}

fs::path TemplateProvisioner::sourceCacheDirectory(const TemplateSource& source) const {
    std::string key = source.location;
    while (!key.empty() && key.back() == '/') {
        key.pop_back();
    }
    if (key.size() > 4 && key.compare(key.size() - 4, 4, ".git") == 0) {
        key.erase(key.size() - 4);
    }
    return m_cache_root / "templates" / sanitizePathComponent(key);
}

fs::path TemplateProvisioner::cachePathFor(const TemplateSource& source, const std::string& branch) const {
    return sourceCacheDirectory(source) / sanitizePathComponent(branch);
}

fs::path TemplateProvisioner::fetch(const TemplateSource& source) {
    if (!source.isRemote()) {
        return fetchLocked(source);
    }
    std::lock_guard<std::mutex> lock(sourceLock(sourceCacheDirectory(source)));
    return fetchLocked(source);
}

fs::path TemplateProvisioner::fetchLocked(const TemplateSource& source) {
    auto& logger = Logger::getInstance();

    if (!source.isRemote()) {
        fs::path local = source.location;
        std::error_code ec;
        if (!fs::is_directory(local, ec)) {
            throw TemplateError("Template directory " + local.string() + " does not exist");
        }
        return local;
    }

    std::string last_output;
    std::vector<std::string> tried;
    for (const auto& branch : candidateBranches(source)) {
        fs::path cached = cachePathFor(source, branch);
        tried.push_back(branch);

        ScopedTempDirectory staging(m_cache_root / "templates" / ".staging", "clone-");
        fs::path clone_dir = staging.path() / "repo";
        if (cloneBranch(source, branch, clone_dir, last_output)) {
            removeQuietly(clone_dir / ".git");
            replaceDirectory(clone_dir, cached);
            logger.debug("Template", "Fetched " + source.location, "branch " + branch);
            return cached;
        }

        std::error_code ec;
        if (fs::is_directory(cached, ec)) {
            logger.warning("Template", "Unable to update template " + source.location +
                           "; using the cached copy of branch " + branch);
            return cached;
        }
        logger.debug("Template", "Branch " + branch + " unavailable", source.location);
    }

    std::string branches;
    for (const auto& branch : tried) {
        branches += (branches.empty() ? "" : ", ") + branch;
    }
    throw TemplateError("Unable to fetch template " + source.location + " (tried " + branches + "):\n" +
                        last_output);
}

bool TemplateProvisioner::cloneBranch(const TemplateSource& source, const std::string& branch,
                                      const fs::path& destination, std::string& output) {
    ToolInvocation invocation;
    invocation.args = {"git", "clone", "--quiet", "--depth", "1", "--branch", branch,
                       source.location, destination.string()};
    invocation.env_overlay["GIT_TERMINAL_PROMPT"] = "0";
    invocation.tool_name = "git";

    ProcessResult result = m_supervisor.run(invocation);
    if (result.outcome == RunOutcome::CANCELLED) {
        throw Cancelled();
    }
    output = result.output;
    return result.succeeded();
}

ProjectTree TemplateProvisioner::provision(const ScaffoldRequest& request) {
    std::unique_lock<std::mutex> source_lock;
    if (request.source.isRemote()) {
        source_lock = std::unique_lock<std::mutex>(sourceLock(sourceCacheDirectory(request.source)));
    }
    fs::path template_dir = fetchLocked(request.source);
    TemplateManifest manifest = loadManifest(template_dir);

    std::map<std::string, std::string> context = manifest.defaults;
    for (const auto& [key, value] : request.context) {
        context[key] = value;
    }
    IgnorePatternSet verbatim(manifest.copy_without_render);

    fs::path destination = request.destination;
    fs::create_directories(destination.parent_path());
    ScopedTempDirectory staging(destination.parent_path(), "." + destination.filename().string() + ".render-");

    std::vector<fs::directory_entry> entries;
    for (auto it = fs::recursive_directory_iterator(template_dir); it != fs::recursive_directory_iterator(); ++it) {
        std::string name = it->path().filename().string();
        if (name == ".git") {
            if (it->is_directory()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it.depth() == 0 && name == MANIFEST_NAME) {
            continue;
        }
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& entry : entries) {
        fs::path relative = fs::relative(entry.path(), template_dir);
        std::string relative_text = relative.generic_string();

        fs::path rendered_relative;
        for (const auto& component : relative) {
            std::string rendered = render(component.string(), context, relative_text);
            if (rendered.empty()) {
                throw TemplateError("Template path " + relative_text + " renders to an empty name");
            }
            rendered_relative /= rendered;
        }
        fs::path target = staging.path() / rendered_relative;

        if (entry.is_symlink()) {
            fs::create_directories(target.parent_path());
            fs::copy_symlink(entry.path(), target);
        } else if (entry.is_directory()) {
            fs::create_directories(target);
        } else {
            fs::create_directories(target.parent_path());
            std::string content = readFile(entry.path());
            if (!isBinaryContent(content) && !verbatim.shouldIgnore(relative_text)) {
                content = render(content, context, relative_text);
            }
            writeFileAtomic(target, content);
            fs::permissions(target, entry.status().permissions(), fs::perm_options::replace);
        }
    }

    if (source_lock.owns_lock()) {
        source_lock.unlock();
    }

    replaceDirectory(staging.path(), destination);
    Logger::getInstance().debug("Template", "Rendered " + request.source.location, destination.string());

    ProjectTree tree;
    tree.root = destination;
    return tree;
}

std::string TemplateProvisioner::render(const std::string& text,
                                        const std::map<std::string, std::string>& context,
                                        const std::string& origin) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t variable = text.find("{{", pos);
        size_t tag = text.find("{%", pos);
        size_t next = std::min(variable, tag);
        if (next == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        result.append(text, pos, next - pos);

        if (next == tag) {
            size_t tag_end = text.find("%}", tag + 2);
            if (tag_end == std::string::npos) {
                throw TemplateError(origin + ": unterminated '{%' tag");
            }
            std::string tag_name = trim(text.substr(tag + 2, tag_end - tag - 2));
            if (tag_name != "raw") {
                throw TemplateError(origin + ": unsupported tag '{% " + tag_name + " %}'");
            }

            // Find the matching endraw tag, allowing any spacing inside it
            size_t search = tag_end + 2;
            size_t body_end = std::string::npos;
            size_t after_end = std::string::npos;
            while (true) {
                size_t candidate = text.find("{%", search);
                if (candidate == std::string::npos) {
                    break;
                }
                size_t candidate_end = text.find("%}", candidate + 2);
                if (candidate_end == std::string::npos) {
                    break;
                }
                if (trim(text.substr(candidate + 2, candidate_end - candidate - 2)) == "endraw") {
                    body_end = candidate;
                    after_end = candidate_end + 2;
                    break;
                }
                search = candidate + 2;
            }
            if (body_end == std::string::npos) {
                throw TemplateError(origin + ": '{% raw %}' without matching '{% endraw %}'");
            }
            result.append(text, tag_end + 2, body_end - tag_end - 2);
            pos = after_end;
            continue;
        }

        size_t close = text.find("}}", variable + 2);
        if (close == std::string::npos) {
            throw TemplateError(origin + ": unterminated placeholder '{{'");
        }
        std::string key = trim(text.substr(variable + 2, close - variable - 2));
        auto it = context.find(key);
        if (key.empty() || it == context.end()) {
            throw TemplateError(origin + ": unresolved placeholder '{{ " + key + " }}'");
        }
        result += it->second;
        pos = close + 2;
    }
    return result;
}

} // namespace Packwright
