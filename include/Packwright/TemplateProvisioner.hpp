// =================================================================
// include/Packwright/TemplateProvisioner.hpp
// =================================================================
// Fetches versioned scaffold templates and renders them.

#pragma once

#include "Packwright/Environment.hpp"
#include "Packwright/ProcessSupervisor.hpp"
#include "Packwright/ProjectTree.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief Where a template comes from
 */
struct TemplateSource {
    std::string location;   ///< Local directory or git repository URL
    std::string branch;     ///< Requested branch or tag; empty = version default

    /**
     * @brief True for git URLs (https://, http://, ssh://, git://, file://, git@host:)
     */
    bool isRemote() const;
};

/**
 * @brief Everything needed to produce a ProjectTree
 */
struct ScaffoldRequest {
    TemplateSource source;
    std::map<std::string, std::string> context;
    std::filesystem::path destination;
};

/**
 * @brief Provisions project trees from local or remote templates
 *
 * Remote templates are shallow-cloned into Packwright's own template cache,
 * keyed by source and branch. Fetching and reading a cached source is
 * serialized across provisioners sharing the process. A template may carry a `template.yml` manifest
 * with `defaults:` for context keys and `copy_without_render:` globs.
 *
 * Placeholders use `{{ key }}` in file names and contents; text between
 * `{% raw %}` and `{% endraw %}` is emitted literally.
 */
class TemplateProvisioner {
public:
    static const char* MANIFEST_NAME;

    TemplateProvisioner(ProcessSupervisor& supervisor,
                        const std::filesystem::path& cache_root = cacheRoot(),
                        const std::string& tool_version = toolVersion());

    /**
     * @brief Fetch the template and render it onto the destination
     *
     * Rendering happens in a sibling temporary directory that replaces the
     * destination only once complete.
     * @throws TemplateError for unresolved placeholders or unusable templates
     */
    ProjectTree provision(const ScaffoldRequest& request);

    /**
     * @brief Make a template available locally
     * @return Directory holding the template files
     * @throws TemplateError if no candidate branch can be fetched and nothing is cached
     */
    std::filesystem::path fetch(const TemplateSource& source);

    /**
     * @brief Branches tried for a remote source, in order
     */
    std::vector<std::string> candidateBranches(const TemplateSource& source) const;

    /**
     * @brief Cache directory for one (source, branch) pair
     */
    std::filesystem::path cachePathFor(const TemplateSource& source, const std::string& branch) const;

    /**
     * @brief Substitute placeholders in a piece of text
     * @param origin File name used in error messages
     * @throws TemplateError naming the origin and the unresolved placeholder
     */
    static std::string render(const std::string& text,
                              const std::map<std::string, std::string>& context,
                              const std::string& origin);

private:
    ProcessSupervisor& m_supervisor;
    std::filesystem::path m_cache_root;
    std::string m_tool_version;

    std::filesystem::path sourceCacheDirectory(const TemplateSource& source) const;
    std::filesystem::path fetchLocked(const TemplateSource& source);
    bool cloneBranch(const TemplateSource& source, const std::string& branch,
                     const std::filesystem::path& destination, std::string& output);
};

} // namespace Packwright
