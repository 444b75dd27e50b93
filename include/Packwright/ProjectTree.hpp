// =================================================================
// include/Packwright/ProjectTree.hpp
// =================================================================
// The generated on-disk scaffold for one app/platform/format.

#pragma once

#include <filesystem>
#include <string>

namespace Packwright {

/**
 * @brief Location of a generated scaffold
 *
 * The tree persists between invocations; Packwright never deletes it on its
 * own. Bookkeeping (stage markers, notarization records) lives under the
 * hidden `.packwright` directory at its root.
 */
struct ProjectTree {
    std::filesystem::path root;
    std::string app_name;
    std::string platform;
    std::string output_format;

    std::filesystem::path metadataDirectory() const { return root / ".packwright"; }
    std::filesystem::path stagesDirectory() const { return metadataDirectory() / "stages"; }

    bool exists() const {
        std::error_code ec;
        return std::filesystem::is_directory(root, ec);
    }
};

} // namespace Packwright
