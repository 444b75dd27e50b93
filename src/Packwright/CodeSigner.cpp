// =================================================================
// src/Packwright/CodeSigner.cpp
// =================================================================
// Implementation for depth-first bundle signing.

#include "Packwright/CodeSigner.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/Logger.hpp"
#include "Packwright/WorkerPool.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <map>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

bool isNestedBundle(const fs::path& path) {
    std::string extension = path.extension().string();
    return extension == ".framework" || extension == ".app" || extension == ".bundle" ||
           extension == ".xpc" || extension == ".appex";
}

bool isLibrary(const fs::path& path) {
    std::string extension = path.extension().string();
    return extension == ".dylib" || extension == ".so";
}

bool isExecutableFile(const fs::directory_entry& entry) {
    auto permissions = entry.status().permissions();
    return (permissions & fs::perms::owner_exec) != fs::perms::none;
}

size_t depthBelow(const fs::path& root, const fs::path& path) {
    size_t depth = 0;
    for (const auto& component : fs::relative(path, root)) {
        (void)component;
        ++depth;
    }
    return depth;
}

} // anonymous namespace

CodeSigner::CodeSigner(SignFunction sign, const CancellationToken& token, size_t max_parallel)
    : m_sign(std::move(sign)), m_token(token), m_max_parallel(max_parallel == 0 ? 1 : max_parallel) {
}

std::vector<std::vector<fs::path>> CodeSigner::depthFirstGroups(const fs::path& root,
                                                                const std::vector<fs::path>& components) {
    std::map<size_t, std::vector<fs::path>, std::greater<size_t>> by_depth;
    for (const auto& component : components) {
        by_depth[depthBelow(root, component)].push_back(component);
    }

    std::vector<std::vector<fs::path>> groups;
    for (auto& [depth, paths] : by_depth) {
        std::sort(paths.begin(), paths.end());
        groups.push_back(paths);
    }
    return groups;
}

std::vector<fs::path> CodeSigner::findSignableComponents(const fs::path& bundle) {
    std::vector<fs::path> components;
    fs::path main_executables = bundle / "Contents" / "MacOS";

    for (auto it = fs::recursive_directory_iterator(bundle); it != fs::recursive_directory_iterator(); ++it) {
        const fs::path& path = it->path();
        if (it->is_symlink()) {
            continue;
        }
        if (it->is_directory()) {
            if (isNestedBundle(path)) {
                components.push_back(path);
            }
            continue;
        }
        if (!it->is_regular_file()) {
            continue;
        }
        if (isLibrary(path)) {
            components.push_back(path);
        } else if (isExecutableFile(*it) && path.parent_path() != main_executables) {
            components.push_back(path);
        }
    }
    return components;
}

void CodeSigner::signBundle(const fs::path& bundle) {
    auto& logger = Logger::getInstance();
    auto groups = depthFirstGroups(bundle, findSignableComponents(bundle));

    WorkerPool pool(m_max_parallel, m_token);
    for (const auto& group : groups) {
        m_token.throwIfCancelled();
        std::vector<std::future<void>> pending;
        pending.reserve(group.size());
        for (const auto& component : group) {
            pending.push_back(pool.submit([this, component]() { m_sign(component); },
                                          []() { throw Cancelled(); }));
        }

        std::exception_ptr first_error;
        for (auto& future : pending) {
            try {
                future.get();
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
        logger.debug("Signing", "Signed " + std::to_string(group.size()) + " nested components",
                     bundle.filename().string());
    }

    m_token.throwIfCancelled();
    m_sign(bundle);
    logger.info("Signing", "Signed " + bundle.filename().string());
}

} // namespace Packwright
