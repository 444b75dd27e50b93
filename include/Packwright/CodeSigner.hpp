// =================================================================
// include/Packwright/CodeSigner.hpp
// =================================================================
// Depth-first signing of bundles and their nested components.

#pragma once

#include "Packwright/Cancellation.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief Signs one file or directory; throws on failure
 */
using SignFunction = std::function<void(const std::filesystem::path&)>;

/**
 * @brief Signs nested components before the bundle that encloses them
 *
 * Components are grouped by nesting depth. Groups are signed deepest
 * first; the components of one group are independent and are signed
 * concurrently. The bundle itself is signed last.
 */
class CodeSigner {
public:
    /**
     * @param sign Signs a single path
     * @param token Stops signing between components once cancelled
     * @param max_parallel Upper bound on concurrent signing operations
     */
    CodeSigner(SignFunction sign, const CancellationToken& token, size_t max_parallel = 4);

    /**
     * @brief Sign every nested component of a bundle, then the bundle
     * @throws the first signing failure, after the failing group finishes
     * @throws Cancelled if the token trips before every component is signed
     */
    void signBundle(const std::filesystem::path& bundle);

    /**
     * @brief Group paths by depth below a root, deepest group first
     */
    static std::vector<std::vector<std::filesystem::path>> depthFirstGroups(
        const std::filesystem::path& root, const std::vector<std::filesystem::path>& components);

    /**
     * @brief Nested code inside a bundle: libraries, nested bundles and
     * helper executables
     */
    static std::vector<std::filesystem::path> findSignableComponents(const std::filesystem::path& bundle);

private:
    SignFunction m_sign;
    const CancellationToken& m_token;
    size_t m_max_parallel;
};

} // namespace Packwright
