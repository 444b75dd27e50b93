// =================================================================
// include/Packwright/IgnorePattern.hpp
// =================================================================
// Gitignore-style glob matching for template and source copying.

#pragma once

#include <regex>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief One gitignore-style glob
 *
 * Supports `*`, `**`, `?`, character classes, `!negation`, trailing `/`
 * for directory-only patterns and a leading `/` to anchor the pattern at
 * the root of the tree being copied.
 */
class IgnorePattern {
public:
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check a path relative to the tree root (using '/' separators)
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isEmpty() const { return m_is_empty; }
    const std::string& getPattern() const { return m_original_pattern; }

private:
    std::string m_original_pattern;
    bool m_is_negation = false;
    bool m_directory_only = false;
    bool m_is_anchored = false;
    bool m_is_empty = false;
    std::regex m_regex;

    void processPattern(const std::string& pattern);
    std::string globToRegex(const std::string& glob_pattern) const;
};

/**
 * @brief Ordered pattern list; later patterns override earlier ones
 */
class IgnorePatternSet {
public:
    IgnorePatternSet() = default;
    explicit IgnorePatternSet(const std::vector<std::string>& patterns);

    void addPattern(const std::string& pattern);
    void addPatterns(const std::vector<std::string>& patterns);

    /**
     * @brief True if the last matching pattern is not a negation
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace Packwright
