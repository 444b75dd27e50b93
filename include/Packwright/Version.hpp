// =================================================================
// include/Packwright/Version.hpp
// =================================================================
// Well-ordered version strings and version ranges.

#pragma once

#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief A canonical, totally ordered version
 *
 * Accepts `[N!]N(.N)*[{a|b|rc}N][.postN][.devN]`. Release segments are
 * compared numerically with implicit zero padding, so "1.0" == "1.0.0".
 */
class Version {
public:
    Version() = default;

    /**
     * @brief Parse a version string
     * @throws std::invalid_argument if the text is not a canonical version
     */
    static Version parse(const std::string& text);

    /**
     * @brief Check whether a string is a canonical version
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Three-way comparison
     * @return Negative, zero or positive like strcmp
     */
    int compare(const Version& other) const;

    bool operator==(const Version& other) const { return compare(other) == 0; }
    bool operator!=(const Version& other) const { return compare(other) != 0; }
    bool operator<(const Version& other) const { return compare(other) < 0; }
    bool operator<=(const Version& other) const { return compare(other) <= 0; }
    bool operator>(const Version& other) const { return compare(other) > 0; }
    bool operator>=(const Version& other) const { return compare(other) >= 0; }

    const std::string& toString() const { return m_text; }
    const std::vector<long>& release() const { return m_release; }
    bool isPrerelease() const { return m_pre_tag >= 0 || m_dev >= 0; }

private:
    std::string m_text;
    long m_epoch = 0;
    std::vector<long> m_release;
    int m_pre_tag = -1;     // 0 = a, 1 = b, 2 = rc
    long m_pre_value = 0;
    long m_post = -1;
    long m_dev = -1;
};

/**
 * @brief A conjunction of version clauses such as ">=1.2,<2"
 *
 * An empty range accepts every version. A bare version is shorthand for "==".
 */
class VersionRange {
public:
    VersionRange() = default;

    /**
     * @brief Parse a comma-separated list of clauses
     * @throws std::invalid_argument on malformed clauses
     */
    static VersionRange parse(const std::string& text);

    bool contains(const Version& version) const;
    bool isAny() const { return m_clauses.empty(); }
    const std::string& toString() const { return m_text; }

private:
    enum class Op { EQ, NE, GE, LE, GT, LT };

    struct Clause {
        Op op;
        Version version;
    };

    std::string m_text;
    std::vector<Clause> m_clauses;
};

} // namespace Packwright
