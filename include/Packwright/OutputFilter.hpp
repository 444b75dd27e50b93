// =================================================================
// include/Packwright/OutputFilter.hpp
// =================================================================
// Display-only filters for noisy tool output.

#pragma once

#include <regex>
#include <string>
#include <vector>

namespace Packwright {

/**
 * @brief Decides whether a line of tool output is shown to the user
 *
 * Filters never affect captured output or success/failure classification.
 * Implementations may keep state between lines.
 */
class OutputFilter {
public:
    virtual ~OutputFilter() = default;

    /**
     * @brief Called for every output line in order
     * @return true if the line should be displayed
     */
    virtual bool shouldDisplay(const std::string& line) = 0;
};

/**
 * @brief Regex based noise suppression
 *
 * A line matching a suppression pattern is hidden along with a fixed number
 * of following lines. Block rules hide everything from a begin match up to
 * and including the matching end line.
 */
class PatternNoiseFilter : public OutputFilter {
public:
    PatternNoiseFilter() = default;

    /**
     * @brief Hide lines matching a pattern
     * @param pattern ECMAScript regex, searched anywhere in the line
     * @param following_lines Number of subsequent lines to hide as well
     */
    void suppress(const std::string& pattern, int following_lines = 0);

    /**
     * @brief Hide every line between a begin and an end match
     */
    void suppressBlock(const std::string& begin_pattern, const std::string& end_pattern);

    bool shouldDisplay(const std::string& line) override;

    /**
     * @brief Number of lines hidden so far
     */
    size_t suppressedCount() const { return m_suppressed; }

private:
    struct LineRule {
        std::regex pattern;
        int following_lines;
    };

    struct BlockRule {
        std::regex begin;
        std::regex end;
    };

    std::vector<LineRule> m_line_rules;
    std::vector<BlockRule> m_block_rules;
    int m_skip_remaining = 0;
    int m_active_block = -1;
    size_t m_suppressed = 0;
};

} // namespace Packwright
