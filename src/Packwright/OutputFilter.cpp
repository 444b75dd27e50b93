// =================================================================
// src/Packwright/OutputFilter.cpp
// =================================================================
// Implementation for display-only noise filtering.

#include "Packwright/OutputFilter.hpp"
#include "Packwright/Errors.hpp"

namespace Packwright {

namespace {

std::regex compilePattern(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        throw UserError("Invalid output filter pattern '" + pattern + "': " + e.what());
    }
}

} // anonymous namespace

void PatternNoiseFilter::suppress(const std::string& pattern, int following_lines) {
    m_line_rules.push_back({compilePattern(pattern), following_lines < 0 ? 0 : following_lines});
}

void PatternNoiseFilter::suppressBlock(const std::string& begin_pattern, const std::string& end_pattern) {
    m_block_rules.push_back({compilePattern(begin_pattern), compilePattern(end_pattern)});
}

bool PatternNoiseFilter::shouldDisplay(const std::string& line) {
    if (m_active_block >= 0) {
        if (std::regex_search(line, m_block_rules[static_cast<size_t>(m_active_block)].end)) {
            m_active_block = -1;
        }
        ++m_suppressed;
        return false;
    }

    if (m_skip_remaining > 0) {
        --m_skip_remaining;
        ++m_suppressed;
        return false;
    }

    for (size_t i = 0; i < m_block_rules.size(); ++i) {
        if (std::regex_search(line, m_block_rules[i].begin)) {
            m_active_block = static_cast<int>(i);
            ++m_suppressed;
            return false;
        }
    }

    for (const auto& rule : m_line_rules) {
        if (std::regex_search(line, rule.pattern)) {
            m_skip_remaining = rule.following_lines;
            ++m_suppressed;
            return false;
        }
    }

    return true;
}

} // namespace Packwright
