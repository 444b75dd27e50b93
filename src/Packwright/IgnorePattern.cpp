// =================================================================
// src/Packwright/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-style glob matching.

#include "Packwright/IgnorePattern.hpp"
#include "Packwright/Logger.hpp"

namespace Packwright {

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern) {
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }
    if (m_directory_only && !is_directory) {
        return false;
    }
    return std::regex_match(path, m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working = pattern;
    working.erase(0, working.find_first_not_of(" \t"));
    working.erase(working.find_last_not_of(" \t\r") + 1);

    if (working.empty() || working[0] == '#') {
        m_is_empty = true;
        return;
    }

    if (working[0] == '!') {
        m_is_negation = true;
        working.erase(0, 1);
    }
    if (!working.empty() && working.back() == '/') {
        m_directory_only = true;
        working.pop_back();
    }
    if (!working.empty() && working[0] == '/') {
        m_is_anchored = true;
        working.erase(0, 1);
    }
    if (working.empty()) {
        m_is_empty = true;
        return;
    }

    // A slash in the middle anchors the pattern, as in gitignore
    if (working.find('/') != std::string::npos) {
        m_is_anchored = true;
    }

    try {
        m_regex = std::regex(globToRegex(working), std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("IgnorePattern", "Ignoring invalid pattern '" + pattern + "'", e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) const {
    std::string body;
    bool in_brackets = false;

    for (size_t i = 0; i < glob_pattern.length(); ++i) {
        char c = glob_pattern[i];
        switch (c) {
            case '*':
                if (i + 1 < glob_pattern.length() && glob_pattern[i + 1] == '*') {
                    if (i + 2 < glob_pattern.length() && glob_pattern[i + 2] == '/') {
                        body += "(?:.*/)?";
                        i += 2;
                    } else {
                        body += ".*";
                        i += 1;
                    }
                } else {
                    body += "[^/]*";
                }
                break;

            case '?':
                body += "[^/]";
                break;

            case '[':
                in_brackets = true;
                body += '[';
                if (i + 1 < glob_pattern.length() && glob_pattern[i + 1] == '!') {
                    body += '^';
                    ++i;
                }
                break;

            case ']':
                in_brackets = false;
                body += ']';
                break;

            case '\\':
                body += '\\';
                body += (i + 1 < glob_pattern.length()) ? glob_pattern[++i] : '\\';
                break;

            default:
                if (!in_brackets && (c == '.' || c == '^' || c == '$' || c == '+' ||
                    c == '{' || c == '}' || c == '|' || c == '(' || c == ')')) {
                    body += '\\';
                }
                body += c;
                break;
        }
    }

    // Matching a directory also matches everything below it
    if (m_is_anchored) {
        return body + "(?:/.*)?";
    }
    return "(?:.*/)?" + body + "(?:/.*)?";
}

// IgnorePatternSet

IgnorePatternSet::IgnorePatternSet(const std::vector<std::string>& patterns) {
    addPatterns(patterns);
}

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

void IgnorePatternSet::addPatterns(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addPattern(pattern);
    }
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    bool should_ignore = false;
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            should_ignore = !pattern.isNegation();
        }
    }
    return should_ignore;
}

} // namespace Packwright
