// =================================================================
// src/Packwright/Version.cpp
// =================================================================
// Implementation of version parsing, ordering and ranges.

#include "Packwright/Version.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>
#include <limits>
#include <algorithm>

namespace Packwright {

namespace {

const std::regex& versionRegex() {
    static const std::regex pattern(
        R"(^(?:([1-9][0-9]*)!)?)"
        R"((0|[1-9][0-9]*)((?:\.(?:0|[1-9][0-9]*))*))"
        R"((?:(a|b|rc)(0|[1-9][0-9]*))?)"
        R"((?:\.post(0|[1-9][0-9]*))?)"
        R"((?:\.dev(0|[1-9][0-9]*))?$)");
    return pattern;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

int compareLong(long a, long b) {
    return a < b ? -1 : (a > b ? 1 : 0);
}

} // namespace

Version Version::parse(const std::string& text) {
    std::smatch match;
    if (!std::regex_match(text, match, versionRegex())) {
        throw std::invalid_argument("Version number (" + text + ") is not valid");
    }

    Version version;
    version.m_text = text;
    if (match[1].matched) {
        version.m_epoch = std::stol(match[1].str());
    }

    version.m_release.push_back(std::stol(match[2].str()));
    std::istringstream rest(match[3].str());
    std::string segment;
    while (std::getline(rest, segment, '.')) {
        if (!segment.empty()) {
            version.m_release.push_back(std::stol(segment));
        }
    }

    if (match[4].matched) {
        const std::string tag = match[4].str();
        version.m_pre_tag = tag == "a" ? 0 : (tag == "b" ? 1 : 2);
        version.m_pre_value = std::stol(match[5].str());
    }
    if (match[6].matched) {
        version.m_post = std::stol(match[6].str());
    }
    if (match[7].matched) {
        version.m_dev = std::stol(match[7].str());
    }
    return version;
}

bool Version::isValid(const std::string& text) {
    return std::regex_match(text, versionRegex());
}

int Version::compare(const Version& other) const {
    if (int c = compareLong(m_epoch, other.m_epoch)) {
        return c;
    }

    size_t segments = std::max(m_release.size(), other.m_release.size());
    for (size_t i = 0; i < segments; ++i) {
        long mine = i < m_release.size() ? m_release[i] : 0;
        long theirs = i < other.m_release.size() ? other.m_release[i] : 0;
        if (int c = compareLong(mine, theirs)) {
            return c;
        }
    }

    // A bare dev release (1.0.dev1) sorts before every pre-release of 1.0;
    // a final release sorts after all of its pre-releases.
    const long lowest = std::numeric_limits<long>::min();
    const long highest = std::numeric_limits<long>::max();
    auto preKey = [&](const Version& v) -> std::pair<long, long> {
        if (v.m_pre_tag < 0 && v.m_post < 0 && v.m_dev >= 0) {
            return {lowest, 0};
        }
        if (v.m_pre_tag < 0) {
            return {highest, 0};
        }
        return {v.m_pre_tag, v.m_pre_value};
    };

    auto mine_pre = preKey(*this);
    auto theirs_pre = preKey(other);
    if (int c = compareLong(mine_pre.first, theirs_pre.first)) {
        return c;
    }
    if (int c = compareLong(mine_pre.second, theirs_pre.second)) {
        return c;
    }

    if (int c = compareLong(m_post < 0 ? lowest : m_post, other.m_post < 0 ? lowest : other.m_post)) {
        return c;
    }
    return compareLong(m_dev < 0 ? highest : m_dev, other.m_dev < 0 ? highest : other.m_dev);
}

VersionRange VersionRange::parse(const std::string& text) {
    VersionRange range;
    range.m_text = trim(text);

    std::istringstream stream(range.m_text);
    std::string raw_clause;
    while (std::getline(stream, raw_clause, ',')) {
        std::string clause = trim(raw_clause);
        if (clause.empty()) {
            continue;
        }

        Op op = Op::EQ;
        size_t skip = 0;
        if (clause.rfind("==", 0) == 0) { op = Op::EQ; skip = 2; }
        else if (clause.rfind("!=", 0) == 0) { op = Op::NE; skip = 2; }
        else if (clause.rfind(">=", 0) == 0) { op = Op::GE; skip = 2; }
        else if (clause.rfind("<=", 0) == 0) { op = Op::LE; skip = 2; }
        else if (clause.rfind(">", 0) == 0) { op = Op::GT; skip = 1; }
        else if (clause.rfind("<", 0) == 0) { op = Op::LT; skip = 1; }

        std::string version_text = trim(clause.substr(skip));
        if (!Version::isValid(version_text)) {
            throw std::invalid_argument("Invalid version clause '" + clause + "'");
        }
        range.m_clauses.push_back({op, Version::parse(version_text)});
    }
    return range;
}

bool VersionRange::contains(const Version& version) const {
    for (const auto& clause : m_clauses) {
        int c = version.compare(clause.version);
        bool ok = false;
        switch (clause.op) {
            case Op::EQ: ok = c == 0; break;
            case Op::NE: ok = c != 0; break;
            case Op::GE: ok = c >= 0; break;
            case Op::LE: ok = c <= 0; break;
            case Op::GT: ok = c > 0; break;
            case Op::LT: ok = c < 0; break;
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace Packwright
