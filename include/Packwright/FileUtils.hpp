// =================================================================
// include/Packwright/FileUtils.hpp
// =================================================================
// File system helpers with atomic publish semantics.

#pragma once

#include <filesystem>
#include <string>

namespace Packwright {

/**
 * @brief Reads the entire content of a file into a string.
 * @throws std::runtime_error on failure
 */
std::string readFile(const std::filesystem::path& file_path);

/**
 * @brief Writes content through a sibling temporary file and renames it into place.
 * @throws std::runtime_error on failure; the destination is left untouched
 */
void writeFileAtomic(const std::filesystem::path& file_path, const std::string& content);

/**
 * @brief Lower-case hexadecimal SHA-256 digest of a file's bytes
 * @throws std::runtime_error when the file cannot be read
 */
std::string sha256File(const std::filesystem::path& file_path);

/**
 * @brief Random hexadecimal suffix for private staging names
 */
std::string uniqueSuffix();

/**
 * @brief Turn an arbitrary string (URL, branch) into a single safe path component
 */
std::string sanitizePathComponent(const std::string& text);

/**
 * @brief True when the bytes look binary (contain a NUL byte)
 */
bool isBinaryContent(const std::string& content);

/**
 * @brief Atomically rename a fully staged directory onto its final name
 * @return false when the destination already exists (another writer won)
 * @throws std::runtime_error for any other rename failure
 */
bool publishDirectory(const std::filesystem::path& staged, const std::filesystem::path& destination);

/**
 * @brief Replace an existing directory with a staged one
 *
 * The old directory is renamed aside first and removed once the staged copy
 * is in place, so readers never see a partially written destination.
 */
void replaceDirectory(const std::filesystem::path& staged, const std::filesystem::path& destination);

/**
 * @brief Remove a path recursively, ignoring errors
 */
void removeQuietly(const std::filesystem::path& path);

/**
 * @brief A uniquely named directory removed on destruction unless released
 */
class ScopedTempDirectory {
public:
    ScopedTempDirectory(const std::filesystem::path& parent, const std::string& prefix);
    ~ScopedTempDirectory();

    ScopedTempDirectory(const ScopedTempDirectory&) = delete;
    ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    /**
     * @brief Stop managing the directory; the caller now owns it
     */
    std::filesystem::path release();

private:
    std::filesystem::path m_path;
    bool m_released = false;
};

} // namespace Packwright
