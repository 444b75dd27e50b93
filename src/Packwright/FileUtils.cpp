// =================================================================
// src/Packwright/FileUtils.cpp
// =================================================================
// Implementation for file system helpers.

#include "Packwright/FileUtils.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <random>
#include <iomanip>
#include <system_error>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace Packwright {

std::string readFile(const fs::path& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

void writeFileAtomic(const fs::path& file_path, const std::string& content) {
    if (file_path.has_parent_path()) {
        fs::create_directories(file_path.parent_path());
    }

    fs::path temp_path = file_path;
    temp_path += "." + uniqueSuffix() + ".tmp";
    {
        std::ofstream file_stream(temp_path, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            throw std::runtime_error("Failed to write file: " + temp_path.string());
        }
        file_stream << content;
        file_stream.flush();
        if (!file_stream.good()) {
            file_stream.close();
            removeQuietly(temp_path);
            throw std::runtime_error("Failed to write file: " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, file_path, ec);
    if (ec) {
        removeQuietly(temp_path);
        throw std::runtime_error("Failed to move " + temp_path.string() + " into place: " + ec.message());
    }
}

std::string sha256File(const fs::path& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 digest");
    }

    std::vector<char> buffer(64 * 1024);
    while (file_stream) {
        file_stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file_stream.gcount();
        if (count > 0 && EVP_DigestUpdate(context.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            throw std::runtime_error("Failed to hash " + file_path.string());
        }
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(context.get(), digest, &digest_length) != 1) {
        throw std::runtime_error("Failed to hash " + file_path.string());
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_length; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string uniqueSuffix() {
    static thread_local std::mt19937_64 generator(std::random_device{}());
    std::ostringstream suffix;
    suffix << std::hex << std::setfill('0') << std::setw(16) << generator();
    return suffix.str();
}

std::string sanitizePathComponent(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
            result += c;
        } else {
            result += '_';
        }
    }
    while (!result.empty() && result.front() == '.') {
        result.erase(result.begin());
    }
    return result.empty() ? "_" : result;
}

bool isBinaryContent(const std::string& content) {
    return content.find('\0') != std::string::npos;
}

bool publishDirectory(const fs::path& staged, const fs::path& destination) {
    fs::create_directories(destination.parent_path());

    std::error_code ec;
    if (fs::exists(destination, ec)) {
        return false;
    }

    fs::rename(staged, destination, ec);
    if (!ec) {
        return true;
    }
    if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
        return false;
    }
    throw std::runtime_error("Failed to publish " + destination.string() + ": " + ec.message());
}

void replaceDirectory(const fs::path& staged, const fs::path& destination) {
    fs::create_directories(destination.parent_path());

    std::error_code ec;
    fs::path retired;
    if (fs::exists(destination, ec)) {
        retired = destination;
        retired += ".retired-" + uniqueSuffix();
        fs::rename(destination, retired, ec);
        if (ec) {
            throw std::runtime_error("Failed to retire " + destination.string() + ": " + ec.message());
        }
    }

    fs::rename(staged, destination, ec);
    if (ec) {
        if (!retired.empty()) {
            std::error_code restore_ec;
            fs::rename(retired, destination, restore_ec);
        }
        throw std::runtime_error("Failed to publish " + destination.string() + ": " + ec.message());
    }

    if (!retired.empty()) {
        removeQuietly(retired);
    }
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
}

ScopedTempDirectory::ScopedTempDirectory(const fs::path& parent, const std::string& prefix) {
    fs::create_directories(parent);
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = parent / (prefix + uniqueSuffix());
        std::error_code ec;
        if (fs::create_directory(candidate, ec)) {
            m_path = candidate;
            return;
        }
    }
    throw std::runtime_error("Unable to create a staging directory in " + parent.string());
}

ScopedTempDirectory::~ScopedTempDirectory() {
    if (!m_released) {
        removeQuietly(m_path);
    }
}

fs::path ScopedTempDirectory::release() {
    m_released = true;
    return m_path;
}

} // namespace Packwright
