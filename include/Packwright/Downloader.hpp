// =================================================================
// include/Packwright/Downloader.hpp
// =================================================================
// Fetches tool archives over HTTP(S) or from file:// URLs.

#pragma once

#include "Packwright/Cancellation.hpp"
#include <filesystem>
#include <string>

namespace Packwright {

/**
 * @brief Abstract transport used by the tool registry
 *
 * Implementations must never leave a partial file at the destination:
 * either the complete payload is there, or nothing is.
 */
class Downloader {
public:
    virtual ~Downloader() = default;

    /**
     * @brief Download a URL to a local file
     * @param url http://, https:// or file:// URL
     * @param destination File to create
     * @param token Cancellation observed between chunks
     * @throws DownloadFailed on network or HTTP errors
     * @throws IntegrityFailed when fewer bytes arrive than announced
     * @throws Cancelled when interrupted
     */
    virtual void download(const std::string& url, const std::filesystem::path& destination,
                          const CancellationToken& token) = 0;
};

/**
 * @brief cpp-httplib based downloader with redirect support
 */
class HttpDownloader : public Downloader {
public:
    /**
     * @param connection_timeout_seconds Time allowed to connect
     * @param read_timeout_seconds Time allowed between received chunks
     */
    explicit HttpDownloader(int connection_timeout_seconds = 30, int read_timeout_seconds = 300);

    void download(const std::string& url, const std::filesystem::path& destination,
                  const CancellationToken& token) override;

private:
    int m_connection_timeout;
    int m_read_timeout;

    void copyLocalFile(const std::string& url, const std::filesystem::path& partial,
                       const CancellationToken& token);
    void fetchRemote(const std::string& url, const std::filesystem::path& partial,
                     const CancellationToken& token);
};

} // namespace Packwright
