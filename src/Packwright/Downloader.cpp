// =================================================================
// src/Packwright/Downloader.cpp
// =================================================================
// Implementation for HTTP(S) and file:// downloads.

#include "Packwright/Downloader.hpp"
#include "Packwright/Errors.hpp"
#include "Packwright/FileUtils.hpp"
#include "Packwright/Logger.hpp"
#include "httplib.h"
#include <fstream>

namespace fs = std::filesystem;

namespace Packwright {

namespace {

const std::string FILE_SCHEME = "file://";

struct ParsedUrl {
    std::string origin;     // scheme://host[:port]
    std::string path;       // /path?query
};

ParsedUrl splitUrl(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw DownloadFailed(url, "not an absolute URL");
    }
    auto path_start = url.find('/', scheme_end + 3);
    ParsedUrl parsed;
    if (path_start == std::string::npos) {
        parsed.origin = url;
        parsed.path = "/";
    } else {
        parsed.origin = url.substr(0, path_start);
        parsed.path = url.substr(path_start);
    }
    return parsed;
}

} // anonymous namespace

HttpDownloader::HttpDownloader(int connection_timeout_seconds, int read_timeout_seconds)
    : m_connection_timeout(connection_timeout_seconds), m_read_timeout(read_timeout_seconds) {
}

void HttpDownloader::download(const std::string& url, const fs::path& destination,
                              const CancellationToken& token) {
    token.throwIfCancelled();

    fs::path partial = destination;
    partial += ".part-" + uniqueSuffix();

    Logger::getInstance().info("Download", "Downloading " + url);
    try {
        if (url.compare(0, FILE_SCHEME.size(), FILE_SCHEME) == 0) {
            copyLocalFile(url, partial, token);
        } else {
            fetchRemote(url, partial, token);
        }
    } catch (...) {
        removeQuietly(partial);
        throw;
    }

    std::error_code ec;
    fs::rename(partial, destination, ec);
    if (ec) {
        removeQuietly(partial);
        throw DownloadFailed(url, "could not move download into place: " + ec.message());
    }
}

void HttpDownloader::copyLocalFile(const std::string& url, const fs::path& partial,
                                   const CancellationToken& token) {
    fs::path source = url.substr(FILE_SCHEME.size());
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        throw DownloadFailed(url, "file not found");
    }
    std::ofstream output(partial, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw DownloadFailed(url, "cannot write " + partial.string());
    }

    char buffer[64 * 1024];
    while (input) {
        token.throwIfCancelled();
        input.read(buffer, sizeof(buffer));
        output.write(buffer, input.gcount());
    }
    if (input.bad() || !output.good()) {
        throw DownloadFailed(url, "copy failed");
    }
}

void HttpDownloader::fetchRemote(const std::string& url, const fs::path& partial,
                                 const CancellationToken& token) {
    ParsedUrl parsed = splitUrl(url);

    httplib::Client client(parsed.origin);
    client.set_follow_location(true);
    client.set_connection_timeout(m_connection_timeout);
    client.set_read_timeout(m_read_timeout);

    std::ofstream output(partial, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw DownloadFailed(url, "cannot write " + partial.string());
    }

    int status = 0;
    long long expected_size = -1;
    long long received = 0;
    bool interrupted = false;

    auto res = client.Get(
        parsed.path,
        [&](const httplib::Response& response) {
            status = response.status;
            if (response.has_header("Content-Length")) {
                try {
                    expected_size = std::stoll(response.get_header_value("Content-Length"));
                } catch (const std::exception&) {
                    expected_size = -1;
                }
            }
            return response.status == 200;
        },
        [&](const char* data, size_t length) {
            if (token.isCancelled()) {
                interrupted = true;
                return false;
            }
            output.write(data, static_cast<std::streamsize>(length));
            received += static_cast<long long>(length);
            return output.good();
        });

    output.close();

    if (interrupted) {
        throw Cancelled();
    }
    if (status != 0 && status != 200) {
        throw DownloadFailed(url, "server returned HTTP " + std::to_string(status));
    }
    if (!res) {
        if (received > 0 && expected_size > 0) {
            throw IntegrityFailed(url, "connection dropped after " + std::to_string(received) +
                                  " of " + std::to_string(expected_size) + " bytes");
        }
        throw DownloadFailed(url, httplib::to_string(res.error()));
    }
    if (expected_size >= 0 && received != expected_size) {
        throw IntegrityFailed(url, "received " + std::to_string(received) + " of " +
                              std::to_string(expected_size) + " bytes");
    }

    Logger::getInstance().debug("Download", "Downloaded " + std::to_string(received) + " bytes", url);
}

} // namespace Packwright
