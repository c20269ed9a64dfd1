#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>

class FeedClient;

enum class SnapshotResult
{
    Stored,
    Unchanged,      // identical to the newest earlier snapshot, removed again
    AlreadyPresent  // a file of that name was downloaded before
};

// Keeps dated copies of the static GTFS zip, one file per distinct upload.
class StaticDownloader
{
private:
    std::filesystem::path dir;

    std::optional<std::filesystem::path> newestSnapshot() const;

public:
    explicit StaticDownloader(std::filesystem::path outputDir);

    // The bare file name from a Content-Disposition header value, or nothing
    // when the header carries none.
    static std::optional<std::string> filenameFromDisposition(std::string const& disposition);

    // Lower-case hex SHA-1 of a file's contents.
    static std::string sha1File(std::filesystem::path const& path);

    SnapshotResult storeSnapshot(std::string const& filename, std::string const& body,
                                 std::optional<std::uint64_t> contentLength);

    // Empty when the response named no file.
    boost::asio::awaitable<std::optional<SnapshotResult>> download(FeedClient& client, std::string url);
};
