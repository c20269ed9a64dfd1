#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <openssl/evp.h>
#include "FeedClient.hpp"
#include "StaticDownloader.hpp"

namespace fs = std::filesystem;

namespace
{
    std::string trim(std::string const& s)
    {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t");
        return s.substr(begin, end - begin + 1);
    }

    bool iequals(std::string const& a, std::string const& b)
    {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i)
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        return true;
    }
}

StaticDownloader::StaticDownloader(fs::path outputDir) : dir(std::move(outputDir))
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw std::runtime_error("Cannot create " + dir.string() + ": " + ec.message());
}

std::optional<std::string> StaticDownloader::filenameFromDisposition(std::string const& disposition)
{
    // Parameters follow the disposition type: attachment; filename="x.zip"
    std::size_t pos = disposition.find(';');
    while (pos != std::string::npos)
    {
        std::size_t next = disposition.find(';', pos + 1);
        std::string param = disposition.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);
        pos = next;

        auto eq = param.find('=');
        if (eq == std::string::npos || !iequals(trim(param.substr(0, eq)), "filename"))
            continue;

        std::string value = trim(param.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);

        std::string name = fs::path(value).filename().string();
        if (name.empty() || name == "." || name == "..")
            return std::nullopt;
        return name;
    }
    return std::nullopt;
}

std::string StaticDownloader::sha1File(fs::path const& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Cannot open " + path.string());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("SHA-1 initialisation failed");

    std::array<char, 64 * 1024> chunk;
    while (in)
    {
        in.read(chunk.data(), chunk.size());
        if (in.gcount() > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(in.gcount())) != 1)
            throw std::runtime_error("SHA-1 update failed for " + path.string());
    }
    if (in.bad())
        throw std::runtime_error("Read error on " + path.string());

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1)
        throw std::runtime_error("SHA-1 finalisation failed for " + path.string());

    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i)
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return hex.str();
}

std::optional<fs::path> StaticDownloader::newestSnapshot() const
{
    std::optional<fs::path> newest;
    fs::file_time_type newestTime{};

    for (auto const& entry : fs::directory_iterator(dir))
    {
        if (!entry.is_regular_file())
            continue;
        auto mtime = entry.last_write_time();
        if (!newest || mtime > newestTime)
        {
            newest = entry.path();
            newestTime = mtime;
        }
    }
    return newest;
}

SnapshotResult StaticDownloader::storeSnapshot(std::string const& filename, std::string const& body,
                                               std::optional<std::uint64_t> contentLength)
{
    fs::path target = dir / filename;
    if (fs::exists(target))
        return SnapshotResult::AlreadyPresent;

    std::optional<fs::path> previous = newestSnapshot();

    {
        std::ofstream out(target, std::ios::binary);
        if (!out)
            throw std::runtime_error("Cannot create " + target.string());
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.close();
        if (!out)
        {
            std::error_code ec;
            fs::remove(target, ec);
            throw std::runtime_error("Write failed for " + target.string());
        }
    }

    std::uint64_t written = fs::file_size(target);
    if (contentLength && written != *contentLength)
    {
        std::error_code ec;
        fs::remove(target, ec);
        throw std::runtime_error("Downloaded " + std::to_string(written) + " bytes but expected "
                                 + std::to_string(*contentLength));
    }

    if (previous && sha1File(*previous) == sha1File(target))
    {
        fs::remove(target);
        std::cout << "[Static] " << filename << " matches " << previous->filename().string() << ", not kept" << std::endl;
        return SnapshotResult::Unchanged;
    }

    std::cout << "[Static] Downloaded static GTFS data: " << target.string() << std::endl;
    return SnapshotResult::Stored;
}

boost::asio::awaitable<std::optional<SnapshotResult>> StaticDownloader::download(FeedClient& client, std::string url)
{
    FeedResponse response = co_await client.fetch(url);

    std::optional<std::string> filename = filenameFromDisposition(response.contentDisposition);
    if (!filename)
    {
        std::cerr << "[Static] No file name in Content-Disposition from " << url << ", nothing stored" << std::endl;
        co_return std::nullopt;
    }

    co_return storeSnapshot(*filename, response.body, response.contentLength);
}
