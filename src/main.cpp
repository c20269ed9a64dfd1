#include <string>
#include <iostream>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <date/tz.h>
#include "ArchiveDriver.hpp"
#include "ArchiveErrors.hpp"
#include "ConfigurationManager.hpp"
#include "FeedClient.hpp"
#include "FeedParser.hpp"
#include "SQLiteStore.hpp"
#include "StaticDownloader.hpp"
#include "Types.hpp"

struct CommandLine
{
    std::string configPath;
    std::string command = "static";
    std::string dbPath;
    std::string archiveDir;
    bool fullRescan = false;
    std::optional<std::chrono::seconds> interval;
};

boost::asio::awaitable<void> ingestVehicleUpdates(FeedClient& client, SQLiteStore& db, std::string url, date::time_zone const* zone)
{
    FeedResponse response = co_await client.fetch(url);
    std::vector<VehiclePosition> positions = FeedParser::extractVehiclePositions(response.body, zone);

    std::size_t inserted = db.insertMany(positions);
    std::cout << "[T=" << std::time(nullptr) << "] [Feed] " << positions.size() << " vehicle positions, "
              << inserted << " new." << std::endl;
}

boost::asio::awaitable<void> runPollingLoop(FeedClient& client, SQLiteStore& db, std::string url, date::time_zone const* zone, std::chrono::seconds interval)
{
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    for (;;)
    {
        try
        {
            co_await ingestVehicleUpdates(client, db, url, zone);
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Feed] Error fetching " << url << ": " << e.what() << std::endl;
        }

        timer.expires_after(interval);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

boost::asio::awaitable<void> fetchStatic(FeedClient& client, std::filesystem::path dir, std::string url)
{
    StaticDownloader downloader(dir);
    std::optional<SnapshotResult> result = co_await downloader.download(client, url);
    if (result && *result == SnapshotResult::AlreadyPresent)
        std::cout << "[Static] Latest static data already downloaded." << std::endl;
}

// Runs one coroutine to completion and rethrows whatever it threw.
void runToCompletion(boost::asio::io_context& io, boost::asio::awaitable<void> task)
{
    std::exception_ptr failure;
    boost::asio::co_spawn(io, std::move(task), [&failure](std::exception_ptr e) { failure = e; });
    io.run();
    if (failure)
        std::rethrow_exception(failure);
}

void requireURL(std::string const& url, char const* key)
{
    if (url.empty())
        throw std::runtime_error(std::string(key) + " not set in configuration.");
}

CommandLine parseCommandLineArgs(int argc, char* argv[])
{
    CommandLine cli;
    bool commandSeen = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            cli.configPath = argv[++i];
        }
        else if (arg == "--db" && i + 1 < argc)
        {
            cli.dbPath = argv[++i];
        }
        else if (arg == "--archive" && i + 1 < argc)
        {
            cli.archiveDir = argv[++i];
        }
        else if (arg == "--full-rescan")
        {
            cli.fullRescan = true;
        }
        else if (arg == "--interval" && i + 1 < argc)
        {
            int seconds = 0;
            try
            {
                seconds = std::stoi(argv[++i]);
            }
            catch (std::exception const&)
            {
                throw std::invalid_argument("--interval expects a number of seconds");
            }
            if (seconds <= 0)
                throw std::invalid_argument("--interval must be positive");
            cli.interval = std::chrono::seconds(seconds);
        }
        else if (!commandSeen && !arg.empty() && arg[0] != '-')
        {
            if (arg != "static" && arg != "vehicleupdates" && arg != "archive"
                && arg != "alerts" && arg != "tripupdates")
            {
                throw std::invalid_argument("Invalid command: " + arg);
            }
            cli.command = arg;
            commandSeen = true;
        }
        else
        {
            throw std::invalid_argument("Unknown or malformed argument: " + arg);
        }
    }

    return cli;
}

ArchiveSummary runArchive(ConfigurationManager const& config, CommandLine const& cli)
{
    std::filesystem::path dbPath = cli.dbPath.empty() ? config.storePath() : std::filesystem::path(cli.dbPath);
    std::filesystem::path root = cli.archiveDir.empty() ? config.archiveDir() : std::filesystem::path(cli.archiveDir);

    if (!std::filesystem::exists(dbPath))
        throw std::runtime_error("Store not found: " + dbPath.string());

    MergeOptions options;
    options.rowGroupSize = config.getRowGroupSize();
    options.windowStart = (cli.fullRescan || config.getFullRescan()) ? WindowStart::PeriodStart : WindowStart::MinWatermark;

    SQLiteStore db(dbPath.string(), OpenMode::ReadOnly);
    ArchiveDriver driver(db, root, options);
    return driver.run();
}

int main(int argc, char* argv[])
{
    try
    {
        CommandLine cli = parseCommandLineArgs(argc, argv);
        ConfigurationManager config(ConfigurationManager::resolvePath(cli.configPath));

        if (cli.command == "archive")
        {
            runArchive(config, cli);
            return 0;
        }

        boost::asio::io_context io;
        FeedClient client(config.getAPIKeyHeader(), config.getAPIKey());

        if (cli.command == "static")
        {
            requireURL(config.getStaticURL(), "StaticURL");
            runToCompletion(io, fetchStatic(client, config.staticDir(), config.getStaticURL()));
            return 0;
        }

        if (cli.command == "alerts")
            throw std::runtime_error("archiving alerts not implemented");
        if (cli.command == "tripupdates")
            throw std::runtime_error("archiving trip updates not implemented");

        requireURL(config.getVehicleUpdatesURL(), "VehicleUpdatesURL");
        date::time_zone const* zone = date::locate_zone(config.getTimeZone());

        std::filesystem::create_directories(config.getDataDir());
        SQLiteStore db(config.storePath().string());
        std::cout << "[System] Store " << config.storePath().string() << " ready." << std::endl;

        if (cli.interval)
        {
            std::cout << "[System] Polling " << config.getVehicleUpdatesURL() << " every "
                      << cli.interval->count() << "s" << std::endl;
            runToCompletion(io, runPollingLoop(client, db, config.getVehicleUpdatesURL(), zone, *cli.interval));
        }
        else
        {
            runToCompletion(io, ingestVehicleUpdates(client, db, config.getVehicleUpdatesURL(), zone));
        }
    }
    catch (InvariantViolation const& e)
    {
        std::cerr << "Archive invariant violated: " << e.what() << "\n";
        return 2;
    }
    catch (ArchiveError const& e)
    {
        std::cerr << "Archive failed (" << toString(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
