#include <cstdlib>
#include <stdexcept>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include "ConfigurationManager.hpp"
#include "RowGroupBuffer.hpp"

ConfigurationManager::ConfigurationManager(std::string const& path)
{
    boost::property_tree::ptree tree;
    try
    {
        boost::property_tree::read_json(path, tree);

        dataDir           = tree.get<std::string>("DataDir");
        staticURL         = tree.get<std::string>("StaticURL", "");
        alertsURL         = tree.get<std::string>("AlertsURL", "");
        tripUpdatesURL    = tree.get<std::string>("TripUpdatesURL", "");
        vehicleUpdatesURL = tree.get<std::string>("VehicleUpdatesURL", "");
        timeZone          = tree.get<std::string>("TimeZone", "UTC");
        apiKeyHeader      = tree.get<std::string>("ApiKeyHeader", "X-API-Key");
        rowGroupSize      = tree.get<std::size_t>("RowGroupSize", RowGroupBuffer::defaultCapacity);
        fullRescan        = tree.get<bool>("FullRescan", false);
    }
    catch (boost::property_tree::ptree_error const& e)
    {
        throw std::runtime_error("Invalid configuration " + path + ": " + e.what());
    }

    if (dataDir.empty()) throw std::runtime_error("DataDir not set in " + path + ".");
    if (rowGroupSize == 0) throw std::runtime_error("RowGroupSize must be positive.");

    const char* envAPIKey = std::getenv(API_KEY_ENV);
    if (envAPIKey) apiKey = envAPIKey;
}

std::string ConfigurationManager::resolvePath(std::string const& commandLinePath)
{
    if (!commandLinePath.empty()) return commandLinePath;

    const char* envPath = std::getenv(CONFIG_ENV);
    if (envPath && *envPath) return envPath;

    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path ConfigurationManager::storePath() const { return std::filesystem::path(dataDir) / "realtime.db"; }
std::filesystem::path ConfigurationManager::archiveDir() const { return std::filesystem::path(dataDir) / "archive"; }
std::filesystem::path ConfigurationManager::staticDir() const { return std::filesystem::path(dataDir) / "static"; }
