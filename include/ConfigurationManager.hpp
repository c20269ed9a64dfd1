#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

// Settings from gtfs-scraper.json plus the API key from the environment.
class ConfigurationManager
{
private:
    std::string dataDir;
    std::string staticURL;
    std::string alertsURL;
    std::string tripUpdatesURL;
    std::string vehicleUpdatesURL;
    std::string timeZone;
    std::string apiKey;
    std::string apiKeyHeader;
    std::size_t rowGroupSize;
    bool fullRescan;

public:
    static inline const std::string DEFAULT_CONFIG_PATH = "gtfs-scraper.json";
    static inline const char* CONFIG_ENV = "GTFS_SCRAPER_CONFIG";
    static inline const char* API_KEY_ENV = "GTFS_API_KEY";

    explicit ConfigurationManager(std::string const& path);

    // Command line beats the environment, which beats the default file name.
    static std::string resolvePath(std::string const& commandLinePath);

    [[nodiscard]] std::string const& getDataDir() const noexcept { return dataDir; }
    [[nodiscard]] std::string const& getStaticURL() const noexcept { return staticURL; }
    [[nodiscard]] std::string const& getAlertsURL() const noexcept { return alertsURL; }
    [[nodiscard]] std::string const& getTripUpdatesURL() const noexcept { return tripUpdatesURL; }
    [[nodiscard]] std::string const& getVehicleUpdatesURL() const noexcept { return vehicleUpdatesURL; }
    [[nodiscard]] std::string const& getTimeZone() const noexcept { return timeZone; }
    [[nodiscard]] std::string const& getAPIKey() const noexcept { return apiKey; }
    [[nodiscard]] std::string const& getAPIKeyHeader() const noexcept { return apiKeyHeader; }
    [[nodiscard]] std::size_t getRowGroupSize() const noexcept { return rowGroupSize; }
    [[nodiscard]] bool getFullRescan() const noexcept { return fullRescan; }

    [[nodiscard]] std::filesystem::path storePath() const;
    [[nodiscard]] std::filesystem::path archiveDir() const;
    [[nodiscard]] std::filesystem::path staticDir() const;
};
