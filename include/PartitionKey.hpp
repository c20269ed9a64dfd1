#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

// Identifies one calendar month (UTC), the unit an archive file covers.
// The window is [periodStart(), periodEnd()).
struct PartitionKey
{
    int year = 1970;
    unsigned month = 1;

    static PartitionKey fromTimestamp(int64_t epochSeconds);
    // Accepts "YYYY-MM", throws std::invalid_argument on anything else.
    static PartitionKey parse(std::string const& yearMonth);

    int64_t periodStart() const;
    int64_t periodEnd() const;
    PartitionKey next() const;
    bool contains(int64_t epochSeconds) const;

    std::string label() const;
    std::filesystem::path directory(std::filesystem::path const& archiveRoot) const;

    friend bool operator==(PartitionKey const& a, PartitionKey const& b) noexcept
    {
        return a.year == b.year && a.month == b.month;
    }
    friend bool operator!=(PartitionKey const& a, PartitionKey const& b) noexcept { return !(a == b); }
    friend bool operator<(PartitionKey const& a, PartitionKey const& b) noexcept
    {
        return a.year != b.year ? a.year < b.year : a.month < b.month;
    }
    friend bool operator<=(PartitionKey const& a, PartitionKey const& b) noexcept { return !(b < a); }
};
