#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include "PartitionKey.hpp"
#include "RowGroupBuffer.hpp"

class SQLiteStore;

// Where the store rescan for a partition begins.
enum class WindowStart
{
    // Oldest per-vehicle watermark of the existing file. Cheap, but misses a
    // vehicle that is new to the partition and whose rows predate that point.
    MinWatermark,
    // Always the first instant of the month.
    PeriodStart
};

struct MergeOptions
{
    std::size_t rowGroupSize = RowGroupBuffer::defaultCapacity;
    WindowStart windowStart = WindowStart::MinWatermark;
};

struct MergeStats
{
    int64_t existingRows = 0;
    int64_t copiedRows = 0;
    std::size_t vehicles = 0;
    int64_t newRows = 0;
    int64_t skippedRows = 0;
};

// Brings one month's archive file up to date with the store.
class PartitionMerger
{
public:
    static constexpr char const* fileName = "vehicle_positions.parquet";
    static constexpr char const* stagingSuffix = ".tmp";

    PartitionMerger(SQLiteStore& store, std::filesystem::path archiveRoot, MergeOptions options = {});

    MergeStats merge(PartitionKey const& key);

    std::filesystem::path partitionPath(PartitionKey const& key) const;

private:
    SQLiteStore& store;
    std::filesystem::path root;
    MergeOptions options;
};
