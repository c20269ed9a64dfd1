#pragma once
#include <cstdint>
#include <filesystem>
#include "PartitionMerger.hpp"

class SQLiteStore;

struct ArchiveSummary
{
    int partitions = 0;
    int64_t copiedRows = 0;
    int64_t newRows = 0;
    int64_t skippedRows = 0;
};

// Walks every month between the oldest and newest valid record and merges
// each one. The first failure ends the run.
class ArchiveDriver
{
public:
    ArchiveDriver(SQLiteStore& store, std::filesystem::path archiveRoot, MergeOptions options = {});

    ArchiveSummary run();

private:
    SQLiteStore& store;
    std::filesystem::path root;
    MergeOptions options;
};
