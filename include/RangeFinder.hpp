#pragma once
#include <optional>
#include "PartitionKey.hpp"

class SQLiteStore;

// Inclusive span of months that hold at least one valid record at each end.
struct ArchiveRange
{
    PartitionKey first;
    PartitionKey last;
};

class RangeFinder
{
public:
    // Empty when the store has no record with timestamp > 0. Throws
    // ArchiveError (Discovery) when the bounds cannot be read or parsed.
    static std::optional<ArchiveRange> computeRange(SQLiteStore& store);
};
