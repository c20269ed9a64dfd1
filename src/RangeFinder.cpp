#include <stdexcept>
#include "ArchiveErrors.hpp"
#include "RangeFinder.hpp"
#include "SQLiteStore.hpp"

std::optional<ArchiveRange> RangeFinder::computeRange(SQLiteStore& store)
{
    auto bounds = store.archiveMonthBounds();
    if (!bounds)
        return std::nullopt;

    try
    {
        ArchiveRange range{PartitionKey::parse(bounds->first), PartitionKey::parse(bounds->second)};
        if (range.last < range.first)
            throw std::invalid_argument("range ends before it starts");
        return range;
    }
    catch (std::invalid_argument const& e)
    {
        throw ArchiveError(ArchiveError::Kind::Discovery,
            "Malformed archive range [" + bounds->first + ", " + bounds->second + "]: " + e.what());
    }
}
