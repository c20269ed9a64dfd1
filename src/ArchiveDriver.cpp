#include <iostream>
#include <system_error>
#include "ArchiveDriver.hpp"
#include "RangeFinder.hpp"
#include "SQLiteStore.hpp"

ArchiveDriver::ArchiveDriver(SQLiteStore& positions, std::filesystem::path archiveRoot, MergeOptions mergeOptions)
    : store(positions), root(std::move(archiveRoot)), options(mergeOptions)
{
}

ArchiveSummary ArchiveDriver::run()
{
    std::error_code ec;
    auto absolute = std::filesystem::absolute(root, ec);
    std::cout << "[Archive] Archiving to " << (ec ? root : absolute).string() << " ..." << std::endl;

    ArchiveSummary summary;
    auto range = RangeFinder::computeRange(store);
    if (!range)
    {
        std::cout << "[Archive] No valid vehicle positions in store. Nothing to archive." << std::endl;
        return summary;
    }

    std::cout << "[Archive] Creating partitions from " << range->first.label()
              << " to " << range->last.label() << std::endl;

    PartitionMerger merger(store, root, options);
    for (PartitionKey period = range->first; period <= range->last; period = period.next())
    {
        std::cout << "[Archive] Writing partition for " << period.label() << std::endl;
        MergeStats stats;
        try
        {
            stats = merger.merge(period);
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Archive] " << period.label() << ": partition failed: " << e.what() << std::endl;
            throw;
        }

        ++summary.partitions;
        summary.copiedRows += stats.copiedRows;
        summary.newRows += stats.newRows;
        summary.skippedRows += stats.skippedRows;
        std::cout << "[Archive] Created partition for " << period.label() << std::endl;
    }

    std::cout << "[Archive] Done. " << summary.partitions << " partitions, "
              << summary.newRows << " new rows, " << summary.skippedRows << " skipped." << std::endl;
    return summary;
}
