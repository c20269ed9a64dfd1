#include <algorithm>
#include <iostream>
#include <optional>
#include <system_error>
#include <date/date.h>
#include "ArchiveErrors.hpp"
#include "PartitionMerger.hpp"
#include "PartitionReader.hpp"
#include "PartitionWriter.hpp"
#include "SQLiteStore.hpp"

namespace fs = std::filesystem;

namespace
{
    std::string formatInstant(int64_t epochSeconds)
    {
        date::sys_seconds tp{std::chrono::seconds{epochSeconds}};
        return date::format("%F %T UTC", tp);
    }

    // Deletes the merge output unless the merge reached the final rename.
    // With no pre-existing file the output sits at the final path, so a failed
    // first merge leaves nothing half-written behind.
    class OutputGuard
    {
    public:
        explicit OutputGuard(fs::path output) : path(std::move(output)) {}

        ~OutputGuard()
        {
            if (committed)
                return;
            std::error_code ec;
            fs::remove(path, ec);
            if (ec)
                std::cerr << "[Archive] Could not remove " << path.string() << ": " << ec.message() << "\n";
        }

        void commit() noexcept { committed = true; }

    private:
        fs::path path;
        bool committed = false;
    };
}

PartitionMerger::PartitionMerger(SQLiteStore& positions, fs::path archiveRoot, MergeOptions mergeOptions)
    : store(positions), root(std::move(archiveRoot)), options(mergeOptions)
{
}

fs::path PartitionMerger::partitionPath(PartitionKey const& key) const
{
    return key.directory(root) / fileName;
}

MergeStats PartitionMerger::merge(PartitionKey const& key)
{
    const std::string ym = key.label();
    const fs::path finalPath = partitionPath(key);

    std::error_code ec;
    fs::create_directories(finalPath.parent_path(), ec);
    if (ec)
        throw ArchiveError(ArchiveError::Kind::Io, "Cannot create " + finalPath.parent_path().string() + ": " + ec.message());

    MergeStats stats;
    ArchiveWatermarks lastUpdates;
    fs::path stagingPath = finalPath;

    std::optional<PartitionReader> existing = PartitionReader::open(finalPath);
    if (existing)
    {
        stats.existingRows = existing->numRows();
        std::cout << "[Archive] " << ym << ": found " << stats.existingRows << " rows in existing file" << std::endl;

        lastUpdates = existing->watermarks();
        existing->rewind();
        stats.vehicles = lastUpdates.vehicles.size();
        std::cout << "[Archive] " << ym << ": found updates for " << stats.vehicles << " vehicles and "
                  << lastUpdates.trips.size() << " trips without a vehicle id" << std::endl;

        stagingPath += stagingSuffix;
    }

    OutputGuard guard(stagingPath);
    {
        PartitionWriter writer(stagingPath, static_cast<int64_t>(options.rowGroupSize));

        if (existing)
        {
            stats.copiedRows = writer.copyFrom(*existing);
            std::cout << "[Archive] " << ym << ": copied " << stats.copiedRows << " rows from existing file" << std::endl;
            if (stats.copiedRows != stats.existingRows)
            {
                throw InvariantViolation(ym + ": expected to copy " + std::to_string(stats.existingRows)
                                       + " parquet rows, copied " + std::to_string(stats.copiedRows));
            }
        }

        int64_t from = key.periodStart();
        std::optional<int64_t> oldest = lastUpdates.oldest();
        if (options.windowStart == WindowStart::MinWatermark && oldest)
        {
            // Never reach into the previous month.
            from = std::max(from, *oldest);
        }
        const int64_t until = key.periodEnd();
        std::cout << "[Archive] " << ym << ": querying data from " << formatInstant(from)
                  << " to " << formatInstant(until) << std::endl;

        RowGroupBuffer buffer(writer, options.rowGroupSize);
        PositionCursor cursor = store.queryWindow(from, until);

        VehiclePosition p;
        while (cursor.next(p))
        {
            // Rows arrive in timestamp order, so raising the mark as rows are
            // taken only drops exact repeats of an archived observation.
            if (!lastUpdates.admit(p))
            {
                ++stats.skippedRows;
                continue;
            }

            ++stats.newRows;
            buffer.append(std::move(p));
        }

        buffer.flush();
        writer.close();

        if (buffer.flushedRows() != stats.newRows)
        {
            throw InvariantViolation(ym + ": expected to write " + std::to_string(stats.newRows)
                                   + " parquet rows, wrote " + std::to_string(buffer.flushedRows()));
        }
    }
    std::cout << "[Archive] " << ym << ": wrote " << stats.newRows << " new rows, skipped "
              << stats.skippedRows << " rows" << std::endl;

    // Release the old file before it is replaced.
    existing.reset();

    if (stagingPath != finalPath)
    {
        fs::rename(stagingPath, finalPath, ec);
        if (ec)
        {
            throw ArchiveError(ArchiveError::Kind::Io, "Cannot replace " + finalPath.string()
                                                     + " with " + stagingPath.string() + ": " + ec.message());
        }
    }
    guard.commit();

    return stats;
}
