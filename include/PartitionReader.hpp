#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include "Types.hpp"

// Latest archived observation per key.
using Watermarks = std::unordered_map<std::string, int64_t>;

// What a partition file already holds. Rows are keyed by vehicle id, or by
// trip id when the feed left the vehicle id empty.
struct ArchiveWatermarks
{
    Watermarks vehicles;
    Watermarks trips;

    bool empty() const noexcept { return vehicles.empty() && trips.empty(); }

    // Oldest mark of either kind; nothing when empty.
    std::optional<int64_t> oldest() const;

    // False when the row is not strictly newer than its key's mark. Otherwise
    // the mark moves up to the row's timestamp.
    bool admit(VehiclePosition const& p);
};

// Row-group cursor over an existing partition file. Supports any number of
// full passes through rewind().
class PartitionReader
{
public:
    // Empty when nothing exists at `path`; throws ArchiveError (Io) when the
    // path cannot be inspected.
    static std::optional<PartitionReader> open(std::filesystem::path const& path);

    explicit PartitionReader(std::filesystem::path const& path);

    PartitionReader(PartitionReader&&) noexcept = default;
    PartitionReader& operator=(PartitionReader&&) noexcept = default;

    int64_t numRows() const;
    int numRowGroups() const;
    std::shared_ptr<arrow::Schema> const& schema() const noexcept { return arrowSchema; }
    std::filesystem::path const& path() const noexcept { return filePath; }

    // Next row group with every column, or nullptr past the last one.
    std::shared_ptr<arrow::Table> nextRowGroup();
    // Same, restricted to the given column indices.
    std::shared_ptr<arrow::Table> nextRowGroup(std::vector<int> const& columns);

    void rewind() noexcept { nextGroup = 0; }

    // Reads trip_id, vehicle_id and timestamp from the current position to
    // the end.
    ArchiveWatermarks watermarks();

    // Decodes every row of the file; leaves the cursor at the end.
    std::vector<VehiclePosition> readAll();

private:
    std::filesystem::path filePath;
    std::shared_ptr<arrow::io::ReadableFile> file;
    std::unique_ptr<parquet::arrow::FileReader> reader;
    std::shared_ptr<arrow::Schema> arrowSchema;
    int nextGroup = 0;
};
