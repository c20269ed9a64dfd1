#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include "RowGroupBuffer.hpp"

class PartitionReader;

// Writes one partition file: ZSTD compressed, dictionary-encoded strings,
// delta-encoded timestamps. Output is only a valid parquet file after close();
// a writer destroyed before that abandons its file without a footer.
class PartitionWriter : public RecordSink
{
public:
    PartitionWriter(std::filesystem::path path, int64_t maxRowGroupLength);
    ~PartitionWriter() override;

    PartitionWriter(PartitionWriter const&) = delete;
    PartitionWriter& operator=(PartitionWriter const&) = delete;

    int64_t write(std::vector<VehiclePosition> const& batch) override;

    // Streams the reader's remaining row groups into this file unchanged.
    // Throws ArchiveError (Codec) when the reader's schema differs.
    int64_t copyFrom(PartitionReader& reader);

    void close();

    std::filesystem::path const& path() const noexcept { return filePath; }
    int64_t rowsWritten() const noexcept { return rows; }

private:
    std::filesystem::path filePath;
    int64_t rowGroupLength;
    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    std::unique_ptr<parquet::arrow::FileWriter> writer;
    int64_t rows = 0;
    bool closed = false;
};
