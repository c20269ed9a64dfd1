#include <iostream>
#include <parquet/properties.h>
#include "ArchiveSchema.hpp"
#include "ArchiveStatus.hpp"
#include "PartitionReader.hpp"
#include "PartitionWriter.hpp"

namespace
{
    constexpr auto kIo = ArchiveError::Kind::Io;
    constexpr auto kCodec = ArchiveError::Kind::Codec;

    std::shared_ptr<parquet::WriterProperties> writerProperties(int64_t rowGroupLength)
    {
        // Time columns grow almost monotonically inside a partition, so delta
        // encoding beats a dictionary there.
        return parquet::WriterProperties::Builder()
            .compression(arrow::Compression::ZSTD)
            ->max_row_group_length(rowGroupLength)
            ->enable_dictionary()
            ->disable_dictionary(ArchiveSchema::timestampColumn)
            ->encoding(ArchiveSchema::timestampColumn, parquet::Encoding::DELTA_BINARY_PACKED)
            ->disable_dictionary(ArchiveSchema::startTimeColumn)
            ->encoding(ArchiveSchema::startTimeColumn, parquet::Encoding::DELTA_BINARY_PACKED)
            ->build();
    }
}

PartitionWriter::PartitionWriter(std::filesystem::path path, int64_t maxRowGroupLength)
    : filePath(std::move(path)), rowGroupLength(maxRowGroupLength)
{
    outfile = valueOrThrow(arrow::io::FileOutputStream::Open(filePath.string()), kIo,
                           "Cannot create " + filePath.string());

    auto arrowProps = parquet::ArrowWriterProperties::Builder()
                          .store_schema()
                          ->build();

    writer = valueOrThrow(
        parquet::arrow::FileWriter::Open(*ArchiveSchema::schema(), arrow::default_memory_pool(),
                                         outfile, writerProperties(rowGroupLength), arrowProps),
        kIo, "Cannot start parquet writer for " + filePath.string());
}

PartitionWriter::~PartitionWriter()
{
    if (closed)
        return;

    // Closing the stream first keeps the writer from appending a footer.
    auto status = outfile->Close();
    if (!status.ok())
        std::cerr << "[Archive] Abandoning " << filePath.string() << ": " << status.ToString() << "\n";
    writer.reset();
}

int64_t PartitionWriter::write(std::vector<VehiclePosition> const& batch)
{
    if (batch.empty())
        return 0;

    auto table = ArchiveSchema::toTable(batch);
    ARCHIVE_THROW_IF_NOT_OK(kIo, writer->WriteTable(*table, rowGroupLength));

    rows += table->num_rows();
    return table->num_rows();
}

int64_t PartitionWriter::copyFrom(PartitionReader& reader)
{
    if (!reader.schema()->Equals(*ArchiveSchema::schema(), false))
    {
        throw ArchiveError(kCodec, reader.path().string() + " does not match the archive schema: "
                                 + reader.schema()->ToString());
    }

    int64_t copied = 0;
    while (auto table = reader.nextRowGroup())
    {
        ARCHIVE_THROW_IF_NOT_OK(kIo, writer->WriteTable(*table, rowGroupLength));
        copied += table->num_rows();
    }

    rows += copied;
    return copied;
}

void PartitionWriter::close()
{
    if (closed)
        return;

    ARCHIVE_THROW_IF_NOT_OK(kIo, writer->Close());
    ARCHIVE_THROW_IF_NOT_OK(kIo, outfile->Close());
    closed = true;
}
