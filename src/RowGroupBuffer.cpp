#include <algorithm>
#include <stdexcept>
#include <string>
#include "ArchiveErrors.hpp"
#include "RowGroupBuffer.hpp"

RowGroupBuffer::RowGroupBuffer(RecordSink& recordSink, std::size_t capacity)
    : sink(recordSink), maxRows(capacity)
{
    if (maxRows == 0)
        throw std::invalid_argument("row group capacity must be positive");
    batch.reserve(std::min<std::size_t>(maxRows, 65536));
}

void RowGroupBuffer::append(VehiclePosition record)
{
    batch.push_back(std::move(record));
    if (batch.size() >= maxRows)
        flush();
}

void RowGroupBuffer::flush()
{
    const int64_t expected = static_cast<int64_t>(batch.size());
    const int64_t actual = sink.write(batch);
    if (actual != expected)
    {
        throw InvariantViolation("expected to write " + std::to_string(expected)
                               + " parquet rows, wrote " + std::to_string(actual));
    }

    written += actual;
    batch.clear();
}
