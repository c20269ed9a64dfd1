#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "Types.hpp"

// Anything a RowGroupBuffer can flush into. write() returns the number of
// rows it actually wrote.
class RecordSink
{
public:
    virtual ~RecordSink() = default;
    virtual int64_t write(std::vector<VehiclePosition> const& batch) = 0;
};

// Collects records and hands them to the sink one row group at a time, so
// at most `capacity` records are ever held in memory.
class RowGroupBuffer
{
public:
    static constexpr std::size_t defaultCapacity = 1'000'000;

    explicit RowGroupBuffer(RecordSink& sink, std::size_t capacity = defaultCapacity);

    void append(VehiclePosition record);

    // Writes whatever is buffered, an empty batch included, and starts over.
    // Throws InvariantViolation if the sink reports a different row count.
    void flush();

    std::size_t size() const noexcept { return batch.size(); }
    std::size_t capacity() const noexcept { return maxRows; }
    int64_t flushedRows() const noexcept { return written; }

private:
    RecordSink& sink;
    std::size_t maxRows;
    std::vector<VehiclePosition> batch;
    int64_t written = 0;
};
