#pragma once

#include <cstdint>
#include <functional>

namespace snapbucket {

class MetricsExporter;

// Returns the bytes of memory currently available to this process
using MemoryProbe = std::function<uint64_t()>;

// MemAvailable from /proc/meminfo, falling back to sysinfo() free RAM
uint64_t available_memory();

/// Decides how many bytes to buffer for the next read. Memory is sampled
/// on every call, so the chunk shrinks when the host comes under pressure.
class ChunkSizer {
public:
    ChunkSizer(uint64_t ceiling, uint64_t margin, MemoryProbe probe = available_memory);

    // Sizer for archive uploads: 5 GiB ceiling, 500 MiB margin
    static ChunkSizer for_upload(MemoryProbe probe = available_memory);
    // Sizer for extraction: 5 GiB ceiling, 10 MiB margin
    static ChunkSizer for_extraction(MemoryProbe probe = available_memory);

    // Next read size bounded by the bytes left before the split boundary.
    // Requires bytes_read_for_split < split_limit. Throws ResourceExhausted
    // when the memory budget is not positive.
    uint64_t next(uint64_t bytes_read_for_split, uint64_t split_limit) const;

    // Next read size with no split boundary
    uint64_t next() const;

    uint64_t ceiling() const { return ceiling_; }
    uint64_t margin() const { return margin_; }

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

private:
    uint64_t ceiling_;
    uint64_t margin_;
    MemoryProbe probe_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace snapbucket
