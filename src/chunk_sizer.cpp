#include "snapbucket/transfer/chunk_sizer.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/metrics.hpp"

#include <sys/sysinfo.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

namespace snapbucket {

uint64_t available_memory() {
    std::ifstream meminfo("/proc/meminfo");
    std::string name;
    uint64_t value = 0;
    std::string unit;
    while (meminfo >> name >> value) {
        std::getline(meminfo, unit);
        if (name == "MemAvailable:") {
            return value * constants::KiB;
        }
    }

    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return static_cast<uint64_t>(info.freeram) * info.mem_unit;
    }
    return 0;
}

ChunkSizer::ChunkSizer(uint64_t ceiling, uint64_t margin, MemoryProbe probe)
    : ceiling_(ceiling), margin_(margin), probe_(std::move(probe)) {}

ChunkSizer ChunkSizer::for_upload(MemoryProbe probe) {
    return ChunkSizer(constants::MAX_PART_SIZE, constants::UPLOAD_MEMORY_MARGIN, std::move(probe));
}

ChunkSizer ChunkSizer::for_extraction(MemoryProbe probe) {
    return ChunkSizer(constants::MAX_PART_SIZE, constants::EXTRACT_MEMORY_MARGIN, std::move(probe));
}

uint64_t ChunkSizer::next() const {
    uint64_t available = probe_();
    uint64_t bounded = std::min(available, ceiling_);
    if (metrics_) {
        metrics_->available_memory().Set(static_cast<double>(available));
    }
    if (bounded <= margin_) {
        throw ResourceExhausted("Not enough free memory to buffer a chunk: " +
                                std::to_string(available) + " bytes available, " +
                                std::to_string(margin_) + " bytes must stay free");
    }
    uint64_t size = bounded - margin_;
    if (metrics_) {
        metrics_->chunk_size().Set(static_cast<double>(size));
    }
    return size;
}

uint64_t ChunkSizer::next(uint64_t bytes_read_for_split, uint64_t split_limit) const {
    if (bytes_read_for_split >= split_limit) {
        throw std::invalid_argument("chunk requested past the split boundary");
    }
    uint64_t candidate = next();
    uint64_t remaining = split_limit - bytes_read_for_split;
    if (candidate > remaining) {
        log_debug(3, "Chunk clamped from %lu to %lu bytes at split boundary",
                  static_cast<unsigned long>(candidate), static_cast<unsigned long>(remaining));
        candidate = remaining;
        if (metrics_) {
            metrics_->chunk_size().Set(static_cast<double>(candidate));
        }
    }
    return candidate;
}

}  // namespace snapbucket
