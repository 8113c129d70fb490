#pragma once

#include "snapbucket/storage/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace snapbucket {

class ByteSink;
class ChunkSizer;
class MetricsExporter;

/// What a restore prefix resolves to.
struct RestorePlan {
    std::vector<std::string> keys;  // in extraction order
    uint64_t size_bytes = 0;        // bytes the restored filesystem needs
    bool gzip = false;
};

/// Lists `prefix` and orders the objects found. One object is taken as
/// is; several must be -part1 .. -partN of the same unit. The size comes
/// from the disc-size metadata of the first object when it is at least 2,
/// otherwise from the sum of the listed sizes. Throws StorageError when
/// nothing (or an inconsistent part set) is found.
RestorePlan plan_restore(const ObjectStore& store, const std::string& prefix);

// Creates `dir` when missing. Throws ConfigurationError unless it ends up
// a writable directory.
void prepare_restore_dir(const std::filesystem::path& dir);

/// Downloads each object of a plan to a scratch file, feeds it to the
/// sink and removes the file before the next object is requested.
class PartDownloader {
public:
    PartDownloader(const ObjectStore& store, std::filesystem::path restore_dir,
                   const ChunkSizer& sizer, MetricsExporter* metrics = nullptr);

    // Returns the bytes written to the sink. Does not finish the sink.
    uint64_t restore(const RestorePlan& plan, ByteSink& sink);

private:
    std::filesystem::path download(const std::string& key);

    const ObjectStore& store_;
    std::filesystem::path restore_dir_;
    const ChunkSizer& sizer_;
    MetricsExporter* metrics_;
};

}  // namespace snapbucket
