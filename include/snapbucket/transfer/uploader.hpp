#pragma once

#include "snapbucket/compute/volume_control.hpp"
#include "snapbucket/storage/object_store.hpp"
#include "snapbucket/transfer/multipart_session.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace snapbucket {

class ByteSource;
class ChunkSizer;
class MetricsExporter;

struct UploadOptions {
    uint64_t split_size = 5ULL * 1024 * 1024 * 1024 * 1024;
    std::string storage_class;
    bool gzip = false;
    RetryPolicy retry;
};

struct UploadedObject {
    std::string key;
    uint64_t size = 0;
    int parts = 0;
    std::string etag;
};

struct UploadSummary {
    std::vector<UploadedObject> objects;
    uint64_t total_bytes = 0;
};

/// Streams one archive into one or more objects.
///
/// Whether the unit is split is decided once from the size estimate: an
/// estimate at or below the split size yields a single object without a
/// part suffix. Object boundaries are then driven by bytes read, so every
/// split object holds exactly split_size bytes except the last. A single
/// object may grow up to the store's maximum object size.
class SplitUploader {
public:
    SplitUploader(ObjectStore& store, const ChunkSizer& sizer, UploadOptions options,
                  MetricsExporter* metrics = nullptr);

    /// Throws SourceFailure when the archive fails, is empty or outgrows a
    /// single object; PartUploadFailed / CompleteFailed when the store gives
    /// up. No session is left open when this throws.
    UploadSummary upload(const Snapshot& snapshot, ByteSource& source, uint64_t size_estimate,
                         std::chrono::system_clock::time_point unit_start);

private:
    MultipartOptions object_options(const Snapshot& snapshot, uint64_t size_estimate,
                                    const std::string& content_type) const;

    ObjectStore& store_;
    const ChunkSizer& sizer_;
    UploadOptions options_;
    MetricsExporter* metrics_;
};

}  // namespace snapbucket
