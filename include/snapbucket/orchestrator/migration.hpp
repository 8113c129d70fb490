#pragma once

#include "snapbucket/compute/volume_control.hpp"
#include "snapbucket/transfer/chunk_sizer.hpp"
#include "snapbucket/transfer/uploader.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace snapbucket {

class ByteSource;
class DeviceOps;
class MetricsExporter;
class ObjectStore;
class VolumeLifecycle;

// Opens the archive stream of a mounted tree
using SourceFactory =
    std::function<std::unique_ptr<ByteSource>(const std::filesystem::path& root, bool gzip)>;

struct MigrationOptions {
    std::filesystem::path mount_point = "/mnt/snaps";
    std::string tag = "snap-to-bucket";
    bool delete_snapshot = false;
    UploadOptions upload;
};

/// Moves every snapshot tagged <tag>=migrate into the bucket, one at a time:
///   CreateVolume -> Attach -> Mount -> Transfer -> Unmount -> Detach ->
///   Delete -> (DeleteSnapshot | TagSnapshot)
/// The volume is unmounted, detached and deleted whether or not the
/// transfer succeeds.
class MigrationOrchestrator {
public:
    MigrationOrchestrator(VolumeLifecycle& lifecycle, VolumeControl& control, DeviceOps& devices,
                          ObjectStore& store, MigrationOptions options,
                          MetricsExporter* metrics = nullptr);

    void set_source_factory(SourceFactory factory) { source_factory_ = std::move(factory); }
    void set_chunk_sizer(ChunkSizer sizer) { sizer_ = std::move(sizer); }

    /// Migrates all eligible snapshots; stops at the first failing unit.
    /// Returns the number of snapshots migrated.
    size_t run();

    /// One transfer unit
    UploadSummary migrate(const Snapshot& snapshot);

private:
    // Unmount (when mounted), detach and delete. With `unwinding` set,
    // failures are logged so the original error survives; otherwise the
    // first failure is rethrown after every step was attempted.
    void teardown(const std::string& volume_id, bool mounted, bool unwinding);

    void finish_snapshot(const Snapshot& snapshot);

    VolumeLifecycle& lifecycle_;
    VolumeControl& control_;
    DeviceOps& devices_;
    ObjectStore& store_;
    MigrationOptions options_;
    MetricsExporter* metrics_;

    SourceFactory source_factory_;
    ChunkSizer sizer_;
};

}  // namespace snapbucket
