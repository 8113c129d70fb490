#pragma once

#include "snapbucket/transfer/chunk_sizer.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace snapbucket {

class ByteSink;
class DeviceOps;
class MetricsExporter;
class ObjectStore;
class VolumeLifecycle;

using SinkFactory =
    std::function<std::unique_ptr<ByteSink>(const std::filesystem::path& root, bool gzip)>;

struct RestoreOptions {
    std::string key;  // object key or prefix of a split archive
    std::filesystem::path mount_point = "/mnt/snaps";
    std::filesystem::path restore_dir = "/tmp/snap-to-bucket";
    bool boot = false;
    std::chrono::milliseconds label_settle{1000};
};

/// Rebuilds a volume from archived objects:
///   CreateEmptyVolume -> Attach -> Partition/Format -> Mount ->
///   {Download -> Extract}* -> CloseExtractor ->
///   [FixFstab -> BindMounts -> grub in changed root -> UnbindMounts] ->
///   Unmount -> Detach
/// On success the volume is left detached for the caller; on failure it
/// is deleted.
class RestoreSequencer {
public:
    RestoreSequencer(VolumeLifecycle& lifecycle, DeviceOps& devices, const ObjectStore& store,
                     RestoreOptions options, MetricsExporter* metrics = nullptr);

    void set_sink_factory(SinkFactory factory) { sink_factory_ = std::move(factory); }
    void set_chunk_sizer(ChunkSizer sizer) { sizer_ = std::move(sizer); }

    // Returns the id of the restored volume
    std::string run();

private:
    void install_boot_loader(const std::string& volume_id, const std::string& device,
                             std::vector<std::filesystem::path>& bound);

    VolumeLifecycle& lifecycle_;
    DeviceOps& devices_;
    const ObjectStore& store_;
    RestoreOptions options_;
    MetricsExporter* metrics_;

    SinkFactory sink_factory_;
    ChunkSizer sizer_;
};

}  // namespace snapbucket
