#include "snapbucket/orchestrator/restore.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/metrics.hpp"
#include "snapbucket/orchestrator/volume_lifecycle.hpp"
#include "snapbucket/storage/object_store.hpp"
#include "snapbucket/system/device_ops.hpp"
#include "snapbucket/system/fstab.hpp"
#include "snapbucket/transfer/archive_stream.hpp"
#include "snapbucket/transfer/downloader.hpp"

#include <optional>

namespace snapbucket {

namespace {

// Bound into the restored tree so grub can see the running system
const char* const CHROOT_DIRS[] = {"/sys", "/proc", "/run", "/dev"};

}  // namespace

RestoreSequencer::RestoreSequencer(VolumeLifecycle& lifecycle, DeviceOps& devices,
                                   const ObjectStore& store, RestoreOptions options,
                                   MetricsExporter* metrics)
    : lifecycle_(lifecycle)
    , devices_(devices)
    , store_(store)
    , options_(std::move(options))
    , metrics_(metrics)
    , sink_factory_([](const std::filesystem::path& root, bool gzip) {
        return std::unique_ptr<ByteSink>(ArchiveExtractor::open(root, gzip));
    })
    , sizer_(ChunkSizer::for_extraction()) {
    sizer_.set_metrics(metrics_);
}

void RestoreSequencer::install_boot_loader(const std::string& volume_id,
                                           const std::string& device,
                                           std::vector<std::filesystem::path>& bound) {
    fix_fstab(devices_, options_.mount_point, device, options_.label_settle);

    for (const char* dir : CHROOT_DIRS) {
        auto target = options_.mount_point / (dir + 1);
        devices_.bind_mount(dir, target);
        bound.push_back(target);
    }

    std::string disk = resolve_boot_device(devices_, volume_id);
    log_info("Changing root to %s to fix grub", options_.mount_point.c_str());
    devices_.run_in_root(options_.mount_point, {"grub-install", disk});
    devices_.run_in_root(options_.mount_point, {"update-grub"});
}

std::string RestoreSequencer::run() {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->unit_duration());

    std::string volume_id;
    try {
        prepare_restore_dir(options_.restore_dir);
        auto plan = plan_restore(store_, options_.key);
        volume_id = lifecycle_.create_empty(plan.size_bytes, std::chrono::system_clock::now());
        lifecycle_.attach(volume_id);

        bool mounted = false;
        std::vector<std::filesystem::path> bound;
        try {
            std::string disk = resolve_mountable_device(devices_, volume_id);
            devices_.partition(disk, options_.boot);
            std::string device = resolve_mountable_device(devices_, volume_id);
            devices_.format_ext4(device);

            devices_.mount(device, options_.mount_point);
            mounted = true;

            {
                auto sink = sink_factory_(options_.mount_point, plan.gzip);
                PartDownloader downloader(store_, options_.restore_dir, sizer_, metrics_);
                uint64_t restored = downloader.restore(plan, *sink);
                sink->finish();
                log_info("Restored %lu bytes from %zu object(s) into %s",
                         static_cast<unsigned long>(restored), plan.keys.size(),
                         volume_id.c_str());
            }

            if (options_.boot) {
                install_boot_loader(volume_id, device, bound);
                while (!bound.empty()) {
                    devices_.unmount(bound.back());
                    bound.pop_back();
                }
            }

            devices_.unmount(options_.mount_point);
            mounted = false;
            lifecycle_.detach(volume_id);
        } catch (const std::exception& e) {
            log_error("Restore into volume '%s' failed: %s", volume_id.c_str(), e.what());
            log_error("Deleting volume '%s'", volume_id.c_str());
            while (!bound.empty()) {
                try {
                    devices_.unmount(bound.back());
                } catch (const std::exception& unbind) {
                    log_error("Unmount of %s failed: %s", bound.back().c_str(), unbind.what());
                }
                bound.pop_back();
            }
            if (mounted) {
                try {
                    devices_.unmount(options_.mount_point);
                } catch (const std::exception& unmount) {
                    log_error("Unmount of %s failed: %s", options_.mount_point.c_str(),
                              unmount.what());
                }
            }
            lifecycle_.compensate(volume_id);
            throw;
        }
    } catch (const std::exception&) {
        if (metrics_) metrics_->restores_failure().Increment();
        throw;
    }

    if (metrics_) metrics_->restores_success().Increment();
    log_info("Restored %s into volume '%s'", options_.key.c_str(), volume_id.c_str());
    return volume_id;
}

}  // namespace snapbucket
