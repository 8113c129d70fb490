#include "snapbucket/orchestrator/migration.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/metrics.hpp"
#include "snapbucket/orchestrator/volume_lifecycle.hpp"
#include "snapbucket/storage/object_store.hpp"
#include "snapbucket/system/device_ops.hpp"
#include "snapbucket/transfer/archive_stream.hpp"

#include <exception>
#include <optional>

namespace snapbucket {

MigrationOrchestrator::MigrationOrchestrator(VolumeLifecycle& lifecycle, VolumeControl& control,
                                             DeviceOps& devices, ObjectStore& store,
                                             MigrationOptions options, MetricsExporter* metrics)
    : lifecycle_(lifecycle)
    , control_(control)
    , devices_(devices)
    , store_(store)
    , options_(std::move(options))
    , metrics_(metrics)
    , source_factory_([](const std::filesystem::path& root, bool gzip) {
        return std::unique_ptr<ByteSource>(ArchiveSource::open(root, gzip));
    })
    , sizer_(ChunkSizer::for_upload()) {
    sizer_.set_metrics(metrics_);
}

size_t MigrationOrchestrator::run() {
    auto snapshots = control_.list_snapshots(options_.tag, constants::TAG_MIGRATE);
    log_info("Found %zu snapshots tagged %s=%s", snapshots.size(), options_.tag.c_str(),
             constants::TAG_MIGRATE);

    size_t done = 0;
    for (const auto& snapshot : snapshots) {
        log_info("Processing snapshot '%s'", snapshot.id.c_str());
        migrate(snapshot);
        ++done;
        log_info("Processed snapshot '%s'", snapshot.id.c_str());
        log_info("%zu of %zu", done, snapshots.size());
    }
    return done;
}

UploadSummary MigrationOrchestrator::migrate(const Snapshot& snapshot) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->unit_duration());
    auto unit_start = std::chrono::system_clock::now();

    UploadSummary summary;
    try {
        std::string volume_id = lifecycle_.create_from_snapshot(snapshot);
        lifecycle_.attach(volume_id);

        bool mounted = false;
        try {
            std::string device = resolve_mountable_device(devices_, volume_id);
            devices_.mount(device, options_.mount_point);
            mounted = true;

            uint64_t used = devices_.used_bytes(options_.mount_point);
            log_debug(1, "Snapshot %s holds %lu bytes", snapshot.id.c_str(),
                      static_cast<unsigned long>(used));

            auto source = source_factory_(options_.mount_point, options_.upload.gzip);
            SplitUploader uploader(store_, sizer_, options_.upload, metrics_);
            summary = uploader.upload(snapshot, *source, used, unit_start);
        } catch (const std::exception& e) {
            log_error("Error occurred during upload for snapshot '%s': %s", snapshot.id.c_str(),
                      e.what());
            log_error("Deleting volume '%s'", volume_id.c_str());
            if (metrics_) metrics_->volumes_compensated().Increment();
            teardown(volume_id, mounted, true);
            throw;
        }
        teardown(volume_id, mounted, false);
        finish_snapshot(snapshot);
    } catch (const std::exception&) {
        if (metrics_) metrics_->migrations_failure().Increment();
        throw;
    }

    if (metrics_) metrics_->migrations_success().Increment();
    return summary;
}

void MigrationOrchestrator::teardown(const std::string& volume_id, bool mounted, bool unwinding) {
    std::exception_ptr first;
    auto step = [&](const char* what, auto&& action) {
        try {
            action();
        } catch (const std::exception& e) {
            log_error("%s of volume '%s' failed: %s", what, volume_id.c_str(), e.what());
            if (!first) first = std::current_exception();
        }
    };

    if (mounted) step("Unmount", [&] { devices_.unmount(options_.mount_point); });
    step("Detach", [&] { lifecycle_.detach(volume_id); });
    step("Delete", [&] { lifecycle_.destroy(volume_id); });

    if (first && !unwinding) std::rethrow_exception(first);
}

void MigrationOrchestrator::finish_snapshot(const Snapshot& snapshot) {
    if (options_.delete_snapshot) {
        control_.delete_snapshot(snapshot.id);
        log_info("Deleting snapshot '%s'", snapshot.id.c_str());
    } else {
        control_.tag_resource(snapshot.id, {{options_.tag, constants::TAG_TRANSFERRED}});
        log_debug(1, "Updated tag for snapshot '%s'", snapshot.id.c_str());
    }
}

}  // namespace snapbucket
