#include "snapbucket/orchestrator/volume_lifecycle.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/metrics.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <thread>

namespace snapbucket {

int restore_volume_size_gib(uint64_t bytes) {
    double gib = std::ceil(static_cast<double>(bytes) / static_cast<double>(constants::GiB));
    long size = std::lround(gib * constants::RESTORE_VOLUME_HEADROOM);
    return size < 1 ? 1 : static_cast<int>(size);
}

namespace {

// "2024-05-01_12-00-00-123456"
std::string volume_timestamp(std::chrono::system_clock::time_point now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &tm);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      now.time_since_epoch()).count() % 1000000;
    char frac[16];
    std::snprintf(frac, sizeof(frac), "-%06lld", static_cast<long long>(micros));
    return std::string(buf) + frac;
}

}  // namespace

VolumeLifecycle::VolumeLifecycle(VolumeControl& control, VolumeSettings settings,
                                 ReadinessPolicies policies, MetricsExporter* metrics)
    : control_(control)
    , settings_(std::move(settings))
    , policies_(policies)
    , metrics_(metrics) {}

void VolumeLifecycle::wait_for(const std::string& volume_id, VolumeState target,
                               const PollPolicy& policy) {
    VolumeState last = VolumeState::Creating;
    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        last = control_.describe_volume(volume_id).state;
        if (last == target) {
            log_debug(3, "Volume %s is %s", volume_id.c_str(), volume_state_to_string(target));
            return;
        }
        if (last == VolumeState::Error) {
            throw ControlPlaneError("Volume " + volume_id + " entered the error state", volume_id);
        }
        if (attempt < policy.max_attempts) {
            std::this_thread::sleep_for(policy.delay);
        }
    }
    throw ResourceTimeout("Volume " + volume_id + " did not become " +
                          volume_state_to_string(target) + " after " +
                          std::to_string(policy.max_attempts) + " checks (last state: " +
                          volume_state_to_string(last) + ")", volume_id);
}

std::string VolumeLifecycle::create(const VolumeRequest& request, const std::string& what) {
    std::string volume_id = control_.create_volume(request);
    log_debug(2, "Created volume %s from %s", volume_id.c_str(), what.c_str());
    try {
        wait_for(volume_id, VolumeState::Available, policies_.available);
    } catch (const Error& e) {
        log_error("Timed out while waiting for %s to get ready: %s", volume_id.c_str(), e.what());
        log_error("Attempting to delete volume %s", volume_id.c_str());
        compensate(volume_id);
        throw;
    }
    return volume_id;
}

std::string VolumeLifecycle::create_from_snapshot(const Snapshot& snapshot) {
    VolumeRequest request;
    request.availability_zone = settings_.availability_zone;
    request.snapshot_id = snapshot.id;
    request.volume_type = settings_.volume_type;
    request.iops = settings_.iops;
    request.throughput = settings_.throughput;
    request.tags[settings_.tag] = constants::TAG_CREATED;
    request.tags["Name"] = std::string(constants::VOLUME_NAME_PREFIX) + snapshot.id;
    return create(request, "snapshot " + snapshot.id);
}

std::string VolumeLifecycle::create_empty(uint64_t bytes,
                                          std::chrono::system_clock::time_point now) {
    VolumeRequest request;
    request.availability_zone = settings_.availability_zone;
    request.size_gib = restore_volume_size_gib(bytes);
    request.volume_type = settings_.volume_type;
    request.iops = settings_.iops;
    request.throughput = settings_.throughput;
    request.tags[settings_.tag] = constants::TAG_RESTORE_VOLUME;
    request.tags["Name"] = std::string(constants::VOLUME_NAME_PREFIX) + volume_timestamp(now);
    log_info("Creating %d GiB volume for %lu bytes", request.size_gib,
             static_cast<unsigned long>(bytes));
    return create(request, "nothing");
}

void VolumeLifecycle::attach(const std::string& volume_id) {
    try {
        control_.attach_volume(volume_id, settings_.instance_id, settings_.device);
        log_debug(2, "Attaching volume %s to instance %s", volume_id.c_str(),
                  settings_.instance_id.c_str());
        wait_for(volume_id, VolumeState::InUse, policies_.in_use);
    } catch (const Error& e) {
        log_error("Failed to attach volume %s to instance %s: %s", volume_id.c_str(),
                  settings_.instance_id.c_str(), e.what());
        log_error("Deleting volume %s", volume_id.c_str());
        compensate(volume_id);
        throw;
    }
}

void VolumeLifecycle::detach(const std::string& volume_id) {
    control_.detach_volume(volume_id, true);
    log_debug(2, "Detaching volume %s from instance %s", volume_id.c_str(),
              settings_.instance_id.c_str());
    wait_for(volume_id, VolumeState::Available, policies_.available);
}

void VolumeLifecycle::destroy(const std::string& volume_id) {
    control_.delete_volume(volume_id);
    log_debug(2, "Deleting volume %s", volume_id.c_str());
    wait_for(volume_id, VolumeState::Deleted, policies_.deleted);
}

void VolumeLifecycle::compensate(const std::string& volume_id) {
    if (metrics_) metrics_->volumes_compensated().Increment();
    try {
        VolumeState state = control_.describe_volume(volume_id).state;
        if (state == VolumeState::Deleted) return;
        if (state == VolumeState::InUse || state == VolumeState::Attaching ||
            state == VolumeState::Detaching) {
            detach(volume_id);
        }
        destroy(volume_id);
    } catch (const std::exception& e) {
        log_error("Cleanup of volume %s failed: %s. Delete it manually.", volume_id.c_str(),
                  e.what());
    }
}

}  // namespace snapbucket
