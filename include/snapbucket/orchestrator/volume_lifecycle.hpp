#pragma once

#include "snapbucket/compute/volume_control.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace snapbucket {

class MetricsExporter;

struct PollPolicy {
    std::chrono::milliseconds delay;
    int max_attempts;
};

struct ReadinessPolicies {
    PollPolicy available{std::chrono::seconds(10), 50};
    PollPolicy in_use{std::chrono::seconds(15), 40};
    PollPolicy deleted{std::chrono::seconds(15), 40};
};

/// Where and how volumes are created and attached.
struct VolumeSettings {
    std::string availability_zone;
    std::string instance_id;
    std::string volume_type = "gp2";
    std::optional<int> iops;
    std::optional<int> throughput;
    std::string tag = "snap-to-bucket";
    std::string device = "/dev/sdk";
};

// ceil(bytes / GiB) * 1.25, rounded, at least 1
int restore_volume_size_gib(uint64_t bytes);

/// Volume create/attach/detach/delete with readiness polling. A volume
/// that fails to become available or to attach is deleted before the
/// error propagates.
class VolumeLifecycle {
public:
    VolumeLifecycle(VolumeControl& control, VolumeSettings settings,
                    ReadinessPolicies policies = {}, MetricsExporter* metrics = nullptr);

    // Returns the id of an available volume restored from `snapshot`
    std::string create_from_snapshot(const Snapshot& snapshot);

    // Returns the id of an available blank volume sized for `bytes`
    std::string create_empty(uint64_t bytes, std::chrono::system_clock::time_point now);

    // Attaches to this instance and waits for in-use
    void attach(const std::string& volume_id);

    // Forced detach, waits for available
    void detach(const std::string& volume_id);

    // Deletes and waits until the volume is gone
    void destroy(const std::string& volume_id);

    // Throws ResourceTimeout when `target` is not reached within the policy
    void wait_for(const std::string& volume_id, VolumeState target, const PollPolicy& policy);

    /// Best-effort removal of a volume in any state: forced detach when
    /// attached, then delete. Logs instead of throwing.
    void compensate(const std::string& volume_id);

    const VolumeSettings& settings() const { return settings_; }

private:
    std::string create(const VolumeRequest& request, const std::string& what);

    VolumeControl& control_;
    VolumeSettings settings_;
    ReadinessPolicies policies_;
    MetricsExporter* metrics_;
};

}  // namespace snapbucket
