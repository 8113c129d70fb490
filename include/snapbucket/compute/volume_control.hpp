#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace snapbucket {

enum class VolumeState {
    Creating,
    Available,
    Attaching,
    InUse,
    Detaching,
    Deleting,
    Deleted,
    Error
};

const char* volume_state_to_string(VolumeState state);

/// A block-storage snapshot eligible for migration. Read-only to this tool.
struct Snapshot {
    std::string id;
    std::chrono::system_clock::time_point created;
    int volume_size_gib = 0;
    std::string name;  // Name tag, falls back to the id
};

struct Volume {
    std::string id;
    VolumeState state = VolumeState::Creating;
    std::string snapshot_id;  // empty for blank volumes
    int size_gib = 0;
    std::string instance_id;  // set while attached
    std::string device;
};

/// Parameters of a CreateVolume call. Exactly one of snapshot_id and
/// size_gib is meaningful.
struct VolumeRequest {
    std::string availability_zone;
    std::string snapshot_id;
    int size_gib = 0;
    std::string volume_type = "gp2";
    std::optional<int> iops;
    std::optional<int> throughput;
    std::map<std::string, std::string> tags;
};

/// Compute control plane operations on volumes and snapshots. Every call
/// throws ControlPlaneError when the request is rejected.
class VolumeControl {
public:
    virtual ~VolumeControl() = default;

    // All snapshots whose tag `tag` has value `value`, across all pages
    virtual std::vector<Snapshot> list_snapshots(const std::string& tag,
                                                 const std::string& value) = 0;

    // Returns the new volume id
    virtual std::string create_volume(const VolumeRequest& request) = 0;

    // A volume that no longer exists is reported as Deleted
    virtual Volume describe_volume(const std::string& volume_id) = 0;

    virtual void attach_volume(const std::string& volume_id, const std::string& instance_id,
                               const std::string& device) = 0;
    virtual void detach_volume(const std::string& volume_id, bool force) = 0;
    virtual void delete_volume(const std::string& volume_id) = 0;

    virtual void delete_snapshot(const std::string& snapshot_id) = 0;

    // Creates or overwrites tags on a volume or snapshot
    virtual void tag_resource(const std::string& resource_id,
                              const std::map<std::string, std::string>& tags) = 0;
};

}  // namespace snapbucket
