#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snapbucket {

/// One entry of `lsblk --json --output NAME,SERIAL,MOUNTPOINT`.
struct BlockDevice {
    std::string name;
    std::string serial;
    std::optional<std::string> mountpoint;
    std::vector<BlockDevice> children;
};

// Throws DeviceResolutionFailure on malformed output
std::vector<BlockDevice> parse_lsblk(const std::string& json);

// Hardware serial of an attached volume: its id without dashes
std::string volume_serial(const std::string& volume_id);

// First unmounted partition of the volume's disk, else the disk itself
std::optional<std::string> find_mountable_device(const std::vector<BlockDevice>& devices,
                                                 const std::string& volume_id);

// Whole-disk device of the volume (where the boot loader goes)
std::optional<std::string> find_boot_device(const std::vector<BlockDevice>& devices,
                                            const std::string& volume_id);

/// Host block-device and filesystem operations. Implementations throw
/// CommandFailed when the underlying tool fails.
class DeviceOps {
public:
    virtual ~DeviceOps() = default;

    // Waits for the kernel to pick up new devices and partition tables
    virtual void settle() = 0;
    virtual std::vector<BlockDevice> list_block_devices() = 0;

    virtual void mount(const std::string& device, const std::filesystem::path& target) = 0;
    virtual void unmount(const std::filesystem::path& target) = 0;
    virtual void bind_mount(const std::filesystem::path& source,
                            const std::filesystem::path& target) = 0;

    // Bytes in use on the filesystem mounted at `mount_point`
    virtual uint64_t used_bytes(const std::filesystem::path& mount_point) = 0;

    // DOS label with a single type-83 partition spanning the disk
    virtual void partition(const std::string& device, bool bootable) = 0;
    virtual void format_ext4(const std::string& device) = 0;

    virtual std::string filesystem_uuid(const std::string& device) = 0;
    virtual void set_label(const std::string& device, const std::string& label) = 0;
    virtual std::string label(const std::string& device) = 0;

    // Runs a command with its root changed to `root`
    virtual void run_in_root(const std::filesystem::path& root,
                             const std::vector<std::string>& argv) = 0;
};

// settle(), then the mountable device of the volume. Throws
// DeviceResolutionFailure when no disk carries the volume's serial.
std::string resolve_mountable_device(DeviceOps& ops, const std::string& volume_id);
std::string resolve_boot_device(DeviceOps& ops, const std::string& volume_id);

/// DeviceOps backed by lsblk, mount, sfdisk, mke2fs, blkid and e2label.
class SystemDeviceOps : public DeviceOps {
public:
    explicit SystemDeviceOps(std::chrono::seconds settle_delay = std::chrono::seconds(5));

    void settle() override;
    std::vector<BlockDevice> list_block_devices() override;
    void mount(const std::string& device, const std::filesystem::path& target) override;
    void unmount(const std::filesystem::path& target) override;
    void bind_mount(const std::filesystem::path& source,
                    const std::filesystem::path& target) override;
    uint64_t used_bytes(const std::filesystem::path& mount_point) override;
    void partition(const std::string& device, bool bootable) override;
    void format_ext4(const std::string& device) override;
    std::string filesystem_uuid(const std::string& device) override;
    void set_label(const std::string& device, const std::string& label) override;
    std::string label(const std::string& device) override;
    void run_in_root(const std::filesystem::path& root,
                     const std::vector<std::string>& argv) override;

private:
    std::chrono::seconds settle_delay_;
};

}  // namespace snapbucket
