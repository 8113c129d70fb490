#include "snapbucket/system/device_ops.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/system/fstab.hpp"
#include "snapbucket/system/subprocess.hpp"

#include <sys/statvfs.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <nlohmann/json.hpp>

namespace snapbucket {

// ============================================================================
// lsblk parsing and device resolution
// ============================================================================

namespace {

std::string string_or_empty(const nlohmann::json& j, const char* name) {
    if (!j.contains(name) || j[name].is_null()) return {};
    return j[name].get<std::string>();
}

BlockDevice parse_device(const nlohmann::json& j) {
    BlockDevice device;
    device.name = string_or_empty(j, "name");
    device.serial = string_or_empty(j, "serial");
    if (j.contains("mountpoint") && !j["mountpoint"].is_null()) {
        device.mountpoint = j["mountpoint"].get<std::string>();
    }
    if (j.contains("children") && j["children"].is_array()) {
        for (const auto& child : j["children"]) {
            device.children.push_back(parse_device(child));
        }
    }
    return device;
}

const BlockDevice* find_by_serial(const std::vector<BlockDevice>& devices,
                                  const std::string& volume_id) {
    std::string serial = volume_serial(volume_id);
    for (const auto& device : devices) {
        if (device.serial == serial) return &device;
    }
    return nullptr;
}

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

}  // namespace

std::vector<BlockDevice> parse_lsblk(const std::string& json) {
    std::vector<BlockDevice> devices;
    try {
        auto j = nlohmann::json::parse(json);
        for (const auto& entry : j.at("blockdevices")) {
            devices.push_back(parse_device(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw DeviceResolutionFailure(std::string("Cannot parse lsblk output: ") + e.what());
    }
    return devices;
}

std::string volume_serial(const std::string& volume_id) {
    std::string serial;
    for (char c : volume_id) {
        if (c != '-') serial += c;
    }
    return serial;
}

std::optional<std::string> find_mountable_device(const std::vector<BlockDevice>& devices,
                                                 const std::string& volume_id) {
    const BlockDevice* disk = find_by_serial(devices, volume_id);
    if (!disk) return std::nullopt;
    for (const auto& child : disk->children) {
        if (!child.mountpoint) return "/dev/" + child.name;
    }
    return "/dev/" + disk->name;
}

std::optional<std::string> find_boot_device(const std::vector<BlockDevice>& devices,
                                            const std::string& volume_id) {
    const BlockDevice* disk = find_by_serial(devices, volume_id);
    if (!disk) return std::nullopt;
    return "/dev/" + disk->name;
}

std::string resolve_mountable_device(DeviceOps& ops, const std::string& volume_id) {
    ops.settle();
    auto device = find_mountable_device(ops.list_block_devices(), volume_id);
    if (!device) {
        throw DeviceResolutionFailure("No block device with serial " + volume_serial(volume_id),
                                      volume_id);
    }
    log_debug(2, "Volume %s is %s", volume_id.c_str(), device->c_str());
    return *device;
}

std::string resolve_boot_device(DeviceOps& ops, const std::string& volume_id) {
    auto device = find_boot_device(ops.list_block_devices(), volume_id);
    if (!device) {
        throw DeviceResolutionFailure("No block device with serial " + volume_serial(volume_id),
                                      volume_id);
    }
    return *device;
}

// ============================================================================
// SystemDeviceOps
// ============================================================================

SystemDeviceOps::SystemDeviceOps(std::chrono::seconds settle_delay)
    : settle_delay_(settle_delay) {}

void SystemDeviceOps::settle() {
    // Both tools fail harmlessly on hosts without pending events
    for (const auto& argv : {std::vector<std::string>{"partprobe"},
                             std::vector<std::string>{"udevadm", "settle"}}) {
        auto result = run_command(argv);
        if (result.exit_code != 0) {
            log_debug(2, "%s exited with %d", join_command(argv).c_str(), result.exit_code);
        }
    }
    std::this_thread::sleep_for(settle_delay_);
}

std::vector<BlockDevice> SystemDeviceOps::list_block_devices() {
    return parse_lsblk(check_output({"lsblk", "--json", "--output", "NAME,SERIAL,MOUNTPOINT"}));
}

void SystemDeviceOps::mount(const std::string& device, const std::filesystem::path& target) {
    log_debug(2, "Mounting %s at %s", device.c_str(), target.c_str());
    check_output({"mount", "--source", device, "--target", target.string()});
}

void SystemDeviceOps::unmount(const std::filesystem::path& target) {
    log_debug(2, "Unmounting %s", target.c_str());
    check_output({"umount", target.string()});
}

void SystemDeviceOps::bind_mount(const std::filesystem::path& source,
                                 const std::filesystem::path& target) {
    check_output({"mount", "--bind", source.string(), target.string()});
}

uint64_t SystemDeviceOps::used_bytes(const std::filesystem::path& mount_point) {
    struct statvfs st;
    if (statvfs(mount_point.c_str(), &st) != 0) {
        throw Error("statvfs(" + mount_point.string() + ") failed: " + strerror(errno),
                    mount_point.string());
    }
    return static_cast<uint64_t>(st.f_blocks - st.f_bfree) * st.f_frsize;
}

void SystemDeviceOps::partition(const std::string& device, bool bootable) {
    log_debug(3, "Partitioning %s", device.c_str());
    std::string layout = "label: dos\ntype=83";
    if (bootable) layout += ", bootable";
    layout += "\n";
    check_output({"sfdisk", device}, layout);
}

void SystemDeviceOps::format_ext4(const std::string& device) {
    log_debug(3, "Formatting %s with ext4", device.c_str());
    check_output({"mke2fs", "-t", "ext4", device});
}

std::string SystemDeviceOps::filesystem_uuid(const std::string& device) {
    auto uuid = parse_blkid_uuid(check_output({"blkid", "--output", "export", device}));
    if (!uuid) {
        throw DeviceResolutionFailure("blkid reported no UUID for " + device, device);
    }
    return *uuid;
}

void SystemDeviceOps::set_label(const std::string& device, const std::string& label) {
    check_output({"e2label", device, label});
}

std::string SystemDeviceOps::label(const std::string& device) {
    return trim(check_output({"e2label", device}));
}

void SystemDeviceOps::run_in_root(const std::filesystem::path& root,
                                  const std::vector<std::string>& argv) {
    log_debug(1, "Running %s under %s", join_command(argv).c_str(), root.c_str());
    check_output(argv, {}, root);
}

}  // namespace snapbucket
