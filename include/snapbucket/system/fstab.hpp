#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace snapbucket {

class DeviceOps;

/// The entry mounting `/` or `/boot` from an ext2-4 filesystem, addressed
/// by UUID= or LABEL=.
struct FstabEntry {
    enum class Scheme {
        Uuid,
        Label
    };

    Scheme scheme = Scheme::Uuid;
    std::string id;
    std::string mount_point;
    std::string fs_type;
};

// First matching line of an fstab, case-insensitive
std::optional<FstabEntry> find_root_entry(const std::string& fstab);

// Every occurrence of `old_uuid` replaced; the rest of the file is kept
std::string replace_uuid(const std::string& fstab, const std::string& old_uuid,
                         const std::string& new_uuid);

// UUID= line of `blkid --output export`
std::optional<std::string> parse_blkid_uuid(const std::string& output);

/// Points <root>/etc/fstab at `device`: a UUID entry is rewritten to the
/// device's new UUID, a LABEL entry is written onto the device and read
/// back. Throws DeviceResolutionFailure when the table has no usable
/// entry or the label does not stick.
void fix_fstab(DeviceOps& ops, const std::filesystem::path& root, const std::string& device,
               std::chrono::milliseconds label_settle = std::chrono::seconds(1));

}  // namespace snapbucket
