#include "snapbucket/system/fstab.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/system/device_ops.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <thread>

namespace snapbucket {

std::optional<FstabEntry> find_root_entry(const std::string& fstab) {
    static const std::regex pattern(
        R"(((?:UUID)|(?:LABEL))=([0-9a-z\-]+)\s+((?:\/boot)|(?:\/))\s+(ext(?:[2-4])))",
        std::regex::ECMAScript | std::regex::icase);

    std::istringstream lines(fstab);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) continue;

        FstabEntry entry;
        std::string scheme = m[1].str();
        entry.scheme = (scheme[0] == 'U' || scheme[0] == 'u') ? FstabEntry::Scheme::Uuid
                                                              : FstabEntry::Scheme::Label;
        entry.id = m[2].str();
        entry.mount_point = m[3].str();
        entry.fs_type = m[4].str();
        return entry;
    }
    return std::nullopt;
}

std::string replace_uuid(const std::string& fstab, const std::string& old_uuid,
                         const std::string& new_uuid) {
    if (old_uuid.empty()) return fstab;
    std::string result;
    size_t pos = 0;
    while (true) {
        size_t found = fstab.find(old_uuid, pos);
        if (found == std::string::npos) break;
        result.append(fstab, pos, found - pos);
        result += new_uuid;
        pos = found + old_uuid.size();
    }
    result.append(fstab, pos, std::string::npos);
    return result;
}

std::optional<std::string> parse_blkid_uuid(const std::string& output) {
    static const std::regex pattern(R"(^UUID=([0-9a-z\-]+)$)", std::regex::icase);
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::smatch m;
        if (std::regex_match(line, m, pattern)) return m[1].str();
    }
    return std::nullopt;
}

void fix_fstab(DeviceOps& ops, const std::filesystem::path& root, const std::string& device,
               std::chrono::milliseconds label_settle) {
    auto path = root / "etc" / "fstab";
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw DeviceResolutionFailure("Cannot read " + path.string(), device);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();
    std::string fstab = buffer.str();

    auto entry = find_root_entry(fstab);
    if (!entry) {
        throw DeviceResolutionFailure("No UUID= or LABEL= entry for / or /boot in " +
                                      path.string(), device);
    }

    if (entry->scheme == FstabEntry::Scheme::Uuid) {
        log_debug(2, "Restored filesystem was mounted with UUID=%s", entry->id.c_str());
        std::string uuid = ops.filesystem_uuid(device);
        log_debug(2, "New UUID of %s is %s", device.c_str(), uuid.c_str());

        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            out << replace_uuid(fstab, entry->id, uuid);
            if (!out.good()) {
                throw DeviceResolutionFailure("Cannot write " + tmp.string(), device);
            }
        }
        std::filesystem::rename(tmp, path);
        log_info("Updated %s: UUID=%s -> UUID=%s", path.c_str(), entry->id.c_str(), uuid.c_str());
        return;
    }

    log_debug(2, "Restored filesystem was mounted with LABEL=%s", entry->id.c_str());
    ops.set_label(device, entry->id);
    std::this_thread::sleep_for(label_settle);
    std::string label = ops.label(device);
    if (label != entry->id) {
        throw DeviceResolutionFailure("Unable to change the label of " + device + " to '" +
                                      entry->id + "' (reads '" + label + "')", device);
    }
    log_info("Labelled %s as %s", device.c_str(), entry->id.c_str());
}

}  // namespace snapbucket
