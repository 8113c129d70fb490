#pragma once

#include "snapbucket/storage/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snapbucket {

/// IOPS and throughput each volume type accepts. Types without a row
/// accept neither.
struct VolumeTypeRule {
    const char* type;
    int min_iops;  // 0 = IOPS not settable
    int max_iops;
    int min_throughput;  // 0 = throughput not settable
    int max_throughput;
};

const std::vector<VolumeTypeRule>& volume_type_rules();
const std::vector<std::string>& volume_types();
const std::vector<std::string>& storage_classes();

/// "<number><b|k|m|g|t>" in bytes (rounded up), nullopt when malformed.
/// Range checking is left to MigrateConfig::validate().
std::optional<uint64_t> parse_split_size(const std::string& text);

/// Configuration for one migrate or restore run.
struct MigrateConfig {
    // Target bucket (or directory with store.type == "local")
    StoreConfig store;

    // Snapshot selection and volume parameters
    std::string tag = "snap-to-bucket";
    std::string volume_type = "gp2";
    std::optional<int> iops;
    std::optional<int> throughput;
    std::string storage_class = "STANDARD";
    std::filesystem::path mount_point = "/mnt/snaps";
    bool delete_snapshot = false;

    // Archive layout
    std::string split_text = "5t";
    uint64_t split_size = 5ULL * 1024 * 1024 * 1024 * 1024;
    bool gzip = false;

    // Restore
    bool restore = false;
    std::string restore_key;
    bool boot = false;
    std::filesystem::path restore_dir = "/tmp/snap-to-bucket";

    // Network
    std::string proxy;
    std::string no_proxy;

    // Credentials (empty = instance profile)
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    // Control plane endpoint override (EC2-compatible APIs, tests)
    std::string ec2_endpoint;

    int verbosity = 0;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    bool show_help = false;
    bool show_version = false;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (message printed to stderr).
    static std::optional<MigrateConfig> from_args(int argc, char* argv[]);

    static void print_usage();

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Environment fallbacks (proxy, credentials) and derived values.
    void apply_defaults();

    /// Validate the whole configuration. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace snapbucket
