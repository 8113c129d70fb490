// Test suite for snapbucket.
//
// Tests:
//   1. MigrateConfig CLI/JSON parsing and validation
//   2. ChunkSizer budgets and split clamping
//   3. Object keys and part numbering
//   4. lsblk parsing, device resolution and fstab rewriting
//   5. MultipartSession against the local object store (retries, idempotent
//      complete, abort on failure)
//   6. SplitUploader splitting and single-object layout
//   7. Archive round trips through real tar/gzip
//   8. VolumeLifecycle compensation
//   9. MigrationOrchestrator and RestoreSequencer with fake control plane
//      and device layers
//  10. EC2 reply parsing, subprocess helpers and metrics export

#include "snapbucket/aws/credentials.hpp"
#include "snapbucket/compute/ec2_volume_control.hpp"
#include "snapbucket/config.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/metrics.hpp"
#include "snapbucket/net/http.hpp"
#include "snapbucket/orchestrator/migration.hpp"
#include "snapbucket/orchestrator/restore.hpp"
#include "snapbucket/orchestrator/volume_lifecycle.hpp"
#include "snapbucket/storage/object_store.hpp"
#include "snapbucket/system/device_ops.hpp"
#include "snapbucket/system/fstab.hpp"
#include "snapbucket/system/subprocess.hpp"
#include "snapbucket/transfer/archive_stream.hpp"
#include "snapbucket/transfer/chunk_sizer.hpp"
#include "snapbucket/transfer/downloader.hpp"
#include "snapbucket/transfer/multipart_session.hpp"
#include "snapbucket/transfer/object_key.hpp"
#include "snapbucket/transfer/uploader.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace snapbucket;
using constants::KiB;
using constants::MiB;
using constants::GiB;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), std::string(msg) + ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return cond();
}

/// Deterministic, poorly compressible bytes.
static std::string make_payload(size_t size, uint32_t seed) {
    std::string data(size, '\0');
    uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        data[i] = static_cast<char>(x & 0xff);
    }
    return data;
}

static std::chrono::system_clock::time_point utc(const std::string& text) {
    auto tp = aws::parse_iso8601_utc(text);
    if (!tp) throw std::runtime_error("bad timestamp " + text);
    return *tp;
}

static Snapshot make_snapshot(const std::string& id, const std::string& name) {
    Snapshot snapshot;
    snapshot.id = id;
    snapshot.name = name;
    snapshot.created = utc("2024-05-01T12:00:00Z");
    snapshot.volume_size_gib = 8;
    return snapshot;
}

static size_t count_entries(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static std::string join(const std::vector<std::string>& items, const char* sep = ",") {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

static RetryPolicy no_delay_retries(int max_retries) {
    RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.delay = std::chrono::milliseconds(0);
    return policy;
}

static ReadinessPolicies instant_polls(int attempts = 3) {
    ReadinessPolicies policies;
    policies.available = {std::chrono::milliseconds(0), attempts};
    policies.in_use = {std::chrono::milliseconds(0), attempts};
    policies.deleted = {std::chrono::milliseconds(0), attempts};
    return policies;
}

// Sizer whose chunks are exactly `chunk` bytes
static ChunkSizer fixed_sizer(uint64_t chunk) {
    return ChunkSizer(constants::MAX_PART_SIZE, MiB, [chunk] { return chunk + MiB; });
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

/// ByteSource over an in-memory buffer.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string data, bool fail_on_finish = false)
        : data_(std::move(data)), fail_on_finish_(fail_on_finish) {}

    size_t read(uint8_t* buf, size_t n) override {
        size_t k = std::min(n, data_.size() - pos_);
        std::memcpy(buf, data_.data() + pos_, k);
        pos_ += k;
        return k;
    }

    void finish() override {
        finished = true;
        if (fail_on_finish_) throw SourceFailure("tar exited with 2");
    }

    bool finished = false;

private:
    std::string data_;
    size_t pos_ = 0;
    bool fail_on_finish_;
};

/// Sink that refuses input, like an extractor that died.
class BrokenSink : public ByteSink {
public:
    void write(std::span<const uint8_t>) override {
        throw TransferCorruption("extractor closed its input");
    }
    void finish() override {}
};

/// Local store wrapper that fails selected calls.
class FlakyObjectStore : public ObjectStore {
public:
    explicit FlakyObjectStore(std::unique_ptr<ObjectStore> inner) : inner_(std::move(inner)) {}

    int fail_parts = 0;  // upcoming upload_part calls to fail, -1 = all
    bool fail_retryable = true;

    int part_calls = 0;
    int complete_calls = 0;
    int abort_calls = 0;

    std::string type_name() const override { return "flaky"; }
    std::string describe(const std::string& key) const override { return inner_->describe(key); }
    StoreStatus check_access() const override { return inner_->check_access(); }

    CreateUploadResult create_multipart_upload(const std::string& key,
                                               const MultipartOptions& options) override {
        return inner_->create_multipart_upload(key, options);
    }

    PartResult upload_part(const std::string& key, const std::string& upload_id, int part_number,
                           std::span<const uint8_t> data,
                           const std::string& content_md5) override {
        ++part_calls;
        if (fail_parts != 0) {
            if (fail_parts > 0) --fail_parts;
            PartResult result;
            result.retryable = fail_retryable;
            result.status_code = fail_retryable ? 503 : 403;
            result.error_message = fail_retryable ? "SlowDown" : "AccessDenied";
            return result;
        }
        return inner_->upload_part(key, upload_id, part_number, data, content_md5);
    }

    CompleteResult complete_multipart_upload(const std::string& key, const std::string& upload_id,
                                             const std::vector<CompletedPart>& parts) override {
        ++complete_calls;
        return inner_->complete_multipart_upload(key, upload_id, parts);
    }

    StoreStatus abort_multipart_upload(const std::string& key,
                                       const std::string& upload_id) override {
        ++abort_calls;
        return inner_->abort_multipart_upload(key, upload_id);
    }

    ListResult list(const ListOptions& options) const override { return inner_->list(options); }
    std::optional<ObjectMetadata> head(const std::string& key) const override {
        return inner_->head(key);
    }
    GetResult get_to_file(const std::string& key, const fs::path& destination,
                          const TransferProgress& progress) const override {
        return inner_->get_to_file(key, destination, progress);
    }

private:
    std::unique_ptr<ObjectStore> inner_;
};

/// In-memory control plane. Volumes become ready immediately unless told
/// otherwise; every call is appended to `calls`.
class FakeVolumeControl : public VolumeControl {
public:
    struct TaggedSnapshot {
        Snapshot snapshot;
        std::map<std::string, std::string> tags;
    };

    std::vector<TaggedSnapshot> snapshots;
    std::map<std::string, Volume> volumes;
    std::vector<VolumeRequest> requests;
    std::vector<std::string> deleted_snapshots;
    std::vector<std::string> calls;

    bool stuck_creating = false;
    bool fail_attach = false;

    std::vector<Snapshot> list_snapshots(const std::string& tag,
                                         const std::string& value) override {
        calls.push_back("list");
        std::vector<Snapshot> out;
        for (const auto& s : snapshots) {
            auto it = s.tags.find(tag);
            if (it != s.tags.end() && it->second == value) out.push_back(s.snapshot);
        }
        return out;
    }

    std::string create_volume(const VolumeRequest& request) override {
        requests.push_back(request);
        Volume volume;
        volume.id = "vol-" + std::to_string(1000 + requests.size());
        volume.state = stuck_creating ? VolumeState::Creating : VolumeState::Available;
        volume.snapshot_id = request.snapshot_id;
        volume.size_gib = request.size_gib;
        volumes[volume.id] = volume;
        calls.push_back("create");
        return volume.id;
    }

    Volume describe_volume(const std::string& volume_id) override {
        auto it = volumes.find(volume_id);
        if (it == volumes.end()) {
            Volume gone;
            gone.id = volume_id;
            gone.state = VolumeState::Deleted;
            return gone;
        }
        return it->second;
    }

    void attach_volume(const std::string& volume_id, const std::string& instance_id,
                       const std::string& device) override {
        calls.push_back("attach");
        if (fail_attach) throw ControlPlaneError("IncorrectState", volume_id);
        auto& volume = volumes.at(volume_id);
        volume.state = VolumeState::InUse;
        volume.instance_id = instance_id;
        volume.device = device;
    }

    void detach_volume(const std::string& volume_id, bool force) override {
        calls.push_back(force ? "detach-force" : "detach");
        auto& volume = volumes.at(volume_id);
        volume.state = VolumeState::Available;
        volume.instance_id.clear();
    }

    void delete_volume(const std::string& volume_id) override {
        calls.push_back("delete");
        volumes.erase(volume_id);
    }

    void delete_snapshot(const std::string& snapshot_id) override {
        calls.push_back("delete-snapshot");
        deleted_snapshots.push_back(snapshot_id);
    }

    void tag_resource(const std::string& resource_id,
                      const std::map<std::string, std::string>& tags) override {
        calls.push_back("tag");
        for (auto& s : snapshots) {
            if (s.snapshot.id != resource_id) continue;
            for (const auto& [k, v] : tags) s.tags[k] = v;
        }
    }

    std::string attached_volume() const {
        for (const auto& [id, volume] : volumes) {
            if (volume.state == VolumeState::InUse) return id;
        }
        return {};
    }
};

/// Host layer that reports attached fake volumes as /dev/xvdk. Mounting is
/// only recorded; the mount point is a plain directory owned by the test.
class FakeDeviceOps : public DeviceOps {
public:
    explicit FakeDeviceOps(FakeVolumeControl& control) : control_(control) {}

    uint64_t used = 256 * KiB;
    std::string uuid = "def-456";
    bool label_sticks = true;

    std::set<std::string> partitioned;
    std::map<std::string, std::string> labels;
    std::vector<std::vector<std::string>> in_root;

    void settle() override {}

    std::vector<BlockDevice> list_block_devices() override {
        std::vector<BlockDevice> devices;
        BlockDevice root;
        root.name = "xvda";
        BlockDevice root_part;
        root_part.name = "xvda1";
        root_part.mountpoint = "/";
        root.children.push_back(root_part);
        devices.push_back(root);

        std::string id = control_.attached_volume();
        if (!id.empty()) {
            BlockDevice disk;
            disk.name = "xvdk";
            disk.serial = volume_serial(id);
            if (!control_.volumes.at(id).snapshot_id.empty() || partitioned.count(id)) {
                BlockDevice part;
                part.name = "xvdk1";
                disk.children.push_back(part);
            }
            devices.push_back(disk);
        }
        return devices;
    }

    void mount(const std::string& device, const fs::path& target) override {
        control_.calls.push_back("mount " + device);
        (void)target;
    }

    void unmount(const fs::path& target) override {
        control_.calls.push_back("umount " + target.filename().string());
    }

    void bind_mount(const fs::path& source, const fs::path& target) override {
        control_.calls.push_back("bind " + source.string());
        (void)target;
    }

    uint64_t used_bytes(const fs::path&) override { return used; }

    void partition(const std::string& device, bool bootable) override {
        control_.calls.push_back("partition " + device + (bootable ? " boot" : ""));
        partitioned.insert(control_.attached_volume());
    }

    void format_ext4(const std::string& device) override {
        control_.calls.push_back("mkfs " + device);
    }

    std::string filesystem_uuid(const std::string&) override { return uuid; }

    void set_label(const std::string& device, const std::string& label) override {
        if (label_sticks) labels[device] = label;
    }

    std::string label(const std::string& device) override {
        auto it = labels.find(device);
        return it == labels.end() ? std::string() : it->second;
    }

    void run_in_root(const fs::path&, const std::vector<std::string>& argv) override {
        in_root.push_back(argv);
        control_.calls.push_back("chroot " + join(argv, " "));
    }

private:
    FakeVolumeControl& control_;
};

static VolumeSettings test_settings() {
    VolumeSettings settings;
    settings.availability_zone = "eu-west-1a";
    settings.instance_id = "i-0123456789";
    return settings;
}

/// Fills a directory with a small tree of files with distinct permissions.
static void populate_tree(const fs::path& root) {
    write_file(root / "etc" / "hostname", "restored-host\n");
    write_file(root / "etc" / "fstab",
               "# static file system information\n"
               "UUID=abc-123 / ext4 defaults 0 1\n"
               "proc /proc proc defaults 0 0\n");
    write_file(root / "usr" / "bin" / "tool", "#!/bin/sh\necho tool\n");
    fs::permissions(root / "usr" / "bin" / "tool", fs::perms(0755));
    write_file(root / "var" / "data" / "blob.bin", make_payload(300 * KiB, 7));
    fs::permissions(root / "var" / "data" / "blob.bin", fs::perms(0640));
    write_file(root / "home" / "user" / "notes.txt", make_payload(90 * KiB, 11));
}

static std::string compare_trees(const fs::path& expected, const fs::path& actual) {
    for (const auto& entry : fs::recursive_directory_iterator(expected)) {
        if (!entry.is_regular_file()) continue;
        auto rel = fs::relative(entry.path(), expected);
        auto other = actual / rel;
        if (!fs::exists(other)) return "missing " + rel.string();
        if (read_file(entry.path()) != read_file(other)) return "content differs: " + rel.string();
        auto want = fs::status(entry.path()).permissions();
        auto got = fs::status(other).permissions();
        if (want != got) return "permissions differ: " + rel.string();
    }
    return {};
}

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

static void clear_environment() {
    for (const char* name : {"http_proxy", "HTTP_PROXY", "https_proxy", "HTTPS_PROXY",
                             "no_proxy", "NO_PROXY", "AWS_ACCESS_KEY_ID",
                             "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN"}) {
        unsetenv(name);
    }
}

static void test_config() {
    std::cout << "\n=== MigrateConfig ===" << std::endl;
    clear_environment();

    {
        TEST(split_size_parsing);
        ASSERT_EQ(parse_split_size("5t").value_or(0), 5 * constants::TiB, "5t");
        ASSERT_EQ(parse_split_size("10M").value_or(0), 10 * MiB, "10M");
        ASSERT_EQ(parse_split_size("1.5k").value_or(0), 1536ULL, "1.5k");
        ASSERT_EQ(parse_split_size("100b").value_or(0), 100ULL, "100b");
        ASSERT_TRUE(!parse_split_size("10").has_value(), "missing unit rejected");
        ASSERT_TRUE(!parse_split_size("12x").has_value(), "unknown unit rejected");
        ASSERT_TRUE(!parse_split_size("").has_value(), "empty rejected");
        PASS();
    }
    {
        TEST(cli_full_migration_args);
        const char* args[] = {
            "snapbucket",
            "-b", "backups",
            "-t", "nightly",
            "--type", "GP3",
            "--iops", "4000",
            "--throughput", "2000",
            "--storage-class", "standard_ia",
            "-s", "10m",
            "-g",
            "-d",
            "-vvv",
        };
        auto cfg = MigrateConfig::from_args(18, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->store.bucket, "backups", "bucket");
        ASSERT_EQ(cfg->tag, "nightly", "tag");
        ASSERT_EQ(cfg->volume_type, "gp3", "type lowercased");
        ASSERT_EQ(cfg->iops.value_or(0), 4000, "iops");
        ASSERT_EQ(cfg->throughput.value_or(0), 1000, "throughput clamped to 1000");
        ASSERT_EQ(cfg->storage_class, "STANDARD_IA", "storage class uppercased");
        ASSERT_EQ(cfg->split_size, 10 * MiB, "split size");
        ASSERT_TRUE(cfg->gzip, "gzip");
        ASSERT_TRUE(cfg->delete_snapshot, "delete");
        ASSERT_EQ(cfg->verbosity, 3, "-vvv");
        ASSERT_EMPTY(cfg->validate(), "valid config");
        PASS();
    }
    {
        TEST(cli_defaults);
        const char* args[] = {"snapbucket", "--bucket=backups"};
        auto cfg = MigrateConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->tag, "snap-to-bucket", "default tag");
        ASSERT_EQ(cfg->volume_type, "gp2", "default type");
        ASSERT_EQ(cfg->storage_class, "STANDARD", "default storage class");
        ASSERT_EQ(cfg->mount_point.string(), "/mnt/snaps", "default mount");
        ASSERT_EQ(cfg->split_size, 5 * constants::TiB, "default split");
        ASSERT_TRUE(!cfg->gzip && !cfg->restore && !cfg->boot, "flags off");
        ASSERT_EMPTY(cfg->validate(), "valid config");
        PASS();
    }
    {
        TEST(throughput_clamped_low);
        const char* args[] = {"snapbucket", "-b", "x", "--type", "gp3", "--throughput", "10"};
        auto cfg = MigrateConfig::from_args(7, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->throughput.value_or(0), 125, "clamped to 125");
        PASS();
    }
    {
        TEST(unknown_option_rejected);
        const char* args[] = {"snapbucket", "-b", "x", "--frobnicate"};
        auto cfg = MigrateConfig::from_args(4, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "should fail");
        PASS();
    }
    {
        TEST(missing_value_rejected);
        const char* args[] = {"snapbucket", "-b"};
        auto cfg = MigrateConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "should fail");
        PASS();
    }
    {
        TEST(split_bounds);
        MigrateConfig cfg;
        cfg.store.bucket = "x";
        cfg.split_text = "4m";
        ASSERT_TRUE(contains(cfg.validate(), "lesser than 5m"), "4m too small: " + cfg.validate());
        cfg.split_text = "6t";
        ASSERT_TRUE(contains(cfg.validate(), "greater than 5t"), "6t too large: " + cfg.validate());
        cfg.split_text = "12q";
        ASSERT_TRUE(contains(cfg.validate(), "format"), "bad format: " + cfg.validate());
        cfg.split_text = "5m";
        ASSERT_EMPTY(cfg.validate(), "5m accepted");
        cfg.split_text = "5t";
        ASSERT_EMPTY(cfg.validate(), "5t accepted");
        PASS();
    }
    {
        TEST(iops_rules);
        MigrateConfig cfg;
        cfg.store.bucket = "x";
        cfg.iops = 3000;
        ASSERT_TRUE(contains(cfg.validate(), "gp3, io1 & io2"), "gp2 takes no IOPS");
        cfg.volume_type = "gp3";
        ASSERT_EMPTY(cfg.validate(), "gp3 3000");
        cfg.iops = 16001;
        ASSERT_TRUE(contains(cfg.validate(), "3000-16000"), "gp3 upper bound");
        cfg.iops = 2999;
        ASSERT_NOT_EMPTY(cfg.validate(), "gp3 lower bound");
        cfg.volume_type = "io2";
        cfg.iops = 64000;
        ASSERT_EMPTY(cfg.validate(), "io2 64000");
        cfg.volume_type = "io1";
        cfg.iops = 99;
        ASSERT_NOT_EMPTY(cfg.validate(), "io1 lower bound");
        PASS();
    }
    {
        TEST(throughput_only_gp3);
        MigrateConfig cfg;
        cfg.store.bucket = "x";
        cfg.throughput = 500;
        ASSERT_TRUE(contains(cfg.validate(), "Only gp3"), "gp2 takes no throughput");
        cfg.volume_type = "gp3";
        ASSERT_EMPTY(cfg.validate(), "gp3 throughput");
        PASS();
    }
    {
        TEST(unsupported_type_and_class);
        MigrateConfig cfg;
        cfg.store.bucket = "x";
        cfg.volume_type = "magnetic";
        ASSERT_TRUE(contains(cfg.validate(), "volume type"), "type");
        cfg.volume_type = "st1";
        cfg.storage_class = "COLD";
        ASSERT_TRUE(contains(cfg.validate(), "storage class"), "class");
        PASS();
    }
    {
        TEST(restore_requires_key);
        const char* args[] = {"snapbucket", "-b", "x", "-r", "--boot"};
        auto cfg = MigrateConfig::from_args(5, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_TRUE(contains(cfg->validate(), "key"), "key required");
        cfg->restore_key = "snap/web/snap-1";
        ASSERT_EMPTY(cfg->validate(), "restore with key");
        PASS();
    }
    {
        TEST(store_requirements);
        MigrateConfig cfg;
        ASSERT_TRUE(contains(cfg.validate(), "bucket"), "bucket required");
        cfg.store.type = "local";
        ASSERT_NOT_EMPTY(cfg.validate(), "path required");
        cfg.store.path = "/srv/archive";
        ASSERT_EMPTY(cfg.validate(), "local store");
        cfg.store.type = "tape";
        ASSERT_NOT_EMPTY(cfg.validate(), "unknown store type");
        PASS();
    }
    {
        TEST(proxy_excludes_metadata_service);
        const char* args[] = {"snapbucket", "-b", "x", "--proxy", "http://proxy:3128",
                              "--noproxy", "localhost"};
        auto cfg = MigrateConfig::from_args(7, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->no_proxy, "localhost,169.254.169.254", "no_proxy");
        PASS();
    }
    {
        TEST(proxy_from_environment);
        setenv("https_proxy", "http://envproxy:8080", 1);
        const char* args[] = {"snapbucket", "-b", "x"};
        auto cfg = MigrateConfig::from_args(3, const_cast<char**>(args));
        unsetenv("https_proxy");
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->proxy, "http://envproxy:8080", "proxy");
        ASSERT_EQ(cfg->no_proxy, "169.254.169.254", "no_proxy");
        PASS();
    }
    {
        TEST(json_overlay);
        auto dir = make_temp_dir("snapbucket-config");
        write_file(dir / "config.json", R"({
            "bucket": "from-json",
            "split": "1g",
            "gzip": true,
            "type": "IO2",
            "iops": 20000,
            "store": {"type": "local", "path": "/srv/archive"},
            "credentials": {"access_key_id": "AKIDEXAMPLE", "secret_access_key": "secret"}
        })");
        std::string config_arg = "--config=" + (dir / "config.json").string();
        const char* args[] = {"snapbucket", config_arg.c_str(), "-s", "2g"};
        auto cfg = MigrateConfig::from_args(4, const_cast<char**>(args));
        fs::remove_all(dir);
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->store.bucket, "from-json", "bucket");
        ASSERT_EQ(cfg->store.type, "local", "store type");
        ASSERT_EQ(cfg->store.path.string(), "/srv/archive", "store path");
        ASSERT_EQ(cfg->volume_type, "io2", "type");
        ASSERT_EQ(cfg->iops.value_or(0), 20000, "iops");
        ASSERT_TRUE(cfg->gzip, "gzip");
        ASSERT_EQ(cfg->split_size, 2 * GiB, "later CLI flag wins");
        ASSERT_EQ(cfg->access_key_id, "AKIDEXAMPLE", "access key");
        ASSERT_EMPTY(cfg->validate(), "valid");
        PASS();
    }
    {
        TEST(json_missing_file);
        MigrateConfig cfg;
        ASSERT_TRUE(!cfg.load_json("/nonexistent/snapbucket.json"), "should fail");
        PASS();
    }
}

static void test_chunk_sizer() {
    std::cout << "\n=== ChunkSizer ===" << std::endl;

    {
        TEST(memory_minus_margin);
        ChunkSizer sizer(5 * GiB, 500 * MiB, [] { return 2 * GiB; });
        ASSERT_EQ(sizer.next(), 2 * GiB - 500 * MiB, "chunk");
        PASS();
    }
    {
        TEST(ceiling_caps_large_memory);
        ChunkSizer sizer(5 * GiB, 500 * MiB, [] { return 64 * GiB; });
        ASSERT_EQ(sizer.next(), 5 * GiB - 500 * MiB, "chunk");
        PASS();
    }
    {
        TEST(clamped_at_split_boundary);
        ChunkSizer sizer(5 * GiB, 500 * MiB, [] { return 2 * GiB; });
        ASSERT_EQ(sizer.next(10 * MiB - 3, 10 * MiB), 3ULL, "remaining bytes");
        ASSERT_EQ(sizer.next(0, 10 * MiB), 10 * MiB, "whole split");
        PASS();
    }
    {
        TEST(exhausted_memory_throws);
        ChunkSizer sizer = ChunkSizer::for_upload([] { return 400 * MiB; });
        bool thrown = false;
        try {
            sizer.next();
        } catch (const ResourceExhausted&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "ResourceExhausted expected");
        PASS();
    }
    {
        TEST(extraction_margin);
        ChunkSizer sizer = ChunkSizer::for_extraction([] { return 20 * MiB; });
        ASSERT_EQ(sizer.next(), 10 * MiB, "chunk");
        PASS();
    }
    {
        TEST(never_overshoots_split);
        // Memory swings between samples; the sum of chunks must land on
        // the split boundary exactly.
        uint64_t samples[] = {3 * MiB, 9 * MiB, 2 * MiB, 40 * MiB, 5 * MiB};
        size_t call = 0;
        ChunkSizer sizer(5 * GiB, MiB, [&] { return samples[call++ % 5]; });
        uint64_t split = 17 * MiB + 123;
        uint64_t in_split = 0;
        int reads = 0;
        while (in_split < split) {
            uint64_t n = sizer.next(in_split, split);
            ASSERT_TRUE(n > 0, "positive chunk");
            in_split += n;
            ASSERT_TRUE(in_split <= split, "overshoot");
            ++reads;
        }
        ASSERT_EQ(in_split, split, "ends on boundary");
        ASSERT_TRUE(reads > 1, "multiple reads");
        PASS();
    }
    {
        TEST(reports_gauges);
        MetricsExporter metrics("", std::chrono::seconds(60), {});
        ChunkSizer sizer(5 * GiB, MiB, [] { return 9 * MiB; });
        sizer.set_metrics(&metrics);
        sizer.next(0, 4 * MiB);
        ASSERT_EQ(metrics.available_memory().Value(), static_cast<double>(9 * MiB), "memory");
        ASSERT_EQ(metrics.chunk_size().Value(), static_cast<double>(4 * MiB), "clamped chunk");
        PASS();
    }
}

static void test_object_keys() {
    std::cout << "\n=== Object keys ===" << std::endl;

    auto snapshot = make_snapshot("snap-0123", "my disk/root");
    auto start = utc("2024-06-02T03:04:05Z");

    {
        TEST(single_key_layout);
        auto key = make_object_key(snapshot, start, false);
        ASSERT_EQ(key.single(),
                  "snap/my+disk_root/snap-0123-2024-05-01T12:00:00+00:00-2024-06-02T03:04:05.tar",
                  "single key");
        ASSERT_EQ(key.content_type(), "application/x-tar", "content type");
        PASS();
    }
    {
        TEST(part_key_layout);
        auto key = make_object_key(snapshot, start, true);
        ASSERT_EQ(key.part(3),
                  "snap/my+disk_root/snap-0123-2024-05-01T12:00:00+00:00-2024-06-02T03:04:05"
                  "-part3.tar.gz",
                  "part key");
        ASSERT_EQ(key.content_type(), "application/gzip", "content type");
        PASS();
    }
    {
        TEST(split_part_number);
        ASSERT_EQ(split_part_number("snap/a/x-part1.tar"), 1, "part1");
        ASSERT_EQ(split_part_number("snap/a/x-part12.tar.gz"), 12, "part12 gz");
        ASSERT_EQ(split_part_number("snap/a/x.tar"), 0, "single");
        ASSERT_EQ(split_part_number("snap/a/x-part.tar"), 0, "no digits");
        ASSERT_EQ(split_part_number("snap/a/x-part2.zip"), 0, "wrong extension");
        ASSERT_EQ(split_part_number("snap/a/xpart2.tar"), 0, "no dash");
        PASS();
    }
    {
        TEST(gzip_detection);
        ASSERT_TRUE(is_gzip_key("a/b.tar.gz"), "gz");
        ASSERT_TRUE(!is_gzip_key("a/b.tar"), "tar");
        PASS();
    }
}

static void test_devices_and_fstab() {
    std::cout << "\n=== Devices and fstab ===" << std::endl;

    const std::string lsblk = R"({"blockdevices": [
        {"name": "xvda", "serial": null, "mountpoint": null,
         "children": [{"name": "xvda1", "serial": null, "mountpoint": "/"}]},
        {"name": "nvme1n1", "serial": "vol0abc", "mountpoint": null,
         "children": [{"name": "nvme1n1p1", "serial": null, "mountpoint": "/mnt/other"},
                      {"name": "nvme1n1p2", "serial": null, "mountpoint": null}]},
        {"name": "nvme2n1", "serial": "vol0def", "mountpoint": null}
    ]})";

    {
        TEST(lsblk_parse);
        auto devices = parse_lsblk(lsblk);
        ASSERT_EQ(devices.size(), 3u, "device count");
        ASSERT_EQ(devices[1].serial, "vol0abc", "serial");
        ASSERT_EQ(devices[1].children.size(), 2u, "children");
        ASSERT_TRUE(devices[0].children[0].mountpoint.has_value(), "mounted child");
        ASSERT_TRUE(!devices[2].mountpoint.has_value(), "null mountpoint");
        PASS();
    }
    {
        TEST(device_resolution);
        auto devices = parse_lsblk(lsblk);
        ASSERT_EQ(volume_serial("vol-0abc"), "vol0abc", "serial");
        ASSERT_EQ(find_mountable_device(devices, "vol-0abc").value_or(""), "/dev/nvme1n1p2",
                  "first unmounted partition");
        ASSERT_EQ(find_mountable_device(devices, "vol-0def").value_or(""), "/dev/nvme2n1",
                  "unpartitioned disk");
        ASSERT_EQ(find_boot_device(devices, "vol-0abc").value_or(""), "/dev/nvme1n1",
                  "boot disk");
        ASSERT_TRUE(!find_mountable_device(devices, "vol-0fff").has_value(), "unknown volume");
        PASS();
    }
    {
        TEST(lsblk_malformed);
        bool thrown = false;
        try {
            parse_lsblk("{\"devices\": 3");
        } catch (const DeviceResolutionFailure&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "DeviceResolutionFailure expected");
        PASS();
    }
    {
        TEST(fstab_root_entry);
        auto entry = find_root_entry("# header\nUUID=abc-123 / ext4 defaults 0 1\n");
        ASSERT_TRUE(entry.has_value(), "entry");
        ASSERT_TRUE(entry->scheme == FstabEntry::Scheme::Uuid, "uuid scheme");
        ASSERT_EQ(entry->id, "abc-123", "id");
        ASSERT_EQ(entry->mount_point, "/", "mount point");
        ASSERT_EQ(entry->fs_type, "ext4", "fs type");

        auto label = find_root_entry("LABEL=cloudimg-rootfs\t/boot\text3\tdefaults\t0 2\n");
        ASSERT_TRUE(label.has_value(), "label entry");
        ASSERT_TRUE(label->scheme == FstabEntry::Scheme::Label, "label scheme");
        ASSERT_EQ(label->id, "cloudimg-rootfs", "label id");
        ASSERT_EQ(label->mount_point, "/boot", "boot");

        ASSERT_TRUE(!find_root_entry("UUID=abc /data xfs defaults 0 0\n").has_value(),
                    "xfs data volume ignored");
        ASSERT_TRUE(!find_root_entry("/dev/xvda1 / ext4 defaults 0 1\n").has_value(),
                    "device path ignored");
        PASS();
    }
    {
        TEST(blkid_uuid);
        auto uuid = parse_blkid_uuid("DEVNAME=/dev/xvdk1\nUUID=def-456\nTYPE=ext4\n");
        ASSERT_EQ(uuid.value_or(""), "def-456", "uuid");
        ASSERT_TRUE(!parse_blkid_uuid("TYPE=ext4\n").has_value(), "missing");
        PASS();
    }
    {
        TEST(fix_fstab_uuid);
        FakeVolumeControl control;
        FakeDeviceOps ops(control);
        auto root = make_temp_dir("snapbucket-fstab");
        write_file(root / "etc" / "fstab",
                   "# comment\nUUID=abc-123 / ext4 defaults 0 1\nproc /proc proc defaults 0 0\n");
        fix_fstab(ops, root, "/dev/xvdk1", std::chrono::milliseconds(0));
        auto content = read_file(root / "etc" / "fstab");
        fs::remove_all(root);
        ASSERT_EQ(content,
                  "# comment\nUUID=def-456 / ext4 defaults 0 1\nproc /proc proc defaults 0 0\n",
                  "rewritten fstab");
        PASS();
    }
    {
        TEST(fix_fstab_label);
        FakeVolumeControl control;
        FakeDeviceOps ops(control);
        auto root = make_temp_dir("snapbucket-fstab");
        write_file(root / "etc" / "fstab", "LABEL=cloudimg-rootfs / ext4 defaults 0 1\n");
        fix_fstab(ops, root, "/dev/xvdk1", std::chrono::milliseconds(0));
        auto content = read_file(root / "etc" / "fstab");
        fs::remove_all(root);
        ASSERT_EQ(ops.labels["/dev/xvdk1"], "cloudimg-rootfs", "label written");
        ASSERT_EQ(content, "LABEL=cloudimg-rootfs / ext4 defaults 0 1\n", "fstab untouched");
        PASS();
    }
    {
        TEST(fix_fstab_label_not_applied);
        FakeVolumeControl control;
        FakeDeviceOps ops(control);
        ops.label_sticks = false;
        auto root = make_temp_dir("snapbucket-fstab");
        write_file(root / "etc" / "fstab", "LABEL=rootfs / ext4 defaults 0 1\n");
        bool thrown = false;
        try {
            fix_fstab(ops, root, "/dev/xvdk1", std::chrono::milliseconds(0));
        } catch (const DeviceResolutionFailure&) {
            thrown = true;
        }
        fs::remove_all(root);
        ASSERT_TRUE(thrown, "DeviceResolutionFailure expected");
        PASS();
    }
    {
        TEST(fix_fstab_without_root_entry);
        FakeVolumeControl control;
        FakeDeviceOps ops(control);
        auto root = make_temp_dir("snapbucket-fstab");
        write_file(root / "etc" / "fstab", "/dev/xvda1 / ext4 defaults 0 1\n");
        bool thrown = false;
        try {
            fix_fstab(ops, root, "/dev/xvdk1", std::chrono::milliseconds(0));
        } catch (const DeviceResolutionFailure&) {
            thrown = true;
        }
        fs::remove_all(root);
        ASSERT_TRUE(thrown, "DeviceResolutionFailure expected");
        PASS();
    }
}

static void test_multipart_session() {
    std::cout << "\n=== MultipartSession ===" << std::endl;

    auto root = make_temp_dir("snapbucket-store");
    auto uploads_dir = root / ".snapbucket" / "uploads";
    auto payload = make_payload(64 * KiB, 3);
    std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(payload.data()),
                                   payload.size());

    {
        TEST(complete_is_idempotent);
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        MultipartSession session(store, "snap/a/one.tar", {}, no_delay_retries(0));
        ASSERT_EQ(session.upload_part(bytes), 1, "first part number");
        ASSERT_EQ(session.upload_part(bytes), 2, "second part number");
        std::string first = session.complete().etag;
        std::string second = session.complete().etag;
        ASSERT_NOT_EMPTY(first, "etag");
        ASSERT_EQ(first, second, "same etag");
        ASSERT_EQ(store.complete_calls, 1, "store completed once");
        ASSERT_TRUE(session.state() == MultipartSession::State::Completed, "completed");
        auto entries = list_all(store, "snap/a/");
        ASSERT_EQ(entries.size(), 1u, "one object");
        ASSERT_EQ(entries[0].size, 2 * payload.size(), "object size");
        ASSERT_EQ(read_file(root / "snap/a/one.tar"), payload + payload, "object bytes");
        PASS();
    }
    {
        TEST(transient_failures_retried);
        MetricsExporter metrics("", std::chrono::seconds(60), {});
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        store.fail_parts = 2;
        MultipartSession session(store, "snap/b/one.tar", {}, no_delay_retries(4), &metrics);
        session.upload_part(bytes);
        session.complete();
        ASSERT_EQ(store.part_calls, 3, "two failures then success");
        ASSERT_EQ(metrics.part_retries().Value(), 2.0, "retries counted");
        ASSERT_EQ(metrics.parts_uploaded().Value(), 1.0, "one part");
        ASSERT_EQ(metrics.objects_completed().Value(), 1.0, "one object");
        PASS();
    }
    {
        TEST(retry_exhaustion_aborts);
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        store.fail_parts = -1;
        bool thrown = false;
        {
            MultipartSession session(store, "snap/c/one.tar", {}, no_delay_retries(2));
            try {
                session.upload_part(bytes);
            } catch (const PartUploadFailed&) {
                thrown = true;
            }
            ASSERT_TRUE(session.state() == MultipartSession::State::Aborted, "aborted");
        }
        ASSERT_TRUE(thrown, "PartUploadFailed expected");
        ASSERT_EQ(store.part_calls, 3, "first attempt plus two retries");
        ASSERT_EQ(store.abort_calls, 1, "aborted once");
        ASSERT_TRUE(list_all(store, "snap/c/").empty(), "no object");
        ASSERT_EQ(count_entries(uploads_dir), 0u, "no pending upload");
        PASS();
    }
    {
        TEST(fatal_failure_not_retried);
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        store.fail_parts = 1;
        store.fail_retryable = false;
        MultipartSession session(store, "snap/d/one.tar", {}, no_delay_retries(4));
        bool thrown = false;
        try {
            session.upload_part(bytes);
        } catch (const PartUploadFailed&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "PartUploadFailed expected");
        ASSERT_EQ(store.part_calls, 1, "no retry");
        PASS();
    }
    {
        TEST(complete_after_abort_fails);
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        MultipartSession session(store, "snap/e/one.tar", {}, no_delay_retries(0));
        session.upload_part(bytes);
        session.abort();
        session.abort();
        bool thrown = false;
        try {
            session.complete();
        } catch (const CompleteFailed&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "CompleteFailed expected");
        ASSERT_EQ(store.complete_calls, 0, "store not asked");
        ASSERT_TRUE(list_all(store, "snap/e/").empty(), "no object");
        PASS();
    }
    {
        TEST(open_session_aborted_on_destruction);
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        {
            MultipartSession session(store, "snap/f/one.tar", {}, no_delay_retries(0));
            session.upload_part(bytes);
        }
        ASSERT_EQ(store.abort_calls, 1, "abort on destruction");
        ASSERT_TRUE(list_all(store, "snap/f/").empty(), "no object");
        ASSERT_EQ(count_entries(uploads_dir), 0u, "no pending upload");
        PASS();
    }
    {
        TEST(metadata_stored);
        auto store = ObjectStoreFactory::create_local(root);
        MultipartOptions options;
        options.content_type = "application/x-tar";
        options.metadata["disc-size"] = "12345";
        MultipartSession session(*store, "snap/g/one.tar", options, no_delay_retries(0));
        session.upload_part(bytes);
        session.complete();
        auto meta = store->head("snap/g/one.tar");
        ASSERT_TRUE(meta.has_value(), "head");
        ASSERT_EQ(meta->size, static_cast<uint64_t>(payload.size()), "size");
        ASSERT_EQ(meta->user_metadata["disc-size"], "12345", "user metadata");
        ASSERT_TRUE(!store->head("snap/g/missing.tar").has_value(), "missing key");
        PASS();
    }

    fs::remove_all(root);
}

static void test_split_uploader() {
    std::cout << "\n=== SplitUploader ===" << std::endl;

    auto snapshot = make_snapshot("snap-42", "web root");
    auto start = utc("2024-06-02T03:04:05Z");
    auto sizer = fixed_sizer(4 * MiB);

    UploadOptions options;
    options.split_size = 10 * MiB;
    options.retry = no_delay_retries(0);

    {
        TEST(splits_on_byte_boundaries);
        auto root = make_temp_dir("snapbucket-split");
        auto store = ObjectStoreFactory::create_local(root);
        auto payload = make_payload(25 * MiB, 1);
        MemorySource source(payload);
        SplitUploader uploader(*store, sizer, options);
        auto summary = uploader.upload(snapshot, source, 25 * MiB, start);

        ASSERT_TRUE(source.finished, "source finished");
        ASSERT_EQ(summary.objects.size(), 3u, "three objects");
        ASSERT_EQ(summary.total_bytes, 25 * MiB, "total bytes");
        auto key = make_object_key(snapshot, start, false);
        std::string joined;
        for (int i = 0; i < 3; ++i) {
            ASSERT_EQ(summary.objects[i].key, key.part(i + 1), "part key");
            joined += read_file(root / summary.objects[i].key);
        }
        ASSERT_EQ(summary.objects[0].size, 10 * MiB, "part1 size");
        ASSERT_EQ(summary.objects[1].size, 10 * MiB, "part2 size");
        ASSERT_EQ(summary.objects[2].size, 5 * MiB, "part3 size");
        ASSERT_TRUE(joined == payload, "concatenated parts equal the stream");

        auto meta = store->head(key.part(2));
        ASSERT_TRUE(meta.has_value(), "head part2");
        ASSERT_EQ(meta->user_metadata["disc-size"], std::to_string(25 * MiB), "disc-size");
        ASSERT_EQ(meta->user_metadata["snap-volume-size"], "8 GiB", "volume size");
        ASSERT_EQ(meta->user_metadata["creation-time"], "2024-05-01T12:00:00+00:00",
                  "creation time");
        ASSERT_EQ(list_all(*store, "snap/").size(), 3u, "three listed");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(exact_multiple_has_no_empty_tail);
        auto root = make_temp_dir("snapbucket-split");
        auto store = ObjectStoreFactory::create_local(root);
        MemorySource source(make_payload(20 * MiB, 2));
        SplitUploader uploader(*store, sizer, options);
        auto summary = uploader.upload(snapshot, source, 20 * MiB + 1, start);
        ASSERT_EQ(summary.objects.size(), 2u, "two objects");
        ASSERT_EQ(summary.objects[1].size, 10 * MiB, "full last part");
        ASSERT_EQ(list_all(*store, "snap/").size(), 2u, "two listed");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(estimate_at_split_is_single_object);
        auto root = make_temp_dir("snapbucket-split");
        auto store = ObjectStoreFactory::create_local(root);
        MemorySource source(make_payload(7 * MiB, 3));
        SplitUploader uploader(*store, sizer, options);
        auto summary = uploader.upload(snapshot, source, 10 * MiB, start);
        ASSERT_EQ(summary.objects.size(), 1u, "one object");
        ASSERT_EQ(summary.objects[0].key, make_object_key(snapshot, start, false).single(),
                  "single key");
        ASSERT_EQ(summary.objects[0].parts, 2, "two parts of 4 MiB and 3 MiB");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(underestimate_stays_single);
        auto root = make_temp_dir("snapbucket-split");
        auto store = ObjectStoreFactory::create_local(root);
        MemorySource source(make_payload(13 * MiB, 4));
        SplitUploader uploader(*store, sizer, options);
        auto summary = uploader.upload(snapshot, source, 2 * MiB, start);
        ASSERT_EQ(summary.objects.size(), 1u, "one object");
        ASSERT_EQ(summary.objects[0].size, 13 * MiB, "whole stream");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(gzip_key_suffix);
        auto root = make_temp_dir("snapbucket-split");
        auto store = ObjectStoreFactory::create_local(root);
        MemorySource source(make_payload(MiB, 5));
        UploadOptions gz = options;
        gz.gzip = true;
        SplitUploader uploader(*store, sizer, gz);
        auto summary = uploader.upload(snapshot, source, MiB, start);
        ASSERT_EQ(summary.objects.size(), 1u, "one object");
        ASSERT_TRUE(is_gzip_key(summary.objects[0].key), "gzip suffix");
        auto meta = store->head(summary.objects[0].key);
        ASSERT_TRUE(meta.has_value(), "head");
        ASSERT_EQ(meta->content_type, "application/gzip", "content type");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(empty_stream_fails);
        auto root = make_temp_dir("snapbucket-split");
        auto store = ObjectStoreFactory::create_local(root);
        MemorySource source("");
        SplitUploader uploader(*store, sizer, options);
        bool thrown = false;
        try {
            uploader.upload(snapshot, source, 0, start);
        } catch (const SourceFailure&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "SourceFailure expected");
        ASSERT_TRUE(list_all(*store, "snap/").empty(), "no object");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(failing_archiver_leaves_no_object);
        auto root = make_temp_dir("snapbucket-split");
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        MemorySource source(make_payload(6 * MiB, 6), true);
        SplitUploader uploader(store, sizer, options);
        bool thrown = false;
        try {
            uploader.upload(snapshot, source, 6 * MiB, start);
        } catch (const SourceFailure&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "SourceFailure expected");
        ASSERT_EQ(store.complete_calls, 0, "never completed");
        ASSERT_EQ(store.abort_calls, 1, "session aborted");
        ASSERT_TRUE(list_all(store, "snap/").empty(), "no object");
        ASSERT_EQ(count_entries(root / ".snapbucket" / "uploads"), 0u, "no pending upload");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(failed_part_aborts_current_object);
        auto root = make_temp_dir("snapbucket-split");
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));
        MemorySource source(make_payload(25 * MiB, 8));
        SplitUploader uploader(store, sizer, options);
        // Objects 1 and 2 complete, then every part of object 3 is refused
        struct Trigger : ByteSource {
            MemorySource& inner;
            FlakyObjectStore& store;
            int reads_left = 6;
            Trigger(MemorySource& i, FlakyObjectStore& s) : inner(i), store(s) {}
            size_t read(uint8_t* buf, size_t n) override {
                if (reads_left-- == 0) store.fail_parts = -1;
                return inner.read(buf, n);
            }
            void finish() override { inner.finish(); }
        } trigger(source, store);
        bool thrown = false;
        try {
            uploader.upload(snapshot, trigger, 25 * MiB, start);
        } catch (const PartUploadFailed&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "PartUploadFailed expected");
        auto entries = list_all(store, "snap/");
        ASSERT_EQ(entries.size(), 2u, "completed objects stay");
        ASSERT_EQ(count_entries(root / ".snapbucket" / "uploads"), 0u, "no pending upload");
        fs::remove_all(root);
        PASS();
    }
}

static void test_archive_round_trip() {
    std::cout << "\n=== Archive round trip ===" << std::endl;

    auto snapshot = make_snapshot("snap-77", "db");
    auto start = utc("2024-06-02T03:04:05Z");

    for (bool gzip : {false, true}) {
        TEST(split_archive_restores_tree);
        auto src = make_temp_dir("snapbucket-src");
        auto dst = make_temp_dir("snapbucket-dst");
        auto scratch = make_temp_dir("snapbucket-scratch");
        auto root = make_temp_dir("snapbucket-store");
        populate_tree(src);

        auto store = ObjectStoreFactory::create_local(root);
        auto sizer = fixed_sizer(32 * KiB);
        UploadOptions options;
        options.split_size = 100 * KiB;
        options.gzip = gzip;
        options.retry = no_delay_retries(0);

        auto source = ArchiveSource::open(src, gzip);
        SplitUploader uploader(*store, sizer, options);
        auto summary = uploader.upload(snapshot, *source, 400 * KiB, start);
        ASSERT_TRUE(summary.objects.size() >= 2, "archive split");
        ASSERT_EQ(summary.total_bytes, source->bytes_read(), "all bytes stored");

        auto prefix = make_object_key(snapshot, start, gzip).base;
        auto plan = plan_restore(*store, prefix);
        ASSERT_EQ(plan.keys.size(), summary.objects.size(), "plan covers every object");
        ASSERT_EQ(plan.gzip, gzip, "compression detected");
        ASSERT_EQ(plan.size_bytes, 400 * KiB, "size from disc-size");

        auto sink = ArchiveExtractor::open(dst, plan.gzip);
        PartDownloader downloader(*store, scratch, sizer);
        uint64_t restored = downloader.restore(plan, *sink);
        sink->finish();
        ASSERT_EQ(restored, summary.total_bytes, "bytes fed to extractor");

        auto diff = compare_trees(src, dst);
        ASSERT_EMPTY(diff, "restored tree");
        ASSERT_EQ(count_entries(scratch / "snap" / "db"), 0u, "scratch files removed");

        fs::remove_all(src);
        fs::remove_all(dst);
        fs::remove_all(scratch);
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(archiver_failure_detected);
        auto root = make_temp_dir("snapbucket-store");
        auto store = ObjectStoreFactory::create_local(root);
        auto sizer = fixed_sizer(32 * KiB);
        UploadOptions options;
        options.retry = no_delay_retries(0);
        auto source = ArchiveSource::open(root / "does-not-exist", false);
        SplitUploader uploader(*store, sizer, options);
        bool thrown = false;
        try {
            uploader.upload(snapshot, *source, 0, start);
        } catch (const SourceFailure&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "SourceFailure expected");
        ASSERT_TRUE(list_all(*store, "snap/").empty(), "no object");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(extractor_rejects_garbage);
        auto dst = make_temp_dir("snapbucket-dst");
        std::string garbage(256 * KiB, 'x');
        bool thrown = false;
        try {
            auto sink = ArchiveExtractor::open(dst, false);
            sink->write({reinterpret_cast<const uint8_t*>(garbage.data()), garbage.size()});
            sink->finish();
        } catch (const TransferCorruption&) {
            thrown = true;
        }
        fs::remove_all(dst);
        ASSERT_TRUE(thrown, "TransferCorruption expected");
        PASS();
    }
    {
        TEST(plan_rejects_gaps_and_mixed_sets);
        auto root = make_temp_dir("snapbucket-store");
        auto store = ObjectStoreFactory::create_local(root);
        auto put = [&](const std::string& key) {
            MultipartSession session(*store, key, {}, no_delay_retries(0));
            std::string data = "x";
            session.upload_part({reinterpret_cast<const uint8_t*>(data.data()), data.size()});
            session.complete();
        };
        put("snap/a/u1-part1.tar");
        put("snap/a/u1-part3.tar");
        put("snap/b/u2.tar");
        put("snap/b/u2-part1.tar");

        bool gap = false;
        try {
            plan_restore(*store, "snap/a/u1");
        } catch (const StorageError&) {
            gap = true;
        }
        bool mixed = false;
        try {
            plan_restore(*store, "snap/b/u2");
        } catch (const StorageError&) {
            mixed = true;
        }
        bool missing = false;
        try {
            plan_restore(*store, "snap/c/");
        } catch (const StorageError&) {
            missing = true;
        }
        auto single = plan_restore(*store, "snap/b/u2-part1");
        fs::remove_all(root);
        ASSERT_TRUE(gap, "missing part detected");
        ASSERT_TRUE(mixed, "single and split objects under one prefix rejected");
        ASSERT_TRUE(missing, "empty prefix rejected");
        ASSERT_EQ(single.keys.size(), 1u, "single object plan");
        ASSERT_EQ(single.size_bytes, 1u, "size from listing");
        PASS();
    }
}

static void test_volume_lifecycle() {
    std::cout << "\n=== VolumeLifecycle ===" << std::endl;

    {
        TEST(restore_volume_size);
        ASSERT_EQ(restore_volume_size_gib(0), 1, "empty");
        ASSERT_EQ(restore_volume_size_gib(1), 1, "one byte");
        ASSERT_EQ(restore_volume_size_gib(4 * GiB), 5, "4 GiB");
        ASSERT_EQ(restore_volume_size_gib(10 * GiB), 13, "10 GiB rounds up");
        ASSERT_EQ(restore_volume_size_gib(10 * GiB + 1), 14, "partial GiB counts");
        PASS();
    }
    {
        TEST(create_tags_volume);
        FakeVolumeControl control;
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        auto id = lifecycle.create_from_snapshot(make_snapshot("snap-9", "x"));
        ASSERT_EQ(control.requests.size(), 1u, "one request");
        const auto& request = control.requests[0];
        ASSERT_EQ(request.snapshot_id, "snap-9", "snapshot");
        ASSERT_EQ(request.availability_zone, "eu-west-1a", "zone");
        ASSERT_EQ(request.tags.at("snap-to-bucket"), "created", "tool tag");
        ASSERT_EQ(request.tags.at("Name"), "snap-to-bucket-snap-9", "name tag");
        ASSERT_TRUE(control.volumes.at(id).state == VolumeState::Available, "available");
        PASS();
    }
    {
        TEST(create_empty_names_volume);
        FakeVolumeControl control;
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        auto now = utc("2024-06-02T03:04:05Z") + std::chrono::microseconds(42);
        lifecycle.create_empty(3 * GiB, now);
        const auto& request = control.requests[0];
        ASSERT_EQ(request.size_gib, 4, "size with headroom");
        ASSERT_EQ(request.tags.at("snap-to-bucket"), "restore-volume", "tool tag");
        ASSERT_EQ(request.tags.at("Name"), "snap-to-bucket-2024-06-02_03-04-05-000042",
                  "name tag");
        PASS();
    }
    {
        TEST(create_timeout_deletes_volume);
        MetricsExporter metrics("", std::chrono::seconds(60), {});
        FakeVolumeControl control;
        control.stuck_creating = true;
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls(), &metrics);
        bool thrown = false;
        try {
            lifecycle.create_from_snapshot(make_snapshot("snap-9", "x"));
        } catch (const ResourceTimeout&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "ResourceTimeout expected");
        ASSERT_TRUE(control.volumes.empty(), "volume deleted");
        ASSERT_EQ(metrics.volumes_compensated().Value(), 1.0, "compensation counted");
        PASS();
    }
    {
        TEST(attach_failure_deletes_volume);
        FakeVolumeControl control;
        control.fail_attach = true;
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        auto id = lifecycle.create_from_snapshot(make_snapshot("snap-9", "x"));
        bool thrown = false;
        try {
            lifecycle.attach(id);
        } catch (const ControlPlaneError&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "ControlPlaneError expected");
        ASSERT_TRUE(control.volumes.empty(), "volume deleted");
        PASS();
    }
    {
        TEST(attach_uses_instance_and_device);
        FakeVolumeControl control;
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        auto id = lifecycle.create_from_snapshot(make_snapshot("snap-9", "x"));
        lifecycle.attach(id);
        const auto& volume = control.volumes.at(id);
        ASSERT_TRUE(volume.state == VolumeState::InUse, "in use");
        ASSERT_EQ(volume.instance_id, "i-0123456789", "instance");
        ASSERT_EQ(volume.device, "/dev/sdk", "device");
        lifecycle.compensate(id);
        ASSERT_TRUE(control.volumes.empty(), "compensate detaches and deletes");
        ASSERT_EQ(join(control.calls), "create,attach,detach-force,delete", "call order");
        PASS();
    }
}

static void test_migration() {
    std::cout << "\n=== MigrationOrchestrator ===" << std::endl;

    auto make_control = [] {
        FakeVolumeControl control;
        auto a = make_snapshot("snap-a", "alpha");
        auto b = make_snapshot("snap-b", "beta");
        auto c = make_snapshot("snap-c", "gamma");
        control.snapshots.push_back({a, {{"snap-to-bucket", "migrate"}}});
        control.snapshots.push_back({b, {{"snap-to-bucket", "migrate"}}});
        control.snapshots.push_back({c, {{"snap-to-bucket", "transferred"}}});
        return control;
    };

    {
        TEST(migrates_tagged_snapshots);
        MetricsExporter metrics("", std::chrono::seconds(60), {});
        auto control = make_control();
        FakeDeviceOps devices(control);
        auto mount = make_temp_dir("snapbucket-mnt");
        auto root = make_temp_dir("snapbucket-store");
        populate_tree(mount);
        auto store = ObjectStoreFactory::create_local(root);

        VolumeLifecycle lifecycle(control, test_settings(), instant_polls(), &metrics);
        MigrationOptions options;
        options.mount_point = mount;
        options.upload.retry = no_delay_retries(0);
        MigrationOrchestrator orchestrator(lifecycle, control, devices, *store, options, &metrics);
        orchestrator.set_chunk_sizer(fixed_sizer(64 * KiB));

        size_t done = orchestrator.run();
        ASSERT_EQ(done, 2u, "two snapshots");
        ASSERT_EQ(list_all(*store, "snap/alpha/").size(), 1u, "alpha archived");
        ASSERT_EQ(list_all(*store, "snap/beta/").size(), 1u, "beta archived");
        ASSERT_TRUE(list_all(*store, "snap/gamma/").empty(), "gamma skipped");
        ASSERT_TRUE(control.volumes.empty(), "no volume left behind");
        ASSERT_EQ(control.snapshots[0].tags["snap-to-bucket"], "transferred", "alpha tagged");
        ASSERT_EQ(control.snapshots[1].tags["snap-to-bucket"], "transferred", "beta tagged");
        ASSERT_EQ(metrics.migrations_success().Value(), 2.0, "success counted");

        std::vector<std::string> first_unit(control.calls.begin() + 1, control.calls.begin() + 8);
        ASSERT_EQ(join(first_unit),
                  "create,attach,mount /dev/xvdk1," + std::string("umount ") +
                      mount.filename().string() + ",detach-force,delete,tag",
                  "unit order");
        fs::remove_all(mount);
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(delete_snapshot_option);
        auto control = make_control();
        FakeDeviceOps devices(control);
        auto mount = make_temp_dir("snapbucket-mnt");
        auto root = make_temp_dir("snapbucket-store");
        populate_tree(mount);
        auto store = ObjectStoreFactory::create_local(root);

        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        MigrationOptions options;
        options.mount_point = mount;
        options.delete_snapshot = true;
        options.upload.retry = no_delay_retries(0);
        MigrationOrchestrator orchestrator(lifecycle, control, devices, *store, options);
        orchestrator.set_chunk_sizer(fixed_sizer(64 * KiB));

        orchestrator.run();
        ASSERT_EQ(join(control.deleted_snapshots), "snap-a,snap-b", "snapshots deleted");
        ASSERT_EQ(control.snapshots[0].tags["snap-to-bucket"], "migrate", "not retagged");
        fs::remove_all(mount);
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(failure_mid_unit_cleans_up);
        MetricsExporter metrics("", std::chrono::seconds(60), {});
        auto control = make_control();
        FakeDeviceOps devices(control);
        auto mount = make_temp_dir("snapbucket-mnt");
        auto root = make_temp_dir("snapbucket-store");
        FlakyObjectStore store(ObjectStoreFactory::create_local(root));

        VolumeLifecycle lifecycle(control, test_settings(), instant_polls(), &metrics);
        MigrationOptions options;
        options.mount_point = mount;
        options.upload.retry = no_delay_retries(0);
        MigrationOrchestrator orchestrator(lifecycle, control, devices, store, options, &metrics);
        orchestrator.set_chunk_sizer(fixed_sizer(64 * KiB));
        orchestrator.set_source_factory([](const fs::path&, bool) {
            return std::unique_ptr<ByteSource>(new MemorySource(make_payload(300 * KiB, 9), true));
        });

        bool thrown = false;
        try {
            orchestrator.run();
        } catch (const SourceFailure&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "SourceFailure expected");
        ASSERT_TRUE(control.volumes.empty(), "volume detached and deleted");
        ASSERT_TRUE(list_all(store, "snap/").empty(), "no object");
        ASSERT_EQ(store.abort_calls, 1, "session aborted");
        ASSERT_EQ(control.snapshots[0].tags["snap-to-bucket"], "migrate", "snapshot untouched");
        ASSERT_EQ(control.requests.size(), 1u, "stopped after the failing unit");
        auto calls = join(control.calls);
        ASSERT_TRUE(contains(calls, "umount"), "unmounted: " + calls);
        ASSERT_TRUE(contains(calls, "detach-force,delete"), "detached then deleted: " + calls);
        ASSERT_TRUE(!contains(calls + ",", ",tag,"), "no tag: " + calls);
        ASSERT_EQ(metrics.migrations_failure().Value(), 1.0, "failure counted");
        fs::remove_all(mount);
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(unresolvable_device_cleans_up);
        auto control = make_control();
        control.snapshots.resize(1);
        auto root = make_temp_dir("snapbucket-store");
        auto store = ObjectStoreFactory::create_local(root);

        // The attached volume never shows up as a block device
        struct VanishingDevices : FakeDeviceOps {
            using FakeDeviceOps::FakeDeviceOps;
            std::vector<BlockDevice> list_block_devices() override { return {}; }
        } vanishing(control);

        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        MigrationOptions options;
        options.upload.retry = no_delay_retries(0);
        MigrationOrchestrator orchestrator(lifecycle, control, vanishing, *store, options);
        orchestrator.set_chunk_sizer(fixed_sizer(64 * KiB));

        bool thrown = false;
        try {
            orchestrator.run();
        } catch (const DeviceResolutionFailure&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "DeviceResolutionFailure expected");
        ASSERT_TRUE(control.volumes.empty(), "volume deleted");
        ASSERT_TRUE(!contains(join(control.calls), "umount "), "nothing to unmount");
        fs::remove_all(root);
        PASS();
    }
}

static void test_restore() {
    std::cout << "\n=== RestoreSequencer ===" << std::endl;

    auto snapshot = make_snapshot("snap-r", "root disk");
    auto start = utc("2024-06-02T03:04:05Z");

    // Archive a tree into a fresh store, split into several objects
    auto seed_store = [&](const fs::path& root, const fs::path& tree) {
        auto store = ObjectStoreFactory::create_local(root);
        auto sizer = fixed_sizer(32 * KiB);
        UploadOptions options;
        options.split_size = 100 * KiB;
        options.retry = no_delay_retries(0);
        auto source = ArchiveSource::open(tree, false);
        SplitUploader uploader(*store, sizer, options);
        uploader.upload(snapshot, *source, 3 * GiB, start);
        return store;
    };

    {
        TEST(boot_restore);
        MetricsExporter metrics("", std::chrono::seconds(60), {});
        auto tree = make_temp_dir("snapbucket-tree");
        auto root = make_temp_dir("snapbucket-store");
        auto mount = make_temp_dir("snapbucket-mnt");
        auto scratch = make_temp_dir("snapbucket-scratch");
        populate_tree(tree);
        auto store = seed_store(root, tree);

        FakeVolumeControl control;
        FakeDeviceOps devices(control);
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls(), &metrics);
        RestoreOptions options;
        options.key = make_object_key(snapshot, start, false).base;
        options.mount_point = mount;
        options.restore_dir = scratch;
        options.boot = true;
        options.label_settle = std::chrono::milliseconds(0);
        RestoreSequencer sequencer(lifecycle, devices, *store, options, &metrics);
        sequencer.set_chunk_sizer(fixed_sizer(32 * KiB));

        auto volume_id = sequencer.run();
        ASSERT_EQ(control.volumes.size(), 1u, "volume kept");
        ASSERT_TRUE(control.volumes.at(volume_id).state == VolumeState::Available,
                    "volume detached");
        ASSERT_EQ(control.requests[0].size_gib, 4, "sized from disc-size");
        ASSERT_TRUE(control.requests[0].snapshot_id.empty(), "blank volume");

        // fstab is expected to differ, everything else must match
        auto fstab = read_file(mount / "etc" / "fstab");
        ASSERT_TRUE(contains(fstab, "UUID=def-456 / ext4 defaults 0 1"), "fstab rewritten");
        ASSERT_TRUE(contains(fstab, "proc /proc proc defaults 0 0"), "other lines kept");
        write_file(tree / "etc" / "fstab", fstab);
        auto diff = compare_trees(tree, mount);
        ASSERT_EMPTY(diff, "restored tree");

        ASSERT_EQ(devices.in_root.size(), 2u, "two commands in changed root");
        ASSERT_EQ(join(devices.in_root[0], " "), "grub-install /dev/xvdk", "grub on disk");
        ASSERT_EQ(join(devices.in_root[1], " "), "update-grub", "grub config");

        std::string m = mount.filename().string();
        std::vector<std::string> expected = {
            "create", "attach", "partition /dev/xvdk boot", "mkfs /dev/xvdk1",
            "mount /dev/xvdk1", "bind /sys", "bind /proc", "bind /run", "bind /dev",
            "chroot grub-install /dev/xvdk", "chroot update-grub",
            "umount dev", "umount run", "umount proc", "umount sys", "umount " + m,
            "detach-force",
        };
        ASSERT_EQ(join(control.calls), join(expected), "restore order");
        ASSERT_EQ(metrics.restores_success().Value(), 1.0, "success counted");
        ASSERT_TRUE(metrics.restore_bytes().Value() > 0, "bytes counted");

        fs::remove_all(tree);
        fs::remove_all(root);
        fs::remove_all(mount);
        fs::remove_all(scratch);
        PASS();
    }
    {
        TEST(data_restore_without_boot);
        auto tree = make_temp_dir("snapbucket-tree");
        auto root = make_temp_dir("snapbucket-store");
        auto mount = make_temp_dir("snapbucket-mnt");
        auto scratch = make_temp_dir("snapbucket-scratch");
        populate_tree(tree);
        auto store = seed_store(root, tree);

        FakeVolumeControl control;
        FakeDeviceOps devices(control);
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        RestoreOptions options;
        options.key = make_object_key(snapshot, start, false).base;
        options.mount_point = mount;
        options.restore_dir = scratch;
        RestoreSequencer sequencer(lifecycle, devices, *store, options);
        sequencer.set_chunk_sizer(fixed_sizer(32 * KiB));
        sequencer.run();

        ASSERT_EMPTY(compare_trees(tree, mount), "restored tree");
        auto calls = join(control.calls);
        ASSERT_TRUE(contains(calls, "partition /dev/xvdk,"), "not bootable: " + calls);
        ASSERT_TRUE(!contains(calls, "bind /") && !contains(calls, "chroot "), "no boot loader");
        ASSERT_EQ(read_file(mount / "etc" / "fstab"), read_file(tree / "etc" / "fstab"),
                  "fstab untouched");

        fs::remove_all(tree);
        fs::remove_all(root);
        fs::remove_all(mount);
        fs::remove_all(scratch);
        PASS();
    }
    {
        TEST(extraction_failure_deletes_volume);
        MetricsExporter metrics("", std::chrono::seconds(60), {});
        auto tree = make_temp_dir("snapbucket-tree");
        auto root = make_temp_dir("snapbucket-store");
        auto mount = make_temp_dir("snapbucket-mnt");
        auto scratch = make_temp_dir("snapbucket-scratch");
        populate_tree(tree);
        auto store = seed_store(root, tree);

        FakeVolumeControl control;
        FakeDeviceOps devices(control);
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        RestoreOptions options;
        options.key = make_object_key(snapshot, start, false).base;
        options.mount_point = mount;
        options.restore_dir = scratch;
        RestoreSequencer sequencer(lifecycle, devices, *store, options, &metrics);
        sequencer.set_chunk_sizer(fixed_sizer(32 * KiB));
        sequencer.set_sink_factory([](const fs::path&, bool) {
            return std::unique_ptr<ByteSink>(new BrokenSink());
        });

        bool thrown = false;
        try {
            sequencer.run();
        } catch (const TransferCorruption&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "TransferCorruption expected");
        ASSERT_TRUE(control.volumes.empty(), "volume deleted");
        auto calls = join(control.calls);
        ASSERT_TRUE(contains(calls, "umount " + mount.filename().string() +
                                        ",detach-force,delete"),
                    "unmount, detach, delete: " + calls);
        ASSERT_EQ(count_entries(scratch / "snap"), 1u, "only the name directory remains");
        ASSERT_EQ(metrics.restores_failure().Value(), 1.0, "failure counted");

        fs::remove_all(tree);
        fs::remove_all(root);
        fs::remove_all(mount);
        fs::remove_all(scratch);
        PASS();
    }
    {
        TEST(unknown_key_creates_nothing);
        auto root = make_temp_dir("snapbucket-store");
        auto store = ObjectStoreFactory::create_local(root);
        FakeVolumeControl control;
        FakeDeviceOps devices(control);
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        auto scratch = make_temp_dir("snapbucket-scratch");
        RestoreOptions options;
        options.key = "snap/nothing/here";
        options.restore_dir = scratch;
        RestoreSequencer sequencer(lifecycle, devices, *store, options);
        bool thrown = false;
        try {
            sequencer.run();
        } catch (const StorageError&) {
            thrown = true;
        }
        fs::remove_all(root);
        fs::remove_all(scratch);
        ASSERT_TRUE(thrown, "StorageError expected");
        ASSERT_TRUE(control.requests.empty(), "no volume created");
        PASS();
    }
    {
        TEST(unusable_restore_dir_creates_nothing);
        auto tree = make_temp_dir("snapbucket-tree");
        auto root = make_temp_dir("snapbucket-store");
        auto scratch = make_temp_dir("snapbucket-scratch");
        populate_tree(tree);
        auto store = seed_store(root, tree);
        write_file(scratch / "occupied", "not a directory");

        FakeVolumeControl control;
        FakeDeviceOps devices(control);
        VolumeLifecycle lifecycle(control, test_settings(), instant_polls());
        RestoreOptions options;
        options.key = make_object_key(snapshot, start, false).base;
        options.restore_dir = scratch / "occupied" / "parts";

        std::string resource;
        bool thrown = false;
        try {
            RestoreSequencer(lifecycle, devices, *store, options).run();
        } catch (const ConfigurationError& e) {
            thrown = true;
            resource = e.resource();
        }
        ASSERT_TRUE(thrown, "ConfigurationError expected");
        ASSERT_EQ(resource, options.restore_dir.string(), "directory reported");
        ASSERT_TRUE(control.requests.empty(), "no volume created");
        ASSERT_EMPTY(join(control.calls), "no control plane calls");

        options.restore_dir = scratch / "occupied";
        thrown = false;
        try {
            RestoreSequencer(lifecycle, devices, *store, options).run();
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "a file is not a restore directory");
        ASSERT_TRUE(control.requests.empty(), "still no volume");

        options.restore_dir = scratch / "fresh" / "parts";
        prepare_restore_dir(options.restore_dir);
        ASSERT_TRUE(fs::is_directory(options.restore_dir), "missing directory created");

        fs::remove_all(tree);
        fs::remove_all(root);
        fs::remove_all(scratch);
        PASS();
    }
}

static void test_http() {
    std::cout << "\n=== HTTP and signing ===" << std::endl;

    {
        TEST(url_encoding);
        ASSERT_EQ(net::url_encode("snap/web db/a~b_c-1.tar"), "snap%2Fweb%20db%2Fa~b_c-1.tar",
                  "query value");
        ASSERT_EQ(net::url_encode_path("snap/web db/x+y.tar"), "snap/web%20db/x%2By.tar",
                  "object key path");
        PASS();
    }
    {
        TEST(parsed_url);
        auto url = net::ParsedUrl::parse("https://bucket.s3.eu-west-1.amazonaws.com/snap/a.tar?uploads");
        ASSERT_TRUE(url.has_value(), "parsed");
        ASSERT_EQ(url->authority(), "bucket.s3.eu-west-1.amazonaws.com", "default port hidden");
        ASSERT_EQ(url->path, "/snap/a.tar", "path");
        ASSERT_EQ(url->query, "uploads", "query");

        auto local = net::ParsedUrl::parse("http://127.0.0.1:9000/bucket");
        ASSERT_TRUE(local.has_value(), "parsed with port");
        ASSERT_EQ(local->authority(), "127.0.0.1:9000", "explicit port kept");
        ASSERT_TRUE(!net::ParsedUrl::parse("no-scheme/path").has_value(), "no scheme");
        PASS();
    }
    {
        TEST(header_map);
        net::HttpHeaders headers;
        headers.set("Content-Length", "1234");
        headers.set("X-Amz-Meta-Disc-Size", "99");
        ASSERT_EQ(headers.content_length().value_or(0), 1234u, "content length");
        ASSERT_EQ(headers.get("x-amz-meta-disc-size").value_or(""), "99", "case-insensitive");
        headers.set("content-length", "12x");
        ASSERT_TRUE(!headers.content_length().has_value(), "malformed length");
        headers.remove("CONTENT-LENGTH");
        ASSERT_TRUE(!headers.get("Content-Length").has_value(), "removed");
        PASS();
    }
    {
        TEST(sigv4_authorization);
        net::AwsSigV4Signer signer("AKID", "secret", "eu-west-1", "ec2");
        auto request = net::HttpRequest::post("https://ec2.eu-west-1.amazonaws.com/",
                                              "Action=DescribeSnapshots");
        request.headers.set_content_type("application/x-www-form-urlencoded; charset=utf-8");
        signer.sign(request);

        auto auth = request.headers.get("Authorization").value_or("");
        const std::string prefix = "AWS4-HMAC-SHA256 Credential=AKID/";
        ASSERT_EQ(auth.substr(0, prefix.size()), prefix, "credential");
        ASSERT_TRUE(contains(auth, "/eu-west-1/ec2/aws4_request, SignedHeaders=content-type;"
                                   "host;x-amz-content-sha256;x-amz-date, Signature="),
                    auth);
        ASSERT_EQ(auth.size() - auth.find("Signature=") - 10, 64u, "hex signature");
        ASSERT_EQ(request.headers.get("Host").value_or(""), "ec2.eu-west-1.amazonaws.com", "host");

        signer.sign_with_token(request, "session");
        auth = request.headers.get("Authorization").value_or("");
        ASSERT_TRUE(contains(auth, "x-amz-date;x-amz-security-token, Signature="),
                    "token signed: " + auth);
        ASSERT_TRUE(!contains(auth, "authorization"), "old signature not signed");
        PASS();
    }
}

static void test_ec2_parsing() {
    std::cout << "\n=== EC2 replies ===" << std::endl;

    {
        TEST(encode_query);
        auto body = Ec2VolumeControl::encode_query(
            "CreateTags", {{"ResourceId.1", "snap-1"}, {"Tag.1.Value", "a b/c"}});
        ASSERT_EQ(body,
                  "Action=CreateTags&Version=2016-11-15&ResourceId.1=snap-1"
                  "&Tag.1.Value=a%20b%2Fc",
                  "query body");
        PASS();
    }
    {
        TEST(create_volume_client_token);
        VolumeRequest request;
        request.availability_zone = "eu-west-1a";
        request.size_gib = 4;
        request.volume_type = "gp3";
        request.iops = 4000;
        request.tags = {{"Name", "restore"}};

        auto params = Ec2VolumeControl::create_volume_params(request);
        ASSERT_EQ(params.count("ClientToken"), 1u, "token present");
        ASSERT_EQ(params["ClientToken"].size(), 32u, "token length");
        ASSERT_EQ(params["Size"], "4", "size");
        ASSERT_EQ(params["Iops"], "4000", "iops");
        ASSERT_TRUE(params.count("Throughput") == 0, "no throughput");
        ASSERT_EQ(params["TagSpecification.1.Tag.1.Value"], "restore", "tag");

        auto body = Ec2VolumeControl::encode_query("CreateVolume", params);
        ASSERT_TRUE(contains(body, "&ClientToken=" + params["ClientToken"] + "&"),
                    "token in query body");

        auto again = Ec2VolumeControl::create_volume_params(request);
        ASSERT_TRUE(again["ClientToken"] != params["ClientToken"], "token per volume");
        PASS();
    }
    {
        TEST(describe_snapshots);
        const std::string xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<DescribeSnapshotsResponse xmlns="http://ec2.amazonaws.com/doc/2016-11-15/">
    <requestId>59dbff89-35bd-4eac-99ed-be587EXAMPLE</requestId>
    <snapshotSet>
        <item>
            <snapshotId>snap-1</snapshotId>
            <volumeId>vol-9</volumeId>
            <status>completed</status>
            <startTime>2024-05-01T12:00:00.000Z</startTime>
            <volumeSize>8</volumeSize>
            <tagSet>
                <item><key>snap-to-bucket</key><value>migrate</value></item>
                <item><key>name</key><value>web &amp; db</value></item>
            </tagSet>
        </item>
        <item>
            <snapshotId>snap-2</snapshotId>
            <startTime>2024-05-02T00:00:00.000Z</startTime>
            <volumeSize>20</volumeSize>
        </item>
    </snapshotSet>
    <nextToken>token-2</nextToken>
</DescribeSnapshotsResponse>)";
        std::vector<Snapshot> snapshots;
        auto next = Ec2VolumeControl::parse_snapshots(xml, snapshots);
        ASSERT_EQ(next, "token-2", "next token");
        ASSERT_EQ(snapshots.size(), 2u, "two snapshots");
        ASSERT_EQ(snapshots[0].id, "snap-1", "id");
        ASSERT_EQ(snapshots[0].name, "web & db", "name tag");
        ASSERT_EQ(snapshots[0].volume_size_gib, 8, "size");
        ASSERT_TRUE(snapshots[0].created == utc("2024-05-01T12:00:00Z"), "created");
        ASSERT_EQ(snapshots[1].name, "snap-2", "name falls back to id");
        PASS();
    }
    {
        TEST(describe_volumes);
        const std::string xml = R"(<DescribeVolumesResponse>
    <volumeSet>
        <item>
            <volumeId>vol-1</volumeId>
            <size>8</size>
            <snapshotId>snap-1</snapshotId>
            <status>in-use</status>
            <attachmentSet>
                <item>
                    <volumeId>vol-1</volumeId>
                    <instanceId>i-1</instanceId>
                    <device>/dev/sdk</device>
                    <status>attached</status>
                </item>
            </attachmentSet>
        </item>
    </volumeSet>
</DescribeVolumesResponse>)";
        auto volume = Ec2VolumeControl::parse_volume(xml);
        ASSERT_TRUE(volume.has_value(), "volume");
        ASSERT_EQ(volume->id, "vol-1", "id");
        ASSERT_TRUE(volume->state == VolumeState::InUse, "in use");
        ASSERT_EQ(volume->size_gib, 8, "size");
        ASSERT_EQ(volume->snapshot_id, "snap-1", "snapshot");
        ASSERT_EQ(volume->instance_id, "i-1", "instance");
        ASSERT_EQ(volume->device, "/dev/sdk", "device");

        ASSERT_TRUE(!Ec2VolumeControl::parse_volume(
                        "<DescribeVolumesResponse><volumeSet/></DescribeVolumesResponse>")
                         .has_value(),
                    "empty set");
        PASS();
    }
    {
        TEST(instance_identity);
        auto identity = aws::InstanceIdentity::from_json(
            R"({"instanceId": "i-0abc", "region": "eu-west-1", "availabilityZone": "eu-west-1b"})");
        ASSERT_EQ(identity.instance_id, "i-0abc", "instance");
        ASSERT_EQ(identity.region, "eu-west-1", "region");
        ASSERT_EQ(identity.availability_zone, "eu-west-1b", "zone");
        bool thrown = false;
        try {
            aws::InstanceIdentity::from_json("{}");
        } catch (const ControlPlaneError&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "ControlPlaneError expected");
        PASS();
    }
}

static void test_subprocess() {
    std::cout << "\n=== Subprocess ===" << std::endl;

    {
        TEST(captures_output_and_exit_code);
        auto result = run_command({"sh", "-c", "echo out; echo err >&2; exit 3"});
        ASSERT_EQ(result.exit_code, 3, "exit code");
        ASSERT_EQ(result.output, "out\n", "stdout");
        ASSERT_EQ(result.error, "err\n", "stderr");
        PASS();
    }
    {
        TEST(feeds_stdin);
        ASSERT_EQ(check_output({"cat"}, "label: dos\ntype=83\n"), "label: dos\ntype=83\n",
                  "echoed input");
        PASS();
    }
    {
        TEST(failure_throws);
        bool thrown = false;
        int code = 0;
        try {
            check_output({"false"});
        } catch (const CommandFailed& e) {
            thrown = true;
            code = e.exit_code();
        }
        ASSERT_TRUE(thrown, "CommandFailed expected");
        ASSERT_EQ(code, 1, "exit code");
        PASS();
    }
    {
        TEST(join_command_quotes);
        ASSERT_EQ(join_command({"tar", "--create"}), "tar --create", "joined");
        PASS();
    }
}

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("snapbucket-metrics");
    auto prom_path = tmpdir / "snapbucket.prom";

    {
        TEST(creates_prom_file);
        std::map<std::string, std::string> labels = {
            {"instance", "i-0abc"},
            {"mode", "migrate"},
        };
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), labels);
        exporter.start();

        bool created = wait_for([&] { return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(contains(content, "snapbucket_units_total"), "units counter");
        ASSERT_TRUE(contains(content, "snapbucket_chunk_size_bytes"), "chunk gauge");
        ASSERT_TRUE(contains(content, "snapbucket_part_upload_duration_seconds"),
                    "part histogram");
        ASSERT_TRUE(contains(content, "instance=\"i-0abc\""), "constant label");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(counter_values_written_on_stop);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {{"mode", "restore"}});
        exporter.restores_success().Increment();
        exporter.upload_bytes().Increment(12345);
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(contains(content, "direction=\"restore\""), "direction label");
        ASSERT_TRUE(contains(content, "result=\"success\""), "result label");
        ASSERT_TRUE(contains(content, "snapbucket_upload_bytes_total{mode=\"restore\"} 12345"),
                    "byte counter: " + content);
        PASS();
    }
    {
        TEST(serialize_without_file);
        MetricsExporter exporter("", std::chrono::seconds(60), {});
        exporter.parts_uploaded().Increment(3);
        exporter.stop();
        ASSERT_TRUE(contains(exporter.serialize(), "snapbucket_parts_uploaded_total 3"),
                    "serialized counter");
        PASS();
    }

    fs::remove_all(tmpdir);
}

int main() {
    // Extractors that exit early must surface as errors, not kill the run
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "snapbucket test suite" << std::endl;
    std::cout << "=====================" << std::endl;

    test_config();
    test_chunk_sizer();
    test_object_keys();
    test_devices_and_fstab();
    test_multipart_session();
    test_split_uploader();
    test_archive_round_trip();
    test_volume_lifecycle();
    test_migration();
    test_restore();
    test_http();
    test_ec2_parsing();
    test_subprocess();
    test_metrics();

    std::cout << "\n=====================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
