#pragma once

#include <chrono>
#include <cstdint>

namespace snapbucket::constants {

constexpr const char* VERSION = "1.3.0";

// Sizes
constexpr uint64_t KiB = 1024ULL;
constexpr uint64_t MiB = 1024ULL * KiB;
constexpr uint64_t GiB = 1024ULL * MiB;
constexpr uint64_t TiB = 1024ULL * GiB;

// Object storage limits
constexpr uint64_t MAX_PART_SIZE = 5 * GiB;
constexpr uint64_t MAX_OBJECT_SIZE = 5 * TiB;
constexpr uint64_t MIN_SPLIT_SIZE = 5 * MiB;
constexpr uint64_t MAX_SPLIT_SIZE = 5 * TiB;
constexpr int MAX_PARTS_PER_UPLOAD = 10000;

// Memory kept free while buffering a chunk
constexpr uint64_t UPLOAD_MEMORY_MARGIN = 500 * MiB;
constexpr uint64_t EXTRACT_MEMORY_MARGIN = 10 * MiB;

// Part retries
constexpr int DEFAULT_MAX_RETRIES = 4;
constexpr std::chrono::seconds DEFAULT_RETRY_DELAY{4};

// Volume readiness polling
constexpr std::chrono::seconds AVAILABLE_POLL_DELAY{10};
constexpr int AVAILABLE_POLL_ATTEMPTS = 50;
constexpr std::chrono::seconds IN_USE_POLL_DELAY{15};
constexpr int IN_USE_POLL_ATTEMPTS = 40;
constexpr std::chrono::seconds DELETED_POLL_DELAY{15};
constexpr int DELETED_POLL_ATTEMPTS = 40;

// Restored volumes get headroom over the archived byte count
constexpr double RESTORE_VOLUME_HEADROOM = 1.25;

// Tagging
constexpr const char* DEFAULT_TAG = "snap-to-bucket";
constexpr const char* TAG_MIGRATE = "migrate";
constexpr const char* TAG_TRANSFERRED = "transferred";
constexpr const char* TAG_CREATED = "created";
constexpr const char* TAG_RESTORE_VOLUME = "restore-volume";
constexpr const char* VOLUME_NAME_PREFIX = "snap-to-bucket-";

// Object metadata keys
constexpr const char* META_CREATION_TIME = "creation-time";
constexpr const char* META_VOLUME_SIZE = "snap-volume-size";
constexpr const char* META_DISC_SIZE = "disc-size";

// Host defaults
constexpr const char* ATTACH_DEVICE = "/dev/sdk";
constexpr const char* DEFAULT_MOUNT_POINT = "/mnt/snaps";
constexpr const char* DEFAULT_RESTORE_DIR = "/tmp/snap-to-bucket";
constexpr const char* DEFAULT_VOLUME_TYPE = "gp2";
constexpr const char* DEFAULT_STORAGE_CLASS = "STANDARD";
constexpr const char* DEFAULT_SPLIT = "5t";
constexpr std::chrono::seconds DEVICE_SETTLE_DELAY{5};
constexpr std::chrono::seconds LABEL_SETTLE_DELAY{1};

// Instance metadata service
constexpr const char* IMDS_HOST = "169.254.169.254";
constexpr const char* IMDS_ENDPOINT = "http://169.254.169.254";
constexpr int IMDS_TOKEN_TTL_SECONDS = 21600;
constexpr std::chrono::minutes CREDENTIAL_REFRESH_WINDOW{5};

// EC2 Query API
constexpr const char* EC2_API_VERSION = "2016-11-15";

// Process exit codes
constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_NOT_ROOT = 5;

}  // namespace snapbucket::constants
