#pragma once

#include "snapbucket/net/http.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace snapbucket {

namespace aws {
class CredentialProvider;
}

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::string content_type;
    std::string etag;
    std::string storage_class;
    std::map<std::string, std::string> user_metadata;
};

// Common outcome of a store call. `retryable` distinguishes transient
// failures (network, throttling, 5xx, digest mismatch) from fatal ones.
struct StoreStatus {
    bool success = false;
    bool retryable = false;
    int status_code = 0;
    std::string error_message;
};

struct CreateUploadResult : StoreStatus {
    std::string upload_id;
};

struct PartResult : StoreStatus {
    std::string etag;
};

struct CompleteResult : StoreStatus {
    std::string etag;
};

struct GetResult : StoreStatus {
    uint64_t bytes = 0;
};

struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::string etag;
    std::string storage_class;
};

struct ListResult : StoreStatus {
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
};

struct ListOptions {
    std::string prefix;
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

// Applied when a multipart upload is created
struct MultipartOptions {
    std::string content_type = "application/octet-stream";
    std::string storage_class;
    std::map<std::string, std::string> metadata;
};

struct CompletedPart {
    int part_number = 0;
    std::string etag;
    uint64_t size = 0;
};

// Bytes received so far, total (0 when unknown)
using TransferProgress = std::function<void(uint64_t, uint64_t)>;

/// Object storage as seen by the transfer engine: multipart uploads,
/// prefix listing, metadata lookup and streamed downloads.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::string type_name() const = 0;

    // Printable location of `key` ("s3://bucket/key", "/srv/store/key")
    virtual std::string describe(const std::string& key) const = 0;

    // Head-bucket: verifies the target exists and is accessible
    virtual StoreStatus check_access() const = 0;

    virtual CreateUploadResult create_multipart_upload(const std::string& key,
                                                       const MultipartOptions& options) = 0;

    // `content_md5` is the base64 MD5 of `data`; the store rejects the
    // part when the received bytes do not match it.
    virtual PartResult upload_part(const std::string& key,
                                   const std::string& upload_id,
                                   int part_number,
                                   std::span<const uint8_t> data,
                                   const std::string& content_md5) = 0;

    virtual CompleteResult complete_multipart_upload(const std::string& key,
                                                     const std::string& upload_id,
                                                     const std::vector<CompletedPart>& parts) = 0;

    virtual StoreStatus abort_multipart_upload(const std::string& key,
                                               const std::string& upload_id) = 0;

    // One page of keys under a prefix, in lexicographic order
    virtual ListResult list(const ListOptions& options) const = 0;

    virtual std::optional<ObjectMetadata> head(const std::string& key) const = 0;

    virtual GetResult get_to_file(const std::string& key,
                                  const std::filesystem::path& destination,
                                  const TransferProgress& progress = nullptr) const = 0;
};

/// Follows continuation tokens until the listing is exhausted.
/// Throws StorageError when a page fails.
std::vector<ListEntry> list_all(const ObjectStore& store, const std::string& prefix);

struct StoreConfig {
    std::string type = "s3";  // "s3" or "local"

    // s3
    std::string bucket;
    std::string region;
    std::string endpoint;  // Empty for AWS, custom for MinIO and other S3-compatible stores
    bool use_path_style = false;
    bool verify_ssl = true;
    std::string ca_cert;

    // local
    std::filesystem::path path;
};

class ObjectStoreFactory {
public:
    // Throws ConfigurationError for unknown types or missing parameters
    static std::unique_ptr<ObjectStore> create(const StoreConfig& config,
                                               std::shared_ptr<aws::CredentialProvider> credentials,
                                               const net::HttpClientConfig& http_config);

    // Directory-backed store rooted at `root` (created when missing)
    static std::unique_ptr<ObjectStore> create_local(const std::filesystem::path& root);

    static std::unique_ptr<ObjectStore> create_s3(const StoreConfig& config,
                                                  std::shared_ptr<aws::CredentialProvider> credentials,
                                                  const net::HttpClientConfig& http_config);
};

}  // namespace snapbucket
