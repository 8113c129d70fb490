#include "snapbucket/storage/object_store.hpp"
#include "snapbucket/aws/credentials.hpp"
#include "snapbucket/core/digest.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/net/xml.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>

namespace snapbucket {

namespace fs = std::filesystem;

std::vector<ListEntry> list_all(const ObjectStore& store, const std::string& prefix) {
    std::vector<ListEntry> entries;
    ListOptions options;
    options.prefix = prefix;

    while (true) {
        auto page = store.list(options);
        if (!page.success) {
            throw StorageError("Listing " + store.describe(prefix) + " failed: " +
                               page.error_message, prefix);
        }
        entries.insert(entries.end(), page.entries.begin(), page.entries.end());
        if (!page.truncated || page.continuation_token.empty()) {
            break;
        }
        options.continuation_token = page.continuation_token;
    }
    return entries;
}

// ============================================================================
// LocalObjectStore - directory-backed implementation
//
// Layout under the root:
//   <key>                                   completed objects
//   .snapbucket/meta/<key>.json             content type, storage class, metadata
//   .snapbucket/uploads/<id>/manifest.json  in-flight upload (key, options)
//   .snapbucket/uploads/<id>/part-<n>       staged part bytes
//   .snapbucket/completed/<id>              etag of a completed upload
// ============================================================================

namespace {

constexpr const char* STATE_DIR = ".snapbucket";

bool valid_key(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    for (const auto& part : fs::path(key)) {
        if (part == ".." || part == STATE_DIR) return false;
    }
    return true;
}

std::string quote_etag(const std::string& etag) {
    return "\"" + etag + "\"";
}

void write_file_atomic(const fs::path& path, std::span<const uint8_t> data) {
    fs::create_directories(path.parent_path());
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::system_error(errno, std::generic_category(), "open " + tmp.string());
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            throw std::system_error(errno, std::generic_category(), "write " + tmp.string());
        }
    }
    fs::rename(tmp, path);
}

void write_text_atomic(const fs::path& path, const std::string& text) {
    write_file_atomic(path, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

template <typename Result>
Result fatal(const std::string& message) {
    Result result;
    result.success = false;
    result.retryable = false;
    result.error_message = message;
    return result;
}

}  // namespace

class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(const fs::path& root)
        : root_(fs::absolute(root)) {
        fs::create_directories(root_);
    }

    std::string type_name() const override { return "local"; }

    std::string describe(const std::string& key) const override {
        return (root_ / key).string();
    }

    StoreStatus check_access() const override {
        StoreStatus status;
        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            status.error_message = root_.string() + " is not a directory";
            return status;
        }
        fs::create_directories(state_dir(), ec);
        if (ec) {
            status.error_message = "Cannot write to " + root_.string() + ": " + ec.message();
            return status;
        }
        status.success = true;
        return status;
    }

    CreateUploadResult create_multipart_upload(const std::string& key,
                                               const MultipartOptions& options) override {
        if (!valid_key(key)) {
            return fatal<CreateUploadResult>("Invalid key: " + key);
        }
        CreateUploadResult result;
        try {
            std::string upload_id = random_hex(16);
            nlohmann::json manifest;
            manifest["key"] = key;
            manifest["content_type"] = options.content_type;
            manifest["storage_class"] = options.storage_class;
            manifest["metadata"] = options.metadata;
            write_text_atomic(upload_dir(upload_id) / "manifest.json", manifest.dump());
            result.success = true;
            result.upload_id = upload_id;
        } catch (const std::exception& e) {
            result.retryable = true;
            result.error_message = e.what();
        }
        return result;
    }

    PartResult upload_part(const std::string& key,
                           const std::string& upload_id,
                           int part_number,
                           std::span<const uint8_t> data,
                           const std::string& content_md5) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto manifest = load_manifest(upload_id);
        if (!manifest || (*manifest)["key"] != key) {
            return fatal<PartResult>("NoSuchUpload: " + upload_id);
        }

        PartResult result;
        if (!content_md5.empty() && md5_base64(data) != content_md5) {
            result.retryable = true;
            result.status_code = 400;
            result.error_message = "BadDigest: Content-MD5 does not match the received part";
            return result;
        }

        try {
            std::string digest = md5_hex(data);
            write_file_atomic(part_path(upload_id, part_number), data);
            write_text_atomic(md5_path(upload_id, part_number), digest);
            result.success = true;
            result.etag = quote_etag(digest);
        } catch (const std::exception& e) {
            result.retryable = true;
            result.error_message = e.what();
        }
        return result;
    }

    CompleteResult complete_multipart_upload(const std::string& key,
                                             const std::string& upload_id,
                                             const std::vector<CompletedPart>& parts) override {
        std::lock_guard<std::mutex> lock(mutex_);

        // A repeated completion of the same upload reports the original result
        fs::path marker = state_dir() / "completed" / upload_id;
        if (fs::exists(marker)) {
            CompleteResult done;
            done.success = true;
            done.etag = read_text(marker);
            return done;
        }

        auto manifest = load_manifest(upload_id);
        if (!manifest || (*manifest)["key"] != key) {
            return fatal<CompleteResult>("NoSuchUpload: " + upload_id);
        }
        if (parts.empty()) {
            return fatal<CompleteResult>("MalformedXML: no parts given for " + key);
        }

        CompleteResult result;
        try {
            fs::path target = root_ / key;
            fs::create_directories(target.parent_path());
            fs::path tmp = target;
            tmp += ".partial";

            std::string etag_material;
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                int expected = 1;
                for (const auto& part : parts) {
                    if (part.part_number != expected++) {
                        out.close();
                        fs::remove(tmp);
                        return fatal<CompleteResult>("InvalidPartOrder for " + key);
                    }
                    fs::path src = part_path(upload_id, part.part_number);
                    std::string part_md5 = read_text(md5_path(upload_id, part.part_number));
                    std::ifstream in(src, std::ios::binary);
                    if (!in || part_md5.empty()) {
                        out.close();
                        fs::remove(tmp);
                        return fatal<CompleteResult>("InvalidPart " +
                                                     std::to_string(part.part_number));
                    }
                    if (quote_etag(part_md5) != part.etag) {
                        out.close();
                        fs::remove(tmp);
                        return fatal<CompleteResult>("InvalidPart: etag mismatch for part " +
                                                     std::to_string(part.part_number));
                    }
                    etag_material += part_md5;
                    if (fs::file_size(src) > 0) {
                        out << in.rdbuf();
                    }
                }
                out.flush();
                if (!out) {
                    throw std::system_error(errno, std::generic_category(), "write " + tmp.string());
                }
            }
            fs::rename(tmp, target);

            std::string etag = quote_etag(
                md5_hex(std::span<const uint8_t>(
                    reinterpret_cast<const uint8_t*>(etag_material.data()), etag_material.size())) +
                "-" + std::to_string(parts.size()));

            nlohmann::json meta;
            meta["content_type"] = (*manifest)["content_type"];
            meta["storage_class"] = (*manifest)["storage_class"];
            meta["metadata"] = (*manifest)["metadata"];
            meta["etag"] = etag;
            write_text_atomic(meta_path(key), meta.dump());

            write_text_atomic(marker, etag);
            fs::remove_all(upload_dir(upload_id));

            result.success = true;
            result.etag = etag;
        } catch (const std::exception& e) {
            result.retryable = true;
            result.error_message = e.what();
        }
        return result;
    }

    StoreStatus abort_multipart_upload(const std::string& key,
                                       const std::string& upload_id) override {
        (void)key;
        std::lock_guard<std::mutex> lock(mutex_);
        StoreStatus status;
        std::error_code ec;
        fs::remove_all(upload_dir(upload_id), ec);
        if (ec) {
            status.retryable = true;
            status.error_message = ec.message();
            return status;
        }
        status.success = true;
        return status;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;
        std::vector<ListEntry> all;
        try {
            for (auto it = fs::recursive_directory_iterator(root_);
                 it != fs::recursive_directory_iterator(); ++it) {
                if (it->is_directory() && it->path().filename() == STATE_DIR) {
                    it.disable_recursion_pending();
                    continue;
                }
                if (!it->is_regular_file()) continue;
                std::string key = fs::relative(it->path(), root_).generic_string();
                if (key.ends_with(".partial") || key.ends_with(".tmp")) continue;
                if (!key.starts_with(options.prefix)) continue;

                ListEntry entry;
                entry.key = key;
                entry.size = it->file_size();
                all.push_back(std::move(entry));
            }
        } catch (const fs::filesystem_error& e) {
            result.error_message = e.what();
            return result;
        }

        std::sort(all.begin(), all.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });

        // Continuation token = last key returned
        auto first = all.begin();
        if (!options.continuation_token.empty()) {
            first = std::upper_bound(all.begin(), all.end(), options.continuation_token,
                                     [](const std::string& token, const ListEntry& e) {
                                         return token < e.key;
                                     });
        }
        for (auto it = first; it != all.end(); ++it) {
            if (result.entries.size() >= options.max_keys) {
                result.truncated = true;
                result.continuation_token = result.entries.back().key;
                break;
            }
            result.entries.push_back(*it);
        }
        result.success = true;
        return result;
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        if (!valid_key(key)) return std::nullopt;
        std::error_code ec;
        auto size = fs::file_size(root_ / key, ec);
        if (ec) return std::nullopt;

        ObjectMetadata meta;
        meta.size = size;
        if (fs::exists(meta_path(key))) {
            try {
                auto j = nlohmann::json::parse(read_text(meta_path(key)));
                meta.content_type = j.value("content_type", "");
                meta.storage_class = j.value("storage_class", "");
                meta.etag = j.value("etag", "");
                meta.user_metadata = j.value("metadata", std::map<std::string, std::string>{});
            } catch (const nlohmann::json::exception& e) {
                log_warn("Ignoring unreadable metadata for %s: %s", key.c_str(), e.what());
            }
        }
        return meta;
    }

    GetResult get_to_file(const std::string& key,
                          const fs::path& destination,
                          const TransferProgress& progress) const override {
        GetResult result;
        fs::path source = root_ / key;
        std::error_code ec;
        uint64_t total = fs::file_size(source, ec);
        if (ec || !valid_key(key)) {
            result.status_code = 404;
            result.error_message = "NoSuchKey: " + key;
            return result;
        }

        std::ifstream in(source, std::ios::binary);
        fs::create_directories(destination.parent_path(), ec);
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!in || !out) {
            result.error_message = "Cannot copy " + source.string() + " to " + destination.string();
            return result;
        }

        std::vector<char> buffer(1024 * 1024);
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto n = in.gcount();
            if (n <= 0) break;
            out.write(buffer.data(), n);
            result.bytes += static_cast<uint64_t>(n);
            if (progress) progress(result.bytes, total);
        }
        out.flush();
        if (!out) {
            result.error_message = "Write to " + destination.string() + " failed";
            return result;
        }
        result.success = true;
        return result;
    }

private:
    fs::path state_dir() const { return root_ / STATE_DIR; }
    fs::path upload_dir(const std::string& id) const { return state_dir() / "uploads" / id; }
    fs::path part_path(const std::string& id, int n) const {
        return upload_dir(id) / ("part-" + std::to_string(n));
    }
    fs::path md5_path(const std::string& id, int n) const {
        return upload_dir(id) / ("part-" + std::to_string(n) + ".md5");
    }
    fs::path meta_path(const std::string& key) const {
        return state_dir() / "meta" / (key + ".json");
    }

    std::optional<nlohmann::json> load_manifest(const std::string& upload_id) const {
        fs::path path = upload_dir(upload_id) / "manifest.json";
        if (upload_id.empty() || upload_id.find('/') != std::string::npos || !fs::exists(path)) {
            return std::nullopt;
        }
        try {
            return nlohmann::json::parse(read_text(path));
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    fs::path root_;
    mutable std::mutex mutex_;
};

// ============================================================================
// S3ObjectStore - S3 REST implementation
// ============================================================================

class S3ObjectStore : public ObjectStore {
public:
    S3ObjectStore(const StoreConfig& config,
                  std::shared_ptr<aws::CredentialProvider> credentials,
                  const net::HttpClientConfig& http_config)
        : config_(config)
        , credentials_(std::move(credentials)) {
        if (config_.region.empty()) {
            config_.region = "us-east-1";
        }
        net::HttpClientConfig cfg = http_config;
        cfg.verify_ssl_by_default = config_.verify_ssl;
        if (!config_.ca_cert.empty()) {
            cfg.default_ca_bundle = config_.ca_cert;
        }
        http_client_ = std::make_unique<net::HttpClient>(cfg);
    }

    std::string type_name() const override { return "s3"; }

    std::string describe(const std::string& key) const override {
        return "s3://" + config_.bucket + "/" + key;
    }

    StoreStatus check_access() const override {
        net::HttpRequest request = net::HttpRequest::head(build_url(""));
        sign(request);
        auto response = http_client_->execute_with_retry(request);
        return to_status<StoreStatus>(response);
    }

    CreateUploadResult create_multipart_upload(const std::string& key,
                                               const MultipartOptions& options) override {
        net::HttpRequest request = net::HttpRequest::post(build_url(key) + "?uploads", "");
        if (!options.content_type.empty()) {
            request.headers.set_content_type(options.content_type);
        }
        if (!options.storage_class.empty()) {
            request.headers.set("x-amz-storage-class", options.storage_class);
        }
        for (const auto& [k, v] : options.metadata) {
            request.headers.set("x-amz-meta-" + k, v);
        }

        sign(request);
        auto response = http_client_->execute(request);

        auto result = to_status<CreateUploadResult>(response);
        if (result.success) {
            result.upload_id = xml::get_element(response.body_string(), "UploadId");
            if (result.upload_id.empty()) {
                result.success = false;
                result.retryable = true;
                result.error_message = "CreateMultipartUpload response carried no UploadId";
            }
        }
        return result;
    }

    PartResult upload_part(const std::string& key,
                           const std::string& upload_id,
                           int part_number,
                           std::span<const uint8_t> data,
                           const std::string& content_md5) override {
        std::string url = build_url(key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + net::url_encode(upload_id);

        net::HttpRequest request = net::HttpRequest::put(url, data);
        if (!content_md5.empty()) {
            request.headers.set("Content-MD5", content_md5);
        }
        // Integrity is carried by Content-MD5; skip hashing multi-GiB bodies twice
        request.headers.set("X-Amz-Content-Sha256", "UNSIGNED-PAYLOAD");

        sign(request);
        auto response = http_client_->execute(request);

        auto result = to_status<PartResult>(response);
        if (result.success) {
            result.etag = ensure_etag_quotes(response.headers.get("ETag").value_or(""));
        }
        return result;
    }

    CompleteResult complete_multipart_upload(const std::string& key,
                                             const std::string& upload_id,
                                             const std::vector<CompletedPart>& parts) override {
        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& part : parts) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(part.etag) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        net::HttpRequest request = net::HttpRequest::post(url, body.str());
        request.headers.set_content_type("application/xml");

        sign(request);
        auto response = http_client_->execute(request);

        auto result = to_status<CompleteResult>(response);
        if (!result.success) {
            return result;
        }

        // S3 may report a failed completion inside a 200 response
        std::string text = response.body_string();
        if (text.find("<Error>") != std::string::npos) {
            result.success = false;
            result.retryable = true;
            result.error_message = xml::get_element(text, "Code") + ": " +
                                   xml::get_element(text, "Message");
            return result;
        }
        result.etag = ensure_etag_quotes(xml::decode_entities(xml::get_element(text, "ETag")));
        return result;
    }

    StoreStatus abort_multipart_upload(const std::string& key,
                                       const std::string& upload_id) override {
        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

        net::HttpRequest request = net::HttpRequest::del(url);
        sign(request);
        auto response = http_client_->execute(request);

        // Already gone counts as aborted
        if (response.status_code == 404) {
            StoreStatus status;
            status.success = true;
            return status;
        }
        return to_status<StoreStatus>(response);
    }

    ListResult list(const ListOptions& options) const override {
        std::string url = build_url("") + "?list-type=2" +
                          "&max-keys=" + std::to_string(options.max_keys);
        if (!options.prefix.empty()) {
            url += "&prefix=" + net::url_encode(options.prefix);
        }
        if (!options.continuation_token.empty()) {
            url += "&continuation-token=" + net::url_encode(options.continuation_token);
        }

        net::HttpRequest request = net::HttpRequest::get(url);
        sign(request);
        auto response = http_client_->execute_with_retry(request);

        auto result = to_status<ListResult>(response);
        if (result.success) {
            parse_list_response(response.body_string(), result);
        }
        return result;
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        net::HttpRequest request = net::HttpRequest::head(build_url(key));
        sign(request);
        auto response = http_client_->execute_with_retry(request);

        if (!response.ok()) {
            if (response.status_code != 404) {
                log_debug(1, "HEAD %s failed: %s", describe(key).c_str(),
                          describe_error(response).c_str());
            }
            return std::nullopt;
        }

        ObjectMetadata meta;
        meta.size = response.headers.content_length().value_or(0);
        meta.etag = response.headers.get("ETag").value_or("");
        meta.content_type = response.headers.get("Content-Type").value_or("");
        meta.storage_class = response.headers.get("x-amz-storage-class").value_or("STANDARD");

        const std::string meta_prefix = "x-amz-meta-";
        for (const auto& [name, value] : response.headers.all()) {
            if (name.starts_with(meta_prefix)) {
                meta.user_metadata[name.substr(meta_prefix.size())] = value;
            }
        }
        return meta;
    }

    GetResult get_to_file(const std::string& key,
                          const fs::path& destination,
                          const TransferProgress& progress) const override {
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);

        net::HttpRequest request = net::HttpRequest::get(build_url(key));
        request.output_path = destination.string();
        if (progress) {
            request.progress = [&progress](uint64_t now, uint64_t total) {
                progress(now, total);
                return true;
            };
        }
        sign(request);
        auto response = http_client_->execute_with_retry(request);

        auto result = to_status<GetResult>(response);
        result.bytes = response.bytes_written;
        return result;
    }

private:
    void sign(net::HttpRequest& request) const {
        aws::sign_request(request, *credentials_, config_.region, "s3");
    }

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            while (!url.empty() && url.back() == '/') url.pop_back();
            if (config_.use_path_style) {
                url += "/" + config_.bucket;
            } else {
                auto parsed = net::ParsedUrl::parse(url);
                if (parsed) {
                    url = parsed->scheme + "://" + config_.bucket + "." + parsed->authority();
                }
            }
        } else if (config_.use_path_style) {
            url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
        } else {
            url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
        }
        url += "/" + net::url_encode_path(key);
        return url;
    }

    static std::string ensure_etag_quotes(const std::string& etag) {
        if (etag.empty()) return etag;
        std::string result = etag;
        if (result.front() != '"') result = "\"" + result;
        if (result.back() != '"') result += "\"";
        return result;
    }

    static std::string describe_error(const net::HttpResponse& response) {
        if (response.is_network_error || response.status_code == 0) {
            return response.error.empty() ? "network error" : response.error;
        }
        std::string body = response.body_string();
        std::string code = xml::get_element(body, "Code");
        std::string message = xml::get_element(body, "Message");
        std::string text = "HTTP " + std::to_string(response.status_code);
        if (!code.empty()) text += " " + code;
        if (!message.empty()) text += ": " + message;
        if (!response.error.empty()) text += " (" + response.error + ")";
        return text;
    }

    // Transient: network errors, throttling, 5xx, request timeouts and
    // digest mismatches (the bytes were damaged in transit)
    static bool is_retryable(const net::HttpResponse& response) {
        if (response.is_network_error || response.status_code == 0) return true;
        if (net::is_retryable_status(response.status_code)) return true;
        if (response.status_code == 400) {
            std::string code = xml::get_element(response.body_string(), "Code");
            return code == "BadDigest" || code == "RequestTimeout" || code == "IncompleteBody";
        }
        return false;
    }

    template <typename Result>
    static Result to_status(const net::HttpResponse& response) {
        Result result;
        result.status_code = response.status_code;
        if (response.ok() && response.error.empty()) {
            result.success = true;
            return result;
        }
        result.retryable = is_retryable(response);
        result.error_message = describe_error(response);
        return result;
    }

    static void parse_list_response(const std::string& body, ListResult& result) {
        result.truncated = xml::get_element(body, "IsTruncated") == "true";
        result.continuation_token =
            xml::decode_entities(xml::get_element(body, "NextContinuationToken"));

        for (const auto& range : xml::find_elements(body, "Contents")) {
            std::string content = xml::content(body, range);

            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Key"));
            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                try {
                    entry.size = std::stoull(size_str);
                } catch (const std::exception&) {
                    entry.size = 0;
                }
            }
            entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
            entry.storage_class = xml::get_element(content, "StorageClass");
            result.entries.push_back(std::move(entry));
        }
    }

    StoreConfig config_;
    std::shared_ptr<aws::CredentialProvider> credentials_;
    std::unique_ptr<net::HttpClient> http_client_;
};

// ============================================================================
// ObjectStoreFactory
// ============================================================================

std::unique_ptr<ObjectStore> ObjectStoreFactory::create(
    const StoreConfig& config,
    std::shared_ptr<aws::CredentialProvider> credentials,
    const net::HttpClientConfig& http_config) {

    if (config.type == "local") {
        if (config.path.empty()) {
            throw ConfigurationError("Local store requires a path (--store-path)");
        }
        return create_local(config.path);
    }

    if (config.type == "s3") {
        return create_s3(config, std::move(credentials), http_config);
    }

    throw ConfigurationError("Unknown store type: " + config.type);
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_local(const fs::path& root) {
    return std::make_unique<LocalObjectStore>(root);
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_s3(
    const StoreConfig& config,
    std::shared_ptr<aws::CredentialProvider> credentials,
    const net::HttpClientConfig& http_config) {
    if (config.bucket.empty()) {
        throw ConfigurationError("S3 store requires a bucket");
    }
    if (!credentials) {
        throw ConfigurationError("S3 store requires a credential provider");
    }
    return std::make_unique<S3ObjectStore>(config, std::move(credentials), http_config);
}

}  // namespace snapbucket
