#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace snapbucket::net {

// 2xx
bool is_success_status(int status);
// Throttling (429) and transient 5xx answers worth sending again
bool is_retryable_status(int status);

/// Header map keyed by lowercase name. all() yields names sorted, which is
/// the order SigV4 signs them in.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<size_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

enum class HttpMethod { GET, HEAD, POST, PUT, DELETE };

// Return false to abort the transfer
using DownloadProgress = std::function<bool(uint64_t now, uint64_t total)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // POST bodies are owned. PUT bodies are borrowed part buffers and must
    // outlive the request.
    std::vector<uint8_t> body;
    std::span<const uint8_t> body_view;

    // Set for object downloads: a 2xx body goes to this file, not to memory
    std::string output_path;
    DownloadProgress progress;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{0};  // parts can take hours
    bool verify_ssl = true;

    // execute_with_retry: sends again on network errors and retryable statuses
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};  // doubles each time

    std::span<const uint8_t> payload() const {
        return body_view.empty() ? std::span<const uint8_t>(body) : body_view;
    }

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::span<const uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    uint64_t bytes_written = 0;  // to output_path

    std::string error;
    bool is_network_error = false;  // no HTTP answer at all

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

struct HttpClientConfig {
    std::string proxy_url;
    std::string no_proxy;  // CURLOPT_NOPROXY list; keeps IMDS off the proxy

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    size_t max_idle_handles = 8;
    size_t max_response_size = 64 * 1024 * 1024;  // in-memory bodies only
    std::chrono::seconds keepalive_idle{60};
    std::chrono::seconds keepalive_interval{15};
    std::string user_agent = "snapbucket/1.3";
};

/// Blocking libcurl client. Easy handles are pooled so S3 and EC2 calls
/// reuse their connections. Safe to share between threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);
    HttpResponse execute_with_retry(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// AWS Signature Version 4 for one region and service ("s3", "ec2").
/// Signing sets Host, X-Amz-Date, X-Amz-Content-Sha256 (kept when already
/// present, e.g. UNSIGNED-PAYLOAD) and Authorization; a request may be
/// signed again before a resend.
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                   std::string region, std::string service);

    void sign(HttpRequest& request) const;
    // Adds X-Amz-Security-Token first when `session_token` is not empty
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;  // 0 when the URL has none
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);

    // host, plus ":port" when the port is not the scheme default
    std::string authority() const;
};

// Percent-encodes all but A-Z a-z 0-9 - _ . ~
std::string url_encode(const std::string& str);
// Same, keeping '/' so object keys stay paths
std::string url_encode_path(const std::string& path);

std::string base64_encode(std::span<const uint8_t> data);

}  // namespace snapbucket::net
