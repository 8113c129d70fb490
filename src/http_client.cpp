#include "snapbucket/net/http.hpp"
#include "snapbucket/core/log.hpp"

#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace snapbucket::net {

// ============================================================================
// Utility functions
// ============================================================================

static const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

static std::string lowercase(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

static std::string percent_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode(const std::string& str) {
    return percent_encode(str, false);
}

std::string url_encode_path(const std::string& path) {
    return percent_encode(path, true);
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(std::span<const uint8_t> data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < data.size()) {
        uint32_t octet_a = i < data.size() ? data[i++] : 0;
        uint32_t octet_b = i < data.size() ? data[i++] : 0;
        uint32_t octet_c = i < data.size() ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += (i > data.size() + 1) ? '=' : base64_chars[(triple >> 6) & 0x3F];
        result += (i > data.size()) ? '=' : base64_chars[triple & 0x3F];
    }

    return result;
}

// ============================================================================
// HttpHeaders
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[lowercase(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[lowercase(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(lowercase(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(lowercase(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<size_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value) return std::nullopt;
    size_t length = 0;
    const char* end = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(value->data(), end, length);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return length;
}

// ============================================================================
// HttpRequest
// ============================================================================

static HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::head(const std::string& url) {
    return make_request(HttpMethod::HEAD, url);
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    auto req = make_request(HttpMethod::POST, url);
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::span<const uint8_t> body) {
    auto req = make_request(HttpMethod::PUT, url);
    req.body_view = body;
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }
    size_t colon_pos = host_port.rfind(':');
    if (colon_pos != std::string::npos && host_port.front() != '[') {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

std::string ParsedUrl::authority() const {
    if (port == 0 || (scheme == "https" && port == 443) || (scheme == "http" && port == 80)) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Response sink: bounded memory buffer, or a file for successful streamed GETs
struct WriteCallbackContext {
    CURL* curl;
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
    const std::string* output_path;
    FILE* file;
    uint64_t file_bytes;
    bool file_error;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (!ctx->output_path->empty()) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (is_success_status(static_cast<int>(status))) {
            if (!ctx->file) {
                ctx->file = fopen(ctx->output_path->c_str(), "wb");
                if (!ctx->file) {
                    ctx->file_error = true;
                    return 0;
                }
            }
            if (fwrite(ptr, 1, bytes, ctx->file) != bytes) {
                ctx->file_error = true;
                return 0;
            }
            ctx->file_bytes += bytes;
            return bytes;
        }
    }

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a fresh header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string() : value.substr(start);

        headers->add(name, value);
    }

    return bytes;
}

struct ReadData {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadData*>(userdata);
    size_t max_bytes = size * nitems;
    size_t remaining = rd->size - rd->pos;
    size_t to_copy = std::min(max_bytes, remaining);

    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }

    return to_copy;
}

// Rewinds the borrowed body when curl needs to resend it (auth, redirects)
static int seek_callback(void* userdata, curl_off_t offset, int origin) {
    auto* rd = static_cast<ReadData*>(userdata);
    if (origin != SEEK_SET || offset < 0 || static_cast<size_t>(offset) > rd->size) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    rd->pos = static_cast<size_t>(offset);
    return CURL_SEEKFUNC_OK;
}

static int xferinfo_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    const auto& progress = *static_cast<const DownloadProgress*>(clientp);
    return progress(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal)) ? 0 : 1;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

private:
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            return handle;
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        if (!handle) return;

        // Reset options but keep the live connection cache
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

public:
    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create CURL handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        auto payload = request.payload();

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Part bodies are large; do not wait for a 100-continue round trip
        headers_list = curl_slist_append(headers_list, "Expect:");

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        ReadData read_data{payload.data(), payload.size(), 0};

        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
            curl_easy_setopt(curl, CURLOPT_SEEKFUNCTION, seek_callback);
            curl_easy_setopt(curl, CURLOPT_SEEKDATA, &read_data);
            // Explicit length (including 0) so servers never answer 411
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(payload.size()));
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(payload.size()));
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{curl, &response_body, config_.max_response_size, 0,
                                       false, &request.output_path, nullptr, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        if (request.progress) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &request.progress);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                         static_cast<long>(config_.keepalive_idle.count()));
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                         static_cast<long>(config_.keepalive_interval.count()));

        bool ssl_verify_enabled = request.verify_ssl && config_.verify_ssl_by_default;
        if (!ssl_verify_enabled) {
            static std::once_flag ssl_warning_flag;
            std::call_once(ssl_warning_flag, []() {
                log_warn("SSL verification disabled via configuration; "
                         "connections are exposed to man-in-the-middle attacks");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify_enabled ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify_enabled ? 2L : 0L);

        if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        // Proxy settings come only from configuration, never from the environment
        curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
        if (!config_.no_proxy.empty()) {
            curl_easy_setopt(curl, CURLOPT_NOPROXY, config_.no_proxy.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

        CURLcode res = curl_easy_perform(curl);

        if (res == CURLE_OK && !write_ctx.size_exceeded) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
            response.bytes_written = write_ctx.file_bytes;

            // Empty successful download still produces the file
            if (!request.output_path.empty() && response.ok() && !write_ctx.file) {
                write_ctx.file = fopen(request.output_path.c_str(), "wb");
                if (!write_ctx.file) {
                    write_ctx.file_error = true;
                }
            }
        } else if (write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (write_ctx.file_error) {
            response.error = "Failed to write " + request.output_path + ": " + strerror(errno);
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        if (write_ctx.file) {
            if (fclose(write_ctx.file) != 0) {
                write_ctx.file_error = true;
            }
        }
        if (write_ctx.file_error && response.error.empty()) {
            response.error = "Failed to write " + request.output_path;
            response.status_code = 0;
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);

        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request) {
        int retries = 0;
        auto delay = request.retry_delay;

        while (true) {
            HttpResponse response = execute(request);

            if (!response.is_network_error && !is_retryable_status(response.status_code)) {
                return response;
            }

            if (retries >= request.max_retries) {
                return response;
            }

            log_debug(2, "HTTP %s %s failed (%s), retrying in %ld ms",
                      method_name(request.method), request.url.c_str(),
                      response.error.empty() ? std::to_string(response.status_code).c_str()
                                             : response.error.c_str(),
                      static_cast<long>(delay.count()));
            std::this_thread::sleep_for(delay);

            delay *= 2;
            retries++;
        }
    }

private:
    HttpClientConfig config_;

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) {
    return impl_->execute_with_retry(request);
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string sha256_hex(std::span<const uint8_t> data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

static std::vector<uint8_t> hmac_sha256(std::span<const uint8_t> key, const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash, &hash_len);
    return std::vector<uint8_t>(hash, hash + hash_len);
}

// Query params arrive already encoded; SigV4 wants them sorted, with
// value-less ones ("uploads") written as "uploads=".
static std::string canonical_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq == std::string::npos) {
            params[param] = "";
        } else {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        }
        pos = amp + 1;
    }

    std::string result;
    for (const auto& [key, value] : params) {
        if (!result.empty()) result += '&';
        result += key + "=" + value;
    }
    return result;
}

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                               std::string region, std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char stamp[17];
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &tm);
    std::string datetime = stamp;
    std::string date = datetime.substr(0, 8);
    std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";

    request.headers.remove("Authorization");
    request.headers.set("Host", url->authority());
    request.headers.set("X-Amz-Date", datetime);
    std::string payload_hash = request.headers.get("X-Amz-Content-Sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.payload());
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    // all() is sorted by lowercase name, as the canonical form requires
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : request.headers.all()) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
    }

    std::string canonical_request = std::string(method_name(request.method)) + "\n" +
                                    (url->path.empty() ? "/" : url->path) + "\n" +
                                    canonical_query(url->query) + "\n" +
                                    canonical_headers + "\n" +
                                    signed_headers + "\n" +
                                    payload_hash;
    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" + scope + "\n" +
                                 sha256_hex(canonical_request);

    std::string secret = "AWS4" + secret_access_key_;
    auto key = hmac_sha256(std::span<const uint8_t>(
                               reinterpret_cast<const uint8_t*>(secret.data()), secret.size()),
                           date);
    for (const std::string& part : {region_, service_, std::string("aws4_request")}) {
        key = hmac_sha256(key, part);
    }
    auto signature = hmac_sha256(key, string_to_sign);

    request.headers.set("Authorization",
                        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope +
                            ", SignedHeaders=" + signed_headers +
                            ", Signature=" + to_hex(signature.data(), signature.size()));
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    if (!session_token.empty()) {
        request.headers.set("X-Amz-Security-Token", session_token);
    }
    sign(request);
}

}  // namespace snapbucket::net
