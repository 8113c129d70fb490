#include "snapbucket/aws/credentials.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <ctime>

namespace snapbucket::aws {

std::optional<std::chrono::system_clock::time_point> parse_iso8601_utc(const std::string& text) {
    int year, month, day, hour, min, sec;
    if (sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d", &year, &month, &day, &hour, &min, &sec) != 6) {
        return std::nullopt;
    }
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t tt = timegm(&tm);
    if (tt == -1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

InstanceIdentity InstanceIdentity::from_json(const std::string& document) {
    try {
        auto j = nlohmann::json::parse(document);
        InstanceIdentity identity;
        identity.instance_id = j.at("instanceId").get<std::string>();
        identity.region = j.at("region").get<std::string>();
        identity.availability_zone = j.at("availabilityZone").get<std::string>();
        return identity;
    } catch (const nlohmann::json::exception& e) {
        throw ControlPlaneError(std::string("Malformed instance identity document: ") + e.what());
    }
}

InstanceMetadataClient::InstanceMetadataClient(net::HttpClient& http, std::string endpoint)
    : http_(http), endpoint_(std::move(endpoint)) {}

std::string InstanceMetadataClient::token() {
    if (token_unsupported_) {
        return "";
    }
    auto now = std::chrono::steady_clock::now();
    if (!token_.empty() && now < token_expiry_) {
        return token_;
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::PUT;
    request.url = endpoint_ + "/latest/api/token";
    request.headers.set("X-aws-ec2-metadata-token-ttl-seconds",
                        std::to_string(constants::IMDS_TOKEN_TTL_SECONDS));
    request.connect_timeout = std::chrono::milliseconds(2000);
    request.total_timeout = std::chrono::milliseconds(5000);

    auto response = http_.execute(request);
    if (!response.ok()) {
        log_debug(2, "IMDSv2 token unavailable (%s), using IMDSv1",
                  response.error.empty() ? std::to_string(response.status_code).c_str()
                                         : response.error.c_str());
        token_unsupported_ = true;
        return "";
    }

    token_ = response.body_string();
    // Renew well before the TTL runs out
    token_expiry_ = now + std::chrono::seconds(constants::IMDS_TOKEN_TTL_SECONDS / 2);
    return token_;
}

std::string InstanceMetadataClient::get(const std::string& path) {
    net::HttpRequest request = net::HttpRequest::get(endpoint_ + path);
    std::string tok = token();
    if (!tok.empty()) {
        request.headers.set("X-aws-ec2-metadata-token", tok);
    }
    request.connect_timeout = std::chrono::milliseconds(2000);
    request.total_timeout = std::chrono::milliseconds(5000);
    request.max_retries = 2;

    auto response = http_.execute_with_retry(request);
    if (!response.ok()) {
        throw ControlPlaneError("Instance metadata request " + path + " failed: " +
                                (response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                                        : response.error));
    }
    return response.body_string();
}

InstanceIdentity InstanceMetadataClient::identity() {
    return InstanceIdentity::from_json(get("/latest/dynamic/instance-identity/document"));
}

Credentials InstanceMetadataClient::role_credentials() {
    std::string roles = get("/latest/meta-data/iam/security-credentials/");
    std::string role = roles.substr(0, roles.find('\n'));
    if (role.empty()) {
        throw ControlPlaneError("No instance profile attached; supply credentials explicitly");
    }

    std::string document = get("/latest/meta-data/iam/security-credentials/" + role);
    try {
        auto j = nlohmann::json::parse(document);
        Credentials creds;
        creds.access_key_id = j.at("AccessKeyId").get<std::string>();
        creds.secret_access_key = j.at("SecretAccessKey").get<std::string>();
        creds.session_token = j.value("Token", "");
        if (j.contains("Expiration")) {
            creds.expiration = parse_iso8601_utc(j["Expiration"].get<std::string>());
        }
        return creds;
    } catch (const nlohmann::json::exception& e) {
        throw ControlPlaneError("Malformed credentials for role " + role + ": " + e.what());
    }
}

InstanceProfileCredentialProvider::InstanceProfileCredentialProvider(
    std::shared_ptr<InstanceMetadataClient> imds)
    : imds_(std::move(imds)) {}

Credentials InstanceProfileCredentialProvider::credentials() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::system_clock::now();
    if (cached_ && (!cached_->expiration ||
                    *cached_->expiration - constants::CREDENTIAL_REFRESH_WINDOW > now)) {
        return *cached_;
    }
    cached_ = imds_->role_credentials();
    log_debug(2, "Refreshed instance profile credentials");
    return *cached_;
}

void sign_request(net::HttpRequest& request, CredentialProvider& provider,
                  const std::string& region, const std::string& service) {
    Credentials creds = provider.credentials();
    net::AwsSigV4Signer signer(creds.access_key_id, creds.secret_access_key, region, service);
    signer.sign_with_token(request, creds.session_token);
}

}  // namespace snapbucket::aws
