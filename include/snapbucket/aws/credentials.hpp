#pragma once

#include "snapbucket/net/http.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace snapbucket::aws {

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::optional<std::chrono::system_clock::time_point> expiration;

    bool empty() const { return access_key_id.empty() || secret_access_key.empty(); }
};

class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    // Returns currently valid credentials; throws ControlPlaneError when none
    // can be obtained.
    virtual Credentials credentials() = 0;
};

class StaticCredentialProvider : public CredentialProvider {
public:
    explicit StaticCredentialProvider(Credentials creds) : creds_(std::move(creds)) {}
    Credentials credentials() override { return creds_; }

private:
    Credentials creds_;
};

/// Identity of the instance this process runs on, from the IMDS
/// instance-identity document.
struct InstanceIdentity {
    std::string instance_id;
    std::string region;
    std::string availability_zone;

    // Throws ControlPlaneError on malformed documents
    static InstanceIdentity from_json(const std::string& document);
};

/// Client for the EC2 instance metadata service. Uses the IMDSv2 session
/// token flow and falls back to plain IMDSv1 GETs when no token is issued.
class InstanceMetadataClient {
public:
    explicit InstanceMetadataClient(net::HttpClient& http,
                                    std::string endpoint = "http://169.254.169.254");

    std::string get(const std::string& path);

    InstanceIdentity identity();

    // Role credentials of the attached instance profile
    Credentials role_credentials();

private:
    std::string token();

    net::HttpClient& http_;
    std::string endpoint_;
    std::string token_;
    std::chrono::steady_clock::time_point token_expiry_{};
    bool token_unsupported_ = false;
};

/// Instance profile credentials, refreshed shortly before they expire.
class InstanceProfileCredentialProvider : public CredentialProvider {
public:
    explicit InstanceProfileCredentialProvider(std::shared_ptr<InstanceMetadataClient> imds);

    Credentials credentials() override;

private:
    std::shared_ptr<InstanceMetadataClient> imds_;
    std::mutex mutex_;
    std::optional<Credentials> cached_;
};

/// Signs `request` with SigV4 using the provider's current credentials.
void sign_request(net::HttpRequest& request, CredentialProvider& provider,
                  const std::string& region, const std::string& service);

// Parses an ISO-8601 UTC timestamp ("2024-05-01T12:00:00Z", optional
// fractional seconds). Returns nullopt when the text does not match.
std::optional<std::chrono::system_clock::time_point> parse_iso8601_utc(const std::string& text);

}  // namespace snapbucket::aws
