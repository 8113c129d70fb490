#pragma once

#include "snapbucket/compute/volume_control.hpp"
#include "snapbucket/net/http.hpp"

#include <map>
#include <memory>
#include <string>

namespace snapbucket {

namespace aws {
class CredentialProvider;
}

/// VolumeControl over the EC2 Query API (form-encoded POST, XML replies,
/// SigV4 service "ec2").
class Ec2VolumeControl : public VolumeControl {
public:
    // `endpoint` overrides https://ec2.<region>.amazonaws.com
    Ec2VolumeControl(net::HttpClient& http, std::shared_ptr<aws::CredentialProvider> credentials,
                     std::string region, std::string endpoint = {});

    std::vector<Snapshot> list_snapshots(const std::string& tag, const std::string& value) override;
    std::string create_volume(const VolumeRequest& request) override;
    Volume describe_volume(const std::string& volume_id) override;
    void attach_volume(const std::string& volume_id, const std::string& instance_id,
                       const std::string& device) override;
    void detach_volume(const std::string& volume_id, bool force) override;
    void delete_volume(const std::string& volume_id) override;
    void delete_snapshot(const std::string& snapshot_id) override;
    void tag_resource(const std::string& resource_id,
                      const std::map<std::string, std::string>& tags) override;

    using Params = std::map<std::string, std::string>;

    // Form body for `action` with `params`, keys in sorted order
    static std::string encode_query(const std::string& action, const Params& params);

    // CreateVolume parameters, including a fresh ClientToken
    static Params create_volume_params(const VolumeRequest& request);

    // Parses a DescribeSnapshots reply, appending to `out`. Returns nextToken.
    static std::string parse_snapshots(const std::string& xml, std::vector<Snapshot>& out);

    // Parses the first volume of a DescribeVolumes reply
    static std::optional<Volume> parse_volume(const std::string& xml);

private:
    struct QueryResult {
        int status_code = 0;
        std::string body;
        std::string error_code;
        std::string error_message;
    };

    QueryResult query(const std::string& action, const Params& params);
    // query(), throwing ControlPlaneError on failure
    std::string call(const std::string& action, const Params& params, const std::string& resource);

    net::HttpClient& http_;
    std::shared_ptr<aws::CredentialProvider> credentials_;
    std::string region_;
    std::string endpoint_;
};

}  // namespace snapbucket
