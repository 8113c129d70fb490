#include "snapbucket/compute/ec2_volume_control.hpp"
#include "snapbucket/aws/credentials.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/digest.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/net/xml.hpp"

#include <cctype>

namespace snapbucket {

const char* volume_state_to_string(VolumeState state) {
    switch (state) {
        case VolumeState::Creating: return "creating";
        case VolumeState::Available: return "available";
        case VolumeState::Attaching: return "attaching";
        case VolumeState::InUse: return "in-use";
        case VolumeState::Detaching: return "detaching";
        case VolumeState::Deleting: return "deleting";
        case VolumeState::Deleted: return "deleted";
        case VolumeState::Error: return "error";
    }
    return "unknown";
}

namespace {

std::string field(const std::string& item, const std::string& tag) {
    return xml::decode_entities(xml::get_element(item, tag));
}

// <tagSet><item><key/><value/></item>...</tagSet> as a map
std::map<std::string, std::string> parse_tag_set(const std::string& item) {
    std::map<std::string, std::string> tags;
    std::string tag_set = xml::get_element(item, "tagSet");
    for (const auto& range : xml::find_elements(tag_set, "item")) {
        std::string tag = xml::content(tag_set, range);
        tags[field(tag, "key")] = field(tag, "value");
    }
    return tags;
}

int to_int(const std::string& text) {
    try {
        return text.empty() ? 0 : std::stoi(text);
    } catch (const std::exception&) {
        return 0;
    }
}

VolumeState parse_state(const std::string& status, const std::string& attachment_status) {
    if (status == "creating") return VolumeState::Creating;
    if (status == "available") return VolumeState::Available;
    if (status == "in-use") {
        if (attachment_status == "attaching") return VolumeState::Attaching;
        if (attachment_status == "detaching") return VolumeState::Detaching;
        return VolumeState::InUse;
    }
    if (status == "deleting") return VolumeState::Deleting;
    if (status == "deleted") return VolumeState::Deleted;
    return VolumeState::Error;
}

}  // namespace

Ec2VolumeControl::Ec2VolumeControl(net::HttpClient& http,
                                   std::shared_ptr<aws::CredentialProvider> credentials,
                                   std::string region, std::string endpoint)
    : http_(http)
    , credentials_(std::move(credentials))
    , region_(std::move(region))
    , endpoint_(std::move(endpoint)) {
    if (endpoint_.empty()) {
        endpoint_ = "https://ec2." + region_ + ".amazonaws.com/";
    } else if (endpoint_.back() != '/') {
        endpoint_ += '/';
    }
}

std::string Ec2VolumeControl::encode_query(const std::string& action, const Params& params) {
    std::string body = "Action=" + net::url_encode(action) +
                       "&Version=" + net::url_encode(constants::EC2_API_VERSION);
    for (const auto& [name, value] : params) {
        body += "&" + net::url_encode(name) + "=" + net::url_encode(value);
    }
    return body;
}

Ec2VolumeControl::QueryResult Ec2VolumeControl::query(const std::string& action,
                                                      const Params& params) {
    auto request = net::HttpRequest::post(endpoint_, encode_query(action, params));
    request.headers.set_content_type("application/x-www-form-urlencoded; charset=utf-8");
    aws::sign_request(request, *credentials_, region_, "ec2");

    log_debug(3, "EC2 %s", action.c_str());
    auto response = http_.execute_with_retry(request);

    QueryResult result;
    result.status_code = response.status_code;
    result.body = response.body_string();
    if (response.is_network_error || response.status_code == 0) {
        result.error_code = "NetworkError";
        result.error_message = response.error.empty() ? "network error" : response.error;
    } else if (!response.ok()) {
        result.error_code = xml::get_element(result.body, "Code");
        result.error_message = xml::decode_entities(xml::get_element(result.body, "Message"));
        if (result.error_code.empty()) {
            result.error_code = "HTTP " + std::to_string(response.status_code);
        }
    }
    return result;
}

std::string Ec2VolumeControl::call(const std::string& action, const Params& params,
                                   const std::string& resource) {
    auto result = query(action, params);
    if (!result.error_code.empty()) {
        std::string message = action + " failed: " + result.error_code;
        if (!result.error_message.empty()) message += ": " + result.error_message;
        throw ControlPlaneError(message, resource);
    }
    return result.body;
}

// ============================================================================
// Snapshots
// ============================================================================

std::string Ec2VolumeControl::parse_snapshots(const std::string& xml, std::vector<Snapshot>& out) {
    std::string snapshot_set = xml::get_element(xml, "snapshotSet");
    for (const auto& range : xml::find_elements(snapshot_set, "item")) {
        std::string item = xml::content(snapshot_set, range);
        auto tags = parse_tag_set(item);
        std::string own = xml::remove_element(item, "tagSet");

        Snapshot snapshot;
        snapshot.id = field(own, "snapshotId");
        snapshot.volume_size_gib = to_int(field(own, "volumeSize"));
        auto created = aws::parse_iso8601_utc(field(own, "startTime"));
        if (created) snapshot.created = *created;
        for (const auto& [key, value] : tags) {
            std::string lower = key;
            for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower == "name") {
                snapshot.name = value;
                break;
            }
        }
        if (snapshot.name.empty()) snapshot.name = snapshot.id;
        out.push_back(std::move(snapshot));
    }

    // nextToken of the reply itself follows the snapshot set
    size_t after = xml.find("</snapshotSet>");
    return xml::get_element(xml, "nextToken", after == std::string::npos ? 0 : after);
}

std::vector<Snapshot> Ec2VolumeControl::list_snapshots(const std::string& tag,
                                                       const std::string& value) {
    std::vector<Snapshot> snapshots;
    std::string token;
    do {
        Params params = {
            {"Filter.1.Name", "tag:" + tag},
            {"Filter.1.Value.1", value},
        };
        if (!token.empty()) params["NextToken"] = token;
        token = parse_snapshots(call("DescribeSnapshots", params, tag + "=" + value), snapshots);
    } while (!token.empty());

    log_debug(1, "Found %zu snapshots tagged %s=%s", snapshots.size(), tag.c_str(), value.c_str());
    return snapshots;
}

void Ec2VolumeControl::delete_snapshot(const std::string& snapshot_id) {
    call("DeleteSnapshot", {{"SnapshotId", snapshot_id}}, snapshot_id);
}

void Ec2VolumeControl::tag_resource(const std::string& resource_id,
                                    const std::map<std::string, std::string>& tags) {
    Params params = {{"ResourceId.1", resource_id}};
    int n = 1;
    for (const auto& [key, value] : tags) {
        params["Tag." + std::to_string(n) + ".Key"] = key;
        params["Tag." + std::to_string(n) + ".Value"] = value;
        ++n;
    }
    call("CreateTags", params, resource_id);
}

// ============================================================================
// Volumes
// ============================================================================

Ec2VolumeControl::Params Ec2VolumeControl::create_volume_params(const VolumeRequest& request) {
    Params params = {
        {"AvailabilityZone", request.availability_zone},
        {"ClientToken", random_hex(16)},
        {"Encrypted", "false"},
        {"VolumeType", request.volume_type},
    };
    if (!request.snapshot_id.empty()) {
        params["SnapshotId"] = request.snapshot_id;
    } else {
        params["Size"] = std::to_string(request.size_gib);
    }
    if (request.iops) params["Iops"] = std::to_string(*request.iops);
    if (request.throughput) params["Throughput"] = std::to_string(*request.throughput);
    if (!request.tags.empty()) {
        params["TagSpecification.1.ResourceType"] = "volume";
        int n = 1;
        for (const auto& [key, value] : request.tags) {
            params["TagSpecification.1.Tag." + std::to_string(n) + ".Key"] = key;
            params["TagSpecification.1.Tag." + std::to_string(n) + ".Value"] = value;
            ++n;
        }
    }
    return params;
}

std::string Ec2VolumeControl::create_volume(const VolumeRequest& request) {
    // One token per volume: transport retries resend the same body, so EC2
    // answers a replayed CreateVolume with the volume it already created.
    std::string resource = request.snapshot_id.empty() ? "new volume" : request.snapshot_id;
    std::string volume_id =
        field(call("CreateVolume", create_volume_params(request), resource), "volumeId");
    if (volume_id.empty()) {
        throw ControlPlaneError("CreateVolume returned no volume id", resource);
    }
    return volume_id;
}

std::optional<Volume> Ec2VolumeControl::parse_volume(const std::string& xml) {
    std::string volume_set = xml::get_element(xml, "volumeSet");
    auto items = xml::find_elements(volume_set, "item");
    if (items.empty()) return std::nullopt;

    std::string item = xml::content(volume_set, items.front());
    std::string attachment_set = xml::get_element(item, "attachmentSet");
    std::string own = xml::remove_element(xml::remove_element(item, "attachmentSet"), "tagSet");

    Volume volume;
    volume.id = field(own, "volumeId");
    volume.snapshot_id = field(own, "snapshotId");
    volume.size_gib = to_int(field(own, "size"));

    std::string attachment_status;
    auto attachments = xml::find_elements(attachment_set, "item");
    if (!attachments.empty()) {
        std::string attachment = xml::content(attachment_set, attachments.front());
        volume.instance_id = field(attachment, "instanceId");
        volume.device = field(attachment, "device");
        attachment_status = field(attachment, "status");
    }
    volume.state = parse_state(field(own, "status"), attachment_status);
    return volume;
}

Volume Ec2VolumeControl::describe_volume(const std::string& volume_id) {
    auto result = query("DescribeVolumes", {{"VolumeId.1", volume_id}});
    if (result.error_code == "InvalidVolume.NotFound") {
        Volume gone;
        gone.id = volume_id;
        gone.state = VolumeState::Deleted;
        return gone;
    }
    if (!result.error_code.empty()) {
        throw ControlPlaneError("DescribeVolumes failed: " + result.error_code +
                                (result.error_message.empty() ? "" : ": " + result.error_message),
                                volume_id);
    }

    auto volume = parse_volume(result.body);
    if (!volume) {
        Volume gone;
        gone.id = volume_id;
        gone.state = VolumeState::Deleted;
        return gone;
    }
    return *volume;
}

void Ec2VolumeControl::attach_volume(const std::string& volume_id, const std::string& instance_id,
                                     const std::string& device) {
    call("AttachVolume", {{"Device", device}, {"InstanceId", instance_id}, {"VolumeId", volume_id}},
         volume_id);
}

void Ec2VolumeControl::detach_volume(const std::string& volume_id, bool force) {
    call("DetachVolume", {{"Force", force ? "true" : "false"}, {"VolumeId", volume_id}}, volume_id);
}

void Ec2VolumeControl::delete_volume(const std::string& volume_id) {
    call("DeleteVolume", {{"VolumeId", volume_id}}, volume_id);
}

}  // namespace snapbucket
