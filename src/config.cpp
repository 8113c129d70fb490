#include "snapbucket/config.hpp"
#include "snapbucket/core/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <regex>
#include <nlohmann/json.hpp>

namespace snapbucket {

// --- Validation tables ---

const std::vector<VolumeTypeRule>& volume_type_rules() {
    static const std::vector<VolumeTypeRule> rules = {
        {"gp3", 3000, 16000, 125, 1000},
        {"io1", 100, 64000, 0, 0},
        {"io2", 100, 64000, 0, 0},
    };
    return rules;
}

const std::vector<std::string>& volume_types() {
    static const std::vector<std::string> types = {
        "standard", "io1", "io2", "gp2", "gp3", "sc1", "st1",
    };
    return types;
}

const std::vector<std::string>& storage_classes() {
    static const std::vector<std::string> classes = {
        "STANDARD", "REDUCED_REDUNDANCY", "STANDARD_IA", "ONEZONE_IA",
        "GLACIER", "INTELLIGENT_TIERING", "DEEP_ARCHIVE",
    };
    return classes;
}

std::optional<uint64_t> parse_split_size(const std::string& text) {
    static const std::regex pattern(R"(^([\d\.]+)(b|k|m|g|t)$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(text, m, pattern)) return std::nullopt;

    double value = 0;
    try {
        size_t used = 0;
        value = std::stod(m[1].str(), &used);
        if (used != m[1].str().size()) return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }

    switch (std::tolower(static_cast<unsigned char>(m[2].str()[0]))) {
        case 't': value *= 1024.0;
            [[fallthrough]];
        case 'g': value *= 1024.0;
            [[fallthrough]];
        case 'm': value *= 1024.0;
            [[fallthrough]];
        case 'k': value *= 1024.0;
            break;
        default: break;
    }
    // Larger than any valid split; validate() reports it
    if (value > 1e18) return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(std::ceil(value));
}

// --- MigrateConfig ---

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

bool parse_int(const char* text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (text[used] != '\0') return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

const char* first_env(std::initializer_list<const char*> names) {
    for (const char* name : names) {
        const char* v = std::getenv(name);
        if (v && *v) return v;
    }
    return nullptr;
}

}  // namespace

void MigrateConfig::print_usage() {
    std::cerr <<
        "Usage: snapbucket -b <bucket> [options]\n"
        "       snapbucket -b <bucket> -r -k <key> [options]\n"
        "\n"
        "Moves tagged EBS snapshots into an S3 bucket as tar archives, or\n"
        "restores such an archive into a new volume.\n"
        "\n"
        "Required:\n"
        "  -b, --bucket <name>              S3 bucket to push snapshots in\n"
        "\n"
        "Migration:\n"
        "  -t, --tag <tag>                  Tag on snapshots (default: snap-to-bucket)\n"
        "      --type <type>                Volume type: standard, io1, io2, gp2, gp3,\n"
        "                                   sc1, st1 (default: gp2)\n"
        "      --iops <n>                   Volume IOPS (gp3, io1, io2 only)\n"
        "      --throughput <MiB/s>         Volume throughput, 125-1000 (gp3 only)\n"
        "      --storage-class <class>      Storage class for objects (default: STANDARD)\n"
        "  -m, --mount <dir>                Mount point for disks (default: /mnt/snaps)\n"
        "  -d, --delete                     Delete snapshot after transfer. Use with caution!\n"
        "  -s, --split <size>               Split archives in objects no bigger than\n"
        "                                   <size> (suffix b,k,m,g,t; default: 5t)\n"
        "  -g, --gzip                       Compress archives with gzip\n"
        "\n"
        "Restore:\n"
        "  -r, --restore                    Restore a snapshot\n"
        "  -k, --key <key>                  Key of the snapshot to restore\n"
        "      --boot                       The snapshot was a bootable volume\n"
        "      --restore-dir <dir>          Scratch directory for downloaded objects\n"
        "                                   (default: /tmp/snap-to-bucket)\n"
        "\n"
        "Storage:\n"
        "      --store-type <s3|local>      Object store type (default: s3)\n"
        "      --store-path <dir>           Root directory of a local store\n"
        "      --s3-endpoint <url>          Endpoint for S3-compatible stores\n"
        "      --s3-region <region>         Bucket region (default: instance region)\n"
        "      --s3-path-style              Use path-style bucket addressing\n"
        "      --no-verify-ssl              Skip SSL verification\n"
        "      --ca-cert <path>             CA certificate bundle\n"
        "      --ec2-endpoint <url>         Endpoint for the EC2 API\n"
        "\n"
        "General:\n"
        "      --config <path>              JSON config file\n"
        "      --proxy <url>                Proxy to use (default: $http_proxy)\n"
        "      --noproxy <hosts>            Hosts not to proxy (default: $no_proxy)\n"
        "      --log-file <path>            Append output to this file\n"
        "      --metrics-file <path>        Prometheus .prom file for node_exporter textfile collector\n"
        "      --metrics-interval <secs>    Metrics write interval (default: 15)\n"
        "  -v, --verbose                    Increase verbosity (-vvv for more)\n"
        "      --version                    Show the version and exit\n"
        "  -h, --help                       Show this help\n";
}

std::optional<MigrateConfig> MigrateConfig::from_args(int argc, char* argv[]) {
    MigrateConfig config;

    std::string inline_value;
    bool has_inline = false;
    auto next_arg = [&](int& i, const std::string& name) -> const char* {
        if (has_inline) return inline_value.c_str();
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // --name=value
        has_inline = false;
        if (arg.compare(0, 2, "--") == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        // -v, -vv, -vvv
        if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
            arg.find_first_not_of('v', 1) == std::string::npos) {
            config.verbosity += static_cast<int>(arg.size() - 1);
            continue;
        }

        if (arg == "-b" || arg == "--bucket") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.store.bucket = v;
        } else if (arg == "-t" || arg == "--tag") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.tag = v;
        } else if (arg == "--type") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.volume_type = lower(v);
        } else if (arg == "--iops") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            int n = 0;
            if (!parse_int(v, n)) {
                std::cerr << "Error: --iops expects an integer, got '" << v << "'\n";
                return std::nullopt;
            }
            config.iops = n;
        } else if (arg == "--throughput") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            int n = 0;
            if (!parse_int(v, n)) {
                std::cerr << "Error: --throughput expects an integer, got '" << v << "'\n";
                return std::nullopt;
            }
            config.throughput = n;
        } else if (arg == "--storage-class") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.storage_class = upper(v);
        } else if (arg == "-m" || arg == "--mount") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.mount_point = v;
        } else if (arg == "-d" || arg == "--delete") {
            config.delete_snapshot = true;
        } else if (arg == "-s" || arg == "--split") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.split_text = v;
        } else if (arg == "-g" || arg == "--gzip") {
            config.gzip = true;
        } else if (arg == "-r" || arg == "--restore") {
            config.restore = true;
        } else if (arg == "-k" || arg == "--key") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.restore_key = v;
        } else if (arg == "--boot") {
            config.boot = true;
        } else if (arg == "--restore-dir") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.restore_dir = v;
        } else if (arg == "--proxy") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.proxy = v;
        } else if (arg == "--noproxy") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.no_proxy = v;
        } else if (arg == "--store-type") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.store.type = lower(v);
        } else if (arg == "--store-path") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.store.path = v;
        } else if (arg == "--s3-endpoint") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.store.endpoint = v;
        } else if (arg == "--s3-region") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.store.region = v;
        } else if (arg == "--s3-path-style") {
            config.store.use_path_style = true;
        } else if (arg == "--no-verify-ssl") {
            config.store.verify_ssl = false;
        } else if (arg == "--ca-cert") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.store.ca_cert = v;
        } else if (arg == "--ec2-endpoint") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.ec2_endpoint = v;
        } else if (arg == "--config") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--verbose") {
            ++config.verbosity;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            int n = 0;
            if (!parse_int(v, n) || n <= 0) {
                std::cerr << "Error: --metrics-interval expects a positive integer\n";
                return std::nullopt;
            }
            config.metrics_interval_secs = static_cast<size_t>(n);
        } else if (arg == "--version") {
            config.show_version = true;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }

        if (has_inline && (arg == "-d" || arg == "--delete" || arg == "--gzip" ||
                           arg == "--restore" || arg == "--boot" || arg == "--s3-path-style" ||
                           arg == "--no-verify-ssl" || arg == "--verbose" ||
                           arg == "--version" || arg == "--help")) {
            std::cerr << "Error: " << arg << " takes no value\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool MigrateConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("bucket")) store.bucket = j["bucket"].get<std::string>();
        if (j.contains("tag")) tag = j["tag"].get<std::string>();
        if (j.contains("type")) volume_type = lower(j["type"].get<std::string>());
        if (j.contains("iops")) iops = j["iops"].get<int>();
        if (j.contains("throughput")) throughput = j["throughput"].get<int>();
        if (j.contains("storage_class")) storage_class = upper(j["storage_class"].get<std::string>());
        if (j.contains("mount")) mount_point = j["mount"].get<std::string>();
        if (j.contains("delete")) delete_snapshot = j["delete"].get<bool>();
        if (j.contains("split")) split_text = j["split"].get<std::string>();
        if (j.contains("gzip")) gzip = j["gzip"].get<bool>();
        if (j.contains("restore")) restore = j["restore"].get<bool>();
        if (j.contains("key")) restore_key = j["key"].get<std::string>();
        if (j.contains("boot")) boot = j["boot"].get<bool>();
        if (j.contains("restore_dir")) restore_dir = j["restore_dir"].get<std::string>();
        if (j.contains("proxy")) proxy = j["proxy"].get<std::string>();
        if (j.contains("no_proxy")) no_proxy = j["no_proxy"].get<std::string>();
        if (j.contains("ec2_endpoint")) ec2_endpoint = j["ec2_endpoint"].get<std::string>();
        if (j.contains("verbose")) verbosity = j["verbose"].get<int>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("store") && j["store"].is_object()) {
            auto& js = j["store"];
            if (js.contains("type")) store.type = lower(js["type"].get<std::string>());
            if (js.contains("path")) store.path = js["path"].get<std::string>();
            if (js.contains("endpoint")) store.endpoint = js["endpoint"].get<std::string>();
            if (js.contains("region")) store.region = js["region"].get<std::string>();
            if (js.contains("path_style")) store.use_path_style = js["path_style"].get<bool>();
            if (js.contains("verify_ssl")) store.verify_ssl = js["verify_ssl"].get<bool>();
            if (js.contains("ca_cert")) store.ca_cert = js["ca_cert"].get<std::string>();
        }

        if (j.contains("credentials") && j["credentials"].is_object()) {
            auto& jc = j["credentials"];
            if (jc.contains("access_key_id")) access_key_id = jc["access_key_id"].get<std::string>();
            if (jc.contains("secret_access_key"))
                secret_access_key = jc["secret_access_key"].get<std::string>();
            if (jc.contains("session_token")) session_token = jc["session_token"].get<std::string>();
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void MigrateConfig::apply_defaults() {
    if (proxy.empty()) {
        if (const char* v = first_env({"http_proxy", "HTTP_PROXY", "https_proxy", "HTTPS_PROXY"})) {
            proxy = v;
        }
    }
    if (no_proxy.empty()) {
        if (const char* v = first_env({"no_proxy", "NO_PROXY"})) {
            no_proxy = v;
        }
    }
    // The metadata service must never go through a proxy
    if (!proxy.empty() && no_proxy.find(constants::IMDS_HOST) == std::string::npos) {
        if (!no_proxy.empty()) no_proxy += ",";
        no_proxy += constants::IMDS_HOST;
    }

    if (access_key_id.empty() && secret_access_key.empty()) {
        if (const char* v = std::getenv("AWS_ACCESS_KEY_ID")) access_key_id = v;
        if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY")) secret_access_key = v;
        if (const char* v = std::getenv("AWS_SESSION_TOKEN")) session_token = v;
    }
    if (store.region.empty()) {
        if (const char* v = first_env({"AWS_REGION", "AWS_DEFAULT_REGION"})) store.region = v;
    }

    if (throughput) {
        throughput = std::clamp(*throughput, 125, 1000);
    }

    if (auto parsed = parse_split_size(split_text)) {
        split_size = *parsed;
    }
}

std::string MigrateConfig::validate() const {
    if (store.type == "s3") {
        if (store.bucket.empty()) return "bucket is required (-b/--bucket)";
    } else if (store.type == "local") {
        if (store.path.empty()) return "local store requires a directory (--store-path)";
    } else {
        return "unknown store type: " + store.type;
    }

    const auto& types = volume_types();
    if (std::find(types.begin(), types.end(), volume_type) == types.end()) {
        return "unsupported volume type: " + volume_type;
    }

    const VolumeTypeRule* rule = nullptr;
    for (const auto& r : volume_type_rules()) {
        if (volume_type == r.type) rule = &r;
    }
    if (iops) {
        if (!rule || rule->min_iops == 0) {
            return "Can set IOPS only for gp3, io1 & io2 type volume, " + volume_type + " set";
        }
        if (*iops < rule->min_iops || *iops > rule->max_iops) {
            return volume_type + " supports " + std::to_string(rule->min_iops) + "-" +
                   std::to_string(rule->max_iops) + " IOPS, " + std::to_string(*iops) + " passed";
        }
    }
    if (throughput && (!rule || rule->min_throughput == 0)) {
        return "Only gp3 supports throughput, " + volume_type + " passed";
    }

    const auto& classes = storage_classes();
    if (std::find(classes.begin(), classes.end(), storage_class) == classes.end()) {
        return "unsupported storage class: " + storage_class;
    }

    auto split = parse_split_size(split_text);
    if (!split) return split_text + " not in <size><b|k|m|g|t> format";
    if (*split > constants::MAX_SPLIT_SIZE) {
        return "Can not have split size greater than 5t, " + split_text + " provided";
    }
    if (*split < constants::MIN_SPLIT_SIZE) {
        return "Can not have split size lesser than 5m, " + split_text + " provided";
    }

    if (restore && restore_key.empty()) return "restore requires a key (-k/--key)";
    if (mount_point.empty()) return "mount point is required (-m/--mount)";
    if (metrics_interval_secs == 0) return "metrics interval must be > 0";
    return {};
}

}  // namespace snapbucket
