#include "snapbucket/aws/credentials.hpp"
#include "snapbucket/compute/ec2_volume_control.hpp"
#include "snapbucket/config.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/metrics.hpp"
#include "snapbucket/net/http.hpp"
#include "snapbucket/orchestrator/migration.hpp"
#include "snapbucket/orchestrator/restore.hpp"
#include "snapbucket/orchestrator/volume_lifecycle.hpp"
#include "snapbucket/storage/object_store.hpp"
#include "snapbucket/system/device_ops.hpp"

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <unistd.h>

using namespace snapbucket;

namespace {

int run(const MigrateConfig& config) {
    net::HttpClientConfig http_config;
    http_config.proxy_url = config.proxy;
    http_config.no_proxy = config.no_proxy;
    http_config.verify_ssl_by_default = config.store.verify_ssl;
    http_config.default_ca_bundle = config.store.ca_cert;
    net::HttpClient http(http_config);

    auto imds = std::make_shared<aws::InstanceMetadataClient>(http, constants::IMDS_ENDPOINT);
    auto identity = imds->identity();
    log_debug(1, "Running on %s in %s", identity.instance_id.c_str(),
              identity.availability_zone.c_str());

    std::shared_ptr<aws::CredentialProvider> credentials;
    if (!config.access_key_id.empty()) {
        credentials = std::make_shared<aws::StaticCredentialProvider>(aws::Credentials{
            config.access_key_id, config.secret_access_key, config.session_token, std::nullopt});
    } else {
        credentials = std::make_shared<aws::InstanceProfileCredentialProvider>(imds);
    }

    StoreConfig store_config = config.store;
    if (store_config.region.empty()) store_config.region = identity.region;
    auto store = ObjectStoreFactory::create(store_config, credentials, http_config);
    auto access = store->check_access();
    if (!access.success) {
        throw StorageError("Bucket " + store->describe("") + " is not accessible: " +
                           access.error_message, store_config.bucket);
    }

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{
                {"instance", identity.instance_id},
                {"mode", config.restore ? "restore" : "migrate"},
            });
        metrics->start();
    }

    Ec2VolumeControl control(http, credentials, identity.region, config.ec2_endpoint);
    SystemDeviceOps devices;

    VolumeSettings settings;
    settings.availability_zone = identity.availability_zone;
    settings.instance_id = identity.instance_id;
    settings.volume_type = config.volume_type;
    settings.iops = config.iops;
    settings.throughput = config.throughput;
    settings.tag = config.tag;
    settings.device = constants::ATTACH_DEVICE;
    VolumeLifecycle lifecycle(control, settings, {}, metrics.get());

    std::filesystem::create_directories(config.mount_point);

    if (config.restore) {
        RestoreOptions options;
        options.key = config.restore_key;
        options.mount_point = config.mount_point;
        options.restore_dir = config.restore_dir;
        options.boot = config.boot;

        RestoreSequencer sequencer(lifecycle, devices, *store, options, metrics.get());
        std::string volume_id = sequencer.run();
        std::cout << "Restored volume: " << volume_id << std::endl;
    } else {
        MigrationOptions options;
        options.mount_point = config.mount_point;
        options.tag = config.tag;
        options.delete_snapshot = config.delete_snapshot;
        options.upload.split_size = config.split_size;
        options.upload.storage_class = config.storage_class;
        options.upload.gzip = config.gzip;

        MigrationOrchestrator orchestrator(lifecycle, control, devices, *store, options,
                                           metrics.get());
        orchestrator.run();
    }

    if (metrics) metrics->stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = MigrateConfig::from_args(argc, argv);
    if (!config_opt) {
        return constants::EXIT_CONFIG_ERROR;
    }
    auto config = std::move(*config_opt);

    if (config.show_help) {
        MigrateConfig::print_usage();
        return 0;
    }
    if (config.show_version) {
        std::cout << "snapbucket " << constants::VERSION << std::endl;
        return 0;
    }

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return constants::EXIT_CONFIG_ERROR;
    }

    if (geteuid() != 0) {
        std::cerr << "You need to have root privileges to run this program.\n"
                     "Please try again, this time using 'sudo'. Exiting." << std::endl;
        return constants::EXIT_NOT_ROOT;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file " << config.log_file << std::endl;
            return constants::EXIT_CONFIG_ERROR;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    set_verbosity(config.verbosity);

    // A dead archiver must surface as EPIPE, not kill the process
    signal(SIGPIPE, SIG_IGN);

    try {
        return run(config);
    } catch (const ConfigurationError& e) {
        log_error("%s", e.what());
        return constants::EXIT_CONFIG_ERROR;
    } catch (const Error& e) {
        if (e.resource().empty()) {
            log_error("%s", e.what());
        } else {
            log_error("%s [%s]", e.what(), e.resource().c_str());
        }
        return constants::EXIT_RUNTIME_ERROR;
    } catch (const std::exception& e) {
        log_error("%s", e.what());
        return constants::EXIT_RUNTIME_ERROR;
    }
}
