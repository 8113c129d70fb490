#include "snapbucket/metrics.hpp"
#include "snapbucket/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace snapbucket {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& units_family = prometheus::BuildCounter()
        .Name("snapbucket_units_total")
        .Help("Transfer units processed")
        .Labels(labels)
        .Register(*registry_);
    migrations_success_ = &units_family.Add({{"direction", "migrate"}, {"result", "success"}});
    migrations_failure_ = &units_family.Add({{"direction", "migrate"}, {"result", "failure"}});
    restores_success_ = &units_family.Add({{"direction", "restore"}, {"result", "success"}});
    restores_failure_ = &units_family.Add({{"direction", "restore"}, {"result", "failure"}});

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    parts_uploaded_ = &counter_reg("snapbucket_parts_uploaded_total", "Multipart parts stored");
    upload_bytes_ = &counter_reg("snapbucket_upload_bytes_total", "Archive bytes uploaded");
    restore_bytes_ = &counter_reg("snapbucket_restore_bytes_total", "Archive bytes fed to the extractor");
    part_retries_ = &counter_reg("snapbucket_part_retries_total", "Retried object store calls");
    objects_completed_ = &counter_reg("snapbucket_objects_completed_total", "Objects completed");
    sessions_aborted_ = &counter_reg("snapbucket_sessions_aborted_total", "Multipart sessions aborted");
    volumes_compensated_ = &counter_reg("snapbucket_volumes_compensated_total",
                                        "Volumes deleted by failure compensation");

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    chunk_size_ = &gauge_reg("snapbucket_chunk_size_bytes", "Size of the most recent chunk read");
    available_memory_ = &gauge_reg("snapbucket_available_memory_bytes",
                                   "Available memory at the most recent sample");

    // --- Histograms ---

    part_upload_duration_ = &prometheus::BuildHistogram()
        .Name("snapbucket_part_upload_duration_seconds")
        .Help("Part upload duration in seconds, retries included")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 120, 300, 600, 1800});

    unit_duration_ = &prometheus::BuildHistogram()
        .Name("snapbucket_unit_duration_seconds")
        .Help("Duration of a whole migration or restore unit in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            60, 300, 900, 1800, 3600, 7200, 14400, 28800, 86400});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

std::string MetricsExporter::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_debug(1, "Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_debug(1, "Cannot replace metrics file %s: %s",
                  prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace snapbucket
