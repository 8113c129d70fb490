#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace snapbucket {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename, so a long migration can be watched while it runs.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file (empty = never written).
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Current registry contents in the text exposition format.
    std::string serialize() const;

    // --- Counters ---
    prometheus::Counter& migrations_success() { return *migrations_success_; }
    prometheus::Counter& migrations_failure() { return *migrations_failure_; }
    prometheus::Counter& restores_success() { return *restores_success_; }
    prometheus::Counter& restores_failure() { return *restores_failure_; }
    prometheus::Counter& parts_uploaded() { return *parts_uploaded_; }
    prometheus::Counter& upload_bytes() { return *upload_bytes_; }
    prometheus::Counter& restore_bytes() { return *restore_bytes_; }
    prometheus::Counter& part_retries() { return *part_retries_; }
    prometheus::Counter& objects_completed() { return *objects_completed_; }
    prometheus::Counter& sessions_aborted() { return *sessions_aborted_; }
    prometheus::Counter& volumes_compensated() { return *volumes_compensated_; }

    // --- Gauges ---
    prometheus::Gauge& chunk_size() { return *chunk_size_; }
    prometheus::Gauge& available_memory() { return *available_memory_; }

    // --- Histograms ---
    prometheus::Histogram& part_upload_duration() { return *part_upload_duration_; }
    prometheus::Histogram& unit_duration() { return *unit_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* migrations_success_;
    prometheus::Counter* migrations_failure_;
    prometheus::Counter* restores_success_;
    prometheus::Counter* restores_failure_;
    prometheus::Counter* parts_uploaded_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* restore_bytes_;
    prometheus::Counter* part_retries_;
    prometheus::Counter* objects_completed_;
    prometheus::Counter* sessions_aborted_;
    prometheus::Counter* volumes_compensated_;

    prometheus::Gauge* chunk_size_;
    prometheus::Gauge* available_memory_;

    prometheus::Histogram* part_upload_duration_;
    prometheus::Histogram* unit_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace snapbucket
