#include "snapbucket/transfer/downloader.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/metrics.hpp"
#include "snapbucket/transfer/archive_stream.hpp"
#include "snapbucket/transfer/chunk_sizer.hpp"
#include "snapbucket/transfer/object_key.hpp"

#include <algorithm>
#include <map>

#include <unistd.h>

namespace snapbucket {

RestorePlan plan_restore(const ObjectStore& store, const std::string& prefix) {
    auto entries = list_all(store, prefix);
    if (entries.empty()) {
        throw StorageError("No objects found under " + store.describe(prefix), prefix);
    }

    RestorePlan plan;
    uint64_t listed = 0;
    for (const auto& entry : entries) listed += entry.size;

    if (entries.size() == 1) {
        plan.keys.push_back(entries.front().key);
    } else {
        std::map<int, std::string> by_part;
        for (const auto& entry : entries) {
            int number = split_part_number(entry.key);
            if (number == 0 || !by_part.emplace(number, entry.key).second) {
                throw StorageError("Prefix " + prefix + " matches more than one archive (" +
                                   entry.key + ")", prefix);
            }
        }
        int expected = 1;
        for (const auto& [number, key] : by_part) {
            if (number != expected) {
                throw StorageError("Part " + std::to_string(expected) + " missing under " +
                                   store.describe(prefix), prefix);
            }
            plan.keys.push_back(key);
            ++expected;
        }
    }
    plan.gzip = is_gzip_key(plan.keys.front());

    plan.size_bytes = listed;
    auto meta = store.head(plan.keys.front());
    if (meta) {
        auto it = meta->user_metadata.find(constants::META_DISC_SIZE);
        if (it != meta->user_metadata.end()) {
            try {
                uint64_t disc_size = std::stoull(it->second);
                if (disc_size >= 2) plan.size_bytes = disc_size;
            } catch (const std::exception&) {
                log_warn("Ignoring malformed %s metadata '%s' on %s", constants::META_DISC_SIZE,
                         it->second.c_str(), plan.keys.front().c_str());
            }
        }
    }

    log_debug(1, "Restoring %zu object(s), %lu bytes%s", plan.keys.size(),
              static_cast<unsigned long>(plan.size_bytes), plan.gzip ? " (gzip)" : "");
    return plan;
}

void prepare_restore_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ConfigurationError("Cannot create restore directory " + dir.string() + ": " +
                                 ec.message(), dir.string());
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        throw ConfigurationError("Restore directory " + dir.string() + " is not a directory",
                                 dir.string());
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        throw ConfigurationError("Restore directory " + dir.string() + " is not writable",
                                 dir.string());
    }
}

PartDownloader::PartDownloader(const ObjectStore& store, std::filesystem::path restore_dir,
                               const ChunkSizer& sizer, MetricsExporter* metrics)
    : store_(store)
    , restore_dir_(std::move(restore_dir))
    , sizer_(sizer)
    , metrics_(metrics) {}

std::filesystem::path PartDownloader::download(const std::string& key) {
    auto path = restore_dir_ / key;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("Cannot create " + path.parent_path().string() + ": " + ec.message(),
                           key);
    }

    log_info("Downloading %s", store_.describe(key).c_str());
    auto result = store_.get_to_file(key, path, [&key](uint64_t now, uint64_t total) {
        if (total > 0) {
            log_progress("%s  %.2f / %.2f MiB  (%.2f%%)", key.c_str(),
                         static_cast<double>(now) / constants::MiB,
                         static_cast<double>(total) / constants::MiB,
                         100.0 * static_cast<double>(now) / static_cast<double>(total));
        }
    });
    log_progress_done();

    if (!result.success) {
        std::filesystem::remove(path, ec);
        throw StorageError("Download of " + store_.describe(key) + " failed: " +
                           result.error_message, key);
    }
    return path;
}

uint64_t PartDownloader::restore(const RestorePlan& plan, ByteSink& sink) {
    uint64_t total = 0;
    for (const auto& key : plan.keys) {
        auto path = download(key);
        uint64_t copied = 0;
        try {
            copied = copy_file_to_sink(path, sink, sizer_);
        } catch (const std::exception&) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            throw;
        }
        std::error_code ec;
        std::filesystem::remove(path, ec);

        total += copied;
        if (metrics_) metrics_->restore_bytes().Increment(static_cast<double>(copied));
        log_debug(1, "Extracted %s (%lu bytes)", key.c_str(), static_cast<unsigned long>(copied));
    }
    return total;
}

}  // namespace snapbucket
