#include "snapbucket/transfer/uploader.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/transfer/archive_stream.hpp"
#include "snapbucket/transfer/chunk_sizer.hpp"
#include "snapbucket/transfer/object_key.hpp"

#include <memory>

namespace snapbucket {

SplitUploader::SplitUploader(ObjectStore& store, const ChunkSizer& sizer, UploadOptions options,
                             MetricsExporter* metrics)
    : store_(store)
    , sizer_(sizer)
    , options_(std::move(options))
    , metrics_(metrics) {}

MultipartOptions SplitUploader::object_options(const Snapshot& snapshot, uint64_t size_estimate,
                                               const std::string& content_type) const {
    MultipartOptions opts;
    opts.content_type = content_type;
    opts.storage_class = options_.storage_class;
    opts.metadata[constants::META_CREATION_TIME] = format_utc_offset(snapshot.created);
    opts.metadata[constants::META_VOLUME_SIZE] = std::to_string(snapshot.volume_size_gib) + " GiB";
    if (size_estimate > 1) {
        opts.metadata[constants::META_DISC_SIZE] = std::to_string(size_estimate);
    }
    return opts;
}

UploadSummary SplitUploader::upload(const Snapshot& snapshot, ByteSource& source,
                                    uint64_t size_estimate,
                                    std::chrono::system_clock::time_point unit_start) {
    ObjectKey key = make_object_key(snapshot, unit_start, options_.gzip);
    MultipartOptions opts = object_options(snapshot, size_estimate, key.content_type());

    bool split = size_estimate > options_.split_size;
    uint64_t boundary = split ? options_.split_size : constants::MAX_OBJECT_SIZE;
    if (split) {
        log_debug(2, "Splitting %s at %lu bytes (estimate %lu)", snapshot.id.c_str(),
                  static_cast<unsigned long>(boundary), static_cast<unsigned long>(size_estimate));
    } else {
        log_debug(2, "Uploading %s as a single object (%lu <= %lu)", snapshot.id.c_str(),
                  static_cast<unsigned long>(size_estimate),
                  static_cast<unsigned long>(options_.split_size));
    }

    UploadSummary summary;
    std::unique_ptr<MultipartSession> session;
    uint64_t in_object = 0;
    bool full = false;

    // Completes the current session and records the object
    auto close_session = [&] {
        const auto& done = session->complete();
        summary.objects.push_back({session->key(), session->bytes_uploaded(),
                                   static_cast<int>(session->parts().size()), done.etag});
        log_progress_done();
        log_info("Stored %s (%lu bytes)", store_.describe(session->key()).c_str(),
                 static_cast<unsigned long>(session->bytes_uploaded()));
        session.reset();
        in_object = 0;
        full = false;
    };

    std::vector<uint8_t> buffer;
    bool eof = false;
    while (!eof) {
        uint64_t want = sizer_.next(full ? 0 : in_object, boundary);
        buffer.resize(static_cast<size_t>(want));
        size_t got = source.read(buffer.data(), buffer.size());
        if (got < want) eof = true;
        if (got == 0) break;

        if (full) {
            if (!split) {
                throw SourceFailure("Archive of " + snapshot.id + " exceeds the maximum object size",
                                    snapshot.id);
            }
            close_session();
        }
        if (!session) {
            int number = static_cast<int>(summary.objects.size()) + 1;
            std::string object_key = split ? key.part(number) : key.single();
            log_info("Uploading %s", store_.describe(object_key).c_str());
            session = std::make_unique<MultipartSession>(store_, object_key, opts,
                                                         options_.retry, metrics_);
        }

        int part = session->upload_part({buffer.data(), got});
        in_object += got;
        summary.total_bytes += got;
        if (verbosity() > 0) {
            log_progress("Part # %d, Uploaded %.2f MiB (total)", part,
                         static_cast<double>(summary.total_bytes) / constants::MiB);
        } else {
            log_progress("Uploaded %.2f MiB (total)",
                         static_cast<double>(summary.total_bytes) / constants::MiB);
        }
        if (in_object >= boundary) full = true;
    }

    buffer.clear();
    buffer.shrink_to_fit();

    // A failing archiver must never produce a completed object
    source.finish();
    if (session) close_session();

    if (summary.objects.empty()) {
        throw SourceFailure("Archive of " + snapshot.id + " produced no data", snapshot.id);
    }
    return summary;
}

}  // namespace snapbucket
