#include "snapbucket/transfer/multipart_session.hpp"
#include "snapbucket/core/constants.hpp"
#include "snapbucket/core/digest.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/metrics.hpp"

#include <optional>

namespace snapbucket {

void count_retry(MetricsExporter* metrics) {
    if (metrics) metrics->part_retries().Increment();
}

MultipartSession::MultipartSession(ObjectStore& store, std::string key, MultipartOptions options,
                                   RetryPolicy retry, MetricsExporter* metrics)
    : store_(store)
    , key_(std::move(key))
    , retry_(retry)
    , metrics_(metrics) {
    auto result = retry_store_call(retry_, "create multipart upload", key_, metrics_, [&] {
        return store_.create_multipart_upload(key_, options);
    });
    if (!result.success) {
        throw StorageError("Cannot start upload of " + store_.describe(key_) + ": " +
                           result.error_message, key_);
    }
    upload_id_ = result.upload_id;
    log_debug(2, "Opened multipart upload %s for %s", upload_id_.c_str(), key_.c_str());
}

MultipartSession::~MultipartSession() {
    if (state_ == State::Open) {
        log_warn("Multipart upload of %s left open, aborting", key_.c_str());
        abort();
    }
}

int MultipartSession::upload_part(std::span<const uint8_t> data) {
    if (state_ != State::Open) {
        throw PartUploadFailed("Upload of " + key_ + " is no longer open", key_);
    }
    if (static_cast<int>(parts_.size()) >= constants::MAX_PARTS_PER_UPLOAD) {
        abort();
        throw PartUploadFailed("Upload of " + key_ + " exceeds " +
                               std::to_string(constants::MAX_PARTS_PER_UPLOAD) +
                               " parts; aborted", key_);
    }

    int part_number = static_cast<int>(parts_.size()) + 1;
    std::string content_md5 = md5_base64(data);

    PartResult result;
    {
        std::optional<ScopedTimer> timer;
        if (metrics_) timer.emplace(metrics_->part_upload_duration());
        result = retry_store_call(retry_, "Part upload", key_, metrics_, [&] {
            return store_.upload_part(key_, upload_id_, part_number, data, content_md5);
        });
    }

    if (!result.success) {
        log_error("Part %d of %s failed: %s. Aborting upload %s", part_number, key_.c_str(),
                  result.error_message.c_str(), upload_id_.c_str());
        abort();
        throw PartUploadFailed("Part " + std::to_string(part_number) + " of " + key_ +
                               " failed: " + result.error_message, key_);
    }

    parts_.push_back({part_number, result.etag, data.size()});
    bytes_uploaded_ += data.size();
    if (metrics_) {
        metrics_->parts_uploaded().Increment();
        metrics_->upload_bytes().Increment(static_cast<double>(data.size()));
    }
    return part_number;
}

const CompleteResult& MultipartSession::complete() {
    if (state_ == State::Completed) return completed_;
    if (state_ == State::Aborted) {
        throw CompleteFailed("Upload of " + key_ + " was aborted", key_);
    }

    auto result = retry_store_call(retry_, "Complete", key_, metrics_, [&] {
        return store_.complete_multipart_upload(key_, upload_id_, parts_);
    });
    if (!result.success) {
        log_error("Completing %s failed: %s. Aborting upload %s", key_.c_str(),
                  result.error_message.c_str(), upload_id_.c_str());
        abort();
        throw CompleteFailed("Cannot complete " + key_ + ": " + result.error_message, key_);
    }

    completed_ = std::move(result);
    state_ = State::Completed;
    if (metrics_) metrics_->objects_completed().Increment();
    log_debug(1, "Completed %s (%zu parts, %lu bytes)", store_.describe(key_).c_str(),
              parts_.size(), static_cast<unsigned long>(bytes_uploaded_));
    return completed_;
}

void MultipartSession::abort() {
    if (state_ != State::Open) return;
    state_ = State::Aborted;
    if (metrics_) metrics_->sessions_aborted().Increment();

    auto result = retry_store_call(retry_, "Abort", key_, metrics_, [&] {
        return store_.abort_multipart_upload(key_, upload_id_);
    });
    if (!result.success) {
        log_error("Abort of upload %s for %s failed: %s", upload_id_.c_str(), key_.c_str(),
                  result.error_message.c_str());
    } else {
        log_info("Aborted upload %s for %s", upload_id_.c_str(), key_.c_str());
    }
}

}  // namespace snapbucket
