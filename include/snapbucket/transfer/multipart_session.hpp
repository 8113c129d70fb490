#pragma once

#include "snapbucket/storage/object_store.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace snapbucket {

class MetricsExporter;

struct RetryPolicy {
    int max_retries = 4;  // attempts after the first one
    std::chrono::milliseconds delay{4000};
};

enum class StoreOutcome {
    Success,
    Retryable,
    Fatal
};

inline StoreOutcome classify(const StoreStatus& status) {
    if (status.success) return StoreOutcome::Success;
    return status.retryable ? StoreOutcome::Retryable : StoreOutcome::Fatal;
}

// Increments the retry counter (no-op without metrics)
void count_retry(MetricsExporter* metrics);

/// Runs `call` until it succeeds, fails fatally, or the retry budget is
/// spent. Returns the last result.
template <typename Call>
auto retry_store_call(const RetryPolicy& policy, const char* what, const std::string& key,
                      MetricsExporter* metrics, Call&& call) -> decltype(call());

/// One remote object's multipart upload. Opened on construction; must end
/// completed or aborted. A session destroyed while still open aborts itself.
class MultipartSession {
public:
    enum class State {
        Open,
        Completed,
        Aborted
    };

    // Throws StorageError when the upload cannot be created
    MultipartSession(ObjectStore& store, std::string key, MultipartOptions options,
                     RetryPolicy retry = {}, MetricsExporter* metrics = nullptr);
    ~MultipartSession();

    MultipartSession(const MultipartSession&) = delete;
    MultipartSession& operator=(const MultipartSession&) = delete;

    /// Stores `data` as the next part (numbered from 1) and returns its
    /// number. On failure the session is aborted and PartUploadFailed thrown.
    int upload_part(std::span<const uint8_t> data);

    /// Completes the upload. Idempotent: later calls return the first
    /// result without contacting the store. Throws CompleteFailed (after
    /// aborting) when the store refuses.
    const CompleteResult& complete();

    /// Best-effort abort; never throws.
    void abort();

    State state() const { return state_; }
    const std::string& key() const { return key_; }
    const std::string& upload_id() const { return upload_id_; }
    const std::vector<CompletedPart>& parts() const { return parts_; }
    uint64_t bytes_uploaded() const { return bytes_uploaded_; }

private:
    ObjectStore& store_;
    std::string key_;
    RetryPolicy retry_;
    MetricsExporter* metrics_;

    std::string upload_id_;
    std::vector<CompletedPart> parts_;
    uint64_t bytes_uploaded_ = 0;
    State state_ = State::Open;
    CompleteResult completed_;
};

}  // namespace snapbucket

#include "snapbucket/core/log.hpp"

namespace snapbucket {

template <typename Call>
auto retry_store_call(const RetryPolicy& policy, const char* what, const std::string& key,
                      MetricsExporter* metrics, Call&& call) -> decltype(call()) {
    for (int attempt = 0;; ++attempt) {
        auto result = call();
        if (classify(result) != StoreOutcome::Retryable || attempt >= policy.max_retries) {
            return result;
        }
        log_warn("%s for %s failed (attempt %d of %d): %s",
                 what, key.c_str(), attempt + 1, policy.max_retries + 1,
                 result.error_message.c_str());
        count_retry(metrics);
        std::this_thread::sleep_for(policy.delay);
    }
}

}  // namespace snapbucket
