#include "retry_queue_worker.hpp"

#include <algorithm>

#include "internal/core/db_errors.hpp"
#include "internal/intake/dead_letter.hpp"
#include "internal/intake/processor_event.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace settlement::retry {

using settlement::observability::IntField;
using settlement::observability::StringField;

namespace {

// base * 2^(attempts-1), capped at one hour.
int64_t BackoffMs(std::chrono::milliseconds base, uint32_t attempts) {
  constexpr int64_t kMaxBackoffMs = 60LL * 60 * 1000;
  int64_t           delay         = std::max<int64_t>(base.count(), 1);
  for (uint32_t i = 1; i < attempts && delay < kMaxBackoffMs; ++i) {
    delay *= 2;
  }
  return std::min(delay, kMaxBackoffMs);
}

} // namespace

RetryQueueWorker::RetryQueueWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<intake::EventDispatcher> dispatcher,
                                   RetryQueueOptions options, util::NowFn now)
    : repository_(std::move(repository)),
      dispatcher_(std::move(dispatcher)),
      options_(options),
      now_(std::move(now)),
      owner_("retry-worker-" + util::NewId()) {
}

DrainStats RetryQueueWorker::DrainOnce() {
  DrainStats stats;

  while (stats.claimed < options_.batch_size) {
    std::optional<db::model::RetryRecord> record;
    {
      auto tx = repository_->Begin();
      record  = repository_->ClaimNextRetry(*tx, owner_, util::ToUnixMillis(now_()), options_.lease.count());
      tx->Commit();
    }
    if (!record) {
      break;
    }
    ++stats.claimed;

    try {
      dispatcher_->Dispatch(intake::DecodeEvent(record->raw_payload));
    } catch (const std::exception& e) {
      Fail(std::move(*record), e, stats);
      continue;
    }
    Complete(*record);
    ++stats.resolved;
  }

  auto tx          = repository_->Begin();
  const auto depth = repository_->CountRetries(*tx);
  tx->Commit();
  settlement::observability::Metrics::Instance().SetRetryQueueDepth(depth);

  if (stats.claimed > 0) {
    SETTLEMENT_LOG_INFO("retry queue drained", {IntField("claimed", stats.claimed), IntField("resolved", stats.resolved),
                                                IntField("rescheduled", stats.rescheduled), IntField("dead_lettered", stats.dead_lettered),
                                                IntField("depth", static_cast<int64_t>(depth))});
  }
  return stats;
}

void RetryQueueWorker::Complete(const db::model::RetryRecord& record) {
  auto tx = repository_->Begin();
  core::ThrowIfDbError(repository_->DeleteRetry(*tx, record.id), "delete retry " + record.id);
  tx->Commit();
  settlement::observability::Metrics::Instance().RecordEventOutcome(record.event_type, "applied");
}

void RetryQueueWorker::Fail(db::model::RetryRecord record, const std::exception& error, DrainStats& stats) {
  const int64_t now_ms = util::ToUnixMillis(now_());
  ++record.attempts;
  record.last_error = error.what();

  if (util::IsRetryable(error) && record.attempts < options_.max_attempts) {
    record.next_attempt_at_ms  = now_ms + BackoffMs(options_.base_backoff, record.attempts);
    record.lease_owner.clear();
    record.lease_expires_at_ms = 0;

    auto tx = repository_->Begin();
    core::ThrowIfDbError(repository_->UpdateRetry(*tx, record), "reschedule retry " + record.id);
    tx->Commit();

    ++stats.rescheduled;
    SETTLEMENT_LOG_WARN("queued event failed again", {StringField("event_id", record.event_id), IntField("attempts", record.attempts),
                                                      IntField("next_attempt_at_ms", record.next_attempt_at_ms), StringField("error", record.last_error)});
    return;
  }

  const auto failed = intake::MakeFailedEvent(record, record.last_error, now_ms);

  auto tx = repository_->Begin();
  core::ThrowIfDbError(repository_->InsertFailedEvent(*tx, failed), "dead-letter retry " + record.id);
  core::ThrowIfDbError(repository_->DeleteRetry(*tx, record.id), "delete retry " + record.id);
  tx->Commit();

  ++stats.dead_lettered;
  settlement::observability::Metrics::Instance().RecordEventOutcome(record.event_type, "dead_lettered");
  SETTLEMENT_LOG_ERROR("queued event dead-lettered", {StringField("event_id", record.event_id), StringField("event_type", record.event_type),
                                                      StringField("failed_event_id", failed.id), IntField("attempts", record.attempts),
                                                      StringField("error", record.last_error)});
}

} // namespace settlement::retry
