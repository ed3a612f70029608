#include "failed_event_replayer.hpp"

#include <optional>
#include <vector>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::intake {

using settlement::observability::IntField;
using settlement::observability::StringField;

FailedEventReplayer::FailedEventReplayer(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventDispatcher> dispatcher, util::NowFn now)
    : repository_(std::move(repository)), dispatcher_(std::move(dispatcher)), now_(std::move(now)) {
}

ReplayOutcome FailedEventReplayer::Replay(const std::string& failed_event_id) {
  // The read transaction must be gone before dispatch opens its own.
  std::optional<db::model::FailedEventRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetFailedEvent(*tx, failed_event_id);
    tx->Commit();
  }
  if (!record) {
    throw util::NotFound("failed event " + failed_event_id + " not found");
  }
  return ReplayRecord(std::move(*record));
}

ReplayBatchOutcome FailedEventReplayer::ReplayUnresolved(uint32_t limit) {
  std::vector<db::model::FailedEventRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListFailedEvents(*tx, false, limit);
    tx->Commit();
  }

  ReplayBatchOutcome batch;
  for (auto& record : pending) {
    ++batch.attempted;
    const auto outcome = ReplayRecord(std::move(record));
    if (outcome.resolved) {
      ++batch.resolved;
    } else {
      ++batch.failed;
    }
  }

  if (batch.attempted > 0) {
    SETTLEMENT_LOG_INFO("replayed failed events", {IntField("attempted", batch.attempted), IntField("resolved", batch.resolved),
                                                   IntField("failed", batch.failed)});
  }
  return batch;
}

ReplayOutcome FailedEventReplayer::ReplayRecord(db::model::FailedEventRecord record) {
  ReplayOutcome outcome;
  if (record.resolved_at_ms) {
    outcome.resolved         = true;
    outcome.already_resolved = true;
    return outcome;
  }

  try {
    dispatcher_->Dispatch(DecodeEvent(record.raw_payload));
    outcome.resolved     = true;
    record.resolved_at_ms = util::ToUnixMillis(now_());
  } catch (const std::exception& e) {
    outcome.error_message = e.what();
    record.error_message  = e.what();
    ++record.replay_attempts;
  }

  {
    auto tx = repository_->Begin();
    core::ThrowIfDbError(repository_->UpdateFailedEvent(*tx, record), "update failed event " + record.id);
    tx->Commit();
  }

  if (outcome.resolved) {
    SETTLEMENT_LOG_INFO("failed event resolved", {StringField("failed_event_id", record.id), StringField("event_id", record.event_id)});
  } else {
    SETTLEMENT_LOG_WARN("failed event replay failed", {StringField("failed_event_id", record.id), StringField("event_id", record.event_id),
                                                       IntField("replay_attempts", record.replay_attempts), StringField("error", outcome.error_message)});
  }
  return outcome;
}

} // namespace settlement::intake
