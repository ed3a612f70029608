#include "event_intake.hpp"

#include <algorithm>
#include <thread>

#include "internal/intake/dead_letter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace settlement::intake {

using settlement::observability::IntField;
using settlement::observability::StringField;

const char* DispositionName(Disposition disposition) {
  switch (disposition) {
    case Disposition::kApplied:
      return "applied";
    case Disposition::kIgnored:
      return "ignored";
    case Disposition::kQueuedForRetry:
      return "queued_for_retry";
    case Disposition::kDeadLettered:
      return "dead_lettered";
  }
  return "unknown";
}

EventIntake::EventIntake(std::shared_ptr<db::Repository> repository, std::shared_ptr<SignatureVerifier> verifier,
                         std::shared_ptr<EventDispatcher> dispatcher, IntakeOptions options, util::NowFn now, SleepFn sleep)
    : repository_(std::move(repository)),
      verifier_(std::move(verifier)),
      dispatcher_(std::move(dispatcher)),
      options_(options),
      now_(std::move(now)),
      sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

IntakeResult EventIntake::Handle(std::string_view body, std::string_view signature) {
  verifier_->Verify(body, signature);
  return Process(body);
}

IntakeResult EventIntake::Process(std::string_view body) {
  ProcessorEvent event;
  try {
    event = DecodeEvent(body);
  } catch (const util::ValidationError& e) {
    event = PeekEnvelope(body);
    return Finish(event, Disposition::kDeadLettered, DeadLetter(event, body, e.what()));
  }

  const auto deadline = now_() + options_.event_deadline;
  const auto attempts = std::max<uint32_t>(1, options_.max_inline_attempts);
  auto       backoff  = options_.inline_backoff;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      const auto dispatched = dispatcher_->Dispatch(event);
      return Finish(event, dispatched == DispatchResult::kApplied ? Disposition::kApplied : Disposition::kIgnored);
    } catch (const std::exception& e) {
      if (!util::IsRetryable(e)) {
        return Finish(event, Disposition::kDeadLettered, DeadLetter(event, body, e.what()));
      }

      const bool out_of_time = now_() + backoff >= deadline;
      if (attempt >= attempts || out_of_time) {
        EnqueueRetry(event, body, out_of_time ? std::string("event deadline exceeded: ") + e.what() : std::string(e.what()));
        return Finish(event, Disposition::kQueuedForRetry);
      }

      SETTLEMENT_LOG_WARN("event failed, retrying inline", {StringField("event_id", event.event_id), IntField("attempt", attempt),
                                                            StringField("error", e.what())});
      sleep_(backoff);
      backoff *= 2;
    }
  }
}

IntakeResult EventIntake::Finish(const ProcessorEvent& event, Disposition disposition, std::string failed_event_id) {
  settlement::observability::Metrics::Instance().RecordEventOutcome(event.event_type, DispositionName(disposition));
  return IntakeResult{event.event_id, disposition, std::move(failed_event_id)};
}

std::string EventIntake::DeadLetter(const ProcessorEvent& event, std::string_view body, const std::string& error) {
  auto record = MakeFailedEvent(event.event_id, event.event_type, std::string(body), event.order_id, error, util::ToUnixMillis(now_()));

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertFailedEvent(*tx, record);
    if (!result) {
      throw std::runtime_error(result.message);
    }
    tx->Commit();
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("failed to dead-letter event", {StringField("event_id", event.event_id), StringField("event_type", event.event_type),
                                                         StringField("error", error), StringField("capture_error", e.what())});
    throw util::Transient("could not record failed event " + event.event_id + ": " + e.what());
  }

  SETTLEMENT_LOG_ERROR("event dead-lettered", {StringField("event_id", event.event_id), StringField("event_type", event.event_type),
                                               StringField("order_id", event.order_id), StringField("failed_event_id", record.id),
                                               StringField("error", error), StringField("raw_payload", record.raw_payload)});
  return record.id;
}

void EventIntake::EnqueueRetry(const ProcessorEvent& event, std::string_view body, const std::string& error) {
  const int64_t now_ms = util::ToUnixMillis(now_());

  db::model::RetryRecord record;
  record.id                 = util::NewId();
  record.event_id           = event.event_id;
  record.event_type         = event.event_type;
  record.raw_payload        = std::string(body);
  record.order_id           = event.order_id;
  record.attempts           = 0;
  record.next_attempt_at_ms = now_ms + options_.retry_delay.count();
  record.last_error         = error;
  record.created_at_ms      = now_ms;

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->EnqueueRetry(*tx, record);
    if (!result) {
      throw std::runtime_error(result.message);
    }
    tx->Commit();
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("failed to queue event for retry", {StringField("event_id", event.event_id), StringField("error", error),
                                                             StringField("capture_error", e.what())});
    throw util::Transient("could not queue event " + event.event_id + " for retry: " + e.what());
  }

  SETTLEMENT_LOG_WARN("event queued for retry", {StringField("event_id", event.event_id), StringField("event_type", event.event_type),
                                                 StringField("retry_id", record.id), StringField("error", error)});
}

} // namespace settlement::intake
