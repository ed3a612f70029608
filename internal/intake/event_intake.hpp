#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/intake/event_dispatcher.hpp"
#include "internal/intake/signature_verifier.hpp"
#include "internal/util/time.hpp"

namespace settlement::intake {

enum class Disposition {
  kApplied,
  kIgnored,
  kQueuedForRetry,
  kDeadLettered,
};

const char* DispositionName(Disposition disposition);

struct IntakeResult {
  std::string event_id;
  Disposition disposition = Disposition::kIgnored;
  // Set for kDeadLettered.
  std::string failed_event_id;
};

struct IntakeOptions {
  uint32_t                  max_inline_attempts = 3;
  std::chrono::milliseconds inline_backoff{100};
  // Covers every inline attempt and the backoff between them.
  std::chrono::milliseconds event_deadline{10000};
  // Delay before the retry queue first picks up an event.
  std::chrono::milliseconds retry_delay{1000};
};

/*
  Webhook boundary.

  1. verify the signature; on failure throw util::Unauthenticated and
     record nothing
  2. decode and dispatch, retrying retryable failures inline within
     the event deadline
  3. an event that still fails is captured, and acknowledged:
       retryable      -> retry queue
       anything else  -> dead letter (FailedEvent)

  Handle throws util::Transient only when the capture write itself
  failed, so the sender redelivers.
*/
class EventIntake {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  EventIntake(std::shared_ptr<db::Repository> repository, std::shared_ptr<SignatureVerifier> verifier, std::shared_ptr<EventDispatcher> dispatcher,
              IntakeOptions options = {}, util::NowFn now = util::Now, SleepFn sleep = {});

  IntakeResult Handle(std::string_view body, std::string_view signature);

  // Steps 2-3 for a body whose authenticity is already established.
  IntakeResult Process(std::string_view body);

 private:
  std::string DeadLetter(const ProcessorEvent& event, std::string_view body, const std::string& error);
  void        EnqueueRetry(const ProcessorEvent& event, std::string_view body, const std::string& error);

  IntakeResult Finish(const ProcessorEvent& event, Disposition disposition, std::string failed_event_id = {});

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<SignatureVerifier> verifier_;
  std::shared_ptr<EventDispatcher>   dispatcher_;
  IntakeOptions                      options_;
  util::NowFn                        now_;
  SleepFn                            sleep_;
};

} // namespace settlement::intake
