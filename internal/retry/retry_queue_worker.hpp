#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/intake/event_dispatcher.hpp"
#include "internal/util/time.hpp"

namespace settlement::retry {

struct RetryQueueOptions {
  // Claimed rows stay invisible to other workers this long.
  std::chrono::milliseconds lease{30000};
  // Attempts from the queue before the event is dead-lettered.
  uint32_t                  max_attempts = 5;
  std::chrono::milliseconds base_backoff{1000};
  uint32_t                  batch_size = 50;
};

struct DrainStats {
  uint32_t claimed       = 0;
  uint32_t resolved      = 0;
  uint32_t rescheduled   = 0;
  uint32_t dead_lettered = 0;
};

/*
  Drains the durable retry queue.

  Each row is claimed with a lease, re-dispatched, then:
    success                         -> deleted
    retryable, attempts remaining   -> rescheduled with exponential backoff
    otherwise                       -> moved to the dead letters (one
                                       transaction: insert + delete)

  A worker that dies mid-event leaves the lease to expire, after which
  another worker picks the row up.
*/
class RetryQueueWorker {
 public:
  RetryQueueWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<intake::EventDispatcher> dispatcher, RetryQueueOptions options = {},
                   util::NowFn now = util::Now);

  // Processes up to batch_size due rows.
  DrainStats DrainOnce();

  const std::string& owner() const {
    return owner_;
  }

 private:
  void Complete(const db::model::RetryRecord& record);
  void Fail(db::model::RetryRecord record, const std::exception& error, DrainStats& stats);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<intake::EventDispatcher> dispatcher_;
  RetryQueueOptions                        options_;
  util::NowFn                              now_;
  std::string                              owner_;
};

} // namespace settlement::retry
