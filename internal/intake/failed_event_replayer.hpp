#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/intake/event_dispatcher.hpp"
#include "internal/util/time.hpp"

namespace settlement::intake {

struct ReplayOutcome {
  bool        resolved         = false;
  bool        already_resolved = false;
  std::string error_message;
};

struct ReplayBatchOutcome {
  uint32_t attempted = 0;
  uint32_t resolved  = 0;
  uint32_t failed    = 0;
};

/*
  Reprocesses dead-lettered events once the underlying problem is
  fixed. Success stamps resolved_at; failure records the new error and
  bumps replay_attempts. Replaying a resolved event is a successful
  no-op.
*/
class FailedEventReplayer {
 public:
  FailedEventReplayer(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventDispatcher> dispatcher, util::NowFn now = util::Now);

  // Throws util::NotFound for an unknown id.
  ReplayOutcome Replay(const std::string& failed_event_id);

  // Oldest unresolved first, at most limit events.
  ReplayBatchOutcome ReplayUnresolved(uint32_t limit);

 private:
  ReplayOutcome ReplayRecord(db::model::FailedEventRecord record);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  util::NowFn                      now_;
};

} // namespace settlement::intake
