#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settlement::core {

/*
  Promotes held entries whose hold period has elapsed to available.

  One bulk update per call; entries already promoted are not selected
  again, so concurrent or repeated sweeps are harmless.
*/
class MaturityTransitioner {
 public:
  explicit MaturityTransitioner(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  // Returns the number of entries promoted.
  uint64_t Sweep();

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace settlement::core
