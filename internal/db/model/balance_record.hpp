#pragma once

#include <cstdint>

namespace settlement::db::model {

struct BalanceRecord {
  int64_t available_minor      = 0;
  int64_t held_minor           = 0;
  int64_t disputed_minor       = 0;
  int64_t lifetime_total_minor = 0;
};

} // namespace settlement::db::model
