#include "maturity_transitioner.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace settlement::core {

MaturityTransitioner::MaturityTransitioner(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

uint64_t MaturityTransitioner::Sweep() {
  const int64_t now_ms = util::ToUnixMillis(now_());

  auto     tx       = repository_->Begin();
  uint64_t promoted = 0;
  ThrowIfDbError(repository_->PromoteMaturedEntries(*tx, now_ms, promoted), "promote matured entries");
  tx->Commit();

  if (promoted > 0) {
    settlement::observability::Metrics::Instance().AddMaturedEntries(promoted);
    SETTLEMENT_LOG_INFO("matured ledger entries", {settlement::observability::IntField("promoted", static_cast<int64_t>(promoted))});
  }
  return promoted;
}

} // namespace settlement::core
