#pragma once

#include <memory>

#include "internal/core/dispute_handler.hpp"
#include "internal/core/payout_processor.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/intake/processor_event.hpp"

namespace settlement::intake {

enum class DispatchResult {
  // The event changed the ledger.
  kApplied,
  // Redelivery, unknown event type, or a status with no ledger effect.
  kIgnored,
};

/*
  Routes a decoded event to the component that owns it. Exceptions from
  the components propagate unchanged; classifying them is the caller's
  job.
*/
class EventDispatcher {
 public:
  EventDispatcher(std::shared_ptr<core::SettlementEngine> settlement, std::shared_ptr<core::PayoutProcessor> payouts,
                  std::shared_ptr<core::DisputeHandler> disputes);

  DispatchResult Dispatch(const ProcessorEvent& event);

 private:
  std::shared_ptr<core::SettlementEngine> settlement_;
  std::shared_ptr<core::PayoutProcessor>  payouts_;
  std::shared_ptr<core::DisputeHandler>   disputes_;
};

} // namespace settlement::intake
