#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace settlement::core {

/*
  Chargebacks. Every held or available entry of the disputed order moves
  to disputed in one transaction. Entries already paid out, and entries
  in any other state, are left alone.
*/
class DisputeHandler {
 public:
  explicit DisputeHandler(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now, uint32_t max_attempts = 3);

  // The order is found by payment reference, falling back to order id.
  // Returns the number of entries moved; zero on redelivery.
  // Throws util::NotFound when neither identifies an order.
  uint64_t OpenDispute(const std::string& payment_ref, const std::string& order_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
  uint32_t                        max_attempts_;
};

} // namespace settlement::core
