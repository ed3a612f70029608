#pragma once

#include <memory>

namespace settlement::core {
class OrderRegistry;
class PayoutProcessor;
class MaturityTransitioner;
} // namespace settlement::core
namespace settlement::intake {
class EventIntake;
class FailedEventReplayer;
} // namespace settlement::intake
namespace settlement::db {
class Repository;
}

namespace settlement::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<settlement::db::Repository>            repository;
  std::shared_ptr<settlement::core::OrderRegistry>        orders;
  std::shared_ptr<settlement::core::PayoutProcessor>      payouts;
  std::shared_ptr<settlement::core::MaturityTransitioner> maturity;
  std::shared_ptr<settlement::intake::EventIntake>        intake;
  std::shared_ptr<settlement::intake::FailedEventReplayer> replayer;
};

} // namespace settlement::service
