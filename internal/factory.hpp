#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/scheduler/periodic_worker.hpp"

namespace settlement::factory {

/*
  Application

  Owns everything the server needs for the lifetime of the process:
  the gRPC adapters to register and the background workers to start.
*/
struct Application {
  std::shared_ptr<db::Repository>                                 repository;
  std::vector<std::unique_ptr<::grpc::Service>>                   grpc_services;
  std::vector<std::shared_ptr<settlement::scheduler::PeriodicWorker>> background_workers;
};

/*
  Build

  Constructs the entire backend based on runtime config. Workers are
  returned stopped.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const settlement::runtime::config::RuntimeConfig& config);

// Opens the configured store and creates its schema if missing.
std::shared_ptr<db::Repository> BuildRepository(const settlement::runtime::config::RuntimeConfig& config);

} // namespace settlement::factory
