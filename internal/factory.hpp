#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/lifecycle_timers.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/worker/transform_pool.hpp"

namespace relay::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<worker::TransformPool>        transform_pool;
  std::shared_ptr<registry::ConnectionRegistry> registry;
  std::shared_ptr<service::RelayService>        relay_service;
  std::shared_ptr<lifecycle::LifecycleTimers>   timers;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Stops timers, closes every open connection (final flush) and
  // drains the transform pool.
  void Shutdown();
};

/*
  Build

  Constructs the entire backend based on runtime config. Timers and the
  transform pool are started; the gRPC server is not.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const relay::runtime::config::RuntimeConfig& config);

} // namespace relay::factory
