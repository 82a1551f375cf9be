#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/curation_limits.hpp"

namespace narrative::core {
class CurationEngine;
}
namespace narrative::db {
class Repository;
}

namespace narrative::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<narrative::db::Repository>     repository;
  std::shared_ptr<narrative::core::CurationEngine> engine;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root of the application. It is the ONLY place allowed to
  know concrete DB types.
*/
std::shared_ptr<narrative::db::Repository> BuildRepository(const narrative::runtime::config::RuntimeConfig& config);

// Zero-valued config fields keep the built-in defaults.
narrative::core::CurationLimits BuildLimits(const narrative::runtime::config::CurationConfig& config);

Application Build(const narrative::runtime::config::RuntimeConfig& config);

} // namespace narrative::factory
