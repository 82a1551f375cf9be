#pragma once

#include <memory>

namespace narrative::core {
class CurationEngine;
}
namespace narrative::db {
class Repository;
}
namespace narrative::util {
class TimeSource;
}

namespace narrative::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<narrative::core::CurationEngine>  engine;
  std::shared_ptr<narrative::db::Repository>        repository;
  std::shared_ptr<const narrative::util::TimeSource> clock;
};

} // namespace narrative::service
