#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/notification_allocator.hpp"
#include "internal/db/api/repository.hpp"

namespace notify::factory {

/*
  Application

  Owns the long-lived objects built from a RuntimeConfig.
*/
struct Application {
  std::shared_ptr<db::NotificationRepository>  repository;
  std::shared_ptr<core::NotificationAllocator> allocator;
};

/*
  Build

  Selects and bootstraps the configured store, then wires the allocator.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete DB types.
*/
Application Build(const notify::runtime::config::RuntimeConfig& config);

} // namespace notify::factory
