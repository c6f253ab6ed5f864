#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/collaborators/calendar_service.hpp"
#include "internal/collaborators/reasoning_service.hpp"
#include "internal/core/goal_manager.hpp"
#include "internal/db/api/repository.hpp"

namespace goalgraph::factory {

/*
  Application

  Owns the long-lived objects of one process.
*/
struct Application {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<core::GoalManager> manager;
};

/*
  Composition root: the only place that knows concrete repository types.
  The returned manager is already hydrated from the repository.
*/
Application Build(const goalgraph::runtime::config::RuntimeConfig& config, std::shared_ptr<collaborators::ReasoningService> reasoning,
                  std::shared_ptr<collaborators::CalendarService> calendar);

std::shared_ptr<db::Repository> BuildRepository(const goalgraph::runtime::config::RuntimeConfig& config);

} // namespace goalgraph::factory
