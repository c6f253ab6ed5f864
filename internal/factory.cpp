#include "factory.hpp"

#include <stdexcept>

#include "internal/config/engine_options.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace goalgraph::factory {

std::shared_ptr<db::Repository> BuildRepository(const goalgraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    GOALGRAPH_LOG_INFO("Using SQLite repository",
                       {observability::StringField("path", sqlite.path()), observability::BoolField("wal_mode", sqlite.wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  GOALGRAPH_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const goalgraph::runtime::config::RuntimeConfig& config, std::shared_ptr<collaborators::ReasoningService> reasoning,
                  std::shared_ptr<collaborators::CalendarService> calendar) {
  if (!reasoning || !calendar) {
    throw std::invalid_argument("reasoning and calendar collaborators are required");
  }

  Application app;
  app.repository = BuildRepository(config);
  app.manager    = std::make_shared<core::GoalManager>(app.repository, std::move(reasoning), std::move(calendar),
                                                    goalgraph::config::ResolveEngineOptions(config));
  app.manager->Hydrate();
  return app;
}

} // namespace goalgraph::factory
