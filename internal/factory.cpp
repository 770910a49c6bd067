#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_step_repository.hpp"
#include "internal/observability/logging.hpp"
#if STEPDB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_step_repository.hpp"
#endif

namespace stepdb::factory {

using observability::IntField;
using observability::StringField;

db::api::StoreOptions ToStoreOptions(const stepdb::runtime::config::RuntimeConfig& config) {
  db::api::StoreOptions options;
  const auto&           store = config.store();
  if (store.first_step_id() != 0) {
    options.first_step_id = store.first_step_id();
  }
  if (store.max_name_length() != 0) {
    options.max_name_length = store.max_name_length();
  }
  if (store.first_fixture_row_id() != 0) {
    options.first_fixture_row_id = store.first_fixture_row_id();
  }
  return options;
}

std::shared_ptr<db::StepRepository> BuildStepRepository(const stepdb::runtime::config::RuntimeConfig& config,
                                                        std::shared_ptr<const util::Clock> clock) {
  const auto options = ToStoreOptions(config);
  const auto backend = config.database().backend().empty() ? std::string("memory") : config.database().backend();

  STEPDB_LOG_INFO("Building step repository", {StringField("backend", backend), IntField("first_step_id", options.first_step_id),
                                               IntField("max_name_length", static_cast<std::int64_t>(options.max_name_length))});

  if (backend == "memory") {
    return std::make_shared<db::memory::MemoryStepRepository>(std::move(clock), options);
  }

  if (backend == "sqlite") {
#if STEPDB_DB_SQLITE
    const auto path      = config.database().sqlite().path().empty() ? std::string(":memory:") : config.database().sqlite().path();
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    return std::make_shared<db::sqlite::SqliteStepRepository>(std::move(sqlite_db), std::move(clock), options);
#else
    throw std::runtime_error("stepdb was built without SQLite support");
#endif
  }

  throw std::runtime_error("Unknown database backend: " + backend);
}

} // namespace stepdb::factory
