#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/step_repository.hpp"
#include "internal/db/api/types.hpp"
#include "internal/util/time.hpp"

namespace stepdb::factory {

/*
  Composition root: the ONLY place that knows concrete repository types.
*/

// Zero-valued config fields fall back to StoreOptions defaults.
db::api::StoreOptions ToStoreOptions(const stepdb::runtime::config::RuntimeConfig& config);

// database.backend: "memory" (default) or "sqlite".
std::shared_ptr<db::StepRepository> BuildStepRepository(const stepdb::runtime::config::RuntimeConfig& config,
                                                        std::shared_ptr<const util::Clock> clock);

} // namespace stepdb::factory
