#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/step_record.hpp"

namespace stepdb::db::model {

/*
  Fixture row for bulk preloading.

  Column defaults match what fixture authors expect from the steps table
  seeds. buildid is required; id is assigned by the repository when left
  empty. Nothing else is validated: fixtures may look invalid on purpose.
*/

struct StepRow {
  std::optional<StepId>  id;
  std::optional<BuildId> buildid;

  int32_t     number = 29;
  std::string name   = "step29";

  std::optional<util::EpochSeconds> started_at = 1304262222;
  std::optional<util::EpochSeconds> locks_acquired_at;
  std::optional<util::EpochSeconds> complete_at;

  std::string            state_string;
  std::optional<int32_t> results;

  std::string urls_json = "[]";
  int32_t     hidden    = 0;
};

} // namespace stepdb::db::model
