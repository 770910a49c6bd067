#include "internal/db/common/step_allocation.hpp"

#include <limits>

#include "internal/util/errors.hpp"

namespace stepdb::db::common {

std::string UniqueStepName(const std::string& name, const std::unordered_set<std::string>& taken) {
  if (!taken.contains(name)) {
    return name;
  }

  int suffix = 1;
  while (taken.contains(name + "_" + std::to_string(suffix))) {
    ++suffix;
  }
  return name + "_" + std::to_string(suffix);
}

int32_t NextStepNumber(std::optional<int32_t> max_number) {
  if (!max_number) return 0;

  const int64_t next = static_cast<int64_t>(*max_number) + 1;
  if (next > std::numeric_limits<int32_t>::max()) {
    throw util::InvalidArguments("step number " + std::to_string(next) + " exceeds the number column range");
  }
  return static_cast<int32_t>(next);
}

api::StepId SmallestUnusedId(api::StepId first, const std::function<bool(api::StepId)>& in_use) {
  api::StepId id = first;
  while (in_use(id)) {
    ++id;
  }
  return id;
}

void RequireBuildIds(const std::vector<model::StepRow>& rows) {
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i].buildid) continue;
    const std::string which = rows[i].id ? "steps row " + std::to_string(*rows[i].id) : "steps row at index " + std::to_string(i);
    throw util::InvalidArguments(which + " requires buildid");
  }
}

model::StepRecord RecordFromRow(const model::StepRow& row, api::StepId id) {
  if (!row.buildid) {
    throw util::InvalidArguments("steps row " + std::to_string(id) + " requires buildid");
  }

  model::StepRecord record;
  record.id                = id;
  record.buildid           = *row.buildid;
  record.number            = row.number;
  record.name              = row.name;
  record.started_at        = row.started_at;
  record.locks_acquired_at = row.locks_acquired_at;
  record.complete_at       = row.complete_at;
  record.state_string      = row.state_string;
  record.results           = row.results;
  record.urls_json         = row.urls_json;
  record.hidden            = row.hidden;
  return record;
}

} // namespace stepdb::db::common
