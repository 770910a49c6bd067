#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/step_record.hpp"
#include "internal/db/model/step_row.hpp"

namespace stepdb::db::common {

/*
  Allocation rules shared by every steps table backend.
*/

// name itself when free, else name_1, name_2, ... (smallest free suffix).
std::string UniqueStepName(const std::string& name, const std::unordered_set<std::string>& taken);

// 0 for an empty build, else max_number + 1. Throws util::InvalidArguments
// when the next number does not fit the number column.
int32_t NextStepNumber(std::optional<int32_t> max_number);

// Smallest id >= first for which in_use() is false.
api::StepId SmallestUnusedId(api::StepId first, const std::function<bool(api::StepId)>& in_use);

// Throws util::InvalidArguments naming the first row without a buildid.
// Called before a batch touches the table so a bad row rejects all of it.
void RequireBuildIds(const std::vector<model::StepRow>& rows);

// Throws util::InvalidArguments when the row has no buildid.
model::StepRecord RecordFromRow(const model::StepRow& row, api::StepId id);

} // namespace stepdb::db::common
