#include "memory_step_repository.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "internal/db/codec/url_codec.hpp"
#include "internal/db/common/step_allocation.hpp"
#include "internal/db/view/step_view.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stepdb::db::memory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

MemoryStepRepository::MemoryStepRepository(std::shared_ptr<const util::Clock> clock, api::StoreOptions options)
    : clock_(std::move(clock)),
      options_(options),
      identifier_validator_(options.max_name_length),
      next_fixture_row_id_(options.first_fixture_row_id) {
  if (!clock_) {
    throw std::invalid_argument("MemoryStepRepository requires a clock");
  }
}

model::StepRecord* MemoryStepRepository::Find(api::StepId stepid) {
  auto it = steps_.find(stepid);
  if (it == steps_.end()) return nullptr;
  return &it->second;
}

void MemoryStepRepository::Put(model::StepRecord record) {
  const auto id = record.id;
  if (!steps_.contains(id)) {
    insertion_order_.push_back(id);
  }
  steps_[id] = std::move(record);
}

api::AddStepResult MemoryStepRepository::AddStep(api::BuildId buildid, const std::string& name, const std::string& state_string) {
  string_validator_.Validate("state_string", state_string);
  identifier_validator_.Validate("name", name);

  std::optional<int32_t>          max_number;
  std::unordered_set<std::string> names;
  for (const auto& [_, record] : steps_) {
    if (record.buildid != buildid) continue;
    max_number = max_number ? std::max(*max_number, record.number) : record.number;
    names.insert(record.name);
  }

  api::AddStepResult result;
  result.number = common::NextStepNumber(max_number);
  result.name   = common::UniqueStepName(name, names);
  result.id     = common::SmallestUnusedId(options_.first_step_id, [this](api::StepId id) { return steps_.contains(id); });

  model::StepRecord record;
  record.id           = result.id;
  record.buildid      = buildid;
  record.number       = result.number;
  record.name         = result.name;
  record.state_string = state_string;
  Put(std::move(record));

  STEPDB_LOG_DEBUG("Step added", {IntField("stepid", result.id), IntField("buildid", buildid), IntField("number", result.number),
                                  StringField("name", result.name)});
  return result;
}

std::optional<stepdb::v1::StepView> MemoryStepRepository::GetStep(api::StepId stepid) {
  const auto* record = Find(stepid);
  if (!record) return std::nullopt;
  return view::ToView(*record);
}

std::optional<stepdb::v1::StepView> MemoryStepRepository::GetStepByBuild(api::BuildId buildid, std::optional<int32_t> number,
                                                                         const std::optional<std::string>& name) {
  if (!number && !name) {
    throw util::InvalidArguments("GetStepByBuild requires a number or a name");
  }

  for (auto id : insertion_order_) {
    const auto& record = steps_.at(id);
    if (record.buildid != buildid) continue;
    if (number && record.number != *number) continue;
    if (name && record.name != *name) continue;
    return view::ToView(record);
  }
  return std::nullopt;
}

std::vector<stepdb::v1::StepView> MemoryStepRepository::ListSteps(api::BuildId buildid) {
  std::vector<const model::StepRecord*> matches;
  for (auto id : insertion_order_) {
    const auto& record = steps_.at(id);
    if (record.buildid == buildid) matches.push_back(&record);
  }
  std::stable_sort(matches.begin(), matches.end(),
                   [](const model::StepRecord* a, const model::StepRecord* b) { return a->number < b->number; });

  std::vector<stepdb::v1::StepView> out;
  out.reserve(matches.size());
  for (const auto* record : matches) {
    out.push_back(view::ToView(*record));
  }
  return out;
}

void MemoryStepRepository::StartStep(api::StepId stepid, util::EpochSeconds started_at, bool locks_acquired) {
  auto* record = Find(stepid);
  if (!record) return;
  record->started_at = started_at;
  if (locks_acquired) {
    record->locks_acquired_at = started_at;
  }
}

void MemoryStepRepository::SetStepLocksAcquiredAt(api::StepId stepid, util::EpochSeconds locks_acquired_at) {
  auto* record = Find(stepid);
  if (!record) return;
  record->locks_acquired_at = locks_acquired_at;
}

void MemoryStepRepository::SetStepStateString(api::StepId stepid, const std::string& state_string) {
  string_validator_.Validate("state_string", state_string);
  auto* record = Find(stepid);
  if (!record) return;
  record->state_string = state_string;
}

void MemoryStepRepository::AddUrl(api::StepId stepid, const std::string& name, const std::string& url) {
  int_validator_.Validate("stepid", stepid);
  identifier_validator_.Validate("name", name);
  string_validator_.Validate("url", url);

  auto* record = Find(stepid);
  if (!record) return;

  auto urls = codec::DecodeUrls(record->urls_json);
  if (codec::AppendUnique(urls, {name, url})) {
    record->urls_json = codec::EncodeUrls(urls);
  }
}

void MemoryStepRepository::FinishStep(api::StepId stepid, std::optional<int32_t> results, bool hidden) {
  const auto now    = clock_->Seconds();
  auto*      record = Find(stepid);
  if (!record) return;
  record->complete_at = now;
  record->results     = results;
  record->hidden      = hidden ? 1 : 0;

  STEPDB_LOG_DEBUG("Step finished", {IntField("stepid", stepid), StringField("results", results ? std::to_string(*results) : "null"),
                                     BoolField("hidden", hidden)});
}

void MemoryStepRepository::InsertTestData(const std::vector<model::StepRow>& rows) {
  common::RequireBuildIds(rows);

  for (const auto& row : rows) {
    api::StepId id;
    if (row.id) {
      id = *row.id;
    } else {
      id                   = common::SmallestUnusedId(next_fixture_row_id_, [this](api::StepId candidate) { return steps_.contains(candidate); });
      next_fixture_row_id_ = id + 1;
    }

    auto record = common::RecordFromRow(row, id);
    if (steps_.contains(id)) {
      STEPDB_LOG_WARN("Fixture row replaces existing step", {IntField("stepid", id)});
    }
    Put(std::move(record));
  }

  STEPDB_LOG_DEBUG("Fixture rows inserted", {IntField("rows", static_cast<std::int64_t>(rows.size())),
                                             IntField("steps", static_cast<std::int64_t>(steps_.size()))});
}

std::optional<model::StepRecord> MemoryStepRepository::GetRecord(api::StepId stepid) const {
  auto it = steps_.find(stepid);
  if (it == steps_.end()) return std::nullopt;
  return it->second;
}

} // namespace stepdb::db::memory
