#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/step_repository.hpp"
#include "internal/validation/validators.hpp"

namespace stepdb::db::memory {

/*
  Steps table held in a std::map keyed by step id.

  Single owner, no locking. insertion_order_ records the order in which ids
  first entered the table; "first match" lookups and number ties in
  ListSteps follow it. Replacing a row keeps its original position.
*/

class MemoryStepRepository final : public db::StepRepository {
 public:
  explicit MemoryStepRepository(std::shared_ptr<const util::Clock> clock, api::StoreOptions options = {});

  api::AddStepResult AddStep(api::BuildId buildid, const std::string& name, const std::string& state_string) override;

  std::optional<stepdb::v1::StepView> GetStep(api::StepId stepid) override;
  std::optional<stepdb::v1::StepView> GetStepByBuild(api::BuildId buildid, std::optional<int32_t> number,
                                                     const std::optional<std::string>& name) override;
  std::vector<stepdb::v1::StepView> ListSteps(api::BuildId buildid) override;

  void StartStep(api::StepId stepid, util::EpochSeconds started_at, bool locks_acquired) override;
  void SetStepLocksAcquiredAt(api::StepId stepid, util::EpochSeconds locks_acquired_at) override;
  void SetStepStateString(api::StepId stepid, const std::string& state_string) override;
  void AddUrl(api::StepId stepid, const std::string& name, const std::string& url) override;
  void FinishStep(api::StepId stepid, std::optional<int32_t> results, bool hidden) override;

  void InsertTestData(const std::vector<model::StepRow>& rows) override;

  // Raw row access for assertions on stored columns.
  std::optional<model::StepRecord> GetRecord(api::StepId stepid) const;

  size_t Size() const {
    return steps_.size();
  }

 private:
  model::StepRecord* Find(api::StepId stepid);
  void               Put(model::StepRecord record);

  std::shared_ptr<const util::Clock> clock_;
  api::StoreOptions                  options_;

  validation::StringValidator     string_validator_;
  validation::IdentifierValidator identifier_validator_;
  validation::IntValidator        int_validator_;

  std::map<api::StepId, model::StepRecord> steps_;
  std::vector<api::StepId>                 insertion_order_;
  api::StepId                              next_fixture_row_id_;
};

} // namespace stepdb::db::memory
