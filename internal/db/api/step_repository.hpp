#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/step_row.hpp"
#include "internal/util/time.hpp"
#include "stepdb/v1.hpp"

namespace stepdb::db {

/*
  Steps table abstraction.

  GUARANTEES (all backends):

  - numbers are 0, 1, 2, ... per build with no gaps
  - names are unique per build ("compile", "compile_1", ...)
  - a step's URL list never holds two identical {name, url} pairs
  - unknown step ids are absence, never errors:
      lookups return std::nullopt, mutators do nothing

  Shape violations throw util::ValidationError.
*/

class StepRepository {
 public:
  virtual ~StepRepository() = default;

  // ---------------------------------------------------------------------
  // Creation
  // ---------------------------------------------------------------------

  virtual api::AddStepResult AddStep(api::BuildId buildid, const std::string& name, const std::string& state_string) = 0;

  // ---------------------------------------------------------------------
  // Lookup
  // ---------------------------------------------------------------------

  virtual std::optional<stepdb::v1::StepView> GetStep(api::StepId stepid) = 0;

  // Throws util::InvalidArguments when neither number nor name is given.
  virtual std::optional<stepdb::v1::StepView> GetStepByBuild(api::BuildId buildid, std::optional<int32_t> number,
                                                             const std::optional<std::string>& name) = 0;

  // Ordered by number.
  virtual std::vector<stepdb::v1::StepView> ListSteps(api::BuildId buildid) = 0;

  // ---------------------------------------------------------------------
  // Mutation
  // ---------------------------------------------------------------------

  virtual void StartStep(api::StepId stepid, util::EpochSeconds started_at, bool locks_acquired) = 0;

  virtual void SetStepLocksAcquiredAt(api::StepId stepid, util::EpochSeconds locks_acquired_at) = 0;

  virtual void SetStepStateString(api::StepId stepid, const std::string& state_string) = 0;

  virtual void AddUrl(api::StepId stepid, const std::string& name, const std::string& url) = 0;

  // complete_at comes from the repository's clock. Repeatable; last call wins.
  virtual void FinishStep(api::StepId stepid, std::optional<int32_t> results, bool hidden) = 0;

  // ---------------------------------------------------------------------
  // Fixtures
  // ---------------------------------------------------------------------

  // Copies rows verbatim, bypassing every AddStep rule except that
  // buildid must be set.
  virtual void InsertTestData(const std::vector<model::StepRow>& rows) = 0;
};

} // namespace stepdb::db
