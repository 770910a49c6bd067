#pragma once

#include <memory>

#include "internal/db/api/step_repository.hpp"
#include "internal/validation/validators.hpp"
#include "sqlite_db.hpp"

namespace stepdb::db::sqlite {

/*
  Steps table backed by SQLite.

  Creates the steps table on construction. No uniqueness constraints are
  declared: fixture rows may break them on purpose, and AddStep enforces
  the real rules itself.
*/

class SqliteStepRepository final : public db::StepRepository {
 public:
  SqliteStepRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<const util::Clock> clock, api::StoreOptions options = {});

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

 private:
  void                             BootstrapSchema();
  bool                             Exists(api::StepId stepid);
  std::optional<model::StepRecord> FetchRecord(api::StepId stepid);
  void                             WriteRecord(const model::StepRecord& record);

  std::shared_ptr<SqliteDB>          db_;
  std::shared_ptr<const util::Clock> clock_;
  api::StoreOptions                  options_;

  validation::StringValidator     string_validator_;
  validation::IdentifierValidator identifier_validator_;
  validation::IntValidator        int_validator_;

  api::StepId next_fixture_row_id_;
};

} // namespace stepdb::db::sqlite
