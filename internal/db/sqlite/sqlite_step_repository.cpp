#include "sqlite_step_repository.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "internal/db/codec/url_codec.hpp"
#include "internal/db/common/step_allocation.hpp"
#include "internal/db/view/step_view.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stepdb::db::sqlite {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kSelectColumns =
    "SELECT id,buildid,number,name,started_at,locks_acquired_at,complete_at,state_string,results,urls_json,hidden FROM steps ";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalReal(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptionalI32(sqlite3_stmt* st, int idx, const std::optional<int32_t>& v) {
  if (v) {
    sqlite3_bind_int(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<double> ColOptionalReal(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

std::optional<int32_t> ColOptionalI32(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col);
}

model::StepRecord ReadRecord(sqlite3_stmt* st) {
  model::StepRecord r;
  r.id                = sqlite3_column_int64(st, 0);
  r.buildid           = sqlite3_column_int64(st, 1);
  r.number            = sqlite3_column_int(st, 2);
  r.name              = ColText(st, 3);
  r.started_at        = ColOptionalReal(st, 4);
  r.locks_acquired_at = ColOptionalReal(st, 5);
  r.complete_at       = ColOptionalReal(st, 6);
  r.state_string      = ColText(st, 7);
  r.results           = ColOptionalI32(st, 8);
  r.urls_json         = ColText(st, 9);
  r.hidden            = sqlite3_column_int(st, 10);
  return r;
}

} // namespace

SqliteStepRepository::SqliteStepRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<const util::Clock> clock, api::StoreOptions options)
    : db_(std::move(db)),
      clock_(std::move(clock)),
      options_(options),
      identifier_validator_(options.max_name_length),
      next_fixture_row_id_(options.first_fixture_row_id) {
  if (!db_ || !clock_) {
    throw std::invalid_argument("SqliteStepRepository requires a database and a clock");
  }
  BootstrapSchema();
}

void SqliteStepRepository::BootstrapSchema() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS steps (id INTEGER PRIMARY KEY, buildid INTEGER NOT NULL, number INTEGER NOT NULL, name TEXT NOT NULL, "
      "started_at REAL, locks_acquired_at REAL, complete_at REAL, state_string TEXT NOT NULL DEFAULT '', results INTEGER, "
      "urls_json TEXT NOT NULL DEFAULT '[]', hidden INTEGER NOT NULL DEFAULT 0, seq INTEGER NOT NULL);");
  db_->Exec("CREATE INDEX IF NOT EXISTS steps_buildid ON steps (buildid);");
}

bool SqliteStepRepository::Exists(api::StepId stepid) {
  auto st = db_->Prepare("SELECT 1 FROM steps WHERE id=?;");
  BindI64(st.get(), 1, stepid);
  int rc = sqlite3_step(st.get());
  db_->Check(rc, "select step id");
  return rc == SQLITE_ROW;
}

std::optional<model::StepRecord> SqliteStepRepository::FetchRecord(api::StepId stepid) {
  auto st = db_->Prepare(std::string(kSelectColumns) + "WHERE id=?;");
  BindI64(st.get(), 1, stepid);

  int rc = sqlite3_step(st.get());
  db_->Check(rc, "select step");
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadRecord(st.get());
}

// seq is assigned once, when the id first enters the table, and survives
// replacement; lookups order by it.
void SqliteStepRepository::WriteRecord(const model::StepRecord& r) {
  auto st = db_->Prepare(
      "INSERT INTO steps(id,buildid,number,name,started_at,locks_acquired_at,complete_at,state_string,results,urls_json,hidden,seq) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,(SELECT COALESCE(MAX(seq),0)+1 FROM steps)) "
      "ON CONFLICT(id) DO UPDATE SET buildid=excluded.buildid, number=excluded.number, name=excluded.name, "
      "started_at=excluded.started_at, locks_acquired_at=excluded.locks_acquired_at, complete_at=excluded.complete_at, "
      "state_string=excluded.state_string, results=excluded.results, urls_json=excluded.urls_json, hidden=excluded.hidden;");

  BindI64(st.get(), 1, r.id);
  BindI64(st.get(), 2, r.buildid);
  sqlite3_bind_int(st.get(), 3, r.number);
  BindText(st.get(), 4, r.name);
  BindOptionalReal(st.get(), 5, r.started_at);
  BindOptionalReal(st.get(), 6, r.locks_acquired_at);
  BindOptionalReal(st.get(), 7, r.complete_at);
  BindText(st.get(), 8, r.state_string);
  BindOptionalI32(st.get(), 9, r.results);
  BindText(st.get(), 10, r.urls_json);
  sqlite3_bind_int(st.get(), 11, r.hidden);

  db_->Check(sqlite3_step(st.get()), "write step");
}

// ------------------------------------------------------------------
// Creation
// ------------------------------------------------------------------

api::AddStepResult SqliteStepRepository::AddStep(api::BuildId buildid, const std::string& name, const std::string& state_string) {
  string_validator_.Validate("state_string", state_string);
  identifier_validator_.Validate("name", name);

  std::optional<int32_t>          max_number;
  std::unordered_set<std::string> names;
  {
    auto st = db_->Prepare("SELECT number,name FROM steps WHERE buildid=?;");
    BindI64(st.get(), 1, buildid);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      const int32_t number = sqlite3_column_int(st.get(), 0);
      max_number           = max_number ? std::max(*max_number, number) : number;
      names.insert(ColText(st.get(), 1));
    }
    db_->Check(rc, "select build steps");
  }

  api::AddStepResult result;
  result.number = common::NextStepNumber(max_number);
  result.name   = common::UniqueStepName(name, names);
  result.id     = common::SmallestUnusedId(options_.first_step_id, [this](api::StepId id) { return Exists(id); });

  model::StepRecord record;
  record.id           = result.id;
  record.buildid      = buildid;
  record.number       = result.number;
  record.name         = result.name;
  record.state_string = state_string;
  WriteRecord(record);

  STEPDB_LOG_DEBUG("Step added", {IntField("stepid", result.id), IntField("buildid", buildid), IntField("number", result.number),
                                  StringField("name", result.name), StringField("backend", "sqlite")});
  return result;
}

// ------------------------------------------------------------------
// Lookup
// ------------------------------------------------------------------

std::optional<stepdb::v1::StepView> SqliteStepRepository::GetStep(api::StepId stepid) {
  auto record = FetchRecord(stepid);
  if (!record) return std::nullopt;
  return view::ToView(*record);
}

std::optional<stepdb::v1::StepView> SqliteStepRepository::GetStepByBuild(api::BuildId buildid, std::optional<int32_t> number,
                                                                         const std::optional<std::string>& name) {
  if (!number && !name) {
    throw util::InvalidArguments("GetStepByBuild requires a number or a name");
  }

  auto st = db_->Prepare(std::string(kSelectColumns) +
                         "WHERE buildid=?1 AND (?2 IS NULL OR number=?2) AND (?3 IS NULL OR name=?3) ORDER BY seq LIMIT 1;");
  BindI64(st.get(), 1, buildid);
  BindOptionalI32(st.get(), 2, number);
  if (name) {
    BindText(st.get(), 3, *name);
  } else {
    sqlite3_bind_null(st.get(), 3);
  }

  int rc = sqlite3_step(st.get());
  db_->Check(rc, "select step by build");
  if (rc != SQLITE_ROW) return std::nullopt;
  return view::ToView(ReadRecord(st.get()));
}

std::vector<stepdb::v1::StepView> SqliteStepRepository::ListSteps(api::BuildId buildid) {
  auto st = db_->Prepare(std::string(kSelectColumns) + "WHERE buildid=? ORDER BY number, seq;");
  BindI64(st.get(), 1, buildid);

  std::vector<stepdb::v1::StepView> out;
  int                               rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(view::ToView(ReadRecord(st.get())));
  }
  db_->Check(rc, "list steps");
  return out;
}

// ------------------------------------------------------------------
// Mutation
// ------------------------------------------------------------------

void SqliteStepRepository::StartStep(api::StepId stepid, util::EpochSeconds started_at, bool locks_acquired) {
  auto st = db_->Prepare(locks_acquired ? "UPDATE steps SET started_at=?1, locks_acquired_at=?1 WHERE id=?2;"
                                        : "UPDATE steps SET started_at=?1 WHERE id=?2;");
  sqlite3_bind_double(st.get(), 1, started_at);
  BindI64(st.get(), 2, stepid);
  db_->Check(sqlite3_step(st.get()), "start step");
}

void SqliteStepRepository::SetStepLocksAcquiredAt(api::StepId stepid, util::EpochSeconds locks_acquired_at) {
  auto st = db_->Prepare("UPDATE steps SET locks_acquired_at=? WHERE id=?;");
  sqlite3_bind_double(st.get(), 1, locks_acquired_at);
  BindI64(st.get(), 2, stepid);
  db_->Check(sqlite3_step(st.get()), "set locks_acquired_at");
}

void SqliteStepRepository::SetStepStateString(api::StepId stepid, const std::string& state_string) {
  string_validator_.Validate("state_string", state_string);

  auto st = db_->Prepare("UPDATE steps SET state_string=? WHERE id=?;");
  BindText(st.get(), 1, state_string);
  BindI64(st.get(), 2, stepid);
  db_->Check(sqlite3_step(st.get()), "set state_string");
}

void SqliteStepRepository::AddUrl(api::StepId stepid, const std::string& name, const std::string& url) {
  int_validator_.Validate("stepid", stepid);
  identifier_validator_.Validate("name", name);
  string_validator_.Validate("url", url);

  auto record = FetchRecord(stepid);
  if (!record) return;

  auto urls = codec::DecodeUrls(record->urls_json);
  if (!codec::AppendUnique(urls, {name, url})) return;

  auto st = db_->Prepare("UPDATE steps SET urls_json=? WHERE id=?;");
  BindText(st.get(), 1, codec::EncodeUrls(urls));
  BindI64(st.get(), 2, stepid);
  db_->Check(sqlite3_step(st.get()), "set urls_json");
}

void SqliteStepRepository::FinishStep(api::StepId stepid, std::optional<int32_t> results, bool hidden) {
  const auto now = clock_->Seconds();

  auto st = db_->Prepare("UPDATE steps SET complete_at=?, results=?, hidden=? WHERE id=?;");
  sqlite3_bind_double(st.get(), 1, now);
  BindOptionalI32(st.get(), 2, results);
  sqlite3_bind_int(st.get(), 3, hidden ? 1 : 0);
  BindI64(st.get(), 4, stepid);
  db_->Check(sqlite3_step(st.get()), "finish step");

  if (sqlite3_changes(db_->Handle()) == 0) return;
  STEPDB_LOG_DEBUG("Step finished", {IntField("stepid", stepid), StringField("results", results ? std::to_string(*results) : "null"),
                                     BoolField("hidden", hidden), StringField("backend", "sqlite")});
}

// ------------------------------------------------------------------
// Fixtures
// ------------------------------------------------------------------

void SqliteStepRepository::InsertTestData(const std::vector<model::StepRow>& rows) {
  common::RequireBuildIds(rows);

  for (const auto& row : rows) {
    api::StepId id;
    if (row.id) {
      id = *row.id;
    } else {
      id                   = common::SmallestUnusedId(next_fixture_row_id_, [this](api::StepId candidate) { return Exists(candidate); });
      next_fixture_row_id_ = id + 1;
    }

    auto record = common::RecordFromRow(row, id);
    if (Exists(id)) {
      STEPDB_LOG_WARN("Fixture row replaces existing step", {IntField("stepid", id), StringField("backend", "sqlite")});
    }
    WriteRecord(record);
  }

  STEPDB_LOG_DEBUG("Fixture rows inserted", {IntField("rows", static_cast<std::int64_t>(rows.size())), StringField("backend", "sqlite")});
}

} // namespace stepdb::db::sqlite
