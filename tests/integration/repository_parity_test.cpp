#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/step_repository.hpp"
#include "internal/db/memory/memory_step_repository.hpp"
#include "internal/db/model/step_row.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if STEPDB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_step_repository.hpp"
#endif

namespace {

using stepdb::db::StepRepository;
using stepdb::db::memory::MemoryStepRepository;
using stepdb::db::model::StepRow;
using stepdb::util::VirtualClock;
using stepdb::v1::StepView;

struct Backend {
  std::shared_ptr<VirtualClock>   clock;
  std::shared_ptr<StepRepository> repo;
};

struct BackendFactory {
  std::string              name;
  std::function<Backend()> make_backend;
};

// Every view the scenario leaves behind, in a stable order.
using Snapshot = std::vector<StepView>;

Snapshot RunBuildLifecycle(Backend& backend) {
  auto& repo = *backend.repo;

  auto checkout = repo.AddStep(1, "checkout", "pending");
  auto compile  = repo.AddStep(1, "compile", "pending");
  auto again    = repo.AddStep(1, "compile", "pending");
  auto third    = repo.AddStep(1, "compile", "pending");

  assert(checkout.id == 100 && checkout.number == 0);
  assert(compile.id == 101 && compile.number == 1);
  assert(again.name == "compile_1" && again.number == 2);
  assert(third.name == "compile_2" && third.number == 3);

  backend.clock->Advance(1304262222);
  repo.StartStep(checkout.id, backend.clock->Seconds(), true);
  repo.StartStep(compile.id, backend.clock->Seconds(), false);
  repo.SetStepLocksAcquiredAt(compile.id, backend.clock->Seconds() + 3);
  repo.SetStepStateString(compile.id, "compiling");

  repo.AddUrl(compile.id, "report", "http://x");
  repo.AddUrl(compile.id, "report", "http://x");
  repo.AddUrl(compile.id, "report", "http://y");

  backend.clock->Advance(12.25);
  repo.FinishStep(checkout.id, 0, true);
  repo.FinishStep(compile.id, 2, false);

  auto finished = repo.GetStep(checkout.id);
  assert(finished.has_value());
  assert(finished->complete_at().seconds() == 1304262234);
  assert(finished->complete_at().nanos() == 250000000);
  assert(finished->results() == 0);
  assert(finished->hidden());

  auto with_urls = repo.GetStep(compile.id);
  assert(with_urls->urls_size() == 2);
  assert(with_urls->state_string() == "compiling");
  assert(with_urls->locks_acquired_at().seconds() == 1304262225);

  return repo.ListSteps(1);
}

Snapshot RunLookupsAndAbsence(Backend& backend) {
  auto& repo = *backend.repo;

  repo.InsertTestData({
      StepRow{.id = 120, .buildid = 5, .number = 2, .name = "upload"},
      StepRow{.id = 110, .buildid = 5, .number = 0, .name = "fetch"},
      StepRow{.id = 115, .buildid = 5, .number = 1, .name = "build", .urls_json = R"([{"name": "log", "url": "http://log"}])"},
      StepRow{.id = 130, .buildid = 6, .number = 0, .name = "fetch"},
  });

  assert(!repo.GetStep(999).has_value());
  assert(repo.GetStepByBuild(5, 1, std::nullopt)->name() == "build");
  assert(repo.GetStepByBuild(5, std::nullopt, std::string("fetch"))->id() == 110);
  assert(!repo.GetStepByBuild(5, 3, std::nullopt).has_value());

  bool threw = false;
  try {
    repo.GetStepByBuild(5, std::nullopt, std::nullopt);
  } catch (const stepdb::util::InvalidArguments&) {
    threw = true;
  }
  assert(threw);

  // unknown ids are silently ignored
  repo.StartStep(999, 1, true);
  repo.AddUrl(999, "report", "http://x");
  repo.FinishStep(999, 0, true);
  assert(!repo.GetStep(999).has_value());

  auto added = repo.AddStep(5, "fetch", "");
  assert(added.id == 100);
  assert(added.number == 3);
  assert(added.name == "fetch_1");

  repo.AddUrl(115, "log", "http://log");
  repo.AddUrl(115, "log2", "http://log");

  auto views = repo.ListSteps(5);
  assert(views.size() == 4);
  for (std::size_t i = 0; i < views.size(); ++i) {
    assert(views[i].number() == static_cast<int32_t>(i));
  }
  assert(views[1].urls_size() == 2);
  return views;
}

Snapshot RunValidationFailures(Backend& backend) {
  auto& repo  = *backend.repo;
  auto  added = repo.AddStep(9, "step", "");

  const auto rejects = [](const std::function<void()>& fn) {
    try {
      fn();
    } catch (const stepdb::util::ValidationError&) {
      return true;
    }
    return false;
  };

  assert(rejects([&] { repo.AddStep(9, "", ""); }));
  assert(rejects([&] { repo.AddStep(9, std::string(51, 'n'), ""); }));
  assert(rejects([&] { repo.AddStep(9, "ok", "\xff"); }));
  assert(rejects([&] { repo.SetStepStateString(added.id, "\xc0\xaf"); }));
  assert(rejects([&] { repo.AddUrl(added.id, "not valid", "http://x"); }));

  return repo.ListSteps(9);
}

Snapshot RunInsertionOrderTies(Backend& backend) {
  auto& repo = *backend.repo;

  // same (buildid, number) twice; the row inserted first wins, not the lower id
  repo.InsertTestData({
      StepRow{.id = 500, .buildid = 2, .number = 0, .name = "inserted_first"},
      StepRow{.id = 200, .buildid = 2, .number = 0, .name = "inserted_second"},
      StepRow{.id = 300, .buildid = 2, .number = 1, .name = "after"},
  });

  assert(repo.GetStepByBuild(2, 0, std::nullopt)->id() == 500);

  repo.InsertTestData({StepRow{.id = 500, .buildid = 2, .number = 0, .name = "replaced"}});
  assert(repo.GetStepByBuild(2, 0, std::nullopt)->name() == "replaced");

  auto views = repo.ListSteps(2);
  assert(views.size() == 3);
  assert(views[0].id() == 500);
  assert(views[1].id() == 200);
  assert(views[2].id() == 300);
  return views;
}

Snapshot RunRejectedWrites(Backend& backend) {
  auto& repo = *backend.repo;

  const auto invalid_arguments = [](const std::function<void()>& fn) {
    try {
      fn();
    } catch (const stepdb::util::InvalidArguments&) {
      return true;
    }
    return false;
  };

  // one bad row rejects the whole batch
  assert(invalid_arguments([&] { repo.InsertTestData({StepRow{.buildid = 4}, StepRow{}}); }));
  assert(repo.ListSteps(4).empty());
  assert(!repo.GetStep(1000).has_value());

  repo.InsertTestData({StepRow{.buildid = 4}});
  assert(repo.GetStep(1000).has_value());

  // numbers stop at the top of the int32 range
  repo.InsertTestData({StepRow{.id = 7, .buildid = 4, .number = std::numeric_limits<int32_t>::max(), .name = "last"}});
  assert(invalid_arguments([&] { repo.AddStep(4, "overflow", ""); }));
  assert(repo.ListSteps(4).size() == 2);

  // negative ids are ordinary ids
  repo.InsertTestData({StepRow{.id = -5, .buildid = 4, .number = 0, .name = "negative"}});
  repo.AddUrl(-5, "report", "http://x");
  repo.AddUrl(-1, "report", "http://x");
  assert(repo.GetStep(-5)->urls_size() == 1);
  assert(!repo.GetStep(-1).has_value());

  return repo.ListSteps(4);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name = "memory",
      .make_backend =
          []() {
            auto clock = std::make_shared<VirtualClock>();
            return Backend{clock, std::make_shared<MemoryStepRepository>(clock)};
          },
  };
}

#if STEPDB_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  return BackendFactory{
      .name = "sqlite",
      .make_backend =
          []() {
            auto clock = std::make_shared<VirtualClock>();
            auto db    = std::make_shared<stepdb::db::sqlite::SqliteDB>(":memory:");
            return Backend{clock, std::make_shared<stepdb::db::sqlite::SqliteStepRepository>(std::move(db), clock)};
          },
  };
}
#endif

void AssertSameSnapshot(const Snapshot& expected, const Snapshot& actual, const std::string& scenario) {
  assert(expected.size() == actual.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (!google::protobuf::util::MessageDifferencer::Equals(expected[i], actual[i])) {
      std::cerr << scenario << ": views differ at " << i << "\n"
                << expected[i].DebugString() << "\n"
                << actual[i].DebugString() << "\n";
      assert(false);
    }
  }
}

void RunParity(const std::vector<BackendFactory>& backends, const std::string& scenario_name,
               const std::function<Snapshot(Backend&)>& scenario) {
  std::optional<Snapshot> reference;
  for (const auto& factory : backends) {
    std::cout << "running " << scenario_name << " on " << factory.name << "\n";
    auto backend  = factory.make_backend();
    auto snapshot = scenario(backend);
    if (!reference) {
      reference = std::move(snapshot);
    } else {
      AssertSameSnapshot(*reference, snapshot, scenario_name);
    }
  }
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STEPDB_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  RunParity(backends, "build_lifecycle", RunBuildLifecycle);
  RunParity(backends, "lookups_and_absence", RunLookupsAndAbsence);
  RunParity(backends, "validation_failures", RunValidationFailures);
  RunParity(backends, "insertion_order_ties", RunInsertionOrderTies);
  RunParity(backends, "rejected_writes", RunRejectedWrites);

  std::cout << "stepdb_integration_repository_parity: pass\n";
  return 0;
}
