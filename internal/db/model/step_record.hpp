#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace stepdb::db::model {

using StepId  = std::int64_t;
using BuildId = std::int64_t;

/*
  One row of the steps table, exactly as stored.

  urls_json holds the encoded URL list (see db::codec).
  hidden is kept as the raw integer column; views cast it to bool.
*/

struct StepRecord {
  StepId      id      = 0;
  BuildId     buildid = 0;
  int32_t     number  = 0;
  std::string name;

  std::optional<util::EpochSeconds> started_at;
  std::optional<util::EpochSeconds> locks_acquired_at;
  std::optional<util::EpochSeconds> complete_at;

  std::string            state_string;
  std::optional<int32_t> results;

  std::string urls_json = "[]";
  int32_t     hidden    = 0;
};

struct UrlRecord {
  std::string name;
  std::string url;

  bool operator==(const UrlRecord&) const = default;
};

} // namespace stepdb::db::model
