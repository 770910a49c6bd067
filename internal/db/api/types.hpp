#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/db/model/step_record.hpp"

namespace stepdb::db::api {

using StepId  = model::StepId;
using BuildId = model::BuildId;

// What AddStep settled on after allocation and disambiguation.
struct AddStepResult {
  StepId      id     = 0;
  int32_t     number = 0;
  std::string name;

  bool operator==(const AddStepResult&) const = default;
};

struct StoreOptions {
  StepId      first_step_id        = 100;
  std::size_t max_name_length      = 50;
  StepId      first_fixture_row_id = 1000;
};

} // namespace stepdb::db::api
