#pragma once

#include "internal/db/model/step_record.hpp"
#include "stepdb/v1.hpp"

namespace stepdb::db::view {

// Projects a stored row into the public read shape. Performs no
// validation; only a corrupt urls_json column can make it throw.
stepdb::v1::StepView ToView(const model::StepRecord& record);

} // namespace stepdb::db::view
