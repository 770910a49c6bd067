#include "internal/db/view/step_view.hpp"

#include "internal/db/codec/url_codec.hpp"
#include "internal/util/time.hpp"

namespace stepdb::db::view {

stepdb::v1::StepView ToView(const model::StepRecord& record) {
  stepdb::v1::StepView view;
  view.set_id(record.id);
  view.set_buildid(record.buildid);
  view.set_number(record.number);
  view.set_name(record.name);

  if (record.started_at) {
    *view.mutable_started_at() = util::ToProto(*record.started_at);
  }
  if (record.locks_acquired_at) {
    *view.mutable_locks_acquired_at() = util::ToProto(*record.locks_acquired_at);
  }
  if (record.complete_at) {
    *view.mutable_complete_at() = util::ToProto(*record.complete_at);
  }

  view.set_state_string(record.state_string);
  if (record.results) {
    view.set_results(*record.results);
  }

  for (const auto& url : codec::DecodeUrls(record.urls_json)) {
    auto* out = view.add_urls();
    out->set_name(url.name);
    out->set_url(url.url);
  }

  view.set_hidden(record.hidden != 0);
  return view;
}

} // namespace stepdb::db::view
