#pragma once

#include <string>
#include <vector>

#include "internal/db/model/step_record.hpp"

namespace stepdb::db::codec {

/*
  urls_json column codec.

  Wire form is a JSON array of {"name": ..., "url": ...} objects in
  insertion order, "[]" when empty.
*/

// Throws util::CorruptRecord when the text is not such an array.
std::vector<model::UrlRecord> DecodeUrls(const std::string& urls_json);

std::string EncodeUrls(const std::vector<model::UrlRecord>& urls);

// Appends unless an identical {name, url} pair is already present.
// Returns true when the list changed.
bool AppendUnique(std::vector<model::UrlRecord>& urls, model::UrlRecord url);

} // namespace stepdb::db::codec
