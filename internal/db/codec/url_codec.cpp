#include "internal/db/codec/url_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace stepdb::db::codec {

namespace {

std::string StringKey(const google::protobuf::Struct& object, const std::string& key, const std::string& urls_json) {
  const auto& fields = object.fields();
  const auto  it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    throw util::CorruptRecord("urls_json entry has no string '" + key + "': " + urls_json);
  }
  return it->second.string_value();
}

} // namespace

std::vector<model::UrlRecord> DecodeUrls(const std::string& urls_json) {
  google::protobuf::ListValue list;

  auto status = google::protobuf::util::JsonStringToMessage(urls_json, &list);
  if (!status.ok()) {
    throw util::CorruptRecord("urls_json is not a JSON list: " + std::string(status.message()));
  }

  std::vector<model::UrlRecord> urls;
  urls.reserve(static_cast<size_t>(list.values_size()));
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStructValue) {
      throw util::CorruptRecord("urls_json entry is not an object: " + urls_json);
    }
    const auto& object = value.struct_value();
    urls.push_back({StringKey(object, "name", urls_json), StringKey(object, "url", urls_json)});
  }
  return urls;
}

std::string EncodeUrls(const std::vector<model::UrlRecord>& urls) {
  if (urls.empty()) {
    return "[]";
  }

  google::protobuf::ListValue list;
  for (const auto& url : urls) {
    auto* fields = list.add_values()->mutable_struct_value()->mutable_fields();
    (*fields)["name"].set_string_value(url.name);
    (*fields)["url"].set_string_value(url.url);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode urls_json: " + std::string(status.message()));
  }
  return json;
}

bool AppendUnique(std::vector<model::UrlRecord>& urls, model::UrlRecord url) {
  if (std::find(urls.begin(), urls.end(), url) != urls.end()) {
    return false;
  }
  urls.push_back(std::move(url));
  return true;
}

} // namespace stepdb::db::codec
