#include "encode_json.h"

#include <utility>

#include <aws/core/utils/json/JsonSerializer.h>

namespace protocol {

using Aws::DynamoDB::Model::ValueType;
using Aws::Utils::Json::JsonValue;

std::string encode_item_json(const storage::Item& item) {
  JsonValue out;
  for (const auto& kv : item) {
    out.WithObject(kv.first, kv.second.Jsonize());
  }
  return out.View().WriteReadable().c_str();
}

std::set<std::string> unique_string_values(const std::vector<storage::Item>& items, const std::string& attribute) {
  std::set<std::string> out;
  for (const auto& item : items) {
    auto it = item.find(attribute.c_str());
    if (it == item.end() || it->second.GetType() != ValueType::STRING) continue;
    out.insert(it->second.GetS().c_str());
  }
  return out;
}

std::string encode_string_set_json(const std::set<std::string>& values) {
  Aws::Utils::Array<JsonValue> array(values.size());
  size_t i = 0;
  for (const auto& v : values) {
    array[i++].AsString(v.c_str());
  }
  JsonValue out;
  out.AsArray(std::move(array));
  return out.View().WriteCompact().c_str();
}

}  // namespace protocol
