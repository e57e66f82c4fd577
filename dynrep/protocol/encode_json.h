#pragma once

#include <set>
#include <string>
#include <vector>

#include "../storage/models.h"

namespace protocol {

// Typed DynamoDB JSON, e.g. {"pk": {"S": "a"}}, indented for terminals.
std::string encode_item_json(const storage::Item& item);

// Distinct string ("S") values of one attribute. Items without it, or with a
// non-string value, are skipped.
std::set<std::string> unique_string_values(const std::vector<storage::Item>& items, const std::string& attribute);

std::string encode_string_set_json(const std::set<std::string>& values);

}  // namespace protocol
