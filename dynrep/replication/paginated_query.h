#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../storage/models.h"
#include "table_handle.h"

namespace replication {

constexpr int kDefaultQueryPageSize = 200;

struct ItemSelector {
  std::string partition_value;
  // Matched with begins_with on the sort key.
  std::optional<std::string> sort_prefix;
  std::optional<std::string> index_name;
};

struct AttributeFilter {
  std::string attribute;
  std::string prefix;
};

// All items with partition key == selector.partition_value, across pages.
// Index queries use the index's own key names. An empty result is not an error.
std::vector<storage::Item> QueryItems(const TableHandle& table,
                                      const ItemSelector& selector,
                                      const std::optional<AttributeFilter>& filter = std::nullopt,
                                      int page_size = kDefaultQueryPageSize);

}  // namespace replication
