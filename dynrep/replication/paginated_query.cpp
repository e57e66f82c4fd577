#include "paginated_query.h"

#include <iterator>
#include <utility>

#include "../storage/errors.h"
#include "../util/log.h"

namespace replication {

std::vector<storage::Item> QueryItems(const TableHandle& table,
                                      const ItemSelector& selector,
                                      const std::optional<AttributeFilter>& filter,
                                      int page_size) {
  storage::KeySchema keys = table.Keys();
  if (selector.index_name.has_value()) {
    keys = table.Service().DescribeIndexKeySchema(table.Name(), *selector.index_name);
  }
  if (selector.sort_prefix.has_value() && !keys.sort_key.has_value()) {
    throw storage::ConfigurationError("Sort key prefix given but " +
                                      selector.index_name.value_or(table.Name()) + " has no sort key");
  }

  storage::QueryPageRequest req;
  req.table_name = table.Name();
  req.index_name = selector.index_name;
  req.partition_key = keys.partition_key;
  req.partition_value = selector.partition_value;
  req.sort_key = keys.sort_key;
  req.sort_prefix = selector.sort_prefix;
  if (filter.has_value()) {
    req.filter_attribute = filter->attribute;
    req.filter_prefix = filter->prefix;
  }
  req.limit = page_size > 0 ? page_size : kDefaultQueryPageSize;

  std::vector<storage::Item> items;
  int pages = 0;
  while (true) {
    auto page = table.Service().Query(req);
    ++pages;
    items.insert(items.end(), std::make_move_iterator(page.items.begin()), std::make_move_iterator(page.items.end()));
    // A continuation key on a page that scanned nothing is treated as the end.
    if (page.last_evaluated_key.empty() || page.scanned_count <= 0) break;
    req.exclusive_start_key = std::move(page.last_evaluated_key);
  }

  util::LogDebug("Queried " + std::to_string(items.size()) + " items from " + table.Name() + " in " +
                 std::to_string(pages) + " pages");
  return items;
}

}  // namespace replication
