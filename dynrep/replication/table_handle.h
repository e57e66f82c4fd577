#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../storage/models.h"
#include "../storage/table_service.h"

namespace replication {

// A table in one environment. The key schema is resolved once, here, and the
// handle is immutable afterwards. The service is the environment's session and
// every remote call for this table goes through it.
class TableHandle {
 public:
  TableHandle(std::string env, std::string table_name, std::shared_ptr<storage::ITableService> service);

  const std::string& Env() const { return env_; }
  const std::string& Name() const { return table_name_; }
  const storage::KeySchema& Keys() const { return keys_; }
  const std::string& PartitionKey() const { return keys_.partition_key; }
  const std::optional<std::string>& SortKey() const { return keys_.sort_key; }
  storage::ITableService& Service() const { return *service_; }

  std::vector<std::string> KeyAttributeNames() const;
  // Throws ConfigurationError if the item lacks a key attribute.
  storage::Item KeyOf(const storage::Item& item) const;

  std::string ToString() const;

 private:
  std::string env_;
  std::string table_name_;
  std::shared_ptr<storage::ITableService> service_;
  storage::KeySchema keys_;
};

// Identity is (environment, table name).
bool operator==(const TableHandle& a, const TableHandle& b);
bool operator!=(const TableHandle& a, const TableHandle& b);

using CompatibilityPredicate = std::function<bool(const TableHandle&, const TableHandle&)>;

// True when one table name contains the other, which lets a table be copied
// to or from a differently named backup copy of itself.
bool IsCopyCompatible(const TableHandle& a, const TableHandle& b);

}  // namespace replication
