#include "table_handle.h"

#include <sstream>
#include <utility>

#include "../storage/errors.h"

namespace replication {

TableHandle::TableHandle(std::string env, std::string table_name, std::shared_ptr<storage::ITableService> service)
    : env_(std::move(env)), table_name_(std::move(table_name)), service_(std::move(service)) {
  if (!service_) throw storage::ConfigurationError("No table service for environment " + env_);
  keys_ = service_->DescribeKeySchema(table_name_);
  if (keys_.partition_key.empty()) {
    throw storage::ConfigurationError("Table " + table_name_ + " in " + env_ + " has no partition key");
  }
}

std::vector<std::string> TableHandle::KeyAttributeNames() const {
  std::vector<std::string> names{keys_.partition_key};
  if (keys_.sort_key.has_value()) names.push_back(*keys_.sort_key);
  return names;
}

storage::Item TableHandle::KeyOf(const storage::Item& item) const {
  storage::Item key;
  for (const auto& name : KeyAttributeNames()) {
    auto it = item.find(name.c_str());
    if (it == item.end()) {
      throw storage::ConfigurationError("Item in " + table_name_ + " is missing key attribute " + name);
    }
    key.emplace(it->first, it->second);
  }
  return key;
}

std::string TableHandle::ToString() const {
  std::ostringstream out;
  out << "TableHandle(env=" << env_ << ", table_name=" << table_name_ << ", pk_name=" << keys_.partition_key
      << ", sk_name=" << keys_.sort_key.value_or("") << ")";
  return out.str();
}

bool operator==(const TableHandle& a, const TableHandle& b) {
  return a.Env() == b.Env() && a.Name() == b.Name();
}

bool operator!=(const TableHandle& a, const TableHandle& b) {
  return !(a == b);
}

bool IsCopyCompatible(const TableHandle& a, const TableHandle& b) {
  return b.Name().find(a.Name()) != std::string::npos || a.Name().find(b.Name()) != std::string::npos;
}

}  // namespace replication
