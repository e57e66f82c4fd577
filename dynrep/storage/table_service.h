#pragma once

#include <string>
#include <vector>

#include "models.h"

namespace storage {

// One instance per environment (AWS profile). Implementations must be safe to
// call from several worker threads at once.
class ITableService {
 public:
  virtual ~ITableService() = default;

  virtual KeySchema DescribeKeySchema(const std::string& table) = 0;
  // Throws NotFoundError if the table has no index with that name.
  virtual KeySchema DescribeIndexKeySchema(const std::string& table, const std::string& index_name) = 0;

  virtual Page Scan(const ScanPageRequest& req) = 0;
  virtual Page Query(const QueryPageRequest& req) = 0;

  // A non-success status is reported in the result, not thrown.
  virtual BatchWriteResult BatchWrite(const std::string& table, const std::vector<WriteIntent>& intents) = 0;

  virtual BackupInfo CreateBackup(const std::string& table, const std::string& backup_name) = 0;
  virtual void DeleteTable(const std::string& table) = 0;
};

}  // namespace storage
