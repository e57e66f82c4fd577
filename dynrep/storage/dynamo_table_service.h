#pragma once

#include <memory>
#include <string>
#include <vector>

#include <aws/dynamodb/DynamoDBClient.h>

#include "table_service.h"

namespace storage {

struct DynamoConfig {
  // AWS profile name; this is what the CLI calls an environment.
  std::string profile;
  // Empty means take it from the profile.
  std::string region;
  std::string endpoint;
};

class DynamoTableService : public ITableService {
 public:
  explicit DynamoTableService(DynamoConfig cfg);

  KeySchema DescribeKeySchema(const std::string& table) override;
  KeySchema DescribeIndexKeySchema(const std::string& table, const std::string& index_name) override;

  Page Scan(const ScanPageRequest& req) override;
  Page Query(const QueryPageRequest& req) override;

  BatchWriteResult BatchWrite(const std::string& table, const std::vector<WriteIntent>& intents) override;

  BackupInfo CreateBackup(const std::string& table, const std::string& backup_name) override;
  void DeleteTable(const std::string& table) override;

 private:
  DynamoConfig cfg_;
  std::shared_ptr<Aws::DynamoDB::DynamoDBClient> client_;
};

}  // namespace storage
