#include "table_service_factory.h"

#include <cstdlib>
#include <string>

#include "dynamo_table_service.h"
#include "errors.h"

namespace storage {
namespace {

std::string GetEnvAnyOrDefault(const char* first, const char* second, const std::string& def) {
  const char* v1 = std::getenv(first);
  if (v1 && *v1) return std::string(v1);
  const char* v2 = std::getenv(second);
  if (v2 && *v2) return std::string(v2);
  return def;
}

}  // namespace

std::shared_ptr<ITableService> CreateTableServiceForEnv(const std::string& env) {
  if (env.empty()) throw ConfigurationError("Environment (AWS profile) name must not be empty");
  DynamoConfig cfg;
  cfg.profile = env;
  cfg.endpoint = GetEnvAnyOrDefault("DDB_ENDPOINT", "DYNAMO_ENDPOINT", "");
  cfg.region = GetEnvAnyOrDefault("DYNAMO_REGION", "AWS_REGION", "");
  return std::make_shared<DynamoTableService>(cfg);
}

}  // namespace storage
