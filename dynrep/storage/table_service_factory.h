#pragma once

#include <memory>
#include <string>

#include "table_service.h"

namespace storage {

// Builds the table service for one environment (AWS profile). Region and
// endpoint overrides are read from the process environment.
std::shared_ptr<ITableService> CreateTableServiceForEnv(const std::string& env);

}  // namespace storage
