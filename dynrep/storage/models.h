#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <aws/core/utils/memory/stl/AWSMap.h>
#include <aws/core/utils/memory/stl/AWSString.h>
#include <aws/dynamodb/model/AttributeValue.h>

namespace storage {

// Items are kept in the service's own typed representation and copied as-is.
using Item = Aws::Map<Aws::String, Aws::DynamoDB::Model::AttributeValue>;

// Hard limit of the BatchWriteItem API. Larger batches make the call itself fail.
constexpr size_t kMaxBatchWriteItems = 25;

struct KeySchema {
  std::string partition_key;
  std::optional<std::string> sort_key;
};

enum class WriteKind { kPut, kDelete };

const char* WriteKindName(WriteKind kind);

// For kPut `attributes` is the whole item, for kDelete only the key attributes.
struct WriteIntent {
  WriteKind kind = WriteKind::kPut;
  Item attributes;
};

struct BatchWriteResult {
  int http_status = 200;
  std::string error_message;
  std::vector<WriteIntent> unprocessed;
};

struct ScanPageRequest {
  std::string table_name;
  int segment = 0;
  int total_segments = 1;
  bool consistent_read = false;
  // Empty means ALL_ATTRIBUTES.
  std::vector<std::string> projection;
  Item exclusive_start_key;
};

struct QueryPageRequest {
  std::string table_name;
  std::optional<std::string> index_name;
  std::string partition_key;
  std::string partition_value;
  std::optional<std::string> sort_key;
  std::optional<std::string> sort_prefix;
  // begins_with filter on a non-key attribute.
  std::optional<std::string> filter_attribute;
  std::optional<std::string> filter_prefix;
  int limit = 200;
  Item exclusive_start_key;
};

struct Page {
  std::vector<Item> items;
  int64_t scanned_count = 0;
  // Empty when there is nothing left to read.
  Item last_evaluated_key;
};

struct BackupInfo {
  std::string arn;
  std::string name;
  std::string status;
};

}  // namespace storage
