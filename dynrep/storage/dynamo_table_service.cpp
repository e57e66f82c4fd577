#include "dynamo_table_service.h"

#include <sstream>
#include <utility>

#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/memory/AWSMemory.h>
#include <aws/dynamodb/DynamoDBErrors.h>
#include <aws/dynamodb/model/BackupStatus.h>
#include <aws/dynamodb/model/BatchWriteItemRequest.h>
#include <aws/dynamodb/model/CreateBackupRequest.h>
#include <aws/dynamodb/model/DeleteRequest.h>
#include <aws/dynamodb/model/DeleteTableRequest.h>
#include <aws/dynamodb/model/DescribeTableRequest.h>
#include <aws/dynamodb/model/KeySchemaElement.h>
#include <aws/dynamodb/model/PutRequest.h>
#include <aws/dynamodb/model/QueryRequest.h>
#include <aws/dynamodb/model/ScanRequest.h>
#include <aws/dynamodb/model/WriteRequest.h>

#include "errors.h"

namespace storage {
namespace {

using Aws::DynamoDB::Model::AttributeValue;
using Aws::DynamoDB::Model::KeySchemaElement;
using Aws::DynamoDB::Model::KeyType;

const char* kAllocationTag = "dynrep";

AttributeValue S(const std::string& v) {
  AttributeValue a;
  a.SetS(v.c_str());
  return a;
}

KeySchema ToKeySchema(const Aws::Vector<KeySchemaElement>& elements) {
  KeySchema schema;
  for (const auto& key : elements) {
    if (key.GetKeyType() == KeyType::HASH) {
      schema.partition_key = key.GetAttributeName().c_str();
    } else if (key.GetKeyType() == KeyType::RANGE) {
      schema.sort_key = std::string(key.GetAttributeName().c_str());
    }
  }
  return schema;
}

template <typename Outcome>
void ThrowIfFailed(const Outcome& out, const char* op, const std::string& table) {
  if (out.IsSuccess()) return;
  const auto& err = out.GetError();
  std::ostringstream msg;
  msg << op << " on " << table << " failed: " << err.GetExceptionName() << ": " << err.GetMessage();
  if (err.GetErrorType() == Aws::DynamoDB::DynamoDBErrors::RESOURCE_NOT_FOUND) {
    throw NotFoundError(msg.str());
  }
  throw ServiceError(msg.str(), static_cast<int>(err.GetResponseCode()));
}

Page ToPage(const Aws::Vector<Item>& items, int scanned_count, const Item& last_evaluated_key) {
  Page page;
  page.items.assign(items.begin(), items.end());
  page.scanned_count = scanned_count;
  page.last_evaluated_key = last_evaluated_key;
  return page;
}

Aws::DynamoDB::Model::WriteRequest ToWriteRequest(const WriteIntent& intent) {
  Aws::DynamoDB::Model::WriteRequest wr;
  if (intent.kind == WriteKind::kPut) {
    Aws::DynamoDB::Model::PutRequest put;
    put.SetItem(intent.attributes);
    wr.SetPutRequest(put);
  } else {
    Aws::DynamoDB::Model::DeleteRequest del;
    del.SetKey(intent.attributes);
    wr.SetDeleteRequest(del);
  }
  return wr;
}

WriteIntent FromWriteRequest(const Aws::DynamoDB::Model::WriteRequest& wr) {
  WriteIntent intent;
  if (wr.PutRequestHasBeenSet()) {
    intent.kind = WriteKind::kPut;
    intent.attributes = wr.GetPutRequest().GetItem();
  } else {
    intent.kind = WriteKind::kDelete;
    intent.attributes = wr.GetDeleteRequest().GetKey();
  }
  return intent;
}

}  // namespace

DynamoTableService::DynamoTableService(DynamoConfig cfg) : cfg_(std::move(cfg)) {
  Aws::Client::ClientConfiguration cc(cfg_.profile.c_str());
  if (!cfg_.region.empty()) cc.region = cfg_.region.c_str();
  if (!cfg_.endpoint.empty()) {
    cc.endpointOverride = cfg_.endpoint.c_str();
    cc.scheme = Aws::Http::Scheme::HTTP;
  }
  auto credentials =
      Aws::MakeShared<Aws::Auth::ProfileConfigFileAWSCredentialsProvider>(kAllocationTag, cfg_.profile.c_str());
  client_ = std::make_shared<Aws::DynamoDB::DynamoDBClient>(credentials, cc);
}

KeySchema DynamoTableService::DescribeKeySchema(const std::string& table) {
  Aws::DynamoDB::Model::DescribeTableRequest req;
  req.SetTableName(table.c_str());
  auto out = client_->DescribeTable(req);
  ThrowIfFailed(out, "DescribeTable", table);
  return ToKeySchema(out.GetResult().GetTable().GetKeySchema());
}

KeySchema DynamoTableService::DescribeIndexKeySchema(const std::string& table, const std::string& index_name) {
  Aws::DynamoDB::Model::DescribeTableRequest req;
  req.SetTableName(table.c_str());
  auto out = client_->DescribeTable(req);
  ThrowIfFailed(out, "DescribeTable", table);

  const auto& desc = out.GetResult().GetTable();
  for (const auto& gsi : desc.GetGlobalSecondaryIndexes()) {
    if (gsi.GetIndexName() == index_name.c_str()) return ToKeySchema(gsi.GetKeySchema());
  }
  for (const auto& lsi : desc.GetLocalSecondaryIndexes()) {
    if (lsi.GetIndexName() == index_name.c_str()) return ToKeySchema(lsi.GetKeySchema());
  }
  throw NotFoundError("Index " + index_name + " not found on table " + table);
}

Page DynamoTableService::Scan(const ScanPageRequest& req) {
  Aws::DynamoDB::Model::ScanRequest scan;
  scan.SetTableName(req.table_name.c_str());
  scan.SetConsistentRead(req.consistent_read);
  scan.SetSegment(req.segment);
  scan.SetTotalSegments(req.total_segments);
  scan.SetReturnConsumedCapacity(Aws::DynamoDB::Model::ReturnConsumedCapacity::NONE);
  if (req.projection.empty()) {
    scan.SetSelect(Aws::DynamoDB::Model::Select::ALL_ATTRIBUTES);
  } else {
    // Placeholders keep reserved words usable as key names.
    std::string projection;
    for (size_t i = 0; i < req.projection.size(); ++i) {
      const std::string placeholder = "#k" + std::to_string(i);
      scan.AddExpressionAttributeNames(placeholder.c_str(), req.projection[i].c_str());
      if (!projection.empty()) projection += ", ";
      projection += placeholder;
    }
    scan.SetProjectionExpression(projection.c_str());
  }
  if (!req.exclusive_start_key.empty()) scan.SetExclusiveStartKey(req.exclusive_start_key);

  auto out = client_->Scan(scan);
  ThrowIfFailed(out, "Scan", req.table_name);
  const auto& res = out.GetResult();
  return ToPage(res.GetItems(), res.GetScannedCount(), res.GetLastEvaluatedKey());
}

Page DynamoTableService::Query(const QueryPageRequest& req) {
  Aws::DynamoDB::Model::QueryRequest query;
  query.SetTableName(req.table_name.c_str());
  query.SetLimit(req.limit);
  query.SetSelect(Aws::DynamoDB::Model::Select::ALL_ATTRIBUTES);
  if (req.index_name.has_value()) query.SetIndexName(req.index_name->c_str());

  std::string key_condition = "#P = :item_key";
  query.AddExpressionAttributeNames("#P", req.partition_key.c_str());
  query.AddExpressionAttributeValues(":item_key", S(req.partition_value));
  if (req.sort_prefix.has_value() && req.sort_key.has_value()) {
    key_condition += " AND begins_with ( #D, :val )";
    query.AddExpressionAttributeNames("#D", req.sort_key->c_str());
    query.AddExpressionAttributeValues(":val", S(*req.sort_prefix));
  }
  query.SetKeyConditionExpression(key_condition.c_str());

  if (req.filter_attribute.has_value() && req.filter_prefix.has_value()) {
    query.SetFilterExpression("begins_with ( #F, :filter )");
    query.AddExpressionAttributeNames("#F", req.filter_attribute->c_str());
    query.AddExpressionAttributeValues(":filter", S(*req.filter_prefix));
  }
  if (!req.exclusive_start_key.empty()) query.SetExclusiveStartKey(req.exclusive_start_key);

  auto out = client_->Query(query);
  ThrowIfFailed(out, "Query", req.table_name);
  const auto& res = out.GetResult();
  return ToPage(res.GetItems(), res.GetScannedCount(), res.GetLastEvaluatedKey());
}

BatchWriteResult DynamoTableService::BatchWrite(const std::string& table, const std::vector<WriteIntent>& intents) {
  Aws::Vector<Aws::DynamoDB::Model::WriteRequest> requests;
  requests.reserve(intents.size());
  for (const auto& intent : intents) requests.push_back(ToWriteRequest(intent));

  Aws::DynamoDB::Model::BatchWriteItemRequest req;
  req.AddRequestItems(table.c_str(), requests);
  req.SetReturnConsumedCapacity(Aws::DynamoDB::Model::ReturnConsumedCapacity::TOTAL);
  req.SetReturnItemCollectionMetrics(Aws::DynamoDB::Model::ReturnItemCollectionMetrics::NONE);

  BatchWriteResult result;
  auto out = client_->BatchWriteItem(req);
  if (!out.IsSuccess()) {
    const auto& err = out.GetError();
    result.http_status = static_cast<int>(err.GetResponseCode());
    result.error_message = std::string(err.GetExceptionName().c_str()) + ": " + err.GetMessage().c_str();
    return result;
  }

  const auto& unprocessed = out.GetResult().GetUnprocessedItems();
  auto it = unprocessed.find(table.c_str());
  if (it != unprocessed.end()) {
    result.unprocessed.reserve(it->second.size());
    for (const auto& wr : it->second) result.unprocessed.push_back(FromWriteRequest(wr));
  }
  return result;
}

BackupInfo DynamoTableService::CreateBackup(const std::string& table, const std::string& backup_name) {
  Aws::DynamoDB::Model::CreateBackupRequest req;
  req.SetTableName(table.c_str());
  req.SetBackupName(backup_name.c_str());
  auto out = client_->CreateBackup(req);
  ThrowIfFailed(out, "CreateBackup", table);

  const auto& details = out.GetResult().GetBackupDetails();
  BackupInfo info;
  info.arn = details.GetBackupArn().c_str();
  info.name = details.GetBackupName().c_str();
  info.status =
      Aws::DynamoDB::Model::BackupStatusMapper::GetNameForBackupStatus(details.GetBackupStatus()).c_str();
  return info;
}

void DynamoTableService::DeleteTable(const std::string& table) {
  Aws::DynamoDB::Model::DeleteTableRequest req;
  req.SetTableName(table.c_str());
  auto out = client_->DeleteTable(req);
  ThrowIfFailed(out, "DeleteTable", table);
}

}  // namespace storage
