#include "backoff_writer.h"

#include <thread>
#include <utility>

#include "../storage/errors.h"
#include "../util/log.h"

namespace replication {

void SleepFor(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

BackoffWriter::BackoffWriter(const TableHandle& table, storage::WriteKind kind, BackoffPolicy policy, SleepFn sleep)
    : table_(table), kind_(kind), policy_(policy), sleep_(std::move(sleep)) {
  if (!sleep_) sleep_ = SleepFor;
}

std::vector<storage::WriteIntent> BackoffWriter::ToIntents(const std::vector<storage::Item>& batch) const {
  std::vector<storage::WriteIntent> intents;
  intents.reserve(batch.size());
  for (const auto& item : batch) {
    storage::WriteIntent intent;
    intent.kind = kind_;
    intent.attributes = kind_ == storage::WriteKind::kPut ? item : table_.KeyOf(item);
    intents.push_back(std::move(intent));
  }
  return intents;
}

void BackoffWriter::CheckStatus(const storage::BatchWriteResult& result) const {
  if (result.http_status == 200) return;
  throw storage::ServiceError(std::string(storage::WriteKindName(kind_)) + " returned a problem writing batch items to " +
                                  table_.Name() + " in " + table_.Env() + ": HTTP " +
                                  std::to_string(result.http_status) + " " + result.error_message,
                              result.http_status);
}

void BackoffWriter::Execute(const std::vector<storage::Item>& batch) const {
  if (batch.empty()) return;
  if (batch.size() > storage::kMaxBatchWriteItems) {
    throw storage::ConfigurationError("Batch of " + std::to_string(batch.size()) + " exceeds the limit of " +
                                      std::to_string(storage::kMaxBatchWriteItems) + " write requests");
  }

  auto result = table_.Service().BatchWrite(table_.Name(), ToIntents(batch));
  CheckStatus(result);

  auto delay = policy_.initial_delay;
  int retries = 0;
  while (!result.unprocessed.empty()) {
    if (policy_.max_attempts > 0 && retries >= policy_.max_attempts) {
      throw storage::RetryExhaustedError(std::to_string(result.unprocessed.size()) + " items still unprocessed on " +
                                             table_.Name() + " after " + std::to_string(retries) + " retries",
                                         retries);
    }
    util::LogInfo("Unprocessed items detected on " + table_.Name() + " (" + std::to_string(result.unprocessed.size()) +
                  ")... backing off " + std::to_string(delay.count()) + "ms and trying again");
    sleep_(delay);
    delay *= 2;
    ++retries;
    result = table_.Service().BatchWrite(table_.Name(), result.unprocessed);
    CheckStatus(result);
  }
}

}  // namespace replication
