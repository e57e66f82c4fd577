#pragma once

#include <chrono>
#include <functional>
#include <vector>

#include "../storage/models.h"
#include "table_handle.h"

namespace replication {

struct BackoffPolicy {
  std::chrono::milliseconds initial_delay{3000};
  // Retries allowed before giving up; 0 keeps retrying until the batch drains.
  int max_attempts = 0;
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

void SleepFor(std::chrono::milliseconds delay);

// Writes one batch (at most kMaxBatchWriteItems) of puts or deletes to a table.
// Unprocessed intents are resubmitted with a doubling delay until none remain.
// A non-200 status is never retried.
class BackoffWriter {
 public:
  BackoffWriter(const TableHandle& table, storage::WriteKind kind, BackoffPolicy policy, SleepFn sleep = SleepFor);

  // Items are whole items; for deletes only their key attributes are sent.
  void Execute(const std::vector<storage::Item>& batch) const;

  storage::WriteKind Kind() const { return kind_; }

 private:
  std::vector<storage::WriteIntent> ToIntents(const std::vector<storage::Item>& batch) const;
  void CheckStatus(const storage::BatchWriteResult& result) const;

  const TableHandle& table_;
  storage::WriteKind kind_;
  BackoffPolicy policy_;
  SleepFn sleep_;
};

}  // namespace replication
