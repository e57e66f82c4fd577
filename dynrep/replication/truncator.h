#pragma once

#include <cstdint>

#include "backoff_writer.h"
#include "table_handle.h"
#include "worker_pool.h"

namespace replication {

// Deletes every item of a table, page by page, reading only key attributes.
// Not atomic: readers can observe a partially emptied table.
class Truncator {
 public:
  Truncator(WorkerPool& pool, BackoffPolicy policy, SleepFn sleep = SleepFor);

  // Returns the number of items deleted.
  int64_t Truncate(const TableHandle& table);

 private:
  WorkerPool& pool_;
  BackoffPolicy policy_;
  SleepFn sleep_;
};

}  // namespace replication
