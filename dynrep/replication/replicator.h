#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "../storage/models.h"
#include "backoff_writer.h"
#include "paginated_query.h"
#include "table_handle.h"
#include "worker_pool.h"

namespace replication {

struct ReplicatorOptions {
  // Parallel scan segments; <= 0 means one per pool worker.
  int scan_segments = 0;
  int query_page_size = kDefaultQueryPageSize;
  BackoffPolicy backoff;
  SleepFn sleep = SleepFor;
  CompatibilityPredicate compatible = IsCopyCompatible;
};

// Sequences scans, queries, truncation and batched writes into the public
// copy, backup and restore operations. Every operation either completes its
// whole sequence or throws; a failure midway is not rolled back.
class Replicator {
 public:
  explicit Replicator(WorkerPool& pool, ReplicatorOptions options = ReplicatorOptions());

  // Backs up the target, truncates it, then copies every source item into it.
  void CopyTable(const TableHandle& source, const TableHandle& target);

  // Replaces the target's items matching the selector with the source's.
  // All deletes finish before the first put is issued.
  void CopyItems(const TableHandle& source, const TableHandle& target, const ItemSelector& selector);

  std::vector<storage::Item> Query(const TableHandle& table, const ItemSelector& selector);
  std::vector<storage::Item> QueryWithFilter(const TableHandle& table,
                                             const ItemSelector& selector,
                                             const AttributeFilter& filter);

  // On-demand backup named "<table>-backup".
  storage::BackupInfo CreateBackup(const TableHandle& table);

  // Truncates `table`, copies `backup` into it, then deletes `backup`.
  void RestoreFromBackup(const TableHandle& table, const TableHandle& backup);

 private:
  void CheckCopyCompatible(const TableHandle& source, const TableHandle& target, const char* what) const;
  int64_t CopyInParallel(const TableHandle& source, const TableHandle& target);
  void WriteInParallel(const TableHandle& target, storage::WriteKind kind, const std::vector<storage::Item>& items);

  WorkerPool& pool_;
  ReplicatorOptions options_;
};

}  // namespace replication
