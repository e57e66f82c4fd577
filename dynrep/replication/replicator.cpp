#include "replicator.h"

#include <future>
#include <utility>

#include "../storage/errors.h"
#include "../util/log.h"
#include "batcher.h"
#include "segmented_scanner.h"
#include "truncator.h"

namespace replication {

Replicator::Replicator(WorkerPool& pool, ReplicatorOptions options) : pool_(pool), options_(std::move(options)) {
  if (!options_.compatible) options_.compatible = IsCopyCompatible;
  if (!options_.sleep) options_.sleep = SleepFor;
}

void Replicator::CheckCopyCompatible(const TableHandle& source, const TableHandle& target, const char* what) const {
  if (options_.compatible(source, target)) return;
  throw storage::ConfigurationError(std::string("Cannot copy ") + what + ": " + source.Name() +
                                    " != " + target.Name() + ".");
}

void Replicator::CopyTable(const TableHandle& source, const TableHandle& target) {
  CheckCopyCompatible(source, target, "different tables");

  CreateBackup(target);
  Truncator(pool_, options_.backoff, options_.sleep).Truncate(target);
  const int64_t copied = CopyInParallel(source, target);
  util::LogInfo("Copied " + std::to_string(copied) + " items from " + source.Name() + " in " + source.Env() + " to " +
                target.Name() + " in " + target.Env());
}

void Replicator::CopyItems(const TableHandle& source, const TableHandle& target, const ItemSelector& selector) {
  CheckCopyCompatible(source, target, "items across tables with different names");

  const auto source_items = Query(source, selector);
  const auto target_items = Query(target, selector);

  WriteInParallel(target, storage::WriteKind::kDelete, target_items);
  util::LogInfo("Deleted " + std::to_string(target_items.size()) + " items from " + target.Name() + " in " +
                target.Env());
  WriteInParallel(target, storage::WriteKind::kPut, source_items);
  util::LogInfo("Put " + std::to_string(source_items.size()) + " items to " + target.Name() + " in " + target.Env());

  util::LogInfo("Copied " + std::to_string(source_items.size()) + " items from " + source.Name() + " in " +
                source.Env() + " to " + target.Name() + " in " + target.Env());
}

std::vector<storage::Item> Replicator::Query(const TableHandle& table, const ItemSelector& selector) {
  return QueryItems(table, selector, std::nullopt, options_.query_page_size);
}

std::vector<storage::Item> Replicator::QueryWithFilter(const TableHandle& table,
                                                       const ItemSelector& selector,
                                                       const AttributeFilter& filter) {
  return QueryItems(table, selector, filter, options_.query_page_size);
}

storage::BackupInfo Replicator::CreateBackup(const TableHandle& table) {
  const std::string backup_name = table.Name() + "-backup";
  auto info = table.Service().CreateBackup(table.Name(), backup_name);
  util::LogInfo("Created on-demand backup of " + table.Name() + " in " + table.Env() + " as '" + backup_name + "'");
  return info;
}

void Replicator::RestoreFromBackup(const TableHandle& table, const TableHandle& backup) {
  Truncator(pool_, options_.backoff, options_.sleep).Truncate(table);
  CopyInParallel(backup, table);
  backup.Service().DeleteTable(backup.Name());
  util::LogInfo("All items from " + backup.Name() + " have been copied to " + table.Name() + ". " + backup.Name() +
                " is now deleted");
}

int64_t Replicator::CopyInParallel(const TableHandle& source, const TableHandle& target) {
  SegmentedScanner scanner(pool_);
  auto segments = scanner.ScanSegments(source, options_.scan_segments);

  int64_t counter = 0;
  for (const auto& items : segments) {
    counter += static_cast<int64_t>(items.size());
    WriteInParallel(target, storage::WriteKind::kPut, items);
    util::LogDebug("Put " + std::to_string(items.size()) + " to " + target.Name() + " in " + target.Env());
  }
  return counter;
}

void Replicator::WriteInParallel(const TableHandle& target,
                                 storage::WriteKind kind,
                                 const std::vector<storage::Item>& items) {
  const BackoffWriter writer(target, kind, options_.backoff, options_.sleep);
  std::vector<std::future<void>> pending;
  for (auto& batch : SplitIntoBatches(items)) {
    pending.push_back(pool_.Submit([&writer, batch = std::move(batch)] { writer.Execute(batch); }));
  }
  WaitAll(pending);
}

}  // namespace replication
