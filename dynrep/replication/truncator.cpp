#include "truncator.h"

#include <future>
#include <utility>
#include <vector>

#include "../util/log.h"
#include "batcher.h"

namespace replication {

Truncator::Truncator(WorkerPool& pool, BackoffPolicy policy, SleepFn sleep)
    : pool_(pool), policy_(policy), sleep_(std::move(sleep)) {}

int64_t Truncator::Truncate(const TableHandle& table) {
  storage::ScanPageRequest req;
  req.table_name = table.Name();
  req.projection = table.KeyAttributeNames();

  const BackoffWriter deleter(table, storage::WriteKind::kDelete, policy_, sleep_);
  int64_t counter = 0;
  auto page = table.Service().Scan(req);
  while (!page.items.empty()) {
    counter += static_cast<int64_t>(page.items.size());

    std::vector<std::future<void>> pending;
    for (auto& batch : SplitIntoBatches(page.items)) {
      pending.push_back(pool_.Submit([&deleter, batch = std::move(batch)] { deleter.Execute(batch); }));
    }
    WaitAll(pending);

    if (page.last_evaluated_key.empty()) break;
    req.exclusive_start_key = std::move(page.last_evaluated_key);
    page = table.Service().Scan(req);
  }

  util::LogInfo("Truncated all " + std::to_string(counter) + " items from " + table.Name() + " in " + table.Env() + ".");
  return counter;
}

}  // namespace replication
