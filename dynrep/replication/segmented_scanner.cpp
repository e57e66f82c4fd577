#include "segmented_scanner.h"

#include <future>
#include <iterator>
#include <utility>

#include "../util/log.h"

namespace replication {

std::vector<storage::Item> ScanSegment(const TableHandle& table, int segment, int total_segments) {
  storage::ScanPageRequest req;
  req.table_name = table.Name();
  req.segment = segment;
  req.total_segments = total_segments;
  req.consistent_read = true;

  std::vector<storage::Item> items;
  while (true) {
    auto page = table.Service().Scan(req);
    items.insert(items.end(), std::make_move_iterator(page.items.begin()), std::make_move_iterator(page.items.end()));
    if (page.last_evaluated_key.empty()) break;
    req.exclusive_start_key = std::move(page.last_evaluated_key);
  }

  util::LogDebug("Scanned " + std::to_string(items.size()) + " items from " + table.Name() + " segment " +
                 std::to_string(segment) + "/" + std::to_string(total_segments));
  return items;
}

SegmentedScanner::SegmentedScanner(WorkerPool& pool) : pool_(pool) {}

std::vector<std::vector<storage::Item>> SegmentedScanner::ScanSegments(const TableHandle& table, int total_segments) {
  if (total_segments <= 0) total_segments = static_cast<int>(pool_.Size());

  std::vector<std::future<std::vector<storage::Item>>> futures;
  futures.reserve(static_cast<size_t>(total_segments));
  for (int segment = 0; segment < total_segments; ++segment) {
    futures.push_back(pool_.Submit([&table, segment, total_segments] {
      return ScanSegment(table, segment, total_segments);
    }));
  }
  auto segments = CollectAll(futures);

  size_t total = 0;
  for (const auto& s : segments) total += s.size();
  util::LogInfo("Scanned " + std::to_string(total) + " items from " + table.Name() + " in " + table.Env() + " across " +
                std::to_string(total_segments) + " segments");
  return segments;
}

std::vector<storage::Item> SegmentedScanner::ScanAll(const TableHandle& table, int total_segments) {
  auto segments = ScanSegments(table, total_segments);
  std::vector<storage::Item> out;
  for (auto& s : segments) {
    out.insert(out.end(), std::make_move_iterator(s.begin()), std::make_move_iterator(s.end()));
  }
  return out;
}

}  // namespace replication
