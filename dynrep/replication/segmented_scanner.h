#pragma once

#include <vector>

#include "../storage/models.h"
#include "table_handle.h"
#include "worker_pool.h"

namespace replication {

// Reads one segment of a parallel scan to exhaustion with strongly consistent reads.
std::vector<storage::Item> ScanSegment(const TableHandle& table, int segment, int total_segments);

// Full-table read split into disjoint segments scanned concurrently on the pool.
class SegmentedScanner {
 public:
  explicit SegmentedScanner(WorkerPool& pool);

  // One entry per segment, indexed by segment number. total_segments <= 0 means
  // one segment per pool worker. If any segment fails the whole scan fails.
  std::vector<std::vector<storage::Item>> ScanSegments(const TableHandle& table, int total_segments = 0);

  std::vector<storage::Item> ScanAll(const TableHandle& table, int total_segments = 0);

 private:
  WorkerPool& pool_;
};

}  // namespace replication
