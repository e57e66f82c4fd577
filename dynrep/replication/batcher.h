#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "../storage/models.h"

namespace replication {

// Contiguous, ordered chunks of at most batch_size elements; only the last one
// may be shorter.
template <typename T>
std::vector<std::vector<T>> SplitIntoBatches(const std::vector<T>& items,
                                             size_t batch_size = storage::kMaxBatchWriteItems) {
  if (batch_size == 0) throw std::invalid_argument("batch_size must be positive");
  std::vector<std::vector<T>> out;
  out.reserve((items.size() + batch_size - 1) / batch_size);
  for (size_t i = 0; i < items.size(); i += batch_size) {
    const size_t end = std::min(items.size(), i + batch_size);
    out.emplace_back(items.begin() + static_cast<std::ptrdiff_t>(i), items.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return out;
}

}  // namespace replication
