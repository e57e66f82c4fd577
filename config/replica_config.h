#pragma once

#include <chrono>
#include <cstdint>
#include <string>

struct ReplicaConfig {
  int workers = 1;
  // Parallel scan segments; follows workers unless set explicitly.
  int segments = 1;
  int backoff_initial_ms = 3000;
  int backoff_max_attempts = 0;  // 0 = retry until drained
  int query_page_size = 200;
  std::string log_level = "info";

  static ReplicaConfig FromEnv();
  std::chrono::milliseconds BackoffInitialDelay() const;
};
