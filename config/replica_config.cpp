#include "replica_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <thread>

namespace {

int clamp_int(int value, int min_v, int max_v) {
  return std::max(min_v, std::min(value, max_v));
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

int getenv_int(const char* name, int default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  char* end = nullptr;
  long parsed = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') return default_value;
  return static_cast<int>(parsed);
}

bool has_env(const char* name) {
  const char* v = std::getenv(name);
  return v && *v;
}

int default_workers() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<int>(hw);
}

}  // namespace

ReplicaConfig ReplicaConfig::FromEnv() {
  ReplicaConfig cfg;

  cfg.workers = clamp_int(getenv_int("DYNREP_WORKERS", default_workers()), 1, 256);
  cfg.segments = cfg.workers;
  if (has_env("DYNREP_SEGMENTS")) {
    cfg.segments = clamp_int(getenv_int("DYNREP_SEGMENTS", cfg.segments), 1, 1000000);
  }
  cfg.backoff_initial_ms = std::max(1, getenv_int("DYNREP_BACKOFF_INITIAL_MS", cfg.backoff_initial_ms));
  cfg.backoff_max_attempts = std::max(0, getenv_int("DYNREP_BACKOFF_MAX_ATTEMPTS", cfg.backoff_max_attempts));
  cfg.query_page_size = clamp_int(getenv_int("DYNREP_QUERY_PAGE_SIZE", cfg.query_page_size), 1, 1000);

  const char* level = std::getenv("DYNREP_LOG_LEVEL");
  if (level && *level) {
    const std::string l = lower(level);
    if (l == "error" || l == "info" || l == "debug") cfg.log_level = l;
  }

  return cfg;
}

std::chrono::milliseconds ReplicaConfig::BackoffInitialDelay() const {
  return std::chrono::milliseconds(backoff_initial_ms);
}
