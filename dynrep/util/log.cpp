#include "log.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace util {
namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_out_mu;

bool Enabled(LogLevel level) {
  return static_cast<int>(level) <= g_level.load(std::memory_order_relaxed);
}

}  // namespace

void SetLogLevel(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

void SetLogLevel(const std::string& name) {
  if (name == "error") SetLogLevel(LogLevel::kError);
  else if (name == "info") SetLogLevel(LogLevel::kInfo);
  else if (name == "debug") SetLogLevel(LogLevel::kDebug);
}

LogLevel GetLogLevel() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void LogInfo(const std::string& line) {
  if (!Enabled(LogLevel::kInfo)) return;
  std::lock_guard<std::mutex> lock(g_out_mu);
  std::cout << line << "\n";
}

void LogDebug(const std::string& line) {
  if (!Enabled(LogLevel::kDebug)) return;
  std::lock_guard<std::mutex> lock(g_out_mu);
  std::cout << line << "\n";
}

void LogError(const std::string& line) {
  std::lock_guard<std::mutex> lock(g_out_mu);
  std::cerr << line << "\n";
}

}  // namespace util
