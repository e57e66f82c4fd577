#pragma once

#include <string>

namespace util {

enum class LogLevel { kError = 0, kInfo = 1, kDebug = 2 };

void SetLogLevel(LogLevel level);
// Accepts "error", "info" or "debug"; anything else keeps the current level.
void SetLogLevel(const std::string& name);
LogLevel GetLogLevel();

// Whole lines only, so output from pool threads does not interleave.
void LogInfo(const std::string& line);
void LogDebug(const std::string& line);
void LogError(const std::string& line);

}  // namespace util
