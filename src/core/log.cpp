#include "core/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace pm_sentinel {

namespace {

std::mutex g_log_mutex;
std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};

bool Enabled(LogLevel level) {
  return static_cast<int>(level) >= g_min_level.load(std::memory_order_relaxed);
}

void Write(std::ostream& out, const char* tag, std::string_view message) {
  // 抓取线程统一走同一把锁，避免日志交叉写入。
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  out << std::put_time(&tm, "%F %T") << ' ' << tag << ' ' << message << '\n';
}

}  // namespace

void SetLogLevel(LogLevel level) {
  g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool ParseLogLevel(const std::string& text, LogLevel* out_level) {
  if (out_level == nullptr) {
    return false;
  }
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    *out_level = LogLevel::kDebug;
    return true;
  }
  if (lowered == "info" || lowered == "warn" || lowered == "warning") {
    *out_level = LogLevel::kInfo;
    return true;
  }
  if (lowered == "error") {
    *out_level = LogLevel::kError;
    return true;
  }
  return false;
}

void LogDebug(std::string_view message) {
  if (!Enabled(LogLevel::kDebug)) {
    return;
  }
  Write(std::cout, "[DEBUG]", message);
}

void LogInfo(std::string_view message) {
  if (!Enabled(LogLevel::kInfo)) {
    return;
  }
  Write(std::cout, "[INFO]", message);
}

void LogError(std::string_view message) {
  // ERROR 不受级别过滤影响。
  Write(std::cerr, "[ERROR]", message);
}

}  // namespace pm_sentinel
