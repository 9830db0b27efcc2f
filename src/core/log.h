#pragma once

#include <string>
#include <string_view>

namespace pm_sentinel {

/// 日志级别：低于当前最小级别的日志直接丢弃。
enum class LogLevel {
  kDebug,
  kInfo,
  kError,
};

/// 设置全局最小日志级别（默认 INFO）。
void SetLogLevel(LogLevel level);

/**
 * @brief 解析日志级别文本
 *
 * 支持 `debug/info/warn/warning/error`（大小写不敏感）；
 * `warn` 归并到 INFO。无法识别时返回 `false`，不修改输出。
 */
bool ParseLogLevel(const std::string& text, LogLevel* out_level);

/// 输出 DEBUG 级日志（`stdout`，`[DEBUG]` 前缀）。
void LogDebug(std::string_view message);

/**
 * @brief 输出 INFO 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stdout`；
 * 3. 自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stderr`；
 * 3. 自动附加本地时间戳和 `[ERROR]` 前缀。
 */
void LogError(std::string_view message);

}  // namespace pm_sentinel
