#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.h"

namespace pm_sentinel {

/// Telegram HTML 模式转义：`&` `<` `>` `"`。
std::string HtmlEscape(const std::string& text);

/// 概率格式化为百分比，保留 1 位小数（0.723 -> "72.3%"）。
std::string FormatPercent(double probability);

/**
 * @brief 信号文本渲染（纯函数）
 *
 * 每种信号、每种语言（en/he/fr）一套模板；未知语言回退 en。
 * 用户可控文本（标题、链接、关键词、来源）一律 HTML 转义。
 */
std::string FormatSignal(const GapSignal& signal, const std::string& language);
std::string FormatSignal(const MoveSignal& signal, const std::string& language);
std::string FormatSignal(const NewsSignal& signal, const std::string& language);
std::string FormatSignal(const CorrelationSignal& signal, const std::string& language);

/// 心跳统计。
struct HeartbeatStats {
  std::int64_t run_count{0};
  int markets_tracked{0};
  int pairs_matched{0};
  int signals_fired{0};
  int errors{0};
};

/// 启动通知内容。
struct StartupInfo {
  int interval_minutes{0};
  int threshold_bps{0};
  int correlation_threshold_bps{0};  ///< 0 表示相关背离检测关闭。
  int feeds{0};
  std::int64_t run_count{0};  ///< 已恢复历史的运行次数；0 表示无历史。
  std::vector<std::string> languages;
};

/// 启动通知：服务上线时发送一次。
std::string FormatStartup(const StartupInfo& info, const std::string& language);

/// 心跳文本：周期性确认服务存活。
std::string FormatHeartbeat(const HeartbeatStats& stats, const std::string& language);

}  // namespace pm_sentinel
