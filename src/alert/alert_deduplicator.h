#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace pm_sentinel {

enum class SignalKind {
  kGap,
  kMove,
  kNews,
  kCorrelation,
};

inline const char* ToString(SignalKind kind) {
  switch (kind) {
    case SignalKind::kGap:
      return "gap";
    case SignalKind::kMove:
      return "move";
    case SignalKind::kNews:
      return "news";
    case SignalKind::kCorrelation:
      return "correlation";
  }
  return "unknown";
}

/**
 * @brief 单信号去重判定（纯函数）
 *
 * - 数值信号（价差/波动，`value` 非空）：无记录，或距上次告警超过冷却期，
 *   或 `|value - last_value|` 超过 `realert_delta_bps` 时放行；
 * - 新闻信号（`value` 为空）：仅在无记录时放行。
 *
 * 放行时返回更新后的记录，否则返回 `std::nullopt` 并写入 `out_reason`。
 */
std::optional<AlertRecord> ShouldFire(const std::string& signal_key,
                                      std::optional<int> value,
                                      const AlertHistory& history,
                                      std::int64_t now_ms,
                                      const AlertConfig& config,
                                      std::string* out_reason);

/// 去重统计：用于单轮汇总日志。
struct AlertDedupStats {
  int checks{0};
  int allowed{0};
  int cooldown_rejects{0};  ///< 冷却期内且变化不足。
  int seen_rejects{0};      ///< 新闻已告警过。
  int cap_rejects{0};       ///< 本轮该类信号已达上限。
};

/// 单轮上限拒绝的原因前缀；此类信号下一轮重新评估。
inline constexpr const char* kCycleCapReason = "cycle_cap_reached";

inline bool IsCycleCapRejection(const std::string& reason) {
  return reason.rfind(kCycleCapReason, 0) == 0;
}

/**
 * @brief 单轮告警准入器
 *
 * 在 `ShouldFire` 之上叠加每类信号的单轮上限（`max_per_kind_per_cycle`，
 * 0 表示不限）。超出上限的信号不写记录，下一轮重新评估。
 * 告警历史以参数传入，准入器本身只持有本轮计数。
 */
class AlertDeduplicator {
 public:
  explicit AlertDeduplicator(AlertConfig config)
      : config_(config) {}

  /**
   * @brief 判断信号是否放行
   *
   * @param kind 信号类别（决定上限计数桶）
   * @param signal_key 信号稳定键
   * @param value 数值信号的 bps；新闻为空
   * @param history 当前告警历史（只读）
   * @param now_ms 当前毫秒时间戳
   * @param out_record 放行时输出更新后的记录
   * @param out_reason 拒绝原因（可选输出）
   */
  bool Allow(SignalKind kind,
             const std::string& signal_key,
             std::optional<int> value,
             const AlertHistory& history,
             std::int64_t now_ms,
             AlertRecord* out_record,
             std::string* out_reason);

  const AlertDedupStats& stats() const { return stats_; }

 private:
  AlertConfig config_;
  int fired_by_kind_[4]{0, 0, 0, 0};
  AlertDedupStats stats_;
};

/**
 * @brief 告警历史清理
 *
 * - `gap:`/`move:`/`corr:` 记录：任一对应市场不在本轮成功抓取平台的活跃列表中时删除；
 *   抓取失败的平台不做判断；
 * - `news:` 记录：条目已移出已读历史时删除。
 *
 * @return 删除的记录数
 */
int PruneAlertHistory(AlertHistory* history,
                      const std::vector<Market>& active_markets,
                      const std::vector<Platform>& fetched_platforms,
                      const std::vector<SeenItem>& seen_history);

}  // namespace pm_sentinel
