#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/json_utils.h"
#include "core/types.h"

namespace pm_sentinel {

/// 单条原始市场记录的归一化结果。
enum class NormalizeOutcome {
  kAccepted,    ///< 产出有效 Market。
  kInactive,    ///< 已关闭/已结算/不接受下单/标题日期已过，静默丢弃。
  kParseError,  ///< 字段缺失或非法，记为解析错误并跳过。
};

/// 归一化上下文：同一批次共享。
struct NormalizeContext {
  std::int64_t fetched_at_ms{0};
  std::int64_t now_ms{0};  ///< 用于标题过期判断。
  bool drop_expired_titles{true};
  const std::vector<KeywordRule>* rules{nullptr};  ///< 类别推断规则，可为空。
};

/// 批量归一化统计与结果。
struct NormalizeBatch {
  std::vector<Market> markets;
  int parse_errors{0};
  int inactive{0};
  int duplicates{0};
  std::string first_error;  ///< 首个解析错误描述，便于日志定位。
};

/**
 * @brief 归一化单条平台市场记录
 *
 * Polymarket（Gamma `/markets`）与 Kalshi（`/trade-api/v2/markets`）字段映射
 * 在实现中分别处理；下游只看到统一的 `Market`。
 * 价格不在 [0,1] 内、缺少 id/标题/价格均视为 `kParseError`。
 */
NormalizeOutcome NormalizeMarket(const JsonValue& payload,
                                 Platform platform,
                                 const NormalizeContext& context,
                                 Market* out_market,
                                 std::string* out_error);

/// 批量归一化；同平台重复 `external_id` 仅保留首条。
NormalizeBatch NormalizeMarkets(const std::vector<JsonValue>& payloads,
                                Platform platform,
                                const NormalizeContext& context);

/**
 * @brief 标题日期过期判断
 *
 * 标题同时包含月份名（全称或缩写）与 20xx 年份，且该月已整体过去时返回 `true`。
 */
bool IsExpiredTitle(const std::string& title, std::int64_t now_ms);

}  // namespace pm_sentinel
