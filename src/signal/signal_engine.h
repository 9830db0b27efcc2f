#pragma once

#include <cstdint>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace pm_sentinel {

/// 两个概率之差的绝对值（bps，四舍五入为整数，消除浮点噪声）。
int PriceDiffBps(double lhs, double rhs);

/**
 * @brief 跨平台价差检测
 *
 * `gap_bps >= threshold_bps` 即为候选（含等号）；方向记录价格较高的一侧。
 * 结果按 `gap_bps` 降序、配对键升序排列。
 */
std::vector<GapSignal> DetectGaps(const std::vector<MatchedPair>& pairs,
                                  int threshold_bps);

/**
 * @brief 单市场价格波动检测
 *
 * 仅对上一快照中存在的市场计算；首次出现的市场只建立基线，不产生信号。
 * 结果按 `move_bps` 降序、市场键升序排列。
 */
std::vector<MoveSignal> DetectMoves(const std::vector<Market>& markets,
                                    const Snapshot& prior,
                                    int threshold_bps);

/**
 * @brief 相关市场背离检测
 *
 * 以上一快照为基线计算每个市场的带符号波动（bps），首次出现的市场不参与。
 * 领动方 `|move| >= threshold_bps`，滞后方 `|move| < threshold_bps * laggard_ratio`。
 * 两者相关的判定：
 * 1. 任一提示对在两侧标题中分别按词边界命中（顺序不限）；
 * 2. 否则标题相似度严格大于 `similarity_floor`。
 * 本轮已配对的跨平台市场之间的背离属于价差信号，不在此重复报告。
 * 结果按领动方 `|move|` 降序、信号键升序排列。
 */
std::vector<CorrelationSignal> DetectCorrelationAnomalies(
    const std::vector<Market>& markets,
    const Snapshot& prior,
    const std::vector<MatchedPair>& pairs,
    const CorrelationConfig& config);

/**
 * @brief 生成下一轮快照
 *
 * 本轮抓取成功的平台以当前价格整体替换；`failed_platforms` 中的平台沿用
 * 上一快照条目，避免短暂故障重置波动基线。任一平台失败时配对条目同样沿用。
 */
Snapshot BuildSnapshot(const std::vector<Market>& markets,
                       const std::vector<MatchedPair>& pairs,
                       const Snapshot& prior,
                       const std::vector<Platform>& failed_platforms,
                       std::int64_t now_ms);

}  // namespace pm_sentinel
