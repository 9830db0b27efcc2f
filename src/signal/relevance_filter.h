#pragma once

#include <cstdint>
#include <vector>

#include "core/types.h"

namespace pm_sentinel {

struct NewsFilterOptions {
  /// 同批次内标题相似度达到该值视为重复报道。
  double duplicate_title_similarity{0.8};
};

struct NewsFilterResult {
  std::vector<NewsSignal> signals;
  /// 本轮首次检查且已定论的条目（重复、不相关）。
  /// 产生信号的条目不在此列，由调用方在告警放行后再记为已读。
  std::vector<SeenItem> newly_seen;
  int already_seen{0};
  int duplicates{0};
  int irrelevant{0};
};

/**
 * @brief 新闻相关性过滤
 *
 * 处理顺序：按发布时间由新到旧。
 * 1. 已在历史中的 `item_id` 直接丢弃，不再做关键词判断（规则变化不会使其复活）；
 * 2. 与本批次更早条目标题近似的视为重复，仅记为已读；
 * 3. 标题+摘要在词边界上命中任一关键词即产生一条信号，
 *    类别取命中关键词最多的规则。此类条目暂不记为已读。
 */
NewsFilterResult FilterNews(const std::vector<NewsItem>& items,
                            const std::vector<KeywordRule>& rules,
                            const std::vector<SeenItem>& seen_history,
                            std::int64_t now_ms,
                            const NewsFilterOptions& options);

/**
 * @brief 合并已读历史
 *
 * 追加新条目；总数超过 `max_size` 时仅保留最新的 `keep_size` 条。
 */
std::vector<SeenItem> MergeSeenHistory(const std::vector<SeenItem>& history,
                                       const std::vector<SeenItem>& newly_seen,
                                       int max_size,
                                       int keep_size);

}  // namespace pm_sentinel
