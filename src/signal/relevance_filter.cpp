#include "signal/relevance_filter.h"

#include <algorithm>
#include <cstddef>
#include <unordered_set>
#include <utility>

#include "core/text_utils.h"
#include "match/market_matcher.h"

namespace pm_sentinel {

NewsFilterResult FilterNews(const std::vector<NewsItem>& items,
                            const std::vector<KeywordRule>& rules,
                            const std::vector<SeenItem>& seen_history,
                            std::int64_t now_ms,
                            const NewsFilterOptions& options) {
  NewsFilterResult result;

  std::unordered_set<std::string> seen_ids;
  seen_ids.reserve(seen_history.size() + items.size());
  for (const auto& seen : seen_history) {
    seen_ids.insert(seen.item_id);
  }

  std::vector<const NewsItem*> ordered;
  ordered.reserve(items.size());
  for (const auto& item : items) {
    ordered.push_back(&item);
  }
  // 无发布时间的条目排在最后；同一时间保持输入顺序。
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const NewsItem* lhs, const NewsItem* rhs) {
                     return lhs->published_at_ms.value_or(-1) >
                            rhs->published_at_ms.value_or(-1);
                   });

  std::vector<std::string> batch_titles;
  for (const NewsItem* item : ordered) {
    if (!seen_ids.insert(item->item_id).second) {
      ++result.already_seen;
      continue;
    }

    const std::string normalized_title = NormalizeTitle(item->title);
    const bool duplicate =
        std::any_of(batch_titles.begin(), batch_titles.end(),
                    [&](const std::string& earlier) {
                      return TitleSimilarity(earlier, normalized_title) >=
                             options.duplicate_title_similarity;
                    });
    if (duplicate) {
      ++result.duplicates;
      result.newly_seen.push_back(SeenItem{item->item_id, now_ms});
      continue;
    }
    batch_titles.push_back(normalized_title);

    NewsSignal signal;
    signal.category = MatchKeywordRules(
        NormalizeTitle(item->title + " " + item->summary), rules, &signal.matched_keywords);
    if (signal.matched_keywords.empty()) {
      ++result.irrelevant;
      result.newly_seen.push_back(SeenItem{item->item_id, now_ms});
      continue;
    }
    signal.item = *item;
    result.signals.push_back(std::move(signal));
  }
  return result;
}

std::vector<SeenItem> MergeSeenHistory(const std::vector<SeenItem>& history,
                                       const std::vector<SeenItem>& newly_seen,
                                       int max_size,
                                       int keep_size) {
  std::vector<SeenItem> merged = history;
  merged.insert(merged.end(), newly_seen.begin(), newly_seen.end());
  if (max_size > 0 && static_cast<int>(merged.size()) > max_size) {
    const std::size_t keep = static_cast<std::size_t>(std::max(0, keep_size));
    merged.erase(merged.begin(),
                 merged.end() - static_cast<std::ptrdiff_t>(std::min(keep, merged.size())));
  }
  return merged;
}

}  // namespace pm_sentinel
