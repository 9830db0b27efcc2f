#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pm_sentinel {

/// 预测市场平台（跨平台统一语义）。
enum class Platform {
  kPolymarket,
  kKalshi,
};

/// 平台文本化（用于存储键与日志）。
inline const char* ToString(Platform platform) {
  switch (platform) {
    case Platform::kPolymarket:
      return "polymarket";
    case Platform::kKalshi:
      return "kalshi";
  }
  return "unknown";
}

/// 平台展示名（用于告警文本）。
inline const char* DisplayName(Platform platform) {
  switch (platform) {
    case Platform::kPolymarket:
      return "Polymarket";
    case Platform::kKalshi:
      return "Kalshi";
  }
  return "Unknown";
}

/// 归一化后的单个市场：下游模块只看到该结构，不接触平台原始字段。
struct Market {
  Platform platform{Platform::kPolymarket};
  std::string external_id;
  std::string title;        // 展示标题：保留原始大小写，空白已折叠。
  std::string match_title;  // 匹配标题：小写、去标点、空白折叠。
  std::string category;     // 可能为空。
  bool category_inferred{false};  // category 由关键词规则判定时为 true；否则为平台自报或空。
  double price{0.0};        // YES 概率，[0, 1]。
  std::string url;
  std::int64_t fetched_at_ms{0};
};

/// 市场存储键：`<platform>:<external_id>`。
inline std::string MarketKey(Platform platform, const std::string& external_id) {
  return std::string(ToString(platform)) + ":" + external_id;
}

inline std::string MarketKey(const Market& market) {
  return MarketKey(market.platform, market.external_id);
}

/// 跨平台配对：仅引用本轮扫描中的 Market，不持有所有权。
struct MatchedPair {
  const Market* poly{nullptr};
  const Market* kalshi{nullptr};
  double similarity{0.0};
};

/// 配对稳定键：`<poly_id>|<kalshi_id>`。
inline std::string PairKey(const std::string& poly_id, const std::string& kalshi_id) {
  return poly_id + "|" + kalshi_id;
}

inline std::string PairKey(const MatchedPair& pair) {
  return PairKey(pair.poly->external_id, pair.kalshi->external_id);
}

struct SnapshotMarketEntry {
  double price{0.0};
  std::int64_t fetched_at_ms{0};
};

struct SnapshotPairEntry {
  int gap_bps{0};
  std::int64_t seen_at_ms{0};
};

/**
 * @brief 上一轮成功扫描的持久化快照
 *
 * 生命周期：轮次开始时读取，轮次成功结束时整体替换，不做局部更新。
 */
struct Snapshot {
  std::unordered_map<std::string, SnapshotMarketEntry> markets;  ///< MarketKey -> 价格。
  std::unordered_map<std::string, SnapshotPairEntry> pairs;  ///< PairKey -> 价差。
  std::int64_t saved_at_ms{0};
};

/// 告警抑制记录：每个 signal_key 至多一条。
struct AlertRecord {
  std::string signal_key;
  std::int64_t last_fired_at_ms{0};
  std::optional<int> last_value;  // 触发时的 bps；新闻为空。
};

using AlertHistory = std::unordered_map<std::string, AlertRecord>;

/// 已处理新闻条目（按 item_id 去重）。
struct SeenItem {
  std::string item_id;
  std::int64_t seen_at_ms{0};
};

/// 状态存储持久化的完整内容。
struct PersistedState {
  Snapshot snapshot;
  AlertHistory alerts;
  std::vector<SeenItem> seen_items;  ///< 按首次出现时间升序。
  std::int64_t run_count{0};
};

/// 归一化后的新闻条目。
struct NewsItem {
  std::string item_id;  // GUID/链接/标题的 SHA-256 摘要。
  std::string title;
  std::string link;
  std::string source;   // 来源 feed 名称。
  std::string summary;
  std::optional<std::int64_t> published_at_ms;
};

/// 关注的关键词规则：命中任一关键词即归入该类别。
struct KeywordRule {
  std::string category;
  std::vector<std::string> keywords;
};

enum class GapDirection {
  kPolyHigher,
  kKalshiHigher,
};

struct GapSignal {
  MatchedPair pair;
  int gap_bps{0};
  GapDirection direction{GapDirection::kPolyHigher};
};

struct MoveSignal {
  const Market* market{nullptr};
  double before_price{0.0};
  double after_price{0.0};
  int move_bps{0};
  std::int64_t elapsed_minutes{0};
};

struct NewsSignal {
  NewsItem item;
  std::vector<std::string> matched_keywords;
  std::string category;
};

/// 相关市场背离：一方大幅波动，另一方几乎未动。波动均相对上一快照，带符号。
struct CorrelationSignal {
  const Market* mover{nullptr};
  const Market* laggard{nullptr};
  double mover_before{0.0};
  double laggard_before{0.0};
  int mover_move_bps{0};
  int laggard_move_bps{0};
  double similarity{0.0};
  std::string hint;  // 命中的提示对 `left|right`；为空表示按标题相似度判定。
};

inline std::string SignalKey(const GapSignal& signal) {
  return "gap:" + PairKey(signal.pair);
}

inline std::string SignalKey(const MoveSignal& signal) {
  return "move:" + MarketKey(*signal.market);
}

inline std::string SignalKey(const NewsSignal& signal) {
  return "news:" + signal.item.item_id;
}

/// `corr:<mover MarketKey>|<laggard MarketKey>`；方向不同视为不同信号。
inline std::string SignalKey(const CorrelationSignal& signal) {
  return "corr:" + MarketKey(*signal.mover) + "|" + MarketKey(*signal.laggard);
}

/// 单轮错误分类。
enum class ErrorKind {
  kFetch,
  kParse,
  kPersistence,
  kDelivery,
  kCancelled,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kFetch:
      return "fetch";
    case ErrorKind::kParse:
      return "parse";
    case ErrorKind::kPersistence:
      return "persistence";
    case ErrorKind::kDelivery:
      return "delivery";
    case ErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

struct CycleError {
  ErrorKind kind{ErrorKind::kFetch};
  std::string source;
  std::string message;
};

/// 单轮扫描结果：供调度器/CLI 汇报。
struct CycleReport {
  bool skipped{false};    ///< 上一轮尚未结束，本轮直接跳过。
  bool committed{false};  ///< 新快照是否已原子提交。
  int signals_fired{0};
  int gap_candidates{0};
  int move_candidates{0};
  int news_candidates{0};
  int correlation_candidates{0};
  int gaps_fired{0};
  int moves_fired{0};
  int news_fired{0};
  int correlations_fired{0};
  int markets_tracked{0};
  int pairs_matched{0};
  std::vector<CycleError> errors;
};

}  // namespace pm_sentinel
