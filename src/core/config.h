#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace pm_sentinel {

/// 告警阈值与抑制参数。
struct AlertConfig {
  int threshold_bps{500};          ///< 价差/波动告警阈值（含等号）。
  int cooldown_minutes{60};        ///< 同一信号重复告警的最小间隔。
  int realert_delta_bps{100};      ///< 冷却期内重新告警所需的最小幅度变化。
  int max_per_kind_per_cycle{5};   ///< 每轮每类信号最多告警条数，0 表示不限。
};

/// 跨平台匹配参数。
struct MatcherConfig {
  double similarity_floor{0.45};  ///< 低于该相似度视为不匹配。
};

struct NormalizerConfig {
  // 标题中的月份+年份已整体过去时视为已失效市场。
  bool drop_expired_titles{true};
};

/// 平台抓取参数（每个数据源独立超时）。
struct FetchConfig {
  std::string polymarket_base_url{"https://gamma-api.polymarket.com"};
  std::string kalshi_base_url{"https://api.elections.kalshi.com/trade-api/v2"};
  int page_limit{500};
  int max_pages{4};
  int connect_timeout_ms{5000};
  int timeout_ms{30000};
};

/// 相关提示对：两侧标题分别包含 `left`/`right`（顺序不限）即视为相关。
struct CorrelationHint {
  std::string left;
  std::string right;
};

/// 相关市场背离检测参数。
struct CorrelationConfig {
  bool enabled{true};
  int threshold_bps{1000};         ///< 领动方波动下限（含等号）。
  double laggard_ratio{0.3};       ///< 滞后方波动须严格小于 threshold_bps * ratio。
  double similarity_floor{0.4};    ///< 无提示对时标题相似度须严格大于该值。
  std::vector<CorrelationHint> hints{
      {"fed", "rate cut"},
      {"recession", "unemployment"},
      {"bitcoin", "ethereum"},
      {"nuclear", "sanctions"},
      {"war", "strike"},
      {"israel", "attack"},
      {"supreme leader", "regime"},
  };
};

struct FeedConfig {
  std::string name;
  std::string url;
};

/// 新闻源与已读历史参数。
struct NewsConfig {
  std::vector<FeedConfig> feeds{
      {"federal_reserve", "https://www.federalreserve.gov/feeds/press_all.xml"},
      {"ecb", "https://www.ecb.europa.eu/rss/press.html"},
      {"coindesk", "https://www.coindesk.com/arc/outboundfeeds/rss/"},
      {"politico", "https://rss.politico.com/politics-news.xml"},
  };
  int seen_history_max{5000};   ///< 超过该条数触发裁剪。
  int seen_history_keep{3000};  ///< 裁剪后保留的最新条数。
  double duplicate_title_similarity{0.8};
  int max_items_per_feed{20};
};

struct TelegramConfig {
  std::string bot_token;  ///< 仅从环境变量 TELEGRAM_BOT_TOKEN 读取。
  std::string chat_id;
  int max_retry_after_seconds{30};
};

/// 应用主配置：聚合告警、匹配、抓取、新闻、投递与系统运行参数。
struct AppConfig {
  std::string state_file{"data/state.json"};
  int interval_minutes{120};
  int heartbeat_every_runs{12};  ///< 每 N 轮发送一次心跳，0 表示关闭。
  bool startup_notice{true};     ///< 常驻模式启动时发送一次启动通知。
  std::string log_level{"info"};
  std::vector<std::string> languages{"en", "he", "fr"};
  AlertConfig alert{};
  MatcherConfig matcher{};
  NormalizerConfig normalizer{};
  FetchConfig fetch{};
  NewsConfig news{};
  CorrelationConfig correlation{};
  std::vector<KeywordRule> relevance_rules{DefaultKeywordRules()};
  TelegramConfig telegram{};

  /// 默认关键词规则（类别顺序即并列时的优先级）。
  static std::vector<KeywordRule> DefaultKeywordRules();
};

/// 是否为已提供模板的告警语言。
bool IsSupportedLanguage(const std::string& language);

/**
 * @brief 轻量 YAML 配置加载器
 *
 * 仅解析当前项目运行所需关键字段；以 `out_config` 现值为默认值，
 * 解析失败返回 `false` 并写入 `out_error`。加载后会执行 `ValidateAppConfig`。
 */
bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error);

/**
 * @brief 环境变量覆盖
 *
 * 支持：TELEGRAM_BOT_TOKEN、TELEGRAM_CHAT_ID、ALERT_THRESHOLD_BPS、
 * LANGUAGES（逗号分隔）、LOG_LEVEL、STATE_FILE、CHECK_INTERVAL_MINUTES。
 */
bool ApplyEnvironmentOverrides(AppConfig* config, std::string* out_error);

/// 配置一致性校验。
bool ValidateAppConfig(const AppConfig& config, std::string* out_error);

}  // namespace pm_sentinel
