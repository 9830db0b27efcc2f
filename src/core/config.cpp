#include "core/config.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/log.h"
#include "core/text_utils.h"

namespace pm_sentinel {

namespace {

// 以下工具函数用于“轻量 YAML 解析”：
// - 通过缩进和键路径识别结构；
// - 仅覆盖当前项目使用到的配置字段。
std::string StripInlineComment(const std::string& line) {
  // 仅剔除非引号上下文中的 `#` 注释，避免误伤字符串内容。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      continue;
    }
    if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      continue;
    }
    if (ch == '#' && !in_single_quotes && !in_double_quotes &&
        (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

bool ParseDouble(const std::string& text, double* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& text, int* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseBool(const std::string& text, bool* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  const std::string lowered = ToLowerCopy(text);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

bool ParseStringList(const std::string& text,
                     std::vector<std::string>* out_items) {
  if (out_items == nullptr) {
    return false;
  }

  std::string trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return false;
  }
  trimmed = trimmed.substr(1, trimmed.size() - 2);
  out_items->clear();
  std::string token;
  std::istringstream iss(trimmed);
  while (std::getline(iss, token, ',')) {
    const std::string item = Trim(Unquote(Trim(token)));
    if (!item.empty()) {
      out_items->push_back(item);
    }
  }
  return true;
}

std::string LineError(const std::string& key, int line_no) {
  return key + " 解析失败，行号: " + std::to_string(line_no);
}

bool AssignInt(const std::string& value, const std::string& key, int line_no,
               int* out_field, std::string* out_error) {
  int parsed = 0;
  if (!ParseInt(value, &parsed)) {
    if (out_error != nullptr) {
      *out_error = LineError(key, line_no);
    }
    return false;
  }
  *out_field = parsed;
  return true;
}

bool AssignDouble(const std::string& value, const std::string& key, int line_no,
                  double* out_field, std::string* out_error) {
  double parsed = 0.0;
  if (!ParseDouble(value, &parsed)) {
    if (out_error != nullptr) {
      *out_error = LineError(key, line_no);
    }
    return false;
  }
  *out_field = parsed;
  return true;
}

bool AssignBool(const std::string& value, const std::string& key, int line_no,
                bool* out_field, std::string* out_error) {
  bool parsed = false;
  if (!ParseBool(value, &parsed)) {
    if (out_error != nullptr) {
      *out_error = LineError(key, line_no);
    }
    return false;
  }
  *out_field = parsed;
  return true;
}

/// `left|right` 形式的提示对列表；任一侧为空即失败。
bool ParseHintList(const std::string& text, std::vector<CorrelationHint>* out_hints) {
  std::vector<std::string> items;
  if (!ParseStringList(text, &items)) {
    return false;
  }
  std::vector<CorrelationHint> hints;
  for (const auto& item : items) {
    const std::size_t bar = item.find('|');
    if (bar == std::string::npos) {
      return false;
    }
    CorrelationHint hint{ToLowerCopy(Trim(item.substr(0, bar))),
                         ToLowerCopy(Trim(item.substr(bar + 1)))};
    if (hint.left.empty() || hint.right.empty()) {
      return false;
    }
    hints.push_back(std::move(hint));
  }
  *out_hints = std::move(hints);
  return true;
}

std::vector<std::string> NormalizeLanguages(const std::vector<std::string>& raw) {
  std::vector<std::string> out;
  for (const auto& item : raw) {
    const std::string lowered = ToLowerCopy(Trim(item));
    if (lowered.empty()) {
      continue;
    }
    if (std::find(out.begin(), out.end(), lowered) == out.end()) {
      out.push_back(lowered);
    }
  }
  return out;
}

const char* GetEnv(const char* key) {
  const char* value = std::getenv(key);
  if (value == nullptr || value[0] == '\0') {
    return nullptr;
  }
  return value;
}

}  // namespace

std::vector<KeywordRule> AppConfig::DefaultKeywordRules() {
  return {
      {"crypto", {"bitcoin", "btc", "ethereum", "eth", "crypto", "solana",
                  "stablecoin"}},
      {"macro", {"fed", "federal reserve", "interest rate", "rate cut",
                 "rate hike", "inflation", "cpi", "recession", "gdp", "ecb",
                 "unemployment"}},
      {"politics", {"election", "president", "senate", "congress",
                    "parliament", "prime minister", "iran", "supreme court"}},
      {"sports", {"nba", "nfl", "world cup", "super bowl",
                  "champions league"}},
      {"tech", {"openai", "nvidia", "apple", "tesla", "google"}},
      {"climate", {"climate", "hurricane", "temperature", "emissions"}},
  };
}

bool IsSupportedLanguage(const std::string& language) {
  return language == "en" || language == "he" || language == "fr";
}

bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error) {
  if (out_config == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_config 为空";
    }
    return false;
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开配置文件: " + file_path;
    }
    return false;
  }

  AppConfig config = *out_config;
  // YAML 中出现 feeds/rules 小节时整体替换默认值，而不是追加。
  bool feeds_overridden = false;
  bool rules_overridden = false;
  std::string current_section;
  std::string current_subsection;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string no_comment = Trim(StripInlineComment(line));
    if (no_comment.empty()) {
      continue;
    }

    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }

    if (indent == 0 && no_comment.back() == ':') {
      current_section = Trim(no_comment.substr(0, no_comment.size() - 1));
      current_subsection.clear();
      continue;
    }

    if (indent < 2) {
      continue;
    }

    if (indent == 2 && no_comment.back() == ':') {
      current_subsection = Trim(no_comment.substr(0, no_comment.size() - 1));
      continue;
    }

    const std::size_t colon_pos = no_comment.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(Unquote(Trim(no_comment.substr(0, colon_pos))));
    const std::string raw_value = Trim(no_comment.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    const std::string value = Unquote(raw_value);
    if (indent <= 2) {
      current_subsection.clear();
    }

    if (current_section == "system") {
      if (key == "state_file") {
        config.state_file = value;
        continue;
      }
      if (key == "interval_minutes") {
        if (!AssignInt(value, "system.interval_minutes", line_no,
                       &config.interval_minutes, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "heartbeat_every_runs") {
        if (!AssignInt(value, "system.heartbeat_every_runs", line_no,
                       &config.heartbeat_every_runs, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "startup_notice") {
        if (!AssignBool(value, "system.startup_notice", line_no, &config.startup_notice,
                        out_error)) {
          return false;
        }
        continue;
      }
      if (key == "log_level") {
        config.log_level = value;
        continue;
      }
      if (key == "languages") {
        std::vector<std::string> parsed;
        if (!ParseStringList(raw_value, &parsed)) {
          if (out_error != nullptr) {
            *out_error = LineError("system.languages", line_no);
          }
          return false;
        }
        config.languages = NormalizeLanguages(parsed);
        continue;
      }
    }

    if (current_section == "alert") {
      if (key == "threshold_bps") {
        if (!AssignInt(value, "alert.threshold_bps", line_no,
                       &config.alert.threshold_bps, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "cooldown_minutes") {
        if (!AssignInt(value, "alert.cooldown_minutes", line_no,
                       &config.alert.cooldown_minutes, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "realert_delta_bps") {
        if (!AssignInt(value, "alert.realert_delta_bps", line_no,
                       &config.alert.realert_delta_bps, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "max_per_kind_per_cycle") {
        if (!AssignInt(value, "alert.max_per_kind_per_cycle", line_no,
                       &config.alert.max_per_kind_per_cycle, out_error)) {
          return false;
        }
        continue;
      }
    }

    if (current_section == "matcher" && key == "similarity_floor") {
      if (!AssignDouble(value, "matcher.similarity_floor", line_no,
                        &config.matcher.similarity_floor, out_error)) {
        return false;
      }
      continue;
    }

    if (current_section == "normalizer" && key == "drop_expired_titles") {
      if (!AssignBool(value, "normalizer.drop_expired_titles", line_no,
                      &config.normalizer.drop_expired_titles, out_error)) {
        return false;
      }
      continue;
    }

    if (current_section == "fetch") {
      if (key == "polymarket_base_url") {
        config.fetch.polymarket_base_url = value;
        continue;
      }
      if (key == "kalshi_base_url") {
        config.fetch.kalshi_base_url = value;
        continue;
      }
      if (key == "page_limit") {
        if (!AssignInt(value, "fetch.page_limit", line_no,
                       &config.fetch.page_limit, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "max_pages") {
        if (!AssignInt(value, "fetch.max_pages", line_no,
                       &config.fetch.max_pages, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "connect_timeout_ms") {
        if (!AssignInt(value, "fetch.connect_timeout_ms", line_no,
                       &config.fetch.connect_timeout_ms, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "timeout_ms") {
        if (!AssignInt(value, "fetch.timeout_ms", line_no,
                       &config.fetch.timeout_ms, out_error)) {
          return false;
        }
        continue;
      }
    }

    if (current_section == "news") {
      if (current_subsection == "feeds") {
        if (!feeds_overridden) {
          config.news.feeds.clear();
          feeds_overridden = true;
        }
        config.news.feeds.push_back(FeedConfig{key, value});
        continue;
      }
      if (key == "seen_history_max") {
        if (!AssignInt(value, "news.seen_history_max", line_no,
                       &config.news.seen_history_max, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "seen_history_keep") {
        if (!AssignInt(value, "news.seen_history_keep", line_no,
                       &config.news.seen_history_keep, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "duplicate_title_similarity") {
        if (!AssignDouble(value, "news.duplicate_title_similarity", line_no,
                          &config.news.duplicate_title_similarity, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "max_items_per_feed") {
        if (!AssignInt(value, "news.max_items_per_feed", line_no,
                       &config.news.max_items_per_feed, out_error)) {
          return false;
        }
        continue;
      }
    }

    if (current_section == "correlation") {
      if (key == "enabled") {
        if (!AssignBool(value, "correlation.enabled", line_no,
                        &config.correlation.enabled, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "threshold_bps") {
        if (!AssignInt(value, "correlation.threshold_bps", line_no,
                       &config.correlation.threshold_bps, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "laggard_ratio") {
        if (!AssignDouble(value, "correlation.laggard_ratio", line_no,
                          &config.correlation.laggard_ratio, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "similarity_floor") {
        if (!AssignDouble(value, "correlation.similarity_floor", line_no,
                          &config.correlation.similarity_floor, out_error)) {
          return false;
        }
        continue;
      }
      if (key == "hints") {
        if (!ParseHintList(raw_value, &config.correlation.hints)) {
          if (out_error != nullptr) {
            *out_error = LineError("correlation.hints", line_no);
          }
          return false;
        }
        continue;
      }
    }

    if (current_section == "relevance" && current_subsection == "rules") {
      std::vector<std::string> keywords;
      if (!ParseStringList(raw_value, &keywords)) {
        if (out_error != nullptr) {
          *out_error = LineError("relevance.rules." + key, line_no);
        }
        return false;
      }
      if (!rules_overridden) {
        config.relevance_rules.clear();
        rules_overridden = true;
      }
      config.relevance_rules.push_back(KeywordRule{ToLowerCopy(key), keywords});
      continue;
    }

    if (current_section == "telegram") {
      if (key == "chat_id") {
        config.telegram.chat_id = value;
        continue;
      }
      if (key == "max_retry_after_seconds") {
        if (!AssignInt(value, "telegram.max_retry_after_seconds", line_no,
                       &config.telegram.max_retry_after_seconds, out_error)) {
          return false;
        }
        continue;
      }
    }

    // 未知字段仅记录，便于新旧版本配置共存。
    LogDebug("CONFIG_UNKNOWN_KEY: " + current_section +
             (current_subsection.empty() ? std::string() : "." + current_subsection) +
             "." + key);
  }

  if (!ValidateAppConfig(config, out_error)) {
    return false;
  }
  *out_config = config;
  return true;
}

bool ApplyEnvironmentOverrides(AppConfig* config, std::string* out_error) {
  if (config == nullptr) {
    if (out_error != nullptr) {
      *out_error = "config 为空";
    }
    return false;
  }

  AppConfig updated = *config;
  if (const char* token = GetEnv("TELEGRAM_BOT_TOKEN"); token != nullptr) {
    updated.telegram.bot_token = token;
  }
  if (const char* chat = GetEnv("TELEGRAM_CHAT_ID"); chat != nullptr) {
    updated.telegram.chat_id = chat;
  }
  if (const char* threshold = GetEnv("ALERT_THRESHOLD_BPS"); threshold != nullptr) {
    if (!ParseInt(Trim(threshold), &updated.alert.threshold_bps)) {
      if (out_error != nullptr) {
        *out_error = "ALERT_THRESHOLD_BPS 非法: " + std::string(threshold);
      }
      return false;
    }
  }
  if (const char* languages = GetEnv("LANGUAGES"); languages != nullptr) {
    updated.languages = NormalizeLanguages(SplitAndTrim(languages, ','));
  }
  if (const char* level = GetEnv("LOG_LEVEL"); level != nullptr) {
    updated.log_level = level;
  }
  if (const char* state_file = GetEnv("STATE_FILE"); state_file != nullptr) {
    updated.state_file = state_file;
  }
  if (const char* interval = GetEnv("CHECK_INTERVAL_MINUTES"); interval != nullptr) {
    if (!ParseInt(Trim(interval), &updated.interval_minutes)) {
      if (out_error != nullptr) {
        *out_error = "CHECK_INTERVAL_MINUTES 非法: " + std::string(interval);
      }
      return false;
    }
  }

  if (!ValidateAppConfig(updated, out_error)) {
    return false;
  }
  *config = updated;
  return true;
}

bool ValidateAppConfig(const AppConfig& config, std::string* out_error) {
  auto fail = [out_error](const std::string& message) {
    if (out_error != nullptr) {
      *out_error = message;
    }
    return false;
  };

  if (config.state_file.empty()) {
    return fail("system.state_file 不能为空");
  }
  if (config.interval_minutes <= 0) {
    return fail("system.interval_minutes 必须大于 0");
  }
  if (config.heartbeat_every_runs < 0) {
    return fail("system.heartbeat_every_runs 不能为负数");
  }
  LogLevel level = LogLevel::kInfo;
  if (!ParseLogLevel(config.log_level, &level)) {
    return fail("system.log_level 非法: " + config.log_level);
  }
  if (config.languages.empty()) {
    return fail("system.languages 不能为空");
  }
  for (const auto& language : config.languages) {
    if (!IsSupportedLanguage(language)) {
      return fail("不支持的告警语言: " + language);
    }
  }
  if (config.alert.threshold_bps < 0) {
    return fail("alert.threshold_bps 不能为负数");
  }
  if (config.alert.cooldown_minutes < 0) {
    return fail("alert.cooldown_minutes 不能为负数");
  }
  if (config.alert.realert_delta_bps < 0) {
    return fail("alert.realert_delta_bps 不能为负数");
  }
  if (config.alert.max_per_kind_per_cycle < 0) {
    return fail("alert.max_per_kind_per_cycle 不能为负数");
  }
  if (config.matcher.similarity_floor < 0.0 ||
      config.matcher.similarity_floor > 1.0) {
    return fail("matcher.similarity_floor 必须在 [0,1] 范围内");
  }
  if (config.correlation.threshold_bps <= 0) {
    return fail("correlation.threshold_bps 必须大于 0");
  }
  if (config.correlation.laggard_ratio <= 0.0 || config.correlation.laggard_ratio >= 1.0) {
    return fail("correlation.laggard_ratio 必须在 (0,1) 范围内");
  }
  if (config.correlation.similarity_floor < 0.0 ||
      config.correlation.similarity_floor > 1.0) {
    return fail("correlation.similarity_floor 必须在 [0,1] 范围内");
  }
  for (const auto& hint : config.correlation.hints) {
    if (hint.left.empty() || hint.right.empty()) {
      return fail("correlation.hints 两侧关键词不能为空");
    }
  }
  if (config.fetch.page_limit <= 0 || config.fetch.max_pages <= 0) {
    return fail("fetch.page_limit/max_pages 必须大于 0");
  }
  if (config.fetch.connect_timeout_ms <= 0 || config.fetch.timeout_ms <= 0) {
    return fail("fetch 超时参数必须大于 0");
  }
  if (config.news.seen_history_max <= 0 || config.news.seen_history_keep <= 0) {
    return fail("news.seen_history_max/keep 必须大于 0");
  }
  if (config.news.seen_history_keep > config.news.seen_history_max) {
    return fail("news.seen_history_keep 不能大于 news.seen_history_max");
  }
  if (config.news.duplicate_title_similarity <= 0.0 ||
      config.news.duplicate_title_similarity > 1.0) {
    return fail("news.duplicate_title_similarity 必须在 (0,1] 范围内");
  }
  if (config.news.max_items_per_feed <= 0) {
    return fail("news.max_items_per_feed 必须大于 0");
  }
  for (const auto& feed : config.news.feeds) {
    if (feed.name.empty() || feed.url.empty()) {
      return fail("news.feeds 名称与 URL 不能为空");
    }
  }
  for (const auto& rule : config.relevance_rules) {
    if (rule.category.empty() || rule.keywords.empty()) {
      return fail("relevance.rules 类别与关键词不能为空");
    }
  }
  if (config.telegram.max_retry_after_seconds < 0) {
    return fail("telegram.max_retry_after_seconds 不能为负数");
  }
  return true;
}

}  // namespace pm_sentinel
