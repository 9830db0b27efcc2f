#include "alert/alert_deduplicator.h"

#include <algorithm>
#include <cstdlib>
#include <initializer_list>
#include <unordered_set>
#include <utility>

namespace pm_sentinel {

namespace {

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

/// 解析 `<platform>:<external_id>`；未知平台返回 false。
bool ParseMarketKey(const std::string& market_key, Platform* out_platform, std::string* out_id) {
  for (const Platform platform : {Platform::kPolymarket, Platform::kKalshi}) {
    const std::string prefix = std::string(ToString(platform)) + ":";
    if (StartsWith(market_key, prefix)) {
      *out_platform = platform;
      *out_id = market_key.substr(prefix.size());
      return true;
    }
  }
  return false;
}

bool Fetched(const std::vector<Platform>& fetched_platforms, Platform platform) {
  return std::find(fetched_platforms.begin(), fetched_platforms.end(), platform) !=
         fetched_platforms.end();
}

}  // namespace

std::optional<AlertRecord> ShouldFire(const std::string& signal_key,
                                      std::optional<int> value,
                                      const AlertHistory& history,
                                      std::int64_t now_ms,
                                      const AlertConfig& config,
                                      std::string* out_reason) {
  AlertRecord fired{signal_key, now_ms, value};
  const auto it = history.find(signal_key);
  if (it == history.end()) {
    return fired;
  }
  const AlertRecord& record = it->second;

  if (!value.has_value()) {
    if (out_reason != nullptr) {
      *out_reason = "already_alerted";
    }
    return std::nullopt;
  }

  // 规则 1: 冷却期已过（严格大于）。
  const std::int64_t elapsed_ms = now_ms - record.last_fired_at_ms;
  const std::int64_t cooldown_ms =
      static_cast<std::int64_t>(config.cooldown_minutes) * 60000;
  if (elapsed_ms > cooldown_ms) {
    return fired;
  }

  // 规则 2: 冷却期内幅度变化足够大（严格大于）。
  if (!record.last_value.has_value() ||
      std::abs(*value - *record.last_value) > config.realert_delta_bps) {
    return fired;
  }

  if (out_reason != nullptr) {
    *out_reason = "cooldown_remaining_ms=" + std::to_string(cooldown_ms - elapsed_ms) +
                  " delta_bps=" + std::to_string(std::abs(*value - *record.last_value));
  }
  return std::nullopt;
}

bool AlertDeduplicator::Allow(SignalKind kind,
                              const std::string& signal_key,
                              std::optional<int> value,
                              const AlertHistory& history,
                              std::int64_t now_ms,
                              AlertRecord* out_record,
                              std::string* out_reason) {
  ++stats_.checks;
  auto record = ShouldFire(signal_key, value, history, now_ms, config_, out_reason);
  if (!record.has_value()) {
    if (value.has_value()) {
      ++stats_.cooldown_rejects;
    } else {
      ++stats_.seen_rejects;
    }
    return false;
  }

  int& fired = fired_by_kind_[static_cast<int>(kind)];
  if (config_.max_per_kind_per_cycle > 0 && fired >= config_.max_per_kind_per_cycle) {
    if (out_reason != nullptr) {
      *out_reason = std::string(kCycleCapReason) + " kind=" + ToString(kind);
    }
    ++stats_.cap_rejects;
    return false;
  }

  ++fired;
  ++stats_.allowed;
  if (out_record != nullptr) {
    *out_record = std::move(*record);
  }
  return true;
}

int PruneAlertHistory(AlertHistory* history,
                      const std::vector<Market>& active_markets,
                      const std::vector<Platform>& fetched_platforms,
                      const std::vector<SeenItem>& seen_history) {
  if (history == nullptr) {
    return 0;
  }
  std::unordered_set<std::string> active_keys;
  for (const auto& market : active_markets) {
    active_keys.insert(MarketKey(market));
  }
  std::unordered_set<std::string> seen_ids;
  for (const auto& item : seen_history) {
    seen_ids.insert(item.item_id);
  }

  // 平台抓取成功且市场不在活跃列表中才判定为消失。
  auto market_gone = [&](Platform platform, const std::string& external_id) {
    return Fetched(fetched_platforms, platform) &&
           active_keys.count(MarketKey(platform, external_id)) == 0;
  };

  int removed = 0;
  for (auto it = history->begin(); it != history->end();) {
    const std::string& key = it->first;
    bool drop = false;
    if (StartsWith(key, "gap:")) {
      const std::string pair_key = key.substr(4);
      const std::size_t bar = pair_key.find('|');
      if (bar != std::string::npos) {
        drop = market_gone(Platform::kPolymarket, pair_key.substr(0, bar)) ||
               market_gone(Platform::kKalshi, pair_key.substr(bar + 1));
      }
    } else if (StartsWith(key, "move:")) {
      Platform platform = Platform::kPolymarket;
      std::string external_id;
      if (ParseMarketKey(key.substr(5), &platform, &external_id)) {
        drop = market_gone(platform, external_id);
      }
    } else if (StartsWith(key, "corr:")) {
      const std::string pair_key = key.substr(5);
      const std::size_t bar = pair_key.find('|');
      if (bar != std::string::npos) {
        for (const std::string& market_key : {pair_key.substr(0, bar), pair_key.substr(bar + 1)}) {
          Platform platform = Platform::kPolymarket;
          std::string external_id;
          if (ParseMarketKey(market_key, &platform, &external_id) &&
              market_gone(platform, external_id)) {
            drop = true;
          }
        }
      }
    } else if (StartsWith(key, "news:")) {
      drop = seen_ids.count(key.substr(5)) == 0;
    }

    if (drop) {
      it = history->erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace pm_sentinel
