#include "signal/signal_engine.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_set>
#include <utility>

#include "core/text_utils.h"
#include "match/market_matcher.h"

namespace pm_sentinel {

namespace {

bool PlatformFailed(const std::vector<Platform>& failed_platforms, Platform platform) {
  return std::find(failed_platforms.begin(), failed_platforms.end(), platform) !=
         failed_platforms.end();
}

/// 市场键前缀 `<platform>:` 判断。
bool KeyBelongsTo(const std::string& market_key, Platform platform) {
  const std::string prefix = std::string(ToString(platform)) + ":";
  return market_key.compare(0, prefix.size(), prefix) == 0;
}

struct MarketMove {
  const Market* market{nullptr};
  double before{0.0};
  int signed_bps{0};
};

/// 返回命中的提示对（`left|right`），未命中返回空串。
std::string FindHint(const std::string& lhs_title,
                     const std::string& rhs_title,
                     const std::vector<CorrelationHint>& hints) {
  for (const auto& hint : hints) {
    const std::string left = NormalizeTitle(hint.left);
    const std::string right = NormalizeTitle(hint.right);
    if ((ContainsPhrase(lhs_title, left) && ContainsPhrase(rhs_title, right)) ||
        (ContainsPhrase(lhs_title, right) && ContainsPhrase(rhs_title, left))) {
      return hint.left + "|" + hint.right;
    }
  }
  return std::string();
}

}  // namespace

int PriceDiffBps(double lhs, double rhs) {
  return static_cast<int>(std::llround(std::fabs(lhs - rhs) * 10000.0));
}

std::vector<GapSignal> DetectGaps(const std::vector<MatchedPair>& pairs,
                                  int threshold_bps) {
  std::vector<GapSignal> signals;
  for (const auto& pair : pairs) {
    if (pair.poly == nullptr || pair.kalshi == nullptr) {
      continue;
    }
    const int gap_bps = PriceDiffBps(pair.poly->price, pair.kalshi->price);
    if (gap_bps < threshold_bps) {
      continue;
    }
    GapSignal signal;
    signal.pair = pair;
    signal.gap_bps = gap_bps;
    signal.direction = pair.poly->price >= pair.kalshi->price
                           ? GapDirection::kPolyHigher
                           : GapDirection::kKalshiHigher;
    signals.push_back(signal);
  }
  std::sort(signals.begin(), signals.end(),
            [](const GapSignal& lhs, const GapSignal& rhs) {
              if (lhs.gap_bps != rhs.gap_bps) {
                return lhs.gap_bps > rhs.gap_bps;
              }
              return PairKey(lhs.pair) < PairKey(rhs.pair);
            });
  return signals;
}

std::vector<MoveSignal> DetectMoves(const std::vector<Market>& markets,
                                    const Snapshot& prior,
                                    int threshold_bps) {
  std::vector<MoveSignal> signals;
  for (const auto& market : markets) {
    const auto it = prior.markets.find(MarketKey(market));
    if (it == prior.markets.end()) {
      continue;
    }
    const int move_bps = PriceDiffBps(market.price, it->second.price);
    if (move_bps < threshold_bps) {
      continue;
    }
    MoveSignal signal;
    signal.market = &market;
    signal.before_price = it->second.price;
    signal.after_price = market.price;
    signal.move_bps = move_bps;
    signal.elapsed_minutes =
        std::max<std::int64_t>(0, (market.fetched_at_ms - it->second.fetched_at_ms) / 60000);
    signals.push_back(signal);
  }
  std::sort(signals.begin(), signals.end(),
            [](const MoveSignal& lhs, const MoveSignal& rhs) {
              if (lhs.move_bps != rhs.move_bps) {
                return lhs.move_bps > rhs.move_bps;
              }
              return MarketKey(*lhs.market) < MarketKey(*rhs.market);
            });
  return signals;
}

std::vector<CorrelationSignal> DetectCorrelationAnomalies(
    const std::vector<Market>& markets,
    const Snapshot& prior,
    const std::vector<MatchedPair>& pairs,
    const CorrelationConfig& config) {
  std::vector<CorrelationSignal> signals;
  if (!config.enabled || config.threshold_bps <= 0) {
    return signals;
  }
  const double laggard_limit = config.threshold_bps * config.laggard_ratio;

  std::vector<MarketMove> movers;
  std::vector<MarketMove> laggards;
  for (const auto& market : markets) {
    const auto it = prior.markets.find(MarketKey(market));
    if (it == prior.markets.end()) {
      continue;
    }
    MarketMove move;
    move.market = &market;
    move.before = it->second.price;
    move.signed_bps =
        static_cast<int>(std::llround((market.price - it->second.price) * 10000.0));
    const int magnitude = std::abs(move.signed_bps);
    if (magnitude >= config.threshold_bps) {
      movers.push_back(move);
    } else if (magnitude < laggard_limit) {
      laggards.push_back(move);
    }
  }
  if (movers.empty() || laggards.empty()) {
    return signals;
  }

  std::unordered_set<std::string> matched;
  for (const auto& pair : pairs) {
    if (pair.poly == nullptr || pair.kalshi == nullptr) {
      continue;
    }
    matched.insert(MarketKey(*pair.poly) + "|" + MarketKey(*pair.kalshi));
    matched.insert(MarketKey(*pair.kalshi) + "|" + MarketKey(*pair.poly));
  }

  for (const auto& mover : movers) {
    for (const auto& laggard : laggards) {
      if (matched.count(MarketKey(*mover.market) + "|" + MarketKey(*laggard.market)) > 0) {
        continue;
      }
      const double similarity =
          TitleSimilarity(mover.market->match_title, laggard.market->match_title);
      std::string hint =
          FindHint(mover.market->match_title, laggard.market->match_title, config.hints);
      if (hint.empty() && similarity <= config.similarity_floor) {
        continue;
      }
      CorrelationSignal signal;
      signal.mover = mover.market;
      signal.laggard = laggard.market;
      signal.mover_before = mover.before;
      signal.laggard_before = laggard.before;
      signal.mover_move_bps = mover.signed_bps;
      signal.laggard_move_bps = laggard.signed_bps;
      signal.similarity = similarity;
      signal.hint = std::move(hint);
      signals.push_back(std::move(signal));
    }
  }

  std::sort(signals.begin(), signals.end(),
            [](const CorrelationSignal& lhs, const CorrelationSignal& rhs) {
              const int lhs_move = std::abs(lhs.mover_move_bps);
              const int rhs_move = std::abs(rhs.mover_move_bps);
              if (lhs_move != rhs_move) {
                return lhs_move > rhs_move;
              }
              return SignalKey(lhs) < SignalKey(rhs);
            });
  return signals;
}

Snapshot BuildSnapshot(const std::vector<Market>& markets,
                       const std::vector<MatchedPair>& pairs,
                       const Snapshot& prior,
                       const std::vector<Platform>& failed_platforms,
                       std::int64_t now_ms) {
  Snapshot next;
  next.saved_at_ms = now_ms;

  for (const auto& [key, entry] : prior.markets) {
    for (const Platform platform : failed_platforms) {
      if (KeyBelongsTo(key, platform)) {
        next.markets.emplace(key, entry);
        break;
      }
    }
  }
  for (const auto& market : markets) {
    if (PlatformFailed(failed_platforms, market.platform)) {
      continue;
    }
    next.markets[MarketKey(market)] =
        SnapshotMarketEntry{market.price, market.fetched_at_ms};
  }

  if (!failed_platforms.empty()) {
    next.pairs = prior.pairs;
  }
  for (const auto& pair : pairs) {
    if (pair.poly == nullptr || pair.kalshi == nullptr) {
      continue;
    }
    next.pairs[PairKey(pair)] =
        SnapshotPairEntry{PriceDiffBps(pair.poly->price, pair.kalshi->price), now_ms};
  }
  return next;
}

}  // namespace pm_sentinel
