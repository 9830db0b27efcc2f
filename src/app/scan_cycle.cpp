#include "app/scan_cycle.h"

#include <chrono>
#include <cstdlib>
#include <thread>
#include <utility>

#include "alert/alert_deduplicator.h"
#include "core/log.h"
#include "ingest/market_normalizer.h"
#include "match/market_matcher.h"
#include "notify/message_formatter.h"
#include "signal/relevance_filter.h"
#include "signal/signal_engine.h"

namespace pm_sentinel {

namespace {

/// 轮次运行标志的 RAII 复位。
class RunningGuard {
 public:
  explicit RunningGuard(std::atomic<bool>* running) : running_(running) {}
  ~RunningGuard() { running_->store(false); }

  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

 private:
  std::atomic<bool>* running_;
};

void AddError(CycleReport* report,
              ErrorKind kind,
              const std::string& source,
              const std::string& message) {
  report->errors.push_back(CycleError{kind, source, message});
  LogError(std::string(ToString(kind)) + "_ERROR: source=" + source + " " + message);
}

}  // namespace

std::int64_t SystemNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ScanCycle::ScanCycle(AppConfig config,
                     const MarketFetchClient* market_client,
                     const NewsFetchClient* news_client,
                     DeliveryChannel* channel,
                     const StateStore* store,
                     ClockFunction clock,
                     const std::atomic<bool>* stop_flag)
    : config_(std::move(config)),
      market_client_(market_client),
      news_client_(news_client),
      channel_(channel),
      store_(store),
      clock_(std::move(clock)),
      stop_flag_(stop_flag) {
  if (!clock_) {
    clock_ = SystemNowMs;
  }
}

CycleReport ScanCycle::RunCycle() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    LogInfo("CYCLE_SKIPPED: 上一轮尚未结束");
    CycleReport report;
    report.skipped = true;
    return report;
  }
  RunningGuard guard(&running_);
  return RunCycleLocked();
}

bool ScanCycle::StopRequested(const char* stage, CycleReport* report) const {
  if (stop_flag_ == nullptr || !stop_flag_->load()) {
    return false;
  }
  AddError(report, ErrorKind::kCancelled, "cycle", std::string("stopped at ") + stage);
  return true;
}

void ScanCycle::FetchAll(std::vector<PlatformFetch>* platforms,
                         std::vector<FeedFetch>* feeds) const {
  platforms->clear();
  platforms->push_back(PlatformFetch{Platform::kPolymarket});
  platforms->push_back(PlatformFetch{Platform::kKalshi});
  feeds->clear();
  if (news_client_ != nullptr) {
    for (const auto& feed : config_.news.feeds) {
      FeedFetch fetch;
      fetch.feed = &feed;
      feeds->push_back(std::move(fetch));
    }
  }

  // 每个数据源一个线程，各自只写自己的结果槽位。
  std::vector<std::thread> workers;
  workers.reserve(platforms->size() + feeds->size());
  for (auto& slot : *platforms) {
    if (market_client_ == nullptr) {
      slot.error = "market client 未配置";
      continue;
    }
    workers.emplace_back([this, &slot]() {
      slot.ok = market_client_->FetchActiveMarkets(slot.platform, &slot.payloads, &slot.error);
    });
  }
  for (auto& slot : *feeds) {
    workers.emplace_back([this, &slot]() {
      slot.ok = news_client_->FetchFeedItems(*slot.feed, &slot.items, &slot.parse_errors,
                                             &slot.error);
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
}

template <typename Signal>
std::vector<std::string> ScanCycle::RenderAll(const Signal& signal) const {
  std::vector<std::string> texts;
  texts.reserve(config_.languages.size());
  for (const auto& language : config_.languages) {
    texts.push_back(FormatSignal(signal, language));
  }
  return texts;
}

void ScanCycle::Deliver(const std::vector<PendingAlert>& alerts, CycleReport* report) {
  if (channel_ == nullptr) {
    return;
  }
  for (const auto& alert : alerts) {
    for (const auto& text : alert.texts) {
      std::string error;
      if (!channel_->Send(config_.telegram.chat_id, text, &error)) {
        AddError(report, ErrorKind::kDelivery, alert.signal_key, error);
      }
    }
  }
}

bool ScanCycle::AnnounceStartup(std::string* out_error) {
  PersistedState state;
  std::string load_error;
  if (!store_->Load(&state, &load_error)) {
    if (out_error != nullptr) {
      *out_error = "读取状态失败: " + load_error;
    }
    return false;
  }

  StartupInfo info;
  info.interval_minutes = config_.interval_minutes;
  info.threshold_bps = config_.alert.threshold_bps;
  info.correlation_threshold_bps =
      config_.correlation.enabled ? config_.correlation.threshold_bps : 0;
  info.feeds = static_cast<int>(config_.news.feeds.size());
  info.run_count = state.run_count;
  info.languages = config_.languages;

  if (channel_ == nullptr) {
    return true;
  }
  bool all_sent = true;
  for (const auto& language : config_.languages) {
    std::string error;
    if (!channel_->Send(config_.telegram.chat_id, FormatStartup(info, language), &error)) {
      all_sent = false;
      if (out_error != nullptr) {
        *out_error = "启动通知投递失败(" + language + "): " + error;
      }
    }
  }
  LogInfo("STARTUP_NOTICE: run_count=" + std::to_string(state.run_count) +
          " sent=" + (all_sent ? "true" : "false"));
  return all_sent;
}

CycleReport ScanCycle::RunCycleLocked() {
  CycleReport report;
  const std::int64_t cycle_start_ms = clock_();

  PersistedState state;
  std::string load_error;
  if (!store_->Load(&state, &load_error)) {
    // 无法读取历史时去重无从保证，整轮放弃。
    AddError(&report, ErrorKind::kPersistence, store_->file_path(), load_error);
    return report;
  }

  std::vector<PlatformFetch> platform_fetches;
  std::vector<FeedFetch> feed_fetches;
  FetchAll(&platform_fetches, &feed_fetches);
  const std::int64_t now_ms = clock_();
  if (StopRequested("fetch", &report)) {
    return report;
  }

  // --- 归一化 ---
  NormalizeContext context;
  context.fetched_at_ms = now_ms;
  context.now_ms = now_ms;
  context.drop_expired_titles = config_.normalizer.drop_expired_titles;
  context.rules = &config_.relevance_rules;

  std::vector<Market> poly_markets;
  std::vector<Market> kalshi_markets;
  std::vector<Platform> failed_platforms;
  std::vector<Platform> fetched_platforms;
  for (auto& fetch : platform_fetches) {
    const char* source = ToString(fetch.platform);
    if (!fetch.ok) {
      failed_platforms.push_back(fetch.platform);
      AddError(&report, ErrorKind::kFetch, source, fetch.error);
      continue;
    }
    fetched_platforms.push_back(fetch.platform);
    NormalizeBatch batch = NormalizeMarkets(fetch.payloads, fetch.platform, context);
    if (batch.parse_errors > 0) {
      AddError(&report, ErrorKind::kParse, source,
               std::to_string(batch.parse_errors) + " 条记录解析失败, 首条: " +
                   batch.first_error);
    }
    LogInfo(std::string("MARKETS_NORMALIZED: source=") + source +
            " raw=" + std::to_string(fetch.payloads.size()) +
            " accepted=" + std::to_string(batch.markets.size()) +
            " inactive=" + std::to_string(batch.inactive) +
            " duplicates=" + std::to_string(batch.duplicates));
    if (fetch.platform == Platform::kPolymarket) {
      poly_markets = std::move(batch.markets);
    } else {
      kalshi_markets = std::move(batch.markets);
    }
  }

  std::vector<Market> all_markets;
  all_markets.reserve(poly_markets.size() + kalshi_markets.size());
  all_markets.insert(all_markets.end(), poly_markets.begin(), poly_markets.end());
  all_markets.insert(all_markets.end(), kalshi_markets.begin(), kalshi_markets.end());
  report.markets_tracked = static_cast<int>(all_markets.size());

  // --- 匹配与数值信号 ---
  MatchOptions match_options;
  match_options.similarity_floor = config_.matcher.similarity_floor;
  const std::vector<MatchedPair> pairs =
      MatchMarkets(poly_markets, kalshi_markets, match_options);
  report.pairs_matched = static_cast<int>(pairs.size());

  const std::vector<GapSignal> gaps = DetectGaps(pairs, config_.alert.threshold_bps);
  const std::vector<MoveSignal> moves =
      DetectMoves(all_markets, state.snapshot, config_.alert.threshold_bps);
  const std::vector<CorrelationSignal> correlations =
      DetectCorrelationAnomalies(all_markets, state.snapshot, pairs, config_.correlation);
  report.gap_candidates = static_cast<int>(gaps.size());
  report.move_candidates = static_cast<int>(moves.size());
  report.correlation_candidates = static_cast<int>(correlations.size());

  // --- 新闻 ---
  std::vector<NewsItem> news_items;
  for (auto& fetch : feed_fetches) {
    if (!fetch.ok) {
      AddError(&report, ErrorKind::kFetch, fetch.feed->name, fetch.error);
      continue;
    }
    if (fetch.parse_errors > 0) {
      AddError(&report, ErrorKind::kParse, fetch.feed->name,
               std::to_string(fetch.parse_errors) + " 个条目缺少标题与链接");
    }
    for (auto& item : fetch.items) {
      news_items.push_back(std::move(item));
    }
  }
  NewsFilterOptions news_options;
  news_options.duplicate_title_similarity = config_.news.duplicate_title_similarity;
  const NewsFilterResult news =
      FilterNews(news_items, config_.relevance_rules, state.seen_items, now_ms, news_options);
  report.news_candidates = static_cast<int>(news.signals.size());

  // --- 去重 ---
  AlertHistory alerts = state.alerts;
  AlertDeduplicator dedup(config_.alert);
  std::vector<PendingAlert> pending;
  std::string reason;
  auto admit = [&](SignalKind kind, const std::string& key, std::optional<int> value) {
    AlertRecord record;
    reason.clear();
    if (!dedup.Allow(kind, key, value, alerts, now_ms, &record, &reason)) {
      LogDebug("ALERT_SUPPRESSED: key=" + key + " " + reason);
      return false;
    }
    alerts[key] = record;
    return true;
  };
  for (const auto& gap : gaps) {
    const std::string key = SignalKey(gap);
    if (admit(SignalKind::kGap, key, gap.gap_bps)) {
      pending.push_back(PendingAlert{key, RenderAll(gap)});
      ++report.gaps_fired;
    }
  }
  for (const auto& move : moves) {
    const std::string key = SignalKey(move);
    if (admit(SignalKind::kMove, key, move.move_bps)) {
      pending.push_back(PendingAlert{key, RenderAll(move)});
      ++report.moves_fired;
    }
  }
  for (const auto& correlation : correlations) {
    const std::string key = SignalKey(correlation);
    if (admit(SignalKind::kCorrelation, key, std::abs(correlation.mover_move_bps))) {
      pending.push_back(PendingAlert{key, RenderAll(correlation)});
      ++report.correlations_fired;
    }
  }
  // 受单轮上限拒绝的新闻不记为已读，下一轮重新评估。
  std::vector<SeenItem> newly_seen = news.newly_seen;
  for (const auto& signal : news.signals) {
    const std::string key = SignalKey(signal);
    if (admit(SignalKind::kNews, key, std::nullopt)) {
      pending.push_back(PendingAlert{key, RenderAll(signal)});
      ++report.news_fired;
    } else if (IsCycleCapRejection(reason)) {
      continue;
    }
    newly_seen.push_back(SeenItem{signal.item.item_id, now_ms});
  }
  report.signals_fired =
      report.gaps_fired + report.moves_fired + report.correlations_fired + report.news_fired;

  // --- 投递 ---
  if (StopRequested("delivery", &report)) {
    return report;
  }
  Deliver(pending, &report);

  const std::int64_t run_count = state.run_count + 1;
  if (config_.heartbeat_every_runs > 0 && run_count % config_.heartbeat_every_runs == 0) {
    HeartbeatStats stats;
    stats.run_count = run_count;
    stats.markets_tracked = report.markets_tracked;
    stats.pairs_matched = report.pairs_matched;
    stats.signals_fired = report.signals_fired;
    stats.errors = static_cast<int>(report.errors.size());
    PendingAlert heartbeat{"heartbeat", {}};
    for (const auto& language : config_.languages) {
      heartbeat.texts.push_back(FormatHeartbeat(stats, language));
    }
    Deliver({heartbeat}, &report);
  }

  // --- 提交 ---
  PersistedState next;
  next.snapshot = BuildSnapshot(all_markets, pairs, state.snapshot, failed_platforms, now_ms);
  next.seen_items = MergeSeenHistory(state.seen_items, newly_seen,
                                     config_.news.seen_history_max,
                                     config_.news.seen_history_keep);
  const int pruned = PruneAlertHistory(&alerts, all_markets, fetched_platforms, next.seen_items);
  next.alerts = std::move(alerts);
  next.run_count = run_count;

  if (StopRequested("commit", &report)) {
    return report;
  }
  std::string commit_error;
  if (!store_->Commit(next, &commit_error)) {
    AddError(&report, ErrorKind::kPersistence, store_->file_path(), commit_error);
  } else {
    report.committed = true;
  }

  const AlertDedupStats& stats = dedup.stats();
  LogInfo("CYCLE_DONE: run=" + std::to_string(run_count) +
          " markets=" + std::to_string(report.markets_tracked) +
          " pairs=" + std::to_string(report.pairs_matched) +
          " gaps=" + std::to_string(report.gaps_fired) + "/" +
          std::to_string(report.gap_candidates) +
          " moves=" + std::to_string(report.moves_fired) + "/" +
          std::to_string(report.move_candidates) +
          " corr=" + std::to_string(report.correlations_fired) + "/" +
          std::to_string(report.correlation_candidates) +
          " news=" + std::to_string(report.news_fired) + "/" +
          std::to_string(report.news_candidates) +
          " suppressed=" + std::to_string(stats.cooldown_rejects + stats.seen_rejects) +
          " capped=" + std::to_string(stats.cap_rejects) +
          " pruned=" + std::to_string(pruned) +
          " errors=" + std::to_string(report.errors.size()) +
          " committed=" + (report.committed ? "true" : "false") +
          " elapsed_ms=" + std::to_string(clock_() - cycle_start_ms));
  return report;
}

}  // namespace pm_sentinel
