#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "app/scan_cycle.h"
#include "core/config.h"
#include "core/log.h"
#include "ingest/fetch_client.h"
#include "notify/telegram_channel.h"
#include "storage/state_store.h"

namespace {

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int /*signal*/) {
  g_stop_requested.store(true);
}

struct RuntimeOptions {
  std::string config_path{"config/default.yaml"};
  std::optional<int> interval_minutes;
  std::optional<std::string> state_file;
  bool once{false};
  bool dry_run{false};
};

bool ParsePositiveInt(const std::string& raw, int* out_value) {
  if (out_value == nullptr || raw.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(raw, &consumed);
    if (consumed != raw.size() || parsed <= 0) {
      return false;
    }
    *out_value = parsed;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

RuntimeOptions ParseOptions(int argc, char** argv) {
  RuntimeOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      options.config_path = arg.substr(std::string("--config=").size());
      continue;
    }
    if (arg.rfind("--state_file=", 0) == 0) {
      options.state_file = arg.substr(std::string("--state_file=").size());
      continue;
    }
    if (arg.rfind("--interval_minutes=", 0) == 0) {
      int parsed = 0;
      const std::string raw = arg.substr(std::string("--interval_minutes=").size());
      if (!ParsePositiveInt(raw, &parsed)) {
        pm_sentinel::LogInfo("--interval_minutes 参数非法，已忽略: " + raw);
        continue;
      }
      options.interval_minutes = parsed;
      continue;
    }
    if (arg == "--once") {
      options.once = true;
      continue;
    }
    if (arg == "--dry_run" || arg == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    pm_sentinel::LogInfo("未知参数，已忽略: " + arg);
  }
  return options;
}

/// 分段睡眠直到 `deadline` 或收到停止信号。
void SleepUntil(std::chrono::steady_clock::time_point deadline) {
  while (!g_stop_requested.load() && std::chrono::steady_clock::now() < deadline) {
    const auto remaining = deadline - std::chrono::steady_clock::now();
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(remaining, std::chrono::milliseconds(500)));
  }
}

void LogReport(const pm_sentinel::CycleReport& report) {
  for (const auto& error : report.errors) {
    pm_sentinel::LogInfo(std::string("CYCLE_ERROR: kind=") + pm_sentinel::ToString(error.kind) +
                         " source=" + error.source + " message=" + error.message);
  }
}

}  // namespace

int main(int argc, char** argv) {
  pm_sentinel::LogInfo("启动 pm-sentinel 预测市场监控...");
  const RuntimeOptions options = ParseOptions(argc, argv);

  pm_sentinel::AppConfig config;
  std::string config_error;
  if (!pm_sentinel::LoadAppConfigFromYaml(options.config_path, &config, &config_error)) {
    pm_sentinel::LogError("配置加载失败: " + config_error);
    return 1;
  }
  if (!pm_sentinel::ApplyEnvironmentOverrides(&config, &config_error)) {
    pm_sentinel::LogError("环境变量覆盖失败: " + config_error);
    return 1;
  }
  if (options.interval_minutes.has_value()) {
    config.interval_minutes = *options.interval_minutes;
  }
  if (options.state_file.has_value()) {
    config.state_file = *options.state_file;
  }
  if (!pm_sentinel::ValidateAppConfig(config, &config_error)) {
    pm_sentinel::LogError("配置校验失败: " + config_error);
    return 1;
  }

  pm_sentinel::LogLevel level = pm_sentinel::LogLevel::kInfo;
  if (pm_sentinel::ParseLogLevel(config.log_level, &level)) {
    pm_sentinel::SetLogLevel(level);
  }

  std::string languages;
  for (const auto& language : config.languages) {
    languages += (languages.empty() ? "" : ",") + language;
  }
  pm_sentinel::LogInfo("配置加载成功: state_file=" + config.state_file +
                       ", interval_minutes=" + std::to_string(config.interval_minutes) +
                       ", alert.threshold_bps=" + std::to_string(config.alert.threshold_bps) +
                       ", alert.cooldown_minutes=" +
                       std::to_string(config.alert.cooldown_minutes) +
                       ", alert.realert_delta_bps=" +
                       std::to_string(config.alert.realert_delta_bps) +
                       ", matcher.similarity_floor=" +
                       std::to_string(config.matcher.similarity_floor) +
                       ", news.feeds=" + std::to_string(config.news.feeds.size()) +
                       ", languages=[" + languages + "]" +
                       ", dry_run=" + (options.dry_run ? "true" : "false"));

  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);

  const pm_sentinel::HttpMarketFetchClient market_client(config.fetch);
  const pm_sentinel::HttpNewsFetchClient news_client(
      config.news.max_items_per_feed,
      std::make_unique<pm_sentinel::CurlHttpTransport>(config.fetch.connect_timeout_ms,
                                                       config.fetch.timeout_ms));
  std::unique_ptr<pm_sentinel::DeliveryChannel> channel;
  if (options.dry_run) {
    channel = std::make_unique<pm_sentinel::LoggingChannel>();
  } else {
    if (config.telegram.bot_token.empty() || config.telegram.chat_id.empty()) {
      pm_sentinel::LogError("TELEGRAM_BOT_TOKEN/TELEGRAM_CHAT_ID 未配置；可使用 --dry_run");
      return 1;
    }
    channel = std::make_unique<pm_sentinel::TelegramChannel>(config.telegram);
  }
  const pm_sentinel::StateStore store(config.state_file);
  pm_sentinel::ScanCycle cycle(config, &market_client, &news_client, channel.get(), &store,
                               nullptr, &g_stop_requested);

  if (options.once) {
    const pm_sentinel::CycleReport report = cycle.RunCycle();
    LogReport(report);
    return report.committed ? 0 : 2;
  }

  if (config.startup_notice) {
    std::string notice_error;
    if (!cycle.AnnounceStartup(&notice_error)) {
      pm_sentinel::LogError("STARTUP_NOTICE_FAILED: " + notice_error);
    }
  }

  const auto interval = std::chrono::minutes(config.interval_minutes);
  auto next_tick = std::chrono::steady_clock::now();
  while (!g_stop_requested.load()) {
    LogReport(cycle.RunCycle());

    // 轮次耗时超过间隔时丢弃过期 tick，不排队补跑。
    next_tick += interval;
    const auto now = std::chrono::steady_clock::now();
    std::int64_t skipped = 0;
    while (next_tick <= now) {
      next_tick += interval;
      ++skipped;
    }
    if (skipped > 0) {
      pm_sentinel::LogInfo("TICK_SKIPPED: count=" + std::to_string(skipped));
    }
    SleepUntil(next_tick);
  }

  pm_sentinel::LogInfo("收到停止信号，pm-sentinel 退出");
  return 0;
}
