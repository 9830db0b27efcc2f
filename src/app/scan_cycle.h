#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "ingest/fetch_client.h"
#include "notify/telegram_channel.h"
#include "storage/state_store.h"

namespace pm_sentinel {

/// 毫秒时钟；测试可注入固定时间。
using ClockFunction = std::function<std::int64_t()>;

/// 当前 UTC epoch 毫秒。
std::int64_t SystemNowMs();

/**
 * @brief 单轮扫描编排
 *
 * 流程：
 * 1. 读取持久化状态（失败则放弃本轮，不计算任何信号）；
 * 2. 各数据源并发抓取（每源一个线程），全部结束后进入顺序阶段；
 * 3. 归一化 -> 匹配 -> 价差/波动/相关背离检测 -> 新闻过滤 -> 去重 -> 渲染 -> 投递；
 * 4. 生成新快照与历史并原子提交。
 *
 * 停止请求在抓取结束后、投递前、提交前检查；被停止的轮次不提交任何状态。
 * 同一实例上一轮未结束时再次调用直接返回 `skipped = true`。
 */
class ScanCycle {
 public:
  /**
   * @param market_client 市场抓取（不持有所有权）
   * @param news_client 新闻抓取（不持有所有权）
   * @param channel 投递通道（不持有所有权）
   * @param store 状态存储（不持有所有权）
   * @param stop_flag 外部停止标志，可为空
   */
  ScanCycle(AppConfig config,
            const MarketFetchClient* market_client,
            const NewsFetchClient* news_client,
            DeliveryChannel* channel,
            const StateStore* store,
            ClockFunction clock = nullptr,
            const std::atomic<bool>* stop_flag = nullptr);

  /// 执行一轮扫描；可重复调用。
  CycleReport RunCycle();

  /**
   * @brief 发送启动通知（每种语言一条）
   *
   * 只读取状态文件以报告已恢复的运行次数，不写入。
   * 状态读取失败时不发送；任一语言投递失败返回 false，其余语言照常发送。
   */
  bool AnnounceStartup(std::string* out_error);

  /// 是否有轮次正在执行。
  bool running() const { return running_.load(); }

 private:
  struct PlatformFetch {
    Platform platform{Platform::kPolymarket};
    bool ok{false};
    std::vector<JsonValue> payloads;
    std::string error;
  };

  struct FeedFetch {
    const FeedConfig* feed{nullptr};
    bool ok{false};
    std::vector<NewsItem> items;
    int parse_errors{0};
    std::string error;
  };

  /// 已放行、待投递的一条告警（各语言文本）。
  struct PendingAlert {
    std::string signal_key;
    std::vector<std::string> texts;
  };

  CycleReport RunCycleLocked();
  void FetchAll(std::vector<PlatformFetch>* platforms, std::vector<FeedFetch>* feeds) const;
  bool StopRequested(const char* stage, CycleReport* report) const;
  void Deliver(const std::vector<PendingAlert>& alerts, CycleReport* report);

  template <typename Signal>
  std::vector<std::string> RenderAll(const Signal& signal) const;

  AppConfig config_;
  const MarketFetchClient* market_client_{nullptr};
  const NewsFetchClient* news_client_{nullptr};
  DeliveryChannel* channel_{nullptr};
  const StateStore* store_{nullptr};
  ClockFunction clock_;
  const std::atomic<bool>* stop_flag_{nullptr};
  std::atomic<bool> running_{false};
};

}  // namespace pm_sentinel
