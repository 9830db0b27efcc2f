#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/json_utils.h"
#include "core/types.h"
#include "ingest/http_transport.h"

namespace pm_sentinel {

/**
 * @brief 平台市场抓取接口
 *
 * 仅负责取回原始记录（JSON 对象），不做字段解释；归一化由 Normalizer 完成。
 * 失败返回 `false` 并写入 `out_error`，此时 `out_payloads` 内容不可用。
 */
class MarketFetchClient {
 public:
  virtual ~MarketFetchClient() = default;
  virtual bool FetchActiveMarkets(Platform platform,
                                  std::vector<JsonValue>* out_payloads,
                                  std::string* out_error) const = 0;
};

/// 新闻源抓取接口：取回并解析一个 RSS/Atom feed。
class NewsFetchClient {
 public:
  virtual ~NewsFetchClient() = default;
  virtual bool FetchFeedItems(const FeedConfig& feed,
                              std::vector<NewsItem>* out_items,
                              int* out_parse_errors,
                              std::string* out_error) const = 0;
};

/**
 * @brief 基于 HTTP 的市场抓取实现
 *
 * 分页：
 * 1. Polymarket `GET /markets?active=true&closed=false&limit=&offset=`，
 *    返回条数小于 `limit` 时停止；
 * 2. Kalshi `GET /markets?status=open&limit=&cursor=`，cursor 为空时停止。
 * 两者均受 `fetch.max_pages` 限制。
 */
class HttpMarketFetchClient final : public MarketFetchClient {
 public:
  HttpMarketFetchClient(FetchConfig config,
                        std::unique_ptr<HttpTransport> transport = nullptr);

  bool FetchActiveMarkets(Platform platform,
                          std::vector<JsonValue>* out_payloads,
                          std::string* out_error) const override;

 private:
  bool FetchPolymarket(std::vector<JsonValue>* out_payloads,
                       std::string* out_error) const;
  bool FetchKalshi(std::vector<JsonValue>* out_payloads,
                   std::string* out_error) const;
  bool GetJson(const std::string& url,
               JsonValue* out_value,
               std::string* out_error) const;

  FetchConfig config_;
  std::unique_ptr<HttpTransport> transport_;
};

/// 基于 HTTP 的新闻抓取实现（单 feed 至多 `max_items_per_feed` 条）。
class HttpNewsFetchClient final : public NewsFetchClient {
 public:
  HttpNewsFetchClient(int max_items_per_feed,
                      std::unique_ptr<HttpTransport> transport);

  bool FetchFeedItems(const FeedConfig& feed,
                      std::vector<NewsItem>* out_items,
                      int* out_parse_errors,
                      std::string* out_error) const override;

 private:
  int max_items_per_feed_;
  std::unique_ptr<HttpTransport> transport_;
};

}  // namespace pm_sentinel
