#include "ingest/fetch_client.h"

#include <utility>

#include "core/log.h"
#include "ingest/feed_parser.h"

namespace pm_sentinel {

namespace {

bool SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

/// 截断响应体用于错误描述，避免日志被大段 HTML 淹没。
std::string BodyPreview(const std::string& body) {
  constexpr std::size_t kMaxPreview = 200;
  return body.size() <= kMaxPreview ? body : body.substr(0, kMaxPreview) + "...";
}

std::string TrimTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

}  // namespace

HttpMarketFetchClient::HttpMarketFetchClient(FetchConfig config,
                                             std::unique_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (transport_ == nullptr) {
    transport_ = std::make_unique<CurlHttpTransport>(config_.connect_timeout_ms,
                                                     config_.timeout_ms);
  }
}

bool HttpMarketFetchClient::FetchActiveMarkets(Platform platform,
                                               std::vector<JsonValue>* out_payloads,
                                               std::string* out_error) const {
  if (out_payloads == nullptr) {
    return SetError(out_error, "out_payloads 为空");
  }
  out_payloads->clear();
  return platform == Platform::kPolymarket ? FetchPolymarket(out_payloads, out_error)
                                           : FetchKalshi(out_payloads, out_error);
}

bool HttpMarketFetchClient::GetJson(const std::string& url,
                                    JsonValue* out_value,
                                    std::string* out_error) const {
  const HttpHeaders headers{{"Accept", "application/json"}};
  const HttpResponse response = transport_->Send("GET", url, headers, "");
  if (!response.error.empty()) {
    return SetError(out_error, response.error);
  }
  if (!IsHttpSuccess(response.status_code)) {
    return SetError(out_error, "HTTP " + std::to_string(response.status_code) +
                                   ": " + BodyPreview(response.body));
  }
  std::string parse_error;
  if (!ParseJson(response.body, out_value, &parse_error)) {
    return SetError(out_error, "响应 JSON 解析失败: " + parse_error);
  }
  return true;
}

bool HttpMarketFetchClient::FetchPolymarket(std::vector<JsonValue>* out_payloads,
                                            std::string* out_error) const {
  const std::string base = TrimTrailingSlash(config_.polymarket_base_url);
  for (int page = 0; page < config_.max_pages; ++page) {
    const int offset = page * config_.page_limit;
    const std::string url = base + "/markets?active=true&closed=false&limit=" +
                            std::to_string(config_.page_limit) +
                            "&offset=" + std::to_string(offset);
    JsonValue root;
    std::string error;
    if (!GetJson(url, &root, &error)) {
      return SetError(out_error, "polymarket 第 " + std::to_string(page + 1) +
                                     " 页抓取失败: " + error);
    }
    // Gamma 直接返回数组；兼容 {"data": [...]} 包装。
    const JsonValue* list = &root;
    if (root.type == JsonType::kObject) {
      list = JsonObjectField(&root, "data");
    }
    if (list == nullptr || list->type != JsonType::kArray) {
      return SetError(out_error, "polymarket 响应不是市场数组");
    }
    for (const auto& item : list->array_value) {
      out_payloads->push_back(item);
    }
    if (static_cast<int>(list->array_value.size()) < config_.page_limit) {
      break;
    }
  }
  return true;
}

bool HttpMarketFetchClient::FetchKalshi(std::vector<JsonValue>* out_payloads,
                                        std::string* out_error) const {
  const std::string base = TrimTrailingSlash(config_.kalshi_base_url);
  std::string cursor;
  for (int page = 0; page < config_.max_pages; ++page) {
    std::string url = base + "/markets?status=open&limit=" +
                      std::to_string(config_.page_limit);
    if (!cursor.empty()) {
      url += "&cursor=" + UrlEncode(cursor);
    }
    JsonValue root;
    std::string error;
    if (!GetJson(url, &root, &error)) {
      return SetError(out_error, "kalshi 第 " + std::to_string(page + 1) +
                                     " 页抓取失败: " + error);
    }
    const JsonValue* list = JsonObjectField(&root, "markets");
    if (list == nullptr || list->type != JsonType::kArray) {
      return SetError(out_error, "kalshi 响应缺少 markets 数组");
    }
    for (const auto& item : list->array_value) {
      out_payloads->push_back(item);
    }
    cursor = JsonAsString(JsonObjectField(&root, "cursor")).value_or("");
    if (cursor.empty() || list->array_value.empty()) {
      break;
    }
  }
  return true;
}

HttpNewsFetchClient::HttpNewsFetchClient(int max_items_per_feed,
                                         std::unique_ptr<HttpTransport> transport)
    : max_items_per_feed_(max_items_per_feed), transport_(std::move(transport)) {
  if (transport_ == nullptr) {
    transport_ = std::make_unique<CurlHttpTransport>();
  }
}

bool HttpNewsFetchClient::FetchFeedItems(const FeedConfig& feed,
                                         std::vector<NewsItem>* out_items,
                                         int* out_parse_errors,
                                         std::string* out_error) const {
  if (out_items == nullptr || out_parse_errors == nullptr) {
    return SetError(out_error, "FetchFeedItems 输出参数为空");
  }
  const HttpHeaders headers{
      {"Accept", "application/rss+xml, application/atom+xml, application/xml, text/xml"}};
  const HttpResponse response = transport_->Send("GET", feed.url, headers, "");
  if (!response.error.empty()) {
    return SetError(out_error, response.error);
  }
  if (!IsHttpSuccess(response.status_code)) {
    return SetError(out_error, "HTTP " + std::to_string(response.status_code));
  }
  if (!ParseFeed(response.body, feed.name, max_items_per_feed_, out_items,
                 out_parse_errors, out_error)) {
    return false;
  }
  if (*out_parse_errors > 0) {
    LogDebug("FEED_ITEM_SKIPPED: " + feed.name + " count=" +
             std::to_string(*out_parse_errors));
  }
  return true;
}

}  // namespace pm_sentinel
