#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/types.h"

namespace pm_sentinel {

/**
 * @brief RSS 2.0 / Atom 文档解析
 *
 * 行为：
 * 1. RSS 取 `<item>`，Atom 取 `<entry>`；
 * 2. 条目缺少标题且缺少链接时计入 `out_parse_errors` 并跳过；
 * 3. `item_id` 为 guid/id、否则链接、否则标题的 SHA-256 十六进制；
 * 4. `max_items > 0` 时仅保留文档中前 `max_items` 个条目。
 *
 * 文档根既不是 RSS/RDF 也不是 Atom 时返回 `false`。
 */
bool ParseFeed(const std::string& xml,
               const std::string& source,
               int max_items,
               std::vector<NewsItem>* out_items,
               int* out_parse_errors,
               std::string* out_error);

/**
 * @brief 解析 feed 时间戳为 epoch 毫秒
 *
 * 支持 RFC 822（`Tue, 10 Jun 2025 14:00:00 GMT` / `+0200`）与
 * ISO 8601（`2025-06-10T14:00:00Z` / `+02:00`，可带小数秒）。
 */
std::optional<std::int64_t> ParseFeedTimestamp(const std::string& text);

/// 解码 XML 文本：展开 CDATA、实体引用，去掉内嵌 HTML 标签并折叠空白。
std::string DecodeXmlText(const std::string& raw);

}  // namespace pm_sentinel
