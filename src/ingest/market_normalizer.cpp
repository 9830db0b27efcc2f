#include "ingest/market_normalizer.h"

#include <cctype>
#include <cmath>
#include <ctime>
#include <optional>
#include <unordered_set>
#include <utility>

#include "core/log.h"
#include "core/text_utils.h"

namespace pm_sentinel {

namespace {

bool SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

std::string FieldString(const JsonValue& payload, const std::string& key) {
  const auto value = JsonAsString(JsonObjectField(&payload, key));
  return value.has_value() ? Trim(*value) : std::string();
}

/// 布尔字段：缺失时返回 `fallback`；兼容 "true"/"false" 字符串。
bool FieldBool(const JsonValue& payload, const std::string& key, bool fallback) {
  const JsonValue* node = JsonObjectField(&payload, key);
  if (node == nullptr || node->type == JsonType::kNull) {
    return fallback;
  }
  if (const auto flag = JsonAsBool(node); flag.has_value()) {
    return *flag;
  }
  if (const auto text = JsonAsString(node); text.has_value()) {
    const std::string lowered = ToLowerCopy(Trim(*text));
    if (lowered == "true") {
      return true;
    }
    if (lowered == "false") {
      return false;
    }
  }
  return fallback;
}

std::optional<double> FieldNumber(const JsonValue& payload, const std::string& key) {
  const JsonValue* node = JsonObjectField(&payload, key);
  if (node == nullptr || node->type == JsonType::kNull) {
    return std::nullopt;
  }
  if (node->type == JsonType::kString && Trim(node->string_value).empty()) {
    return std::nullopt;
  }
  return JsonAsNumber(node);
}

/// Polymarket `outcomePrices` 为 JSON 编码的字符串数组（偶见原生数组）。
std::optional<double> PolymarketOutcomePrice(const JsonValue& payload) {
  const JsonValue* node = JsonObjectField(&payload, "outcomePrices");
  if (node == nullptr) {
    return std::nullopt;
  }
  JsonValue decoded;
  const JsonValue* array = node;
  if (node->type == JsonType::kString) {
    std::string parse_error;
    if (!ParseJson(node->string_value, &decoded, &parse_error)) {
      return std::nullopt;
    }
    array = &decoded;
  }
  return JsonAsNumber(JsonArrayAt(array, 0));
}

std::string PolymarketSlug(const JsonValue& payload) {
  const std::string slug = FieldString(payload, "slug");
  if (!slug.empty()) {
    return slug;
  }
  const JsonValue* first_event = JsonArrayAt(JsonObjectField(&payload, "events"), 0);
  if (first_event == nullptr) {
    return {};
  }
  return FieldString(*first_event, "slug");
}

/// Kalshi 价格：优先 `<base>_dollars`（美元字符串），否则 `<base>`（整数美分）。
std::optional<double> KalshiPrice(const JsonValue& payload, const std::string& base) {
  if (const auto dollars = FieldNumber(payload, base + "_dollars"); dollars.has_value()) {
    return dollars;
  }
  if (const auto cents = FieldNumber(payload, base); cents.has_value()) {
    return *cents / 100.0;
  }
  return std::nullopt;
}

/// 关键词规则优先；未命中时退回平台自报类别（各平台命名不一致）。
std::string InferCategory(const std::string& match_title,
                          const std::string& declared,
                          const std::vector<KeywordRule>* rules,
                          bool* out_inferred) {
  *out_inferred = false;
  if (rules != nullptr) {
    const std::string inferred = MatchKeywordRules(match_title, *rules, nullptr);
    if (!inferred.empty()) {
      *out_inferred = true;
      return inferred;
    }
  }
  return ToLowerCopy(Trim(declared));
}

NormalizeOutcome NormalizePolymarket(const JsonValue& payload,
                                     Market* out,
                                     std::string* out_error) {
  out->external_id = FieldString(payload, "id");
  if (out->external_id.empty()) {
    SetError(out_error, "polymarket 缺少 id");
    return NormalizeOutcome::kParseError;
  }
  if (!FieldBool(payload, "active", true) || FieldBool(payload, "closed", false) ||
      FieldBool(payload, "archived", false) ||
      !FieldBool(payload, "acceptingOrders", true)) {
    return NormalizeOutcome::kInactive;
  }

  std::string title = FieldString(payload, "question");
  if (title.empty()) {
    title = FieldString(payload, "groupItemTitle");
  }
  if (title.empty()) {
    SetError(out_error, "polymarket 缺少标题: " + out->external_id);
    return NormalizeOutcome::kParseError;
  }
  out->title = CollapseWhitespace(title);

  std::optional<double> price = PolymarketOutcomePrice(payload);
  if (!price.has_value()) {
    price = FieldNumber(payload, "lastTradePrice");
  }
  if (!price.has_value()) {
    price = FieldNumber(payload, "bestAsk");
  }
  if (!price.has_value()) {
    SetError(out_error, "polymarket 缺少价格: " + out->external_id);
    return NormalizeOutcome::kParseError;
  }
  out->price = *price;

  const std::string slug = PolymarketSlug(payload);
  out->url = slug.empty() ? "https://polymarket.com/markets"
                          : "https://polymarket.com/event/" + slug;
  out->category = FieldString(payload, "category");
  return NormalizeOutcome::kAccepted;
}

NormalizeOutcome NormalizeKalshi(const JsonValue& payload,
                                 Market* out,
                                 std::string* out_error) {
  out->external_id = FieldString(payload, "ticker");
  if (out->external_id.empty()) {
    SetError(out_error, "kalshi 缺少 ticker");
    return NormalizeOutcome::kParseError;
  }
  const std::string status = ToLowerCopy(FieldString(payload, "status"));
  if (!status.empty() && status != "open" && status != "active") {
    return NormalizeOutcome::kInactive;
  }

  std::string title = CollapseWhitespace(FieldString(payload, "title"));
  if (title.empty()) {
    SetError(out_error, "kalshi 缺少标题: " + out->external_id);
    return NormalizeOutcome::kParseError;
  }
  const std::string subtitle = CollapseWhitespace(FieldString(payload, "subtitle"));
  if (!subtitle.empty() &&
      ToLowerCopy(title).find(ToLowerCopy(subtitle)) == std::string::npos) {
    title += " - " + subtitle;
  }
  out->title = title;

  const auto yes_bid = KalshiPrice(payload, "yes_bid");
  const auto yes_ask = KalshiPrice(payload, "yes_ask");
  const auto last_price = KalshiPrice(payload, "last_price");
  if (yes_bid.has_value() && yes_ask.has_value() && *yes_bid > 0.0 && *yes_ask > 0.0) {
    out->price = (*yes_bid + *yes_ask) / 2.0;
  } else if (last_price.has_value() && *last_price > 0.0) {
    out->price = *last_price;
  } else if (yes_ask.has_value()) {
    out->price = *yes_ask;
  } else {
    SetError(out_error, "kalshi 缺少价格: " + out->external_id);
    return NormalizeOutcome::kParseError;
  }

  out->url = "https://kalshi.com/markets/" + ToLowerCopy(out->external_id);
  out->category = FieldString(payload, "category");
  return NormalizeOutcome::kAccepted;
}

int MonthFromToken(const std::string& token) {
  static const struct {
    const char* name;
    int month;
  } kMonths[] = {
      {"january", 1},   {"february", 2}, {"march", 3},     {"april", 4},
      {"may", 5},       {"june", 6},     {"july", 7},      {"august", 8},
      {"september", 9}, {"october", 10}, {"november", 11}, {"december", 12},
      {"jan", 1},       {"feb", 2},      {"mar", 3},       {"apr", 4},
      {"jun", 6},       {"jul", 7},      {"aug", 8},       {"sep", 9},
      {"sept", 9},      {"oct", 10},     {"nov", 11},      {"dec", 12},
  };
  for (const auto& entry : kMonths) {
    if (token == entry.name) {
      return entry.month;
    }
  }
  return 0;
}

}  // namespace

bool IsExpiredTitle(const std::string& title, std::int64_t now_ms) {
  int month = 0;
  int year = 0;
  for (const auto& token : SplitWords(NormalizeTitle(title))) {
    if (month == 0) {
      month = MonthFromToken(token);
    }
    if (year == 0 && token.size() == 4 && token.compare(0, 2, "20") == 0 &&
        std::isdigit(static_cast<unsigned char>(token[2])) != 0 &&
        std::isdigit(static_cast<unsigned char>(token[3])) != 0) {
      year = 2000 + (token[2] - '0') * 10 + (token[3] - '0');
    }
  }
  if (month == 0 || year == 0) {
    return false;
  }

  const std::time_t now_seconds = static_cast<std::time_t>(now_ms / 1000);
  std::tm now_tm{};
  gmtime_r(&now_seconds, &now_tm);
  const int now_year = now_tm.tm_year + 1900;
  const int now_month = now_tm.tm_mon + 1;
  return year < now_year || (year == now_year && month < now_month);
}

NormalizeOutcome NormalizeMarket(const JsonValue& payload,
                                 Platform platform,
                                 const NormalizeContext& context,
                                 Market* out_market,
                                 std::string* out_error) {
  if (out_market == nullptr) {
    SetError(out_error, "out_market 为空");
    return NormalizeOutcome::kParseError;
  }
  if (payload.type != JsonType::kObject) {
    SetError(out_error, std::string(ToString(platform)) + " 记录不是 JSON 对象");
    return NormalizeOutcome::kParseError;
  }

  Market market;
  market.platform = platform;
  market.fetched_at_ms = context.fetched_at_ms;
  const NormalizeOutcome outcome =
      platform == Platform::kPolymarket ? NormalizePolymarket(payload, &market, out_error)
                                        : NormalizeKalshi(payload, &market, out_error);
  if (outcome != NormalizeOutcome::kAccepted) {
    return outcome;
  }

  if (!std::isfinite(market.price) || market.price < 0.0 || market.price > 1.0) {
    SetError(out_error, MarketKey(market) + " 价格越界: " + std::to_string(market.price));
    return NormalizeOutcome::kParseError;
  }
  if (context.drop_expired_titles && IsExpiredTitle(market.title, context.now_ms)) {
    LogDebug("MARKET_EXPIRED_TITLE: " + MarketKey(market) + " " + market.title);
    return NormalizeOutcome::kInactive;
  }

  market.match_title = NormalizeTitle(market.title);
  market.category = InferCategory(market.match_title, market.category, context.rules,
                                  &market.category_inferred);
  *out_market = std::move(market);
  return NormalizeOutcome::kAccepted;
}

NormalizeBatch NormalizeMarkets(const std::vector<JsonValue>& payloads,
                                Platform platform,
                                const NormalizeContext& context) {
  NormalizeBatch batch;
  std::unordered_set<std::string> seen_ids;
  for (const auto& payload : payloads) {
    Market market;
    std::string error;
    switch (NormalizeMarket(payload, platform, context, &market, &error)) {
      case NormalizeOutcome::kAccepted:
        if (!seen_ids.insert(market.external_id).second) {
          ++batch.duplicates;
          LogDebug("MARKET_DUPLICATE: " + MarketKey(market));
          break;
        }
        batch.markets.push_back(std::move(market));
        break;
      case NormalizeOutcome::kInactive:
        ++batch.inactive;
        break;
      case NormalizeOutcome::kParseError:
        ++batch.parse_errors;
        if (batch.first_error.empty()) {
          batch.first_error = error;
        }
        break;
    }
  }
  return batch;
}

}  // namespace pm_sentinel
