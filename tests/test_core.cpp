#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/json_utils.h"
#include "core/text_utils.h"
#include "ingest/feed_parser.h"
#include "ingest/fetch_client.h"
#include "ingest/market_normalizer.h"
#include "notify/message_formatter.h"
#include "notify/telegram_channel.h"
#include "test_helpers.h"

namespace {

using test_support::kBaseNowMs;
using test_support::MakeMarket;
using test_support::MockHttpTransport;
using test_support::NearlyEqual;
using test_support::Ok;
using test_support::ScopedEnvVar;
using test_support::ScopedTempDir;
using test_support::Status;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

pm_sentinel::JsonValue MustParse(const std::string& text) {
  pm_sentinel::JsonValue value;
  std::string error;
  if (!pm_sentinel::ParseJson(text, &value, &error)) {
    std::cerr << "测试 JSON 解析失败: " << error << "\n";
  }
  return value;
}

pm_sentinel::NormalizeContext DefaultContext(
    const std::vector<pm_sentinel::KeywordRule>* rules) {
  pm_sentinel::NormalizeContext context;
  context.fetched_at_ms = kBaseNowMs;
  context.now_ms = kBaseNowMs;
  context.drop_expired_titles = true;
  context.rules = rules;
  return context;
}

const char* kRssDocument =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<rss version=\"2.0\"><channel><title>Desk</title>\n"
    "<item><title><![CDATA[Fed & ECB <b>signal</b> cuts]]></title>"
    "<link>https://example.com/a?x=1&amp;y=2</link><guid>urn:item:1</guid>"
    "<description>Rates &lt;b&gt;lower&lt;/b&gt; soon &#8364;</description>"
    "<pubDate>Tue, 10 Jun 2025 14:00:00 GMT</pubDate></item>\n"
    "<item><description>no title, no link</description></item>\n"
    "<item><title>Second</title><link>https://example.com/b</link></item>\n"
    "</channel></rss>\n";

const char* kAtomDocument =
    "<feed xmlns=\"http://www.w3.org/2005/Atom\"><title>Atom desk</title>\n"
    "<entry><title type=\"html\">Bitcoin ETF approved</title>"
    "<link rel=\"self\" href=\"https://example.com/self\"/>"
    "<link rel=\"alternate\" href=\"https://example.com/btc\"/>"
    "<id>urn:item:1</id><updated>2025-06-10T16:00:00+02:00</updated>"
    "<summary>Spot ETF</summary></entry>\n"
    "</feed>\n";

}  // namespace

int main() {
  // ---------------------------------------------------------------- JSON
  {
    pm_sentinel::JsonValue value;
    std::string error;
    if (!pm_sentinel::ParseJson("{\"b\":[1,true,null],\"a\":\"x\\u00e9\"}", &value, &error)) {
      std::cerr << "预期 JSON 解析成功: " << error << "\n";
      return 1;
    }
    const auto a = pm_sentinel::JsonAsString(pm_sentinel::JsonObjectField(&value, "a"));
    if (!a.has_value() || *a != "x\xC3\xA9") {
      std::cerr << "\\u00e9 应按 UTF-8 写出\n";
      return 1;
    }
    if (pm_sentinel::SerializeJson(value) != "{\"a\":\"x\xC3\xA9\",\"b\":[1,true,null]}") {
      std::cerr << "序列化应按键排序，实际: " << pm_sentinel::SerializeJson(value) << "\n";
      return 1;
    }
    if (pm_sentinel::ParseJson("{\"a\": }", &value, &error)) {
      std::cerr << "非法 JSON 应解析失败\n";
      return 1;
    }
    const pm_sentinel::JsonValue nested = MustParse("{\"p\":{\"retry_after\":7}}");
    const auto retry =
        pm_sentinel::JsonAsInt64(pm_sentinel::JsonFindPath(&nested, {"p", "retry_after"}));
    if (!retry.has_value() || *retry != 7) {
      std::cerr << "JsonFindPath 应找到嵌套字段\n";
      return 1;
    }
  }

  // ---------------------------------------------------------------- 配置
  {
    ScopedTempDir dir("config");
    const auto path = dir.path() / "app.yaml";
    test_support::WriteTextFile(
        path,
        "system:\n"
        "  state_file: /tmp/pm_state.json   # 注释\n"
        "  interval_minutes: 30\n"
        "  languages: [EN, fr, en]\n"
        "alert:\n"
        "  threshold_bps: 400\n"
        "  cooldown_minutes: 90\n"
        "matcher:\n"
        "  similarity_floor: 0.5\n"
        "news:\n"
        "  feeds:\n"
        "    fed: https://example.com/fed.xml\n"
        "relevance:\n"
        "  rules:\n"
        "    Crypto: [bitcoin, \"ether\"]\n"
        "telegram:\n"
        "  chat_id: \"-100123\"\n"
        "future_section:\n"
        "  something: 1\n");
    pm_sentinel::AppConfig config;
    std::string error;
    if (!pm_sentinel::LoadAppConfigFromYaml(path.string(), &config, &error)) {
      std::cerr << "预期 YAML 加载成功: " << error << "\n";
      return 1;
    }
    if (config.state_file != "/tmp/pm_state.json" || config.interval_minutes != 30 ||
        config.alert.threshold_bps != 400 || config.alert.cooldown_minutes != 90 ||
        config.alert.realert_delta_bps != 100 ||
        !NearlyEqual(config.matcher.similarity_floor, 0.5)) {
      std::cerr << "YAML 字段未正确覆盖\n";
      return 1;
    }
    if (config.languages != std::vector<std::string>{"en", "fr"}) {
      std::cerr << "languages 应小写去重\n";
      return 1;
    }
    if (config.news.feeds.size() != 1 || config.news.feeds[0].name != "fed" ||
        config.news.feeds[0].url != "https://example.com/fed.xml") {
      std::cerr << "feeds 小节应整体替换默认值\n";
      return 1;
    }
    if (config.relevance_rules.size() != 1 || config.relevance_rules[0].category != "crypto" ||
        config.relevance_rules[0].keywords != std::vector<std::string>{"bitcoin", "ether"}) {
      std::cerr << "relevance.rules 应整体替换默认值\n";
      return 1;
    }
    if (config.telegram.chat_id != "-100123") {
      std::cerr << "chat_id 引号应去除\n";
      return 1;
    }
  }

  {
    ScopedTempDir dir("config_bad");
    const auto bad_int = dir.path() / "bad_int.yaml";
    test_support::WriteTextFile(bad_int, "alert:\n  cooldown_minutes: soon\n");
    pm_sentinel::AppConfig config;
    std::string error;
    if (pm_sentinel::LoadAppConfigFromYaml(bad_int.string(), &config, &error) ||
        !Contains(error, "alert.cooldown_minutes")) {
      std::cerr << "非法整数应报错并指明字段，实际: " << error << "\n";
      return 1;
    }

    const auto bad_keep = dir.path() / "bad_keep.yaml";
    test_support::WriteTextFile(bad_keep,
                                "news:\n  seen_history_max: 100\n  seen_history_keep: 200\n");
    if (pm_sentinel::LoadAppConfigFromYaml(bad_keep.string(), &config, &error)) {
      std::cerr << "keep > max 应校验失败\n";
      return 1;
    }

    const auto bad_language = dir.path() / "bad_language.yaml";
    test_support::WriteTextFile(bad_language, "system:\n  languages: [en, de]\n");
    if (pm_sentinel::LoadAppConfigFromYaml(bad_language.string(), &config, &error)) {
      std::cerr << "不支持的语言应校验失败\n";
      return 1;
    }

    if (pm_sentinel::LoadAppConfigFromYaml((dir.path() / "missing.yaml").string(), &config,
                                           &error)) {
      std::cerr << "缺失配置文件应返回失败\n";
      return 1;
    }
  }

  {
    ScopedTempDir dir("config_corr");
    const auto path = dir.path() / "corr.yaml";
    test_support::WriteTextFile(path,
                                "system:\n"
                                "  startup_notice: false\n"
                                "correlation:\n"
                                "  enabled: true\n"
                                "  threshold_bps: 800\n"
                                "  laggard_ratio: 0.25\n"
                                "  similarity_floor: 0.5\n"
                                "  hints: [\"Fed | Rate Cut\", oil|opec]\n");
    pm_sentinel::AppConfig config;
    std::string error;
    if (!pm_sentinel::LoadAppConfigFromYaml(path.string(), &config, &error)) {
      std::cerr << "预期 correlation 小节加载成功: " << error << "\n";
      return 1;
    }
    if (config.startup_notice || config.correlation.threshold_bps != 800 ||
        !NearlyEqual(config.correlation.laggard_ratio, 0.25) ||
        !NearlyEqual(config.correlation.similarity_floor, 0.5) ||
        config.correlation.hints.size() != 2 || config.correlation.hints[0].left != "fed" ||
        config.correlation.hints[0].right != "rate cut" ||
        config.correlation.hints[1].left != "oil" || config.correlation.hints[1].right != "opec") {
      std::cerr << "correlation 小节字段未正确覆盖\n";
      return 1;
    }

    const auto bad_hint = dir.path() / "bad_hint.yaml";
    test_support::WriteTextFile(bad_hint, "correlation:\n  hints: [fed]\n");
    if (pm_sentinel::LoadAppConfigFromYaml(bad_hint.string(), &config, &error) ||
        !Contains(error, "correlation.hints")) {
      std::cerr << "缺少 '|' 的关联词应报错并指明字段，实际: " << error << "\n";
      return 1;
    }

    const auto bad_ratio = dir.path() / "bad_ratio.yaml";
    test_support::WriteTextFile(bad_ratio, "correlation:\n  laggard_ratio: 1.0\n");
    if (pm_sentinel::LoadAppConfigFromYaml(bad_ratio.string(), &config, &error)) {
      std::cerr << "laggard_ratio >= 1 应校验失败\n";
      return 1;
    }
  }

  {
    ScopedEnvVar token("TELEGRAM_BOT_TOKEN", "123:abc");
    ScopedEnvVar chat("TELEGRAM_CHAT_ID", "42");
    ScopedEnvVar threshold("ALERT_THRESHOLD_BPS", "700");
    ScopedEnvVar languages("LANGUAGES", "he, EN");
    ScopedEnvVar interval("CHECK_INTERVAL_MINUTES", "15");
    ScopedEnvVar level("LOG_LEVEL", "debug");
    pm_sentinel::AppConfig config;
    std::string error;
    if (!pm_sentinel::ApplyEnvironmentOverrides(&config, &error)) {
      std::cerr << "环境变量覆盖应成功: " << error << "\n";
      return 1;
    }
    if (config.telegram.bot_token != "123:abc" || config.telegram.chat_id != "42" ||
        config.alert.threshold_bps != 700 || config.interval_minutes != 15 ||
        config.log_level != "debug" ||
        config.languages != std::vector<std::string>{"he", "en"}) {
      std::cerr << "环境变量覆盖结果不符合预期\n";
      return 1;
    }
  }

  {
    ScopedEnvVar threshold("ALERT_THRESHOLD_BPS", "five");
    pm_sentinel::AppConfig config;
    std::string error;
    if (pm_sentinel::ApplyEnvironmentOverrides(&config, &error) || config.alert.threshold_bps != 500) {
      std::cerr << "非法 ALERT_THRESHOLD_BPS 应失败且不修改配置\n";
      return 1;
    }
  }

  {
    ScopedEnvVar languages("LANGUAGES", "en,de");
    pm_sentinel::AppConfig config;
    std::string error;
    if (pm_sentinel::ApplyEnvironmentOverrides(&config, &error) || config.languages.size() != 3) {
      std::cerr << "LANGUAGES 包含不支持语言时应失败\n";
      return 1;
    }
  }

  // ---------------------------------------------------------------- 文本工具
  {
    if (pm_sentinel::NormalizeTitle("  Will the Fed cut rates in December?  ") !=
        "will the fed cut rates in december") {
      std::cerr << "NormalizeTitle 结果不符合预期\n";
      return 1;
    }
    if (pm_sentinel::NormalizeTitle("Trump's  2nd-term") != "trumps 2nd term") {
      std::cerr << "撇号应删除，其他标点替换为空格\n";
      return 1;
    }
    if (pm_sentinel::ContainsPhrase("the federal reserve meets", "fed") ||
        !pm_sentinel::ContainsPhrase("fed cuts rates", "fed") ||
        !pm_sentinel::ContainsPhrase("the federal reserve meets", "federal reserve")) {
      std::cerr << "ContainsPhrase 应按词边界匹配\n";
      return 1;
    }

    std::vector<std::string> matched;
    const std::string category = pm_sentinel::MatchKeywordRules(
        "bitcoin slips as fed signals rate cut", pm_sentinel::AppConfig::DefaultKeywordRules(),
        &matched);
    if (category != "macro" ||
        matched != std::vector<std::string>{"bitcoin", "fed", "rate cut"}) {
      std::cerr << "MatchKeywordRules 应取命中最多的类别，实际: " << category << "\n";
      return 1;
    }
    matched.clear();
    if (!pm_sentinel::MatchKeywordRules("quiet day", pm_sentinel::AppConfig::DefaultKeywordRules(),
                                        &matched)
             .empty() ||
        !matched.empty()) {
      std::cerr << "无命中时类别应为空\n";
      return 1;
    }

    std::string hex;
    std::string error;
    if (!pm_sentinel::Sha256Hex("abc", &hex, &error) ||
        hex != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
      std::cerr << "SHA-256(abc) 结果不符合预期: " << hex << "\n";
      return 1;
    }
  }

  // ---------------------------------------------------------------- 归一化
  const std::vector<pm_sentinel::KeywordRule> rules = pm_sentinel::AppConfig::DefaultKeywordRules();
  {
    const pm_sentinel::JsonValue payload = MustParse(
        "{\"id\":512,\"question\":\"Will the Fed cut rates in December?\","
        "\"outcomePrices\":\"[\\\"0.723\\\", \\\"0.277\\\"]\",\"active\":true,"
        "\"closed\":false,\"slug\":\"fed-cut-december\",\"category\":\"Economics\"}");
    pm_sentinel::Market market;
    std::string error;
    const auto outcome = pm_sentinel::NormalizeMarket(
        payload, pm_sentinel::Platform::kPolymarket, DefaultContext(&rules), &market, &error);
    if (outcome != pm_sentinel::NormalizeOutcome::kAccepted) {
      std::cerr << "Polymarket 记录应归一化成功: " << error << "\n";
      return 1;
    }
    if (market.external_id != "512" || !NearlyEqual(market.price, 0.723) ||
        market.url != "https://polymarket.com/event/fed-cut-december" ||
        market.match_title != "will the fed cut rates in december" ||
        market.category != "macro" || !market.category_inferred ||
        market.fetched_at_ms != kBaseNowMs) {
      std::cerr << "Polymarket 字段映射不符合预期\n";
      return 1;
    }
  }

  {
    const pm_sentinel::JsonValue payload = MustParse(
        "{\"ticker\":\"NYCMAYOR-ZM\",\"title\":\"Zohran Mamdani wins NYC mayoral race\","
        "\"status\":\"open\",\"last_price\":81,\"category\":\" Elections \"}");
    pm_sentinel::Market market;
    std::string error;
    if (pm_sentinel::NormalizeMarket(payload, pm_sentinel::Platform::kKalshi,
                                     DefaultContext(&rules), &market, &error) !=
            pm_sentinel::NormalizeOutcome::kAccepted ||
        market.category != "elections" || market.category_inferred) {
      std::cerr << "关键词未命中时应退回平台自报类别且不标记为规则判定\n";
      return 1;
    }
  }

  {
    const pm_sentinel::JsonValue closed = MustParse(
        "{\"id\":\"1\",\"question\":\"Q\",\"outcomePrices\":\"[\\\"0.5\\\"]\",\"closed\":true}");
    const pm_sentinel::JsonValue out_of_range = MustParse(
        "{\"id\":\"2\",\"question\":\"Q\",\"outcomePrices\":\"[\\\"1.7\\\"]\"}");
    const pm_sentinel::JsonValue no_title =
        MustParse("{\"id\":\"3\",\"outcomePrices\":\"[\\\"0.5\\\"]\"}");
    const pm_sentinel::JsonValue fallback_price =
        MustParse("{\"id\":\"4\",\"question\":\"Q\",\"lastTradePrice\":0.31}");
    pm_sentinel::Market market;
    std::string error;
    const auto context = DefaultContext(nullptr);
    if (pm_sentinel::NormalizeMarket(closed, pm_sentinel::Platform::kPolymarket, context,
                                     &market, &error) !=
        pm_sentinel::NormalizeOutcome::kInactive) {
      std::cerr << "closed 市场应视为非活跃\n";
      return 1;
    }
    if (pm_sentinel::NormalizeMarket(out_of_range, pm_sentinel::Platform::kPolymarket, context,
                                     &market, &error) !=
        pm_sentinel::NormalizeOutcome::kParseError) {
      std::cerr << "价格越界应为解析错误\n";
      return 1;
    }
    if (pm_sentinel::NormalizeMarket(no_title, pm_sentinel::Platform::kPolymarket, context,
                                     &market, &error) !=
        pm_sentinel::NormalizeOutcome::kParseError) {
      std::cerr << "缺少标题应为解析错误\n";
      return 1;
    }
    if (pm_sentinel::NormalizeMarket(fallback_price, pm_sentinel::Platform::kPolymarket, context,
                                     &market, &error) !=
            pm_sentinel::NormalizeOutcome::kAccepted ||
        !NearlyEqual(market.price, 0.31) || !market.category.empty()) {
      std::cerr << "缺少 outcomePrices 时应回退 lastTradePrice\n";
      return 1;
    }
  }

  {
    const pm_sentinel::JsonValue cents = MustParse(
        "{\"ticker\":\"FED-25DEC-T4.00\",\"title\":\"Fed cuts rates by December\","
        "\"status\":\"open\",\"yes_bid\":55,\"yes_ask\":57}");
    const pm_sentinel::JsonValue dollars = MustParse(
        "{\"ticker\":\"BTC-26\",\"title\":\"Bitcoin above 150k\",\"subtitle\":\"By end of 2026\","
        "\"status\":\"active\",\"yes_bid\":10,\"yes_ask\":12,"
        "\"yes_bid_dollars\":\"0.6100\",\"yes_ask_dollars\":\"0.6300\"}");
    const pm_sentinel::JsonValue settled = MustParse(
        "{\"ticker\":\"OLD\",\"title\":\"Old\",\"status\":\"settled\",\"last_price\":99}");
    pm_sentinel::Market market;
    std::string error;
    const auto context = DefaultContext(&rules);
    if (pm_sentinel::NormalizeMarket(cents, pm_sentinel::Platform::kKalshi, context, &market,
                                     &error) != pm_sentinel::NormalizeOutcome::kAccepted ||
        !NearlyEqual(market.price, 0.56) ||
        market.url != "https://kalshi.com/markets/fed-25dec-t4.00" ||
        market.category != "macro") {
      std::cerr << "Kalshi 美分报价应取买卖中间价\n";
      return 1;
    }
    if (pm_sentinel::NormalizeMarket(dollars, pm_sentinel::Platform::kKalshi, context, &market,
                                     &error) != pm_sentinel::NormalizeOutcome::kAccepted ||
        !NearlyEqual(market.price, 0.62) ||
        market.title != "Bitcoin above 150k - By end of 2026" || market.category != "crypto") {
      std::cerr << "Kalshi 美元字段应优先，副标题应拼接，实际标题: " << market.title << "\n";
      return 1;
    }
    if (pm_sentinel::NormalizeMarket(settled, pm_sentinel::Platform::kKalshi, context, &market,
                                     &error) != pm_sentinel::NormalizeOutcome::kInactive) {
      std::cerr << "已结算 Kalshi 市场应视为非活跃\n";
      return 1;
    }
  }

  {
    // kBaseNowMs 位于 2025 年 10 月。
    if (!pm_sentinel::IsExpiredTitle("Fed decision in March 2025?", kBaseNowMs) ||
        pm_sentinel::IsExpiredTitle("Fed decision in October 2025?", kBaseNowMs) ||
        pm_sentinel::IsExpiredTitle("Fed decision in Dec 2025?", kBaseNowMs) ||
        pm_sentinel::IsExpiredTitle("Bitcoin above 150k in 2024", kBaseNowMs)) {
      std::cerr << "IsExpiredTitle 判定不符合预期\n";
      return 1;
    }
    const pm_sentinel::JsonValue expired = MustParse(
        "{\"id\":\"9\",\"question\":\"Fed cut in March 2025?\",\"outcomePrices\":\"[\\\"0.1\\\"]\"}");
    pm_sentinel::Market market;
    std::string error;
    auto context = DefaultContext(nullptr);
    if (pm_sentinel::NormalizeMarket(expired, pm_sentinel::Platform::kPolymarket, context,
                                     &market, &error) !=
        pm_sentinel::NormalizeOutcome::kInactive) {
      std::cerr << "标题日期已过的市场应丢弃\n";
      return 1;
    }
    context.drop_expired_titles = false;
    if (pm_sentinel::NormalizeMarket(expired, pm_sentinel::Platform::kPolymarket, context,
                                     &market, &error) !=
        pm_sentinel::NormalizeOutcome::kAccepted) {
      std::cerr << "关闭过期过滤后应接受该市场\n";
      return 1;
    }
  }

  {
    std::vector<pm_sentinel::JsonValue> payloads{
        MustParse("{\"id\":\"1\",\"question\":\"A\",\"outcomePrices\":\"[\\\"0.4\\\"]\"}"),
        MustParse("{\"id\":\"1\",\"question\":\"A again\",\"outcomePrices\":\"[\\\"0.6\\\"]\"}"),
        MustParse("{\"id\":\"2\",\"question\":\"B\",\"outcomePrices\":\"[\\\"0.5\\\"]\",\"active\":false}"),
        MustParse("[1,2,3]"),
        MustParse("{\"question\":\"no id\",\"outcomePrices\":\"[\\\"0.5\\\"]\"}"),
    };
    const pm_sentinel::NormalizeBatch batch = pm_sentinel::NormalizeMarkets(
        payloads, pm_sentinel::Platform::kPolymarket, DefaultContext(nullptr));
    if (batch.markets.size() != 1 || batch.markets[0].title != "A" || batch.duplicates != 1 ||
        batch.inactive != 1 || batch.parse_errors != 2 || batch.first_error.empty()) {
      std::cerr << "批量归一化统计不符合预期\n";
      return 1;
    }
  }

  // ---------------------------------------------------------------- Feed 解析
  {
    std::vector<pm_sentinel::NewsItem> items;
    int parse_errors = 0;
    std::string error;
    if (!pm_sentinel::ParseFeed(kRssDocument, "desk", 0, &items, &parse_errors, &error)) {
      std::cerr << "RSS 解析应成功: " << error << "\n";
      return 1;
    }
    if (items.size() != 2 || parse_errors != 1) {
      std::cerr << "RSS 条目数或解析错误数不符合预期: " << items.size() << "/" << parse_errors
                << "\n";
      return 1;
    }
    const pm_sentinel::NewsItem& first = items[0];
    if (first.title != "Fed & ECB signal cuts" ||
        first.link != "https://example.com/a?x=1&y=2" ||
        first.summary != "Rates lower soon \xE2\x82\xAC" || first.source != "desk") {
      std::cerr << "RSS 文本解码不符合预期: [" << first.title << "] [" << first.summary << "]\n";
      return 1;
    }
    if (first.item_id != "b136cdd7ff1e0f04662e5a061dd2e52270e267ebdcc359b98364f270020a0ca4") {
      std::cerr << "item_id 应为 guid 的 SHA-256\n";
      return 1;
    }
    if (!first.published_at_ms.has_value() || *first.published_at_ms != 1749564000000) {
      std::cerr << "pubDate 解析不符合预期\n";
      return 1;
    }
    if (items[1].published_at_ms.has_value() || items[1].item_id.size() != 64) {
      std::cerr << "无日期条目应保留空发布时间\n";
      return 1;
    }

    if (!pm_sentinel::ParseFeed(kRssDocument, "desk", 1, &items, &parse_errors, &error) ||
        items.size() != 1) {
      std::cerr << "max_items 应限制条目数\n";
      return 1;
    }
  }

  {
    std::vector<pm_sentinel::NewsItem> items;
    int parse_errors = 0;
    std::string error;
    if (!pm_sentinel::ParseFeed(kAtomDocument, "atom", 0, &items, &parse_errors, &error) ||
        items.size() != 1) {
      std::cerr << "Atom 解析应成功: " << error << "\n";
      return 1;
    }
    if (items[0].link != "https://example.com/btc" || items[0].title != "Bitcoin ETF approved" ||
        items[0].summary != "Spot ETF" ||
        items[0].item_id != "b136cdd7ff1e0f04662e5a061dd2e52270e267ebdcc359b98364f270020a0ca4" ||
        items[0].published_at_ms.value_or(0) != 1749564000000) {
      std::cerr << "Atom 字段不符合预期: " << items[0].link << "\n";
      return 1;
    }

    if (pm_sentinel::ParseFeed("<html><body>maintenance</body></html>", "broken", 0, &items,
                               &parse_errors, &error)) {
      std::cerr << "非 feed 文档应解析失败\n";
      return 1;
    }
  }

  {
    const auto iso = pm_sentinel::ParseFeedTimestamp("2025-06-10T14:00:00.123Z");
    const auto edt = pm_sentinel::ParseFeedTimestamp("Tue, 10 Jun 2025 10:00:00 EDT");
    const auto offset = pm_sentinel::ParseFeedTimestamp("10 Jun 2025 16:00:00 +0200");
    if (iso.value_or(0) != 1749564000000 || edt.value_or(0) != 1749564000000 ||
        offset.value_or(0) != 1749564000000) {
      std::cerr << "时间戳格式解析不符合预期\n";
      return 1;
    }
    if (pm_sentinel::ParseFeedTimestamp("yesterday").has_value()) {
      std::cerr << "无法识别的时间应返回空\n";
      return 1;
    }
  }

  // ---------------------------------------------------------------- 抓取客户端
  {
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("GET", "offset=0", Ok("[{\"id\":\"1\"},{\"id\":\"2\"}]"));
    mock->AddRoute("GET", "offset=2", Ok("{\"data\":[{\"id\":\"3\"}]}"));
    pm_sentinel::FetchConfig config;
    config.polymarket_base_url = "https://poly.test/";
    config.page_limit = 2;
    config.max_pages = 5;
    const pm_sentinel::HttpMarketFetchClient client(config, std::move(transport));
    std::vector<pm_sentinel::JsonValue> payloads;
    std::string error;
    if (!client.FetchActiveMarkets(pm_sentinel::Platform::kPolymarket, &payloads, &error)) {
      std::cerr << "Polymarket 分页抓取应成功: " << error << "\n";
      return 1;
    }
    const auto requests = mock->requests();
    if (payloads.size() != 3 || requests.size() != 2 ||
        requests[0].url !=
            "https://poly.test/markets?active=true&closed=false&limit=2&offset=0") {
      std::cerr << "Polymarket 应在不足一页时停止翻页\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("GET", "cursor=abc",
                   Ok("{\"markets\":[{\"ticker\":\"C\"}],\"cursor\":\"\"}"));
    mock->AddRoute("GET", "status=open",
                   Ok("{\"markets\":[{\"ticker\":\"A\"},{\"ticker\":\"B\"}],\"cursor\":\"abc\"}"));
    pm_sentinel::FetchConfig config;
    config.kalshi_base_url = "https://kalshi.test/trade-api/v2";
    config.page_limit = 2;
    const pm_sentinel::HttpMarketFetchClient client(config, std::move(transport));
    std::vector<pm_sentinel::JsonValue> payloads;
    std::string error;
    if (!client.FetchActiveMarkets(pm_sentinel::Platform::kKalshi, &payloads, &error) ||
        payloads.size() != 3 || mock->requests().size() != 2 ||
        !Contains(mock->requests()[1].url, "&cursor=abc")) {
      std::cerr << "Kalshi 应沿 cursor 翻页直至 cursor 为空: " << error << "\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("GET", "offset=", Ok("[{\"id\":\"x\"},{\"id\":\"y\"}]"));
    pm_sentinel::FetchConfig config;
    config.page_limit = 2;
    config.max_pages = 2;
    const pm_sentinel::HttpMarketFetchClient client(config, std::move(transport));
    std::vector<pm_sentinel::JsonValue> payloads;
    std::string error;
    if (!client.FetchActiveMarkets(pm_sentinel::Platform::kPolymarket, &payloads, &error) ||
        payloads.size() != 4 || mock->requests().size() != 2) {
      std::cerr << "翻页应受 max_pages 限制\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockHttpTransport>();
    transport->AddRoute("GET", "status=open", Status(503, "upstream down"));
    const pm_sentinel::HttpMarketFetchClient client(pm_sentinel::FetchConfig{},
                                                    std::move(transport));
    std::vector<pm_sentinel::JsonValue> payloads;
    std::string error;
    if (client.FetchActiveMarkets(pm_sentinel::Platform::kKalshi, &payloads, &error) ||
        !Contains(error, "HTTP 503")) {
      std::cerr << "非 2xx 响应应返回失败并带状态码，实际: " << error << "\n";
      return 1;
    }
  }

  {
    auto transport = std::make_unique<MockHttpTransport>();
    transport->AddRoute("GET", "https://example.com/rss.xml", Ok(kRssDocument));
    transport->AddRoute("GET", "https://example.com/gone.xml", Status(404, ""));
    const pm_sentinel::HttpNewsFetchClient client(20, std::move(transport));
    std::vector<pm_sentinel::NewsItem> items;
    int parse_errors = 0;
    std::string error;
    if (!client.FetchFeedItems(pm_sentinel::FeedConfig{"desk", "https://example.com/rss.xml"},
                               &items, &parse_errors, &error) ||
        items.size() != 2 || parse_errors != 1 || items[0].source != "desk") {
      std::cerr << "新闻抓取应解析 RSS: " << error << "\n";
      return 1;
    }
    if (client.FetchFeedItems(pm_sentinel::FeedConfig{"gone", "https://example.com/gone.xml"},
                              &items, &parse_errors, &error) ||
        !Contains(error, "HTTP 404")) {
      std::cerr << "feed 404 应返回失败\n";
      return 1;
    }
  }

  // ---------------------------------------------------------------- Telegram
  {
    const auto parts = pm_sentinel::SplitMessage("a\nb\nc", 3);
    if (parts != std::vector<std::string>{"a\nb", "c"}) {
      std::cerr << "SplitMessage 应按行边界切分\n";
      return 1;
    }
    const auto utf8 = pm_sentinel::SplitMessage("\xC3\xA9\xC3\xA9\xC3\xA9", 3);
    if (utf8 != std::vector<std::string>{"\xC3\xA9", "\xC3\xA9", "\xC3\xA9"}) {
      std::cerr << "超长行应在 UTF-8 字符边界切分\n";
      return 1;
    }
    if (pm_sentinel::SplitMessage("short", 4000) != std::vector<std::string>{"short"}) {
      std::cerr << "短消息不应切分\n";
      return 1;
    }
  }

  {
    pm_sentinel::TelegramConfig config;
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    pm_sentinel::TelegramChannel channel(config, std::move(transport));
    std::string error;
    if (channel.Send("42", "hello", &error) || !mock->requests().empty()) {
      std::cerr << "缺少 bot token 时应直接失败且不发请求\n";
      return 1;
    }
  }

  {
    pm_sentinel::TelegramConfig config;
    config.bot_token = "TOKEN";
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("POST", "/botTOKEN/sendMessage", Ok("{\"ok\":true,\"result\":{}}"));
    pm_sentinel::TelegramChannel channel(config, std::move(transport));
    std::string error;
    if (!channel.Send("42", "hello <b>x</b>", &error)) {
      std::cerr << "Telegram 投递应成功: " << error << "\n";
      return 1;
    }
    const auto requests = mock->requests();
    const pm_sentinel::JsonValue body = MustParse(requests.at(0).body);
    if (requests.size() != 1 ||
        pm_sentinel::JsonAsString(pm_sentinel::JsonObjectField(&body, "chat_id")) !=
            std::optional<std::string>("42") ||
        pm_sentinel::JsonAsString(pm_sentinel::JsonObjectField(&body, "parse_mode")) !=
            std::optional<std::string>("HTML") ||
        pm_sentinel::JsonAsBool(
            pm_sentinel::JsonObjectField(&body, "disable_web_page_preview")) !=
            std::optional<bool>(true)) {
      std::cerr << "sendMessage 请求体不符合预期\n";
      return 1;
    }
  }

  {
    pm_sentinel::TelegramConfig config;
    config.bot_token = "TOKEN";
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("POST", "sendMessage",
                   Status(429, "{\"ok\":false,\"parameters\":{\"retry_after\":3}}"));
    mock->AddRoute("POST", "sendMessage", Ok("{\"ok\":true}"));
    std::vector<int> slept;
    pm_sentinel::TelegramChannel channel(config, std::move(transport),
                                         [&slept](int seconds) { slept.push_back(seconds); });
    std::string error;
    if (!channel.Send("42", "rate limited", &error) || slept != std::vector<int>{3} ||
        mock->requests().size() != 2) {
      std::cerr << "429 应按 retry_after 等待后重试一次: " << error << "\n";
      return 1;
    }
  }

  {
    pm_sentinel::TelegramConfig config;
    config.bot_token = "TOKEN";
    config.max_retry_after_seconds = 30;
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("POST", "sendMessage",
                   Status(429, "{\"ok\":false,\"parameters\":{\"retry_after\":120}}"));
    std::vector<int> slept;
    pm_sentinel::TelegramChannel channel(config, std::move(transport),
                                         [&slept](int seconds) { slept.push_back(seconds); });
    std::string error;
    if (channel.Send("42", "rate limited", &error) || !slept.empty() ||
        mock->requests().size() != 1 || !Contains(error, "retry_after=120")) {
      std::cerr << "retry_after 超过上限时应直接失败\n";
      return 1;
    }
  }

  {
    pm_sentinel::TelegramConfig config;
    config.bot_token = "TOKEN";
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("POST", "sendMessage",
                   Status(400, "{\"ok\":false,\"description\":\"Bad Request: chat not found\"}"));
    pm_sentinel::TelegramChannel channel(config, std::move(transport));
    std::string error;
    if (channel.Send("42", "x", &error) || !Contains(error, "chat not found") ||
        mock->requests().size() != 1) {
      std::cerr << "400 应失败并带 Telegram 描述，实际: " << error << "\n";
      return 1;
    }
  }

  {
    pm_sentinel::TelegramConfig config;
    config.bot_token = "TOKEN";
    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* mock = transport.get();
    mock->AddRoute("POST", "sendMessage", Ok("{\"ok\":true}"));
    pm_sentinel::TelegramChannel channel(config, std::move(transport));
    const std::string long_text = std::string(2500, 'a') + "\n" + std::string(2500, 'b');
    std::string error;
    if (!channel.Send("42", long_text, &error) || mock->requests().size() != 2) {
      std::cerr << "超长消息应拆分为两段发送\n";
      return 1;
    }
  }

  {
    pm_sentinel::LoggingChannel channel;
    std::string error;
    if (!channel.Send("", "dry run text", &error) ||
        channel.sent_messages() != std::vector<std::string>{"dry run text"}) {
      std::cerr << "LoggingChannel 应记录消息\n";
      return 1;
    }
  }

  // ---------------------------------------------------------------- 文本渲染
  {
    const pm_sentinel::Market poly = MakeMarket(pm_sentinel::Platform::kPolymarket, "512",
                                                "Fed <script> cut?", 0.723);
    const pm_sentinel::Market kalshi = MakeMarket(pm_sentinel::Platform::kKalshi, "FED-DEC",
                                                  "Fed cuts by December", 0.551);
    pm_sentinel::GapSignal gap;
    gap.pair = pm_sentinel::MatchedPair{&poly, &kalshi, 0.93};
    gap.gap_bps = 1720;
    gap.direction = pm_sentinel::GapDirection::kPolyHigher;
    const std::string text = pm_sentinel::FormatSignal(gap, "en");
    if (!Contains(text, "17.2%") || !Contains(text, "Polymarket: 72.3% | Kalshi: 55.1%") ||
        !Contains(text, "Gap: 1720 bps (Polymarket higher)") ||
        !Contains(text, "Match similarity: 0.93") || !Contains(text, "Fed &lt;script&gt; cut?") ||
        Contains(text, "<script>")) {
      std::cerr << "价差告警文本不符合预期:\n" << text << "\n";
      return 1;
    }
    if (pm_sentinel::FormatSignal(gap, "de") != text) {
      std::cerr << "未知语言应回退英文\n";
      return 1;
    }
    if (!Contains(pm_sentinel::FormatSignal(gap, "he"), "פער") ||
        !Contains(pm_sentinel::FormatSignal(gap, "fr"), "Écart")) {
      std::cerr << "希伯来语/法语模板缺失\n";
      return 1;
    }
  }

  {
    const pm_sentinel::Market market = MakeMarket(pm_sentinel::Platform::kPolymarket, "77",
                                                  "Bitcoin above 150k by 2026?", 0.628);
    pm_sentinel::MoveSignal move;
    move.market = &market;
    move.before_price = 0.452;
    move.after_price = 0.628;
    move.move_bps = 1760;
    move.elapsed_minutes = 120;
    const std::string text = pm_sentinel::FormatSignal(move, "en");
    if (!Contains(text, "45.2% → 62.8% (+17.6 pts, 1760 bps)") || !Contains(text, "over 120 min")) {
      std::cerr << "波动告警文本不符合预期:\n" << text << "\n";
      return 1;
    }
  }

  {
    pm_sentinel::NewsSignal signal;
    signal.item = test_support::MakeNews("n1", "Fed & ECB hold", kBaseNowMs);
    signal.matched_keywords = {"fed", "ecb"};
    signal.category = "macro";
    const std::string text = pm_sentinel::FormatSignal(signal, "en");
    if (!Contains(text, "Fed &amp; ECB hold") || !Contains(text, "Keywords: fed, ecb") ||
        !Contains(text, "Category: macro") || !Contains(text, "Read more") ||
        !Contains(text, "https://news.example.com/n1")) {
      std::cerr << "新闻告警文本不符合预期:\n" << text << "\n";
      return 1;
    }
  }

  {
    pm_sentinel::Market mover = MakeMarket(pm_sentinel::Platform::kPolymarket, "fed-dec",
                                           "Will the Fed cut rates in December?", 0.70);
    pm_sentinel::Market laggard = MakeMarket(pm_sentinel::Platform::kKalshi, "RATE-CUT",
                                             "Rate cut by March", 0.40);
    pm_sentinel::CorrelationSignal signal;
    signal.mover = &mover;
    signal.laggard = &laggard;
    signal.mover_before = 0.55;
    signal.laggard_before = 0.41;
    signal.mover_move_bps = 1500;
    signal.laggard_move_bps = -100;
    signal.similarity = 0.21;
    signal.hint = "fed|rate cut";
    const std::string text = pm_sentinel::FormatSignal(signal, "en");
    if (!Contains(text, "Correlation anomaly") ||
        !Contains(text, "Moved: <b>Will the Fed cut rates in December?</b>") ||
        !Contains(text, "Polymarket: 55.0% → 70.0% (+15.0 pts)") ||
        !Contains(text, "Did not react: <b>Rate cut by March</b>") ||
        !Contains(text, "Kalshi: 41.0% → 40.0% (-1.0 pts)") ||
        !Contains(text, "Related by: fed / rate cut") || Contains(text, "Match similarity") ||
        !Contains(text, "https://kalshi.com/markets/RATE-CUT")) {
      std::cerr << "相关背离告警文本不符合预期:\n" << text << "\n";
      return 1;
    }
    signal.hint.clear();
    signal.similarity = 0.6756;
    const std::string by_title = pm_sentinel::FormatSignal(signal, "en");
    if (!Contains(by_title, "Match similarity: 0.68") || Contains(by_title, "Related by")) {
      std::cerr << "无关联词时应展示标题相似度:\n" << by_title << "\n";
      return 1;
    }
    if (!Contains(pm_sentinel::FormatSignal(signal, "he"), "קורלציה") ||
        !Contains(pm_sentinel::FormatSignal(signal, "fr"), "corrélation")) {
      std::cerr << "相关背离缺少希伯来语/法语模板\n";
      return 1;
    }
  }

  {
    pm_sentinel::StartupInfo info;
    info.interval_minutes = 120;
    info.threshold_bps = 500;
    info.correlation_threshold_bps = 1000;
    info.feeds = 4;
    info.languages = {"en", "he"};
    const std::string fresh = pm_sentinel::FormatStartup(info, "en");
    if (!Contains(fresh, "pm-sentinel started") || !Contains(fresh, "Scan interval: 120 min") ||
        !Contains(fresh, "Gap/move threshold: 500 bps") ||
        !Contains(fresh, "Correlation threshold: 1000 bps") || !Contains(fresh, "News feeds: 4") ||
        !Contains(fresh, "History: empty") || !Contains(fresh, "Languages: en, he")) {
      std::cerr << "启动通知文本不符合预期:\n" << fresh << "\n";
      return 1;
    }
    info.run_count = 37;
    info.correlation_threshold_bps = 0;
    const std::string restored = pm_sentinel::FormatStartup(info, "en");
    if (!Contains(restored, "History: restored (Runs: 37)") ||
        Contains(restored, "Correlation threshold")) {
      std::cerr << "启动通知应展示已恢复历史且隐藏关闭的检测:\n" << restored << "\n";
      return 1;
    }
    if (!Contains(pm_sentinel::FormatStartup(info, "he"), "הופעל") ||
        !Contains(pm_sentinel::FormatStartup(info, "fr"), "démarré")) {
      std::cerr << "启动通知缺少希伯来语/法语模板\n";
      return 1;
    }
  }

  {
    pm_sentinel::HeartbeatStats stats;
    stats.run_count = 24;
    stats.markets_tracked = 10;
    stats.pairs_matched = 3;
    stats.signals_fired = 2;
    const std::string quiet = pm_sentinel::FormatHeartbeat(stats, "en");
    if (!Contains(quiet, "heartbeat") || !Contains(quiet, "Runs: 24") ||
        !Contains(quiet, "Markets tracked: 10") || !Contains(quiet, "Matched pairs: 3") ||
        Contains(quiet, "Errors")) {
      std::cerr << "心跳文本不符合预期:\n" << quiet << "\n";
      return 1;
    }
    stats.errors = 1;
    if (!Contains(pm_sentinel::FormatHeartbeat(stats, "en"), "Errors this run: 1")) {
      std::cerr << "心跳应包含错误数\n";
      return 1;
    }
    if (pm_sentinel::FormatPercent(0.723) != "72.3%") {
      std::cerr << "FormatPercent 应保留一位小数\n";
      return 1;
    }
  }

  return 0;
}
