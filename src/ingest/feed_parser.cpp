#include "ingest/feed_parser.h"

#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <utility>

#include "core/text_utils.h"

namespace pm_sentinel {

namespace {

struct XmlElement {
  std::string attributes;
  std::string inner;
  std::size_t end_pos{0};  ///< 元素结束标签之后的位置。
};

bool IsNameTerminator(char ch) {
  return ch == '>' || ch == '/' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

/// 跳过 CDATA / 注释 / 处理指令；返回跳过后的位置，未命中返回 `pos`。
std::size_t SkipOpaqueSection(const std::string& xml, std::size_t pos) {
  if (xml.compare(pos, 9, "<![CDATA[") == 0) {
    const std::size_t end = xml.find("]]>", pos + 9);
    return end == std::string::npos ? xml.size() : end + 3;
  }
  if (xml.compare(pos, 4, "<!--") == 0) {
    const std::size_t end = xml.find("-->", pos + 4);
    return end == std::string::npos ? xml.size() : end + 3;
  }
  return pos;
}

/// 查找 `<tag`（名称完整匹配），跳过 CDATA 与注释中的内容。
std::size_t FindOpenTag(const std::string& xml,
                        const std::string& tag,
                        std::size_t from,
                        std::size_t limit) {
  std::size_t pos = from;
  while (pos < limit) {
    pos = xml.find('<', pos);
    if (pos == std::string::npos || pos >= limit) {
      return std::string::npos;
    }
    const std::size_t skipped = SkipOpaqueSection(xml, pos);
    if (skipped != pos) {
      pos = skipped;
      continue;
    }
    const std::size_t name_end = pos + 1 + tag.size();
    if (name_end < xml.size() && xml.compare(pos + 1, tag.size(), tag) == 0 &&
        IsNameTerminator(xml[name_end])) {
      return pos;
    }
    ++pos;
  }
  return std::string::npos;
}

std::size_t FindCloseTag(const std::string& xml,
                         const std::string& tag,
                         std::size_t from,
                         std::size_t limit) {
  std::size_t pos = from;
  while (pos < limit) {
    pos = xml.find('<', pos);
    if (pos == std::string::npos || pos >= limit) {
      return std::string::npos;
    }
    const std::size_t skipped = SkipOpaqueSection(xml, pos);
    if (skipped != pos) {
      pos = skipped;
      continue;
    }
    const std::size_t name_end = pos + 2 + tag.size();
    if (name_end < xml.size() && xml[pos + 1] == '/' &&
        xml.compare(pos + 2, tag.size(), tag) == 0 &&
        (xml[name_end] == '>' ||
         std::isspace(static_cast<unsigned char>(xml[name_end])) != 0)) {
      return pos;
    }
    ++pos;
  }
  return std::string::npos;
}

/// 在 `[from, limit)` 内提取下一个 `<tag ...>...</tag>` 或自闭合 `<tag .../>`。
bool NextElement(const std::string& xml,
                 const std::string& tag,
                 std::size_t from,
                 std::size_t limit,
                 XmlElement* out) {
  const std::size_t open = FindOpenTag(xml, tag, from, limit);
  if (open == std::string::npos) {
    return false;
  }
  const std::size_t open_end = xml.find('>', open);
  if (open_end == std::string::npos || open_end >= limit) {
    return false;
  }
  const std::size_t attr_begin = open + 1 + tag.size();
  const bool self_closing = xml[open_end - 1] == '/';
  if (self_closing) {
    out->attributes = xml.substr(attr_begin, open_end - 1 - attr_begin);
    out->inner.clear();
    out->end_pos = open_end + 1;
    return true;
  }
  out->attributes = xml.substr(attr_begin, open_end - attr_begin);
  const std::size_t close = FindCloseTag(xml, tag, open_end + 1, limit);
  if (close == std::string::npos) {
    return false;
  }
  out->inner = xml.substr(open_end + 1, close - open_end - 1);
  const std::size_t close_end = xml.find('>', close);
  out->end_pos = close_end == std::string::npos ? limit : close_end + 1;
  return true;
}

std::string AttributeValue(const std::string& attributes, const std::string& name) {
  std::size_t pos = 0;
  while (pos < attributes.size()) {
    pos = attributes.find(name, pos);
    if (pos == std::string::npos) {
      return {};
    }
    const bool starts_token =
        pos == 0 || std::isspace(static_cast<unsigned char>(attributes[pos - 1])) != 0;
    std::size_t cursor = pos + name.size();
    while (cursor < attributes.size() &&
           std::isspace(static_cast<unsigned char>(attributes[cursor])) != 0) {
      ++cursor;
    }
    if (!starts_token || cursor >= attributes.size() || attributes[cursor] != '=') {
      pos += name.size();
      continue;
    }
    ++cursor;
    while (cursor < attributes.size() &&
           std::isspace(static_cast<unsigned char>(attributes[cursor])) != 0) {
      ++cursor;
    }
    if (cursor >= attributes.size()) {
      return {};
    }
    const char quote = attributes[cursor];
    if (quote != '"' && quote != '\'') {
      return {};
    }
    const std::size_t end = attributes.find(quote, cursor + 1);
    if (end == std::string::npos) {
      return {};
    }
    return DecodeXmlText(attributes.substr(cursor + 1, end - cursor - 1));
  }
  return {};
}

void AppendUtf8(std::uint32_t code_point, std::string* out) {
  if (code_point < 0x80U) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800U) {
    out->push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
    out->push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else if (code_point < 0x10000U) {
    out->push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
    out->push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else if (code_point <= 0x10FFFFU) {
    out->push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
    out->push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  }
}

/// 展开单个实体；`pos` 指向 `&`。无法识别时原样输出 `&`。
std::size_t DecodeEntity(const std::string& text, std::size_t pos, std::string* out) {
  const std::size_t semicolon = text.find(';', pos);
  if (semicolon == std::string::npos || semicolon - pos > 10) {
    out->push_back('&');
    return pos + 1;
  }
  const std::string name = text.substr(pos + 1, semicolon - pos - 1);
  if (name == "amp") {
    out->push_back('&');
  } else if (name == "lt") {
    out->push_back('<');
  } else if (name == "gt") {
    out->push_back('>');
  } else if (name == "quot") {
    out->push_back('"');
  } else if (name == "apos") {
    out->push_back('\'');
  } else if (name == "nbsp") {
    out->push_back(' ');
  } else if (name.size() > 1 && name[0] == '#') {
    const bool hex = name[1] == 'x' || name[1] == 'X';
    const std::string digits = name.substr(hex ? 2 : 1);
    if (digits.empty()) {
      out->push_back('&');
      return pos + 1;
    }
    std::uint32_t code_point = 0;
    for (const char ch : digits) {
      const int digit = std::isdigit(static_cast<unsigned char>(ch)) != 0
                            ? ch - '0'
                            : (hex && std::isxdigit(static_cast<unsigned char>(ch)) != 0
                                   ? std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10
                                   : -1);
      if (digit < 0 || code_point > 0x10FFFFU) {
        out->push_back('&');
        return pos + 1;
      }
      code_point = code_point * (hex ? 16U : 10U) + static_cast<std::uint32_t>(digit);
    }
    AppendUtf8(code_point, out);
  } else {
    out->push_back('&');
    return pos + 1;
  }
  return semicolon + 1;
}

/// 去除 HTML 标签（仅 `<` 后紧跟字母、`/` 或 `!` 时视为标签）。
std::string StripMarkup(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const char ch = text[pos];
    if (ch == '<' && pos + 1 < text.size() &&
        (std::isalpha(static_cast<unsigned char>(text[pos + 1])) != 0 ||
         text[pos + 1] == '/' || text[pos + 1] == '!')) {
      const std::size_t end = text.find('>', pos);
      if (end != std::string::npos) {
        out.push_back(' ');
        pos = end + 1;
        continue;
      }
    }
    out.push_back(ch);
    ++pos;
  }
  return out;
}

bool ParseDigits(const std::string& text, std::size_t pos, std::size_t count, int* out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char ch = text[pos + i];
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  *out = value;
  return true;
}

/// 公历日期到 epoch 天数（proleptic Gregorian）。
std::int64_t DaysFromCivil(int year, int month, int day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const std::int64_t yoe = year - era * 400;
  const std::int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

std::optional<std::int64_t> ComposeEpochMs(int year, int month, int day,
                                           int hour, int minute, int second,
                                           int offset_seconds) {
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return std::nullopt;
  }
  const std::int64_t seconds = DaysFromCivil(year, month, day) * 86400 +
                               hour * 3600 + minute * 60 + second - offset_seconds;
  return seconds * 1000;
}

int MonthFromName(const std::string& name) {
  static const char* kMonths[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                  "jul", "aug", "sep", "oct", "nov", "dec"};
  const std::string lowered = ToLowerCopy(name.substr(0, 3));
  for (int i = 0; i < 12; ++i) {
    if (lowered == kMonths[i]) {
      return i + 1;
    }
  }
  return 0;
}

bool ParseZoneOffset(const std::string& zone, int* out_seconds) {
  if (zone.empty() || zone == "GMT" || zone == "UT" || zone == "UTC" || zone == "Z") {
    *out_seconds = 0;
    return true;
  }
  static const struct {
    const char* name;
    int hours;
  } kNamedZones[] = {{"EST", -5}, {"EDT", -4}, {"CST", -6}, {"CDT", -5},
                     {"MST", -7}, {"MDT", -6}, {"PST", -8}, {"PDT", -7}};
  for (const auto& named : kNamedZones) {
    if (zone == named.name) {
      *out_seconds = named.hours * 3600;
      return true;
    }
  }
  if (zone[0] != '+' && zone[0] != '-') {
    return false;
  }
  std::string digits;
  for (std::size_t i = 1; i < zone.size(); ++i) {
    if (zone[i] != ':') {
      digits.push_back(zone[i]);
    }
  }
  int hours = 0;
  int minutes = 0;
  if (digits.size() != 4 || !ParseDigits(digits, 0, 2, &hours) ||
      !ParseDigits(digits, 2, 2, &minutes)) {
    return false;
  }
  const int total = hours * 3600 + minutes * 60;
  *out_seconds = zone[0] == '-' ? -total : total;
  return true;
}

bool ParseClock(const std::string& text, int* hour, int* minute, int* second) {
  *second = 0;
  if (!ParseDigits(text, 0, 2, hour) || text.size() < 5 || text[2] != ':' ||
      !ParseDigits(text, 3, 2, minute)) {
    return false;
  }
  if (text.size() >= 8 && text[5] == ':') {
    return ParseDigits(text, 6, 2, second);
  }
  return true;
}

std::optional<std::int64_t> ParseRfc822(const std::string& text) {
  std::string cleaned = text;
  const std::size_t comma = cleaned.find(',');
  if (comma != std::string::npos) {
    cleaned = cleaned.substr(comma + 1);
  }
  const std::vector<std::string> parts = SplitAndTrim(CollapseWhitespace(cleaned), ' ');
  if (parts.size() < 4) {
    return std::nullopt;
  }
  int day = 0;
  if (!ParseDigits(parts[0], 0, parts[0].size(), &day) || parts[0].size() > 2) {
    return std::nullopt;
  }
  const int month = MonthFromName(parts[1]);
  int year = 0;
  if (month == 0 || !ParseDigits(parts[2], 0, parts[2].size(), &year)) {
    return std::nullopt;
  }
  if (parts[2].size() == 2) {
    year += 2000;
  }
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!ParseClock(parts[3], &hour, &minute, &second)) {
    return std::nullopt;
  }
  int offset = 0;
  if (parts.size() >= 5 && !ParseZoneOffset(parts[4], &offset)) {
    return std::nullopt;
  }
  return ComposeEpochMs(year, month, day, hour, minute, second, offset);
}

std::optional<std::int64_t> ParseIso8601(const std::string& text) {
  int year = 0;
  int month = 0;
  int day = 0;
  if (!ParseDigits(text, 0, 4, &year) || text.size() < 10 || text[4] != '-' ||
      !ParseDigits(text, 5, 2, &month) || text[7] != '-' ||
      !ParseDigits(text, 8, 2, &day)) {
    return std::nullopt;
  }
  if (text.size() == 10) {
    return ComposeEpochMs(year, month, day, 0, 0, 0, 0);
  }
  if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') {
    return std::nullopt;
  }
  std::size_t pos = 11;
  std::size_t zone_pos = pos;
  while (zone_pos < text.size() && text[zone_pos] != 'Z' && text[zone_pos] != 'z' &&
         text[zone_pos] != '+' && text[zone_pos] != '-') {
    ++zone_pos;
  }
  std::string clock = text.substr(pos, zone_pos - pos);
  const std::size_t fraction = clock.find('.');
  if (fraction != std::string::npos) {
    clock = clock.substr(0, fraction);
  }
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!ParseClock(clock, &hour, &minute, &second)) {
    return std::nullopt;
  }
  int offset = 0;
  std::string zone = zone_pos < text.size() ? text.substr(zone_pos) : std::string();
  if (zone == "z") {
    zone = "Z";
  }
  if (!ParseZoneOffset(zone, &offset)) {
    return std::nullopt;
  }
  return ComposeEpochMs(year, month, day, hour, minute, second, offset);
}

/// 子元素文本；不存在返回空串。
std::string ChildText(const std::string& block, const std::string& tag) {
  XmlElement element;
  if (!NextElement(block, tag, 0, block.size(), &element)) {
    return {};
  }
  return DecodeXmlText(element.inner);
}

/// 条目链接：RSS 取文本，Atom 取 `rel` 缺省或为 alternate 的 `href`。
std::string EntryLink(const std::string& block) {
  std::string fallback;
  std::size_t pos = 0;
  XmlElement element;
  while (NextElement(block, "link", pos, block.size(), &element)) {
    pos = element.end_pos;
    const std::string text = DecodeXmlText(element.inner);
    if (!text.empty()) {
      return text;
    }
    const std::string href = AttributeValue(element.attributes, "href");
    if (href.empty()) {
      continue;
    }
    const std::string rel = AttributeValue(element.attributes, "rel");
    if (rel.empty() || rel == "alternate") {
      return href;
    }
    if (fallback.empty()) {
      fallback = href;
    }
  }
  return fallback;
}

std::string FirstNonEmpty(std::initializer_list<std::string> values) {
  for (const auto& value : values) {
    if (!value.empty()) {
      return value;
    }
  }
  return {};
}

}  // namespace

std::string DecodeXmlText(const std::string& raw) {
  std::string decoded;
  decoded.reserve(raw.size());
  std::size_t pos = 0;
  while (pos < raw.size()) {
    if (raw.compare(pos, 9, "<![CDATA[") == 0) {
      const std::size_t end = raw.find("]]>", pos + 9);
      const std::size_t stop = end == std::string::npos ? raw.size() : end;
      decoded.append(raw, pos + 9, stop - pos - 9);
      pos = end == std::string::npos ? raw.size() : end + 3;
      continue;
    }
    if (raw[pos] == '&') {
      pos = DecodeEntity(raw, pos, &decoded);
      continue;
    }
    decoded.push_back(raw[pos]);
    ++pos;
  }
  return CollapseWhitespace(StripMarkup(decoded));
}

std::optional<std::int64_t> ParseFeedTimestamp(const std::string& text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  if (std::isdigit(static_cast<unsigned char>(trimmed[0])) != 0 &&
      trimmed.size() >= 10 && trimmed[4] == '-') {
    return ParseIso8601(trimmed);
  }
  return ParseRfc822(trimmed);
}

bool ParseFeed(const std::string& xml,
               const std::string& source,
               int max_items,
               std::vector<NewsItem>* out_items,
               int* out_parse_errors,
               std::string* out_error) {
  if (out_items == nullptr || out_parse_errors == nullptr) {
    if (out_error != nullptr) {
      *out_error = "ParseFeed 输出参数为空";
    }
    return false;
  }
  out_items->clear();
  *out_parse_errors = 0;

  std::string item_tag;
  if (FindOpenTag(xml, "rss", 0, xml.size()) != std::string::npos ||
      FindOpenTag(xml, "rdf:RDF", 0, xml.size()) != std::string::npos) {
    item_tag = "item";
  } else if (FindOpenTag(xml, "feed", 0, xml.size()) != std::string::npos) {
    item_tag = "entry";
  } else {
    if (out_error != nullptr) {
      *out_error = "不是 RSS/Atom 文档: " + source;
    }
    return false;
  }

  std::size_t pos = 0;
  XmlElement element;
  while (NextElement(xml, item_tag, pos, xml.size(), &element)) {
    pos = element.end_pos;
    if (max_items > 0 && static_cast<int>(out_items->size()) >= max_items) {
      break;
    }
    const std::string& block = element.inner;

    NewsItem item;
    item.source = source;
    item.title = ChildText(block, "title");
    item.link = EntryLink(block);
    item.summary = FirstNonEmpty({ChildText(block, "description"),
                                  ChildText(block, "summary"),
                                  ChildText(block, "content")});
    const std::string guid = FirstNonEmpty({ChildText(block, "guid"),
                                            ChildText(block, "id")});
    const std::string published = FirstNonEmpty({ChildText(block, "pubDate"),
                                                 ChildText(block, "published"),
                                                 ChildText(block, "updated"),
                                                 ChildText(block, "dc:date")});
    if (item.title.empty() && item.link.empty()) {
      ++(*out_parse_errors);
      continue;
    }
    if (item.title.empty()) {
      item.title = item.link;
    }
    if (!published.empty()) {
      item.published_at_ms = ParseFeedTimestamp(published);
    }

    std::string digest_error;
    const std::string identity = FirstNonEmpty({guid, item.link, item.title});
    if (!Sha256Hex(identity, &item.item_id, &digest_error)) {
      if (out_error != nullptr) {
        *out_error = "条目摘要失败: " + digest_error;
      }
      return false;
    }
    out_items->push_back(std::move(item));
  }
  return true;
}

}  // namespace pm_sentinel
