#include "core/json_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <limits>
#include <sstream>

namespace pm_sentinel {

namespace {

void AppendUtf8(unsigned int codepoint, std::string* out) {
  if (codepoint <= 0x7F) {
    out->push_back(static_cast<char>(codepoint));
  } else if (codepoint <= 0x7FF) {
    out->push_back(static_cast<char>(0xC0 | (codepoint >> 6U)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  } else if (codepoint <= 0xFFFF) {
    out->push_back(static_cast<char>(0xE0 | (codepoint >> 12U)));
    out->push_back(static_cast<char>(0x80 | ((codepoint >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (codepoint >> 18U)));
    out->push_back(static_cast<char>(0x80 | ((codepoint >> 12U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80 | ((codepoint >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  }
}

class JsonParser {
 public:
  explicit JsonParser(const std::string& text) : text_(text) {}

  bool Parse(JsonValue* out_value, std::string* out_error) {
    if (out_value == nullptr) {
      if (out_error != nullptr) {
        *out_error = "out_value 为空";
      }
      return false;
    }
    SkipWhitespace();
    if (!ParseValue(out_value, out_error, 0)) {
      return false;
    }
    SkipWhitespace();
    if (cursor_ != text_.size()) {
      if (out_error != nullptr) {
        *out_error = "JSON 尾部存在多余字符";
      }
      return false;
    }
    return true;
  }

 private:
  // 限制嵌套深度，避免恶意负载导致栈溢出。
  static constexpr int kMaxDepth = 128;

  bool ParseValue(JsonValue* out_value, std::string* out_error, int depth) {
    if (depth > kMaxDepth) {
      return Fail("JSON 嵌套层级过深", out_error);
    }
    if (cursor_ >= text_.size()) {
      return Fail("JSON 意外结束", out_error);
    }
    const char ch = text_[cursor_];
    if (ch == '{') {
      return ParseObject(out_value, out_error, depth);
    }
    if (ch == '[') {
      return ParseArray(out_value, out_error, depth);
    }
    if (ch == '"') {
      out_value->type = JsonType::kString;
      return ParseString(&out_value->string_value, out_error);
    }
    if (ch == 't' || ch == 'f') {
      out_value->type = JsonType::kBool;
      return ParseBool(&out_value->bool_value, out_error);
    }
    if (ch == 'n') {
      out_value->type = JsonType::kNull;
      return ParseNull(out_error);
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      out_value->type = JsonType::kNumber;
      return ParseNumber(&out_value->number_value, out_error);
    }
    return Fail("JSON 非法值起始字符", out_error);
  }

  bool ParseObject(JsonValue* out_value, std::string* out_error, int depth) {
    if (!Expect('{', out_error)) {
      return false;
    }
    out_value->type = JsonType::kObject;
    out_value->object_value.clear();

    SkipWhitespace();
    if (ConsumeIf('}')) {
      return true;
    }

    while (cursor_ < text_.size()) {
      std::string key;
      if (!ParseString(&key, out_error)) {
        return false;
      }
      SkipWhitespace();
      if (!Expect(':', out_error)) {
        return false;
      }
      SkipWhitespace();

      JsonValue value;
      if (!ParseValue(&value, out_error, depth + 1)) {
        return false;
      }
      out_value->object_value[key] = std::move(value);

      SkipWhitespace();
      if (ConsumeIf('}')) {
        return true;
      }
      if (!Expect(',', out_error)) {
        return false;
      }
      SkipWhitespace();
    }
    return Fail("JSON 对象缺少结束符", out_error);
  }

  bool ParseArray(JsonValue* out_value, std::string* out_error, int depth) {
    if (!Expect('[', out_error)) {
      return false;
    }
    out_value->type = JsonType::kArray;
    out_value->array_value.clear();

    SkipWhitespace();
    if (ConsumeIf(']')) {
      return true;
    }

    while (cursor_ < text_.size()) {
      JsonValue item;
      if (!ParseValue(&item, out_error, depth + 1)) {
        return false;
      }
      out_value->array_value.push_back(std::move(item));

      SkipWhitespace();
      if (ConsumeIf(']')) {
        return true;
      }
      if (!Expect(',', out_error)) {
        return false;
      }
      SkipWhitespace();
    }
    return Fail("JSON 数组缺少结束符", out_error);
  }

  bool ParseHex4(unsigned int* out_codepoint, std::string* out_error) {
    if (cursor_ + 4 > text_.size()) {
      return Fail("JSON unicode 转义不完整", out_error);
    }
    unsigned int codepoint = 0;
    for (int i = 0; i < 4; ++i) {
      const char hex = text_[cursor_++];
      codepoint <<= 4U;
      if (hex >= '0' && hex <= '9') {
        codepoint += static_cast<unsigned int>(hex - '0');
      } else if (hex >= 'a' && hex <= 'f') {
        codepoint += static_cast<unsigned int>(hex - 'a' + 10);
      } else if (hex >= 'A' && hex <= 'F') {
        codepoint += static_cast<unsigned int>(hex - 'A' + 10);
      } else {
        return Fail("JSON unicode 转义非法", out_error);
      }
    }
    *out_codepoint = codepoint;
    return true;
  }

  bool ParseString(std::string* out, std::string* out_error) {
    if (out == nullptr) {
      return Fail("ParseString 输出为空", out_error);
    }
    if (!Expect('"', out_error)) {
      return false;
    }
    out->clear();
    while (cursor_ < text_.size()) {
      const char ch = text_[cursor_++];
      if (ch == '"') {
        return true;
      }
      if (ch == '\\') {
        if (cursor_ >= text_.size()) {
          return Fail("JSON 字符串转义不完整", out_error);
        }
        const char esc = text_[cursor_++];
        switch (esc) {
          case '"':
          case '\\':
          case '/':
            out->push_back(esc);
            break;
          case 'b':
            out->push_back('\b');
            break;
          case 'f':
            out->push_back('\f');
            break;
          case 'n':
            out->push_back('\n');
            break;
          case 'r':
            out->push_back('\r');
            break;
          case 't':
            out->push_back('\t');
            break;
          case 'u': {
            unsigned int codepoint = 0;
            if (!ParseHex4(&codepoint, out_error)) {
              return false;
            }
            // 高代理项必须紧跟 `\uDC00-\uDFFF` 低代理项。
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
              if (cursor_ + 2 > text_.size() || text_[cursor_] != '\\' ||
                  text_[cursor_ + 1] != 'u') {
                return Fail("JSON 代理对不完整", out_error);
              }
              cursor_ += 2;
              unsigned int low = 0;
              if (!ParseHex4(&low, out_error)) {
                return false;
              }
              if (low < 0xDC00 || low > 0xDFFF) {
                return Fail("JSON 低代理项非法", out_error);
              }
              codepoint = 0x10000 + ((codepoint - 0xD800) << 10U) + (low - 0xDC00);
            } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
              return Fail("JSON 孤立低代理项", out_error);
            }
            AppendUtf8(codepoint, out);
            break;
          }
          default:
            return Fail("JSON 字符串转义字符非法", out_error);
        }
        continue;
      }
      out->push_back(ch);
    }
    return Fail("JSON 字符串缺少结束引号", out_error);
  }

  bool ParseBool(bool* out_value, std::string* out_error) {
    if (MatchLiteral("true")) {
      *out_value = true;
      return true;
    }
    if (MatchLiteral("false")) {
      *out_value = false;
      return true;
    }
    return Fail("JSON 布尔值解析失败", out_error);
  }

  bool ParseNull(std::string* out_error) {
    if (MatchLiteral("null")) {
      return true;
    }
    return Fail("JSON null 解析失败", out_error);
  }

  bool ParseNumber(double* out_value, std::string* out_error) {
    const std::size_t begin = cursor_;
    ConsumeIf('-');
    if (!ConsumeDigits()) {
      return Fail("JSON 数字解析失败", out_error);
    }
    if (ConsumeIf('.')) {
      if (!ConsumeDigits()) {
        return Fail("JSON 小数解析失败", out_error);
      }
    }
    if (ConsumeIf('e') || ConsumeIf('E')) {
      if (!ConsumeIf('+')) {
        ConsumeIf('-');
      }
      if (!ConsumeDigits()) {
        return Fail("JSON 指数解析失败", out_error);
      }
    }
    const std::string raw = text_.substr(begin, cursor_ - begin);
    try {
      *out_value = std::stod(raw);
      return true;
    } catch (const std::exception&) {
      return Fail("JSON 数字转换失败", out_error);
    }
  }

  bool ConsumeDigits() {
    const std::size_t begin = cursor_;
    while (cursor_ < text_.size() &&
           std::isdigit(static_cast<unsigned char>(text_[cursor_])) != 0) {
      ++cursor_;
    }
    return cursor_ > begin;
  }

  bool MatchLiteral(const char* literal) {
    const std::size_t len = std::char_traits<char>::length(literal);
    if (cursor_ + len > text_.size()) {
      return false;
    }
    if (text_.compare(cursor_, len, literal) != 0) {
      return false;
    }
    cursor_ += len;
    return true;
  }

  bool Expect(char ch, std::string* out_error) {
    if (cursor_ >= text_.size() || text_[cursor_] != ch) {
      std::ostringstream oss;
      oss << "JSON 期望字符 '" << ch << "'";
      return Fail(oss.str(), out_error);
    }
    ++cursor_;
    return true;
  }

  bool ConsumeIf(char ch) {
    if (cursor_ < text_.size() && text_[cursor_] == ch) {
      ++cursor_;
      return true;
    }
    return false;
  }

  void SkipWhitespace() {
    while (cursor_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[cursor_])) != 0) {
      ++cursor_;
    }
  }

  bool Fail(const std::string& message, std::string* out_error) const {
    if (out_error != nullptr) {
      *out_error = message + "，offset=" + std::to_string(cursor_);
    }
    return false;
  }

  const std::string& text_;
  std::size_t cursor_{0};
};

std::string FormatNumber(double value) {
  if (!std::isfinite(value)) {
    // JSON 不支持 NaN/Inf，统一落为 null。
    return "null";
  }
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%.15g", value);
  // 15 位有效数字无法无损往返时退回 17 位。
  if (std::strtod(buffer, nullptr) != value) {
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  }
  return buffer;
}

void AppendNewline(int indent, int depth, std::string* out) {
  if (indent <= 0) {
    return;
  }
  out->push_back('\n');
  out->append(static_cast<std::size_t>(indent * depth), ' ');
}

void SerializeInto(const JsonValue& value, int indent, int depth, std::string* out) {
  switch (value.type) {
    case JsonType::kNull:
      out->append("null");
      return;
    case JsonType::kBool:
      out->append(value.bool_value ? "true" : "false");
      return;
    case JsonType::kNumber:
      out->append(FormatNumber(value.number_value));
      return;
    case JsonType::kString:
      out->append(JsonQuote(value.string_value));
      return;
    case JsonType::kArray: {
      if (value.array_value.empty()) {
        out->append("[]");
        return;
      }
      out->push_back('[');
      for (std::size_t i = 0; i < value.array_value.size(); ++i) {
        if (i > 0U) {
          out->push_back(',');
        }
        AppendNewline(indent, depth + 1, out);
        SerializeInto(value.array_value[i], indent, depth + 1, out);
      }
      AppendNewline(indent, depth, out);
      out->push_back(']');
      return;
    }
    case JsonType::kObject: {
      if (value.object_value.empty()) {
        out->append("{}");
        return;
      }
      std::vector<const std::string*> keys;
      keys.reserve(value.object_value.size());
      for (const auto& [key, unused] : value.object_value) {
        (void)unused;
        keys.push_back(&key);
      }
      std::sort(keys.begin(), keys.end(),
                [](const std::string* lhs, const std::string* rhs) {
                  return *lhs < *rhs;
                });
      out->push_back('{');
      for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0U) {
          out->push_back(',');
        }
        AppendNewline(indent, depth + 1, out);
        out->append(JsonQuote(*keys[i]));
        out->append(indent > 0 ? ": " : ":");
        SerializeInto(value.object_value.at(*keys[i]), indent, depth + 1, out);
      }
      AppendNewline(indent, depth, out);
      out->push_back('}');
      return;
    }
  }
}

}  // namespace

bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error) {
  JsonParser parser(text);
  return parser.Parse(out_value, out_error);
}

std::string SerializeJson(const JsonValue& value, int indent) {
  std::string out;
  SerializeInto(value, indent, 0, &out);
  return out;
}

std::string JsonQuote(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2U);
  out.push_back('"');
  for (const char ch : text) {
    switch (ch) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20U) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(buffer);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
  out.push_back('"');
  return out;
}

JsonValue MakeJsonNull() {
  return JsonValue{};
}

JsonValue MakeJsonBool(bool value) {
  JsonValue out;
  out.type = JsonType::kBool;
  out.bool_value = value;
  return out;
}

JsonValue MakeJsonNumber(double value) {
  JsonValue out;
  out.type = JsonType::kNumber;
  out.number_value = value;
  return out;
}

JsonValue MakeJsonString(std::string value) {
  JsonValue out;
  out.type = JsonType::kString;
  out.string_value = std::move(value);
  return out;
}

JsonValue MakeJsonArray() {
  JsonValue out;
  out.type = JsonType::kArray;
  return out;
}

JsonValue MakeJsonObject() {
  JsonValue out;
  out.type = JsonType::kObject;
  return out;
}

const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key) {
  if (value == nullptr || value->type != JsonType::kObject) {
    return nullptr;
  }
  const auto it = value->object_value.find(key);
  if (it == value->object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index) {
  if (value == nullptr || value->type != JsonType::kArray) {
    return nullptr;
  }
  if (index >= value->array_value.size()) {
    return nullptr;
  }
  return &value->array_value[index];
}

const JsonValue* JsonFindPath(const JsonValue* value,
                              const std::vector<std::string>& object_path) {
  const JsonValue* cursor = value;
  for (const auto& key : object_path) {
    cursor = JsonObjectField(cursor, key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

std::optional<std::string> JsonAsString(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kString) {
    return value->string_value;
  }
  if (value->type == JsonType::kNumber) {
    // 数值型 id（如 `"id": 12345`）按整数文本输出，避免 `12345.000000`。
    return FormatNumber(value->number_value);
  }
  if (value->type == JsonType::kBool) {
    return value->bool_value ? "true" : "false";
  }
  return std::nullopt;
}

std::optional<double> JsonAsNumber(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kNumber) {
    return value->number_value;
  }
  if (value->type == JsonType::kString) {
    try {
      std::size_t consumed = 0;
      const double parsed = std::stod(value->string_value, &consumed);
      if (consumed != value->string_value.size()) {
        return std::nullopt;
      }
      return parsed;
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<std::int64_t> JsonAsInt64(const JsonValue* value) {
  const auto number = JsonAsNumber(value);
  if (!number.has_value() || !std::isfinite(*number)) {
    return std::nullopt;
  }
  if (std::trunc(*number) != *number ||
      std::fabs(*number) > 9007199254740992.0) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(*number);
}

std::optional<bool> JsonAsBool(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kBool) {
    return value->bool_value;
  }
  if (value->type == JsonType::kString) {
    if (value->string_value == "true") {
      return true;
    }
    if (value->string_value == "false") {
      return false;
    }
  }
  return std::nullopt;
}

}  // namespace pm_sentinel
