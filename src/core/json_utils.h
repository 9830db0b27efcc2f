#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pm_sentinel {

/// 轻量 JSON AST 节点类型，覆盖项目当前使用到的 JSON 子集。
enum class JsonType {
  kNull,
  kBool,
  kNumber,
  kString,
  kArray,
  kObject,
};

/// 轻量 JSON 值表示（对象/数组为递归结构）。
struct JsonValue {
  JsonType type{JsonType::kNull};
  bool bool_value{false};
  double number_value{0.0};
  std::string string_value;
  std::vector<JsonValue> array_value;
  std::unordered_map<std::string, JsonValue> object_value;
};

/**
 * @brief JSON 解析入口
 *
 * `\uXXXX` 转义（含代理对）按 UTF-8 写出。
 *
 * @param text 原始 JSON 文本
 * @param out_value 解析结果
 * @param out_error 失败原因（可选输出）
 * @return true 解析成功
 * @return false 解析失败
 */
bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error);

/**
 * @brief JSON 序列化
 *
 * 对象键按字典序输出，保证同一状态序列化结果逐字节稳定；
 * `indent > 0` 时按该缩进美化输出。
 */
std::string SerializeJson(const JsonValue& value, int indent = 0);

/// 字符串转义为 JSON 字面量（含两侧引号）。
std::string JsonQuote(const std::string& text);

/// 构造工具：减少调用方手写 AST 的样板代码。
JsonValue MakeJsonNull();
JsonValue MakeJsonBool(bool value);
JsonValue MakeJsonNumber(double value);
JsonValue MakeJsonString(std::string value);
JsonValue MakeJsonArray();
JsonValue MakeJsonObject();

/**
 * @brief 获取对象字段
 *
 * 仅做类型与边界检查，不抛异常；字段不存在返回 `nullptr`。
 */
const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key);

/**
 * @brief 获取数组元素
 *
 * 仅做类型与边界检查，不抛异常；越界返回 `nullptr`。
 */
const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index);

/**
 * @brief 按对象路径查找子节点
 *
 * `object_path` 中每一段都按对象字段访问；任意一段缺失返回 `nullptr`。
 */
const JsonValue* JsonFindPath(const JsonValue* value,
                              const std::vector<std::string>& object_path);

/// 尝试将节点解释为字符串；失败返回 `std::nullopt`。
std::optional<std::string> JsonAsString(const JsonValue* value);
/// 尝试将节点解释为数值；失败返回 `std::nullopt`。
std::optional<double> JsonAsNumber(const JsonValue* value);
/// 尝试将节点解释为整数（数值需为整数且在 int64 范围内）。
std::optional<std::int64_t> JsonAsInt64(const JsonValue* value);
/// 尝试将节点解释为布尔值；失败返回 `std::nullopt`。
std::optional<bool> JsonAsBool(const JsonValue* value);

}  // namespace pm_sentinel
