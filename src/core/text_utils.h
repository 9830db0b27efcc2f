#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace pm_sentinel {

/// 去除首尾 ASCII 空白。
std::string Trim(const std::string& text);
/// ASCII 小写副本（UTF-8 多字节序列原样保留）。
std::string ToLowerCopy(const std::string& text);
/// 折叠连续空白为单个空格并去除首尾空白。
std::string CollapseWhitespace(const std::string& text);

/**
 * @brief 标题归一化（用于匹配与关键词检索）
 *
 * 1. ASCII 非字母数字字符统一替换为空格（消除标点差异）；
 * 2. 转小写；
 * 3. 折叠空白。
 * UTF-8 多字节字符保留，非拉丁标题仍可参与比较。
 */
std::string NormalizeTitle(const std::string& text);

/// 按分隔符切分并去除每段首尾空白，丢弃空段。
std::vector<std::string> SplitAndTrim(const std::string& text, char delimiter);

/// 按空格切分已归一化文本。
std::vector<std::string> SplitWords(const std::string& normalized);

/**
 * @brief 词边界短语检索
 *
 * 两个参数都应先经过 `NormalizeTitle`；`phrase` 必须作为完整词序列出现，
 * 例如 `fed` 不会命中 `federal`。
 */
bool ContainsPhrase(const std::string& normalized_text,
                    const std::string& normalized_phrase);

/**
 * @brief 关键词规则归类
 *
 * 对已归一化文本逐条规则做词边界检索，`out_matched` 返回全部命中关键词
 * （去重，按规则与关键词配置顺序）。返回命中关键词最多的规则类别，
 * 并列时取配置中靠前者；无命中返回空串。
 */
std::string MatchKeywordRules(const std::string& normalized_text,
                              const std::vector<KeywordRule>& rules,
                              std::vector<std::string>* out_matched);

/// 计算 SHA-256 并输出小写十六进制（OpenSSL EVP）。
bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error);

}  // namespace pm_sentinel
