#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/types.h"

namespace pm_sentinel {

/// 相似度函数：对称，取值 [0,1]。
using SimilarityFunction = std::function<double(const Market&, const Market&)>;

struct MatchOptions {
  double similarity_floor{0.45};
  /// 为空时使用 `TitleSimilarity(match_title, match_title)`；测试可注入。
  SimilarityFunction similarity;
};

/**
 * @brief 标题相似度
 *
 * 输入为已归一化标题。去停用词并做轻量词干（去复数 `s`）后：
 * `0.6 * Dice(词集合) + 0.4 * Dice(字符二元组多重集)`，
 * 二元组取自排序去重后以空格连接的词串，词序不影响结果。
 */
double TitleSimilarity(const std::string& left_normalized,
                       const std::string& right_normalized);

/// 匹配用词元：去停用词、去复数后排序去重。
std::vector<std::string> MatchTokens(const std::string& normalized);

/**
 * @brief 跨平台市场配对
 *
 * 1. 两侧类别均由关键词规则判定且不同的组合不参与比较；
 * 2. 相似度低于 `similarity_floor` 的候选丢弃；
 * 3. 候选按相似度降序、poly id 升序、kalshi id 升序排序后贪心选取，
 *    每个市场至多出现在一个配对中。
 *
 * 结果与输入顺序无关；返回的指针引用输入向量中的元素。
 */
std::vector<MatchedPair> MatchMarkets(const std::vector<Market>& poly_markets,
                                      const std::vector<Market>& kalshi_markets,
                                      const MatchOptions& options);

}  // namespace pm_sentinel
