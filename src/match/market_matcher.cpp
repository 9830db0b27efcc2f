#include "match/market_matcher.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <unordered_set>

#include "core/text_utils.h"

namespace pm_sentinel {

namespace {

constexpr double kTokenWeight = 0.6;
constexpr double kBigramWeight = 0.4;

bool IsStopWord(const std::string& token) {
  static const std::unordered_set<std::string> kStopWords = {
      "a",    "an",  "the",  "will", "be",   "is",     "are",   "was",
      "of",   "in",  "on",   "at",   "by",   "to",     "for",   "from",
      "with", "and", "or",   "as",   "it",   "its",    "this",  "that",
      "than", "do",  "does", "did",  "who",  "what",   "which", "before",
      "after", "end", "any", "there", "between",
  };
  return kStopWords.count(token) > 0;
}

std::string Stem(const std::string& token) {
  if (token.size() > 3 && token.back() == 's' && token[token.size() - 2] != 's') {
    return token.substr(0, token.size() - 1);
  }
  return token;
}

struct TitleProfile {
  std::vector<std::string> tokens;          ///< 排序去重。
  std::map<std::string, int> bigrams;       ///< 二元组 -> 出现次数。
  int bigram_total{0};
};

TitleProfile BuildProfile(const std::string& normalized) {
  TitleProfile profile;
  profile.tokens = MatchTokens(normalized);
  std::string joined;
  for (const auto& token : profile.tokens) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += token;
  }
  for (std::size_t i = 0; i + 1 < joined.size(); ++i) {
    ++profile.bigrams[joined.substr(i, 2)];
    ++profile.bigram_total;
  }
  return profile;
}

double ProfileSimilarity(const TitleProfile& left, const TitleProfile& right) {
  if (left.tokens.empty() || right.tokens.empty()) {
    return 0.0;
  }
  std::vector<std::string> common;
  std::set_intersection(left.tokens.begin(), left.tokens.end(),
                        right.tokens.begin(), right.tokens.end(),
                        std::back_inserter(common));
  const double token_dice = 2.0 * static_cast<double>(common.size()) /
                            static_cast<double>(left.tokens.size() + right.tokens.size());

  double bigram_dice = 0.0;
  if (left.bigram_total > 0 && right.bigram_total > 0) {
    int shared = 0;
    for (const auto& [bigram, count] : left.bigrams) {
      const auto it = right.bigrams.find(bigram);
      if (it != right.bigrams.end()) {
        shared += std::min(count, it->second);
      }
    }
    bigram_dice = 2.0 * shared / static_cast<double>(left.bigram_total + right.bigram_total);
  }
  const double score = kTokenWeight * token_dice + kBigramWeight * bigram_dice;
  return std::clamp(score, 0.0, 1.0);
}

struct Candidate {
  std::size_t poly_index{0};
  std::size_t kalshi_index{0};
  double similarity{0.0};
};

}  // namespace

std::vector<std::string> MatchTokens(const std::string& normalized) {
  std::vector<std::string> tokens;
  for (const auto& word : SplitWords(normalized)) {
    if (IsStopWord(word)) {
      continue;
    }
    tokens.push_back(Stem(word));
  }
  std::sort(tokens.begin(), tokens.end());
  tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
  return tokens;
}

double TitleSimilarity(const std::string& left_normalized,
                       const std::string& right_normalized) {
  return ProfileSimilarity(BuildProfile(left_normalized),
                           BuildProfile(right_normalized));
}

std::vector<MatchedPair> MatchMarkets(const std::vector<Market>& poly_markets,
                                      const std::vector<Market>& kalshi_markets,
                                      const MatchOptions& options) {
  std::vector<TitleProfile> poly_profiles;
  std::vector<TitleProfile> kalshi_profiles;
  if (!options.similarity) {
    poly_profiles.reserve(poly_markets.size());
    for (const auto& market : poly_markets) {
      poly_profiles.push_back(BuildProfile(market.match_title));
    }
    kalshi_profiles.reserve(kalshi_markets.size());
    for (const auto& market : kalshi_markets) {
      kalshi_profiles.push_back(BuildProfile(market.match_title));
    }
  }

  std::vector<Candidate> candidates;
  for (std::size_t i = 0; i < poly_markets.size(); ++i) {
    const Market& poly = poly_markets[i];
    for (std::size_t j = 0; j < kalshi_markets.size(); ++j) {
      const Market& kalshi = kalshi_markets[j];
      // 仅比较规则判定的类别；平台自报类别命名不统一，不作为排除依据。
      if (poly.category_inferred && kalshi.category_inferred &&
          poly.category != kalshi.category) {
        continue;
      }
      const double similarity = options.similarity
                                    ? options.similarity(poly, kalshi)
                                    : ProfileSimilarity(poly_profiles[i], kalshi_profiles[j]);
      if (similarity < options.similarity_floor) {
        continue;
      }
      candidates.push_back(Candidate{i, j, similarity});
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [&](const Candidate& lhs, const Candidate& rhs) {
              if (lhs.similarity != rhs.similarity) {
                return lhs.similarity > rhs.similarity;
              }
              const std::string& lhs_poly = poly_markets[lhs.poly_index].external_id;
              const std::string& rhs_poly = poly_markets[rhs.poly_index].external_id;
              if (lhs_poly != rhs_poly) {
                return lhs_poly < rhs_poly;
              }
              return kalshi_markets[lhs.kalshi_index].external_id <
                     kalshi_markets[rhs.kalshi_index].external_id;
            });

  std::vector<bool> poly_taken(poly_markets.size(), false);
  std::vector<bool> kalshi_taken(kalshi_markets.size(), false);
  std::vector<MatchedPair> pairs;
  for (const auto& candidate : candidates) {
    if (poly_taken[candidate.poly_index] || kalshi_taken[candidate.kalshi_index]) {
      continue;
    }
    poly_taken[candidate.poly_index] = true;
    kalshi_taken[candidate.kalshi_index] = true;
    pairs.push_back(MatchedPair{&poly_markets[candidate.poly_index],
                                &kalshi_markets[candidate.kalshi_index],
                                candidate.similarity});
  }
  return pairs;
}

}  // namespace pm_sentinel
