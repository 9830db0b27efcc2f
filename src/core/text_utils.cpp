#include "core/text_utils.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace pm_sentinel {

namespace {

std::string BytesToHex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    const unsigned char v = bytes[i];
    out[i * 2U] = kHex[(v >> 4U) & 0x0FU];
    out[i * 2U + 1U] = kHex[v & 0x0FU];
  }
  return out;
}

bool IsAsciiSpace(char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  return byte < 0x80U && std::isspace(byte) != 0;
}

}  // namespace

std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() && IsAsciiSpace(text[begin])) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin && IsAsciiSpace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string ToLowerCopy(const std::string& text) {
  std::string lowered = text;
  for (char& ch : lowered) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x80U) {
      ch = static_cast<char>(std::tolower(byte));
    }
  }
  return lowered;
}

std::string CollapseWhitespace(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char ch : text) {
    if (IsAsciiSpace(ch)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(ch);
  }
  return out;
}

std::string NormalizeTitle(const std::string& text) {
  std::string replaced;
  replaced.reserve(text.size());
  for (const char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte >= 0x80U) {
      replaced.push_back(ch);
      continue;
    }
    if (std::isalnum(byte) != 0) {
      replaced.push_back(static_cast<char>(std::tolower(byte)));
      continue;
    }
    // `'` 直接删除，使 "fed's" 与 "feds" 一致。
    if (ch == '\'') {
      continue;
    }
    replaced.push_back(' ');
  }
  return CollapseWhitespace(replaced);
}

std::vector<std::string> SplitAndTrim(const std::string& text, char delimiter) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream iss(text);
  while (std::getline(iss, current, delimiter)) {
    const std::string item = Trim(current);
    if (!item.empty()) {
      parts.push_back(item);
    }
  }
  return parts;
}

std::vector<std::string> SplitWords(const std::string& normalized) {
  return SplitAndTrim(normalized, ' ');
}

bool ContainsPhrase(const std::string& normalized_text,
                    const std::string& normalized_phrase) {
  if (normalized_phrase.empty()) {
    return false;
  }
  const std::string haystack = " " + normalized_text + " ";
  const std::string needle = " " + normalized_phrase + " ";
  return haystack.find(needle) != std::string::npos;
}

std::string MatchKeywordRules(const std::string& normalized_text,
                              const std::vector<KeywordRule>& rules,
                              std::vector<std::string>* out_matched) {
  std::string best_category;
  std::size_t best_hits = 0;
  for (const auto& rule : rules) {
    std::size_t hits = 0;
    for (const auto& keyword : rule.keywords) {
      const std::string phrase = NormalizeTitle(keyword);
      if (phrase.empty() || !ContainsPhrase(normalized_text, phrase)) {
        continue;
      }
      ++hits;
      if (out_matched != nullptr &&
          std::find(out_matched->begin(), out_matched->end(), keyword) ==
              out_matched->end()) {
        out_matched->push_back(keyword);
      }
    }
    if (hits > best_hits) {
      best_hits = hits;
      best_category = rule.category;
    }
  }
  return best_category;
}

bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error) {
  if (out_hex == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_hex 为空";
    }
    return false;
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                               &EVP_MD_CTX_free);
  if (ctx == nullptr) {
    if (out_error != nullptr) {
      *out_error = "EVP_MD_CTX_new 失败";
    }
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1 ||
      digest_len == 0U) {
    if (out_error != nullptr) {
      *out_error = "OpenSSL SHA-256 计算失败";
    }
    return false;
  }
  *out_hex = BytesToHex(digest, digest_len);
  return true;
}

}  // namespace pm_sentinel
