#include "notify/telegram_channel.h"

#include <chrono>
#include <thread>
#include <utility>

#include "core/json_utils.h"
#include "core/log.h"

namespace pm_sentinel {

namespace {

bool SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

/// 回退到 UTF-8 字符起始字节，避免切断多字节序列。
std::size_t Utf8Boundary(const std::string& text, std::size_t pos) {
  while (pos > 0 && pos < text.size() &&
         (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
    --pos;
  }
  return pos;
}

std::string TelegramDescription(const JsonValue& root) {
  return JsonAsString(JsonObjectField(&root, "description")).value_or("");
}

}  // namespace

std::vector<std::string> SplitMessage(const std::string& text, std::size_t max_bytes) {
  std::vector<std::string> parts;
  if (max_bytes == 0 || text.size() <= max_bytes) {
    parts.push_back(text);
    return parts;
  }

  std::string current;
  auto flush = [&]() {
    if (!current.empty()) {
      parts.push_back(current);
      current.clear();
    }
  };

  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(start, end - start);
    start = end + 1;

    while (line.size() > max_bytes) {
      flush();
      std::size_t cut = Utf8Boundary(line, max_bytes);
      if (cut == 0) {
        cut = max_bytes;
      }
      parts.push_back(line.substr(0, cut));
      line.erase(0, cut);
    }
    const std::size_t needed = current.empty() ? line.size() : current.size() + 1 + line.size();
    if (needed > max_bytes) {
      flush();
    }
    if (!current.empty()) {
      current.push_back('\n');
    }
    current += line;
    if (end == text.size()) {
      break;
    }
  }
  flush();
  return parts;
}

TelegramChannel::TelegramChannel(TelegramConfig config,
                                 std::unique_ptr<HttpTransport> transport,
                                 SleepFunction sleeper)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      sleeper_(std::move(sleeper)) {
  if (transport_ == nullptr) {
    transport_ = std::make_unique<CurlHttpTransport>();
  }
  if (!sleeper_) {
    sleeper_ = [](int seconds) {
      std::this_thread::sleep_for(std::chrono::seconds(seconds));
    };
  }
}

bool TelegramChannel::Send(const std::string& chat_target,
                           const std::string& text,
                           std::string* out_error) {
  if (config_.bot_token.empty()) {
    return SetError(out_error, "TELEGRAM_BOT_TOKEN 未配置");
  }
  if (chat_target.empty()) {
    return SetError(out_error, "telegram chat_id 未配置");
  }
  const auto parts = SplitMessage(text, kTelegramMaxMessageBytes);
  for (std::size_t i = 0; i < parts.size(); ++i) {
    std::string error;
    if (!SendPart(chat_target, parts[i], &error)) {
      return SetError(out_error, "第 " + std::to_string(i + 1) + "/" +
                                     std::to_string(parts.size()) + " 段发送失败: " + error);
    }
  }
  return true;
}

bool TelegramChannel::SendPart(const std::string& chat_target,
                               const std::string& text,
                               std::string* out_error) {
  JsonValue body = MakeJsonObject();
  body.object_value["chat_id"] = MakeJsonString(chat_target);
  body.object_value["text"] = MakeJsonString(text);
  body.object_value["parse_mode"] = MakeJsonString("HTML");
  body.object_value["disable_web_page_preview"] = MakeJsonBool(true);
  const std::string payload = SerializeJson(body);
  const std::string url = api_base_url_ + "/bot" + config_.bot_token + "/sendMessage";
  const HttpHeaders headers{{"Content-Type", "application/json"}};

  bool retried = false;
  while (true) {
    const HttpResponse response = transport_->Send("POST", url, headers, payload);
    if (!response.error.empty()) {
      return SetError(out_error, response.error);
    }

    JsonValue root;
    std::string parse_error;
    const bool parsed = ParseJson(response.body, &root, &parse_error);
    if (IsHttpSuccess(response.status_code) && parsed &&
        JsonAsBool(JsonObjectField(&root, "ok")).value_or(false)) {
      return true;
    }

    if (response.status_code == 429 && parsed && !retried) {
      const auto retry_after =
          JsonAsInt64(JsonFindPath(&root, {"parameters", "retry_after"}));
      const std::int64_t wait_seconds = retry_after.value_or(1);
      if (wait_seconds <= config_.max_retry_after_seconds) {
        LogInfo("TELEGRAM_RATE_LIMITED: retry_after=" + std::to_string(wait_seconds));
        sleeper_(static_cast<int>(wait_seconds));
        retried = true;
        continue;
      }
      return SetError(out_error, "HTTP 429 retry_after=" + std::to_string(wait_seconds) +
                                     " 超过上限");
    }

    std::string detail = parsed ? TelegramDescription(root) : response.body;
    return SetError(out_error, "HTTP " + std::to_string(response.status_code) +
                                   (detail.empty() ? std::string() : ": " + detail));
  }
}

bool LoggingChannel::Send(const std::string& chat_target,
                          const std::string& text,
                          std::string* out_error) {
  (void)out_error;
  LogInfo("DRY_RUN_DELIVERY: target=" + (chat_target.empty() ? std::string("-") : chat_target) +
          "\n" + text);
  std::lock_guard<std::mutex> lock(mutex_);
  sent_messages_.push_back(text);
  return true;
}

std::vector<std::string> LoggingChannel::sent_messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sent_messages_;
}

}  // namespace pm_sentinel
