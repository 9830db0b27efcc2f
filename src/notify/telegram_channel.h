#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.h"
#include "ingest/http_transport.h"

namespace pm_sentinel {

/// 投递通道抽象：扫描流程只依赖该接口。
class DeliveryChannel {
 public:
  virtual ~DeliveryChannel() = default;
  virtual bool Send(const std::string& chat_target,
                    const std::string& text,
                    std::string* out_error) = 0;
};

/// Telegram 单条消息上限（留出余量，低于官方 4096）。
inline constexpr std::size_t kTelegramMaxMessageBytes = 4000;

/**
 * @brief 按行边界拆分长消息
 *
 * 单行超长时在 UTF-8 字符边界硬切分。
 */
std::vector<std::string> SplitMessage(const std::string& text, std::size_t max_bytes);

/**
 * @brief Telegram Bot API 投递
 *
 * 1. `sendMessage`，HTML parse mode，关闭链接预览；
 * 2. 超长消息按行拆分逐段发送；
 * 3. 遇到 429 且 `retry_after` 不超过 `max_retry_after_seconds` 时等待后重试一次。
 */
class TelegramChannel final : public DeliveryChannel {
 public:
  using SleepFunction = std::function<void(int seconds)>;

  TelegramChannel(TelegramConfig config,
                  std::unique_ptr<HttpTransport> transport = nullptr,
                  SleepFunction sleeper = nullptr);

  bool Send(const std::string& chat_target,
            const std::string& text,
            std::string* out_error) override;

 private:
  bool SendPart(const std::string& chat_target,
                const std::string& text,
                std::string* out_error);

  TelegramConfig config_;
  std::string api_base_url_{"https://api.telegram.org"};
  std::unique_ptr<HttpTransport> transport_;
  SleepFunction sleeper_;
};

/// 演练通道：只写日志，不对外发送；同时保留已发送文本便于检查。
class LoggingChannel final : public DeliveryChannel {
 public:
  bool Send(const std::string& chat_target,
            const std::string& text,
            std::string* out_error) override;

  std::vector<std::string> sent_messages() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> sent_messages_;
};

}  // namespace pm_sentinel
