#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pm_sentinel {

/// HTTP 响应统一结构，便于 mock 与真实传输层复用。
struct HttpResponse {
  int status_code{0};
  std::string body;
  std::string error;  ///< 传输层错误（DNS/超时/TLS）；HTTP 非 2xx 不写入此字段。
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief HTTP 传输抽象
 *
 * 作用：
 * 1. 抓取与投递逻辑不直接依赖 libcurl；
 * 2. 单元测试可注入 mock transport。
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse Send(const std::string& method,
                            const std::string& url,
                            const HttpHeaders& headers,
                            const std::string& body) const = 0;
};

/// libcurl 实现；连接与总超时按数据源独立配置。
class CurlHttpTransport final : public HttpTransport {
 public:
  CurlHttpTransport(int connect_timeout_ms = 5000, int timeout_ms = 30000);

  HttpResponse Send(const std::string& method,
                    const std::string& url,
                    const HttpHeaders& headers,
                    const std::string& body) const override;

 private:
  int connect_timeout_ms_;
  int timeout_ms_;
};

/// 百分号编码（RFC 3986 非保留字符原样保留），用于拼接查询参数。
std::string UrlEncode(const std::string& text);

/// 2xx 状态码判定。
inline bool IsHttpSuccess(int status_code) {
  return status_code >= 200 && status_code < 300;
}

}  // namespace pm_sentinel
