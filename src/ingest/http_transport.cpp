#include "ingest/http_transport.h"

#include <curl/curl.h>

namespace pm_sentinel {

namespace {

std::string CurlCodeToString(CURLcode code) {
  return std::string(curl_easy_strerror(code));
}

std::size_t WriteToString(char* ptr, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  if (ptr == nullptr || userdata == nullptr) {
    return 0;
  }
  std::string* out = static_cast<std::string*>(userdata);
  const std::size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

}  // namespace

CurlHttpTransport::CurlHttpTransport(int connect_timeout_ms, int timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms), timeout_ms_(timeout_ms) {}

HttpResponse CurlHttpTransport::Send(const std::string& method,
                                     const std::string& url,
                                     const HttpHeaders& headers,
                                     const std::string& body) const {
  // 进程级初始化一次，后续请求复用；并发抓取线程启动前由首个请求触发。
  static const bool kCurlGlobalInit = []() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  }();

  HttpResponse out;
  if (!kCurlGlobalInit) {
    out.error = "curl_global_init 失败";
    return out;
  }

  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    out.error = "curl_easy_init 失败";
    return out;
  }

  struct curl_slist* header_list = nullptr;
  for (const auto& [key, value] : headers) {
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }

  std::string response_body;
  char curl_error[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(connect_timeout_ms_));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curl_error);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "pm-sentinel/0.1");
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  if (method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  out.status_code = static_cast<int>(status_code);
  out.body = std::move(response_body);
  if (code != CURLE_OK) {
    const std::string detailed =
        (curl_error[0] != '\0') ? std::string(curl_error) : CurlCodeToString(code);
    out.error = "curl_easy_perform 失败: " + detailed;
  }

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);
  return out;
}

std::string UrlEncode(const std::string& text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (const char raw : text) {
    const unsigned char ch = static_cast<unsigned char>(raw);
    const bool unreserved = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                            (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' ||
                            ch == '.' || ch == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(kHex[(ch >> 4U) & 0x0FU]);
      out.push_back(kHex[ch & 0x0FU]);
    }
  }
  return out;
}

}  // namespace pm_sentinel
