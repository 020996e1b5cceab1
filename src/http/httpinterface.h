#ifndef YADWH_HTTP_INTERFACE_H_
#define YADWH_HTTP_INTERFACE_H_

#include <curl/curl.h>
#include <json/json.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace yadwh {

struct HttpResponse {
  HttpResponse() = default;
  HttpResponse(std::string body_in, long http_status_code_in, CURLcode curl_code_in, std::string error_message_in)
      : body(std::move(body_in)),
        http_status_code(http_status_code_in),
        curl_code(curl_code_in),
        error_message(std::move(error_message_in)) {}

  std::string body;
  long http_status_code{0};
  CURLcode curl_code{CURLE_OK};
  std::string error_message;

  bool isOk() const { return curl_code == CURLE_OK && http_status_code >= 200 && http_status_code < 300; }
  // the request reached the server and the server answered with an error status
  bool wasInResponse() const { return curl_code == CURLE_OK && http_status_code != 0; }
  std::string getStatusStr() const {
    if (curl_code != CURLE_OK) {
      return std::to_string(curl_code) + " " + error_message;
    }
    return "HTTP " + std::to_string(http_status_code) + " " + (error_message.empty() ? body : error_message);
  }
  Json::Value getJson() const;
};

class HttpInterface {
 public:
  using Headers = std::vector<std::string>;
  static constexpr int64_t kNoLimit{0};

  HttpInterface() = default;
  virtual ~HttpInterface() = default;
  HttpInterface(const HttpInterface&) = delete;
  HttpInterface& operator=(const HttpInterface&) = delete;
  HttpInterface(HttpInterface&&) = delete;
  HttpInterface& operator=(HttpInterface&&) = delete;

  virtual HttpResponse get(const std::string& url, int64_t maxsize) = 0;
  virtual HttpResponse post(const std::string& url, const std::string& content_type, const std::string& data,
                            const Headers& headers) = 0;
  virtual HttpResponse post(const std::string& url, const Json::Value& data) = 0;
  virtual HttpResponse del(const std::string& url) = 0;
};

}  // namespace yadwh

#endif  // YADWH_HTTP_INTERFACE_H_
