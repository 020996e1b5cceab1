#ifndef YADWH_HTTP_CLIENT_H_
#define YADWH_HTTP_CLIENT_H_

#include <string>

#include "http/httpinterface.h"

namespace yadwh {

/**
 * libcurl based client, either over TCP or over a unix domain socket (the Docker Engine API case).
 *
 * Every request runs on its own easy handle, so a single instance can be shared between threads.
 */
class HttpClient : public HttpInterface {
 public:
  explicit HttpClient(std::string unix_socket = "", Headers extra_headers = {});

  HttpResponse get(const std::string& url, int64_t maxsize) override;
  HttpResponse post(const std::string& url, const std::string& content_type, const std::string& data,
                    const Headers& headers) override;
  HttpResponse post(const std::string& url, const Json::Value& data) override;
  HttpResponse del(const std::string& url) override;

  // overall time a request may take, 0 disables the limit
  void timeout(int64_t ms) { timeout_ms_ = ms; }

  static std::string urlEncode(const std::string& value);

 private:
  HttpResponse perform(const std::string& method, const std::string& url, const std::string* content_type,
                       const std::string* data, const Headers& headers, int64_t maxsize) const;

  const std::string unix_socket_;
  const Headers extra_headers_;
  int64_t timeout_ms_{0};
};

}  // namespace yadwh

#endif  // YADWH_HTTP_CLIENT_H_
