#include "http/httpclient.h"

#include <memory>
#include <stdexcept>

#include "logging/logging.h"
#include "utilities/utils.h"

namespace yadwh {

namespace {

struct CurlGlobalInit {
  CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalInit() { curl_global_cleanup(); }
  CurlGlobalInit(const CurlGlobalInit&) = delete;
  CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;
  CurlGlobalInit(CurlGlobalInit&&) = delete;
  CurlGlobalInit& operator=(CurlGlobalInit&&) = delete;
};

struct WriteContext {
  std::string* body;
  int64_t maxsize;
};

size_t writeBody(void* contents, size_t size, size_t nmemb, void* userp) {
  auto* ctx = static_cast<WriteContext*>(userp);
  const size_t chunk{size * nmemb};
  if (ctx->maxsize != HttpInterface::kNoLimit &&
      static_cast<int64_t>(ctx->body->size() + chunk) > ctx->maxsize) {
    // returning a short count makes curl abort the transfer with CURLE_WRITE_ERROR
    return 0;
  }
  ctx->body->append(static_cast<char*>(contents), chunk);
  return chunk;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

}  // namespace

Json::Value HttpResponse::getJson() const {
  try {
    return Utils::parseJSON(body);
  } catch (const std::invalid_argument& exc) {
    LOG_DEBUG << exc.what();
    return Json::Value();
  }
}

HttpClient::HttpClient(std::string unix_socket, Headers extra_headers)
    : unix_socket_{std::move(unix_socket)}, extra_headers_{std::move(extra_headers)} {
  static CurlGlobalInit curl_global;
}

HttpResponse HttpClient::get(const std::string& url, int64_t maxsize) {
  return perform("GET", url, nullptr, nullptr, {}, maxsize);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& content_type, const std::string& data,
                              const Headers& headers) {
  return perform("POST", url, &content_type, &data, headers, kNoLimit);
}

HttpResponse HttpClient::post(const std::string& url, const Json::Value& data) {
  const std::string content_type{"application/json"};
  std::string body;
  if (!data.isNull()) {
    body = Utils::jsonToStr(data);
  }
  return perform("POST", url, &content_type, &body, {}, kNoLimit);
}

HttpResponse HttpClient::del(const std::string& url) { return perform("DELETE", url, nullptr, nullptr, {}, kNoLimit); }

std::string HttpClient::urlEncode(const std::string& value) {
  CurlHandle curl{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    throw std::runtime_error("Failed to instantiate curl handler");
  }
  char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
  if (escaped == nullptr) {
    throw std::runtime_error("Failed to URL-encode a value: " + value);
  }
  std::string res{escaped};
  curl_free(escaped);
  return res;
}

HttpResponse HttpClient::perform(const std::string& method, const std::string& url, const std::string* content_type,
                                 const std::string* data, const Headers& headers, int64_t maxsize) const {
  CurlHandle curl{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    return HttpResponse("", 0, CURLE_FAILED_INIT, "Failed to instantiate curl handler");
  }

  CurlHeaders header_list{nullptr, curl_slist_free_all};
  auto append_header = [&header_list](const std::string& header) {
    curl_slist* res = curl_slist_append(header_list.get(), header.c_str());
    if (res != nullptr) {
      header_list.release();
      header_list.reset(res);
    }
  };
  for (const auto& h : extra_headers_) {
    append_header(h);
  }
  for (const auto& h : headers) {
    append_header(h);
  }

  std::string body;
  WriteContext ctx{&body, maxsize};
  char err_buf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "yadwh/1.0.0");
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, err_buf);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
  if (!unix_socket_.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, unix_socket_.c_str());
  }

  if (method == "POST") {
    if (content_type != nullptr) {
      append_header("Content-Type: " + *content_type);
    }
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(data != nullptr ? data->size() : 0));
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, data != nullptr ? data->c_str() : "");
  } else if (method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  }
  if (header_list) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  }

  const CURLcode curl_code{curl_easy_perform(curl.get())};
  long http_code{0};
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

  if (curl_code != CURLE_OK) {
    const std::string err{err_buf[0] != '\0' ? err_buf : curl_easy_strerror(curl_code)};
    LOG_DEBUG << method << " request to " << url << " failed: " << err;
    return HttpResponse(body, http_code, curl_code, err);
  }
  LOG_TRACE << method << " " << url << " -> HTTP " << http_code;
  return HttpResponse(body, http_code, curl_code, "");
}

}  // namespace yadwh
