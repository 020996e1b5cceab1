#ifndef YADWH_WEBHOOK_GATEWAY_H_
#define YADWH_WEBHOOK_GATEWAY_H_

#include <exception>
#include <string>

#include <json/json.h>

#include "yadwh/orchestrator.h"

namespace yadwh {

class ApiException : public std::exception {
 public:
  ApiException(int status, const std::string& error) : status(status) {
    resp["error"] = error;
    what_ = "HTTP_" + std::to_string(status) + " " + error;
  }

  const char* what() const noexcept override { return what_.c_str(); }

  int status;
  Json::Value resp;

 private:
  std::string what_;
};

/**
 * Authenticates webhook calls and runs the update of the requested group.
 */
class Gateway {
 public:
  static constexpr const char* const SecretHeader{"X-YADWH-Secret"};
  static constexpr const char* const SecretParam{"secret"};

  explicit Gateway(Orchestrator& orchestrator) : orchestrator_{orchestrator} {}

  // JSON array of the updated containers, throws ApiException
  Json::Value handle(const std::string& name, const std::string& secret);

  static Json::Value toJson(const ProcessResult& result);

 private:
  Orchestrator& orchestrator_;
};

}  // namespace yadwh

#endif  // YADWH_WEBHOOK_GATEWAY_H_
