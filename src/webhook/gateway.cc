#include "webhook/gateway.h"

#include <boost/algorithm/string/trim.hpp>

#include "logging/logging.h"

namespace yadwh {

Json::Value Gateway::handle(const std::string& name, const std::string& secret) {
  const auto group{boost::trim_copy(name)};
  const auto trimmed_secret{boost::trim_copy(secret)};
  if (trimmed_secret.empty()) {
    throw ApiException(401, "secret not found");
  }

  ProcessResult result;
  try {
    result = orchestrator_.process(group, trimmed_secret);
  } catch (const AuthError& exc) {
    LOG_WARNING << "Rejected webhook call for " << group << ": " << exc.what();
    throw ApiException(exc.kind() == AuthError::Kind::NotFound ? 404 : 401, exc.what());
  } catch (const DiscoveryError& exc) {
    throw ApiException(500, exc.what());
  }
  return toJson(result);
}

Json::Value Gateway::toJson(const ProcessResult& result) {
  Json::Value updated{Json::arrayValue};
  for (const auto& outcome : result) {
    if (outcome && outcome.updated) {
      updated.append(outcome.updated->json);
    }
  }
  return updated;
}

}  // namespace yadwh
