#include "docker/docker.h"

#include <stdexcept>

#include <json/json.h>

#include "logging/logging.h"
#include "utilities/utils.h"

namespace yadwh::docker {

ImageRef ImageRef::parse(const std::string& ref) {
  if (ref.empty()) {
    throw std::invalid_argument("Got empty image reference");
  }

  ImageRef res;
  std::string remainder{ref};

  const auto digest_pos{remainder.find('@')};
  if (digest_pos != std::string::npos) {
    res.digest = remainder.substr(digest_pos + 1);
    remainder = remainder.substr(0, digest_pos);
    if (res.digest.find(':') == std::string::npos || res.digest.back() == ':') {
      throw std::invalid_argument("Invalid image digest: " + ref);
    }
  }

  // a colon after the last slash separates a tag, otherwise it's a registry port
  const auto last_slash{remainder.rfind('/')};
  const auto last_colon{remainder.rfind(':')};
  if (last_colon != std::string::npos && (last_slash == std::string::npos || last_colon > last_slash)) {
    res.tag = remainder.substr(last_colon + 1);
    remainder = remainder.substr(0, last_colon);
    if (res.tag.empty()) {
      throw std::invalid_argument("Invalid image tag: " + ref);
    }
  }

  if (remainder.empty() || remainder.back() == '/' || remainder.front() == '/') {
    throw std::invalid_argument("Invalid image name: " + ref);
  }
  res.name = remainder;
  return res;
}

std::string ImageRef::pullTag() const {
  if (!digest.empty()) {
    return digest;
  }
  return tag.empty() ? DefaultTag : tag;
}

std::string ImageRef::str() const {
  std::string res{name};
  if (!tag.empty()) {
    res += ":" + tag;
  }
  if (!digest.empty()) {
    res += "@" + digest;
  }
  return res;
}

std::string RegistryAuth::toEngineAuth(const std::string& auth) {
  std::string decoded;
  try {
    decoded = Utils::fromBase64(auth);
  } catch (const std::invalid_argument& exc) {
    LOG_DEBUG << "Registry auth is not base64 encoded, passing it as is: " << exc.what();
    return auth;
  }

  const auto sep{decoded.find(':')};
  if (decoded.empty() || decoded.front() == '{' || sep == std::string::npos) {
    return auth;
  }

  Json::Value auth_config;
  auth_config["username"] = decoded.substr(0, sep);
  auth_config["password"] = decoded.substr(sep + 1);
  return Utils::toBase64Url(Utils::jsonToStr(auth_config));
}

}  // namespace yadwh::docker
