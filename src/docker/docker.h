#ifndef YADWH_DOCKER_H_
#define YADWH_DOCKER_H_

#include <string>

namespace yadwh::docker {

// <name>[:<tag>][@<digest>], <name> may start with a registry hostname that includes a port
struct ImageRef {
  static constexpr const char* const DefaultTag{"latest"};

  static ImageRef parse(const std::string& ref);

  // the value of the `tag` parameter of an image pull request, a digest takes precedence over a tag
  std::string pullTag() const;
  std::string str() const;

  std::string name;
  std::string tag;
  std::string digest;
};

struct RegistryAuth {
  static constexpr const char* const Header{"X-Registry-Auth"};

  // Turns a base64 encoded `user:password` into the base64url encoded auth config the Docker Engine expects.
  // A value that doesn't decode into `user:password` is assumed to be an auth config already and is kept as is.
  static std::string toEngineAuth(const std::string& auth);
  static std::string header(const std::string& auth) { return std::string(Header) + ": " + toEngineAuth(auth); }
};

}  // namespace yadwh::docker

#endif  // YADWH_DOCKER_H_
