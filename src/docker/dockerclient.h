#ifndef YADWH_DOCKER_CLIENT_H_
#define YADWH_DOCKER_CLIENT_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "http/httpinterface.h"
#include "yadwh/runtime.h"

namespace yadwh::docker {

// RuntimeClient implementation on top of the Docker Engine API.
class DockerClient : public RuntimeClient {
 public:
  using Ptr = std::shared_ptr<DockerClient>;
  using HttpClientFactory =
      std::function<std::shared_ptr<HttpInterface>(const std::string& docker_host, std::chrono::seconds timeout)>;
  static const HttpClientFactory DefaultHttpClientFactory;
  static constexpr const char* const DefaultHost{"unix:///var/run/docker.sock"};
  static constexpr std::chrono::seconds DefaultTimeout{600};

  explicit DockerClient(std::shared_ptr<HttpInterface> http_client = DefaultHttpClientFactory(DefaultHost,
                                                                                                DefaultTimeout));

  std::vector<ContainerDescriptor> listByLabelKey(const std::string& key) override;
  ContainerDescriptor describe(const std::string& id) override;
  ContainerSnapshot inspect(const std::string& id) override;
  std::string pull(const std::string& image, const std::string& registry_auth) override;
  void stop(const std::string& id, std::chrono::seconds grace) override;
  void remove(const std::string& id) override;
  std::string create(const ContainerSnapshot& snapshot, const std::string& name) override;
  void start(const std::string& id) override;
  void removeImage(const std::string& image_id) override;

  const Json::Value& engineInfo() const { return engine_info_; }

  // request body of a container create call
  static Json::Value createRequest(const ContainerSnapshot& snapshot);
  // first error reported in the newline separated JSON stream of an image pull, empty if none
  static std::string pullError(const std::string& pull_log);

 private:
  Json::Value getEngineInfo();
  std::vector<ContainerDescriptor> getContainers(const Json::Value& filters, bool all);

  std::shared_ptr<HttpInterface> http_client_;
  const Json::Value engine_info_;
};

}  // namespace yadwh::docker

#endif  // YADWH_DOCKER_CLIENT_H_
