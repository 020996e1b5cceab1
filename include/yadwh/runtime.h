#ifndef YADWH_RUNTIME_H_
#define YADWH_RUNTIME_H_

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>

namespace yadwh {

// A container as reported by the runtime's container listing.
struct ContainerDescriptor {
  ContainerDescriptor() = default;
  explicit ContainerDescriptor(const Json::Value& value);

  std::string id;
  std::string image;
  std::string image_id;
  std::map<std::string, std::string> labels;
  std::vector<std::string> names;
  Json::Value host_config;
  Json::Value network_settings;

  // runtime representation the fields above were parsed from
  Json::Value json;

  // first name without the leading '/', empty if the container is anonymous
  std::string name() const;
  ContainerDescriptor withId(const std::string& new_id) const;
};

// Configuration captured by inspect, sufficient to create an equivalent container.
struct ContainerSnapshot {
  ContainerSnapshot() = default;
  explicit ContainerSnapshot(const Json::Value& inspect);

  Json::Value config;
  Json::Value host_config;
  Json::Value endpoints_config;

  bool autoRemove() const { return host_config["AutoRemove"].asBool(); }
};

class RuntimeError : public std::runtime_error {
 public:
  explicit RuntimeError(const std::string& what, long status = 0) : std::runtime_error(what), status_{status} {}
  // HTTP status of the failed call, 0 if the runtime wasn't reached
  long status() const { return status_; }

 private:
  long status_;
};

/**
 * Operations against a container runtime. Every operation throws RuntimeError on failure.
 *
 * Implementations must be safe to call from several threads at once.
 */
class RuntimeClient {
 public:
  using Ptr = std::shared_ptr<RuntimeClient>;

  virtual std::vector<ContainerDescriptor> listByLabelKey(const std::string& key) = 0;
  virtual ContainerDescriptor describe(const std::string& id) = 0;
  virtual ContainerSnapshot inspect(const std::string& id) = 0;
  // returns the pull progress log
  virtual std::string pull(const std::string& image, const std::string& registry_auth) = 0;
  virtual void stop(const std::string& id, std::chrono::seconds grace) = 0;
  virtual void remove(const std::string& id) = 0;
  virtual std::string create(const ContainerSnapshot& snapshot, const std::string& name) = 0;
  virtual void start(const std::string& id) = 0;
  virtual void removeImage(const std::string& image_id) = 0;

  virtual ~RuntimeClient() = default;
  RuntimeClient(const RuntimeClient&&) = delete;
  RuntimeClient(const RuntimeClient&) = delete;
  RuntimeClient& operator=(const RuntimeClient&) = delete;
  RuntimeClient& operator=(const RuntimeClient&&) = delete;

 protected:
  RuntimeClient() = default;
};

}  // namespace yadwh

#endif  // YADWH_RUNTIME_H_
