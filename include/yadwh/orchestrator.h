#ifndef YADWH_ORCHESTRATOR_H_
#define YADWH_ORCHESTRATOR_H_

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "yadwh/credentials.h"
#include "yadwh/runtime.h"

namespace yadwh {

enum class Stage { Pull, Inspect, Stop, Remove, Create, Start };

std::string toString(Stage stage);

struct UpdateOutcome {
  enum class Status { Succeeded, SkippedNotMonitored, Failed };

  static UpdateOutcome succeeded(ContainerDescriptor descriptor, ContainerDescriptor updated);
  static UpdateOutcome skipped(ContainerDescriptor descriptor);
  static UpdateOutcome failed(ContainerDescriptor descriptor, Stage stage, std::string cause);

  // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
  operator bool() const { return status == Status::Succeeded; }

  // the container as listed before the update
  ContainerDescriptor descriptor;
  Status status{Status::SkippedNotMonitored};
  // the recreated container, set if Succeeded
  boost::optional<ContainerDescriptor> updated;
  // set if Failed
  boost::optional<Stage> stage;
  std::string cause;
};

// one outcome per listed container, in the order the runtime listed them
using ProcessResult = std::vector<UpdateOutcome>;

class DiscoveryError : public std::runtime_error {
 public:
  explicit DiscoveryError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Decides whether the old image must be kept after a pull, i.e. the pull didn't bring a new image.
 *
 * The default policy looks for the old image id in the pull log. It is a heuristic and may misfire,
 * comparing image digests before and after the pull would be exact.
 */
using RepullPolicy = std::function<bool(const std::string& pull_log, const std::string& old_image_id)>;
bool pullLogMentionsImage(const std::string& pull_log, const std::string& old_image_id);

/**
 * Updates the containers of a group: pull, inspect, stop, remove (unless auto-removed), create, start and
 * optionally purge the previous image.
 *
 * Containers are processed one by one on the calling thread. A failure ends the pipeline of that container only,
 * nothing is rolled back: if creating the new container fails after the old one has been removed, the container
 * stays gone.
 */
class Orchestrator {
 public:
  struct Options {
    std::string label_key{"io.d2a.yadwh.ug"};
    std::chrono::seconds stop_grace{60};
    RepullPolicy repull_policy{pullLogMentionsImage};
  };

  Orchestrator(RuntimeClient::Ptr runtime, const CredentialStore& credentials, Options options);
  Orchestrator(RuntimeClient::Ptr runtime, const CredentialStore& credentials);

  // throws AuthError before touching the runtime, DiscoveryError if containers can't be listed
  ProcessResult process(const std::string& group, const std::string& secret);
  // `credential` is assumed to be authenticated
  ProcessResult process(const GroupCredential& credential);

  // whether a comma separated label value names `group`, comparison is trimmed and case-insensitive
  static bool isMonitored(const std::string& label_value, const std::string& group);

 private:
  UpdateOutcome update(const ContainerDescriptor& container, const GroupCredential& credential);
  void purge(const ContainerDescriptor& old, const ContainerDescriptor& updated, const std::string& pull_log);

  RuntimeClient::Ptr runtime_;
  const CredentialStore& credentials_;
  const Options options_;
};

}  // namespace yadwh

#endif  // YADWH_ORCHESTRATOR_H_
