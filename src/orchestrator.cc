#include "yadwh/orchestrator.h"

#include <boost/algorithm/string.hpp>

#include "logging/logging.h"

namespace yadwh {

static std::string trimId(const std::string& id) {
  if (id.size() > 16) {
    return id.substr(0, 15) + "-";
  }
  return id;
}

std::string toString(Stage stage) {
  switch (stage) {
    case Stage::Pull:
      return "Pull";
    case Stage::Inspect:
      return "Inspect";
    case Stage::Stop:
      return "Stop";
    case Stage::Remove:
      return "Remove";
    case Stage::Create:
      return "Create";
    case Stage::Start:
      return "Start";
  }
  return "Unknown";
}

UpdateOutcome UpdateOutcome::succeeded(ContainerDescriptor descriptor, ContainerDescriptor updated) {
  UpdateOutcome res;
  res.descriptor = std::move(descriptor);
  res.status = Status::Succeeded;
  res.updated = std::move(updated);
  return res;
}

UpdateOutcome UpdateOutcome::skipped(ContainerDescriptor descriptor) {
  UpdateOutcome res;
  res.descriptor = std::move(descriptor);
  res.status = Status::SkippedNotMonitored;
  return res;
}

UpdateOutcome UpdateOutcome::failed(ContainerDescriptor descriptor, Stage stage, std::string cause) {
  UpdateOutcome res;
  res.descriptor = std::move(descriptor);
  res.status = Status::Failed;
  res.stage = stage;
  res.cause = std::move(cause);
  return res;
}

bool pullLogMentionsImage(const std::string& pull_log, const std::string& old_image_id) {
  if (old_image_id.empty()) {
    return false;
  }
  return boost::to_lower_copy(pull_log).find(old_image_id) != std::string::npos;
}

Orchestrator::Orchestrator(RuntimeClient::Ptr runtime, const CredentialStore& credentials, Options options)
    : runtime_{std::move(runtime)}, credentials_{credentials}, options_{std::move(options)} {
  if (!options_.repull_policy) {
    throw std::invalid_argument("Repull policy is not set");
  }
}

Orchestrator::Orchestrator(RuntimeClient::Ptr runtime, const CredentialStore& credentials)
    : Orchestrator(std::move(runtime), credentials, Options()) {}

ProcessResult Orchestrator::process(const std::string& group, const std::string& secret) {
  return process(credentials_.authenticate(group, secret));
}

ProcessResult Orchestrator::process(const GroupCredential& credential) {
  std::vector<ContainerDescriptor> containers;
  try {
    containers = runtime_->listByLabelKey(options_.label_key);
  } catch (const std::exception& exc) {
    LOG_ERROR << "Failed to list containers with label " << options_.label_key << ": " << exc.what();
    throw DiscoveryError(exc.what());
  }

  LOG_INFO << "Finding and updating containers of " << credential.name << ", " << containers.size()
           << " container(s) carry the label " << options_.label_key;

  ProcessResult result;
  result.reserve(containers.size());
  for (const auto& container : containers) {
    const auto label{container.labels.find(options_.label_key)};
    if (label == container.labels.end() || !isMonitored(label->second, credential.name)) {
      LOG_DEBUG << "Container " << trimId(container.id) << " is not monitored by " << credential.name;
      result.emplace_back(UpdateOutcome::skipped(container));
      continue;
    }
    result.emplace_back(update(container, credential));
  }

  size_t updated{0};
  for (const auto& r : result) {
    updated += r ? 1 : 0;
  }
  LOG_INFO << "Updated " << updated << " container(s) of " << credential.name;
  return result;
}

bool Orchestrator::isMonitored(const std::string& label_value, const std::string& group) {
  const auto expected{boost::trim_copy(group)};
  std::vector<std::string> watched;
  boost::split(watched, label_value, boost::is_any_of(","));
  for (const auto& w : watched) {
    if (boost::iequals(boost::trim_copy(w), expected)) {
      return true;
    }
  }
  return false;
}

UpdateOutcome Orchestrator::update(const ContainerDescriptor& container, const GroupCredential& credential) {
  const auto id{trimId(container.id)};
  auto failed = [&container, &id](Stage stage, const std::exception& exc) {
    LOG_WARNING << "Failed to update container " << id << " at the " << toString(stage) << " stage: " << exc.what();
    return UpdateOutcome::failed(container, stage, exc.what());
  };

  LOG_INFO << "Pulling image for container " << id << "@" << container.image;
  std::string pull_log;
  try {
    pull_log = runtime_->pull(container.image, credential.registry_auth.value_or(""));
  } catch (const std::exception& exc) {
    return failed(Stage::Pull, exc);
  }
  LOG_DEBUG << "Pull log of " << container.image << ":\n" << pull_log;

  // the only way to bring up an equivalent container, it has to be captured before anything is destroyed
  ContainerSnapshot snapshot;
  try {
    snapshot = runtime_->inspect(container.id);
  } catch (const std::exception& exc) {
    return failed(Stage::Inspect, exc);
  }

  LOG_INFO << "Stopping container " << id << "/" << container.image << "(" << container.image_id << ")";
  try {
    runtime_->stop(container.id, options_.stop_grace);
  } catch (const std::exception& exc) {
    return failed(Stage::Stop, exc);
  }

  if (!snapshot.autoRemove()) {
    LOG_INFO << "Removing container " << id;
    try {
      runtime_->remove(container.id);
    } catch (const std::exception& exc) {
      return failed(Stage::Remove, exc);
    }
  } else {
    LOG_INFO << "No need to remove container " << id << ", it is removed by the runtime on stop";
  }

  const auto name{container.name()};
  LOG_INFO << "Re-creating container " << (name.empty() ? "<anonymous>" : name) << " with image "
           << snapshot.config["Image"].asString();
  std::string new_id;
  try {
    new_id = runtime_->create(snapshot, name);
  } catch (const std::exception& exc) {
    LOG_ERROR << "Container " << id << " has been removed and could not be re-created";
    return failed(Stage::Create, exc);
  }

  LOG_INFO << "Starting container " << trimId(new_id);
  try {
    runtime_->start(new_id);
  } catch (const std::exception& exc) {
    return failed(Stage::Start, exc);
  }

  ContainerDescriptor updated;
  try {
    updated = runtime_->describe(new_id);
  } catch (const std::exception& exc) {
    LOG_WARNING << "Failed to describe the re-created container " << trimId(new_id) << ": " << exc.what();
    updated = container.withId(new_id);
  }

  if (credential.purge_old_image) {
    purge(container, updated, pull_log);
  }

  LOG_INFO << "Done! Container " << trimId(new_id) << " with image (" << container.image << ") updated";
  return UpdateOutcome::succeeded(container, std::move(updated));
}

void Orchestrator::purge(const ContainerDescriptor& old, const ContainerDescriptor& updated,
                         const std::string& pull_log) {
  if (old.image_id.empty()) {
    LOG_WARNING << "Image id of container " << trimId(old.id) << " is unknown, skipped removing the old image";
    return;
  }
  if (options_.repull_policy(pull_log, old.image_id)) {
    LOG_INFO << "It looks like the old image was pulled again. Skipped removing.";
    return;
  }
  if (updated.image_id == old.image_id) {
    LOG_INFO << "The updated container still runs on image " << old.image_id << ". Skipped removing.";
    return;
  }

  LOG_INFO << "Deleting image " << old.image_id;
  try {
    runtime_->removeImage(old.image_id);
  } catch (const std::exception& exc) {
    LOG_WARNING << "Cannot remove old image " << old.image_id << ": " << exc.what();
  }
}

}  // namespace yadwh
