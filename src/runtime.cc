#include "yadwh/runtime.h"

namespace yadwh {

ContainerDescriptor::ContainerDescriptor(const Json::Value& value)
    : id{value["Id"].asString()},
      image{value["Image"].asString()},
      image_id{value["ImageID"].asString()},
      host_config{value["HostConfig"]},
      network_settings{value["NetworkSettings"]},
      json{value} {
  if (id.empty()) {
    throw RuntimeError("Got invalid container description, missing `Id`");
  }
  const auto& labels_json{value["Labels"]};
  if (labels_json.isObject()) {
    for (auto ii = labels_json.begin(); ii != labels_json.end(); ++ii) {
      labels.emplace(ii.key().asString(), (*ii).asString());
    }
  }
  for (const auto& n : value["Names"]) {
    names.emplace_back(n.asString());
  }
}

std::string ContainerDescriptor::name() const {
  if (names.empty()) {
    return "";
  }
  const auto& first{names.front()};
  return (!first.empty() && first[0] == '/') ? first.substr(1) : first;
}

ContainerDescriptor ContainerDescriptor::withId(const std::string& new_id) const {
  ContainerDescriptor res{*this};
  res.id = new_id;
  res.json["Id"] = new_id;
  return res;
}

ContainerSnapshot::ContainerSnapshot(const Json::Value& inspect)
    : config{inspect["Config"]},
      host_config{inspect["HostConfig"]},
      endpoints_config{inspect["NetworkSettings"]["Networks"]} {
  if (!config.isObject() || config["Image"].asString().empty()) {
    throw RuntimeError("Got invalid container inspect data, missing `Config.Image`");
  }
  if (!host_config.isObject()) {
    host_config = Json::Value(Json::objectValue);
  }
  if (!endpoints_config.isObject()) {
    endpoints_config = Json::Value(Json::objectValue);
  }
}

}  // namespace yadwh
