#include "docker/dockerclient.h"

#include <sstream>

#include <boost/process/environment.hpp>

#include "docker/docker.h"
#include "http/httpclient.h"
#include "logging/logging.h"
#include "utilities/utils.h"

namespace yadwh::docker {

static const std::string kEngine{"http://localhost"};

const DockerClient::HttpClientFactory DockerClient::DefaultHttpClientFactory = [](const std::string& docker_host_in,
                                                                                  std::chrono::seconds timeout) {
  std::string docker_host{docker_host_in};
  auto env{boost::this_process::environment()};
  if (env.end() != env.find("DOCKER_HOST")) {
    docker_host = env.get("DOCKER_HOST");
    LOG_DEBUG << "Docker client: using the host defined by `DOCKER_HOST` env variable: " << docker_host;
  }
  static const std::string docker_host_prefix{"unix://"};
  if (docker_host.rfind(docker_host_prefix, 0) != 0) {
    throw std::invalid_argument("Invalid docker host value, must start with unix:// : " + docker_host);
  }

  const auto socket{docker_host.substr(docker_host_prefix.size())};
  auto c{std::make_shared<HttpClient>(socket)};
  // a stop request blocks for up to the stop grace period and a pull for as long as the download takes
  c->timeout(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
  return c;
};

// Docker replies {"message": "..."} on errors
static std::string errorOf(const HttpResponse& resp) {
  if (resp.wasInResponse()) {
    const auto message{resp.getJson()["message"].asString()};
    if (!message.empty()) {
      return "HTTP " + std::to_string(resp.http_status_code) + " " + message;
    }
  }
  return resp.getStatusStr();
}

static std::string containerUrl(const std::string& id, const std::string& action = "") {
  return kEngine + "/containers/" + HttpClient::urlEncode(id) + (action.empty() ? "" : "/" + action);
}

DockerClient::DockerClient(std::shared_ptr<HttpInterface> http_client)
    : http_client_{std::move(http_client)}, engine_info_{getEngineInfo()} {}

std::vector<ContainerDescriptor> DockerClient::listByLabelKey(const std::string& key) {
  Json::Value filters;
  filters["label"].append(key);
  return getContainers(filters, false);
}

ContainerDescriptor DockerClient::describe(const std::string& id) {
  Json::Value filters;
  filters["id"].append(id);
  auto containers{getContainers(filters, true)};
  // the id filter matches by prefix
  for (auto& c : containers) {
    if (c.id == id) {
      return c;
    }
  }
  throw RuntimeError("No such container: " + id, 404);
}

ContainerSnapshot DockerClient::inspect(const std::string& id) {
  const auto url{containerUrl(id, "json")};
  const auto resp{http_client_->get(url, HttpInterface::kNoLimit)};
  if (!resp.isOk()) {
    throw RuntimeError("Failed to inspect container " + id + ": " + errorOf(resp), resp.http_status_code);
  }
  return ContainerSnapshot{resp.getJson()};
}

std::string DockerClient::pull(const std::string& image, const std::string& registry_auth) {
  ImageRef ref;
  try {
    ref = ImageRef::parse(image);
  } catch (const std::invalid_argument& exc) {
    throw RuntimeError(exc.what());
  }

  // curl -X POST --unix-socket <sock> "http://localhost/images/create?fromImage=<name>&tag=<tag|digest>"
  const std::string url{kEngine + "/images/create?fromImage=" + HttpClient::urlEncode(ref.name) +
                        "&tag=" + HttpClient::urlEncode(ref.pullTag())};
  HttpInterface::Headers headers;
  if (!registry_auth.empty()) {
    headers.emplace_back(RegistryAuth::header(registry_auth));
  }
  const auto resp{http_client_->post(url, "application/json", "", headers)};
  if (!resp.isOk()) {
    throw RuntimeError("Failed to pull image " + ref.str() + ": " + errorOf(resp), resp.http_status_code);
  }
  // the engine answers 200 before the download starts, failures are reported in the progress stream
  const auto err{pullError(resp.body)};
  if (!err.empty()) {
    throw RuntimeError("Failed to pull image " + ref.str() + ": " + err, resp.http_status_code);
  }
  return resp.body;
}

void DockerClient::stop(const std::string& id, std::chrono::seconds grace) {
  const auto resp{http_client_->post(containerUrl(id, "stop") + "?t=" + std::to_string(grace.count()),
                                     Json::nullValue)};
  if (resp.isOk()) {
    return;
  }
  if (resp.curl_code == CURLE_OK && resp.http_status_code == 304) {
    LOG_DEBUG << "Container " << id << " has been already stopped";
    return;
  }
  throw RuntimeError("Failed to stop container " + id + ": " + errorOf(resp), resp.http_status_code);
}

void DockerClient::remove(const std::string& id) {
  const auto resp{http_client_->del(containerUrl(id))};
  if (!resp.isOk()) {
    throw RuntimeError("Failed to remove container " + id + ": " + errorOf(resp), resp.http_status_code);
  }
}

std::string DockerClient::create(const ContainerSnapshot& snapshot, const std::string& name) {
  std::string url{kEngine + "/containers/create"};
  if (!name.empty()) {
    url += "?name=" + HttpClient::urlEncode(name);
  }
  const auto resp{http_client_->post(url, createRequest(snapshot))};
  if (!resp.isOk()) {
    throw RuntimeError("Failed to create container " + (name.empty() ? std::string("<anonymous>") : name) + ": " +
                           errorOf(resp),
                       resp.http_status_code);
  }
  const auto created{resp.getJson()};
  for (const auto& w : created["Warnings"]) {
    LOG_WARNING << "Container create: " << w.asString();
  }
  const auto new_id{created["Id"].asString()};
  if (new_id.empty()) {
    throw RuntimeError("Got invalid response to container create: " + resp.body, resp.http_status_code);
  }
  return new_id;
}

void DockerClient::start(const std::string& id) {
  const auto resp{http_client_->post(containerUrl(id, "start"), Json::nullValue)};
  if (resp.isOk()) {
    return;
  }
  if (resp.curl_code == CURLE_OK && resp.http_status_code == 304) {
    LOG_DEBUG << "Container " << id << " has been already started";
    return;
  }
  throw RuntimeError("Failed to start container " + id + ": " + errorOf(resp), resp.http_status_code);
}

void DockerClient::removeImage(const std::string& image_id) {
  const auto resp{http_client_->del(kEngine + "/images/" + HttpClient::urlEncode(image_id))};
  if (!resp.isOk()) {
    throw RuntimeError("Failed to remove image " + image_id + ": " + errorOf(resp), resp.http_status_code);
  }
  for (const auto& r : resp.getJson()) {
    if (r.isMember("Deleted")) {
      LOG_DEBUG << "Deleted: " << r["Deleted"].asString();
    } else if (r.isMember("Untagged")) {
      LOG_DEBUG << "Untagged: " << r["Untagged"].asString();
    }
  }
}

Json::Value DockerClient::createRequest(const ContainerSnapshot& snapshot) {
  // the create body is the container config extended with the host and networking configs
  Json::Value req{snapshot.config};
  req["HostConfig"] = snapshot.host_config;
  req["NetworkingConfig"]["EndpointsConfig"] = snapshot.endpoints_config;
  return req;
}

std::string DockerClient::pullError(const std::string& pull_log) {
  std::istringstream stream{pull_log};
  std::string line;
  while (std::getline(stream, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    Json::Value record;
    try {
      record = Utils::parseJSON(line);
    } catch (const std::invalid_argument&) {
      LOG_TRACE << "Skipping non-JSON line of the pull log: " << line;
      continue;
    }
    if (record.isMember("error")) {
      const auto detail{record["errorDetail"]["message"].asString()};
      return detail.empty() ? record["error"].asString() : detail;
    }
  }
  return "";
}

Json::Value DockerClient::getEngineInfo() {
  Json::Value info;
  const std::string url{kEngine + "/version"};
  auto resp = http_client_->get(url, HttpInterface::kNoLimit);
  if (resp.isOk()) {
    info = resp.getJson();
  }
  if (!info) {
    throw RuntimeError("Request to the dockerd's /version endpoint has failed: " + errorOf(resp),
                       resp.http_status_code);
  }
  LOG_DEBUG << "Docker engine version: " << info["Version"].asString() << ", API: " << info["ApiVersion"].asString();
  return info;
}

std::vector<ContainerDescriptor> DockerClient::getContainers(const Json::Value& filters, bool all) {
  // curl --unix-socket /var/run/docker.sock 'http://localhost/containers/json?all=0&filters={"label":["<key>"]}'
  const std::string url{kEngine + "/containers/json?all=" + (all ? "1" : "0") +
                        "&filters=" + HttpClient::urlEncode(Utils::jsonToStr(filters))};
  const auto resp{http_client_->get(url, HttpInterface::kNoLimit)};
  Json::Value root;
  if (resp.isOk()) {
    root = resp.getJson();
  }
  // dockerd answers `[]` if nothing matches, a null value means the request or its parsing failed
  if (!root.isArray()) {
    throw RuntimeError("Request to dockerd has failed: " + url + ": " + errorOf(resp), resp.http_status_code);
  }

  std::vector<ContainerDescriptor> containers;
  containers.reserve(root.size());
  for (const auto& c : root) {
    containers.emplace_back(c);
  }
  return containers;
}

}  // namespace yadwh::docker
