#ifndef YADWH_CONFIG_H_
#define YADWH_CONFIG_H_

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/property_tree/ptree.hpp>

namespace yadwh {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  uint16_t port{80};
  std::chrono::seconds idle_timeout{5};
};

struct DockerConfig {
  std::string host{"unix:///var/run/docker.sock"};
  std::chrono::seconds stop_timeout{60};
  // limit for a single request to the engine, has to exceed stop_timeout
  std::chrono::seconds timeout{600};
};

/**
 * Daemon configuration, an INI file:
 *
 *   [server]
 *   host = 0.0.0.0
 *   port = 80
 *   idle_timeout = 5
 *
 *   [docker]
 *   host = unix:///var/run/docker.sock
 *   stop_timeout = 60
 *   timeout = 600
 *
 *   [label]
 *   key = io.d2a.yadwh.ug
 *
 *   [logging]
 *   level = 2
 *
 *   [group.<name>]
 *   secret = <at least 12 chars>
 *   auth = <base64 user:password>
 *   purge = true|false
 */
struct Config {
  static constexpr const char* const DefaultPath{"/etc/yadwh/yadwh.toml"};
  static constexpr const char* const DefaultLabelKey{"io.d2a.yadwh.ug"};

  Config() = default;
  explicit Config(const boost::filesystem::path& path);
  explicit Config(boost::property_tree::ptree pt);

  ServerConfig server;
  DockerConfig docker;
  std::string label_key{DefaultLabelKey};
  int log_level{2};

  // raw content, the group sections are consumed by CredentialStore
  boost::property_tree::ptree raw;

 private:
  void updateFromPropertyTree();
};

}  // namespace yadwh

#endif  // YADWH_CONFIG_H_
