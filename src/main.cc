#include <signal.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/process/environment.hpp>
#include <boost/program_options.hpp>

#include "docker/dockerclient.h"
#include "logging/logging.h"
#include "webhook/gateway.h"
#include "webhook/server.h"
#include "yadwh/config.h"
#include "yadwh/credentials.h"
#include "yadwh/orchestrator.h"

namespace bpo = boost::program_options;

static bpo::variables_map parse_options(int argc, char** argv) {
  bpo::options_description description("yadwh command line options");

  // clang-format off
  description.add_options()
      ("help,h", "print usage")
      ("loglevel", bpo::value<int>(), "set log level 0-5 (trace, debug, info, warning, error, fatal)")
      ("config,c", bpo::value<boost::filesystem::path>(), "configuration file, default: /etc/yadwh/yadwh.toml")
      ("host", bpo::value<std::string>(), "address to listen on, default: 0.0.0.0")
      ("port,p", bpo::value<uint16_t>(), "port to listen on, default: 80")
      ("docker-host", bpo::value<std::string>(), "docker engine socket, default: unix:///var/run/docker.sock")
      ("stop-timeout", bpo::value<int64_t>(), "seconds to wait for a container to stop before killing it, default: 60");
  // clang-format on

  bpo::variables_map vm;
  try {
    bpo::store(bpo::command_line_parser(argc, argv).options(description).run(), vm);
    bpo::notify(vm);
    if (vm.count("help") != 0) {
      std::cout << description << "\n";
      exit(EXIT_SUCCESS);
    }
  } catch (const bpo::error& ex) {
    std::cerr << "command line option error: " << ex.what() << std::endl << description;
    exit(EXIT_FAILURE);
  }

  return vm;
}

static yadwh::Config load_config(const bpo::variables_map& cli_map) {
  yadwh::Config config;
  if (cli_map.count("config") != 0) {
    config = yadwh::Config(cli_map["config"].as<boost::filesystem::path>());
  } else if (boost::filesystem::exists(yadwh::Config::DefaultPath)) {
    config = yadwh::Config(boost::filesystem::path(yadwh::Config::DefaultPath));
  }

  if (cli_map.count("loglevel") != 0) {
    config.log_level = cli_map["loglevel"].as<int>();
  }
  if (cli_map.count("host") != 0) {
    config.server.host = cli_map["host"].as<std::string>();
  }
  if (cli_map.count("port") != 0) {
    config.server.port = cli_map["port"].as<uint16_t>();
  }
  if (cli_map.count("docker-host") != 0) {
    config.docker.host = cli_map["docker-host"].as<std::string>();
  }
  if (cli_map.count("stop-timeout") != 0) {
    const auto stop_timeout{cli_map["stop-timeout"].as<int64_t>()};
    if (stop_timeout < 0) {
      throw std::invalid_argument("--stop-timeout must not be negative");
    }
    config.docker.stop_timeout = std::chrono::seconds(stop_timeout);
  }
  return config;
}

int main(int argc, char** argv) {
  yadwh::logger_init(isatty(1) == 1);
  yadwh::logger_set_threshold(boost::log::trivial::info);

  const bpo::variables_map cli_map = parse_options(argc, argv);

  try {
    const auto config{load_config(cli_map)};
    yadwh::logger_set_threshold(config.log_level);

    const auto credentials{yadwh::CredentialStore::load(config.raw, boost::this_process::environment())};
    if (credentials.empty()) {
      LOG_ERROR << "No secrets found.";
      LOG_ERROR << "Specify them by setting the environment variable " << yadwh::CredentialStore::EnvSecretPrefix
                << "<key>=<secret> or in a [" << yadwh::CredentialStore::ConfigGroupPrefix
                << "<key>] section of the config file";
      return EXIT_FAILURE;
    }

    LOG_INFO << "Connecting to Docker at " << config.docker.host;
    auto docker_client{std::make_shared<yadwh::docker::DockerClient>(
        yadwh::docker::DockerClient::DefaultHttpClientFactory(config.docker.host, config.docker.timeout))};
    LOG_INFO << "Docker engine " << docker_client->engineInfo()["Version"].asString() << " is reachable";

    yadwh::Orchestrator::Options options;
    options.label_key = config.label_key;
    options.stop_grace = config.docker.stop_timeout;
    yadwh::Orchestrator orchestrator{docker_client, credentials, options};
    yadwh::Gateway gateway{orchestrator};
    yadwh::WebhookServer server{gateway, config.server};

    // the signals are handled by serveUntil(), every thread inherits the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    if (!server.bind()) {
      return EXIT_FAILURE;
    }
    return server.serveUntil(signals) ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception& ex) {
    LOG_ERROR << ex.what();
  }
  return EXIT_FAILURE;
}
