#include "yadwh/config.h"

#include <limits>
#include <stdexcept>

#include <boost/property_tree/ini_parser.hpp>

#include "logging/logging.h"
#include "utilities/utils.h"

namespace yadwh {

static boost::property_tree::ptree readIni(const boost::filesystem::path& path) {
  boost::property_tree::ptree pt;
  try {
    boost::property_tree::ini_parser::read_ini(path.string(), pt);
  } catch (const boost::property_tree::ini_parser_error& exc) {
    throw std::invalid_argument("Failed to parse config file " + path.string() + ": " + exc.what());
  }
  return pt;
}

template <typename T>
static void readOption(const boost::property_tree::ptree& pt, const std::string& path, T& dest) {
  const auto raw{pt.get_optional<std::string>(path)};
  if (!raw) {
    return;
  }
  const boost::property_tree::ptree unquoted{Utils::stripQuotes(*raw)};
  const auto value{unquoted.get_value_optional<T>()};
  if (!value) {
    throw std::invalid_argument("Invalid value of `" + path + "`: " + *raw);
  }
  dest = *value;
}

static void readSeconds(const boost::property_tree::ptree& pt, const std::string& path, std::chrono::seconds& dest) {
  int64_t seconds{dest.count()};
  readOption(pt, path, seconds);
  if (seconds < 0) {
    throw std::invalid_argument("`" + path + "` must not be negative: " + std::to_string(seconds));
  }
  dest = std::chrono::seconds(seconds);
}

Config::Config(const boost::filesystem::path& path) : raw{readIni(path)} { updateFromPropertyTree(); }

Config::Config(boost::property_tree::ptree pt) : raw{std::move(pt)} { updateFromPropertyTree(); }

void Config::updateFromPropertyTree() {
  readOption(raw, "server.host", server.host);
  int port{server.port};
  readOption(raw, "server.port", port);
  if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
    throw std::invalid_argument("Invalid `server.port`: " + std::to_string(port));
  }
  server.port = static_cast<uint16_t>(port);
  readSeconds(raw, "server.idle_timeout", server.idle_timeout);

  readOption(raw, "docker.host", docker.host);
  readSeconds(raw, "docker.stop_timeout", docker.stop_timeout);
  readSeconds(raw, "docker.timeout", docker.timeout);
  if (docker.timeout != std::chrono::seconds::zero() && docker.timeout <= docker.stop_timeout) {
    LOG_WARNING << "`docker.timeout` (" << docker.timeout.count() << "s) doesn't exceed `docker.stop_timeout` ("
                << docker.stop_timeout.count() << "s), stop requests may time out before the container stops";
  }

  readOption(raw, "label.key", label_key);
  if (label_key.empty()) {
    throw std::invalid_argument("`label.key` must not be empty");
  }
  readOption(raw, "logging.level", log_level);
}

}  // namespace yadwh
