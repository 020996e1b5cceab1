#include "webhook/server.h"

#include <unistd.h>

#include <atomic>
#include <thread>

#include "logging/logging.h"
#include "utilities/utils.h"

namespace yadwh {

static void json_resp(httplib::Response& res, int code, const Json::Value& data) {
  res.status = code;
  res.set_content(Utils::jsonToStr(data), "application/json");
}

WebhookServer::WebhookServer(Gateway& gateway, const ServerConfig& config) : gateway_{gateway}, config_{config} {
  svr_.set_keep_alive_timeout(static_cast<time_t>(config_.idle_timeout.count()));
  svr_.set_logger([](const httplib::Request& req, const httplib::Response& resp) {
    LOG_INFO << req.method << " " << loggedTarget(req) << " from " << req.remote_addr << " HTTP_" << resp.status;
  });
  registerRoutes();
}

std::string WebhookServer::loggedTarget(const httplib::Request& req) {
  if (req.matches.size() > 1) {
    return "/" + req.matches.str(1);
  }
  // unrouted paths are cut after the first segment as well, the second one may be a secret
  const auto end{req.path.find('/', 1)};
  return end == std::string::npos ? req.path : req.path.substr(0, end) + "/...";
}

std::string WebhookServer::secretOf(const httplib::Request& req) {
  if (req.has_param(Gateway::SecretParam)) {
    const auto secret{req.get_param_value(Gateway::SecretParam)};
    if (!secret.empty()) {
      return secret;
    }
  }
  const auto header{req.get_header_value(Gateway::SecretHeader)};
  if (!header.empty()) {
    return header;
  }
  return req.body;
}

void WebhookServer::registerRoutes() {
  auto handle = [this](const std::string& name, const std::string& secret, httplib::Response& res) {
    try {
      json_resp(res, 200, gateway_.handle(name, secret));
    } catch (const ApiException& exc) {
      json_resp(res, exc.status, exc.resp);
    } catch (const std::exception& exc) {
      LOG_ERROR << "Webhook call for " << name << " failed: " << exc.what();
      Json::Value data;
      data["error"] = exc.what();
      json_resp(res, 500, data);
    }
  };

  const httplib::Server::Handler by_name = [handle](const httplib::Request& req, httplib::Response& res) {
    handle(req.matches[1].str(), secretOf(req), res);
  };
  const httplib::Server::Handler by_path = [handle](const httplib::Request& req, httplib::Response& res) {
    handle(req.matches[1].str(), req.matches[2].str(), res);
  };

  static const std::string name_route{R"(/([^/]+))"};
  static const std::string secret_route{R"(/([^/]+)/([^/]+))"};
  for (const auto& route : {std::make_pair(name_route, by_name), std::make_pair(secret_route, by_path)}) {
    svr_.Get(route.first, route.second);
    svr_.Post(route.first, route.second);
    svr_.Put(route.first, route.second);
    svr_.Patch(route.first, route.second);
    svr_.Delete(route.first, route.second);
  }
}

bool WebhookServer::bind() {
  if (!svr_.bind_to_port(config_.host.c_str(), config_.port)) {
    LOG_ERROR << "Cannot listen on " << config_.host << ":" << config_.port;
    return false;
  }
  LOG_INFO << "Webhook server listening on " << config_.host << ":" << config_.port;
  return true;
}

int WebhookServer::bindToAnyPort() { return svr_.bind_to_any_port(config_.host.c_str()); }

bool WebhookServer::listenAfterBind() { return svr_.listen_after_bind(); }

void WebhookServer::stop() {
  if (svr_.is_running()) {
    LOG_INFO << "Shutting down Web-Server";
  }
  svr_.stop();
}

bool WebhookServer::serveUntil(const sigset_t& signals) {
  std::atomic_bool stopping{false};
  std::atomic_bool listen_failed{false};
  std::thread server_thread{[this, &stopping, &listen_failed]() {
    const bool served{listenAfterBind()};
    // any return before stop() has been requested is a failure
    if (!stopping) {
      LOG_ERROR << "Web-Server has stopped unexpectedly" << (served ? "" : ", failed to listen");
      listen_failed = true;
      kill(getpid(), SIGTERM);
    }
  }};

  int sig{0};
  sigwait(&signals, &sig);
  LOG_INFO << "Got signal " << sig;
  stopping = true;
  stop();
  server_thread.join();
  return !listen_failed;
}

}  // namespace yadwh
