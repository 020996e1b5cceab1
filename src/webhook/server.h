#ifndef YADWH_WEBHOOK_SERVER_H_
#define YADWH_WEBHOOK_SERVER_H_

#include <signal.h>

#include <string>

#include <httplib.h>

#include "webhook/gateway.h"
#include "yadwh/config.h"

namespace yadwh {

// Routes `/<name>` (secret in the `secret` query param, the X-YADWH-Secret header or the body)
// and `/<name>/<secret>` for any method to the gateway.
class WebhookServer {
 public:
  WebhookServer(Gateway& gateway, const ServerConfig& config);

  // binds to the configured host and port
  bool bind();
  // binds to a free port of the configured host, returns the port or -1
  int bindToAnyPort();
  // serves on the bound socket until stop() is called
  bool listenAfterBind();
  void stop();
  // Serves on the bound socket until one of `signals` arrives, the signals must be blocked in every thread.
  // Returns false if the server stopped on its own.
  bool serveUntil(const sigset_t& signals);
  bool isRunning() const { return svr_.is_running(); }

  static std::string secretOf(const httplib::Request& req);
  // the request path as logged: the group name only, never the secret
  static std::string loggedTarget(const httplib::Request& req);

 private:
  void registerRoutes();

  Gateway& gateway_;
  const ServerConfig config_;
  httplib::Server svr_;
};

}  // namespace yadwh

#endif  // YADWH_WEBHOOK_SERVER_H_
