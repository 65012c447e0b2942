#pragma once

#include "anomaly_detector.hpp"
#include "broadcaster.hpp"
#include "capture.hpp"
#include "event_schema.hpp"
#include <ixwebsocket/IXHttpServer.h>
#include <atomic>
#include <string>

namespace riptide {

struct ApiResponse {
  int       status = 200;
  wire_json body;
};

// HTTP control surface: status, capture settings and anomaly stats/config.
// `detector` and `capture` may be null, in which case the routes that need
// them answer 503.
class ApiServer {
public:
  ApiServer(uint16_t port, const std::string& host, AnomalyDetector* detector,
            Broadcaster& broadcaster, CaptureEngine* capture);
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  ApiServer& operator=(const ApiServer&) = delete;

  bool start();
  void stop();

  ApiResponse handle(const std::string& method, const std::string& uri,
                     const std::string& body);

private:
  ApiResponse route(const std::string& method, const std::string& path,
                    const std::string& query, const std::string& body);

  ApiResponse get_root() const;
  ApiResponse get_status() const;
  ApiResponse get_interfaces() const;
  ApiResponse post_capture_settings(const std::string& body);
  ApiResponse get_anomaly_stats() const;
  ApiResponse post_anomaly_config(const std::string& query, const std::string& body);

  uint16_t         port_;
  std::string      host_;
  AnomalyDetector* detector_;
  Broadcaster&     broadcaster_;
  CaptureEngine*   capture_;
  ix::HttpServer   server_;
  std::atomic<bool> running_{false};
};

}
