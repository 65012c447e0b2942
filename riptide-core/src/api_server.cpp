#include "api_server.hpp"
#include <climits>
#include <cmath>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <optional>

namespace riptide {

namespace {

const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
  }
}

ApiResponse error_response(int status, const std::string& detail) {
  ApiResponse res;
  res.status = status;
  res.body["detail"] = detail;
  return res;
}

wire_json optional_string(const std::string& s) {
  return s.empty() ? wire_json(nullptr) : wire_json(s);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string url_decode(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '+') {
      out += ' ';
    } else if (s[i] == '%' && i + 2 < s.size() &&
               hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
      out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
      i += 2;
    } else {
      out += s[i];
    }
  }
  return out;
}

// Later duplicates win.
std::map<std::string, std::string> parse_query(const std::string& query) {
  std::map<std::string, std::string> params;
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) end = query.size();

    const std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      const size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        params[url_decode(pair)] = "";
      } else {
        params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
      }
    }
    start = end + 1;
  }
  return params;
}

std::optional<int> parse_int_text(const std::string& s) {
  try {
    size_t pos = 0;
    long long v = std::stoll(s, &pos);
    if (pos != s.size() || v < INT_MIN || v > INT_MAX) return std::nullopt;
    return static_cast<int>(v);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<double> parse_double_text(const std::string& s) {
  try {
    size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Returns an error text, or std::nullopt when the field is absent or was applied.
std::optional<std::string> read_int_field(const nlohmann::json& req, const char* key, int& target) {
  if (!req.contains(key) || req.at(key).is_null()) return std::nullopt;

  const auto& v = req.at(key);
  if (!v.is_number_integer()) {
    return std::string("Field '") + key + "' must be an integer";
  }
  if (v.is_number_unsigned()) {
    const auto u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(INT_MAX)) {
      return std::string("Field '") + key + "' is out of range";
    }
    target = static_cast<int>(u);
  } else {
    const auto i = v.get<int64_t>();
    if (i < INT_MIN || i > INT_MAX) {
      return std::string("Field '") + key + "' is out of range";
    }
    target = static_cast<int>(i);
  }
  return std::nullopt;
}

std::optional<std::string> read_double_field(const nlohmann::json& req, const char* key, double& target) {
  if (!req.contains(key) || req.at(key).is_null()) return std::nullopt;

  const auto& v = req.at(key);
  if (!v.is_number()) {
    return std::string("Field '") + key + "' must be a number";
  }
  target = v.get<double>();
  return std::nullopt;
}

}

ApiServer::ApiServer(uint16_t port, const std::string& host, AnomalyDetector* detector,
                     Broadcaster& broadcaster, CaptureEngine* capture)
  : port_(port), host_(host), detector_(detector), broadcaster_(broadcaster),
    capture_(capture), server_(static_cast<int>(port), host) {}

ApiServer::~ApiServer() {
  stop();
}

bool ApiServer::start() {
  server_.setOnConnectionCallback(
    [this](ix::HttpRequestPtr request,
           std::shared_ptr<ix::ConnectionState> /*state*/) -> ix::HttpResponsePtr {
      ApiResponse res = handle(request->method, request->uri, request->body);

      ix::WebSocketHttpHeaders headers;
      headers["Content-Type"] = "application/json";
      return std::make_shared<ix::HttpResponse>(
        res.status, reason_phrase(res.status), ix::HttpErrorCode::Ok,
        headers, res.body.dump()
      );
    }
  );

  auto res = server_.listen();
  if (!res.first) {
    std::cerr << "[Riptide] HTTP API failed to listen on port "
              << port_ << ": " << res.second << std::endl;
    return false;
  }

  server_.start();
  running_.store(true, std::memory_order_release);
  std::cout << "[Riptide] HTTP API listening on http://" << host_ << ":"
            << port_ << std::endl;
  return true;
}

void ApiServer::stop() {
  if (running_.exchange(false, std::memory_order_acq_rel)) {
    server_.stop();
    std::cout << "[Riptide] HTTP API stopped" << std::endl;
  }
}

ApiResponse ApiServer::handle(const std::string& method, const std::string& uri,
                              const std::string& body) {
  const size_t qmark = uri.find('?');
  const std::string path = uri.substr(0, qmark);
  const std::string query = qmark == std::string::npos ? "" : uri.substr(qmark + 1);
  try {
    return route(method, path, query, body);
  } catch (const std::exception& e) {
    std::cerr << "[Riptide] " << method << " " << path << " failed: " << e.what() << std::endl;
    return error_response(500, "Internal server error");
  }
}

ApiResponse ApiServer::route(const std::string& method, const std::string& path,
                             const std::string& query, const std::string& body) {
  if (path == "/") {
    if (method == "GET") return get_root();
  } else if (path == "/status") {
    if (method == "GET") return get_status();
  } else if (path == "/interfaces") {
    if (method == "GET") return get_interfaces();
  } else if (path == "/capture/settings") {
    if (method == "POST") return post_capture_settings(body);
  } else if (path == "/anomaly/stats") {
    if (method == "GET") return get_anomaly_stats();
  } else if (path == "/anomaly/config") {
    if (method == "POST") return post_anomaly_config(query, body);
  } else {
    return error_response(404, "Not Found");
  }
  return error_response(405, "Method Not Allowed");
}

ApiResponse ApiServer::get_root() const {
  ApiResponse res;
  res.body["name"] = SERVER_NAME;
  res.body["version"] = SERVER_VERSION;
  res.body["endpoints"] = {
    "/status", "/interfaces", "/capture/settings", "/anomaly/stats", "/anomaly/config"
  };
  return res;
}

ApiResponse ApiServer::get_status() const {
  CaptureStatus capture;
  if (capture_) {
    capture = capture_->status();
  }

  ApiResponse res;
  res.body["status"] = capture.running ? "healthy" : "degraded";
  res.body["capture_active"] = capture.running;
  res.body["current_interface"] = optional_string(capture.interface_name);
  res.body["current_filter"] = optional_string(capture.bpf_filter);
  res.body["connected_clients"] = broadcaster_.count();
  res.body["queue_size"] = capture.queue_size;
  res.body["queue_capacity"] = capture.queue_capacity;
  res.body["queue_drops"] = capture.queue_drops;
  res.body["packets_captured"] = capture.packets_captured;
  return res;
}

ApiResponse ApiServer::get_interfaces() const {
  ApiResponse res;
  res.body = wire_json::array();
  for (const auto& iface : CaptureEngine::list_interfaces()) {
    wire_json entry;
    entry["name"] = iface.name;
    entry["description"] = optional_string(iface.description);
    entry["is_up"] = iface.is_up;
    res.body.push_back(entry);
  }
  return res;
}

ApiResponse ApiServer::post_capture_settings(const std::string& body) {
  if (!capture_) {
    return error_response(503, "Packet capture not initialized");
  }

  auto req = nlohmann::json::parse(body, nullptr, false);
  if (req.is_discarded() || !req.is_object()) {
    return error_response(400, "Request body must be a JSON object");
  }
  if (!req.contains("iface") || !req["iface"].is_string()) {
    return error_response(400, "Field 'iface' is required");
  }

  const std::string iface = req["iface"].get<std::string>();
  std::string bpf;
  if (req.contains("bpf") && req["bpf"].is_string()) {
    bpf = req["bpf"].get<std::string>();
  }

  auto interfaces = CaptureEngine::list_interfaces();
  bool found = false;
  std::string available;
  for (const auto& candidate : interfaces) {
    if (candidate.name == iface) found = true;
    if (!available.empty()) available += ", ";
    available += candidate.name;
  }
  if (!found) {
    return error_response(400, "Interface '" + iface + "' not found. Available: [" + available + "]");
  }

  if (auto err = CaptureEngine::validate_bpf_filter(bpf)) {
    return error_response(400, "Invalid BPF filter: " + *err);
  }

  if (!capture_->restart(iface, bpf)) {
    return error_response(500, "Failed to restart packet capture with new settings");
  }

  broadcaster_.publish(
    capture_config_change_message(iface, bpf, system_time_seconds()).dump()
  );

  ApiResponse res;
  res.body["status"] = "success";
  res.body["message"] = "Capture settings updated successfully";
  res.body["interface"] = iface;
  res.body["bpf_filter"] = optional_string(bpf);
  return res;
}

ApiResponse ApiServer::get_anomaly_stats() const {
  if (!detector_) {
    return error_response(503, "Anomaly detection not initialized");
  }

  ApiResponse res;
  res.body["status"] = "active";
  res.body["statistics"] = stats_to_json(detector_->get_stats());
  return res;
}

// Fields come from the query string and the JSON body; the body wins. Missing
// fields take the AnomalyConfig defaults.
ApiResponse ApiServer::post_anomaly_config(const std::string& query, const std::string& body) {
  if (!detector_) {
    return error_response(503, "Anomaly detection not initialized");
  }

  AnomalyConfig config;

  const auto params = parse_query(query);
  auto query_int = [&params](const char* key, int& target) -> std::optional<std::string> {
    auto it = params.find(key);
    if (it == params.end()) return std::nullopt;
    auto v = parse_int_text(it->second);
    if (!v) return std::string("Query parameter '") + key + "' must be an integer";
    target = *v;
    return std::nullopt;
  };

  std::optional<std::string> err = query_int("window_size", config.window_size);
  if (!err) {
    auto it = params.find("threshold");
    if (it != params.end()) {
      if (auto v = parse_double_text(it->second)) {
        config.threshold = *v;
      } else {
        err = std::string("Query parameter 'threshold' must be a number");
      }
    }
  }
  if (!err) err = query_int("min_samples", config.min_samples);
  if (!err) err = query_int("alert_cooldown", config.alert_cooldown_seconds);
  if (err) return error_response(400, *err);

  if (!body.empty()) {
    auto req = nlohmann::json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
      return error_response(400, "Request body must be a JSON object");
    }

    err = read_int_field(req, "window_size", config.window_size);
    if (!err) err = read_double_field(req, "threshold", config.threshold);
    if (!err) err = read_int_field(req, "min_samples", config.min_samples);
    if (!err) err = read_int_field(req, "alert_cooldown", config.alert_cooldown_seconds);
    if (err) return error_response(400, *err);
  }

  try {
    detector_->update_config(config);
  } catch (const ConfigError& e) {
    return error_response(400, e.what());
  }

  broadcaster_.publish(
    anomaly_config_change_message(config, system_time_seconds()).dump()
  );

  ApiResponse res;
  res.body["status"] = "success";
  res.body["message"] = "Anomaly detection configuration updated";
  res.body["config"] = anomaly_config_to_json(config);
  return res;
}

}
