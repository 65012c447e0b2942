#pragma once

#include "metrics.hpp"
#include "anomaly_detector.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <optional>
#include <string>

namespace riptide {

// Wire objects keep insertion order so clients see the documented key layout.
using wire_json = nlohmann::ordered_json;

constexpr const char* SERVER_NAME    = "riptide";
constexpr const char* SERVER_VERSION = "0.1.0";

inline double round_to(double v, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(v * scale) / scale;
}

inline wire_json packet_to_json(const PacketEvent& pkt) {
  wire_json j;
  j["ts"] = pkt.timestamp;
  j["src"] = pkt.source_addr;
  j["dst"] = pkt.dest_addr;
  j["proto"] = pkt.protocol;
  j["length"] = pkt.length;
  j["sport"] = pkt.source_port ? wire_json(*pkt.source_port) : wire_json(nullptr);
  j["dport"] = pkt.dest_port ? wire_json(*pkt.dest_port) : wire_json(nullptr);
  j["summary"] = pkt.summary;
  return j;
}

inline wire_json alert_to_json(const AnomalyAlert& alert) {
  wire_json j;
  j["type"] = "alert";
  j["level"] = to_string(alert.level);
  j["message"] = alert.message;
  j["timestamp"] = alert.timestamp;

  wire_json meta;
  meta["window_start"] = alert.meta.window_start;
  meta["window_size"] = alert.meta.window_size;
  meta["packet_count"] = alert.meta.packet_count;
  meta["z_score"] = round_to(alert.meta.z_score, 3);
  meta["threshold"] = alert.meta.threshold;
  meta["mean_packets"] = round_to(alert.meta.mean_packets, 2);
  meta["stdev_packets"] = round_to(alert.meta.stdev_packets, 2);
  j["meta"] = meta;

  return j;
}

inline wire_json stats_to_json(const DetectorStats& stats) {
  wire_json j;
  j["window_size"] = stats.window_size;
  j["max_window_size"] = stats.max_window_size;
  j["current_packets_per_sec"] = stats.current_packets_per_sec;
  j["threshold"] = stats.threshold;
  j["min_samples"] = stats.min_samples;
  j["alert_cooldown"] = stats.alert_cooldown;
  j["last_alert_time"] = stats.last_alert_time;

  if (stats.mean)   j["mean_packets"] = round_to(*stats.mean, 2);
  if (stats.median) j["median_packets"] = round_to(*stats.median, 2);
  if (stats.max)    j["max_packets"] = *stats.max;
  if (stats.min)    j["min_packets"] = *stats.min;
  if (stats.stdev)  j["stdev_packets"] = round_to(*stats.stdev, 2);

  return j;
}

inline wire_json anomaly_config_to_json(const AnomalyConfig& config) {
  wire_json j;
  j["window_size"] = config.window_size;
  j["threshold"] = config.threshold;
  j["min_samples"] = config.min_samples;
  j["alert_cooldown"] = config.alert_cooldown_seconds;
  return j;
}

inline wire_json anomaly_config_change_message(const AnomalyConfig& config, double timestamp) {
  wire_json j;
  j["type"] = "anomaly_config_change";
  const wire_json fields = anomaly_config_to_json(config);
  for (const auto& item : fields.items()) {
    j[item.key()] = item.value();
  }
  j["timestamp"] = timestamp;
  return j;
}

inline wire_json capture_config_change_message(const std::string& iface,
                                               const std::string& bpf_filter,
                                               double timestamp) {
  wire_json j;
  j["type"] = "config_change";
  j["interface"] = iface;
  j["bpf_filter"] = bpf_filter;
  j["timestamp"] = timestamp;
  return j;
}

// Reply to a client liveness frame, or std::nullopt for anything else.
inline std::optional<std::string> liveness_reply(const std::string& frame) {
  if (frame == "ping") return std::string("pong");

  auto cmd = nlohmann::json::parse(frame, nullptr, false);
  if (!cmd.is_object() || !cmd.contains("type") || cmd["type"] != "ping") {
    return std::nullopt;
  }

  wire_json pong;
  pong["type"] = "pong";
  pong["t"] = (cmd.contains("t") && cmd["t"].is_number()) ? cmd["t"].get<double>() : 0.0;
  return pong.dump();
}

inline wire_json hello_message() {
  wire_json j;
  j["type"] = "hello";
  j["server"] = SERVER_NAME;
  j["version"] = SERVER_VERSION;
  return j;
}

}
