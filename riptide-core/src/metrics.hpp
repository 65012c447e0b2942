#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace riptide {

struct PacketEvent {
  double      timestamp = 0.0;
  std::string source_addr;
  std::string dest_addr;
  std::string protocol = "Unknown";
  uint32_t    length = 0;

  // Present only for TCP/UDP
  std::optional<uint16_t> source_port;
  std::optional<uint16_t> dest_port;

  std::string summary;
};

struct TrafficBucket {
  int64_t  second = 0;
  uint64_t packet_count = 0;
};

enum class AlertLevel : uint8_t {
  Info,
  Warning,
  Critical
};

struct AlertMeta {
  int64_t  window_start = 0;
  size_t   window_size = 0;
  uint64_t packet_count = 0;
  double   z_score = 0.0;
  double   threshold = 0.0;
  double   mean_packets = 0.0;
  double   stdev_packets = 0.0;
};

struct AnomalyAlert {
  AlertLevel  level = AlertLevel::Info;
  std::string message;
  double      timestamp = 0.0;
  AlertMeta   meta;
};

struct DetectorStats {
  size_t   window_size = 0;
  size_t   max_window_size = 0;
  uint64_t current_packets_per_sec = 0;
  double   threshold = 0.0;
  size_t   min_samples = 0;
  uint32_t alert_cooldown = 0;
  double   last_alert_time = 0.0;

  std::optional<double>   mean;
  std::optional<double>   median;
  std::optional<uint64_t> max;
  std::optional<uint64_t> min;
  std::optional<double>   stdev;
};

struct MonitorConfig {
  std::string interface_name      = "";
  std::string bpf_filter          = "";
  std::string bind_host           = "127.0.0.1";
  uint16_t    ws_port             = 8765;
  uint16_t    api_port            = 8000;
  std::chrono::milliseconds poll_timeout{100};
  std::chrono::milliseconds idle_sleep{10};
  std::chrono::milliseconds error_backoff{1000};
  std::chrono::milliseconds send_timeout{1000};
  std::chrono::milliseconds stop_timeout{5000};
};

}
