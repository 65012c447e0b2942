#pragma once

#include "metrics.hpp"
#include "rolling_window.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace riptide {

class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

struct AnomalyConfig {
  int    window_size            = 60;   // seconds, [10, 300]
  double threshold              = 3.0;  // |z|, [1.0, 10.0]
  int    min_samples            = 10;   // [5, window_size]
  int    alert_cooldown_seconds = 30;   // [5, 300]

  // Throws ConfigError naming the first offending field.
  void validate() const;
};

AlertLevel alert_level_for(double z_score);
const char* to_string(AlertLevel level);

double system_time_seconds();

// Per-second traffic counter with z-score spike/drop classification.
// All public operations are serialized on one mutex.
class AnomalyDetector {
public:
  using AlertCallback = std::function<void(const AnomalyAlert&)>;
  using WallClock = std::function<double()>;

  explicit AnomalyDetector(const AnomalyConfig& config = AnomalyConfig{},
                           WallClock clock = system_time_seconds);

  AnomalyDetector(const AnomalyDetector&) = delete;
  AnomalyDetector& operator=(const AnomalyDetector&) = delete;

  // Invoked synchronously from add_packet() after the lock is released.
  // The callback must not block for long; it runs on the ingest thread.
  void on_alert(AlertCallback cb);

  std::optional<AnomalyAlert> add_packet(double timestamp);

  DetectorStats get_stats() const;
  AnomalyConfig config() const;
  void update_config(const AnomalyConfig& config);
  void reset();

  std::vector<TrafficBucket> window_snapshot() const;
  uint64_t current_count() const;

private:
  void finalize_locked(int64_t second, uint64_t count);
  std::optional<AnomalyAlert> classify_locked(uint64_t packet_count, double now);
  AnomalyAlert build_alert(double z_score, double mean, double stdev,
                           uint64_t packet_count, double now) const;

  mutable std::mutex mutex_;
  AnomalyConfig      config_;
  WallClock          clock_;
  AlertCallback      alert_callback_;
  RollingWindowStats window_;

  int64_t  current_second_  = 0;
  uint64_t current_count_   = 0;
  double   last_alert_time_ = 0.0;
};

}
