#include "anomaly_detector.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace riptide {

namespace {

constexpr int    MIN_WINDOW_SIZE   = 10;
constexpr int    MAX_WINDOW_SIZE   = 300;
constexpr double MIN_THRESHOLD     = 1.0;
constexpr double MAX_THRESHOLD     = 10.0;
constexpr int    MIN_SAMPLES_FLOOR = 5;
constexpr int    MIN_COOLDOWN      = 5;
constexpr int    MAX_COOLDOWN      = 300;

constexpr double WARNING_Z  = 4.0;
constexpr double CRITICAL_Z = 5.0;

}

void AnomalyConfig::validate() const {
  std::ostringstream err;

  if (window_size < MIN_WINDOW_SIZE || window_size > MAX_WINDOW_SIZE) {
    err << "window_size must be between " << MIN_WINDOW_SIZE << " and "
        << MAX_WINDOW_SIZE << " seconds (got " << window_size << ")";
  } else if (!(threshold >= MIN_THRESHOLD && threshold <= MAX_THRESHOLD)) {
    err << "threshold must be between " << MIN_THRESHOLD << " and "
        << MAX_THRESHOLD << " (got " << threshold << ")";
  } else if (min_samples < MIN_SAMPLES_FLOOR || min_samples > window_size) {
    err << "min_samples must be between " << MIN_SAMPLES_FLOOR
        << " and window_size " << window_size << " (got " << min_samples << ")";
  } else if (alert_cooldown_seconds < MIN_COOLDOWN || alert_cooldown_seconds > MAX_COOLDOWN) {
    err << "alert_cooldown must be between " << MIN_COOLDOWN << " and "
        << MAX_COOLDOWN << " seconds (got " << alert_cooldown_seconds << ")";
  } else {
    return;
  }

  throw ConfigError(err.str());
}

AlertLevel alert_level_for(double z_score) {
  const double magnitude = std::fabs(z_score);
  if (magnitude >= CRITICAL_Z) return AlertLevel::Critical;
  if (magnitude >= WARNING_Z) return AlertLevel::Warning;
  return AlertLevel::Info;
}

const char* to_string(AlertLevel level) {
  switch (level) {
    case AlertLevel::Critical: return "critical";
    case AlertLevel::Warning:  return "warning";
    case AlertLevel::Info:     return "info";
  }
  return "info";
}

double system_time_seconds() {
  return std::chrono::duration<double>(
    std::chrono::system_clock::now().time_since_epoch()
  ).count();
}

AnomalyDetector::AnomalyDetector(const AnomalyConfig& config, WallClock clock)
  : config_(config),
    clock_(std::move(clock)),
    window_(0) {
  config_.validate();
  window_.resize(static_cast<size_t>(config_.window_size));
  current_second_ = static_cast<int64_t>(clock_());

  std::cout << "[Riptide] Anomaly detector initialized (window_size="
            << config_.window_size << ", threshold=" << config_.threshold
            << ")" << std::endl;
}

void AnomalyDetector::on_alert(AlertCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  alert_callback_ = std::move(cb);
}

std::optional<AnomalyAlert> AnomalyDetector::add_packet(double timestamp) {
  std::optional<AnomalyAlert> alert;
  AlertCallback callback;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto packet_second = static_cast<int64_t>(timestamp);

    if (packet_second == current_second_) {
      current_count_++;
      return std::nullopt;
    }

    const double now = clock_();

    if (current_count_ > 0) {
      finalize_locked(current_second_, current_count_);
      alert = classify_locked(current_count_, now);
    }

    // Zero-fill silent seconds. Each call reports at most one alert, so once
    // one has fired the remaining gap buckets are pushed unclassified.
    const auto cap = static_cast<int64_t>(window_.capacity());
    int64_t zeros_pushed = 0;
    while (current_second_ < packet_second - 1) {
      // After a full window of zeros stddev is 0 and nothing can alert;
      // skip seconds that would be evicted anyway.
      if (zeros_pushed >= cap && (packet_second - 1) - current_second_ > cap) {
        current_second_ = (packet_second - 1) - cap;
      }

      current_second_++;
      finalize_locked(current_second_, 0);
      zeros_pushed++;

      if (!alert) {
        alert = classify_locked(0, now);
      }
    }

    current_second_ = packet_second;
    current_count_ = 1;

    if (alert) {
      callback = alert_callback_;
    }
  }

  if (alert && callback) {
    callback(*alert);
  }
  return alert;
}

void AnomalyDetector::finalize_locked(int64_t second, uint64_t count) {
  TrafficBucket bucket;
  bucket.second = second;
  bucket.packet_count = count;
  window_.push(bucket);
}

std::optional<AnomalyAlert> AnomalyDetector::classify_locked(uint64_t packet_count, double now) {
  if (window_.size() < static_cast<size_t>(config_.min_samples)) {
    return std::nullopt;
  }

  if (now - last_alert_time_ < static_cast<double>(config_.alert_cooldown_seconds)) {
    return std::nullopt;
  }

  // The count under test was pushed before this call, so it is part of the
  // population it is scored against. Intentional; do not exclude it.
  auto stdev = window_.stddev();
  if (!stdev || *stdev == 0.0) {
    return std::nullopt;
  }
  const double mean = *window_.mean();

  const double z_score = (static_cast<double>(packet_count) - mean) / *stdev;
  if (std::fabs(z_score) < config_.threshold) {
    return std::nullopt;
  }

  AnomalyAlert alert = build_alert(z_score, mean, *stdev, packet_count, now);
  last_alert_time_ = now;
  return alert;
}

AnomalyAlert AnomalyDetector::build_alert(
  double z_score, double mean, double stdev, uint64_t packet_count, double now
) const {
  AnomalyAlert alert;
  alert.level = alert_level_for(z_score);
  alert.timestamp = now;

  char msgbuf[128];
  int len = snprintf(msgbuf, sizeof(msgbuf),
    "Traffic %s detected: %llu packets/sec (z-score: %.2f)",
    z_score > 0 ? "spike" : "drop",
    static_cast<unsigned long long>(packet_count),
    z_score);
  alert.message.assign(msgbuf, len > 0 ? static_cast<size_t>(len) : 0);

  alert.meta.window_start = window_.empty() ? static_cast<int64_t>(now) : window_.front().second;
  alert.meta.window_size = window_.size();
  alert.meta.packet_count = packet_count;
  alert.meta.z_score = z_score;
  alert.meta.threshold = config_.threshold;
  alert.meta.mean_packets = mean;
  alert.meta.stdev_packets = stdev;

  return alert;
}

DetectorStats AnomalyDetector::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);

  DetectorStats stats;
  stats.window_size = window_.size();
  stats.max_window_size = static_cast<size_t>(config_.window_size);
  stats.current_packets_per_sec = current_count_;
  stats.threshold = config_.threshold;
  stats.min_samples = static_cast<size_t>(config_.min_samples);
  stats.alert_cooldown = static_cast<uint32_t>(config_.alert_cooldown_seconds);
  stats.last_alert_time = last_alert_time_;

  stats.mean = window_.mean();
  stats.median = window_.median();
  stats.max = window_.max();
  stats.min = window_.min();
  stats.stdev = window_.stddev();

  return stats;
}

AnomalyConfig AnomalyDetector::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

void AnomalyDetector::update_config(const AnomalyConfig& config) {
  config.validate();

  std::lock_guard<std::mutex> lock(mutex_);
  const int old_window_size = config_.window_size;
  config_ = config;

  if (config_.window_size != old_window_size) {
    window_.resize(static_cast<size_t>(config_.window_size));
  }

  std::cout << "[Riptide] Anomaly config updated (window_size=" << config_.window_size
            << ", threshold=" << config_.threshold
            << ", min_samples=" << config_.min_samples
            << ", alert_cooldown=" << config_.alert_cooldown_seconds << ")" << std::endl;
}

void AnomalyDetector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  window_.clear();
  current_second_ = static_cast<int64_t>(clock_());
  current_count_ = 0;
  last_alert_time_ = 0.0;

  std::cout << "[Riptide] Anomaly detector state reset" << std::endl;
}

std::vector<TrafficBucket> AnomalyDetector::window_snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return window_.snapshot();
}

uint64_t AnomalyDetector::current_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_count_;
}

}
