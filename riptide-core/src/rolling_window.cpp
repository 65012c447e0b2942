#include "rolling_window.hpp"
#include <algorithm>
#include <cmath>

namespace riptide {

RollingWindowStats::RollingWindowStats(size_t capacity)
  : capacity_(capacity) {}

void RollingWindowStats::push(const TrafficBucket& bucket) {
  buckets_.push_back(bucket);
  evict_overflow();
}

void RollingWindowStats::resize(size_t capacity) {
  capacity_ = capacity;
  evict_overflow();
}

void RollingWindowStats::evict_overflow() {
  while (buckets_.size() > capacity_) {
    buckets_.pop_front();
  }
}

std::optional<double> RollingWindowStats::mean() const {
  if (buckets_.empty()) return std::nullopt;

  double sum = 0.0;
  for (const auto& b : buckets_) {
    sum += static_cast<double>(b.packet_count);
  }
  return sum / static_cast<double>(buckets_.size());
}

std::optional<double> RollingWindowStats::stddev() const {
  if (buckets_.size() < 2) return std::nullopt;

  const double m = *mean();
  double sq_sum = 0.0;
  for (const auto& b : buckets_) {
    double d = static_cast<double>(b.packet_count) - m;
    sq_sum += d * d;
  }
  return std::sqrt(sq_sum / static_cast<double>(buckets_.size() - 1));
}

std::optional<double> RollingWindowStats::median() const {
  if (buckets_.empty()) return std::nullopt;

  std::vector<uint64_t> counts;
  counts.reserve(buckets_.size());
  for (const auto& b : buckets_) counts.push_back(b.packet_count);
  std::sort(counts.begin(), counts.end());

  const size_t mid = counts.size() / 2;
  if (counts.size() % 2 == 1) {
    return static_cast<double>(counts[mid]);
  }
  return (static_cast<double>(counts[mid - 1]) + static_cast<double>(counts[mid])) / 2.0;
}

std::optional<uint64_t> RollingWindowStats::min() const {
  if (buckets_.empty()) return std::nullopt;
  auto it = std::min_element(
    buckets_.begin(), buckets_.end(),
    [](const TrafficBucket& a, const TrafficBucket& b) { return a.packet_count < b.packet_count; }
  );
  return it->packet_count;
}

std::optional<uint64_t> RollingWindowStats::max() const {
  if (buckets_.empty()) return std::nullopt;
  auto it = std::max_element(
    buckets_.begin(), buckets_.end(),
    [](const TrafficBucket& a, const TrafficBucket& b) { return a.packet_count < b.packet_count; }
  );
  return it->packet_count;
}

std::vector<TrafficBucket> RollingWindowStats::snapshot() const {
  return std::vector<TrafficBucket>(buckets_.begin(), buckets_.end());
}

}
