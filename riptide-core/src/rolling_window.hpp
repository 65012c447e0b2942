#pragma once

#include "metrics.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace riptide {

// Chronological per-second packet counts, bounded to `capacity` buckets.
// Overflow evicts the oldest bucket.
class RollingWindowStats {
public:
  explicit RollingWindowStats(size_t capacity);

  void push(const TrafficBucket& bucket);
  void resize(size_t capacity);
  void clear() { buckets_.clear(); }

  size_t size() const { return buckets_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return buckets_.empty(); }
  const TrafficBucket& front() const { return buckets_.front(); }

  std::optional<double> mean() const;
  // Sample standard deviation; undefined below two buckets.
  std::optional<double> stddev() const;
  std::optional<double> median() const;
  std::optional<uint64_t> min() const;
  std::optional<uint64_t> max() const;

  std::vector<TrafficBucket> snapshot() const;

private:
  void evict_overflow();

  size_t capacity_;
  std::deque<TrafficBucket> buckets_;
};

}
