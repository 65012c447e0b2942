#pragma once

#include "anomaly_detector.hpp"
#include "broadcaster.hpp"
#include "metrics.hpp"
#include "packet_source.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace riptide {

// Background loop: capture source -> anomaly detector -> broadcaster.
class StreamCoordinator {
public:
  struct Timing {
    std::chrono::milliseconds poll_timeout{100};
    std::chrono::milliseconds idle_sleep{10};
    std::chrono::milliseconds error_backoff{1000};
    std::chrono::milliseconds stop_timeout{5000};
  };

  // `detector` may be null; packets are then streamed without classification.
  StreamCoordinator(PacketSource& source, AnomalyDetector* detector,
                    Broadcaster& broadcaster, const Timing& timing);
  StreamCoordinator(PacketSource& source, AnomalyDetector* detector,
                    Broadcaster& broadcaster);
  ~StreamCoordinator();

  StreamCoordinator(const StreamCoordinator&) = delete;
  StreamCoordinator& operator=(const StreamCoordinator&) = delete;

  bool start();
  // Signals the loop and waits up to Timing::stop_timeout; true once it exited.
  bool stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  uint64_t packets_processed() const { return packets_processed_.load(std::memory_order_relaxed); }
  uint64_t alerts_published() const { return alerts_published_.load(std::memory_order_relaxed); }
  uint64_t iteration_errors() const { return iteration_errors_.load(std::memory_order_relaxed); }

private:
  void run();
  void process(const PacketEvent& pkt);
  void backoff(std::chrono::milliseconds delay);

  PacketSource&    source_;
  AnomalyDetector* detector_;
  Broadcaster&     broadcaster_;
  Timing           timing_;

  std::mutex              lifecycle_mutex_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              state_mutex_;
  std::condition_variable state_cv_;
  bool                    stop_requested_ = false;
  bool                    exited_ = true;

  std::atomic<uint64_t> packets_processed_{0};
  std::atomic<uint64_t> alerts_published_{0};
  std::atomic<uint64_t> iteration_errors_{0};
};

}
