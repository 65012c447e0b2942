#include "stream_coordinator.hpp"
#include "event_schema.hpp"
#include <exception>
#include <iostream>

namespace riptide {

StreamCoordinator::StreamCoordinator(PacketSource& source, AnomalyDetector* detector,
                                     Broadcaster& broadcaster, const Timing& timing)
  : source_(source), detector_(detector), broadcaster_(broadcaster), timing_(timing) {}

StreamCoordinator::StreamCoordinator(PacketSource& source, AnomalyDetector* detector,
                                     Broadcaster& broadcaster)
  : StreamCoordinator(source, detector, broadcaster, Timing{}) {}

StreamCoordinator::~StreamCoordinator() {
  stop();
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StreamCoordinator::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!exited_) {
      std::cerr << "[Riptide] Stream coordinator already running" << std::endl;
      return false;
    }
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = false;
    exited_ = false;
  }
  running_.store(true, std::memory_order_release);
  thread_ = std::thread([this]() { run(); });
  return true;
}

bool StreamCoordinator::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  std::unique_lock<std::mutex> lock(state_mutex_);
  stop_requested_ = true;
  state_cv_.notify_all();

  const bool exited = state_cv_.wait_for(lock, timing_.stop_timeout, [this] { return exited_; });
  lock.unlock();

  if (!exited) {
    std::cerr << "[Riptide] Stream coordinator did not stop within "
              << timing_.stop_timeout.count() << "ms" << std::endl;
    return false;
  }

  if (thread_.joinable()) {
    thread_.join();
  }
  return true;
}

void StreamCoordinator::run() {
  std::cout << "[Riptide] Stream coordinator started (poll timeout: "
            << timing_.poll_timeout.count() << "ms)" << std::endl;

  bool source_down = false;

  while (true) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (stop_requested_) break;
    }

    try {
      auto pkt = source_.pull(timing_.poll_timeout);

      if (source_down) {
        std::cout << "[Riptide] Packet source available again" << std::endl;
        source_down = false;
      }

      if (!pkt) {
        backoff(timing_.idle_sleep);
        continue;
      }

      process(*pkt);

    } catch (const SourceUnavailable& e) {
      if (!source_down) {
        std::cerr << "[Riptide] Packet source unavailable: " << e.what()
                  << " (will keep polling)" << std::endl;
        source_down = true;
      }
      backoff(timing_.error_backoff);

    } catch (const std::exception& e) {
      iteration_errors_.fetch_add(1, std::memory_order_relaxed);
      std::cerr << "[Riptide] Error in stream loop: " << e.what() << std::endl;
      backoff(timing_.error_backoff);
    }
  }

  running_.store(false, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    exited_ = true;
  }
  state_cv_.notify_all();

  std::cout << "[Riptide] Stream coordinator stopped (" << packets_processed()
            << " packets, " << alerts_published() << " alerts)" << std::endl;
}

void StreamCoordinator::process(const PacketEvent& pkt) {
  packets_processed_.fetch_add(1, std::memory_order_relaxed);

  if (detector_) {
    auto alert = detector_->add_packet(pkt.timestamp);
    if (alert) {
      broadcaster_.publish(alert_to_json(*alert).dump());
      alerts_published_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  broadcaster_.publish(packet_to_json(pkt).dump());
}

void StreamCoordinator::backoff(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait_for(lock, delay, [this] { return stop_requested_; });
}

}
