#pragma once

#include "metrics.hpp"
#include "packet_source.hpp"
#include "ring_buffer.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct pcap;
typedef struct pcap pcap_t;

namespace riptide {

struct NetworkInterface {
  std::string name;
  std::string description;
  bool        is_loopback;
  bool        is_up;
  bool        has_ipv4;
};

struct CaptureStatus {
  bool        running = false;
  std::string interface_name;
  std::string bpf_filter;
  size_t      queue_size = 0;
  size_t      queue_capacity = 0;
  uint64_t    queue_drops = 0;
  uint64_t    packets_captured = 0;
};

class CaptureEngine : public PacketSource {
public:
  using PacketQueue = RingBuffer<PacketEvent, 1024>;

  CaptureEngine() = default;
  ~CaptureEngine() override;

  CaptureEngine(const CaptureEngine&) = delete;
  CaptureEngine& operator=(const CaptureEngine&) = delete;

  static std::vector<NetworkInterface> list_interfaces();
  static std::string auto_detect_interface();

  // Returns the compiler error text, or std::nullopt when the expression is valid.
  static std::optional<std::string> validate_bpf_filter(const std::string& expression);

  // Normalizes one captured frame. Non-IP frames yield std::nullopt.
  static std::optional<PacketEvent> parse_frame(const uint8_t* data, uint32_t caplen,
                                                uint32_t wirelen, int link_type,
                                                double timestamp);

  bool start(const std::string& interface_name, const std::string& bpf_filter);
  void stop();
  bool restart(const std::string& interface_name, const std::string& bpf_filter);

  std::optional<PacketEvent> pull(std::chrono::milliseconds timeout) override;

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  uint64_t packets_captured() const { return packets_captured_.load(std::memory_order_relaxed); }
  uint64_t packets_dropped() const { return queue_.drops(); }
  CaptureStatus status() const;

private:
  void capture_loop(int link_type);
  void stop_locked();

  PacketQueue           queue_;
  mutable std::mutex    lifecycle_mutex_;
  std::string           interface_;
  std::string           bpf_filter_;
  pcap_t*               handle_ = nullptr;
  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> packets_captured_{0};
};

}
