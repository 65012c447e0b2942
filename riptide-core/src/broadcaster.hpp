#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace riptide {

// One live delivery channel to a connected client.
class Subscriber {
public:
  virtual ~Subscriber() = default;

  virtual const std::string& id() const = 0;

  // Returns false (or throws) when the message could not be delivered
  // within `timeout`. A failed subscriber is dropped by the Broadcaster.
  virtual bool send(const std::string& message, std::chrono::milliseconds timeout) = 0;

  virtual void close() = 0;
};

// Fan-out hub: every published message goes to each registered subscriber once.
class Broadcaster {
public:
  explicit Broadcaster(std::chrono::milliseconds send_timeout = std::chrono::milliseconds(1000));

  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  void register_subscriber(std::shared_ptr<Subscriber> subscriber);
  void unregister_subscriber(const std::string& id);

  // Returns the number of subscribers that accepted the message.
  size_t publish(const std::string& message);

  void close_all();

  size_t count() const;

  uint64_t messages_published() const {
    return messages_published_.load(std::memory_order_relaxed);
  }

private:
  using SubscriberList = std::vector<std::shared_ptr<Subscriber>>;

  void drop_failed(const SubscriberList& failed);

  std::chrono::milliseconds send_timeout_;
  mutable std::mutex subscribers_mutex_;
  SubscriberList     subscribers_;
  // Serializes publishers so each subscriber sees publish order.
  std::mutex         publish_mutex_;
  std::atomic<uint64_t> messages_published_{0};
};

}
