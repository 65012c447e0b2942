#include "broadcaster.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>

namespace riptide {

Broadcaster::Broadcaster(std::chrono::milliseconds send_timeout)
  : send_timeout_(send_timeout) {}

void Broadcaster::register_subscriber(std::shared_ptr<Subscriber> subscriber) {
  if (!subscriber) return;

  size_t total = 0;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    const std::string& id = subscriber->id();
    subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
        [&id](const std::shared_ptr<Subscriber>& s) { return s->id() == id; }),
      subscribers_.end()
    );
    subscribers_.push_back(std::move(subscriber));
    total = subscribers_.size();
  }

  std::cout << "[Riptide] Subscriber registered. Total connections: " << total << std::endl;
}

void Broadcaster::unregister_subscriber(const std::string& id) {
  size_t removed = 0;
  size_t total = 0;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    auto it = std::remove_if(subscribers_.begin(), subscribers_.end(),
      [&id](const std::shared_ptr<Subscriber>& s) { return s->id() == id; });
    removed = static_cast<size_t>(std::distance(it, subscribers_.end()));
    subscribers_.erase(it, subscribers_.end());
    total = subscribers_.size();
  }

  if (removed > 0) {
    std::cout << "[Riptide] Subscriber " << id << " unregistered. Total connections: "
              << total << std::endl;
  }
}

size_t Broadcaster::publish(const std::string& message) {
  std::lock_guard<std::mutex> publish_lock(publish_mutex_);

  SubscriberList snapshot;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    if (subscribers_.empty()) return 0;
    snapshot = subscribers_;
  }

  SubscriberList failed;
  size_t delivered = 0;

  for (const auto& subscriber : snapshot) {
    bool ok = false;
    try {
      ok = subscriber->send(message, send_timeout_);
    } catch (const std::exception& e) {
      std::cerr << "[Riptide] Failed to send to subscriber " << subscriber->id()
                << ": " << e.what() << std::endl;
    }

    if (ok) {
      delivered++;
    } else {
      failed.push_back(subscriber);
    }
  }

  if (!failed.empty()) {
    drop_failed(failed);
  }

  if (delivered > 0) {
    messages_published_.fetch_add(1, std::memory_order_relaxed);
  }
  return delivered;
}

void Broadcaster::drop_failed(const SubscriberList& failed) {
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
        [&failed](const std::shared_ptr<Subscriber>& s) {
          return std::find(failed.begin(), failed.end(), s) != failed.end();
        }),
      subscribers_.end()
    );
  }

  for (const auto& subscriber : failed) {
    try {
      subscriber->close();
    } catch (const std::exception& e) {
      std::cerr << "[Riptide] Error closing subscriber " << subscriber->id()
                << ": " << e.what() << std::endl;
    }
  }

  std::cout << "[Riptide] Removed " << failed.size() << " disconnected subscribers" << std::endl;
}

void Broadcaster::close_all() {
  SubscriberList closing;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    closing.swap(subscribers_);
  }

  for (const auto& subscriber : closing) {
    try {
      subscriber->close();
    } catch (const std::exception& e) {
      std::cerr << "[Riptide] Error closing subscriber " << subscriber->id()
                << ": " << e.what() << std::endl;
    }
  }

  if (!closing.empty()) {
    std::cout << "[Riptide] Closed " << closing.size() << " subscribers" << std::endl;
  }
}

size_t Broadcaster::count() const {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  return subscribers_.size();
}

}
