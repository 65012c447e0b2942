#include <gtest/gtest.h>
#include "stream_coordinator.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace riptide;

namespace {

constexpr double T = 1700000000.0;

// Replays a fixed script of pull() outcomes, then reports an idle source.
class ScriptedSource : public PacketSource {
public:
  using Step = std::function<std::optional<PacketEvent>()>;

  void add_packet(double ts) {
    PacketEvent pkt;
    pkt.timestamp = ts;
    pkt.source_addr = "10.0.0.1";
    pkt.dest_addr = "10.0.0.2";
    pkt.protocol = "UDP";
    pkt.length = 64;
    pkt.source_port = 4000;
    pkt.dest_port = 53;
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back([pkt]() -> std::optional<PacketEvent> { return pkt; });
  }

  void add_unavailable() {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back([]() -> std::optional<PacketEvent> {
      throw SourceUnavailable("interface down");
    });
  }

  void add_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back([]() -> std::optional<PacketEvent> {
      throw std::runtime_error("decoder exploded");
    });
  }

  std::optional<PacketEvent> pull(std::chrono::milliseconds timeout) override {
    Step step;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!steps_.empty()) {
        step = steps_.front();
        steps_.pop_front();
      }
    }
    if (step) return step();

    std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
    return std::nullopt;
  }

private:
  std::mutex mutex_;
  std::deque<Step> steps_;
};

class CollectingSubscriber : public Subscriber {
public:
  const std::string& id() const override { return id_; }

  bool send(const std::string& message, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(message);
    return true;
  }

  void close() override {}

  std::vector<std::string> messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

private:
  std::string id_ = "collector";
  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
};

bool wait_for(const std::function<bool()>& condition,
              std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return condition();
}

}

class StreamCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    timing.poll_timeout = std::chrono::milliseconds(10);
    timing.idle_sleep = std::chrono::milliseconds(1);
    timing.error_backoff = std::chrono::milliseconds(5);
    timing.stop_timeout = std::chrono::milliseconds(2000);

    subscriber = std::make_shared<CollectingSubscriber>();
    broadcaster.register_subscriber(subscriber);
  }

  StreamCoordinator::Timing timing;
  ScriptedSource source;
  Broadcaster broadcaster;
  std::shared_ptr<CollectingSubscriber> subscriber;
};

TEST_F(StreamCoordinatorTest, StreamsPacketsInOrder) {
  source.add_packet(T + 0.1);
  source.add_packet(T + 0.2);
  source.add_packet(T + 0.3);

  StreamCoordinator coordinator(source, nullptr, broadcaster, timing);
  ASSERT_TRUE(coordinator.start());
  ASSERT_TRUE(wait_for([&] { return subscriber->messages().size() >= 3; }));
  EXPECT_TRUE(coordinator.stop());

  auto messages = subscriber->messages();
  ASSERT_EQ(messages.size(), 3u);
  for (size_t i = 0; i < messages.size(); i++) {
    auto j = nlohmann::json::parse(messages[i]);
    EXPECT_EQ(j["src"], "10.0.0.1");
    EXPECT_DOUBLE_EQ(j["ts"].get<double>(), T + 0.1 * static_cast<double>(i + 1));
  }
  EXPECT_EQ(coordinator.packets_processed(), 3u);
  EXPECT_EQ(coordinator.alerts_published(), 0u);
}

TEST_F(StreamCoordinatorTest, AlertPrecedesTriggeringPacket) {
  AnomalyConfig config;
  config.window_size = 10;
  config.threshold = 2.0;
  config.min_samples = 5;
  config.alert_cooldown_seconds = 10;
  AnomalyDetector detector(config, []() { return T; });

  const int counts[] = {2, 2, 2, 2, 2, 10, 1};
  size_t total = 0;
  for (int s = 0; s < 7; s++) {
    for (int i = 0; i < counts[s]; i++) {
      source.add_packet(T + s + 0.01 * i);
      total++;
    }
  }

  StreamCoordinator coordinator(source, &detector, broadcaster, timing);
  ASSERT_TRUE(coordinator.start());
  ASSERT_TRUE(wait_for([&] { return subscriber->messages().size() >= total + 1; }));
  EXPECT_TRUE(coordinator.stop());

  auto messages = subscriber->messages();
  ASSERT_EQ(messages.size(), total + 1);

  auto alert = nlohmann::json::parse(messages[total - 1]);
  EXPECT_EQ(alert["type"], "alert");
  EXPECT_EQ(alert["level"], "info");
  EXPECT_EQ(alert["meta"]["packet_count"].get<int>(), 10);

  auto trigger = nlohmann::json::parse(messages[total]);
  EXPECT_FALSE(trigger.contains("type"));
  EXPECT_DOUBLE_EQ(trigger["ts"].get<double>(), T + 6);

  EXPECT_EQ(coordinator.alerts_published(), 1u);
  EXPECT_EQ(coordinator.packets_processed(), total);
}

TEST_F(StreamCoordinatorTest, SurvivesSourceErrors) {
  source.add_unavailable();
  source.add_unavailable();
  source.add_failure();
  source.add_packet(T);

  StreamCoordinator coordinator(source, nullptr, broadcaster, timing);
  ASSERT_TRUE(coordinator.start());
  ASSERT_TRUE(wait_for([&] { return subscriber->messages().size() >= 1; }));
  EXPECT_TRUE(coordinator.stop());

  EXPECT_EQ(coordinator.iteration_errors(), 1u);
  EXPECT_EQ(coordinator.packets_processed(), 1u);
}

TEST_F(StreamCoordinatorTest, StartStopLifecycle) {
  StreamCoordinator coordinator(source, nullptr, broadcaster, timing);

  EXPECT_TRUE(coordinator.stop());
  ASSERT_TRUE(coordinator.start());
  EXPECT_TRUE(wait_for([&] { return coordinator.is_running(); }));
  EXPECT_FALSE(coordinator.start());

  EXPECT_TRUE(coordinator.stop());
  EXPECT_FALSE(coordinator.is_running());
  EXPECT_TRUE(coordinator.stop());

  source.add_packet(T);
  ASSERT_TRUE(coordinator.start());
  EXPECT_TRUE(wait_for([&] { return subscriber->messages().size() >= 1; }));
  EXPECT_TRUE(coordinator.stop());
}
