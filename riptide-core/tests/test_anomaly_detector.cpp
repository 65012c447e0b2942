#include <gtest/gtest.h>
#include "anomaly_detector.hpp"

#include <memory>
#include <optional>
#include <vector>

using namespace riptide;

class AnomalyDetectorTest : public ::testing::Test {
protected:
  static constexpr double T = 1700000000.0;

  void SetUp() override {
    now = T;
    config.window_size = 10;
    config.threshold = 2.0;
    config.min_samples = 5;
    config.alert_cooldown_seconds = 10;
  }

  std::unique_ptr<AnomalyDetector> make_detector() {
    return std::make_unique<AnomalyDetector>(config, [this]() { return now; });
  }

  // Feeds `count` packets stamped inside second T + offset and collects any alerts.
  void feed(AnomalyDetector& detector, int offset, int count) {
    for (int i = 0; i < count; i++) {
      auto alert = detector.add_packet(T + offset + 0.001 * i);
      if (alert) alerts.push_back(*alert);
    }
  }

  double now = T;
  AnomalyConfig config;
  std::vector<AnomalyAlert> alerts;
};

TEST(AnomalyConfigTest, DefaultsAreValid) {
  AnomalyConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.window_size, 60);
  EXPECT_DOUBLE_EQ(config.threshold, 3.0);
  EXPECT_EQ(config.min_samples, 10);
  EXPECT_EQ(config.alert_cooldown_seconds, 30);
}

TEST(AnomalyConfigTest, RejectsOutOfRangeFields) {
  AnomalyConfig small_window;
  small_window.window_size = 5;
  small_window.min_samples = 5;
  EXPECT_THROW(small_window.validate(), ConfigError);

  AnomalyConfig low_threshold;
  low_threshold.threshold = 0.5;
  EXPECT_THROW(low_threshold.validate(), ConfigError);

  AnomalyConfig long_cooldown;
  long_cooldown.alert_cooldown_seconds = 301;
  EXPECT_THROW(long_cooldown.validate(), ConfigError);
}

TEST(AnomalyConfigTest, MinSamplesMustFitWindow) {
  AnomalyConfig config;
  config.window_size = 30;
  config.min_samples = 40;

  try {
    config.validate();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("min_samples"), std::string::npos);
  }
}

TEST(AnomalyConfigTest, ConstructorRejectsInvalidConfig) {
  AnomalyConfig config;
  config.window_size = 5;
  EXPECT_THROW(AnomalyDetector detector(config), ConfigError);
}

TEST(AlertLevelTest, MapsMagnitudeToLevel) {
  EXPECT_EQ(alert_level_for(3.5), AlertLevel::Info);
  EXPECT_EQ(alert_level_for(4.0), AlertLevel::Warning);
  EXPECT_EQ(alert_level_for(4.5), AlertLevel::Warning);
  EXPECT_EQ(alert_level_for(5.0), AlertLevel::Critical);
  EXPECT_EQ(alert_level_for(6.0), AlertLevel::Critical);
  EXPECT_EQ(alert_level_for(-6.0), AlertLevel::Critical);
  EXPECT_STREQ(to_string(AlertLevel::Warning), "warning");
}

TEST_F(AnomalyDetectorTest, SameSecondOnlyCounts) {
  auto detector = make_detector();
  feed(*detector, 0, 5);

  EXPECT_EQ(detector->current_count(), 5u);
  EXPECT_TRUE(detector->window_snapshot().empty());
}

TEST_F(AnomalyDetectorTest, NewSecondFinalizesPreviousBucket) {
  auto detector = make_detector();
  feed(*detector, 0, 3);
  feed(*detector, 1, 1);

  auto window = detector->window_snapshot();
  ASSERT_EQ(window.size(), 1u);
  EXPECT_EQ(window[0].second, static_cast<int64_t>(T));
  EXPECT_EQ(window[0].packet_count, 3u);
  EXPECT_EQ(detector->current_count(), 1u);
}

TEST_F(AnomalyDetectorTest, SilentSecondsAreZeroFilled) {
  auto detector = make_detector();
  feed(*detector, 0, 1);
  feed(*detector, 5, 1);

  auto window = detector->window_snapshot();
  ASSERT_EQ(window.size(), 5u);
  EXPECT_EQ(window[0].second, static_cast<int64_t>(T));
  EXPECT_EQ(window[0].packet_count, 1u);
  for (size_t i = 1; i < window.size(); i++) {
    EXPECT_EQ(window[i].second, static_cast<int64_t>(T) + static_cast<int64_t>(i));
    EXPECT_EQ(window[i].packet_count, 0u);
  }
  EXPECT_EQ(detector->current_count(), 1u);
  EXPECT_TRUE(alerts.empty());
}

TEST_F(AnomalyDetectorTest, LongSilenceStaysBounded) {
  auto detector = make_detector();
  feed(*detector, 0, 1);
  feed(*detector, 100000, 1);

  auto window = detector->window_snapshot();
  ASSERT_EQ(window.size(), 10u);
  EXPECT_EQ(window.front().second, static_cast<int64_t>(T) + 99990);
  EXPECT_EQ(window.back().second, static_cast<int64_t>(T) + 99999);
  for (const auto& bucket : window) {
    EXPECT_EQ(bucket.packet_count, 0u);
  }
}

TEST_F(AnomalyDetectorTest, NoAlertBeforeMinSamples) {
  auto detector = make_detector();
  feed(*detector, 0, 1);
  feed(*detector, 1, 1);
  feed(*detector, 2, 1);
  feed(*detector, 3, 500);
  feed(*detector, 4, 1);

  EXPECT_EQ(detector->window_snapshot().size(), 4u);
  EXPECT_TRUE(alerts.empty());
}

TEST_F(AnomalyDetectorTest, ConstantTrafficNeverAlerts) {
  auto detector = make_detector();
  for (int s = 0; s < 15; s++) {
    feed(*detector, s, 4);
  }

  EXPECT_TRUE(alerts.empty());
  auto stats = detector->get_stats();
  ASSERT_TRUE(stats.stdev.has_value());
  EXPECT_DOUBLE_EQ(*stats.stdev, 0.0);
}

TEST_F(AnomalyDetectorTest, SpikeRaisesSingleAlert) {
  auto detector = make_detector();
  for (int s = 0; s < 5; s++) {
    feed(*detector, s, 2);
  }
  feed(*detector, 5, 10);
  feed(*detector, 6, 1);

  ASSERT_EQ(alerts.size(), 1u);
  const auto& alert = alerts[0];
  EXPECT_EQ(alert.level, AlertLevel::Info);
  EXPECT_NE(alert.message.find("spike"), std::string::npos);
  EXPECT_NE(alert.message.find("10 packets/sec"), std::string::npos);
  EXPECT_DOUBLE_EQ(alert.timestamp, T);
  EXPECT_EQ(alert.meta.packet_count, 10u);
  EXPECT_EQ(alert.meta.window_size, 6u);
  EXPECT_EQ(alert.meta.window_start, static_cast<int64_t>(T));
  EXPECT_NEAR(alert.meta.z_score, 2.0412, 1e-3);
  EXPECT_NEAR(alert.meta.mean_packets, 10.0 / 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(alert.meta.threshold, 2.0);
}

TEST_F(AnomalyDetectorTest, DropRaisesAlert) {
  auto detector = make_detector();
  const int counts[] = {10, 12, 10, 12, 10, 12, 10, 12, 10, 1};
  for (int s = 0; s < 10; s++) {
    feed(*detector, s, counts[s]);
  }
  feed(*detector, 10, 1);

  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_NE(alerts[0].message.find("drop"), std::string::npos);
  EXPECT_LT(alerts[0].meta.z_score, 0.0);
  EXPECT_NEAR(alerts[0].meta.z_score, -2.712, 1e-3);
  EXPECT_EQ(alerts[0].meta.packet_count, 1u);
}

TEST_F(AnomalyDetectorTest, ThresholdIsInclusive) {
  const int counts[] = {1, 1, 2, 2, 2, 2, 4};

  auto detector = make_detector();
  for (int s = 0; s < 7; s++) {
    feed(*detector, s, counts[s]);
  }
  feed(*detector, 7, 1);

  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_DOUBLE_EQ(alerts[0].meta.z_score, 2.0);
  EXPECT_DOUBLE_EQ(alerts[0].meta.mean_packets, 2.0);
  EXPECT_DOUBLE_EQ(alerts[0].meta.stdev_packets, 1.0);

  alerts.clear();
  config.threshold = 2.01;
  auto strict = make_detector();
  for (int s = 0; s < 7; s++) {
    feed(*strict, s, counts[s]);
  }
  feed(*strict, 7, 1);

  EXPECT_TRUE(alerts.empty());
}

TEST_F(AnomalyDetectorTest, CooldownSuppressesFollowUpAlerts) {
  auto detector = make_detector();
  for (int s = 0; s < 5; s++) {
    feed(*detector, s, 2);
  }
  feed(*detector, 5, 10);
  feed(*detector, 6, 2);
  ASSERT_EQ(alerts.size(), 1u);

  now = T + 3;
  feed(*detector, 7, 30);
  feed(*detector, 8, 2);
  EXPECT_EQ(alerts.size(), 1u);

  now = T + 23;
  for (int s = 9; s < 19; s++) {
    feed(*detector, s, 2);
  }
  EXPECT_EQ(alerts.size(), 1u);

  feed(*detector, 19, 40);
  feed(*detector, 20, 2);

  ASSERT_EQ(alerts.size(), 2u);
  EXPECT_EQ(alerts[1].meta.packet_count, 40u);
  EXPECT_NEAR(alerts[1].meta.z_score, 2.846, 1e-3);
  EXPECT_DOUBLE_EQ(alerts[1].timestamp, T + 23);
}

TEST_F(AnomalyDetectorTest, CallbackReceivesAlert) {
  auto detector = make_detector();
  std::vector<AnomalyAlert> delivered;
  detector->on_alert([&delivered](const AnomalyAlert& alert) {
    delivered.push_back(alert);
  });

  for (int s = 0; s < 5; s++) {
    feed(*detector, s, 2);
  }
  feed(*detector, 5, 10);
  feed(*detector, 6, 1);

  ASSERT_EQ(delivered.size(), 1u);
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(delivered[0].message, alerts[0].message);
}

TEST_F(AnomalyDetectorTest, StatsReflectWindow) {
  auto detector = make_detector();
  const int counts[] = {1, 1, 2, 2, 2, 2, 4};
  for (int s = 0; s < 7; s++) {
    feed(*detector, s, counts[s]);
  }
  feed(*detector, 7, 1);

  auto stats = detector->get_stats();
  EXPECT_EQ(stats.window_size, 7u);
  EXPECT_EQ(stats.max_window_size, 10u);
  EXPECT_EQ(stats.current_packets_per_sec, 1u);
  EXPECT_DOUBLE_EQ(stats.threshold, 2.0);
  EXPECT_EQ(stats.min_samples, 5u);
  EXPECT_EQ(stats.alert_cooldown, 10u);
  EXPECT_DOUBLE_EQ(stats.last_alert_time, T);
  EXPECT_DOUBLE_EQ(*stats.mean, 2.0);
  EXPECT_DOUBLE_EQ(*stats.median, 2.0);
  EXPECT_DOUBLE_EQ(*stats.stdev, 1.0);
  EXPECT_EQ(*stats.max, 4u);
  EXPECT_EQ(*stats.min, 1u);
}

TEST_F(AnomalyDetectorTest, StatsOmitEmptyWindowFields) {
  auto detector = make_detector();
  auto stats = detector->get_stats();

  EXPECT_EQ(stats.window_size, 0u);
  EXPECT_FALSE(stats.mean.has_value());
  EXPECT_FALSE(stats.median.has_value());
  EXPECT_FALSE(stats.stdev.has_value());
  EXPECT_FALSE(stats.max.has_value());
  EXPECT_FALSE(stats.min.has_value());
}

TEST_F(AnomalyDetectorTest, UpdateConfigShrinksWindow) {
  config.window_size = 60;
  config.min_samples = 10;
  auto detector = make_detector();
  for (int s = 0; s < 16; s++) {
    feed(*detector, s, 3);
  }
  ASSERT_EQ(detector->window_snapshot().size(), 15u);

  AnomalyConfig updated = config;
  updated.window_size = 10;
  detector->update_config(updated);

  auto window = detector->window_snapshot();
  ASSERT_EQ(window.size(), 10u);
  EXPECT_EQ(window.front().second, static_cast<int64_t>(T) + 5);
  EXPECT_EQ(detector->config().window_size, 10);
}

TEST_F(AnomalyDetectorTest, InvalidUpdateLeavesConfigUntouched) {
  auto detector = make_detector();

  AnomalyConfig bad = config;
  bad.window_size = 30;
  bad.min_samples = 40;
  EXPECT_THROW(detector->update_config(bad), ConfigError);

  auto current = detector->config();
  EXPECT_EQ(current.window_size, 10);
  EXPECT_EQ(current.min_samples, 5);
}

TEST_F(AnomalyDetectorTest, ResetClearsState) {
  auto detector = make_detector();
  for (int s = 0; s < 5; s++) {
    feed(*detector, s, 2);
  }
  feed(*detector, 5, 10);
  feed(*detector, 6, 1);
  ASSERT_EQ(alerts.size(), 1u);

  detector->reset();

  auto stats = detector->get_stats();
  EXPECT_EQ(stats.window_size, 0u);
  EXPECT_EQ(stats.current_packets_per_sec, 0u);
  EXPECT_DOUBLE_EQ(stats.last_alert_time, 0.0);
}

TEST_F(AnomalyDetectorTest, SilentGapRaisesDropAlert) {
  config.window_size = 20;
  auto detector = make_detector();

  for (int s = 0; s < 10; s++) {
    feed(*detector, s, s % 2 == 0 ? 10 : 12);
  }
  ASSERT_TRUE(alerts.empty());

  // Seconds T+10..T+14 saw no packets; the first empty second is scored.
  auto alert = detector->add_packet(T + 15.5);
  ASSERT_TRUE(alert.has_value());
  EXPECT_EQ(alert->meta.packet_count, 0u);
  EXPECT_NE(alert->message.find("drop"), std::string::npos);
  EXPECT_NEAR(alert->meta.z_score, -2.886751, 1e-4);

  auto window = detector->window_snapshot();
  ASSERT_EQ(window.size(), 15u);
  EXPECT_EQ(window.back().second, static_cast<int64_t>(T) + 14);
  EXPECT_EQ(window.back().packet_count, 0u);
  EXPECT_EQ(detector->current_count(), 1u);

  // A second gap inside the cooldown stays quiet.
  EXPECT_FALSE(detector->add_packet(T + 25.5).has_value());
}
