#include "core/alert.hpp"
#include "core/alert_manager.hpp"
#include "core/config.hpp"
#include "io/alert_dispatch/file_dispatcher.hpp"
#include "io/alert_dispatch/http_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace {

Finding make_finding(AnomalyKind kind = AnomalyKind::POWER_ANOMALY,
                     Severity severity = Severity::HIGH) {
  return Finding(4.2, kind, DetectionMethod::Z_SCORE,
                 "Power 1000.0W is 4.2 standard deviations from normal",
                 severity);
}

struct Recorded {
  std::mutex mutex;
  std::vector<std::string> devices;
};

class RecordingDispatcher : public IAlertDispatcher {
public:
  explicit RecordingDispatcher(std::shared_ptr<Recorded> sink)
      : sink_(std::move(sink)) {}
  bool dispatch(const Alert &alert) override {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->devices.push_back(alert.device_id);
    return true;
  }
  const char *get_name() const override { return "RecordingDispatcher"; }
  std::string get_dispatcher_type() const override { return "recording"; }

private:
  std::shared_ptr<Recorded> sink_;
};

} // namespace

class AlertManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.alerts_to_stdout = false;
    test_file_path_ = (std::filesystem::temp_directory_path() /
                       "power_alert_dispatcher_test.jsonl")
                          .string();
    std::filesystem::remove(test_file_path_);
  }

  void TearDown() override { std::filesystem::remove(test_file_path_); }

  Config::AppConfig config_;
  std::string test_file_path_;
};

TEST_F(AlertManagerTest, CooldownIsPerDeviceAndKind) {
  config_.alert_throttle_duration_seconds = 60;
  AlertManager manager;
  manager.initialize(config_);

  EXPECT_TRUE(manager.record_alert(Alert("a", 0, make_finding())));
  EXPECT_FALSE(manager.record_alert(Alert("a", 30000, make_finding())));
  EXPECT_TRUE(manager.record_alert(
      Alert("a", 30000, make_finding(AnomalyKind::VOLTAGE_ANOMALY))));
  EXPECT_TRUE(manager.record_alert(Alert("b", 30000, make_finding())));
  EXPECT_TRUE(manager.record_alert(Alert("a", 60000, make_finding())));

  EXPECT_EQ(manager.get_alerts_recorded(), 4u);
  EXPECT_EQ(manager.get_alerts_throttled(), 1u);
}

TEST_F(AlertManagerTest, RecentAlertsAreNewestFirst) {
  AlertManager manager;
  manager.initialize(config_);

  TelemetrySample sample;
  sample.device_id = "meter-3";
  sample.timestamp_ms = 5000;
  sample.power = 3000.0;
  std::vector<Finding> findings = {
      make_finding(AnomalyKind::POWER_ANOMALY),
      make_finding(AnomalyKind::POWER_OUTLIER)};
  EXPECT_EQ(manager.record_findings(sample, findings), 2u);

  auto recent = manager.get_recent_alerts(10);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].finding.kind, AnomalyKind::POWER_OUTLIER);
  EXPECT_EQ(recent[1].finding.kind, AnomalyKind::POWER_ANOMALY);
  EXPECT_DOUBLE_EQ(recent[0].power, 3000.0);
  EXPECT_EQ(manager.get_recent_alerts(1).size(), 1u);
}

TEST_F(AlertManagerTest, DispatchesEveryRecordedAlertBeforeShutdown) {
  auto sink = std::make_shared<Recorded>();
  {
    AlertManager manager;
    manager.initialize(config_);
    manager.add_dispatcher(std::make_unique<RecordingDispatcher>(sink));
    for (int i = 0; i < 25; ++i)
      manager.record_alert(
          Alert("dev-" + std::to_string(i), 1000 + i, make_finding()));
  }
  std::lock_guard<std::mutex> lock(sink->mutex);
  ASSERT_EQ(sink->devices.size(), 25u);
  EXPECT_EQ(sink->devices.front(), "dev-0");
  EXPECT_EQ(sink->devices.back(), "dev-24");
}

TEST_F(AlertManagerTest, FileDispatcherWritesSequencedPowerRecords) {
  {
    FileDispatcher dispatcher(test_file_path_);
    ASSERT_TRUE(dispatcher.is_open());
    EXPECT_EQ(dispatcher.get_dispatcher_type(), "file");

    Alert alert("meter-5", 1704067200000ULL, make_finding());
    alert.voltage = 230.0;
    alert.current = 5.0;
    alert.power = 920.0;
    EXPECT_TRUE(dispatcher.dispatch(alert));
    EXPECT_TRUE(dispatcher.dispatch(Alert("meter-6", 1704067201000ULL,
                                          make_finding())));
    EXPECT_EQ(dispatcher.get_records_written(), 2u);
    EXPECT_EQ(dispatcher.get_failed_writes(), 0u);
  }

  std::ifstream in(test_file_path_);
  std::string line;
  ASSERT_TRUE(std::getline(in, line));
  auto first = nlohmann::json::parse(line);
  EXPECT_EQ(first["sequence"].get<uint64_t>(), 1u);
  EXPECT_EQ(first["device_id"], "meter-5");
  EXPECT_EQ(first["timestamp"], "2024-01-01T00:00:00.000Z");
  EXPECT_EQ(first["anomaly_type"], "Power Anomaly");
  EXPECT_EQ(first["severity"], "high");
  EXPECT_DOUBLE_EQ(first["reading"]["voltage"].get<double>(), 230.0);
  EXPECT_DOUBLE_EQ(first["reading"]["apparent_power"].get<double>(), 1150.0);
  EXPECT_DOUBLE_EQ(first["reading"]["power_factor"].get<double>(), 0.8);

  // No voltage or current recorded: nothing to derive
  ASSERT_TRUE(std::getline(in, line));
  auto second = nlohmann::json::parse(line);
  EXPECT_EQ(second["sequence"].get<uint64_t>(), 2u);
  EXPECT_FALSE(second["reading"].contains("power_factor"));
}

TEST_F(AlertManagerTest, FileDispatcherCountsWritesItCannotMake) {
  // A regular file where the log directory should be
  std::ofstream(test_file_path_) << "not a directory";
  FileDispatcher dispatcher(test_file_path_ + "/alerts.jsonl");
  EXPECT_FALSE(dispatcher.is_open());

  EXPECT_FALSE(dispatcher.dispatch(Alert("meter-5", 0, make_finding())));
  EXPECT_FALSE(dispatcher.dispatch(Alert("meter-5", 1, make_finding())));
  EXPECT_EQ(dispatcher.get_records_written(), 0u);
  EXPECT_EQ(dispatcher.get_failed_writes(), 2u);
}

TEST_F(AlertManagerTest, HttpDispatcherParsesWebhookUrl) {
  HttpDispatcher plain("http://localhost:8080/hooks/power");
  EXPECT_TRUE(plain.is_valid());
  EXPECT_EQ(plain.get_host(), "localhost:8080");
  EXPECT_EQ(plain.get_path(), "/hooks/power");
  EXPECT_FALSE(plain.is_https());
  EXPECT_EQ(plain.get_max_attempts(), 3);

  HttpDispatcher bare("https://alerts.example.com", 0);
  EXPECT_TRUE(bare.is_valid());
  EXPECT_EQ(bare.get_path(), "/");
  EXPECT_TRUE(bare.is_https());
  EXPECT_EQ(bare.get_max_attempts(), 1);

  HttpDispatcher invalid("ftp://nowhere");
  EXPECT_FALSE(invalid.is_valid());
  EXPECT_FALSE(invalid.dispatch(Alert("x", 0, make_finding())));
  EXPECT_EQ(invalid.get_failed_deliveries(), 1u);
  EXPECT_EQ(invalid.get_attempt_count(), 0u);

  EXPECT_FALSE(HttpDispatcher("http:///hooks").is_valid());
}

TEST_F(AlertManagerTest, WebhookPayloadSummarizesThePowerAlert) {
  Alert alert("meter-9", 1704067200000ULL,
              make_finding(AnomalyKind::POWER_ANOMALY, Severity::HIGH));
  alert.power = 1000.0;

  auto payload = HttpDispatcher::build_payload(alert);
  EXPECT_EQ(payload["event"], "power_anomaly");
  EXPECT_EQ(payload["device_id"], "meter-9");
  EXPECT_EQ(payload["severity"], "high");
  EXPECT_EQ(payload["occurred_at"], "2024-01-01T00:00:00.000Z");
  EXPECT_EQ(payload["summary"],
            "Power Anomaly (high) on meter-9: Power 1000.0W is 4.2 standard "
            "deviations from normal");
  EXPECT_DOUBLE_EQ(payload["alert"]["reading"]["power"].get<double>(),
                   1000.0);
}

TEST_F(AlertManagerTest, HttpDispatcherGivesUpAfterMaxAttempts) {
  // Nothing listens on port 1
  HttpDispatcher dispatcher("http://127.0.0.1:1/hooks/power", 3, 0);
  EXPECT_FALSE(dispatcher.dispatch(Alert("meter-1", 0, make_finding())));
  EXPECT_EQ(dispatcher.get_attempt_count(), 3u);
  EXPECT_EQ(dispatcher.get_failed_deliveries(), 1u);
  EXPECT_EQ(dispatcher.get_delivered_count(), 0u);
}

class WebhookServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    server_.Post("/hooks/power", [this](const httplib::Request &req,
                                        httplib::Response &res) {
      last_body_ = req.body;
      res.status = 200;
    });
    server_.Post("/hooks/flaky",
                 [this](const httplib::Request &, httplib::Response &res) {
                   res.status = flaky_calls_++ == 0 ? 503 : 200;
                 });
    server_.Post("/hooks/reject",
                 [this](const httplib::Request &, httplib::Response &res) {
                   reject_calls_++;
                   res.status = 400;
                 });
    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    server_thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running())
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  void TearDown() override {
    server_.stop();
    if (server_thread_.joinable())
      server_thread_.join();
  }

  std::string url(const std::string &path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  httplib::Server server_;
  std::thread server_thread_;
  int port_ = 0;
  std::string last_body_;
  std::atomic<int> flaky_calls_{0};
  std::atomic<int> reject_calls_{0};
};

TEST_F(WebhookServerTest, DeliversPayloadOnFirstAttempt) {
  HttpDispatcher dispatcher(url("/hooks/power"), 3, 0);
  EXPECT_TRUE(dispatcher.dispatch(Alert("meter-2", 0, make_finding())));
  EXPECT_EQ(dispatcher.get_attempt_count(), 1u);
  EXPECT_EQ(dispatcher.get_delivered_count(), 1u);

  auto body = nlohmann::json::parse(last_body_);
  EXPECT_EQ(body["device_id"], "meter-2");
  EXPECT_EQ(body["alert"]["anomaly_type"], "Power Anomaly");
}

TEST_F(WebhookServerTest, RetriesServerErrors) {
  HttpDispatcher dispatcher(url("/hooks/flaky"), 3, 0);
  EXPECT_TRUE(dispatcher.dispatch(Alert("meter-3", 0, make_finding())));
  EXPECT_EQ(dispatcher.get_attempt_count(), 2u);
  EXPECT_EQ(dispatcher.get_failed_deliveries(), 0u);
}

TEST_F(WebhookServerTest, ClientErrorsAreNotRetried) {
  HttpDispatcher dispatcher(url("/hooks/reject"), 3, 0);
  EXPECT_FALSE(dispatcher.dispatch(Alert("meter-4", 0, make_finding())));
  EXPECT_EQ(reject_calls_.load(), 1);
  EXPECT_EQ(dispatcher.get_attempt_count(), 1u);
  EXPECT_EQ(dispatcher.get_failed_deliveries(), 1u);
}
