#include "detection/decision_engine.hpp"
#include "io/db/in_memory_decision_store.hpp"
#include "session/session_supervisor.hpp"
#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

namespace {

// Scriptable stand-in for the proxy process. Records every call in order;
// with hold_restarts set, any start() after the first blocks until
// release_restarts().
class FakeEnforcementProcess : public IEnforcementProcess {
public:
  bool start() override {
    int call = ++start_calls;
    log_call("start");
    if (call > 1 && hold_restarts) {
      std::unique_lock<std::mutex> lock(gate_mutex_);
      restart_waiting = true;
      gate_cv_.wait(lock, [this] { return !hold_restarts; });
    }
    if (!start_succeeds)
      return false;
    running = true;
    return true;
  }
  bool is_running() override { return running; }
  void stop(std::chrono::milliseconds) override {
    ++stop_calls;
    log_call("stop");
    running = false;
  }
  pid_t pid() const override { return running ? 4242 : -1; }

  void crash() { running = false; }

  void release_restarts() {
    {
      std::lock_guard<std::mutex> lock(gate_mutex_);
      hold_restarts = false;
    }
    gate_cv_.notify_all();
  }

  std::vector<std::string> calls() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return calls_;
  }

  std::atomic<bool> start_succeeds{true};
  std::atomic<bool> running{false};
  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};
  std::atomic<bool> hold_restarts{false};
  std::atomic<bool> restart_waiting{false};

private:
  void log_call(const char *name) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    calls_.push_back(name);
  }

  std::mutex gate_mutex_;
  std::condition_variable gate_cv_;
  std::mutex log_mutex_;
  std::vector<std::string> calls_;
};

bool wait_until(const std::function<bool()> &condition,
                std::chrono::milliseconds limit = std::chrono::seconds(3)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

double hours_from_ms(double ms) { return ms / 3600.0 / 1000.0; }

} // namespace

class SessionSupervisorTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir =
        std::filesystem::temp_directory_path() / "anchorite_session_test";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);

    config.session_record_path = (test_dir / "session.json").string();
    config.mission_path = (test_dir / "mission.json").string();
    config.stats_snapshot_path = (test_dir / "stats.json").string();
    config.session.health_check_interval_ms = 10;
    config.session.expiry_check_interval_ms = 10;
    config.session.terminate_timeout_ms = 100;
    config.session.max_restart_attempts = 2;

    store = std::make_unique<SessionStore>(config.session_record_path);
    supervisor = std::make_unique<SessionSupervisor>(config, process, *store,
                                                     metrics);
  }

  void TearDown() override {
    supervisor.reset();
    std::filesystem::remove_all(test_dir);
  }

  std::filesystem::path test_dir;
  Config::AppConfig config;
  MetricsRegistry metrics;
  FakeEnforcementProcess process;
  std::unique_ptr<SessionStore> store;
  std::unique_ptr<SessionSupervisor> supervisor;
};

TEST_F(SessionSupervisorTest, StartPersistsHashAndStartsProcess) {
  auto secret = supervisor->start_session(2.0, "Write chapter three");
  ASSERT_TRUE(secret.has_value());
  EXPECT_EQ(secret->secret.size(), Secret::ENCODED_LENGTH);
  EXPECT_EQ(supervisor->state(), SessionState::ACTIVE);
  EXPECT_TRUE(process.is_running());

  auto record = store->load();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->task, "Write chapter three");
  EXPECT_EQ(record->secret_hash, Secret::hash(secret->secret));
  EXPECT_EQ(record->end_time_ms - record->start_time_ms, 7'200'000u);
  EXPECT_EQ(record->proxy_port, config.session.proxy_port);

  // The plaintext never reaches disk
  std::ifstream in(config.session_record_path);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content.find(secret->secret), std::string::npos);

  auto status = supervisor->status();
  EXPECT_TRUE(status.active);
  EXPECT_EQ(status.task, "Write chapter three");
  EXPECT_GT(status.remaining.count(), 0);
}

TEST_F(SessionSupervisorTest, RejectsInvalidDurationsAndDoubleStart) {
  EXPECT_FALSE(supervisor->start_session(0.0, "x").has_value());
  EXPECT_FALSE(supervisor->start_session(-1.0, "x").has_value());
  EXPECT_FALSE(
      supervisor->start_session(std::numeric_limits<double>::quiet_NaN(), "x")
          .has_value());
  EXPECT_FALSE(supervisor->start_session(1e20, "x").has_value());
  EXPECT_FALSE(
      supervisor->start_session(std::numeric_limits<double>::infinity(), "x")
          .has_value());
  EXPECT_FALSE(supervisor
                   ->start_session(SessionSupervisor::MAX_DURATION_HOURS + 0.5,
                                   "x")
                   .has_value());
  EXPECT_EQ(process.start_calls.load(), 0);
  EXPECT_FALSE(store->exists());

  ASSERT_TRUE(supervisor->start_session(1.0, "first").has_value());
  EXPECT_FALSE(supervisor->start_session(1.0, "second").has_value());
  EXPECT_EQ(supervisor->status().task, "first");
}

TEST_F(SessionSupervisorTest, ProcessStartFailureAbortsSession) {
  process.start_succeeds = false;
  EXPECT_FALSE(supervisor->start_session(1.0, "task").has_value());
  EXPECT_EQ(supervisor->state(), SessionState::IDLE);
  EXPECT_FALSE(store->exists());
}

TEST_F(SessionSupervisorTest, WrongSecretChangesNothing) {
  auto secret = supervisor->start_session(1.0, "task");
  ASSERT_TRUE(secret.has_value());

  EXPECT_FALSE(supervisor->end_session("not-the-secret"));
  EXPECT_FALSE(supervisor->end_session(""));
  EXPECT_EQ(supervisor->state(), SessionState::ACTIVE);
  EXPECT_TRUE(store->exists());
  EXPECT_EQ(process.stop_calls.load(), 0);
}

TEST_F(SessionSupervisorTest, CorrectSecretUnlocks) {
  std::vector<std::pair<SessionState, SessionState>> transitions;
  std::mutex transitions_mutex;
  supervisor->set_transition_listener(
      [&](SessionState from, SessionState to) {
        std::lock_guard<std::mutex> lock(transitions_mutex);
        transitions.emplace_back(from, to);
      });

  auto secret = supervisor->start_session(1.0, "task");
  ASSERT_TRUE(secret.has_value());
  EXPECT_TRUE(supervisor->end_session(secret->secret));

  EXPECT_EQ(supervisor->state(), SessionState::IDLE);
  EXPECT_EQ(supervisor->last_outcome().value_or(SessionState::IDLE),
            SessionState::UNLOCKED);
  EXPECT_FALSE(store->exists());
  EXPECT_FALSE(process.is_running());
  EXPECT_FALSE(supervisor->end_session(secret->secret));

  std::lock_guard<std::mutex> lock(transitions_mutex);
  ASSERT_EQ(transitions.size(), 3u);
  EXPECT_EQ(transitions[0].second, SessionState::ACTIVE);
  EXPECT_EQ(transitions[1].second, SessionState::UNLOCKED);
  EXPECT_EQ(transitions[2].second, SessionState::IDLE);
}

TEST_F(SessionSupervisorTest, FragmentsUnlock) {
  auto secret = supervisor->start_session(1.0, "task");
  ASSERT_TRUE(secret.has_value());
  const auto &f = secret->fragments;

  EXPECT_FALSE(supervisor->end_session_with_fragments(f[1], f[0], f[2]));
  EXPECT_TRUE(supervisor->end_session_with_fragments(f[0], f[1], f[2]));
  EXPECT_EQ(supervisor->last_outcome().value_or(SessionState::IDLE),
            SessionState::UNLOCKED);
}

TEST_F(SessionSupervisorTest, SessionCompletesAtEndTime) {
  ASSERT_TRUE(supervisor->start_session(hours_from_ms(80), "short").has_value());
  ASSERT_TRUE(wait_until([&] {
    return supervisor->last_outcome() == SessionState::COMPLETED;
  }));
  EXPECT_TRUE(wait_until(
      [&] { return supervisor->state() == SessionState::IDLE; }));
  EXPECT_FALSE(store->exists());
  EXPECT_FALSE(process.is_running());

  // A new session can follow immediately
  EXPECT_TRUE(supervisor->start_session(1.0, "next").has_value());
}

TEST_F(SessionSupervisorTest, HealthLoopRestartsDeadProcess) {
  ASSERT_TRUE(supervisor->start_session(1.0, "task").has_value());
  process.crash();

  ASSERT_TRUE(wait_until([&] { return process.start_calls >= 2; }));
  EXPECT_TRUE(wait_until([&] { return process.is_running(); }));
  EXPECT_EQ(supervisor->state(), SessionState::ACTIVE);
  EXPECT_EQ(supervisor->status().consecutive_restart_failures, 0u);
}

TEST_F(SessionSupervisorTest, RepeatedRestartFailureIsEmergency) {
  ASSERT_TRUE(supervisor->start_session(1.0, "task").has_value());
  process.start_succeeds = false;
  process.crash();

  ASSERT_TRUE(wait_until([&] {
    return supervisor->last_outcome() == SessionState::EMERGENCY_TERMINATED;
  }));
  EXPECT_TRUE(wait_until(
      [&] { return supervisor->state() == SessionState::IDLE; }));
  // One initial start plus max_restart_attempts failed restarts
  EXPECT_EQ(process.start_calls.load(), 1 + 2);
  EXPECT_FALSE(store->exists());
}

TEST_F(SessionSupervisorTest, ResumeFutureRecord) {
  SessionRecord record;
  record.task = "resumed task";
  record.start_time_ms = Utils::get_current_time_ms();
  record.end_time_ms = record.start_time_ms + 3'600'000;
  record.duration_hours = 1.0;
  record.secret_hash = Secret::hash("the-secret");
  ASSERT_TRUE(store->save(record));

  EXPECT_TRUE(supervisor->resume());
  EXPECT_EQ(supervisor->state(), SessionState::ACTIVE);
  EXPECT_EQ(supervisor->status().task, "resumed task");
  EXPECT_TRUE(process.is_running());

  EXPECT_TRUE(supervisor->end_session("the-secret"));
}

TEST_F(SessionSupervisorTest, ResumeDiscardsExpiredOrCorruptRecords) {
  SessionRecord expired;
  expired.task = "old";
  expired.end_time_ms = Utils::get_current_time_ms() - 1000;
  ASSERT_TRUE(store->save(expired));
  EXPECT_FALSE(supervisor->resume());
  EXPECT_FALSE(store->exists());

  {
    std::ofstream out(config.session_record_path);
    out << "{\"format_version\": 99}";
  }
  EXPECT_FALSE(supervisor->resume());
  EXPECT_FALSE(store->exists());
  EXPECT_EQ(process.start_calls.load(), 0);
  EXPECT_FALSE(supervisor->resume());
}

TEST_F(SessionSupervisorTest, ShutdownKeepsRecordForResume) {
  auto secret = supervisor->start_session(1.0, "task");
  ASSERT_TRUE(secret.has_value());

  supervisor->shutdown();
  EXPECT_EQ(supervisor->state(), SessionState::IDLE);
  EXPECT_TRUE(store->exists());
  EXPECT_FALSE(process.is_running());
  EXPECT_FALSE(supervisor->last_outcome().has_value());

  MetricsRegistry restarted_metrics;
  SessionSupervisor restarted(config, process, *store, restarted_metrics);
  EXPECT_TRUE(restarted.resume());
  EXPECT_TRUE(restarted.end_session(secret->secret));
}

TEST_F(SessionSupervisorTest, SessionMissionReachesEngine) {
  MetricsRegistry engine_metrics;
  InMemoryDecisionStore decisions;
  ModelManager models(config.classifier, nullptr);
  DecisionEngine engine(config, models, decisions, engine_metrics);

  MetricsRegistry supervisor_metrics;
  SessionSupervisor with_engine(config, process, *store, supervisor_metrics,
                                &engine);
  auto secret = with_engine.start_session(1.0, "Study logistic regression");
  ASSERT_TRUE(secret.has_value());
  ASSERT_NE(engine.mission(), nullptr);
  EXPECT_EQ(engine.mission()->text, "Study logistic regression");

  ASSERT_TRUE(with_engine.end_session(secret->secret));
  EXPECT_EQ(engine.mission(), nullptr);
}

TEST(SessionStatusJsonTest, ReportsRemainingSeconds) {
  SessionStatus status;
  status.state = SessionState::ACTIVE;
  status.active = true;
  status.remaining = std::chrono::milliseconds(90'500);
  auto j = session_status_to_json(status);
  EXPECT_EQ(j["state"], "ACTIVE");
  EXPECT_EQ(j["remaining_seconds"], 90);
}

TEST_F(SessionSupervisorTest, UnlockWaitsForRestartBeforeStoppingProcess) {
  auto secret = supervisor->start_session(1.0, "task");
  ASSERT_TRUE(secret.has_value());

  process.hold_restarts = true;
  process.crash();
  ASSERT_TRUE(wait_until([&] { return process.restart_waiting.load(); }));

  auto unlock = std::async(std::launch::async, [&] {
    return supervisor->end_session(secret->secret);
  });
  // The process is not stopped while the health loop is still inside start()
  EXPECT_EQ(unlock.wait_for(std::chrono::milliseconds(50)),
            std::future_status::timeout);
  EXPECT_EQ(process.stop_calls.load(), 0);

  process.release_restarts();
  ASSERT_TRUE(unlock.get());

  auto calls = process.calls();
  ASSERT_FALSE(calls.empty());
  EXPECT_EQ(calls.back(), "stop");
  EXPECT_EQ(calls, (std::vector<std::string>{"start", "start", "stop"}));
  EXPECT_FALSE(process.is_running());
  EXPECT_FALSE(store->exists());
  EXPECT_EQ(supervisor->state(), SessionState::IDLE);

  // No loop survives to respawn the process
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(process.start_calls.load(), 2);
  EXPECT_FALSE(process.is_running());
}
