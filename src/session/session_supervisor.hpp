#ifndef SESSION_SUPERVISOR_HPP
#define SESSION_SUPERVISOR_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "session/enforcement_process.hpp"
#include "session/secret.hpp"
#include "session/session_store.hpp"

#include "nlohmann/json.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class DecisionEngine;

enum class SessionState {
  IDLE,
  ACTIVE,
  COMPLETED,
  UNLOCKED,
  EMERGENCY_TERMINATED
};

const char *session_state_to_string(SessionState state);

struct SessionStatus {
  SessionState state = SessionState::IDLE;
  bool active = false;
  std::chrono::milliseconds remaining{0};
  std::string task;
  uint64_t start_time_ms = 0;
  uint64_t end_time_ms = 0;
  uint32_t consecutive_restart_failures = 0;
};

nlohmann::json session_status_to_json(const SessionStatus &status);

using TransitionListener =
    std::function<void(SessionState from, SessionState to)>;

// Owns the focus-session state machine:
//   IDLE -> ACTIVE -> {COMPLETED, UNLOCKED, EMERGENCY_TERMINATED} -> IDLE
// While ACTIVE an expiry loop and a health loop run on their own threads.
// Every ending path stops both loops first, then the enforcement process,
// then removes the persisted record.
class SessionSupervisor {
public:
  // One week
  static constexpr double MAX_DURATION_HOURS = 168.0;

  // `engine` may be null; when set it receives the session's mission
  SessionSupervisor(const Config::AppConfig &config,
                    IEnforcementProcess &process, SessionStore &store,
                    MetricsRegistry &metrics, DecisionEngine *engine = nullptr);
  ~SessionSupervisor();

  SessionSupervisor(const SessionSupervisor &) = delete;
  SessionSupervisor &operator=(const SessionSupervisor &) = delete;

  // Empty when a session is already active, the duration is outside
  // (0, MAX_DURATION_HOURS], the record cannot be written or the
  // enforcement process will not start
  std::optional<SessionSecret> start_session(double duration_hours,
                                             const std::string &task);

  // False on a wrong secret or when no session is active; no state change
  bool end_session(const std::string &secret);
  bool end_session_with_fragments(const std::string &first,
                                  const std::string &second,
                                  const std::string &third);

  // Re-enters ACTIVE from a persisted record whose end time is in the
  // future; removes an expired or unreadable record
  bool resume();

  // Stops loops and the enforcement process but keeps the record so the
  // next resume() picks the session up again
  void shutdown();

  SessionStatus status() const;
  SessionState state() const;
  std::optional<SessionState> last_outcome() const;

  void set_transition_listener(TransitionListener listener);

private:
  void start_loops();
  void join_loops();
  void run_loop(void (SessionSupervisor::*loop)());
  void expiry_loop();
  void health_loop();
  void teardown(SessionState outcome, bool from_loop);
  void activate(const SessionRecord &record);
  void notify_transition(SessionState from, SessionState to);

  Config::AppConfig config_;
  IEnforcementProcess &process_;
  SessionStore &store_;
  DecisionEngine *engine_;

  // Serialises start, end, resume and shutdown
  std::mutex lifecycle_mutex_;

  mutable std::mutex state_mutex_;
  std::condition_variable loop_cv_;
  std::condition_variable loops_done_cv_;
  SessionState state_ = SessionState::IDLE;
  std::optional<SessionState> last_outcome_;
  SessionRecord record_;
  bool stop_loops_ = false;
  bool ending_ = false;
  int running_loops_ = 0;
  uint32_t consecutive_failures_ = 0;

  std::thread expiry_thread_;
  std::thread health_thread_;

  std::mutex listener_mutex_;
  TransitionListener listener_;

  std::array<prometheus::Counter *, 5> transitions_by_state_{};
  prometheus::Counter *restarts_ = nullptr;
};

#endif // SESSION_SUPERVISOR_HPP
