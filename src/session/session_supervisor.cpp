#include "session/session_supervisor.hpp"
#include "core/logger.hpp"
#include "core/mission.hpp"
#include "detection/decision_engine.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>

const char *session_state_to_string(SessionState state) {
  switch (state) {
  case SessionState::IDLE:
    return "IDLE";
  case SessionState::ACTIVE:
    return "ACTIVE";
  case SessionState::COMPLETED:
    return "COMPLETED";
  case SessionState::UNLOCKED:
    return "UNLOCKED";
  case SessionState::EMERGENCY_TERMINATED:
    return "EMERGENCY_TERMINATED";
  }
  return "UNKNOWN";
}

nlohmann::json session_status_to_json(const SessionStatus &status) {
  return {{"state", session_state_to_string(status.state)},
          {"active", status.active},
          {"remaining_seconds", status.remaining.count() / 1000},
          {"task", status.task},
          {"start_time_ms", status.start_time_ms},
          {"end_time_ms", status.end_time_ms},
          {"consecutive_restart_failures",
           status.consecutive_restart_failures}};
}

SessionSupervisor::SessionSupervisor(const Config::AppConfig &config,
                                     IEnforcementProcess &process,
                                     SessionStore &store,
                                     MetricsRegistry &metrics,
                                     DecisionEngine *engine)
    : config_(config), process_(process), store_(store), engine_(engine) {
  auto &transitions = metrics.create_counter_family(
      "anchorite_session_transitions_total",
      "Session state transitions by target state.");
  for (SessionState s :
       {SessionState::IDLE, SessionState::ACTIVE, SessionState::COMPLETED,
        SessionState::UNLOCKED, SessionState::EMERGENCY_TERMINATED})
    transitions_by_state_[static_cast<size_t>(s)] =
        &transitions.Add({{"state", session_state_to_string(s)}});
  restarts_ = &metrics.create_counter(
      "anchorite_enforcement_restarts_total",
      "Restart attempts of the enforcement process.");
}

SessionSupervisor::~SessionSupervisor() { shutdown(); }

std::optional<SessionSecret>
SessionSupervisor::start_session(double duration_hours,
                                 const std::string &task) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (!(duration_hours > 0.0) || !(duration_hours <= MAX_DURATION_HOURS)) {
    LOG(LogLevel::WARN, LogComponent::SESSION_LIFECYCLE,
        "Rejected session with duration " << duration_hours << "h.");
    return std::nullopt;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::IDLE) {
      LOG(LogLevel::WARN, LogComponent::SESSION_LIFECYCLE,
          "Session already active.");
      return std::nullopt;
    }
  }
  join_loops();

  LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
      "Starting " << duration_hours << "h focus session: " << task);

  SessionSecret secret;
  SessionRecord record;
  try {
    secret = Secret::generate();
    record.secret_hash = Secret::hash(secret.secret);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::SESSION_SECRET,
        "Could not create the session secret: " << e.what());
    return std::nullopt;
  }

  record.task = task;
  record.start_time_ms = Utils::get_current_time_ms();
  record.end_time_ms =
      record.start_time_ms +
      static_cast<uint64_t>(std::llround(duration_hours * 3600.0 * 1000.0));
  record.duration_hours = duration_hours;
  record.proxy_port = config_.session.proxy_port;

  if (!store_.save(record)) {
    LOG(LogLevel::ERROR, LogComponent::SESSION_LIFECYCLE,
        "Could not persist the session record, aborting session.");
    return std::nullopt;
  }

  if (!process_.start()) {
    LOG(LogLevel::ERROR, LogComponent::SESSION_LIFECYCLE,
        "Failed to start the enforcement process, aborting session.");
    store_.clear();
    return std::nullopt;
  }

  activate(record);
  LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
      "Session started successfully.");
  return secret;
}

bool SessionSupervisor::end_session(const std::string &secret) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::ACTIVE || ending_) {
      LOG(LogLevel::WARN, LogComponent::SESSION_LIFECYCLE,
          "Unlock requested with no active session.");
      return false;
    }
    bool matches = false;
    try {
      matches = Secret::verify(secret, record_.secret_hash);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::SESSION_SECRET,
          "Could not verify the unlock secret: " << e.what());
      return false;
    }
    if (!matches) {
      LOG(LogLevel::WARN, LogComponent::SESSION_SECRET,
          "Unlock attempt with a wrong secret.");
      return false;
    }
    ending_ = true;
  }

  LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
      "Secret verified, ending session early.");
  teardown(SessionState::UNLOCKED, false);
  return true;
}

bool SessionSupervisor::end_session_with_fragments(const std::string &first,
                                                   const std::string &second,
                                                   const std::string &third) {
  return end_session(Secret::join(first, second, third));
}

bool SessionSupervisor::resume() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::IDLE)
      return false;
  }

  std::optional<SessionRecord> record = store_.load();
  if (!record) {
    if (store_.exists()) {
      LOG(LogLevel::WARN, LogComponent::SESSION_LIFECYCLE,
          "Discarding unreadable session record " << store_.path());
      store_.clear();
    }
    return false;
  }

  if (record->end_time_ms <= Utils::get_current_time_ms()) {
    LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
        "Found an expired session record, cleaning up.");
    store_.clear();
    return false;
  }

  join_loops();
  LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
      "Resuming active session: " << record->task);
  if (!process_.start())
    LOG(LogLevel::WARN, LogComponent::SESSION_LIFECYCLE,
        "Enforcement process did not start on resume; the health loop will "
        "retry.");

  activate(*record);
  return true;
}

void SessionSupervisor::shutdown() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  bool was_active = false;
  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    was_active = state_ == SessionState::ACTIVE && !ending_;
    if (was_active)
      ending_ = true;
    stop_loops_ = true;
    loop_cv_.notify_all();
    loops_done_cv_.wait(lock, [this] { return running_loops_ == 0; });
  }
  join_loops();

  if (!was_active)
    return;
  process_.stop(std::chrono::milliseconds(config_.session.terminate_timeout_ms));
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = SessionState::IDLE;
    ending_ = false;
  }
  LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
      "Supervisor stopped with a session in progress; its record is kept "
      "for resumption.");
}

SessionStatus SessionSupervisor::status() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  SessionStatus status;
  status.state = state_;
  status.active = state_ == SessionState::ACTIVE;
  status.consecutive_restart_failures = consecutive_failures_;
  if (status.active) {
    uint64_t now = Utils::get_current_time_ms();
    status.remaining = std::chrono::milliseconds(
        record_.end_time_ms > now ? record_.end_time_ms - now : 0);
    status.task = record_.task;
    status.start_time_ms = record_.start_time_ms;
    status.end_time_ms = record_.end_time_ms;
  }
  return status;
}

SessionState SessionSupervisor::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::optional<SessionState> SessionSupervisor::last_outcome() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_outcome_;
}

void SessionSupervisor::set_transition_listener(TransitionListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

// Called with lifecycle_mutex_ held and the process already started
void SessionSupervisor::activate(const SessionRecord &record) {
  if (engine_ != nullptr) {
    std::optional<Mission> mission = load_mission_file(config_.mission_path);
    if (!mission) {
      LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
          "No mission document at " << config_.mission_path
                                    << ", using the task as the mission.");
      mission = Mission::from_text(record.task);
    }
    engine_->set_mission(std::move(*mission));
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    record_ = record;
    state_ = SessionState::ACTIVE;
    stop_loops_ = false;
    ending_ = false;
    consecutive_failures_ = 0;
  }
  notify_transition(SessionState::IDLE, SessionState::ACTIVE);
  start_loops();
}

void SessionSupervisor::start_loops() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_loops_ = 2;
  }
  expiry_thread_ = std::thread(&SessionSupervisor::run_loop, this,
                               &SessionSupervisor::expiry_loop);
  health_thread_ = std::thread(&SessionSupervisor::run_loop, this,
                               &SessionSupervisor::health_loop);
}

// Loop threads never join; this runs under lifecycle_mutex_ once they have
// returned or are about to
void SessionSupervisor::join_loops() {
  if (expiry_thread_.joinable())
    expiry_thread_.join();
  if (health_thread_.joinable())
    health_thread_.join();
}

void SessionSupervisor::run_loop(void (SessionSupervisor::*loop)()) {
  (this->*loop)();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    --running_loops_;
  }
  loops_done_cv_.notify_all();
}

void SessionSupervisor::expiry_loop() {
  const uint64_t interval = config_.session.expiry_check_interval_ms;
  std::unique_lock<std::mutex> lock(state_mutex_);
  while (!stop_loops_) {
    uint64_t now = Utils::get_current_time_ms();
    if (now >= record_.end_time_ms) {
      if (ending_)
        return;
      ending_ = true;
      lock.unlock();
      LOG(LogLevel::INFO, LogComponent::SESSION_EXPIRY,
          "Session time completed.");
      teardown(SessionState::COMPLETED, true);
      return;
    }
    uint64_t wait_ms = std::min(interval, record_.end_time_ms - now);
    LOG(LogLevel::TRACE, LogComponent::SESSION_EXPIRY,
        "Next expiry check in " << wait_ms << "ms.");
    loop_cv_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                      [this] { return stop_loops_; });
  }
}

void SessionSupervisor::health_loop() {
  const auto interval =
      std::chrono::milliseconds(config_.session.health_check_interval_ms);
  const uint32_t max_attempts = config_.session.max_restart_attempts;

  for (;;) {
    uint32_t failures = 0;
    {
      std::unique_lock<std::mutex> lock(state_mutex_);
      if (loop_cv_.wait_for(lock, interval, [this] { return stop_loops_; }))
        return;
      failures = consecutive_failures_;
    }

    if (process_.is_running())
      continue;
    LOG(LogLevel::WARN, LogComponent::SESSION_HEALTH,
        "Enforcement process died, attempting restart...");

    if (failures >= max_attempts) {
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_loops_ || ending_)
          return;
        ending_ = true;
      }
      LOG(LogLevel::ERROR, LogComponent::SESSION_HEALTH,
          "Max restart attempts (" << max_attempts << ") reached.");
      teardown(SessionState::EMERGENCY_TERMINATED, true);
      return;
    }

    restarts_->Increment();
    bool restarted = process_.start();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (restarted) {
      consecutive_failures_ = 0;
      LOG(LogLevel::INFO, LogComponent::SESSION_HEALTH,
          "Enforcement process restarted successfully.");
    } else {
      ++consecutive_failures_;
      LOG(LogLevel::ERROR, LogComponent::SESSION_HEALTH,
          "Restart attempt " << consecutive_failures_ << " failed.");
    }
  }
}

// The caller has already set ending_. A loop calling this still counts as
// running, so it waits for the other loop only.
void SessionSupervisor::teardown(SessionState outcome, bool from_loop) {
  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    stop_loops_ = true;
    loop_cv_.notify_all();
    const int allowed = from_loop ? 1 : 0;
    loops_done_cv_.wait(lock,
                        [this, allowed] { return running_loops_ <= allowed; });
  }

  process_.stop(std::chrono::milliseconds(config_.session.terminate_timeout_ms));
  store_.clear();
  if (engine_ != nullptr)
    engine_->clear_mission();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = outcome;
    last_outcome_ = outcome;
  }
  notify_transition(SessionState::ACTIVE, outcome);
  if (outcome == SessionState::EMERGENCY_TERMINATED)
    LOG(LogLevel::FATAL, LogComponent::SESSION_LIFECYCLE,
        "Emergency session termination: the enforcement process could not "
        "be kept alive. Filtering is OFF.");

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = SessionState::IDLE;
    record_ = SessionRecord{};
    ending_ = false;
    consecutive_failures_ = 0;
  }
  notify_transition(outcome, SessionState::IDLE);
}

void SessionSupervisor::notify_transition(SessionState from, SessionState to) {
  transitions_by_state_[static_cast<size_t>(to)]->Increment();
  LOG(LogLevel::INFO, LogComponent::SESSION_LIFECYCLE,
      "Session " << session_state_to_string(from) << " -> "
                 << session_state_to_string(to));

  TransitionListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_;
  }
  if (listener)
    listener(from, to);
}
