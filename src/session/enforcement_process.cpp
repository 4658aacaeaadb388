#include "session/enforcement_process.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

std::string replace_all(std::string text, const std::string &from,
                        const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

} // namespace

PosixEnforcementProcess::PosixEnforcementProcess(
    std::string command, std::vector<std::string> args,
    std::chrono::milliseconds startup_grace)
    : command_(std::move(command)), args_(std::move(args)),
      startup_grace_(startup_grace) {}

PosixEnforcementProcess::~PosixEnforcementProcess() {
  if (pid() > 0)
    stop(std::chrono::milliseconds(2000));
}

PosixEnforcementProcess::PosixEnforcementProcess(
    const Config::SessionConfig &cfg)
    : PosixEnforcementProcess(cfg.enforcement_command, resolve_arguments(cfg),
                              std::chrono::milliseconds(cfg.startup_grace_ms)) {}

std::vector<std::string>
PosixEnforcementProcess::resolve_arguments(const Config::SessionConfig &cfg) {
  std::vector<std::string> args;
  for (const auto &arg : cfg.enforcement_args)
    args.push_back(replace_all(arg, "{port}", std::to_string(cfg.proxy_port)));
  return args;
}

bool PosixEnforcementProcess::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ > 0 && !reap_if_exited_locked())
    return true;

  // The child reports a failed exec through a close-on-exec pipe
  int report[2];
  if (pipe2(report, O_CLOEXEC) != 0) {
    LOG(LogLevel::ERROR, LogComponent::SESSION_HEALTH,
        "pipe2 failed: " << std::strerror(errno));
    return false;
  }

  std::vector<char *> argv;
  argv.push_back(const_cast<char *>(command_.c_str()));
  for (auto &arg : args_)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  pid_t child = fork();
  if (child < 0) {
    LOG(LogLevel::ERROR, LogComponent::SESSION_HEALTH,
        "fork failed: " << std::strerror(errno));
    close(report[0]);
    close(report[1]);
    return false;
  }

  if (child == 0) {
    close(report[0]);
    setpgid(0, 0);
    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = write(report[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close(report[1]);
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(report[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(report[0]);

  if (n > 0) {
    waitpid(child, nullptr, 0);
    LOG(LogLevel::ERROR, LogComponent::SESSION_HEALTH,
        "Could not exec '" << command_ << "': " << std::strerror(child_errno));
    return false;
  }

  pid_ = child;
  LOG(LogLevel::INFO, LogComponent::SESSION_HEALTH,
      "Spawned enforcement process '" << command_ << "' (pid " << pid_
                                      << "), waiting "
                                      << startup_grace_.count()
                                      << "ms for it to settle.");

  auto deadline = std::chrono::steady_clock::now() + startup_grace_;
  while (std::chrono::steady_clock::now() < deadline) {
    if (reap_if_exited_locked()) {
      LOG(LogLevel::ERROR, LogComponent::SESSION_HEALTH,
          "Enforcement process exited during startup.");
      return false;
    }
    std::this_thread::sleep_for(POLL_INTERVAL);
  }
  if (reap_if_exited_locked())
    return false;

  LOG(LogLevel::INFO, LogComponent::SESSION_HEALTH,
      "Enforcement process is up (pid " << pid_ << ").");
  return true;
}

bool PosixEnforcementProcess::is_running() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ <= 0)
    return false;
  return !reap_if_exited_locked();
}

void PosixEnforcementProcess::stop(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ <= 0 || reap_if_exited_locked())
    return;

  LOG(LogLevel::INFO, LogComponent::SESSION_HEALTH,
      "Sending SIGTERM to enforcement process " << pid_);
  kill(pid_, SIGTERM);

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (reap_if_exited_locked()) {
      LOG(LogLevel::INFO, LogComponent::SESSION_HEALTH,
          "Enforcement process stopped.");
      return;
    }
    std::this_thread::sleep_for(POLL_INTERVAL);
  }

  LOG(LogLevel::WARN, LogComponent::SESSION_HEALTH,
      "Enforcement process " << pid_ << " ignored SIGTERM for "
                             << timeout.count() << "ms, killing it.");
  kill(pid_, SIGKILL);
  waitpid(pid_, nullptr, 0);
  pid_ = -1;
}

pid_t PosixEnforcementProcess::pid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pid_;
}

// True when the child has exited (and is now reaped) or is not ours
bool PosixEnforcementProcess::reap_if_exited_locked() {
  int status = 0;
  pid_t result = waitpid(pid_, &status, WNOHANG);
  if (result == 0)
    return false;
  if (result == pid_) {
    if (WIFEXITED(status))
      LOG(LogLevel::DEBUG, LogComponent::SESSION_HEALTH,
          "Enforcement process " << pid_ << " exited with status "
                                 << WEXITSTATUS(status));
    else if (WIFSIGNALED(status))
      LOG(LogLevel::DEBUG, LogComponent::SESSION_HEALTH,
          "Enforcement process " << pid_ << " killed by signal "
                                 << WTERMSIG(status));
  }
  pid_ = -1;
  return true;
}
