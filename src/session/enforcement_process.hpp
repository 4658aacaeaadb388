#ifndef ENFORCEMENT_PROCESS_HPP
#define ENFORCEMENT_PROCESS_HPP

#include "core/config.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

// Handle to the external intercepting proxy kept alive during a session
class IEnforcementProcess {
public:
  virtual ~IEnforcementProcess() = default;

  // Spawns the process and confirms it survived its startup grace period.
  // Returns false when it could not be started; never throws.
  virtual bool start() = 0;
  virtual bool is_running() = 0;

  // Graceful terminate, bounded wait, then force kill
  virtual void stop(std::chrono::milliseconds timeout) = 0;

  // -1 when not running
  virtual pid_t pid() const = 0;
};

// fork/execvp of the configured command
class PosixEnforcementProcess : public IEnforcementProcess {
public:
  PosixEnforcementProcess(std::string command, std::vector<std::string> args,
                          std::chrono::milliseconds startup_grace);
  ~PosixEnforcementProcess() override;

  PosixEnforcementProcess(const PosixEnforcementProcess &) = delete;
  PosixEnforcementProcess &operator=(const PosixEnforcementProcess &) = delete;

  // Uses the configured command, with "{port}" substituted in its arguments
  explicit PosixEnforcementProcess(const Config::SessionConfig &cfg);

  static std::vector<std::string>
  resolve_arguments(const Config::SessionConfig &cfg);

  bool start() override;
  bool is_running() override;
  void stop(std::chrono::milliseconds timeout) override;
  pid_t pid() const override;

private:
  bool reap_if_exited_locked();

  std::string command_;
  std::vector<std::string> args_;
  std::chrono::milliseconds startup_grace_;

  mutable std::mutex mutex_;
  pid_t pid_ = -1;
};

#endif // ENFORCEMENT_PROCESS_HPP
