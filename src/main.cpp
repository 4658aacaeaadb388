#include "core/app_context.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;
std::atomic<bool> g_clear_cache_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_config_requested = true;
  else if (signum == SIGUSR1)
    g_clear_cache_requested = true;
}

namespace {

void print_usage(const char *program) {
  std::cerr << "Usage: " << program << " [--config <file>] <command>\n\n"
            << "Commands:\n"
            << "  daemon                     Run the admission engine and "
               "session supervisor\n"
            << "  start <hours> <task...>    Start a focus session\n"
            << "  stop <secret>              End the session with the full "
               "secret\n"
            << "  unlock <f1> <f2> <f3>      End the session with the three "
               "fragments\n"
            << "  status                     Show the session status\n"
            << "  stats                      Show decision statistics\n";
}

int run_daemon(Config::ConfigManager &config_manager,
               const std::string &config_file) {
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);
  sigaction(SIGUSR1, &action, NULL);

  auto current_config = config_manager.get_config();
  LOG(LogLevel::INFO, LogComponent::CORE, "Anchorite daemon starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  AppContext context(current_config);
  if (context.supervisor().resume())
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Resumed the session that was active before the restart.");
  context.start_web_server();

  while (true) {
    if (g_shutdown_requested.exchange(false)) {
      if (context.supervisor().state() == SessionState::ACTIVE) {
        LOG(LogLevel::WARN, LogComponent::CORE,
            "Cannot shut down during an active session!");
      } else {
        LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown signal received.");
        break;
      }
    }

    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP detected. Reloading configuration from " << config_file
                                                           << "...");
      if (config_manager.load_configuration(config_file)) {
        LogManager::instance().configure(
            config_manager.get_config()->logging);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "Logger has been reconfigured. Other settings apply on restart.");
      } else {
        LOG(LogLevel::ERROR, LogComponent::CONFIG,
            "Failed to reload configuration. Keeping old settings.");
      }
    }

    if (g_clear_cache_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGUSR1 detected. Clearing the decision cache.");
      context.engine().clear_cache();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Anchorite daemon shut down.");
  return 0;
}

// Sends one request to the local daemon and prints the JSON reply
int call_daemon(const Config::AppConfig &config, const std::string &method,
                const std::string &path, const json &body = json()) {
  httplib::Client client(config.web_server.host, config.web_server.port);
  client.set_connection_timeout(5, 0);
  client.set_read_timeout(30, 0);

  auto res = method == "GET"
                 ? client.Get(path)
                 : client.Post(path, body.dump(), "application/json");
  if (!res) {
    std::cerr << "Could not reach the daemon at " << config.web_server.host
              << ":" << config.web_server.port << " ("
              << httplib::to_string(res.error()) << ")\n";
    return 2;
  }

  json reply = json::parse(res->body, nullptr, false);
  std::cout << (reply.is_discarded() ? res->body : reply.dump(2)) << "\n";
  return res->status < 400 ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_file_to_load = "config.ini";
  if (args.size() >= 2 && args[0] == "--config") {
    config_file_to_load = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(config_file_to_load))
    std::cerr << "Configuration " << config_file_to_load
              << " could not be applied, using defaults.\n";
  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  const std::string &command = args[0];
  if (command == "daemon")
    return run_daemon(config_manager, config_file_to_load);

  if (command == "start" && args.size() >= 3) {
    auto hours = Utils::string_to_number<double>(args[1]);
    if (!hours || *hours <= 0.0) {
      std::cerr << "Duration must be a positive number of hours.\n";
      return 1;
    }
    std::vector<std::string> task_words(args.begin() + 2, args.end());
    return call_daemon(*current_config, "POST", "/api/v1/session/start",
                       {{"duration_hours", *hours},
                        {"task", Utils::join(task_words, " ")}});
  }
  if (command == "stop" && args.size() == 2)
    return call_daemon(*current_config, "POST", "/api/v1/session/end",
                       {{"secret", args[1]}});
  if (command == "unlock" && args.size() == 4)
    return call_daemon(*current_config, "POST", "/api/v1/session/end",
                       {{"fragments", {args[1], args[2], args[3]}}});
  if (command == "status")
    return call_daemon(*current_config, "GET", "/api/v1/session/status");
  if (command == "stats")
    return call_daemon(*current_config, "GET", "/api/v1/stats");

  print_usage(argv[0]);
  return 1;
}
