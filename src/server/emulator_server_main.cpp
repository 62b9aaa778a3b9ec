#include "emulator-server/Errors.hpp"
#include "emulator-server/Logger.hpp"
#include "emulator-server/ServerConfig.hpp"
#include "emulator-server/device/DeviceSession.hpp"
#include "emulator-server/ipc/ProcessExecutor.hpp"
#include "emulator-server/server/CommandHandlers.hpp"
#include "emulator-server/server/DispatchLoop.hpp"
#include "emulator-server/server/RpcServer.hpp"
#include "emulator-server/server/Transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace emuserver;
using json = nlohmann::json;

static std::atomic<bool> g_running{true};

void signal_handler(int sig) {
  (void)sig;
  g_running = false;
}

void print_usage() {
  std::cout << "Usage: emulator-server <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  serve                      Serve requests (stdio by default)\n";
  std::cout << "  operations                 Print the operation catalog\n";
  std::cout << "  call <op> [json-args]      Run one operation and print the "
               "response\n";
  std::cout << "  check                      Check the bridge tool and list "
               "devices\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <file>      YAML configuration file\n";
  std::cout << "  --port <n>           Serve on 127.0.0.1:<n> instead of stdio\n";
  std::cout << "  --stdio              Serve on stdin/stdout even if a port is "
               "configured\n";
  std::cout << "  --device <serial>    Default device\n";
  std::cout << "  --bridge <path>      Device-bridge executable (default: adb)\n";
  std::cout << "  --log-level <level>  trace|debug|info|warn|error (default: "
               "info)\n";
  std::cout << "  --log-file <file>    Log file ('' disables file logging)\n";
  std::cout << "\nEnvironment:\n";
  std::cout << "  EMULATOR_SERVER_BRIDGE, EMULATOR_SERVER_DEVICE, "
               "ANDROID_SERIAL,\n";
  std::cout << "  EMULATOR_SERVER_PORT\n";
  std::cout << "\nProtocol (one JSON document per line):\n";
  std::cout << "  -> {\"op\": \"tap_coordinates\", \"args\": {\"x\": 100, "
               "\"y\": 200}, \"id\": 1}\n";
  std::cout << "  <- {\"ok\": true, \"result\": \"Tapped at (100, 200)\", "
               "\"id\": 1}\n";
}

struct CliOptions {
  std::string config_path;
  std::optional<uint16_t> port;
  bool force_stdio{false};
  std::optional<std::string> device;
  std::optional<std::string> bridge;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::vector<std::string> positional;
};

// Returns false (after printing why) on a bad flag
bool parse_options(int argc, char **argv, CliOptions &opts) {
  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    auto value = [&](std::string &out) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string v;
    if (arg == "--config") {
      if (!value(opts.config_path))
        return false;
    } else if (arg == "--port") {
      if (!value(v))
        return false;
      try {
        int port = std::stoi(v);
        if (port < 0 || port > 65535)
          throw std::out_of_range(v);
        opts.port = static_cast<uint16_t>(port);
      } catch (const std::exception &) {
        std::cerr << "Invalid port: " << v << "\n";
        return false;
      }
    } else if (arg == "--stdio") {
      opts.force_stdio = true;
    } else if (arg == "--device") {
      if (!value(v))
        return false;
      opts.device = v;
    } else if (arg == "--bridge") {
      if (!value(v))
        return false;
      opts.bridge = v;
    } else if (arg == "--log-level") {
      if (!value(v))
        return false;
      opts.log_level = v;
    } else if (arg == "--log-file") {
      if (!value(v))
        return false;
      opts.log_file = v;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    } else {
      opts.positional.push_back(arg);
    }
  }
  return true;
}

std::optional<ServerConfig> load_config(const CliOptions &opts) {
  ServerConfig config;
  if (!opts.config_path.empty()) {
    try {
      config = ServerConfig::load_file(opts.config_path);
    } catch (const std::runtime_error &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return std::nullopt;
    }
  }
  config.apply_environment();

  if (opts.port)
    config.port = *opts.port;
  if (opts.device)
    config.default_device = *opts.device;
  if (opts.bridge)
    config.bridge_path = *opts.bridge;
  if (opts.log_level)
    config.log_level = parse_log_level(*opts.log_level);
  if (opts.log_file)
    config.log_file = *opts.log_file;
  return config;
}

device::DeviceSessionOptions session_options(const ServerConfig &config) {
  device::DeviceSessionOptions options;
  options.bridge_path = config.bridge_path;
  options.default_timeout = config.process_timeout;
  options.temp_dir = config.effective_temp_dir();
  options.max_artifact_bytes = config.max_artifact_bytes;
  return options;
}

int cmd_serve(const CliOptions &opts);
int cmd_operations(const CliOptions &opts);
int cmd_call(const CliOptions &opts);
int cmd_check(const CliOptions &opts);

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  if (command == "--help" || command == "-h" || command == "help") {
    print_usage();
    return 0;
  }

  CliOptions opts;
  if (!parse_options(argc - 2, argv + 2, opts)) {
    return 1;
  }

  std::signal(SIGPIPE, SIG_IGN);

  if (command == "serve") {
    return cmd_serve(opts);
  } else if (command == "operations") {
    return cmd_operations(opts);
  } else if (command == "call") {
    return cmd_call(opts);
  } else if (command == "check") {
    return cmd_check(opts);
  }

  std::cerr << "Unknown command: " << command << "\n\n";
  print_usage();
  return 1;
}

int cmd_serve(const CliOptions &opts) {
  auto config = load_config(opts);
  if (!config)
    return 1;

  ServerLogger::instance().init(config->log_file, config->log_level);
  config->bridge_path = resolve_bridge_path(config->bridge_path);

  ipc::PosixProcessExecutor executor(config->max_concurrent_processes);
  device::DeviceSession session(executor, session_options(*config));
  auto registry = server::build_default_registry();

  LOG_INFO("MAIN", "SERVE",
           "Bridge: {}, timeout: {}s, artifact limit: {} bytes, "
           "max processes: {}",
           config->bridge_path, config->process_timeout.count(),
           config->max_artifact_bytes, config->max_concurrent_processes);

  if (config->port == 0 || opts.force_stdio) {
    server::FdTransport transport(STDIN_FILENO, STDOUT_FILENO);
    server::DispatchLoop loop(registry, session, *config, "stdio");
    loop.run(transport);
    ServerLogger::instance().shutdown();
    return 0;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  server::RpcServer rpc(registry, session, *config);
  if (!rpc.start(config->port)) {
    std::cerr << "Failed to listen on 127.0.0.1:" << config->port << "\n";
    ServerLogger::instance().shutdown();
    return 1;
  }
  std::cerr << "Listening on 127.0.0.1:" << rpc.port() << "\n";

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  LOG_INFO("MAIN", "SERVE", "Shutting down");
  rpc.stop();
  ServerLogger::instance().shutdown();
  return 0;
}

int cmd_operations(const CliOptions &opts) {
  (void)opts;
  auto registry = server::build_default_registry();
  std::cout << registry->describe_json().dump(2) << "\n";
  return 0;
}

int cmd_call(const CliOptions &opts) {
  if (opts.positional.empty()) {
    std::cerr << "Usage: emulator-server call <op> [json-args]\n";
    return 1;
  }

  auto config = load_config(opts);
  if (!config)
    return 1;
  // Keep the console quiet unless asked; the response goes to stdout
  ServerLogger::instance().init(
      config->log_file, opts.log_level ? config->log_level : spdlog::level::warn);
  config->bridge_path = resolve_bridge_path(config->bridge_path);

  json request;
  request["op"] = opts.positional[0];
  request["args"] = json::object();
  if (opts.positional.size() > 1) {
    try {
      request["args"] = json::parse(opts.positional[1]);
    } catch (const json::parse_error &e) {
      std::cerr << "Invalid JSON arguments: " << e.what() << "\n";
      return 1;
    }
  }

  ipc::PosixProcessExecutor executor(config->max_concurrent_processes);
  device::DeviceSession session(executor, session_options(*config));
  server::DispatchLoop loop(server::build_default_registry(), session,
                            *config, "cli");

  auto response = loop.handle_request(request);
  std::cout << server::dump_response(response) << "\n";
  ServerLogger::instance().shutdown();
  return response.value("ok", false) ? 0 : 1;
}

int cmd_check(const CliOptions &opts) {
  auto config = load_config(opts);
  if (!config)
    return 1;
  ServerLogger::instance().init(config->log_file, config->log_level);
  config->bridge_path = resolve_bridge_path(config->bridge_path);

  ipc::PosixProcessExecutor executor(config->max_concurrent_processes);
  std::cout << "Bridge: " << config->bridge_path << "\n";

  try {
    ipc::ProcessRequest version;
    version.program = config->bridge_path;
    version.args = {"version"};
    version.timeout = config->process_timeout;
    auto result = executor.execute(version);
    auto first_line = result.stdout_text.substr(0, result.stdout_text.find('\n'));
    std::cout << "Version: " << first_line << "\n";

    device::DeviceSession session(executor, session_options(*config));
    auto devices = session.list_devices();
    std::cout << "Devices: " << devices.size() << "\n";
    for (const auto &d : devices) {
      std::cout << "  " << d.serial << "  " << d.state;
      auto model = d.details.find("model");
      if (model != d.details.end())
        std::cout << "  " << model->second;
      std::cout << "\n";
    }
  } catch (const ServerError &e) {
    std::cerr << "Check failed (" << error_kind_name(e.kind())
              << "): " << e.what() << "\n";
    ServerLogger::instance().shutdown();
    return 1;
  }

  ServerLogger::instance().shutdown();
  return 0;
}
