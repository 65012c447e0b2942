#include "anomaly_detector.hpp"
#include "api_server.hpp"
#include "broadcaster.hpp"
#include "capture.hpp"
#include "metrics.hpp"
#include "stream_coordinator.hpp"
#include "ws_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#endif

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int signum) {
  (void)signum;
  g_shutdown.store(true, std::memory_order_release);
}

struct CliArgs {
  riptide::MonitorConfig monitor;
  riptide::AnomalyConfig anomaly;
  bool list_interfaces = false;
  bool help = false;
};

static std::optional<int> parse_int(const std::string& s) {
  try {
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<double> parse_double(const std::string& s) {
  try {
    size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<uint16_t> parse_port(const std::string& s) {
  auto v = parse_int(s);
  if (!v || *v < 1 || *v > 65535) return std::nullopt;
  return static_cast<uint16_t>(*v);
}

// Environment defaults; a malformed value keeps the built-in default.
static void load_env(CliArgs& args) {
  auto env_int = [](const char* key, int& target) {
    const char* raw = std::getenv(key);
    if (!raw) return;
    if (auto v = parse_int(raw)) {
      target = *v;
    } else {
      std::cerr << "[Riptide] Invalid integer value for " << key << ": " << raw
                << ", using default " << target << std::endl;
    }
  };
  auto env_double = [](const char* key, double& target) {
    const char* raw = std::getenv(key);
    if (!raw) return;
    if (auto v = parse_double(raw)) {
      target = *v;
    } else {
      std::cerr << "[Riptide] Invalid float value for " << key << ": " << raw
                << ", using default " << target << std::endl;
    }
  };

  env_int("ANOMALY_WINDOW_SIZE", args.anomaly.window_size);
  env_double("ANOMALY_THRESHOLD", args.anomaly.threshold);
  env_int("ANOMALY_MIN_SAMPLES", args.anomaly.min_samples);
  env_int("ANOMALY_ALERT_COOLDOWN", args.anomaly.alert_cooldown_seconds);

  if (const char* iface = std::getenv("DEFAULT_INTERFACE")) {
    args.monitor.interface_name = iface;
  }
  if (const char* bpf = std::getenv("DEFAULT_BPF_FILTER")) {
    args.monitor.bpf_filter = bpf;
  }
}

static CliArgs parse_args(int argc, char* argv[]) {
  CliArgs args;
  load_env(args);

  auto next_value = [&](int& i, const std::string& flag) -> std::optional<std::string> {
    if (i + 1 < argc) return std::string(argv[++i]);
    std::cerr << "Error: " << flag << " requires a value" << std::endl;
    args.help = true;
    return std::nullopt;
  };

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-i" || arg == "--interface") {
      if (auto v = next_value(i, arg)) args.monitor.interface_name = *v;
    }
    else if (arg == "-f" || arg == "--filter") {
      if (auto v = next_value(i, arg)) args.monitor.bpf_filter = *v;
    }
    else if (arg == "-p" || arg == "--port" || arg == "-a" || arg == "--api-port") {
      auto v = next_value(i, arg);
      if (!v) continue;
      auto port = parse_port(*v);
      if (!port) {
        std::cerr << "Error: invalid port number '" << *v << "'" << std::endl;
        args.help = true;
      } else if (arg == "-p" || arg == "--port") {
        args.monitor.ws_port = *port;
      } else {
        args.monitor.api_port = *port;
      }
    }
    else if (arg == "--host") {
      if (auto v = next_value(i, arg)) args.monitor.bind_host = *v;
    }
    else if (arg == "--window" || arg == "--min-samples" || arg == "--cooldown") {
      auto v = next_value(i, arg);
      if (!v) continue;
      auto n = parse_int(*v);
      if (!n) {
        std::cerr << "Error: " << arg << " expects an integer" << std::endl;
        args.help = true;
      } else if (arg == "--window") {
        args.anomaly.window_size = *n;
      } else if (arg == "--min-samples") {
        args.anomaly.min_samples = *n;
      } else {
        args.anomaly.alert_cooldown_seconds = *n;
      }
    }
    else if (arg == "--threshold") {
      auto v = next_value(i, arg);
      if (!v) continue;
      if (auto t = parse_double(*v)) {
        args.anomaly.threshold = *t;
      } else {
        std::cerr << "Error: --threshold expects a number" << std::endl;
        args.help = true;
      }
    }
    else if (arg == "-l" || arg == "--list") {
      args.list_interfaces = true;
    }
    else if (arg == "-h" || arg == "--help") {
      args.help = true;
    }
    else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      args.help = true;
    }
  }
  return args;
}

static void print_help() {
  std::cout << R"(
Riptide - live packet stream with traffic anomaly alerts

Usage: riptide-monitor [options]

Capture:
  -i, --interface <name>   Network interface to capture from
                           (default: auto-detect best interface)
  -f, --filter <bpf>       BPF filter expression (e.g. "tcp port 443")
  -l, --list               List available network interfaces

Servers:
  -p, --port <num>         WebSocket stream port (default: 8765)
  -a, --api-port <num>     HTTP API port (default: 8000)
      --host <addr>        Bind address for both servers (default: 127.0.0.1)

Anomaly detection:
      --window <sec>       Rolling window size, 10-300 (default: 60)
      --threshold <z>      Z-score threshold, 1.0-10.0 (default: 3.0)
      --min-samples <n>    Samples before detection starts, 5-window (default: 10)
      --cooldown <sec>     Minimum seconds between alerts, 5-300 (default: 30)

  -h, --help               Show this help

Environment:
  ANOMALY_WINDOW_SIZE, ANOMALY_THRESHOLD, ANOMALY_MIN_SAMPLES,
  ANOMALY_ALERT_COOLDOWN, DEFAULT_INTERFACE, DEFAULT_BPF_FILTER
  (command line flags take precedence)

Notes:
  - Packet capture requires elevated permissions (sudo / Run as Administrator)
  - Stream clients connect to ws://<host>:<port>; send "ping" for "pong"
)" << std::endl;
}

static void print_interfaces() {
  auto interfaces = riptide::CaptureEngine::list_interfaces();

  if (interfaces.empty()) {
    std::cerr << "No network interfaces found." << std::endl;
    std::cerr << "Ensure you have proper permissions and pcap is installed." << std::endl;
    return;
  }

  std::cout << "\nAvailable network interfaces:\n" << std::endl;

  int idx = 1;
  for (const auto& iface : interfaces) {
    std::string name = iface.name;
    if (name.length() > 24) name = name.substr(0, 21) + "...";
    name.resize(24, ' ');

    const char* state = iface.is_loopback ? "loopback" : (iface.is_up ? "UP      " : "down    ");

    std::cout << "  " << idx++ << " | " << name << " | " << state
              << " | " << (iface.has_ipv4 ? "ipv4" : "    ")
              << " | " << iface.description << std::endl;
  }

  std::cout << "\nUse -i <name> to select an interface." << std::endl;
}

int main(int argc, char* argv[]) {
  auto args = parse_args(argc, argv);

  if (args.help) {
    print_help();
    return 0;
  }

  if (args.list_interfaces) {
    print_interfaces();
    return 0;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
#ifdef _WIN32
  SetConsoleCtrlHandler([](DWORD type) -> BOOL {
    if (type == CTRL_C_EVENT || type == CTRL_CLOSE_EVENT) {
      g_shutdown.store(true, std::memory_order_release);
      return TRUE;
    }
    return FALSE;
  }, TRUE);
#endif

  const auto& config = args.monitor;

  std::optional<riptide::AnomalyDetector> detector;
  try {
    detector.emplace(args.anomaly);
  } catch (const riptide::ConfigError& e) {
    std::cerr << "[Riptide] Invalid anomaly configuration: " << e.what() << std::endl;
    return 1;
  }

  detector->on_alert([](const riptide::AnomalyAlert& alert) {
    std::cout << "[Riptide] ALERT (" << riptide::to_string(alert.level) << "): "
              << alert.message << std::endl;
  });

  riptide::Broadcaster broadcaster(config.send_timeout);
  riptide::CaptureEngine capture;

  riptide::StreamCoordinator::Timing timing;
  timing.poll_timeout = config.poll_timeout;
  timing.idle_sleep = config.idle_sleep;
  timing.error_backoff = config.error_backoff;
  timing.stop_timeout = config.stop_timeout;
  riptide::StreamCoordinator coordinator(capture, &*detector, broadcaster, timing);

  riptide::WSServer ws_server(config.ws_port, config.bind_host, broadcaster);
  riptide::ApiServer api_server(config.api_port, config.bind_host, &*detector, broadcaster, &capture);

  if (!ws_server.start()) {
    std::cerr << "[Riptide] Failed to start WebSocket server. Exiting." << std::endl;
    return 1;
  }

  if (!api_server.start()) {
    std::cerr << "[Riptide] Failed to start HTTP API. Exiting." << std::endl;
    ws_server.stop();
    return 1;
  }

  if (!capture.start(config.interface_name, config.bpf_filter)) {
    std::cerr << "[Riptide] Packet capture unavailable - streaming will resume once "
              << "capture is configured via POST /capture/settings" << std::endl;
  }

  coordinator.start();

  std::cout << "[Riptide] All systems online. Ctrl+C to stop." << std::endl;

  int tick = 0;
  while (!g_shutdown.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::seconds(1));

    if (++tick % 10 == 0) {
      std::cout << "[Riptide] Status: "
                << capture.packets_captured() << " pkts captured, "
                << capture.packets_dropped() << " queue drops, "
                << broadcaster.count() << " clients, "
                << broadcaster.messages_published() << " messages published, "
                << coordinator.alerts_published() << " alerts"
                << std::endl;
    }
  }

  std::cout << "\n[Riptide] Shutting down..." << std::endl;

  coordinator.stop();
  capture.stop();
  api_server.stop();
  ws_server.stop();
  detector->reset();

  std::cout << "[Riptide] Final stats: "
            << coordinator.packets_processed() << " packets streamed, "
            << coordinator.alerts_published() << " alerts raised"
            << std::endl;
  std::cout << "[Riptide] Goodbye." << std::endl;

  return 0;
}
