#include "runtime/config/config.hpp"
#include "runtime/runtime/machine.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

runtime::Machine* g_machine = nullptr;

void on_stop_signal(int) {
  if (g_machine != nullptr) {
    g_machine->request_stop();
  }
}

struct CliOptions {
  std::string config_path;
  runtime::MachineCliOverrides overrides;
  bool print_config = false;
};

// Returns nullopt after printing the problem to stderr.
std::optional<CliOptions> parse_cli(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--print-config") {
      opts.print_config = true;
    } else if (arg == "--config" && has_value) {
      opts.config_path = argv[++i];
    } else if (arg == "--duration-sec" && has_value) {
      const std::string value = argv[++i];
      try {
        opts.overrides.duration_sec_override = std::stod(value);
      } catch (const std::exception&) {
        std::cerr << "--duration-sec expects seconds, got '" << value << "'\n";
        return std::nullopt;
      }
    } else {
      std::cerr << "Unexpected argument '" << arg << "'\n";
      return std::nullopt;
    }
  }
  if (opts.config_path.empty()) {
    std::cerr << "--config is required\n";
    return std::nullopt;
  }
  return opts;
}

}  // namespace

int main(int argc, char** argv) {
  const std::optional<CliOptions> opts = parse_cli(argc, argv);
  if (!opts) {
    std::cerr << "Usage: " << argv[0] << " --config <path> [--duration-sec <seconds>] [--print-config]\n";
    return EXIT_FAILURE;
  }

  try {
    runtime::MachineConfig cfg = runtime::load_machine_config(opts->config_path);
    if (opts->print_config) {
      std::cout << runtime::machine_config_to_string(cfg) << std::flush;
    }

    runtime::Machine machine(std::move(cfg), opts->overrides);
    g_machine = &machine;
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);
    std::signal(SIGPIPE, SIG_IGN);

    machine.run();
    g_machine = nullptr;
  } catch (const std::exception& ex) {
    g_machine = nullptr;
    std::cerr << "pincore failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
