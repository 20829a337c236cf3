#include "devices/clock.hpp"
#include "runtime/config/config.hpp"
#include "runtime/config/toml_parser.hpp"
#include "runtime/runtime/machine.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

namespace {

#define REQUIRE(cond, msg)      \
  do {                          \
    if (!(cond)) {              \
      std::cerr << msg << "\n"; \
      return false;             \
    }                           \
  } while (0)

const char* kBenchConfig = R"(# bench machine
[machine]
platform = "virtual"
loop_hz = 500
log_period_ms = 0
default_pulse_ms = 12
start_events = ["ball_started"]

[playfield]
ball_search_timeout_ms = 20_000
ball_search_phase_3_searches = 2
ball_search_block_events = [
  "flipper_cradle",
  "ball_save_active",   # trailing comma below
]

[switch.s_pop1]
number = 1
type = "NC"

[switch.s_kickback]
number = "2"
debounce = "quick"

[coil.c_pop1]
number = "20"
default_pulse_ms = 15
default_pulse_power = 0.75
max_pulse_ms = 30

[coil.c_kickback]
number = 0x15

[autofire.pop1]
coil = "c_pop1"
switch = "s_pop1"
events_when_fired = ["pop1_hit", "score_100"]
timeout_watch_time_ms = 300
timeout_max_hits = 10
timeout_disable_time_ms = 500

[kickback.left]
coil = "c_kickback"
switch = "s_kickback"
enable_events = "kickback_lit"

[servo_controller.bench]
type = "virtual"

[servo.diverter]
controller = "bench"
number = 3
servo_min = 0.2
servo_max = 0.8
reset_position = 0.0

[servo.diverter.positions]
diverter_up = 1.0
"diverter.down" = 0.25
)";

bool expect_config_error(const std::string& text, const std::string& needle, const std::string& label) {
  try {
    (void)runtime::parse_machine_config_string(text);
  } catch (const std::exception& e) {
    const std::string what = e.what();
    if (what.find(needle) == std::string::npos) {
      std::cerr << label << ": error '" << what << "' does not mention '" << needle << "'\n";
      return false;
    }
    return true;
  }
  std::cerr << label << ": config was accepted\n";
  return false;
}

bool test_toml_subset() {
  const runtime::TomlDocument doc = runtime::parse_toml_string(
      "[a.\"b.c\"]\n"
      "hex = 0x1F\n"
      "big = 1_000_000\n"
      "neg = -3\n"
      "ratio = 0.5e1\n"
      "text = \"x # not a comment\"  # comment\n"
      "raw = 'C:\\dir'\n"
      "list = [1, [2, 3], \"four\",]\n");
  REQUIRE(doc.count("a.\"b.c\"") == 1, "quoted table part keeps its dot");
  const runtime::TomlSection& sec = doc.at("a.\"b.c\"");
  REQUIRE(sec.at("hex").as_int() == 31, "hex integer");
  REQUIRE(sec.at("big").as_int() == 1000000, "underscore separators");
  REQUIRE(sec.at("neg").as_int() == -3, "negative integer");
  REQUIRE(sec.at("ratio").is_double() && std::fabs(sec.at("ratio").as_double() - 5.0) < 1e-9, "float");
  REQUIRE(sec.at("text").as_string() == "x # not a comment", "hash inside a string");
  REQUIRE(sec.at("raw").as_string() == "C:\\dir", "literal string keeps backslashes");
  const auto& list = sec.at("list").as_array();
  REQUIRE(list.size() == 3 && list[1].as_array().size() == 2 && list[2].as_string() == "four",
          "nested array with trailing comma");

  const auto parts = runtime::split_table_name("servo.diverter.positions");
  REQUIRE(parts.size() == 3 && parts[1] == "diverter", "dotted table split");
  REQUIRE(runtime::split_table_name("a.\"b.c\"").size() == 2, "quoted part stays whole");

  bool threw = false;
  try {
    (void)runtime::parse_toml_string("[t]\nk = 1\nk = 2\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find(":3:") != std::string::npos;
  }
  REQUIRE(threw, "duplicate key rejected with its line number");

  threw = false;
  try {
    (void)runtime::parse_toml_string("[t]\nlist = [1,\n2\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  REQUIRE(threw, "unterminated multi-line array rejected");
  return true;
}

bool test_parse_bench_config() {
  const runtime::MachineConfig cfg = runtime::parse_machine_config_string(kBenchConfig);
  REQUIRE(cfg.machine.platform == runtime::PlatformKind::Virtual, "platform");
  REQUIRE(cfg.machine.loop_hz == 500 && cfg.machine.default_pulse_ms == 12, "machine timing");
  REQUIRE(cfg.machine.start_events.size() == 1 && cfg.machine.start_events[0] == "ball_started",
          "start events");
  REQUIRE(cfg.playfield.timeout_ms == 20000 && cfg.playfield.phase_searches[2] == 2, "ball search");
  REQUIRE(cfg.playfield.block_events.size() == 2 && cfg.playfield.block_events[1] == "ball_save_active",
          "multi-line event list");

  REQUIRE(cfg.switches.size() == 2 && cfg.coils.size() == 2, "switches and coils");
  REQUIRE(cfg.switches[0].name == "s_kickback" && cfg.switches[1].cfg.number == "1",
          "tables come in name order and integers become numbers");
  REQUIRE(cfg.switches[1].cfg.type == rules::SwitchType::NormallyClosed, "switch type");
  REQUIRE(cfg.switches[0].cfg.debounce == rules::DebounceMode::Quick, "switch debounce");
  REQUIRE(cfg.coils[0].name == "c_kickback" && cfg.coils[0].cfg.number == "21", "hex coil number");
  REQUIRE(cfg.coils[1].cfg.default_pulse_power && *cfg.coils[1].cfg.default_pulse_power == 0.75,
          "coil default power");

  REQUIRE(cfg.autofires.size() == 2, "autofire and kickback");
  const runtime::AutofireSection& pop = cfg.autofires[0];
  const runtime::AutofireSection& kick = cfg.autofires[1];
  REQUIRE(pop.name == "pop1" && !pop.kickback && pop.cfg.timeout_max_hits == 10, "autofire timeouts");
  REQUIRE(pop.cfg.enable_events.size() == 1 && pop.cfg.enable_events[0] == "ball_started",
          "autofire keeps default enable events");
  REQUIRE(kick.kickback && kick.cfg.enable_events.size() == 1 &&
              kick.cfg.enable_events[0] == "kickback_lit",
          "kickback enable event from a single string");

  REQUIRE(cfg.servos.size() == 1, "one servo");
  const devices::ServoDeviceConfig& servo = cfg.servos[0].cfg;
  REQUIRE(servo.number == "3" && servo.servo_min == 0.2 && servo.reset_position == 0.0, "servo keys");
  REQUIRE(servo.positions.size() == 2 && servo.positions.at("diverter_up") == 1.0 &&
              servo.positions.at("diverter.down") == 0.25,
          "positions sub-table");

  const std::string printed = runtime::machine_config_to_string(cfg);
  REQUIRE(printed.find("[kickback.left]") != std::string::npos, "printer lists kickbacks");
  REQUIRE(printed.find("[servo_controller.bench] type=virtual") != std::string::npos,
          "printer lists servo controllers");
  return true;
}

bool test_rejects_unknown_and_invalid() {
  const std::string machine = "[machine]\n";
  if (!expect_config_error(machine + "[lights]\n", "Unknown section [lights]", "unknown section") ||
      !expect_config_error(machine + "[switch.a]\nnumber = 1\ncolour = \"red\"\n", "colour",
                           "unknown key") ||
      !expect_config_error("[switch.a]\nnumber = 1\n", "[machine]", "missing machine") ||
      !expect_config_error(machine + "[switch.a]\ntype = \"NO\"\n", "number", "missing number") ||
      !expect_config_error("[machine]\nplatform = \"p-roc\"\n", "p-roc", "bad platform") ||
      !expect_config_error("[machine]\nloop_hz = 0\n", "loop_hz", "zero loop rate") ||
      !expect_config_error(machine + "[coil.c]\nnumber = 1\nmax_pulse_ms = -5\n", "max_pulse_ms",
                           "negative pulse") ||
      !expect_config_error(machine + "[switch.a]\nnumber = 1\n[switch.b]\nnumber = \"1\"\n",
                           "used twice", "shared switch number") ||
      !expect_config_error(machine + "[switch.a]\nnumber = 1\n[autofire.p]\ncoil = \"nope\"\nswitch = \"a\"\n",
                           "unknown coil 'nope'", "dangling coil") ||
      !expect_config_error(machine + "[servo.s.positions]\nup = 1.0\n", "[servo.s]", "orphan positions") ||
      !expect_config_error(machine + "[servo_controller.x]\ntype = \"maestro\"\nmin_value = 100\n",
                           "together", "half a calibration") ||
      !expect_config_error(machine + "[servo_controller.x]\ntype = \"p-roc\"\n", "p-roc",
                           "bad controller type")) {
    return false;
  }
  return true;
}

bool test_load_from_file() {
  const std::string path = "/tmp/pincore_machine_cfg_" + std::to_string(::getpid()) + ".toml";
  {
    std::ofstream out(path);
    out << kBenchConfig;
  }
  bool loaded = false;
  try {
    const runtime::MachineConfig cfg = runtime::load_machine_config(path);
    loaded = cfg.autofires.size() == 2;
  } catch (const std::exception& e) {
    std::cerr << "load failed: " << e.what() << "\n";
  }
  (void)::unlink(path.c_str());
  REQUIRE(loaded, "config file loads");

  bool threw = false;
  try {
    (void)runtime::load_machine_config(path);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  REQUIRE(threw, "missing file rejected");
  return true;
}

bool test_virtual_machine_runs_devices() {
  auto owned_clock = std::make_unique<devices::ManualClock>(1000);
  devices::ManualClock* clock = owned_clock.get();
  runtime::Machine machine(runtime::parse_machine_config_string(kBenchConfig), {}, std::move(owned_clock));

  rules::VirtualPlatform* platform = machine.virtual_platform();
  REQUIRE(platform != nullptr && machine.gpio_platform() == nullptr, "virtual backend");
  REQUIRE(machine.find_coil("c_pop1") != nullptr && machine.find_switch("s_pop1") != nullptr,
          "hardware objects built");

  machine.start();
  REQUIRE(machine.started(), "machine started");
  devices::AutofireCoil* pop = machine.devices().find_autofire("pop1");
  devices::AutofireCoil* kick = machine.devices().find_autofire("left");
  devices::ServoDevice* diverter = machine.devices().find_servo("diverter");
  REQUIRE(pop != nullptr && kick != nullptr && diverter != nullptr, "devices registered");
  REQUIRE(pop->enabled() && !kick->enabled(), "ball_started start event enabled only the autofire");
  REQUIRE(machine.events().post_count("machine_reset_phase_3") == 1, "reset phase posted");
  REQUIRE(diverter->position() == 0.0, "servo at its reset position");

  const auto* binding = platform->find_binding("1", "20");
  REQUIRE(binding != nullptr && binding->switch_settings.invert, "NC pop switch bound inverted");
  REQUIRE(binding->driver_settings.pulse.duration_ms == 15, "coil default pulse used");

  // NC switch: the active level is low.
  clock->set_ms(1500);
  platform->simulate_switch("1", false, clock->now_ms());
  platform->simulate_switch("1", true, clock->now_ms());
  machine.tick();
  REQUIRE(platform->driver_state("20").pulse_count == 1, "rule fired the pop coil");
  REQUIRE(machine.playfield().activity_count() == 1, "hit marked the playfield active");
  REQUIRE(machine.events().post_count("score_100") == 1, "events_when_fired posted");

  machine.events().post("kickback_lit");
  machine.events().post("diverter_up");
  machine.tick();
  REQUIRE(kick->enabled() && platform->has_binding("2", "21"), "kickback_lit armed the kickback");
  REQUIRE(diverter->position() == 1.0, "named position event moved the servo");

  REQUIRE(machine.stats_snapshot().switch_changes == 2, "switch changes counted");
  REQUIRE(machine.stats_snapshot().ticks == 2, "tick counter");

  machine.shutdown();
  REQUIRE(!machine.started(), "machine stopped");
  REQUIRE(platform->binding_count() == 0, "shutdown leaves no rule armed");
  REQUIRE(machine.devices().enabled_count() == 0, "every device disabled");
  machine.shutdown();
  return true;
}

bool test_gpio_sim_machine() {
  const std::string text =
      "[machine]\nplatform = \"gpio\"\nstart_events = \"ball_started\"\n"
      "[gpio]\nsim = true\nrecycle_ms = 100\n"
      "[switch.s_sling]\nnumber = 4\n"
      "[coil.c_sling]\nnumber = 17\ndefault_pulse_ms = 20\n"
      "[autofire.sling]\ncoil = \"c_sling\"\nswitch = \"s_sling\"\n";
  runtime::Machine machine(runtime::parse_machine_config_string(text), {},
                           std::make_unique<devices::ManualClock>(0));
  rules::GpioPlatform* gpio = machine.gpio_platform();
  REQUIRE(gpio != nullptr && machine.virtual_platform() == nullptr, "gpio backend");

  machine.start();
  REQUIRE(gpio->started(), "sim lines opened");
  REQUIRE(gpio->rule_count() == 1, "autofire rule evaluated in software");
  machine.tick();

  machine.shutdown();
  REQUIRE(gpio->rule_count() == 0 && !gpio->started(), "shutdown clears rules and releases lines");
  return true;
}

bool test_fractional_power_rejected_on_gpio() {
  const std::string text =
      "[machine]\nplatform = \"gpio\"\n[gpio]\nsim = true\n"
      "[switch.s]\nnumber = 4\n"
      "[coil.c]\nnumber = 17\ndefault_pulse_power = 0.5\n"
      "[autofire.a]\ncoil = \"c\"\nswitch = \"s\"\n";
  runtime::Machine machine(runtime::parse_machine_config_string(text), {},
                           std::make_unique<devices::ManualClock>(0));
  machine.start();
  machine.events().post("ball_started");
  machine.tick();
  devices::AutofireCoil* device = machine.devices().find_autofire("a");
  REQUIRE(device != nullptr && !device->enabled(), "enable failure is logged and leaves it off");
  REQUIRE(machine.gpio_platform()->rule_count() == 0, "nothing reached the lines");
  machine.shutdown();
  return true;
}

}  // namespace

int main() {
  if (!test_toml_subset()) {
    return EXIT_FAILURE;
  }
  if (!test_parse_bench_config()) {
    return EXIT_FAILURE;
  }
  if (!test_rejects_unknown_and_invalid()) {
    return EXIT_FAILURE;
  }
  if (!test_load_from_file()) {
    return EXIT_FAILURE;
  }
  if (!test_virtual_machine_runs_devices()) {
    return EXIT_FAILURE;
  }
  if (!test_gpio_sim_machine()) {
    return EXIT_FAILURE;
  }
  if (!test_fractional_power_rejected_on_gpio()) {
    return EXIT_FAILURE;
  }
  std::cout << "runtime_unit_machine_config: ok\n";
  return EXIT_SUCCESS;
}
