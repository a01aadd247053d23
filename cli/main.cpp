/**
 * @file main.cpp
 * @brief cecflow-cli: run one feature action against a serial bridge or a simulated display.
 *
 * Responsibilities:
 *  - Parse options (CLI11); exactly one of --one-touch-play, --standby <addr>, --query-power.
 *  - Load DeviceConfig from the XDG config file; command-line values win.
 *  - Build the transport: SerialBusTransport (--dev/--baud/--boot-delay) or
 *    SimulatedBus + SimulatedDisplay (--simulate, --wake-after, --silent).
 *  - Start the operation on a LocalDevice and tick it until the result arrives.
 *
 * Output (stdout / stderr, one line):
 *   status=ok result=<n> [power=<status>]
 *   status=error reason=<why> [result=<n>]
 *
 * Exit codes: 0 success, 1 transport open failure, 2 usage/config error,
 *             3 the operation finished with a failure result (or was refused).
 *
 * Notes:
 *  - Simulated runs use a virtual clock that jumps to the next timer, so a
 *    full 10-query timeout finishes instantly.
 *  - Standby never reports success: RESULT_NO_ACK (1) is its normal end when
 *    the target took the command silently.
 */

#include <iostream>
#include <string>
#include <memory>
#include <chrono>
#include <cstdint>
#include <unistd.h>         // usleep

#include "CLI/CLI11.hpp"

#include "cecflow/cec_constants.hpp"
#include "cecflow/config.hpp"
#include "cecflow/local_device.hpp"
#include "cecflow/log.hpp"
#include "cecflow/transport/serial_bus_transport.hpp"
#include "cecflow/transport/simulated_bus.hpp"

using namespace cecflow;

static uint32_t now_ms_steady32() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  return static_cast<uint32_t>(ms & 0xFFFFFFFFu);
}

static const char* power_name(int status) {
  switch (status) {
    case POWER_STATUS_ON:                   return "on";
    case POWER_STATUS_STANDBY:              return "standby";
    case POWER_STATUS_TRANSIENT_TO_ON:      return "transient_to_on";
    case POWER_STATUS_TRANSIENT_TO_STANDBY: return "transient_to_standby";
    default:                                return "unknown";
  }
}

int main(int argc, char** argv) {
  CLI::App app{"cecflow CLI"};

  // ---- commands ----
  bool one_touch = false, query_power = false;
  int  standby_target = -1;

  // ---- device / config ----
  std::string config_path = default_config_path();
  std::string dev, log_level;
  int baud = 0, boot_delay_ms = 0;
  uint32_t timeout_ms = 0;
  bool save = false;

  // ---- simulation ----
  bool simulate = false, silent = false;
  unsigned wake_after = 1;

  app.add_flag("--one-touch-play", one_touch, "Wake the display and become the active source");
  CLI::Option* opt_standby = app.add_option("--standby", standby_target,
      "Send <Standby> to a logical address (0..15)")->check(CLI::Range(0, 15));
  app.add_flag("--query-power", query_power, "Ask the display for its power status");

  app.add_option("--config", config_path, "Config file (default: $XDG_CONFIG_HOME/cecflow/config.json)");
  CLI::Option* opt_dev     = app.add_option("--dev", dev, "Serial bridge device");
  CLI::Option* opt_baud    = app.add_option("--baud", baud, "Baud rate");
  CLI::Option* opt_boot    = app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms)");
  CLI::Option* opt_timeout = app.add_option("--timeout", timeout_ms, "Response timeout per wait (ms)");
  CLI::Option* opt_level   = app.add_option("--log-level", log_level, "debug|info|warn|error|off")
      ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
  app.add_flag("--save-config", save, "Write the effective configuration back to --config");

  app.add_flag("--simulate", simulate, "Use an in-memory bus with a simulated display");
  app.add_option("--wake-after", wake_after, "Simulated display reports on at this power query")
      ->check(CLI::Range(1u, 100u));
  app.add_flag("--silent", silent, "Simulated display never replies");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration: file, then flags --------
  DeviceConfig cfg;
  std::string err;
  if (!load_config(config_path, cfg, err)) {
    std::cerr << "status=error reason=" << err << " path=" << config_path << "\n";
    return 2;
  }
  if (opt_dev->count())     cfg.dev = dev;
  if (opt_baud->count())    cfg.baud = baud;
  if (opt_boot->count())    cfg.boot_delay_ms = boot_delay_ms;
  if (opt_timeout->count()) cfg.response_timeout_ms = timeout_ms;
  if (opt_level->count())   cfg.log_level = log_level;
  if (!validate_config(cfg, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 2;
  }
  set_log_level(cfg.log_level);

  if (save) {
    if (!save_config(config_path, cfg, err)) {
      std::cerr << "status=error reason=" << err << " path=" << config_path << "\n";
      return 2;
    }
    std::cout << "status=ok saved=" << config_path << "\n";
  }

  // -------- choose exactly one command --------
  int cmds = 0;
  cmds += one_touch ? 1 : 0;
  cmds += opt_standby->count() ? 1 : 0;
  cmds += query_power ? 1 : 0;
  if (cmds == 0 && save) return 0;
  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  // -------- transport --------
  transport::SimulatedBus sim_bus;
  transport::SimulatedDisplay display(cfg.tv_address);
  transport::SerialBusTransport serial;
  transport::BusTransport* bus = nullptr;

  if (simulate) {
    display.set_wake_after(wake_after);
    display.set_silent(silent);
    sim_bus.attach(display);
    bus = &sim_bus;
  } else {
    if (!serial.open(cfg.dev, cfg.baud, cfg.boot_delay_ms)) {
      std::cerr << "status=error reason=open_failed dev=" << cfg.dev << "\n";
      return 1;
    }
    bus = &serial;
  }

  // -------- run --------
  LocalDevice device(*bus, cfg);
  bool done = false;
  int result = RESULT_FAIL;
  auto cb = make_callback([&](int r) { done = true; result = r; });

  bool started = false;
  if (one_touch)                 started = device.one_touch_play(cb);
  else if (opt_standby->count()) started = device.standby(static_cast<uint8_t>(standby_target), cb);
  else                           started = device.query_display_status(cb);
  if (!started) {
    std::cerr << "status=error reason=refused\n";
    return 3;
  }

  // wall-clock guard: every wait plus slack
  const uint64_t budget_ms =
      uint64_t(cfg.response_timeout_ms) * (uint64_t(cfg.power_status_loop_max) + 1) + 1000;

  if (simulate) {
    uint32_t now = 0;
    while (!done) {
      device.tick(now);
      if (done) break;
      uint64_t next = 0;
      if (sim_bus.pending_count() > 0 || device.inbox_size() > 0) {
        now += 1;
      } else if (device.next_timer_deadline(next)) {
        now = static_cast<uint32_t>(next > now ? next : now + 1);
      } else {
        break;   // nothing left that could finish the action
      }
      if (now > budget_ms) break;
    }
  } else {
    const uint32_t t0 = now_ms_steady32();
    while (!done) {
      const uint32_t now = now_ms_steady32();
      device.tick(now);
      if (uint32_t(now - t0) > budget_ms) break;
      usleep(2000);
    }
  }

  if (!done) {
    std::cerr << "status=error reason=no_result\n";
    return 3;
  }

  if (query_power) {
    if (result == POWER_STATUS_UNKNOWN) {
      std::cerr << "status=error reason=no_power_status result=" << result << "\n";
      return 3;
    }
    std::cout << "status=ok result=" << result << " power=" << power_name(result) << "\n";
    return 0;
  }

  if (result != RESULT_SUCCESS) {
    std::cerr << "status=error reason=action_failed result=" << result << "\n";
    return 3;
  }
  std::cout << "status=ok result=" << result << "\n";
  return 0;
}
