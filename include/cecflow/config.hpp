/**
 * @page cf-config cecflow Configuration
 * @file config.hpp
 * @brief DeviceConfig and its JSON file under the XDG config directory.
 *
 * @details
 * PURPOSE
 * -------
 * Everything a local device needs to know about itself and about its bus
 * wait budget, in one struct with sane defaults. The CLI reads the file,
 * applies command-line overrides on top, validates, and hands the struct to
 * LocalDevice.
 *
 * FILE
 * ----
 * `$XDG_CONFIG_HOME/cecflow/config.json`, falling back to
 * `$HOME/.config/cecflow/config.json`. Every key is optional:
 *
 * @code
 * {
 *   "logical_address": 4,
 *   "physical_address": "1.0.0.0",
 *   "tv_address": 0,
 *   "response_timeout_ms": 2000,
 *   "power_status_loop_max": 10,
 *   "log_level": "info",
 *   "serial": { "dev": "/dev/ttyACM0", "baud": 115200, "boot_delay_ms": 400 }
 * }
 * @endcode
 *
 * `physical_address` may also be given as a number (4096 == 1.0.0.0).
 *
 * ERRORS
 * ------
 * Failures return false with a stable, script-friendly string:
 *   "bad_json", "open_failed", "write_failed",
 *   "bad_value:logical_address(0..14)", "bad_value:physical_address",
 *   "bad_value:tv_address(0..14)", "bad_value:response_timeout_ms(1..60000)",
 *   "bad_value:power_status_loop_max(1..100)", "bad_value:log_level",
 *   "bad_value:baud", "bad_value:dev", "bad_value:boot_delay_ms(0..10000)".
 */
#pragma once
#include <stdint.h>
#include <string>
#include "cec_constants.hpp"

namespace cecflow {

struct DeviceConfig {
  uint8_t     logical_address{ADDR_PLAYBACK_1};
  uint16_t    physical_address{0x1000};
  uint8_t     tv_address{ADDR_TV};
  uint32_t    response_timeout_ms{RESPONSE_TIMEOUT_MS_DEFAULT};
  uint8_t     power_status_loop_max{POWER_STATUS_LOOP_MAX_DEFAULT};
  std::string log_level{"info"};

  // serial bridge
  std::string dev{"/dev/ttyACM0"};
  int         baud{115200};
  int         boot_delay_ms{400};
};

/// Check ranges; on failure `err` names the first bad field.
bool validate_config(const DeviceConfig& cfg, std::string& err);

/// Default file location (see above).
std::string default_config_path();

/**
 * @brief Load `path` over the values already in `cfg`.
 *
 * A missing file is not an error: `cfg` is left as is and true is returned.
 * The result is validated before returning.
 */
bool load_config(const std::string& path, DeviceConfig& cfg, std::string& err);

/// Write `cfg` as pretty JSON (temp file + rename). Creates parent directories.
bool save_config(const std::string& path, const DeviceConfig& cfg, std::string& err);

/// "1.0.0.0" <-> 0x1000
std::string format_physical_address(uint16_t pa);
bool parse_physical_address(const std::string& text, uint16_t& out);

} // namespace cecflow
