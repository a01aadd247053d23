// -----------------------------------------------------------------------------
// config.cpp: DeviceConfig file I/O (nlohmann::json)
//
// Format & error strings: see include/cecflow/config.hpp
// -----------------------------------------------------------------------------
#include "cecflow/config.hpp"
#include "cecflow/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace cecflow {

// ---------- physical address text ----------

std::string format_physical_address(uint16_t pa) {
  char buf[16];
  std::snprintf(buf, sizeof buf, "%x.%x.%x.%x",
                (pa >> 12) & 0xF, (pa >> 8) & 0xF, (pa >> 4) & 0xF, pa & 0xF);
  return buf;
}

bool parse_physical_address(const std::string& text, uint16_t& out) {
  // exactly four hex nibbles separated by dots: "1.0.0.0"
  uint16_t pa = 0;
  int nibbles = 0;
  bool want_digit = true;
  for (char c : text) {
    if (want_digit) {
      int v;
      if      (c >= '0' && c <= '9') v = c - '0';
      else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
      else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
      else return false;
      pa = static_cast<uint16_t>((pa << 4) | v);
      ++nibbles;
      want_digit = false;
    } else {
      if (c != '.') return false;
      want_digit = true;
    }
  }
  if (nibbles != 4 || want_digit) return false;
  out = pa;
  return true;
}

// ---------- validation ----------

bool validate_config(const DeviceConfig& cfg, std::string& err) {
  if (cfg.logical_address > ADDR_SPECIFIC_USE) { err = "bad_value:logical_address(0..14)"; return false; }
  if (cfg.physical_address == INVALID_PHYSICAL_ADDRESS) { err = "bad_value:physical_address"; return false; }
  if (cfg.tv_address > ADDR_SPECIFIC_USE) { err = "bad_value:tv_address(0..14)"; return false; }
  if (cfg.response_timeout_ms < 1 || cfg.response_timeout_ms > 60000) {
    err = "bad_value:response_timeout_ms(1..60000)";
    return false;
  }
  if (cfg.power_status_loop_max < 1 || cfg.power_status_loop_max > 100) {
    err = "bad_value:power_status_loop_max(1..100)";
    return false;
  }
  if (cfg.log_level != "debug" && cfg.log_level != "info" && cfg.log_level != "warn" &&
      cfg.log_level != "error" && cfg.log_level != "off") {
    err = "bad_value:log_level";
    return false;
  }
  if (cfg.baud <= 0) { err = "bad_value:baud"; return false; }
  return true;
}

// ---------- file location ----------

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return (base / "cecflow" / "config.json").string();
}

// ---------- load ----------

// Range-check an integer field before narrowing it into the struct.
template <typename T>
static bool read_int(const json& j, const char* key, long lo, long hi, T& out,
                     const char* err_text, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number_integer()) { err = err_text; return false; }
  long n = v.get<long>();
  if (n < lo || n > hi) { err = err_text; return false; }
  out = static_cast<T>(n);
  return true;
}

static bool apply_json(const json& j, DeviceConfig& cfg, std::string& err) {
  if (!j.is_object()) { err = "bad_json"; return false; }

  if (!read_int(j, "logical_address", 0, ADDR_SPECIFIC_USE, cfg.logical_address,
                "bad_value:logical_address(0..14)", err)) return false;
  if (!read_int(j, "tv_address", 0, ADDR_SPECIFIC_USE, cfg.tv_address,
                "bad_value:tv_address(0..14)", err)) return false;
  if (!read_int(j, "response_timeout_ms", 1, 60000, cfg.response_timeout_ms,
                "bad_value:response_timeout_ms(1..60000)", err)) return false;
  if (!read_int(j, "power_status_loop_max", 1, 100, cfg.power_status_loop_max,
                "bad_value:power_status_loop_max(1..100)", err)) return false;

  if (j.contains("physical_address")) {
    const json& v = j.at("physical_address");
    uint16_t pa = 0;
    if (v.is_string()) {
      if (!parse_physical_address(v.get<std::string>(), pa)) { err = "bad_value:physical_address"; return false; }
    } else if (v.is_number_integer() && v.get<long>() >= 0 && v.get<long>() < 0xFFFF) {
      pa = static_cast<uint16_t>(v.get<long>());
    } else {
      err = "bad_value:physical_address";
      return false;
    }
    cfg.physical_address = pa;
  }

  if (j.contains("log_level")) {
    if (!j.at("log_level").is_string()) { err = "bad_value:log_level"; return false; }
    cfg.log_level = j.at("log_level").get<std::string>();
  }

  if (j.contains("serial")) {
    const json& s = j.at("serial");
    if (!s.is_object()) { err = "bad_json"; return false; }
    if (s.contains("dev")) {
      if (!s.at("dev").is_string()) { err = "bad_value:dev"; return false; }
      cfg.dev = s.at("dev").get<std::string>();
    }
    if (!read_int(s, "baud", 1, 4000000, cfg.baud, "bad_value:baud", err)) return false;
    if (!read_int(s, "boot_delay_ms", 0, 10000, cfg.boot_delay_ms,
                  "bad_value:boot_delay_ms(0..10000)", err)) return false;
  }
  return true;
}

bool load_config(const std::string& path, DeviceConfig& cfg, std::string& err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    log_debug("event=config_missing path=", path);
    return validate_config(cfg, err);
  }

  std::ifstream in(path);
  if (!in) { err = "open_failed"; return false; }

  json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) { err = "bad_json"; return false; }

  DeviceConfig next = cfg;   // all-or-nothing
  if (!apply_json(j, next, err)) return false;
  if (!validate_config(next, err)) return false;
  cfg = next;
  log_debug("event=config_loaded path=", path);
  return true;
}

// ---------- save ----------

bool save_config(const std::string& path, const DeviceConfig& cfg, std::string& err) {
  json j;
  j["logical_address"] = cfg.logical_address;
  j["physical_address"] = format_physical_address(cfg.physical_address);
  j["tv_address"] = cfg.tv_address;
  j["response_timeout_ms"] = cfg.response_timeout_ms;
  j["power_status_loop_max"] = cfg.power_status_loop_max;
  j["log_level"] = cfg.log_level;
  j["serial"] = { {"dev", cfg.dev}, {"baud", cfg.baud}, {"boot_delay_ms", cfg.boot_delay_ms} };

  fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) { err = "write_failed"; return false; }
  }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "write_failed"; return false; }
    out << j.dump(2) << '\n';
    out.flush();
    if (!out) { err = "write_failed"; return false; }
  }
  fs::rename(tmp, p, ec);
  if (ec) {
    fs::remove(tmp, ec);
    err = "write_failed";
    return false;
  }
  log_debug("event=config_saved path=", path);
  return true;
}

} // namespace cecflow
