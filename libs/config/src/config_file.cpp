/**
 * @file config_file.cpp
 * @brief Configuration text loader implementation.
 * @author Watosn
 */

#include "epsim/config/config_file.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include <fmt/format.h>

namespace epsim::config {
namespace {

using epsim::core::Status;

struct DoubleField {
  const char* key;
  double SimulationConfig::*member;
};

constexpr DoubleField kDoubleFields[] = {
    {"time_step_s", &SimulationConfig::time_step_s},
    {"orbit_period_s", &SimulationConfig::orbit_period_s},
    {"solar_constant_w_m2", &SimulationConfig::solar_constant_w_m2},
    {"panel_area_m2", &SimulationConfig::panel_area_m2},
    {"packing_efficiency", &SimulationConfig::packing_efficiency},
    {"cell_efficiency", &SimulationConfig::cell_efficiency},
    {"mppt_efficiency", &SimulationConfig::mppt_efficiency},
    {"wiring_efficiency", &SimulationConfig::wiring_efficiency},
    {"obc_power_w", &SimulationConfig::obc_power_w},
    {"adcs_power_w", &SimulationConfig::adcs_power_w},
    {"comms_power_w", &SimulationConfig::comms_power_w},
    {"payload_power_w", &SimulationConfig::payload_power_w},
    {"tx_power_w", &SimulationConfig::tx_power_w},
    {"tx_duration_s", &SimulationConfig::tx_duration_s},
    {"battery_capacity_wh", &SimulationConfig::battery_capacity_wh},
    {"soc_min", &SimulationConfig::soc_min},
    {"soc_max", &SimulationConfig::soc_max},
    {"soc_init", &SimulationConfig::soc_init},
    {"fade_rate_per_year", &SimulationConfig::fade_rate_per_year},
    {"self_discharge_per_month", &SimulationConfig::self_discharge_per_month},
    {"charge_efficiency", &SimulationConfig::charge_efficiency},
    {"capacity_floor_fraction", &SimulationConfig::capacity_floor_fraction},
    {"safe_mode_soc", &SimulationConfig::safe_mode_soc},
    {"tx_reserve_fraction", &SimulationConfig::tx_reserve_fraction},
    {"viability_soc", &SimulationConfig::viability_soc},
    {"panel_mass_kg", &SimulationConfig::panel_mass_kg},
};

constexpr const char* kNumOrbitsKey = "num_orbits";
constexpr const char* kPanelCountsKey = "panel_counts";

std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.erase(s.begin());
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.pop_back();
  }
  return s;
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  value = v;
  return true;
}

bool parse_int(const std::string& text, int& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
    return false;
  }
  value = static_cast<int>(v);
  return true;
}

bool parse_int_list(const std::string& text, std::vector<int>& values) {
  if (text.empty() || text.back() == ',') {
    return false;
  }
  std::vector<int> parsed;
  std::stringstream ss(text);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    int v = 0;
    if (!parse_int(trim(tok), v)) {
      return false;
    }
    parsed.push_back(v);
  }
  if (parsed.empty()) {
    return false;
  }
  values = std::move(parsed);
  return true;
}

void set_message(std::string* message, std::string text) {
  if (message != nullptr) {
    *message = std::move(text);
  }
}

}  // namespace

const std::vector<std::string>& config_keys() {
  static const std::vector<std::string> keys = [] {
    std::vector<std::string> out;
    out.emplace_back(kNumOrbitsKey);
    out.emplace_back(kPanelCountsKey);
    for (const auto& f : kDoubleFields) {
      out.emplace_back(f.key);
    }
    return out;
  }();
  return keys;
}

Status apply_entry(SimulationConfig* config, const std::string& key, const std::string& value, std::string* message) {
  if (config == nullptr) {
    set_message(message, "null configuration");
    return Status::InvalidInput;
  }
  if (key == kNumOrbitsKey) {
    int v = 0;
    if (!parse_int(value, v)) {
      set_message(message, fmt::format("{}: expected an integer, got '{}'", key, value));
      return Status::ParseError;
    }
    config->num_orbits = v;
    return Status::Ok;
  }
  if (key == kPanelCountsKey) {
    std::vector<int> v;
    if (!parse_int_list(value, v)) {
      set_message(message, fmt::format("{}: expected a comma-separated integer list, got '{}'", key, value));
      return Status::ParseError;
    }
    config->panel_counts = std::move(v);
    return Status::Ok;
  }
  for (const auto& f : kDoubleFields) {
    if (key == f.key) {
      double v = 0.0;
      if (!parse_double(value, v)) {
        set_message(message, fmt::format("{}: expected a number, got '{}'", key, value));
        return Status::ParseError;
      }
      config->*(f.member) = v;
      return Status::Ok;
    }
  }
  set_message(message, fmt::format("unknown configuration key '{}'", key));
  return Status::InvalidInput;
}

Status apply_override(SimulationConfig* config, const std::string& token, std::string* message) {
  const auto eq = token.find('=');
  if (eq == std::string::npos) {
    set_message(message, fmt::format("override '{}' is not of the form key=value", token));
    return Status::ParseError;
  }
  return apply_entry(config, trim(token.substr(0, eq)), trim(token.substr(eq + 1)), message);
}

LoadResult parse_config_text(const std::string& text, const SimulationConfig& base) {
  LoadResult out{.config = base};
  std::set<std::string> seen;
  std::stringstream in(text);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    line = trim(line);
    if (line.empty()) {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      out.status = Status::ParseError;
      out.message = fmt::format("line {}: expected 'key = value'", line_no);
      return out;
    }
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));
    if (!seen.insert(key).second) {
      out.status = Status::InvalidInput;
      out.message = fmt::format("line {}: duplicate key '{}'", line_no, key);
      return out;
    }
    std::string why;
    const Status s = apply_entry(&out.config, key, value, &why);
    if (s != Status::Ok) {
      out.status = s;
      out.message = fmt::format("line {}: {}", line_no, why);
      return out;
    }
  }
  return out;
}

LoadResult load_config_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return LoadResult{.status = Status::DataUnavailable,
                      .message = fmt::format("failed to open config file: {}", path.string())};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto out = parse_config_text(buffer.str());
  if (out.status != Status::Ok) {
    out.message = fmt::format("{}: {}", path.string(), out.message);
  }
  return out;
}

LoadResult resolve_config(const std::string& path, const std::vector<std::string>& overrides) {
  LoadResult out{};
  if (!path.empty() && path != "-") {
    out = load_config_file(path);
    if (out.status != Status::Ok) {
      return out;
    }
  }
  for (const auto& token : overrides) {
    std::string why;
    const Status s = apply_override(&out.config, token, &why);
    if (s != Status::Ok) {
      out.status = s;
      out.message = fmt::format("override '{}': {}", token, why);
      return out;
    }
  }
  return out;
}

}  // namespace epsim::config
