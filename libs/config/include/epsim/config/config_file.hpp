/**
 * @file config_file.hpp
 * @brief `key = value` configuration text loader and overrides.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "epsim/config/simulation_config.hpp"

namespace epsim::config {

/**
 * @brief Parsed configuration plus loader status.
 */
struct LoadResult {
  SimulationConfig config{};
  epsim::core::Status status{epsim::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Apply one `key`/`value` pair onto a configuration.
 * @param config Target configuration; untouched on failure.
 * @param key Field name as spelled in SimulationConfig.
 * @param value Textual value; `panel_counts` takes a comma-separated list.
 * @param message Receives a description on failure.
 * @return `Ok`, `InvalidInput` for an unknown key or `ParseError` for a malformed value.
 */
[[nodiscard]] epsim::core::Status apply_entry(SimulationConfig* config,
                                              const std::string& key,
                                              const std::string& value,
                                              std::string* message);

/**
 * @brief Apply a `key=value` override token (command-line form).
 */
[[nodiscard]] epsim::core::Status apply_override(SimulationConfig* config, const std::string& token, std::string* message);

/**
 * @brief Parse configuration text on top of `base`.
 *
 * Lines are `key = value`; `#` starts a comment; blank lines are skipped.
 * A key may appear only once.
 */
[[nodiscard]] LoadResult parse_config_text(const std::string& text, const SimulationConfig& base = {});

/**
 * @brief Read and parse a configuration file on top of the defaults.
 */
[[nodiscard]] LoadResult load_config_file(const std::filesystem::path& path);

/**
 * @brief Resolve a run configuration from an optional file and `key=value` overrides.
 * @param path Config file, or empty / "-" for built-in defaults.
 * @param overrides Override tokens applied in order after the file.
 */
[[nodiscard]] LoadResult resolve_config(const std::string& path, const std::vector<std::string>& overrides);

/**
 * @brief Names of all recognized configuration keys, in declaration order.
 */
[[nodiscard]] const std::vector<std::string>& config_keys();

}  // namespace epsim::config
