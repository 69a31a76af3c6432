/**
 * @file types.hpp
 * @brief Core status types for epsim.
 * @author Watosn
 */
#pragma once

#include <cstdint>

namespace epsim::core {

/**
 * @brief Standard status code used by model and loader outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DataUnavailable, ParseError };

/**
 * @brief Stable lowercase name for a status value.
 */
inline const char* status_to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::ParseError:
      return "parse_error";
    default:
      return "unknown";
  }
}

}  // namespace epsim::core
