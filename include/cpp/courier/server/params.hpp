#pragma once

#include <optional>
#include <string>

#include <courier/type.hpp>

/* Argument coercion shared by all handlers. Commands receive an untyped JSON
 * object; each handler pulls out and checks only the keys it uses. */
namespace courier::server::params
{
  /* Strings pass through, numbers and booleans are stringified. Missing or null
   * keys and object/array values throw error::invalid_parameter. */
  std::string require_string(json const &args, std::string const &key);

  /* As `require_string`, but missing or null keys give `fallback`. */
  std::string
  optional_string(json const &args, std::string const &key, std::string const &fallback);

  /* Missing or null keys give nothing. */
  std::optional<std::string> maybe_string(json const &args, std::string const &key);

  /* Integers, floats (truncated toward zero) and numeric strings. */
  std::optional<i64> optional_integer(json const &args, std::string const &key);

  double optional_number(json const &args, std::string const &key, double fallback);

  /* Truthiness: false, 0, "", [], {} and null are false. */
  bool optional_flag(json const &args, std::string const &key, bool fallback);
}
