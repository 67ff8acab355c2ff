#pragma once

#include <string>
#include <string_view>

namespace courier::util
{
  std::string to_lower(std::string_view s);

  /* Reduces a client supplied file name to something safe to place in a
   * directory: only the final path component survives, and every character
   * outside [A-Za-z0-9._-] becomes '_'. Never returns an empty name, "." or "..". */
  std::string sanitize_filename(std::string_view name);

  bool is_valid_utf8(std::string_view s);

  std::string percent_encode(std::string_view s);
  std::string percent_decode(std::string_view s);
}
