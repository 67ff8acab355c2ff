#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace courier::util
{
  /* Guesses a MIME type from the extension of `file_name`, case-insensitively.
   * Unknown or missing extensions yield nothing. */
  std::optional<std::string> guess_mime_type(std::string_view file_name);

  bool is_audio_file(std::string_view file_name);
}
