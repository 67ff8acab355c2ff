#include <unordered_map>

#include <courier/util/mime.hpp>
#include <courier/util/string.hpp>

namespace courier::util
{
  static std::unordered_map<std::string, std::string> const &mime_table()
  {
    static std::unordered_map<std::string, std::string> const table{
      /* Audio. */
      { ".aac", "audio/aac" },
      { ".aif", "audio/x-aiff" },
      { ".aifc", "audio/x-aiff" },
      { ".aiff", "audio/x-aiff" },
      { ".au", "audio/basic" },
      { ".flac", "audio/flac" },
      { ".m4a", "audio/mp4" },
      { ".mid", "audio/midi" },
      { ".midi", "audio/midi" },
      { ".mp2", "audio/mpeg" },
      { ".mp3", "audio/mpeg" },
      { ".oga", "audio/ogg" },
      { ".ogg", "audio/ogg" },
      { ".opus", "audio/opus" },
      { ".ra", "audio/x-pn-realaudio" },
      { ".snd", "audio/basic" },
      { ".wav", "audio/x-wav" },
      { ".weba", "audio/webm" },
      { ".wma", "audio/x-ms-wma" },
      /* Everything else a client commonly uploads. */
      { ".csv", "text/csv" },
      { ".htm", "text/html" },
      { ".html", "text/html" },
      { ".md", "text/markdown" },
      { ".txt", "text/plain" },
      { ".json", "application/json" },
      { ".pdf", "application/pdf" },
      { ".zip", "application/zip" },
      { ".gif", "image/gif" },
      { ".jpg", "image/jpeg" },
      { ".jpeg", "image/jpeg" },
      { ".png", "image/png" },
      { ".svg", "image/svg+xml" },
      { ".mp4", "video/mp4" },
      { ".webm", "video/webm" },
      { ".mov", "video/quicktime" },
    };
    return table;
  }

  std::optional<std::string> guess_mime_type(std::string_view const file_name)
  {
    auto const slash(file_name.find_last_of("/\\"));
    auto const base(slash == std::string_view::npos ? file_name : file_name.substr(slash + 1));
    auto const dot(base.rfind('.'));
    if(dot == std::string_view::npos || dot == 0)
    {
      return std::nullopt;
    }

    auto const &table(mime_table());
    auto const found(table.find(to_lower(base.substr(dot))));
    if(found == table.end())
    {
      return std::nullopt;
    }
    return found->second;
  }

  bool is_audio_file(std::string_view const file_name)
  {
    auto const mime(guess_mime_type(file_name));
    return mime.has_value() && mime->starts_with("audio");
  }
}
