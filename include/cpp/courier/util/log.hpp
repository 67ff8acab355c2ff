#pragma once

#include <sstream>
#include <string>
#include <string_view>

#include <courier/type.hpp>

namespace courier::util::log
{
  enum class level : u8
  {
    debug,
    info,
    warn,
    error,
    off
  };

  constexpr char const *level_str(level const l)
  {
    switch(l)
    {
      case level::debug:
        return "debug";
      case level::info:
        return "info";
      case level::warn:
        return "warn";
      case level::error:
        return "error";
      case level::off:
        return "off";
      default:
        return "unknown";
    }
  }

  void set_level(level l);
  level current_level();
  bool enabled(level l);

  /* Writes one line, `[tag] message`, to stderr. Lines from different threads
   * never interleave. */
  void write(level l, std::string_view tag, std::string_view message);

  template <typename... Args>
  void emit(level const l, std::string_view const tag, Args &&...args)
  {
    if(!enabled(l))
    {
      return;
    }

    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    write(l, tag, oss.str());
  }

  template <typename... Args>
  void debug(std::string_view const tag, Args &&...args)
  {
    emit(level::debug, tag, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(std::string_view const tag, Args &&...args)
  {
    emit(level::info, tag, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(std::string_view const tag, Args &&...args)
  {
    emit(level::warn, tag, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(std::string_view const tag, Args &&...args)
  {
    emit(level::error, tag, std::forward<Args>(args)...);
  }
}
