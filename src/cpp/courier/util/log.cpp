#include <atomic>
#include <iostream>
#include <mutex>

#include <courier/util/log.hpp>

namespace courier::util::log
{
  namespace
  {
    /* NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables) */
    std::atomic<level> min_level{ level::info };

    std::mutex &write_mutex()
    {
      static std::mutex m;
      return m;
    }
  }

  void set_level(level const l)
  {
    min_level.store(l);
  }

  level current_level()
  {
    return min_level.load();
  }

  bool enabled(level const l)
  {
    auto const min(min_level.load());
    return min != level::off && l >= min;
  }

  void write(level const l, std::string_view const tag, std::string_view const message)
  {
    std::lock_guard<std::mutex> const lock{ write_mutex() };
    std::cerr << '[' << tag << ']';
    if(l == level::warn || l == level::error)
    {
      std::cerr << ' ' << level_str(l) << ':';
    }
    std::cerr << ' ' << message << std::endl;
  }
}
