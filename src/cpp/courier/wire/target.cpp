#include <courier/util/string.hpp>
#include <courier/wire/target.hpp>

namespace courier::wire
{
  std::string make_target(connection_params const &params)
  {
    std::string ret{ "/?user=" };
    ret += util::percent_encode(params.user);
    ret += "&session=";
    ret += util::percent_encode(params.session);
    ret += "&think=";
    ret += params.think ? "true" : "false";
    return ret;
  }

  static bool parse_flag(std::string_view const value)
  {
    auto const lowered(util::to_lower(value));
    return lowered == "true" || lowered == "1" || lowered == "yes";
  }

  connection_params parse_target(std::string_view target)
  {
    connection_params ret;

    auto const question(target.find('?'));
    if(question == std::string_view::npos)
    {
      return ret;
    }
    target.remove_prefix(question + 1);

    while(!target.empty())
    {
      auto const amp(target.find('&'));
      auto const pair(target.substr(0, amp));
      target.remove_prefix(amp == std::string_view::npos ? target.size() : amp + 1);

      auto const eq(pair.find('='));
      auto const key(util::percent_decode(pair.substr(0, eq)));
      auto const value(
        eq == std::string_view::npos ? std::string{} : util::percent_decode(pair.substr(eq + 1)));

      if(key == "user")
      {
        ret.user = value;
      }
      else if(key == "session")
      {
        ret.session = value;
      }
      else if(key == "think")
      {
        ret.think = parse_flag(value);
      }
    }

    return ret;
  }
}
