#pragma once

#include <string>
#include <string_view>

namespace courier::wire
{
  /* Per-connection identity. Constant for the lifetime of a connection and
   * carried in the websocket request target, not in message bodies. */
  struct connection_params
  {
    bool operator==(connection_params const &) const = default;

    std::string user;
    std::string session;
    bool think{ false };
  };

  /* "/?user=<user>&session=<session>&think=true|false", percent-encoded. */
  std::string make_target(connection_params const &params);

  /* Unknown keys are ignored, missing ones keep their defaults. */
  connection_params parse_target(std::string_view target);
}
