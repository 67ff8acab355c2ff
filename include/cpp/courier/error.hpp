#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace courier::error
{
  /* All failures raised by courier itself derive from this. Failures raised by a
   * backend operation are not wrapped; they propagate as whatever the backend threw. */
  struct base : std::runtime_error
  {
    using std::runtime_error::runtime_error;

    virtual std::string_view kind() const noexcept = 0;
  };

  /* The command name has no handler. Raised before any frame is produced. */
  struct unknown_command : base
  {
    explicit unknown_command(std::string const &command)
      : base{ "Unknown command: " + command }
      , command{ command }
    {
    }

    std::string_view kind() const noexcept override
    {
      return "unknown-command";
    }

    std::string command;
  };

  struct invalid_parameter : base
  {
    using base::base;

    std::string_view kind() const noexcept override
    {
      return "invalid-parameter";
    }
  };

  /* A message on the wire could not be understood. */
  struct protocol : base
  {
    using base::base;

    std::string_view kind() const noexcept override
    {
      return "protocol";
    }
  };

  struct unsupported : base
  {
    using base::base;

    std::string_view kind() const noexcept override
    {
      return "unsupported";
    }
  };

  /* Client side: no qualifying frame arrived within the call's timeout. */
  struct server_unresponsive : base
  {
    using base::base;

    std::string_view kind() const noexcept override
    {
      return "server-unresponsive";
    }
  };

  /* Client side: the connection ended before a qualifying frame arrived. */
  struct connection_closed : base
  {
    using base::base;

    std::string_view kind() const noexcept override
    {
      return "connection-closed";
    }
  };

  /* Client side: the server answered with an error envelope. */
  struct command_failed : base
  {
    command_failed(std::string const &command, std::string const &message)
      : base{ command + ": " + message }
      , command{ command }
      , server_message{ message }
    {
    }

    std::string_view kind() const noexcept override
    {
      return "command-failed";
    }

    std::string command;
    std::string server_message;
  };
}
