#pragma once

#include <optional>
#include <string>
#include <vector>

#include <courier/type.hpp>
#include <courier/util/log.hpp>
#include <courier/wire/protocol.hpp>

namespace courier::util::cli
{
  struct server_options
  {
    std::string bind_address{ "127.0.0.1" };
    u16 port{ wire::default_port };
    std::string upload_dir{ "uploads" };
    std::string workspace_dir{ "workspace" };
    int vm_timeout{ 30 };
    log::level log_level{ log::level::info };
  };

  enum class client_command : u8
  {
    request,
    chat,
    exec
  };

  struct client_options
  {
    /* Connection. */
    std::string host{ "127.0.0.1" };
    u16 port{ wire::default_port };
    std::string user;
    std::string session{ "default" };
    std::optional<bool> think;
    double timeout{ 10 };
    log::level log_level{ log::level::warn };

    /* Request command. */
    std::string command_name;
    std::vector<std::string> arg_pairs;
    std::string args_json;

    /* Chat command. */
    std::string prompt;
    double quiet_timeout{ 30 };

    /* Exec command. */
    std::string exec_command;
    bool raw{};

    client_command command{ client_command::request };
  };

  /* Both return an exit code when the process should stop right away, after
   * `--help` or a parse error. */
  std::optional<int> parse(int argc, char const **argv, server_options &opts);
  std::optional<int> parse(int argc, char const **argv, client_options &opts);

  /* Builds request arguments from `key=value` pairs layered over a JSON object.
   * A value that parses as JSON is taken as such, anything else as a string.
   * Throws error::invalid_parameter on a pair without '=' or a non-object
   * `args_json`. */
  json make_request_args(std::vector<std::string> const &arg_pairs, std::string const &args_json);
}
