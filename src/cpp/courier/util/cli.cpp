#include <map>

#include <CLI/CLI.hpp>

#include <courier/error.hpp>
#include <courier/util/cli.hpp>

namespace courier::util::cli
{
  static std::string make_default(std::string const &input)
  {
    return "default: " + input;
  }

  static std::map<std::string, log::level> const &log_levels()
  {
    static std::map<std::string, log::level> const levels{
      { "debug", log::level::debug },
      {  "info",  log::level::info },
      {  "warn",  log::level::warn },
      { "error", log::level::error },
      {   "off",   log::level::off }
    };
    return levels;
  }

  static void add_log_level(CLI::App &cli, log::level &target, char const * const envname)
  {
    auto &opt(*cli.add_option("--log-level", target, "Minimum level of log lines to print.")
                 ->transform(CLI::CheckedTransformer(log_levels(), CLI::ignore_case)
                               .description("{debug,info,warn,error,off}"))
                 ->default_str(make_default(log::level_str(target))));
    if(envname)
    {
      opt.envname(envname);
    }
  }

  std::optional<int> parse(int const argc, char const **argv, server_options &opts)
  {
    CLI::App cli{ "courier agent server" };

    cli.set_help_flag("-h,--help", "Print this help message and exit.");

    cli.add_option("--bind", opts.bind_address, "Address to listen on.")
      ->envname("COURIER_BIND")
      ->default_str(make_default(opts.bind_address));
    cli.add_option("-p,--port", opts.port, "Port to listen on; 0 picks a free one.")
      ->envname("COURIER_PORT")
      ->default_str(make_default(std::to_string(opts.port)));
    cli.add_option("--upload-dir", opts.upload_dir, "Directory uploaded documents are stored in.")
      ->envname("COURIER_UPLOAD_DIR")
      ->default_str(make_default(opts.upload_dir));
    cli
      .add_option("--workspace-dir",
                  opts.workspace_dir,
                  "Directory holding each user's files for the file commands.")
      ->envname("COURIER_WORKSPACE_DIR")
      ->default_str(make_default(opts.workspace_dir));
    cli.add_option("--vm-timeout", opts.vm_timeout, "Default VM command timeout, in seconds.")
      ->envname("COURIER_VM_TIMEOUT")
      ->check(CLI::PositiveNumber)
      ->default_str(make_default(std::to_string(opts.vm_timeout)));
    add_log_level(cli, opts.log_level, "COURIER_LOG_LEVEL");

    cli.failure_message(CLI::FailureMessage::help);

    try
    {
      cli.parse(argc, argv);
    }
    catch(CLI::ParseError const &e)
    {
      return cli.exit(e);
    }

    return std::nullopt;
  }

  std::optional<int> parse(int const argc, char const **argv, client_options &opts)
  {
    CLI::App cli{ "courier client" };

    cli.set_help_flag("-h,--help", "Print this help message and exit.");

    cli.add_option("--host", opts.host, "Server host.")
      ->envname("COURIER_HOST")
      ->default_str(make_default(opts.host));
    cli.add_option("-p,--port", opts.port, "Server port.")
      ->envname("COURIER_PORT")
      ->default_str(make_default(std::to_string(opts.port)));
    cli.add_option("-u,--user", opts.user, "User the connection acts for.")->envname("COURIER_USER");
    cli.add_option("-s,--session", opts.session, "Session the connection acts in.")
      ->envname("COURIER_SESSION")
      ->default_str(make_default(opts.session));
    cli.add_option("--think", opts.think, "Enable model reasoning (true/false).");
    cli.add_option("--timeout", opts.timeout, "Seconds to wait for each reply frame.")
      ->check(CLI::PositiveNumber)
      ->default_str(make_default("10"));
    add_log_level(cli, opts.log_level, nullptr);

    /* Request subcommand. */
    auto &cli_request(*cli.add_subcommand("request", "Send one command and print its reply."));
    cli_request.fallthrough();
    cli_request.add_option("command", opts.command_name, "The command to send.")->required();
    cli_request.add_option("--arg",
                           opts.arg_pairs,
                           "An argument as key=value; values that parse as JSON are sent as "
                           "such. Can be specified multiple times.");
    cli_request.add_option("--args", opts.args_json, "All arguments as one JSON object.");

    /* Chat subcommand. */
    auto &cli_chat(*cli.add_subcommand("chat", "Chat with the agent, printing replies as they stream."));
    cli_chat.fallthrough();
    cli_chat.add_option("prompt", opts.prompt, "The prompt to send.")->required();
    cli_chat
      .add_option("--quiet-timeout",
                  opts.quiet_timeout,
                  "Seconds without output after which the reply is considered complete.")
      ->check(CLI::PositiveNumber)
      ->default_str(make_default("30"));

    /* Exec subcommand. */
    auto &cli_exec(*cli.add_subcommand("exec", "Run a command in the VM, streaming its output."));
    cli_exec.fallthrough();
    cli_exec.add_option("command", opts.exec_command, "The shell command to run.")->required();
    cli_exec.add_flag("--raw", opts.raw, "Stream raw terminal output.");

    cli.require_subcommand(1);
    cli.failure_message(CLI::FailureMessage::help);

    try
    {
      cli.parse(argc, argv);
    }
    catch(CLI::ParseError const &e)
    {
      return cli.exit(e);
    }

    if(cli.got_subcommand(&cli_request))
    {
      opts.command = client_command::request;
    }
    else if(cli.got_subcommand(&cli_chat))
    {
      opts.command = client_command::chat;
    }
    else if(cli.got_subcommand(&cli_exec))
    {
      opts.command = client_command::exec;
    }

    return std::nullopt;
  }

  json make_request_args(std::vector<std::string> const &arg_pairs, std::string const &args_json)
  {
    auto args(json::object());
    if(!args_json.empty())
    {
      args = json::parse(args_json, nullptr, false);
      if(!args.is_object())
      {
        throw error::invalid_parameter{ "--args must be a JSON object" };
      }
    }

    for(auto const &pair : arg_pairs)
    {
      auto const eq(pair.find('='));
      if(eq == std::string::npos || eq == 0)
      {
        throw error::invalid_parameter{ "expected key=value, got '" + pair + "'" };
      }

      auto const key(pair.substr(0, eq));
      auto const value(pair.substr(eq + 1));
      auto parsed(json::parse(value, nullptr, false));
      if(parsed.is_discarded())
      {
        args[key] = value;
      }
      else
      {
        args[key] = std::move(parsed);
      }
    }

    return args;
  }
}
