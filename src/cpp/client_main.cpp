#include <iostream>

#include <courier/client/client.hpp>
#include <courier/util/cli.hpp>
#include <courier/util/log.hpp>
#include <courier/util/try.hpp>

namespace
{
  std::chrono::milliseconds to_millis(double const seconds)
  {
    return std::chrono::milliseconds{ static_cast<courier::i64>(seconds * 1000.0) };
  }
}

int main(int const argc, char const **argv)
{
  using namespace courier;

  COURIER_TRY
  {
    util::cli::client_options opts;
    if(auto const exit_code = util::cli::parse(argc, argv, opts))
    {
      return *exit_code;
    }
    util::log::set_level(opts.log_level);

    client::client const c{ opts.host, opts.port };
    client::call_options const call{ opts.user, opts.session, opts.think };

    switch(opts.command)
    {
      case util::cli::client_command::request:
        {
          auto const reply(c.request(opts.command_name,
                                     util::cli::make_request_args(opts.arg_pairs, opts.args_json),
                                     call,
                                     to_millis(opts.timeout)));
          std::cout << reply.dump(2) << std::endl;
          return reply.contains("error") ? 2 : 0;
        }
      case util::cli::client_command::chat:
        {
          auto reader(c.team_chat_stream(opts.prompt, call, json::object(), to_millis(opts.quiet_timeout)));
          while(auto const chunk = reader.next())
          {
            std::cout << *chunk << std::flush;
          }
          std::cout << std::endl;
          return 0;
        }
      case util::cli::client_command::exec:
        {
          auto reader(c.vm_execute_stream(opts.exec_command, call, opts.raw));
          while(auto const chunk = reader.next())
          {
            std::cout << *chunk;
            if(!opts.raw)
            {
              std::cout << '\n';
            }
            std::cout << std::flush;
          }
          return 0;
        }
    }
  }
  COURIER_CATCH(util::print_exception)

  return 1;
}
