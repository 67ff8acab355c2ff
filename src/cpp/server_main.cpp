#include <csignal>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <courier/backend/local_backend.hpp>
#include <courier/server/asio.hpp>
#include <courier/server/engine.hpp>
#include <courier/util/cli.hpp>
#include <courier/util/log.hpp>
#include <courier/util/try.hpp>

int main(int const argc, char const **argv)
{
  using namespace courier;

  COURIER_TRY
  {
    util::cli::server_options opts;
    if(auto const exit_code = util::cli::parse(argc, argv, opts))
    {
      return *exit_code;
    }
    util::log::set_level(opts.log_level);

    backend::config const config{ opts.upload_dir, opts.workspace_dir, opts.vm_timeout };
    backend::local_backend backend;
    server::engine eng{ backend };
    server::asio::server srv{ eng, backend, config, opts.bind_address, opts.port };

    util::log::info("courier-server",
                    "listening on ",
                    opts.bind_address,
                    ":",
                    srv.port(),
                    " with ",
                    server::engine::commands().size(),
                    " commands");

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals{ signals_context, SIGINT, SIGTERM };
    signals.async_wait([&](boost::system::error_code const &ec, int const signal) {
      if(!ec)
      {
        util::log::info("courier-server", "received signal ", signal, ", shutting down");
      }
    });
    signals_context.run();

    srv.stop();
    return 0;
  }
  COURIER_CATCH(util::print_exception)

  return 1;
}
