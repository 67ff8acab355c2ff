#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <courier/type.hpp>
#include <courier/backend/config.hpp>
#include <courier/backend/operations.hpp>
#include <courier/server/engine.hpp>

namespace courier::server::asio
{
  using boost::asio::ip::tcp;

  class connection;

  /* Websocket front end for an engine. Connections are accepted on a dedicated io
   * thread; each accepted connection then runs its command loop on a thread of its
   * own, so a handler blocked on the backend never stalls anyone else. */
  class server
  {
  public:
    /* Port 0 binds an ephemeral port; `port()` reports the real one. */
    server(engine &eng,
           backend::operations &backend,
           backend::config config,
           std::string const &bind_address,
           u16 port);
    ~server();

    server(server const &) = delete;
    server &operator=(server const &) = delete;

    /* Stops accepting, interrupts open connections and waits for them. */
    void stop();

    u16 port() const
    {
      return port_;
    }

    usize active_connections() const;

  private:
    struct worker
    {
      std::shared_ptr<connection> conn;
      std::thread thread;
    };

    void accept_connection();
    void reap_finished();

    engine &engine_;
    backend::operations &backend_;
    backend::config config_;
    u16 port_{};
    boost::asio::io_context io_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread io_thread_;
    mutable std::mutex workers_mutex_;
    std::list<worker> workers_;
    std::atomic<bool> running_{ true };
  };
}
