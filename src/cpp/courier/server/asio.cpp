#include <sys/socket.h>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <courier/server/asio.hpp>
#include <courier/util/log.hpp>
#include <courier/util/string.hpp>
#include <courier/wire/protocol.hpp>
#include <courier/wire/target.hpp>

namespace courier::server::asio
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace websocket = beast::websocket;

  static constexpr char const log_tag[]{ "courier-server" };

  class connection : public std::enable_shared_from_this<connection>
  {
  public:
    connection(tcp::socket &&socket,
               engine &eng,
               backend::operations &backend,
               backend::config const &config)
      : native_handle_{ socket.native_handle() }
      , ws_{ std::move(socket) }
      , engine_{ eng }
      , backend_{ backend }
      , config_{ config }
    {
    }

    /* Runs on the connection's own thread until the peer goes away. */
    void run()
    {
      try
      {
        if(accept_handshake())
        {
          command_loop();
        }
      }
      catch(beast::system_error const &e)
      {
        if(e.code() != websocket::error::closed)
        {
          util::log::debug(log_tag, "connection ended: ", e.code().message());
        }
      }
      catch(std::exception const &e)
      {
        util::log::error(log_tag, "connection failed: ", e.what());
      }
      catch(...)
      {
        util::log::error(log_tag, "connection failed: unknown error");
      }

      close();
    }

    /* Safe to call from any thread. Unblocks a pending read or write so `run`
     * can finish. */
    void interrupt()
    {
      std::lock_guard<std::mutex> const lock{ close_mutex_ };
      if(!closed_)
      {
        ::shutdown(native_handle_, SHUT_RDWR);
      }
    }

    bool finished() const
    {
      return finished_.load();
    }

  private:
    bool accept_handshake()
    {
      beast::flat_buffer buffer;
      http::request<http::string_body> request;
      http::read(ws_.next_layer(), buffer, request);
      if(!websocket::is_upgrade(request))
      {
        util::log::warn(log_tag, "rejecting non-websocket request for ", request.target());
        return false;
      }

      auto const target(request.target());
      auto const params(wire::parse_target(std::string_view{ target.data(), target.size() }));
      ws_.set_option(websocket::stream_base::decorator([](websocket::response_type &res) {
        res.set(http::field::server, "courier");
      }));
      ws_.accept(request);

      ctx_.user = params.user;
      ctx_.session = params.session;
      ctx_.think = params.think;
      ctx_.config = config_;
      try
      {
        ctx_.chat = backend_.open_chat_session(params.user, params.session, params.think, config_);
      }
      catch(std::exception const &e)
      {
        util::log::warn(log_tag, "no chat session for ", params.user, ": ", e.what());
      }
      catch(...)
      {
        util::log::warn(log_tag, "no chat session for ", params.user);
      }

      util::log::info(log_tag,
                      "connection opened for user '",
                      ctx_.user,
                      "' session '",
                      ctx_.session,
                      "'");
      return true;
    }

    void command_loop()
    {
      while(true)
      {
        beast::flat_buffer buffer;
        ws_.read(buffer);
        switch(serve(beast::buffers_to_string(buffer.data())))
        {
          case outcome::next_command:
            break;
          case outcome::stream_ended:
            {
              boost::system::error_code ec;
              ws_.close(websocket::close_code::normal, ec);
              return;
            }
          case outcome::peer_gone:
            return;
        }
      }
    }

    enum class outcome : u8
    {
      next_command,
      /* A raw stream has no end marker; closing the connection is the marker. */
      stream_ended,
      peer_gone
    };

    outcome serve(std::string const &message)
    {
      auto shape(wire::frame_shape::envelope);
      try
      {
        auto command(wire::decode_command(message));
        shape = engine::shape_of(command.name);
        util::log::debug(log_tag, "dispatching ", command.name, " for ", ctx_.user);

        auto frames(engine_.dispatch(command.name, std::move(command.args), ctx_));
        while(auto frame = frames.next())
        {
          if(!send(*frame))
          {
            /* The peer is gone; abandon the rest of the stream. */
            return outcome::peer_gone;
          }
        }
      }
      catch(std::exception const &e)
      {
        util::log::warn(log_tag, "command failed: ", e.what());
        if(!send(wire::envelope::error(e.what())))
        {
          return outcome::peer_gone;
        }
      }
      catch(...)
      {
        util::log::warn(log_tag, "command failed with a non-standard exception");
        if(!send(wire::envelope::error("unknown error")))
        {
          return outcome::peer_gone;
        }
      }

      return shape == wire::frame_shape::raw ? outcome::stream_ended : outcome::next_command;
    }

    bool send(wire::frame const &frame)
    {
      auto const payload(wire::encode(frame));
      /* Text messages must be UTF-8; raw VM output need not be. */
      auto const as_text(std::holds_alternative<wire::envelope>(frame)
                         || util::is_valid_utf8(payload));
      ws_.text(as_text);

      boost::system::error_code ec;
      ws_.write(boost::asio::buffer(payload), ec);
      if(ec)
      {
        util::log::debug(log_tag, "write failed: ", ec.message());
        return false;
      }
      return true;
    }

    void close()
    {
      {
        std::lock_guard<std::mutex> const lock{ close_mutex_ };
        closed_ = true;
        boost::system::error_code ec;
        auto &socket(ws_.next_layer());
        if(socket.is_open())
        {
          static_cast<void>(socket.shutdown(tcp::socket::shutdown_both, ec));
          static_cast<void>(socket.close(ec));
        }
      }
      util::log::debug(log_tag, "connection closed for user '", ctx_.user, "'");
      finished_ = true;
    }

    tcp::socket::native_handle_type native_handle_;
    websocket::stream<tcp::socket> ws_;
    engine &engine_;
    backend::operations &backend_;
    backend::config config_;
    invocation_context ctx_;
    std::mutex close_mutex_;
    bool closed_{};
    std::atomic<bool> finished_{ false };
  };

  server::server(engine &eng,
                 backend::operations &backend,
                 backend::config config,
                 std::string const &bind_address,
                 u16 const port)
    : engine_{ eng }
    , backend_{ backend }
    , config_{ std::move(config) }
    , io_context_{}
    , work_guard_{ boost::asio::make_work_guard(io_context_) }
  {
    auto const address(boost::asio::ip::make_address(bind_address));
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, tcp::endpoint(address, port));
    port_ = acceptor_->local_endpoint().port();

    accept_connection();

    io_thread_ = std::thread([this]() { io_context_.run(); });
  }

  server::~server()
  {
    stop();
  }

  void server::stop()
  {
    if(!running_.exchange(false))
    {
      return;
    }

    boost::asio::post(io_context_, [this]() {
      boost::system::error_code ec;
      static_cast<void>(acceptor_->close(ec));
      if(ec)
      {
        util::log::warn(log_tag, "acceptor close error: ", ec.message());
      }
    });
    work_guard_.reset();
    if(io_thread_.joinable())
    {
      io_thread_.join();
    }

    std::list<worker> remaining;
    {
      std::lock_guard<std::mutex> const lock{ workers_mutex_ };
      remaining.swap(workers_);
    }
    for(auto &w : remaining)
    {
      w.conn->interrupt();
    }
    for(auto &w : remaining)
    {
      if(w.thread.joinable())
      {
        w.thread.join();
      }
    }
  }

  usize server::active_connections() const
  {
    std::lock_guard<std::mutex> const lock{ workers_mutex_ };
    usize count{};
    for(auto const &w : workers_)
    {
      if(!w.conn->finished())
      {
        ++count;
      }
    }
    return count;
  }

  void server::accept_connection()
  {
    if(!running_)
    {
      return;
    }

    auto next_socket(std::make_shared<tcp::socket>(io_context_));
    acceptor_->async_accept(*next_socket, [this, next_socket](boost::system::error_code const ec) {
      if(!ec && running_)
      {
        reap_finished();

        auto conn(std::make_shared<connection>(std::move(*next_socket), engine_, backend_, config_));
        std::lock_guard<std::mutex> const lock{ workers_mutex_ };
        workers_.push_back({ conn, std::thread{ [conn]() { conn->run(); } } });
      }
      else if(ec && running_)
      {
        util::log::error(log_tag, "accept error: ", ec.message());
      }

      accept_connection();
    });
  }

  void server::reap_finished()
  {
    std::lock_guard<std::mutex> const lock{ workers_mutex_ };
    for(auto it(workers_.begin()); it != workers_.end();)
    {
      if(it->conn->finished())
      {
        if(it->thread.joinable())
        {
          it->thread.join();
        }
        it = workers_.erase(it);
      }
      else
      {
        ++it;
      }
    }
  }
}
