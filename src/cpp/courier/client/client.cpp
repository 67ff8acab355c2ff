#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <courier/client/client.hpp>
#include <courier/error.hpp>
#include <courier/util/base64.hpp>
#include <courier/util/log.hpp>
#include <courier/wire/target.hpp>

namespace courier::client
{
  namespace beast = boost::beast;
  namespace websocket = beast::websocket;
  using boost::asio::ip::tcp;

  static constexpr char const log_tag[]{ "courier-client" };

  namespace
  {
    /* One websocket connection, driven synchronously from the calling thread. */
    class channel
    {
    public:
      enum class status : u8
      {
        frame,
        timed_out,
        closed
      };

      channel(std::string const &host,
              u16 const port,
              wire::connection_params const &params,
              std::chrono::milliseconds const connect_timeout)
        : ws_{ ioc_ }
      {
        auto const where(host + ":" + std::to_string(port));
        boost::system::error_code ec;
        bool done{};

        tcp::resolver resolver{ ioc_ };
        auto const endpoints(resolver.resolve(host, std::to_string(port), ec));
        if(ec)
        {
          throw error::connection_closed{ "Failed to resolve " + where + ": " + ec.message() };
        }

        beast::get_lowest_layer(ws_).async_connect(
          endpoints,
          [&](boost::system::error_code const e, tcp::endpoint const &) {
            ec = e;
            done = true;
          });
        if(!drive(connect_timeout, done))
        {
          abandon(done);
          throw error::server_unresponsive{ "Timed out connecting to " + where };
        }
        if(ec)
        {
          throw error::connection_closed{ "Failed to connect to " + where + ": " + ec.message() };
        }

        /* The websocket layer manages its own timeouts from here on. */
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

        done = false;
        ws_.async_handshake(where, wire::make_target(params), [&](boost::system::error_code const e) {
          ec = e;
          done = true;
        });
        if(!drive(connect_timeout, done))
        {
          abandon(done);
          throw error::server_unresponsive{ "Timed out opening websocket to " + where };
        }
        if(ec)
        {
          throw error::connection_closed{ "Websocket handshake with " + where
                                          + " failed: " + ec.message() };
        }
        open_ = true;
        util::log::debug(log_tag, "Connected to ", where);
      }

      ~channel()
      {
        close();
      }

      channel(channel const &) = delete;
      channel &operator=(channel const &) = delete;

      void send(std::string const &message, std::chrono::milliseconds const timeout)
      {
        boost::system::error_code ec;
        bool done{};
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(message),
                        [&](boost::system::error_code const e, usize) {
                          ec = e;
                          done = true;
                        });
        if(!drive(timeout, done))
        {
          abandon(done);
          throw error::server_unresponsive{ "Timed out sending command" };
        }
        if(ec)
        {
          open_ = false;
          throw error::connection_closed{ "Failed to send command: " + ec.message() };
        }
      }

      /* No `timeout` waits until a frame arrives or the connection ends. */
      status read(std::optional<std::chrono::milliseconds> const timeout, std::string &out)
      {
        if(!open_)
        {
          return status::closed;
        }

        beast::flat_buffer buffer;
        boost::system::error_code ec;
        bool done{};
        ws_.async_read(buffer, [&](boost::system::error_code const e, usize) {
          ec = e;
          done = true;
        });

        if(timeout.has_value())
        {
          if(!drive(*timeout, done))
          {
            abandon(done);
            return status::timed_out;
          }
        }
        else
        {
          ioc_.restart();
          while(!done && ioc_.run_one() != 0)
          {
          }
        }

        if(ec)
        {
          if(ec != websocket::error::closed)
          {
            util::log::debug(log_tag, "Connection ended: ", ec.message());
          }
          open_ = false;
          return status::closed;
        }

        out = beast::buffers_to_string(buffer.data());
        return status::frame;
      }

      void close() noexcept
      {
        if(open_)
        {
          open_ = false;
          boost::system::error_code ec;
          bool done{};
          ws_.async_close(websocket::close_code::normal,
                          [&](boost::system::error_code const e) {
                            ec = e;
                            done = true;
                          });
          if(!drive(close_timeout, done))
          {
            abandon(done);
          }
        }

        boost::system::error_code ignored;
        auto &socket(beast::get_lowest_layer(ws_).socket());
        if(socket.is_open())
        {
          static_cast<void>(socket.close(ignored));
        }
      }

    private:
      static constexpr std::chrono::milliseconds close_timeout{ 1'000 };

      /* Runs handlers until `done` is set or `limit` has passed. */
      bool drive(std::chrono::milliseconds const limit, bool const &done)
      {
        ioc_.restart();
        auto const deadline(std::chrono::steady_clock::now() + limit);
        while(!done && ioc_.run_one_until(deadline) != 0)
        {
        }
        return done;
      }

      /* Gives up on the pending operation. The stream can't be used afterward. */
      void abandon(bool const &done)
      {
        open_ = false;
        boost::system::error_code ignored;
        static_cast<void>(beast::get_lowest_layer(ws_).socket().close(ignored));
        ioc_.restart();
        while(!done && ioc_.run_one() != 0)
        {
        }
      }

      boost::asio::io_context ioc_;
      websocket::stream<beast::tcp_stream> ws_;
      bool open_{};
    };

    wire::connection_params
    connection_params_for(call_options const &opts, bool const default_think)
    {
      return { opts.user, opts.session, opts.think.value_or(default_think) };
    }

    std::string result_string(json const &reply)
    {
      auto const it(reply.find("result"));
      if(it == reply.end() || it->is_null())
      {
        return "";
      }
      if(it->is_string())
      {
        return it->get<std::string>();
      }
      return it->dump();
    }

    json result_or(json const &reply, json fallback)
    {
      auto const it(reply.find("result"));
      if(it == reply.end() || it->is_null())
      {
        return fallback;
      }
      return *it;
    }
  }

  struct frame_reader::impl
  {
    impl(std::unique_ptr<channel> ch,
         end_condition const condition,
         std::chrono::milliseconds const quiet_period)
      : ch{ std::move(ch) }
      , condition{ condition }
      , quiet_period{ quiet_period }
    {
    }

    std::unique_ptr<channel> ch;
    end_condition condition;
    std::chrono::milliseconds quiet_period;
  };

  frame_reader::frame_reader(std::unique_ptr<impl> i)
    : impl_{ std::move(i) }
  {
  }

  frame_reader::frame_reader(frame_reader &&) noexcept = default;
  frame_reader &frame_reader::operator=(frame_reader &&) noexcept = default;
  frame_reader::~frame_reader() = default;

  std::optional<std::string> frame_reader::next()
  {
    if(!impl_ || !impl_->ch)
    {
      return std::nullopt;
    }

    std::optional<std::chrono::milliseconds> timeout;
    if(impl_->condition == end_condition::quiet_period)
    {
      timeout = impl_->quiet_period;
    }

    std::string text;
    if(impl_->ch->read(timeout, text) == channel::status::frame)
    {
      return text;
    }

    /* Either ending is a normal end of stream. */
    impl_->ch.reset();
    return std::nullopt;
  }

  std::vector<std::string> frame_reader::collect()
  {
    std::vector<std::string> ret;
    while(auto text = next())
    {
      ret.push_back(std::move(*text));
    }
    return ret;
  }

  client::client(std::string host, u16 const port)
    : host_{ std::move(host) }
    , port_{ port }
  {
  }

  json client::request(std::string const &command,
                       json args,
                       call_options const &opts,
                       std::chrono::milliseconds const timeout) const
  {
    channel ch{ host_, port_, connection_params_for(opts, true), timeout };
    ch.send(wire::encode_command({ command, std::move(args) }), timeout);

    while(true)
    {
      std::string text;
      switch(ch.read(timeout, text))
      {
        case channel::status::timed_out:
          throw error::server_unresponsive{ "Server did not respond in time to " + command };
        case channel::status::closed:
          throw error::connection_closed{ "Server closed connection without a result" };
        case channel::status::frame:
          break;
      }

      if(auto const env = wire::parse_envelope(text))
      {
        return wire::to_json(*env);
      }
      util::log::debug(log_tag, "Ignoring non-JSON response: ", text);
    }
  }

  frame_reader client::team_chat_stream(std::string const &prompt,
                                        call_options const &opts,
                                        json const &extra_args,
                                        std::chrono::milliseconds const quiet_period) const
  {
    json args{ { "prompt", prompt } };
    if(extra_args.is_object())
    {
      args.update(extra_args);
    }

    auto ch(std::make_unique<channel>(host_,
                                      port_,
                                      connection_params_for(opts, true),
                                      default_request_timeout));
    ch->send(wire::encode_command({ "team_chat", std::move(args) }), default_request_timeout);
    return frame_reader{ std::make_unique<frame_reader::impl>(std::move(ch),
                                                              frame_reader::end_condition::quiet_period,
                                                              quiet_period) };
  }

  frame_reader
  client::vm_execute_stream(std::string const &command, call_options const &opts, bool const raw) const
  {
    auto ch(std::make_unique<channel>(host_,
                                      port_,
                                      connection_params_for(opts, false),
                                      default_request_timeout));
    ch->send(wire::encode_command({ "vm_execute_stream", { { "command", command }, { "raw", raw } } }),
             default_request_timeout);
    return frame_reader{ std::make_unique<frame_reader::impl>(std::move(ch),
                                                              frame_reader::end_condition::close,
                                                              std::chrono::milliseconds::zero()) };
  }

  json client::call(std::string const &command, json args, call_options const &opts) const
  {
    call_options resolved{ opts };
    resolved.think = opts.think.value_or(false);

    auto reply(request(command, std::move(args), resolved));
    auto const err(reply.find("error"));
    if(err != reply.end())
    {
      throw error::command_failed{ command, err->is_string() ? err->get<std::string>() : err->dump() };
    }
    return reply;
  }

  std::string client::vm_execute(std::string const &command,
                                 call_options const &opts,
                                 std::optional<int> const timeout) const
  {
    json args{ { "command", command } };
    if(timeout.has_value())
    {
      args["timeout"] = *timeout;
    }
    return result_string(call("vm_execute", std::move(args), opts));
  }

  void client::vm_send_input(std::string const &data, call_options const &opts) const
  {
    call("vm_input", { { "data", data } }, opts);
  }

  void client::vm_send_keys(std::string const &data, call_options const &opts, double const delay) const
  {
    call("vm_keys", { { "data", data }, { "delay", delay } }, opts);
  }

  void client::restart_terminal(call_options const &opts) const
  {
    call("restart_terminal", json::object(), opts);
  }

  std::vector<dir_entry> client::list_dir(std::string const &path, call_options const &opts) const
  {
    auto const result(result_or(call("list_dir", { { "path", path } }, opts), json::array()));
    if(!result.is_array())
    {
      throw error::protocol{ "list_dir result is not a list: " + result.dump() };
    }

    std::vector<dir_entry> ret;
    ret.reserve(result.size());
    for(auto const &entry : result)
    {
      if(!entry.is_array() || entry.size() < 2 || !entry[0].is_string())
      {
        throw error::protocol{ "malformed list_dir entry: " + entry.dump() };
      }
      auto const &flag(entry[1]);
      ret.push_back({ entry[0].get<std::string>(),
                      flag.is_boolean() ? flag.get<bool>() : (flag.is_number() && flag != 0) });
    }
    return ret;
  }

  std::string client::read_file(std::string const &path, call_options const &opts) const
  {
    return result_string(call("read_file", { { "path", path } }, opts));
  }

  std::string client::write_file(std::string const &path,
                                 std::string const &content,
                                 call_options const &opts) const
  {
    return result_string(call("write_file", { { "path", path }, { "content", content } }, opts));
  }

  std::string client::download_file(std::string const &path,
                                    call_options const &opts,
                                    std::optional<std::string> const &dest) const
  {
    json args{ { "path", path }, { "dest", nullptr } };
    if(dest.has_value())
    {
      args["dest"] = *dest;
    }
    return result_string(call("download_file", std::move(args), opts));
  }

  std::string client::delete_path(std::string const &path, call_options const &opts) const
  {
    return result_string(call("delete_path", { { "path", path } }, opts));
  }

  void client::send_notification(std::string const &message, call_options const &opts) const
  {
    call("send_notification", { { "message", message } }, opts);
  }

  /* Only the stored location is awaited. A transcript frame that may follow for
   * audio is dropped with the connection. */
  std::string client::upload_document(std::string const &file_path, call_options const &opts) const
  {
    return result_string(call("upload_document", { { "file_path", file_path } }, opts));
  }

  std::string client::upload_data(native_bytes const &data,
                                  std::string const &file_name,
                                  call_options const &opts) const
  {
    return result_string(call("upload_document",
                              { { "file_name", file_name }, { "file_data", util::base64_encode(data) } },
                              opts));
  }

  std::vector<std::string> client::list_sessions(call_options const &opts) const
  {
    auto const result(result_or(call("list_sessions", json::object(), opts), json::array()));
    std::vector<std::string> ret;
    for(auto const &name : result)
    {
      ret.push_back(name.is_string() ? name.get<std::string>() : name.dump());
    }
    return ret;
  }

  json client::list_sessions_info(call_options const &opts) const
  {
    return result_or(call("list_sessions_info", json::object(), opts), json::array());
  }

  json client::list_documents(call_options const &opts) const
  {
    return result_or(call("list_documents", json::object(), opts), json::array());
  }

  std::string client::get_memory(call_options const &opts) const
  {
    return result_string(call("get_memory", json::object(), opts));
  }

  std::string client::set_memory(std::string const &memory, call_options const &opts) const
  {
    return result_string(call("set_memory", { { "memory", memory } }, opts));
  }

  std::string client::reset_memory(call_options const &opts) const
  {
    return result_string(call("reset_memory", json::object(), opts));
  }
}
