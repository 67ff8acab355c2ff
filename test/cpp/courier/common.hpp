#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <courier/backend/operations.hpp>
#include <courier/server/engine.hpp>
#include <courier/wire/protocol.hpp>
#include <courier/wire/target.hpp>

#include <doctest/doctest.h>

namespace courier::test
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace websocket = beast::websocket;
  using boost::asio::ip::tcp;

  /* A text stream that hands out chunks in bursts. Within a burst every chunk
   * but the last reports the next one as ready, the way a socket that received
   * several writes at once would. */
  class burst_stream : public backend::text_stream
  {
  public:
    explicit burst_stream(std::vector<std::vector<std::string>> bursts)
      : bursts_{ std::move(bursts) }
    {
    }

    std::optional<std::string> next() override
    {
      while(burst_ < bursts_.size() && chunk_ >= bursts_[burst_].size())
      {
        ++burst_;
        chunk_ = 0;
      }
      if(burst_ >= bursts_.size())
      {
        return std::nullopt;
      }
      ++pulls;
      return bursts_[burst_][chunk_++];
    }

    bool ready() const override
    {
      return burst_ < bursts_.size() && chunk_ < bursts_[burst_].size();
    }

    usize pulls{};

  private:
    std::vector<std::vector<std::string>> bursts_;
    usize burst_{};
    usize chunk_{};
  };

  class fake_chat_session : public backend::chat_session
  {
  public:
    backend::text_stream_ptr chat_stream(std::string const &prompt) override
    {
      prompts.push_back(prompt);
      return std::make_unique<backend::buffered_stream>(chunks);
    }

    void send_notification(std::string const &message) override
    {
      notifications.push_back(message);
    }

    std::vector<std::string> chunks{ "from ", "session" };
    std::vector<std::string> prompts;
    std::vector<std::string> notifications;
  };

  /* Thrown by the fake backend for failures that aren't std::exceptions. */
  struct foreign_failure
  {
  };

  /* Records every call and answers with whatever the test configured. */
  class fake_backend : public backend::operations
  {
  public:
    backend::text_stream_ptr chat(std::string const &prompt,
                                  std::string const &user,
                                  std::string const &session,
                                  bool const think,
                                  backend::config const &) override
    {
      record("chat:" + prompt + ":" + user + ":" + session + ":" + (think ? "think" : "plain"));
      return std::make_unique<backend::buffered_stream>(chat_chunks);
    }

    std::string upload_document(std::string const &file_path,
                                std::string const &user,
                                std::string const &,
                                backend::config const &) override
    {
      record("upload_document:" + file_path);
      if(fail_upload)
      {
        throw std::runtime_error{ "disk full" };
      }
      return "vm:/home/" + user + "/" + std::filesystem::path{ file_path }.filename().string();
    }

    std::string upload_data(native_bytes const &data,
                            std::string const &file_name,
                            std::string const &user,
                            std::string const &,
                            backend::config const &) override
    {
      record("upload_data:" + file_name);
      uploaded_bytes = data;
      return "vm:/home/" + user + "/" + file_name;
    }

    std::string transcribe_and_upload(std::string const &local_path,
                                      std::string const &,
                                      std::string const &,
                                      backend::config const &) override
    {
      record("transcribe:" + local_path);
      if(fail_transcription)
      {
        throw std::runtime_error{ "speech model unavailable" };
      }
      if(foreign_transcription_failure)
      {
        throw foreign_failure{};
      }
      return transcript;
    }

    void send_notification(std::string const &message,
                           std::string const &,
                           std::string const &,
                           backend::config const &) override
    {
      record("notify:" + message);
      if(fail_notification)
      {
        throw std::runtime_error{ "notification channel down" };
      }
      std::lock_guard<std::mutex> const lock{ mutex_ };
      notifications.push_back(message);
    }

    std::vector<backend::dir_entry>
    list_dir(std::string const &path, std::string const &, backend::config const &) override
    {
      record("list_dir:" + path);
      return listing;
    }

    std::string
    read_file(std::string const &path, std::string const &, backend::config const &) override
    {
      record("read_file:" + path);
      if(path == "missing")
      {
        throw std::runtime_error{ "No such file: missing" };
      }
      return "contents of " + path;
    }

    std::string write_file(std::string const &path,
                           std::string const &content,
                           std::string const &,
                           backend::config const &) override
    {
      record("write_file:" + path + ":" + content);
      return "written";
    }

    std::string delete_path(std::string const &path,
                            std::string const &,
                            std::string const &,
                            backend::config const &) override
    {
      record("delete_path:" + path);
      return "deleted";
    }

    std::string download_file(std::string const &path,
                              std::string const &,
                              std::string const &,
                              std::optional<std::string> const &dest,
                              backend::config const &) override
    {
      record("download_file:" + path + ":" + dest.value_or("<none>"));
      return dest.value_or("/host/" + path);
    }

    std::string vm_execute(std::string const &command,
                           std::string const &,
                           std::string const &,
                           std::optional<int> const timeout,
                           backend::config const &) override
    {
      record("vm_execute:" + command);
      last_timeout = timeout;
      return vm_output;
    }

    backend::text_stream_ptr vm_execute_stream(std::string const &command,
                                               std::string const &,
                                               std::string const &,
                                               backend::config const &,
                                               bool const raw) override
    {
      record("vm_execute_stream:" + command);
      last_raw = raw;
      return std::make_unique<burst_stream>(vm_bursts);
    }

    void vm_send_input(std::string const &data,
                       std::string const &,
                       std::string const &,
                       backend::config const &) override
    {
      record("vm_input:" + data);
    }

    void vm_send_keys(std::string const &data,
                      double const delay,
                      std::string const &,
                      std::string const &,
                      backend::config const &) override
    {
      record("vm_keys:" + data);
      last_delay = delay;
    }

    void restart_terminal(std::string const &, std::string const &, backend::config const &) override
    {
      record("restart_terminal");
    }

    std::vector<std::string> list_sessions(std::string const &user) override
    {
      record("list_sessions:" + user);
      if(foreign_listing_failure)
      {
        throw foreign_failure{};
      }
      return { "main", "scratch" };
    }

    json list_sessions_info(std::string const &user) override
    {
      record("list_sessions_info:" + user);
      return json::array({ { { "session", "main" } } });
    }

    json list_documents(std::string const &user) override
    {
      record("list_documents:" + user);
      return json::array({ { { "name", "notes.txt" } } });
    }

    std::string get_memory(std::string const &user) override
    {
      record("get_memory:" + user);
      return memory;
    }

    std::string set_memory(std::string const &user, std::string const &value) override
    {
      record("set_memory:" + user);
      memory = value;
      return memory;
    }

    std::string reset_memory(std::string const &user) override
    {
      record("reset_memory:" + user);
      memory.clear();
      return memory;
    }

    backend::chat_session_ptr open_chat_session(std::string const &,
                                                std::string const &,
                                                bool const,
                                                backend::config const &) override
    {
      return chat_handle;
    }

    std::vector<std::string> recorded_calls() const
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      return calls;
    }

    usize count(std::string const &prefix) const
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      return static_cast<usize>(std::ranges::count_if(calls, [&](auto const &call) {
        return call.starts_with(prefix);
      }));
    }

    /* Answers. */
    std::vector<std::string> chat_chunks{ "Hello, ", "world" };
    std::vector<backend::dir_entry> listing;
    std::string vm_output{ "hi\n" };
    std::vector<std::vector<std::string>> vm_bursts{
      { "a", "b", "c" }
    };
    std::string transcript;
    std::string memory;
    bool fail_upload{};
    bool fail_transcription{};
    bool fail_notification{};
    bool foreign_transcription_failure{};
    bool foreign_listing_failure{};
    std::shared_ptr<fake_chat_session> chat_handle;

    /* Observations. */
    std::vector<std::string> calls;
    std::vector<std::string> notifications;
    native_bytes uploaded_bytes;
    std::optional<int> last_timeout;
    std::optional<bool> last_raw;
    std::optional<double> last_delay;

  private:
    void record(std::string call)
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      calls.push_back(std::move(call));
    }

    mutable std::mutex mutex_;
  };

  inline server::invocation_context
  make_context(std::string user = "alice", std::string session = "main")
  {
    server::invocation_context ctx;
    ctx.user = std::move(user);
    ctx.session = std::move(session);
    ctx.config.upload_dir = "uploads";
    return ctx;
  }

  inline std::vector<wire::frame> drain(server::frame_stream stream)
  {
    std::vector<wire::frame> frames;
    while(auto frame = stream.next())
    {
      frames.push_back(std::move(*frame));
    }
    return frames;
  }

  inline std::vector<std::string> encode_all(std::vector<wire::frame> const &frames)
  {
    std::vector<std::string> ret;
    for(auto const &frame : frames)
    {
      ret.push_back(wire::encode(frame));
    }
    return ret;
  }

  inline std::vector<wire::frame> run_command(server::engine &eng,
                                              std::string const &command,
                                              json args,
                                              server::invocation_context const &ctx = make_context())
  {
    return drain(eng.dispatch(command, std::move(args), ctx));
  }

  inline json const &result_of(wire::frame const &frame)
  {
    auto const &env(std::get<wire::envelope>(frame));
    REQUIRE_FALSE(env.is_error());
    return env.payload;
  }

  struct script_step
  {
    enum class kind : u8
    {
      send,
      pause,
      close
    };

    kind type{ kind::send };
    std::string text;
    std::chrono::milliseconds delay{};
  };

  inline script_step send_text(std::string text)
  {
    return { script_step::kind::send, std::move(text), {} };
  }

  inline script_step pause_for(std::chrono::milliseconds const delay)
  {
    return { script_step::kind::pause, {}, delay };
  }

  inline script_step close_connection()
  {
    return { script_step::kind::close, {}, {} };
  }

  /* A websocket peer for exactly one connection. It reads the command, plays the
   * script, then holds the connection open until the client goes away, unless the
   * script closed it. */
  class scripted_server
  {
  public:
    explicit scripted_server(std::vector<script_step> steps)
      : steps_{ std::move(steps) }
      , acceptor_{ ioc_, tcp::endpoint{ boost::asio::ip::make_address("127.0.0.1"), 0 } }
    {
      port_ = acceptor_.local_endpoint().port();
      thread_ = std::thread{ [this]() { serve(); } };
    }

    ~scripted_server()
    {
      if(thread_.joinable())
      {
        thread_.join();
      }
    }

    u16 port() const
    {
      return port_;
    }

    /* Waits for the connection to finish, then reports what the client sent. */
    std::string received()
    {
      finish();
      return received_;
    }

    std::string target()
    {
      finish();
      return target_;
    }

  private:
    void finish()
    {
      if(thread_.joinable())
      {
        thread_.join();
      }
    }

    void serve()
    {
      try
      {
        tcp::socket socket{ ioc_ };
        acceptor_.accept(socket);
        websocket::stream<tcp::socket> ws{ std::move(socket) };

        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(ws.next_layer(), buffer, request);
        auto const request_target(request.target());
        target_ = std::string{ request_target.data(), request_target.size() };
        ws.accept(request);

        beast::flat_buffer message;
        ws.read(message);
        received_ = beast::buffers_to_string(message.data());

        for(auto const &step : steps_)
        {
          switch(step.type)
          {
            case script_step::kind::send:
              ws.text(true);
              ws.write(boost::asio::buffer(step.text));
              break;
            case script_step::kind::pause:
              std::this_thread::sleep_for(step.delay);
              break;
            case script_step::kind::close:
              ws.close(websocket::close_code::normal);
              return;
          }
        }

        while(true)
        {
          beast::flat_buffer ignored;
          ws.read(ignored);
        }
      }
      catch(std::exception const &e)
      {
        /* The client hanging up ends every script that doesn't close itself. */
        ended_with_ = e.what();
      }
    }

    std::vector<script_step> steps_;
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    u16 port_{};
    std::thread thread_;
    std::string received_;
    std::string target_;
    std::string ended_with_;
  };

  /* A plain websocket connection for driving a server directly, several commands
   * per connection. */
  class raw_connection
  {
  public:
    raw_connection(u16 const port, wire::connection_params const &params)
      : ws_{ ioc_ }
    {
      tcp::resolver resolver{ ioc_ };
      boost::asio::connect(ws_.next_layer(), resolver.resolve("127.0.0.1", std::to_string(port)));
      ws_.handshake("127.0.0.1:" + std::to_string(port), wire::make_target(params));
    }

    void send(std::string const &text)
    {
      ws_.text(true);
      ws_.write(boost::asio::buffer(text));
    }

    /* The next message and whether it arrived as text. */
    std::pair<std::string, bool> read()
    {
      beast::flat_buffer buffer;
      ws_.read(buffer);
      return { beast::buffers_to_string(buffer.data()), ws_.got_text() };
    }

    /* The server may already have closed after a stream; either way is fine. */
    void close()
    {
      boost::system::error_code ec;
      ws_.close(websocket::close_code::normal, ec);
    }

  private:
    boost::asio::io_context ioc_;
    websocket::stream<tcp::socket> ws_;
  };

  /* A port nothing listens on. */
  inline u16 unused_port()
  {
    boost::asio::io_context ioc;
    tcp::acceptor acceptor{ ioc, tcp::endpoint{ boost::asio::ip::make_address("127.0.0.1"), 0 } };
    return acceptor.local_endpoint().port();
  }

  /* A fresh directory under the system temp dir, removed again on destruction. */
  class temp_dir
  {
  public:
    temp_dir()
    {
      auto const stamp(std::chrono::steady_clock::now().time_since_epoch().count());
      path_ = std::filesystem::temp_directory_path()
        / ("courier-test-" + std::to_string(stamp) + "-"
           + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
      std::filesystem::create_directories(path_);
    }

    ~temp_dir()
    {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    std::filesystem::path const &path() const
    {
      return path_;
    }

  private:
    std::filesystem::path path_;
  };
}
