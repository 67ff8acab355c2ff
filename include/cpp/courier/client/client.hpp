#pragma once

// Courier Client
//
// Talks to a courier server over websockets. Every call opens its own
// connection, sends one command and closes the connection when it is done;
// nothing is pooled, so concurrent calls never share state or timeouts.
//
// Usage:
//   client::client c{ "127.0.0.1", 8765 };
//   client::call_options const opts{ .user = "alice", .session = "main" };
//   auto const entries(c.list_dir("/tmp", opts));
//
//   auto reader(c.team_chat_stream("hello", opts));
//   while(auto const chunk = reader.next())
//   {
//     std::cout << *chunk;
//   }

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <courier/type.hpp>
#include <courier/backend/operations.hpp>
#include <courier/wire/protocol.hpp>

namespace courier::client
{
  struct call_options
  {
    std::string user;
    std::string session;
    /* Unset means the call's own default: on for `request` and the chat stream,
     * off for everything else. */
    std::optional<bool> think;
  };

  using dir_entry = backend::dir_entry;

  constexpr std::chrono::milliseconds default_request_timeout{ 10'000 };
  constexpr std::chrono::milliseconds default_quiet_period{ 30'000 };
  constexpr double default_key_delay{ 0.05 };

  /* Streamed frames of one call, pulled one at a time. Single pass and move only.
   * The underlying connection is closed when the stream ends or the reader is
   * destroyed, whichever happens first. */
  class frame_reader
  {
  public:
    enum class end_condition : u8
    {
      /* No frame arrived for a whole quiet period. */
      quiet_period,
      /* The server closed the connection. */
      close
    };

    frame_reader(frame_reader &&) noexcept;
    frame_reader &operator=(frame_reader &&) noexcept;
    ~frame_reader();

    frame_reader(frame_reader const &) = delete;
    frame_reader &operator=(frame_reader const &) = delete;

    /* Blocks for the next frame's text. Ending is not an error. */
    std::optional<std::string> next();

    /* Drains the remaining frames. */
    std::vector<std::string> collect();

  private:
    friend class client;

    struct impl;

    explicit frame_reader(std::unique_ptr<impl> i);

    std::unique_ptr<impl> impl_;
  };

  class client
  {
  public:
    explicit client(std::string host = "127.0.0.1", u16 port = wire::default_port);

    std::string const &host() const
    {
      return host_;
    }

    u16 port() const
    {
      return port_;
    }

    /* Sends `command` and waits for the first frame that is a JSON object holding
     * "result" or "error", which is returned whole. Frames that aren't JSON are
     * skipped. `timeout` bounds each wait for a frame.
     *
     * Throws error::server_unresponsive when a wait times out and
     * error::connection_closed when the connection ends (or can't be made) first. */
    json request(std::string const &command,
                 json args,
                 call_options const &opts,
                 std::chrono::milliseconds timeout = default_request_timeout) const;

    frame_reader team_chat_stream(std::string const &prompt,
                                  call_options const &opts,
                                  json const &extra_args = json::object(),
                                  std::chrono::milliseconds quiet_period
                                  = default_quiet_period) const;
    frame_reader vm_execute_stream(std::string const &command,
                                   call_options const &opts,
                                   bool raw = false) const;

    /* Typed wrappers. An error envelope throws error::command_failed. */
    std::string vm_execute(std::string const &command,
                           call_options const &opts,
                           std::optional<int> timeout = std::nullopt) const;
    void vm_send_input(std::string const &data, call_options const &opts) const;
    void vm_send_keys(std::string const &data,
                      call_options const &opts,
                      double delay = default_key_delay) const;
    void restart_terminal(call_options const &opts) const;

    std::vector<dir_entry> list_dir(std::string const &path, call_options const &opts) const;
    std::string read_file(std::string const &path, call_options const &opts) const;
    std::string write_file(std::string const &path,
                           std::string const &content,
                           call_options const &opts) const;
    std::string download_file(std::string const &path,
                              call_options const &opts,
                              std::optional<std::string> const &dest = std::nullopt) const;
    std::string delete_path(std::string const &path, call_options const &opts) const;

    void send_notification(std::string const &message, call_options const &opts) const;

    /* Upload a file the server can already reach, by path. */
    std::string upload_document(std::string const &file_path, call_options const &opts) const;
    /* Upload bytes held by the caller; they travel base64 encoded. */
    std::string upload_data(native_bytes const &data,
                            std::string const &file_name,
                            call_options const &opts) const;

    std::vector<std::string> list_sessions(call_options const &opts) const;
    json list_sessions_info(call_options const &opts) const;
    json list_documents(call_options const &opts) const;
    std::string get_memory(call_options const &opts) const;
    std::string set_memory(std::string const &memory, call_options const &opts) const;
    std::string reset_memory(call_options const &opts) const;

  private:
    /* `request` with the typed wrappers' think default, failing on error envelopes. */
    json call(std::string const &command, json args, call_options const &opts) const;

    std::string host_;
    u16 port_{};
  };
}
