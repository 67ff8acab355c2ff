#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <courier/type.hpp>
#include <courier/backend/config.hpp>
#include <courier/backend/text_stream.hpp>

namespace courier::backend
{
  struct dir_entry
  {
    bool operator==(dir_entry const &) const = default;

    std::string name;
    bool is_dir{};
  };

  /* A pre-existing conversation. When a connection carries one, chat turns go
   * through it instead of a one-off generation. */
  class chat_session
  {
  public:
    virtual ~chat_session() = default;

    virtual text_stream_ptr chat_stream(std::string const &prompt) = 0;
    virtual void send_notification(std::string const &message) = 0;
  };

  using chat_session_ptr = std::shared_ptr<chat_session>;

  /* Everything the command engine can ask of the agent backend. Implementations
   * may block; each connection is serviced on its own thread. Any exception
   * thrown here propagates to the client as an error envelope, except from
   * `transcribe_and_upload`, whose failures are logged and dropped. Implementations
   * must be safe to call from several connections at once. */
  class operations
  {
  public:
    virtual ~operations() = default;

    virtual text_stream_ptr chat(std::string const &prompt,
                                 std::string const &user,
                                 std::string const &session,
                                 bool think,
                                 config const &cfg)
      = 0;

    /* Both return the stored location of the document. */
    virtual std::string upload_document(std::string const &file_path,
                                        std::string const &user,
                                        std::string const &session,
                                        config const &cfg)
      = 0;
    virtual std::string upload_data(native_bytes const &data,
                                    std::string const &file_name,
                                    std::string const &user,
                                    std::string const &session,
                                    config const &cfg)
      = 0;

    /* Returns the stored location of the transcript, or an empty string when
     * nothing was produced. */
    virtual std::string transcribe_and_upload(std::string const &local_path,
                                              std::string const &user,
                                              std::string const &session,
                                              config const &cfg)
      = 0;

    virtual void send_notification(std::string const &message,
                                   std::string const &user,
                                   std::string const &session,
                                   config const &cfg)
      = 0;

    virtual std::vector<dir_entry>
    list_dir(std::string const &path, std::string const &user, config const &cfg)
      = 0;
    virtual std::string
    read_file(std::string const &path, std::string const &user, config const &cfg)
      = 0;
    virtual std::string write_file(std::string const &path,
                                   std::string const &content,
                                   std::string const &user,
                                   config const &cfg)
      = 0;
    virtual std::string delete_path(std::string const &path,
                                    std::string const &user,
                                    std::string const &session,
                                    config const &cfg)
      = 0;
    /* Returns the host path the file was copied to. */
    virtual std::string download_file(std::string const &path,
                                      std::string const &user,
                                      std::string const &session,
                                      std::optional<std::string> const &dest,
                                      config const &cfg)
      = 0;

    virtual std::string vm_execute(std::string const &command,
                                   std::string const &user,
                                   std::string const &session,
                                   std::optional<int> timeout,
                                   config const &cfg)
      = 0;
    virtual text_stream_ptr vm_execute_stream(std::string const &command,
                                              std::string const &user,
                                              std::string const &session,
                                              config const &cfg,
                                              bool raw)
      = 0;
    virtual void vm_send_input(std::string const &data,
                               std::string const &user,
                               std::string const &session,
                               config const &cfg)
      = 0;
    /* `delay` is the pause between simulated keystrokes, in seconds. */
    virtual void vm_send_keys(std::string const &data,
                              double delay,
                              std::string const &user,
                              std::string const &session,
                              config const &cfg)
      = 0;
    virtual void
    restart_terminal(std::string const &user, std::string const &session, config const &cfg)
      = 0;

    virtual std::vector<std::string> list_sessions(std::string const &user) = 0;
    virtual json list_sessions_info(std::string const &user) = 0;
    virtual json list_documents(std::string const &user) = 0;
    virtual std::string get_memory(std::string const &user) = 0;
    virtual std::string set_memory(std::string const &user, std::string const &memory) = 0;
    virtual std::string reset_memory(std::string const &user) = 0;

    /* Called once per connection. Backends without persistent conversations
     * return null and every chat turn is a one-off generation. */
    virtual chat_session_ptr open_chat_session(std::string const &user,
                                               std::string const &session,
                                               bool think,
                                               config const &cfg);
  };
}
