#pragma once

#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <courier/backend/operations.hpp>

namespace courier::backend
{
  /* A backend that needs nothing but the local disk. File operations work inside
   * `workspace_dir / user` and uploads land in `upload_dir / user`; sessions and
   * memory live in this object. There is no model and no VM behind it, so chat,
   * VM execution and transcription throw error::unsupported. */
  class local_backend : public operations
  {
  public:
    local_backend() = default;

    text_stream_ptr chat(std::string const &prompt,
                         std::string const &user,
                         std::string const &session,
                         bool think,
                         config const &cfg) override;

    std::string upload_document(std::string const &file_path,
                                std::string const &user,
                                std::string const &session,
                                config const &cfg) override;
    std::string upload_data(native_bytes const &data,
                            std::string const &file_name,
                            std::string const &user,
                            std::string const &session,
                            config const &cfg) override;
    std::string transcribe_and_upload(std::string const &local_path,
                                      std::string const &user,
                                      std::string const &session,
                                      config const &cfg) override;

    void send_notification(std::string const &message,
                           std::string const &user,
                           std::string const &session,
                           config const &cfg) override;

    std::vector<dir_entry>
    list_dir(std::string const &path, std::string const &user, config const &cfg) override;
    std::string
    read_file(std::string const &path, std::string const &user, config const &cfg) override;
    std::string write_file(std::string const &path,
                           std::string const &content,
                           std::string const &user,
                           config const &cfg) override;
    std::string delete_path(std::string const &path,
                            std::string const &user,
                            std::string const &session,
                            config const &cfg) override;
    std::string download_file(std::string const &path,
                              std::string const &user,
                              std::string const &session,
                              std::optional<std::string> const &dest,
                              config const &cfg) override;

    std::string vm_execute(std::string const &command,
                           std::string const &user,
                           std::string const &session,
                           std::optional<int> timeout,
                           config const &cfg) override;
    text_stream_ptr vm_execute_stream(std::string const &command,
                                      std::string const &user,
                                      std::string const &session,
                                      config const &cfg,
                                      bool raw) override;
    void vm_send_input(std::string const &data,
                       std::string const &user,
                       std::string const &session,
                       config const &cfg) override;
    void vm_send_keys(std::string const &data,
                      double delay,
                      std::string const &user,
                      std::string const &session,
                      config const &cfg) override;
    void restart_terminal(std::string const &user,
                          std::string const &session,
                          config const &cfg) override;

    std::vector<std::string> list_sessions(std::string const &user) override;
    json list_sessions_info(std::string const &user) override;
    json list_documents(std::string const &user) override;
    std::string get_memory(std::string const &user) override;
    std::string set_memory(std::string const &user, std::string const &memory) override;
    std::string reset_memory(std::string const &user) override;

    chat_session_ptr open_chat_session(std::string const &user,
                                       std::string const &session,
                                       bool think,
                                       config const &cfg) override;

    /* The most recent notifications delivered for `user`, oldest first. At most
     * `max_notifications` are kept per user. */
    std::vector<std::string> notifications(std::string const &user) const;

    static constexpr usize max_notifications{ 256 };

  private:
    struct session_info
    {
      usize connections{};
      usize notifications{};
    };

    /* Maps a client path into the user's workspace. Absolute paths are taken
     * relative to the workspace root; anything resolving outside it throws
     * error::invalid_parameter. */
    std::filesystem::path
    resolve(std::string const &path, std::string const &user, config const &cfg) const;
    std::filesystem::path user_upload_dir(std::string const &user, config const &cfg);
    void touch_session(std::string const &user, std::string const &session);

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, session_info>> sessions_;
    std::map<std::string, std::string> memory_;
    std::map<std::string, std::deque<std::string>> notifications_;
    /* Upload directories by user, as seen by the uploads so far. */
    std::map<std::string, std::filesystem::path> upload_dirs_;
  };
}
