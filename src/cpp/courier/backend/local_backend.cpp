#include <algorithm>
#include <fstream>
#include <iterator>

#include <courier/backend/local_backend.hpp>
#include <courier/error.hpp>
#include <courier/util/log.hpp>
#include <courier/util/string.hpp>

namespace courier::backend
{
  namespace fs = std::filesystem;

  static constexpr char const log_tag[]{ "courier-backend" };

  namespace
  {
    [[noreturn]]
    void unsupported(std::string const &what)
    {
      throw error::unsupported{ what + " is not available in the local backend" };
    }

    /* User names become directory names, so they must be a single plain path
     * component. The empty user is allowed and shares the root. */
    void check_user(std::string const &user)
    {
      if(!user.empty() && util::sanitize_filename(user) != user)
      {
        throw error::invalid_parameter{ "Invalid user name: " + user };
      }
    }

    void write_bytes(fs::path const &target, char const * const data, usize const size)
    {
      fs::create_directories(target.parent_path());
      std::ofstream out{ target, std::ios::binary | std::ios::trunc };
      if(!out)
      {
        throw std::runtime_error{ "Unable to open " + target.string() + " for writing" };
      }
      out.write(data, static_cast<std::streamsize>(size));
      if(!out)
      {
        throw std::runtime_error{ "Failed writing " + target.string() };
      }
    }
  }

  text_stream_ptr local_backend::chat(std::string const &,
                                      std::string const &,
                                      std::string const &,
                                      bool const,
                                      config const &)
  {
    unsupported("chat");
  }

  std::string local_backend::upload_document(std::string const &file_path,
                                             std::string const &user,
                                             std::string const &session,
                                             config const &cfg)
  {
    fs::path const source{ file_path };
    if(!fs::is_regular_file(source))
    {
      throw error::invalid_parameter{ "No such file: " + file_path };
    }

    auto const target(user_upload_dir(user, cfg) / source.filename());
    fs::create_directories(target.parent_path());
    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
    touch_session(user, session);
    util::log::info(log_tag, "stored ", file_path, " as ", target.string());
    return target.string();
  }

  std::string local_backend::upload_data(native_bytes const &data,
                                         std::string const &file_name,
                                         std::string const &user,
                                         std::string const &session,
                                         config const &cfg)
  {
    auto const target(user_upload_dir(user, cfg) / util::sanitize_filename(file_name));
    write_bytes(target, reinterpret_cast<char const *>(data.data()), data.size());
    touch_session(user, session);
    util::log::info(log_tag, "stored ", data.size(), " bytes as ", target.string());
    return target.string();
  }

  std::string local_backend::transcribe_and_upload(std::string const &,
                                                   std::string const &,
                                                   std::string const &,
                                                   config const &)
  {
    unsupported("transcription");
  }

  void local_backend::send_notification(std::string const &message,
                                        std::string const &user,
                                        std::string const &session,
                                        config const &)
  {
    check_user(user);
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      auto &delivered(notifications_[user]);
      delivered.push_back(message);
      if(delivered.size() > max_notifications)
      {
        delivered.pop_front();
      }
      ++sessions_[user][session].notifications;
    }
    util::log::info(log_tag, "notification for ", user, "/", session, ": ", message);
  }

  std::vector<dir_entry>
  local_backend::list_dir(std::string const &path, std::string const &user, config const &cfg)
  {
    auto const dir(resolve(path, user, cfg));
    if(!fs::is_directory(dir))
    {
      throw error::invalid_parameter{ "Not a directory: " + path };
    }

    std::vector<dir_entry> ret;
    for(auto const &entry : fs::directory_iterator{ dir })
    {
      ret.push_back({ entry.path().filename().string(), entry.is_directory() });
    }
    std::ranges::sort(ret, {}, &dir_entry::name);
    return ret;
  }

  std::string
  local_backend::read_file(std::string const &path, std::string const &user, config const &cfg)
  {
    auto const file(resolve(path, user, cfg));
    if(!fs::is_regular_file(file))
    {
      throw error::invalid_parameter{ "No such file: " + path };
    }

    std::ifstream in{ file, std::ios::binary };
    if(!in)
    {
      throw std::runtime_error{ "Unable to open " + path };
    }
    return { std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
  }

  std::string local_backend::write_file(std::string const &path,
                                        std::string const &content,
                                        std::string const &user,
                                        config const &cfg)
  {
    auto const file(resolve(path, user, cfg));
    if(fs::is_directory(file))
    {
      throw error::invalid_parameter{ "Is a directory: " + path };
    }
    write_bytes(file, content.data(), content.size());
    return "Wrote " + std::to_string(content.size()) + " bytes to " + path;
  }

  std::string local_backend::delete_path(std::string const &path,
                                         std::string const &user,
                                         std::string const &session,
                                         config const &cfg)
  {
    auto const target(resolve(path, user, cfg));
    if(target == resolve("", user, cfg))
    {
      throw error::invalid_parameter{ "Refusing to delete the workspace root" };
    }
    if(!fs::exists(target))
    {
      throw error::invalid_parameter{ "No such file or directory: " + path };
    }

    auto const removed(fs::remove_all(target));
    touch_session(user, session);
    return "Deleted " + path + " (" + std::to_string(removed) + " entries)";
  }

  std::string local_backend::download_file(std::string const &path,
                                           std::string const &user,
                                           std::string const &session,
                                           std::optional<std::string> const &dest,
                                           config const &cfg)
  {
    auto const source(resolve(path, user, cfg));
    if(!fs::is_regular_file(source))
    {
      throw error::invalid_parameter{ "No such file: " + path };
    }

    fs::path target;
    if(dest.has_value() && !dest->empty())
    {
      target = *dest;
      if(fs::is_directory(target))
      {
        target /= source.filename();
      }
    }
    else
    {
      target = user_upload_dir(user, cfg) / "downloads" / source.filename();
    }

    fs::create_directories(target.parent_path());
    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
    touch_session(user, session);
    return target.string();
  }

  std::string local_backend::vm_execute(std::string const &,
                                        std::string const &,
                                        std::string const &,
                                        std::optional<int> const,
                                        config const &)
  {
    unsupported("VM execution");
  }

  text_stream_ptr local_backend::vm_execute_stream(std::string const &,
                                                   std::string const &,
                                                   std::string const &,
                                                   config const &,
                                                   bool const)
  {
    unsupported("VM execution");
  }

  void local_backend::vm_send_input(std::string const &,
                                    std::string const &,
                                    std::string const &,
                                    config const &)
  {
    unsupported("VM input");
  }

  void local_backend::vm_send_keys(std::string const &,
                                   double const,
                                   std::string const &,
                                   std::string const &,
                                   config const &)
  {
    unsupported("VM input");
  }

  void
  local_backend::restart_terminal(std::string const &, std::string const &, config const &)
  {
    unsupported("VM terminal");
  }

  std::vector<std::string> local_backend::list_sessions(std::string const &user)
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    std::vector<std::string> ret;
    auto const found(sessions_.find(user));
    if(found != sessions_.end())
    {
      for(auto const &[name, info] : found->second)
      {
        ret.push_back(name);
      }
    }
    return ret;
  }

  json local_backend::list_sessions_info(std::string const &user)
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    auto ret(json::array());
    auto const found(sessions_.find(user));
    if(found != sessions_.end())
    {
      for(auto const &[name, info] : found->second)
      {
        ret.push_back({ { "session", name },
                        { "connections", std::to_string(info.connections) },
                        { "notifications", std::to_string(info.notifications) } });
      }
    }
    return ret;
  }

  json local_backend::list_documents(std::string const &user)
  {
    fs::path dir;
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      auto const found(upload_dirs_.find(user));
      if(found == upload_dirs_.end())
      {
        return json::array();
      }
      dir = found->second;
    }

    std::vector<fs::path> files;
    std::error_code ec;
    for(auto const &entry : fs::directory_iterator{ dir, ec })
    {
      if(entry.is_regular_file())
      {
        files.push_back(entry.path());
      }
    }
    std::sort(files.begin(), files.end());

    auto ret(json::array());
    for(auto const &file : files)
    {
      ret.push_back({ { "name", file.filename().string() },
                      { "path", file.string() },
                      { "size", std::to_string(fs::file_size(file)) } });
    }
    return ret;
  }

  std::string local_backend::get_memory(std::string const &user)
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    auto const found(memory_.find(user));
    return found == memory_.end() ? std::string{} : found->second;
  }

  std::string local_backend::set_memory(std::string const &user, std::string const &memory)
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    memory_[user] = memory;
    return memory;
  }

  std::string local_backend::reset_memory(std::string const &user)
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    memory_.erase(user);
    return {};
  }

  chat_session_ptr local_backend::open_chat_session(std::string const &user,
                                                    std::string const &session,
                                                    bool const,
                                                    config const &)
  {
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      ++sessions_[user][session].connections;
    }
    return nullptr;
  }

  std::vector<std::string> local_backend::notifications(std::string const &user) const
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    auto const found(notifications_.find(user));
    if(found == notifications_.end())
    {
      return {};
    }
    return { found->second.begin(), found->second.end() };
  }

  fs::path
  local_backend::resolve(std::string const &path, std::string const &user, config const &cfg) const
  {
    check_user(user);
    auto const base(fs::absolute(cfg.workspace_dir / user));
    fs::create_directories(base);
    auto const root(fs::canonical(base));

    auto const candidate(fs::weakly_canonical(root / fs::path{ path }.relative_path()));
    auto const relative(candidate.lexically_relative(root));
    if(relative.empty() || *relative.begin() == "..")
    {
      throw error::invalid_parameter{ "Path escapes the workspace: " + path };
    }
    return candidate;
  }

  fs::path local_backend::user_upload_dir(std::string const &user, config const &cfg)
  {
    check_user(user);
    auto dir(fs::absolute(cfg.upload_dir / user));
    std::lock_guard<std::mutex> const lock{ mutex_ };
    upload_dirs_[user] = dir;
    return dir;
  }

  void local_backend::touch_session(std::string const &user, std::string const &session)
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    sessions_[user][session];
  }
}
