#pragma once

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

#include <courier/type.hpp>
#include <courier/error.hpp>
#include <courier/backend/operations.hpp>
#include <courier/server/context.hpp>
#include <courier/server/handler.hpp>
#include <courier/server/params.hpp>
#include <courier/util/log.hpp>

namespace courier::server
{
  /* Resolves command names to handlers and hands back their frames. The engine
   * holds no per-command state; anything that lasts between commands lives in the
   * backend, so one engine serves every connection concurrently. */
  class engine
  {
  public:
    using handler_fn = handler_ptr (engine::*)(json const &args, invocation_context const &ctx);

    explicit engine(backend::operations &backend)
      : backend_{ backend }
    {
    }

    /* Throws error::unknown_command, before any frame exists, when `command` has no
     * handler. Anything else the command does wrong surfaces from the returned
     * stream's `next()`. */
    frame_stream dispatch(std::string const &command, json args, invocation_context const &ctx)
    {
      auto const &handlers(registry());
      auto const found(handlers.find(command));
      if(found == handlers.end())
      {
        throw error::unknown_command{ command };
      }

      if(args.is_null())
      {
        args = json::object();
      }
      else if(!args.is_object())
      {
        throw error::invalid_parameter{ "args for '" + command + "' must be an object" };
      }

      return frame_stream{ (this->*(found->second.fn))(args, ctx) };
    }

    static std::vector<std::string> commands()
    {
      std::vector<std::string> ret;
      ret.reserve(registry().size());
      for(auto const &entry : registry())
      {
        ret.push_back(entry.first);
      }
      std::ranges::sort(ret);
      return ret;
    }

    static bool has_command(std::string const &command)
    {
      return registry().contains(command);
    }

    /* The shape of the frames `command` produces. Raw streams have no end marker,
     * so their consumers rely on the connection closing. Unknown commands answer
     * with an error envelope. */
    static wire::frame_shape shape_of(std::string const &command)
    {
      auto const found(registry().find(command));
      return found == registry().end() ? wire::frame_shape::envelope : found->second.shape;
    }

  private:
    struct entry
    {
      handler_fn fn;
      wire::frame_shape shape;
    };

    static std::unordered_map<std::string, entry> const &registry()
    {
      constexpr auto raw(wire::frame_shape::raw);
      constexpr auto envelope(wire::frame_shape::envelope);
      static std::unordered_map<std::string, entry> const handlers{
        {          "team_chat",          { &engine::handle_team_chat, raw } },
        /* Short alias; identical behavior. */
        {               "chat",          { &engine::handle_team_chat, raw } },
        {    "upload_document",    { &engine::handle_upload_document, envelope } },
        {           "list_dir",           { &engine::handle_list_dir, envelope } },
        {          "read_file",          { &engine::handle_read_file, envelope } },
        {         "write_file",         { &engine::handle_write_file, envelope } },
        {        "delete_path",        { &engine::handle_delete_path, envelope } },
        {      "download_file",      { &engine::handle_download_file, envelope } },
        {         "vm_execute",         { &engine::handle_vm_execute, envelope } },
        {  "vm_execute_stream",  { &engine::handle_vm_execute_stream, raw } },
        {           "vm_input",           { &engine::handle_vm_input, envelope } },
        {            "vm_keys",            { &engine::handle_vm_keys, envelope } },
        {  "send_notification",  { &engine::handle_send_notification, envelope } },
        {      "list_sessions",      { &engine::handle_list_sessions, envelope } },
        { "list_sessions_info", { &engine::handle_list_sessions_info, envelope } },
        {     "list_documents",     { &engine::handle_list_documents, envelope } },
        {         "get_memory",         { &engine::handle_get_memory, envelope } },
        {         "set_memory",         { &engine::handle_set_memory, envelope } },
        {       "reset_memory",       { &engine::handle_reset_memory, envelope } },
        {   "restart_terminal",   { &engine::handle_restart_terminal, envelope } },
      };
      return handlers;
    }

    handler_ptr handle_team_chat(json const &args, invocation_context const &ctx);

    handler_ptr handle_upload_document(json const &args, invocation_context const &ctx);

    handler_ptr handle_list_dir(json const &args, invocation_context const &ctx);

    handler_ptr handle_read_file(json const &args, invocation_context const &ctx);

    handler_ptr handle_write_file(json const &args, invocation_context const &ctx);

    handler_ptr handle_delete_path(json const &args, invocation_context const &ctx);

    handler_ptr handle_download_file(json const &args, invocation_context const &ctx);

    handler_ptr handle_vm_execute(json const &args, invocation_context const &ctx);

    handler_ptr handle_vm_execute_stream(json const &args, invocation_context const &ctx);

    handler_ptr handle_vm_input(json const &args, invocation_context const &ctx);

    handler_ptr handle_vm_keys(json const &args, invocation_context const &ctx);

    handler_ptr handle_send_notification(json const &args, invocation_context const &ctx);

    handler_ptr handle_list_sessions(json const &args, invocation_context const &ctx);

    handler_ptr handle_list_sessions_info(json const &args, invocation_context const &ctx);

    handler_ptr handle_list_documents(json const &args, invocation_context const &ctx);

    handler_ptr handle_get_memory(json const &args, invocation_context const &ctx);

    handler_ptr handle_set_memory(json const &args, invocation_context const &ctx);

    handler_ptr handle_reset_memory(json const &args, invocation_context const &ctx);

    handler_ptr handle_restart_terminal(json const &args, invocation_context const &ctx);

    backend::operations &backend_;
  };
}

#include <courier/server/ops/chat.hpp>
#include <courier/server/ops/upload_document.hpp>
#include <courier/server/ops/files.hpp>
#include <courier/server/ops/vm.hpp>
#include <courier/server/ops/notification.hpp>
#include <courier/server/ops/memory.hpp>
