#pragma once

#include <string>

#include <courier/backend/config.hpp>
#include <courier/backend/operations.hpp>

namespace courier::server
{
  /* Who a command runs for and how. Fixed for the whole of one dispatched command;
   * handlers keep their own copy since they outlive the dispatch call. */
  struct invocation_context
  {
    std::string user;
    std::string session;
    bool think{};
    backend::config config;
    /* Null means chat turns are one-off generations scoped to user/session. */
    backend::chat_session_ptr chat;
  };
}
