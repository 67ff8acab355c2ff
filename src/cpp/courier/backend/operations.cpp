#include <courier/backend/operations.hpp>

namespace courier::backend
{
  chat_session_ptr operations::open_chat_session(std::string const &,
                                                 std::string const &,
                                                 bool const,
                                                 config const &)
  {
    return nullptr;
  }
}
