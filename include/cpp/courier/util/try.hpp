#pragma once

#include <exception>

#include <cpptrace/cpptrace.hpp>
#include <cpptrace/from_current.hpp>

namespace courier::util
{
  /* Prints the in-flight exception along with the stack trace captured where it
   * was thrown. Only meaningful inside COURIER_CATCH. */
  void print_exception(std::exception const &e);
}

/* Top-level guard for executables. The trace is collected at the throw site, so
 * the catch block can report where the failure came from, not just what it was. */
#define COURIER_TRY CPPTRACE_TRY
#define COURIER_CATCH(fun)        \
  CPPTRACE_CATCH(std::exception const &e) \
  {                               \
    fun(e);                       \
  }
