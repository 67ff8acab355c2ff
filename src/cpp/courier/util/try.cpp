#include <iostream>

#include <courier/error.hpp>
#include <courier/util/try.hpp>

namespace courier::util
{
  void print_exception(std::exception const &e)
  {
    if(auto const * const known = dynamic_cast<error::base const *>(&e))
    {
      std::cerr << "error (" << known->kind() << "): " << e.what() << '\n';
    }
    else
    {
      std::cerr << "error: " << e.what() << '\n';
    }

    cpptrace::from_current_exception().print(std::cerr);
  }
}
