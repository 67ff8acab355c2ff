#include <charconv>
#include <cmath>
#include <limits>

#include <courier/error.hpp>
#include <courier/server/params.hpp>

namespace courier::server::params
{
  static json const *find(json const &args, std::string const &key)
  {
    if(!args.is_object())
    {
      return nullptr;
    }
    auto const found(args.find(key));
    if(found == args.end() || found->is_null())
    {
      return nullptr;
    }
    return &*found;
  }

  static std::string stringify(json const &value, std::string const &key)
  {
    if(value.is_string())
    {
      return value.get<std::string>();
    }
    if(value.is_number() || value.is_boolean())
    {
      return value.dump();
    }
    throw error::invalid_parameter{ "parameter '" + key + "' must be a string" };
  }

  std::string require_string(json const &args, std::string const &key)
  {
    auto const * const value(find(args, key));
    if(!value)
    {
      throw error::invalid_parameter{ "missing parameter '" + key + "'" };
    }
    return stringify(*value, key);
  }

  std::string
  optional_string(json const &args, std::string const &key, std::string const &fallback)
  {
    auto const * const value(find(args, key));
    if(!value)
    {
      return fallback;
    }
    return stringify(*value, key);
  }

  std::optional<std::string> maybe_string(json const &args, std::string const &key)
  {
    auto const * const value(find(args, key));
    if(!value)
    {
      return std::nullopt;
    }
    return stringify(*value, key);
  }

  std::optional<i64> optional_integer(json const &args, std::string const &key)
  {
    auto const * const value(find(args, key));
    if(!value)
    {
      return std::nullopt;
    }

    if(value->is_number_integer())
    {
      return value->get<i64>();
    }
    if(value->is_number_float())
    {
      auto const d(value->get<double>());
      if(std::isfinite(d) && std::abs(d) < static_cast<double>(std::numeric_limits<i64>::max()))
      {
        return static_cast<i64>(d);
      }
    }
    else if(value->is_string())
    {
      auto const &str(value->get_ref<std::string const &>());
      i64 parsed{};
      auto const * const begin(str.data());
      auto const * const str_end(str.data() + str.size());
      auto const result(std::from_chars(begin, str_end, parsed));
      if(!str.empty() && result.ec == std::errc{} && result.ptr == str_end)
      {
        return parsed;
      }
    }
    else if(value->is_boolean())
    {
      return value->get<bool>() ? 1 : 0;
    }

    throw error::invalid_parameter{ "parameter '" + key + "' must be an integer" };
  }

  double optional_number(json const &args, std::string const &key, double const fallback)
  {
    auto const * const value(find(args, key));
    if(!value)
    {
      return fallback;
    }

    if(value->is_number())
    {
      return value->get<double>();
    }
    if(value->is_string())
    {
      auto const &str(value->get_ref<std::string const &>());
      double parsed{};
      auto const * const str_end(str.data() + str.size());
      auto const result(std::from_chars(str.data(), str_end, parsed));
      if(!str.empty() && result.ec == std::errc{} && result.ptr == str_end)
      {
        return parsed;
      }
    }

    throw error::invalid_parameter{ "parameter '" + key + "' must be a number" };
  }

  bool optional_flag(json const &args, std::string const &key, bool const fallback)
  {
    if(!args.is_object())
    {
      return fallback;
    }
    auto const found(args.find(key));
    if(found == args.end())
    {
      return fallback;
    }

    auto const &value(*found);
    switch(value.type())
    {
      case json::value_t::null:
        return false;
      case json::value_t::boolean:
        return value.get<bool>();
      case json::value_t::number_integer:
      case json::value_t::number_unsigned:
        return value.get<i64>() != 0;
      case json::value_t::number_float:
        return value.get<double>() != 0.0;
      case json::value_t::string:
        return !value.get_ref<std::string const &>().empty();
      case json::value_t::array:
      case json::value_t::object:
        return !value.empty();
      case json::value_t::binary:
        return !value.get_binary().empty();
      case json::value_t::discarded:
      default:
        return fallback;
    }
  }
}
