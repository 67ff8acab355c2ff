#include <courier/error.hpp>
#include <courier/wire/protocol.hpp>

namespace courier::wire
{
  static std::string dump(json const &value)
  {
    /* Payloads can hold arbitrary file contents; never let one bad byte fail
     * the whole frame. */
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
  }

  json to_json(envelope const &e)
  {
    json ret(json::object());
    ret[e.is_error() ? "error" : "result"] = e.payload;
    return ret;
  }

  std::string encode(envelope const &e)
  {
    return dump(to_json(e));
  }

  std::string encode(frame const &f)
  {
    if(auto const * const e = std::get_if<envelope>(&f))
    {
      return encode(*e);
    }
    return std::get<raw_text>(f).text;
  }

  std::string encode_command(command const &c)
  {
    json msg(json::object());
    msg["command"] = c.name;
    msg["args"] = c.args.is_null() ? json::object() : c.args;
    return dump(msg);
  }

  command decode_command(std::string_view const message)
  {
    auto parsed(json::parse(message.begin(), message.end(), nullptr, false));
    if(parsed.is_discarded())
    {
      throw error::protocol{ "message is not valid JSON" };
    }
    if(!parsed.is_object())
    {
      throw error::protocol{ "message must be a JSON object" };
    }

    auto const name_it(parsed.find("command"));
    if(name_it == parsed.end() || !name_it->is_string())
    {
      throw error::protocol{ "message is missing a string \"command\"" };
    }

    command ret{ name_it->get<std::string>(), json::object() };
    auto const args_it(parsed.find("args"));
    if(args_it != parsed.end() && !args_it->is_null())
    {
      ret.args = std::move(*args_it);
    }
    return ret;
  }

  std::optional<envelope> parse_envelope(std::string_view const text)
  {
    auto parsed(json::parse(text.begin(), text.end(), nullptr, false));
    if(parsed.is_discarded() || !parsed.is_object())
    {
      return std::nullopt;
    }

    if(auto const result_it = parsed.find("result"); result_it != parsed.end())
    {
      return envelope::result(std::move(*result_it));
    }
    if(auto const error_it = parsed.find("error"); error_it != parsed.end())
    {
      return envelope::error(std::move(*error_it));
    }
    return std::nullopt;
  }
}
