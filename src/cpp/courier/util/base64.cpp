#include <array>

#include <courier/util/base64.hpp>

namespace courier::util
{
  static constexpr char const alphabet[]{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"
  };

  static constexpr std::array<i8, 256> make_table()
  {
    std::array<i8, 256> table{};
    for(auto &entry : table)
    {
      entry = -1;
    }
    for(usize i{}; i < 64; ++i)
    {
      table[static_cast<u8>(alphabet[i])] = static_cast<i8>(i);
    }
    return table;
  }

  std::string base64_encode(native_bytes const &data)
  {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    usize i{};
    for(; i + 2 < data.size(); i += 3)
    {
      u32 const n{ (static_cast<u32>(data[i]) << 16) | (static_cast<u32>(data[i + 1]) << 8)
                   | data[i + 2] };
      result.push_back(alphabet[(n >> 18) & 0x3F]);
      result.push_back(alphabet[(n >> 12) & 0x3F]);
      result.push_back(alphabet[(n >> 6) & 0x3F]);
      result.push_back(alphabet[n & 0x3F]);
    }

    auto const remaining(data.size() - i);
    if(remaining == 1)
    {
      u32 const n{ static_cast<u32>(data[i]) << 16 };
      result.push_back(alphabet[(n >> 18) & 0x3F]);
      result.push_back(alphabet[(n >> 12) & 0x3F]);
      result += "==";
    }
    else if(remaining == 2)
    {
      u32 const n{ (static_cast<u32>(data[i]) << 16) | (static_cast<u32>(data[i + 1]) << 8) };
      result.push_back(alphabet[(n >> 18) & 0x3F]);
      result.push_back(alphabet[(n >> 12) & 0x3F]);
      result.push_back(alphabet[(n >> 6) & 0x3F]);
      result.push_back('=');
    }

    return result;
  }

  std::optional<native_bytes> base64_decode(std::string_view const encoded)
  {
    static constexpr auto table(make_table());

    native_bytes result;
    result.reserve((encoded.size() / 4) * 3);

    u32 accumulator{};
    usize bits{};
    usize quad_pos{};
    usize pads{};
    for(auto const c : encoded)
    {
      if(c == '=')
      {
        /* Padding only counts once a quad holds at least two sextets. A complete
         * quad ends the input; whatever follows is ignored. */
        if(quad_pos >= 2 && quad_pos + ++pads >= 4)
        {
          quad_pos = 0;
          break;
        }
        continue;
      }

      auto const value(table[static_cast<u8>(c)]);
      if(value < 0)
      {
        continue;
      }
      pads = 0;

      accumulator = (accumulator << 6) | static_cast<u32>(value);
      bits += 6;
      quad_pos = (quad_pos + 1) % 4;
      if(bits >= 8)
      {
        bits -= 8;
        result.push_back(static_cast<u8>((accumulator >> bits) & 0xFF));
      }
    }

    /* A partial quad means missing padding or a stray sextet. */
    if(quad_pos != 0)
    {
      return std::nullopt;
    }

    return result;
  }
}
