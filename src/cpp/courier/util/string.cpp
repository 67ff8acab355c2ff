#include <algorithm>
#include <cctype>

#include <courier/type.hpp>
#include <courier/util/string.hpp>

namespace courier::util
{
  std::string to_lower(std::string_view const s)
  {
    std::string ret{ s };
    std::ranges::transform(ret, ret.begin(), [](unsigned char const c) {
      return static_cast<char>(std::tolower(c));
    });
    return ret;
  }

  std::string sanitize_filename(std::string_view name)
  {
    auto const slash(name.find_last_of("/\\"));
    if(slash != std::string_view::npos)
    {
      name.remove_prefix(slash + 1);
    }

    std::string ret;
    ret.reserve(name.size());
    for(auto const c : name)
    {
      auto const uc(static_cast<unsigned char>(c));
      if(std::isalnum(uc) || c == '.' || c == '_' || c == '-')
      {
        ret.push_back(c);
      }
      else
      {
        ret.push_back('_');
      }
    }

    if(ret.empty() || ret == "." || ret == "..")
    {
      ret = "upload";
    }
    return ret;
  }

  bool is_valid_utf8(std::string_view const s)
  {
    usize i{};
    while(i < s.size())
    {
      auto const c(static_cast<u8>(s[i]));
      usize len{};
      u32 min{};
      u32 cp{};
      if(c < 0x80)
      {
        ++i;
        continue;
      }
      else if((c & 0xE0) == 0xC0)
      {
        len = 2;
        min = 0x80;
        cp = c & 0x1F;
      }
      else if((c & 0xF0) == 0xE0)
      {
        len = 3;
        min = 0x800;
        cp = c & 0x0F;
      }
      else if((c & 0xF8) == 0xF0)
      {
        len = 4;
        min = 0x10000;
        cp = c & 0x07;
      }
      else
      {
        return false;
      }

      if(i + len > s.size())
      {
        return false;
      }
      for(usize j{ 1 }; j < len; ++j)
      {
        auto const cc(static_cast<u8>(s[i + j]));
        if((cc & 0xC0) != 0x80)
        {
          return false;
        }
        cp = (cp << 6) | (cc & 0x3F);
      }

      /* Overlong forms, surrogates and out of range code points. */
      if(cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      {
        return false;
      }
      i += len;
    }
    return true;
  }

  std::string percent_encode(std::string_view const s)
  {
    static constexpr char const hex[]{ "0123456789ABCDEF" };
    std::string ret;
    ret.reserve(s.size());
    for(auto const c : s)
    {
      auto const uc(static_cast<unsigned char>(c));
      if(std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~')
      {
        ret.push_back(c);
      }
      else
      {
        ret.push_back('%');
        ret.push_back(hex[uc >> 4]);
        ret.push_back(hex[uc & 0x0F]);
      }
    }
    return ret;
  }

  static int hex_value(char const c)
  {
    if(c >= '0' && c <= '9')
    {
      return c - '0';
    }
    if(c >= 'a' && c <= 'f')
    {
      return c - 'a' + 10;
    }
    if(c >= 'A' && c <= 'F')
    {
      return c - 'A' + 10;
    }
    return -1;
  }

  std::string percent_decode(std::string_view const s)
  {
    std::string ret;
    ret.reserve(s.size());
    for(usize i{}; i < s.size(); ++i)
    {
      if(s[i] == '+')
      {
        ret.push_back(' ');
        continue;
      }
      if(s[i] == '%' && i + 2 < s.size())
      {
        auto const hi(hex_value(s[i + 1]));
        auto const lo(hex_value(s[i + 2]));
        if(hi >= 0 && lo >= 0)
        {
          ret.push_back(static_cast<char>((hi << 4) | lo));
          i += 2;
          continue;
        }
      }
      ret.push_back(s[i]);
    }
    return ret;
  }
}
