#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <courier/type.hpp>

namespace courier::util
{
  std::string base64_encode(native_bytes const &data);

  /* Standard alphabet. Characters outside it are skipped and decoding stops at
   * the first complete padding. Returns nothing when the data ends in an
   * incomplete quad, which covers missing padding. */
  std::optional<native_bytes> base64_decode(std::string_view encoded);
}
