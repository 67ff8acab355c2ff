#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

namespace courier
{
  using i8 = std::int8_t;
  using u8 = std::uint8_t;
  using u16 = std::uint16_t;
  using u32 = std::uint32_t;
  using u64 = std::uint64_t;
  using i64 = std::int64_t;
  using usize = std::size_t;

  /* Every JSON value crossing the wire, in both directions, is one of these. */
  using json = nlohmann::json;

  using native_bytes = std::vector<u8>;
}
