#pragma once

#include <courier/type.hpp>
#include <courier/backend/text_stream.hpp>

namespace courier::util
{
  constexpr usize default_coalesce_limit{ static_cast<usize>(64) * 1024 };

  /* Merges adjacent chunks of `source` into fewer, larger ones. Each `next()`
   * waits for one chunk, then keeps appending whatever the source already has
   * ready until the merged chunk reaches `limit` bytes. Chunks are never split or
   * reordered, so the concatenation of the output always equals the
   * concatenation of the input. */
  class coalescing_stream : public backend::text_stream
  {
  public:
    explicit coalescing_stream(backend::text_stream_ptr source,
                               usize limit = default_coalesce_limit);

    std::optional<std::string> next() override;
    bool ready() const override;

  private:
    backend::text_stream_ptr source_;
    usize limit_{};
    bool exhausted_{};
  };
}
