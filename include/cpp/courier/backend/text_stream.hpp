#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace courier::backend
{
  /* A lazy, single-pass sequence of text chunks produced by a backend operation.
   * `next()` blocks until the next chunk is available and returns nothing once the
   * sequence has ended. An empty chunk carries no value. */
  class text_stream
  {
  public:
    virtual ~text_stream() = default;

    virtual std::optional<std::string> next() = 0;

    /* Whether `next()` would return without blocking. Streams that can't tell
     * say no, which only costs coalescing opportunities. */
    virtual bool ready() const
    {
      return false;
    }
  };

  using text_stream_ptr = std::unique_ptr<text_stream>;

  /* A stream over chunks that are all already in memory. */
  class buffered_stream : public text_stream
  {
  public:
    buffered_stream() = default;

    explicit buffered_stream(std::vector<std::string> chunks)
      : chunks_{ chunks.begin(), chunks.end() }
    {
    }

    std::optional<std::string> next() override
    {
      if(chunks_.empty())
      {
        return std::nullopt;
      }
      auto ret(std::move(chunks_.front()));
      chunks_.pop_front();
      return ret;
    }

    bool ready() const override
    {
      return !chunks_.empty();
    }

  private:
    std::deque<std::string> chunks_;
  };
}
