#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <courier/type.hpp>
#include <courier/backend/text_stream.hpp>
#include <courier/wire/protocol.hpp>

namespace courier::server
{
  /* One element of a handler's output. An element holding no frame is dropped by
   * the dispatcher, which lets a handler decline to emit in some branch without
   * inventing a sentinel frame. */
  using maybe_frame = std::optional<wire::frame>;

  /* The lazy output of one command invocation. Work happens inside `next()`: a
   * handler does nothing, not even argument validation, until it is first pulled. */
  class handler
  {
  public:
    virtual ~handler() = default;

    /* Nothing once the sequence has ended. */
    virtual std::optional<maybe_frame> next() = 0;
  };

  using handler_ptr = std::unique_ptr<handler>;

  inline std::optional<maybe_frame> yield(wire::frame f)
  {
    return std::make_optional<maybe_frame>(std::move(f));
  }

  inline std::optional<maybe_frame> skip()
  {
    return std::make_optional<maybe_frame>(std::nullopt);
  }

  inline std::optional<maybe_frame> end()
  {
    return std::nullopt;
  }

  /* Commands with exactly one envelope: run `produce` on the first pull and wrap
   * whatever it returns as a result. */
  class single_result : public handler
  {
  public:
    using producer = std::function<json()>;

    explicit single_result(producer produce)
      : produce_{ std::move(produce) }
    {
    }

    std::optional<maybe_frame> next() override
    {
      if(done_)
      {
        return end();
      }
      done_ = true;
      return yield(wire::envelope::result(produce_()));
    }

  private:
    producer produce_;
    bool done_{};
  };

  /* Commands that relay a backend text stream as raw frames. The stream is opened
   * on the first pull. Empty chunks carry nothing and are skipped. */
  class stream_relay : public handler
  {
  public:
    using opener = std::function<backend::text_stream_ptr()>;

    explicit stream_relay(opener open)
      : open_{ std::move(open) }
    {
    }

    std::optional<maybe_frame> next() override
    {
      if(!opened_)
      {
        opened_ = true;
        stream_ = open_();
      }
      if(!stream_)
      {
        return end();
      }

      auto part(stream_->next());
      if(!part.has_value())
      {
        stream_.reset();
        return end();
      }
      if(part->empty())
      {
        return skip();
      }
      return yield(wire::raw_text{ std::move(*part) });
    }

  private:
    opener open_;
    backend::text_stream_ptr stream_;
    bool opened_{};
  };

  /* What the dispatcher hands back: the handler's frames, in order, with the
   * frameless elements removed. */
  class frame_stream
  {
  public:
    explicit frame_stream(handler_ptr h)
      : handler_{ std::move(h) }
    {
    }

    std::optional<wire::frame> next()
    {
      while(handler_)
      {
        auto element(handler_->next());
        if(!element.has_value())
        {
          handler_.reset();
          break;
        }
        if(element->has_value())
        {
          return std::move(**element);
        }
      }
      return std::nullopt;
    }

  private:
    handler_ptr handler_;
  };
}
