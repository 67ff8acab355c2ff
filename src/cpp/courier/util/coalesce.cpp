#include <courier/util/coalesce.hpp>

namespace courier::util
{
  coalescing_stream::coalescing_stream(backend::text_stream_ptr source, usize const limit)
    : source_{ std::move(source) }
    , limit_{ limit }
  {
  }

  std::optional<std::string> coalescing_stream::next()
  {
    if(exhausted_)
    {
      return std::nullopt;
    }

    auto merged(source_->next());
    if(!merged.has_value())
    {
      exhausted_ = true;
      return std::nullopt;
    }

    while(merged->size() < limit_ && source_->ready())
    {
      auto more(source_->next());
      if(!more.has_value())
      {
        exhausted_ = true;
        break;
      }
      merged->append(*more);
    }

    return merged;
  }

  bool coalescing_stream::ready() const
  {
    return !exhausted_ && source_->ready();
  }
}
