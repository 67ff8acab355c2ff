#pragma once

#include <limits>

#include <courier/util/coalesce.hpp>

namespace courier::server
{
  inline handler_ptr engine::handle_vm_execute(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const command(params::require_string(args, "command"));
      std::optional<int> timeout;
      if(auto const requested = params::optional_integer(args, "timeout"); requested.has_value())
      {
        if(*requested < 0 || *requested > std::numeric_limits<int>::max())
        {
          throw error::invalid_parameter{ "parameter 'timeout' is out of range" };
        }
        timeout = static_cast<int>(*requested);
      }
      else if(ctx.config.vm_timeout > 0)
      {
        timeout = ctx.config.vm_timeout;
      }
      return json(backend_.vm_execute(command, ctx.user, ctx.session, timeout, ctx.config));
    });
  }

  /* With `raw` (the default) the output is an undifferentiated feed, so adjacent
   * chunks are merged into fewer frames. Without it every unit the backend
   * produces, typically a line, keeps its own frame. */
  inline handler_ptr
  engine::handle_vm_execute_stream(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<stream_relay>([this, args, ctx]() -> backend::text_stream_ptr {
      auto const command(params::require_string(args, "command"));
      auto const raw(params::optional_flag(args, "raw", true));
      auto stream(backend_.vm_execute_stream(command, ctx.user, ctx.session, ctx.config, raw));
      if(raw && stream)
      {
        return std::make_unique<util::coalescing_stream>(std::move(stream));
      }
      return stream;
    });
  }

  inline handler_ptr engine::handle_vm_input(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const data(params::optional_string(args, "data", ""));
      backend_.vm_send_input(data, ctx.user, ctx.session, ctx.config);
      return json("ok");
    });
  }

  inline handler_ptr engine::handle_vm_keys(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const data(params::optional_string(args, "data", ""));
      auto const delay(params::optional_number(args, "delay", 0.05));
      if(delay < 0.0)
      {
        throw error::invalid_parameter{ "parameter 'delay' must not be negative" };
      }
      backend_.vm_send_keys(data, delay, ctx.user, ctx.session, ctx.config);
      return json("ok");
    });
  }

  inline handler_ptr
  engine::handle_restart_terminal(json const &, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, ctx]() {
      backend_.restart_terminal(ctx.user, ctx.session, ctx.config);
      if(ctx.chat)
      {
        ctx.chat->send_notification("VM terminal restarted");
      }
      return json("restarted");
    });
  }
}
