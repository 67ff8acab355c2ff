#pragma once

/* Per-user persisted state. None of these look at the session. */
namespace courier::server
{
  inline handler_ptr engine::handle_list_sessions(json const &, invocation_context const &ctx)
  {
    return std::make_unique<single_result>(
      [this, ctx]() { return json(backend_.list_sessions(ctx.user)); });
  }

  inline handler_ptr
  engine::handle_list_sessions_info(json const &, invocation_context const &ctx)
  {
    return std::make_unique<single_result>(
      [this, ctx]() { return backend_.list_sessions_info(ctx.user); });
  }

  inline handler_ptr engine::handle_list_documents(json const &, invocation_context const &ctx)
  {
    return std::make_unique<single_result>(
      [this, ctx]() { return backend_.list_documents(ctx.user); });
  }

  inline handler_ptr engine::handle_get_memory(json const &, invocation_context const &ctx)
  {
    return std::make_unique<single_result>(
      [this, ctx]() { return json(backend_.get_memory(ctx.user)); });
  }

  inline handler_ptr engine::handle_set_memory(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const memory(params::optional_string(args, "memory", ""));
      return json(backend_.set_memory(ctx.user, memory));
    });
  }

  inline handler_ptr engine::handle_reset_memory(json const &, invocation_context const &ctx)
  {
    return std::make_unique<single_result>(
      [this, ctx]() { return json(backend_.reset_memory(ctx.user)); });
  }
}
