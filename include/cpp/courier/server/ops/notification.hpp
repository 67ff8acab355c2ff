#pragma once

namespace courier::server
{
  inline handler_ptr
  engine::handle_send_notification(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const message(params::require_string(args, "message"));
      backend_.send_notification(message, ctx.user, ctx.session, ctx.config);
      return json("ok");
    });
  }
}
