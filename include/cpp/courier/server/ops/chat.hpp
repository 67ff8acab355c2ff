#pragma once

namespace courier::server
{
  inline handler_ptr engine::handle_team_chat(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<stream_relay>([this, args, ctx]() -> backend::text_stream_ptr {
      auto const prompt(params::optional_string(args, "prompt", ""));
      if(ctx.chat)
      {
        return ctx.chat->chat_stream(prompt);
      }
      return backend_.chat(prompt, ctx.user, ctx.session, ctx.think, ctx.config);
    });
  }
}
