#pragma once

namespace courier::server
{
  inline handler_ptr engine::handle_list_dir(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const path(params::require_string(args, "path"));
      auto const listing(backend_.list_dir(path, ctx.user, ctx.config));

      /* Each entry goes out as a [name, is_dir] pair. */
      json entries(json::array());
      for(auto const &entry : listing)
      {
        entries.push_back(json::array({ entry.name, entry.is_dir }));
      }
      return entries;
    });
  }

  inline handler_ptr engine::handle_read_file(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const path(params::require_string(args, "path"));
      return json(backend_.read_file(path, ctx.user, ctx.config));
    });
  }

  inline handler_ptr engine::handle_write_file(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const path(params::require_string(args, "path"));
      auto const content(params::optional_string(args, "content", ""));
      return json(backend_.write_file(path, content, ctx.user, ctx.config));
    });
  }

  inline handler_ptr engine::handle_delete_path(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const path(params::require_string(args, "path"));
      return json(backend_.delete_path(path, ctx.user, ctx.session, ctx.config));
    });
  }

  inline handler_ptr engine::handle_download_file(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<single_result>([this, args, ctx]() {
      auto const path(params::require_string(args, "path"));
      auto const dest(params::maybe_string(args, "dest"));
      return json(backend_.download_file(path, ctx.user, ctx.session, dest, ctx.config));
    });
  }
}
