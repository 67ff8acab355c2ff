#pragma once

#include <filesystem>

#include <courier/util/base64.hpp>
#include <courier/util/mime.hpp>
#include <courier/util/string.hpp>

namespace courier::server
{
  /* Stores a document, then, when it is audio, transcribes it.
   *
   *   receiving ─► stored ─┬─► done                  (not audio)
   *                        └─► transcribing ─► done  (transcript or not)
   *
   * The store result is always the first frame. A transcript location, when one
   * is produced, is the second. Transcription failures are logged and swallowed:
   * the upload has already been reported as a success and stays one. */
  class upload_pipeline : public handler
  {
  public:
    enum class state : u8
    {
      receiving,
      stored,
      transcribing,
      done
    };

    upload_pipeline(backend::operations &backend, json args, invocation_context ctx)
      : backend_{ backend }
      , args_( std::move(args) )
      , ctx_{ std::move(ctx) }
    {
    }

    std::optional<maybe_frame> next() override
    {
      switch(state_)
      {
        case state::receiving:
          {
            /* A failed store ends the pipeline. */
            state_ = state::done;
            auto location(store());
            notify_uploaded(location);
            state_ = state::stored;
            return yield(wire::envelope::result(std::move(location)));
          }
        case state::stored:
          if(util::is_audio_file(local_path_.filename().string()))
          {
            state_ = state::transcribing;
            return transcribe();
          }
          state_ = state::done;
          return end();
        case state::transcribing:
          return transcribe();
        case state::done:
        default:
          return end();
      }
    }

    state current_state() const
    {
      return state_;
    }

    std::filesystem::path const &local_path() const
    {
      return local_path_;
    }

  private:
    std::string store()
    {
      auto const &cfg(ctx_.config);
      auto const data_it(args_.find("file_data"));
      if(data_it != args_.end() && !data_it->is_null())
      {
        auto const file_name(params::optional_string(args_, "file_name", ""));
        if(file_name.empty())
        {
          throw error::invalid_parameter{ "file_name required when file_data provided" };
        }

        native_bytes data;
        if(data_it->is_string())
        {
          auto decoded(util::base64_decode(data_it->get_ref<std::string const &>()));
          if(!decoded.has_value())
          {
            throw error::invalid_parameter{ "file_data is not valid base64" };
          }
          data = std::move(*decoded);
        }
        else if(data_it->is_binary())
        {
          auto const &bytes(data_it->get_binary());
          data.assign(bytes.begin(), bytes.end());
        }
        else
        {
          throw error::invalid_parameter{ "file_data must be bytes or base64 string" };
        }

        auto location(backend_.upload_data(data, file_name, ctx_.user, ctx_.session, cfg));
        local_path_ = cfg.upload_dir / ctx_.user / util::sanitize_filename(file_name);
        return location;
      }

      auto const file_path(params::require_string(args_, "file_path"));
      auto location(backend_.upload_document(file_path, ctx_.user, ctx_.session, cfg));
      local_path_ = cfg.upload_dir / ctx_.user / std::filesystem::path{ file_path }.filename();
      return location;
    }

    /* The upload already happened; a notification that can't be delivered must not
     * hide that from the caller. */
    void notify_uploaded(std::string const &location)
    {
      try
      {
        backend_.send_notification("File uploaded: " + location,
                                   ctx_.user,
                                   ctx_.session,
                                   ctx_.config);
      }
      catch(std::exception const &e)
      {
        util::log::warn("courier-server",
                        "Upload notification failed for ",
                        location,
                        ": ",
                        e.what());
      }
      catch(...)
      {
        util::log::warn("courier-server", "Upload notification failed for ", location);
      }
    }

    std::optional<maybe_frame> transcribe()
    {
      state_ = state::done;
      try
      {
        auto transcript(backend_.transcribe_and_upload(local_path_.string(),
                                                       ctx_.user,
                                                       ctx_.session,
                                                       ctx_.config));
        if(transcript.empty())
        {
          return skip();
        }

        backend_.send_notification("File uploaded: " + transcript,
                                   ctx_.user,
                                   ctx_.session,
                                   ctx_.config);
        return yield(wire::envelope::result(std::move(transcript)));
      }
      catch(std::exception const &e)
      {
        util::log::error("courier-server",
                         "Transcription failed for ",
                         local_path_.string(),
                         ": ",
                         e.what());
        return end();
      }
      catch(...)
      {
        util::log::error("courier-server", "Transcription failed for ", local_path_.string());
        return end();
      }
    }

    backend::operations &backend_;
    json args_;
    invocation_context ctx_;
    state state_{ state::receiving };
    std::filesystem::path local_path_;
  };

  inline handler_ptr
  engine::handle_upload_document(json const &args, invocation_context const &ctx)
  {
    return std::make_unique<upload_pipeline>(backend_, args, ctx);
  }
}
