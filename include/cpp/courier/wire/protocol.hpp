#pragma once

// Courier Wire Protocol
//
// One websocket connection carries commands from a client to the agent server
// and frames back. Identity travels in the connection target, never in a message.
//
// Connection target:
//   /?user=alice&session=main&think=true
//
// Client -> Server (one JSON text message per command):
//   {"command":"list_dir","args":{"path":"/tmp"}}
//
// Server -> Client, envelope frame (commands with exactly-once results):
//   {"result":[["a.txt",false],["sub",true]]}
//   {"error":"Unknown command: lsit_dir"}
//
// Server -> Client, raw frame (streaming commands: chat deltas, VM output):
//   Hello, wor
//   ld!
//
// A client knows which shape to expect from the command it issued. Raw frames
// are never wrapped, so a raw frame may itself look like JSON. Nothing marks the
// end of a raw stream: once it is done the server closes the connection.

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <courier/type.hpp>

namespace courier::wire
{
  struct command
  {
    std::string name;
    json args = json::object();
  };

  struct envelope
  {
    enum class kind : u8
    {
      result,
      error
    };

    static envelope result(json payload)
    {
      return { kind::result, std::move(payload) };
    }

    static envelope error(json payload)
    {
      return { kind::error, std::move(payload) };
    }

    bool is_error() const
    {
      return type == kind::error;
    }

    bool operator==(envelope const &) const = default;

    kind type{ kind::result };
    json payload;
  };

  struct raw_text
  {
    bool operator==(raw_text const &) const = default;

    std::string text;
  };

  using frame = std::variant<envelope, raw_text>;

  /* The frame shape a command answers with when it succeeds. */
  enum class frame_shape : u8
  {
    envelope,
    raw
  };

  std::string encode(frame const &f);
  std::string encode(envelope const &e);
  std::string encode_command(command const &c);

  /* Throws error::protocol if `message` is not a JSON object with a string
   * "command". Missing or null "args" decode as an empty object. */
  command decode_command(std::string_view message);

  /* Reads `text` as an envelope frame. Anything that is not a JSON object holding
   * "result" or "error" yields nothing. */
  std::optional<envelope> parse_envelope(std::string_view text);

  /* Back to the JSON object as it appeared on the wire. */
  json to_json(envelope const &e);

  constexpr u16 default_port = 8765;
}
