#include <array>

#include <courier/util/base64.hpp>
#include <courier/util/cli.hpp>
#include <courier/util/log.hpp>
#include <courier/util/mime.hpp>
#include <courier/util/string.hpp>

#include "common.hpp"

namespace courier::util
{
  static native_bytes bytes_of(std::string_view const s)
  {
    return { s.begin(), s.end() };
  }

  TEST_SUITE("util")
  {
    TEST_CASE("base64 encoding")
    {
      CHECK(base64_encode({}) == "");
      CHECK(base64_encode(bytes_of("f")) == "Zg==");
      CHECK(base64_encode(bytes_of("fo")) == "Zm8=");
      CHECK(base64_encode(bytes_of("foo")) == "Zm9v");
      CHECK(base64_encode(bytes_of("foobar")) == "Zm9vYmFy");
      CHECK(base64_encode(native_bytes{ 0xfb, 0xff }) == "+/8=");
    }

    TEST_CASE("base64 decoding")
    {
      CHECK(base64_decode("Zm9vYmFy") == bytes_of("foobar"));
      CHECK(base64_decode("Zm8=") == bytes_of("fo"));
      CHECK(base64_decode("Zg==") == bytes_of("f"));
      CHECK(base64_decode("Zm9v\nYmFy\n") == bytes_of("foobar"));
      CHECK(base64_decode("") == native_bytes{});
      CHECK(base64_decode("+/8=") == native_bytes{ 0xfb, 0xff });

      SUBCASE("characters outside the alphabet are skipped")
      {
        CHECK(base64_decode("Zm9v!") == bytes_of("foo"));
        CHECK(base64_decode("Zm-9v YmFy") == bytes_of("foobar"));
        CHECK(base64_decode("@@@") == native_bytes{});
      }
      SUBCASE("decoding stops after padding")
      {
        CHECK(base64_decode("Zg==Zg==") == bytes_of("f"));
        CHECK(base64_decode("Zm8=garbage") == bytes_of("fo"));
      }
      SUBCASE("incomplete quads are rejected")
      {
        CHECK_FALSE(base64_decode("Zm8").has_value());
        CHECK_FALSE(base64_decode("Zg=").has_value());
        CHECK_FALSE(base64_decode("Z").has_value());
        CHECK_FALSE(base64_decode("Zm9vY").has_value());
      }
    }

    TEST_CASE("mime types come from the extension")
    {
      CHECK(guess_mime_type("song.mp3") == "audio/mpeg");
      CHECK(guess_mime_type("SONG.WAV").value_or("").starts_with("audio/"));
      CHECK(guess_mime_type("notes.txt") == "text/plain");
      CHECK_FALSE(guess_mime_type("README").has_value());
      CHECK_FALSE(guess_mime_type("archive.unknownext").has_value());

      for(auto const *name : { "a.mp3", "a.wav", "a.ogg", "a.flac", "a.m4a", "a.opus", "dir/b.aac" })
      {
        CAPTURE(name);
        CHECK(is_audio_file(name));
      }
      for(auto const *name : { "a.pdf", "a.txt", "a.mp4", "mp3", "" })
      {
        CAPTURE(name);
        CHECK_FALSE(is_audio_file(name));
      }
    }

    TEST_CASE("file names are sanitized")
    {
      CHECK(sanitize_filename("report.pdf") == "report.pdf");
      CHECK(sanitize_filename("../../etc/passwd") == "passwd");
      CHECK(sanitize_filename("C:\\temp\\a b.txt") == "a_b.txt");
      CHECK(sanitize_filename("voice note (1).m4a") == "voice_note__1_.m4a");
      CHECK(sanitize_filename("") == "upload");
      CHECK(sanitize_filename("..") == "upload");
      CHECK(sanitize_filename("dir/") == "upload");
    }

    TEST_CASE("utf-8 validation")
    {
      CHECK(is_valid_utf8("plain ascii"));
      CHECK(is_valid_utf8("caf\xc3\xa9"));
      CHECK(is_valid_utf8("\xf0\x9f\x98\x80"));
      CHECK_FALSE(is_valid_utf8("\xff"));
      CHECK_FALSE(is_valid_utf8("\xc3"));
      CHECK_FALSE(is_valid_utf8("\xc0\xaf"));
      CHECK_FALSE(is_valid_utf8("\xed\xa0\x80"));
    }

    TEST_CASE("percent encoding")
    {
      CHECK(percent_encode("alice") == "alice");
      CHECK(percent_encode("a b&c=d") == "a%20b%26c%3Dd");
      CHECK(percent_decode("a%20b%26c%3Dd") == "a b&c=d");
      CHECK(percent_decode("a+b") == "a b");
      CHECK(percent_decode("100%") == "100%");
      CHECK(percent_decode("%zz") == "%zz");
    }

    TEST_CASE("log levels")
    {
      auto const previous(log::current_level());

      log::set_level(log::level::warn);
      CHECK_FALSE(log::enabled(log::level::debug));
      CHECK_FALSE(log::enabled(log::level::info));
      CHECK(log::enabled(log::level::warn));
      CHECK(log::enabled(log::level::error));

      log::set_level(log::level::off);
      CHECK_FALSE(log::enabled(log::level::error));

      log::set_level(previous);
      CHECK(std::string_view{ log::level_str(log::level::debug) } == "debug");
    }

    TEST_CASE("client request arguments")
    {
      auto const args(cli::make_request_args({ "path=/tmp", "timeout=5", "raw=false", "note=hello world" },
                                             R"({"command":"ls","timeout":1})"));
      CHECK(args == json{
                      {    "path",        "/tmp" },
                      { "timeout",             5 },
                      {     "raw",         false },
                      {    "note", "hello world" },
                      { "command",          "ls" }
      });

      CHECK(cli::make_request_args({}, "") == json::object());
      CHECK(cli::make_request_args({ "empty=" }, "")["empty"] == "");
      CHECK_THROWS_AS(cli::make_request_args({ "novalue" }, ""), error::invalid_parameter);
      CHECK_THROWS_AS(cli::make_request_args({}, "[1]"), error::invalid_parameter);
      CHECK_THROWS_AS(cli::make_request_args({}, "{oops"), error::invalid_parameter);
    }

    TEST_CASE("server options")
    {
      cli::server_options opts;
      std::array<char const *, 7> argv{ "courier-server", "--port",     "0",     "--upload-dir",
                                        "/tmp/up",        "--log-level", "DEBUG" };
      CHECK_FALSE(cli::parse(static_cast<int>(argv.size()), argv.data(), opts).has_value());
      CHECK(opts.port == 0);
      CHECK(opts.upload_dir == "/tmp/up");
      CHECK(opts.log_level == log::level::debug);
      CHECK(opts.workspace_dir == "workspace");
    }

    TEST_CASE("client options")
    {
      cli::client_options opts;
      std::array<char const *, 10> argv{ "courier-client", "--user", "alice", "request",  "list_dir",
                                         "--arg",          "path=/", "--arg", "depth=2", "--think=false" };
      CHECK_FALSE(cli::parse(static_cast<int>(argv.size()), argv.data(), opts).has_value());
      CHECK(opts.command == cli::client_command::request);
      CHECK(opts.user == "alice");
      CHECK(opts.command_name == "list_dir");
      CHECK(opts.arg_pairs == std::vector<std::string>{ "path=/", "depth=2" });
      CHECK(opts.think == false);
    }
  }
}
