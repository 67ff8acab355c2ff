#include <courier/client/client.hpp>
#include <courier/server/asio.hpp>

#include "common.hpp"

namespace courier::client
{
  using namespace std::chrono_literals;
  using test::close_connection;
  using test::pause_for;
  using test::scripted_server;
  using test::send_text;

  static call_options const alice{ "alice", "main", std::nullopt };

  TEST_SUITE("client driver")
  {
    TEST_CASE("request returns the first envelope")
    {
      scripted_server peer{ { send_text("warming up"), send_text(R"({"status":"busy"})"),
                              send_text(R"({"result":"hi\n"})"), send_text(R"({"result":"late"})") } };
      client const c{ "127.0.0.1", peer.port() };

      auto const reply(c.request("vm_execute", { { "command", "echo hi" } }, alice));
      CHECK(reply == json{
                       { "result", "hi\n" }
      });
      CHECK(json::parse(peer.received())
            == json{
              { "command", "vm_execute" },
              {    "args", { { "command", "echo hi" } } }
      });
      CHECK(peer.target() == "/?user=alice&session=main&think=true");
    }

    TEST_CASE("request returns error envelopes as they are")
    {
      scripted_server peer{ { send_text(R"({"error":"Unknown command: nope"})") } };
      client const c{ "127.0.0.1", peer.port() };

      auto const reply(c.request("nope", json::object(), alice));
      CHECK(reply["error"] == "Unknown command: nope");
    }

    TEST_CASE("silence is reported as an unresponsive server")
    {
      scripted_server peer{ { send_text("not json at all") } };
      client const c{ "127.0.0.1", peer.port() };

      CHECK_THROWS_AS(c.request("get_memory", json::object(), alice, 200ms), error::server_unresponsive);
    }

    TEST_CASE("a close without a result is reported as such")
    {
      scripted_server peer{ { send_text("partial"), close_connection() } };
      client const c{ "127.0.0.1", peer.port() };

      CHECK_THROWS_AS(c.request("get_memory", json::object(), alice, 5s), error::connection_closed);
    }

    TEST_CASE("nothing listening")
    {
      client const c{ "127.0.0.1", test::unused_port() };
      CHECK_THROWS_AS(c.request("get_memory", json::object(), alice, 2s), error::connection_closed);
    }

    TEST_CASE("the chat stream ends after a quiet period")
    {
      scripted_server peer{ { send_text("Hel"), pause_for(50ms), send_text("lo"), send_text(R"({"result":1})") } };
      client const c{ "127.0.0.1", peer.port() };

      auto reader(c.team_chat_stream("greet me", alice, { { "style", "terse" } }, 300ms));
      CHECK(reader.collect() == std::vector<std::string>{ "Hel", "lo", R"({"result":1})" });
      CHECK_FALSE(reader.next().has_value());

      CHECK(json::parse(peer.received())
            == json{
              { "command", "team_chat" },
              {    "args", { { "prompt", "greet me" }, { "style", "terse" } } }
      });
      CHECK(peer.target() == "/?user=alice&session=main&think=true");
    }

    TEST_CASE("the VM stream ends when the server closes")
    {
      scripted_server peer{ { send_text("line 1"), send_text("line 2"), close_connection() } };
      client const c{ "127.0.0.1", peer.port() };

      auto reader(c.vm_execute_stream("make", alice, true));
      frame_reader moved{ std::move(reader) };
      CHECK(moved.next() == "line 1");
      CHECK(moved.next() == "line 2");
      CHECK_FALSE(moved.next().has_value());
      CHECK_FALSE(reader.next().has_value());

      auto const sent(json::parse(peer.received()));
      CHECK(sent["args"]["raw"] == true);
      CHECK(peer.target() == "/?user=alice&session=main&think=false");
    }

    TEST_CASE("typed wrappers")
    {
      SUBCASE("results are unwrapped")
      {
        scripted_server peer{ { send_text(R"({"result":[["a.txt",false],["sub",true]]})") } };
        client const c{ "127.0.0.1", peer.port() };

        auto const entries(c.list_dir("/tmp", alice));
        CHECK(entries == std::vector<dir_entry>{
                           { "a.txt", false },
                           {   "sub",  true }
        });
        CHECK(peer.target() == "/?user=alice&session=main&think=false");
      }
      SUBCASE("missing results give empty values")
      {
        scripted_server peer{ { send_text(R"({"result":null})") } };
        client const c{ "127.0.0.1", peer.port() };
        CHECK(c.get_memory(alice) == "");
      }
      SUBCASE("error envelopes throw")
      {
        scripted_server peer{ { send_text(R"({"error":"No such file: x"})") } };
        client const c{ "127.0.0.1", peer.port() };

        try
        {
          c.read_file("x", alice);
          FAIL("read_file should have thrown");
        }
        catch(error::command_failed const &e)
        {
          CHECK(e.command == "read_file");
          CHECK(e.server_message == "No such file: x");
        }
      }
      SUBCASE("uploads send base64 data")
      {
        scripted_server peer{ { send_text(R"({"result":"vm:/home/alice/a.bin"})") } };
        client const c{ "127.0.0.1", peer.port() };

        CHECK(c.upload_data({ 'f', 'o', 'o' }, "a.bin", alice) == "vm:/home/alice/a.bin");
        auto const sent(json::parse(peer.received()));
        CHECK(sent["command"] == "upload_document");
        CHECK(sent["args"]["file_data"] == "Zm9v");
        CHECK(sent["args"]["file_name"] == "a.bin");
      }
      SUBCASE("explicit think wins")
      {
        scripted_server peer{ { send_text(R"({"result":"ok"})") } };
        client const c{ "127.0.0.1", peer.port() };
        c.send_notification("done", { "alice", "main", true });
        CHECK(peer.target() == "/?user=alice&session=main&think=true");
      }
    }
  }

  TEST_SUITE("server transport")
  {
    struct running_server
    {
      explicit running_server(test::fake_backend &backend)
        : eng{ backend }
        , srv{ eng, backend, backend::config{}, "127.0.0.1", 0 }
        , c{ "127.0.0.1", srv.port() }
      {
      }

      server::engine eng;
      server::asio::server srv;
      client c;
    };

    TEST_CASE("commands round trip through the server")
    {
      test::fake_backend backend;
      backend.listing = {
        { "a.txt", false },
        {   "sub",  true }
      };
      running_server running{ backend };
      auto const &c(running.c);

      CHECK(running.srv.port() != 0);
      CHECK(c.list_dir("/tmp", alice).size() == 2);
      CHECK(c.vm_execute("echo hi", alice, 5) == "hi\n");
      CHECK(backend.last_timeout == 5);
      CHECK(c.set_memory("remember", alice) == "remember");
      CHECK(c.get_memory(alice) == "remember");
      CHECK(c.upload_data({ 'x' }, "x.txt", alice) == "vm:/home/alice/x.txt");

      auto const unknown(c.request("nope", json::object(), alice));
      CHECK(unknown == json{
                         { "error", "Unknown command: nope" }
      });
      CHECK_THROWS_AS(c.read_file("missing", alice), error::command_failed);
    }

    TEST_CASE("streams through the server")
    {
      test::fake_backend backend;
      backend.vm_bursts = {
        { "a", "b" },
        { "c" }
      };
      running_server running{ backend };
      auto const &c(running.c);

      CHECK(c.vm_execute_stream("ls", alice, false).collect() == std::vector<std::string>{ "a", "b", "c" });
      CHECK(c.vm_execute_stream("ls", alice, true).collect() == std::vector<std::string>{ "ab", "c" });
      CHECK(c.team_chat_stream("hi", alice, json::object(), 300ms).collect()
            == std::vector<std::string>{ "Hello, ", "world" });
      CHECK(backend.count("chat:hi:alice:main:think") == 1);
    }

    TEST_CASE("an attached chat session is used for the connection")
    {
      test::fake_backend backend;
      backend.chat_handle = std::make_shared<test::fake_chat_session>();
      running_server running{ backend };

      CHECK(running.c.team_chat_stream("hey", alice, json::object(), 300ms).collect()
            == std::vector<std::string>{ "from ", "session" });
      running.c.restart_terminal(alice);
      CHECK(backend.chat_handle->notifications == std::vector<std::string>{ "VM terminal restarted" });
    }

    TEST_CASE("one connection serves several commands and survives errors")
    {
      test::fake_backend backend;
      running_server running{ backend };
      test::raw_connection conn{ running.srv.port(), { "alice", "main", false } };

      conn.send("this is not json");
      auto const [bad, bad_is_text](conn.read());
      CHECK(bad_is_text);
      CHECK(json::parse(bad).contains("error"));

      conn.send(R"({"command":"vm_execute","args":[1]})");
      CHECK(json::parse(conn.read().first).contains("error"));

      conn.send(R"({"command":"vm_execute","args":{"command":"echo hi"}})");
      CHECK(conn.read().first == R"({"result":"hi\n"})");
      conn.close();
    }

    TEST_CASE("a backend failure of any type becomes an error envelope")
    {
      test::fake_backend backend;
      backend.foreign_listing_failure = true;
      running_server running{ backend };
      test::raw_connection conn{ running.srv.port(), { "alice", "main", false } };

      conn.send(R"({"command":"list_sessions"})");
      CHECK(conn.read().first == R"({"error":"unknown error"})");

      conn.send(R"({"command":"get_memory"})");
      CHECK(json::parse(conn.read().first).contains("result"));
      conn.close();

      CHECK_THROWS_AS(running.c.list_sessions(alice), error::command_failed);
    }

    TEST_CASE("raw output that isn't UTF-8 goes out as binary")
    {
      test::fake_backend backend;
      backend.vm_bursts = {
        { "ok" },
        { std::string{ "\xff\xfe" } }
      };
      running_server running{ backend };
      test::raw_connection conn{ running.srv.port(), { "alice", "main", false } };

      conn.send(R"({"command":"vm_execute_stream","args":{"command":"cat blob","raw":false}})");
      auto const first(conn.read());
      CHECK(first.first == "ok");
      CHECK(first.second);
      auto const second(conn.read());
      CHECK(second.first == "\xff\xfe");
      CHECK_FALSE(second.second);
      conn.close();
    }

    TEST_CASE("stop waits for open connections")
    {
      test::fake_backend backend;
      running_server running{ backend };
      test::raw_connection conn{ running.srv.port(), { "alice", "main", false } };

      conn.send(R"({"command":"get_memory"})");
      conn.read();
      CHECK(running.srv.active_connections() == 1);

      running.srv.stop();
      CHECK(running.srv.active_connections() == 0);
      CHECK_THROWS(conn.read());
    }
  }
}
