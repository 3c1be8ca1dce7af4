/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/bus/redis_backend.h"
#include "capflow/bus/resp.h"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace capflow;
using namespace std::chrono_literals;

namespace
{

namespace net = boost::asio;
using tcp = net::ip::tcp;
using boost::system::error_code;

std::string bulk(const std::string& s) { return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n"; }

// Single-threaded RESP server covering the handful of commands the backend uses.
class FakeRedisServer
{
 public:
  FakeRedisServer() : _acceptor(_io, tcp::endpoint(net::ip::address_v4::loopback(), 0))
  {
    accept();
    _thread = std::thread([this] { _io.run(); });
  }

  ~FakeRedisServer()
  {
    _io.stop();
    _thread.join();
  }

  uint16_t port() const { return _acceptor.local_endpoint().port(); }

  void setSilent(bool silent) { _silent = silent; }
  void failNextCommand() { _failNext = true; }

  size_t subscriberCount(const std::string& channel)
  {
    std::lock_guard lock(_mutex);
    size_t n = 0;
    for (const auto& s : _sessions)
    {
      n += s->channels.count(channel);
    }
    return n;
  }

  // Closes every client connection, as a restarting server would.
  void kickAll()
  {
    std::promise<void> done;
    net::post(_io,
              [this, &done]
              {
                std::vector<std::shared_ptr<Session>> sessions;
                {
                  std::lock_guard lock(_mutex);
                  sessions.swap(_sessions);
                }
                for (const auto& s : sessions)
                {
                  error_code ignored;
                  s->socket.shutdown(tcp::socket::shutdown_both, ignored);
                  s->socket.close(ignored);
                }
                done.set_value();
              });
    done.get_future().wait();
  }

  std::vector<std::vector<std::string>> commands()
  {
    std::lock_guard lock(_mutex);
    return _commands;
  }

 private:
  struct Session
  {
    explicit Session(tcp::socket s) : socket(std::move(s)) {}

    tcp::socket socket;
    resp::Parser parser;
    std::array<char, 4096> buf{};
    std::set<std::string> channels;
  };

  void accept()
  {
    _acceptor.async_accept(
        [this](const error_code& ec, tcp::socket socket)
        {
          if (ec)
          {
            return;
          }
          auto session = std::make_shared<Session>(std::move(socket));
          {
            std::lock_guard lock(_mutex);
            _sessions.push_back(session);
          }
          read(session);
          accept();
        });
  }

  void read(const std::shared_ptr<Session>& session)
  {
    session->socket.async_read_some(net::buffer(session->buf),
                                    [this, session](const error_code& ec, size_t n)
                                    {
                                      if (ec)
                                      {
                                        drop(session);
                                        return;
                                      }
                                      session->parser.feed(std::string_view(session->buf.data(), n));
                                      while (auto cmd = session->parser.next())
                                      {
                                        std::vector<std::string> args;
                                        for (auto& e : cmd->elements)
                                        {
                                          args.push_back(e.str);
                                        }
                                        handle(*session, args);
                                      }
                                      read(session);
                                    });
  }

  void drop(const std::shared_ptr<Session>& session)
  {
    std::lock_guard lock(_mutex);
    std::erase(_sessions, session);
  }

  void reply(Session& session, const std::string& wire)
  {
    error_code ignored;
    net::write(session.socket, net::buffer(wire), ignored);
  }

  void handle(Session& session, const std::vector<std::string>& args)
  {
    {
      std::lock_guard lock(_mutex);
      _commands.push_back(args);
    }
    if (_silent || args.empty())
    {
      return;
    }
    if (_failNext.exchange(false))
    {
      reply(session, "-ERR injected failure\r\n");
      return;
    }

    const auto& cmd = args[0];
    if (cmd == "PING")
    {
      reply(session, "+PONG\r\n");
    }
    else if (cmd == "SET" && args.size() >= 3)
    {
      _store[args[1]] = args[2];
      reply(session, "+OK\r\n");
    }
    else if (cmd == "GET" && args.size() == 2)
    {
      auto it = _store.find(args[1]);
      reply(session, it == _store.end() ? std::string("$-1\r\n") : bulk(it->second));
    }
    else if (cmd == "SUBSCRIBE" && args.size() == 2)
    {
      {
        std::lock_guard lock(_mutex);
        session.channels.insert(args[1]);
      }
      reply(session, "*3\r\n" + bulk("subscribe") + bulk(args[1]) + ":1\r\n");
    }
    else if (cmd == "UNSUBSCRIBE" && args.size() == 2)
    {
      {
        std::lock_guard lock(_mutex);
        session.channels.erase(args[1]);
      }
      reply(session, "*3\r\n" + bulk("unsubscribe") + bulk(args[1]) + ":0\r\n");
    }
    else if (cmd == "PUBLISH" && args.size() == 3)
    {
      std::vector<std::shared_ptr<Session>> targets;
      {
        std::lock_guard lock(_mutex);
        for (const auto& s : _sessions)
        {
          if (s->channels.count(args[1]))
          {
            targets.push_back(s);
          }
        }
      }
      for (const auto& t : targets)
      {
        reply(*t, "*3\r\n" + bulk("message") + bulk(args[1]) + bulk(args[2]));
      }
      reply(session, ":" + std::to_string(targets.size()) + "\r\n");
    }
    else
    {
      reply(session, "-ERR unknown command '" + cmd + "'\r\n");
    }
  }

  net::io_context _io;
  tcp::acceptor _acceptor;
  std::thread _thread;

  std::mutex _mutex;
  std::vector<std::shared_ptr<Session>> _sessions;
  std::vector<std::vector<std::string>> _commands;
  std::map<std::string, std::string> _store;  // io thread only

  std::atomic<bool> _silent{false};
  std::atomic<bool> _failNext{false};
};

uint16_t unusedPort()
{
  net::io_context io;
  tcp::acceptor acceptor(io, tcp::endpoint(net::ip::address_v4::loopback(), 0));
  return acceptor.local_endpoint().port();
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 2000ms)
{
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline)
  {
    if (pred())
    {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

}  // namespace

TEST(RedisBackendTest, ConnectFailsWhenUnreachable)
{
  RedisBackend backend({"127.0.0.1", unusedPort()}, 500ms);

  EXPECT_FALSE(backend.connect());
  EXPECT_FALSE(backend.isConnected());
  EXPECT_FALSE(backend.lastError().empty());
}

TEST(RedisBackendTest, ConnectPingsServer)
{
  FakeRedisServer server;
  RedisBackend backend({"127.0.0.1", server.port()}, 1000ms);

  ASSERT_TRUE(backend.connect());
  EXPECT_TRUE(backend.isConnected());
  EXPECT_EQ(backend.name(), "redis");

  auto cmds = server.commands();
  ASSERT_FALSE(cmds.empty());
  EXPECT_EQ(cmds.front(), std::vector<std::string>{"PING"});

  backend.disconnect();
  EXPECT_FALSE(backend.isConnected());
}

TEST(RedisBackendTest, SilentServerTimesOut)
{
  FakeRedisServer server;
  server.setSilent(true);
  RedisBackend backend({"127.0.0.1", server.port()}, 150ms);

  const auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(backend.connect());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
  EXPECT_FALSE(backend.lastError().empty());
}

TEST(RedisBackendTest, SetWithExpiryAndGet)
{
  FakeRedisServer server;
  RedisBackend backend({"127.0.0.1", server.port()}, 1000ms);
  ASSERT_TRUE(backend.connect());

  backend.set("quote:Mint", R"({"price":1})", 1000ms);
  EXPECT_EQ(backend.get("quote:Mint"), R"({"price":1})");
  EXPECT_FALSE(backend.get("quote:Other").has_value());

  std::vector<std::string> expectedSet{"SET", "quote:Mint", R"({"price":1})", "PX", "1000"};
  auto cmds = server.commands();
  EXPECT_NE(std::find(cmds.begin(), cmds.end(), expectedSet), cmds.end());
}

TEST(RedisBackendTest, ErrorReplyThrowsAndConnectionRecovers)
{
  FakeRedisServer server;
  RedisBackend backend({"127.0.0.1", server.port()}, 1000ms);
  ASSERT_TRUE(backend.connect());

  server.failNextCommand();
  EXPECT_THROW(backend.publish("candles:a:1m", "x"), std::runtime_error);

  backend.set("k", "v", 1000ms);
  EXPECT_EQ(backend.get("k"), "v");
}

TEST(RedisBackendTest, SubscribedMessagesReachHandler)
{
  FakeRedisServer server;
  RedisBackend backend({"127.0.0.1", server.port()}, 1000ms);
  ASSERT_TRUE(backend.connect());

  std::mutex m;
  std::vector<std::pair<std::string, std::string>> received;
  backend.setMessageHandler(
      [&](std::string_view channel, std::string_view payload)
      {
        std::lock_guard lock(m);
        received.emplace_back(channel, payload);
      });

  backend.subscribe("candles:Mint:1m");
  ASSERT_TRUE(eventually([&] { return server.subscriberCount("candles:Mint:1m") == 1; }));

  backend.publish("candles:Mint:1m", "first");
  backend.publish("candles:Other:1m", "ignored");
  backend.publish("candles:Mint:1m", "second");

  ASSERT_TRUE(eventually(
      [&]
      {
        std::lock_guard lock(m);
        return received.size() >= 2;
      }));
  {
    std::lock_guard lock(m);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].first, "candles:Mint:1m");
    EXPECT_EQ(received[0].second, "first");
    EXPECT_EQ(received[1].second, "second");
  }

  backend.unsubscribe("candles:Mint:1m");
  EXPECT_TRUE(eventually([&] { return server.subscriberCount("candles:Mint:1m") == 0; }));
}

TEST(RedisBackendTest, ReconnectAfterDisconnect)
{
  FakeRedisServer server;
  RedisBackend backend({"127.0.0.1", server.port()}, 1000ms);

  ASSERT_TRUE(backend.connect());
  backend.subscribe("supply:Mint");
  ASSERT_TRUE(eventually([&] { return server.subscriberCount("supply:Mint") == 1; }));

  backend.disconnect();
  EXPECT_TRUE(eventually([&] { return server.subscriberCount("supply:Mint") == 0; }));

  ASSERT_TRUE(backend.connect());
  backend.subscribe("supply:Mint");
  EXPECT_TRUE(eventually([&] { return server.subscriberCount("supply:Mint") == 1; }));
}

TEST(RedisBackendTest, SubscriberResubscribesAfterServerDropsConnection)
{
  FakeRedisServer server;
  RedisBackend backend({"127.0.0.1", server.port()}, 1000ms);
  ASSERT_TRUE(backend.connect());

  std::mutex m;
  std::vector<std::string> received;
  backend.setMessageHandler(
      [&](std::string_view, std::string_view payload)
      {
        std::lock_guard lock(m);
        received.emplace_back(payload);
      });

  backend.subscribe("candles:Mint:1m");
  backend.subscribe("supply:Mint");
  backend.subscribe("candles:Gone:1m");
  backend.unsubscribe("candles:Gone:1m");
  ASSERT_TRUE(eventually([&] { return server.subscriberCount("supply:Mint") == 1; }));

  server.kickAll();
  EXPECT_EQ(server.subscriberCount("candles:Mint:1m"), 0u);
  EXPECT_TRUE(eventually([&] { return !backend.isConnected(); }));

  ASSERT_TRUE(eventually([&] { return server.subscriberCount("candles:Mint:1m") == 1; }));
  EXPECT_TRUE(eventually([&] { return server.subscriberCount("supply:Mint") == 1; }));
  EXPECT_EQ(server.subscriberCount("candles:Gone:1m"), 0u);
  EXPECT_TRUE(eventually([&] { return backend.isConnected(); }));

  // the command connection was dropped too; the first publish may fail before it reconnects
  ASSERT_TRUE(eventually(
      [&]
      {
        try
        {
          backend.publish("candles:Mint:1m", "after-restart");
          return true;
        }
        catch (const std::runtime_error&)
        {
          return false;
        }
      }));
  EXPECT_TRUE(eventually(
      [&]
      {
        std::lock_guard lock(m);
        return std::find(received.begin(), received.end(), "after-restart") != received.end();
      }));
}
