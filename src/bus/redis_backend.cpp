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
#include "capflow/log/log.h"
#include "capflow/util/concurrency/supervised_task.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>

namespace capflow
{

namespace net = boost::asio;
using tcp = net::ip::tcp;
using boost::system::error_code;

struct RedisBackend::Impl
{
  BrokerEndpoint endpoint;
  std::chrono::milliseconds timeout;

  // Command connection, driven synchronously by callers under cmdMutex.
  std::mutex cmdMutex;
  net::io_context cmdIo{1};
  tcp::socket cmdSocket{cmdIo};
  resp::Parser cmdParser;
  std::atomic<bool> connected{false};

  mutable std::mutex errorMutex;
  std::string lastError;

  // Subscriber connection, owned by the listener thread once started.
  std::mutex subMutex;
  bool subscriberReady = false;
  net::io_context subIo{1};
  std::optional<net::executor_work_guard<net::io_context::executor_type>> subWork;
  tcp::socket subSocket{subIo};
  resp::Parser subParser;
  std::array<char, 8192> readBuf{};
  std::deque<std::string> writeQueue;
  SupervisedTask listener;

  // Listener-thread state for recovering a dropped subscriber connection.
  std::set<std::string> channels;
  net::steady_timer reconnectTimer{subIo};
  std::chrono::milliseconds reconnectDelay{kReconnectMin};
  bool linkDown = false;
  uint64_t generation = 0;  // bumped by stopSubscriber(); stale handlers bail out
  std::atomic<bool> subscriberHealthy{true};

  static constexpr std::chrono::milliseconds kReconnectMin{100};
  static constexpr std::chrono::milliseconds kReconnectMax{2000};

  std::mutex handlerMutex;
  MessageHandler handler;

  Impl(BrokerEndpoint ep, std::chrono::milliseconds t) : endpoint(std::move(ep)), timeout(t) {}

  // Runs io until the pending operation stores its result or the deadline
  // passes; on timeout the socket is closed and the aborted handler drained.
  void runUntilDone(net::io_context& io, tcp::socket& socket, error_code& result)
  {
    io.restart();
    io.run_for(timeout);
    if (result == net::error::would_block)
    {
      error_code ignored;
      socket.close(ignored);
      io.restart();
      io.run();
      throw boost::system::system_error(net::error::timed_out, "redis: operation timed out");
    }
    if (result)
    {
      throw boost::system::system_error(result);
    }
  }

  void connectSocket(net::io_context& io, tcp::socket& socket)
  {
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(endpoint.host, std::to_string(endpoint.port));

    error_code result = net::error::would_block;
    net::async_connect(socket, endpoints,
                       [&result](const error_code& ec, const tcp::endpoint&) { result = ec; });
    runUntilDone(io, socket, result);

    socket.set_option(tcp::no_delay(true));
  }

  void closeCommandSocket()
  {
    error_code ignored;
    cmdSocket.close(ignored);
    cmdParser.reset();
  }

  resp::Value command(const std::string& wire)
  {
    std::lock_guard lock(cmdMutex);

    try
    {
      if (!cmdSocket.is_open())
      {
        connectSocket(cmdIo, cmdSocket);
      }

      error_code result = net::error::would_block;
      net::async_write(cmdSocket, net::buffer(wire),
                       [&result](const error_code& ec, size_t) { result = ec; });
      runUntilDone(cmdIo, cmdSocket, result);

      std::array<char, 4096> buf{};
      while (true)
      {
        if (auto reply = cmdParser.next())
        {
          if (reply->isError())
          {
            throw std::runtime_error("redis: " + reply->str);
          }
          return std::move(*reply);
        }

        size_t bytes = 0;
        result = net::error::would_block;
        cmdSocket.async_read_some(net::buffer(buf),
                                  [&result, &bytes](const error_code& ec, size_t n)
                                  {
                                    result = ec;
                                    bytes = n;
                                  });
        runUntilDone(cmdIo, cmdSocket, result);
        cmdParser.feed(std::string_view(buf.data(), bytes));
      }
    }
    catch (const std::runtime_error&)
    {
      // reply stream is out of sync after any failure; reconnect on next use
      closeCommandSocket();
      throw;
    }
  }

  void dispatch(const resp::Value& push)
  {
    if (push.type != resp::Value::Type::Array || push.elements.size() != 3 ||
        push.elements[0].str != "message")
    {
      return;  // subscribe/unsubscribe confirmations
    }

    MessageHandler h;
    {
      std::lock_guard lock(handlerMutex);
      h = handler;
    }
    if (h)
    {
      h(push.elements[1].str, push.elements[2].str);
    }
  }

  // --- subscriber connection: everything below runs on the listener thread ---

  void startRead()
  {
    subSocket.async_read_some(
        net::buffer(readBuf),
        [this, gen = generation](const error_code& ec, size_t n)
        {
          if (gen != generation || ec == net::error::operation_aborted)
          {
            return;
          }
          if (ec)
          {
            connectionLost("subscriber connection lost: " + ec.message());
            return;
          }

          subParser.feed(std::string_view(readBuf.data(), n));
          try
          {
            while (auto push = subParser.next())
            {
              dispatch(*push);
            }
          }
          catch (const resp::ProtocolError& e)
          {
            connectionLost(e.what());
            return;
          }

          startRead();
        });
  }

  void queueWrite(std::string wire)
  {
    if (linkDown)
    {
      return;  // resubscribe() replays the channel set once reconnected
    }
    writeQueue.push_back(std::move(wire));
    if (writeQueue.size() == 1)
    {
      writeNext();
    }
  }

  void writeNext()
  {
    net::async_write(subSocket, net::buffer(writeQueue.front()),
                     [this, gen = generation](const error_code& ec, size_t)
                     {
                       if (gen != generation || ec == net::error::operation_aborted)
                       {
                         return;
                       }
                       if (ec)
                       {
                         connectionLost("subscribe write failed: " + ec.message());
                         return;
                       }
                       writeQueue.pop_front();
                       if (!writeQueue.empty())
                       {
                         writeNext();
                       }
                     });
  }

  void connectionLost(const std::string& why)
  {
    if (linkDown)
    {
      return;
    }
    CAPFLOW_LOG_ERROR("[RedisBackend] " << why << ", reconnecting");

    linkDown = true;
    subscriberHealthy.store(false, std::memory_order_release);
    error_code ignored;
    subSocket.close(ignored);
    writeQueue.clear();
    subParser.reset();
    reconnectDelay = kReconnectMin;
    scheduleReconnect();
  }

  void scheduleReconnect()
  {
    reconnectTimer.expires_after(reconnectDelay);
    reconnectTimer.async_wait(
        [this, gen = generation](const error_code& ec)
        {
          if (gen != generation || ec)
          {
            return;
          }
          reconnect();
        });
  }

  void reconnect()
  {
    error_code resolveError;
    tcp::resolver resolver(subIo);
    auto endpoints =
        resolver.resolve(endpoint.host, std::to_string(endpoint.port), resolveError);
    if (resolveError)
    {
      retryLater(resolveError);
      return;
    }

    net::async_connect(subSocket, endpoints,
                       [this, gen = generation](const error_code& ec, const tcp::endpoint&)
                       {
                         if (gen != generation || ec == net::error::operation_aborted)
                         {
                           return;
                         }
                         if (ec)
                         {
                           retryLater(ec);
                           return;
                         }
                         error_code ignored;
                         subSocket.set_option(tcp::no_delay(true), ignored);
                         resubscribe();
                       });
  }

  void retryLater(const error_code& ec)
  {
    CAPFLOW_LOG_WARN("[RedisBackend] subscriber reconnect failed: " << ec.message());
    error_code ignored;
    subSocket.close(ignored);
    reconnectDelay = std::min(reconnectDelay * 2, kReconnectMax);
    scheduleReconnect();
  }

  void resubscribe()
  {
    linkDown = false;
    subParser.reset();
    startRead();
    for (const auto& channel : channels)
    {
      queueWrite(resp::encodeCommand({"SUBSCRIBE", channel}));
    }
    subscriberHealthy.store(true, std::memory_order_release);
    CAPFLOW_LOG_INFO("[RedisBackend] subscriber reconnected, " << channels.size()
                                                               << " channel(s) restored");
  }

  // Called with subMutex held.
  void ensureSubscriber()
  {
    if (subscriberReady)
    {
      return;
    }

    connectSocket(subIo, subSocket);
    subParser.reset();
    writeQueue.clear();
    channels.clear();
    linkDown = false;
    subscriberHealthy.store(true, std::memory_order_release);

    subIo.restart();
    subWork.emplace(net::make_work_guard(subIo));
    startRead();

    listener.start(
        "redis-listener",
        [this](StopSignal&)
        {
          try
          {
            subIo.run();
          }
          catch (const std::exception& e)
          {
            CAPFLOW_LOG_ERROR("[RedisBackend] listener stopped: " << e.what());
          }
        },
        [this]
        {
          subWork.reset();
          subIo.stop();
        });

    subscriberReady = true;
  }

  void postSubscribe(const std::string& channel)
  {
    net::post(subIo,
              [this, channel]
              {
                if (channels.insert(channel).second)
                {
                  queueWrite(resp::encodeCommand({"SUBSCRIBE", channel}));
                }
              });
  }

  void postUnsubscribe(const std::string& channel)
  {
    net::post(subIo,
              [this, channel]
              {
                if (channels.erase(channel) > 0)
                {
                  queueWrite(resp::encodeCommand({"UNSUBSCRIBE", channel}));
                }
              });
  }

  void stopSubscriber()
  {
    std::lock_guard lock(subMutex);
    listener.stop();

    ++generation;
    error_code ignored;
    reconnectTimer.cancel();
    subSocket.close(ignored);
    subWork.reset();
    writeQueue.clear();
    channels.clear();
    subParser.reset();
    linkDown = false;
    subscriberHealthy.store(true, std::memory_order_release);
    subscriberReady = false;
  }

  void setLastError(std::string msg)
  {
    std::lock_guard lock(errorMutex);
    lastError = std::move(msg);
  }
};

RedisBackend::RedisBackend(BrokerEndpoint endpoint, std::chrono::milliseconds timeout)
    : _impl(std::make_unique<Impl>(std::move(endpoint), timeout))
{
}

RedisBackend::~RedisBackend() { disconnect(); }

bool RedisBackend::connect()
{
  try
  {
    auto pong = _impl->command(resp::encodeCommand({"PING"}));
    if (pong.str != "PONG")
    {
      _impl->setLastError("unexpected PING reply '" + pong.str + "'");
      return false;
    }
  }
  catch (const std::exception& e)
  {
    _impl->setLastError(e.what());
    return false;
  }

  _impl->connected.store(true, std::memory_order_release);
  CAPFLOW_LOG_INFO("[RedisBackend] connected to " << _impl->endpoint.host << ":"
                                                  << _impl->endpoint.port);
  return true;
}

void RedisBackend::disconnect()
{
  const bool wasConnected = _impl->connected.exchange(false, std::memory_order_acq_rel);

  _impl->stopSubscriber();
  {
    std::lock_guard lock(_impl->cmdMutex);
    _impl->closeCommandSocket();
  }

  if (wasConnected)
  {
    CAPFLOW_LOG_INFO("[RedisBackend] disconnected");
  }
}

bool RedisBackend::isConnected() const
{
  return _impl->connected.load(std::memory_order_acquire) &&
         _impl->subscriberHealthy.load(std::memory_order_acquire);
}

std::string RedisBackend::lastError() const
{
  std::lock_guard lock(_impl->errorMutex);
  return _impl->lastError;
}

void RedisBackend::setMessageHandler(MessageHandler handler)
{
  std::lock_guard lock(_impl->handlerMutex);
  _impl->handler = std::move(handler);
}

void RedisBackend::publish(const std::string& channel, const std::string& payload)
{
  _impl->command(resp::encodeCommand({"PUBLISH", channel, payload}));
}

void RedisBackend::subscribe(const std::string& channel)
{
  std::lock_guard lock(_impl->subMutex);
  _impl->ensureSubscriber();
  _impl->postSubscribe(channel);
}

void RedisBackend::unsubscribe(const std::string& channel)
{
  std::lock_guard lock(_impl->subMutex);
  if (!_impl->subscriberReady)
  {
    return;
  }
  _impl->postUnsubscribe(channel);
}

void RedisBackend::set(const std::string& key, const std::string& value,
                       std::chrono::milliseconds ttl)
{
  _impl->command(resp::encodeCommand({"SET", key, value, "PX", std::to_string(ttl.count())}));
}

std::optional<std::string> RedisBackend::get(const std::string& key)
{
  auto reply = _impl->command(resp::encodeCommand({"GET", key}));
  if (reply.isNull())
  {
    return std::nullopt;
  }
  return std::move(reply.str);
}

}  // namespace capflow
