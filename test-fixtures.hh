/*
 * This file is part of PowerDNS or dnsdist.
 * Copyright -- PowerDNS.COM B.V. and its contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * In addition, for the avoidance of any doubt, permission is granted to
 * link this program with OpenSSL and to (re)distribute the binaries
 * produced as the result of such linking.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <boost/core/noncopyable.hpp>

#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/event.h>
#include <event2/listener.h>

#include "dialer.hh"
#include "lock.hh"
#include "logger.hh"

/* A WHOIS server on 127.0.0.1, on a port picked by the kernel, running its own libevent loop
   in a thread. Every query line is passed to the responder: the returned text is sent and the
   connection closed, std::nullopt keeps the connection open without ever answering. */
class FixtureWhoisServer : public boost::noncopyable
{
public:
  using responder_t = std::function<std::optional<std::string>(const std::string& line)>;

  explicit FixtureWhoisServer(responder_t responder) :
    d_responder(std::move(responder))
  {
    d_base = event_base_new();
    if (d_base == nullptr) {
      throw std::runtime_error("Unable to create the fixture event base");
    }

    struct sockaddr_in sin;
    memset(&sin, 0, sizeof(sin));
    sin.sin_family = AF_INET;
    sin.sin_port = 0;
    sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    d_listener = evconnlistener_new_bind(d_base, onAccept, this, LEV_OPT_CLOSE_ON_FREE | LEV_OPT_REUSEABLE, -1, reinterpret_cast<struct sockaddr*>(&sin), sizeof(sin));
    if (d_listener == nullptr) {
      event_base_free(d_base);
      throw std::runtime_error("Unable to create the fixture listener");
    }

    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(evconnlistener_get_fd(d_listener), reinterpret_cast<struct sockaddr*>(&bound), &len) < 0) {
      evconnlistener_free(d_listener);
      event_base_free(d_base);
      throw std::runtime_error("Unable to find the port of the fixture listener");
    }
    d_port = ntohs(bound.sin_port);

    // loopbreak is only safe from within the loop, so the loop polls d_stop itself
    d_ticker = event_new(d_base, -1, EV_PERSIST, onTick, this);
    struct timeval tick = {0, 20000};
    event_add(d_ticker, &tick);

    d_thread = std::thread([this]() { event_base_dispatch(d_base); });
  }

  ~FixtureWhoisServer()
  {
    d_stop = true;
    d_thread.join();
    for (auto* bev : d_connections) {
      bufferevent_free(bev);
    }
    event_free(d_ticker);
    evconnlistener_free(d_listener);
    event_base_free(d_base);
  }

  [[nodiscard]] uint16_t getPort() const
  {
    return d_port;
  }

  std::vector<std::string> getLines()
  {
    return *d_lines.lock();
  }

  size_t getQueryCount()
  {
    return d_lines.lock()->size();
  }

  [[nodiscard]] unsigned int getAcceptedCount() const
  {
    return d_accepted.load();
  }

  //! connections the client closed before we did
  [[nodiscard]] unsigned int getClosedByPeerCount() const
  {
    return d_closedByPeer.load();
  }

private:
  static void onTick(evutil_socket_t /* fd */, short /* what */, void* arg)
  {
    auto* server = static_cast<FixtureWhoisServer*>(arg);
    if (server->d_stop) {
      event_base_loopbreak(server->d_base);
    }
  }

  static void onAccept(struct evconnlistener* /* listener */, evutil_socket_t fd, struct sockaddr* /* addr */, int /* socklen */, void* arg)
  {
    auto* server = static_cast<FixtureWhoisServer*>(arg);
    ++server->d_accepted;
    struct bufferevent* bev = bufferevent_socket_new(server->d_base, fd, BEV_OPT_CLOSE_ON_FREE);
    if (bev == nullptr) {
      EVUTIL_CLOSESOCKET(fd);
      return;
    }
    server->d_connections.insert(bev);
    bufferevent_setcb(bev, onRead, nullptr, onEvent, server);
    bufferevent_enable(bev, EV_READ | EV_WRITE);
  }

  static void onRead(struct bufferevent* bev, void* arg)
  {
    auto* server = static_cast<FixtureWhoisServer*>(arg);
    size_t len = 0;
    char* line = evbuffer_readln(bufferevent_get_input(bev), &len, EVBUFFER_EOL_CRLF);
    if (line == nullptr) {
      return;
    }
    std::string query(line, len);
    free(line);

    server->d_lines.lock()->push_back(query);
    auto response = server->d_responder(query);
    if (!response) {
      return;
    }
    if (response->empty()) {
      server->closeConnection(bev);
      return;
    }
    bufferevent_setcb(bev, nullptr, onWritten, onEvent, server);
    bufferevent_write(bev, response->data(), response->size());
  }

  static void onWritten(struct bufferevent* bev, void* arg)
  {
    auto* server = static_cast<FixtureWhoisServer*>(arg);
    if (evbuffer_get_length(bufferevent_get_output(bev)) == 0) {
      server->closeConnection(bev);
    }
  }

  static void onEvent(struct bufferevent* bev, short what, void* arg)
  {
    auto* server = static_cast<FixtureWhoisServer*>(arg);
    if ((what & (BEV_EVENT_EOF | BEV_EVENT_ERROR)) != 0) {
      ++server->d_closedByPeer;
      server->closeConnection(bev);
    }
  }

  void closeConnection(struct bufferevent* bev)
  {
    d_connections.erase(bev);
    bufferevent_free(bev);
  }

  responder_t d_responder;
  LockGuarded<std::vector<std::string>> d_lines;
  std::set<struct bufferevent*> d_connections;
  std::thread d_thread;
  struct event_base* d_base{nullptr};
  struct evconnlistener* d_listener{nullptr};
  struct event* d_ticker{nullptr};
  std::atomic<unsigned int> d_accepted{0};
  std::atomic<unsigned int> d_closedByPeer{0};
  std::atomic<bool> d_stop{false};
  uint16_t d_port{0};
};

/* Sends every host name to a fixture server instead of the real one, and remembers every dial
   as "host:port", with the port that was asked for. Unknown host names fail like an unreachable host. */
class RecordingDialer : public Dialer
{
public:
  void addRoute(const std::string& host, uint16_t fixturePort)
  {
    d_routes.lock()->emplace(host, fixturePort);
  }

  //! every dial sleeps this long before connecting
  void setDelay(std::chrono::milliseconds delay)
  {
    d_delayMsec = static_cast<int>(delay.count());
  }

  std::unique_ptr<Socket> dial(const std::string& host, uint16_t port) override
  {
    d_dials.lock()->push_back(host + ":" + std::to_string(port));

    uint16_t target = 0;
    {
      auto routes = d_routes.lock();
      auto route = routes->find(host);
      if (route == routes->end()) {
        throw NetworkError("No route to host " + host);
      }
      target = route->second;
    }

    if (d_delayMsec.load() > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(d_delayMsec.load()));
    }
    return d_tcp.dial("127.0.0.1", target);
  }

  [[nodiscard]] std::string getName() const override
  {
    return "recording";
  }

  std::vector<std::string> getDials()
  {
    return *d_dials.lock();
  }

private:
  LockGuarded<std::map<std::string, uint16_t>> d_routes;
  LockGuarded<std::vector<std::string>> d_dials;
  std::atomic<int> d_delayMsec{0};
  TCPDialer d_tcp{1000};
};

//! polls cond for up to two seconds
inline bool waitFor(const std::function<bool()>& cond)
{
  auto until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!cond()) {
    if (std::chrono::steady_clock::now() > until) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

/* Sends console output of g_log into a buffer readable from any thread, for the lifetime of the
   object. Syslog and timestamps are off while capturing. */
class LogCapture : public boost::noncopyable
{
public:
  explicit LogCapture(Logger::Urgency level = Logger::Debug) :
    d_stream(&d_buffer), d_previousLevel(g_log.getLoglevel())
  {
    g_log.disableSyslog(true);
    g_log.setTimestamps(false);
    g_log.setLoglevel(level);
    g_log.toConsole(level);
    g_log.setConsoleStream(&d_stream);
  }

  ~LogCapture()
  {
    g_log.setConsoleStream(&std::clog);
    g_log.toConsole(Logger::Error);
    g_log.setLoglevel(d_previousLevel);
    g_log.setTimestamps(true);
    g_log.disableSyslog(false);
  }

  std::string getText()
  {
    return *d_buffer.d_text.lock();
  }

private:
  struct Buffer : public std::streambuf
  {
    int_type overflow(int_type c) override
    {
      if (c != traits_type::eof()) {
        d_text.lock()->push_back(static_cast<char>(c));
      }
      return traits_type::not_eof(c);
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override
    {
      d_text.lock()->append(s, static_cast<size_t>(n));
      return n;
    }

    LockGuarded<std::string> d_text;
  };

  Buffer d_buffer;
  std::ostream d_stream;
  Logger::Urgency d_previousLevel;
};
