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
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include "mplexer.hh"
#include "logger.hh"

#include <event2/event.h>
#include <event2/util.h>
#include <map>

class LibeventFDMultiplexer : public FDMultiplexer
{
public:
  LibeventFDMultiplexer(unsigned int maxEventsHint);
  ~LibeventFDMultiplexer() override
  {
    for (auto& entry : d_events) {
      event_del(entry.second.d_event);
      event_free(entry.second.d_event);
    }
    d_events.clear();

    if (d_eventBase != nullptr) {
      event_base_free(d_eventBase);
    }
  }

  int run(struct timeval* tv, int timeout = 500) override;

  std::string getName() const override
  {
    return "libevent";
  }

private:
  void addFD(int fd, FDMultiplexer::EventKind kind) override;
  void removeFD(int fd, FDMultiplexer::EventKind kind) override;

  static void eventCallback(evutil_socket_t fd, short what, void* arg);

  struct RegisteredEvent
  {
    struct event* d_event{nullptr};
    LibeventFDMultiplexer* d_mplex{nullptr};
    int d_fd{-1};
    bool d_read{false};
  };

  struct event_base* d_eventBase{nullptr};
  /* keyed on (fd, isRead), one libevent event per direction */
  std::map<std::pair<int, bool>, RegisteredEvent> d_events;
  unsigned int d_maxEvents;
  int d_handled{0};
};

static std::unique_ptr<FDMultiplexer> makeLibevent(unsigned int maxEventsHint)
{
  return std::make_unique<LibeventFDMultiplexer>(maxEventsHint);
}

static struct LibeventRegisterOurselves
{
  LibeventRegisterOurselves()
  {
    FDMultiplexer::getMultiplexerMap().emplace(1, &makeLibevent);
  }
} doItLibevent;

std::unique_ptr<FDMultiplexer> FDMultiplexer::getMultiplexerSilent(unsigned int maxEventsHint)
{
  auto& map = getMultiplexerMap();
  for (const auto& entry : map) {
    try {
      return entry.second(maxEventsHint);
    }
    catch (const FDMultiplexerException& fe) {
      g_log << Logger::Debug << "Multiplexer with priority " << entry.first << " unavailable: " << fe.what() << std::endl;
    }
  }
  throw FDMultiplexerException("No working FD multiplexer available");
}

LibeventFDMultiplexer::LibeventFDMultiplexer(unsigned int maxEventsHint) :
  d_maxEvents(maxEventsHint)
{
  struct event_config* cfg = event_config_new();
  if (cfg != nullptr) {
    // every multiplexer is owned by a single thread
    event_config_set_flag(cfg, EVENT_BASE_FLAG_NOLOCK);
    d_eventBase = event_base_new_with_config(cfg);
    event_config_free(cfg);
  }

  if (d_eventBase == nullptr) {
    d_eventBase = event_base_new();
  }

  if (d_eventBase == nullptr) {
    throw FDMultiplexerException("Failed to create libevent base");
  }
}

void LibeventFDMultiplexer::eventCallback(evutil_socket_t fd, short what, void* arg)
{
  auto* registered = static_cast<RegisteredEvent*>(arg);
  auto* mplex = registered->d_mplex;
  int fdInt = static_cast<int>(fd);

  if (mplex->d_handled >= static_cast<int>(mplex->d_maxEvents)) {
    return;
  }

  /* the callback may remove its own descriptor, which frees 'registered' and the
     stored callback, so we work on copies from here on */
  const bool isRead = registered->d_read;
  if (isRead && (what & EV_READ) != 0) {
    const auto& iter = mplex->d_readCallbacks.find(fdInt);
    if (iter != mplex->d_readCallbacks.end()) {
      auto callback = *iter;
      ++mplex->d_handled;
      callback.d_callback(callback.d_fd, callback.d_parameter);
    }
  }
  else if (!isRead && (what & EV_WRITE) != 0) {
    const auto& iter = mplex->d_writeCallbacks.find(fdInt);
    if (iter != mplex->d_writeCallbacks.end()) {
      auto callback = *iter;
      ++mplex->d_handled;
      callback.d_callback(callback.d_fd, callback.d_parameter);
    }
  }
}

int LibeventFDMultiplexer::run(struct timeval* now, int timeout)
{
  InRun guard(d_inrun);
  d_handled = 0;

  int ret = 0;
  if (timeout == 0) {
    ret = event_base_loop(d_eventBase, EVLOOP_NONBLOCK | EVLOOP_ONCE);
  }
  else if (timeout < 0) {
    ret = event_base_loop(d_eventBase, EVLOOP_ONCE);
  }
  else {
    struct timeval tv_timeout;
    tv_timeout.tv_sec = timeout / 1000;
    tv_timeout.tv_usec = (timeout % 1000) * 1000;
    // a one-shot timer is an active event too, so EVLOOP_ONCE returns at the latest when it fires
    struct event* timeoutEvent = evtimer_new(d_eventBase, [](evutil_socket_t, short, void*) {}, nullptr);
    if (timeoutEvent == nullptr) {
      throw FDMultiplexerException("Unable to create the libevent timeout event");
    }
    if (evtimer_add(timeoutEvent, &tv_timeout) != 0) {
      event_free(timeoutEvent);
      throw FDMultiplexerException("Unable to add the libevent timeout event");
    }
    ret = event_base_loop(d_eventBase, EVLOOP_ONCE);
    evtimer_del(timeoutEvent);
    event_free(timeoutEvent);
  }

  if (ret < 0) {
    throw FDMultiplexerException("libevent loop failed");
  }

  if (now != nullptr) {
    gettimeofday(now, nullptr);
  }
  return d_handled;
}

void LibeventFDMultiplexer::addFD(int fd, FDMultiplexer::EventKind kind)
{
  auto add = [this, fd](bool read) {
    auto key = std::make_pair(fd, read);
    if (d_events.count(key) != 0) {
      throw FDMultiplexerException("Tried to add fd " + std::to_string(fd) + " to libevent twice");
    }
    auto& registered = d_events[key];
    registered.d_mplex = this;
    registered.d_fd = fd;
    registered.d_read = read;
    short flags = static_cast<short>((read ? EV_READ : EV_WRITE) | EV_PERSIST);
    registered.d_event = event_new(d_eventBase, fd, flags, eventCallback, &registered);
    if (registered.d_event == nullptr) {
      d_events.erase(key);
      throw FDMultiplexerException("Failed to create libevent event for fd " + std::to_string(fd));
    }
    if (event_add(registered.d_event, nullptr) != 0) {
      event_free(registered.d_event);
      d_events.erase(key);
      throw FDMultiplexerException("Failed to add libevent event for fd " + std::to_string(fd));
    }
  };

  if (kind == EventKind::Read || kind == EventKind::Both) {
    add(true);
  }
  if (kind == EventKind::Write || kind == EventKind::Both) {
    add(false);
  }
}

void LibeventFDMultiplexer::removeFD(int fd, FDMultiplexer::EventKind kind)
{
  auto remove = [this, fd](bool read) {
    auto iter = d_events.find(std::make_pair(fd, read));
    if (iter == d_events.end()) {
      throw FDMultiplexerException("Tried to remove unlisted fd " + std::to_string(fd) + " from libevent");
    }
    event_del(iter->second.d_event);
    event_free(iter->second.d_event);
    d_events.erase(iter);
  };

  if (kind == EventKind::Read || kind == EventKind::Both) {
    remove(true);
  }
  if (kind == EventKind::Write || kind == EventKind::Both) {
    remove(false);
  }
}
