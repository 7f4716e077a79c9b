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
#include <boost/any.hpp>
#include <cstdint>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index_container.hpp>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/time.h>
#include <vector>

class FDMultiplexerException : public std::runtime_error
{
public:
  FDMultiplexerException(const std::string& str) :
    std::runtime_error(str)
  {}
};

/** Very simple FD multiplexer, which allows you to add sockets, and be informed when data is available.
    Also allows you to remove sockets again.

    Callbacks are invoked with the descriptor and the parameter passed at registration time. A callback
    may remove its own descriptor, or add others.

    Simple usage:

    mplexer->addReadFD(sock, [](int fd, FDMultiplexer::funcparam_t& param) { ... });
    mplexer->run(&now, 1000);
*/
class FDMultiplexer
{
public:
  using funcparam_t = boost::any;
  using callbackfunc_t = std::function<void(int, funcparam_t&)>;
  enum class EventKind : uint8_t
  {
    Read,
    Write,
    Both
  };

protected:
  struct Callback
  {
    callbackfunc_t d_callback;
    mutable funcparam_t d_parameter;
    int d_fd;
  };

public:
  FDMultiplexer() = default;
  FDMultiplexer(const FDMultiplexer&) = delete;
  FDMultiplexer& operator=(const FDMultiplexer&) = delete;
  virtual ~FDMultiplexer() = default;

  // The maximum number of events processed in a single run, not the maximum of watched descriptors
  static constexpr unsigned int s_maxevents = 128;
  /* Default implementation, the only one shipped here is libevent */
  static std::unique_ptr<FDMultiplexer> getMultiplexerSilent(unsigned int maxEventsHint = s_maxevents);

  /* tv will be updated to 'now' before run returns */
  /* timeout is in ms, 0 will return immediately, -1 will block until an event is ready */
  /* returns the number of callbacks invoked, 0 on timeout */
  virtual int run(struct timeval* tv, int timeout = 500) = 0;

  virtual void addReadFD(int fd, callbackfunc_t toDo, const funcparam_t& parameter = funcparam_t())
  {
    accountingAddFD(d_readCallbacks, fd, std::move(toDo), parameter);
    try {
      addFD(fd, EventKind::Read);
    }
    catch (...) {
      accountingRemoveFD(d_readCallbacks, fd);
      throw;
    }
  }

  virtual void addWriteFD(int fd, callbackfunc_t toDo, const funcparam_t& parameter = funcparam_t())
  {
    accountingAddFD(d_writeCallbacks, fd, std::move(toDo), parameter);
    try {
      addFD(fd, EventKind::Write);
    }
    catch (...) {
      accountingRemoveFD(d_writeCallbacks, fd);
      throw;
    }
  }

  virtual void removeReadFD(int fd)
  {
    removeFD(fd, EventKind::Read);
    accountingRemoveFD(d_readCallbacks, fd);
  }

  virtual void removeWriteFD(int fd)
  {
    removeFD(fd, EventKind::Write);
    accountingRemoveFD(d_writeCallbacks, fd);
  }

  [[nodiscard]] bool isWatched(int fd) const
  {
    return d_readCallbacks.count(fd) != 0 || d_writeCallbacks.count(fd) != 0;
  }

  [[nodiscard]] size_t getWatchedFDCount(bool writeFDs) const
  {
    return writeFDs ? d_writeCallbacks.size() : d_readCallbacks.size();
  }

  [[nodiscard]] virtual std::string getName() const = 0;

  using FDMultiplexermap_t = std::multimap<int, std::function<std::unique_ptr<FDMultiplexer>(unsigned int)>>;

  static FDMultiplexermap_t& getMultiplexerMap()
  {
    static FDMultiplexermap_t theMap;
    return theMap;
  }

protected:
  struct FDBasedTag
  {
  };
  using callbackmap_t = boost::multi_index::multi_index_container<
    Callback,
    boost::multi_index::indexed_by<
      boost::multi_index::hashed_unique<boost::multi_index::tag<FDBasedTag>,
                                        boost::multi_index::member<Callback, int, &Callback::d_fd>>>>;

  callbackmap_t d_readCallbacks, d_writeCallbacks;
  bool d_inrun{false};

  virtual void addFD(int fd, EventKind kind) = 0;
  virtual void removeFD(int fd, EventKind kind) = 0;

  void accountingAddFD(callbackmap_t& cbmap, int fd, callbackfunc_t toDo, const funcparam_t& parameter)
  {
    Callback cb;
    cb.d_fd = fd;
    cb.d_callback = std::move(toDo);
    cb.d_parameter = parameter;

    if (!cbmap.insert(cb).second) {
      throw FDMultiplexerException("Tried to add fd " + std::to_string(fd) + " to multiplexer twice");
    }
  }

  void accountingRemoveFD(callbackmap_t& cbmap, int fd)
  {
    if (cbmap.erase(fd) == 0) {
      throw FDMultiplexerException("Tried to remove unlisted fd " + std::to_string(fd) + " from multiplexer");
    }
  }

  class InRun
  {
  public:
    InRun(bool& inrun) :
      d_inrun(inrun)
    {
      if (d_inrun) {
        throw FDMultiplexerException("FDMultiplexer::run() is not reentrant");
      }
      d_inrun = true;
    }
    ~InRun()
    {
      d_inrun = false;
    }

  private:
    bool& d_inrun;
  };
};
