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
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <boost/core/noncopyable.hpp>

class NetworkError : public std::runtime_error
{
public:
  NetworkError(const std::string& why = "Network Error") :
    std::runtime_error(why.c_str())
  {}
  NetworkError(const char* why = "Network Error") :
    std::runtime_error(why)
  {}
};

inline std::string stringerror(int err = errno)
{
  return std::string(strerror(err));
}

inline void setNonBlocking(int sock)
{
  int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
    throw NetworkError("Setting socket to non-blocking: " + stringerror());
  }
}

inline void setBlocking(int sock)
{
  int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0 || fcntl(sock, F_SETFL, flags & (~O_NONBLOCK)) < 0) {
    throw NetworkError("Setting socket to blocking: " + stringerror());
  }
}

//! Representation of a Socket and many of the Berkeley functions available
class Socket : public boost::noncopyable
{
public:
  Socket(int fd) :
    d_socket(fd)
  {
  }

  //! Construct a socket of specified address family and socket type.
  Socket(int af, int st, int pt = 0)
  {
    if ((d_socket = socket(af, st, pt)) < 0) {
      throw NetworkError(stringerror());
    }
    setCloseOnExec();
  }

  Socket(Socket&& rhs) noexcept :
    d_socket(rhs.d_socket)
  {
    rhs.d_socket = -1;
  }

  Socket& operator=(Socket&& rhs) noexcept
  {
    if (d_socket != -1) {
      close(d_socket);
    }
    d_socket = rhs.d_socket;
    rhs.d_socket = -1;
    return *this;
  }

  ~Socket()
  {
    if (d_socket != -1) {
      close(d_socket);
    }
  }

  void setCloseOnExec()
  {
    int flags = fcntl(d_socket, F_GETFD, 0);
    if (flags < 0 || fcntl(d_socket, F_SETFD, flags | FD_CLOEXEC) < 0) {
      throw NetworkError("Setting close-on-exec: " + stringerror());
    }
  }

  void setNonBlocking()
  {
    ::setNonBlocking(d_socket);
  }

  void setBlocking()
  {
    ::setBlocking(d_socket);
  }

  //! Connect the socket to a specified endpoint, giving up after timeoutMsec
  void connect(const struct sockaddr* addr, socklen_t addrlen, int timeoutMsec)
  {
    setNonBlocking();
    int ret = ::connect(d_socket, addr, addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
      throw NetworkError("connect: " + stringerror());
    }
    if (ret < 0) {
      struct pollfd pfd;
      pfd.fd = d_socket;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      do {
        ret = poll(&pfd, 1, timeoutMsec);
      } while (ret < 0 && errno == EINTR);

      if (ret == 0) {
        throw NetworkError("Timeout connecting to remote");
      }
      if (ret < 0) {
        throw NetworkError("poll: " + stringerror());
      }
      int err = 0;
      socklen_t len = sizeof(err);
      if (getsockopt(d_socket, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        throw NetworkError("getsockopt: " + stringerror());
      }
      if (err != 0) {
        throw NetworkError("connect: " + stringerror(err));
      }
    }
    setBlocking();
  }

  //! Writes len bytes from buffer, blocking until done, for the synchronous dialers
  void writenWithTimeout(const void* buffer, size_t len, int timeoutMsec)
  {
    const char* ptr = static_cast<const char*>(buffer);
    size_t pos = 0;
    while (pos < len) {
      if (!waitFor(POLLOUT, timeoutMsec)) {
        throw NetworkError("Timeout writing to remote");
      }
      ssize_t res = ::send(d_socket, ptr + pos, len - pos, MSG_NOSIGNAL);
      if (res < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
          continue;
        }
        throw NetworkError("Writing to remote: " + stringerror());
      }
      pos += static_cast<size_t>(res);
    }
  }

  //! Reads exactly len bytes, for the synchronous dialers
  void readnWithTimeout(void* buffer, size_t len, int timeoutMsec)
  {
    char* ptr = static_cast<char*>(buffer);
    size_t pos = 0;
    while (pos < len) {
      if (!waitFor(POLLIN, timeoutMsec)) {
        throw NetworkError("Timeout reading from remote");
      }
      ssize_t res = ::recv(d_socket, ptr + pos, len - pos, 0);
      if (res == 0) {
        throw NetworkError("Remote closed the connection");
      }
      if (res < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
          continue;
        }
        throw NetworkError("Reading from remote: " + stringerror());
      }
      pos += static_cast<size_t>(res);
    }
  }

  [[nodiscard]] int getHandle() const
  {
    return d_socket;
  }

private:
  bool waitFor(short events, int timeoutMsec)
  {
    struct pollfd pfd;
    pfd.fd = d_socket;
    pfd.events = events;
    pfd.revents = 0;
    int ret = 0;
    do {
      ret = poll(&pfd, 1, timeoutMsec);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
      throw NetworkError("poll: " + stringerror());
    }
    return ret > 0;
  }

  int d_socket{-1};
};
