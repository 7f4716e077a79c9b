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
#include "rawquery.hh"
#include "logger.hh"
#include "mplexer.hh"
#include "sstuff.hh"

#include <algorithm>

namespace
{
// upper bound of a single multiplexer wait, so a cancel from another thread is noticed quickly
const int s_maxWaitMsec = 100;

struct WhoisExchange
{
  std::string d_out;
  size_t d_outPos{0};
  std::string d_in;
  FDMultiplexer* d_mplexer{nullptr};
  WhoisException::Kind d_errorKind{WhoisException::Kind::Unspecified};
  std::string d_error;
  bool d_done{false};
};

void handleReadable(int fd, FDMultiplexer::funcparam_t& param)
{
  auto* exchange = boost::any_cast<WhoisExchange*>(param);
  char buffer[4096];
  for (;;) {
    ssize_t got = ::recv(fd, buffer, sizeof(buffer), 0);
    if (got > 0) {
      exchange->d_in.append(buffer, static_cast<size_t>(got));
      continue;
    }
    if (got == 0) {
      exchange->d_mplexer->removeReadFD(fd);
      exchange->d_done = true;
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }
    exchange->d_mplexer->removeReadFD(fd);
    exchange->d_errorKind = WhoisException::Kind::ReadFailed;
    exchange->d_error = stringerror();
    exchange->d_done = true;
    return;
  }
}

void handleWritable(int fd, FDMultiplexer::funcparam_t& param)
{
  auto* exchange = boost::any_cast<WhoisExchange*>(param);
  while (exchange->d_outPos < exchange->d_out.size()) {
    ssize_t sent = ::send(fd, exchange->d_out.data() + exchange->d_outPos, exchange->d_out.size() - exchange->d_outPos, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return;
      }
      exchange->d_mplexer->removeWriteFD(fd);
      exchange->d_errorKind = WhoisException::Kind::SendFailed;
      exchange->d_error = stringerror();
      exchange->d_done = true;
      return;
    }
    exchange->d_outPos += static_cast<size_t>(sent);
  }

  exchange->d_mplexer->removeWriteFD(fd);
  exchange->d_mplexer->addReadFD(fd, handleReadable, param);
}
}

std::string rawWhoisQuery(const std::shared_ptr<Dialer>& dialer, const QueryContext& ctx, const std::string& host, uint16_t port, const std::string& line)
{
  g_log << Logger::Debug << "Sending '" << line << "' to whois server " << host << ":" << port << std::endl;

  auto sock = cancelableDial(ctx, dialer, host, port);

  WhoisExchange exchange;
  exchange.d_out = line + "\r\n";

  std::unique_ptr<FDMultiplexer> mplexer;
  try {
    sock->setNonBlocking();
    mplexer = FDMultiplexer::getMultiplexerSilent(1);
    exchange.d_mplexer = mplexer.get();
    mplexer->addWriteFD(sock->getHandle(), handleWritable, &exchange);
  }
  catch (const std::exception& e) {
    throw WhoisException(WhoisException::Kind::SendFailed, "whois: send to whois server (" + host + ") failed: " + e.what(), host);
  }

  struct timeval now;
  while (!exchange.d_done) {
    ctx.check(host);
    int wait = std::max(1, std::min(ctx.remainingMsec(), s_maxWaitMsec));
    try {
      mplexer->run(&now, wait);
    }
    catch (const FDMultiplexerException& fe) {
      auto kind = exchange.d_outPos < exchange.d_out.size() ? WhoisException::Kind::SendFailed : WhoisException::Kind::ReadFailed;
      throw WhoisException(kind, "whois: exchange with whois server (" + host + ") failed: " + fe.what(), host);
    }
  }

  if (exchange.d_errorKind == WhoisException::Kind::SendFailed) {
    throw WhoisException(exchange.d_errorKind, "whois: send to whois server (" + host + ") failed: " + exchange.d_error, host);
  }
  if (exchange.d_errorKind == WhoisException::Kind::ReadFailed) {
    throw WhoisException(exchange.d_errorKind, "whois: read from whois server (" + host + ") failed: " + exchange.d_error, host);
  }

  g_log << Logger::Debug << "Received " << exchange.d_in.size() << " bytes from whois server " << host << std::endl;
  return exchange.d_in;
}
