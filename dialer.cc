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
#include "dialer.hh"
#include "logger.hh"

#include <arpa/inet.h>
#include <cstring>
#include <netdb.h>
#include <system_error>
#include <vector>

std::unique_ptr<Socket> TCPDialer::dial(const std::string& host, uint16_t port)
{
  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  struct addrinfo* res = nullptr;
  int ret = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
  if (ret != 0) {
    throw NetworkError("Unable to resolve '" + host + "': " + std::string(gai_strerror(ret)));
  }
  std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addresses(res, &freeaddrinfo);

  std::string lastError("no address found");
  for (const struct addrinfo* address = addresses.get(); address != nullptr; address = address->ai_next) {
    try {
      auto sock = std::make_unique<Socket>(address->ai_family, SOCK_STREAM, 0);
      sock->connect(address->ai_addr, address->ai_addrlen, d_timeoutMsec);
      return sock;
    }
    catch (const NetworkError& ne) {
      lastError = ne.what();
      g_log << Logger::Debug << "Connecting to " << host << " port " << port << " failed: " << lastError << std::endl;
    }
  }

  throw NetworkError(lastError);
}

Socks5Dialer::Socks5Dialer(std::string proxyHost, uint16_t proxyPort, std::string username, std::string password, std::shared_ptr<Dialer> forward, int timeoutMsec) :
  d_proxyHost(std::move(proxyHost)), d_username(std::move(username)), d_password(std::move(password)), d_forward(std::move(forward)), d_timeoutMsec(timeoutMsec), d_proxyPort(proxyPort)
{
  if (!d_forward) {
    d_forward = std::make_shared<TCPDialer>(d_timeoutMsec);
  }
  if (d_username.size() > 255 || d_password.size() > 255) {
    throw NetworkError("SOCKS5 username and password are limited to 255 bytes");
  }
}

static const char* socks5ReplyToString(uint8_t rep)
{
  switch (rep) {
  case 0x01:
    return "general SOCKS server failure";
  case 0x02:
    return "connection not allowed by ruleset";
  case 0x03:
    return "network unreachable";
  case 0x04:
    return "host unreachable";
  case 0x05:
    return "connection refused";
  case 0x06:
    return "TTL expired";
  case 0x07:
    return "command not supported";
  case 0x08:
    return "address type not supported";
  default:
    return "unknown error";
  }
}

void Socks5Dialer::authenticate(Socket& sock)
{
  std::vector<uint8_t> greeting{0x05};
  if (d_username.empty()) {
    greeting.push_back(1);
    greeting.push_back(0x00);
  }
  else {
    greeting.push_back(2);
    greeting.push_back(0x00);
    greeting.push_back(0x02);
  }
  sock.writenWithTimeout(greeting.data(), greeting.size(), d_timeoutMsec);

  uint8_t reply[2];
  sock.readnWithTimeout(reply, sizeof(reply), d_timeoutMsec);
  if (reply[0] != 0x05) {
    throw NetworkError("SOCKS5 proxy " + d_proxyHost + " sent an unexpected version " + std::to_string(reply[0]));
  }
  if (reply[1] == 0x00) {
    return;
  }
  if (reply[1] != 0x02 || d_username.empty()) {
    throw NetworkError("SOCKS5 proxy " + d_proxyHost + " accepts none of our authentication methods");
  }

  std::vector<uint8_t> auth{0x01, static_cast<uint8_t>(d_username.size())};
  auth.insert(auth.end(), d_username.begin(), d_username.end());
  auth.push_back(static_cast<uint8_t>(d_password.size()));
  auth.insert(auth.end(), d_password.begin(), d_password.end());
  sock.writenWithTimeout(auth.data(), auth.size(), d_timeoutMsec);

  sock.readnWithTimeout(reply, sizeof(reply), d_timeoutMsec);
  if (reply[1] != 0x00) {
    throw NetworkError("SOCKS5 proxy " + d_proxyHost + " rejected our username and password");
  }
}

std::unique_ptr<Socket> Socks5Dialer::dial(const std::string& host, uint16_t port)
{
  auto sock = d_forward->dial(d_proxyHost, d_proxyPort);
  authenticate(*sock);

  std::vector<uint8_t> request{0x05, 0x01, 0x00};
  struct in_addr addr4;
  struct in6_addr addr6;
  if (inet_pton(AF_INET, host.c_str(), &addr4) == 1) {
    request.push_back(0x01);
    const auto* bytes = reinterpret_cast<const uint8_t*>(&addr4);
    request.insert(request.end(), bytes, bytes + sizeof(addr4));
  }
  else if (inet_pton(AF_INET6, host.c_str(), &addr6) == 1) {
    request.push_back(0x04);
    const auto* bytes = reinterpret_cast<const uint8_t*>(&addr6);
    request.insert(request.end(), bytes, bytes + sizeof(addr6));
  }
  else {
    if (host.empty() || host.size() > 255) {
      throw NetworkError("Host name '" + host + "' can not be sent to a SOCKS5 proxy");
    }
    request.push_back(0x03);
    request.push_back(static_cast<uint8_t>(host.size()));
    request.insert(request.end(), host.begin(), host.end());
  }
  request.push_back(static_cast<uint8_t>(port >> 8));
  request.push_back(static_cast<uint8_t>(port & 0xff));
  sock->writenWithTimeout(request.data(), request.size(), d_timeoutMsec);

  uint8_t header[4];
  sock->readnWithTimeout(header, sizeof(header), d_timeoutMsec);
  if (header[0] != 0x05) {
    throw NetworkError("SOCKS5 proxy " + d_proxyHost + " sent an unexpected version " + std::to_string(header[0]));
  }
  if (header[1] != 0x00) {
    throw NetworkError("SOCKS5 proxy " + d_proxyHost + " could not connect to " + host + ": " + socks5ReplyToString(header[1]));
  }

  size_t boundLen = 0;
  switch (header[3]) {
  case 0x01:
    boundLen = 4;
    break;
  case 0x04:
    boundLen = 16;
    break;
  case 0x03: {
    uint8_t len = 0;
    sock->readnWithTimeout(&len, 1, d_timeoutMsec);
    boundLen = len;
    break;
  }
  default:
    throw NetworkError("SOCKS5 proxy " + d_proxyHost + " sent an unknown address type " + std::to_string(header[3]));
  }
  // bound address and port, which we have no use for
  std::vector<uint8_t> bound(boundLen + 2);
  sock->readnWithTimeout(bound.data(), bound.size(), d_timeoutMsec);

  return sock;
}

std::unique_ptr<Socket> cancelableDial(const QueryContext& ctx, const std::shared_ptr<Dialer>& dialer, const std::string& host, uint16_t port)
{
  ctx.check(host);

  std::function<std::unique_ptr<Socket>()> operation = [dialer, host, port]() {
    return dialer->dial(host, port);
  };
  std::function<void(std::unique_ptr<Socket>&)> discard = [host](std::unique_ptr<Socket>& sock) {
    g_log << Logger::Debug << "Closing connection to " << host << " that completed after its deadline" << std::endl;
    sock.reset();
  };

  try {
    return runCancelable<std::unique_ptr<Socket>>(ctx, std::move(operation), std::move(discard), host);
  }
  catch (const NetworkError& ne) {
    throw WhoisException(WhoisException::Kind::ConnectFailed, "whois: connect to whois server (" + host + ") failed: " + ne.what(), host);
  }
  catch (const std::system_error& se) {
    throw WhoisException(WhoisException::Kind::ConnectFailed, "whois: connect to whois server (" + host + ") failed: " + se.what(), host);
  }
}
