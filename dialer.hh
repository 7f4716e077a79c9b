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
#include <cstdint>
#include <memory>
#include <string>

#include "cancelable.hh"
#include "sstuff.hh"

/** Opens a connected TCP stream to host:port.
 *
 * dial() blocks and is not expected to honour any deadline but its own; use
 * cancelableDial() to bound it by a QueryContext. Failures throw NetworkError.
 */
class Dialer
{
public:
  virtual ~Dialer() = default;
  virtual std::unique_ptr<Socket> dial(const std::string& host, uint16_t port) = 0;
  [[nodiscard]] virtual std::string getName() const = 0;
};

//! Direct connections, every resolved address is tried in turn
class TCPDialer : public Dialer
{
public:
  explicit TCPDialer(int timeoutMsec = 5000) :
    d_timeoutMsec(timeoutMsec)
  {
  }

  std::unique_ptr<Socket> dial(const std::string& host, uint16_t port) override;
  [[nodiscard]] std::string getName() const override
  {
    return "tcp";
  }

private:
  int d_timeoutMsec;
};

/** Connections through a SOCKS5 proxy (RFC 1928), with optional username/password
 * authentication (RFC 1929). The target host name is resolved by the proxy.
 * The proxy itself is reached with the forward dialer.
 */
class Socks5Dialer : public Dialer
{
public:
  Socks5Dialer(std::string proxyHost, uint16_t proxyPort, std::string username, std::string password, std::shared_ptr<Dialer> forward, int timeoutMsec = 5000);

  std::unique_ptr<Socket> dial(const std::string& host, uint16_t port) override;
  [[nodiscard]] std::string getName() const override
  {
    return "socks5";
  }

private:
  void authenticate(Socket& sock);

  std::string d_proxyHost;
  std::string d_username;
  std::string d_password;
  std::shared_ptr<Dialer> d_forward;
  int d_timeoutMsec;
  uint16_t d_proxyPort;
};

/** Dials host:port with dialer, giving up when ctx expires or is canceled.
 * Throws WhoisException: ConnectFailed when the dial itself fails, Timeout or Canceled otherwise.
 * A connection that completes after the caller gave up is closed.
 */
std::unique_ptr<Socket> cancelableDial(const QueryContext& ctx, const std::shared_ptr<Dialer>& dialer, const std::string& host, uint16_t port);
