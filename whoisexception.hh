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
#include <string>
#include <utility>

//! Generic exception thrown by the whoisrec code base, print reason to tell the user what went wrong
class WhoisException
{
public:
  enum class Kind : uint8_t
  {
    Unspecified,
    EmptyQuery,
    ServerNotFound,
    ConnectFailed,
    SendFailed,
    ReadFailed,
    Timeout,
    Canceled,
    InitFailed
  };

  WhoisException() :
    reason("Unspecified") {}
  WhoisException(std::string r) :
    reason(std::move(r)) {}
  WhoisException(Kind k, std::string r, std::string srv = std::string()) :
    reason(std::move(r)), kind(k), server(std::move(srv)) {}
  virtual ~WhoisException() = default;

  [[nodiscard]] static const char* kindToString(Kind k)
  {
    switch (k) {
    case Kind::Unspecified:
      return "Unspecified";
    case Kind::EmptyQuery:
      return "EmptyQuery";
    case Kind::ServerNotFound:
      return "ServerNotFound";
    case Kind::ConnectFailed:
      return "ConnectFailed";
    case Kind::SendFailed:
      return "SendFailed";
    case Kind::ReadFailed:
      return "ReadFailed";
    case Kind::Timeout:
      return "Timeout";
    case Kind::Canceled:
      return "Canceled";
    case Kind::InitFailed:
      return "InitFailed";
    }
    return "Unknown";
  }

  std::string reason; //! Print this to tell the user what went wrong
  Kind kind{Kind::Unspecified};
  std::string server; //! The WHOIS server involved, if any
};

class TimeoutException : public WhoisException
{
public:
  TimeoutException() = default;
  TimeoutException(std::string r, std::string srv = std::string()) :
    WhoisException(Kind::Timeout, std::move(r), std::move(srv)) {}
};

class CanceledException : public WhoisException
{
public:
  CanceledException() = default;
  CanceledException(std::string r, std::string srv = std::string()) :
    WhoisException(Kind::Canceled, std::move(r), std::move(srv)) {}
};
