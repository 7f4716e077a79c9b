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
#include <ctime>
#include <string>
#include <sys/time.h>

#include <boost/algorithm/string.hpp>

/** High resolution stopwatch, used to time WHOIS queries */
class DTime
{
public:
  DTime() = default;
  DTime(const DTime& dt) = default;
  DTime& operator=(const DTime& dt) = default;
  inline time_t time() const;
  inline void set();
  inline int udiff(bool reset = true);
  inline int udiffNoReset() const;
  inline uint64_t udiff64(bool reset = true);

private:
  struct timeval d_set{0, 0};
};

inline time_t DTime::time() const
{
  return d_set.tv_sec;
}

inline void DTime::set()
{
  gettimeofday(&d_set, nullptr);
}

inline int DTime::udiff(bool reset)
{
  return static_cast<int>(udiff64(reset));
}

inline int DTime::udiffNoReset() const
{
  struct timeval now;
  gettimeofday(&now, nullptr);
  return static_cast<int>(1000000 * (now.tv_sec - d_set.tv_sec) + (now.tv_usec - d_set.tv_usec));
}

inline uint64_t DTime::udiff64(bool reset)
{
  struct timeval now;
  gettimeofday(&now, nullptr);
  int64_t ret = 1000000 * (now.tv_sec - d_set.tv_sec) + (now.tv_usec - d_set.tv_usec);
  if (reset) {
    d_set = now;
  }
  return ret < 0 ? 0 : static_cast<uint64_t>(ret);
}

inline std::string toLower(const std::string& upper)
{
  return boost::algorithm::to_lower_copy(upper);
}

inline bool pdns_iequals(const std::string& a, const std::string& b)
{
  return boost::algorithm::iequals(a, b);
}

//! strips whitespace and any leading or trailing dots
std::string stripWhoisQuery(const std::string& query);
//! true for an IPv4 or IPv6 literal, optionally with a /prefix
bool isIPAddress(const std::string& str);
//! formats a timestamp the way WHOIS footers show it: Mon Jan 02 15:04:05 MST 2006
std::string makeWhenString(time_t when);
//! splits "host:port" or "[v6]:port"; port is left alone when absent or invalid
void splitHostPort(const std::string& hostport, std::string& host, uint16_t& port);
bool pdns_stou16(const std::string& str, uint16_t& out);
