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
#include "misc.hh"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <netinet/in.h>

std::string stripWhoisQuery(const std::string& query)
{
  std::string ret = boost::algorithm::trim_copy(query);
  boost::algorithm::trim_if(ret, boost::algorithm::is_any_of("."));
  return ret;
}

bool isIPAddress(const std::string& str)
{
  std::string addr = str.substr(0, str.find('/'));
  struct in6_addr buf6;
  struct in_addr buf4;
  if (inet_pton(AF_INET, addr.c_str(), &buf4) == 1) {
    return true;
  }
  return inet_pton(AF_INET6, addr.c_str(), &buf6) == 1;
}

std::string makeWhenString(time_t when)
{
  struct tm tm;
  localtime_r(&when, &tm);
  char buffer[80];
  if (strftime(buffer, sizeof(buffer), "%a %b %d %H:%M:%S %Z %Y", &tm) == 0) {
    return std::to_string(when);
  }
  return buffer;
}

bool pdns_stou16(const std::string& str, uint16_t& out)
{
  if (str.empty() || !std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  errno = 0;
  unsigned long val = strtoul(str.c_str(), nullptr, 10);
  if (errno != 0 || val > 65535) {
    return false;
  }
  out = static_cast<uint16_t>(val);
  return true;
}

void splitHostPort(const std::string& hostport, std::string& host, uint16_t& port)
{
  if (!hostport.empty() && hostport.at(0) == '[') {
    auto close = hostport.find(']');
    if (close == std::string::npos) {
      host = hostport;
      return;
    }
    host = hostport.substr(1, close - 1);
    if (close + 1 < hostport.size() && hostport.at(close + 1) == ':') {
      uint16_t parsed = 0;
      if (pdns_stou16(hostport.substr(close + 2), parsed)) {
        port = parsed;
      }
    }
    return;
  }

  auto colon = hostport.find(':');
  // more than one colon and no brackets: a bare IPv6 literal
  if (colon == std::string::npos || hostport.find(':', colon + 1) != std::string::npos) {
    host = hostport;
    return;
  }
  host = hostport.substr(0, colon);
  // an unparsable port leaves the caller's default in place
  uint16_t parsed = 0;
  if (pdns_stou16(hostport.substr(colon + 1), parsed)) {
    port = parsed;
  }
}
