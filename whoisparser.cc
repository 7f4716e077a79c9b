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
#include "whoisparser.hh"
#include "misc.hh"

#include <ostream>

std::string WhoisServer::toString() const
{
  if (d_host.find(':') != std::string::npos) {
    return "[" + d_host + "]:" + std::to_string(d_port);
  }
  return d_host + ":" + std::to_string(d_port);
}

std::ostream& operator<<(std::ostream& ostr, const WhoisServer& server)
{
  return ostr << server.toString();
}

std::string extractHostname(const std::string& server)
{
  auto scheme = server.find("://");
  if (scheme == std::string::npos) {
    return server;
  }

  std::string authority = server.substr(scheme + 3);
  auto end = authority.find_first_of("/?#");
  if (end != std::string::npos) {
    authority.resize(end);
  }
  // drop any userinfo
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }
  return authority;
}

WhoisServer extractReferral(const std::string& data)
{
  WhoisServer ret;

  for (const auto* token : s_referralTokens) {
    std::string marker(token);
    auto start = data.find(marker);
    if (start == std::string::npos) {
      continue;
    }
    start += marker.size();
    auto end = data.find('\n', start);
    if (end == std::string::npos) {
      end = data.size();
    }

    std::string value = boost::algorithm::trim_copy(data.substr(start, end - start));
    value = extractHostname(value);
    splitHostPort(value, ret.d_host, ret.d_port);
    boost::algorithm::trim(ret.d_host);
    return ret;
  }

  return ret;
}
