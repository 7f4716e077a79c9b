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
#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

static const uint16_t s_defaultWhoisPort = 43;

//! A WHOIS server as found in a response: host name plus port. An empty host means "none found"
struct WhoisServer
{
  std::string d_host;
  uint16_t d_port{s_defaultWhoisPort};

  [[nodiscard]] bool empty() const
  {
    return d_host.empty();
  }
  [[nodiscard]] std::string toString() const;

  bool operator==(const WhoisServer& rhs) const
  {
    return d_host == rhs.d_host && d_port == rhs.d_port;
  }
};

std::ostream& operator<<(std::ostream& ostr, const WhoisServer& server);

/* Marker tokens, in order of preference. The first one present in a response wins,
   regardless of where in the response it appears. */
static const std::array<const char*, 4> s_referralTokens = {
  "Registrar WHOIS Server: ",
  "whois: ",
  "ReferralServer: ",
  "refer: ",
};

/** Looks for a referral in a raw WHOIS response.
    Returns an empty WhoisServer when no marker token is present, which is not an error.
*/
WhoisServer extractReferral(const std::string& data);

//! "whois://whois.example.net:4321/path" -> "whois.example.net:4321". Non-URLs are returned as is
std::string extractHostname(const std::string& server);
