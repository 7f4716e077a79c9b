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
#include <memory>
#include <string>
#include <vector>

#include "dialer.hh"
#include "serverdirectory.hh"
#include "whoisparser.hh"

static const char* const s_defaultRootServer = "whois.iana.org";
static const char* const s_arinServer = "whois.arin.net";
static const unsigned int s_defaultQueryTimeoutMsec = 15000;
static const int s_defaultDialTimeoutMsec = 5000;

/** WHOIS client: finds the authoritative server for a query, asks it, and follows one referral.
 *
 * Server resolution order is: explicit override, the shared ServerDirectory, then discovery
 * through the root server. Discovered servers are memoized in the directory forever.
 *
 * Configure first, then whois() may be called from any number of threads at once. The
 * setters return the client for chaining.
 */
class WhoisClient
{
public:
  explicit WhoisClient(std::shared_ptr<ServerDirectory> directory);

  WhoisClient& setDialer(std::shared_ptr<Dialer> dialer);
  //! overall bound on each exchange with a server, the dial included
  WhoisClient& setTimeout(unsigned int timeoutMsec);
  WhoisClient& setDisableStats(bool disabled);
  WhoisClient& setDisableReferral(bool disabled);
  WhoisClient& setRootServer(const std::string& host, uint16_t port = s_defaultWhoisPort);

  /** Queries WHOIS for a domain name, IP address or ASN.
   * When servers holds a non-empty first entry, that server is asked directly.
   * Throws WhoisException. Failures of the referral query are logged, not thrown.
   */
  std::string whois(const std::string& query, const std::vector<std::string>& servers = {}) const;

private:
  std::string doWhois(const std::string& query, const std::vector<std::string>& servers) const;
  WhoisServer discoverServer(const std::string& extension) const;
  std::string rawQuery(const std::string& query, bool asn, const WhoisServer& server) const;

  std::shared_ptr<ServerDirectory> d_directory;
  std::shared_ptr<Dialer> d_dialer;
  WhoisServer d_rootServer;
  unsigned int d_timeoutMsec{s_defaultQueryTimeoutMsec};
  bool d_disableStats{false};
  bool d_disableReferral{false};
};

//! trims whitespace, then leading and trailing dots
std::string normalizeQuery(const std::string& query);
//! "15169", "AS15169" and "as15169" are ASNs
bool isASN(const std::string& query);
//! "AS" followed by the digits, query must be an ASN
std::string canonicalASN(const std::string& query);
//! the server selection key: the whole address for IP literals, the last label otherwise, lowercase and without a /prefix
std::string getExtension(const std::string& query);
//! the line actually sent to server, ARIN wants "n + " or "a + " in front
std::string formatQueryLine(const std::string& query, bool asn, const std::string& server);
//! appends the query time footer to an already trimmed, non-empty result
std::string formatStats(const std::string& result, uint64_t elapsedMsec, time_t start);
