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
#include "whoisclient.hh"
#include "logger.hh"
#include "misc.hh"
#include "rawquery.hh"

#include <algorithm>
#include <cctype>

std::string normalizeQuery(const std::string& query)
{
  return stripWhoisQuery(query);
}

bool isASN(const std::string& query)
{
  std::string digits = query;
  if (digits.size() >= 2 && pdns_iequals(digits.substr(0, 2), "AS")) {
    digits = digits.substr(2);
  }
  return !digits.empty() && std::all_of(digits.begin(), digits.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)) != 0; });
}

std::string canonicalASN(const std::string& query)
{
  if (query.size() >= 2 && pdns_iequals(query.substr(0, 2), "AS")) {
    return "AS" + query.substr(2);
  }
  return "AS" + query;
}

std::string getExtension(const std::string& query)
{
  std::string ext = query;
  if (!isIPAddress(query)) {
    auto dot = ext.rfind('.');
    if (dot != std::string::npos) {
      ext = ext.substr(dot + 1);
    }
  }
  auto slash = ext.find('/');
  if (slash != std::string::npos) {
    ext.resize(slash);
  }
  return toLower(ext);
}

std::string formatQueryLine(const std::string& query, bool asn, const std::string& server)
{
  if (pdns_iequals(server, s_arinServer)) {
    return (asn ? "a + " : "n + ") + query;
  }
  return query;
}

std::string formatStats(const std::string& result, uint64_t elapsedMsec, time_t start)
{
  return result + "\n\n% Query time: " + std::to_string(elapsedMsec) + " msec\n% WHEN: " + makeWhenString(start) + "\n";
}

WhoisClient::WhoisClient(std::shared_ptr<ServerDirectory> directory) :
  d_directory(std::move(directory)), d_dialer(std::make_shared<TCPDialer>(s_defaultDialTimeoutMsec))
{
  d_rootServer.d_host = s_defaultRootServer;
  d_rootServer.d_port = s_defaultWhoisPort;
}

WhoisClient& WhoisClient::setDialer(std::shared_ptr<Dialer> dialer)
{
  d_dialer = std::move(dialer);
  return *this;
}

WhoisClient& WhoisClient::setTimeout(unsigned int timeoutMsec)
{
  d_timeoutMsec = timeoutMsec;
  return *this;
}

WhoisClient& WhoisClient::setDisableStats(bool disabled)
{
  d_disableStats = disabled;
  return *this;
}

WhoisClient& WhoisClient::setDisableReferral(bool disabled)
{
  d_disableReferral = disabled;
  return *this;
}

WhoisClient& WhoisClient::setRootServer(const std::string& host, uint16_t port)
{
  d_rootServer.d_host = toLower(host);
  d_rootServer.d_port = port;
  return *this;
}

std::string WhoisClient::rawQuery(const std::string& query, bool asn, const WhoisServer& server) const
{
  std::string line = formatQueryLine(query, asn, server.d_host);

  // the rewritten name is only what we dial, server keeps its identity everywhere else
  std::string target = server.d_host;
  if (auto rewrite = d_directory->getRewriteServer(server.d_host)) {
    g_log << Logger::Debug << "Dialing " << *rewrite << " instead of whois server " << server.d_host << std::endl;
    target = *rewrite;
  }

  QueryContext ctx(d_timeoutMsec);
  return rawWhoisQuery(d_dialer, ctx, target, server.d_port, line);
}

WhoisServer WhoisClient::discoverServer(const std::string& extension) const
{
  std::string response;
  try {
    response = rawQuery(extension, false, d_rootServer);
  }
  catch (const WhoisException& we) {
    throw WhoisException(we.kind, "whois: query for whois server failed: " + we.reason, we.server);
  }

  WhoisServer server = extractReferral(response);
  if (server.empty()) {
    return server;
  }
  server.d_host = toLower(server.d_host);

  std::string entry = server.d_host;
  if (server.d_port != s_defaultWhoisPort) {
    entry = server.toString();
  }
  d_directory->setWhoisServer(extension, entry);
  g_log << Logger::Info << "Learned whois server " << server << " for '" << extension << "'" << std::endl;
  return server;
}

std::string WhoisClient::doWhois(const std::string& rawquery, const std::vector<std::string>& servers) const
{
  std::string query = normalizeQuery(rawquery);
  if (query.empty()) {
    throw WhoisException(WhoisException::Kind::EmptyQuery, "whois: domain is empty");
  }

  bool asn = isASN(query);
  if (asn) {
    query = canonicalASN(query);
  }

  if (query.find('.') == std::string::npos && query.find(':') == std::string::npos && !asn) {
    return rawQuery(query, false, d_rootServer);
  }

  WhoisServer server;
  if (!servers.empty() && !servers.front().empty()) {
    server.d_host = toLower(servers.front());
  }
  else {
    std::string extension = getExtension(query);
    if (auto known = d_directory->getWhoisServer(extension)) {
      splitHostPort(*known, server.d_host, server.d_port);
    }
    else {
      g_log << Logger::Info << "No whois server known for '" << extension << "', asking " << d_rootServer << std::endl;
      server = discoverServer(extension);
      if (server.empty()) {
        throw WhoisException(WhoisException::Kind::ServerNotFound, "whois: no whois server found for domain: " + query);
      }
    }
  }

  std::string result = rawQuery(query, asn, server);
  if (d_disableReferral) {
    return result;
  }

  WhoisServer referral = extractReferral(result);
  if (referral.empty() || pdns_iequals(referral.d_host, server.d_host)) {
    return result;
  }

  try {
    result += rawQuery(query, asn, referral);
  }
  catch (const WhoisException& we) {
    g_log << Logger::Notice << "Referral query for '" << query << "' to " << referral << " failed: " << we.reason << std::endl;
  }
  return result;
}

std::string WhoisClient::whois(const std::string& query, const std::vector<std::string>& servers) const
{
  if (!d_directory) {
    throw WhoisException(WhoisException::Kind::InitFailed, "whois: the whois server directory is not initialized");
  }

  DTime dt;
  dt.set();

  std::string result = boost::algorithm::trim_copy(doWhois(query, servers));
  if (!result.empty() && !d_disableStats) {
    result = formatStats(result, dt.udiff64(false) / 1000, dt.time());
  }
  return result;
}
