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
#include <cstdlib>
#include <iostream>

#include "arguments.hh"
#include "dialer.hh"
#include "logger.hh"
#include "misc.hh"
#include "serverdirectory.hh"
#include "whoisclient.hh"

#ifndef SYSCONFDIR
#define SYSCONFDIR "/etc/whoisrec"
#endif

static const uint16_t s_defaultSocks5Port = 1080;

static void declareArguments()
{
  ::arg().set("config-dir", "Location of configuration directory (whoisrec.conf)") = SYSCONFDIR;
  ::arg().set("config-name", "Name of this configuration, reads whoisrec-NAME.conf") = "";
  ::arg().set("whois-servers-file", "File with the known WHOIS servers per extension, and server rewrites") = SYSCONFDIR "/whois-servers.conf";
  ::arg().set("server", "Ask this WHOIS server directly, instead of looking it up") = "";
  ::arg().set("root-server", "WHOIS server that is asked for the server of an unknown extension, host or host:port") = s_defaultRootServer;
  ::arg().set("timeout", "Overall timeout of a single exchange with a WHOIS server, in msec") = std::to_string(s_defaultQueryTimeoutMsec);
  ::arg().set("dial-timeout", "Timeout of a TCP connect, in msec") = std::to_string(s_defaultDialTimeoutMsec);
  ::arg().set("proxy", "Connect through this SOCKS5 proxy, host:port") = "";
  ::arg().set("proxy-username", "Username for the SOCKS5 proxy") = "";
  ::arg().set("proxy-password", "Password for the SOCKS5 proxy") = "";
  ::arg().setSwitch("disable-stats", "Do not append the query time footer to results") = "no";
  ::arg().setSwitch("disable-referral", "Do not follow the referral to a registrar WHOIS server") = "no";
  ::arg().set("loglevel", "Amount of logging. Higher is more. Do not set below 3") = "4";
  ::arg().set("help", "Provide a helpful message") = "no";
  ::arg().set("config", "Output blank configuration. You can use --config=check to test the config file and command line arguments.") = "no";

  ::arg().setDefaults();
}

static std::shared_ptr<Dialer> makeDialer()
{
  int dialTimeout = ::arg().asNum("dial-timeout", s_defaultDialTimeoutMsec);
  std::shared_ptr<Dialer> dialer = std::make_shared<TCPDialer>(dialTimeout);
  if (::arg().isEmpty("proxy")) {
    return dialer;
  }

  std::string host;
  uint16_t port = s_defaultSocks5Port;
  splitHostPort(::arg()["proxy"], host, port);
  g_log << Logger::Info << "Using SOCKS5 proxy " << host << ":" << port << std::endl;
  return std::make_shared<Socks5Dialer>(host, port, ::arg()["proxy-username"], ::arg()["proxy-password"], dialer, dialTimeout);
}

static void usage()
{
  std::cerr << "syntax: whoisrec [--setting=value ...] query [query ...]" << std::endl
            << std::endl
            << ::arg().helpstring() << std::endl;
}

int main(int argc, char** argv)
{
  g_log.setName("whoisrec");
  g_log.disableSyslog(true);
  g_log.setTimestamps(false);

  int ret = EXIT_SUCCESS;

  try {
    declareArguments();
    ::arg().laxParse(argc, argv); // do a lax parse

    if (::arg()["help"] != "no") {
      std::cout << "syntax: whoisrec [--setting=value ...] query [query ...]" << std::endl
                << std::endl;
      std::cout << ::arg().helpstring(::arg()["help"] == "yes" ? "" : ::arg()["help"]) << std::endl;
      return EXIT_SUCCESS;
    }

    ::arg().preParse(argc, argv, "config-dir");
    ::arg().preParse(argc, argv, "config-name");
    std::string configname = ::arg()["config-dir"] + "/whoisrec.conf";
    if (!::arg().isEmpty("config-name")) {
      configname = ::arg()["config-dir"] + "/whoisrec-" + ::arg()["config-name"] + ".conf";
    }
    if (!::arg().file(configname)) {
      g_log << Logger::Debug << "Unable to open configuration file '" << configname << "', using defaults" << std::endl;
    }

    ::arg().parse(argc, argv);

    if (::arg()["config"] != "no") {
      const auto& config = ::arg()["config"];
      if (config == "default" || config == "yes") {
        std::cout << ::arg().configstring(false, true);
      }
      else if (config == "diff") {
        std::cout << ::arg().configstring(true, false);
      }
      else if (config != "check") {
        std::cout << ::arg().configstring(true, true);
      }
      return EXIT_SUCCESS;
    }

    auto loglevel = static_cast<Logger::Urgency>(::arg().asNum("loglevel"));
    g_log.setLoglevel(loglevel);
    g_log.toConsole(loglevel);

    const auto& queries = ::arg().getCommands();
    if (queries.empty()) {
      usage();
      return EXIT_FAILURE;
    }

    std::shared_ptr<ServerDirectory> directory;
    if (::arg().isEmpty("whois-servers-file")) {
      directory = std::make_shared<ServerDirectory>();
    }
    else {
      directory = initWhois(::arg()["whois-servers-file"]);
    }

    std::string rootHost;
    uint16_t rootPort = s_defaultWhoisPort;
    splitHostPort(::arg()["root-server"], rootHost, rootPort);

    WhoisClient client(directory);
    client.setDialer(makeDialer())
      .setTimeout(static_cast<unsigned int>(::arg().asNum("timeout", static_cast<int>(s_defaultQueryTimeoutMsec))))
      .setDisableStats(::arg().mustDo("disable-stats"))
      .setDisableReferral(::arg().mustDo("disable-referral"))
      .setRootServer(rootHost, rootPort);

    std::vector<std::string> servers;
    if (!::arg().isEmpty("server")) {
      servers.push_back(::arg()["server"]);
    }

    for (const auto& query : queries) {
      try {
        std::cout << client.whois(query, servers) << std::endl;
      }
      catch (const WhoisException& we) {
        g_log << Logger::Error << "Query for '" << query << "' failed: " << we.reason << std::endl;
        ret = EXIT_FAILURE;
      }
    }
  }
  catch (const WhoisException& we) {
    g_log << Logger::Error << "Exiting because: " << we.reason << std::endl;
    ret = EXIT_FAILURE;
  }
  catch (const std::exception& e) {
    g_log << Logger::Error << "Exiting because of STL error: " << e.what() << std::endl;
    ret = EXIT_FAILURE;
  }

  return ret;
}
