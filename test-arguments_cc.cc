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
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#define BOOST_TEST_NO_MAIN

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <fstream>
#include <unistd.h>

#include "arguments.hh"

static void declare(ArgvMap& args)
{
  args.set("timeout", "Overall timeout") = "15000";
  args.set("server", "Explicit server") = "";
  args.set("config-dir", "Configuration directory") = "/etc/whoisrec";
  args.setSwitch("disable-stats", "No footer") = "no";
  args.setDefaults();
}

BOOST_AUTO_TEST_SUITE(arguments_cc)

BOOST_AUTO_TEST_CASE(test_parse)
{
  ArgvMap args;
  declare(args);

  const char* argv[] = {"whoisrec", "--timeout=2500", "--disable-stats", "example.com", "--server= whois.nic.xy", "AS15169", nullptr};
  int argc = 6;
  args.parse(argc, const_cast<char**>(argv));

  BOOST_CHECK_EQUAL(args.asNum("timeout"), 2500);
  BOOST_CHECK(args.mustDo("disable-stats"));
  BOOST_CHECK_EQUAL(args["server"], "whois.nic.xy");
  BOOST_CHECK(!args.isEmpty("server"));
  BOOST_REQUIRE_EQUAL(args.getCommands().size(), 2U);
  BOOST_CHECK_EQUAL(args.getCommands().at(0), "example.com");
  BOOST_CHECK_EQUAL(args.getCommands().at(1), "AS15169");
}

BOOST_AUTO_TEST_CASE(test_unknown)
{
  ArgvMap args;
  declare(args);

  const char* argv[] = {"whoisrec", "--no-such-setting=1", nullptr};
  int argc = 2;
  BOOST_CHECK_THROW(args.parse(argc, const_cast<char**>(argv)), ArgException);
  BOOST_CHECK_NO_THROW(args.laxParse(argc, const_cast<char**>(argv)));
  BOOST_CHECK_THROW(args["no-such-setting"], ArgException);
}

BOOST_AUTO_TEST_CASE(test_asNum)
{
  ArgvMap args;
  declare(args);
  args.set("timeout") = "";
  BOOST_CHECK_EQUAL(args.asNum("timeout", 7), 7);
  args.set("timeout") = "0x10";
  BOOST_CHECK_EQUAL(args.asNum("timeout"), 16);
  args.set("timeout") = "12ms";
  BOOST_CHECK_THROW(args.asNum("timeout"), ArgException);
  args.set("timeout") = "soon";
  BOOST_CHECK_THROW(args.asNum("timeout"), ArgException);
}

BOOST_AUTO_TEST_CASE(test_preParse)
{
  ArgvMap args;
  declare(args);

  const char* argv[] = {"whoisrec", "--timeout=1", "--config-dir=/tmp/whoisrec", "example.com", nullptr};
  int argc = 4;
  args.preParse(argc, const_cast<char**>(argv), "config-dir");
  BOOST_CHECK_EQUAL(args["config-dir"], "/tmp/whoisrec");
  BOOST_CHECK_EQUAL(args["timeout"], "15000");
  BOOST_CHECK(args.getCommands().empty());
}

BOOST_AUTO_TEST_CASE(test_file)
{
  char name[] = "/tmp/whoisrec-conf-XXXXXX";
  int fd = mkstemp(name);
  BOOST_REQUIRE(fd >= 0);
  close(fd);
  {
    std::ofstream conf(name);
    conf << "# whoisrec configuration\n"
         << "timeout=3000\n"
         << "  server = whois.example.net   # trailing comment\n"
         << "disable-stats=yes\n";
  }

  ArgvMap args;
  declare(args);
  BOOST_CHECK(args.file(name));
  unlink(name);

  BOOST_CHECK_EQUAL(args.asNum("timeout"), 3000);
  BOOST_CHECK_EQUAL(args["server"], "whois.example.net");
  BOOST_CHECK(args.mustDo("disable-stats"));
  BOOST_CHECK(!args.file("/nonexistent/whoisrec.conf"));
}

BOOST_AUTO_TEST_CASE(test_file_high_bytes)
{
  char name[] = "/tmp/whoisrec-conf-XXXXXX";
  int fd = mkstemp(name);
  BOOST_REQUIRE(fd >= 0);
  close(fd);
  {
    std::ofstream conf(name);
    // a '#' right after a non-ASCII byte does not start a comment, one after a space does
    conf << "config-dir=/etc/caf\xc3\xa9#1\n"
         << "server=whois.caf\xc3\xa9.example \xe2\x80\x94 # comment\n";
  }

  ArgvMap args;
  declare(args);
  BOOST_CHECK(args.file(name));
  unlink(name);

  BOOST_CHECK_EQUAL(args["config-dir"], "/etc/caf\xc3\xa9#1");
  BOOST_CHECK_EQUAL(args["server"], "whois.caf\xc3\xa9.example \xe2\x80\x94");
}

BOOST_AUTO_TEST_CASE(test_bad_file_names_line)
{
  char name[] = "/tmp/whoisrec-conf-XXXXXX";
  int fd = mkstemp(name);
  BOOST_REQUIRE(fd >= 0);
  close(fd);
  {
    std::ofstream conf(name);
    conf << "timeout=3000\n"
         << "no-such-setting=yes\n";
  }

  ArgvMap args;
  declare(args);
  try {
    args.file(name);
    BOOST_FAIL("an unknown setting in a file should not load");
  }
  catch (const ArgException& ae) {
    BOOST_CHECK_NE(ae.reason.find(":2: "), std::string::npos);
  }
  unlink(name);
}

BOOST_AUTO_TEST_CASE(test_configstring)
{
  ArgvMap args;
  declare(args);
  args.set("timeout") = "2000";

  auto diff = args.configstring(true, false);
  BOOST_CHECK_NE(diff.find("timeout=2000"), std::string::npos);
  BOOST_CHECK_EQUAL(diff.find("config-dir="), std::string::npos);

  auto full = args.configstring(false, true);
  BOOST_CHECK_NE(full.find("# timeout=15000"), std::string::npos);
  BOOST_CHECK_NE(full.find("# disable-stats=no"), std::string::npos);

  auto help = args.helpstring();
  BOOST_CHECK_NE(help.find("--timeout=..."), std::string::npos);
  BOOST_CHECK_NE(help.find("--disable-stats | --disable-stats=yes"), std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
