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

#include <unistd.h>
#include <vector>

#include "misc.hh"

BOOST_AUTO_TEST_SUITE(misc_hh)

BOOST_AUTO_TEST_CASE(test_stripWhoisQuery)
{
  BOOST_CHECK_EQUAL(stripWhoisQuery("example.com."), "example.com");
  BOOST_CHECK_EQUAL(stripWhoisQuery(" example.com "), "example.com");
  BOOST_CHECK_EQUAL(stripWhoisQuery("\t.example.com..\r\n"), "example.com");
  BOOST_CHECK_EQUAL(stripWhoisQuery(" . "), "");
  BOOST_CHECK_EQUAL(stripWhoisQuery(""), "");
}

BOOST_AUTO_TEST_CASE(test_isIPAddress)
{
  BOOST_CHECK(isIPAddress("192.0.2.1"));
  BOOST_CHECK(isIPAddress("192.0.2.0/24"));
  BOOST_CHECK(isIPAddress("2001:db8::1"));
  BOOST_CHECK(isIPAddress("2001:db8::/32"));
  BOOST_CHECK(!isIPAddress("example.com"));
  BOOST_CHECK(!isIPAddress("192.0.2"));
  BOOST_CHECK(!isIPAddress(""));
}

BOOST_AUTO_TEST_CASE(test_splitHostPort)
{
  std::string host;
  uint16_t port = 43;

  splitHostPort("whois.example.org:4321", host, port);
  BOOST_CHECK_EQUAL(host, "whois.example.org");
  BOOST_CHECK_EQUAL(port, 4321);

  port = 43;
  splitHostPort("whois.example.org", host, port);
  BOOST_CHECK_EQUAL(host, "whois.example.org");
  BOOST_CHECK_EQUAL(port, 43);

  splitHostPort("[2001:db8::1]:4343", host, port);
  BOOST_CHECK_EQUAL(host, "2001:db8::1");
  BOOST_CHECK_EQUAL(port, 4343);

  port = 43;
  splitHostPort("2001:db8::1", host, port);
  BOOST_CHECK_EQUAL(host, "2001:db8::1");
  BOOST_CHECK_EQUAL(port, 43);

  splitHostPort("whois.example.org:http", host, port);
  BOOST_CHECK_EQUAL(host, "whois.example.org");
  BOOST_CHECK_EQUAL(port, 43);

  splitHostPort("whois.example.org:70000", host, port);
  BOOST_CHECK_EQUAL(port, 43);
}

BOOST_AUTO_TEST_CASE(test_pdns_stou16)
{
  uint16_t out = 0;
  BOOST_CHECK(pdns_stou16("65535", out));
  BOOST_CHECK_EQUAL(out, 65535);
  BOOST_CHECK(!pdns_stou16("65536", out));
  BOOST_CHECK(!pdns_stou16("-1", out));
  BOOST_CHECK(!pdns_stou16("", out));
  BOOST_CHECK(!pdns_stou16("12a", out));
}

BOOST_AUTO_TEST_CASE(test_makeWhenString)
{
  // exact output depends on the local time zone, the layout does not
  std::string when = makeWhenString(1700000000);
  std::vector<std::string> parts;
  boost::algorithm::split(parts, when, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
  BOOST_REQUIRE_EQUAL(parts.size(), 6U);
  BOOST_CHECK_EQUAL(parts.at(3).size(), 8U);
  BOOST_CHECK_EQUAL(parts.at(5), "2023");
}

BOOST_AUTO_TEST_CASE(test_DTime)
{
  DTime dt;
  dt.set();
  usleep(20000);
  auto elapsed = dt.udiffNoReset();
  BOOST_CHECK_GE(elapsed, 20000);
  BOOST_CHECK_GE(dt.udiff64(), static_cast<uint64_t>(elapsed));
  BOOST_CHECK_LT(dt.udiff(), 20000);
}

BOOST_AUTO_TEST_SUITE_END()
