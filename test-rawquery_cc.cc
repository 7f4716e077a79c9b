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

#include <chrono>
#include <optional>
#include <thread>

#include "rawquery.hh"
#include "test-fixtures.hh"

using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(rawquery_cc)

BOOST_AUTO_TEST_CASE(test_exchange)
{
  FixtureWhoisServer server([](const std::string& line) { return "you asked for: " + line + "\n"; });
  auto dialer = std::make_shared<RecordingDialer>();
  dialer->addRoute("whois.example.net", server.getPort());

  QueryContext ctx(2000);
  auto result = rawWhoisQuery(dialer, ctx, "whois.example.net", 43, "example.net");
  BOOST_CHECK_EQUAL(result, "you asked for: example.net\n");
  BOOST_REQUIRE_EQUAL(server.getLines().size(), 1U);
  BOOST_CHECK_EQUAL(server.getLines().at(0), "example.net");
  BOOST_REQUIRE_EQUAL(dialer->getDials().size(), 1U);
  BOOST_CHECK_EQUAL(dialer->getDials().at(0), "whois.example.net:43");
}

BOOST_AUTO_TEST_CASE(test_large_response)
{
  std::string big;
  for (unsigned int n = 0; n < 20000; ++n) {
    big += "line " + std::to_string(n) + " of a rather long whois response\n";
  }
  FixtureWhoisServer server([&big](const std::string&) { return big; });
  auto dialer = std::make_shared<RecordingDialer>();
  dialer->addRoute("whois.example.net", server.getPort());

  QueryContext ctx(5000);
  auto result = rawWhoisQuery(dialer, ctx, "whois.example.net", 43, "example.net");
  BOOST_CHECK_EQUAL(result.size(), big.size());
  BOOST_CHECK(result == big);
}

BOOST_AUTO_TEST_CASE(test_read_timeout)
{
  FixtureWhoisServer server([](const std::string&) { return std::nullopt; });
  auto dialer = std::make_shared<RecordingDialer>();
  dialer->addRoute("whois.silent.example", server.getPort());

  QueryContext ctx(200);
  auto start = std::chrono::steady_clock::now();
  try {
    rawWhoisQuery(dialer, ctx, "whois.silent.example", 43, "example.net");
    BOOST_FAIL("a silent server should time out");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::Timeout);
    BOOST_CHECK_EQUAL(e.server, "whois.silent.example");
  }
  auto took = std::chrono::steady_clock::now() - start;
  BOOST_CHECK(took >= 190ms);
  BOOST_CHECK(took < 600ms);

  // the connection is closed when we give up
  BOOST_CHECK(waitFor([&server]() { return server.getClosedByPeerCount() == 1; }));
}

BOOST_AUTO_TEST_CASE(test_cancel)
{
  FixtureWhoisServer server([](const std::string&) { return std::nullopt; });
  auto dialer = std::make_shared<RecordingDialer>();
  dialer->addRoute("whois.silent.example", server.getPort());

  QueryContext ctx(5000);
  std::thread canceler([ctx]() mutable {
    std::this_thread::sleep_for(100ms);
    ctx.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  BOOST_CHECK_THROW(rawWhoisQuery(dialer, ctx, "whois.silent.example", 43, "example.net"), CanceledException);
  canceler.join();
  BOOST_CHECK(std::chrono::steady_clock::now() - start < 1s);
}

BOOST_AUTO_TEST_CASE(test_connect_failed)
{
  auto dialer = std::make_shared<RecordingDialer>();
  QueryContext ctx(1000);
  try {
    rawWhoisQuery(dialer, ctx, "whois.unrouted.example", 43, "example.net");
    BOOST_FAIL("an unknown host can not be queried");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::ConnectFailed);
    BOOST_CHECK_EQUAL(e.server, "whois.unrouted.example");
  }
}

BOOST_AUTO_TEST_SUITE_END()
