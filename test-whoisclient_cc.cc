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

#include <atomic>
#include <sstream>
#include <thread>

#include <boost/algorithm/string.hpp>

#include "test-fixtures.hh"
#include "whoisclient.hh"

static const std::string s_xyResponse = "Domain Name: NAME.XY\nRegistrar WHOIS Server: whois.registrar.example\n";
static const std::string s_registrarResponse = "Registrant Name: Someone\n";

static std::optional<std::string> rootResponder(const std::string& line)
{
  if (line == "xy") {
    return "% IANA WHOIS server\n\ndomain:       XY\nwhois:        whois.nic.xy\n\nstatus:       ACTIVE\n";
  }
  if (line == "com") {
    return "domain:       COM\nwhois:        whois.verisign-grs.com\n";
  }
  if (line == "qq") {
    return "domain:       QQ\nwhois:        whois.nic.qq:4343\n";
  }
  return "% This query returned 0 objects.\n";
}

/* Root, registry, registrar and ARIN servers, all reachable only through the recording dialer */
struct WhoisWorld
{
  WhoisWorld() :
    root(rootResponder),
    nicxy([](const std::string& line) -> std::optional<std::string> {
      if (line == "self.xy") {
        return "Domain Name: SELF.XY\nRegistrar WHOIS Server: WHOIS.NIC.XY\n";
      }
      if (line == "lost.xy") {
        return "Domain Name: LOST.XY\nRegistrar WHOIS Server: whois.unrouted.example\n";
      }
      return s_xyResponse;
    }),
    registrar([](const std::string&) { return s_registrarResponse; }),
    arin([](const std::string& line) { return "ARIN answer for " + line + "\n"; }),
    dialer(std::make_shared<RecordingDialer>()),
    directory(std::make_shared<ServerDirectory>()),
    client(directory)
  {
    dialer->addRoute("whois.iana.org", root.getPort());
    dialer->addRoute("whois.nic.xy", nicxy.getPort());
    dialer->addRoute("whois.nic.qq", nicxy.getPort());
    dialer->addRoute("whois.registrar.example", registrar.getPort());
    dialer->addRoute("rr.arin.net", arin.getPort());
    client.setDialer(dialer).setDisableStats(true).setTimeout(2000);
  }

  FixtureWhoisServer root;
  FixtureWhoisServer nicxy;
  FixtureWhoisServer registrar;
  FixtureWhoisServer arin;
  std::shared_ptr<RecordingDialer> dialer;
  std::shared_ptr<ServerDirectory> directory;
  WhoisClient client;
};

BOOST_AUTO_TEST_SUITE(whoisclient_cc)

BOOST_AUTO_TEST_CASE(test_helpers)
{
  BOOST_CHECK_EQUAL(normalizeQuery(" example.com. "), "example.com");

  BOOST_CHECK(isASN("15169"));
  BOOST_CHECK(isASN("AS15169"));
  BOOST_CHECK(isASN("as15169"));
  BOOST_CHECK(isASN("aS15169"));
  BOOST_CHECK(!isASN("AS"));
  BOOST_CHECK(!isASN("ASN15169"));
  BOOST_CHECK(!isASN("example.com"));
  BOOST_CHECK(!isASN("192.0.2.1"));

  BOOST_CHECK_EQUAL(canonicalASN("15169"), "AS15169");
  BOOST_CHECK_EQUAL(canonicalASN("as15169"), "AS15169");
  BOOST_CHECK_EQUAL(canonicalASN(canonicalASN("AS15169")), "AS15169");

  BOOST_CHECK_EQUAL(getExtension("www.Example.COM"), "com");
  BOOST_CHECK_EQUAL(getExtension("192.0.2.1"), "192.0.2.1");
  BOOST_CHECK_EQUAL(getExtension("192.0.2.0/24"), "192.0.2.0");
  BOOST_CHECK_EQUAL(getExtension("2001:DB8::1"), "2001:db8::1");
  BOOST_CHECK_EQUAL(getExtension("AS15169"), "as15169");

  BOOST_CHECK_EQUAL(formatQueryLine("192.0.2.1", false, "whois.arin.net"), "n + 192.0.2.1");
  BOOST_CHECK_EQUAL(formatQueryLine("AS15169", true, "WHOIS.ARIN.NET"), "a + AS15169");
  BOOST_CHECK_EQUAL(formatQueryLine("AS15169", true, "whois.ripe.net"), "AS15169");

  auto footer = formatStats("result", 12, 1700000000);
  BOOST_CHECK(boost::starts_with(footer, "result\n\n% Query time: 12 msec\n% WHEN: "));
  BOOST_CHECK(boost::ends_with(footer, "2023\n"));
}

BOOST_AUTO_TEST_CASE(test_bare_label)
{
  WhoisWorld world;
  auto result = world.client.whois("com");

  BOOST_CHECK_EQUAL(result, "domain:       COM\nwhois:        whois.verisign-grs.com");
  BOOST_REQUIRE_EQUAL(world.dialer->getDials().size(), 1U);
  BOOST_CHECK_EQUAL(world.dialer->getDials().at(0), "whois.iana.org:43");
  // neither learned nor referred
  BOOST_CHECK_EQUAL(world.directory->size(), 0U);
  BOOST_CHECK_EQUAL(world.root.getLines().at(0), "com");
}

BOOST_AUTO_TEST_CASE(test_discovery_is_memoized)
{
  WhoisWorld world;
  world.client.setDisableReferral(true);

  auto result = world.client.whois("name.xy");
  BOOST_CHECK_EQUAL(result, boost::trim_copy(s_xyResponse));
  BOOST_REQUIRE_EQUAL(world.dialer->getDials().size(), 2U);
  BOOST_CHECK_EQUAL(world.dialer->getDials().at(0), "whois.iana.org:43");
  BOOST_CHECK_EQUAL(world.dialer->getDials().at(1), "whois.nic.xy:43");
  BOOST_REQUIRE(world.directory->getWhoisServer("xy"));
  BOOST_CHECK_EQUAL(*world.directory->getWhoisServer("xy"), "whois.nic.xy");
  BOOST_CHECK_EQUAL(world.root.getLines().at(0), "xy");

  world.client.whois("other.XY");
  BOOST_REQUIRE_EQUAL(world.dialer->getDials().size(), 3U);
  BOOST_CHECK_EQUAL(world.dialer->getDials().at(2), "whois.nic.xy:43");
  BOOST_CHECK_EQUAL(world.root.getQueryCount(), 1U);
}

BOOST_AUTO_TEST_CASE(test_discovered_port_is_kept)
{
  WhoisWorld world;
  world.client.setDisableReferral(true);

  world.client.whois("name.qq");
  world.client.whois("other.qq");
  auto dials = world.dialer->getDials();
  BOOST_REQUIRE_EQUAL(dials.size(), 3U);
  BOOST_CHECK_EQUAL(dials.at(1), "whois.nic.qq:4343");
  BOOST_CHECK_EQUAL(dials.at(2), "whois.nic.qq:4343");
  BOOST_CHECK_EQUAL(*world.directory->getWhoisServer("qq"), "whois.nic.qq:4343");
}

BOOST_AUTO_TEST_CASE(test_normalization)
{
  WhoisWorld world;
  world.directory->setWhoisServer("xy", "whois.nic.xy");
  world.client.setDisableReferral(true);

  auto plain = world.client.whois("name.xy");
  BOOST_CHECK_EQUAL(world.client.whois("name.xy."), plain);
  BOOST_CHECK_EQUAL(world.client.whois(" name.xy "), plain);

  for (const auto& line : world.nicxy.getLines()) {
    BOOST_CHECK_EQUAL(line, "name.xy");
  }
  BOOST_CHECK_EQUAL(world.nicxy.getQueryCount(), 3U);
  BOOST_CHECK_EQUAL(world.root.getQueryCount(), 0U);
}

BOOST_AUTO_TEST_CASE(test_referral_is_followed)
{
  WhoisWorld world;
  world.directory->setWhoisServer("xy", "whois.nic.xy");

  auto result = world.client.whois("name.xy");
  BOOST_CHECK_EQUAL(result, boost::trim_copy(s_xyResponse + s_registrarResponse));
  auto dials = world.dialer->getDials();
  BOOST_REQUIRE_EQUAL(dials.size(), 2U);
  BOOST_CHECK_EQUAL(dials.at(0), "whois.nic.xy:43");
  BOOST_CHECK_EQUAL(dials.at(1), "whois.registrar.example:43");
  BOOST_CHECK_EQUAL(world.registrar.getLines().at(0), "name.xy");
}

BOOST_AUTO_TEST_CASE(test_referral_to_self_is_not_followed)
{
  WhoisWorld world;
  world.directory->setWhoisServer("xy", "whois.nic.xy");

  world.client.whois("self.xy");
  BOOST_CHECK_EQUAL(world.dialer->getDials().size(), 1U);
}

BOOST_AUTO_TEST_CASE(test_referral_failure_is_swallowed)
{
  WhoisWorld world;
  world.directory->setWhoisServer("xy", "whois.nic.xy");

  std::string result;
  BOOST_CHECK_NO_THROW(result = world.client.whois("lost.xy"));
  BOOST_CHECK_EQUAL(result, "Domain Name: LOST.XY\nRegistrar WHOIS Server: whois.unrouted.example");
  auto dials = world.dialer->getDials();
  BOOST_REQUIRE_EQUAL(dials.size(), 2U);
  BOOST_CHECK_EQUAL(dials.at(1), "whois.unrouted.example:43");
}

BOOST_AUTO_TEST_CASE(test_asn_forms)
{
  WhoisWorld world;
  std::istringstream conf("as15169 whois.arin.net\nrewrite whois.arin.net rr.arin.net\n");
  world.directory->loadFromStream(conf, "test");

  for (const auto& query : {"AS15169", "as15169", "15169"}) {
    BOOST_CHECK_EQUAL(world.client.whois(query), "ARIN answer for a + AS15169");
  }
  for (const auto& line : world.arin.getLines()) {
    BOOST_CHECK_EQUAL(line, "a + AS15169");
  }
  BOOST_CHECK_EQUAL(world.arin.getQueryCount(), 3U);
  for (const auto& dial : world.dialer->getDials()) {
    BOOST_CHECK_EQUAL(dial, "rr.arin.net:43");
  }
}

BOOST_AUTO_TEST_CASE(test_arin_rewrite_only_changes_dial_target)
{
  WhoisWorld world;
  std::istringstream conf("rewrite whois.arin.net rr.arin.net\n");
  world.directory->loadFromStream(conf, "test");

  auto result = world.client.whois("192.0.2.1", {"WHOIS.ARIN.NET"});
  BOOST_CHECK_EQUAL(result, "ARIN answer for n + 192.0.2.1");
  auto dials = world.dialer->getDials();
  BOOST_REQUIRE_EQUAL(dials.size(), 1U);
  BOOST_CHECK_EQUAL(dials.at(0), "rr.arin.net:43");
  BOOST_CHECK_EQUAL(world.root.getQueryCount(), 0U);
}

BOOST_AUTO_TEST_CASE(test_server_override)
{
  WhoisWorld world;
  world.client.setDisableReferral(true);
  world.dialer->addRoute("whois.other.example", world.nicxy.getPort());

  world.client.whois("name.xy", {"WHOIS.Other.Example"});
  auto dials = world.dialer->getDials();
  BOOST_REQUIRE_EQUAL(dials.size(), 1U);
  BOOST_CHECK_EQUAL(dials.at(0), "whois.other.example:43");
  BOOST_CHECK(!world.directory->getWhoisServer("xy"));

  // an empty override is no override
  world.client.whois("name.xy", {""});
  BOOST_CHECK_EQUAL(world.root.getQueryCount(), 1U);
}

BOOST_AUTO_TEST_CASE(test_stats_footer)
{
  WhoisWorld world;
  world.client.setDisableStats(false).setDisableReferral(true);
  world.directory->setWhoisServer("xy", "whois.nic.xy");

  auto result = world.client.whois("name.xy");
  BOOST_CHECK(boost::starts_with(result, boost::trim_copy(s_xyResponse) + "\n\n% Query time: "));
  BOOST_CHECK_NE(result.find(" msec\n% WHEN: "), std::string::npos);
  BOOST_CHECK(boost::ends_with(result, "\n"));

  // the bare label path gets a footer too
  BOOST_CHECK_NE(world.client.whois("com").find("% Query time: "), std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_empty_result_has_no_footer)
{
  FixtureWhoisServer blank([](const std::string&) { return std::string(" \r\n\n"); });
  auto dialer = std::make_shared<RecordingDialer>();
  dialer->addRoute("whois.blank.example", blank.getPort());
  WhoisClient client(std::make_shared<ServerDirectory>());
  client.setDialer(dialer).setDisableStats(false);

  BOOST_CHECK_EQUAL(client.whois("name.xy", {"whois.blank.example"}), "");
}

BOOST_AUTO_TEST_CASE(test_empty_query)
{
  WhoisWorld world;
  for (const auto& query : {"", "   ", " . ", ".."}) {
    try {
      world.client.whois(query);
      BOOST_FAIL("an empty query should not be sent");
    }
    catch (const WhoisException& e) {
      BOOST_CHECK(e.kind == WhoisException::Kind::EmptyQuery);
    }
  }
  BOOST_CHECK(world.dialer->getDials().empty());
}

BOOST_AUTO_TEST_CASE(test_server_not_found)
{
  WhoisWorld world;
  try {
    world.client.whois("name.zz");
    BOOST_FAIL("no server should be found for .zz");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::ServerNotFound);
    BOOST_CHECK_NE(e.reason.find("name.zz"), std::string::npos);
  }
  BOOST_CHECK(!world.directory->getWhoisServer("zz"));
  BOOST_CHECK_EQUAL(world.dialer->getDials().size(), 1U);
}

BOOST_AUTO_TEST_CASE(test_discovery_transport_error)
{
  WhoisWorld world;
  world.client.setRootServer("whois.unrouted.example");
  try {
    world.client.whois("name.xy");
    BOOST_FAIL("discovery through an unreachable root should fail");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::ConnectFailed);
    BOOST_CHECK_EQUAL(e.reason.find("whois: query for whois server failed: "), 0U);
  }
}

BOOST_AUTO_TEST_CASE(test_primary_transport_error)
{
  WhoisWorld world;
  world.directory->setWhoisServer("yy", "whois.unrouted.example");
  try {
    world.client.whois("name.yy");
    BOOST_FAIL("an unreachable server should fail the query");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::ConnectFailed);
    BOOST_CHECK_EQUAL(e.server, "whois.unrouted.example");
  }
}

BOOST_AUTO_TEST_CASE(test_uninitialized_directory)
{
  WhoisClient client(nullptr);
  try {
    client.whois("name.xy");
    BOOST_FAIL("a client without directory can not resolve");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::InitFailed);
  }
}

BOOST_AUTO_TEST_CASE(test_concurrent_queries)
{
  WhoisWorld world;
  world.client.setDisableReferral(true);
  std::atomic<unsigned int> good{0};
  std::atomic<unsigned int> failed{0};

  std::vector<std::thread> threads;
  for (unsigned int n = 0; n < 8; ++n) {
    threads.emplace_back([&world, &good, &failed, n]() {
      try {
        if (world.client.whois("name" + std::to_string(n) + ".xy") == boost::trim_copy(s_xyResponse)) {
          ++good;
        }
      }
      catch (const WhoisException&) {
        ++failed;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  BOOST_CHECK_EQUAL(good.load(), 8U);
  BOOST_CHECK_EQUAL(failed.load(), 0U);
  BOOST_CHECK_EQUAL(*world.directory->getWhoisServer("xy"), "whois.nic.xy");
}

BOOST_AUTO_TEST_SUITE_END()
