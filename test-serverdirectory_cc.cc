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
#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include <unistd.h>

#include "serverdirectory.hh"

static std::string writeTempFile(const std::string& content)
{
  char name[] = "/tmp/whoisrec-servers-XXXXXX";
  int fd = mkstemp(name);
  BOOST_REQUIRE(fd >= 0);
  close(fd);
  std::ofstream out(name);
  out << content;
  return name;
}

BOOST_AUTO_TEST_SUITE(serverdirectory_cc)

BOOST_AUTO_TEST_CASE(test_set_get)
{
  ServerDirectory directory;
  BOOST_CHECK(!directory.getWhoisServer("xy"));

  directory.setWhoisServer("xy", "whois.nic.xy");
  BOOST_REQUIRE(directory.getWhoisServer("xy"));
  BOOST_CHECK_EQUAL(*directory.getWhoisServer("xy"), "whois.nic.xy");
  BOOST_CHECK_EQUAL(*directory.getWhoisServer("XY"), "whois.nic.xy");

  // last write wins
  directory.setWhoisServer("XY", "whois2.nic.xy");
  BOOST_CHECK_EQUAL(*directory.getWhoisServer("xy"), "whois2.nic.xy");
  BOOST_CHECK_EQUAL(directory.size(), 1U);
}

BOOST_AUTO_TEST_CASE(test_load)
{
  std::istringstream input(
    "# known servers\n"
    "\n"
    "com   whois.verisign-grs.com\n"
    ".NET\tWHOIS.verisign-grs.com   # trailing comment\n"
    "rewrite whois.arin.net rr.arin.net\n");

  ServerDirectory directory;
  directory.loadFromStream(input, "test");

  BOOST_CHECK_EQUAL(directory.size(), 2U);
  BOOST_CHECK_EQUAL(directory.rewriteSize(), 1U);
  BOOST_CHECK_EQUAL(*directory.getWhoisServer("com"), "whois.verisign-grs.com");
  BOOST_CHECK_EQUAL(*directory.getWhoisServer("net"), "whois.verisign-grs.com");
  BOOST_CHECK_EQUAL(*directory.getRewriteServer("whois.arin.net"), "rr.arin.net");
  BOOST_CHECK(!directory.getRewriteServer("whois.verisign-grs.com"));
  // the rewrite table is separate from the server table
  BOOST_CHECK(!directory.getWhoisServer("rewrite"));
}

BOOST_AUTO_TEST_CASE(test_malformed_leaves_directory_untouched)
{
  ServerDirectory directory;
  directory.setWhoisServer("xy", "whois.nic.xy");

  std::istringstream input(
    "com whois.verisign-grs.com\n"
    "net\n");

  try {
    directory.loadFromStream(input, "broken.conf");
    BOOST_FAIL("a malformed line should not load");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::InitFailed);
    BOOST_CHECK_NE(e.reason.find("line 2"), std::string::npos);
    BOOST_CHECK_NE(e.reason.find("broken.conf"), std::string::npos);
  }

  BOOST_CHECK_EQUAL(directory.size(), 1U);
  BOOST_CHECK_EQUAL(*directory.getWhoisServer("xy"), "whois.nic.xy");
  BOOST_CHECK(!directory.getWhoisServer("com"));

  std::istringstream badRewrite("rewrite whois.arin.net\n");
  BOOST_CHECK_THROW(directory.loadFromStream(badRewrite, "broken.conf"), WhoisException);
  BOOST_CHECK_EQUAL(directory.rewriteSize(), 0U);
}

BOOST_AUTO_TEST_CASE(test_missing_file)
{
  ServerDirectory directory;
  try {
    directory.loadFromFile("/nonexistent/whois-servers.conf");
    BOOST_FAIL("loading a missing file should fail");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::InitFailed);
  }
}

BOOST_AUTO_TEST_CASE(test_concurrent_set_get)
{
  ServerDirectory directory;
  const unsigned int numThreads = 8;
  const unsigned int perThread = 500;
  std::atomic<unsigned int> misses{0};

  std::vector<std::thread> threads;
  for (unsigned int t = 0; t < numThreads; ++t) {
    threads.emplace_back([&directory, &misses, t]() {
      for (unsigned int n = 0; n < perThread; ++n) {
        std::string key = "ext" + std::to_string(t) + "-" + std::to_string(n);
        directory.setWhoisServer(key, "whois." + key);
        auto found = directory.getWhoisServer(key);
        if (!found || *found != "whois." + key) {
          ++misses;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  BOOST_CHECK_EQUAL(misses.load(), 0U);
  BOOST_CHECK_EQUAL(directory.size(), numThreads * perThread);
}

BOOST_AUTO_TEST_CASE(test_initializer_once)
{
  auto fname = writeTempFile("xy whois.nic.xy\n");
  DirectoryInitializer initializer;
  BOOST_CHECK(!initializer.isInitialized());

  std::vector<std::shared_ptr<ServerDirectory>> results(8);
  std::vector<std::thread> threads;
  for (size_t n = 0; n < results.size(); ++n) {
    threads.emplace_back([&initializer, &results, &fname, n]() {
      results.at(n) = initializer.get(fname);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  BOOST_CHECK(initializer.isInitialized());
  for (const auto& result : results) {
    BOOST_REQUIRE(result != nullptr);
    BOOST_CHECK(result == results.at(0));
  }
  BOOST_CHECK_EQUAL(*results.at(0)->getWhoisServer("xy"), "whois.nic.xy");

  // the file is not read again
  unlink(fname.c_str());
  BOOST_CHECK(initializer.get(fname) == results.at(0));
}

BOOST_AUTO_TEST_CASE(test_initializer_failure_reaches_every_caller)
{
  DirectoryInitializer initializer;
  std::atomic<unsigned int> failures{0};

  std::vector<std::thread> threads;
  for (unsigned int n = 0; n < 8; ++n) {
    threads.emplace_back([&initializer, &failures]() {
      try {
        initializer.get("/nonexistent/whois-servers.conf");
      }
      catch (const WhoisException& e) {
        if (e.kind == WhoisException::Kind::InitFailed) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  BOOST_CHECK_EQUAL(failures.load(), 8U);
  BOOST_CHECK(!initializer.isInitialized());

  // later callers get the same error, the load is not retried
  auto fname = writeTempFile("xy whois.nic.xy\n");
  BOOST_CHECK_THROW(initializer.get(fname), WhoisException);
  unlink(fname.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
