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

#include <sstream>
#include <thread>
#include <vector>

#include "logger.hh"
#include "test-fixtures.hh"

static size_t countOf(const std::string& text, const std::string& what)
{
  size_t count = 0;
  for (auto pos = text.find(what); pos != std::string::npos; pos = text.find(what, pos + what.size())) {
    ++count;
  }
  return count;
}

BOOST_AUTO_TEST_SUITE(logger_cc)

BOOST_AUTO_TEST_CASE(test_line_on_endl)
{
  LogCapture capture;
  g_log << Logger::Notice << "query for " << "example.net" << " took " << 12 << " msec";
  BOOST_CHECK_EQUAL(capture.getText(), "");
  g_log << std::endl;
  BOOST_CHECK_EQUAL(capture.getText(), "query for example.net took 12 msec\n");
}

BOOST_AUTO_TEST_CASE(test_levels)
{
  LogCapture capture(Logger::Warning);
  g_log << Logger::Debug << "raw query sent" << std::endl;
  g_log << Logger::Info << "server memoized" << std::endl;
  g_log << Logger::Error << "connect failed" << std::endl;
  BOOST_CHECK_EQUAL(capture.getText(), "connect failed\n");

  // the urgency of a dropped line does not leak into the next one
  g_log << "no urgency given" << std::endl;
  BOOST_CHECK_EQUAL(capture.getText(), "connect failed\n");
}

BOOST_AUTO_TEST_CASE(test_threads_do_not_interleave)
{
  LogCapture capture;
  std::vector<std::thread> threads;
  for (unsigned int n = 0; n < 4; ++n) {
    threads.emplace_back([n]() {
      for (unsigned int i = 0; i < 100; ++i) {
        g_log << Logger::Info << "thread " << n << " part one, ";
        std::this_thread::yield();
        g_log << "part two" << std::endl;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto text = capture.getText();
  std::istringstream lines(text);
  std::string line;
  unsigned int count = 0;
  while (std::getline(lines, line)) {
    BOOST_CHECK_EQUAL(line.substr(line.size() - 18), "part one, part two");
    ++count;
  }
  BOOST_CHECK_EQUAL(count, 400U);
  BOOST_CHECK_EQUAL(countOf(text, "thread 3 part one, part two\n"), 100U);
}

BOOST_AUTO_TEST_CASE(test_single_instance)
{
  BOOST_CHECK_EQUAL(&getLogger(), &g_log);
}

BOOST_AUTO_TEST_SUITE_END()
