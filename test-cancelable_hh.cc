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
#include <chrono>
#include <stdexcept>
#include <thread>

#include "cancelable.hh"
#include "test-fixtures.hh"

using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(cancelable_hh)

BOOST_AUTO_TEST_CASE(test_completes_first)
{
  QueryContext ctx(1000);
  auto discarded = std::make_shared<std::atomic<bool>>(false);
  int result = runCancelable<int>(
    ctx, []() { return 42; }, [discarded](int&) { *discarded = true; }, "whois.example.net");
  BOOST_CHECK_EQUAL(result, 42);
  BOOST_CHECK(!*discarded);
}

BOOST_AUTO_TEST_CASE(test_error_is_rethrown)
{
  QueryContext ctx(1000);
  BOOST_CHECK_THROW(runCancelable<int>(
                      ctx, []() -> int { throw std::runtime_error("refused"); }, nullptr, "whois.example.net"),
                    std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_deadline_first_discards_late_result)
{
  QueryContext ctx(50);
  auto discarded = std::make_shared<std::atomic<int>>(0);

  auto start = std::chrono::steady_clock::now();
  try {
    runCancelable<int>(
      ctx, []() { std::this_thread::sleep_for(500ms); return 42; }, [discarded](int& late) { *discarded = late; }, "whois.example.net");
    BOOST_FAIL("the deadline should have fired first");
  }
  catch (const TimeoutException& te) {
    BOOST_CHECK(te.kind == WhoisException::Kind::Timeout);
    BOOST_CHECK_EQUAL(te.server, "whois.example.net");
  }
  auto took = std::chrono::steady_clock::now() - start;
  BOOST_CHECK(took < 300ms);

  BOOST_CHECK(waitFor([discarded]() { return discarded->load() == 42; }));
}

BOOST_AUTO_TEST_CASE(test_cancel_first)
{
  QueryContext ctx(5000);
  std::thread canceler([ctx]() mutable {
    std::this_thread::sleep_for(50ms);
    ctx.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  BOOST_CHECK_THROW(runCancelable<int>(
                      ctx, []() { std::this_thread::sleep_for(500ms); return 1; }, nullptr, "whois.example.net"),
                    CanceledException);
  canceler.join();
  BOOST_CHECK(std::chrono::steady_clock::now() - start < 300ms);
  BOOST_CHECK(ctx.canceled());
}

BOOST_AUTO_TEST_CASE(test_context)
{
  QueryContext ctx(100);
  BOOST_CHECK(!ctx.expired());
  BOOST_CHECK(!ctx.canceled());
  BOOST_CHECK_GT(ctx.remainingMsec(), 0);
  BOOST_CHECK_NO_THROW(ctx.check("whois.example.net"));

  QueryContext expired(0);
  BOOST_CHECK(expired.expired());
  BOOST_CHECK_EQUAL(expired.remainingMsec(), 0);
  BOOST_CHECK_THROW(expired.check("whois.example.net"), TimeoutException);

  ctx.cancel();
  BOOST_CHECK_THROW(ctx.check("whois.example.net"), CanceledException);
}

BOOST_AUTO_TEST_SUITE_END()
