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

#include <sys/socket.h>
#include <unistd.h>

#include "mplexer.hh"
#include "sstuff.hh"

BOOST_AUTO_TEST_SUITE(mplexer_cc)

BOOST_AUTO_TEST_CASE(test_getMultiplexer)
{
  auto mplexer = FDMultiplexer::getMultiplexerSilent();
  BOOST_REQUIRE(mplexer != nullptr);
  BOOST_CHECK_EQUAL(mplexer->getName(), "libevent");
  BOOST_CHECK_EQUAL(mplexer->getWatchedFDCount(false), 0U);
  BOOST_CHECK_EQUAL(mplexer->getWatchedFDCount(true), 0U);
}

BOOST_AUTO_TEST_CASE(test_read)
{
  auto mplexer = FDMultiplexer::getMultiplexerSilent();
  int pipes[2];
  BOOST_REQUIRE_EQUAL(socketpair(AF_UNIX, SOCK_STREAM, 0, pipes), 0);
  Socket reader(pipes[0]);
  Socket writer(pipes[1]);

  struct timeval now;
  bool called = false;
  mplexer->addReadFD(reader.getHandle(), [&called](int, FDMultiplexer::funcparam_t& param) {
    called = boost::any_cast<int>(param) == 42;
  },
                     42);
  BOOST_CHECK(mplexer->isWatched(reader.getHandle()));
  BOOST_CHECK_EQUAL(mplexer->getWatchedFDCount(false), 1U);

  // nothing to read yet
  BOOST_CHECK_EQUAL(mplexer->run(&now, 10), 0);
  BOOST_CHECK(!called);

  BOOST_REQUIRE_EQUAL(write(writer.getHandle(), "x", 1), 1);
  BOOST_CHECK_EQUAL(mplexer->run(&now, 1000), 1);
  BOOST_CHECK(called);

  mplexer->removeReadFD(reader.getHandle());
  BOOST_CHECK(!mplexer->isWatched(reader.getHandle()));
  BOOST_CHECK_EQUAL(mplexer->run(&now, 10), 0);
}

BOOST_AUTO_TEST_CASE(test_write_and_self_removal)
{
  auto mplexer = FDMultiplexer::getMultiplexerSilent();
  int pipes[2];
  BOOST_REQUIRE_EQUAL(socketpair(AF_UNIX, SOCK_STREAM, 0, pipes), 0);
  Socket one(pipes[0]);
  Socket two(pipes[1]);

  struct timeval now;
  unsigned int calls = 0;
  FDMultiplexer* mplex = mplexer.get();
  mplexer->addWriteFD(one.getHandle(), [&calls, mplex](int fd, FDMultiplexer::funcparam_t&) {
    ++calls;
    mplex->removeWriteFD(fd);
  });

  BOOST_CHECK_EQUAL(mplexer->run(&now, 1000), 1);
  BOOST_CHECK_EQUAL(calls, 1U);
  BOOST_CHECK_EQUAL(mplexer->getWatchedFDCount(true), 0U);
  BOOST_CHECK_EQUAL(mplexer->run(&now, 10), 0);
  BOOST_CHECK_EQUAL(calls, 1U);
}

BOOST_AUTO_TEST_CASE(test_accounting_errors)
{
  auto mplexer = FDMultiplexer::getMultiplexerSilent();
  int pipes[2];
  BOOST_REQUIRE_EQUAL(socketpair(AF_UNIX, SOCK_STREAM, 0, pipes), 0);
  Socket one(pipes[0]);
  Socket two(pipes[1]);

  auto noop = [](int, FDMultiplexer::funcparam_t&) {};
  mplexer->addReadFD(one.getHandle(), noop);
  BOOST_CHECK_THROW(mplexer->addReadFD(one.getHandle(), noop), FDMultiplexerException);
  BOOST_CHECK_EQUAL(mplexer->getWatchedFDCount(false), 1U);

  // reading and writing are registered independently
  mplexer->addWriteFD(one.getHandle(), noop);
  BOOST_CHECK_EQUAL(mplexer->getWatchedFDCount(true), 1U);

  BOOST_CHECK_THROW(mplexer->removeReadFD(two.getHandle()), FDMultiplexerException);
  mplexer->removeReadFD(one.getHandle());
  mplexer->removeWriteFD(one.getHandle());
  BOOST_CHECK_THROW(mplexer->removeWriteFD(one.getHandle()), FDMultiplexerException);
}

BOOST_AUTO_TEST_SUITE_END()
