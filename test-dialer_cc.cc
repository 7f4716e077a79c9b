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
#include <thread>
#include <vector>

#include "dialer.hh"
#include "test-fixtures.hh"

using namespace std::chrono_literals;

/* Plays a SOCKS5 proxy for exactly one client: checks the handshake, records the CONNECT target,
   then answers the tunneled WHOIS query itself. */
class FakeSocks5Proxy
{
public:
  FakeSocks5Proxy(std::string username, std::string password) :
    d_username(std::move(username)), d_password(std::move(password)), d_listener(AF_INET, SOCK_STREAM, 0)
  {
    int one = 1;
    setsockopt(d_listener.getHandle(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    struct sockaddr_in sin;
    memset(&sin, 0, sizeof(sin));
    sin.sin_family = AF_INET;
    sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    BOOST_REQUIRE(bind(d_listener.getHandle(), reinterpret_cast<struct sockaddr*>(&sin), sizeof(sin)) == 0);
    BOOST_REQUIRE(listen(d_listener.getHandle(), 1) == 0);
    socklen_t len = sizeof(sin);
    BOOST_REQUIRE(getsockname(d_listener.getHandle(), reinterpret_cast<struct sockaddr*>(&sin), &len) == 0);
    d_port = ntohs(sin.sin_port);

    d_thread = std::thread([this]() {
      try {
        serve();
      }
      catch (const NetworkError& ne) {
        d_error = ne.what();
      }
    });
  }

  ~FakeSocks5Proxy()
  {
    join();
  }

  void join()
  {
    if (d_thread.joinable()) {
      d_thread.join();
    }
  }

  uint16_t d_port{0};
  std::string d_error;
  std::string d_target;
  uint16_t d_targetPort{0};
  std::string d_query;
  bool d_authenticated{false};

private:
  void serve()
  {
    int fd = accept(d_listener.getHandle(), nullptr, nullptr);
    if (fd < 0) {
      throw NetworkError("accept: " + stringerror());
    }
    Socket client(fd);

    uint8_t greeting[2];
    client.readnWithTimeout(greeting, sizeof(greeting), 2000);
    std::vector<uint8_t> methods(greeting[1]);
    client.readnWithTimeout(methods.data(), methods.size(), 2000);
    bool wantAuth = !d_username.empty();
    uint8_t choice[2] = {0x05, static_cast<uint8_t>(wantAuth ? 0x02 : 0x00)};
    client.writenWithTimeout(choice, sizeof(choice), 2000);

    if (wantAuth) {
      uint8_t header[2];
      client.readnWithTimeout(header, sizeof(header), 2000);
      std::string user(header[1], '\0');
      client.readnWithTimeout(&user.at(0), user.size(), 2000);
      uint8_t plen = 0;
      client.readnWithTimeout(&plen, 1, 2000);
      std::string pass(plen, '\0');
      client.readnWithTimeout(&pass.at(0), pass.size(), 2000);
      d_authenticated = user == d_username && pass == d_password;
      uint8_t status[2] = {0x01, static_cast<uint8_t>(d_authenticated ? 0x00 : 0x01)};
      client.writenWithTimeout(status, sizeof(status), 2000);
      if (!d_authenticated) {
        return;
      }
    }

    uint8_t request[4];
    client.readnWithTimeout(request, sizeof(request), 2000);
    if (request[3] != 0x03) {
      throw NetworkError("expected a domain name CONNECT");
    }
    uint8_t hlen = 0;
    client.readnWithTimeout(&hlen, 1, 2000);
    d_target.resize(hlen);
    client.readnWithTimeout(&d_target.at(0), d_target.size(), 2000);
    uint8_t port[2];
    client.readnWithTimeout(port, sizeof(port), 2000);
    d_targetPort = static_cast<uint16_t>((port[0] << 8) | port[1]);

    // bound address given as a domain name, which the client has to skip
    std::vector<uint8_t> reply{0x05, 0x00, 0x00, 0x03, 5, 'p', 'r', 'o', 'x', 'y', 0x04, 0x38};
    client.writenWithTimeout(reply.data(), reply.size(), 2000);

    char c = 0;
    while (d_query.size() < 2 || d_query.compare(d_query.size() - 2, 2, "\r\n") != 0) {
      client.readnWithTimeout(&c, 1, 2000);
      d_query.push_back(c);
    }
    std::string response = "tunneled response\n";
    client.writenWithTimeout(response.data(), response.size(), 2000);
  }

  std::string d_username;
  std::string d_password;
  Socket d_listener;
  std::thread d_thread;
};

BOOST_AUTO_TEST_SUITE(dialer_cc)

BOOST_AUTO_TEST_CASE(test_tcp_dialer)
{
  FixtureWhoisServer server([](const std::string&) { return std::string("hello\n"); });
  TCPDialer dialer(1000);
  auto sock = dialer.dial("127.0.0.1", server.getPort());
  BOOST_REQUIRE(sock != nullptr);
  BOOST_CHECK_GE(sock->getHandle(), 0);
  BOOST_CHECK(waitFor([&server]() { return server.getAcceptedCount() == 1; }));
}

BOOST_AUTO_TEST_CASE(test_tcp_dialer_refused)
{
  uint16_t port = 0;
  {
    FixtureWhoisServer server([](const std::string&) { return std::string(); });
    port = server.getPort();
  }
  TCPDialer dialer(1000);
  BOOST_CHECK_THROW(dialer.dial("127.0.0.1", port), NetworkError);
  BOOST_CHECK_THROW(dialer.dial("host.invalid", 43), NetworkError);
}

BOOST_AUTO_TEST_CASE(test_cancelable_dial_failure)
{
  auto dialer = std::make_shared<RecordingDialer>();
  QueryContext ctx(1000);
  try {
    cancelableDial(ctx, dialer, "whois.unrouted.example", 43);
    BOOST_FAIL("dialing an unknown host should fail");
  }
  catch (const WhoisException& e) {
    BOOST_CHECK(e.kind == WhoisException::Kind::ConnectFailed);
    BOOST_CHECK_EQUAL(e.server, "whois.unrouted.example");
    BOOST_CHECK_EQUAL(e.reason.find("whois: connect to whois server (whois.unrouted.example) failed: "), 0U);
  }
}

BOOST_AUTO_TEST_CASE(test_cancelable_dial_timeout_closes_late_connection)
{
  FixtureWhoisServer server([](const std::string&) { return std::string("late\n"); });
  auto dialer = std::make_shared<RecordingDialer>();
  dialer->addRoute("whois.slow.example", server.getPort());
  dialer->setDelay(300ms);

  QueryContext ctx(50);
  auto start = std::chrono::steady_clock::now();
  BOOST_CHECK_THROW(cancelableDial(ctx, dialer, "whois.slow.example", 43), TimeoutException);
  BOOST_CHECK(std::chrono::steady_clock::now() - start < 250ms);

  // the connection that completes afterwards is closed again, not leaked
  BOOST_CHECK(waitFor([&server]() { return server.getAcceptedCount() == 1 && server.getClosedByPeerCount() == 1; }));
}

BOOST_AUTO_TEST_CASE(test_late_connection_logged_after_caller_left)
{
  LogCapture capture;
  FixtureWhoisServer server([](const std::string&) { return std::string("late\n"); });
  {
    auto dialer = std::make_shared<RecordingDialer>();
    dialer->addRoute("whois.slow.example", server.getPort());
    dialer->setDelay(200ms);
    QueryContext ctx(30);
    BOOST_CHECK_THROW(cancelableDial(ctx, dialer, "whois.slow.example", 43), TimeoutException);
  }

  // nothing on this side references the dial anymore, the worker still reaches the logger
  BOOST_CHECK(waitFor([&capture]() {
    return capture.getText().find("Closing connection to whois.slow.example that completed after its deadline") != std::string::npos;
  }));
  BOOST_CHECK(waitFor([&server]() { return server.getClosedByPeerCount() == 1; }));
}

BOOST_AUTO_TEST_CASE(test_socks5_no_auth)
{
  FakeSocks5Proxy proxy("", "");
  {
    Socks5Dialer dialer("127.0.0.1", proxy.d_port, "", "", nullptr, 1000);
    auto sock = dialer.dial("whois.example.net", 43);
    std::string query = "example.net\r\n";
    sock->writenWithTimeout(query.data(), query.size(), 1000);
    char buffer[18];
    sock->readnWithTimeout(buffer, sizeof(buffer), 1000);
    BOOST_CHECK_EQUAL(std::string(buffer, sizeof(buffer)), "tunneled response\n");
  }
  proxy.join();

  BOOST_CHECK_EQUAL(proxy.d_error, "");
  BOOST_CHECK_EQUAL(proxy.d_target, "whois.example.net");
  BOOST_CHECK_EQUAL(proxy.d_targetPort, 43);
  BOOST_CHECK_EQUAL(proxy.d_query, "example.net\r\n");
}

BOOST_AUTO_TEST_CASE(test_socks5_auth)
{
  FakeSocks5Proxy proxy("user", "secret");
  {
    Socks5Dialer dialer("127.0.0.1", proxy.d_port, "user", "secret", std::make_shared<TCPDialer>(1000), 1000);
    auto sock = dialer.dial("whois.nic.xy", 4343);
    std::string query = "name.xy\r\n";
    sock->writenWithTimeout(query.data(), query.size(), 1000);
  }
  proxy.join();

  BOOST_CHECK(proxy.d_authenticated);
  BOOST_CHECK_EQUAL(proxy.d_target, "whois.nic.xy");
  BOOST_CHECK_EQUAL(proxy.d_targetPort, 4343);
}

BOOST_AUTO_TEST_CASE(test_socks5_bad_credentials)
{
  FakeSocks5Proxy proxy("user", "secret");
  {
    Socks5Dialer dialer("127.0.0.1", proxy.d_port, "user", "wrong", nullptr, 1000);
    BOOST_CHECK_THROW(dialer.dial("whois.nic.xy", 43), NetworkError);
  }
  proxy.join();
  BOOST_CHECK(!proxy.d_authenticated);
}

BOOST_AUTO_TEST_SUITE_END()
