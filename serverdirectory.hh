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
#pragma once
#include <condition_variable>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/core/noncopyable.hpp>

#include "lock.hh"
#include "whoisexception.hh"

/** The learned-server directory.
 *
 * Maps a domain extension (or other server selection key, like an IP address or ASN)
 * to the WHOIS server that is authoritative for it, plus a rewrite table that maps a
 * server name to the host name that must actually be dialed.
 *
 * Shared by every client of the process and safe for concurrent use. Entries never expire.
 */
class ServerDirectory : public boost::noncopyable
{
public:
  using servermap_t = std::unordered_map<std::string, std::string>;

  [[nodiscard]] std::optional<std::string> getWhoisServer(const std::string& extension) const;
  void setWhoisServer(const std::string& extension, const std::string& server);
  [[nodiscard]] std::optional<std::string> getRewriteServer(const std::string& server) const;

  /* Both tables are replaced only once the whole source parsed, a failure leaves
     the directory as it was. Throws a WhoisException of kind InitFailed. */
  void loadFromFile(const std::string& fname);
  void loadFromStream(std::istream& input, const std::string& name);

  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t rewriteSize() const;

private:
  SharedLockGuarded<servermap_t> d_servers;
  SharedLockGuarded<servermap_t> d_rewrites;
};

/** Builds a ServerDirectory from a file, exactly once.
 *
 * Concurrent first callers block until the single load completes. Every caller then
 * gets the same directory, or the same InitFailed exception if the load failed.
 */
class DirectoryInitializer : public boost::noncopyable
{
public:
  std::shared_ptr<ServerDirectory> get(const std::string& fname);
  [[nodiscard]] bool isInitialized() const;

private:
  enum class State : uint8_t
  {
    NotStarted,
    Running,
    Done,
    Failed
  };

  mutable std::mutex d_mutex;
  std::condition_variable d_cond;
  State d_state{State::NotStarted};
  std::shared_ptr<ServerDirectory> d_directory;
  WhoisException d_error;
};

//! The process-wide directory, loaded from fname by the first caller
std::shared_ptr<ServerDirectory> initWhois(const std::string& fname);
