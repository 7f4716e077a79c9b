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
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include "serverdirectory.hh"
#include "logger.hh"
#include "misc.hh"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

std::optional<std::string> ServerDirectory::getWhoisServer(const std::string& extension) const
{
  auto servers = d_servers.read_lock();
  const auto iter = servers->find(toLower(extension));
  if (iter == servers->end()) {
    return std::nullopt;
  }
  return iter->second;
}

void ServerDirectory::setWhoisServer(const std::string& extension, const std::string& server)
{
  auto servers = d_servers.write_lock();
  (*servers)[toLower(extension)] = server;
}

std::optional<std::string> ServerDirectory::getRewriteServer(const std::string& server) const
{
  auto rewrites = d_rewrites.read_lock();
  const auto iter = rewrites->find(toLower(server));
  if (iter == rewrites->end()) {
    return std::nullopt;
  }
  return iter->second;
}

size_t ServerDirectory::size() const
{
  return d_servers.read_lock()->size();
}

size_t ServerDirectory::rewriteSize() const
{
  return d_rewrites.read_lock()->size();
}

void ServerDirectory::loadFromFile(const std::string& fname)
{
  std::ifstream input(fname);
  if (!input) {
    throw WhoisException(WhoisException::Kind::InitFailed, "Unable to open WHOIS servers file '" + fname + "': " + std::string(strerror(errno)));
  }
  loadFromStream(input, fname);
}

void ServerDirectory::loadFromStream(std::istream& input, const std::string& name)
{
  servermap_t servers;
  servermap_t rewrites;
  std::string line;
  unsigned int lineno = 0;

  while (std::getline(input, line)) {
    ++lineno;
    auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.resize(hash);
    }
    boost::algorithm::trim(line);
    if (line.empty()) {
      continue;
    }

    std::vector<std::string> parts;
    boost::algorithm::split(parts, line, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

    if (parts.at(0) == "rewrite") {
      if (parts.size() != 3) {
        throw WhoisException(WhoisException::Kind::InitFailed, "Malformed rewrite on line " + std::to_string(lineno) + " in WHOIS servers file '" + name + "': '" + line + "'");
      }
      rewrites[toLower(parts.at(1))] = toLower(parts.at(2));
      continue;
    }
    if (parts.size() != 2) {
      throw WhoisException(WhoisException::Kind::InitFailed, "Malformed line " + std::to_string(lineno) + " in WHOIS servers file '" + name + "': '" + line + "'");
    }

    std::string extension = toLower(parts.at(0));
    boost::algorithm::trim_left_if(extension, boost::algorithm::is_any_of("."));
    if (extension.empty()) {
      throw WhoisException(WhoisException::Kind::InitFailed, "Empty extension on line " + std::to_string(lineno) + " in WHOIS servers file '" + name + "'");
    }
    servers[extension] = toLower(parts.at(1));
  }

  if (input.bad()) {
    throw WhoisException(WhoisException::Kind::InitFailed, "Error reading WHOIS servers file '" + name + "'");
  }

  // lock order is always servers, then rewrites
  auto liveServers = d_servers.write_lock();
  auto liveRewrites = d_rewrites.write_lock();
  liveServers->swap(servers);
  liveRewrites->swap(rewrites);

  g_log << Logger::Info << "Loaded " << liveServers->size() << " WHOIS servers and " << liveRewrites->size() << " rewrites from '" << name << "'" << std::endl;
}

bool DirectoryInitializer::isInitialized() const
{
  std::lock_guard<std::mutex> lock(d_mutex);
  return d_state == State::Done;
}

std::shared_ptr<ServerDirectory> DirectoryInitializer::get(const std::string& fname)
{
  std::unique_lock<std::mutex> lock(d_mutex);
  if (d_state == State::NotStarted) {
    d_state = State::Running;
    lock.unlock();

    auto directory = std::make_shared<ServerDirectory>();
    std::optional<WhoisException> error;
    try {
      directory->loadFromFile(fname);
    }
    catch (const WhoisException& e) {
      error = e;
    }
    catch (const std::exception& e) {
      error = WhoisException(WhoisException::Kind::InitFailed, "Loading WHOIS servers file '" + fname + "' failed: " + e.what());
    }

    lock.lock();
    if (error) {
      g_log << Logger::Error << error->reason << std::endl;
      d_error = *error;
      d_state = State::Failed;
    }
    else {
      d_directory = std::move(directory);
      d_state = State::Done;
    }
    d_cond.notify_all();
  }

  d_cond.wait(lock, [this] { return d_state == State::Done || d_state == State::Failed; });
  if (d_state == State::Failed) {
    throw d_error;
  }
  return d_directory;
}

std::shared_ptr<ServerDirectory> initWhois(const std::string& fname)
{
  static DirectoryInitializer s_initializer;
  return s_initializer.get(fname);
}
