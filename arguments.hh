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
#include <map>
#include <string>
#include <vector>

#include "whoisexception.hh"

using ArgException = WhoisException;

/** Command line and configuration file parameters.
 *
 * Every parameter is declared before use, with set() or setSwitch(), which return a reference the
 * default can be assigned to:
 *
 *   ::arg().set("timeout", "Overall timeout of a query, in msec") = "15000";
 *   ::arg().setSwitch("disable-stats", "Do not append the query time footer") = "no";
 *
 * Command line words that are not --parameters are collected, see getCommands().
 * Using an undeclared parameter throws an ArgException.
 */
class ArgvMap
{
public:
  ArgvMap() = default;
  void parse(int& argc, char** argv, bool lax = false);
  void laxParse(int& argc, char** argv)
  {
    parse(argc, argv, true);
  }
  //! only picks up arg from the command line, used to find the configuration file before parsing for real
  void preParse(int& argc, char** argv, const std::string& arg);

  //! false when the file can not be opened
  bool file(const std::string& fname, bool lax = false);
  bool parmIsset(const std::string& var);
  bool mustDo(const std::string& var);
  int asNum(const std::string& arg, int def = 0);
  std::string& set(const std::string&);
  std::string& set(const std::string&, const std::string&);
  std::string& setSwitch(const std::string&, const std::string&);
  std::string helpstring(std::string prefix = "");
  std::string configstring(bool running, bool full);
  bool isEmpty(const std::string& arg);
  void setDefaults();

  const std::string& operator[](const std::string&);
  const std::vector<std::string>& getCommands();

private:
  void parseOne(const std::string& arg, const std::string& parseOnly = "", bool lax = false);
  static std::string formatOne(bool running, bool full, const std::string& var, const std::string& help, const std::string& theDefault, const std::string& current);
  std::map<std::string, std::string> d_params;
  std::map<std::string, std::string> d_unknownParams;
  std::map<std::string, std::string> helpmap;
  std::map<std::string, std::string> defaultmap;
  std::map<std::string, std::string> d_typeMap;
  std::vector<std::string> d_cmds;
};

extern ArgvMap& arg();
