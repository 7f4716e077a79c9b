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
#include "arguments.hh"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

#include <boost/algorithm/string.hpp>

ArgvMap& arg()
{
  static ArgvMap theArg;
  return theArg;
}

std::string& ArgvMap::set(const std::string& var)
{
  return d_params[var];
}

void ArgvMap::setDefaults()
{
  for (const auto& param : d_params) {
    if (defaultmap.count(param.first) == 0) {
      defaultmap.insert(param);
    }
  }
}

bool ArgvMap::mustDo(const std::string& var)
{
  return ((*this)[var] != "no") && ((*this)[var] != "off");
}

std::string& ArgvMap::set(const std::string& var, const std::string& help)
{
  helpmap[var] = help;
  d_typeMap[var] = "Parameter";
  return set(var);
}

std::string& ArgvMap::setSwitch(const std::string& var, const std::string& help)
{
  helpmap[var] = help;
  d_typeMap[var] = "Switch";
  return set(var);
}

std::string ArgvMap::helpstring(std::string prefix)
{
  if (prefix == "no") {
    prefix = "";
  }

  std::string help;

  for (const auto& entry : helpmap) {
    if (!prefix.empty() && entry.first.find(prefix) != 0) { // only print items with prefix
      continue;
    }

    help += "  --";
    help += entry.first;

    std::string type = d_typeMap[entry.first];

    if (type == "Parameter") {
      help += "=...";
    }
    else if (type == "Switch") {
      help += " | --" + entry.first + "=yes";
      help += " | --" + entry.first + "=no";
    }

    help += "\n\t";
    help += entry.second;
    help += "\n";
  }
  return help;
}

std::string ArgvMap::formatOne(bool running, bool full, const std::string& var, const std::string& help, const std::string& theDefault, const std::string& current)
{
  std::string out;

  if (!running || full) {
    out += "#################################\n";
    out += "# ";
    out += var;
    out += "\t";
    out += help;
    out += "\n#\n";
  }
  else {
    if (theDefault == current) {
      return "";
    }
  }

  if (!running || theDefault == current) {
    out += "# ";
  }

  if (running) {
    out += var + "=" + current + "\n";
    if (full) {
      out += "\n";
    }
  }
  else {
    out += var + "=" + theDefault + "\n\n";
  }

  return out;
}

std::string ArgvMap::configstring(bool running, bool full)
{
  std::string help;

  if (running) {
    help = "# Autogenerated configuration file based on running instance\n";
  }
  else {
    help = "# Autogenerated configuration file template\n";
  }

  for (const auto& entry : helpmap) {
    if (d_typeMap[entry.first] == "Command") {
      continue;
    }
    help += formatOne(running, full, entry.first, entry.second, defaultmap[entry.first], d_params[entry.first]);
  }

  if (running) {
    for (const auto& unknown : d_unknownParams) {
      help += formatOne(running, full, unknown.first, "unknown setting", "", unknown.second);
    }
  }

  return help;
}

const std::string& ArgvMap::operator[](const std::string& arg)
{
  if (!parmIsset(arg)) {
    throw ArgException(std::string("Undefined but needed argument: '") + arg + "'");
  }

  return d_params[arg];
}

int ArgvMap::asNum(const std::string& arg, int def)
{
  if (!parmIsset(arg)) {
    throw ArgException(std::string("Undefined but needed argument: '") + arg + "'");
  }

  // use default for empty values
  if (d_params[arg].empty()) {
    return def;
  }

  const char* cptr_orig = d_params[arg].c_str();
  char* cptr_ret = nullptr;

  errno = 0;
  long retval = strtol(cptr_orig, &cptr_ret, 0);
  if (retval == 0 && cptr_ret == cptr_orig) {
    throw ArgException("'" + arg + "' value '" + std::string(cptr_orig) + "' is not a valid number");
  }
  if (errno == ERANGE || retval > INT_MAX || retval < INT_MIN) {
    throw ArgException("'" + arg + "' value '" + std::string(cptr_orig) + "' is out of range");
  }
  if (*cptr_ret != '\0') {
    throw ArgException("'" + arg + "' value '" + std::string(cptr_orig) + "' has trailing garbage");
  }

  return static_cast<int>(retval);
}

bool ArgvMap::isEmpty(const std::string& arg)
{
  if (!parmIsset(arg)) {
    return true;
  }
  return d_params[arg].empty();
}

bool ArgvMap::parmIsset(const std::string& var)
{
  return d_params.find(var) != d_params.end();
}

void ArgvMap::parseOne(const std::string& arg, const std::string& parseOnly, bool lax)
{
  std::string var;
  std::string val;
  std::string::size_type pos = 0;
  bool incremental = false;

  pos = arg.find('=');
  if (arg.find("--") == 0 && pos != std::string::npos && pos > 2 && arg[pos - 1] == '+') { // this is a --port+=25 case
    var = arg.substr(2, pos - 3);
    val = arg.substr(pos + 1);
    incremental = true;
  }
  else if (arg.find("--") == 0 && (pos = arg.find('=')) != std::string::npos) { // this is a --port=25 case
    var = arg.substr(2, pos - 2);
    val = arg.substr(pos + 1);
  }
  else if (arg.find("--") == 0 && (arg.find('=') == std::string::npos)) { // this is a --daemon case
    var = arg.substr(2);
    val = "";
  }
  else if (arg[0] == '-' && arg.length() > 1) {
    var = arg.substr(1);
    val = "";
  }
  else { // command
    d_cmds.push_back(arg);
  }

  boost::trim(var);

  if (!var.empty() && (parseOnly.empty() || var == parseOnly)) {
    pos = val.find_first_not_of(" \t"); // strip leading whitespace
    if (pos != 0 && pos != std::string::npos) {
      val = val.substr(pos);
    }
    if (parmIsset(var)) {
      if (incremental) {
        if (d_params[var].empty()) {
          d_params[var] = val;
        }
        else {
          d_params[var] += ", " + val;
        }
      }
      else {
        d_params[var] = val;
        // a switch mentioned without a value is switched on
        if (val.empty() && d_typeMap[var] == "Switch") {
          d_params[var] = "yes";
        }
      }
    }
    else {
      // unknown setting encountered, only tolerated when lax
      d_unknownParams[var] = val;
      if (!lax) {
        throw ArgException("Trying to set unknown setting '" + var + "'");
      }
    }
  }
}

void ArgvMap::preParse(int& argc, char** argv, const std::string& arg)
{
  for (int n = 1; n < argc; n++) {
    std::string varval = argv[n];
    if (varval.find("--" + arg) == 0) {
      parseOne(argv[n], arg);
    }
  }
}

void ArgvMap::parse(int& argc, char** argv, bool lax)
{
  d_cmds.clear();
  for (int n = 1; n < argc; n++) {
    parseOne(argv[n], "", lax);
  }
}

bool ArgvMap::file(const std::string& fname, bool lax)
{
  std::ifstream configFileStream(fname);
  if (!configFileStream) {
    return false;
  }

  std::string pline;
  std::string line;
  unsigned int lineno = 0;

  while (getline(configFileStream, pline)) {
    ++lineno;
    boost::trim_right(pline);

    if (!pline.empty() && pline[pline.size() - 1] == '\\') {
      line += pline.substr(0, pline.length() - 1);
      continue;
    }

    line += pline;

    // strip everything after a #
    std::string::size_type pos = line.find('#');
    if (pos != std::string::npos) {
      // make sure it's either first char or has whitespace before
      if (pos == 0 || (std::isspace(static_cast<unsigned char>(line[pos - 1])) != 0)) {
        line = line.substr(0, pos);
      }
    }

    // strip trailing spaces
    boost::trim_right(line);

    // strip leading spaces
    pos = line.find_first_not_of(" \t\r\n");
    if (pos != std::string::npos) {
      line = line.substr(pos);
    }

    if (!line.empty()) {
      try {
        parseOne(std::string("--") + line, "", lax);
      }
      catch (const ArgException& ae) {
        throw ArgException(fname + ":" + std::to_string(lineno) + ": " + ae.reason);
      }
    }
    line = "";
  }

  return true;
}

const std::vector<std::string>& ArgvMap::getCommands()
{
  return d_cmds;
}
