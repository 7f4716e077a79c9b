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

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <syslog.h>

//! The Logger class can be used to log messages in various ways.
class Logger
{
public:
  Logger(std::string name, int facility = LOG_DAEMON); //!< pass the identification you wish to appear in the log

  //! The urgency of a log message
  enum Urgency
  {
    All = 32767,
    Alert = LOG_ALERT,
    Critical = LOG_CRIT,
    Error = LOG_ERR,
    Warning = LOG_WARNING,
    Notice = LOG_NOTICE,
    Info = LOG_INFO,
    Debug = LOG_DEBUG,
    None = -1
  };

  /** Log a message.
      \param msg Message you wish to log
      \param u Urgency of the message you wish to log
  */
  void log(const std::string& msg, Urgency u = Notice) noexcept;

  void setLoglevel(Urgency u)
  {
    d_loglevel.store(u);
  }
  Urgency getLoglevel() const
  {
    return d_loglevel.load();
  }

  //! Log to the console as well, for messages at or above this urgency
  void toConsole(Urgency);
  void setName(const std::string&);
  void disableSyslog(bool d)
  {
    d_disableSyslog = d;
  }
  void setTimestamps(bool t)
  {
    d_timestamps = t;
  }
  //! Redirect console output, mostly for tests
  void setConsoleStream(std::ostream* stream)
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    d_console = stream;
  }

  //! log a string
  Logger& operator<<(const char* s);
  Logger& operator<<(const std::string& s);
  //! set the urgency of the line being built
  Logger& operator<<(Urgency);

  using EndlFunc = std::ostream& (*)(std::ostream&);
  //! emits the line built so far, on std::endl
  Logger& operator<<(EndlFunc);

  template <typename T>
  Logger& operator<<(const T& i)
  {
    std::ostringstream tmp;
    tmp << i;
    *this << tmp.str();
    return *this;
  }

private:
  struct PerThread
  {
    std::string d_output;
    Urgency d_urgency{Info};
  };
  static PerThread& getPerThread();
  void open();

  std::string d_name;
  int d_facility;
  std::atomic<Urgency> d_loglevel{Logger::Warning};
  std::atomic<Urgency> d_consoleUrgency{Logger::Error};
  bool d_opened{false};
  bool d_disableSyslog{false};
  bool d_timestamps{true};
  std::ostream* d_console{&std::clog};
  std::mutex d_mutex;
};

Logger& getLogger();

#define g_log getLogger()
