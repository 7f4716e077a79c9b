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
#include "logger.hh"

#include <ctime>
#include <sys/time.h>

Logger& getLogger()
{
  // never destroyed: detached dial workers may still log while the process exits
  static Logger* log = new Logger("whoisrec");
  return *log;
}

Logger::Logger(std::string name, int facility) :
  d_name(std::move(name)), d_facility(facility)
{
  open();
}

void Logger::log(const std::string& msg, Urgency u) noexcept
{
  try {
    if (u <= d_consoleUrgency.load()) {
      std::string prefix;
      if (d_timestamps) {
        struct timeval now;
        gettimeofday(&now, nullptr);
        struct tm tm;
        localtime_r(&now.tv_sec, &tm);
        char buffer[50];
        if (strftime(buffer, sizeof(buffer), "%b %d %H:%M:%S ", &tm) > 0) {
          prefix = buffer;
        }
      }
      std::lock_guard<std::mutex> lock(d_mutex);
      if (d_console != nullptr) {
        *d_console << prefix << msg << std::endl;
      }
    }

    if (!d_disableSyslog && (u <= d_consoleUrgency.load() || u <= d_loglevel.load())) {
      syslog(u, "%s", msg.c_str());
    }
  }
  catch (const std::exception& e) {
    // the logger is the last resort, there is nowhere left to report to
    std::cerr << "Logger::log failed: " << e.what() << std::endl;
  }
}

void Logger::toConsole(Urgency u)
{
  d_consoleUrgency.store(u);
}

void Logger::open()
{
  if (d_opened) {
    closelog();
  }
  openlog(d_name.c_str(), LOG_PID | LOG_NDELAY, d_facility);
  d_opened = true;
}

void Logger::setName(const std::string& name)
{
  d_name = name;
  open();
}

Logger::PerThread& Logger::getPerThread()
{
  thread_local PerThread t_perThread;
  return t_perThread;
}

Logger& Logger::operator<<(const char* s)
{
  *this << std::string(s);
  return *this;
}

Logger& Logger::operator<<(const std::string& s)
{
  PerThread& pt = getPerThread();
  pt.d_output.append(s);
  return *this;
}

Logger& Logger::operator<<(Urgency u)
{
  getPerThread().d_urgency = u;
  return *this;
}

Logger& Logger::operator<<(EndlFunc /* endl */)
{
  PerThread& pt = getPerThread();
  // messages above the configured level are dropped, the buffer is always reset
  if (pt.d_urgency <= d_loglevel.load() || pt.d_urgency <= d_consoleUrgency.load()) {
    log(pt.d_output, pt.d_urgency);
  }
  pt.d_output.clear();
  pt.d_urgency = Info;
  return *this;
}
